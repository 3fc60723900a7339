#include "bundle.h"
#include "constants.h"

#include <cctype>
#include <cstdio>

namespace mbk {

std::optional<BundleIndex> BundleIndex::parse(const std::string& key) {
    if (key.size() != MBK_BUNDLE_KEY_DIGITS) return std::nullopt;
    uint64_t v = 0;
    for (char c : key) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        v = v * 10 + static_cast<uint64_t>(c - '0');
    }
    return BundleIndex{v};
}

std::string BundleIndex::key() const {
    return format_base_number(base_number);
}

std::string format_base_number(uint64_t base_number) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%010llu", static_cast<unsigned long long>(base_number));
    return std::string(buf);
}

const char* marker_kind_name(MarkerKind kind) {
    switch (kind) {
        case MarkerKind::Broken:  return "broken";
        case MarkerKind::Missing: return "missing";
        default:                  return "unknown";
    }
}

std::string Marker::key() const {
    return format_base_number(base_number) +
           (kind == MarkerKind::Broken ? BROKEN_SUFFIX : MISSING_SUFFIX);
}

} // namespace mbk
