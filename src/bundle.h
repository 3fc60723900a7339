#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace mbk {

inline uint64_t round_to_bundle_start(uint64_t num, uint64_t bundle_size) {
    return num - (num % bundle_size);
}

inline uint64_t round_to_bundle_end(uint64_t num, uint64_t bundle_size) {
    return round_to_bundle_start(num, bundle_size) + bundle_size - 1;
}

// Structured form of a bundle key ("0000012300" -> 12300)
struct BundleIndex {
    uint64_t base_number{0};

    // Parses a store key. Keys not starting with ten digits, or carrying
    // a suffix (markers, ".tmp" files), are not bundles.
    static std::optional<BundleIndex> parse(const std::string& key);

    std::string key() const;
};

// "%010d" of a base number
std::string format_base_number(uint64_t base_number);

enum class MarkerKind { Broken, Missing };

const char* marker_kind_name(MarkerKind kind);

struct Marker {
    uint64_t   base_number{0};
    MarkerKind kind{MarkerKind::Broken};

    std::string key() const;
    bool operator==(const Marker& o) const { return base_number == o.base_number && kind == o.kind; }
};

} // namespace mbk
