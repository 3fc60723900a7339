#include "block_range.h"
#include "errors.h"

#include <cctype>
#include <limits>

namespace mbk {

static bool parse_u64(const std::string& s, uint64_t& out) {
    if (s.empty() || s.size() > 20) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        uint64_t d = static_cast<uint64_t>(c - '0');
        if (v > (std::numeric_limits<uint64_t>::max() - d) / 10) return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

static int64_t parse_start(const std::string& s, const std::string& text) {
    bool negative = !s.empty() && s[0] == '-';
    uint64_t v = 0;
    if (!parse_u64(negative ? s.substr(1) : s, v) ||
        v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw PreconditionError("invalid range start in \"" + text + "\"");
    }
    return negative ? -static_cast<int64_t>(v) : static_cast<int64_t>(v);
}

BlockRange BlockRange::closed(uint64_t start, uint64_t stop) {
    BlockRange r;
    r.start = static_cast<int64_t>(start);
    r.stop = stop;
    return r;
}

BlockRange BlockRange::open_ended(uint64_t start) {
    BlockRange r;
    r.start = static_cast<int64_t>(start);
    r.open = true;
    return r;
}

BlockRange BlockRange::parse(const std::string& text) {
    if (text.empty()) throw PreconditionError("empty block range");

    BlockRange r;
    size_t colon = text.find(':');
    if (colon == std::string::npos) {
        r.start = parse_start(text, text);
        return r;
    }

    std::string lhs = text.substr(0, colon);
    std::string rhs = text.substr(colon + 1);
    r.start = lhs.empty() ? 0 : parse_start(lhs, text);

    if (rhs.empty()) {
        r.open = true;
        return r;
    }

    uint64_t v = 0;
    bool relative = rhs[0] == '+';
    if (!parse_u64(relative ? rhs.substr(1) : rhs, v)) {
        throw PreconditionError("invalid range stop in \"" + text + "\"");
    }
    if (relative) {
        if (r.start < 0) {
            throw PreconditionError("relative stop needs an absolute start in \"" + text + "\"");
        }
        v += static_cast<uint64_t>(r.start);
    }
    if (r.start >= 0 && v <= static_cast<uint64_t>(r.start)) {
        throw PreconditionError("range stop must be above start in \"" + text + "\"");
    }
    r.stop = v;
    return r;
}

bool BlockRange::is_resolved() const {
    if (start < 0) return false;
    if (stop) return *stop > static_cast<uint64_t>(start);
    return open;
}

std::string BlockRange::to_string() const {
    std::string s = "[" + std::to_string(start) + ", ";
    if (stop) s += std::to_string(*stop);
    else if (open) s += "+inf";
    else s += "?";
    return s + ")";
}

} // namespace mbk
