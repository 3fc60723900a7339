#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace mbk {

// Half-open block range [start, stop).
//
// Textual forms accepted by parse():
//   "A:B"   closed, [A,B)
//   "A:+N"  closed, [A,A+N)
//   "A:"    explicitly open ended
//   "A"     closed intent with no known stop (unresolved)
//   "-N:B"  start relative to chain head (unresolved)
struct BlockRange {
    int64_t                 start{0};
    std::optional<uint64_t> stop;
    bool                    open{false};

    static BlockRange closed(uint64_t start, uint64_t stop);
    static BlockRange open_ended(uint64_t start);
    static BlockRange parse(const std::string& text);

    // Start known (non-negative) and stop present or explicitly open.
    bool is_resolved() const;
    bool is_closed() const { return stop.has_value(); }
    uint64_t start_block() const { return start < 0 ? 0 : static_cast<uint64_t>(start); }
    uint64_t stop_block_or(uint64_t fallback) const { return stop ? *stop : fallback; }

    std::string to_string() const;
};

} // namespace mbk
