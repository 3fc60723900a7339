#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace mbk {

// One archived block. An empty id marks a corrupted record.
struct Block {
    std::string          id;
    std::string          parent_id;
    uint64_t             number{0};
    uint64_t             parent_number{0};
    uint64_t             lib_number{0};   // last irreversible block when produced
    int64_t              timestamp{0};    // unix milliseconds
    std::vector<uint8_t> payload;

    bool well_formed() const { return !id.empty(); }

    // "#<number> (<id>)", used in log and error messages
    std::string describe() const {
        return "#" + std::to_string(number) + " (" + id + ")";
    }
};

} // namespace mbk
