#pragma once
#include <cstdint>
#include <vector>

namespace mbk {

// Tracks the next anticipated bundle base number and reports every base
// skipped by the archive listing.
class GapDetector {
public:
    GapDetector(uint64_t first_expected, uint64_t bundle_size)
        : expected_(first_expected), bundle_size_(bundle_size) {}

    // Base numbers missing before `base`, in ascending order. Throws
    // OrderingError when base is below the expected one.
    std::vector<uint64_t> observe(uint64_t base);

    // Marks `base` as processed, broken or clean.
    void processed(uint64_t base) { expected_ = base + bundle_size_; }

    uint64_t expected() const { return expected_; }

private:
    uint64_t expected_;
    uint64_t bundle_size_;
};

} // namespace mbk
