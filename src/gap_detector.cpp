#include "gap_detector.h"
#include "errors.h"

namespace mbk {

std::vector<uint64_t> GapDetector::observe(uint64_t base) {
    if (base < expected_) {
        throw OrderingError("found base number " + std::to_string(base) +
                            " below expected " + std::to_string(expected_));
    }
    std::vector<uint64_t> missing;
    while (expected_ < base) {
        missing.push_back(expected_);
        expected_ += bundle_size_;
    }
    return missing;
}

} // namespace mbk
