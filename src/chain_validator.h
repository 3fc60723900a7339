#pragma once
#include <cstdint>
#include <string>

#include "bundle.h"
#include "object_store.h"

namespace mbk {

class CancelToken;

// Carried across bundles by the scanning loop. Empty means the chain is
// not established yet (start of scan, or after a broken or missing bundle).
struct ChainState {
    std::string last_block_id;
};

struct BundleCheck {
    enum class Failure { NONE, OPEN, DECODE, SPAN };

    bool        broken{false};
    Failure     failure{Failure::NONE};  // anything but NONE aborts the scan
    uint64_t    blocks_read{0};
    std::string reason;                  // why the bundle is broken or failed
};

// Verifies the parent/identity chain of one bundle.
//
//  - open or header error: broken, OPEN failure
//  - empty block id or parent mismatch: broken, rest of bundle unread
//  - first block of an unestablished chain seeds it with its own parent
//  - decode error after the header: DECODE failure, not broken
//  - block numbered outside [base, base + bundle_size): SPAN failure, the
//    archive was written with another bundle size
//
// On a clean bundle the state holds its last block id; on a broken one it
// is reset so the next bundle reseeds.
class ChainValidator {
public:
    // bundle_size 0 skips the span check
    explicit ChainValidator(uint64_t bundle_size = 0) : bundle_size_(bundle_size) {}

    BundleCheck check(ObjectStore& store, const std::string& key, ChainState& state,
                      const CancelToken* cancel = nullptr) const;

private:
    uint64_t bundle_size_;
};

} // namespace mbk
