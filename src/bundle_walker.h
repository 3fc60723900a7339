#pragma once
#include <cstdint>
#include <functional>
#include <string>

#include "bundle.h"
#include "object_store.h"

namespace mbk {

class CancelToken;

// Ordered traversal of the bundle objects of an archive, starting at the
// bundle holding a given base number. Temporary and non-bundle keys are
// skipped; listing errors propagate as StoreError.
class BundleWalker {
public:
    // Return false to stop the walk.
    using Visitor = std::function<bool(const BundleIndex& idx, const std::string& key)>;

    BundleWalker(ObjectStore& store, uint64_t start_base)
        : store_(store), start_key_(format_base_number(start_base)) {}

    void walk(const Visitor& visit, const CancelToken* cancel = nullptr);

    const std::string& start_key() const { return start_key_; }
    uint64_t skipped() const { return skipped_; }

private:
    ObjectStore& store_;
    std::string start_key_;
    uint64_t skipped_{0};
};

} // namespace mbk
