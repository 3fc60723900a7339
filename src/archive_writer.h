#pragma once
#include <cstdint>
#include <memory>

#include "block.h"
#include "codec.h"
#include "object_store.h"

namespace mbk {

// Packs accepted blocks into fixed-size bundles. A bundle is written only
// once a block beyond its range arrives (or at finish()), as one atomic
// object write. Fully skipped bundles are written empty so base numbers
// stay contiguous.
class ArchiveWriter {
public:
    ArchiveWriter(ObjectStore& dest, uint64_t bundle_size);

    // Throws OrderingError for a block below the open bundle, StoreError
    // when a flush fails.
    void process(const Block& b);

    // Flushes the final partial bundle, if it holds any block.
    void finish();

    uint64_t bundles_flushed() const { return bundles_flushed_; }
    uint64_t blocks_written() const { return blocks_written_; }
    // Base number of the bundle being filled, meaningful once a block was processed.
    uint64_t open_bundle_base() const { return low_; }
    size_t buffered() const { return current_ ? current_->count() : 0; }

private:
    void flush_bundle();

    ObjectStore& dest_;
    uint64_t bundle_size_;
    bool started_{false};
    uint64_t low_{0};
    std::unique_ptr<BundleWriter> current_;
    uint64_t bundles_flushed_{0};
    uint64_t blocks_written_{0};
};

} // namespace mbk
