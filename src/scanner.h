#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "block_range.h"
#include "bundle.h"
#include "chain_validator.h"
#include "constants.h"
#include "gap_detector.h"
#include "marker_writer.h"
#include "object_store.h"

namespace mbk {

class CancelToken;

struct ScanOptions {
    BlockRange range;
    uint64_t   bundle_size{MBK_DEFAULT_BUNDLE_SIZE};
    uint64_t   progress_every{1000};  // bundles between progress log lines, 0 disables
};

struct ScanReport {
    uint64_t bundles_checked{0};
    uint64_t broken{0};
    uint64_t missing{0};
    uint64_t marker_write_failures{0};
    uint64_t blocks_read{0};
    std::vector<Marker> markers;  // successfully written, in emission order

    bool clean() const { return broken == 0 && missing == 0; }
};

// Everything the scanning loop carries from one bundle to the next.
struct ScanState {
    ChainState  chain;
    GapDetector gaps;
    ScanReport  report;

    ScanState(uint64_t first_expected, uint64_t bundle_size)
        : gaps(first_expected, bundle_size) {}
};

// Walks an archive over a resolved range and writes a `.broken` marker for
// every bundle whose hash chain does not link and a `.missing` marker for
// every absent bundle. Fatal errors (listing, open, ordering) throw after
// any marker for the offending bundle has been written.
class Scanner {
public:
    // Throws PreconditionError for an unresolved range or a zero bundle size.
    Scanner(ObjectStore& source, ObjectStore& dest, const ScanOptions& opts,
            const CancelToken* cancel = nullptr);

    // Throws PreconditionError, before writing any marker for the bundle,
    // when the archive was written with a different bundle size.
    ScanReport run();

private:
    // One iteration of the walk. Returns false once the range's closing
    // bundle has been processed.
    bool step(const BundleIndex& idx, const std::string& key, ScanState& state);

    void emit(const Marker& m, ScanState& state);

    ObjectStore& source_;
    MarkerWriter markers_;
    ScanOptions opts_;
    const CancelToken* cancel_;
    ChainValidator validator_;
};

// Convenience wrapper used by the CLI: opens both stores by URL and runs a scan.
ScanReport check_merged_blocks(const std::string& source_url, const std::string& dest_url,
                               uint64_t bundle_size, const BlockRange& range,
                               const CancelToken* cancel = nullptr);

} // namespace mbk
