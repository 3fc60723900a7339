#include "scanner.h"
#include "bundle_walker.h"
#include "cancel.h"
#include "errors.h"
#include "logging.h"

namespace mbk {

static void validate_options(const ScanOptions& opts) {
    if (!opts.range.is_resolved()) {
        throw PreconditionError("check merged blocks can only work with fully resolved range, got " +
                                opts.range.to_string());
    }
    if (opts.bundle_size == 0) {
        throw PreconditionError("bundle size must be greater than zero");
    }
}

Scanner::Scanner(ObjectStore& source, ObjectStore& dest, const ScanOptions& opts,
                 const CancelToken* cancel)
    : source_(source), markers_(dest), opts_(opts), cancel_(cancel),
      validator_(opts.bundle_size) {
    validate_options(opts_);
}

void Scanner::emit(const Marker& m, ScanState& state) {
    if (m.kind == MarkerKind::Broken) state.report.broken++;
    else state.report.missing++;

    if (markers_.write(m)) {
        state.report.markers.push_back(m);
    } else {
        state.report.marker_write_failures++;
    }
}

bool Scanner::step(const BundleIndex& idx, const std::string& key, ScanState& state) {
    const uint64_t base = idx.base_number;
    const uint64_t start = opts_.range.start_block();

    if (base % opts_.bundle_size != 0) {
        throw PreconditionError("bundle size mismatch: " + key + " is not a multiple of " +
                                std::to_string(opts_.bundle_size));
    }

    // Bundle entirely below the range start
    if (base + opts_.bundle_size - 1 < start) return true;

    std::vector<uint64_t> gaps = state.gaps.observe(base);
    // Nothing links across a missing bundle; reseed from this one
    if (!gaps.empty()) state.chain.last_block_id.clear();

    BundleCheck check = validator_.check(source_, key, state.chain, cancel_);
    if (check.failure == BundleCheck::Failure::SPAN) {
        throw PreconditionError(check.reason);
    }
    state.report.bundles_checked++;
    state.report.blocks_read += check.blocks_read;

    for (uint64_t gap : gaps) {
        emit(Marker{gap, MarkerKind::Missing}, state);
    }

    if (check.broken) {
        LOG_SCAN(logging::Level::WARN, "bundle " + key + " is broken: " + check.reason);
        emit(Marker{base, MarkerKind::Broken}, state);
    }
    switch (check.failure) {
        case BundleCheck::Failure::NONE:
            break;
        case BundleCheck::Failure::OPEN:
            throw StoreError(check.reason);
        case BundleCheck::Failure::DECODE:
            throw DecodeError(check.reason);
        case BundleCheck::Failure::SPAN:
            break;
    }

    if (opts_.progress_every && state.report.bundles_checked % opts_.progress_every == 0) {
        LOG_SCAN(logging::Level::INFO, "progress: " + std::to_string(state.report.bundles_checked) +
                 " bundles checked, at " + key);
    }

    if (opts_.range.is_closed() &&
        round_to_bundle_end(base, opts_.bundle_size) >= *opts_.range.stop - 1) {
        return false;
    }
    state.gaps.processed(base);
    return true;
}

ScanReport Scanner::run() {
    const uint64_t first = round_to_bundle_start(opts_.range.start_block(), opts_.bundle_size);
    ScanState state(first, opts_.bundle_size);

    LOG_SCAN(logging::Level::INFO, "checking merged blocks in " + source_.describe() +
             " over " + opts_.range.to_string() + ", bundle size " +
             std::to_string(opts_.bundle_size));
    logging::ScopedLogTimer timer("merged blocks check", logging::Level::INFO);

    BundleWalker walker(source_, first);
    walker.walk([&](const BundleIndex& idx, const std::string& key) {
        return step(idx, key, state);
    }, cancel_);

    LOG_SCAN(logging::Level::INFO, "done: " + std::to_string(state.report.bundles_checked) +
             " bundles, " + std::to_string(state.report.broken) + " broken, " +
             std::to_string(state.report.missing) + " missing");
    if (state.report.marker_write_failures) {
        LOG_SCAN(logging::Level::WARN, std::to_string(state.report.marker_write_failures) +
                 " marker writes failed, marker set is incomplete");
    }
    return state.report;
}

ScanReport check_merged_blocks(const std::string& source_url, const std::string& dest_url,
                               uint64_t bundle_size, const BlockRange& range,
                               const CancelToken* cancel) {
    ScanOptions opts;
    opts.range = range;
    opts.bundle_size = bundle_size;
    validate_options(opts);

    auto source = open_store(source_url);
    auto dest = open_store(dest_url);
    Scanner scanner(*source, *dest, opts, cancel);
    return scanner.run();
}

} // namespace mbk
