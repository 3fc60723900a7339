#include "archive_writer.h"
#include "bundle.h"
#include "errors.h"
#include "logging.h"

namespace mbk {

ArchiveWriter::ArchiveWriter(ObjectStore& dest, uint64_t bundle_size)
    : dest_(dest), bundle_size_(bundle_size) {
    if (bundle_size_ == 0) throw PreconditionError("bundle size must be greater than zero");
}

void ArchiveWriter::process(const Block& b) {
    if (!started_) {
        low_ = round_to_bundle_start(b.number, bundle_size_);
        current_ = std::make_unique<BundleWriter>();
        started_ = true;
    }
    if (b.number < low_) {
        throw OrderingError("block " + b.describe() + " is below open bundle " +
                            format_base_number(low_));
    }

    while (b.number >= low_ + bundle_size_) {
        flush_bundle();
        low_ += bundle_size_;
    }
    current_->add(b);
}

void ArchiveWriter::finish() {
    if (!started_ || current_->count() == 0) return;
    flush_bundle();
}

void ArchiveWriter::flush_bundle() {
    const std::string key = format_base_number(low_);
    const size_t n = current_->count();
    std::vector<uint8_t> data = current_->finish();
    current_ = std::make_unique<BundleWriter>();

    std::string err;
    if (!dest_.write(key, data, err)) {
        throw StoreError("unable to write bundle " + key + ": " + err);
    }
    bundles_flushed_++;
    blocks_written_ += n;
    LOG_ARCHIVE(logging::Level::INFO, "wrote bundle " + key + " (" + std::to_string(n) +
                " blocks) to " + dest_.describe());
}

} // namespace mbk
