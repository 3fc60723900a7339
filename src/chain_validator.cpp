#include "chain_validator.h"
#include "cancel.h"
#include "codec.h"
#include "errors.h"
#include "logging.h"

#include <optional>

namespace mbk {

BundleCheck ChainValidator::check(ObjectStore& store, const std::string& key, ChainState& state,
                                  const CancelToken* cancel) const {
    BundleCheck result;
    LOG_SCAN(logging::Level::DEBUG, "checking " + key);

    std::unique_ptr<std::istream> in;
    try {
        in = store.open(key);
    } catch (const StoreError& e) {
        result.broken = true;
        result.failure = BundleCheck::Failure::OPEN;
        result.reason = e.what();
        state.last_block_id.clear();
        return result;
    }

    BundleReader reader(*in);
    std::string err;
    if (!reader.read_header(err)) {
        result.broken = true;
        result.failure = BundleCheck::Failure::OPEN;
        result.reason = key + ": " + err;
        state.last_block_id.clear();
        return result;
    }

    std::optional<BundleIndex> idx = BundleIndex::parse(key);
    const bool check_span = bundle_size_ != 0 && idx.has_value();

    std::string last = state.last_block_id;
    Block block;
    while (true) {
        if (cancel) cancel->throw_if_cancelled();

        BundleReader::Status st = reader.next(block, err);
        if (st == BundleReader::Status::END) break;
        if (st == BundleReader::Status::ERROR) {
            result.failure = BundleCheck::Failure::DECODE;
            result.reason = key + ": " + err;
            return result;
        }
        result.blocks_read++;

        if (check_span && (block.number < idx->base_number ||
                           block.number - idx->base_number >= bundle_size_)) {
            result.failure = BundleCheck::Failure::SPAN;
            result.reason = "bundle size mismatch: " + key + " holds block #" +
                            std::to_string(block.number) + ", outside a bundle of " +
                            std::to_string(bundle_size_);
            return result;
        }

        if (!block.well_formed()) {
            result.broken = true;
            result.reason = "block #" + std::to_string(block.number) + " has an empty id";
            state.last_block_id.clear();
            return result;
        }

        if (last.empty()) {
            last = block.parent_id;
        }
        if (block.parent_id != last) {
            result.broken = true;
            result.reason = "block " + block.describe() + " has parent " + block.parent_id +
                            ", expected " + last;
            state.last_block_id.clear();
            return result;
        }
        last = block.id;
    }

    state.last_block_id = last;
    return result;
}

} // namespace mbk
