#include "continuity.h"
#include "chain_model.h"
#include "errors.h"
#include "logging.h"

namespace mbk {

void ContinuityChecker::accept(const Block& b) {
    if (session_.started() && b.parent_id != session_.last_block_id) {
        throw ContinuityError("got an invalid sequence of blocks: block " + b.describe() +
                              " has previous id " + b.parent_id + ", previous block " +
                              std::to_string(session_.last_block_number) + " had id " +
                              session_.last_block_id +
                              ", this endpoint is serving blocks out of order");
    }
    session_.last_block_id = b.id;
    session_.last_block_number = b.number;
}

BlockNormalizer::BlockNormalizer(const std::string& block_type, uint64_t first_streamable_block)
    : block_type_(block_type), first_streamable_block_(first_streamable_block) {
    if (block_type_ != HeaderBlock::TYPE && block_type_ != FinalityBlock::TYPE) {
        throw PreconditionError("unknown block type \"" + block_type_ + "\" (expected " +
                                HeaderBlock::TYPE + " or " + FinalityBlock::TYPE + ")");
    }
}

Block BlockNormalizer::normalize(const StreamResponse& resp) {
    if (resp.metadata) return from_cursor(resp);

    if (!fallback_warned_.exchange(true)) {
        LOG_STREAM(logging::Level::WARN, "the server endpoint does not send block metadata, "
                   "falling back to decoding full " + block_type_ + " block payloads");
    }
    if (block_type_ == FinalityBlock::TYPE) return from_payload<FinalityBlock>(resp);
    return from_payload<HeaderBlock>(resp);
}

template <typename T>
Block BlockNormalizer::from_payload(const StreamResponse& resp) {
    if (!resp.block_type.empty() && resp.block_type != T::TYPE) {
        throw DecodeError("response carries a " + resp.block_type + " block, configured for " +
                          T::TYPE);
    }
    T blk;
    std::string err;
    if (!T::decode(resp.payload, blk, err)) {
        throw DecodeError("unmarshal response block: " + err);
    }

    if constexpr (reports_lib_num<T>::value) {
        return to_archive_block(blk, blk.lib_num(), resp.payload);
    } else {
        if (!approx_warned_.exchange(true)) {
            LOG_STREAM(logging::Level::WARN, "LIB number is approximated, the " + block_type_ +
                       " block model does not provide it so it is set to block number minus 1");
        }
        BlockEnvelope<T> env{blk, approximate_lib_num(blk.number, first_streamable_block_)};
        return to_archive_block(env, resp.payload);
    }
}

Block BlockNormalizer::from_cursor(const StreamResponse& resp) const {
    Cursor c = Cursor::from_opaque(resp.cursor);

    Block b;
    b.id = c.block_id;
    b.number = c.block_num;
    b.parent_id = resp.metadata->parent_id;
    b.parent_number = resp.metadata->parent_num;
    b.timestamp = resp.metadata->time;
    b.lib_number = resp.metadata->lib_num;
    b.payload = resp.payload;
    return b;
}

} // namespace mbk
