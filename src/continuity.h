#pragma once
#include <atomic>
#include <cstdint>
#include <string>

#include "block.h"
#include "stream.h"

namespace mbk {

// Identity of the last block accepted in this process. Survives reconnects.
struct DownloadSession {
    std::string last_block_id;
    uint64_t    last_block_number{0};

    bool started() const { return !last_block_id.empty(); }
};

// Rejects any block whose parent is not the previously accepted block.
class ContinuityChecker {
public:
    // Throws ContinuityError. Updates the session on success.
    void accept(const Block& b);

    const DownloadSession& session() const { return session_; }

private:
    DownloadSession session_;
};

// Turns either response shape into an archive Block:
//  - metadata present: stub from the decoded cursor plus metadata
//  - payload only: decoded with the configured chain model, LIB taken from
//    the model when it reports one, approximated otherwise
// Safe to share between the concurrent print workers.
class BlockNormalizer {
public:
    // Throws PreconditionError for an unknown block type.
    explicit BlockNormalizer(const std::string& block_type, uint64_t first_streamable_block = 0);

    // Throws DecodeError.
    Block normalize(const StreamResponse& resp);

    const std::string& block_type() const { return block_type_; }

private:
    template <typename T>
    Block from_payload(const StreamResponse& resp);

    Block from_cursor(const StreamResponse& resp) const;

    std::string block_type_;
    uint64_t first_streamable_block_;
    std::atomic<bool> fallback_warned_{false};
    std::atomic<bool> approx_warned_{false};
};

} // namespace mbk
