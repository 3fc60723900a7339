#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "block_range.h"
#include "constants.h"
#include "object_store.h"
#include "stream.h"

namespace mbk {

class CancelToken;

struct DownloadOptions {
    BlockRange                range;
    uint64_t                  bundle_size{MBK_DEFAULT_BUNDLE_SIZE};
    std::chrono::milliseconds retry_delay{MBK_RETRY_DELAY_MS};
    std::string               block_type{"header"};
    uint64_t                  first_streamable_block{0};
    std::string               cursor;  // resume point, empty to start at range.start
};

struct DownloadReport {
    uint64_t    blocks{0};
    uint64_t    bundles_flushed{0};
    uint64_t    reconnects{0};
    std::string last_cursor;
    std::string last_block_id;
    uint64_t    last_block_number{0};
};

// Sleeps for the backoff delay; returns false when interrupted by cancellation.
using Sleeper = std::function<bool(std::chrono::milliseconds)>;

// Streams final blocks of a range into bundles. Transport errors are
// retried forever after a fixed delay, resuming from the last processed
// cursor. Continuity and decode errors are fatal.
class Downloader {
public:
    Downloader(BlockStreamClient& client, ObjectStore& dest, const DownloadOptions& opts,
               CancelToken* cancel = nullptr, Sleeper sleeper = {});

    DownloadReport run();

private:
    StreamRequest make_request() const;

    BlockStreamClient& client_;
    ObjectStore& dest_;
    DownloadOptions opts_;
    CancelToken* cancel_;
    Sleeper sleep_;
    std::string cursor_;
};

} // namespace mbk
