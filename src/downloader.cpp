#include "downloader.h"
#include "archive_writer.h"
#include "cancel.h"
#include "continuity.h"
#include "errors.h"
#include "logging.h"

#include <thread>

namespace mbk {

Downloader::Downloader(BlockStreamClient& client, ObjectStore& dest, const DownloadOptions& opts,
                       CancelToken* cancel, Sleeper sleeper)
    : client_(client), dest_(dest), opts_(opts), cancel_(cancel),
      sleep_(std::move(sleeper)), cursor_(opts.cursor) {
    if (opts_.range.start < 0) {
        throw PreconditionError("download needs an absolute start block, got " +
                                opts_.range.to_string());
    }
    if (opts_.bundle_size == 0) {
        throw PreconditionError("bundle size must be greater than zero");
    }
    if (!sleep_) {
        sleep_ = [this](std::chrono::milliseconds d) {
            if (cancel_) return cancel_->wait_for(d);
            std::this_thread::sleep_for(d);
            return true;
        };
    }
}

StreamRequest Downloader::make_request() const {
    StreamRequest req;
    req.start_block_num = opts_.range.start_block();
    req.stop_block_num = opts_.range.stop_block_or(0);
    req.final_blocks_only = true;
    req.cursor = cursor_;
    return req;
}

DownloadReport Downloader::run() {
    BlockNormalizer normalizer(opts_.block_type, opts_.first_streamable_block);
    ContinuityChecker continuity;
    ArchiveWriter writer(dest_, opts_.bundle_size);
    DownloadReport report;

    auto finalize_report = [&]() {
        report.bundles_flushed = writer.bundles_flushed();
        report.last_cursor = cursor_;
        report.last_block_id = continuity.session().last_block_id;
        report.last_block_number = continuity.session().last_block_number;
    };

    LOG_STREAM(logging::Level::INFO, "downloading " + opts_.range.to_string() + " into " +
               dest_.describe());

    while (true) {
        if (cancel_) cancel_->throw_if_cancelled();

        StreamRequest req = make_request();
        std::unique_ptr<BlockStream> stream;
        try {
            stream = client_.open(req);
        } catch (const StreamError& e) {
            throw StreamError(std::string("unable to start blocks stream: ") + e.what());
        }
        LOG_STREAM(logging::Level::DEBUG, "stream opened: " + req.to_line());

        while (true) {
            StreamResponse resp;
            std::string err;
            BlockStream::RecvStatus st = stream->recv(resp, err);

            if (st == BlockStream::RecvStatus::END) {
                writer.finish();
                finalize_report();
                LOG_STREAM(logging::Level::INFO, "stream ended, " + std::to_string(report.blocks) +
                           " blocks in " + std::to_string(report.bundles_flushed) + " bundles");
                return report;
            }

            if (st == BlockStream::RecvStatus::ERROR) {
                if (cancel_) cancel_->throw_if_cancelled();
                LOG_STREAM(logging::Level::ERROR, "stream encountered a remote error, going to retry in " +
                           std::to_string(opts_.retry_delay.count()) + " ms: " + err);
                report.reconnects++;
                if (!sleep_(opts_.retry_delay)) throw CancelledError();
                break;
            }

            Block blk = normalizer.normalize(resp);
            continuity.accept(blk);
            writer.process(blk);
            cursor_ = resp.cursor;
            report.blocks++;
            LOG_EVERY_N(1000, logging::Level::INFO, "downloaded block " + blk.describe() +
                        ", " + std::to_string(report.blocks) + " blocks so far");
        }
    }
}

} // namespace mbk
