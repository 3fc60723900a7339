#include "printer.h"
#include "cancel.h"
#include "continuity.h"
#include "errors.h"
#include "logging.h"
#include "ordered_pipeline.h"

#include <memory>
#include <ostream>
#include <sstream>

namespace mbk {

bool parse_output_format(const std::string& s, OutputFormat& out) {
    if (s == "text") { out = OutputFormat::TEXT; return true; }
    if (s == "json") { out = OutputFormat::JSON; return true; }
    return false;
}

static std::string escape_json(const std::string& s) {
    std::string r;
    r.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  r += "\\\""; break;
            case '\\': r += "\\\\"; break;
            case '\n': r += "\\n"; break;
            case '\r': r += "\\r"; break;
            case '\t': r += "\\t"; break;
            default:   r += c; break;
        }
    }
    return r;
}

std::string format_response(const StreamResponse& resp, BlockNormalizer& normalizer,
                            OutputFormat format) {
    Block b = normalizer.normalize(resp);
    std::ostringstream ss;

    if (format == OutputFormat::JSON) {
        ss << "{\"step\":\"" << fork_step_name(resp.step) << "\""
           << ",\"cursor\":\"" << escape_json(resp.cursor) << "\""
           << ",\"block\":{"
           << "\"number\":" << b.number
           << ",\"id\":\"" << escape_json(b.id) << "\""
           << ",\"parent_id\":\"" << escape_json(b.parent_id) << "\""
           << ",\"parent_number\":" << b.parent_number
           << ",\"lib_number\":" << b.lib_number
           << ",\"timestamp\":" << b.timestamp
           << ",\"payload_size\":" << b.payload.size()
           << "}}";
    } else {
        ss << "Block " << b.describe()
           << " parent=" << b.parent_id << " (#" << b.parent_number << ")"
           << " lib=" << b.lib_number
           << " time=" << b.timestamp
           << " payload=" << b.payload.size() << "B"
           << " step=" << fork_step_name(resp.step);
    }
    return ss.str();
}

uint64_t print_stream(BlockStreamClient& client, const StreamRequest& req,
                      BlockNormalizer& normalizer, const PrintOptions& opts, std::ostream& out,
                      const CancelToken* cancel) {
    std::unique_ptr<BlockStream> stream;
    try {
        stream = client.open(req);
    } catch (const StreamError& e) {
        throw StreamError(std::string("unable to start blocks stream: ") + e.what());
    }
    LOG_STREAM(logging::Level::INFO, "connected, streaming " + req.to_line());

    uint64_t count = 0;
    if (opts.cursor_only) {
        while (true) {
            if (cancel) cancel->throw_if_cancelled();
            StreamResponse resp;
            std::string err;
            BlockStream::RecvStatus st = stream->recv(resp, err);
            if (st == BlockStream::RecvStatus::END) return count;
            if (st == BlockStream::RecvStatus::ERROR) {
                throw StreamError("stream error while receiving: " + err);
            }
            out << fork_step_name(resp.step) << " - " << resp.cursor << "\n";
            count++;
        }
    }

    OrderedPipeline<std::string> pipeline(opts.queue_depth, [&out](std::string&& line) {
        out << line << "\n";
    });

    while (true) {
        if (cancel) cancel->throw_if_cancelled();
        auto resp = std::make_shared<StreamResponse>();
        std::string err;
        BlockStream::RecvStatus st = stream->recv(*resp, err);
        if (st == BlockStream::RecvStatus::END) break;
        if (st == BlockStream::RecvStatus::ERROR) {
            pipeline.close();
            throw StreamError("stream error while receiving: " + err);
        }

        const OutputFormat format = opts.format;
        pipeline.submit([resp, &normalizer, format]() -> std::string {
            try {
                return format_response(*resp, normalizer, format);
            } catch (const DecodeError& e) {
                LOG_STREAM(logging::Level::ERROR, std::string("unable to format response: ") + e.what());
                return std::string();
            }
        });
        count++;
    }

    pipeline.close();
    out.flush();
    return count;
}

} // namespace mbk
