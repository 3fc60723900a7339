#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mbk {

enum class ForkStep : uint8_t {
    NEW   = 1,
    UNDO  = 2,
    FINAL = 3
};

const char* fork_step_name(ForkStep s);

struct StreamRequest {
    uint64_t    start_block_num{0};
    uint64_t    stop_block_num{0};   // 0 means no stop
    bool        final_blocks_only{false};
    std::string cursor;              // empty starts from start_block_num

    // "BLOCKS start=<n> stop=<n> final=<0|1> cursor=<c>"
    std::string to_line() const;
    static bool parse_line(const std::string& line, StreamRequest& out);
};

struct BlockMetadata {
    std::string parent_id;
    uint64_t    parent_num{0};
    uint64_t    lib_num{0};
    int64_t     time{0};
};

// One message of the remote block stream. Without metadata the payload is
// a full chain block to decode; with metadata the block identity comes
// from the cursor.
struct StreamResponse {
    ForkStep                     step{ForkStep::NEW};
    std::string                  cursor;
    std::optional<BlockMetadata> metadata;
    std::string                  block_type;
    std::vector<uint8_t>         payload;
};

std::vector<uint8_t> encode_response(const StreamResponse& r);
bool decode_response(const std::vector<uint8_t>& raw, StreamResponse& out, std::string& err);

// Decoded view of an opaque cursor "c1:<step>:<block_num>:<block_id>:<lib_num>".
struct Cursor {
    ForkStep    step{ForkStep::NEW};
    uint64_t    block_num{0};
    std::string block_id;
    uint64_t    lib_num{0};

    // Throws DecodeError.
    static Cursor from_opaque(const std::string& opaque);
    std::string to_opaque() const;
};

// A live response stream. recv() blocks until a message, a clean end of
// stream, or a transport error.
class BlockStream {
public:
    enum class RecvStatus { MESSAGE, END, ERROR };

    virtual ~BlockStream() = default;
    virtual RecvStatus recv(StreamResponse& out, std::string& err) = 0;
};

class BlockStreamClient {
public:
    virtual ~BlockStreamClient() = default;

    // Throws StreamError when the request cannot be issued at all.
    // Connection problems surface later as recv() errors.
    virtual std::unique_ptr<BlockStream> open(const StreamRequest& req) = 0;
};

} // namespace mbk
