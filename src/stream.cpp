#include "stream.h"
#include "codec.h"
#include "constants.h"
#include "errors.h"

#include <sstream>
#include <stdexcept>
#include <vector>

namespace mbk {

const char* fork_step_name(ForkStep s) {
    switch (s) {
        case ForkStep::NEW:   return "new";
        case ForkStep::UNDO:  return "undo";
        case ForkStep::FINAL: return "final";
        default:              return "unknown";
    }
}

static bool valid_step(uint64_t v) { return v >= 1 && v <= 3; }

std::string StreamRequest::to_line() const {
    std::ostringstream ss;
    ss << "BLOCKS start=" << start_block_num
       << " stop=" << stop_block_num
       << " final=" << (final_blocks_only ? 1 : 0)
       << " cursor=" << cursor;
    return ss.str();
}

bool StreamRequest::parse_line(const std::string& line, StreamRequest& out) {
    std::istringstream ss(line);
    std::string verb;
    if (!(ss >> verb) || verb != "BLOCKS") return false;

    StreamRequest r;
    int seen = 0;
    std::string tok;
    while (ss >> tok) {
        size_t eq = tok.find('=');
        if (eq == std::string::npos) return false;
        std::string k = tok.substr(0, eq), v = tok.substr(eq + 1);
        try {
            if (k == "start") { r.start_block_num = std::stoull(v); seen |= 1; }
            else if (k == "stop") { r.stop_block_num = std::stoull(v); seen |= 2; }
            else if (k == "final") { r.final_blocks_only = (v == "1"); seen |= 4; }
            else if (k == "cursor") { r.cursor = v; }
            else return false;
        } catch (const std::exception&) {
            return false;
        }
    }
    if (seen != 7) return false;
    out = r;
    return true;
}

std::vector<uint8_t> encode_response(const StreamResponse& r) {
    ByteWriter w;
    w.put_u8(static_cast<uint8_t>(r.step));
    w.put_str(r.cursor);
    w.put_u8(r.metadata ? 1 : 0);
    if (r.metadata) {
        w.put_str(r.metadata->parent_id);
        w.put_u64(r.metadata->parent_num);
        w.put_u64(r.metadata->lib_num);
        w.put_i64(r.metadata->time);
    }
    w.put_str(r.block_type);
    w.put_bytes(r.payload);
    return w.take();
}

bool decode_response(const std::vector<uint8_t>& raw, StreamResponse& out, std::string& err) {
    ByteReader rd(raw);
    StreamResponse r;
    uint8_t step = 0, has_meta = 0;
    if (!rd.get_u8(step) || !valid_step(step)) {
        err = "invalid fork step";
        return false;
    }
    r.step = static_cast<ForkStep>(step);
    if (!rd.get_str(r.cursor) || !rd.get_u8(has_meta)) {
        err = "truncated response header";
        return false;
    }
    if (has_meta) {
        BlockMetadata m;
        if (!rd.get_str(m.parent_id) || !rd.get_u64(m.parent_num) ||
            !rd.get_u64(m.lib_num) || !rd.get_i64(m.time)) {
            err = "truncated response metadata";
            return false;
        }
        r.metadata = std::move(m);
    }
    if (!rd.get_str(r.block_type) || !rd.get_bytes(r.payload)) {
        err = "truncated response block";
        return false;
    }
    if (rd.remaining() != 0) {
        err = "trailing bytes after response";
        return false;
    }
    out = std::move(r);
    return true;
}

Cursor Cursor::from_opaque(const std::string& opaque) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (true) {
        size_t c = opaque.find(':', pos);
        parts.push_back(opaque.substr(pos, c == std::string::npos ? std::string::npos : c - pos));
        if (c == std::string::npos) break;
        pos = c + 1;
    }
    if (parts.size() != 5 || parts[0] != CURSOR_PREFIX || parts[3].empty()) {
        throw DecodeError("unable to decode cursor \"" + opaque + "\"");
    }

    Cursor c;
    try {
        size_t used = 0;
        uint64_t step = std::stoull(parts[1], &used);
        if (used != parts[1].size() || !valid_step(step)) throw std::invalid_argument("step");
        c.step = static_cast<ForkStep>(step);
        c.block_num = std::stoull(parts[2], &used);
        if (used != parts[2].size()) throw std::invalid_argument("block_num");
        c.lib_num = std::stoull(parts[4], &used);
        if (used != parts[4].size()) throw std::invalid_argument("lib_num");
    } catch (const std::exception&) {
        throw DecodeError("unable to decode cursor \"" + opaque + "\"");
    }
    c.block_id = parts[3];
    return c;
}

std::string Cursor::to_opaque() const {
    return std::string(CURSOR_PREFIX) + ":" + std::to_string(static_cast<int>(step)) + ":" +
           std::to_string(block_num) + ":" + block_id + ":" + std::to_string(lib_num);
}

} // namespace mbk
