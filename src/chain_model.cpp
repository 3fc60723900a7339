#include "chain_model.h"

namespace mbk {

bool HeaderBlock::decode(const std::vector<uint8_t>& raw, HeaderBlock& out, std::string& err) {
    ByteReader r(raw);
    HeaderBlock b;
    if (!r.get_u64(b.number) || !r.get_u64(b.parent_number) || !r.get_i64(b.time) ||
        !r.get_str(b.id) || !r.get_str(b.parent_id) || !r.get_bytes(b.body)) {
        err = "truncated header block";
        return false;
    }
    if (r.remaining() != 0) {
        err = "trailing bytes after header block";
        return false;
    }
    out = std::move(b);
    return true;
}

std::vector<uint8_t> HeaderBlock::encode() const {
    ByteWriter w;
    w.put_u64(number);
    w.put_u64(parent_number);
    w.put_i64(time);
    w.put_str(id);
    w.put_str(parent_id);
    w.put_bytes(body);
    return w.take();
}

bool FinalityBlock::decode(const std::vector<uint8_t>& raw, FinalityBlock& out, std::string& err) {
    ByteReader r(raw);
    FinalityBlock b;
    if (!r.get_u64(b.number) || !r.get_u64(b.parent_number) || !r.get_i64(b.time) ||
        !r.get_u64(b.lib) || !r.get_str(b.id) || !r.get_str(b.parent_id) ||
        !r.get_bytes(b.body)) {
        err = "truncated finality block";
        return false;
    }
    if (r.remaining() != 0) {
        err = "trailing bytes after finality block";
        return false;
    }
    out = std::move(b);
    return true;
}

std::vector<uint8_t> FinalityBlock::encode() const {
    ByteWriter w;
    w.put_u64(number);
    w.put_u64(parent_number);
    w.put_i64(time);
    w.put_u64(lib);
    w.put_str(id);
    w.put_str(parent_id);
    w.put_bytes(body);
    return w.take();
}

} // namespace mbk
