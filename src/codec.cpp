#include "codec.h"
#include "constants.h"

#include <cstring>

namespace mbk {

// -----------------------------------------------------------------------------
// ByteWriter / ByteReader
// -----------------------------------------------------------------------------

void ByteWriter::put_u32(uint32_t v) {
    for (int i = 0; i < 4; ++i) buf_.push_back(static_cast<uint8_t>(v >> (8 * i)));
}

void ByteWriter::put_u64(uint64_t v) {
    for (int i = 0; i < 8; ++i) buf_.push_back(static_cast<uint8_t>(v >> (8 * i)));
}

void ByteWriter::put_str(const std::string& s) {
    put_u32(static_cast<uint32_t>(s.size()));
    put_raw(s.data(), s.size());
}

void ByteWriter::put_bytes(const std::vector<uint8_t>& b) {
    put_u32(static_cast<uint32_t>(b.size()));
    put_raw(b.data(), b.size());
}

void ByteWriter::put_raw(const void* p, size_t n) {
    const uint8_t* b = static_cast<const uint8_t*>(p);
    buf_.insert(buf_.end(), b, b + n);
}

bool ByteReader::get_u8(uint8_t& v) {
    if (remaining() < 1) return false;
    v = p_[pos_++];
    return true;
}

bool ByteReader::get_u32(uint32_t& v) {
    if (remaining() < 4) return false;
    v = 0;
    for (int i = 0; i < 4; ++i) v |= static_cast<uint32_t>(p_[pos_ + i]) << (8 * i);
    pos_ += 4;
    return true;
}

bool ByteReader::get_u64(uint64_t& v) {
    if (remaining() < 8) return false;
    v = 0;
    for (int i = 0; i < 8; ++i) v |= static_cast<uint64_t>(p_[pos_ + i]) << (8 * i);
    pos_ += 8;
    return true;
}

bool ByteReader::get_i64(int64_t& v) {
    uint64_t u = 0;
    if (!get_u64(u)) return false;
    v = static_cast<int64_t>(u);
    return true;
}

bool ByteReader::get_str(std::string& s) {
    uint32_t n = 0;
    if (!get_u32(n) || remaining() < n) return false;
    s.assign(reinterpret_cast<const char*>(p_ + pos_), n);
    pos_ += n;
    return true;
}

bool ByteReader::get_bytes(std::vector<uint8_t>& b) {
    uint32_t n = 0;
    if (!get_u32(n) || remaining() < n) return false;
    b.assign(p_ + pos_, p_ + pos_ + n);
    pos_ += n;
    return true;
}

// -----------------------------------------------------------------------------
// Block records
// -----------------------------------------------------------------------------

std::vector<uint8_t> encode_block(const Block& b) {
    ByteWriter w;
    w.put_u64(b.number);
    w.put_u64(b.parent_number);
    w.put_u64(b.lib_number);
    w.put_i64(b.timestamp);
    w.put_str(b.id);
    w.put_str(b.parent_id);
    w.put_bytes(b.payload);
    return w.take();
}

bool decode_block(const std::vector<uint8_t>& raw, Block& out, std::string& err) {
    ByteReader r(raw);
    Block b;
    if (!r.get_u64(b.number) || !r.get_u64(b.parent_number) ||
        !r.get_u64(b.lib_number) || !r.get_i64(b.timestamp) ||
        !r.get_str(b.id) || !r.get_str(b.parent_id) || !r.get_bytes(b.payload)) {
        err = "truncated block record";
        return false;
    }
    if (r.remaining() != 0) {
        err = "trailing bytes after block record";
        return false;
    }
    out = std::move(b);
    return true;
}

// -----------------------------------------------------------------------------
// BundleReader
// -----------------------------------------------------------------------------

bool BundleReader::read_header(std::string& err) {
    char hdr[BUNDLE_HEADER_SIZE];
    if (!in_.read(hdr, sizeof(hdr))) {
        err = "short bundle header";
        return false;
    }
    if (std::memcmp(hdr, BUNDLE_MAGIC, 4) != 0) {
        err = "bad bundle magic";
        return false;
    }
    if (static_cast<uint8_t>(hdr[4]) != BUNDLE_VERSION) {
        err = "unsupported bundle version " + std::to_string(static_cast<uint8_t>(hdr[4]));
        return false;
    }
    if (std::memcmp(hdr + 5, BUNDLE_CONTENT_TYPE, 3) != 0) {
        err = "unexpected bundle content type";
        return false;
    }
    header_ok_ = true;
    return true;
}

BundleReader::Status BundleReader::next(Block& out, std::string& err) {
    if (!header_ok_) {
        err = "bundle header not read";
        return Status::ERROR;
    }

    unsigned char szb[4];
    in_.read(reinterpret_cast<char*>(szb), sizeof(szb));
    std::streamsize got = in_.gcount();
    if (got == 0 && in_.eof()) return Status::END;
    if (got != static_cast<std::streamsize>(sizeof(szb))) {
        err = "truncated record length after block " + std::to_string(blocks_read_);
        return Status::ERROR;
    }

    uint32_t sz = static_cast<uint32_t>(szb[0]) | (static_cast<uint32_t>(szb[1]) << 8) |
                  (static_cast<uint32_t>(szb[2]) << 16) | (static_cast<uint32_t>(szb[3]) << 24);
    if (sz == 0 || sz > MAX_RECORD_SIZE) {
        err = "invalid record size " + std::to_string(sz);
        return Status::ERROR;
    }

    std::vector<uint8_t> raw(sz);
    if (!in_.read(reinterpret_cast<char*>(raw.data()), sz)) {
        err = "truncated record body (" + std::to_string(sz) + " bytes expected)";
        return Status::ERROR;
    }
    if (!decode_block(raw, out, err)) return Status::ERROR;

    blocks_read_++;
    return Status::BLOCK;
}

// -----------------------------------------------------------------------------
// BundleWriter
// -----------------------------------------------------------------------------

BundleWriter::BundleWriter() {
    out_.put_raw(BUNDLE_MAGIC, 4);
    out_.put_u8(BUNDLE_VERSION);
    out_.put_raw(BUNDLE_CONTENT_TYPE, 3);
}

void BundleWriter::add(const Block& b) {
    std::vector<uint8_t> rec = encode_block(b);
    out_.put_u32(static_cast<uint32_t>(rec.size()));
    out_.put_raw(rec.data(), rec.size());
    count_++;
}

} // namespace mbk
