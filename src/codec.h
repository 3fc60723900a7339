#pragma once
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

#include "block.h"

namespace mbk {

// Little-endian primitives shared by the bundle and stream formats.
class ByteWriter {
public:
    void put_u8(uint8_t v) { buf_.push_back(v); }
    void put_u32(uint32_t v);
    void put_u64(uint64_t v);
    void put_i64(int64_t v) { put_u64(static_cast<uint64_t>(v)); }
    void put_str(const std::string& s);
    void put_bytes(const std::vector<uint8_t>& b);
    void put_raw(const void* p, size_t n);

    const std::vector<uint8_t>& data() const { return buf_; }
    std::vector<uint8_t> take() { return std::move(buf_); }

private:
    std::vector<uint8_t> buf_;
};

// Bounds-checked reader; every getter returns false once the input is exhausted.
class ByteReader {
public:
    ByteReader(const uint8_t* p, size_t n) : p_(p), n_(n) {}
    explicit ByteReader(const std::vector<uint8_t>& v) : p_(v.data()), n_(v.size()) {}

    bool get_u8(uint8_t& v);
    bool get_u32(uint32_t& v);
    bool get_u64(uint64_t& v);
    bool get_i64(int64_t& v);
    bool get_str(std::string& s);
    bool get_bytes(std::vector<uint8_t>& b);

    size_t remaining() const { return n_ - pos_; }

private:
    const uint8_t* p_;
    size_t n_;
    size_t pos_{0};
};

std::vector<uint8_t> encode_block(const Block& b);
bool decode_block(const std::vector<uint8_t>& raw, Block& out, std::string& err);

// Sequential reader over one bundle object.
class BundleReader {
public:
    enum class Status { BLOCK, END, ERROR };

    explicit BundleReader(std::istream& in) : in_(in) {}

    // Validates the "dbin" header. False (with err) on a short or foreign header.
    bool read_header(std::string& err);

    // Next block in stored order. END is a clean end of data; ERROR means
    // a truncated or undecodable record.
    Status next(Block& out, std::string& err);

    uint64_t blocks_read() const { return blocks_read_; }

private:
    std::istream& in_;
    bool header_ok_{false};
    uint64_t blocks_read_{0};
};

// Accumulates blocks into a complete bundle object.
class BundleWriter {
public:
    BundleWriter();

    void add(const Block& b);
    size_t count() const { return count_; }

    std::vector<uint8_t> finish() { return out_.take(); }

private:
    ByteWriter out_;
    size_t count_{0};
};

} // namespace mbk
