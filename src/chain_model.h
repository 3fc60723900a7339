#pragma once
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "block.h"
#include "codec.h"

namespace mbk {

// =============================================================================
// Chain block models carried as full payloads by the stream
// =============================================================================

// Header-level block; does not know its chain's LIB.
struct HeaderBlock {
    static constexpr const char* TYPE = "header";

    uint64_t             number{0};
    uint64_t             parent_number{0};
    int64_t              time{0};
    std::string          id;
    std::string          parent_id;
    std::vector<uint8_t> body;

    static bool decode(const std::vector<uint8_t>& raw, HeaderBlock& out, std::string& err);
    std::vector<uint8_t> encode() const;
};

// Block of a chain with deterministic finality; reports its LIB.
struct FinalityBlock {
    static constexpr const char* TYPE = "final";

    uint64_t             number{0};
    uint64_t             parent_number{0};
    int64_t              time{0};
    uint64_t             lib{0};
    std::string          id;
    std::string          parent_id;
    std::vector<uint8_t> body;

    uint64_t lib_num() const { return lib; }

    static bool decode(const std::vector<uint8_t>& raw, FinalityBlock& out, std::string& err);
    std::vector<uint8_t> encode() const;
};

// True for models exposing `uint64_t lib_num() const`.
template <typename T, typename = void>
struct reports_lib_num : std::false_type {};

template <typename T>
struct reports_lib_num<T, std::void_t<decltype(std::declval<const T&>().lib_num())>>
    : std::true_type {};

// Gives a model without LIB knowledge an explicit, externally supplied LIB.
template <typename T>
struct BlockEnvelope {
    T        block;
    uint64_t lib;

    uint64_t lib_num() const { return lib; }
};

// LIB approximation for models that cannot report it: the parent of the
// block, or the block itself at or below the first streamable block.
inline uint64_t approximate_lib_num(uint64_t number, uint64_t first_streamable_block) {
    if (number <= first_streamable_block) return number;
    return number - 1;
}

template <typename T>
Block to_archive_block(const T& b, uint64_t lib_num, const std::vector<uint8_t>& payload) {
    Block out;
    out.id = b.id;
    out.parent_id = b.parent_id;
    out.number = b.number;
    out.parent_number = b.parent_number;
    out.lib_number = lib_num;
    out.timestamp = b.time;
    out.payload = payload;
    return out;
}

template <typename T>
Block to_archive_block(const BlockEnvelope<T>& env, const std::vector<uint8_t>& payload) {
    return to_archive_block(env.block, env.lib_num(), payload);
}

} // namespace mbk
