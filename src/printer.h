#pragma once
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

#include "stream.h"

namespace mbk {

class BlockNormalizer;
class CancelToken;

enum class OutputFormat { TEXT, JSON };

bool parse_output_format(const std::string& s, OutputFormat& out);

struct PrintOptions {
    OutputFormat format{OutputFormat::TEXT};
    bool         cursor_only{false};
    size_t       queue_depth{10};
};

// One line describing a response: its normalized block, step and cursor.
// Throws DecodeError.
std::string format_response(const StreamResponse& resp, BlockNormalizer& normalizer,
                            OutputFormat format);

// Streams a request once (no retries) and prints every response to `out`
// in arrival order. Returns the number of responses printed. Throws
// StreamError on a receive error.
uint64_t print_stream(BlockStreamClient& client, const StreamRequest& req,
                      BlockNormalizer& normalizer, const PrintOptions& opts, std::ostream& out,
                      const CancelToken* cancel = nullptr);

} // namespace mbk
