#pragma once
#include <cstdint>
#include <memory>
#include <string>

#include "stream.h"

namespace mbk {

class CancelToken;

struct Endpoint {
    std::string host;
    uint16_t    port{0};

    // "host:port" or "[v6]:port". Throws PreconditionError.
    static Endpoint parse(const std::string& text);
    std::string to_string() const { return host + ":" + std::to_string(port); }
};

// Block stream over a plain TCP connection.
//
// The client sends StreamRequest::to_line() + "\n", the server answers with
// frames [u32 LE length][response]. A zero-length frame ends the stream
// cleanly; a dropped connection is a transport error. The connection is
// made lazily on the first recv(), so connect failures are retryable.
class TcpBlockStreamClient : public BlockStreamClient {
public:
    TcpBlockStreamClient(const Endpoint& ep, int connect_timeout_ms, int recv_timeout_ms,
                         const CancelToken* cancel = nullptr);

    std::unique_ptr<BlockStream> open(const StreamRequest& req) override;

private:
    Endpoint ep_;
    int connect_timeout_ms_;
    int recv_timeout_ms_;
    const CancelToken* cancel_;
};

} // namespace mbk
