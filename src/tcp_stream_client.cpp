#include "tcp_stream_client.h"
#include "cancel.h"
#include "constants.h"
#include "errors.h"
#include "logging.h"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <netinet/in.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>

namespace mbk {

using sock_t = int;
static constexpr sock_t SOCK_INVALID = -1;
static constexpr int POLL_SLICE_MS = 250;  // cancellation check interval while blocked

// =============================================================================
// Socket helpers
// =============================================================================

static bool set_nonblocking(sock_t fd, bool enable) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    if (enable) {
        flags |= O_NONBLOCK;
    } else {
        flags &= ~O_NONBLOCK;
    }
    return (fcntl(fd, F_SETFL, flags) == 0);
}

static bool connect_with_timeout(sock_t fd, const sockaddr* addr, socklen_t addrlen, int timeout_ms) {
    if (!set_nonblocking(fd, true)) {
        return false;
    }

    int result = ::connect(fd, addr, addrlen);
    if (result == 0) {
        set_nonblocking(fd, false);
        return true;
    }
    if (errno != EINPROGRESS && errno != EWOULDBLOCK) {
        return false;
    }

    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLOUT;
    pfd.revents = 0;

    result = poll(&pfd, 1, timeout_ms);
    if (result <= 0) {
        return false;  // Timeout or error
    }
    if (pfd.revents & (POLLERR | POLLHUP)) {
        return false;
    }

    int error = 0;
    socklen_t len = sizeof(error);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &len) != 0 || error != 0) {
        return false;
    }

    set_nonblocking(fd, false);
    return true;
}

static bool send_all(sock_t fd, const std::string& data, std::string& err) {
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::send(fd, p, left, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            err = std::string("send failed: ") + std::strerror(errno);
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

// =============================================================================
// TcpBlockStream
// =============================================================================

class TcpBlockStream : public BlockStream {
public:
    TcpBlockStream(const Endpoint& ep, const StreamRequest& req, int connect_timeout_ms,
                   int recv_timeout_ms, const CancelToken* cancel)
        : ep_(ep), line_(req.to_line() + "\n"), connect_timeout_ms_(connect_timeout_ms),
          recv_timeout_ms_(recv_timeout_ms), cancel_(cancel) {}

    ~TcpBlockStream() override {
        if (fd_ != SOCK_INVALID) ::close(fd_);
    }

    RecvStatus recv(StreamResponse& out, std::string& err) override {
        if (ended_) return RecvStatus::END;
        if (fd_ == SOCK_INVALID && !connect(err)) return RecvStatus::ERROR;

        unsigned char szb[4];
        if (!read_full(szb, sizeof(szb), err)) return fail();
        uint32_t sz = static_cast<uint32_t>(szb[0]) | (static_cast<uint32_t>(szb[1]) << 8) |
                      (static_cast<uint32_t>(szb[2]) << 16) | (static_cast<uint32_t>(szb[3]) << 24);
        if (sz == 0) {
            ended_ = true;
            return RecvStatus::END;
        }
        if (sz > MAX_RECORD_SIZE) {
            err = "frame too large (" + std::to_string(sz) + " bytes)";
            return fail();
        }

        std::vector<uint8_t> frame(sz);
        if (!read_full(frame.data(), sz, err)) return fail();
        if (!decode_response(frame, out, err)) {
            err = "undecodable response: " + err;
            return fail();
        }
        return RecvStatus::MESSAGE;
    }

private:
    RecvStatus fail() {
        if (fd_ != SOCK_INVALID) {
            ::close(fd_);
            fd_ = SOCK_INVALID;
        }
        return RecvStatus::ERROR;
    }

    bool connect(std::string& err) {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_protocol = IPPROTO_TCP;

        char portbuf[16];
        std::snprintf(portbuf, sizeof(portbuf), "%u", static_cast<unsigned>(ep_.port));

        addrinfo* res = nullptr;
        int rc = getaddrinfo(ep_.host.c_str(), portbuf, &hints, &res);
        if (rc != 0 || !res) {
            err = "cannot resolve " + ep_.to_string() + ": " + gai_strerror(rc);
            return false;
        }

        sock_t fd = SOCK_INVALID;
        for (addrinfo* ai = res; ai; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            // Long-lived stream
            int keepalive = 1;
            setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));

            if (connect_with_timeout(fd, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen),
                                     connect_timeout_ms_)) {
                break;
            }
            ::close(fd);
            fd = SOCK_INVALID;
        }
        freeaddrinfo(res);

        if (fd == SOCK_INVALID) {
            err = "cannot connect to " + ep_.to_string();
            return false;
        }
        fd_ = fd;
        if (!send_all(fd_, line_, err)) {
            fail();
            return false;
        }
        LOG_STREAM(logging::Level::INFO, "connected to " + ep_.to_string());
        return true;
    }

    bool read_full(void* buf, size_t n, std::string& err) {
        auto* p = static_cast<uint8_t*>(buf);
        size_t got = 0;
        auto last_data = std::chrono::steady_clock::now();

        while (got < n) {
            if (cancel_ && cancel_->cancelled()) {
                err = "cancelled";
                return false;
            }

            pollfd pfd;
            pfd.fd = fd_;
            pfd.events = POLLIN;
            pfd.revents = 0;
            int rc = poll(&pfd, 1, POLL_SLICE_MS);
            if (rc < 0) {
                if (errno == EINTR) continue;
                err = std::string("poll failed: ") + std::strerror(errno);
                return false;
            }
            if (rc == 0) {
                if (recv_timeout_ms_ > 0) {
                    auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - last_data).count();
                    if (idle >= recv_timeout_ms_) {
                        err = "receive timeout after " + std::to_string(idle) + " ms";
                        return false;
                    }
                }
                continue;
            }

            ssize_t r = ::recv(fd_, p + got, n - got, 0);
            if (r < 0) {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
                err = std::string("recv failed: ") + std::strerror(errno);
                return false;
            }
            if (r == 0) {
                err = "connection closed by " + ep_.to_string();
                return false;
            }
            got += static_cast<size_t>(r);
            last_data = std::chrono::steady_clock::now();
        }
        return true;
    }

    Endpoint ep_;
    std::string line_;
    int connect_timeout_ms_;
    int recv_timeout_ms_;
    const CancelToken* cancel_;
    sock_t fd_{SOCK_INVALID};
    bool ended_{false};
};

// =============================================================================
// Endpoint / client
// =============================================================================

Endpoint Endpoint::parse(const std::string& text) {
    Endpoint ep;
    std::string port;
    if (!text.empty() && text[0] == '[') {
        size_t close = text.find(']');
        if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':') {
            throw PreconditionError("invalid endpoint \"" + text + "\"");
        }
        ep.host = text.substr(1, close - 1);
        port = text.substr(close + 2);
    } else {
        size_t colon = text.rfind(':');
        if (colon == std::string::npos) {
            throw PreconditionError("endpoint \"" + text + "\" needs a port");
        }
        ep.host = text.substr(0, colon);
        port = text.substr(colon + 1);
    }

    unsigned long v = 0;
    try {
        size_t used = 0;
        v = std::stoul(port, &used);
        if (used != port.size()) v = 0;
    } catch (const std::exception&) {
        v = 0;
    }
    if (ep.host.empty() || v == 0 || v > 65535) {
        throw PreconditionError("invalid endpoint \"" + text + "\"");
    }
    ep.port = static_cast<uint16_t>(v);
    return ep;
}

TcpBlockStreamClient::TcpBlockStreamClient(const Endpoint& ep, int connect_timeout_ms,
                                           int recv_timeout_ms, const CancelToken* cancel)
    : ep_(ep),
      connect_timeout_ms_(connect_timeout_ms > 0 ? connect_timeout_ms : MBK_CONNECT_TIMEOUT_MS),
      recv_timeout_ms_(recv_timeout_ms), cancel_(cancel) {}

std::unique_ptr<BlockStream> TcpBlockStreamClient::open(const StreamRequest& req) {
    if (req.cursor.find_first_of(" \r\n") != std::string::npos) {
        throw StreamError("cursor contains whitespace");
    }
    return std::make_unique<TcpBlockStream>(ep_, req, connect_timeout_ms_, recv_timeout_ms_, cancel_);
}

} // namespace mbk
