#pragma once

/// @file timed_socket.hpp
/// @brief Blocking TCP socket with per-call timeouts and length-prefixed framing
///
/// Every blocking call first waits for readiness with poll(2), so a caller
/// never blocks longer than the requested timeout. This is what lets the
/// server accept loop and its workers observe a shutdown flag between polls.
///
/// Framed messages on the wire:
/// +--------------------+----------------------------+
/// | length (4, BE u32) | payload (length bytes)     |
/// +--------------------+----------------------------+

#include "address.hpp"

#include <scrpc/log/macros.hpp>

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace scrpc::net {

// ============================================================================
// Errors
// ============================================================================

/// Base class for transport failures
class socket_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// No readiness within the requested timeout. Callers may retry.
class timeout_error : public socket_error {
public:
    timeout_error() : socket_error("operation timed out") {}
};

/// connect() failed
class connection_error : public socket_error {
public:
    connection_error(const std::string& what, int err)
        : socket_error(what), error_(err) {}

    /// errno reported by the failed connect
    int error_code() const noexcept { return error_; }

private:
    int error_;
};

/// Malformed length prefix, oversized frame or stalled payload
class framing_error : public socket_error {
public:
    using socket_error::socket_error;
};

// ============================================================================
// Options
// ============================================================================

/// Transport tuning knobs
struct transport_options {
    /// Timeout used when a call passes no override
    std::chrono::milliseconds default_timeout{10000};
    /// Per-chunk wait while reading a framed payload
    std::chrono::milliseconds framed_chunk_timeout{60000};
    /// Largest single send()/recv() issued by the framed calls
    size_t chunk_size = 4096;
    /// Consecutive chunk timeouts that make a framed read fail
    unsigned max_consecutive_timeouts = 2;
    /// Largest payload accepted by recv_framed() and send_framed()
    uint32_t max_message_size = 16 * 1024 * 1024;
    bool reuse_addr = true;      ///< SO_REUSEADDR on bind
    bool no_delay = true;        ///< TCP_NODELAY on connected sockets
};

/// Optional per-call timeout; std::nullopt selects the socket default
using timeout_t = std::optional<std::chrono::milliseconds>;

/// Size of the length prefix in front of every framed message
constexpr size_t frame_prefix_size = 4;

// ============================================================================
// timed_socket
// ============================================================================

/// TCP stream socket with poll-guarded blocking calls
class timed_socket {
public:
    /// Create a fresh IPv4 stream socket
    /// @throws std::system_error if the socket cannot be created
    explicit timed_socket(const transport_options& opts = {})
        : opts_(opts) {
        fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd_ < 0) {
            throw std::system_error(errno, std::generic_category(), "socket");
        }
    }

    /// Wrap an already connected descriptor (used by accept)
    timed_socket(int fd, const ipv4_address& peer, const transport_options& opts)
        : fd_(fd), peer_addr_(peer), opts_(opts) {
        apply_stream_options();
    }

    /// Move constructor
    timed_socket(timed_socket&& other) noexcept
        : fd_(other.fd_)
        , local_addr_(other.local_addr_)
        , peer_addr_(other.peer_addr_)
        , opts_(other.opts_) {
        other.fd_ = -1;
    }

    /// Move assignment
    timed_socket& operator=(timed_socket&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            local_addr_ = other.local_addr_;
            peer_addr_ = other.peer_addr_;
            opts_ = other.opts_;
            other.fd_ = -1;
        }
        return *this;
    }

    ~timed_socket() {
        close();
    }

    // Non-copyable
    timed_socket(const timed_socket&) = delete;
    timed_socket& operator=(const timed_socket&) = delete;

    /// Check if the socket holds a descriptor
    bool is_valid() const noexcept { return fd_ >= 0; }

    /// Get the file descriptor
    int fd() const noexcept { return fd_; }

    /// Address this socket is bound to (valid after bind)
    const ipv4_address& local_address() const noexcept { return local_addr_; }

    /// Address of the connected peer
    const ipv4_address& peer_address() const noexcept { return peer_addr_; }

    const transport_options& options() const noexcept { return opts_; }

    /// Bind to a local address. Port 0 picks an ephemeral port; the actual
    /// address is available from local_address() afterwards.
    void bind(const ipv4_address& addr) {
        ensure_open();
        if (opts_.reuse_addr) {
            int flag = 1;
            setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &flag, sizeof(flag));
        }

        auto sa = addr.to_sockaddr();
        if (::bind(fd_, reinterpret_cast<struct sockaddr*>(&sa), sizeof(sa)) < 0) {
            throw std::system_error(errno, std::generic_category(),
                                    "bind " + addr.to_string());
        }

        struct sockaddr_in bound{};
        socklen_t len = sizeof(bound);
        if (getsockname(fd_, reinterpret_cast<struct sockaddr*>(&bound), &len) == 0) {
            local_addr_ = ipv4_address(bound);
        } else {
            local_addr_ = addr;
        }
    }

    void listen(int backlog) {
        ensure_open();
        if (::listen(fd_, backlog) < 0) {
            throw std::system_error(errno, std::generic_category(), "listen");
        }
    }

    /// Connect to a remote address, waiting at most the given timeout
    /// @throws connection_error if the connection is refused or fails
    /// @throws timeout_error if the handshake does not finish in time
    void connect(const ipv4_address& addr, timeout_t timeout = std::nullopt) {
        ensure_open();
        auto wait = resolve_timeout(timeout);
        auto sa = addr.to_sockaddr();

        // Non-blocking connect so the handshake can be bounded by poll()
        int flags = fcntl(fd_, F_GETFL, 0);
        fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd_, reinterpret_cast<struct sockaddr*>(&sa), sizeof(sa));
        if (rc < 0 && errno != EINPROGRESS) {
            int err = errno;
            fcntl(fd_, F_SETFL, flags);
            throw connection_error("connect to " + addr.to_string() + ": " +
                                   std::strerror(err), err);
        }

        if (rc < 0) {
            try {
                wait_ready(POLLOUT, wait);
            } catch (const timeout_error&) {
                fcntl(fd_, F_SETFL, flags);
                throw;
            } catch (const socket_error&) {
                // Fall through to SO_ERROR for the real reason
            }

            int err = 0;
            socklen_t len = sizeof(err);
            getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len);
            if (err != 0) {
                fcntl(fd_, F_SETFL, flags);
                throw connection_error("connect to " + addr.to_string() + ": " +
                                       std::strerror(err), err);
            }
        }

        fcntl(fd_, F_SETFL, flags);
        peer_addr_ = addr;
        apply_stream_options();
        SCRPC_LOG_DEBUG("Connected to {}", addr.to_string());
    }

    /// Wait for an incoming connection and accept it
    /// @throws timeout_error if nothing arrives within the timeout
    /// @throws socket_error if the listening socket is broken
    timed_socket accept(timeout_t timeout = std::nullopt) {
        wait_ready(POLLIN, resolve_timeout(timeout));

        struct sockaddr_in sa{};
        socklen_t len = sizeof(sa);
        int fd;
        do {
            fd = ::accept4(fd_, reinterpret_cast<struct sockaddr*>(&sa), &len, SOCK_CLOEXEC);
        } while (fd < 0 && errno == EINTR);

        if (fd < 0) {
            throw socket_error(std::string("accept: ") + std::strerror(errno));
        }
        return timed_socket(fd, ipv4_address(sa), opts_);
    }

    /// Write once, after waiting for writability
    /// @return Number of bytes written (may be less than length)
    size_t send(const void* data, size_t length, timeout_t timeout = std::nullopt) {
        auto wait = resolve_timeout(timeout);

        // MSG_DONTWAIT: poll only promises some buffer space, so a large
        // write must not block waiting for the rest of it
        ssize_t n;
        do {
            wait_ready(POLLOUT, wait);
            n = ::send(fd_, data, length, MSG_NOSIGNAL | MSG_DONTWAIT);
        } while (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK));

        if (n < 0) {
            throw socket_error(std::string("send: ") + std::strerror(errno));
        }
        return static_cast<size_t>(n);
    }

    /// Read once, after waiting for readability
    /// @return Number of bytes read; 0 means the peer closed the connection
    size_t recv(void* buffer, size_t length, timeout_t timeout = std::nullopt) {
        auto wait = resolve_timeout(timeout);

        ssize_t n;
        do {
            wait_ready(POLLIN, wait);
            n = ::recv(fd_, buffer, length, MSG_DONTWAIT);
        } while (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK));

        if (n < 0) {
            throw socket_error(std::string("recv: ") + std::strerror(errno));
        }
        return static_cast<size_t>(n);
    }

    /// Send one length-prefixed message, in chunks of at most chunk_size
    void send_framed(std::span<const uint8_t> message, timeout_t timeout = std::nullopt) {
        if (message.size() > opts_.max_message_size) {
            throw framing_error("message of " + std::to_string(message.size()) +
                                " bytes exceeds the frame size limit");
        }

        std::vector<uint8_t> framed(frame_prefix_size + message.size());
        uint32_t prefix = htonl(static_cast<uint32_t>(message.size()));
        std::memcpy(framed.data(), &prefix, frame_prefix_size);
        if (!message.empty()) {
            std::memcpy(framed.data() + frame_prefix_size, message.data(), message.size());
        }

        size_t chunk = std::max<size_t>(1, opts_.chunk_size);
        size_t sent = 0;
        while (sent < framed.size()) {
            size_t n = std::min(chunk, framed.size() - sent);
            sent += send(framed.data() + sent, n, timeout);
        }
    }

    void send_framed(std::string_view message, timeout_t timeout = std::nullopt) {
        send_framed(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(message.data()), message.size()), timeout);
    }

    /// Receive one length-prefixed message
    ///
    /// The timeout applies to the arrival of the length prefix. The payload
    /// is then read with framed_chunk_timeout per chunk; one stalled chunk is
    /// tolerated, max_consecutive_timeouts in a row are fatal.
    ///
    /// @return The payload, or std::nullopt if the peer closed the connection
    ///         before sending anything
    /// @throws timeout_error if no prefix arrives in time
    /// @throws framing_error on a malformed prefix or an incomplete payload
    std::optional<std::vector<uint8_t>> recv_framed(timeout_t timeout = std::nullopt) {
        std::array<uint8_t, frame_prefix_size> prefix{};
        size_t got = recv(prefix.data(), prefix.size(), timeout);
        if (got == 0) {
            return std::nullopt;
        }

        while (got < prefix.size()) {
            size_t n = 0;
            try {
                n = recv(prefix.data() + got, prefix.size() - got, opts_.framed_chunk_timeout);
            } catch (const timeout_error&) {
                throw framing_error("invalid length prefix: stalled after " +
                                    std::to_string(got) + " bytes");
            }
            if (n == 0) {
                throw framing_error("invalid length prefix: connection closed after " +
                                    std::to_string(got) + " bytes");
            }
            got += n;
        }

        uint32_t length;
        std::memcpy(&length, prefix.data(), sizeof(length));
        length = ntohl(length);
        if (length > opts_.max_message_size) {
            throw framing_error("declared frame length " + std::to_string(length) +
                                " exceeds the frame size limit");
        }

        std::vector<uint8_t> payload(length);
        size_t chunk = std::max<size_t>(1, opts_.chunk_size);
        unsigned limit = std::max(1u, opts_.max_consecutive_timeouts);
        unsigned timeouts = 0;
        size_t received = 0;

        while (received < length) {
            size_t want = std::min(chunk, static_cast<size_t>(length) - received);
            size_t n = 0;
            try {
                n = recv(payload.data() + received, want, opts_.framed_chunk_timeout);
            } catch (const timeout_error&) {
                if (++timeouts >= limit) {
                    throw framing_error("not enough data was received");
                }
                continue;
            }
            if (n == 0) {
                throw framing_error("connection was closed unexpectedly");
            }
            received += n;
            timeouts = 0;
        }

        return payload;
    }

    /// Release the descriptor. Safe to call more than once.
    void close() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    void ensure_open() const {
        if (fd_ < 0) {
            throw socket_error("socket is closed");
        }
    }

    std::chrono::milliseconds resolve_timeout(timeout_t timeout) const {
        auto t = timeout.value_or(opts_.default_timeout);
        if (t.count() < 0) {
            throw std::invalid_argument("invalid timeout period (" +
                                        std::to_string(t.count()) + " ms)");
        }
        return t;
    }

    /// Block until the descriptor is ready for `events` or the timeout expires
    void wait_ready(short events, std::chrono::milliseconds timeout) {
        ensure_open();
        auto deadline = std::chrono::steady_clock::now() + timeout;

        struct pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = events;

        int rc;
        for (;;) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() < 0) {
                remaining = std::chrono::milliseconds(0);
            }
            int wait_ms = static_cast<int>(std::min<std::chrono::milliseconds::rep>(
                remaining.count(), INT_MAX));

            pfd.revents = 0;
            rc = ::poll(&pfd, 1, wait_ms);
            if (rc >= 0 || errno != EINTR) {
                break;
            }
        }

        if (rc < 0) {
            throw socket_error(std::string("poll: ") + std::strerror(errno));
        }
        if (rc == 0) {
            throw timeout_error();
        }
        if (pfd.revents & (POLLERR | POLLNVAL)) {
            throw socket_error("connection broken");
        }
    }

    void apply_stream_options() noexcept {
        if (opts_.no_delay && fd_ >= 0) {
            int flag = 1;
            setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
        }
    }

    int fd_ = -1;
    ipv4_address local_addr_;
    ipv4_address peer_addr_;
    transport_options opts_;
};

} // namespace scrpc::net
