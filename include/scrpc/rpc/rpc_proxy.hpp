#pragma once

/// @file rpc_proxy.hpp
/// @brief Client side of an RPC connection
///
/// An rpc_proxy owns a single connection and runs one call at a time; calls
/// from several threads queue on an internal mutex. A transport failure
/// drops the connection and the next call reconnects.
///
/// Usage:
/// @code
/// rpc_proxy proxy("127.0.0.1", 8080);
/// int32_t sum = proxy.call<int32_t>("add", 2, 3);
///
/// auto add = proxy.method<int32_t>("add");
/// sum = add(4, 5);
///
/// auto result = proxy.try_call<int32_t>("add", 1, 1);
/// if (result.ok()) {
///     process(result.value());
/// }
/// @endcode

#include "rpc_protocol.hpp"

#include <scrpc/log/macros.hpp>
#include <scrpc/net/timed_socket.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace scrpc::rpc {

/// Proxy configuration
struct proxy_options {
    /// Longest time a remote function may run before the call fails
    std::chrono::milliseconds max_call_length{600000};
    /// Bound on establishing the connection
    std::chrono::milliseconds connect_timeout{10000};
    net::transport_options transport;
};

template<typename R>
class remote_method;

/// Calls functions on a remote rpc_server
class rpc_proxy {
public:
    /// Connect to `addr`
    /// @throws communication_error if the connection cannot be established
    explicit rpc_proxy(const net::ipv4_address& addr, const proxy_options& opts = {})
        : address_(addr), opts_(opts)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connect_locked();
    }

    /// Resolve `host` and connect
    /// @throws communication_error if the host is unknown or unreachable
    rpc_proxy(std::string_view host, uint16_t port, const proxy_options& opts = {})
        : rpc_proxy(resolve(host, port), opts) {}

    ~rpc_proxy() {
        close();
    }

    // Non-copyable, non-movable
    rpc_proxy(const rpc_proxy&) = delete;
    rpc_proxy& operator=(const rpc_proxy&) = delete;
    rpc_proxy(rpc_proxy&&) = delete;
    rpc_proxy& operator=(rpc_proxy&&) = delete;

    /// Call a remote function
    /// @tparam R Expected return type; void discards the result
    /// @throws communication_error on transport failure (connection dropped)
    /// @throws remote_error if the server rejects the call or the function throws
    /// @throws marshaling_error if arguments or result cannot be (de)serialized
    template<typename R = void, typename... Args>
    R call(std::string_view name, const Args&... args) {
        static_assert(!std::is_reference_v<R>, "remote calls return by value");

        std::lock_guard<std::mutex> lock(mutex_);
        if (!socket_) {
            connect_locked();
        }

        buffer_writer payload;
        try {
            payload = pack_arguments(args...);
        } catch (const marshaling_error& e) {
            throw marshaling_error(std::string("error marshaling function input: ") + e.what());
        }
        if (payload.size() > opts_.transport.max_message_size) {
            throw marshaling_error(fmt::format(
                "error marshaling function input: {} bytes exceed the frame size limit",
                payload.size()));
        }

        send_locked(build_perform(name).span());
        expect_ack_locked(receive_perform_reply_locked());

        send_locked(payload.span());
        expect_ack_locked(receive_locked(std::nullopt));

        auto frame = receive_locked(opts_.max_call_length, true);
        return decode_result<R>(frame);
    }

    /// Same as call(), reporting failures as an error code instead
    template<typename R = void, typename... Args>
    rpc_result<R> try_call(std::string_view name, const Args&... args) {
        try {
            if constexpr (std::is_void_v<R>) {
                call<void>(name, args...);
                return rpc_result<void>::success();
            } else {
                return rpc_result<R>(call<R>(name, args...));
            }
        } catch (const rpc_exception& e) {
            return rpc_result<R>(e.code(), e.what());
        }
    }

    /// Callable object bound to a remote function name
    template<typename R = void>
    remote_method<R> method(std::string name) {
        return remote_method<R>(*this, std::move(name));
    }

    /// Drop the connection. The next call reconnects.
    void close() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        disconnect_locked();
    }

    bool is_connected() const noexcept {
        return connected_.load(std::memory_order_acquire);
    }

    /// Change the server address; takes effect at the next reconnect
    void set_address(const net::ipv4_address& addr) {
        std::lock_guard<std::mutex> lock(mutex_);
        address_ = addr;
    }

    net::ipv4_address address() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return address_;
    }

    const proxy_options& options() const noexcept { return opts_; }

private:
    static net::ipv4_address resolve(std::string_view host, uint16_t port) {
        auto addr = net::ipv4_address::resolve(host, port);
        if (!addr) {
            throw communication_error(fmt::format("cannot resolve host '{}': {}",
                                                  host, gai_strerror(addr.error())));
        }
        return *addr;
    }

    void connect_locked() {
        disconnect_locked();
        try {
            net::timed_socket sock(opts_.transport);
            sock.connect(address_, opts_.connect_timeout);
            socket_.emplace(std::move(sock));
        } catch (const net::socket_error& e) {
            SCRPC_LOG_INFO("Cannot connect to {}: {}", address_.to_string(), e.what());
            throw communication_error(fmt::format("cannot connect to {}: {}",
                                                  address_.to_string(), e.what()));
        } catch (const std::system_error& e) {
            throw communication_error(fmt::format("cannot connect to {}: {}",
                                                  address_.to_string(), e.what()));
        }
        connected_.store(true, std::memory_order_release);
        SCRPC_LOG_DEBUG("Proxy connected to {}", address_.to_string());
    }

    void disconnect_locked() noexcept {
        if (!socket_) {
            return;
        }
        socket_.reset();
        stale_replies_ = 0;
        connected_.store(false, std::memory_order_release);
        SCRPC_LOG_DEBUG("Proxy disconnected from {}", address_.to_string());
    }

    void send_locked(std::span<const uint8_t> frame) {
        try {
            socket_->send_framed(frame);
        } catch (const net::socket_error& e) {
            SCRPC_LOG_INFO("Send to {} failed: {}", address_.to_string(), e.what());
            disconnect_locked();
            throw communication_error(std::string("error sending to server: ") + e.what());
        }
    }

    /// Receive one frame
    /// @param call_timeout A timeout means the remote function ran too long,
    ///        not that the connection broke
    std::vector<uint8_t> receive_locked(net::timeout_t timeout, bool call_timeout = false) {
        std::optional<std::vector<uint8_t>> frame;
        try {
            frame = socket_->recv_framed(timeout);
        } catch (const net::timeout_error&) {
            if (call_timeout) {
                // The server still owes this call a reply
                ++stale_replies_;
                throw remote_error("timeout while performing remote function");
            }
            SCRPC_LOG_INFO("Timed out waiting for {}", address_.to_string());
            disconnect_locked();
            throw communication_error("timed out waiting for the server");
        } catch (const net::socket_error& e) {
            SCRPC_LOG_INFO("Receive from {} failed: {}", address_.to_string(), e.what());
            disconnect_locked();
            throw communication_error(std::string("error receiving from server: ") + e.what());
        }

        if (!frame) {
            SCRPC_LOG_INFO("Connection closed by {}", address_.to_string());
            disconnect_locked();
            throw communication_error("connection closed by server");
        }
        return std::move(*frame);
    }

    /// Receive the answer to PERFORM, first dropping the late replies of
    /// calls that timed out. The server answers in order, so those come first.
    std::vector<uint8_t> receive_perform_reply_locked() {
        for (;;) {
            if (stale_replies_ == 0) {
                return receive_locked(std::nullopt);
            }

            // The abandoned call may still be running on the server
            auto frame = receive_locked(std::max(opts_.max_call_length,
                                                 opts_.transport.default_timeout));
            auto kind = parse_response(frame).kind;
            if (kind != frame_kind::result && kind != frame_kind::exception) {
                stale_replies_ = 0;
                return frame;
            }
            --stale_replies_;
            SCRPC_LOG_DEBUG("Dropped late {} frame from {}", frame_kind_str(kind),
                            address_.to_string());
        }
    }

    void expect_ack_locked(const std::vector<uint8_t>& frame) {
        auto r = parse_response(frame);
        switch (r.kind) {
            case frame_kind::ack:
                return;
            case frame_kind::nack:
                throw remote_error(r.reason.empty() ? std::string("request rejected by server")
                                                    : std::string(r.reason));
            case frame_kind::exception:
                throw_remote_exception(r.body);
            default:
                protocol_fault_locked(r.kind, verb::ack);
        }
    }

    template<typename R>
    R decode_result(const std::vector<uint8_t>& frame) {
        auto r = parse_response(frame);
        if (r.kind == frame_kind::exception) {
            throw_remote_exception(r.body);
        }
        if (r.kind != frame_kind::result) {
            protocol_fault_locked(r.kind, verb::result);
        }

        if constexpr (std::is_void_v<R>) {
            return;
        } else {
            try {
                buffer_view reader = r.body;
                auto value = deserialize<R>(reader);
                if (reader.remaining() != 0) {
                    throw marshaling_error("trailing bytes after result");
                }
                return value;
            } catch (const marshaling_error& e) {
                throw marshaling_error(std::string("error unmarshalling result: ") + e.what());
            }
        }
    }

    [[noreturn]] static void throw_remote_exception(buffer_view body) {
        remote_exception error;
        try {
            error = decode_exception(body);
        } catch (const marshaling_error&) {
            throw remote_error("unknown exception raised on server");
        }
        throw remote_error(error.message, error.type);
    }

    /// The server answered out of turn; the dialogue cannot be resynchronized
    [[noreturn]] void protocol_fault_locked(frame_kind got, std::string_view expected) {
        SCRPC_LOG_WARNING("Protocol fault with {}: expected {}, got {}",
                          address_.to_string(), expected, frame_kind_str(got));
        disconnect_locked();
        throw communication_error(fmt::format("unexpected {} frame from server, expected {}",
                                              frame_kind_str(got), expected));
    }

    net::ipv4_address address_;
    proxy_options opts_;
    mutable std::mutex mutex_;
    std::optional<net::timed_socket> socket_;
    std::atomic<bool> connected_{false};
    /// Replies owed by the server for calls that timed out on this connection
    size_t stale_replies_ = 0;
};

/// Function-like handle on a remote function
template<typename R>
class remote_method {
public:
    remote_method(rpc_proxy& proxy, std::string name)
        : proxy_(&proxy), name_(std::move(name)) {}

    template<typename... Args>
    R operator()(const Args&... args) const {
        return proxy_->call<R>(name_, args...);
    }

    const std::string& name() const noexcept { return name_; }

private:
    rpc_proxy* proxy_;
    std::string name_;
};

} // namespace scrpc::rpc
