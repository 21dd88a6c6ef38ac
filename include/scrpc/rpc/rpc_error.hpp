#pragma once

/// @file rpc_error.hpp
/// @brief Error taxonomy shared by the proxy, the server and the serializer
///
/// A failed call always surfaces as one of three exception types:
/// - communication_error: the connection is gone, the next call reconnects
/// - remote_error: the server rejected or failed the call, connection intact
/// - marshaling_error: local (de)serialization failed, connection intact

#include <cstdint>
#include <stdexcept>
#include <string>

namespace scrpc::rpc {

/// Error codes for RPC operations
enum class rpc_errc : uint32_t {
    success = 0,
    communication_error = 1,
    remote_error = 2,
    marshaling_error = 3,
};

/// Convert error code to string
inline const char* rpc_errc_str(rpc_errc err) {
    switch (err) {
        case rpc_errc::success: return "success";
        case rpc_errc::communication_error: return "communication error";
        case rpc_errc::remote_error: return "remote error";
        case rpc_errc::marshaling_error: return "marshaling error";
        default: return "unknown error";
    }
}

/// Base class of every client-visible RPC failure
class rpc_exception : public std::runtime_error {
public:
    rpc_exception(rpc_errc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    rpc_errc code() const noexcept { return code_; }

private:
    rpc_errc code_;
};

/// Transport failure or unexpected close. The proxy has disconnected.
class communication_error : public rpc_exception {
public:
    explicit communication_error(const std::string& what)
        : rpc_exception(rpc_errc::communication_error, what) {}
};

/// The server rejected the call or the remote function failed
class remote_error : public rpc_exception {
public:
    explicit remote_error(const std::string& what, std::string exception_type = {})
        : rpc_exception(rpc_errc::remote_error, what)
        , exception_type_(std::move(exception_type)) {}

    /// Dynamic type name of the exception raised on the server, empty when
    /// the server rejected the call without running it
    const std::string& exception_type() const noexcept { return exception_type_; }

private:
    std::string exception_type_;
};

/// Serialization or deserialization failed
class marshaling_error : public rpc_exception {
public:
    explicit marshaling_error(const std::string& what)
        : rpc_exception(rpc_errc::marshaling_error, what) {}
};

/// A function name was registered twice
class duplicate_registration_error : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace scrpc::rpc
