#pragma once

/// @file rpc_protocol.hpp
/// @brief Frames exchanged on one RPC connection
///
/// Every frame is one length-prefixed message (see net::timed_socket). A call
/// is a strict request/response dialogue:
///
///   client                          server
///   PERFORM <name>        ---->
///                         <----     ACK | NACK <reason>
///   <argument envelope>   ---->
///                         <----     ACK | NACK <reason> | EXCEPTION <error>
///                         <----     RESULT <value> | EXCEPTION <error>
///
/// Argument envelope (values in serializer format):
/// +-----------+-------------+------------------+
/// | kind (u8) | count (u32) | arguments...     |
/// +-----------+-------------+------------------+

#include "rpc_buffer.hpp"
#include "rpc_types.hpp"

#include <cxxabi.h>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <typeinfo>

namespace scrpc::rpc {

// ============================================================================
// Protocol constants
// ============================================================================

/// Frame verbs
namespace verb {
constexpr std::string_view perform = "PERFORM";
constexpr std::string_view ack = "ACK";
constexpr std::string_view nack = "NACK";
constexpr std::string_view exception = "EXCEPTION";
constexpr std::string_view result = "RESULT";
} // namespace verb

/// Suffix naming the optional intent hook of a registered function
constexpr std::string_view intent_suffix = "_intent";

/// Kind byte leading every argument envelope
enum class payload_kind : uint8_t {
    tuple = 'T',   ///< Positional arguments
};

/// Kind of a frame sent by the server
enum class frame_kind : uint8_t {
    ack,
    nack,
    exception,
    result,
    unknown,
};

inline const char* frame_kind_str(frame_kind kind) {
    switch (kind) {
        case frame_kind::ack: return "ACK";
        case frame_kind::nack: return "NACK";
        case frame_kind::exception: return "EXCEPTION";
        case frame_kind::result: return "RESULT";
        default: return "unknown";
    }
}

/// Error object carried by an EXCEPTION frame
struct remote_exception {
    std::string type;      ///< Demangled dynamic type of the thrown exception
    std::string message;   ///< what() of the thrown exception

    SCRPC_FIELDS(remote_exception, type, message)
};

// ============================================================================
// Helpers
// ============================================================================

inline std::string_view as_text(std::span<const uint8_t> frame) noexcept {
    return {reinterpret_cast<const char*>(frame.data()), frame.size()};
}

/// Human readable name of a type_info
inline std::string demangle(const std::type_info& info) {
    int status = 0;
    std::unique_ptr<char, void(*)(void*)> name(
        abi::__cxa_demangle(info.name(), nullptr, nullptr, &status), std::free);
    if (status == 0 && name) {
        return name.get();
    }
    return info.name();
}

/// Frame `<verb> <text>`
inline buffer_writer build_frame(std::string_view verb_name, std::string_view text) {
    buffer_writer writer(verb_name.size() + 1 + text.size());
    writer.write_bytes(verb_name);
    writer.write(' ');
    writer.write_bytes(text);
    return writer;
}

// ============================================================================
// Client frames
// ============================================================================

/// Build `PERFORM <name>`
inline buffer_writer build_perform(std::string_view name) {
    return build_frame(verb::perform, name);
}

/// Extract the function name from a PERFORM frame
/// @return The name, or std::nullopt if the frame is not a PERFORM command
inline std::optional<std::string> parse_perform(std::span<const uint8_t> frame) {
    auto text = as_text(frame);
    if (text.size() <= verb::perform.size() ||
        !text.starts_with(verb::perform) ||
        text[verb::perform.size()] != ' ') {
        return std::nullopt;
    }
    return std::string(text.substr(verb::perform.size() + 1));
}

/// Write the envelope header for `count` positional arguments
inline void write_argument_header(buffer_writer& writer, size_t count) {
    writer.write(static_cast<uint8_t>(payload_kind::tuple));
    writer.write_array_size(count);
}

/// Serialize positional arguments into an envelope
/// @throws marshaling_error if an argument cannot be serialized
template<typename... Args>
buffer_writer pack_arguments(const Args&... args) {
    buffer_writer writer;
    write_argument_header(writer, sizeof...(Args));
    (serialize(writer, to_wire(args)), ...);
    return writer;
}

/// Decoded envelope header
struct argument_header {
    uint8_t kind = 0;
    uint32_t count = 0;

    bool is_tuple() const noexcept {
        return kind == static_cast<uint8_t>(payload_kind::tuple);
    }
};

/// Read the envelope header, leaving the view at the first argument
/// @throws marshaling_error if the payload is too short
inline argument_header read_argument_header(buffer_view& reader) {
    argument_header header;
    header.kind = reader.read<uint8_t>();
    if (header.is_tuple()) {
        header.count = reader.read_array_size();
    }
    return header;
}

// ============================================================================
// Server frames
// ============================================================================

inline buffer_writer build_ack() {
    buffer_writer writer(verb::ack.size());
    writer.write_bytes(verb::ack);
    return writer;
}

/// Build `NACK <reason>`
inline buffer_writer build_nack(std::string_view reason) {
    return build_frame(verb::nack, reason);
}

/// Build `EXCEPTION <remote_exception>`
inline buffer_writer build_exception(const remote_exception& error) {
    buffer_writer writer;
    writer.write_bytes(verb::exception);
    writer.write(' ');
    serialize(writer, error);
    return writer;
}

inline buffer_writer build_exception(const std::exception& e) {
    return build_exception(remote_exception{demangle(typeid(e)), e.what()});
}

/// Exception frame for a thrown object that is not a std::exception
inline buffer_writer build_unknown_exception() {
    return build_exception(remote_exception{"unknown", "unknown exception raised on server"});
}

/// Start a `RESULT ` frame; the value is serialized after the header
inline buffer_writer begin_result() {
    buffer_writer writer;
    writer.write_bytes(verb::result);
    writer.write(' ');
    return writer;
}

/// A frame received from the server
struct response {
    frame_kind kind = frame_kind::unknown;
    std::string_view reason;   ///< NACK reason
    buffer_view body;          ///< EXCEPTION or RESULT payload
};

/// Classify a server frame. The returned views point into `frame`.
inline response parse_response(std::span<const uint8_t> frame) {
    auto text = as_text(frame);
    response r;

    auto payload_after = [&](std::string_view v) -> std::optional<size_t> {
        if (text.size() > v.size() && text.starts_with(v) && text[v.size()] == ' ') {
            return v.size() + 1;
        }
        return std::nullopt;
    };

    if (text == verb::ack) {
        r.kind = frame_kind::ack;
    } else if (text == verb::nack) {
        r.kind = frame_kind::nack;
    } else if (auto off = payload_after(verb::nack)) {
        r.kind = frame_kind::nack;
        r.reason = text.substr(*off);
    } else if (auto off = payload_after(verb::exception)) {
        r.kind = frame_kind::exception;
        r.body = buffer_view(frame.subspan(*off));
    } else if (text == verb::result) {
        r.kind = frame_kind::result;
    } else if (auto off = payload_after(verb::result)) {
        r.kind = frame_kind::result;
        r.body = buffer_view(frame.subspan(*off));
    }
    return r;
}

/// Decode the error object of an EXCEPTION frame
/// @throws marshaling_error if the body is malformed
inline remote_exception decode_exception(buffer_view body) {
    auto error = deserialize<remote_exception>(body);
    if (body.remaining() != 0) {
        throw marshaling_error("trailing bytes after exception object");
    }
    return error;
}

} // namespace scrpc::rpc
