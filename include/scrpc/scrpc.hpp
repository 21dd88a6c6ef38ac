#pragma once

/// scrpc - Single-connection RPC over TCP
///
/// Version: 0.1.0
///
/// Include this file to use every scrpc component.

// Version information
#define SCRPC_VERSION_MAJOR 0
#define SCRPC_VERSION_MINOR 1
#define SCRPC_VERSION_PATCH 0

// Logging
#include "log/logger.hpp"
#include "log/macros.hpp"

// Networking
#include "net/address.hpp"
#include "net/timed_socket.hpp"

// RPC
#include "rpc/rpc.hpp"

#include <tuple>

/// Root namespace for the scrpc library
namespace scrpc {

/// Get library version string
inline const char* version() noexcept {
    return "0.1.0";
}

/// Get library version as tuple
inline constexpr auto version_tuple() noexcept {
    return std::make_tuple(SCRPC_VERSION_MAJOR, SCRPC_VERSION_MINOR, SCRPC_VERSION_PATCH);
}

} // namespace scrpc
