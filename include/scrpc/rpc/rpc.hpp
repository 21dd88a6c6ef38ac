#pragma once

/// @file rpc.hpp
/// @brief Umbrella header for the scrpc RPC layer
///
/// ## Quick Start
///
/// @code
/// #include <scrpc/rpc/rpc.hpp>
///
/// struct Point {
///     int32_t x;
///     int32_t y;
///     SCRPC_FIELDS(Point, x, y)
/// };
///
/// // Server side
/// scrpc::rpc::rpc_server server(scrpc::net::ipv4_address(9000));
/// server.register_function("add", [](int32_t a, int32_t b) { return a + b; });
/// server.register_function("shift", [](Point p, int32_t d) {
///     return Point{p.x + d, p.y + d};
/// });
/// server.start();
///
/// // Client side
/// scrpc::rpc::rpc_proxy proxy("127.0.0.1", 9000);
/// int32_t sum = proxy.call<int32_t>("add", 2, 3);
/// Point p = proxy.call<Point>("shift", Point{1, 2}, 10);
/// @endcode
///
/// ## Errors
///
/// Every failed call raises one of:
/// - communication_error: the connection was dropped, the next call reconnects
/// - remote_error: rejected by the server or the function threw
/// - marshaling_error: a value could not be (de)serialized
///
/// ## Intent hooks
///
/// If a function `f` is registered together with `f_intent(bool)`, the
/// worker calls `f_intent(false)` as soon as it accepts a call to `f`, and
/// `f_intent(true)` if the call then fails before `f` runs.

#include "rpc_error.hpp"
#include "rpc_buffer.hpp"
#include "rpc_types.hpp"
#include "rpc_protocol.hpp"
#include "function_registry.hpp"
#include "rpc_server.hpp"
#include "rpc_proxy.hpp"
