#pragma once

#include "logger.hpp"

/// Logging macros with file and line information
///
/// Arguments are only evaluated when the level is enabled, so calls such as
/// `SCRPC_LOG_INFO("peer {}", peer.to_string())` cost one atomic load when
/// filtered out.

/// Log at an explicit level
#define SCRPC_LOG(lvl, fmt, ...) \
    do { \
        auto& scrpc_logger_ = ::scrpc::log::logger::instance(); \
        if (scrpc_logger_.enabled(lvl)) { \
            scrpc_logger_.log((lvl), __FILE__, __LINE__, \
                              fmt __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

// Debug records exist only in builds with SCRPC_DEBUG defined
#ifdef SCRPC_DEBUG
    #define SCRPC_LOG_DEBUG(fmt, ...) \
        SCRPC_LOG(::scrpc::log::level::debug, fmt __VA_OPT__(,) __VA_ARGS__)
#else
    #define SCRPC_LOG_DEBUG(fmt, ...) ((void)0)
#endif

#define SCRPC_LOG_INFO(fmt, ...) \
    SCRPC_LOG(::scrpc::log::level::info, fmt __VA_OPT__(,) __VA_ARGS__)

#define SCRPC_LOG_WARNING(fmt, ...) \
    SCRPC_LOG(::scrpc::log::level::warning, fmt __VA_OPT__(,) __VA_ARGS__)

#define SCRPC_LOG_ERROR(fmt, ...) \
    SCRPC_LOG(::scrpc::log::level::error, fmt __VA_OPT__(,) __VA_ARGS__)
