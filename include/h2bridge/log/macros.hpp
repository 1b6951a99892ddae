#pragma once

#include "logger.hpp"

/// Logging macros with file and line information

#ifdef H2BRIDGE_DEBUG
    #define H2BRIDGE_LOG_DEBUG(fmt, ...) \
        ::h2bridge::log::logger::instance().log( \
            ::h2bridge::log::level::debug, \
            __FILE__, __LINE__, \
            fmt __VA_OPT__(,) __VA_ARGS__ \
        )
#else
    #define H2BRIDGE_LOG_DEBUG(fmt, ...) ((void)0)
#endif

#define H2BRIDGE_LOG_INFO(fmt, ...) \
    ::h2bridge::log::logger::instance().log( \
        ::h2bridge::log::level::info, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

#define H2BRIDGE_LOG_WARNING(fmt, ...) \
    ::h2bridge::log::logger::instance().log( \
        ::h2bridge::log::level::warning, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

#define H2BRIDGE_LOG_ERROR(fmt, ...) \
    ::h2bridge::log::logger::instance().log( \
        ::h2bridge::log::level::error, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )
