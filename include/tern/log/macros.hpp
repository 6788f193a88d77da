#pragma once

#include "logger.hpp"

#ifdef TERN_DEBUG
    #define TERN_LOG_DEBUG(fmt, ...) \
        ::tern::log::logger::instance().log( \
            ::tern::log::level::debug, \
            __FILE__, __LINE__, \
            fmt __VA_OPT__(,) __VA_ARGS__ \
        )
#else
    #define TERN_LOG_DEBUG(fmt, ...) ((void)0)
#endif

#define TERN_LOG_INFO(fmt, ...) \
    ::tern::log::logger::instance().log( \
        ::tern::log::level::info, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

#define TERN_LOG_WARNING(fmt, ...) \
    ::tern::log::logger::instance().log( \
        ::tern::log::level::warning, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

#define TERN_LOG_ERROR(fmt, ...) \
    ::tern::log::logger::instance().log( \
        ::tern::log::level::error, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )
