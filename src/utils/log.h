/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#pragma once

#include <cstdarg>

namespace gds::log {
void set_debug(bool enabled);
bool debug_enabled();

void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);
// Only prints when set_debug(true) was called.
void debug(const char* fmt, ...);
}  // namespace gds::log

#define GDS_LOG_INFO(fmt, ...) ::gds::log::info(fmt, ##__VA_ARGS__)
#define GDS_LOG_WARN(fmt, ...) ::gds::log::warn(fmt, ##__VA_ARGS__)
#define GDS_LOG_ERROR(fmt, ...) ::gds::log::error(fmt, ##__VA_ARGS__)
#define GDS_LOG_DEBUG(fmt, ...)                    \
    do {                                           \
        if (::gds::log::debug_enabled()) {         \
            ::gds::log::debug(fmt, ##__VA_ARGS__); \
        }                                          \
    } while (0)
