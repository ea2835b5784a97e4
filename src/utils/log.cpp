/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#include "log.h"

#include <atomic>
#include <cstdio>

namespace {
std::atomic<bool> g_debug{false};

void vprint(FILE* f, const char* prefix, const char* fmt, va_list args) {
    std::fputs(prefix, f);
    std::vfprintf(f, fmt, args);
    std::fputc('\n', f);
    std::fflush(f);
}
}  // namespace

namespace gds::log {
void set_debug(bool enabled) {
    g_debug.store(enabled, std::memory_order_relaxed);
}

bool debug_enabled() {
    return g_debug.load(std::memory_order_relaxed);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint(stdout, "", fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint(stderr, "[WARN] ", fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint(stderr, "[ERROR] ", fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    if (!debug_enabled()) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    vprint(stderr, "[DEBUG] ", fmt, args);
    va_end(args);
}
}  // namespace gds::log
