/**
 * @file logging.cpp
 * @brief 내부 stderr 로그 헬퍼 구현
 */

#include "logging.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace affect_sdk {
namespace internal {

namespace {

std::atomic<bool> g_logging_enabled{true};

void vlog(const char* level, const char* format, va_list args) {
    if (!g_logging_enabled.load(std::memory_order_relaxed)) {
        return;
    }
    std::fprintf(stderr, "[AffectSDK][%s] ", level);
    std::vfprintf(stderr, format, args);
    std::fprintf(stderr, "\n");
}

} // anonymous namespace

void setLoggingEnabled(bool enabled) {
    g_logging_enabled.store(enabled, std::memory_order_relaxed);
}

bool isLoggingEnabled() {
    return g_logging_enabled.load(std::memory_order_relaxed);
}

void logInfo(const char* format, ...) {
    va_list args;
    va_start(args, format);
    vlog("INFO", format, args);
    va_end(args);
}

void logWarn(const char* format, ...) {
    va_list args;
    va_start(args, format);
    vlog("WARN", format, args);
    va_end(args);
}

void logError(const char* format, ...) {
    va_list args;
    va_start(args, format);
    vlog("ERROR", format, args);
    va_end(args);
}

} // namespace internal
} // namespace affect_sdk
