#include "wcoord/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

namespace wcoord::core {

namespace {
    std::atomic<u8> g_level{static_cast<u8>(LogLevel::Warn)};
    std::mutex g_write_mutex;

    const char* level_prefix(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Error: return "error";
            case LogLevel::Warn: return "warn";
            case LogLevel::Info: return "info";
            case LogLevel::Debug: return "debug";
        }
        return "log";
    }

    void vlog(LogLevel level, const char* fmt, va_list ap) noexcept {
        if (!log_enabled(level) || fmt == nullptr) {
            return;
        }
        char buf[1024];
        std::vsnprintf(buf, sizeof(buf), fmt, ap);
        std::lock_guard<std::mutex> lock(g_write_mutex);
        std::fprintf(stderr, "%s: %s\n", level_prefix(level), buf);
    }
} // namespace

void log_set_level(LogLevel level) noexcept {
    g_level.store(static_cast<u8>(level), std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool log_enabled(LogLevel level) noexcept {
    return static_cast<u8>(level) <= g_level.load(std::memory_order_relaxed);
}

void log_init_from_env() noexcept {
    const char* v = std::getenv("WCOORD_LOG_LEVEL");
    if (v == nullptr || v[0] == '\0') {
        return;
    }
    if (std::strcmp(v, "error") == 0) {
        log_set_level(LogLevel::Error);
    } else if (std::strcmp(v, "warn") == 0) {
        log_set_level(LogLevel::Warn);
    } else if (std::strcmp(v, "info") == 0) {
        log_set_level(LogLevel::Info);
    } else if (std::strcmp(v, "debug") == 0) {
        log_set_level(LogLevel::Debug);
    } else {
        log_warn("ignoring WCOORD_LOG_LEVEL=%s", v);
    }
}

void log_error(const char* fmt, ...) noexcept {
    va_list ap;
    va_start(ap, fmt);
    vlog(LogLevel::Error, fmt, ap);
    va_end(ap);
}

void log_warn(const char* fmt, ...) noexcept {
    va_list ap;
    va_start(ap, fmt);
    vlog(LogLevel::Warn, fmt, ap);
    va_end(ap);
}

void log_info(const char* fmt, ...) noexcept {
    va_list ap;
    va_start(ap, fmt);
    vlog(LogLevel::Info, fmt, ap);
    va_end(ap);
}

void log_debug(const char* fmt, ...) noexcept {
    va_list ap;
    va_start(ap, fmt);
    vlog(LogLevel::Debug, fmt, ap);
    va_end(ap);
}

void log_status(const char* context, Status s) noexcept {
    log_error("%s failed (code=%s/%u, domain=%s/%u, aux=%u)",
              context ? context : "operation",
              status_code_name(s.code),
              static_cast<unsigned>(s.code),
              status_domain_name(s.domain),
              static_cast<unsigned>(s.domain),
              s.aux);
}

} // namespace wcoord::core
