#pragma once

#include "wcoord/core/errors.hpp"
#include "wcoord/core/types.hpp"

namespace wcoord::core {

    enum class LogLevel : u8 {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3,
    };

    // Messages go to stderr as "<level>: <message>\n".
    void log_set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel log_level() noexcept;
    [[nodiscard]] bool log_enabled(LogLevel level) noexcept;

    // Reads WCOORD_LOG_LEVEL (error|warn|info|debug). Unset or unknown keeps the current level.
    void log_init_from_env() noexcept;

    void log_error(const char* fmt, ...) noexcept __attribute__((format(printf, 1, 2)));
    void log_warn(const char* fmt, ...) noexcept __attribute__((format(printf, 1, 2)));
    void log_info(const char* fmt, ...) noexcept __attribute__((format(printf, 1, 2)));
    void log_debug(const char* fmt, ...) noexcept __attribute__((format(printf, 1, 2)));

    // "error: <context> failed (code=NotFound/3, domain=Registry/1, aux=0)"
    void log_status(const char* context, Status s) noexcept;

} // namespace wcoord::core
