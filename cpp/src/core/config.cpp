#include "wcoord/core/config.hpp"
#include "wcoord/core/log.hpp"

#include <charconv>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace wcoord::core {

namespace {
    [[nodiscard]] bool parse_u32(const char* s, u32* out) noexcept {
        const char* end = s + std::strlen(s);
        u32 v{};
        auto r = std::from_chars(s, end, v, 10);
        if (r.ec != std::errc() || r.ptr != end) {
            return false;
        }
        *out = v;
        return true;
    }

    [[nodiscard]] bool parse_f64(const char* s, double* out) noexcept {
        errno = 0;
        char* end = nullptr;
        const double v = std::strtod(s, &end);
        if (end == s || end == nullptr || *end != '\0' || errno != 0) {
            return false;
        }
        *out = v;
        return true;
    }
} // namespace

void env_override_f64(const char* name, double min, double max, double* inout) noexcept {
    if (name == nullptr || inout == nullptr) {
        return;
    }
    const char* v = std::getenv(name);
    if (v == nullptr || v[0] == '\0') {
        return;
    }
    double parsed = 0.0;
    if (!parse_f64(v, &parsed) || parsed < min || parsed > max) {
        log_warn("ignoring %s=%s (expected a number in [%g, %g])", name, v, min, max);
        return;
    }
    *inout = parsed;
}

void env_override_u32(const char* name, u32 min, u32 max, u32* inout) noexcept {
    if (name == nullptr || inout == nullptr) {
        return;
    }
    const char* v = std::getenv(name);
    if (v == nullptr || v[0] == '\0') {
        return;
    }
    u32 parsed = 0;
    if (!parse_u32(v, &parsed) || parsed < min || parsed > max) {
        log_warn("ignoring %s=%s (expected an integer in [%u, %u])", name, v, min, max);
        return;
    }
    *inout = parsed;
}

const char* env_or(const char* name, const char* fallback) noexcept {
    const char* v = name ? std::getenv(name) : nullptr;
    if (v == nullptr || v[0] == '\0') {
        return fallback;
    }
    return v;
}

} // namespace wcoord::core
