#pragma once

#include "wcoord/core/types.hpp"

namespace wcoord::core {

    // Environment overrides. Each helper leaves *inout untouched when the
    // variable is unset, and logs a warning when it is set but unparsable
    // or outside [min, max].
    void env_override_f64(const char* name, double min, double max, double* inout) noexcept;
    void env_override_u32(const char* name, u32 min, u32 max, u32* inout) noexcept;

    // Returns the variable's value, or `fallback` when unset or empty.
    [[nodiscard]] const char* env_or(const char* name, const char* fallback) noexcept;

} // namespace wcoord::core
