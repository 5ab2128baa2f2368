#pragma once
#include <cstdint>
#include <type_traits>

namespace wcoord::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        DuplicateReport,
        PermissionDenied,
        InvalidTransition,
        CapacityExceeded,
        SchedulingConflict,
        Busy,
        Corrupt,
        Io,
        Unavailable,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Registry,
        Spatial,
        Fleet,
        Routing,
        Lifecycle,
        Db,
        Service,
        Cli,
    };

    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    // Storage unavailability and corruption are the only process-fatal classes.
    [[nodiscard]] constexpr bool is_fatal(Status s) noexcept {
        return s.code == StatusCode::Unavailable || s.code == StatusCode::Corrupt || s.code == StatusCode::Io;
    }

    [[nodiscard]] const char* status_code_name(StatusCode code) noexcept;
    [[nodiscard]] const char* status_domain_name(StatusDomain domain) noexcept;

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace wcoord::core
