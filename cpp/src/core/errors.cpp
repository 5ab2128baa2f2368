#include "wcoord/core/errors.hpp"

namespace wcoord::core {

const char* status_code_name(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Ok: return "Ok";
        case StatusCode::Unknown: return "Unknown";
        case StatusCode::Invalid: return "Invalid";
        case StatusCode::NotFound: return "NotFound";
        case StatusCode::DuplicateReport: return "DuplicateReport";
        case StatusCode::PermissionDenied: return "PermissionDenied";
        case StatusCode::InvalidTransition: return "InvalidTransition";
        case StatusCode::CapacityExceeded: return "CapacityExceeded";
        case StatusCode::SchedulingConflict: return "SchedulingConflict";
        case StatusCode::Busy: return "Busy";
        case StatusCode::Corrupt: return "Corrupt";
        case StatusCode::Io: return "Io";
        case StatusCode::Unavailable: return "Unavailable";
    }
    return "Unknown";
}

const char* status_domain_name(StatusDomain domain) noexcept {
    switch (domain) {
        case StatusDomain::Core: return "Core";
        case StatusDomain::Registry: return "Registry";
        case StatusDomain::Spatial: return "Spatial";
        case StatusDomain::Fleet: return "Fleet";
        case StatusDomain::Routing: return "Routing";
        case StatusDomain::Lifecycle: return "Lifecycle";
        case StatusDomain::Db: return "Db";
        case StatusDomain::Service: return "Service";
        case StatusDomain::Cli: return "Cli";
    }
    return "Unknown";
}

} // namespace wcoord::core
