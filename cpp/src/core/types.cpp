#include "wcoord/core/types.hpp"

#include <cstring>
#include <ctime>
#include <iterator>

namespace wcoord::core {

namespace {
    template <typename E, std::size_t N>
    [[nodiscard]] bool parse_by_name(const char* s, const char* const (&names)[N], E* out) noexcept {
        if (s == nullptr || out == nullptr) {
            return false;
        }
        for (std::size_t i = 0; i < N; ++i) {
            if (std::strcmp(s, names[i]) == 0) {
                *out = static_cast<E>(i);
                return true;
            }
        }
        return false;
    }

    constexpr const char* kFillNames[] = {"empty", "quarter", "half", "three_quarters", "full"};
    constexpr const char* kCategoryNames[] = {"general", "recyclable", "organic", "hazardous"};
    constexpr const char* kTruckStatusNames[] = {"available", "on_route", "maintenance", "out_of_service"};
    constexpr const char* kRouteStatusNames[] = {"pending", "assigned", "in_progress", "completed", "cancelled"};
} // namespace

Timestamp unix_now() noexcept {
    return static_cast<Timestamp>(std::time(nullptr));
}

const char* fill_level_name(FillLevel level) noexcept {
    const auto i = static_cast<std::size_t>(level);
    return i < std::size(kFillNames) ? kFillNames[i] : "unknown";
}

const char* waste_category_name(WasteCategory c) noexcept {
    const auto i = static_cast<std::size_t>(c);
    return i < std::size(kCategoryNames) ? kCategoryNames[i] : "unknown";
}

const char* truck_status_name(TruckStatus s) noexcept {
    const auto i = static_cast<std::size_t>(s);
    return i < std::size(kTruckStatusNames) ? kTruckStatusNames[i] : "unknown";
}

const char* route_status_name(RouteStatus s) noexcept {
    const auto i = static_cast<std::size_t>(s);
    return i < std::size(kRouteStatusNames) ? kRouteStatusNames[i] : "unknown";
}

bool parse_fill_level(const char* s, FillLevel* out) noexcept {
    return parse_by_name(s, kFillNames, out);
}

bool parse_waste_category(const char* s, WasteCategory* out) noexcept {
    return parse_by_name(s, kCategoryNames, out);
}

bool parse_truck_status(const char* s, TruckStatus* out) noexcept {
    return parse_by_name(s, kTruckStatusNames, out);
}

} // namespace wcoord::core
