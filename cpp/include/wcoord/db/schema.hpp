#pragma once

#include <type_traits>

#include "wcoord/core/types.hpp"

namespace wcoord::db {
    using u32 = wcoord::core::u32;

    // Stored in PRAGMA user_version; open() refuses journals written with another.
    inline constexpr u32 kSchemaVersion = 1;

    enum class TableId : u32 {
        Bins = 1,
        WasteReports = 2,
        Trucks = 3,
        Drivers = 4,
        LocationUpdates = 5,
        CollectionRoutes = 6,
        RouteBins = 7,
    };

    [[nodiscard]] const char* table_name(TableId t) noexcept;

    // Route row as journaled; stops are stored in route_bins.
    struct RouteRecord {
        wcoord::core::RouteId id{wcoord::core::RouteId::invalid()};
        wcoord::core::DriverId driver{wcoord::core::DriverId::invalid()};
        wcoord::core::TruckId truck{wcoord::core::TruckId::invalid()};
        wcoord::core::RouteStatus status{wcoord::core::RouteStatus::Pending};
        wcoord::core::Timestamp scheduled_date{0};
        double planned_distance_km{0.0};
        double actual_distance_km{0.0};
        u32 bins_collected{0};
        double total_waste_kg{0.0};
        double efficiency_score{0.0};
        wcoord::core::Timestamp actual_start{0};
        wcoord::core::Timestamp actual_end{0};
    };

    static_assert(std::is_trivially_copyable_v<RouteRecord>);
    static_assert(std::is_standard_layout_v<RouteRecord>);

} // namespace wcoord::db
