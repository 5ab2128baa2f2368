#pragma once
#include <type_traits>
#include <vector>
#include "wcoord/core/types.hpp"

namespace wcoord::core {
    struct Bin {
        BinId id{BinId::invalid()};
        UserId owner{UserId::invalid()};
        char code[32]{};                      // human-readable, e.g. "BIN-000042"
        u32 capacity_liters{0};
        WasteCategory category{WasteCategory::General};
        FillLevel fill{FillLevel::Empty};
        bool active{true};
        bool needs_collection{false};         // always needs_collection(fill, active)
        GeoPoint point{};
        RouteId claimed_by{RouteId::invalid()};
        Timestamp last_reported{0};
        Timestamp created_at{0};
        Timestamp updated_at{0};
        Timestamp deleted_at{0};
    };

    [[nodiscard]] constexpr bool needs_collection(FillLevel level, bool active) noexcept {
        return active && level >= FillLevel::ThreeQuarters;
    }

    [[nodiscard]] constexpr bool bin_eligible(const Bin& b) noexcept {
        return needs_collection(b.fill, b.active);
    }

    struct WasteReport {
        ReportId id{ReportId::invalid()};
        BinId bin{BinId::invalid()};
        UserId reporter{UserId::invalid()};
        FillLevel fill{FillLevel::Empty};
        Timestamp reported_at{0};
    };

    struct Truck {
        TruckId id{TruckId::invalid()};
        char license_plate[24]{};
        u32 capacity_kg{0};
        DriverId current_driver{DriverId::invalid()};
        TruckStatus status{TruckStatus::Available};
        bool has_position{false};
        GeoPoint last_position{};
        Timestamp last_position_at{0};
        double total_distance_km{0.0};
    };

    inline constexpr u32 kMinUpdateFrequencyS = 10;
    inline constexpr u32 kMaxUpdateFrequencyS = 300;
    inline constexpr u32 kDefaultUpdateFrequencyS = 30;

    struct Driver {
        DriverId id{DriverId::invalid()};
        char name[64]{};
        TruckId truck{TruckId::invalid()};
        bool on_duty{false};
        bool sharing_enabled{false};
        u32 update_frequency_s{kDefaultUpdateFrequencyS};
        Timestamp last_active{0};
    };

    struct LocationSample {
        SampleId id{SampleId::invalid()};
        DriverId driver{DriverId::invalid()};
        GeoPoint point{};
        double accuracy_m{0.0};
        double heading_deg{0.0};
        double speed_kmh{0.0};
        i64 battery_pct{-1};                  // -1 when the device did not report it
        Timestamp recorded_at{0};
    };

    struct RouteStop {
        RouteId route{RouteId::invalid()};
        BinId bin{BinId::invalid()};
        u32 sequence{0};                      // 1-based, contiguous within the route
        bool collected{false};
        Timestamp collected_at{0};
        double weight_kg{0.0};
    };

    struct RouteSchedule {
        Timestamp scheduled_date{0};          // day start
        Timestamp window_start{0};
        Timestamp window_end{0};
    };

    struct Route {
        RouteId id{RouteId::invalid()};
        char code[32]{};                      // "RT-<id>"
        DriverId driver{DriverId::invalid()};
        TruckId truck{TruckId::invalid()};
        RouteSchedule schedule{};
        RouteStatus status{RouteStatus::Pending};
        std::vector<RouteStop> stops;
        double planned_distance_km{0.0};
        double estimated_mass_kg{0.0};
        Timestamp actual_start{0};
        Timestamp actual_end{0};
        double actual_distance_km{0.0};
        u32 bins_collected{0};
        double total_waste_kg{0.0};
        double efficiency_score{0.0};
        Timestamp created_at{0};
        Timestamp updated_at{0};
    };

    static_assert(std::is_trivially_copyable_v<Bin>);
    static_assert(std::is_trivially_copyable_v<WasteReport>);
    static_assert(std::is_trivially_copyable_v<Truck>);
    static_assert(std::is_trivially_copyable_v<Driver>);
    static_assert(std::is_trivially_copyable_v<LocationSample>);
    static_assert(std::is_trivially_copyable_v<RouteStop>);
    static_assert(std::is_standard_layout_v<Bin>);
    static_assert(std::is_standard_layout_v<Truck>);
    static_assert(std::is_standard_layout_v<LocationSample>);
} // namespace wcoord::core
