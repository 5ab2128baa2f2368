#pragma once

#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>
#include <functional>

namespace wcoord::core{

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Unix seconds. 0 means "unset" wherever a timestamp is optional.
    using Timestamp = i64;

    inline constexpr Timestamp kSecondsPerDay = 86400;

    [[nodiscard]] Timestamp unix_now() noexcept;

    template <typename Tag, typename Repr>
    struct Id {
        Repr v{};

        static constexpr Id invalid() noexcept { return Id{Repr(~Repr{0})}; }
        [[nodiscard]] constexpr bool is_valid() const noexcept { return v != invalid().v; }

        friend constexpr bool operator==(Id, Id) noexcept = default;
        friend constexpr auto operator<=>(Id, Id) noexcept = default;
    };

    struct IdHash {
        template <typename Tag, typename Repr>
        std::size_t operator()(Id<Tag, Repr> id) const noexcept {
            return std::hash<Repr>{}(id.v);
        }
    };

    struct UserIdTag {};
    using UserId = Id<UserIdTag, u32>;

    // Drivers are users with a driver profile; the profile is keyed by the user id.
    using DriverId = UserId;

    struct BinIdTag {};
    using BinId = Id<BinIdTag, u64>;

    struct TruckIdTag {};
    using TruckId = Id<TruckIdTag, u32>;

    struct RouteIdTag {};
    using RouteId = Id<RouteIdTag, u64>;

    struct ReportIdTag {};
    using ReportId = Id<ReportIdTag, u64>;

    struct SampleIdTag {};
    using SampleId = Id<SampleIdTag, u64>;

    // WGS84 degrees.
    struct GeoPoint {
        double lat{0.0};
        double lon{0.0};
        friend constexpr bool operator==(GeoPoint, GeoPoint) noexcept = default;
    };

    [[nodiscard]] constexpr bool geo_point_valid(GeoPoint p) noexcept {
        return p.lat >= -90.0 && p.lat <= 90.0 && p.lon >= -180.0 && p.lon <= 180.0;
    }

    // Ordered scale; comparisons on the underlying value follow fill order.
    enum class FillLevel : u8 {
        Empty = 0,
        Quarter = 1,
        Half = 2,
        ThreeQuarters = 3,
        Full = 4,
    };

    enum class WasteCategory : u8 {
        General = 0,
        Recyclable = 1,
        Organic = 2,
        Hazardous = 3,
    };

    enum class TruckStatus : u8 {
        Available = 0,
        OnRoute = 1,
        Maintenance = 2,
        OutOfService = 3,
    };

    enum class RouteStatus : u8 {
        Pending = 0,
        Assigned = 1,
        InProgress = 2,
        Completed = 3,
        Cancelled = 4,
    };

    [[nodiscard]] constexpr bool route_status_terminal(RouteStatus s) noexcept {
        return s == RouteStatus::Completed || s == RouteStatus::Cancelled;
    }

    // Fraction of the nominal bin volume a fill level represents.
    [[nodiscard]] constexpr double fill_fraction(FillLevel level) noexcept {
        switch (level) {
            case FillLevel::Empty: return 0.0;
            case FillLevel::Quarter: return 0.25;
            case FillLevel::Half: return 0.5;
            case FillLevel::ThreeQuarters: return 0.75;
            case FillLevel::Full: return 1.0;
        }
        return 0.0;
    }

    [[nodiscard]] const char* fill_level_name(FillLevel level) noexcept;
    [[nodiscard]] const char* waste_category_name(WasteCategory c) noexcept;
    [[nodiscard]] const char* truck_status_name(TruckStatus s) noexcept;
    [[nodiscard]] const char* route_status_name(RouteStatus s) noexcept;

    // Accepts the names produced above ("three_quarters", "on_route", ...).
    [[nodiscard]] bool parse_fill_level(const char* s, FillLevel* out) noexcept;
    [[nodiscard]] bool parse_waste_category(const char* s, WasteCategory* out) noexcept;
    [[nodiscard]] bool parse_truck_status(const char* s, TruckStatus* out) noexcept;

    static_assert(sizeof(BinId) == 8);
    static_assert(std::is_trivially_copyable_v<BinId>);
    static_assert(std::is_trivially_copyable_v<GeoPoint>);
    static_assert(std::is_standard_layout_v<GeoPoint>);

} // namespace wcoord::core
