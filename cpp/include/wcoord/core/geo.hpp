#pragma once

#include <cstddef>

#include "wcoord/core/types.hpp"

namespace wcoord::core {

    // WGS84 ellipsoid.
    inline constexpr double kWgs84A = 6378137.0;
    inline constexpr double kWgs84F = 1.0 / 298.257223563;
    inline constexpr double kWgs84B = kWgs84A * (1.0 - kWgs84F);
    inline constexpr double kMeanEarthRadiusM = 6371008.8;

    // Geodesic distance in meters on the WGS84 ellipsoid (Vincenty inverse).
    // Falls back to the great-circle distance on the mean sphere when the
    // iteration does not converge (nearly antipodal points).
    [[nodiscard]] double geodesic_distance_m(GeoPoint a, GeoPoint b) noexcept;

    // Great-circle distance on the mean sphere.
    [[nodiscard]] double haversine_distance_m(GeoPoint a, GeoPoint b) noexcept;

    // Length in meters of one degree of latitude / longitude at `lat_deg`.
    [[nodiscard]] double meters_per_degree_lat(double lat_deg) noexcept;
    [[nodiscard]] double meters_per_degree_lon(double lat_deg) noexcept;

    struct GeoBox {
        double min_lat{0.0};
        double max_lat{0.0};
        double min_lon{0.0};
        double max_lon{0.0};
    };

    // Conservative lat/lon box containing every point within `radius_m` of
    // `center`. Longitude bounds are not wrapped across the antimeridian;
    // callers clamp to [-180, 180].
    [[nodiscard]] GeoBox bounding_box(GeoPoint center, double radius_m) noexcept;

    // Sum of geodesic legs along `points`, in kilometers.
    [[nodiscard]] double path_length_km(const GeoPoint* points, std::size_t count) noexcept;

    // Arithmetic mean of the coordinates; adequate for city-scale clusters.
    [[nodiscard]] GeoPoint centroid(const GeoPoint* points, std::size_t count) noexcept;

} // namespace wcoord::core
