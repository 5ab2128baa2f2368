#include "wcoord/core/geo.hpp"

#include <algorithm>
#include <cmath>

namespace wcoord::core {

namespace {
    constexpr double kPi = 3.14159265358979323846;
    constexpr double kDegToRad = kPi / 180.0;
    constexpr int kVincentyMaxIterations = 200;
    constexpr double kVincentyTolerance = 1e-12;

    // e^2 = f(2 - f)
    constexpr double kWgs84E2 = kWgs84F * (2.0 - kWgs84F);
}

double haversine_distance_m(GeoPoint a, GeoPoint b) noexcept {
    const double phi1 = a.lat * kDegToRad;
    const double phi2 = b.lat * kDegToRad;
    const double dphi = (b.lat - a.lat) * kDegToRad;
    const double dlambda = (b.lon - a.lon) * kDegToRad;

    const double s = std::sin(dphi / 2.0) * std::sin(dphi / 2.0) +
                     std::cos(phi1) * std::cos(phi2) * std::sin(dlambda / 2.0) * std::sin(dlambda / 2.0);
    const double c = 2.0 * std::atan2(std::sqrt(s), std::sqrt(std::max(0.0, 1.0 - s)));
    return kMeanEarthRadiusM * c;
}

double geodesic_distance_m(GeoPoint a, GeoPoint b) noexcept {
    if (a.lat == b.lat && a.lon == b.lon) {
        return 0.0;
    }

    const double L = (b.lon - a.lon) * kDegToRad;
    const double U1 = std::atan((1.0 - kWgs84F) * std::tan(a.lat * kDegToRad));
    const double U2 = std::atan((1.0 - kWgs84F) * std::tan(b.lat * kDegToRad));
    const double sinU1 = std::sin(U1);
    const double cosU1 = std::cos(U1);
    const double sinU2 = std::sin(U2);
    const double cosU2 = std::cos(U2);

    double lambda = L;
    double sin_sigma = 0.0;
    double cos_sigma = 0.0;
    double sigma = 0.0;
    double cos2_alpha = 0.0;
    double cos_2sigma_m = 0.0;

    bool converged = false;
    for (int i = 0; i < kVincentyMaxIterations; ++i) {
        const double sin_lambda = std::sin(lambda);
        const double cos_lambda = std::cos(lambda);
        const double t1 = cosU2 * sin_lambda;
        const double t2 = cosU1 * sinU2 - sinU1 * cosU2 * cos_lambda;
        sin_sigma = std::sqrt(t1 * t1 + t2 * t2);
        if (sin_sigma == 0.0) {
            return 0.0;
        }
        cos_sigma = sinU1 * sinU2 + cosU1 * cosU2 * cos_lambda;
        sigma = std::atan2(sin_sigma, cos_sigma);
        const double sin_alpha = cosU1 * cosU2 * sin_lambda / sin_sigma;
        cos2_alpha = 1.0 - sin_alpha * sin_alpha;
        // Equatorial line: cos2_alpha == 0.
        cos_2sigma_m = cos2_alpha != 0.0 ? cos_sigma - 2.0 * sinU1 * sinU2 / cos2_alpha : 0.0;
        const double C = kWgs84F / 16.0 * cos2_alpha * (4.0 + kWgs84F * (4.0 - 3.0 * cos2_alpha));
        const double prev = lambda;
        lambda = L + (1.0 - C) * kWgs84F * sin_alpha *
                         (sigma + C * sin_sigma * (cos_2sigma_m + C * cos_sigma * (-1.0 + 2.0 * cos_2sigma_m * cos_2sigma_m)));
        if (std::fabs(lambda - prev) < kVincentyTolerance) {
            converged = true;
            break;
        }
    }

    if (!converged) {
        return haversine_distance_m(a, b);
    }

    const double u2 = cos2_alpha * (kWgs84A * kWgs84A - kWgs84B * kWgs84B) / (kWgs84B * kWgs84B);
    const double A = 1.0 + u2 / 16384.0 * (4096.0 + u2 * (-768.0 + u2 * (320.0 - 175.0 * u2)));
    const double B = u2 / 1024.0 * (256.0 + u2 * (-128.0 + u2 * (74.0 - 47.0 * u2)));
    const double delta_sigma =
        B * sin_sigma *
        (cos_2sigma_m + B / 4.0 *
                            (cos_sigma * (-1.0 + 2.0 * cos_2sigma_m * cos_2sigma_m) -
                             B / 6.0 * cos_2sigma_m * (-3.0 + 4.0 * sin_sigma * sin_sigma) *
                                 (-3.0 + 4.0 * cos_2sigma_m * cos_2sigma_m)));

    return kWgs84B * A * (sigma - delta_sigma);
}

double meters_per_degree_lat(double lat_deg) noexcept {
    // Meridional radius of curvature.
    const double s = std::sin(lat_deg * kDegToRad);
    const double w = 1.0 - kWgs84E2 * s * s;
    const double M = kWgs84A * (1.0 - kWgs84E2) / (w * std::sqrt(w));
    return M * kDegToRad;
}

double meters_per_degree_lon(double lat_deg) noexcept {
    // Prime vertical radius of curvature times cos(lat).
    const double phi = lat_deg * kDegToRad;
    const double s = std::sin(phi);
    const double N = kWgs84A / std::sqrt(1.0 - kWgs84E2 * s * s);
    return N * std::cos(phi) * kDegToRad;
}

GeoBox bounding_box(GeoPoint center, double radius_m) noexcept {
    // 1% slack plus a meter absorbs the curvature error of the linear spans.
    const double r = std::max(0.0, radius_m) * 1.01 + 1.0;

    const double dlat = r / std::min(meters_per_degree_lat(center.lat), meters_per_degree_lat(0.0));
    GeoBox box{};
    box.min_lat = std::max(-90.0, center.lat - dlat);
    box.max_lat = std::min(90.0, center.lat + dlat);

    // Longitude degrees shrink toward the poles; size by the most poleward latitude in the box.
    const double worst_lat = std::max(std::fabs(box.min_lat), std::fabs(box.max_lat));
    const double lon_m = meters_per_degree_lon(worst_lat);
    if (worst_lat >= 89.0 || lon_m <= 1.0) {
        box.min_lon = -180.0;
        box.max_lon = 180.0;
        return box;
    }
    const double dlon = r / lon_m;
    box.min_lon = center.lon - dlon;
    box.max_lon = center.lon + dlon;
    return box;
}

double path_length_km(const GeoPoint* points, std::size_t count) noexcept {
    if (points == nullptr || count < 2) {
        return 0.0;
    }
    double total_m = 0.0;
    for (std::size_t i = 0; i + 1 < count; ++i) {
        total_m += geodesic_distance_m(points[i], points[i + 1]);
    }
    return total_m / 1000.0;
}

GeoPoint centroid(const GeoPoint* points, std::size_t count) noexcept {
    GeoPoint c{};
    if (points == nullptr || count == 0) {
        return c;
    }
    for (std::size_t i = 0; i < count; ++i) {
        c.lat += points[i].lat;
        c.lon += points[i].lon;
    }
    c.lat /= static_cast<double>(count);
    c.lon /= static_cast<double>(count);
    return c;
}

} // namespace wcoord::core
