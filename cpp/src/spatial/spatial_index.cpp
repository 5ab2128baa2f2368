#include "wcoord/spatial/spatial_index.hpp"
#include "wcoord/core/geo.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>

namespace wcoord::spatial {

using namespace wcoord::core;

namespace {
    struct LonSpan {
        double lo{0.0};
        double hi{0.0};
    };

    // Splits [lo, hi] at the antimeridian.
    u32 lon_spans(double lo, double hi, LonSpan out[2]) noexcept {
        if (hi - lo >= 360.0) {
            out[0] = LonSpan{-180.0, 180.0};
            return 1;
        }
        if (lo < -180.0) {
            out[0] = LonSpan{lo + 360.0, 180.0};
            out[1] = LonSpan{-180.0, hi};
            return 2;
        }
        if (hi > 180.0) {
            out[0] = LonSpan{lo, 180.0};
            out[1] = LonSpan{-180.0, hi - 360.0};
            return 2;
        }
        out[0] = LonSpan{lo, hi};
        return 1;
    }
} // namespace

bool filter_matches(const NearbyFilter& filter, const Bin& bin) noexcept {
    if (filter.active_only && !bin.active) {
        return false;
    }
    if (filter.needs_collection_only && !bin_eligible(bin)) {
        return false;
    }
    if (filter.unclaimed_only && bin.claimed_by.is_valid()) {
        return false;
    }
    return true;
}

SpatialIndex::SpatialIndex(const IndexConfig& cfg) noexcept : cfg_(cfg) {
    if (!(cfg_.cell_deg > 0.0) || cfg_.cell_deg > 10.0) {
        cfg_.cell_deg = IndexConfig{}.cell_deg;
    }
}

int SpatialIndex::cell_coord(double deg) const noexcept {
    return static_cast<int>(std::floor(deg / cfg_.cell_deg));
}

SpatialIndex::CellKey SpatialIndex::cell_of(GeoPoint p) const noexcept {
    return CellKey{cell_coord(p.lat), cell_coord(p.lon)};
}

void SpatialIndex::unlink_locked(BinId id, CellKey cell) noexcept {
    auto it = cells_.find(cell);
    if (it == cells_.end()) {
        return;
    }
    auto& ids = it->second;
    ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
    if (ids.empty()) {
        cells_.erase(it);
    }
}

void SpatialIndex::upsert(const Bin& bin) noexcept {
    if (!bin.id.is_valid()) {
        return;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);

    const CellKey cell = cell_of(bin.point);
    auto it = bins_.find(bin.id);
    if (it != bins_.end()) {
        const CellKey old_cell = cell_of(it->second.point);
        if (!(old_cell == cell)) {
            unlink_locked(bin.id, old_cell);
            cells_[cell].push_back(bin.id);
        }
        it->second = bin;
        return;
    }
    bins_.emplace(bin.id, bin);
    cells_[cell].push_back(bin.id);
}

void SpatialIndex::remove(BinId id) noexcept {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = bins_.find(id);
    if (it == bins_.end()) {
        return;
    }
    unlink_locked(id, cell_of(it->second.point));
    bins_.erase(it);
}

Status SpatialIndex::nearby(GeoPoint center, double radius_m, const NearbyFilter& filter,
                            std::vector<NearbyHit>* out) const noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Spatial, StatusCode::Invalid);
    }
    out->clear();
    if (!geo_point_valid(center) || !std::isfinite(radius_m) || radius_m < 0.0) {
        return make_status(StatusDomain::Spatial, StatusCode::Invalid);
    }

    const GeoBox box = bounding_box(center, radius_m);
    LonSpan spans[2];
    const u32 span_count = lon_spans(box.min_lon, box.max_lon, spans);

    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto consider = [&](const Bin& bin) {
        if (!filter_matches(filter, bin)) {
            return;
        }
        const double d = geodesic_distance_m(center, bin.point);
        if (d <= radius_m) {
            out->push_back(NearbyHit{bin, d});
        }
    };

    const int lat_lo = cell_coord(box.min_lat);
    const int lat_hi = cell_coord(box.max_lat);
    u64 cell_count = 0;
    for (u32 s = 0; s < span_count; ++s) {
        cell_count += static_cast<u64>(lat_hi - lat_lo + 1) *
                      static_cast<u64>(cell_coord(spans[s].hi) - cell_coord(spans[s].lo) + 1);
    }

    if (cell_count > bins_.size()) {
        // Radius covers more cells than there are bins; a scan is cheaper.
        for (const auto& [id, bin] : bins_) {
            (void)id;
            const bool in_lat = bin.point.lat >= box.min_lat && bin.point.lat <= box.max_lat;
            if (in_lat) {
                consider(bin);
            }
        }
    } else {
        for (u32 s = 0; s < span_count; ++s) {
            const int lon_lo = cell_coord(spans[s].lo);
            const int lon_hi = cell_coord(spans[s].hi);
            for (int la = lat_lo; la <= lat_hi; ++la) {
                for (int lo = lon_lo; lo <= lon_hi; ++lo) {
                    auto cit = cells_.find(CellKey{la, lo});
                    if (cit == cells_.end()) {
                        continue;
                    }
                    for (BinId id : cit->second) {
                        auto bit = bins_.find(id);
                        if (bit != bins_.end()) {
                            consider(bit->second);
                        }
                    }
                }
            }
        }
    }
    lock.unlock();

    std::sort(out->begin(), out->end(), [](const NearbyHit& a, const NearbyHit& b) {
        if (a.distance_m != b.distance_m) {
            return a.distance_m < b.distance_m;
        }
        return a.bin.id.v < b.bin.id.v;
    });
    return ok_status();
}

Status SpatialIndex::select(const NearbyFilter& filter, std::vector<Bin>* out) const noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Spatial, StatusCode::Invalid);
    }
    out->clear();
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [id, bin] : bins_) {
            (void)id;
            if (filter_matches(filter, bin)) {
                out->push_back(bin);
            }
        }
    }
    std::sort(out->begin(), out->end(), [](const Bin& a, const Bin& b) { return a.id.v < b.id.v; });
    return ok_status();
}

u64 SpatialIndex::size() const noexcept {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return static_cast<u64>(bins_.size());
}

} // namespace wcoord::spatial
