#pragma once

#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "wcoord/core/errors.hpp"
#include "wcoord/core/models.hpp"
#include "wcoord/core/types.hpp"

namespace wcoord::spatial {

using u64 = wcoord::core::u64;

struct IndexConfig {
    double cell_deg{0.01};   // grid cell edge in degrees (~1.1 km of latitude)
};

struct NearbyFilter {
    bool active_only{true};
    bool needs_collection_only{true};
    bool unclaimed_only{false};
};

struct NearbyHit {
    wcoord::core::Bin bin{};
    double distance_m{0.0};
};

// Grid-bucket index over bin positions. Entries are full Bin snapshots kept
// current by the registry. Readers share the lock, writers take it
// exclusively, so one query sees one consistent state of every bin.
class SpatialIndex {
public:
    explicit SpatialIndex(const IndexConfig& cfg = IndexConfig{}) noexcept;
    SpatialIndex(const SpatialIndex&) = delete;
    SpatialIndex& operator=(const SpatialIndex&) = delete;

    // Inserts or replaces the entry for bin.id, rebucketing on a position change.
    void upsert(const wcoord::core::Bin& bin) noexcept;
    void remove(wcoord::core::BinId id) noexcept;

    // Matching bins with geodesic distance <= radius_m, ascending by distance
    // (ties by bin id).
    [[nodiscard]] wcoord::core::Status nearby(wcoord::core::GeoPoint center,
                                              double radius_m,
                                              const NearbyFilter& filter,
                                              std::vector<NearbyHit>* out) const noexcept;

    // Every matching bin, ordered by bin id.
    [[nodiscard]] wcoord::core::Status select(const NearbyFilter& filter,
                                              std::vector<wcoord::core::Bin>* out) const noexcept;

    [[nodiscard]] u64 size() const noexcept;

private:
    struct CellKey {
        int lat{0};
        int lon{0};
        friend constexpr bool operator==(CellKey, CellKey) noexcept = default;
    };

    struct CellKeyHash {
        std::size_t operator()(CellKey k) const noexcept {
            const u64 packed = (static_cast<u64>(static_cast<wcoord::core::u32>(k.lat)) << 32) |
                               static_cast<u64>(static_cast<wcoord::core::u32>(k.lon));
            return std::hash<u64>{}(packed);
        }
    };

    [[nodiscard]] CellKey cell_of(wcoord::core::GeoPoint p) const noexcept;
    [[nodiscard]] int cell_coord(double deg) const noexcept;
    void unlink_locked(wcoord::core::BinId id, CellKey cell) noexcept;

    IndexConfig cfg_;
    std::unordered_map<CellKey, std::vector<wcoord::core::BinId>, CellKeyHash> cells_;
    std::unordered_map<wcoord::core::BinId, wcoord::core::Bin, wcoord::core::IdHash> bins_;
    mutable std::shared_mutex mutex_;
};

[[nodiscard]] bool filter_matches(const NearbyFilter& filter, const wcoord::core::Bin& bin) noexcept;

} // namespace wcoord::spatial
