#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "wcoord/core/collection.hpp"
#include "wcoord/core/errors.hpp"
#include "wcoord/core/events.hpp"
#include "wcoord/core/models.hpp"
#include "wcoord/core/types.hpp"
#include "wcoord/db/db.hpp"
#include "wcoord/spatial/spatial_index.hpp"

namespace wcoord::registry {

using u32 = wcoord::core::u32;

// Weight cap for a claim. Zero density leaves the claim unbounded.
struct ClaimLimit {
    double max_mass_kg{0.0};
    double density_kg_per_liter{0.0};
};
using u64 = wcoord::core::u64;

inline constexpr u32 kMinBinCapacityLiters = 1;
inline constexpr u32 kMaxBinCapacityLiters = 10000;
inline constexpr u32 kReportHistory = 32;   // recent reports kept in memory per bin

struct RegistryConfig {
    wcoord::core::Timestamp urgent_age_s{wcoord::core::kDefaultUrgentAgeS};
};

struct BinParams {
    wcoord::core::UserId owner{wcoord::core::UserId::invalid()};
    const char* code{nullptr};                 // nullptr assigns "BIN-<id>"
    u32 capacity_liters{0};
    wcoord::core::WasteCategory category{wcoord::core::WasteCategory::General};
    wcoord::core::GeoPoint point{};
    wcoord::core::Timestamp created_at{0};     // 0 = now
};

struct UrgentBin {
    wcoord::core::Bin bin{};
    wcoord::core::PriorityTier tier{wcoord::core::PriorityTier::Low};
};

// Owns bin records and their fill-level state machine. Every state change is
// journaled before it becomes visible, then mirrored into the spatial index.
//
// Locking: the map lock is shared by per-bin operations (each also takes the
// bin's own mutex) and exclusive for registration and claims, so a claim sees
// every bin of the batch in one state.
class BinRegistry {
public:
    BinRegistry(wcoord::db::Database* db,
                wcoord::spatial::SpatialIndex* index,
                wcoord::core::EventBus* events,
                const RegistryConfig& cfg = RegistryConfig{}) noexcept;
    BinRegistry(const BinRegistry&) = delete;
    BinRegistry& operator=(const BinRegistry&) = delete;

    // Continues id sequences after the rows already in the journal.
    [[nodiscard]] wcoord::core::Status seed_ids() noexcept;

    [[nodiscard]] wcoord::core::Status register_bin(const BinParams& params, wcoord::core::BinId* out) noexcept;
    [[nodiscard]] wcoord::core::Status deactivate(wcoord::core::BinId id, wcoord::core::Timestamp now) noexcept;
    [[nodiscard]] wcoord::core::Status move(wcoord::core::BinId id,
                                            wcoord::core::GeoPoint point,
                                            wcoord::core::Timestamp now) noexcept;

    // Applies max(current, fill). Emits BinEligible when the bin starts
    // needing collection. `out` may be null.
    [[nodiscard]] wcoord::core::Status report(wcoord::core::BinId id,
                                              wcoord::core::FillLevel fill,
                                              wcoord::core::UserId reporter,
                                              wcoord::core::Timestamp reported_at,
                                              wcoord::core::WasteReport* out) noexcept;

    // Collection event from a route holding the claim: level back to empty,
    // claim released.
    [[nodiscard]] wcoord::core::Status mark_collected(wcoord::core::BinId id,
                                                      wcoord::core::RouteId route,
                                                      wcoord::core::Timestamp now) noexcept;

    // All-or-nothing. SchedulingConflict if any bin is unknown, inactive,
    // claimed by another route, or (with require_eligible) not eligible.
    // CapacityExceeded when the fills held under the claim lock weigh more
    // than `limit` allows. `mass_kg` receives that weight.
    [[nodiscard]] wcoord::core::Status claim(wcoord::core::RouteId route,
                                             const wcoord::core::BinId* bins,
                                             u32 count,
                                             bool require_eligible,
                                             const ClaimLimit& limit = ClaimLimit{},
                                             double* mass_kg = nullptr) noexcept;

    // Clears the claims `route` holds on `bins`; others are left alone.
    void release(wcoord::core::RouteId route, const wcoord::core::BinId* bins, u32 count) noexcept;

    // NotFound for unknown and inactive bins.
    [[nodiscard]] wcoord::core::Status get(wcoord::core::BinId id, wcoord::core::Bin* out) const noexcept;

    // Newest first, at most kReportHistory.
    [[nodiscard]] wcoord::core::Status reports(wcoord::core::BinId id,
                                               std::vector<wcoord::core::WasteReport>* out) const noexcept;

    // Eligible bins ordered by id.
    [[nodiscard]] wcoord::core::Status eligible(std::vector<wcoord::core::Bin>* out) const noexcept;

    // Eligible bins in collection order with their tier. `urgent_age_s` <= 0
    // uses the configured age.
    [[nodiscard]] wcoord::core::Status urgent(wcoord::core::Timestamp now,
                                              wcoord::core::Timestamp urgent_age_s,
                                              std::vector<UrgentBin>* out) const noexcept;

    [[nodiscard]] u64 size() const noexcept;

private:
    struct Entry {
        mutable std::mutex mutex;
        wcoord::core::Bin bin{};
        std::vector<wcoord::core::WasteReport> history;   // newest last
        std::unordered_set<wcoord::core::Timestamp> reported_at;   // every accepted report
    };

    [[nodiscard]] Entry* find_locked(wcoord::core::BinId id) const noexcept;
    [[nodiscard]] wcoord::core::Status commit_locked(Entry* e, const wcoord::core::Bin& next) noexcept;

    wcoord::db::Database* db_;
    wcoord::spatial::SpatialIndex* index_;
    wcoord::core::EventBus* events_;
    RegistryConfig cfg_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<wcoord::core::BinId, std::unique_ptr<Entry>, wcoord::core::IdHash> entries_;

    std::atomic<u64> next_bin_{1};
    std::atomic<u64> next_report_{1};
};

} // namespace wcoord::registry
