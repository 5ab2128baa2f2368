#pragma once

#include <atomic>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "wcoord/core/errors.hpp"
#include "wcoord/core/events.hpp"
#include "wcoord/core/models.hpp"
#include "wcoord/core/types.hpp"
#include "wcoord/db/db.hpp"
#include "wcoord/fleet/fleet_tracker.hpp"
#include "wcoord/registry/bin_registry.hpp"

namespace wcoord::routing {

using u32 = wcoord::core::u32;
using u64 = wcoord::core::u64;

inline constexpr double kDefaultDensityKgPerLiter = 0.15;

struct LifecycleConfig {
    double density_kg_per_liter{kDefaultDensityKgPerLiter};
};

// planned / actual as a percentage, clamped to [0, 100]; 100 when nothing was driven.
[[nodiscard]] double efficiency_score(double planned_km, double actual_km) noexcept;

// Route execution state machine:
//   pending -> assigned -> in_progress -> completed
//   any non-terminal -> cancelled
// One mutex serializes every transition, so a cancelled route never accepts
// another collection. Lock order: lifecycle, then registry/fleet.
class RouteLifecycle {
public:
    RouteLifecycle(wcoord::db::Database* db,
                   wcoord::registry::BinRegistry* registry,
                   wcoord::fleet::FleetTracker* fleet,
                   wcoord::core::EventBus* events,
                   const LifecycleConfig& cfg = LifecycleConfig{}) noexcept;
    RouteLifecycle(const RouteLifecycle&) = delete;
    RouteLifecycle& operator=(const RouteLifecycle&) = delete;

    [[nodiscard]] wcoord::core::Status seed_ids() noexcept;

    [[nodiscard]] wcoord::core::Status create(const wcoord::core::RouteSchedule& schedule,
                                              wcoord::core::Timestamp now,
                                              wcoord::core::RouteId* out) noexcept;

    // pending -> assigned. Stops follow the order of `bins` (sequence 1..N).
    // The driver must be paired with the truck. Reserves the truck and claims
    // the bins; every step is undone when a later one fails.
    [[nodiscard]] wcoord::core::Status assign(wcoord::core::RouteId route,
                                              wcoord::core::DriverId driver,
                                              wcoord::core::TruckId truck,
                                              const wcoord::core::BinId* bins,
                                              u32 count,
                                              bool require_eligible,
                                              wcoord::core::Timestamp now) noexcept;

    [[nodiscard]] wcoord::core::Status start(wcoord::core::RouteId route, wcoord::core::Timestamp now) noexcept;

    // Completes the route when the last stop is collected.
    [[nodiscard]] wcoord::core::Status mark_stop_collected(wcoord::core::RouteId route,
                                                           wcoord::core::BinId bin,
                                                           double weight_kg,
                                                           wcoord::core::Timestamp now) noexcept;

    // Negative `actual_distance_km` measures the driver's trail since the start.
    [[nodiscard]] wcoord::core::Status complete(wcoord::core::RouteId route,
                                                double actual_distance_km,
                                                wcoord::core::Timestamp now) noexcept;

    [[nodiscard]] wcoord::core::Status cancel(wcoord::core::RouteId route, wcoord::core::Timestamp now) noexcept;

    [[nodiscard]] wcoord::core::Status get(wcoord::core::RouteId route, wcoord::core::Route* out) const noexcept;

    // Non-terminal routes ordered by id.
    [[nodiscard]] wcoord::core::Status active_routes(std::vector<wcoord::core::Route>* out) const noexcept;

private:
    [[nodiscard]] wcoord::core::Status journal_route(const wcoord::core::Route& r) noexcept;
    [[nodiscard]] double measured_distance_km(const wcoord::core::Route& r, wcoord::core::Timestamp now) const noexcept;

    // Moves a started or assigned route to a terminal state and returns its
    // resources. Caller holds mutex_.
    [[nodiscard]] wcoord::core::Status finish_locked(wcoord::core::Route* r,
                                                     wcoord::core::RouteStatus terminal,
                                                     wcoord::core::Timestamp now,
                                                     std::vector<wcoord::core::Event>* events) noexcept;

    wcoord::db::Database* db_;
    wcoord::registry::BinRegistry* registry_;
    wcoord::fleet::FleetTracker* fleet_;
    wcoord::core::EventBus* events_;
    LifecycleConfig cfg_;

    mutable std::mutex mutex_;
    std::unordered_map<wcoord::core::RouteId, wcoord::core::Route, wcoord::core::IdHash> routes_;
    std::atomic<u64> next_route_{1};
};

} // namespace wcoord::routing
