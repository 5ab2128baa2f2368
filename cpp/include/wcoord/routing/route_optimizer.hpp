#pragma once

#include <vector>

#include "wcoord/core/errors.hpp"
#include "wcoord/core/models.hpp"
#include "wcoord/core/types.hpp"
#include "wcoord/fleet/fleet_tracker.hpp"
#include "wcoord/routing/route_lifecycle.hpp"
#include "wcoord/spatial/spatial_index.hpp"

namespace wcoord::routing {

struct OptimizerConfig {
    double cluster_radius_m{500.0};
    double density_kg_per_liter{kDefaultDensityKgPerLiter};
    wcoord::core::Timestamp urgent_age_s{wcoord::core::kSecondsPerDay};
    u32 max_claim_attempts{3};
    double fallback_capacity_kg{0.0};     // target once trucks run out; <= 0 = unbounded
};

struct OptimizeRequest {
    bool has_seed{false};
    wcoord::core::GeoPoint seed{};        // depot or a truck position
    double radius_m{0.0};                 // > 0 with a seed limits candidates to that radius
    wcoord::core::Timestamp now{0};       // 0 = current time
    wcoord::core::RouteSchedule schedule{};
};

struct Cluster {
    std::vector<wcoord::core::Bin> bins;  // stop order once sequenced
    double mass_kg{0.0};
    wcoord::core::GeoPoint centroid{};
    wcoord::core::TruckId truck{wcoord::core::TruckId::invalid()};
    wcoord::core::DriverId driver{wcoord::core::DriverId::invalid()};
};

struct Plan {
    std::vector<Cluster> assigned;        // mass descending
    std::vector<Cluster> unassigned;
};

struct OptimizeResult {
    std::vector<wcoord::core::RouteId> routes;
    std::vector<Cluster> unassigned;
    u32 conflicts{0};                     // clusters lost on the final pass
    u32 passes{0};
};

// Sorts by collection priority (tier, staleness, bin id).
void rank_bins(std::vector<wcoord::core::Bin>* bins,
               wcoord::core::Timestamp now,
               wcoord::core::Timestamp urgent_age_s) noexcept;

// Nearest-neighbour walk from `start`. `bins` must already be in priority
// order, which breaks distance ties.
void sequence_stops(wcoord::core::GeoPoint start, std::vector<wcoord::core::Bin>* bins) noexcept;

// Turns eligible bins into truck routes. plan() is pure; run() reads the
// index and fleet, commits through the lifecycle and retries the clusters
// that lost a claim or a truck to a concurrent run.
class RouteOptimizer {
public:
    RouteOptimizer(wcoord::spatial::SpatialIndex* index,
                   wcoord::fleet::FleetTracker* fleet,
                   RouteLifecycle* lifecycle,
                   const OptimizerConfig& cfg = OptimizerConfig{}) noexcept;
    RouteOptimizer(const RouteOptimizer&) = delete;
    RouteOptimizer& operator=(const RouteOptimizer&) = delete;

    [[nodiscard]] wcoord::core::Status plan(const std::vector<wcoord::core::Bin>& eligible,
                                            const std::vector<wcoord::fleet::FleetUnit>& trucks,
                                            const OptimizeRequest& req,
                                            Plan* out) const noexcept;

    // SchedulingConflict when clusters still lose after max_claim_attempts
    // passes; `out` then holds the routes that did commit.
    [[nodiscard]] wcoord::core::Status run(const OptimizeRequest& req, OptimizeResult* out) noexcept;

    [[nodiscard]] const OptimizerConfig& config() const noexcept { return cfg_; }

private:
    [[nodiscard]] wcoord::core::Status candidates(const OptimizeRequest& req,
                                                  std::vector<wcoord::core::Bin>* out) const noexcept;

    wcoord::spatial::SpatialIndex* index_;
    wcoord::fleet::FleetTracker* fleet_;
    RouteLifecycle* lifecycle_;
    OptimizerConfig cfg_;
};

} // namespace wcoord::routing
