#pragma once

#include "wcoord/db/db.hpp"
#include "wcoord/fleet/fleet_tracker.hpp"
#include "wcoord/registry/bin_registry.hpp"
#include "wcoord/routing/route_lifecycle.hpp"
#include "wcoord/routing/route_optimizer.hpp"
#include "wcoord/spatial/spatial_index.hpp"

namespace wcoord::service {

using u32 = wcoord::core::u32;

struct SchedulerConfig {
    u32 optimize_interval_s{300};
    bool wake_on_eligible{true};
};

struct EngineConfig {
    wcoord::db::DbConfig db{};
    wcoord::registry::RegistryConfig registry{};
    wcoord::spatial::IndexConfig index{};
    wcoord::fleet::TrackerConfig tracker{};
    wcoord::routing::LifecycleConfig lifecycle{};
    wcoord::routing::OptimizerConfig optimizer{};
    SchedulerConfig scheduler{};

    // Defaults overridden by WCOORD_DB_PATH, WCOORD_DB_JOURNAL_MODE,
    // WCOORD_DENSITY_KG_PER_L, WCOORD_CLUSTER_RADIUS_M and
    // WCOORD_OPTIMIZE_INTERVAL_S. The returned strings point into the
    // process environment.
    [[nodiscard]] static EngineConfig from_env() noexcept;

    // One density drives both planning and the manual-assignment check.
    void set_density(double kg_per_liter) noexcept;
};

} // namespace wcoord::service
