#include "wcoord/service/engine_config.hpp"

#include "wcoord/core/config.hpp"

namespace wcoord::service {

using namespace wcoord::core;

void EngineConfig::set_density(double kg_per_liter) noexcept {
    optimizer.density_kg_per_liter = kg_per_liter;
    lifecycle.density_kg_per_liter = kg_per_liter;
}

EngineConfig EngineConfig::from_env() noexcept {
    EngineConfig cfg{};
    cfg.db.path = env_or("WCOORD_DB_PATH", nullptr);
    cfg.db.journal_mode = env_or("WCOORD_DB_JOURNAL_MODE", nullptr);

    double density = cfg.optimizer.density_kg_per_liter;
    env_override_f64("WCOORD_DENSITY_KG_PER_L", 0.001, 10.0, &density);
    cfg.set_density(density);

    env_override_f64("WCOORD_CLUSTER_RADIUS_M", 1.0, 100000.0, &cfg.optimizer.cluster_radius_m);
    env_override_u32("WCOORD_OPTIMIZE_INTERVAL_S", 1, 86400, &cfg.scheduler.optimize_interval_s);
    return cfg;
}

} // namespace wcoord::service
