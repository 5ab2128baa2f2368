#pragma once

#include <atomic>
#include <vector>

#include "wcoord/core/errors.hpp"
#include "wcoord/core/events.hpp"
#include "wcoord/core/models.hpp"
#include "wcoord/core/types.hpp"
#include "wcoord/db/db.hpp"
#include "wcoord/fleet/fleet_tracker.hpp"
#include "wcoord/registry/bin_registry.hpp"
#include "wcoord/routing/route_lifecycle.hpp"
#include "wcoord/routing/route_optimizer.hpp"
#include "wcoord/service/engine_config.hpp"
#include "wcoord/spatial/spatial_index.hpp"

namespace wcoord::service {

// Inbound interface of the engine. Owns the journal and every component,
// wired in dependency order. A fatal journal status (Unavailable, Io,
// Corrupt) from any write latches the coordinator into a failed state in
// which further writes return Unavailable.
//
// Timestamps default to the current time when passed as 0.
class Coordinator {
public:
    explicit Coordinator(const EngineConfig& cfg = EngineConfig{}) noexcept;
    ~Coordinator() noexcept;
    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    [[nodiscard]] wcoord::core::Status open() noexcept;
    [[nodiscard]] wcoord::core::Status close() noexcept;
    [[nodiscard]] bool healthy() const noexcept;

    [[nodiscard]] wcoord::core::EventBus& events() noexcept { return events_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return cfg_; }

    // ------------------------------------------------------------------
    // Registration
    // ------------------------------------------------------------------

    [[nodiscard]] wcoord::core::Status register_bin(const wcoord::registry::BinParams& params,
                                                    wcoord::core::BinId* out) noexcept;
    [[nodiscard]] wcoord::core::Status deactivate_bin(wcoord::core::BinId bin) noexcept;
    [[nodiscard]] wcoord::core::Status move_bin(wcoord::core::BinId bin, wcoord::core::GeoPoint point) noexcept;
    [[nodiscard]] wcoord::core::Status add_truck(const wcoord::core::Truck& truck, wcoord::core::TruckId* out) noexcept;
    [[nodiscard]] wcoord::core::Status add_driver(const wcoord::core::Driver& driver) noexcept;
    [[nodiscard]] wcoord::core::Status assign_driver(wcoord::core::DriverId driver, wcoord::core::TruckId truck) noexcept;
    [[nodiscard]] wcoord::core::Status unassign_driver(wcoord::core::DriverId driver) noexcept;
    [[nodiscard]] wcoord::core::Status set_location_sharing(wcoord::core::DriverId driver, bool enabled) noexcept;
    [[nodiscard]] wcoord::core::Status set_on_duty(wcoord::core::DriverId driver, bool on_duty) noexcept;
    [[nodiscard]] wcoord::core::Status set_update_frequency(wcoord::core::DriverId driver, u32 seconds) noexcept;
    [[nodiscard]] wcoord::core::Status set_truck_status(wcoord::core::TruckId truck,
                                                        wcoord::core::TruckStatus status) noexcept;

    // ------------------------------------------------------------------
    // Inbound operations
    // ------------------------------------------------------------------

    [[nodiscard]] wcoord::core::Status report_fill_level(wcoord::core::BinId bin,
                                                         wcoord::core::FillLevel fill,
                                                         wcoord::core::UserId reporter,
                                                         wcoord::core::Timestamp reported_at,
                                                         wcoord::core::WasteReport* out) noexcept;

    [[nodiscard]] wcoord::core::Status ingest_location(wcoord::core::DriverId driver,
                                                       const wcoord::core::LocationSample& sample) noexcept;

    [[nodiscard]] wcoord::core::Status run_optimization(const wcoord::routing::OptimizeRequest& req,
                                                        wcoord::routing::OptimizeResult* out) noexcept;

    // Manual override: creates a route and assigns it in the given stop
    // order. Bins only need to be active and unclaimed.
    [[nodiscard]] wcoord::core::Status assign_route(wcoord::core::DriverId driver,
                                                    wcoord::core::TruckId truck,
                                                    const std::vector<wcoord::core::BinId>& bins,
                                                    const wcoord::core::RouteSchedule& schedule,
                                                    wcoord::core::RouteId* out) noexcept;

    [[nodiscard]] wcoord::core::Status start_route(wcoord::core::RouteId route, wcoord::core::Timestamp now = 0) noexcept;
    [[nodiscard]] wcoord::core::Status mark_stop_collected(wcoord::core::RouteId route,
                                                           wcoord::core::BinId bin,
                                                           double weight_kg,
                                                           wcoord::core::Timestamp now = 0) noexcept;
    // Negative distance measures the driver's trail.
    [[nodiscard]] wcoord::core::Status complete_route(wcoord::core::RouteId route,
                                                      double actual_distance_km,
                                                      wcoord::core::Timestamp now = 0) noexcept;
    [[nodiscard]] wcoord::core::Status cancel_route(wcoord::core::RouteId route, wcoord::core::Timestamp now = 0) noexcept;

    [[nodiscard]] wcoord::core::Status purge_locations(wcoord::core::Timestamp before, wcoord::core::u64* removed) noexcept;

    // ------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------

    [[nodiscard]] wcoord::core::Status nearby_bins(wcoord::core::GeoPoint point,
                                                   double radius_m,
                                                   const wcoord::spatial::NearbyFilter& filter,
                                                   std::vector<wcoord::spatial::NearbyHit>* out) const noexcept;
    [[nodiscard]] wcoord::core::Status active_drivers(std::vector<wcoord::fleet::DriverStatus>* out) const noexcept;
    [[nodiscard]] wcoord::core::Status route_detail(wcoord::core::RouteId route, wcoord::core::Route* out) const noexcept;
    [[nodiscard]] wcoord::core::Status active_routes(std::vector<wcoord::core::Route>* out) const noexcept;
    [[nodiscard]] wcoord::core::Status urgent_bins(wcoord::core::Timestamp now,
                                                   std::vector<wcoord::registry::UrgentBin>* out) const noexcept;
    [[nodiscard]] wcoord::core::Status bin(wcoord::core::BinId id, wcoord::core::Bin* out) const noexcept;
    [[nodiscard]] wcoord::core::Status truck(wcoord::core::TruckId id, wcoord::core::Truck* out) const noexcept;

    [[nodiscard]] wcoord::db::Database& journal() noexcept { return db_; }

private:
    [[nodiscard]] wcoord::core::Status writable() const noexcept;
    // Latches fatal statuses; returns `s` unchanged.
    [[nodiscard]] wcoord::core::Status track(const char* context, wcoord::core::Status s) noexcept;

    EngineConfig cfg_;
    wcoord::db::Database db_;
    wcoord::core::EventBus events_;
    wcoord::spatial::SpatialIndex index_;
    wcoord::registry::BinRegistry registry_;
    wcoord::fleet::FleetTracker fleet_;
    wcoord::routing::RouteLifecycle lifecycle_;
    wcoord::routing::RouteOptimizer optimizer_;

    std::atomic<bool> failed_{false};
};

} // namespace wcoord::service
