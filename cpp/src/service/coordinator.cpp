#include "wcoord/service/coordinator.hpp"

#include "wcoord/core/log.hpp"

namespace wcoord::service {

using namespace wcoord::core;

namespace {
    [[nodiscard]] Timestamp or_now(Timestamp t) noexcept {
        return t != 0 ? t : unix_now();
    }
} // namespace

Coordinator::Coordinator(const EngineConfig& cfg) noexcept
    : cfg_(cfg),
      index_(cfg.index),
      registry_(&db_, &index_, &events_, cfg.registry),
      fleet_(&db_, cfg.tracker),
      lifecycle_(&db_, &registry_, &fleet_, &events_, cfg.lifecycle),
      optimizer_(&index_, &fleet_, &lifecycle_, cfg.optimizer) {}

Coordinator::~Coordinator() noexcept {
    if (db_.is_open()) {
        const Status s = db_.close();
        if (!is_ok(s)) {
            log_status("close journal", s);
        }
    }
}

Status Coordinator::open() noexcept {
    Status s = db_.open(cfg_.db);
    if (!is_ok(s)) {
        failed_.store(true);
        log_status("open journal", s);
        return s;
    }
    s = registry_.seed_ids();
    if (is_ok(s)) {
        s = fleet_.seed_ids();
    }
    if (is_ok(s)) {
        s = lifecycle_.seed_ids();
    }
    if (!is_ok(s)) {
        log_status("seed ids", s);
        return track("seed ids", s);
    }
    failed_.store(false);
    log_info("engine ready");
    return ok_status();
}

Status Coordinator::close() noexcept {
    return db_.close();
}

bool Coordinator::healthy() const noexcept {
    return !failed_.load() && db_.is_open();
}

Status Coordinator::writable() const noexcept {
    if (!healthy()) {
        return make_status(StatusDomain::Service, StatusCode::Unavailable);
    }
    return ok_status();
}

Status Coordinator::track(const char* context, Status s) noexcept {
    if (is_fatal(s)) {
        if (!failed_.exchange(true)) {
            log_status(context, s);
            log_error("journal failure; refusing further writes");
        }
    }
    return s;
}

// ============================================================================
// Registration
// ============================================================================

Status Coordinator::register_bin(const wcoord::registry::BinParams& params, BinId* out) noexcept {
    Status s = writable();
    if (!is_ok(s)) {
        return s;
    }
    return track("register bin", registry_.register_bin(params, out));
}

Status Coordinator::deactivate_bin(BinId bin) noexcept {
    Status s = writable();
    if (!is_ok(s)) {
        return s;
    }
    return track("deactivate bin", registry_.deactivate(bin, unix_now()));
}

Status Coordinator::move_bin(BinId bin, GeoPoint point) noexcept {
    Status s = writable();
    if (!is_ok(s)) {
        return s;
    }
    return track("move bin", registry_.move(bin, point, unix_now()));
}

Status Coordinator::add_truck(const Truck& truck, TruckId* out) noexcept {
    Status s = writable();
    if (!is_ok(s)) {
        return s;
    }
    return track("add truck", fleet_.add_truck(truck, out));
}

Status Coordinator::add_driver(const Driver& driver) noexcept {
    Status s = writable();
    if (!is_ok(s)) {
        return s;
    }
    return track("add driver", fleet_.add_driver(driver));
}

Status Coordinator::assign_driver(DriverId driver, TruckId truck) noexcept {
    Status s = writable();
    if (!is_ok(s)) {
        return s;
    }
    return track("assign driver", fleet_.assign(driver, truck));
}

Status Coordinator::unassign_driver(DriverId driver) noexcept {
    Status s = writable();
    if (!is_ok(s)) {
        return s;
    }
    return track("unassign driver", fleet_.unassign(driver));
}

Status Coordinator::set_location_sharing(DriverId driver, bool enabled) noexcept {
    Status s = writable();
    if (!is_ok(s)) {
        return s;
    }
    return track("set sharing", fleet_.set_sharing(driver, enabled));
}

Status Coordinator::set_on_duty(DriverId driver, bool on_duty) noexcept {
    Status s = writable();
    if (!is_ok(s)) {
        return s;
    }
    return track("set on duty", fleet_.set_on_duty(driver, on_duty));
}

Status Coordinator::set_update_frequency(DriverId driver, u32 seconds) noexcept {
    Status s = writable();
    if (!is_ok(s)) {
        return s;
    }
    return track("set update frequency", fleet_.set_update_frequency(driver, seconds));
}

Status Coordinator::set_truck_status(TruckId truck, TruckStatus status) noexcept {
    Status s = writable();
    if (!is_ok(s)) {
        return s;
    }
    return track("set truck status", fleet_.set_truck_status(truck, status));
}

// ============================================================================
// Inbound operations
// ============================================================================

Status Coordinator::report_fill_level(BinId bin, FillLevel fill, UserId reporter, Timestamp reported_at,
                                      WasteReport* out) noexcept {
    Status s = writable();
    if (!is_ok(s)) {
        return s;
    }
    return track("report fill level", registry_.report(bin, fill, reporter, or_now(reported_at), out));
}

Status Coordinator::ingest_location(DriverId driver, const LocationSample& sample) noexcept {
    Status s = writable();
    if (!is_ok(s)) {
        return s;
    }
    return track("ingest location", fleet_.ingest(driver, sample));
}

Status Coordinator::run_optimization(const wcoord::routing::OptimizeRequest& req,
                                     wcoord::routing::OptimizeResult* out) noexcept {
    Status s = writable();
    if (!is_ok(s)) {
        return s;
    }
    s = track("optimize", optimizer_.run(req, out));
    if (is_ok(s) && out != nullptr) {
        log_info("optimizer committed %zu routes (%zu clusters unassigned, %u passes)", out->routes.size(),
                 out->unassigned.size(), out->passes);
    }
    return s;
}

Status Coordinator::assign_route(DriverId driver, TruckId truck, const std::vector<BinId>& bins,
                                 const RouteSchedule& schedule, RouteId* out) noexcept {
    if (out == nullptr || bins.empty()) {
        return make_status(StatusDomain::Service, StatusCode::Invalid);
    }
    Status s = writable();
    if (!is_ok(s)) {
        return s;
    }

    const Timestamp now = unix_now();
    RouteId route{};
    s = track("create route", lifecycle_.create(schedule, now, &route));
    if (!is_ok(s)) {
        return s;
    }
    s = track("assign route",
              lifecycle_.assign(route, driver, truck, bins.data(), static_cast<u32>(bins.size()), false, now));
    if (!is_ok(s)) {
        const Status cs = track("drop unassigned route", lifecycle_.cancel(route, now));
        if (!is_ok(cs)) {
            log_status("drop unassigned route", cs);
        }
        return s;
    }
    *out = route;
    return ok_status();
}

Status Coordinator::start_route(RouteId route, Timestamp now) noexcept {
    Status s = writable();
    if (!is_ok(s)) {
        return s;
    }
    return track("start route", lifecycle_.start(route, or_now(now)));
}

Status Coordinator::mark_stop_collected(RouteId route, BinId bin, double weight_kg, Timestamp now) noexcept {
    Status s = writable();
    if (!is_ok(s)) {
        return s;
    }
    return track("collect stop", lifecycle_.mark_stop_collected(route, bin, weight_kg, or_now(now)));
}

Status Coordinator::complete_route(RouteId route, double actual_distance_km, Timestamp now) noexcept {
    Status s = writable();
    if (!is_ok(s)) {
        return s;
    }
    return track("complete route", lifecycle_.complete(route, actual_distance_km, or_now(now)));
}

Status Coordinator::cancel_route(RouteId route, Timestamp now) noexcept {
    Status s = writable();
    if (!is_ok(s)) {
        return s;
    }
    return track("cancel route", lifecycle_.cancel(route, or_now(now)));
}

Status Coordinator::purge_locations(Timestamp before, u64* removed) noexcept {
    Status s = writable();
    if (!is_ok(s)) {
        return s;
    }
    return track("purge locations", fleet_.purge_before(before, removed));
}

// ============================================================================
// Queries
// ============================================================================

Status Coordinator::nearby_bins(GeoPoint point, double radius_m, const wcoord::spatial::NearbyFilter& filter,
                                std::vector<wcoord::spatial::NearbyHit>* out) const noexcept {
    return index_.nearby(point, radius_m, filter, out);
}

Status Coordinator::active_drivers(std::vector<wcoord::fleet::DriverStatus>* out) const noexcept {
    return fleet_.active_drivers(out);
}

Status Coordinator::route_detail(RouteId route, Route* out) const noexcept {
    return lifecycle_.get(route, out);
}

Status Coordinator::active_routes(std::vector<Route>* out) const noexcept {
    return lifecycle_.active_routes(out);
}

Status Coordinator::urgent_bins(Timestamp now, std::vector<wcoord::registry::UrgentBin>* out) const noexcept {
    return registry_.urgent(or_now(now), 0, out);
}

Status Coordinator::bin(BinId id, Bin* out) const noexcept {
    return registry_.get(id, out);
}

Status Coordinator::truck(TruckId id, Truck* out) const noexcept {
    return fleet_.truck(id, out);
}

} // namespace wcoord::service
