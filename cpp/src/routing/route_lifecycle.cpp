#include "wcoord/routing/route_lifecycle.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "wcoord/core/collection.hpp"
#include "wcoord/core/geo.hpp"
#include "wcoord/core/log.hpp"

namespace wcoord::routing {

using namespace wcoord::core;

namespace {
    [[nodiscard]] Status lifecycle_status(StatusCode code, u32 aux = 0) noexcept {
        return make_status(StatusDomain::Lifecycle, code, aux);
    }

    [[nodiscard]] wcoord::db::RouteRecord to_record(const Route& r) noexcept {
        wcoord::db::RouteRecord rec{};
        rec.id = r.id;
        rec.driver = r.driver;
        rec.truck = r.truck;
        rec.status = r.status;
        rec.scheduled_date = r.schedule.scheduled_date;
        rec.planned_distance_km = r.planned_distance_km;
        rec.actual_distance_km = r.actual_distance_km;
        rec.bins_collected = r.bins_collected;
        rec.total_waste_kg = r.total_waste_kg;
        rec.efficiency_score = r.efficiency_score;
        rec.actual_start = r.actual_start;
        rec.actual_end = r.actual_end;
        return rec;
    }

    [[nodiscard]] Event route_event(EventKind kind, const Route& r, Timestamp at) noexcept {
        Event ev{};
        ev.kind = kind;
        ev.route = r.id;
        ev.driver = r.driver;
        ev.truck = r.truck;
        ev.at = at;
        return ev;
    }

    void release_truck_or_log(wcoord::fleet::FleetTracker* fleet, TruckId truck) noexcept {
        const Status s = fleet->release_truck(truck);
        if (!is_ok(s)) {
            log_status("release truck", s);
        }
    }

    [[nodiscard]] bool distinct_bins(const BinId* bins, u32 count) noexcept {
        std::vector<u64> ids(count);
        for (u32 i = 0; i < count; ++i) {
            ids[i] = bins[i].v;
        }
        std::sort(ids.begin(), ids.end());
        return std::adjacent_find(ids.begin(), ids.end()) == ids.end();
    }
} // namespace

double efficiency_score(double planned_km, double actual_km) noexcept {
    if (!(actual_km > 0.0)) {
        return 100.0;
    }
    const double score = planned_km / actual_km * 100.0;
    if (!std::isfinite(score)) {
        return 0.0;
    }
    return std::clamp(score, 0.0, 100.0);
}

RouteLifecycle::RouteLifecycle(wcoord::db::Database* db,
                               wcoord::registry::BinRegistry* registry,
                               wcoord::fleet::FleetTracker* fleet,
                               EventBus* events,
                               const LifecycleConfig& cfg) noexcept
    : db_(db), registry_(registry), fleet_(fleet), events_(events), cfg_(cfg) {}

Status RouteLifecycle::seed_ids() noexcept {
    if (db_ == nullptr) {
        return ok_status();
    }
    u64 max_route = 0;
    const Status s = db_->max_id(wcoord::db::TableId::CollectionRoutes, &max_route);
    if (!is_ok(s)) {
        return s;
    }
    next_route_.store(max_route + 1);
    return ok_status();
}

Status RouteLifecycle::journal_route(const Route& r) noexcept {
    return db_ != nullptr ? db_->put_route(to_record(r)) : ok_status();
}

double RouteLifecycle::measured_distance_km(const Route& r, Timestamp now) const noexcept {
    if (!r.driver.is_valid() || r.actual_start == 0 || now < r.actual_start) {
        return 0.0;
    }
    std::vector<LocationSample> samples;
    const Status s = fleet_->trail_between(r.driver, r.actual_start, now, &samples);
    if (!is_ok(s)) {
        log_status("route trail", s);
        return 0.0;
    }
    std::vector<GeoPoint> points;
    points.reserve(samples.size());
    for (const LocationSample& ls : samples) {
        points.push_back(ls.point);
    }
    return path_length_km(points.data(), points.size());
}

// ============================================================================
// Transitions
// ============================================================================

Status RouteLifecycle::create(const RouteSchedule& schedule, Timestamp now, RouteId* out) noexcept {
    if (out == nullptr) {
        return lifecycle_status(StatusCode::Invalid);
    }
    if (schedule.window_end != 0 && schedule.window_end < schedule.window_start) {
        return lifecycle_status(StatusCode::Invalid);
    }

    Route r{};
    r.id = RouteId{next_route_.fetch_add(1)};
    std::snprintf(r.code, sizeof(r.code), "RT-%llu", static_cast<unsigned long long>(r.id.v));
    r.schedule = schedule;
    if (r.schedule.scheduled_date == 0) {
        r.schedule.scheduled_date = now - (now % kSecondsPerDay);
    }
    r.status = RouteStatus::Pending;
    r.created_at = now;
    r.updated_at = now;

    std::lock_guard<std::mutex> lock(mutex_);
    const Status s = journal_route(r);
    if (!is_ok(s)) {
        return s;
    }
    routes_.emplace(r.id, r);
    *out = r.id;
    return ok_status();
}

Status RouteLifecycle::assign(RouteId route, DriverId driver, TruckId truck, const BinId* bins, u32 count,
                              bool require_eligible, Timestamp now) noexcept {
    if (bins == nullptr || count == 0 || !distinct_bins(bins, count)) {
        return lifecycle_status(StatusCode::Invalid);
    }

    Route assigned{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = routes_.find(route);
        if (it == routes_.end()) {
            return lifecycle_status(StatusCode::NotFound);
        }
        if (it->second.status != RouteStatus::Pending) {
            return lifecycle_status(StatusCode::InvalidTransition);
        }

        Driver d{};
        Status s = fleet_->driver(driver, &d);
        if (!is_ok(s)) {
            return s;
        }
        Truck t{};
        s = fleet_->truck(truck, &t);
        if (!is_ok(s)) {
            return s;
        }
        if (d.truck != truck || t.current_driver != driver) {
            return lifecycle_status(StatusCode::Invalid, 1);
        }

        std::vector<GeoPoint> points;
        points.reserve(count);
        for (u32 i = 0; i < count; ++i) {
            Bin b{};
            s = registry_->get(bins[i], &b);
            if (!is_ok(s)) {
                return s;
            }
            points.push_back(b.point);
        }

        s = fleet_->reserve_truck(truck);
        if (!is_ok(s)) {
            return s;
        }
        // Capacity is checked by the claim itself against the fills it locks.
        const wcoord::registry::ClaimLimit limit{static_cast<double>(t.capacity_kg), cfg_.density_kg_per_liter};
        double mass = 0.0;
        s = registry_->claim(route, bins, count, require_eligible, limit, &mass);
        if (!is_ok(s)) {
            release_truck_or_log(fleet_, truck);
            if (s.code == StatusCode::CapacityExceeded) {
                return lifecycle_status(StatusCode::CapacityExceeded);
            }
            return s;
        }

        Route next = it->second;
        next.driver = driver;
        next.truck = truck;
        next.stops.clear();
        next.stops.reserve(count);
        for (u32 i = 0; i < count; ++i) {
            RouteStop stop{};
            stop.route = route;
            stop.bin = bins[i];
            stop.sequence = i + 1;
            next.stops.push_back(stop);
        }
        next.status = RouteStatus::Assigned;
        next.planned_distance_km = path_length_km(points.data(), points.size());
        next.estimated_mass_kg = mass;
        next.updated_at = now;

        if (db_ != nullptr) {
            s = db_->insert_route_stops(route, next.stops.data(), count);
            if (is_ok(s)) {
                s = journal_route(next);
                if (!is_ok(s)) {
                    const Status ds = db_->deactivate_route_stops(route);
                    if (!is_ok(ds)) {
                        log_status("undo route stops", ds);
                    }
                }
            }
            if (!is_ok(s)) {
                registry_->release(route, bins, count);
                release_truck_or_log(fleet_, truck);
                return s;
            }
        }

        it->second = next;
        assigned = next;
    }

    log_info("route %s assigned to truck %u with %u stops (%.1f kg)", assigned.code, truck.v, count,
             assigned.estimated_mass_kg);
    if (events_ != nullptr) {
        events_->publish(route_event(EventKind::RouteAssigned, assigned, now));
    }
    return ok_status();
}

Status RouteLifecycle::start(RouteId route, Timestamp now) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = routes_.find(route);
    if (it == routes_.end()) {
        return lifecycle_status(StatusCode::NotFound);
    }
    if (it->second.status != RouteStatus::Assigned) {
        return lifecycle_status(StatusCode::InvalidTransition);
    }

    Route next = it->second;
    next.status = RouteStatus::InProgress;
    next.actual_start = now;
    next.updated_at = now;
    const Status s = journal_route(next);
    if (!is_ok(s)) {
        return s;
    }
    it->second = next;
    return ok_status();
}

Status RouteLifecycle::mark_stop_collected(RouteId route, BinId bin, double weight_kg, Timestamp now) noexcept {
    std::vector<Event> events;
    Status result = ok_status();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = routes_.find(route);
        if (it == routes_.end()) {
            return lifecycle_status(StatusCode::NotFound);
        }
        Route& r = it->second;
        if (r.status != RouteStatus::InProgress) {
            return lifecycle_status(StatusCode::InvalidTransition);
        }
        if (!std::isfinite(weight_kg) || weight_kg < 0.0) {
            return lifecycle_status(StatusCode::Invalid);
        }

        auto stop = std::find_if(r.stops.begin(), r.stops.end(), [bin](const RouteStop& s) { return s.bin == bin; });
        if (stop == r.stops.end()) {
            return lifecycle_status(StatusCode::NotFound, 1);
        }
        if (stop->collected) {
            return lifecycle_status(StatusCode::InvalidTransition, 1);
        }

        Status s = registry_->mark_collected(bin, route, now);
        if (!is_ok(s)) {
            return s;
        }

        stop->collected = true;
        stop->collected_at = now;
        stop->weight_kg = weight_kg;
        r.bins_collected += 1;
        r.total_waste_kg += weight_kg;
        r.updated_at = now;

        if (db_ != nullptr) {
            s = db_->update_stop(*stop);
            if (!is_ok(s)) {
                log_status("journal stop", s);
                result = s;
            }
        }

        const bool all_collected = std::all_of(r.stops.begin(), r.stops.end(),
                                               [](const RouteStop& st) { return st.collected; });
        if (all_collected) {
            r.actual_distance_km = measured_distance_km(r, now);
            s = finish_locked(&r, RouteStatus::Completed, now, &events);
        } else {
            s = journal_route(r);
        }
        if (!is_ok(s) && is_ok(result)) {
            result = s;
        }
    }

    for (const Event& ev : events) {
        if (events_ != nullptr) {
            events_->publish(ev);
        }
    }
    return result;
}

Status RouteLifecycle::complete(RouteId route, double actual_distance_km, Timestamp now) noexcept {
    std::vector<Event> events;
    Status s = ok_status();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = routes_.find(route);
        if (it == routes_.end()) {
            return lifecycle_status(StatusCode::NotFound);
        }
        Route& r = it->second;
        if (r.status != RouteStatus::InProgress) {
            return lifecycle_status(StatusCode::InvalidTransition);
        }
        if (std::isnan(actual_distance_km) || actual_distance_km < 0.0) {
            r.actual_distance_km = measured_distance_km(r, now);
        } else {
            r.actual_distance_km = actual_distance_km;
        }
        s = finish_locked(&r, RouteStatus::Completed, now, &events);
    }

    for (const Event& ev : events) {
        if (events_ != nullptr) {
            events_->publish(ev);
        }
    }
    return s;
}

Status RouteLifecycle::cancel(RouteId route, Timestamp now) noexcept {
    std::vector<Event> events;
    Status s = ok_status();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = routes_.find(route);
        if (it == routes_.end()) {
            return lifecycle_status(StatusCode::NotFound);
        }
        if (route_status_terminal(it->second.status)) {
            return lifecycle_status(StatusCode::InvalidTransition);
        }
        s = finish_locked(&it->second, RouteStatus::Cancelled, now, &events);
    }

    for (const Event& ev : events) {
        if (events_ != nullptr) {
            events_->publish(ev);
        }
    }
    return s;
}

// In-memory state moves to the terminal status even when the journal write
// fails; the failure is returned so the caller can stop the engine.
Status RouteLifecycle::finish_locked(Route* r, RouteStatus terminal, Timestamp now, std::vector<Event>* events) noexcept {
    const bool holds_resources = r->status == RouteStatus::Assigned || r->status == RouteStatus::InProgress;

    if (holds_resources) {
        std::vector<BinId> uncollected;
        for (const RouteStop& stop : r->stops) {
            if (!stop.collected) {
                uncollected.push_back(stop.bin);
            }
        }
        registry_->release(r->id, uncollected.data(), static_cast<u32>(uncollected.size()));

        release_truck_or_log(fleet_, r->truck);
    }

    r->status = terminal;
    r->actual_end = now;
    r->updated_at = now;
    if (terminal == RouteStatus::Completed) {
        r->efficiency_score = efficiency_score(r->planned_distance_km, r->actual_distance_km);
    }

    Status s = ok_status();
    if (db_ != nullptr && holds_resources) {
        s = db_->deactivate_route_stops(r->id);
    }
    const Status js = journal_route(*r);
    if (is_ok(s)) {
        s = js;
    }

    const EventKind kind = terminal == RouteStatus::Completed ? EventKind::RouteCompleted : EventKind::RouteCancelled;
    events->push_back(route_event(kind, *r, now));
    log_info("route %s %s", r->code, route_status_name(terminal));
    return s;
}

// ============================================================================
// Queries
// ============================================================================

Status RouteLifecycle::get(RouteId route, Route* out) const noexcept {
    if (out == nullptr) {
        return lifecycle_status(StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = routes_.find(route);
    if (it == routes_.end()) {
        return lifecycle_status(StatusCode::NotFound);
    }
    *out = it->second;
    return ok_status();
}

Status RouteLifecycle::active_routes(std::vector<Route>* out) const noexcept {
    if (out == nullptr) {
        return lifecycle_status(StatusCode::Invalid);
    }
    out->clear();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, r] : routes_) {
            (void)id;
            if (!route_status_terminal(r.status)) {
                out->push_back(r);
            }
        }
    }
    std::sort(out->begin(), out->end(), [](const Route& a, const Route& b) { return a.id.v < b.id.v; });
    return ok_status();
}

} // namespace wcoord::routing
