#include "wcoord/fleet/fleet_tracker.hpp"

#include <algorithm>
#include <cmath>

#include "wcoord/core/geo.hpp"
#include "wcoord/core/log.hpp"

namespace wcoord::fleet {

using namespace wcoord::core;

namespace {
    [[nodiscard]] Status fleet_status(StatusCode code, u32 aux = 0) noexcept {
        return make_status(StatusDomain::Fleet, code, aux);
    }

    [[nodiscard]] bool in_range(double v, double lo, double hi) noexcept {
        return std::isfinite(v) && v >= lo && v <= hi;
    }
} // namespace

Status validate_sample(const LocationSample& s) noexcept {
    if (!std::isfinite(s.point.lat) || !std::isfinite(s.point.lon) || !geo_point_valid(s.point)) {
        return fleet_status(StatusCode::Invalid, 1);
    }
    if (!std::isfinite(s.accuracy_m) || s.accuracy_m < 0.0) {
        return fleet_status(StatusCode::Invalid, 2);
    }
    if (!in_range(s.heading_deg, 0.0, 360.0)) {
        return fleet_status(StatusCode::Invalid, 3);
    }
    if (!std::isfinite(s.speed_kmh) || s.speed_kmh < 0.0) {
        return fleet_status(StatusCode::Invalid, 4);
    }
    if (s.battery_pct != -1 && (s.battery_pct < 0 || s.battery_pct > 100)) {
        return fleet_status(StatusCode::Invalid, 5);
    }
    if (s.recorded_at < 0) {
        return fleet_status(StatusCode::Invalid, 6);
    }
    return ok_status();
}

FleetTracker::FleetTracker(wcoord::db::Database* db, const TrackerConfig& cfg) noexcept : db_(db), cfg_(cfg) {
    if (cfg_.trail_capacity == 0) {
        cfg_.trail_capacity = 1;
    }
}

Status FleetTracker::seed_ids() noexcept {
    if (db_ == nullptr) {
        return ok_status();
    }
    u64 max_truck = 0;
    u64 max_sample = 0;
    Status s = db_->max_id(wcoord::db::TableId::Trucks, &max_truck);
    if (!is_ok(s)) {
        return s;
    }
    s = db_->max_id(wcoord::db::TableId::LocationUpdates, &max_sample);
    if (!is_ok(s)) {
        return s;
    }
    next_truck_.store(static_cast<u32>(max_truck + 1));
    next_sample_.store(max_sample + 1);
    return ok_status();
}

Status FleetTracker::journal_driver(const Driver& d) noexcept {
    return db_ != nullptr ? db_->put_driver(d) : ok_status();
}

Status FleetTracker::journal_truck(const Truck& t) noexcept {
    return db_ != nullptr ? db_->put_truck(t) : ok_status();
}

// ============================================================================
// Registration and pairing
// ============================================================================

Status FleetTracker::add_truck(const Truck& truck, TruckId* out) noexcept {
    if (truck.capacity_kg == 0 || truck.license_plate[0] == '\0') {
        return fleet_status(StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Truck t = truck;
    if (!t.id.is_valid()) {
        t.id = TruckId{next_truck_.fetch_add(1)};
    } else if (trucks_.count(t.id) != 0) {
        return fleet_status(StatusCode::Invalid);
    } else {
        u32 next = next_truck_.load();
        while (next <= t.id.v && !next_truck_.compare_exchange_weak(next, t.id.v + 1)) {
        }
    }
    // Pairing goes through assign().
    t.current_driver = DriverId::invalid();

    const Status s = journal_truck(t);
    if (!is_ok(s)) {
        return s;
    }
    trucks_.emplace(t.id, t);
    if (out != nullptr) {
        *out = t.id;
    }
    log_debug("added truck %u (%s)", t.id.v, t.license_plate);
    return ok_status();
}

Status FleetTracker::add_driver(const Driver& driver) noexcept {
    if (!driver.id.is_valid()) {
        return fleet_status(StatusCode::Invalid);
    }
    if (driver.update_frequency_s < kMinUpdateFrequencyS || driver.update_frequency_s > kMaxUpdateFrequencyS) {
        return fleet_status(StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (drivers_.count(driver.id) != 0) {
        return fleet_status(StatusCode::Invalid);
    }
    DriverState st{};
    st.driver = driver;
    st.driver.truck = TruckId::invalid();

    const Status s = journal_driver(st.driver);
    if (!is_ok(s)) {
        return s;
    }
    drivers_.emplace(driver.id, std::move(st));
    return ok_status();
}

Status FleetTracker::assign(DriverId driver, TruckId truck) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto dit = drivers_.find(driver);
    if (dit == drivers_.end()) {
        return fleet_status(StatusCode::NotFound, 1);
    }
    auto tit = trucks_.find(truck);
    if (tit == trucks_.end()) {
        return fleet_status(StatusCode::NotFound, 2);
    }

    Driver& d = dit->second.driver;
    Truck& t = tit->second;
    if (d.truck == truck && t.current_driver == driver) {
        return ok_status();
    }

    // Break the old pairings on both sides first.
    if (d.truck.is_valid()) {
        auto old = trucks_.find(d.truck);
        if (old != trucks_.end()) {
            Truck prev = old->second;
            prev.current_driver = DriverId::invalid();
            const Status s = journal_truck(prev);
            if (!is_ok(s)) {
                return s;
            }
            old->second = prev;
        }
    }
    if (t.current_driver.is_valid()) {
        auto old = drivers_.find(t.current_driver);
        if (old != drivers_.end()) {
            Driver prev = old->second.driver;
            prev.truck = TruckId::invalid();
            const Status s = journal_driver(prev);
            if (!is_ok(s)) {
                return s;
            }
            old->second.driver = prev;
        }
    }

    Driver nd = d;
    nd.truck = truck;
    Truck nt = t;
    nt.current_driver = driver;
    Status s = journal_driver(nd);
    if (is_ok(s)) {
        s = journal_truck(nt);
    }
    if (!is_ok(s)) {
        return s;
    }
    d = nd;
    t = nt;
    log_debug("paired driver %u with truck %u", driver.v, truck.v);
    return ok_status();
}

Status FleetTracker::unassign(DriverId driver) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto dit = drivers_.find(driver);
    if (dit == drivers_.end()) {
        return fleet_status(StatusCode::NotFound);
    }
    Driver& d = dit->second.driver;
    if (!d.truck.is_valid()) {
        return ok_status();
    }

    auto tit = trucks_.find(d.truck);
    if (tit != trucks_.end() && tit->second.current_driver == driver) {
        Truck nt = tit->second;
        nt.current_driver = DriverId::invalid();
        const Status s = journal_truck(nt);
        if (!is_ok(s)) {
            return s;
        }
        tit->second = nt;
    }
    Driver nd = d;
    nd.truck = TruckId::invalid();
    const Status s = journal_driver(nd);
    if (!is_ok(s)) {
        return s;
    }
    d = nd;
    return ok_status();
}

Status FleetTracker::set_sharing(DriverId driver, bool enabled) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = drivers_.find(driver);
    if (it == drivers_.end()) {
        return fleet_status(StatusCode::NotFound);
    }
    Driver nd = it->second.driver;
    nd.sharing_enabled = enabled;
    const Status s = journal_driver(nd);
    if (is_ok(s)) {
        it->second.driver = nd;
    }
    return s;
}

Status FleetTracker::set_on_duty(DriverId driver, bool on_duty) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = drivers_.find(driver);
    if (it == drivers_.end()) {
        return fleet_status(StatusCode::NotFound);
    }
    Driver nd = it->second.driver;
    nd.on_duty = on_duty;
    const Status s = journal_driver(nd);
    if (is_ok(s)) {
        it->second.driver = nd;
    }
    return s;
}

Status FleetTracker::set_update_frequency(DriverId driver, u32 seconds) noexcept {
    if (seconds < kMinUpdateFrequencyS || seconds > kMaxUpdateFrequencyS) {
        return fleet_status(StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = drivers_.find(driver);
    if (it == drivers_.end()) {
        return fleet_status(StatusCode::NotFound);
    }
    Driver nd = it->second.driver;
    nd.update_frequency_s = seconds;
    const Status s = journal_driver(nd);
    if (is_ok(s)) {
        it->second.driver = nd;
    }
    return s;
}

Status FleetTracker::set_truck_status(TruckId truck, TruckStatus status) noexcept {
    if (static_cast<u8>(status) > static_cast<u8>(TruckStatus::OutOfService)) {
        return fleet_status(StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trucks_.find(truck);
    if (it == trucks_.end()) {
        return fleet_status(StatusCode::NotFound);
    }
    Truck nt = it->second;
    nt.status = status;
    const Status s = journal_truck(nt);
    if (is_ok(s)) {
        it->second = nt;
    }
    return s;
}

// ============================================================================
// Location ingestion
// ============================================================================

Status FleetTracker::ingest(DriverId driver, const LocationSample& sample) noexcept {
    Status s = validate_sample(sample);
    if (!is_ok(s)) {
        return s;
    }

    LocationSample rec = sample;
    rec.driver = driver;
    if (rec.recorded_at == 0) {
        rec.recorded_at = unix_now();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto dit = drivers_.find(driver);
    if (dit == drivers_.end()) {
        return fleet_status(StatusCode::NotFound);
    }
    DriverState& st = dit->second;
    if (!st.driver.sharing_enabled) {
        return fleet_status(StatusCode::PermissionDenied);
    }

    rec.id = SampleId{next_sample_.fetch_add(1)};

    // Journal first; memory changes only once the row is durable.
    const bool store = st.last_stored_at == 0 || rec.recorded_at - st.last_stored_at >= cfg_.min_store_interval_s;
    if (store && db_ != nullptr) {
        s = db_->insert_location(rec);
        if (!is_ok(s)) {
            log_status("journal location sample", s);
            return s;
        }
    }
    if (store) {
        st.last_stored_at = rec.recorded_at;
    }

    st.trail.push_back(rec);
    while (st.trail.size() > cfg_.trail_capacity) {
        st.trail.pop_front();
    }
    st.driver.last_active = std::max(st.driver.last_active, rec.recorded_at);

    if (st.driver.truck.is_valid()) {
        auto tit = trucks_.find(st.driver.truck);
        if (tit != trucks_.end()) {
            Truck& t = tit->second;
            if (!t.has_position || rec.recorded_at > t.last_position_at) {
                if (t.has_position) {
                    t.total_distance_km += geodesic_distance_m(t.last_position, rec.point) / 1000.0;
                }
                t.has_position = true;
                t.last_position = rec.point;
                t.last_position_at = rec.recorded_at;
            }
        }
    }
    return ok_status();
}

// ============================================================================
// Reservation
// ============================================================================

Status FleetTracker::reserve_truck(TruckId truck) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trucks_.find(truck);
    if (it == trucks_.end()) {
        return fleet_status(StatusCode::NotFound);
    }
    if (it->second.status != TruckStatus::Available) {
        return fleet_status(StatusCode::SchedulingConflict);
    }
    Truck nt = it->second;
    nt.status = TruckStatus::OnRoute;
    const Status s = journal_truck(nt);
    if (is_ok(s)) {
        it->second = nt;
    }
    return s;
}

Status FleetTracker::release_truck(TruckId truck) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trucks_.find(truck);
    if (it == trucks_.end()) {
        return fleet_status(StatusCode::NotFound);
    }
    if (it->second.status != TruckStatus::OnRoute) {
        return ok_status();
    }
    Truck nt = it->second;
    nt.status = TruckStatus::Available;
    const Status s = journal_truck(nt);
    if (is_ok(s)) {
        it->second = nt;
    }
    return s;
}

// ============================================================================
// Queries
// ============================================================================

Status FleetTracker::truck(TruckId id, Truck* out) const noexcept {
    if (out == nullptr) {
        return fleet_status(StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trucks_.find(id);
    if (it == trucks_.end()) {
        return fleet_status(StatusCode::NotFound);
    }
    *out = it->second;
    return ok_status();
}

Status FleetTracker::driver(DriverId id, Driver* out) const noexcept {
    if (out == nullptr) {
        return fleet_status(StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = drivers_.find(id);
    if (it == drivers_.end()) {
        return fleet_status(StatusCode::NotFound);
    }
    *out = it->second.driver;
    return ok_status();
}

Status FleetTracker::trail(DriverId id, std::vector<LocationSample>* out) const noexcept {
    if (out == nullptr) {
        return fleet_status(StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = drivers_.find(id);
    if (it == drivers_.end()) {
        return fleet_status(StatusCode::NotFound);
    }
    out->assign(it->second.trail.begin(), it->second.trail.end());
    return ok_status();
}

Status FleetTracker::trail_between(DriverId id, Timestamp from, Timestamp to,
                                   std::vector<LocationSample>* out) const noexcept {
    if (out == nullptr || to < from) {
        return fleet_status(StatusCode::Invalid);
    }
    out->clear();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = drivers_.find(id);
    if (it == drivers_.end()) {
        return fleet_status(StatusCode::NotFound);
    }
    for (const LocationSample& s : it->second.trail) {
        if (s.recorded_at >= from && s.recorded_at <= to) {
            out->push_back(s);
        }
    }
    std::stable_sort(out->begin(), out->end(), [](const LocationSample& a, const LocationSample& b) {
        return a.recorded_at < b.recorded_at;
    });
    return ok_status();
}

Status FleetTracker::available_trucks(std::vector<FleetUnit>* out) const noexcept {
    if (out == nullptr) {
        return fleet_status(StatusCode::Invalid);
    }
    out->clear();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, t] : trucks_) {
            (void)id;
            if (t.status != TruckStatus::Available || !t.current_driver.is_valid()) {
                continue;
            }
            auto dit = drivers_.find(t.current_driver);
            if (dit == drivers_.end() || !dit->second.driver.on_duty) {
                continue;
            }
            out->push_back(FleetUnit{t, t.current_driver});
        }
    }
    std::sort(out->begin(), out->end(), [](const FleetUnit& a, const FleetUnit& b) {
        return a.truck.id.v < b.truck.id.v;
    });
    return ok_status();
}

Status FleetTracker::active_drivers(std::vector<DriverStatus>* out) const noexcept {
    if (out == nullptr) {
        return fleet_status(StatusCode::Invalid);
    }
    out->clear();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, st] : drivers_) {
            (void)id;
            if (!st.driver.on_duty) {
                continue;
            }
            DriverStatus v{};
            v.driver = st.driver;
            v.truck = st.driver.truck;
            // Position comes from the truck when paired, else the driver's own trail.
            auto tit = trucks_.find(st.driver.truck);
            if (tit != trucks_.end() && tit->second.has_position) {
                v.has_position = true;
                v.position = tit->second.last_position;
                v.position_at = tit->second.last_position_at;
            } else if (!st.trail.empty()) {
                v.has_position = true;
                v.position = st.trail.back().point;
                v.position_at = st.trail.back().recorded_at;
            }
            out->push_back(v);
        }
    }
    std::sort(out->begin(), out->end(), [](const DriverStatus& a, const DriverStatus& b) {
        return a.driver.id.v < b.driver.id.v;
    });
    return ok_status();
}

Status FleetTracker::purge_before(Timestamp before, u64* removed) noexcept {
    u64 count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, st] : drivers_) {
            (void)id;
            const auto old_size = st.trail.size();
            st.trail.erase(std::remove_if(st.trail.begin(), st.trail.end(),
                                          [before](const LocationSample& s) { return s.recorded_at < before; }),
                           st.trail.end());
            count += static_cast<u64>(old_size - st.trail.size());
        }
    }
    if (db_ != nullptr) {
        u64 rows = 0;
        const Status s = db_->purge_locations(before, &rows);
        if (!is_ok(s)) {
            return s;
        }
        log_debug("purged %llu journaled samples", static_cast<unsigned long long>(rows));
    }
    if (removed != nullptr) {
        *removed = count;
    }
    return ok_status();
}

} // namespace wcoord::fleet
