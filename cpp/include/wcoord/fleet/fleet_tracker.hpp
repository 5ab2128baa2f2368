#pragma once

#include <atomic>
#include <deque>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "wcoord/core/errors.hpp"
#include "wcoord/core/models.hpp"
#include "wcoord/core/types.hpp"
#include "wcoord/db/db.hpp"

namespace wcoord::fleet {

using u32 = wcoord::core::u32;
using u64 = wcoord::core::u64;

struct TrackerConfig {
    u32 trail_capacity{256};                        // samples kept per driver
    wcoord::core::Timestamp min_store_interval_s{0}; // journal rate limit per driver
};

// Driver status view.
struct DriverStatus {
    wcoord::core::Driver driver{};
    wcoord::core::TruckId truck{wcoord::core::TruckId::invalid()};
    bool has_position{false};
    wcoord::core::GeoPoint position{};
    wcoord::core::Timestamp position_at{0};
};

// Truck ready for a route, with the driver paired to it.
struct FleetUnit {
    wcoord::core::Truck truck{};
    wcoord::core::DriverId driver{wcoord::core::DriverId::invalid()};
};

// Trucks, drivers and live location state. One mutex covers both tables so
// a pairing change and a sample never interleave. Every change, location
// samples included, is journaled under it before memory is updated.
class FleetTracker {
public:
    explicit FleetTracker(wcoord::db::Database* db, const TrackerConfig& cfg = TrackerConfig{}) noexcept;
    FleetTracker(const FleetTracker&) = delete;
    FleetTracker& operator=(const FleetTracker&) = delete;

    [[nodiscard]] wcoord::core::Status seed_ids() noexcept;

    // truck.id is assigned when invalid.
    [[nodiscard]] wcoord::core::Status add_truck(const wcoord::core::Truck& truck, wcoord::core::TruckId* out) noexcept;
    // Drivers are keyed by an existing user id.
    [[nodiscard]] wcoord::core::Status add_driver(const wcoord::core::Driver& driver) noexcept;

    // Pairs driver and truck, dropping any previous pairing on either side.
    [[nodiscard]] wcoord::core::Status assign(wcoord::core::DriverId driver, wcoord::core::TruckId truck) noexcept;
    [[nodiscard]] wcoord::core::Status unassign(wcoord::core::DriverId driver) noexcept;

    [[nodiscard]] wcoord::core::Status set_sharing(wcoord::core::DriverId driver, bool enabled) noexcept;
    [[nodiscard]] wcoord::core::Status set_on_duty(wcoord::core::DriverId driver, bool on_duty) noexcept;
    [[nodiscard]] wcoord::core::Status set_update_frequency(wcoord::core::DriverId driver, u32 seconds) noexcept;
    [[nodiscard]] wcoord::core::Status set_truck_status(wcoord::core::TruckId truck, wcoord::core::TruckStatus status) noexcept;

    // sample.driver is ignored; recorded_at == 0 stamps the current time.
    [[nodiscard]] wcoord::core::Status ingest(wcoord::core::DriverId driver,
                                              const wcoord::core::LocationSample& sample) noexcept;

    // available -> on_route; SchedulingConflict otherwise.
    [[nodiscard]] wcoord::core::Status reserve_truck(wcoord::core::TruckId truck) noexcept;
    // on_route -> available; other states are left as they are.
    [[nodiscard]] wcoord::core::Status release_truck(wcoord::core::TruckId truck) noexcept;

    [[nodiscard]] wcoord::core::Status truck(wcoord::core::TruckId id, wcoord::core::Truck* out) const noexcept;
    [[nodiscard]] wcoord::core::Status driver(wcoord::core::DriverId id, wcoord::core::Driver* out) const noexcept;

    // Arrival order.
    [[nodiscard]] wcoord::core::Status trail(wcoord::core::DriverId id,
                                             std::vector<wcoord::core::LocationSample>* out) const noexcept;
    [[nodiscard]] wcoord::core::Status trail_between(wcoord::core::DriverId id,
                                                     wcoord::core::Timestamp from,
                                                     wcoord::core::Timestamp to,
                                                     std::vector<wcoord::core::LocationSample>* out) const noexcept;

    // Available trucks with an on-duty driver, ordered by truck id.
    [[nodiscard]] wcoord::core::Status available_trucks(std::vector<FleetUnit>* out) const noexcept;
    // On-duty drivers, ordered by id.
    [[nodiscard]] wcoord::core::Status active_drivers(std::vector<DriverStatus>* out) const noexcept;

    // Drops trail samples recorded before `before` (journal rows too).
    [[nodiscard]] wcoord::core::Status purge_before(wcoord::core::Timestamp before, u64* removed) noexcept;

private:
    struct DriverState {
        wcoord::core::Driver driver{};
        std::deque<wcoord::core::LocationSample> trail;
        wcoord::core::Timestamp last_stored_at{0};
    };

    [[nodiscard]] wcoord::core::Status journal_driver(const wcoord::core::Driver& d) noexcept;
    [[nodiscard]] wcoord::core::Status journal_truck(const wcoord::core::Truck& t) noexcept;

    wcoord::db::Database* db_;
    TrackerConfig cfg_;

    mutable std::mutex mutex_;
    std::unordered_map<wcoord::core::TruckId, wcoord::core::Truck, wcoord::core::IdHash> trucks_;
    std::unordered_map<wcoord::core::DriverId, DriverState, wcoord::core::IdHash> drivers_;

    std::atomic<u32> next_truck_{1};
    std::atomic<u64> next_sample_{1};
};

[[nodiscard]] wcoord::core::Status validate_sample(const wcoord::core::LocationSample& s) noexcept;

} // namespace wcoord::fleet
