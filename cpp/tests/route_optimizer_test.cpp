#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <set>
#include <thread>
#include <vector>

#include "wcoord/routing/route_optimizer.hpp"

using namespace wcoord::routing;
using namespace wcoord::core;

namespace {

constexpr Timestamp kT0 = 1700000000;
constexpr Timestamp kNow = kT0 + 3600;

Bin plan_bin(u64 id, double lat_offset, Timestamp reported, FillLevel fill = FillLevel::Full, u32 liters = 100) {
    Bin b{};
    b.id = BinId{id};
    b.capacity_liters = liters;
    b.fill = fill;
    b.active = true;
    b.needs_collection = needs_collection(fill, true);
    b.point = GeoPoint{52.0 + lat_offset, 13.0};
    b.last_reported = reported;
    return b;
}

wcoord::fleet::FleetUnit plan_truck(u32 id, u32 capacity_kg) {
    wcoord::fleet::FleetUnit u{};
    u.truck.id = TruckId{id};
    u.truck.capacity_kg = capacity_kg;
    u.driver = DriverId{100 + id};
    return u;
}

std::vector<u64> ids_of(const Cluster& c) {
    std::vector<u64> ids;
    for (const Bin& b : c.bins) {
        ids.push_back(b.id.v);
    }
    return ids;
}

// Registry, fleet and lifecycle over an in-memory journal with the
// optimizer on top.
class RouteOptimizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(is_ok(db.open(wcoord::db::DbConfig{})));
    }

    BinId add_full_bin(double lat_offset, Timestamp reported, u32 liters = 100) {
        wcoord::registry::BinParams params{};
        params.capacity_liters = liters;
        params.point = GeoPoint{52.0 + lat_offset, 13.0};
        params.created_at = kT0;
        BinId id{};
        EXPECT_TRUE(is_ok(registry.register_bin(params, &id)));
        EXPECT_TRUE(is_ok(registry.report(id, FillLevel::Full, UserId{1}, reported, nullptr)));
        return id;
    }

    TruckId add_truck(u32 driver_id, u32 capacity_kg) {
        Truck t{};
        std::snprintf(t.license_plate, sizeof(t.license_plate), "B-%u", driver_id);
        t.capacity_kg = capacity_kg;
        TruckId id{};
        EXPECT_TRUE(is_ok(fleet.add_truck(t, &id)));
        Driver d{};
        d.id = DriverId{driver_id};
        d.on_duty = true;
        d.sharing_enabled = true;
        EXPECT_TRUE(is_ok(fleet.add_driver(d)));
        EXPECT_TRUE(is_ok(fleet.assign(DriverId{driver_id}, id)));
        return id;
    }

    OptimizeRequest request() const {
        OptimizeRequest req{};
        req.now = kNow;
        return req;
    }

    wcoord::db::Database db;
    wcoord::spatial::SpatialIndex index;
    EventBus events;
    wcoord::registry::BinRegistry registry{&db, &index, &events};
    wcoord::fleet::FleetTracker fleet{&db};
    RouteLifecycle lifecycle{&db, &registry, &fleet, &events};
    RouteOptimizer optimizer{&index, &fleet, &lifecycle};
};

} // namespace

//=============================================================================
// Ranking and sequencing
//=============================================================================

TEST(RankBins, PriorityOrder) {
    std::vector<Bin> bins = {
        plan_bin(1, 0.0, kNow - 10, FillLevel::ThreeQuarters),
        plan_bin(2, 0.0, kNow - 10),
        plan_bin(3, 0.0, kNow - 2 * kSecondsPerDay),
        plan_bin(4, 0.0, kNow - 20),
    };
    rank_bins(&bins, kNow, kSecondsPerDay);
    EXPECT_EQ(bins[0].id, BinId{3});
    EXPECT_EQ(bins[1].id, BinId{4});
    EXPECT_EQ(bins[2].id, BinId{2});
    EXPECT_EQ(bins[3].id, BinId{1});
}

TEST(SequenceStops, NearestNeighbourWalk) {
    std::vector<Bin> bins = {
        plan_bin(1, 0.003, kNow),
        plan_bin(2, 0.001, kNow),
        plan_bin(3, 0.002, kNow),
    };
    sequence_stops(GeoPoint{52.0, 13.0}, &bins);
    ASSERT_EQ(bins.size(), 3u);
    EXPECT_EQ(bins[0].id, BinId{2});
    EXPECT_EQ(bins[1].id, BinId{3});
    EXPECT_EQ(bins[2].id, BinId{1});
}

TEST(SequenceStops, TiesKeepPriorityOrder) {
    std::vector<Bin> bins = {
        plan_bin(7, 0.001, kNow),
        plan_bin(5, 0.001, kNow),
    };
    sequence_stops(GeoPoint{52.0, 13.0}, &bins);
    EXPECT_EQ(bins[0].id, BinId{7});
}

//=============================================================================
// Planning
//=============================================================================

TEST(RoutePlan, EmptyInputIsEmptyPlan) {
    RouteOptimizer optimizer(nullptr, nullptr, nullptr);
    Plan plan{};
    OptimizeRequest req{};
    req.now = kNow;
    ASSERT_TRUE(is_ok(optimizer.plan({}, {plan_truck(1, 1000)}, req, &plan)));
    EXPECT_TRUE(plan.assigned.empty());
    EXPECT_TRUE(plan.unassigned.empty());
    EXPECT_EQ(optimizer.plan({}, {}, req, nullptr).code, StatusCode::Invalid);
}

TEST(RoutePlan, SkipsIneligibleAndClaimed) {
    RouteOptimizer optimizer(nullptr, nullptr, nullptr);
    Bin claimed = plan_bin(2, 0.0001, kNow);
    claimed.claimed_by = RouteId{3};
    const std::vector<Bin> bins = {
        plan_bin(1, 0.0, kNow, FillLevel::Half),
        claimed,
        plan_bin(3, 0.0002, kNow),
    };
    Plan plan{};
    OptimizeRequest req{};
    req.now = kNow;
    ASSERT_TRUE(is_ok(optimizer.plan(bins, {plan_truck(1, 1000)}, req, &plan)));
    ASSERT_EQ(plan.assigned.size(), 1u);
    EXPECT_EQ(ids_of(plan.assigned[0]), std::vector<u64>({3}));
}

TEST(RoutePlan, FillsTruckWithHighestPriority) {
    RouteOptimizer optimizer(nullptr, nullptr, nullptr);
    // Five full 100 L bins (15 kg each) in a row, oldest report first.
    std::vector<Bin> bins;
    for (u64 i = 0; i < 5; ++i) {
        bins.push_back(plan_bin(i + 1, 0.0001 * static_cast<double>(i), kT0 + static_cast<Timestamp>(i)));
    }
    Plan plan{};
    OptimizeRequest req{};
    req.now = kNow;
    ASSERT_TRUE(is_ok(optimizer.plan(bins, {plan_truck(1, 50)}, req, &plan)));

    ASSERT_EQ(plan.assigned.size(), 1u);
    std::vector<u64> ids = ids_of(plan.assigned[0]);
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, std::vector<u64>({1, 2, 3}));
    EXPECT_NEAR(plan.assigned[0].mass_kg, 45.0, 1e-9);
    EXPECT_EQ(plan.assigned[0].truck, TruckId{1});
    EXPECT_EQ(plan.assigned[0].driver, DriverId{101});

    // The remainder has no truck.
    ASSERT_EQ(plan.unassigned.size(), 1u);
    ids = ids_of(plan.unassigned[0]);
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, std::vector<u64>({4, 5}));
    EXPECT_FALSE(plan.unassigned[0].truck.is_valid());
}

TEST(RoutePlan, PriorityBeatsProximityWhenCapacityBinds) {
    RouteOptimizer optimizer(nullptr, nullptr, nullptr);
    // Bins 4 and 5 sit ~11 m from the seed, 2 and 3 ~167 m away, but 2 and 3
    // were reported earlier and outrank them.
    const std::vector<Bin> bins = {
        plan_bin(1, 0.0, kT0 + 1),
        plan_bin(2, 0.0015, kT0 + 2),
        plan_bin(3, 0.0015, kT0 + 3),
        plan_bin(4, 0.0001, kT0 + 4),
        plan_bin(5, 0.0001, kT0 + 5),
    };
    Plan plan{};
    OptimizeRequest req{};
    req.now = kNow;
    ASSERT_TRUE(is_ok(optimizer.plan(bins, {plan_truck(1, 45)}, req, &plan)));

    ASSERT_EQ(plan.assigned.size(), 1u);
    std::vector<u64> ids = ids_of(plan.assigned[0]);
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, std::vector<u64>({1, 2, 3}));
    EXPECT_LE(plan.assigned[0].mass_kg, 45.0);

    ASSERT_EQ(plan.unassigned.size(), 1u);
    ids = ids_of(plan.unassigned[0]);
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, std::vector<u64>({4, 5}));
}

TEST(RoutePlan, ClusterRadiusSplitsDistantBins) {
    OptimizerConfig cfg{};
    cfg.cluster_radius_m = 500.0;
    RouteOptimizer optimizer(nullptr, nullptr, nullptr, cfg);
    const std::vector<Bin> bins = {
        plan_bin(1, 0.0, kT0),
        plan_bin(2, 0.001, kT0 + 1),   // ~111 m
        plan_bin(3, 0.02, kT0 + 2),    // ~2.2 km
    };
    Plan plan{};
    OptimizeRequest req{};
    req.now = kNow;
    ASSERT_TRUE(is_ok(optimizer.plan(bins, {plan_truck(1, 1000), plan_truck(2, 1000)}, req, &plan)));
    ASSERT_EQ(plan.assigned.size(), 2u);
    EXPECT_EQ(plan.assigned[0].bins.size(), 2u);
    EXPECT_EQ(ids_of(plan.assigned[1]), std::vector<u64>({3}));
}

TEST(RoutePlan, TargetsLargestTrucksFirst) {
    RouteOptimizer optimizer(nullptr, nullptr, nullptr);
    std::vector<Bin> bins;
    for (u64 i = 0; i < 8; ++i) {
        bins.push_back(plan_bin(i + 1, 0.0001 * static_cast<double>(i), kT0 + static_cast<Timestamp>(i)));
    }
    Plan plan{};
    OptimizeRequest req{};
    req.now = kNow;
    ASSERT_TRUE(is_ok(optimizer.plan(bins, {plan_truck(1, 50), plan_truck(2, 100)}, req, &plan)));

    // 100 kg takes six bins, 50 kg the remaining two.
    ASSERT_EQ(plan.assigned.size(), 2u);
    EXPECT_TRUE(plan.unassigned.empty());
    EXPECT_EQ(plan.assigned[0].bins.size(), 6u);
    EXPECT_EQ(plan.assigned[0].truck, TruckId{2});
    EXPECT_EQ(plan.assigned[1].bins.size(), 2u);
    EXPECT_EQ(plan.assigned[1].truck, TruckId{1});
}

TEST(RoutePlan, NoTrucksLeavesEverythingUnassigned) {
    RouteOptimizer optimizer(nullptr, nullptr, nullptr);
    const std::vector<Bin> bins = {plan_bin(1, 0.0, kT0), plan_bin(2, 0.001, kT0)};
    Plan plan{};
    OptimizeRequest req{};
    req.now = kNow;
    ASSERT_TRUE(is_ok(optimizer.plan(bins, {}, req, &plan)));
    EXPECT_TRUE(plan.assigned.empty());
    ASSERT_EQ(plan.unassigned.size(), 1u);
    EXPECT_EQ(plan.unassigned[0].bins.size(), 2u);
}

TEST(RoutePlan, FallbackCapacityBoundsUnassignedClusters) {
    OptimizerConfig cfg{};
    cfg.fallback_capacity_kg = 20.0;
    RouteOptimizer optimizer(nullptr, nullptr, nullptr, cfg);
    const std::vector<Bin> bins = {plan_bin(1, 0.0, kT0), plan_bin(2, 0.0001, kT0 + 1), plan_bin(3, 0.0002, kT0 + 2)};
    Plan plan{};
    OptimizeRequest req{};
    req.now = kNow;
    ASSERT_TRUE(is_ok(optimizer.plan(bins, {}, req, &plan)));
    EXPECT_EQ(plan.unassigned.size(), 3u);
}

TEST(RoutePlan, PrefersNearestPositionedTruck) {
    RouteOptimizer optimizer(nullptr, nullptr, nullptr);
    wcoord::fleet::FleetUnit far = plan_truck(1, 1000);
    far.truck.has_position = true;
    far.truck.last_position = GeoPoint{52.5, 13.0};
    wcoord::fleet::FleetUnit near = plan_truck(2, 1000);
    near.truck.has_position = true;
    near.truck.last_position = GeoPoint{52.01, 13.0};
    const wcoord::fleet::FleetUnit unknown = plan_truck(3, 1000);

    Plan plan{};
    OptimizeRequest req{};
    req.now = kNow;
    ASSERT_TRUE(is_ok(optimizer.plan({plan_bin(1, 0.0, kT0)}, {unknown, far, near}, req, &plan)));
    ASSERT_EQ(plan.assigned.size(), 1u);
    EXPECT_EQ(plan.assigned[0].truck, TruckId{2});
}

TEST(RoutePlan, SkipsTrucksTooSmall) {
    RouteOptimizer optimizer(nullptr, nullptr, nullptr);
    // One 1000 L bin weighs 150 kg.
    Plan plan{};
    OptimizeRequest req{};
    req.now = kNow;
    ASSERT_TRUE(is_ok(optimizer.plan({plan_bin(1, 0.0, kT0, FillLevel::Full, 1000)},
                                     {plan_truck(1, 100), plan_truck(2, 200)}, req, &plan)));
    ASSERT_EQ(plan.assigned.size(), 1u);
    EXPECT_EQ(plan.assigned[0].truck, TruckId{2});
}

//=============================================================================
// Committing runs
//=============================================================================

TEST_F(RouteOptimizerTest, RunCommitsOneRoute) {
    std::vector<BinId> bins;
    for (int i = 0; i < 5; ++i) {
        bins.push_back(add_full_bin(0.0001 * i, kT0 + 1 + i));
    }
    const TruckId truck = add_truck(10, 50);

    OptimizeResult result{};
    ASSERT_TRUE(is_ok(optimizer.run(request(), &result)));
    ASSERT_EQ(result.routes.size(), 1u);
    EXPECT_EQ(result.passes, 1u);
    EXPECT_EQ(result.conflicts, 0u);

    Route r{};
    ASSERT_TRUE(is_ok(lifecycle.get(result.routes[0], &r)));
    EXPECT_EQ(r.status, RouteStatus::Assigned);
    EXPECT_EQ(r.truck, truck);
    std::set<u64> stops;
    for (const RouteStop& s : r.stops) {
        stops.insert(s.bin.v);
    }
    EXPECT_EQ(stops, (std::set<u64>{bins[0].v, bins[1].v, bins[2].v}));

    std::vector<Bin> eligible;
    wcoord::spatial::NearbyFilter unclaimed{};
    unclaimed.unclaimed_only = true;
    ASSERT_TRUE(is_ok(index.select(unclaimed, &eligible)));
    ASSERT_EQ(eligible.size(), 2u);
    EXPECT_EQ(eligible[0].id, bins[3]);
    EXPECT_EQ(eligible[1].id, bins[4]);

    // A second run has no truck left.
    ASSERT_TRUE(is_ok(optimizer.run(request(), &result)));
    EXPECT_TRUE(result.routes.empty());
    EXPECT_EQ(result.unassigned.size(), 1u);
}

TEST_F(RouteOptimizerTest, CancelledRouteBinsAreReplanned) {
    std::vector<BinId> bins;
    for (int i = 0; i < 3; ++i) {
        bins.push_back(add_full_bin(0.0001 * i, kT0 + 1 + i));
    }
    add_truck(10, 100);

    OptimizeResult first{};
    ASSERT_TRUE(is_ok(optimizer.run(request(), &first)));
    ASSERT_EQ(first.routes.size(), 1u);
    const RouteId cancelled = first.routes[0];

    Route r{};
    ASSERT_TRUE(is_ok(lifecycle.get(cancelled, &r)));
    ASSERT_EQ(r.stops.size(), 3u);
    const BinId emptied = r.stops[0].bin;

    ASSERT_TRUE(is_ok(lifecycle.start(cancelled, kNow + 10)));
    ASSERT_TRUE(is_ok(lifecycle.mark_stop_collected(cancelled, emptied, 12.0, kNow + 20)));
    ASSERT_TRUE(is_ok(lifecycle.cancel(cancelled, kNow + 30)));

    OptimizeResult second{};
    ASSERT_TRUE(is_ok(optimizer.run(request(), &second)));
    ASSERT_EQ(second.routes.size(), 1u);
    EXPECT_NE(second.routes[0], cancelled);
    EXPECT_TRUE(second.unassigned.empty());

    ASSERT_TRUE(is_ok(lifecycle.get(second.routes[0], &r)));
    EXPECT_EQ(r.status, RouteStatus::Assigned);
    std::set<u64> stops;
    for (const RouteStop& stop : r.stops) {
        stops.insert(stop.bin.v);
    }
    std::set<u64> expected;
    for (BinId id : bins) {
        if (id != emptied) {
            expected.insert(id.v);
        }
    }
    EXPECT_EQ(stops, expected);

    for (BinId id : bins) {
        u64 active = 0;
        ASSERT_TRUE(is_ok(db.count_active_stops(id, &active)));
        EXPECT_EQ(active, id == emptied ? 0u : 1u);
    }
}

TEST_F(RouteOptimizerTest, RunWithNothingEligible) {
    add_truck(10, 1000);
    OptimizeResult result{};
    ASSERT_TRUE(is_ok(optimizer.run(request(), &result)));
    EXPECT_TRUE(result.routes.empty());
    EXPECT_TRUE(result.unassigned.empty());
}

TEST_F(RouteOptimizerTest, RunLimitedToSeedRadius) {
    const BinId near = add_full_bin(0.0, kT0 + 1);
    add_full_bin(0.05, kT0 + 1);
    add_truck(10, 1000);

    OptimizeRequest req = request();
    req.has_seed = true;
    req.seed = GeoPoint{52.0, 13.0};
    req.radius_m = 1000.0;
    OptimizeResult result{};
    ASSERT_TRUE(is_ok(optimizer.run(req, &result)));
    ASSERT_EQ(result.routes.size(), 1u);

    Route r{};
    ASSERT_TRUE(is_ok(lifecycle.get(result.routes[0], &r)));
    ASSERT_EQ(r.stops.size(), 1u);
    EXPECT_EQ(r.stops[0].bin, near);
}

TEST_F(RouteOptimizerTest, ConcurrentRunsNeverShareBins) {
    for (int i = 0; i < 12; ++i) {
        add_full_bin(0.0001 * i, kT0 + 1 + i);
    }
    add_truck(10, 60);
    add_truck(11, 60);

    OptimizeResult r1{};
    OptimizeResult r2{};
    Status s1{};
    Status s2{};
    std::thread a([&] { s1 = optimizer.run(request(), &r1); });
    std::thread b([&] { s2 = optimizer.run(request(), &r2); });
    a.join();
    b.join();

    for (const Status& s : {s1, s2}) {
        EXPECT_TRUE(is_ok(s) || s.code == StatusCode::SchedulingConflict)
            << status_code_name(s.code) << "/" << status_domain_name(s.domain);
    }

    std::vector<RouteId> routes = r1.routes;
    routes.insert(routes.end(), r2.routes.begin(), r2.routes.end());
    EXPECT_LE(routes.size(), 2u);

    std::set<u64> seen;
    std::set<u32> trucks;
    for (RouteId id : routes) {
        Route r{};
        ASSERT_TRUE(is_ok(lifecycle.get(id, &r)));
        EXPECT_TRUE(trucks.insert(r.truck.v).second);
        for (const RouteStop& stop : r.stops) {
            EXPECT_TRUE(seen.insert(stop.bin.v).second) << "bin " << stop.bin.v << " in two routes";
            u64 active = 0;
            ASSERT_TRUE(is_ok(db.count_active_stops(stop.bin, &active)));
            EXPECT_EQ(active, 1u);
        }
    }
}
