#include <gtest/gtest.h>

#include <limits>
#include <vector>

#include "wcoord/core/geo.hpp"
#include "wcoord/spatial/spatial_index.hpp"

using namespace wcoord::spatial;
using namespace wcoord::core;

namespace {

Bin make_bin(u64 id, GeoPoint p, FillLevel fill = FillLevel::Full) {
    Bin b{};
    b.id = BinId{id};
    b.capacity_liters = 240;
    b.fill = fill;
    b.active = true;
    b.needs_collection = needs_collection(fill, true);
    b.point = p;
    return b;
}

constexpr GeoPoint kCenter{52.0, 13.0};

} // namespace

//=============================================================================
// Radius queries
//=============================================================================

TEST(SpatialIndex, NearbySortedByDistance) {
    SpatialIndex index;
    index.upsert(make_bin(1, GeoPoint{52.0030, 13.0}));  // ~334 m
    index.upsert(make_bin(2, GeoPoint{52.0010, 13.0}));  // ~111 m
    index.upsert(make_bin(3, GeoPoint{52.0200, 13.0}));  // ~2.2 km
    index.upsert(make_bin(4, GeoPoint{52.0020, 13.0}));  // ~222 m

    std::vector<NearbyHit> hits;
    ASSERT_TRUE(is_ok(index.nearby(kCenter, 500.0, NearbyFilter{}, &hits)));
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].bin.id, BinId{2});
    EXPECT_EQ(hits[1].bin.id, BinId{4});
    EXPECT_EQ(hits[2].bin.id, BinId{1});
    EXPECT_LT(hits[0].distance_m, hits[1].distance_m);
}

TEST(SpatialIndex, RadiusIsInclusive) {
    SpatialIndex index;
    const GeoPoint p{52.0045, 13.0031};
    index.upsert(make_bin(1, p));

    const double d = geodesic_distance_m(kCenter, p);
    std::vector<NearbyHit> hits;
    ASSERT_TRUE(is_ok(index.nearby(kCenter, d, NearbyFilter{}, &hits)));
    ASSERT_EQ(hits.size(), 1u);

    ASSERT_TRUE(is_ok(index.nearby(kCenter, d - 0.01, NearbyFilter{}, &hits)));
    EXPECT_TRUE(hits.empty());
}

TEST(SpatialIndex, EqualDistanceTiesById) {
    SpatialIndex index;
    index.upsert(make_bin(9, GeoPoint{52.001, 13.0}));
    index.upsert(make_bin(3, GeoPoint{52.001, 13.0}));

    std::vector<NearbyHit> hits;
    ASSERT_TRUE(is_ok(index.nearby(kCenter, 200.0, NearbyFilter{}, &hits)));
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].bin.id, BinId{3});
    EXPECT_EQ(hits[1].bin.id, BinId{9});
}

TEST(SpatialIndex, ZeroRadiusMatchesSamePoint) {
    SpatialIndex index;
    index.upsert(make_bin(1, kCenter));
    index.upsert(make_bin(2, GeoPoint{52.0001, 13.0}));

    std::vector<NearbyHit> hits;
    ASSERT_TRUE(is_ok(index.nearby(kCenter, 0.0, NearbyFilter{}, &hits)));
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].bin.id, BinId{1});
    EXPECT_DOUBLE_EQ(hits[0].distance_m, 0.0);
}

TEST(SpatialIndex, RejectsBadInput) {
    SpatialIndex index;
    std::vector<NearbyHit> hits;
    EXPECT_EQ(index.nearby(GeoPoint{91.0, 0.0}, 10.0, NearbyFilter{}, &hits).code, StatusCode::Invalid);
    EXPECT_EQ(index.nearby(kCenter, -1.0, NearbyFilter{}, &hits).code, StatusCode::Invalid);
    EXPECT_EQ(index.nearby(kCenter, 10.0, NearbyFilter{}, nullptr).code, StatusCode::Invalid);

    const Status s = index.nearby(kCenter, std::numeric_limits<double>::quiet_NaN(), NearbyFilter{}, &hits);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.domain, StatusDomain::Spatial);
}

TEST(SpatialIndex, CrossesAntimeridian) {
    SpatialIndex index;
    index.upsert(make_bin(1, GeoPoint{0.0, 179.999}));
    index.upsert(make_bin(2, GeoPoint{0.0, -179.999}));
    index.upsert(make_bin(3, GeoPoint{0.0, 179.0}));

    std::vector<NearbyHit> hits;
    ASSERT_TRUE(is_ok(index.nearby(GeoPoint{0.0, 180.0}, 1000.0, NearbyFilter{}, &hits)));
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_NE(hits[0].bin.id, BinId{3});
    EXPECT_NE(hits[1].bin.id, BinId{3});
}

TEST(SpatialIndex, LargeRadiusScansEverything) {
    SpatialIndex index;
    index.upsert(make_bin(1, GeoPoint{52.0, 13.0}));
    index.upsert(make_bin(2, GeoPoint{48.0, 11.0}));

    std::vector<NearbyHit> hits;
    ASSERT_TRUE(is_ok(index.nearby(kCenter, 1000000.0, NearbyFilter{}, &hits)));
    EXPECT_EQ(hits.size(), 2u);
}

//=============================================================================
// Filters and maintenance
//=============================================================================

TEST(SpatialIndex, FiltersApply) {
    SpatialIndex index;
    index.upsert(make_bin(1, GeoPoint{52.0001, 13.0}, FillLevel::Half));
    Bin claimed = make_bin(2, GeoPoint{52.0002, 13.0});
    claimed.claimed_by = RouteId{5};
    index.upsert(claimed);
    Bin inactive = make_bin(3, GeoPoint{52.0003, 13.0});
    inactive.active = false;
    index.upsert(inactive);
    index.upsert(make_bin(4, GeoPoint{52.0004, 13.0}));

    std::vector<NearbyHit> hits;
    ASSERT_TRUE(is_ok(index.nearby(kCenter, 100.0, NearbyFilter{}, &hits)));
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].bin.id, BinId{2});
    EXPECT_EQ(hits[1].bin.id, BinId{4});

    NearbyFilter unclaimed{};
    unclaimed.unclaimed_only = true;
    ASSERT_TRUE(is_ok(index.nearby(kCenter, 100.0, unclaimed, &hits)));
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].bin.id, BinId{4});

    NearbyFilter all{false, false, false};
    ASSERT_TRUE(is_ok(index.nearby(kCenter, 100.0, all, &hits)));
    EXPECT_EQ(hits.size(), 4u);
}

TEST(SpatialIndex, UpsertMovesBetweenCells) {
    SpatialIndex index;
    index.upsert(make_bin(1, kCenter));
    index.upsert(make_bin(1, GeoPoint{52.5, 13.5}));
    EXPECT_EQ(index.size(), 1u);

    std::vector<NearbyHit> hits;
    ASSERT_TRUE(is_ok(index.nearby(kCenter, 1000.0, NearbyFilter{}, &hits)));
    EXPECT_TRUE(hits.empty());
    ASSERT_TRUE(is_ok(index.nearby(GeoPoint{52.5, 13.5}, 10.0, NearbyFilter{}, &hits)));
    EXPECT_EQ(hits.size(), 1u);
}

TEST(SpatialIndex, UpsertReplacesSnapshot) {
    SpatialIndex index;
    index.upsert(make_bin(1, kCenter, FillLevel::Full));
    index.upsert(make_bin(1, kCenter, FillLevel::Empty));

    std::vector<Bin> bins;
    ASSERT_TRUE(is_ok(index.select(NearbyFilter{}, &bins)));
    EXPECT_TRUE(bins.empty());
}

TEST(SpatialIndex, RemoveAndSelectOrder) {
    SpatialIndex index;
    index.upsert(make_bin(5, kCenter));
    index.upsert(make_bin(2, GeoPoint{40.0, -3.0}));
    index.upsert(make_bin(8, GeoPoint{-33.9, 151.2}));
    index.remove(BinId{8});
    index.remove(BinId{99});

    std::vector<Bin> bins;
    ASSERT_TRUE(is_ok(index.select(NearbyFilter{}, &bins)));
    ASSERT_EQ(bins.size(), 2u);
    EXPECT_EQ(bins[0].id, BinId{2});
    EXPECT_EQ(bins[1].id, BinId{5});
    EXPECT_EQ(index.size(), 2u);
}

TEST(SpatialIndex, InvalidIdIgnored) {
    SpatialIndex index;
    index.upsert(make_bin(BinId::invalid().v, kCenter));
    EXPECT_EQ(index.size(), 0u);
}
