#include <gtest/gtest.h>
#include "wcoord/db/db.hpp"
#include <sqlite3.h>
#include <cstdio>
#include <cstring>
#include <string>
#include <unistd.h>

using namespace wcoord::db;
using namespace wcoord::core;

namespace {

Bin make_test_bin(u64 id) {
    Bin b;
    b.id = BinId{id};
    b.owner = UserId{1000};
    std::snprintf(b.code, sizeof(b.code), "BIN-%06llu", static_cast<unsigned long long>(id));
    b.capacity_liters = 240;
    b.point = GeoPoint{52.0, 13.0};
    b.created_at = 1700000000;
    b.updated_at = 1700000000;
    return b;
}

Driver make_test_driver(u32 id) {
    Driver d;
    d.id = DriverId{id};
    std::snprintf(d.name, sizeof(d.name), "driver-%u", id);
    d.sharing_enabled = true;
    return d;
}

RouteRecord make_test_route(u64 id) {
    RouteRecord r;
    r.id = RouteId{id};
    r.status = RouteStatus::Assigned;
    r.scheduled_date = 1700000000 - (1700000000 % kSecondsPerDay);
    return r;
}

// Opens an in-memory journal for the lifetime of a test.
class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(is_ok(db.open(DbConfig{})));
    }

    Database db;
};

} // namespace

//=============================================================================
// Database Lifecycle Tests
//=============================================================================

TEST(Database, OpenClose) {
    Database db;
    EXPECT_FALSE(db.is_open());

    Status s = db.open(DbConfig{});
    EXPECT_TRUE(is_ok(s));
    EXPECT_TRUE(db.is_open());

    s = db.close();
    EXPECT_TRUE(is_ok(s));
    EXPECT_FALSE(db.is_open());
}

TEST(Database, CloseTwice) {
    Database db;
    ASSERT_TRUE(is_ok(db.open(DbConfig{})));
    ASSERT_TRUE(is_ok(db.close()));

    const Status s = db.close();
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.domain, StatusDomain::Db);
}

TEST(Database, WritesOnClosedJournalAreUnavailable) {
    Database db;
    const Status s = db.put_bin(make_test_bin(1));
    EXPECT_EQ(s.code, StatusCode::Unavailable);
    EXPECT_TRUE(is_fatal(s));
}

TEST(Database, EmptyJournalCountsZero) {
    Database db;
    ASSERT_TRUE(is_ok(db.open(DbConfig{})));
    for (TableId t : {TableId::Bins, TableId::WasteReports, TableId::Trucks, TableId::Drivers,
                      TableId::LocationUpdates, TableId::CollectionRoutes, TableId::RouteBins}) {
        u64 n = 99;
        ASSERT_TRUE(is_ok(db.count_rows(t, &n))) << table_name(t);
        EXPECT_EQ(n, 0u) << table_name(t);
    }
}

TEST(Database, ReopenFileKeepsRows) {
    const std::string path = "/tmp/wcoord_db_test_" + std::to_string(::getpid()) + ".db";
    std::remove(path.c_str());

    {
        Database db;
        ASSERT_TRUE(is_ok(db.open(DbConfig{path.c_str(), nullptr})));
        ASSERT_TRUE(is_ok(db.put_bin(make_test_bin(41))));
        ASSERT_TRUE(is_ok(db.put_bin(make_test_bin(7))));
        ASSERT_TRUE(is_ok(db.close()));
    }
    {
        Database db;
        ASSERT_TRUE(is_ok(db.open(DbConfig{path.c_str(), nullptr})));
        u64 max = 0;
        ASSERT_TRUE(is_ok(db.max_id(TableId::Bins, &max)));
        EXPECT_EQ(max, 41u);
        ASSERT_TRUE(is_ok(db.close()));
    }

    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}

TEST(Database, FreshJournalHasCurrentLayout) {
    const std::string path = "/tmp/wcoord_db_layout_" + std::to_string(::getpid()) + ".db";
    std::remove(path.c_str());

    {
        Database db;
        ASSERT_TRUE(is_ok(db.open(DbConfig{path.c_str(), nullptr})));
        ASSERT_TRUE(is_ok(db.close()));
    }

    sqlite3* raw = nullptr;
    ASSERT_EQ(sqlite3_open(path.c_str(), &raw), SQLITE_OK);
    sqlite3_stmt* stmt = nullptr;
    ASSERT_EQ(sqlite3_prepare_v2(raw, "SELECT sql FROM sqlite_master WHERE type = 'table' AND name = 'route_bins'",
                                 -1, &stmt, nullptr),
              SQLITE_OK);
    ASSERT_EQ(sqlite3_step(stmt), SQLITE_ROW);
    const std::string ddl = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    sqlite3_finalize(stmt);
    EXPECT_NE(ddl.find("active INTEGER NOT NULL DEFAULT 1"), std::string::npos);

    ASSERT_EQ(sqlite3_prepare_v2(raw, "PRAGMA user_version", -1, &stmt, nullptr), SQLITE_OK);
    ASSERT_EQ(sqlite3_step(stmt), SQLITE_ROW);
    EXPECT_EQ(sqlite3_column_int(stmt, 0), static_cast<int>(kSchemaVersion));
    sqlite3_finalize(stmt);
    sqlite3_close(raw);

    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}

TEST(Database, RefusesJournalFromAnotherVersion) {
    const std::string path = "/tmp/wcoord_db_version_" + std::to_string(::getpid()) + ".db";
    std::remove(path.c_str());

    sqlite3* raw = nullptr;
    ASSERT_EQ(sqlite3_open(path.c_str(), &raw), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(raw, "PRAGMA user_version=7", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(raw);

    Database db;
    const Status s = db.open(DbConfig{path.c_str(), nullptr});
    EXPECT_EQ(s.code, StatusCode::Corrupt);
    EXPECT_EQ(s.aux, 7u);
    EXPECT_FALSE(db.is_open());

    std::remove(path.c_str());
}

//=============================================================================
// Bins and Reports
//=============================================================================

TEST_F(DatabaseTest, PutBinUpserts) {
    Bin b = make_test_bin(1);
    ASSERT_TRUE(is_ok(db.put_bin(b)));
    b.fill = FillLevel::Full;
    b.needs_collection = true;
    ASSERT_TRUE(is_ok(db.put_bin(b)));

    u64 n = 0;
    ASSERT_TRUE(is_ok(db.count_rows(TableId::Bins, &n)));
    EXPECT_EQ(n, 1u);
}

TEST_F(DatabaseTest, PutBinRejectsCapacityOutOfRange) {
    Bin b = make_test_bin(1);
    b.capacity_liters = 20000;
    const Status s = db.put_bin(b);
    EXPECT_EQ(s.code, StatusCode::Invalid);
}

TEST_F(DatabaseTest, DuplicateReportRejected) {
    Bin b = make_test_bin(1);
    ASSERT_TRUE(is_ok(db.put_bin(b)));

    WasteReport r{ReportId{1}, BinId{1}, UserId{5}, FillLevel::Half, 1700000100};
    ASSERT_TRUE(is_ok(db.record_report(r, b)));

    r.id = ReportId{2};
    r.fill = FillLevel::Full;
    const Status s = db.record_report(r, b);
    EXPECT_EQ(s.code, StatusCode::DuplicateReport);

    u64 n = 0;
    ASSERT_TRUE(is_ok(db.count_reports(BinId{1}, &n)));
    EXPECT_EQ(n, 1u);
}

TEST_F(DatabaseTest, RecordReportRollsBackBinOnDuplicate) {
    Bin b = make_test_bin(1);
    ASSERT_TRUE(is_ok(db.put_bin(b)));
    ASSERT_TRUE(is_ok(db.record_report(WasteReport{ReportId{1}, BinId{1}, UserId{5}, FillLevel::Half, 100}, b)));

    Bin full = b;
    full.fill = FillLevel::Full;
    full.needs_collection = true;
    const Status s = db.record_report(WasteReport{ReportId{2}, BinId{1}, UserId{6}, FillLevel::Full, 100}, full);
    EXPECT_EQ(s.code, StatusCode::DuplicateReport);

    // The savepoint was released; later writes still commit.
    EXPECT_TRUE(is_ok(db.record_report(WasteReport{ReportId{3}, BinId{1}, UserId{6}, FillLevel::Full, 101}, full)));
    u64 n = 0;
    ASSERT_TRUE(is_ok(db.count_reports(BinId{1}, &n)));
    EXPECT_EQ(n, 2u);
}

TEST_F(DatabaseTest, ReportRequiresBin) {
    const Status s = db.record_report(WasteReport{ReportId{1}, BinId{99}, UserId{5}, FillLevel::Half, 100},
                                      make_test_bin(99));
    EXPECT_FALSE(is_ok(s));
    EXPECT_FALSE(is_fatal(s));

    u64 n = 1;
    ASSERT_TRUE(is_ok(db.count_rows(TableId::Bins, &n)));
    EXPECT_EQ(n, 0u);
}

//=============================================================================
// Fleet
//=============================================================================

TEST_F(DatabaseTest, LocationRequiresDriver) {
    LocationSample sample{};
    sample.id = SampleId{1};
    sample.driver = DriverId{7};
    sample.point = GeoPoint{52.0, 13.0};
    sample.recorded_at = 1700000000;

    Status s = db.insert_location(sample);
    EXPECT_EQ(s.code, StatusCode::Invalid);

    ASSERT_TRUE(is_ok(db.put_driver(make_test_driver(7))));
    s = db.insert_location(sample);
    EXPECT_TRUE(is_ok(s));

    u64 n = 0;
    ASSERT_TRUE(is_ok(db.count_locations(DriverId{7}, &n)));
    EXPECT_EQ(n, 1u);
}

TEST_F(DatabaseTest, DriverFrequencyChecked) {
    Driver d = make_test_driver(3);
    d.update_frequency_s = 5;
    EXPECT_EQ(db.put_driver(d).code, StatusCode::Invalid);
}

TEST_F(DatabaseTest, TruckReplacedById) {
    Truck t{};
    t.id = TruckId{2};
    std::strcpy(t.license_plate, "B-WC-100");
    t.capacity_kg = 8000;
    ASSERT_TRUE(is_ok(db.put_truck(t)));
    t.status = TruckStatus::Maintenance;
    ASSERT_TRUE(is_ok(db.put_truck(t)));

    u64 n = 0;
    ASSERT_TRUE(is_ok(db.count_rows(TableId::Trucks, &n)));
    EXPECT_EQ(n, 1u);

    u64 max = 0;
    ASSERT_TRUE(is_ok(db.max_id(TableId::Trucks, &max)));
    EXPECT_EQ(max, 2u);
}

TEST_F(DatabaseTest, PurgeLocationsBeforeCutoff) {
    ASSERT_TRUE(is_ok(db.put_driver(make_test_driver(1))));
    for (u64 i = 0; i < 5; ++i) {
        LocationSample sample{};
        sample.id = SampleId{i + 1};
        sample.driver = DriverId{1};
        sample.point = GeoPoint{52.0, 13.0};
        sample.recorded_at = 1000 + static_cast<Timestamp>(i) * 100;
        ASSERT_TRUE(is_ok(db.insert_location(sample)));
    }

    u64 removed = 0;
    ASSERT_TRUE(is_ok(db.purge_locations(1250, &removed)));
    EXPECT_EQ(removed, 3u);

    u64 n = 0;
    ASSERT_TRUE(is_ok(db.count_locations(DriverId{1}, &n)));
    EXPECT_EQ(n, 2u);
}

//=============================================================================
// Routes
//=============================================================================

TEST_F(DatabaseTest, RouteRoundTrip) {
    RouteRecord r = make_test_route(3);
    r.driver = DriverId{10};
    r.truck = TruckId{4};
    r.planned_distance_km = 12.5;
    ASSERT_TRUE(is_ok(db.put_route(r)));

    r.status = RouteStatus::Completed;
    r.actual_distance_km = 15.0;
    r.efficiency_score = 83.3;
    ASSERT_TRUE(is_ok(db.put_route(r)));

    RouteRecord got{};
    ASSERT_TRUE(is_ok(db.get_route(RouteId{3}, &got)));
    EXPECT_EQ(got.status, RouteStatus::Completed);
    EXPECT_EQ(got.driver, DriverId{10});
    EXPECT_EQ(got.truck, TruckId{4});
    EXPECT_DOUBLE_EQ(got.planned_distance_km, 12.5);
    EXPECT_DOUBLE_EQ(got.efficiency_score, 83.3);

    EXPECT_EQ(db.get_route(RouteId{4}, &got).code, StatusCode::NotFound);
}

TEST_F(DatabaseTest, UnassignedRouteHasNoDriver) {
    RouteRecord r = make_test_route(1);
    r.status = RouteStatus::Pending;
    ASSERT_TRUE(is_ok(db.put_route(r)));

    RouteRecord got{};
    ASSERT_TRUE(is_ok(db.get_route(RouteId{1}, &got)));
    EXPECT_FALSE(got.driver.is_valid());
    EXPECT_FALSE(got.truck.is_valid());
}

TEST_F(DatabaseTest, EfficiencyScoreChecked) {
    RouteRecord r = make_test_route(1);
    r.efficiency_score = 120.0;
    EXPECT_EQ(db.put_route(r).code, StatusCode::Invalid);
}

TEST_F(DatabaseTest, OneActiveStopPerBin) {
    for (u64 id = 1; id <= 3; ++id) {
        ASSERT_TRUE(is_ok(db.put_bin(make_test_bin(id))));
    }
    ASSERT_TRUE(is_ok(db.put_route(make_test_route(1))));
    ASSERT_TRUE(is_ok(db.put_route(make_test_route(2))));

    const RouteStop first[] = {
        {RouteId{1}, BinId{1}, 1, false, 0, 0.0},
        {RouteId{1}, BinId{2}, 2, false, 0, 0.0},
    };
    ASSERT_TRUE(is_ok(db.insert_route_stops(RouteId{1}, first, 2)));

    const RouteStop second[] = {
        {RouteId{2}, BinId{3}, 1, false, 0, 0.0},
        {RouteId{2}, BinId{2}, 2, false, 0, 0.0},
    };
    Status s = db.insert_route_stops(RouteId{2}, second, 2);
    EXPECT_EQ(s.code, StatusCode::SchedulingConflict);

    // All or nothing: bin 3 was not left behind.
    u64 n = 0;
    ASSERT_TRUE(is_ok(db.count_rows(TableId::RouteBins, &n)));
    EXPECT_EQ(n, 2u);
    ASSERT_TRUE(is_ok(db.count_active_stops(BinId{3}, &n)));
    EXPECT_EQ(n, 0u);

    ASSERT_TRUE(is_ok(db.deactivate_route_stops(RouteId{1})));
    s = db.insert_route_stops(RouteId{2}, second, 2);
    EXPECT_TRUE(is_ok(s));
    ASSERT_TRUE(is_ok(db.count_active_stops(BinId{2}, &n)));
    EXPECT_EQ(n, 1u);
}

TEST_F(DatabaseTest, StopsRequireRouteAndBin) {
    ASSERT_TRUE(is_ok(db.put_bin(make_test_bin(1))));
    const RouteStop stop{RouteId{9}, BinId{1}, 1, false, 0, 0.0};
    EXPECT_FALSE(is_ok(db.insert_route_stops(RouteId{9}, &stop, 1)));
    EXPECT_EQ(db.insert_route_stops(RouteId{9}, nullptr, 1).code, StatusCode::Invalid);
}

TEST_F(DatabaseTest, UpdateStop) {
    ASSERT_TRUE(is_ok(db.put_bin(make_test_bin(1))));
    ASSERT_TRUE(is_ok(db.put_route(make_test_route(1))));
    const RouteStop stop{RouteId{1}, BinId{1}, 1, false, 0, 0.0};
    ASSERT_TRUE(is_ok(db.insert_route_stops(RouteId{1}, &stop, 1)));

    RouteStop done = stop;
    done.collected = true;
    done.collected_at = 1700000500;
    done.weight_kg = 31.5;
    EXPECT_TRUE(is_ok(db.update_stop(done)));

    done.bin = BinId{2};
    EXPECT_EQ(db.update_stop(done).code, StatusCode::NotFound);
}

TEST_F(DatabaseTest, MaxIdRejectsRouteBins) {
    u64 out = 0;
    EXPECT_EQ(db.max_id(TableId::RouteBins, &out).code, StatusCode::Invalid);
    ASSERT_TRUE(is_ok(db.max_id(TableId::Drivers, &out)));
    EXPECT_EQ(out, 0u);
}
