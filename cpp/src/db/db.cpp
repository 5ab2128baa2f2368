#include "wcoord/db/db.hpp"
#include "wcoord/core/log.hpp"
#include <sqlite3.h>
#include <cstdlib>
#include <string>
#include <mutex>

namespace wcoord::db {

using namespace wcoord::core;

namespace {
    // Schema v2. Mirrors the logical model; enums are stored as their integer values.
    constexpr const char* kSchemaSQL = R"SQL(
        PRAGMA foreign_keys = ON;

        CREATE TABLE IF NOT EXISTS bins (
            id INTEGER PRIMARY KEY,
            owner_id INTEGER NOT NULL,
            code TEXT NOT NULL,
            capacity_liters INTEGER NOT NULL CHECK (capacity_liters BETWEEN 1 AND 10000),
            waste_type INTEGER NOT NULL,
            fill_level INTEGER NOT NULL,
            needs_collection INTEGER NOT NULL,
            is_active INTEGER NOT NULL,
            lat REAL NOT NULL,
            lon REAL NOT NULL,
            last_reported INTEGER NOT NULL DEFAULT 0,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            deleted_at INTEGER NOT NULL DEFAULT 0
        );
        CREATE INDEX IF NOT EXISTS idx_bins_needs_collection ON bins(needs_collection) WHERE needs_collection = 1;

        CREATE TABLE IF NOT EXISTS waste_reports (
            id INTEGER PRIMARY KEY,
            bin_id INTEGER NOT NULL REFERENCES bins(id),
            user_id INTEGER NOT NULL,
            fill_level INTEGER NOT NULL,
            reported_at INTEGER NOT NULL,
            UNIQUE (bin_id, reported_at)
        );
        CREATE INDEX IF NOT EXISTS idx_waste_reports_bin ON waste_reports(bin_id, reported_at DESC);

        CREATE TABLE IF NOT EXISTS trucks (
            id INTEGER PRIMARY KEY,
            license_plate TEXT NOT NULL,
            capacity_kg INTEGER NOT NULL CHECK (capacity_kg > 0),
            current_driver_id INTEGER,
            status INTEGER NOT NULL,
            has_location INTEGER NOT NULL DEFAULT 0,
            lat REAL,
            lon REAL,
            last_location_update INTEGER NOT NULL DEFAULT 0,
            total_distance_km REAL NOT NULL DEFAULT 0
        );

        CREATE TABLE IF NOT EXISTS drivers (
            user_id INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            current_truck_id INTEGER,
            location_sharing_enabled INTEGER NOT NULL,
            location_update_frequency INTEGER NOT NULL CHECK (location_update_frequency BETWEEN 10 AND 300),
            is_on_duty INTEGER NOT NULL,
            last_active INTEGER NOT NULL DEFAULT 0
        );

        CREATE TABLE IF NOT EXISTS location_updates (
            id INTEGER PRIMARY KEY,
            driver_id INTEGER NOT NULL REFERENCES drivers(user_id),
            lat REAL NOT NULL,
            lon REAL NOT NULL,
            accuracy_meters REAL CHECK (accuracy_meters >= 0),
            heading REAL CHECK (heading >= 0 AND heading <= 360),
            device_speed_kmh REAL CHECK (device_speed_kmh >= 0),
            battery_level INTEGER,
            recorded_at INTEGER NOT NULL,
            recorded_date INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_location_updates_driver ON location_updates(driver_id, recorded_at DESC);

        CREATE TABLE IF NOT EXISTS collection_routes (
            id INTEGER PRIMARY KEY,
            code TEXT NOT NULL,
            driver_id INTEGER,
            truck_id INTEGER,
            scheduled_date INTEGER NOT NULL,
            status INTEGER NOT NULL,
            total_distance_km REAL NOT NULL DEFAULT 0,
            actual_distance_km REAL NOT NULL DEFAULT 0,
            bins_collected INTEGER NOT NULL DEFAULT 0,
            total_waste_kg REAL NOT NULL DEFAULT 0,
            efficiency_score REAL NOT NULL DEFAULT 0 CHECK (efficiency_score >= 0 AND efficiency_score <= 100),
            actual_start_time INTEGER NOT NULL DEFAULT 0,
            actual_end_time INTEGER NOT NULL DEFAULT 0
        );
        CREATE INDEX IF NOT EXISTS idx_collection_routes_status ON collection_routes(status);

        CREATE TABLE IF NOT EXISTS route_bins (
            route_id INTEGER NOT NULL REFERENCES collection_routes(id),
            bin_id INTEGER NOT NULL REFERENCES bins(id),
            sequence_number INTEGER NOT NULL CHECK (sequence_number > 0),
            collected INTEGER NOT NULL DEFAULT 0,
            collected_at INTEGER NOT NULL DEFAULT 0,
            weight_kg REAL NOT NULL DEFAULT 0 CHECK (weight_kg >= 0),
            active INTEGER NOT NULL DEFAULT 1,
            UNIQUE (route_id, bin_id),
            UNIQUE (route_id, sequence_number)
        );
        CREATE INDEX IF NOT EXISTS idx_route_bins_bin ON route_bins(bin_id);
        CREATE UNIQUE INDEX IF NOT EXISTS idx_route_bins_active_bin ON route_bins(bin_id) WHERE active = 1;
    )SQL";

    // -1 when the pragma cannot be read.
    [[nodiscard]] int read_user_version(sqlite3* db) noexcept {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, "PRAGMA user_version", -1, &stmt, nullptr) != SQLITE_OK || stmt == nullptr) {
            return -1;
        }
        const int version = sqlite3_step(stmt) == SQLITE_ROW ? sqlite3_column_int(stmt, 0) : -1;
        sqlite3_finalize(stmt);
        return version;
    }

    [[nodiscard]] bool exec_sql(sqlite3* db, const char* sql) noexcept {
        if (!db || !sql) return false;
        char* err_msg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
        if (err_msg) {
            log_debug("sqlite: %s", err_msg);
            sqlite3_free(err_msg);
        }
        return rc == SQLITE_OK;
    }


    [[nodiscard]] Status prepare(sqlite3* db, const char* sql, sqlite3_stmt** out) noexcept {
        if (!db) {
            return make_status(StatusDomain::Db, StatusCode::Unavailable);
        }
        const int rc = sqlite3_prepare_v2(db, sql, -1, out, nullptr);
        if (rc != SQLITE_OK || *out == nullptr) {
            log_error("sqlite prepare: %s", sqlite3_errmsg(db));
            return make_status(StatusDomain::Db, StatusCode::Unknown, static_cast<u32>(rc));
        }
        return ok_status();
    }

    // Steps a write statement to completion and finalizes it. Constraint
    // failures map to `on_conflict`.
    [[nodiscard]] Status step_done(sqlite3* db, sqlite3_stmt* stmt, StatusCode on_conflict) noexcept {
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc == SQLITE_DONE) {
            return ok_status();
        }
        if ((rc & 0xff) == SQLITE_CONSTRAINT) {
            return make_status(StatusDomain::Db, on_conflict, static_cast<u32>(sqlite3_extended_errcode(db)));
        }
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            return make_status(StatusDomain::Db, StatusCode::Busy, static_cast<u32>(rc));
        }
        if (rc == SQLITE_IOERR || rc == SQLITE_FULL || rc == SQLITE_CANTOPEN) {
            return make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(rc));
        }
        if (rc == SQLITE_CORRUPT || rc == SQLITE_NOTADB) {
            return make_status(StatusDomain::Db, StatusCode::Corrupt, static_cast<u32>(rc));
        }
        return make_status(StatusDomain::Db, StatusCode::Unknown, static_cast<u32>(rc));
    }

    void bind_optional_id(sqlite3_stmt* stmt, int idx, bool valid, sqlite3_int64 v) noexcept {
        if (valid) {
            sqlite3_bind_int64(stmt, idx, v);
        } else {
            sqlite3_bind_null(stmt, idx);
        }
    }

    [[nodiscard]] Status count_query(sqlite3* db, const char* sql, bool bind, sqlite3_int64 key, u64* out) noexcept {
        sqlite3_stmt* stmt = nullptr;
        Status s = prepare(db, sql, &stmt);
        if (!is_ok(s)) {
            return s;
        }
        if (bind) {
            sqlite3_bind_int64(stmt, 1, key);
        }
        const int rc = sqlite3_step(stmt);
        if (rc != SQLITE_ROW) {
            sqlite3_finalize(stmt);
            return make_status(StatusDomain::Db, StatusCode::Unknown, static_cast<u32>(rc));
        }
        *out = static_cast<u64>(sqlite3_column_int64(stmt, 0));
        sqlite3_finalize(stmt);
        return ok_status();
    }
} // namespace

const char* table_name(TableId t) noexcept {
    switch (t) {
        case TableId::Bins: return "bins";
        case TableId::WasteReports: return "waste_reports";
        case TableId::Trucks: return "trucks";
        case TableId::Drivers: return "drivers";
        case TableId::LocationUpdates: return "location_updates";
        case TableId::CollectionRoutes: return "collection_routes";
        case TableId::RouteBins: return "route_bins";
    }
    return nullptr;
}

// ============================================================================
// Database Lifecycle
// ============================================================================

Database::~Database() noexcept {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Status Database::open(const DbConfig& cfg) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    // Close existing connection if any
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }

    const char* path = (cfg.path && cfg.path[0] != '\0') ? cfg.path : ":memory:";
    int rc = sqlite3_open_v2(path, &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        log_error("cannot open journal %s: %s", path, db_ ? sqlite3_errmsg(db_) : "out of memory");
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return make_status(StatusDomain::Db, StatusCode::Unavailable, static_cast<u32>(rc));
    }

    sqlite3_busy_timeout(db_, 2000);

    // WAL by default (configurable); in-memory databases silently keep "memory".
    const char* journal_mode = cfg.journal_mode;
    if (!journal_mode || journal_mode[0] == '\0') {
        journal_mode = std::getenv("WCOORD_DB_JOURNAL_MODE");
    }
    if (!journal_mode || journal_mode[0] == '\0') {
        journal_mode = "WAL";
    }
    std::string journal_sql = "PRAGMA journal_mode=";
    journal_sql += journal_mode;
    if (!exec_sql(db_, journal_sql.c_str())) {
        log_warn("journal_mode=%s rejected, keeping default", journal_mode);
    }

    (void)exec_sql(db_, "PRAGMA synchronous=NORMAL");
    (void)exec_sql(db_, "PRAGMA temp_store=MEMORY");

    // 0 means a fresh file; anything else must be the layout this build writes.
    const int version = read_user_version(db_);
    if (version < 0 || (version != 0 && version != static_cast<int>(kSchemaVersion))) {
        log_error("journal %s has schema version %d, expected %u", path, version, kSchemaVersion);
        sqlite3_close(db_);
        db_ = nullptr;
        return make_status(StatusDomain::Db, StatusCode::Corrupt, static_cast<u32>(version));
    }

    if (!exec_sql(db_, kSchemaSQL)) {
        log_error("journal schema setup failed: %s", sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return make_status(StatusDomain::Db, StatusCode::Corrupt);
    }

    std::string version_sql = "PRAGMA user_version=" + std::to_string(kSchemaVersion);
    (void)exec_sql(db_, version_sql.c_str());

    log_debug("journal opened at %s", path);
    return ok_status();
}

Status Database::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    sqlite3_close(db_);
    db_ = nullptr;
    return ok_status();
}

bool Database::is_open() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

Status Database::exec_locked(const char* sql) noexcept {
    if (!db_) {
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }
    if (!exec_sql(db_, sql)) {
        return make_status(StatusDomain::Db, StatusCode::Unknown, static_cast<u32>(sqlite3_errcode(db_)));
    }
    return ok_status();
}

// ============================================================================
// Bins and Reports
// ============================================================================

namespace {
    [[nodiscard]] Status put_bin_locked(sqlite3* db, const Bin& bin) noexcept {
        const char* sql =
            "INSERT INTO bins (id, owner_id, code, capacity_liters, waste_type, fill_level, needs_collection, "
            "is_active, lat, lon, last_reported, created_at, updated_at, deleted_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(id) DO UPDATE SET owner_id = excluded.owner_id, code = excluded.code, "
            "capacity_liters = excluded.capacity_liters, waste_type = excluded.waste_type, "
            "fill_level = excluded.fill_level, needs_collection = excluded.needs_collection, "
            "is_active = excluded.is_active, lat = excluded.lat, lon = excluded.lon, "
            "last_reported = excluded.last_reported, updated_at = excluded.updated_at, "
            "deleted_at = excluded.deleted_at";

        sqlite3_stmt* stmt = nullptr;
        Status s = prepare(db, sql, &stmt);
        if (!is_ok(s)) {
            return s;
        }

        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(bin.id.v));
        sqlite3_bind_int64(stmt, 2, bin.owner.v);
        sqlite3_bind_text(stmt, 3, bin.code, -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 4, static_cast<int>(bin.capacity_liters));
        sqlite3_bind_int(stmt, 5, static_cast<int>(bin.category));
        sqlite3_bind_int(stmt, 6, static_cast<int>(bin.fill));
        sqlite3_bind_int(stmt, 7, bin.needs_collection ? 1 : 0);
        sqlite3_bind_int(stmt, 8, bin.active ? 1 : 0);
        sqlite3_bind_double(stmt, 9, bin.point.lat);
        sqlite3_bind_double(stmt, 10, bin.point.lon);
        sqlite3_bind_int64(stmt, 11, bin.last_reported);
        sqlite3_bind_int64(stmt, 12, bin.created_at);
        sqlite3_bind_int64(stmt, 13, bin.updated_at);
        sqlite3_bind_int64(stmt, 14, bin.deleted_at);

        return step_done(db, stmt, StatusCode::Invalid);
    }

    [[nodiscard]] Status insert_report_locked(sqlite3* db, const WasteReport& report) noexcept {
        const char* sql = "INSERT INTO waste_reports (id, bin_id, user_id, fill_level, reported_at) "
                          "VALUES (?, ?, ?, ?, ?)";

        sqlite3_stmt* stmt = nullptr;
        Status s = prepare(db, sql, &stmt);
        if (!is_ok(s)) {
            return s;
        }

        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(report.id.v));
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(report.bin.v));
        sqlite3_bind_int64(stmt, 3, report.reporter.v);
        sqlite3_bind_int(stmt, 4, static_cast<int>(report.fill));
        sqlite3_bind_int64(stmt, 5, report.reported_at);

        return step_done(db, stmt, StatusCode::DuplicateReport);
    }
} // namespace

Status Database::put_bin(const Bin& bin) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return put_bin_locked(db_, bin);
}

Status Database::record_report(const WasteReport& report, const Bin& bin) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    Status s = exec_locked("SAVEPOINT bin_report");
    if (!is_ok(s)) {
        return s;
    }
    s = insert_report_locked(db_, report);
    if (is_ok(s)) {
        s = put_bin_locked(db_, bin);
    }
    if (!is_ok(s)) {
        (void)exec_sql(db_, "ROLLBACK TO bin_report");
        (void)exec_sql(db_, "RELEASE bin_report");
        return s;
    }
    return exec_locked("RELEASE bin_report");
}

// ============================================================================
// Fleet
// ============================================================================

Status Database::put_truck(const Truck& truck) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "INSERT OR REPLACE INTO trucks (id, license_plate, capacity_kg, current_driver_id, status, "
        "has_location, lat, lon, last_location_update, total_distance_km) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(db_, sql, &stmt);
    if (!is_ok(s)) {
        return s;
    }

    sqlite3_bind_int64(stmt, 1, truck.id.v);
    sqlite3_bind_text(stmt, 2, truck.license_plate, -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, truck.capacity_kg);
    bind_optional_id(stmt, 4, truck.current_driver.is_valid(), truck.current_driver.v);
    sqlite3_bind_int(stmt, 5, static_cast<int>(truck.status));
    sqlite3_bind_int(stmt, 6, truck.has_position ? 1 : 0);
    sqlite3_bind_double(stmt, 7, truck.last_position.lat);
    sqlite3_bind_double(stmt, 8, truck.last_position.lon);
    sqlite3_bind_int64(stmt, 9, truck.last_position_at);
    sqlite3_bind_double(stmt, 10, truck.total_distance_km);

    return step_done(db_, stmt, StatusCode::Invalid);
}

Status Database::put_driver(const Driver& driver) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "INSERT OR REPLACE INTO drivers (user_id, name, current_truck_id, location_sharing_enabled, "
        "location_update_frequency, is_on_duty, last_active) VALUES (?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(db_, sql, &stmt);
    if (!is_ok(s)) {
        return s;
    }

    sqlite3_bind_int64(stmt, 1, driver.id.v);
    sqlite3_bind_text(stmt, 2, driver.name, -1, SQLITE_TRANSIENT);
    bind_optional_id(stmt, 3, driver.truck.is_valid(), driver.truck.v);
    sqlite3_bind_int(stmt, 4, driver.sharing_enabled ? 1 : 0);
    sqlite3_bind_int64(stmt, 5, driver.update_frequency_s);
    sqlite3_bind_int(stmt, 6, driver.on_duty ? 1 : 0);
    sqlite3_bind_int64(stmt, 7, driver.last_active);

    return step_done(db_, stmt, StatusCode::Invalid);
}

Status Database::insert_location(const LocationSample& sample) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "INSERT INTO location_updates (id, driver_id, lat, lon, accuracy_meters, heading, device_speed_kmh, "
        "battery_level, recorded_at, recorded_date) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?9 - (?9 % 86400))";

    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(db_, sql, &stmt);
    if (!is_ok(s)) {
        return s;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(sample.id.v));
    sqlite3_bind_int64(stmt, 2, sample.driver.v);
    sqlite3_bind_double(stmt, 3, sample.point.lat);
    sqlite3_bind_double(stmt, 4, sample.point.lon);
    sqlite3_bind_double(stmt, 5, sample.accuracy_m);
    sqlite3_bind_double(stmt, 6, sample.heading_deg);
    sqlite3_bind_double(stmt, 7, sample.speed_kmh);
    bind_optional_id(stmt, 8, sample.battery_pct >= 0, sample.battery_pct);
    sqlite3_bind_int64(stmt, 9, sample.recorded_at);

    return step_done(db_, stmt, StatusCode::Invalid);
}

Status Database::purge_locations(Timestamp before, u64* removed) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(db_, "DELETE FROM location_updates WHERE recorded_at < ?", &stmt);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_int64(stmt, 1, before);
    s = step_done(db_, stmt, StatusCode::Invalid);
    if (is_ok(s) && removed) {
        *removed = static_cast<u64>(sqlite3_changes(db_));
    }
    return s;
}

// ============================================================================
// Routes
// ============================================================================

Status Database::put_route(const RouteRecord& route) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "INSERT INTO collection_routes (id, code, driver_id, truck_id, scheduled_date, status, total_distance_km, "
        "actual_distance_km, bins_collected, total_waste_kg, efficiency_score, actual_start_time, actual_end_time) "
        "VALUES (?1, 'RT-' || ?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12) "
        "ON CONFLICT(id) DO UPDATE SET driver_id = excluded.driver_id, truck_id = excluded.truck_id, "
        "status = excluded.status, total_distance_km = excluded.total_distance_km, "
        "actual_distance_km = excluded.actual_distance_km, bins_collected = excluded.bins_collected, "
        "total_waste_kg = excluded.total_waste_kg, efficiency_score = excluded.efficiency_score, "
        "actual_start_time = excluded.actual_start_time, actual_end_time = excluded.actual_end_time";

    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(db_, sql, &stmt);
    if (!is_ok(s)) {
        return s;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(route.id.v));
    bind_optional_id(stmt, 2, route.driver.is_valid(), route.driver.v);
    bind_optional_id(stmt, 3, route.truck.is_valid(), route.truck.v);
    sqlite3_bind_int64(stmt, 4, route.scheduled_date);
    sqlite3_bind_int(stmt, 5, static_cast<int>(route.status));
    sqlite3_bind_double(stmt, 6, route.planned_distance_km);
    sqlite3_bind_double(stmt, 7, route.actual_distance_km);
    sqlite3_bind_int64(stmt, 8, route.bins_collected);
    sqlite3_bind_double(stmt, 9, route.total_waste_kg);
    sqlite3_bind_double(stmt, 10, route.efficiency_score);
    sqlite3_bind_int64(stmt, 11, route.actual_start);
    sqlite3_bind_int64(stmt, 12, route.actual_end);

    return step_done(db_, stmt, StatusCode::Invalid);
}

Status Database::insert_route_stops(RouteId route, const RouteStop* stops, u32 count) noexcept {
    if (count > 0 && stops == nullptr) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Status s = exec_locked("SAVEPOINT route_stops");
    if (!is_ok(s)) {
        return s;
    }

    const char* sql = "INSERT INTO route_bins (route_id, bin_id, sequence_number, active) VALUES (?, ?, ?, 1)";
    for (u32 i = 0; i < count && is_ok(s); ++i) {
        sqlite3_stmt* stmt = nullptr;
        s = prepare(db_, sql, &stmt);
        if (!is_ok(s)) {
            break;
        }
        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(route.v));
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(stops[i].bin.v));
        sqlite3_bind_int64(stmt, 3, stops[i].sequence);
        s = step_done(db_, stmt, StatusCode::SchedulingConflict);
    }

    if (!is_ok(s)) {
        (void)exec_sql(db_, "ROLLBACK TO route_stops");
        (void)exec_sql(db_, "RELEASE route_stops");
        return s;
    }
    return exec_locked("RELEASE route_stops");
}

Status Database::update_stop(const RouteStop& stop) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "UPDATE route_bins SET collected = ?, collected_at = ?, weight_kg = ? "
                      "WHERE route_id = ? AND bin_id = ?";

    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(db_, sql, &stmt);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_int(stmt, 1, stop.collected ? 1 : 0);
    sqlite3_bind_int64(stmt, 2, stop.collected_at);
    sqlite3_bind_double(stmt, 3, stop.weight_kg);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(stop.route.v));
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(stop.bin.v));

    s = step_done(db_, stmt, StatusCode::Invalid);
    if (is_ok(s) && sqlite3_changes(db_) == 0) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }
    return s;
}

Status Database::deactivate_route_stops(RouteId route) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(db_, "UPDATE route_bins SET active = 0 WHERE route_id = ?", &stmt);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(route.v));
    return step_done(db_, stmt, StatusCode::Invalid);
}

// ============================================================================
// Audit Queries
// ============================================================================

Status Database::count_rows(TableId table, u64* out) const noexcept {
    const char* name = table_name(table);
    if (!out || !name) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = "SELECT COUNT(*) FROM ";
    sql += name;
    return count_query(db_, sql.c_str(), false, 0, out);
}

Status Database::count_reports(BinId bin, u64* out) const noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return count_query(db_, "SELECT COUNT(*) FROM waste_reports WHERE bin_id = ?", true,
                       static_cast<sqlite3_int64>(bin.v), out);
}

Status Database::count_locations(DriverId driver, u64* out) const noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return count_query(db_, "SELECT COUNT(*) FROM location_updates WHERE driver_id = ?", true, driver.v, out);
}

Status Database::count_active_stops(BinId bin, u64* out) const noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return count_query(db_, "SELECT COUNT(*) FROM route_bins WHERE bin_id = ? AND active = 1", true,
                       static_cast<sqlite3_int64>(bin.v), out);
}

Status Database::get_route(RouteId id, RouteRecord* out) const noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "SELECT driver_id, truck_id, status, scheduled_date, total_distance_km, actual_distance_km, "
        "bins_collected, total_waste_kg, efficiency_score, actual_start_time, actual_end_time "
        "FROM collection_routes WHERE id = ?";

    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(db_, sql, &stmt);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id.v));

    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return make_status(StatusDomain::Db, StatusCode::Unknown, static_cast<u32>(rc));
    }

    RouteRecord r{};
    r.id = id;
    if (sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
        r.driver = DriverId{static_cast<u32>(sqlite3_column_int64(stmt, 0))};
    }
    if (sqlite3_column_type(stmt, 1) != SQLITE_NULL) {
        r.truck = TruckId{static_cast<u32>(sqlite3_column_int64(stmt, 1))};
    }
    r.status = static_cast<RouteStatus>(sqlite3_column_int(stmt, 2));
    r.scheduled_date = sqlite3_column_int64(stmt, 3);
    r.planned_distance_km = sqlite3_column_double(stmt, 4);
    r.actual_distance_km = sqlite3_column_double(stmt, 5);
    r.bins_collected = static_cast<u32>(sqlite3_column_int64(stmt, 6));
    r.total_waste_kg = sqlite3_column_double(stmt, 7);
    r.efficiency_score = sqlite3_column_double(stmt, 8);
    r.actual_start = sqlite3_column_int64(stmt, 9);
    r.actual_end = sqlite3_column_int64(stmt, 10);
    sqlite3_finalize(stmt);

    *out = r;
    return ok_status();
}

Status Database::max_id(TableId table, u64* out) const noexcept {
    if (!out || table == TableId::RouteBins) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    const char* name = table_name(table);
    if (!name) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    const char* key = (table == TableId::Drivers) ? "user_id" : "id";

    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = "SELECT COALESCE(MAX(";
    sql += key;
    sql += "), 0) FROM ";
    sql += name;
    return count_query(db_, sql.c_str(), false, 0, out);
}

} // namespace wcoord::db
