#pragma once

#include <mutex>
#include <type_traits>

#include "wcoord/core/errors.hpp"
#include "wcoord/core/models.hpp"
#include "wcoord/core/types.hpp"
#include "wcoord/db/schema.hpp"

struct sqlite3;

namespace wcoord::db {
    using u32 = wcoord::core::u32;
    using u64 = wcoord::core::u64;

    struct DbConfig {
        const char* path{nullptr};         // nullptr or "" opens ":memory:"
        const char* journal_mode{nullptr}; // nullptr reads WCOORD_DB_JOURNAL_MODE, default WAL
    };

    // Durable journal for the coordination engine. One connection, serialized
    // by an internal mutex; every call is safe from any thread.
    class Database {
    public:
        Database() noexcept = default;
        ~Database() noexcept;
        Database(const Database&) = delete;
        Database& operator=(const Database&) = delete;

        [[nodiscard]] wcoord::core::Status open(const DbConfig& cfg) noexcept;
        [[nodiscard]] wcoord::core::Status close() noexcept;
        [[nodiscard]] bool is_open() const noexcept;

        // ------------------------------------------------------------------
        // Writes
        // ------------------------------------------------------------------

        [[nodiscard]] wcoord::core::Status put_bin(const wcoord::core::Bin& bin) noexcept;

        // Report row and resulting bin state in one savepoint. DuplicateReport
        // when (bin, reported_at) already exists.
        [[nodiscard]] wcoord::core::Status record_report(const wcoord::core::WasteReport& report,
                                                         const wcoord::core::Bin& bin) noexcept;

        [[nodiscard]] wcoord::core::Status put_truck(const wcoord::core::Truck& truck) noexcept;
        [[nodiscard]] wcoord::core::Status put_driver(const wcoord::core::Driver& driver) noexcept;
        [[nodiscard]] wcoord::core::Status insert_location(const wcoord::core::LocationSample& sample) noexcept;

        [[nodiscard]] wcoord::core::Status put_route(const RouteRecord& route) noexcept;

        // Inserts all stops as active, or none. SchedulingConflict when a bin
        // already has an active stop in another route.
        [[nodiscard]] wcoord::core::Status insert_route_stops(wcoord::core::RouteId route,
                                                              const wcoord::core::RouteStop* stops,
                                                              u32 count) noexcept;

        [[nodiscard]] wcoord::core::Status update_stop(const wcoord::core::RouteStop& stop) noexcept;

        // Marks every stop of the route inactive (route reached a terminal state).
        [[nodiscard]] wcoord::core::Status deactivate_route_stops(wcoord::core::RouteId route) noexcept;

        // Drops location rows recorded before `before`; returns the count removed.
        [[nodiscard]] wcoord::core::Status purge_locations(wcoord::core::Timestamp before, u64* removed) noexcept;

        // ------------------------------------------------------------------
        // Audit queries
        // ------------------------------------------------------------------

        [[nodiscard]] wcoord::core::Status count_rows(TableId table, u64* out) const noexcept;
        [[nodiscard]] wcoord::core::Status count_reports(wcoord::core::BinId bin, u64* out) const noexcept;
        [[nodiscard]] wcoord::core::Status count_locations(wcoord::core::DriverId driver, u64* out) const noexcept;
        [[nodiscard]] wcoord::core::Status count_active_stops(wcoord::core::BinId bin, u64* out) const noexcept;
        [[nodiscard]] wcoord::core::Status get_route(wcoord::core::RouteId id, RouteRecord* out) const noexcept;

        // Largest primary key in `table` (0 when empty). Seeds id counters when
        // an engine reopens an existing journal. Invalid for route_bins.
        [[nodiscard]] wcoord::core::Status max_id(TableId table, u64* out) const noexcept;

    private:
        [[nodiscard]] wcoord::core::Status exec_locked(const char* sql) noexcept;

        sqlite3* db_{nullptr};
        mutable std::mutex mutex_;
    };

    static_assert(std::is_trivially_copyable_v<DbConfig>);
    static_assert(std::is_standard_layout_v<DbConfig>);

} // namespace wcoord::db
