#include <array>
#include <charconv>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <vector>

#include "wcoord/cli/commands.hpp"
#include "wcoord/cli/options.hpp"
#include "wcoord/core/collection.hpp"
#include "wcoord/core/errors.hpp"
#include "wcoord/core/log.hpp"
#include "wcoord/core/types.hpp"
#include "wcoord/service/coordinator.hpp"
#include "wcoord/service/engine_config.hpp"
#include "wcoord/service/scheduler.hpp"

using wcoord::cli::CliArgs;
using wcoord::cli::OptionId;
using wcoord::cli::OptionSpec;
using wcoord::cli::OptionType;
using wcoord::cli::ParsedOption;
using wcoord::cli::ParsedOptions;
using wcoord::core::Status;
using wcoord::core::i64;
using wcoord::core::u32;
using wcoord::core::u64;
using wcoord::service::Coordinator;

// ========================================================================
// Global State
// ========================================================================

volatile sig_atomic_t g_running = 1;

// ========================================================================
// Signal Handler
// ========================================================================

void sigint_handler(int sig) {
    (void)sig;
    g_running = 0;
}

// ========================================================================
// Option tables
// ========================================================================

namespace {

constexpr std::array<OptionSpec, 3> kMainOptions{{
    {OptionId::Db, OptionType::String, "db", 'd'},
    {OptionId::Interval, OptionType::I64, "interval", 'i'},
    {OptionId::Verbose, OptionType::Flag, "verbose", 'v'},
}};

constexpr std::array<OptionSpec, 4> kBinOptions{{
    {OptionId::Capacity, OptionType::I64, "capacity", 'c'},
    {OptionId::Category, OptionType::String, "category", 't'},
    {OptionId::Code, OptionType::String, "code", '\0'},
    {OptionId::Owner, OptionType::I64, "owner", 'o'},
}};

constexpr std::array<OptionSpec, 2> kReportOptions{{
    {OptionId::Reporter, OptionType::I64, "reporter", 'r'},
    {OptionId::At, OptionType::I64, "at", '\0'},
}};

constexpr std::array<OptionSpec, 1> kTruckOptions{{
    {OptionId::Capacity, OptionType::I64, "capacity", 'c'},
}};

constexpr std::array<OptionSpec, 3> kDriverOptions{{
    {OptionId::Frequency, OptionType::I64, "frequency", 'f'},
    {OptionId::Sharing, OptionType::Flag, "sharing", 's'},
    {OptionId::OnDuty, OptionType::Flag, "on-duty", '\0'},
}};

constexpr std::array<OptionSpec, 5> kLocOptions{{
    {OptionId::Speed, OptionType::F64, "speed", '\0'},
    {OptionId::Accuracy, OptionType::F64, "accuracy", '\0'},
    {OptionId::Heading, OptionType::F64, "heading", '\0'},
    {OptionId::Battery, OptionType::I64, "battery", '\0'},
    {OptionId::At, OptionType::I64, "at", '\0'},
}};

constexpr std::array<OptionSpec, 3> kOptimizeOptions{{
    {OptionId::Lat, OptionType::F64, "lat", '\0'},
    {OptionId::Lon, OptionType::F64, "lon", '\0'},
    {OptionId::Radius, OptionType::F64, "radius", 'r'},
}};

constexpr std::array<OptionSpec, 3> kNearbyOptions{{
    {OptionId::Radius, OptionType::F64, "radius", 'r'},
    {OptionId::All, OptionType::Flag, "all", 'a'},
    {OptionId::Unclaimed, OptionType::Flag, "unclaimed", 'u'},
}};

constexpr std::array<OptionSpec, 1> kCloseOptions{{
    {OptionId::Distance, OptionType::F64, "distance", 'k'},
}};

constexpr u32 kMaxParsedOptions = 16;

// Parsed options plus the positional arguments that follow them.
struct HandlerArgs {
    std::array<ParsedOption, kMaxParsedOptions> storage{};
    ParsedOptions opts{};
    CliArgs rest{};
};

} // namespace

// ========================================================================
// Line parsing
// ========================================================================

void parse_line(const char* line, int* argc, char** argv, int max_args) {
    *argc = 0;

    // Skip leading whitespace
    while (*line && (*line == ' ' || *line == '\t' || *line == '\n' || *line == '\r')) {
        line++;
    }

    while (*line && *argc < max_args) {
        const char* token_start = line;
        while (*line && *line != ' ' && *line != '\t' && *line != '\n' && *line != '\r') {
            line++;
        }

        size_t token_len = static_cast<size_t>(line - token_start);
        if (token_len > 0) {
            char* token = static_cast<char*>(malloc(token_len + 1));
            if (token == nullptr) {
                return;
            }
            memcpy(token, token_start, token_len);
            token[token_len] = '\0';
            argv[(*argc)++] = token;
        }

        while (*line && (*line == ' ' || *line == '\t' || *line == '\n' || *line == '\r')) {
            line++;
        }
    }
}

void free_argv(char** argv, int argc) {
    for (int i = 0; i < argc; ++i) {
        free(argv[i]);
    }
}

// ========================================================================
// Error Handling
// ========================================================================

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

void print_status_error(const char* context, Status s) {
    fprintf(stderr,
            "error: %s failed (code=%s/%u, domain=%s/%u, aux=%u)\n",
            context,
            wcoord::core::status_code_name(s.code),
            static_cast<unsigned>(s.code),
            wcoord::core::status_domain_name(s.domain),
            static_cast<unsigned>(s.domain),
            s.aux);
}

// ========================================================================
// Argument helpers
// ========================================================================

bool parse_handler_args(const char* context, const CliArgs& args, const OptionSpec* specs, u32 spec_count,
                        HandlerArgs* out) {
    out->opts = ParsedOptions{out->storage.data(), 0, kMaxParsedOptions};
    u32 consumed = 0;
    const Status s = wcoord::cli::parse_options(args, specs, spec_count, &out->opts, &consumed);
    if (!wcoord::core::is_ok(s)) {
        print_status_error(context, s);
        return false;
    }
    out->rest.argv = args.argv + consumed;
    out->rest.argc = args.argc - consumed;
    return true;
}

bool parse_u64_arg(const char* s, u64* out) {
    if (s == nullptr || *s == '\0') {
        return false;
    }
    const char* end = s + strlen(s);
    u64 v{};
    auto r = std::from_chars(s, end, v, 10);
    if (r.ec != std::errc() || r.ptr != end) {
        return false;
    }
    *out = v;
    return true;
}

bool parse_u32_arg(const char* s, u32* out) {
    u64 v{};
    if (!parse_u64_arg(s, &v) || v > std::numeric_limits<u32>::max()) {
        return false;
    }
    *out = static_cast<u32>(v);
    return true;
}

bool parse_f64_arg(const char* s, double* out) {
    if (s == nullptr) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const double v = strtod(s, &end);
    if (end == s || end == nullptr || *end != '\0' || errno != 0) {
        return false;
    }
    *out = v;
    return true;
}

bool parse_on_off(const char* s, bool* out) {
    if (s == nullptr) {
        return false;
    }
    if (strcmp(s, "on") == 0 || strcmp(s, "yes") == 0 || strcmp(s, "1") == 0) {
        *out = true;
        return true;
    }
    if (strcmp(s, "off") == 0 || strcmp(s, "no") == 0 || strcmp(s, "0") == 0) {
        *out = false;
        return true;
    }
    return false;
}

bool option_u32(const ParsedOptions& opts, OptionId id, u32* inout) {
    const ParsedOption* o = wcoord::cli::find_option(opts, id);
    if (o == nullptr) {
        return true;
    }
    if (o->value.i64v < 0 || o->value.i64v > static_cast<i64>(std::numeric_limits<u32>::max())) {
        return false;
    }
    *inout = static_cast<u32>(o->value.i64v);
    return true;
}

i64 option_i64(const ParsedOptions& opts, OptionId id, i64 fallback) {
    const ParsedOption* o = wcoord::cli::find_option(opts, id);
    return o != nullptr ? o->value.i64v : fallback;
}

double option_f64(const ParsedOptions& opts, OptionId id, double fallback) {
    const ParsedOption* o = wcoord::cli::find_option(opts, id);
    return o != nullptr ? o->value.f64v : fallback;
}

const char* option_str(const ParsedOptions& opts, OptionId id) {
    const ParsedOption* o = wcoord::cli::find_option(opts, id);
    return o != nullptr ? o->value.str : nullptr;
}

bool option_flag(const ParsedOptions& opts, OptionId id) {
    return wcoord::cli::find_option(opts, id) != nullptr;
}

// ========================================================================
// Output
// ========================================================================

void print_bin(const wcoord::core::Bin& b) {
    printf("bin %llu %s  %s  %s  %u L  (%.6f, %.6f)%s%s",
           static_cast<unsigned long long>(b.id.v),
           b.code,
           wcoord::core::fill_level_name(b.fill),
           wcoord::core::waste_category_name(b.category),
           b.capacity_liters,
           b.point.lat,
           b.point.lon,
           b.active ? "" : "  inactive",
           b.needs_collection ? "  needs-collection" : "");
    if (b.claimed_by.is_valid()) {
        printf("  route=%llu", static_cast<unsigned long long>(b.claimed_by.v));
    }
    printf("\n");
}

void print_route(const wcoord::core::Route& r) {
    printf("%s  %s  driver=%u truck=%u  stops=%zu collected=%u\n",
           r.code,
           wcoord::core::route_status_name(r.status),
           r.driver.v,
           r.truck.v,
           r.stops.size(),
           r.bins_collected);
    printf("  planned %.2f km, estimated %.1f kg", r.planned_distance_km, r.estimated_mass_kg);
    if (r.status == wcoord::core::RouteStatus::Completed) {
        printf(", actual %.2f km, %.1f kg, efficiency %.1f",
               r.actual_distance_km,
               r.total_waste_kg,
               r.efficiency_score);
    }
    printf("\n");
    for (const wcoord::core::RouteStop& stop : r.stops) {
        if (stop.collected) {
            printf("  #%-3u bin %-8llu collected %.1f kg\n",
                   stop.sequence,
                   static_cast<unsigned long long>(stop.bin.v),
                   stop.weight_kg);
        } else {
            printf("  #%-3u bin %-8llu pending\n", stop.sequence, static_cast<unsigned long long>(stop.bin.v));
        }
    }
}

// ========================================================================
// Command Handlers
// ========================================================================

void handle_help() {
    printf("Commands:\n");
    printf("  bin add -c <liters> [--category c] [--code s] [--owner id] <lat> <lon>\n");
    printf("  bin show|rm <id>      Show or deactivate a bin\n");
    printf("  bin move <id> <lat> <lon>\n");
    printf("  report <bin> <fill> [-r reporter] [--at unix]\n");
    printf("                        fill: empty, quarter, half, three_quarters, full\n");
    printf("  truck add -c <kg> <plate>\n");
    printf("  truck show <id>\n");
    printf("  truck status <id> <available|on_route|maintenance|out_of_service>\n");
    printf("  driver add [-f s] [--sharing] [--on-duty] <user id> <name..>\n");
    printf("  driver duty|share <id> on|off\n");
    printf("  driver freq <id> <seconds>\n");
    printf("  pair <driver> <truck|none>\n");
    printf("  loc <driver> <lat> <lon> [--speed] [--accuracy] [--heading] [--battery] [--at]\n");
    printf("  optimize [--lat --lon -r meters]   Plan and commit routes\n");
    printf("  assign <driver> <truck> <bin..>    Manual route\n");
    printf("  start <route>\n");
    printf("  collect <route> <bin> <kg>\n");
    printf("  close <route> [-k km]  Complete (distance measured from the trail if omitted)\n");
    printf("  cancel <route>\n");
    printf("  route <id>            Route detail\n");
    printf("  routes                Active routes\n");
    printf("  urgent                Eligible bins by priority\n");
    printf("  nearby <lat> <lon> [-r meters] [--all] [--unclaimed]\n");
    printf("  drivers               Drivers on duty with their last position\n");
    printf("  help                  Show this help\n");
    printf("  q, quit, exit         Exit REPL\n");
}

void handle_bin(Coordinator& engine, const CliArgs& args) {
    if (args.argc == 0) {
        print_error("bin: expected add, show, rm or move");
        return;
    }
    const char* verb = args.argv[0];
    const CliArgs sub{args.argv + 1, args.argc - 1};

    if (strcmp(verb, "add") == 0) {
        HandlerArgs h;
        if (!parse_handler_args("bin add", sub, kBinOptions.data(), kBinOptions.size(), &h)) {
            return;
        }
        wcoord::registry::BinParams params{};
        wcoord::core::GeoPoint p{};
        if (h.rest.argc != 2 || !parse_f64_arg(h.rest.argv[0], &p.lat) || !parse_f64_arg(h.rest.argv[1], &p.lon)) {
            print_error("bin add: expected <lat> <lon>");
            return;
        }
        params.point = p;
        if (!option_u32(h.opts, OptionId::Capacity, &params.capacity_liters)) {
            print_error("bin add: capacity out of range");
            return;
        }
        u32 owner = params.owner.v;
        if (!option_u32(h.opts, OptionId::Owner, &owner)) {
            print_error("bin add: owner out of range");
            return;
        }
        params.owner = wcoord::core::UserId{owner};
        params.code = option_str(h.opts, OptionId::Code);
        const char* category = option_str(h.opts, OptionId::Category);
        if (category != nullptr && !wcoord::core::parse_waste_category(category, &params.category)) {
            print_error("bin add: unknown category");
            return;
        }
        wcoord::core::BinId id{};
        const Status s = engine.register_bin(params, &id);
        if (!wcoord::core::is_ok(s)) {
            print_status_error("bin add", s);
            return;
        }
        printf("bin %llu registered\n", static_cast<unsigned long long>(id.v));
        return;
    }

    u64 raw = 0;
    if (sub.argc == 0 || !parse_u64_arg(sub.argv[0], &raw)) {
        print_error("bin: expected a bin id");
        return;
    }
    const wcoord::core::BinId id{raw};

    if (strcmp(verb, "show") == 0) {
        wcoord::core::Bin b{};
        const Status s = engine.bin(id, &b);
        if (!wcoord::core::is_ok(s)) {
            print_status_error("bin show", s);
            return;
        }
        print_bin(b);
    } else if (strcmp(verb, "rm") == 0) {
        const Status s = engine.deactivate_bin(id);
        if (!wcoord::core::is_ok(s)) {
            print_status_error("bin rm", s);
            return;
        }
        printf("bin %llu deactivated\n", static_cast<unsigned long long>(raw));
    } else if (strcmp(verb, "move") == 0) {
        wcoord::core::GeoPoint p{};
        if (sub.argc != 3 || !parse_f64_arg(sub.argv[1], &p.lat) || !parse_f64_arg(sub.argv[2], &p.lon)) {
            print_error("bin move: expected <id> <lat> <lon>");
            return;
        }
        const Status s = engine.move_bin(id, p);
        if (!wcoord::core::is_ok(s)) {
            print_status_error("bin move", s);
        }
    } else {
        print_error("bin: expected add, show, rm or move");
    }
}

void handle_report(Coordinator& engine, const CliArgs& args) {
    HandlerArgs h;
    if (!parse_handler_args("report", args, kReportOptions.data(), kReportOptions.size(), &h)) {
        return;
    }
    u64 bin = 0;
    wcoord::core::FillLevel fill{};
    if (h.rest.argc != 2 || !parse_u64_arg(h.rest.argv[0], &bin) ||
        !wcoord::core::parse_fill_level(h.rest.argv[1], &fill)) {
        print_error("report: expected <bin> <fill>");
        return;
    }
    u32 reporter = wcoord::core::UserId::invalid().v;
    if (!option_u32(h.opts, OptionId::Reporter, &reporter)) {
        print_error("report: reporter out of range");
        return;
    }
    wcoord::core::WasteReport report{};
    const Status s = engine.report_fill_level(wcoord::core::BinId{bin}, fill, wcoord::core::UserId{reporter},
                                              option_i64(h.opts, OptionId::At, 0), &report);
    if (!wcoord::core::is_ok(s)) {
        print_status_error("report", s);
        return;
    }
    printf("report %llu recorded\n", static_cast<unsigned long long>(report.id.v));
}

void handle_truck(Coordinator& engine, const CliArgs& args) {
    if (args.argc == 0) {
        print_error("truck: expected add, show or status");
        return;
    }
    const char* verb = args.argv[0];
    const CliArgs sub{args.argv + 1, args.argc - 1};

    if (strcmp(verb, "add") == 0) {
        HandlerArgs h;
        if (!parse_handler_args("truck add", sub, kTruckOptions.data(), kTruckOptions.size(), &h)) {
            return;
        }
        if (h.rest.argc != 1) {
            print_error("truck add: expected <plate>");
            return;
        }
        wcoord::core::Truck t{};
        t.id = wcoord::core::TruckId::invalid();
        snprintf(t.license_plate, sizeof(t.license_plate), "%s", h.rest.argv[0]);
        if (!option_u32(h.opts, OptionId::Capacity, &t.capacity_kg)) {
            print_error("truck add: capacity out of range");
            return;
        }
        wcoord::core::TruckId id{};
        const Status s = engine.add_truck(t, &id);
        if (!wcoord::core::is_ok(s)) {
            print_status_error("truck add", s);
            return;
        }
        printf("truck %u registered\n", id.v);
        return;
    }

    u32 raw = 0;
    if (sub.argc == 0 || !parse_u32_arg(sub.argv[0], &raw)) {
        print_error("truck: expected a truck id");
        return;
    }
    const wcoord::core::TruckId id{raw};

    if (strcmp(verb, "show") == 0) {
        wcoord::core::Truck t{};
        const Status s = engine.truck(id, &t);
        if (!wcoord::core::is_ok(s)) {
            print_status_error("truck show", s);
            return;
        }
        printf("truck %u %s  %u kg  %s", t.id.v, t.license_plate, t.capacity_kg,
               wcoord::core::truck_status_name(t.status));
        if (t.current_driver.is_valid()) {
            printf("  driver=%u", t.current_driver.v);
        }
        if (t.has_position) {
            printf("  at (%.6f, %.6f)", t.last_position.lat, t.last_position.lon);
        }
        printf("  %.2f km\n", t.total_distance_km);
    } else if (strcmp(verb, "status") == 0) {
        wcoord::core::TruckStatus status{};
        if (sub.argc != 2 || !wcoord::core::parse_truck_status(sub.argv[1], &status)) {
            print_error("truck status: expected <id> <status>");
            return;
        }
        const Status s = engine.set_truck_status(id, status);
        if (!wcoord::core::is_ok(s)) {
            print_status_error("truck status", s);
        }
    } else {
        print_error("truck: expected add, show or status");
    }
}

void handle_driver(Coordinator& engine, const CliArgs& args) {
    if (args.argc == 0) {
        print_error("driver: expected add, duty, share or freq");
        return;
    }
    const char* verb = args.argv[0];
    const CliArgs sub{args.argv + 1, args.argc - 1};

    if (strcmp(verb, "add") == 0) {
        HandlerArgs h;
        if (!parse_handler_args("driver add", sub, kDriverOptions.data(), kDriverOptions.size(), &h)) {
            return;
        }
        wcoord::core::Driver d{};
        u32 user = 0;
        if (h.rest.argc < 2 || !parse_u32_arg(h.rest.argv[0], &user)) {
            print_error("driver add: expected <user id> <name..>");
            return;
        }
        d.id = wcoord::core::DriverId{user};
        size_t off = 0;
        for (u32 i = 1; i < h.rest.argc && off + 1 < sizeof(d.name); ++i) {
            const int n = snprintf(d.name + off, sizeof(d.name) - off, "%s%s", i > 1 ? " " : "", h.rest.argv[i]);
            if (n < 0) {
                break;
            }
            off += static_cast<size_t>(n);
        }
        if (!option_u32(h.opts, OptionId::Frequency, &d.update_frequency_s)) {
            print_error("driver add: frequency out of range");
            return;
        }
        d.sharing_enabled = option_flag(h.opts, OptionId::Sharing);
        d.on_duty = option_flag(h.opts, OptionId::OnDuty);
        const Status s = engine.add_driver(d);
        if (!wcoord::core::is_ok(s)) {
            print_status_error("driver add", s);
            return;
        }
        printf("driver %u registered\n", d.id.v);
        return;
    }

    u32 raw = 0;
    if (sub.argc != 2 || !parse_u32_arg(sub.argv[0], &raw)) {
        print_error("driver: expected <id> <value>");
        return;
    }
    const wcoord::core::DriverId id{raw};

    Status s{};
    if (strcmp(verb, "duty") == 0 || strcmp(verb, "share") == 0) {
        bool on = false;
        if (!parse_on_off(sub.argv[1], &on)) {
            print_error("driver: expected on or off");
            return;
        }
        s = (verb[0] == 'd') ? engine.set_on_duty(id, on) : engine.set_location_sharing(id, on);
    } else if (strcmp(verb, "freq") == 0) {
        u32 seconds = 0;
        if (!parse_u32_arg(sub.argv[1], &seconds)) {
            print_error("driver freq: expected seconds");
            return;
        }
        s = engine.set_update_frequency(id, seconds);
    } else {
        print_error("driver: expected add, duty, share or freq");
        return;
    }
    if (!wcoord::core::is_ok(s)) {
        print_status_error(verb, s);
    }
}

void handle_pair(Coordinator& engine, const CliArgs& args) {
    u32 driver = 0;
    if (args.argc != 2 || !parse_u32_arg(args.argv[0], &driver)) {
        print_error("pair: expected <driver> <truck|none>");
        return;
    }
    Status s{};
    if (strcmp(args.argv[1], "none") == 0) {
        s = engine.unassign_driver(wcoord::core::DriverId{driver});
    } else {
        u32 truck = 0;
        if (!parse_u32_arg(args.argv[1], &truck)) {
            print_error("pair: expected <driver> <truck|none>");
            return;
        }
        s = engine.assign_driver(wcoord::core::DriverId{driver}, wcoord::core::TruckId{truck});
    }
    if (!wcoord::core::is_ok(s)) {
        print_status_error("pair", s);
    }
}

void handle_loc(Coordinator& engine, const CliArgs& args) {
    HandlerArgs h;
    if (!parse_handler_args("loc", args, kLocOptions.data(), kLocOptions.size(), &h)) {
        return;
    }
    u32 driver = 0;
    wcoord::core::LocationSample sample{};
    if (h.rest.argc != 3 || !parse_u32_arg(h.rest.argv[0], &driver) ||
        !parse_f64_arg(h.rest.argv[1], &sample.point.lat) || !parse_f64_arg(h.rest.argv[2], &sample.point.lon)) {
        print_error("loc: expected <driver> <lat> <lon>");
        return;
    }
    sample.driver = wcoord::core::DriverId{driver};
    sample.speed_kmh = option_f64(h.opts, OptionId::Speed, 0.0);
    sample.accuracy_m = option_f64(h.opts, OptionId::Accuracy, 0.0);
    sample.heading_deg = option_f64(h.opts, OptionId::Heading, 0.0);
    sample.battery_pct = option_i64(h.opts, OptionId::Battery, -1);
    sample.recorded_at = option_i64(h.opts, OptionId::At, 0);
    if (sample.recorded_at == 0) {
        sample.recorded_at = wcoord::core::unix_now();
    }
    const Status s = engine.ingest_location(sample.driver, sample);
    if (!wcoord::core::is_ok(s)) {
        print_status_error("loc", s);
    }
}

void handle_optimize(Coordinator& engine, const CliArgs& args) {
    HandlerArgs h;
    if (!parse_handler_args("optimize", args, kOptimizeOptions.data(), kOptimizeOptions.size(), &h)) {
        return;
    }
    wcoord::routing::OptimizeRequest req{};
    const bool has_lat = option_flag(h.opts, OptionId::Lat);
    const bool has_lon = option_flag(h.opts, OptionId::Lon);
    if (has_lat != has_lon) {
        print_error("optimize: --lat and --lon go together");
        return;
    }
    req.has_seed = has_lat;
    req.seed.lat = option_f64(h.opts, OptionId::Lat, 0.0);
    req.seed.lon = option_f64(h.opts, OptionId::Lon, 0.0);
    req.radius_m = option_f64(h.opts, OptionId::Radius, 0.0);

    wcoord::routing::OptimizeResult result{};
    const Status s = engine.run_optimization(req, &result);
    if (!wcoord::core::is_ok(s) && s.code != wcoord::core::StatusCode::SchedulingConflict) {
        print_status_error("optimize", s);
        return;
    }
    printf("%zu routes committed, %zu clusters unassigned\n", result.routes.size(), result.unassigned.size());
    for (wcoord::core::RouteId id : result.routes) {
        wcoord::core::Route r{};
        if (wcoord::core::is_ok(engine.route_detail(id, &r))) {
            print_route(r);
        }
    }
    if (s.code == wcoord::core::StatusCode::SchedulingConflict) {
        printf("%u clusters lost to concurrent runs; retry later\n", result.conflicts);
    }
}

void handle_assign(Coordinator& engine, const CliArgs& args) {
    u32 driver = 0;
    u32 truck = 0;
    if (args.argc < 3 || !parse_u32_arg(args.argv[0], &driver) || !parse_u32_arg(args.argv[1], &truck)) {
        print_error("assign: expected <driver> <truck> <bin..>");
        return;
    }
    std::vector<wcoord::core::BinId> bins;
    for (u32 i = 2; i < args.argc; ++i) {
        u64 bin = 0;
        if (!parse_u64_arg(args.argv[i], &bin)) {
            print_error("assign: bad bin id");
            return;
        }
        bins.push_back(wcoord::core::BinId{bin});
    }
    wcoord::core::RouteId route{};
    const Status s = engine.assign_route(wcoord::core::DriverId{driver}, wcoord::core::TruckId{truck}, bins,
                                         wcoord::core::RouteSchedule{}, &route);
    if (!wcoord::core::is_ok(s)) {
        print_status_error("assign", s);
        return;
    }
    printf("route %llu assigned\n", static_cast<unsigned long long>(route.v));
}

bool parse_route_arg(const char* context, const CliArgs& args, u32 expected, wcoord::core::RouteId* out) {
    u64 raw = 0;
    if (args.argc != expected || !parse_u64_arg(args.argv[0], &raw)) {
        fprintf(stderr, "error: %s: expected a route id\n", context);
        return false;
    }
    *out = wcoord::core::RouteId{raw};
    return true;
}

void handle_start(Coordinator& engine, const CliArgs& args) {
    wcoord::core::RouteId route{};
    if (!parse_route_arg("start", args, 1, &route)) {
        return;
    }
    const Status s = engine.start_route(route);
    if (!wcoord::core::is_ok(s)) {
        print_status_error("start", s);
    }
}

void handle_collect(Coordinator& engine, const CliArgs& args) {
    wcoord::core::RouteId route{};
    if (!parse_route_arg("collect", args, 3, &route)) {
        return;
    }
    u64 bin = 0;
    double kg = 0.0;
    if (!parse_u64_arg(args.argv[1], &bin) || !parse_f64_arg(args.argv[2], &kg)) {
        print_error("collect: expected <route> <bin> <kg>");
        return;
    }
    const Status s = engine.mark_stop_collected(route, wcoord::core::BinId{bin}, kg);
    if (!wcoord::core::is_ok(s)) {
        print_status_error("collect", s);
        return;
    }
    wcoord::core::Route r{};
    if (wcoord::core::is_ok(engine.route_detail(route, &r)) && r.status == wcoord::core::RouteStatus::Completed) {
        printf("all stops collected; %s completed (efficiency %.1f)\n", r.code, r.efficiency_score);
    }
}

void handle_close(Coordinator& engine, const CliArgs& args) {
    HandlerArgs h;
    if (!parse_handler_args("close", args, kCloseOptions.data(), kCloseOptions.size(), &h)) {
        return;
    }
    wcoord::core::RouteId route{};
    if (!parse_route_arg("close", h.rest, 1, &route)) {
        return;
    }
    const Status s = engine.complete_route(route, option_f64(h.opts, OptionId::Distance, -1.0));
    if (!wcoord::core::is_ok(s)) {
        print_status_error("close", s);
        return;
    }
    wcoord::core::Route r{};
    if (wcoord::core::is_ok(engine.route_detail(route, &r))) {
        print_route(r);
    }
}

void handle_cancel(Coordinator& engine, const CliArgs& args) {
    wcoord::core::RouteId route{};
    if (!parse_route_arg("cancel", args, 1, &route)) {
        return;
    }
    const Status s = engine.cancel_route(route);
    if (!wcoord::core::is_ok(s)) {
        print_status_error("cancel", s);
    }
}

void handle_route(Coordinator& engine, const CliArgs& args) {
    wcoord::core::RouteId route{};
    if (!parse_route_arg("route", args, 1, &route)) {
        return;
    }
    wcoord::core::Route r{};
    const Status s = engine.route_detail(route, &r);
    if (!wcoord::core::is_ok(s)) {
        print_status_error("route", s);
        return;
    }
    print_route(r);
}

void handle_routes(Coordinator& engine) {
    std::vector<wcoord::core::Route> routes;
    const Status s = engine.active_routes(&routes);
    if (!wcoord::core::is_ok(s)) {
        print_status_error("routes", s);
        return;
    }
    if (routes.empty()) {
        printf("No active routes\n");
        return;
    }
    for (const wcoord::core::Route& r : routes) {
        print_route(r);
    }
}

void handle_urgent(Coordinator& engine) {
    std::vector<wcoord::registry::UrgentBin> bins;
    const Status s = engine.urgent_bins(0, &bins);
    if (!wcoord::core::is_ok(s)) {
        print_status_error("urgent", s);
        return;
    }
    if (bins.empty()) {
        printf("No bins need collection\n");
        return;
    }
    for (const wcoord::registry::UrgentBin& u : bins) {
        printf("%-9s ", wcoord::core::priority_tier_name(u.tier));
        print_bin(u.bin);
    }
}

void handle_nearby(Coordinator& engine, const CliArgs& args) {
    HandlerArgs h;
    if (!parse_handler_args("nearby", args, kNearbyOptions.data(), kNearbyOptions.size(), &h)) {
        return;
    }
    wcoord::core::GeoPoint p{};
    if (h.rest.argc != 2 || !parse_f64_arg(h.rest.argv[0], &p.lat) || !parse_f64_arg(h.rest.argv[1], &p.lon)) {
        print_error("nearby: expected <lat> <lon>");
        return;
    }
    wcoord::spatial::NearbyFilter filter{};
    filter.needs_collection_only = !option_flag(h.opts, OptionId::All);
    filter.unclaimed_only = option_flag(h.opts, OptionId::Unclaimed);

    std::vector<wcoord::spatial::NearbyHit> hits;
    const Status s = engine.nearby_bins(p, option_f64(h.opts, OptionId::Radius, 1000.0), filter, &hits);
    if (!wcoord::core::is_ok(s)) {
        print_status_error("nearby", s);
        return;
    }
    if (hits.empty()) {
        printf("No bins in range\n");
        return;
    }
    for (const wcoord::spatial::NearbyHit& hit : hits) {
        printf("%8.1f m  ", hit.distance_m);
        print_bin(hit.bin);
    }
}

void handle_drivers(Coordinator& engine) {
    std::vector<wcoord::fleet::DriverStatus> drivers;
    const Status s = engine.active_drivers(&drivers);
    if (!wcoord::core::is_ok(s)) {
        print_status_error("drivers", s);
        return;
    }
    if (drivers.empty()) {
        printf("No active drivers\n");
        return;
    }
    for (const wcoord::fleet::DriverStatus& d : drivers) {
        printf("driver %u %s", d.driver.id.v, d.driver.name);
        if (d.truck.is_valid()) {
            printf("  truck=%u", d.truck.v);
        }
        if (d.has_position) {
            printf("  (%.6f, %.6f) at %lld", d.position.lat, d.position.lon, static_cast<long long>(d.position_at));
        } else {
            printf("  no position");
        }
        printf("\n");
    }
}

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    wcoord::core::log_init_from_env();

    // Install signal handler without SA_RESTART so a blocked read returns.
    struct sigaction sa{};
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);

    wcoord::service::EngineConfig cfg = wcoord::service::EngineConfig::from_env();

    HandlerArgs h;
    const CliArgs main_args{argc > 1 ? argv + 1 : nullptr, argc > 1 ? static_cast<u32>(argc - 1) : 0};
    if (!parse_handler_args("arguments", main_args, kMainOptions.data(), kMainOptions.size(), &h)) {
        return EXIT_FAILURE;
    }
    if (h.rest.argc != 0) {
        print_error("usage: wcoord [-d db] [-i seconds] [-v]");
        return EXIT_FAILURE;
    }
    if (const char* db = option_str(h.opts, OptionId::Db)) {
        cfg.db.path = db;
    }
    const i64 interval = option_i64(h.opts, OptionId::Interval, cfg.scheduler.optimize_interval_s);
    if (interval < 0 || interval > 86400) {
        print_error("interval must be within [0, 86400] seconds");
        return EXIT_FAILURE;
    }
    cfg.scheduler.optimize_interval_s = static_cast<u32>(interval);
    if (option_flag(h.opts, OptionId::Verbose)) {
        wcoord::core::log_set_level(wcoord::core::LogLevel::Info);
    }

    Coordinator engine(cfg);
    Status s = engine.open();
    if (!wcoord::core::is_ok(s)) {
        print_status_error("engine open", s);
        return EXIT_FAILURE;
    }

    // Interval 0 leaves optimization to the optimize command.
    wcoord::service::Scheduler scheduler(&engine, cfg.scheduler);
    if (cfg.scheduler.optimize_interval_s > 0) {
        s = scheduler.start();
        if (!wcoord::core::is_ok(s)) {
            print_status_error("scheduler start", s);
        }
    }

    const wcoord::cli::CommandSpec commands[] = {
        {wcoord::cli::CommandId::Help, "help"},
        {wcoord::cli::CommandId::Bin, "bin"},
        {wcoord::cli::CommandId::Report, "report"},
        {wcoord::cli::CommandId::Truck, "truck"},
        {wcoord::cli::CommandId::Driver, "driver"},
        {wcoord::cli::CommandId::Pair, "pair"},
        {wcoord::cli::CommandId::Loc, "loc"},
        {wcoord::cli::CommandId::Optimize, "optimize"},
        {wcoord::cli::CommandId::Assign, "assign"},
        {wcoord::cli::CommandId::Start, "start"},
        {wcoord::cli::CommandId::Collect, "collect"},
        {wcoord::cli::CommandId::Close, "close"},
        {wcoord::cli::CommandId::Cancel, "cancel"},
        {wcoord::cli::CommandId::Route, "route"},
        {wcoord::cli::CommandId::Routes, "routes"},
        {wcoord::cli::CommandId::Urgent, "urgent"},
        {wcoord::cli::CommandId::Nearby, "nearby"},
        {wcoord::cli::CommandId::Drivers, "drivers"},
        {wcoord::cli::CommandId::Quit, "q"},
        {wcoord::cli::CommandId::Quit, "quit"},
        {wcoord::cli::CommandId::Quit, "exit"},
    };
    const u32 command_count = sizeof(commands) / sizeof(commands[0]);

    printf("wcoord - waste collection coordinator\n");
    printf("db=%s\n", (cfg.db.path != nullptr && cfg.db.path[0] != '\0') ? cfg.db.path : ":memory:");
    if (cfg.scheduler.optimize_interval_s > 0) {
        printf("optimizing every %u s\n", cfg.scheduler.optimize_interval_s);
    }
    printf("Type 'help' for commands, 'q' to quit\n\n");

    while (g_running) {
        printf("wcoord> ");
        fflush(stdout);

        char line[1024];
        if (!fgets(line, sizeof(line), stdin)) {
            break;  // EOF (Ctrl-D) or interrupted
        }

        int cmd_argc = 0;
        char* cmd_argv[32];
        parse_line(line, &cmd_argc, cmd_argv, 32);
        if (cmd_argc == 0) {
            continue;
        }

        wcoord::cli::CommandInvocation cmd;
        u32 consumed = 0;
        const CliArgs args{cmd_argv, static_cast<u32>(cmd_argc)};
        s = wcoord::cli::parse_command(args, commands, command_count, &cmd, &consumed);
        if (!wcoord::core::is_ok(s)) {
            printf("error: unknown command\n");
            free_argv(cmd_argv, cmd_argc);
            continue;
        }

        switch (cmd.id) {
            case wcoord::cli::CommandId::Help: handle_help(); break;
            case wcoord::cli::CommandId::Bin: handle_bin(engine, cmd.args); break;
            case wcoord::cli::CommandId::Report: handle_report(engine, cmd.args); break;
            case wcoord::cli::CommandId::Truck: handle_truck(engine, cmd.args); break;
            case wcoord::cli::CommandId::Driver: handle_driver(engine, cmd.args); break;
            case wcoord::cli::CommandId::Pair: handle_pair(engine, cmd.args); break;
            case wcoord::cli::CommandId::Loc: handle_loc(engine, cmd.args); break;
            case wcoord::cli::CommandId::Optimize: handle_optimize(engine, cmd.args); break;
            case wcoord::cli::CommandId::Assign: handle_assign(engine, cmd.args); break;
            case wcoord::cli::CommandId::Start: handle_start(engine, cmd.args); break;
            case wcoord::cli::CommandId::Collect: handle_collect(engine, cmd.args); break;
            case wcoord::cli::CommandId::Close: handle_close(engine, cmd.args); break;
            case wcoord::cli::CommandId::Cancel: handle_cancel(engine, cmd.args); break;
            case wcoord::cli::CommandId::Route: handle_route(engine, cmd.args); break;
            case wcoord::cli::CommandId::Routes: handle_routes(engine); break;
            case wcoord::cli::CommandId::Urgent: handle_urgent(engine); break;
            case wcoord::cli::CommandId::Nearby: handle_nearby(engine, cmd.args); break;
            case wcoord::cli::CommandId::Drivers: handle_drivers(engine); break;
            case wcoord::cli::CommandId::Quit: g_running = 0; break;
            default: printf("error: unknown command\n"); break;
        }

        free_argv(cmd_argv, cmd_argc);

        if (!engine.healthy()) {
            print_error("journal unavailable; shutting down");
            break;
        }
    }

    printf("Goodbye!\n");
    scheduler.stop();
    s = engine.close();
    if (!wcoord::core::is_ok(s)) {
        print_status_error("engine close", s);
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
