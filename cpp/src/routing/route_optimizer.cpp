#include "wcoord/routing/route_optimizer.hpp"

#include <algorithm>
#include <functional>
#include <limits>

#include "wcoord/core/collection.hpp"
#include "wcoord/core/geo.hpp"
#include "wcoord/core/log.hpp"

namespace wcoord::routing {

using namespace wcoord::core;

namespace {
    [[nodiscard]] Status routing_status(StatusCode code, u32 aux = 0) noexcept {
        return make_status(StatusDomain::Routing, code, aux);
    }

    [[nodiscard]] double target_capacity(const std::vector<double>& capacities, std::size_t k,
                                         double fallback) noexcept {
        if (k < capacities.size()) {
            return capacities[k];
        }
        return fallback > 0.0 ? fallback : std::numeric_limits<double>::infinity();
    }

    [[nodiscard]] GeoPoint cluster_centroid(const std::vector<Bin>& bins) noexcept {
        std::vector<GeoPoint> points;
        points.reserve(bins.size());
        for (const Bin& b : bins) {
            points.push_back(b.point);
        }
        return centroid(points.data(), points.size());
    }
} // namespace

void rank_bins(std::vector<Bin>* bins, Timestamp now, Timestamp urgent_age_s) noexcept {
    std::sort(bins->begin(), bins->end(), [now, urgent_age_s](const Bin& a, const Bin& b) {
        return priority_before(priority_key(a, now, urgent_age_s), priority_key(b, now, urgent_age_s));
    });
}

void sequence_stops(GeoPoint start, std::vector<Bin>* bins) noexcept {
    std::vector<Bin> rest = *bins;
    bins->clear();
    GeoPoint tail = start;
    while (!rest.empty()) {
        std::size_t best = 0;
        double best_d = geodesic_distance_m(tail, rest[0].point);
        for (std::size_t i = 1; i < rest.size(); ++i) {
            const double d = geodesic_distance_m(tail, rest[i].point);
            if (d < best_d) {
                best = i;
                best_d = d;
            }
        }
        tail = rest[best].point;
        bins->push_back(rest[best]);
        rest.erase(rest.begin() + static_cast<std::ptrdiff_t>(best));
    }
}

RouteOptimizer::RouteOptimizer(wcoord::spatial::SpatialIndex* index,
                               wcoord::fleet::FleetTracker* fleet,
                               RouteLifecycle* lifecycle,
                               const OptimizerConfig& cfg) noexcept
    : index_(index), fleet_(fleet), lifecycle_(lifecycle), cfg_(cfg) {
    if (cfg_.max_claim_attempts == 0) {
        cfg_.max_claim_attempts = 1;
    }
}

Status RouteOptimizer::plan(const std::vector<Bin>& eligible,
                            const std::vector<wcoord::fleet::FleetUnit>& trucks,
                            const OptimizeRequest& req,
                            Plan* out) const noexcept {
    if (out == nullptr) {
        return routing_status(StatusCode::Invalid);
    }
    out->assigned.clear();
    out->unassigned.clear();

    const Timestamp now = req.now != 0 ? req.now : unix_now();

    std::vector<Bin> ranked;
    ranked.reserve(eligible.size());
    for (const Bin& b : eligible) {
        if (bin_eligible(b) && !b.claimed_by.is_valid()) {
            ranked.push_back(b);
        }
    }
    if (ranked.empty()) {
        return ok_status();
    }
    rank_bins(&ranked, now, cfg_.urgent_age_s);

    std::vector<double> capacities;
    capacities.reserve(trucks.size());
    for (const auto& unit : trucks) {
        capacities.push_back(static_cast<double>(unit.truck.capacity_kg));
    }
    std::sort(capacities.begin(), capacities.end(), std::greater<double>());

    // Clustering: seed from the best unassigned bin, then admit the
    // unassigned bins within the radius of the seed in priority order until
    // the next one would not fit.
    std::vector<Cluster> clusters;
    std::vector<bool> taken(ranked.size(), false);
    for (std::size_t seed = 0; seed < ranked.size(); ++seed) {
        if (taken[seed]) {
            continue;
        }
        const double target = target_capacity(capacities, clusters.size(), cfg_.fallback_capacity_kg);
        const GeoPoint origin = ranked[seed].point;

        Cluster c{};
        c.bins.push_back(ranked[seed]);
        c.mass_kg = estimated_mass_kg(ranked[seed], cfg_.density_kg_per_liter);
        taken[seed] = true;

        for (std::size_t i = seed + 1; i < ranked.size(); ++i) {
            if (taken[i] || geodesic_distance_m(origin, ranked[i].point) > cfg_.cluster_radius_m) {
                continue;
            }
            const double m = estimated_mass_kg(ranked[i], cfg_.density_kg_per_liter);
            if (c.mass_kg + m > target) {
                break;
            }
            c.mass_kg += m;
            c.bins.push_back(ranked[i]);
            taken[i] = true;
        }

        c.centroid = cluster_centroid(c.bins);
        clusters.push_back(std::move(c));
    }

    // Assignment: heaviest cluster first, nearest unused truck that fits.
    std::stable_sort(clusters.begin(), clusters.end(), [](const Cluster& a, const Cluster& b) {
        return a.mass_kg > b.mass_kg;
    });

    std::vector<bool> used(trucks.size(), false);
    for (Cluster& c : clusters) {
        std::size_t best = trucks.size();
        double best_d = std::numeric_limits<double>::infinity();
        bool best_positioned = false;
        for (std::size_t i = 0; i < trucks.size(); ++i) {
            const auto& t = trucks[i].truck;
            if (used[i] || static_cast<double>(t.capacity_kg) < c.mass_kg) {
                continue;
            }
            const bool positioned = t.has_position;
            const double d = positioned ? geodesic_distance_m(t.last_position, c.centroid)
                                        : std::numeric_limits<double>::infinity();
            bool better = false;
            if (best == trucks.size()) {
                better = true;
            } else if (positioned != best_positioned) {
                better = positioned;
            } else if (d != best_d) {
                better = d < best_d;
            } else {
                better = t.id.v < trucks[best].truck.id.v;
            }
            if (better) {
                best = i;
                best_d = d;
                best_positioned = positioned;
            }
        }

        GeoPoint start = req.has_seed ? req.seed : c.bins.front().point;
        if (best == trucks.size()) {
            sequence_stops(start, &c.bins);
            out->unassigned.push_back(std::move(c));
            continue;
        }

        used[best] = true;
        c.truck = trucks[best].truck.id;
        c.driver = trucks[best].driver;
        if (trucks[best].truck.has_position) {
            start = trucks[best].truck.last_position;
        }
        sequence_stops(start, &c.bins);
        out->assigned.push_back(std::move(c));
    }
    return ok_status();
}

Status RouteOptimizer::candidates(const OptimizeRequest& req, std::vector<Bin>* out) const noexcept {
    wcoord::spatial::NearbyFilter filter{};
    filter.active_only = true;
    filter.needs_collection_only = true;
    filter.unclaimed_only = true;

    if (req.has_seed && req.radius_m > 0.0) {
        std::vector<wcoord::spatial::NearbyHit> hits;
        const Status s = index_->nearby(req.seed, req.radius_m, filter, &hits);
        if (!is_ok(s)) {
            return s;
        }
        out->clear();
        out->reserve(hits.size());
        for (const auto& h : hits) {
            out->push_back(h.bin);
        }
        return ok_status();
    }
    return index_->select(filter, out);
}

Status RouteOptimizer::run(const OptimizeRequest& req, OptimizeResult* out) noexcept {
    if (out == nullptr) {
        return routing_status(StatusCode::Invalid);
    }
    *out = OptimizeResult{};

    OptimizeRequest pass_req = req;
    if (pass_req.now == 0) {
        pass_req.now = unix_now();
    }

    for (u32 attempt = 0; attempt < cfg_.max_claim_attempts; ++attempt) {
        out->passes += 1;

        std::vector<Bin> eligible;
        Status s = candidates(pass_req, &eligible);
        if (!is_ok(s)) {
            return s;
        }
        std::vector<wcoord::fleet::FleetUnit> trucks;
        s = fleet_->available_trucks(&trucks);
        if (!is_ok(s)) {
            return s;
        }

        Plan p{};
        s = plan(eligible, trucks, pass_req, &p);
        if (!is_ok(s)) {
            return s;
        }

        u32 lost = 0;
        for (const Cluster& c : p.assigned) {
            RouteId route{};
            s = lifecycle_->create(pass_req.schedule, pass_req.now, &route);
            if (!is_ok(s)) {
                return s;
            }

            std::vector<BinId> ids;
            ids.reserve(c.bins.size());
            for (const Bin& b : c.bins) {
                ids.push_back(b.id);
            }
            s = lifecycle_->assign(route, c.driver, c.truck, ids.data(), static_cast<u32>(ids.size()), true,
                                   pass_req.now);
            if (is_ok(s)) {
                out->routes.push_back(route);
                continue;
            }
            if (is_fatal(s)) {
                return s;
            }

            // Lost a bin or the truck to another run (or the bin changed
            // since the snapshot); drop the empty route and retry next pass.
            log_debug("route %llu lost at commit (%s)", static_cast<unsigned long long>(route.v),
                      status_code_name(s.code));
            ++lost;
            const Status cs = lifecycle_->cancel(route, pass_req.now);
            if (!is_ok(cs)) {
                log_status("drop uncommitted route", cs);
                if (is_fatal(cs)) {
                    return cs;
                }
            }
        }

        out->unassigned = std::move(p.unassigned);
        out->conflicts = lost;
        if (lost == 0) {
            return ok_status();
        }
    }

    log_warn("optimizer gave up on %u clusters after %u passes", out->conflicts, out->passes);
    return routing_status(StatusCode::SchedulingConflict, out->conflicts);
}

} // namespace wcoord::routing
