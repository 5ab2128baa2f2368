#include "wcoord/registry/bin_registry.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

#include "wcoord/core/log.hpp"

namespace wcoord::registry {

using namespace wcoord::core;

namespace {
    [[nodiscard]] Status registry_status(StatusCode code, u32 aux = 0) noexcept {
        return make_status(StatusDomain::Registry, code, aux);
    }

    void set_code(Bin* b, const char* code) noexcept {
        std::memset(b->code, 0, sizeof(b->code));
        if (code != nullptr && code[0] != '\0') {
            std::strncpy(b->code, code, sizeof(b->code) - 1);
        } else {
            std::snprintf(b->code, sizeof(b->code), "BIN-%06llu", static_cast<unsigned long long>(b->id.v));
        }
    }
} // namespace

BinRegistry::BinRegistry(wcoord::db::Database* db,
                         wcoord::spatial::SpatialIndex* index,
                         EventBus* events,
                         const RegistryConfig& cfg) noexcept
    : db_(db), index_(index), events_(events), cfg_(cfg) {}

Status BinRegistry::seed_ids() noexcept {
    if (db_ == nullptr) {
        return ok_status();
    }
    u64 max_bin = 0;
    u64 max_report = 0;
    Status s = db_->max_id(wcoord::db::TableId::Bins, &max_bin);
    if (!is_ok(s)) {
        return s;
    }
    s = db_->max_id(wcoord::db::TableId::WasteReports, &max_report);
    if (!is_ok(s)) {
        return s;
    }
    next_bin_.store(max_bin + 1);
    next_report_.store(max_report + 1);
    return ok_status();
}

BinRegistry::Entry* BinRegistry::find_locked(BinId id) const noexcept {
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : it->second.get();
}

// Journal first, then memory, then index. Caller holds the entry mutex.
Status BinRegistry::commit_locked(Entry* e, const Bin& next) noexcept {
    if (db_ != nullptr) {
        const Status s = db_->put_bin(next);
        if (!is_ok(s)) {
            return s;
        }
    }
    e->bin = next;
    if (index_ != nullptr) {
        index_->upsert(next);
    }
    return ok_status();
}

Status BinRegistry::register_bin(const BinParams& params, BinId* out) noexcept {
    if (out == nullptr) {
        return registry_status(StatusCode::Invalid);
    }
    if (params.capacity_liters < kMinBinCapacityLiters || params.capacity_liters > kMaxBinCapacityLiters) {
        return registry_status(StatusCode::Invalid);
    }
    if (!geo_point_valid(params.point)) {
        return registry_status(StatusCode::Invalid);
    }

    auto entry = std::make_unique<Entry>();
    Bin& b = entry->bin;
    b.id = BinId{next_bin_.fetch_add(1)};
    b.owner = params.owner;
    set_code(&b, params.code);
    b.capacity_liters = params.capacity_liters;
    b.category = params.category;
    b.fill = FillLevel::Empty;
    b.active = true;
    b.needs_collection = needs_collection(b.fill, b.active);
    b.point = params.point;
    b.created_at = params.created_at != 0 ? params.created_at : unix_now();
    b.updated_at = b.created_at;

    if (db_ != nullptr) {
        const Status s = db_->put_bin(b);
        if (!is_ok(s)) {
            log_status("register bin", s);
            return s;
        }
    }

    const Bin snapshot = b;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_.emplace(snapshot.id, std::move(entry));
        if (index_ != nullptr) {
            index_->upsert(snapshot);
        }
    }

    log_debug("registered bin %llu (%s)", static_cast<unsigned long long>(snapshot.id.v), snapshot.code);
    *out = snapshot.id;
    return ok_status();
}

Status BinRegistry::deactivate(BinId id, Timestamp now) noexcept {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    Entry* e = find_locked(id);
    if (e == nullptr) {
        return registry_status(StatusCode::NotFound);
    }
    std::lock_guard<std::mutex> entry_lock(e->mutex);
    if (!e->bin.active) {
        return registry_status(StatusCode::NotFound);
    }

    Bin next = e->bin;
    next.active = false;
    next.needs_collection = needs_collection(next.fill, next.active);
    next.deleted_at = now;
    next.updated_at = now;
    return commit_locked(e, next);
}

Status BinRegistry::move(BinId id, GeoPoint point, Timestamp now) noexcept {
    if (!geo_point_valid(point)) {
        return registry_status(StatusCode::Invalid);
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    Entry* e = find_locked(id);
    if (e == nullptr) {
        return registry_status(StatusCode::NotFound);
    }
    std::lock_guard<std::mutex> entry_lock(e->mutex);
    if (!e->bin.active) {
        return registry_status(StatusCode::NotFound);
    }

    Bin next = e->bin;
    next.point = point;
    next.updated_at = now;
    return commit_locked(e, next);
}

Status BinRegistry::report(BinId id, FillLevel fill, UserId reporter, Timestamp reported_at,
                           WasteReport* out) noexcept {
    if (static_cast<u8>(fill) > static_cast<u8>(FillLevel::Full)) {
        return registry_status(StatusCode::Invalid);
    }
    if (reported_at == 0) {
        reported_at = unix_now();
    }

    bool became_eligible = false;
    Bin snapshot{};
    WasteReport rep{};
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        Entry* e = find_locked(id);
        if (e == nullptr) {
            return registry_status(StatusCode::NotFound);
        }
        std::lock_guard<std::mutex> entry_lock(e->mutex);
        if (!e->bin.active) {
            return registry_status(StatusCode::NotFound);
        }
        if (e->reported_at.count(reported_at) != 0) {
            return registry_status(StatusCode::DuplicateReport);
        }

        rep.id = ReportId{next_report_.fetch_add(1)};
        rep.bin = id;
        rep.reporter = reporter;
        rep.fill = fill;
        rep.reported_at = reported_at;

        Bin next = e->bin;
        if (fill > next.fill) {
            next.fill = fill;
        }
        next.needs_collection = needs_collection(next.fill, next.active);
        next.last_reported = std::max(next.last_reported, reported_at);
        next.updated_at = reported_at;

        if (db_ != nullptr) {
            Status s = db_->record_report(rep, next);
            if (!is_ok(s)) {
                if (s.code == StatusCode::DuplicateReport) {
                    s.domain = StatusDomain::Registry;
                }
                return s;
            }
        }

        became_eligible = !e->bin.needs_collection && next.needs_collection;
        e->bin = next;
        if (e->history.size() >= kReportHistory) {
            e->history.erase(e->history.begin());
        }
        e->history.push_back(rep);
        e->reported_at.insert(reported_at);
        if (index_ != nullptr) {
            index_->upsert(next);
        }
        snapshot = next;
    }

    if (became_eligible) {
        log_info("bin %llu needs collection", static_cast<unsigned long long>(id.v));
        if (events_ != nullptr) {
            Event ev{};
            ev.kind = EventKind::BinEligible;
            ev.bin = id;
            ev.fill = snapshot.fill;
            ev.at = reported_at;
            events_->publish(ev);
        }
    }

    if (out != nullptr) {
        *out = rep;
    }
    return ok_status();
}

Status BinRegistry::mark_collected(BinId id, RouteId route, Timestamp now) noexcept {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    Entry* e = find_locked(id);
    if (e == nullptr) {
        return registry_status(StatusCode::NotFound);
    }
    std::lock_guard<std::mutex> entry_lock(e->mutex);
    if (e->bin.claimed_by != route) {
        return registry_status(StatusCode::SchedulingConflict);
    }

    // Inactive bins still get emptied: the route held the claim before the
    // soft delete.
    Bin next = e->bin;
    next.fill = FillLevel::Empty;
    next.needs_collection = needs_collection(next.fill, next.active);
    next.claimed_by = RouteId::invalid();
    next.updated_at = now;
    return commit_locked(e, next);
}

Status BinRegistry::claim(RouteId route, const BinId* bins, u32 count, bool require_eligible,
                          const ClaimLimit& limit, double* mass_kg) noexcept {
    if (!route.is_valid() || bins == nullptr || count == 0) {
        return registry_status(StatusCode::Invalid);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::vector<Entry*> batch;
    batch.reserve(count);
    for (u32 i = 0; i < count; ++i) {
        Entry* e = find_locked(bins[i]);
        if (e == nullptr || !e->bin.active) {
            return registry_status(StatusCode::SchedulingConflict, i);
        }
        if (std::find(batch.begin(), batch.end(), e) != batch.end()) {
            return registry_status(StatusCode::Invalid, i);
        }
        if (e->bin.claimed_by.is_valid() && e->bin.claimed_by != route) {
            return registry_status(StatusCode::SchedulingConflict, i);
        }
        if (require_eligible && !bin_eligible(e->bin)) {
            return registry_status(StatusCode::SchedulingConflict, i);
        }
        batch.push_back(e);
    }

    // Reports take the shared lock, so these fills cannot change before the
    // claims land.
    double mass = 0.0;
    for (const Entry* e : batch) {
        mass += estimated_mass_kg(e->bin, limit.density_kg_per_liter);
    }
    if (limit.density_kg_per_liter > 0.0 && mass > limit.max_mass_kg) {
        return registry_status(StatusCode::CapacityExceeded);
    }
    if (mass_kg != nullptr) {
        *mass_kg = mass;
    }

    // Claims are engine state; the journal records them as route stops.
    for (Entry* e : batch) {
        e->bin.claimed_by = route;
        if (index_ != nullptr) {
            index_->upsert(e->bin);
        }
    }
    return ok_status();
}

void BinRegistry::release(RouteId route, const BinId* bins, u32 count) noexcept {
    if (bins == nullptr) {
        return;
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (u32 i = 0; i < count; ++i) {
        Entry* e = find_locked(bins[i]);
        if (e == nullptr) {
            continue;
        }
        std::lock_guard<std::mutex> entry_lock(e->mutex);
        if (e->bin.claimed_by != route) {
            continue;
        }
        e->bin.claimed_by = RouteId::invalid();
        if (index_ != nullptr) {
            index_->upsert(e->bin);
        }
    }
}

Status BinRegistry::get(BinId id, Bin* out) const noexcept {
    if (out == nullptr) {
        return registry_status(StatusCode::Invalid);
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    Entry* e = find_locked(id);
    if (e == nullptr) {
        return registry_status(StatusCode::NotFound);
    }
    std::lock_guard<std::mutex> entry_lock(e->mutex);
    if (!e->bin.active) {
        return registry_status(StatusCode::NotFound);
    }
    *out = e->bin;
    return ok_status();
}

Status BinRegistry::reports(BinId id, std::vector<WasteReport>* out) const noexcept {
    if (out == nullptr) {
        return registry_status(StatusCode::Invalid);
    }
    out->clear();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    Entry* e = find_locked(id);
    if (e == nullptr) {
        return registry_status(StatusCode::NotFound);
    }
    std::lock_guard<std::mutex> entry_lock(e->mutex);
    out->assign(e->history.rbegin(), e->history.rend());
    return ok_status();
}

Status BinRegistry::eligible(std::vector<Bin>* out) const noexcept {
    if (out == nullptr) {
        return registry_status(StatusCode::Invalid);
    }
    out->clear();
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [id, e] : entries_) {
            (void)id;
            std::lock_guard<std::mutex> entry_lock(e->mutex);
            if (bin_eligible(e->bin)) {
                out->push_back(e->bin);
            }
        }
    }
    std::sort(out->begin(), out->end(), [](const Bin& a, const Bin& b) { return a.id.v < b.id.v; });
    return ok_status();
}

Status BinRegistry::urgent(Timestamp now, Timestamp urgent_age_s, std::vector<UrgentBin>* out) const noexcept {
    if (out == nullptr) {
        return registry_status(StatusCode::Invalid);
    }
    const Timestamp age = urgent_age_s > 0 ? urgent_age_s : cfg_.urgent_age_s;

    std::vector<Bin> bins;
    const Status s = eligible(&bins);
    if (!is_ok(s)) {
        return s;
    }

    out->clear();
    out->reserve(bins.size());
    for (const Bin& b : bins) {
        out->push_back(UrgentBin{b, priority_tier(b, now, age)});
    }
    std::sort(out->begin(), out->end(), [now, age](const UrgentBin& a, const UrgentBin& b) {
        return priority_before(priority_key(a.bin, now, age), priority_key(b.bin, now, age));
    });
    return ok_status();
}

u64 BinRegistry::size() const noexcept {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return static_cast<u64>(entries_.size());
}

} // namespace wcoord::registry
