#pragma once

#include "wcoord/core/models.hpp"
#include "wcoord/core/types.hpp"

namespace wcoord::core {

    inline constexpr Timestamp kDefaultUrgentAgeS = kSecondsPerDay;

    // Lower value = collected first.
    enum class PriorityTier : u8 {
        Critical = 0,   // full and last reported more than the urgent age ago
        High = 1,       // full
        Medium = 2,     // three_quarters
        Low = 3,        // not eligible
    };

    [[nodiscard]] constexpr const char* priority_tier_name(PriorityTier t) noexcept {
        switch (t) {
            case PriorityTier::Critical: return "critical";
            case PriorityTier::High: return "high";
            case PriorityTier::Medium: return "medium";
            case PriorityTier::Low: return "low";
        }
        return "low";
    }

    struct PriorityKey {
        PriorityTier tier{PriorityTier::Low};
        Timestamp last_reported{0};
        BinId bin{BinId::invalid()};
    };

    [[nodiscard]] constexpr PriorityTier priority_tier(const Bin& b, Timestamp now, Timestamp urgent_age_s) noexcept {
        if (!bin_eligible(b)) {
            return PriorityTier::Low;
        }
        if (b.fill == FillLevel::Full) {
            return (now - b.last_reported > urgent_age_s) ? PriorityTier::Critical : PriorityTier::High;
        }
        return PriorityTier::Medium;
    }

    [[nodiscard]] constexpr PriorityKey priority_key(const Bin& b, Timestamp now, Timestamp urgent_age_s) noexcept {
        return PriorityKey{priority_tier(b, now, urgent_age_s), b.last_reported, b.id};
    }

    // Strict total order: tier, then staleness (older first), then bin id.
    [[nodiscard]] constexpr bool priority_before(const PriorityKey& a, const PriorityKey& b) noexcept {
        if (a.tier != b.tier) {
            return a.tier < b.tier;
        }
        if (a.last_reported != b.last_reported) {
            return a.last_reported < b.last_reported;
        }
        return a.bin.v < b.bin.v;
    }

    // Mass is unknown until the truck weighs the pickup; estimate it from the
    // nominal volume, the reported fill and a deployment density.
    [[nodiscard]] constexpr double estimated_mass_kg(const Bin& b, double density_kg_per_liter) noexcept {
        return static_cast<double>(b.capacity_liters) * fill_fraction(b.fill) * density_kg_per_liter;
    }

} // namespace wcoord::core
