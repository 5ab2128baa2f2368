#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "wcoord/core/types.hpp"

namespace wcoord::core {

    enum class EventKind : u8 {
        BinEligible = 0,      // needs_collection went false -> true
        RouteAssigned = 1,
        RouteCompleted = 2,
        RouteCancelled = 3,
    };

    struct Event {
        EventKind kind{EventKind::BinEligible};
        BinId bin{BinId::invalid()};
        RouteId route{RouteId::invalid()};
        DriverId driver{DriverId::invalid()};
        TruckId truck{TruckId::invalid()};
        FillLevel fill{FillLevel::Empty};
        Timestamp at{0};
    };

    using EventListener = std::function<void(const Event&)>;

    struct SubscriptionId {
        u32 v{0};
    };

    // Callback registry for outbound events. Listeners run on the publishing
    // thread, after the publisher has released its own locks; a listener may
    // call back into the engine. Once unsubscribe() returns, the listener is
    // not running on any other thread and will not be called again.
    class EventBus {
    public:
        EventBus() noexcept = default;
        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        SubscriptionId subscribe(EventKind kind, EventListener listener);
        // Blocks until calls of this listener on other threads have returned.
        void unsubscribe(SubscriptionId id) noexcept;
        void publish(const Event& ev) const;

        [[nodiscard]] u32 listener_count() const noexcept;

    private:
        struct Entry {
            u32 id{0};
            EventKind kind{EventKind::BinEligible};
            EventListener fn;
            u32 in_flight{0};     // guarded by mutex_
            bool removed{false};  // guarded by mutex_
        };

        mutable std::mutex mutex_;
        mutable std::condition_variable idle_;
        std::vector<std::shared_ptr<Entry>> entries_;
        u32 next_id_{1};
    };

} // namespace wcoord::core
