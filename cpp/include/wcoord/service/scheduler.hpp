#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "wcoord/core/errors.hpp"
#include "wcoord/core/events.hpp"
#include "wcoord/routing/route_optimizer.hpp"
#include "wcoord/service/coordinator.hpp"
#include "wcoord/service/engine_config.hpp"

namespace wcoord::service {

using u64 = wcoord::core::u64;

// Runs the optimizer on a background thread every optimize_interval_s, and
// early when a bin becomes eligible. stop() wakes the thread and joins it.
class Scheduler {
public:
    Scheduler(Coordinator* coordinator, const SchedulerConfig& cfg) noexcept;
    ~Scheduler() noexcept;
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    [[nodiscard]] wcoord::core::Status start() noexcept;
    void stop() noexcept;

    // One pass on the calling thread.
    [[nodiscard]] wcoord::core::Status run_once(wcoord::routing::OptimizeResult* out) noexcept;

    [[nodiscard]] bool running() const noexcept { return running_.load(); }
    [[nodiscard]] u64 passes() const noexcept { return passes_.load(); }

private:
    void loop() noexcept;

    Coordinator* coordinator_;
    SchedulerConfig cfg_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_{false};
    bool wake_{false};
    std::thread worker_;
    wcoord::core::SubscriptionId subscription_{};

    std::atomic<bool> running_{false};
    std::atomic<u64> passes_{0};
};

} // namespace wcoord::service
