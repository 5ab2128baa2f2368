#include "wcoord/service/scheduler.hpp"

#include <chrono>
#include <system_error>

#include "wcoord/core/log.hpp"

namespace wcoord::service {

using namespace wcoord::core;

Scheduler::Scheduler(Coordinator* coordinator, const SchedulerConfig& cfg) noexcept
    : coordinator_(coordinator), cfg_(cfg) {
    if (cfg_.optimize_interval_s == 0) {
        cfg_.optimize_interval_s = 1;
    }
}

Scheduler::~Scheduler() noexcept {
    stop();
}

Status Scheduler::start() noexcept {
    if (coordinator_ == nullptr) {
        return make_status(StatusDomain::Service, StatusCode::Invalid);
    }
    if (running_.load()) {
        return ok_status();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
        wake_ = false;
    }

    if (cfg_.wake_on_eligible) {
        subscription_ = coordinator_->events().subscribe(EventKind::BinEligible, [this](const Event&) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                wake_ = true;
            }
            cv_.notify_one();
        });
    }

    try {
        worker_ = std::thread(&Scheduler::loop, this);
    } catch (const std::system_error& e) {
        log_error("cannot start scheduler thread: %s", e.what());
        coordinator_->events().unsubscribe(subscription_);
        subscription_ = SubscriptionId{};
        return make_status(StatusDomain::Service, StatusCode::Unavailable);
    }
    running_.store(true);
    log_info("scheduler started (every %u s)", cfg_.optimize_interval_s);
    return ok_status();
}

void Scheduler::stop() noexcept {
    if (subscription_.v != 0) {
        coordinator_->events().unsubscribe(subscription_);
        subscription_ = SubscriptionId{};
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    running_.store(false);
}

Status Scheduler::run_once(wcoord::routing::OptimizeResult* out) noexcept {
    if (coordinator_ == nullptr || out == nullptr) {
        return make_status(StatusDomain::Service, StatusCode::Invalid);
    }
    wcoord::routing::OptimizeRequest req{};
    const Status s = coordinator_->run_optimization(req, out);
    passes_.fetch_add(1);
    return s;
}

void Scheduler::loop() noexcept {
    const auto interval = std::chrono::seconds(cfg_.optimize_interval_s);
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, interval, [this] { return stop_requested_ || wake_; });
            if (stop_requested_) {
                return;
            }
            wake_ = false;
        }

        wcoord::routing::OptimizeResult result{};
        const Status s = run_once(&result);
        if (s.code == StatusCode::SchedulingConflict) {
            log_info("scheduled pass left %u clusters in conflict", result.conflicts);
        } else if (!is_ok(s)) {
            log_status("scheduled optimization", s);
            if (is_fatal(s)) {
                log_error("scheduler stopping");
                return;
            }
        }
    }
}

} // namespace wcoord::service
