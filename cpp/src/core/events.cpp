#include "wcoord/core/events.hpp"

#include <algorithm>
#include <utility>

namespace wcoord::core {

namespace {
    // Listeners the current thread is inside of, innermost last.
    thread_local std::vector<const void*> t_running;

    class RunningScope {
    public:
        RunningScope(std::mutex* mutex, std::condition_variable* idle, u32* in_flight, const void* entry)
            : mutex_(mutex), idle_(idle), in_flight_(in_flight) {
            t_running.push_back(entry);
        }
        ~RunningScope() {
            t_running.pop_back();
            {
                std::lock_guard<std::mutex> lock(*mutex_);
                --*in_flight_;
            }
            idle_->notify_all();
        }
        RunningScope(const RunningScope&) = delete;
        RunningScope& operator=(const RunningScope&) = delete;

    private:
        std::mutex* mutex_;
        std::condition_variable* idle_;
        u32* in_flight_;
    };
} // namespace

SubscriptionId EventBus::subscribe(EventKind kind, EventListener listener) {
    auto entry = std::make_shared<Entry>();
    entry->kind = kind;
    entry->fn = std::move(listener);
    std::lock_guard<std::mutex> lock(mutex_);
    entry->id = next_id_++;
    entries_.push_back(std::move(entry));
    return SubscriptionId{entries_.back()->id};
}

void EventBus::unsubscribe(SubscriptionId id) noexcept {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const std::shared_ptr<Entry>& e) { return e->id == id.v; });
    if (it == entries_.end()) {
        return;
    }
    std::shared_ptr<Entry> entry = *it;
    entries_.erase(it);
    entry->removed = true;

    // A listener removing itself must not wait for its own call.
    const auto own = static_cast<u32>(std::count(t_running.begin(), t_running.end(), entry.get()));
    idle_.wait(lock, [&] { return entry->in_flight <= own; });
}

void EventBus::publish(const Event& ev) const {
    // Snapshot so listeners can subscribe/unsubscribe while being called.
    std::vector<std::shared_ptr<Entry>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& e : entries_) {
            if (e->kind == ev.kind && e->fn) {
                targets.push_back(e);
            }
        }
    }
    for (const auto& e : targets) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (e->removed) {
                continue;
            }
            ++e->in_flight;
        }
        RunningScope scope(&mutex_, &idle_, &e->in_flight, e.get());
        e->fn(ev);
    }
}

u32 EventBus::listener_count() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<u32>(entries_.size());
}

} // namespace wcoord::core
