#pragma once
#include <cstddef>
#include <deque>
#include <functional>

// Single-threaded ready queue that carries every deferred ("next tick") callback.
// Producers post from within the loop thread; the owning event loop drains it once per turn.
// A callback never runs inside the post() call that queued it.

namespace concurrency {

class TickQueue {
public:
    using Callback = std::function<void()>;

    TickQueue() = default;
    TickQueue(const TickQueue&) = delete;
    TickQueue& operator=(const TickQueue&) = delete;

    void post(Callback cb) {
        if (cb) ready_.push_back(std::move(cb));
    }

    // Run one tick: only callbacks queued before this call, up to limit (0=unbounded).
    // Callbacks posted while draining wait for the next tick.
    size_t drain(size_t limit = 0) {
        size_t budget = ready_.size();
        if (limit && limit < budget) budget = limit;
        size_t processed = 0;
        while (processed < budget && !ready_.empty()) {
            auto cb = std::move(ready_.front());
            ready_.pop_front();
            ++processed;
            cb();
        }
        return processed;
    }

    size_t runUntilIdle() {
        size_t total = 0;
        while (!ready_.empty()) {
            total += drain();
        }
        return total;
    }

    size_t pending() const { return ready_.size(); }
    bool empty() const { return ready_.empty(); }

private:
    std::deque<Callback> ready_;
};

} // namespace concurrency
