#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <vector>

namespace concurrency {

// Named-event dispatcher owned by anything that emits notifications.
// Listeners run synchronously in registration order; an exception thrown by a listener
// propagates to the emitter. Listeners subscribed during an emit are not invoked by it.
template <typename Event, typename... Args>
class Notifier {
public:
    using Listener = std::function<void(Args...)>;

    void subscribe(Event event, Listener listener) {
        if (listener) listeners_[event].push_back(std::move(listener));
    }

    void emit(Event event, Args... args) const {
        auto it = listeners_.find(event);
        if (it == listeners_.end()) return;
        auto snapshot = it->second;
        for (auto& listener : snapshot) {
            listener(args...);
        }
    }

    size_t listenerCount(Event event) const {
        auto it = listeners_.find(event);
        return it == listeners_.end() ? 0 : it->second.size();
    }

    void clear() { listeners_.clear(); }

private:
    std::map<Event, std::vector<Listener>> listeners_;
};

} // namespace concurrency
