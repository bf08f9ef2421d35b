#include "deviceid/events.hpp"

#include <boost/log/trivial.hpp>

#include <exception>
#include <vector>

namespace deviceid {

EventSubscription EventBus::on(const std::string& event, EventHandler handler) {
    auto active = std::make_shared<std::atomic<bool>>(true);

    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.emplace(event, Listener{std::move(handler), active});
    return EventSubscription(std::move(active));
}

void EventBus::emit(const std::string& event, const std::string& detail) {
    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto range = listeners_.equal_range(event);
        for (auto it = range.first; it != range.second;) {
            if (!it->second.active->load()) {
                // Cancelled subscriptions are dropped lazily
                it = listeners_.erase(it);
                continue;
            }
            handlers.push_back(it->second.handler);
            ++it;
        }
    }

    // Handlers may subscribe or cancel, so they run without the lock held
    for (const auto& handler : handlers) {
        try {
            handler(detail);
        } catch (const std::exception& ex) {
            BOOST_LOG_TRIVIAL(warning) << "Handler for " << event << " failed: " << ex.what();
        }
    }
}

}  // namespace deviceid
