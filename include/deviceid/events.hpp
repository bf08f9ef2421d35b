#pragma once

/**
 * @file events.hpp
 * @brief Notifications raised by deviceid::Manager while it loads or stores the identifier
 */

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace deviceid {

// Event names emitted by Manager
namespace events {
constexpr const char* DEVICE_ID_LOADED = "device_id:loaded";
constexpr const char* DEVICE_ID_GENERATED = "device_id:generated";
constexpr const char* DEVICE_ID_CORRUPT = "device_id:corrupt";
constexpr const char* DEVICE_ID_SAVED = "device_id:saved";
constexpr const char* DEVICE_ID_ERROR = "device_id:error";
}  // namespace events

/// Receives the identifier file path, or the error message for events::DEVICE_ID_ERROR
using EventHandler = std::function<void(const std::string& detail)>;

/// Handle returned by Manager::on
class EventSubscription {
  public:
    EventSubscription() = default;
    explicit EventSubscription(std::shared_ptr<std::atomic<bool>> active)
        : active_(std::move(active)) {}

    /// Stop delivering events to the handler. Safe after the manager is gone.
    void cancel() {
        if (active_) {
            active_->store(false);
            active_.reset();
        }
    }

    [[nodiscard]] bool is_active() const { return active_ && active_->load(); }

  private:
    std::shared_ptr<std::atomic<bool>> active_;
};

/**
 * @brief Handlers registered on a manager, keyed by event name
 *
 * Handlers of one event run in subscription order on the thread that raised
 * it. A handler that throws is logged and skipped.
 */
class EventBus {
  public:
    EventSubscription on(const std::string& event, EventHandler handler);

    void emit(const std::string& event, const std::string& detail);

  private:
    struct Listener {
        EventHandler handler;
        std::shared_ptr<std::atomic<bool>> active;
    };

    std::multimap<std::string, Listener> listeners_;
    std::mutex mutex_;
};

}  // namespace deviceid
