#include "panxfer/events/event_bus.hpp"

#include <spdlog/spdlog.h>

#include <mutex>

namespace panxfer::events {

void EventBus::subscribe(ProgressSink observer) {
    if (!observer) {
        return;
    }
    std::unique_lock lock(mutex_);
    observers_.push_back(std::make_shared<const ProgressSink>(std::move(observer)));
}

void EventBus::emit(const ProgressEvent& event) const {
    // Snapshot so an observer may subscribe without deadlock
    std::vector<std::shared_ptr<const ProgressSink>> snapshot;
    {
        std::shared_lock lock(mutex_);
        snapshot = observers_;
    }

    for (const auto& observer : snapshot) {
        try {
            (*observer)(event);
        } catch (const std::exception& e) {
            spdlog::warn("Progress observer failed for {}: {}", event.id, e.what());
        } catch (...) {
            spdlog::warn("Progress observer failed for {} with a non-standard exception", event.id);
        }
    }
}

} // namespace panxfer::events
