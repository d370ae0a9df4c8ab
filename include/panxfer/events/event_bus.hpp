/**
 * @file event_bus.hpp
 * @brief Fans progress events out to every registered observer
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * engine.upload(0, path, make_bus_sink(bus));
 */

#pragma once

#include "panxfer/events/events.hpp"

#include <memory>
#include <shared_mutex>
#include <vector>

namespace panxfer::events {

/**
 * @brief Observer list for ProgressEvent
 *
 * THREAD SAFETY:
 * - Concurrent transfers may emit at the same time
 * - Observers run synchronously on the emitting thread
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    void subscribe(ProgressSink observer);

    /// A throwing observer is logged and skipped; the rest still run
    void emit(const ProgressEvent& event) const;

private:
    std::vector<std::shared_ptr<const ProgressSink>> observers_;
    mutable std::shared_mutex mutex_;
};

} // namespace panxfer::events
