#pragma once

#include "panxfer/events/event_bus.hpp"
#include "panxfer/events/events.hpp"

#include <cstdint>
#include <string>

namespace panxfer::events {

/**
 * @brief Emits the progress events of one transfer
 *
 * Percentages are clamped so a transfer never reports a value lower than
 * one it already reported, nor above 100. Sink failures are logged and
 * dropped; an empty sink is allowed.
 */
class ProgressReporter {
public:
    ProgressReporter(std::string id, ProgressSink sink);

    void report(TransferStatus status, std::uint64_t percent, std::uint64_t bytes = 0);
    void finished(std::uint64_t bytes = 0);
    void failed(const std::string& reason);

    const std::string& id() const noexcept { return id_; }
    std::uint32_t last_percent() const noexcept { return last_percent_; }

private:
    void deliver(ProgressEvent event);

    std::string id_;
    ProgressSink sink_;
    std::uint32_t last_percent_ = 0;
    std::uint64_t last_bytes_ = 0;
};

/// Sink that republishes every event on the bus
ProgressSink make_bus_sink(EventBus& bus);

} // namespace panxfer::events
