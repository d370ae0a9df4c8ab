#include "panxfer/events/progress.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace panxfer::events {

ProgressReporter::ProgressReporter(std::string id, ProgressSink sink)
    : id_(std::move(id)), sink_(std::move(sink)) {}

void ProgressReporter::report(TransferStatus status, std::uint64_t percent, std::uint64_t bytes) {
    const auto capped = static_cast<std::uint32_t>(std::min<std::uint64_t>(percent, 100));
    last_percent_ = std::max(last_percent_, capped);
    last_bytes_ = std::max(last_bytes_, bytes);

    ProgressEvent event;
    event.id = id_;
    event.status = status;
    event.percent = last_percent_;
    event.bytes_transferred = last_bytes_;
    deliver(std::move(event));
}

void ProgressReporter::finished(std::uint64_t bytes) {
    report(TransferStatus::Finished, 100, bytes);
}

void ProgressReporter::failed(const std::string& reason) {
    ProgressEvent event;
    event.id = id_;
    event.status = TransferStatus::Error;
    event.percent = last_percent_;
    event.bytes_transferred = last_bytes_;
    event.message = reason;
    deliver(std::move(event));
}

void ProgressReporter::deliver(ProgressEvent event) {
    if (!sink_) {
        return;
    }
    // Delivery is fire-and-forget; a broken observer must not end the transfer
    try {
        sink_(event);
    } catch (const std::exception& e) {
        spdlog::warn("Progress delivery for {} failed: {}", id_, e.what());
    } catch (...) {
        spdlog::warn("Progress delivery for {} failed with a non-standard exception", id_);
    }
}

ProgressSink make_bus_sink(EventBus& bus) {
    return [&bus](const ProgressEvent& event) {
        bus.emit(event);
    };
}

} // namespace panxfer::events
