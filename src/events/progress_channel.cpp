#include "panxfer/events/progress_channel.hpp"

#include <spdlog/spdlog.h>

namespace panxfer::events {

ProgressChannel::ProgressChannel(ProgressSink downstream)
    : downstream_(std::move(downstream)),
      worker_([this]() { dispatch_loop(); }) {}

ProgressChannel::~ProgressChannel() {
    close();
}

ProgressSink ProgressChannel::sink() {
    return [this](const ProgressEvent& event) {
        push(event);
    };
}

void ProgressChannel::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void ProgressChannel::push(ProgressEvent event) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            spdlog::debug("Progress channel closed, dropping event for {}", event.id);
            return;
        }
        pending_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<ProgressEvent> ProgressChannel::pop() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this]() { return !pending_.empty() || closed_; });
    if (pending_.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(pending_.front());
    pending_.pop_front();
    return event;
}

void ProgressChannel::dispatch_loop() {
    while (auto event = pop()) {
        if (!downstream_) {
            continue;
        }
        try {
            downstream_(*event);
        } catch (const std::exception& e) {
            spdlog::warn("Progress observer failed for {}: {}", event->id, e.what());
        } catch (...) {
            spdlog::warn("Progress observer failed for {} with a non-standard exception", event->id);
        }
    }
}

} // namespace panxfer::events
