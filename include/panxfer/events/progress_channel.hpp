/**
 * @file progress_channel.hpp
 * @brief One-way queued channel between transfers and a slow observer
 *
 * EXAMPLE:
 * ProgressChannel channel([](const ProgressEvent& e) { render(e); });
 * engine.upload(0, path, channel.sink());  // never blocks on render()
 */

#pragma once

#include "panxfer/events/events.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>

namespace panxfer::events {

/**
 * @brief Delivers progress events to a downstream sink on its own thread
 *
 * Events pushed before close() are still delivered; close() drains the
 * queue and joins the dispatch thread. Events pushed after close() are
 * dropped.
 */
class ProgressChannel {
public:
    explicit ProgressChannel(ProgressSink downstream);
    ~ProgressChannel();

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    /// Sink that only enqueues; valid while the channel lives
    ProgressSink sink();

    void close();

private:
    void push(ProgressEvent event);

    /// Blocks until an event is queued; nullopt once closed and drained
    std::optional<ProgressEvent> pop();

    void dispatch_loop();

    ProgressSink downstream_;
    std::deque<ProgressEvent> pending_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
    std::thread worker_;
};

} // namespace panxfer::events
