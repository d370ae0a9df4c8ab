/**
 * @file components.hpp
 * @brief Ready-made observers of transfer progress
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * StatsComponent stats(bus);
 * engine.upload(0, path, make_bus_sink(bus));
 */

#pragma once

#include "panxfer/events/event_bus.hpp"
#include "panxfer/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace panxfer::events {

/**
 * @brief Logs progress events using spdlog
 *
 * Intermediate updates go to debug; terminal ones to info or warn.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        bus.subscribe([this](const ProgressEvent& e) {
            on_progress(e);
        });
    }

private:
    void on_progress(const ProgressEvent& e) {
        switch (e.status) {
            case TransferStatus::Finished:
                spdlog::info("[Finished] id={} bytes={}", e.id, e.bytes_transferred);
                break;
            case TransferStatus::Error:
                spdlog::warn("[Failed] id={} at {}%: {}", e.id, e.percent, e.message);
                break;
            default:
                spdlog::debug("[{}] id={} {}% bytes={}", to_string(e.status), e.id, e.percent, e.bytes_transferred);
                break;
        }
    }
};

/**
 * @brief Counts finished and failed transfers
 *
 * A transfer is classed as upload or download by the last non-terminal
 * status seen for its id; ids that only ever reported a terminal event
 * count under transfers_finished/transfers_failed alone.
 */
class StatsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> transfers_finished{0};
        std::atomic<uint64_t> transfers_failed{0};
        std::atomic<uint64_t> uploads_finished{0};
        std::atomic<uint64_t> downloads_finished{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> bytes_downloaded{0};
        std::atomic<uint64_t> events_seen{0};
    };

    explicit StatsComponent(EventBus& bus) {
        bus.subscribe([this](const ProgressEvent& e) {
            on_progress(e);
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("Transfers finished: {} (uploads {}, downloads {})",
                     stats_.transfers_finished.load(),
                     stats_.uploads_finished.load(),
                     stats_.downloads_finished.load());
        spdlog::info("Transfers failed:   {}", stats_.transfers_failed.load());
        spdlog::info("Bytes uploaded:     {}", stats_.bytes_uploaded.load());
        spdlog::info("Bytes downloaded:   {}", stats_.bytes_downloaded.load());
    }

private:
    void on_progress(const ProgressEvent& e) {
        stats_.events_seen++;
        if (e.status == TransferStatus::Error) {
            stats_.transfers_failed++;
            return;
        }
        if (e.status != TransferStatus::Finished) {
            std::lock_guard lock(mutex_);
            direction_[e.id] = e.status;
            return;
        }

        stats_.transfers_finished++;
        std::lock_guard lock(mutex_);
        const auto it = direction_.find(e.id);
        if (it == direction_.end()) {
            return;
        }
        if (it->second == TransferStatus::Downloading) {
            stats_.downloads_finished++;
            stats_.bytes_downloaded += e.bytes_transferred;
        } else {
            stats_.uploads_finished++;
            stats_.bytes_uploaded += e.bytes_transferred;
        }
        direction_.erase(it);
    }

    Stats stats_;
    std::mutex mutex_;
    std::unordered_map<std::string, TransferStatus> direction_;
};

} // namespace panxfer::events
