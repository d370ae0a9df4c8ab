/**
 * @file events.hpp
 * @brief Progress event definitions produced by transfers
 *
 * Transfers only produce these; delivery is best-effort. An observer
 * that fails or is absent never changes the outcome of a transfer.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace panxfer::events {

enum class TransferStatus {
    Hashing,
    Uploading,
    Downloading,
    Finished,
    Error
};

const char* to_string(TransferStatus status) noexcept;

/**
 * @brief One progress update of one transfer
 *
 * WHO EMITS:
 * - UploadCoordinator (id = local path)
 * - Download flow and DownloadStreamer (id = remote file id)
 *
 * Downloads of unknown size emit no intermediate events; their byte
 * count arrives with the final event.
 */
struct ProgressEvent {
    std::string id;
    std::uint32_t percent = 0;
    TransferStatus status = TransferStatus::Hashing;
    std::uint64_t bytes_transferred = 0;
    std::string message;  ///< Human-readable reason for Error events
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    bool is_terminal() const {
        return status == TransferStatus::Finished || status == TransferStatus::Error;
    }
};

using ProgressSink = std::function<void(const ProgressEvent&)>;

} // namespace panxfer::events
