#pragma once

#include "panxfer/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace panxfer::transfer {

enum class TransferState {
    Idle,
    // upload
    Hashing,
    Negotiating,
    Reused,
    ChunkUploading,
    Finalizing,
    // download
    RequestingTicket,
    Resolving,
    Streaming,
    // terminal
    Finished,
    Failed
};

enum class TransferDirection {
    Upload,
    Download
};

const char* to_string(TransferState state) noexcept;

/**
 * @brief Ephemeral state of one upload or download call
 *
 * Owned by the call that created it and discarded when it returns.
 * Failed is reachable from every non-terminal state; the other edges
 * follow the upload and download state machines.
 */
class TransferSession {
public:
    TransferSession(TransferDirection direction, std::filesystem::path local_path, std::string remote_target);

    [[nodiscard]] TransferDirection direction() const noexcept { return direction_; }
    [[nodiscard]] TransferState state() const noexcept { return state_; }
    [[nodiscard]] const std::filesystem::path& local_path() const noexcept { return local_path_; }
    [[nodiscard]] const std::string& remote_target() const noexcept { return remote_target_; }
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }
    [[nodiscard]] std::uint64_t bytes_done() const noexcept { return bytes_done_; }
    [[nodiscard]] std::uint64_t total_bytes() const noexcept { return total_bytes_; }

    Result<void> transition_to(TransferState next_state);
    Result<void> mark_failed(std::string error_message);

    void set_total_bytes(std::uint64_t total) noexcept { total_bytes_ = total; }

    /// Adds to the running byte counter; the counter never decreases
    std::uint64_t add_progress(std::uint64_t bytes) noexcept;

    /// floor(bytes_done * 100 / total), 0 when the total is unknown or zero
    [[nodiscard]] std::uint32_t percent() const noexcept;

    [[nodiscard]] std::chrono::steady_clock::duration elapsed() const noexcept {
        return std::chrono::steady_clock::now() - started_at_;
    }

private:
    [[nodiscard]] bool can_transition(TransferState target) const noexcept;

    TransferDirection direction_;
    TransferState state_ = TransferState::Idle;
    std::filesystem::path local_path_;
    std::string remote_target_;
    std::string last_error_;
    std::uint64_t bytes_done_ = 0;
    std::uint64_t total_bytes_ = 0;
    std::chrono::steady_clock::time_point started_at_{std::chrono::steady_clock::now()};
};

} // namespace panxfer::transfer
