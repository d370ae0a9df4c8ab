#include "panxfer/transfer/transfer_session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace panxfer::transfer {
namespace {

using TransitionTable = std::unordered_map<TransferState, std::vector<TransferState>>;

const TransitionTable& upload_transitions() {
    static const TransitionTable transitions {
        {TransferState::Idle, {TransferState::Hashing}},
        {TransferState::Hashing, {TransferState::Negotiating}},
        {TransferState::Negotiating, {TransferState::Reused, TransferState::ChunkUploading}},
        {TransferState::Reused, {TransferState::Finished}},
        {TransferState::ChunkUploading, {TransferState::Finalizing}},
        {TransferState::Finalizing, {TransferState::Finished}},
    };
    return transitions;
}

const TransitionTable& download_transitions() {
    static const TransitionTable transitions {
        {TransferState::Idle, {TransferState::RequestingTicket}},
        {TransferState::RequestingTicket, {TransferState::Resolving}},
        {TransferState::Resolving, {TransferState::Streaming}},
        {TransferState::Streaming, {TransferState::Finished}},
    };
    return transitions;
}

} // namespace

const char* to_string(TransferState state) noexcept {
    switch (state) {
        case TransferState::Idle: return "Idle";
        case TransferState::Hashing: return "Hashing";
        case TransferState::Negotiating: return "Negotiating";
        case TransferState::Reused: return "Reused";
        case TransferState::ChunkUploading: return "ChunkUploading";
        case TransferState::Finalizing: return "Finalizing";
        case TransferState::RequestingTicket: return "RequestingTicket";
        case TransferState::Resolving: return "Resolving";
        case TransferState::Streaming: return "Streaming";
        case TransferState::Finished: return "Finished";
        case TransferState::Failed: return "Failed";
    }
    return "Unknown";
}

TransferSession::TransferSession(TransferDirection direction,
                                 std::filesystem::path local_path,
                                 std::string remote_target)
    : direction_(direction),
      local_path_(std::move(local_path)),
      remote_target_(std::move(remote_target)) {}

Result<void> TransferSession::transition_to(TransferState next_state) {
    if (state_ == next_state) {
        return Ok();
    }
    if (!can_transition(next_state)) {
        return Err<void>(Error(ErrorKind::Protocol,
                               std::string("Illegal transfer state transition ") +
                               to_string(state_) + " -> " + to_string(next_state)));
    }
    state_ = next_state;
    return Ok();
}

Result<void> TransferSession::mark_failed(std::string error_message) {
    last_error_ = std::move(error_message);
    return transition_to(TransferState::Failed);
}

std::uint64_t TransferSession::add_progress(std::uint64_t bytes) noexcept {
    bytes_done_ += bytes;
    return bytes_done_;
}

std::uint32_t TransferSession::percent() const noexcept {
    if (total_bytes_ == 0) {
        return 0;
    }
    const auto value = bytes_done_ * 100 / total_bytes_;
    return static_cast<std::uint32_t>(std::min<std::uint64_t>(value, 100));
}

bool TransferSession::can_transition(TransferState target) const noexcept {
    if (state_ == TransferState::Failed || state_ == TransferState::Finished) {
        return false;
    }
    if (target == TransferState::Failed) {
        return true;
    }

    const auto& table = direction_ == TransferDirection::Upload ? upload_transitions() : download_transitions();
    const auto it = table.find(state_);
    if (it == table.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace panxfer::transfer
