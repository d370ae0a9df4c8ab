#pragma once

#include "panxfer/api/models.hpp"
#include "panxfer/api/service_client.hpp"
#include "panxfer/core/result.hpp"
#include "panxfer/core/task_runner.hpp"
#include "panxfer/events/events.hpp"
#include "panxfer/events/progress.hpp"
#include "panxfer/transfer/chunk_planner.hpp"
#include "panxfer/transfer/chunk_uploader.hpp"
#include "panxfer/transfer/content_hasher.hpp"
#include "panxfer/transfer/transfer_session.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace panxfer::transfer {

struct UploadRequest {
    std::filesystem::path local_path;
    std::int64_t parent_folder_id = 0;
    std::string file_name;  ///< Remote name; empty means the local file name
};

struct UploadOutcome {
    std::int64_t file_id = 0;
    bool reused = false;           ///< Completed without sending any bytes
    bool renamed = false;          ///< Negotiated with auto-rename after a name conflict
    std::uint64_t size = 0;
    std::string fingerprint;
    std::uint32_t parts_uploaded = 0;
};

/**
 * @brief Runs the upload state machine for one file
 *
 * Hashing -> Negotiating -> {Reused | ChunkUploading -> Finalizing} -> Finished,
 * with Failed reachable from every state. Every failure emits an error
 * progress event with the reason before the error is returned.
 *
 * Parts are sent strictly one after another. The only automatic retry is
 * a single re-negotiation with auto-rename when the service reports a
 * name conflict.
 */
class UploadCoordinator {
public:
    UploadCoordinator(const api::ServiceClient& client,
                      core::TaskRunner& hashing_runner,
                      std::size_t part_size = ChunkPlanner::kDefaultPartSize,
                      std::size_t hash_buffer_size = ContentHasher::kDefaultBufferSize);

    Result<UploadOutcome> upload(const UploadRequest& request, const events::ProgressSink& sink);

private:
    struct Negotiated {
        api::UploadNegotiation negotiation;
        bool renamed = false;
    };

    Result<Negotiated> negotiate(const std::string& file_name,
                                 std::int64_t parent_folder_id,
                                 const ContentFingerprint& fingerprint) const;

    Result<std::uint32_t> upload_parts(const ChunkUploader& uploader,
                                       TransferSession& session,
                                       events::ProgressReporter& reporter) const;

    Result<void> finalize(const ChunkUploader& uploader, std::int64_t final_file_id) const;

    Error fail(TransferSession& session, events::ProgressReporter& reporter, Error error) const;

    const api::ServiceClient& client_;
    core::TaskRunner& hashing_runner_;
    std::size_t part_size_;
    ContentHasher hasher_;
};

} // namespace panxfer::transfer
