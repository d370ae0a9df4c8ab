#pragma once

#include "panxfer/api/models.hpp"
#include "panxfer/auth/auth_context.hpp"
#include "panxfer/core/config.hpp"
#include "panxfer/core/result.hpp"
#include "panxfer/core/task_runner.hpp"
#include "panxfer/events/events.hpp"
#include "panxfer/network/transport.hpp"
#include "panxfer/transfer/download_coordinator.hpp"
#include "panxfer/transfer/upload_coordinator.hpp"

#include <cstdint>
#include <filesystem>
#include <future>

namespace panxfer {

/**
 * @brief Entry point for uploads and downloads
 *
 * Each call snapshots the credential when it starts and runs
 * independently of every other call. The blocking variants run on the
 * caller's thread; submit_* run them on the engine's worker pool.
 *
 * THREAD SAFETY:
 * - All methods may be called concurrently
 * - The transport must be safe for concurrent requests
 */
class TransferEngine {
public:
    TransferEngine(const core::ClientConfig& config, auth::AuthContext& auth, network::HttpTransport& transport);

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    Result<transfer::UploadOutcome> upload(std::int64_t parent_folder_id,
                                           const std::filesystem::path& local_path,
                                           const events::ProgressSink& sink);

    Result<transfer::DownloadOutcome> download(const api::FileEntry& entry,
                                               const std::filesystem::path& save_path,
                                               const events::ProgressSink& sink);

    std::future<Result<transfer::UploadOutcome>> submit_upload(std::int64_t parent_folder_id,
                                                               std::filesystem::path local_path,
                                                               events::ProgressSink sink);

    std::future<Result<transfer::DownloadOutcome>> submit_download(api::FileEntry entry,
                                                                   std::filesystem::path save_path,
                                                                   events::ProgressSink sink);

private:
    const core::ClientConfig& config_;
    auth::AuthContext& auth_;
    network::HttpTransport& transport_;
    core::TaskRunner hashing_;
    // Declared last so queued transfers drain before the hashing pool goes away
    core::TaskRunner transfers_;
};

} // namespace panxfer
