#include "panxfer/engine.hpp"
#include "panxfer/api/service_client.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace panxfer {

TransferEngine::TransferEngine(const core::ClientConfig& config,
                               auth::AuthContext& auth,
                               network::HttpTransport& transport)
    : config_(config),
      auth_(auth),
      transport_(transport),
      hashing_(1),
      transfers_(config.transfer_workers) {}

Result<transfer::UploadOutcome> TransferEngine::upload(std::int64_t parent_folder_id,
                                                       const std::filesystem::path& local_path,
                                                       const events::ProgressSink& sink) {
    api::ServiceClient client(transport_, config_, auth_.snapshot());
    transfer::UploadCoordinator coordinator(client, hashing_, config_.part_size, config_.hash_buffer_size);

    transfer::UploadRequest request;
    request.local_path = local_path;
    request.parent_folder_id = parent_folder_id;
    return coordinator.upload(request, sink);
}

Result<transfer::DownloadOutcome> TransferEngine::download(const api::FileEntry& entry,
                                                           const std::filesystem::path& save_path,
                                                           const events::ProgressSink& sink) {
    api::ServiceClient client(transport_, config_, auth_.snapshot());
    transfer::DownloadCoordinator coordinator(client);
    return coordinator.download(entry, save_path, sink);
}

std::future<Result<transfer::UploadOutcome>> TransferEngine::submit_upload(std::int64_t parent_folder_id,
                                                                           std::filesystem::path local_path,
                                                                           events::ProgressSink sink) {
    spdlog::debug("Queueing upload of {}", local_path.string());
    return transfers_.submit([this, parent_folder_id, path = std::move(local_path), sink = std::move(sink)]() {
        return upload(parent_folder_id, path, sink);
    });
}

std::future<Result<transfer::DownloadOutcome>> TransferEngine::submit_download(api::FileEntry entry,
                                                                               std::filesystem::path save_path,
                                                                               events::ProgressSink sink) {
    spdlog::debug("Queueing download of {}", entry.name);
    return transfers_.submit([this, entry = std::move(entry), path = std::move(save_path), sink = std::move(sink)]() {
        return download(entry, path, sink);
    });
}

} // namespace panxfer
