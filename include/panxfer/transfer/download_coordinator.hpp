#pragma once

#include "panxfer/api/models.hpp"
#include "panxfer/api/service_client.hpp"
#include "panxfer/core/result.hpp"
#include "panxfer/events/events.hpp"
#include "panxfer/transfer/transfer_session.hpp"

#include <cstdint>
#include <filesystem>

namespace panxfer::transfer {

struct DownloadOutcome {
    std::uint64_t bytes_written = 0;
    std::string resolved_url;
};

/**
 * @brief Runs the download state machine for one remote entry
 *
 * RequestingTicket -> Resolving -> Streaming -> Finished, Failed from any
 * of them. Progress events carry the entry id as their transfer id.
 */
class DownloadCoordinator {
public:
    explicit DownloadCoordinator(const api::ServiceClient& client);

    Result<DownloadOutcome> download(const api::FileEntry& entry,
                                     const std::filesystem::path& destination,
                                     const events::ProgressSink& sink) const;

private:
    const api::ServiceClient& client_;
};

} // namespace panxfer::transfer
