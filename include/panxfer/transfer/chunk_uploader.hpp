#pragma once

#include "panxfer/api/models.hpp"
#include "panxfer/api/service_client.hpp"
#include "panxfer/core/result.hpp"

#include <cstdint>
#include <string>

namespace panxfer::transfer {

/**
 * @brief Storage-side calls of one multipart upload session
 *
 * Destinations are fetched one part at a time, right before the part is
 * sent, and never reused. Part bytes go straight to storage without the
 * service credential.
 */
class ChunkUploader {
public:
    ChunkUploader(const api::ServiceClient& client, api::ChunkSession session);

    /// Register the part list with storage; must precede the first part
    Result<void> initialize() const;

    Result<api::PartDescriptor> request_destination(std::uint32_t part_number) const;

    Result<void> send_part(const api::PartDescriptor& part, const std::string& bytes) const;

    /// Destination fetch followed by the PUT, no retry
    Result<void> upload_part(std::uint32_t part_number, const std::string& bytes) const;

    /// Storage-side "complete multipart"; failures are Finalize errors
    Result<void> complete() const;

    const api::ChunkSession& session() const noexcept { return session_; }

private:
    nlohmann::json session_payload() const;

    const api::ServiceClient& client_;
    api::ChunkSession session_;
};

} // namespace panxfer::transfer
