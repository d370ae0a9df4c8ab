#pragma once

#include "panxfer/api/models.hpp"
#include "panxfer/api/service_client.hpp"
#include "panxfer/auth/auth_context.hpp"
#include "panxfer/core/config.hpp"
#include "panxfer/core/result.hpp"
#include "panxfer/network/transport.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace panxfer::api {

/**
 * @brief Single-request drive operations around the transfer engine
 *
 * Listing, folder creation, trash and sharing. Each call snapshots the
 * credential from the AuthContext when it starts.
 */
class DriveClient {
public:
    static constexpr int kListPageSize = 100;

    DriveClient(network::HttpTransport& transport,
                const core::ClientConfig& config,
                auth::AuthContext& auth);

    /// Stores "Bearer <token>" into the AuthContext on success
    Result<void> sign_in(const std::string& passport, const std::string& password);

    void sign_out();

    /// Ok(false) when the service rejects the current credential
    Result<bool> validate_session() const;

    /// All entries of a folder, following pagination to the end
    Result<std::vector<FileEntry>> list_directory(std::int64_t parent_id) const;

    Result<void> create_folder(std::int64_t parent_id, const std::string& name) const;

    /// Moves one entry to the trash
    Result<void> trash(std::int64_t file_id) const;

    Result<ShareLink> share(const std::vector<std::int64_t>& file_ids,
                            const std::string& password = {}) const;

private:
    ServiceClient session() const;

    static QueryParams list_query(std::int64_t parent_id, int page, int limit);

    network::HttpTransport& transport_;
    const core::ClientConfig& config_;
    auth::AuthContext& auth_;
};

} // namespace panxfer::api
