#include "panxfer/api/drive_client.hpp"
#include "panxfer/api/endpoints.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace panxfer::api {
namespace {

Error rejected(const ApiEnvelope& envelope, const std::string& what) {
    const std::string message = envelope.message.empty() ? "unknown error" : envelope.message;
    return api_error(envelope.code, what + ": " + message);
}

} // namespace

DriveClient::DriveClient(network::HttpTransport& transport,
                         const core::ClientConfig& config,
                         auth::AuthContext& auth)
    : transport_(transport), config_(config), auth_(auth) {}

ServiceClient DriveClient::session() const {
    return ServiceClient(transport_, config_, auth_.snapshot());
}

Result<void> DriveClient::sign_in(const std::string& passport, const std::string& password) {
    spdlog::info("Signing in as {}", passport);

    // sign_in is sent without a credential
    ServiceClient client(transport_, config_, auth::Credentials{"", auth_.client_identifier()});
    const nlohmann::json payload{{"type", 1}, {"passport", passport}, {"password", password}};

    auto envelope = client.post_json(endpoints::kSignIn, payload);
    if (envelope.is_error()) {
        spdlog::error("Sign-in request failed: {}", envelope.error().describe());
        return Err<void>(envelope.error());
    }

    const auto& reply = envelope.value();
    if (reply.code != endpoints::kSignInSuccessCode) {
        spdlog::warn("Sign-in rejected: {}", reply.message);
        return Err<void>(rejected(reply, "sign-in rejected"));
    }

    const auto token = reply.data.is_object() ? reply.data.find("token") : reply.data.end();
    if (!reply.data.is_object() || token == reply.data.end() || !token->is_string()) {
        return Err<void>(protocol_error("sign-in reply has no token"));
    }

    auth_.set_credential("Bearer " + token->get<std::string>());
    spdlog::info("Signed in");
    return Ok();
}

void DriveClient::sign_out() {
    spdlog::info("Signing out");
    auth_.clear();
}

Result<bool> DriveClient::validate_session() const {
    auto envelope = session().get_json(endpoints::kFileList, list_query(0, 1, 1));
    if (envelope.is_error()) {
        if (envelope.error().kind == ErrorKind::Network) {
            return Err<bool>(envelope.error());
        }
        return Ok(false);
    }
    return Ok(envelope.value().code == 0);
}

QueryParams DriveClient::list_query(std::int64_t parent_id, int page, int limit) {
    return {
        {"driveId", "0"},
        {"limit", std::to_string(limit)},
        {"next", "0"},
        {"orderBy", "file_id"},
        {"orderDirection", "desc"},
        {"parentFileId", std::to_string(parent_id)},
        {"trashed", "false"},
        {"SearchData", ""},
        {"Page", std::to_string(page)},
        {"OnlyLookAbnormalFile", "0"},
    };
}

Result<std::vector<FileEntry>> DriveClient::list_directory(std::int64_t parent_id) const {
    spdlog::debug("Listing folder {}", parent_id);
    const auto client = session();

    std::vector<FileEntry> entries;
    std::int64_t total = -1;
    int page = 1;

    while (total < 0 || static_cast<std::int64_t>(entries.size()) < total) {
        auto envelope = client.get_json(endpoints::kFileList, list_query(parent_id, page, kListPageSize));
        if (envelope.is_error()) {
            return Err<std::vector<FileEntry>>(envelope.error());
        }

        const auto& reply = envelope.value();
        if (reply.code != 0) {
            spdlog::error("Listing folder {} failed: code={} message={}", parent_id, reply.code, reply.message);
            return Err<std::vector<FileEntry>>(rejected(reply, "listing failed"));
        }
        if (!reply.data.is_object()) {
            break;
        }

        if (total < 0) {
            const auto declared = reply.data.find("Total");
            total = (declared != reply.data.end() && declared->is_number_integer())
                        ? declared->get<std::int64_t>()
                        : 0;
        }

        const auto list = reply.data.find("InfoList");
        if (list == reply.data.end() || !list->is_array() || list->empty()) {
            break;
        }

        for (const auto& item : *list) {
            auto entry = parse_file_entry(item);
            if (entry.is_error()) {
                return Err<std::vector<FileEntry>>(entry.error());
            }
            entries.push_back(std::move(entry.value()));
        }
        ++page;
    }

    spdlog::debug("Folder {} holds {} entries", parent_id, entries.size());
    return Ok(std::move(entries));
}

Result<void> DriveClient::create_folder(std::int64_t parent_id, const std::string& name) const {
    spdlog::info("Creating folder '{}' under {}", name, parent_id);
    const nlohmann::json payload{
        {"driveId", 0},
        {"etag", ""},
        {"fileName", name},
        {"parentFileId", parent_id},
        {"size", 0},
        {"type", 1},
        {"duplicate", static_cast<int>(DuplicatePolicy::Overwrite)},
        {"NotReuse", true},
        {"event", "newCreateFolder"},
        {"operateType", 1},
    };

    auto envelope = session().post_json(endpoints::kCreateFolder, payload);
    if (envelope.is_error()) {
        return Err<void>(envelope.error());
    }
    if (envelope.value().code != 0) {
        return Err<void>(rejected(envelope.value(), "folder creation rejected"));
    }
    return Ok();
}

Result<void> DriveClient::trash(std::int64_t file_id) const {
    spdlog::info("Moving {} to trash", file_id);
    const nlohmann::json payload{
        {"driveId", 0},
        {"fileTrashInfoList", nlohmann::json::array({{{"fileId", file_id}}})},
        {"operation", true},
    };

    auto envelope = session().post_json(endpoints::kTrash, payload);
    if (envelope.is_error()) {
        return Err<void>(envelope.error());
    }
    if (envelope.value().code != 0) {
        return Err<void>(rejected(envelope.value(), "trash rejected"));
    }
    return Ok();
}

Result<ShareLink> DriveClient::share(const std::vector<std::int64_t>& file_ids,
                                     const std::string& password) const {
    if (file_ids.empty()) {
        return Err<ShareLink>(Error(ErrorKind::Api, "no files selected for sharing"));
    }

    std::ostringstream id_list;
    for (std::size_t i = 0; i < file_ids.size(); ++i) {
        if (i > 0) {
            id_list << ',';
        }
        id_list << file_ids[i];
    }
    spdlog::info("Sharing {}", id_list.str());

    const nlohmann::json payload{
        {"driveId", 0},
        {"expiration", "2099-12-12T08:00:00+08:00"},
        {"fileIdList", id_list.str()},
        {"shareName", "My Share"},
        {"sharePwd", password},
        {"event", "shareCreate"},
    };

    auto envelope = session().post_json(endpoints::kShareCreate, payload);
    if (envelope.is_error()) {
        return Err<ShareLink>(envelope.error());
    }

    const auto& reply = envelope.value();
    if (reply.code != 0) {
        return Err<ShareLink>(rejected(reply, "share rejected"));
    }

    const auto key = reply.data.is_object() ? reply.data.find("ShareKey") : reply.data.end();
    if (!reply.data.is_object() || key == reply.data.end() || !key->is_string()) {
        return Err<ShareLink>(protocol_error("share reply has no ShareKey"));
    }

    ShareLink link;
    link.url = config_.api_base + endpoints::kShareUrlPrefix + key->get<std::string>();
    link.password = password;
    return Ok(std::move(link));
}

} // namespace panxfer::api
