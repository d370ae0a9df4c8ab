#include "panxfer/transfer/chunk_uploader.hpp"
#include "panxfer/api/endpoints.hpp"

#include <spdlog/spdlog.h>

namespace panxfer::transfer {
namespace {

/// 2xx plus, when the body carries one, a zero service code
Result<void> check_storage_reply(const network::HttpResponse& response, ErrorKind kind, const std::string& what) {
    if (!response.is_success()) {
        return Err<void>(Error(kind, what + " returned HTTP " + std::to_string(response.status),
                               static_cast<int>(response.status)));
    }
    auto document = nlohmann::json::parse(response.body, nullptr, false);
    if (!document.is_discarded() && document.is_object()) {
        const auto code = document.find("code");
        if (code != document.end() && code->is_number_integer() && code->get<int>() != 0) {
            const auto message = document.value("message", std::string("no message"));
            return Err<void>(Error(kind, what + " rejected: " + message, code->get<int>()));
        }
    }
    return Ok();
}

} // namespace

ChunkUploader::ChunkUploader(const api::ServiceClient& client, api::ChunkSession session)
    : client_(client), session_(std::move(session)) {}

nlohmann::json ChunkUploader::session_payload() const {
    return nlohmann::json{
        {"bucket", session_.bucket},
        {"key", session_.object_key},
        {"uploadId", session_.upload_id},
        {"storageNode", session_.storage_node},
    };
}

Result<void> ChunkUploader::initialize() const {
    auto response = client_.post_raw(api::endpoints::kListUploadParts, session_payload());
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    return check_storage_reply(response.value(), ErrorKind::Api, "storage session init");
}

Result<api::PartDescriptor> ChunkUploader::request_destination(std::uint32_t part_number) const {
    auto payload = session_payload();
    payload["partNumberStart"] = part_number;
    payload["partNumberEnd"] = part_number + 1;

    auto envelope = client_.post_json(api::endpoints::kPrepareUploadParts, payload);
    if (envelope.is_error()) {
        return Err<api::PartDescriptor>(envelope.error());
    }

    const auto& reply = envelope.value();
    if (reply.code != 0) {
        return Err<api::PartDescriptor>(api_error(reply.code,
            "failed to get upload destination for part " + std::to_string(part_number) +
            (reply.message.empty() ? std::string() : ": " + reply.message)));
    }

    const std::string key = std::to_string(part_number);
    if (reply.data.is_object()) {
        const auto urls = reply.data.find("presignedUrls");
        if (urls != reply.data.end() && urls->is_object()) {
            const auto url = urls->find(key);
            if (url != urls->end() && url->is_string() && !url->get<std::string>().empty()) {
                return Ok(api::PartDescriptor{part_number, url->get<std::string>()});
            }
        }
    }
    return Err<api::PartDescriptor>(protocol_error("no upload destination for part " + key));
}

Result<void> ChunkUploader::send_part(const api::PartDescriptor& part, const std::string& bytes) const {
    network::HttpRequest request;
    request.method = network::HttpMethod::PUT;
    request.url = part.destination_url;
    request.body = bytes;

    auto response = client_.transport().send(request);
    if (response.is_error()) {
        return Err<void>(network_error("part " + std::to_string(part.part_number) +
                                       " upload failed: " + response.error().message));
    }
    if (!response.value().is_success()) {
        return Err<void>(api_error(static_cast<int>(response.value().status),
                                   "part " + std::to_string(part.part_number) + " rejected by storage"));
    }
    return Ok();
}

Result<void> ChunkUploader::upload_part(std::uint32_t part_number, const std::string& bytes) const {
    auto destination = request_destination(part_number);
    if (destination.is_error()) {
        return Err<void>(destination.error());
    }
    spdlog::debug("Uploading part {} ({} bytes) of {}", part_number, bytes.size(), session_.object_key);
    return send_part(destination.value(), bytes);
}

Result<void> ChunkUploader::complete() const {
    auto response = client_.post_raw(api::endpoints::kCompleteMultipart, session_payload());
    if (response.is_error()) {
        return Err<void>(Error(ErrorKind::Finalize,
                               "storage completion signal failed: " + response.error().message));
    }
    return check_storage_reply(response.value(), ErrorKind::Finalize, "storage completion");
}

} // namespace panxfer::transfer
