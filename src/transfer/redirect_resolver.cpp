#include "panxfer/transfer/redirect_resolver.hpp"
#include "panxfer/api/endpoints.hpp"

#include <spdlog/spdlog.h>

#include <regex>

namespace panxfer::transfer {

std::optional<std::string> extract_anchor_url(const std::string& html) {
    static const std::regex anchor(R"(href='(https?://[^']+)')");
    std::smatch match;
    if (std::regex_search(html, match, anchor)) {
        return match[1].str();
    }
    return std::nullopt;
}

ProbeOutcome classify_probe_response(const network::HttpResponse& response) {
    if (auto location = response.get_header("location")) {
        return LocationRedirect{*location};
    }
    if (auto link = extract_anchor_url(response.body)) {
        return EmbeddedLink{*link};
    }
    return NoDownloadLink{};
}

RedirectResolver::RedirectResolver(const api::ServiceClient& client) : client_(client) {}

Result<api::DownloadTicket> RedirectResolver::ticket_from(Result<api::ApiEnvelope> envelope, const char* what) const {
    if (envelope.is_error()) {
        return Err<api::DownloadTicket>(envelope.error());
    }

    const auto& reply = envelope.value();
    if (reply.code != 0) {
        return Err<api::DownloadTicket>(api_error(reply.code, std::string(what) + " rejected: " +
                                                  (reply.message.empty() ? std::string("no message") : reply.message)));
    }

    if (reply.data.is_object()) {
        const auto url = reply.data.find("DownloadUrl");
        if (url != reply.data.end() && url->is_string() && !url->get<std::string>().empty()) {
            return Ok(api::DownloadTicket{url->get<std::string>()});
        }
    }
    return Err<api::DownloadTicket>(protocol_error(std::string(what) + " returned no DownloadUrl"));
}

Result<api::DownloadTicket> RedirectResolver::request_ticket(const api::FileEntry& entry) const {
    if (entry.kind == api::FileKind::Folder) {
        const nlohmann::json payload{
            {"fileIdList", nlohmann::json::array({{{"fileId", entry.id}}})},
        };
        spdlog::debug("Requesting archive download for folder {}", entry.id);
        return ticket_from(client_.post_json(api::endpoints::kBatchDownloadInfo, payload), "archive download info");
    }

    const nlohmann::json payload{
        {"driveId", 0},
        {"fileId", entry.id},
        {"etag", entry.content_fingerprint.value_or("")},
        {"s3keyFlag", entry.storage_key_flag.value_or("")},
        {"type", static_cast<int>(entry.kind)},
        {"fileName", entry.name},
        {"size", entry.size},
    };
    spdlog::debug("Requesting download info for file {}", entry.id);
    return ticket_from(client_.post_json(api::endpoints::kDownloadInfo, payload), "download info");
}

Result<std::string> RedirectResolver::resolve(const api::DownloadTicket& ticket) const {
    network::HttpRequest probe;
    probe.method = network::HttpMethod::GET;
    probe.url = ticket.intermediate_url;
    probe.follow_redirects = false;

    auto response = client_.transport().send(probe);
    if (response.is_error()) {
        return Err<std::string>(network_error("intermediate page request failed: " + response.error().message));
    }

    const auto outcome = classify_probe_response(response.value());
    if (const auto* redirect = std::get_if<LocationRedirect>(&outcome)) {
        spdlog::debug("Download resolved through Location header");
        return Ok(redirect->url);
    }
    if (const auto* link = std::get_if<EmbeddedLink>(&outcome)) {
        spdlog::debug("Download resolved through interstitial page link");
        return Ok(link->url);
    }
    return Err<std::string>(Error(ErrorKind::Resolution, "no download URL found"));
}

Result<api::ResolvedDownloadUrl> RedirectResolver::resolve_for(const api::FileEntry& entry,
                                                               const api::DownloadTicket& ticket) const {
    auto url = resolve(ticket);
    if (url.is_error()) {
        return Err<api::ResolvedDownloadUrl>(url.error());
    }

    api::ResolvedDownloadUrl resolved;
    resolved.url = std::move(url.value());
    if (entry.size > 0) {
        resolved.declared_size = static_cast<std::uint64_t>(entry.size);
    }
    return Ok(std::move(resolved));
}

} // namespace panxfer::transfer
