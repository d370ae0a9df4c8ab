#pragma once

#include "panxfer/api/models.hpp"
#include "panxfer/api/service_client.hpp"
#include "panxfer/core/result.hpp"
#include "panxfer/network/http_types.hpp"

#include <optional>
#include <string>
#include <variant>

namespace panxfer::transfer {

/// The probe answered with a Location header
struct LocationRedirect {
    std::string url;
};

/// The probe answered with an interstitial page linking the bytes
struct EmbeddedLink {
    std::string url;
};

struct NoDownloadLink {};

using ProbeOutcome = std::variant<LocationRedirect, EmbeddedLink, NoDownloadLink>;

/**
 * @brief Classify a non-followed response to an intermediate URL
 *
 * A Location header wins and is returned verbatim; the body is only
 * searched when the header is absent.
 */
ProbeOutcome classify_probe_response(const network::HttpResponse& response);

/// First href='http(s)://...' anchor target in the text
std::optional<std::string> extract_anchor_url(const std::string& html);

/**
 * @brief Turns a remote entry into the URL that actually serves its bytes
 *
 * Folders are requested as a packaged archive through the batch
 * endpoint, files through download_info; both yield an intermediate
 * URL that is then probed once with redirects disabled.
 */
class RedirectResolver {
public:
    explicit RedirectResolver(const api::ServiceClient& client);

    Result<api::DownloadTicket> request_ticket(const api::FileEntry& entry) const;

    Result<std::string> resolve(const api::DownloadTicket& ticket) const;

    /// resolve() paired with the entry's size, kept only when positive
    Result<api::ResolvedDownloadUrl> resolve_for(const api::FileEntry& entry,
                                                 const api::DownloadTicket& ticket) const;

private:
    Result<api::DownloadTicket> ticket_from(Result<api::ApiEnvelope> envelope, const char* what) const;

    const api::ServiceClient& client_;
};

} // namespace panxfer::transfer
