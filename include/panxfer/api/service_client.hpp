#pragma once

#include "panxfer/api/models.hpp"
#include "panxfer/auth/auth_context.hpp"
#include "panxfer/core/config.hpp"
#include "panxfer/core/result.hpp"
#include "panxfer/network/transport.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>
#include <vector>

namespace panxfer::api {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Issues authenticated service calls for one operation
 *
 * Holds the credential snapshot taken when the operation started; later
 * changes to the AuthContext are not seen by this instance.
 */
class ServiceClient {
public:
    ServiceClient(network::HttpTransport& transport,
                  const core::ClientConfig& config,
                  auth::Credentials credentials);

    /// POST a JSON body and decode the reply envelope
    Result<ApiEnvelope> post_json(const std::string& path, const nlohmann::json& body) const;

    /// GET with query parameters and decode the reply envelope
    Result<ApiEnvelope> get_json(const std::string& path, const QueryParams& query) const;

    /// POST a JSON body and return the raw response, whatever its status
    Result<network::HttpResponse> post_raw(const std::string& path, const nlohmann::json& body) const;

    /// Request with the full vendor header set applied
    network::HttpRequest make_request(network::HttpMethod method, const std::string& path) const;

    static Result<ApiEnvelope> decode(const network::HttpResponse& response);

    network::HttpTransport& transport() const noexcept { return transport_; }
    const core::ClientConfig& config() const noexcept { return config_; }
    const auth::Credentials& credentials() const noexcept { return credentials_; }

private:
    network::HttpTransport& transport_;
    const core::ClientConfig& config_;
    auth::Credentials credentials_;
};

std::string url_encode(const std::string& value);

} // namespace panxfer::api
