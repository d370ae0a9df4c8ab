#include "panxfer/api/service_client.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace panxfer::api {

std::string url_encode(const std::string& value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return oss.str();
}

ServiceClient::ServiceClient(network::HttpTransport& transport,
                             const core::ClientConfig& config,
                             auth::Credentials credentials)
    : transport_(transport),
      config_(config),
      credentials_(std::move(credentials)) {}

network::HttpRequest ServiceClient::make_request(network::HttpMethod method, const std::string& path) const {
    const auto& profile = config_.profile;

    network::HttpRequest request;
    request.method = method;
    request.url = config_.api_base + path;
    request.set_header("authorization", credentials_.token);
    request.set_header("platform", profile.platform);
    request.set_header("app-version", profile.app_version);
    request.set_header("x-app-version", profile.x_app_version);
    request.set_header("x-channel", profile.x_channel);
    request.set_header("devicetype", profile.device_type);
    request.set_header("devicename", profile.device_name);
    request.set_header("osversion", profile.os_version);
    request.set_header("loginuuid", credentials_.client_id);
    request.set_header("content-type", "application/json");
    return request;
}

Result<network::HttpResponse> ServiceClient::post_raw(const std::string& path, const nlohmann::json& body) const {
    auto request = make_request(network::HttpMethod::POST, path);
    request.body = body.dump();
    return transport_.send(request);
}

Result<ApiEnvelope> ServiceClient::post_json(const std::string& path, const nlohmann::json& body) const {
    auto response = post_raw(path, body);
    if (response.is_error()) {
        return Err<ApiEnvelope>(response.error());
    }
    auto envelope = decode(response.value());
    if (envelope.is_ok()) {
        spdlog::debug("POST {} -> HTTP {} code {}", path, envelope.value().http_status, envelope.value().code);
    }
    return envelope;
}

Result<ApiEnvelope> ServiceClient::get_json(const std::string& path, const QueryParams& query) const {
    auto request = make_request(network::HttpMethod::GET, path);
    char separator = '?';
    for (const auto& [key, value] : query) {
        request.url += separator;
        request.url += url_encode(key) + "=" + url_encode(value);
        separator = '&';
    }

    auto response = transport_.send(request);
    if (response.is_error()) {
        return Err<ApiEnvelope>(response.error());
    }
    return decode(response.value());
}

Result<ApiEnvelope> ServiceClient::decode(const network::HttpResponse& response) {
    auto document = nlohmann::json::parse(response.body, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        if (!response.is_success()) {
            return Err<ApiEnvelope>(api_error(static_cast<int>(response.status),
                                              "service replied with HTTP " + std::to_string(response.status)));
        }
        return Err<ApiEnvelope>(protocol_error("service reply is not a JSON object"));
    }

    ApiEnvelope envelope;
    envelope.http_status = response.status;

    const auto code = document.find("code");
    if (code == document.end() || !code->is_number_integer()) {
        return Err<ApiEnvelope>(protocol_error("service reply has no integer code"));
    }
    envelope.code = code->get<int>();

    const auto message = document.find("message");
    if (message != document.end() && message->is_string()) {
        envelope.message = message->get<std::string>();
    }

    const auto data = document.find("data");
    if (data != document.end()) {
        envelope.data = *data;
    }
    return Ok(std::move(envelope));
}

} // namespace panxfer::api
