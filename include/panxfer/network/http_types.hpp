#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#ifndef _WIN32
#include <strings.h>
#endif

namespace panxfer {
namespace network {

/**
 * @brief Request methods the engine issues
 */
enum class HttpMethod {
    GET,
    POST,
    PUT
};

const char* to_string(HttpMethod method) noexcept;

using HeaderMap = std::unordered_map<std::string, std::string>;

namespace detail {

// Header names are case-insensitive per RFC 7230
inline int strcasecmp_cross_platform(const char* s1, const char* s2) {
#ifdef _WIN32
    return _stricmp(s1, s2);
#else
    return strcasecmp(s1, s2);
#endif
}

inline std::optional<std::string> find_header(const HeaderMap& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp_cross_platform(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace detail

/**
 * @brief Outbound request
 *
 * The body is a byte string; it holds JSON for service calls and raw
 * part bytes for storage uploads.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;  ///< Sent in order
    std::string body;
    bool follow_redirects = true;

    void set_header(std::string name, std::string value) {
        headers.emplace_back(std::move(name), std::move(value));
    }
};

/**
 * @brief Status line and headers of a response, available before the body
 */
struct HttpResponseHead {
    long status = 0;
    HeaderMap headers;
    std::optional<std::uint64_t> content_length;  ///< Declared Content-Length, if any

    std::optional<std::string> get_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    bool has_header(const std::string& name) const {
        return get_header(name).has_value();
    }

    bool is_success() const {
        return status >= 200 && status < 300;
    }
};

/**
 * @brief Fully buffered response
 */
struct HttpResponse : HttpResponseHead {
    std::string body;
};

} // namespace network
} // namespace panxfer
