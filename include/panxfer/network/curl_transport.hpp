#pragma once

#include "panxfer/core/config.hpp"
#include "panxfer/network/transport.hpp"

#include <string>

namespace panxfer::network {

/**
 * @brief HttpTransport backed by libcurl
 *
 * Every call runs on its own easy handle, so one instance may serve
 * concurrent transfers. The cookie engine is enabled per handle.
 */
class CurlTransport : public HttpTransport {
public:
    struct Options {
        std::string user_agent;
        long connect_timeout_seconds = 30;
        long max_redirects = 10;
    };

    explicit CurlTransport(Options options);
    explicit CurlTransport(const core::ClientConfig& config);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    Result<HttpResponse> send(const HttpRequest& request) override;

    Result<HttpResponseHead> stream(const HttpRequest& request,
                                    const HeadHandler& on_head,
                                    const ChunkHandler& on_chunk) override;

private:
    Options options_;
};

} // namespace panxfer::network
