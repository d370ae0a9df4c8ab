#pragma once

#include "panxfer/core/result.hpp"
#include "panxfer/network/http_types.hpp"

#include <cstddef>
#include <functional>

namespace panxfer::network {

/// Return false to abort the transfer.
using HeadHandler = std::function<bool(const HttpResponseHead&)>;
using ChunkHandler = std::function<bool(const char* data, std::size_t size)>;

/**
 * @brief HTTP capability used by the transfer engine
 *
 * Implementations must be safe to call from several threads at once;
 * each call is independent.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Issue a request and buffer the whole response body
     *
     * A non-2xx status is not an error here; only failing to exchange
     * the request at all is reported as ErrorKind::Network.
     */
    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;

    /**
     * @brief Issue a request and hand the body over in arrival order
     *
     * on_head runs exactly once before any chunk, also for an empty body.
     * Returning false from either handler aborts with a Network error.
     */
    virtual Result<HttpResponseHead> stream(const HttpRequest& request,
                                            const HeadHandler& on_head,
                                            const ChunkHandler& on_chunk) = 0;
};

} // namespace panxfer::network
