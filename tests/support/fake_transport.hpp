#pragma once

#include "panxfer/network/transport.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace panxfer::testing {

/**
 * @brief In-memory HttpTransport replaying scripted responses
 *
 * Responses are registered against a URL substring and consumed in
 * order; the first route whose pattern occurs in the request URL and
 * still has a response queued answers it. Every request is recorded.
 */
class FakeTransport : public network::HttpTransport {
public:
    struct Scripted {
        network::HttpResponse response;
        std::optional<Error> failure;             ///< Fail the exchange before any head
        std::optional<std::size_t> interrupt_at;  ///< Stream: fail after this many body bytes
    };

    void add(std::string url_pattern, Scripted scripted) {
        std::lock_guard lock(mutex_);
        routes_.push_back(Route{std::move(url_pattern), {}});
        routes_.back().responses.push_back(std::move(scripted));
    }

    void add(std::string url_pattern, network::HttpResponse response) {
        Scripted scripted;
        scripted.response = std::move(response);
        add(std::move(url_pattern), std::move(scripted));
    }

    void add_json(std::string url_pattern, const nlohmann::json& body, long status = 200) {
        add(std::move(url_pattern), make_response(status, body.dump()));
    }

    void add_failure(std::string url_pattern, Error error) {
        Scripted scripted;
        scripted.failure = std::move(error);
        add(std::move(url_pattern), std::move(scripted));
    }

    void set_chunk_size(std::size_t size) { chunk_size_ = std::max<std::size_t>(size, 1); }

    std::vector<network::HttpRequest> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    std::vector<network::HttpRequest> requests_to(const std::string& url_pattern) const {
        std::lock_guard lock(mutex_);
        std::vector<network::HttpRequest> matching;
        for (const auto& request : requests_) {
            if (request.url.find(url_pattern) != std::string::npos) {
                matching.push_back(request);
            }
        }
        return matching;
    }

    std::size_t unconsumed() const {
        std::lock_guard lock(mutex_);
        std::size_t count = 0;
        for (const auto& route : routes_) {
            count += route.responses.size();
        }
        return count;
    }

    Result<network::HttpResponse> send(const network::HttpRequest& request) override {
        auto scripted = take(request);
        if (!scripted) {
            return Err<network::HttpResponse>(network_error("no scripted response for " + request.url));
        }
        if (scripted->failure) {
            return Err<network::HttpResponse>(*scripted->failure);
        }
        return Ok(scripted->response);
    }

    Result<network::HttpResponseHead> stream(const network::HttpRequest& request,
                                             const network::HeadHandler& on_head,
                                             const network::ChunkHandler& on_chunk) override {
        auto scripted = take(request);
        if (!scripted) {
            return Err<network::HttpResponseHead>(network_error("no scripted response for " + request.url));
        }
        if (scripted->failure) {
            return Err<network::HttpResponseHead>(*scripted->failure);
        }

        const network::HttpResponseHead& head = scripted->response;
        if (!on_head(head)) {
            return Err<network::HttpResponseHead>(network_error("aborted by head handler"));
        }

        const std::string& body = scripted->response.body;
        const std::size_t limit = scripted->interrupt_at.value_or(body.size());
        std::size_t offset = 0;
        while (offset < std::min(limit, body.size())) {
            const std::size_t size = std::min(chunk_size_, std::min(limit, body.size()) - offset);
            if (!on_chunk(body.data() + offset, size)) {
                return Err<network::HttpResponseHead>(network_error("aborted by chunk handler"));
            }
            offset += size;
        }
        if (scripted->interrupt_at) {
            return Err<network::HttpResponseHead>(network_error("connection reset by peer"));
        }
        return Ok(head);
    }

    static network::HttpResponse make_response(long status, std::string body) {
        network::HttpResponse response;
        response.status = status;
        response.body = std::move(body);
        return response;
    }

private:
    struct Route {
        std::string pattern;
        std::deque<Scripted> responses;
    };

    std::optional<Scripted> take(const network::HttpRequest& request) {
        std::lock_guard lock(mutex_);
        requests_.push_back(request);
        for (auto& route : routes_) {
            if (!route.responses.empty() && request.url.find(route.pattern) != std::string::npos) {
                Scripted scripted = std::move(route.responses.front());
                route.responses.pop_front();
                return scripted;
            }
        }
        return std::nullopt;
    }

    mutable std::mutex mutex_;
    std::vector<Route> routes_;
    std::vector<network::HttpRequest> requests_;
    std::size_t chunk_size_ = 4096;
};

inline nlohmann::json envelope(int code, nlohmann::json data = nullptr, const std::string& message = "ok") {
    return nlohmann::json{{"code", code}, {"message", message}, {"data", std::move(data)}};
}

} // namespace panxfer::testing
