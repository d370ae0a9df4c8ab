#include "panxfer/network/curl_transport.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>

namespace panxfer::network {
namespace {

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

/**
 * @brief Per-call state shared with the curl callbacks
 */
struct CallState {
    CURL* handle = nullptr;
    HttpResponseHead head;
    bool head_delivered = false;
    bool aborted = false;

    const HeadHandler* on_head = nullptr;
    const ChunkHandler* on_chunk = nullptr;

    // Request body cursor for PUT uploads
    const std::string* upload = nullptr;
    std::size_t upload_offset = 0;

    bool deliver_head() {
        if (head_delivered) {
            return !aborted;
        }
        head_delivered = true;
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &head.status);
        if (on_head != nullptr && *on_head && !(*on_head)(head)) {
            aborted = true;
        }
        return !aborted;
    }
};

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* state = static_cast<CallState*>(userdata);
    const size_t total = size * nitems;
    const std::string line(buffer, total);

    // A new status line starts a new header block (redirect hop or 100-continue)
    if (line.rfind("HTTP/", 0) == 0) {
        state->head.headers.clear();
        state->head.content_length.reset();
        return total;
    }

    const auto colon = line.find(':');
    if (colon == std::string::npos) {
        return total;
    }

    std::string name = trim(line.substr(0, colon));
    std::string value = trim(line.substr(colon + 1));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "content-length") {
        try {
            state->head.content_length = std::stoull(value);
        } catch (const std::exception&) {
            state->head.content_length.reset();
        }
    }
    state->head.headers[name] = value;
    return total;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* state = static_cast<CallState*>(userdata);
    const size_t total = size * nmemb;
    if (!state->deliver_head()) {
        return 0;
    }
    if (state->on_chunk != nullptr && *state->on_chunk && !(*state->on_chunk)(ptr, total)) {
        state->aborted = true;
        return 0;
    }
    return total;
}

size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* state = static_cast<CallState*>(userdata);
    const size_t capacity = size * nitems;
    const size_t remaining = state->upload->size() - state->upload_offset;
    const size_t count = std::min(capacity, remaining);
    std::memcpy(buffer, state->upload->data() + state->upload_offset, count);
    state->upload_offset += count;
    return count;
}

} // namespace

CurlTransport::CurlTransport(Options options) : options_(std::move(options)) {
    curl_global_init(CURL_GLOBAL_ALL);
}

CurlTransport::CurlTransport(const core::ClientConfig& config)
    : CurlTransport(Options{config.profile.user_agent,
                            config.connect_timeout_seconds,
                            config.max_redirects}) {}

CurlTransport::~CurlTransport() {
    curl_global_cleanup();
}

Result<HttpResponse> CurlTransport::send(const HttpRequest& request) {
    HttpResponse response;
    auto collect = [&response](const char* data, std::size_t size) {
        response.body.append(data, size);
        return true;
    };

    auto head = stream(request, HeadHandler{}, collect);
    if (head.is_error()) {
        return Err<HttpResponse>(head.error());
    }
    static_cast<HttpResponseHead&>(response) = std::move(head.value());
    return Ok(std::move(response));
}

Result<HttpResponseHead> CurlTransport::stream(const HttpRequest& request,
                                               const HeadHandler& on_head,
                                               const ChunkHandler& on_chunk) {
    EasyHandle handle(curl_easy_init());
    if (!handle) {
        return Err<HttpResponseHead>(network_error("Failed to initialize CURL handle"));
    }

    CallState state;
    state.handle = handle.get();
    state.on_head = &on_head;
    state.on_chunk = &on_chunk;

    CURL* curl = handle.get();
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_COOKIEFILE, "");
    if (!options_.user_agent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    }
    if (options_.connect_timeout_seconds > 0) {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_seconds);
    }
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options_.max_redirects);

    curl_slist* raw_headers = nullptr;
    for (const auto& [name, value] : request.headers) {
        const std::string line = name + ": " + value;
        raw_headers = curl_slist_append(raw_headers, line.c_str());
    }

    switch (request.method) {
        case HttpMethod::GET:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::POST:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
            break;
        case HttpMethod::PUT:
            state.upload = &request.body;
            curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &state);
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
            // Storage endpoints reject the 100-continue handshake
            raw_headers = curl_slist_append(raw_headers, "Expect:");
            break;
    }
    HeaderList headers(raw_headers);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);

    spdlog::debug("{} {}", to_string(request.method), request.url);
    const CURLcode res = curl_easy_perform(curl);

    if (state.aborted) {
        return Err<HttpResponseHead>(network_error("Transfer aborted by receiver: " + request.url));
    }
    if (res != CURLE_OK) {
        spdlog::debug("CURL perform failed: {}", curl_easy_strerror(res));
        return Err<HttpResponseHead>(network_error(std::string(curl_easy_strerror(res)) + ": " + request.url));
    }

    // Empty bodies never reach the write callback
    if (!state.deliver_head()) {
        return Err<HttpResponseHead>(network_error("Transfer aborted by receiver: " + request.url));
    }

    spdlog::debug("Received HTTP {} from {}", state.head.status, request.url);
    return Ok(std::move(state.head));
}

} // namespace panxfer::network
