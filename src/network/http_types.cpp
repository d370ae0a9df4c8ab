#include "panxfer/network/http_types.hpp"

namespace panxfer::network {

const char* to_string(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
    }
    return "UNKNOWN";
}

} // namespace panxfer::network
