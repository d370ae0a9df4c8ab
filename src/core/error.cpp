#include "panxfer/core/error.hpp"

#include <sstream>

namespace panxfer {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Io: return "IoError";
        case ErrorKind::Network: return "NetworkError";
        case ErrorKind::Api: return "ApiError";
        case ErrorKind::Protocol: return "ProtocolError";
        case ErrorKind::Resolution: return "ResolutionError";
        case ErrorKind::Finalize: return "FinalizeError";
        case ErrorKind::Config: return "ConfigError";
    }
    return "UnknownError";
}

std::string Error::describe() const {
    std::ostringstream oss;
    oss << to_string(kind) << ": " << message;
    if (code != 0) {
        oss << " (code " << code << ")";
    }
    return oss.str();
}

} // namespace panxfer
