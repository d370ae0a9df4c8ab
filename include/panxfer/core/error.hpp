#pragma once

#include <string>

namespace panxfer {

enum class ErrorKind {
    Io,          ///< Local file open/read/write failure
    Network,     ///< Transport-level send or receive failure
    Api,         ///< Service returned a non-success status or code
    Protocol,    ///< Response shape violated an expected invariant
    Resolution,  ///< Download link could not be extracted
    Finalize,    ///< One of the completion signals failed
    Config       ///< Configuration file missing or malformed
};

const char* to_string(ErrorKind kind) noexcept;

/**
 * @brief Error value carried by every failed panxfer::Result
 */
struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;
    int code = 0;  ///< Service code or HTTP status where one exists

    Error() = default;
    Error(ErrorKind k, std::string msg, int c = 0)
        : kind(k), message(std::move(msg)), code(c) {}

    /// Human-readable reason, e.g. "Api: quota exceeded (code 5113)"
    std::string describe() const;
};

inline Error io_error(std::string message) {
    return Error(ErrorKind::Io, std::move(message));
}

inline Error network_error(std::string message) {
    return Error(ErrorKind::Network, std::move(message));
}

inline Error api_error(int code, std::string message) {
    return Error(ErrorKind::Api, std::move(message), code);
}

inline Error protocol_error(std::string message) {
    return Error(ErrorKind::Protocol, std::move(message));
}

} // namespace panxfer
