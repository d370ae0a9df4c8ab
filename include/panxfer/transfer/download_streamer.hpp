#pragma once

#include "panxfer/api/models.hpp"
#include "panxfer/core/result.hpp"
#include "panxfer/events/progress.hpp"
#include "panxfer/network/transport.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>

namespace panxfer::transfer {

/**
 * @brief Streams a resolved URL to a local file
 *
 * The destination is created (or truncated) when a 2xx response head
 * arrives, then every chunk is written in arrival order. Percent is
 * reported only when a positive total is known: the response's
 * Content-Length first, else the declared size. A final 100/finished
 * event follows a clean end of stream.
 */
class DownloadStreamer {
public:
    explicit DownloadStreamer(network::HttpTransport& transport);

    /// Bytes written on success
    Result<std::uint64_t> stream_to_file(const api::ResolvedDownloadUrl& source,
                                         const std::filesystem::path& destination,
                                         events::ProgressReporter& reporter) const;

    /// Size of record: positive content length, else positive declared size
    static std::optional<std::uint64_t> effective_total(std::optional<std::uint64_t> content_length,
                                                        std::optional<std::uint64_t> declared_size);

private:
    network::HttpTransport& transport_;
};

} // namespace panxfer::transfer
