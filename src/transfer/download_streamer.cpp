#include "panxfer/transfer/download_streamer.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace panxfer::transfer {

DownloadStreamer::DownloadStreamer(network::HttpTransport& transport) : transport_(transport) {}

std::optional<std::uint64_t> DownloadStreamer::effective_total(std::optional<std::uint64_t> content_length,
                                                               std::optional<std::uint64_t> declared_size) {
    if (content_length && *content_length > 0) {
        return content_length;
    }
    if (declared_size && *declared_size > 0) {
        return declared_size;
    }
    return std::nullopt;
}

Result<std::uint64_t> DownloadStreamer::stream_to_file(const api::ResolvedDownloadUrl& source,
                                                       const std::filesystem::path& destination,
                                                       events::ProgressReporter& reporter) const {
    network::HttpRequest request;
    request.method = network::HttpMethod::GET;
    request.url = source.url;
    request.follow_redirects = true;

    std::ofstream output;
    std::optional<Error> failure;
    std::optional<std::uint64_t> total;
    std::uint64_t written = 0;

    auto on_head = [&](const network::HttpResponseHead& head) {
        if (!head.is_success()) {
            failure = api_error(static_cast<int>(head.status),
                                "download returned HTTP " + std::to_string(head.status));
            return false;
        }
        total = effective_total(head.content_length, source.declared_size);

        output.open(destination, std::ios::binary | std::ios::trunc);
        if (!output) {
            failure = io_error("Failed to create file: " + destination.string());
            return false;
        }
        spdlog::debug("Streaming into {} (size {})", destination.string(),
                      total ? std::to_string(*total) : std::string("unknown"));
        return true;
    };

    auto on_chunk = [&](const char* data, std::size_t size) {
        output.write(data, static_cast<std::streamsize>(size));
        if (!output) {
            failure = io_error("Write failed on " + destination.string());
            return false;
        }
        written += size;
        if (total) {
            reporter.report(events::TransferStatus::Downloading, written * 100 / *total, written);
        }
        return true;
    };

    auto streamed = transport_.stream(request, on_head, on_chunk);
    if (failure) {
        return Err<std::uint64_t>(*failure);
    }
    if (streamed.is_error()) {
        return Err<std::uint64_t>(network_error("download stream interrupted: " + streamed.error().message));
    }

    output.close();
    if (output.fail()) {
        return Err<std::uint64_t>(io_error("Failed to flush " + destination.string()));
    }

    reporter.finished(written);
    return Ok(written);
}

} // namespace panxfer::transfer
