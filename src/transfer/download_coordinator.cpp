#include "panxfer/transfer/download_coordinator.hpp"
#include "panxfer/events/progress.hpp"
#include "panxfer/transfer/download_streamer.hpp"
#include "panxfer/transfer/redirect_resolver.hpp"

#include <spdlog/spdlog.h>

namespace panxfer::transfer {

namespace {

Error fail(TransferSession& session, events::ProgressReporter& reporter, Error error) {
    const auto reason = error.describe();
    spdlog::error("Download of {} failed in {}: {}", session.remote_target(), to_string(session.state()), reason);
    (void)session.mark_failed(reason);
    reporter.failed(reason);
    return error;
}

} // namespace

DownloadCoordinator::DownloadCoordinator(const api::ServiceClient& client) : client_(client) {}

Result<DownloadOutcome> DownloadCoordinator::download(const api::FileEntry& entry,
                                                      const std::filesystem::path& destination,
                                                      const events::ProgressSink& sink) const {
    const std::string id = std::to_string(entry.id);
    TransferSession session(TransferDirection::Download, destination, id);
    events::ProgressReporter reporter(id, sink);
    RedirectResolver resolver(client_);

    (void)session.transition_to(TransferState::RequestingTicket);
    auto ticket = resolver.request_ticket(entry);
    if (ticket.is_error()) {
        return Err<DownloadOutcome>(fail(session, reporter, ticket.error()));
    }

    (void)session.transition_to(TransferState::Resolving);
    auto resolved = resolver.resolve_for(entry, ticket.value());
    if (resolved.is_error()) {
        return Err<DownloadOutcome>(fail(session, reporter, resolved.error()));
    }

    const auto& source = resolved.value();
    if (source.declared_size) {
        session.set_total_bytes(*source.declared_size);
    }

    (void)session.transition_to(TransferState::Streaming);
    spdlog::info("Downloading {} into {}", entry.name, destination.string());
    DownloadStreamer streamer(client_.transport());
    auto written = streamer.stream_to_file(source, destination, reporter);
    if (written.is_error()) {
        return Err<DownloadOutcome>(fail(session, reporter, written.error()));
    }

    session.add_progress(written.value());
    (void)session.transition_to(TransferState::Finished);
    spdlog::info("Downloaded {} ({} bytes)", entry.name, written.value());

    DownloadOutcome outcome;
    outcome.bytes_written = written.value();
    outcome.resolved_url = source.url;
    return Ok(std::move(outcome));
}

} // namespace panxfer::transfer
