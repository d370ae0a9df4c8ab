#include "panxfer/transfer/upload_coordinator.hpp"
#include "panxfer/api/endpoints.hpp"

#include <spdlog/spdlog.h>

#include <variant>

namespace panxfer::transfer {

UploadCoordinator::UploadCoordinator(const api::ServiceClient& client,
                                     core::TaskRunner& hashing_runner,
                                     std::size_t part_size,
                                     std::size_t hash_buffer_size)
    : client_(client),
      hashing_runner_(hashing_runner),
      part_size_(part_size == 0 ? ChunkPlanner::kDefaultPartSize : part_size),
      hasher_(hash_buffer_size) {}

Error UploadCoordinator::fail(TransferSession& session, events::ProgressReporter& reporter, Error error) const {
    const auto reason = error.describe();
    spdlog::error("Upload of {} failed in {}: {}", session.local_path().string(), to_string(session.state()), reason);
    // Failed is reachable from every live state, so this cannot be refused
    (void)session.mark_failed(reason);
    reporter.failed(reason);
    return error;
}

Result<UploadOutcome> UploadCoordinator::upload(const UploadRequest& request, const events::ProgressSink& sink) {
    const std::string local = request.local_path.string();
    TransferSession session(TransferDirection::Upload, request.local_path, std::to_string(request.parent_folder_id));
    events::ProgressReporter reporter(local, sink);

    // ─── Hashing ───
    (void)session.transition_to(TransferState::Hashing);
    reporter.report(events::TransferStatus::Hashing, 0);

    const std::string file_name = request.file_name.empty()
        ? request.local_path.filename().string()
        : request.file_name;
    if (file_name.empty()) {
        return Err<UploadOutcome>(fail(session, reporter, io_error("Invalid file path: " + local)));
    }

    spdlog::info("Hashing {}", local);
    auto fingerprint = hasher_.hash_file_async(request.local_path, hashing_runner_).get();
    if (fingerprint.is_error()) {
        return Err<UploadOutcome>(fail(session, reporter, fingerprint.error()));
    }
    const auto& content = fingerprint.value();
    session.set_total_bytes(content.length);

    // ─── Negotiating ───
    (void)session.transition_to(TransferState::Negotiating);
    auto negotiated = negotiate(file_name, request.parent_folder_id, content);
    if (negotiated.is_error()) {
        return Err<UploadOutcome>(fail(session, reporter, negotiated.error()));
    }

    UploadOutcome outcome;
    outcome.size = content.length;
    outcome.fingerprint = content.hex;
    outcome.renamed = negotiated.value().renamed;

    const auto& negotiation = negotiated.value().negotiation;
    if (const auto* reused = std::get_if<api::Reused>(&negotiation)) {
        (void)session.transition_to(TransferState::Reused);
        (void)session.transition_to(TransferState::Finished);
        spdlog::info("Instant upload of {}: content already on server", file_name);
        outcome.file_id = reused->final_file_id;
        outcome.reused = true;
        reporter.finished(content.length);
        return Ok(std::move(outcome));
    }

    // ─── ChunkUploading ───
    const auto& chunk_session = std::get<api::ChunkSession>(negotiation);
    (void)session.transition_to(TransferState::ChunkUploading);
    ChunkUploader uploader(client_, chunk_session);

    auto initialized = uploader.initialize();
    if (initialized.is_error()) {
        return Err<UploadOutcome>(fail(session, reporter, initialized.error()));
    }

    auto parts = upload_parts(uploader, session, reporter);
    if (parts.is_error()) {
        return Err<UploadOutcome>(fail(session, reporter, parts.error()));
    }
    outcome.parts_uploaded = parts.value();

    // ─── Finalizing ───
    (void)session.transition_to(TransferState::Finalizing);
    auto finalized = finalize(uploader, chunk_session.final_file_id);
    if (finalized.is_error()) {
        return Err<UploadOutcome>(fail(session, reporter, finalized.error()));
    }

    (void)session.transition_to(TransferState::Finished);
    outcome.file_id = chunk_session.final_file_id;
    spdlog::info("Uploaded {} as {} in {} parts", local, outcome.file_id, outcome.parts_uploaded);
    reporter.finished(session.bytes_done());
    return Ok(std::move(outcome));
}

Result<UploadCoordinator::Negotiated> UploadCoordinator::negotiate(const std::string& file_name,
                                                                   std::int64_t parent_folder_id,
                                                                   const ContentFingerprint& fingerprint) const {
    auto make_payload = [&](api::DuplicatePolicy policy) {
        return nlohmann::json{
            {"driveId", 0},
            {"etag", fingerprint.hex},
            {"fileName", file_name},
            {"parentFileId", parent_folder_id},
            {"size", fingerprint.length},
            {"type", 0},
            {"duplicate", static_cast<int>(policy)},
        };
    };

    auto envelope = client_.post_json(api::endpoints::kUploadRequest, make_payload(api::DuplicatePolicy::Ask));
    if (envelope.is_error()) {
        return Err<Negotiated>(envelope.error());
    }

    bool renamed = false;
    if (envelope.value().code == api::endpoints::kNameConflictCode) {
        spdlog::info("{} already exists in folder {}, retrying with auto-rename", file_name, parent_folder_id);
        envelope = client_.post_json(api::endpoints::kUploadRequest, make_payload(api::DuplicatePolicy::Rename));
        if (envelope.is_error()) {
            return Err<Negotiated>(envelope.error());
        }
        renamed = true;
    }

    const auto& reply = envelope.value();
    if (reply.code != 0) {
        return Err<Negotiated>(api_error(reply.code, "upload request rejected: " +
                                         (reply.message.empty() ? std::string("no message") : reply.message)));
    }

    auto negotiation = api::parse_negotiation(reply.data);
    if (negotiation.is_error()) {
        return Err<Negotiated>(negotiation.error());
    }
    return Ok(Negotiated{std::move(negotiation.value()), renamed});
}

Result<std::uint32_t> UploadCoordinator::upload_parts(const ChunkUploader& uploader,
                                                      TransferSession& session,
                                                      events::ProgressReporter& reporter) const {
    ChunkPlanner planner(session.local_path(), part_size_);
    if (auto opened = planner.open(); opened.is_error()) {
        return Err<std::uint32_t>(opened.error());
    }

    while (true) {
        auto next = planner.next();
        if (next.is_error()) {
            return Err<std::uint32_t>(next.error());
        }
        if (!next.value().has_value()) {
            break;
        }

        const auto& part = *next.value();
        auto sent = uploader.upload_part(part.part_number, part.bytes);
        if (sent.is_error()) {
            return Err<std::uint32_t>(sent.error());
        }

        session.add_progress(part.bytes.size());
        if (session.total_bytes() > 0) {
            reporter.report(events::TransferStatus::Uploading, session.percent(), session.bytes_done());
        }
    }
    return Ok(planner.parts_read());
}

Result<void> UploadCoordinator::finalize(const ChunkUploader& uploader, std::int64_t final_file_id) const {
    if (auto storage = uploader.complete(); storage.is_error()) {
        return storage;
    }

    auto response = client_.post_raw(api::endpoints::kUploadComplete, nlohmann::json{{"fileId", final_file_id}});
    if (response.is_error()) {
        return Err<void>(Error(ErrorKind::Finalize,
                               "upload completion signal failed: " + response.error().message));
    }
    if (!response.value().is_success()) {
        return Err<void>(Error(ErrorKind::Finalize,
                               "upload completion returned HTTP " + std::to_string(response.value().status),
                               static_cast<int>(response.value().status)));
    }
    return Ok();
}

} // namespace panxfer::transfer
