#include "vidup/upload/service.hpp"

#include "vidup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace vidup::upload {
namespace fs = std::filesystem;

namespace {

// Keeps an existing session out of the idle sweep while its chunk is written
class PendingWrite {
public:
    PendingWrite(SessionTracker& tracker, std::string session_id)
        : tracker_(tracker), session_id_(std::move(session_id)) {
        tracker_.begin_write(session_id_);
    }

    ~PendingWrite() {
        tracker_.end_write(session_id_);
    }

    PendingWrite(const PendingWrite&) = delete;
    PendingWrite& operator=(const PendingWrite&) = delete;

private:
    SessionTracker& tracker_;
    std::string session_id_;
};

ChunkOutcome finalized_outcome(const FinalizedUpload& done) {
    ChunkOutcome outcome;
    outcome.status = ChunkStatus::Complete;
    outcome.received = done.descriptor.total_chunks;
    outcome.total_chunks = done.descriptor.total_chunks;
    outcome.final_path = done.final_path;
    outcome.final_size = done.final_size;
    return outcome;
}

} // namespace

UploadService::UploadService(const Config& config, events::EventBus& bus)
    : config_(config),
      event_bus_(bus),
      store_(config.staging_dir),
      reassembler_(store_),
      finalizer_(config.upload_dir) {
}

ErrValue<UploadError> UploadService::report_failure(const std::string& session_id, UploadError error) {
    event_bus_.emit(events::UploadFailedEvent{session_id, error.kind, error.message});
    return Fail(std::move(error));
}

UploadResult<ChunkOutcome> UploadService::handle_chunk(const ChunkRequest& request,
                                                       ByteSource& payload,
                                                       const CancellationToken& cancellation) {
    const auto& descriptor = request.descriptor;
    const auto& session_id = descriptor.session_id;

    if (descriptor.total_size > config_.max_upload_size) {
        return report_failure(session_id, UploadError{
            ErrorKind::PayloadTooLarge,
            "Declared size " + std::to_string(descriptor.total_size) + " exceeds the " +
            std::to_string(config_.max_upload_size) + " byte limit"});
    }
    if (!ChunkStore::is_valid_session_id(session_id)) {
        return report_failure(session_id, UploadError{ErrorKind::Validation,
                                                      "Invalid upload id: '" + session_id + "'"});
    }
    if (descriptor.filename.empty()) {
        return report_failure(session_id, UploadError{ErrorKind::Validation, "filename is required"});
    }
    if (auto res = tracker_.validate(descriptor, request.chunk_index); res.is_error()) {
        return report_failure(session_id, res.error());
    }
    if (auto done = tracker_.find_finalized(session_id)) {
        if (!(done->descriptor == descriptor)) {
            return report_failure(session_id, UploadError{
                ErrorKind::Validation,
                "Upload " + session_id + " was already completed with a different declaration"});
        }
        spdlog::debug("Chunk {} of finished upload {} ignored", request.chunk_index, session_id);
        return Ok(finalized_outcome(*done));
    }

    UploadResult<std::uint64_t> written = Ok(std::uint64_t{0});
    {
        PendingWrite pending(tracker_, session_id);
        written = store_.write_chunk(session_id, request.chunk_index, payload, cancellation);
    }
    if (written.is_error()) {
        return report_failure(session_id, written.error());
    }

    auto progress = tracker_.record_chunk_and_check_complete(descriptor, request.chunk_index);
    if (progress.is_error()) {
        return report_failure(session_id, progress.error());
    }
    if (progress.value().already_finalized) {
        // Finalized while this chunk was being written; drop the stray copy
        if (auto res = store_.purge_session(session_id); res.is_error()) {
            spdlog::warn("Failed to remove late chunk of {}: {}", session_id, res.error().message);
        }
        if (auto done = tracker_.find_finalized(session_id)) {
            return Ok(finalized_outcome(*done));
        }
        return upload_error(ErrorKind::Validation, "Upload " + session_id + " is no longer active");
    }

    if (progress.value().new_session) {
        event_bus_.emit(events::UploadStartedEvent{
            session_id, descriptor.filename, descriptor.total_chunks, descriptor.total_size});
    }
    event_bus_.emit(events::ChunkStoredEvent{
        session_id, request.chunk_index, descriptor.total_chunks,
        progress.value().received, written.value()});

    ChunkOutcome outcome;
    outcome.status = ChunkStatus::InProgress;
    outcome.received = progress.value().received;
    outcome.total_chunks = descriptor.total_chunks;
    outcome.bytes_written = written.value();

    if (!progress.value().complete) {
        return Ok(outcome);
    }
    if (!tracker_.try_claim_completion(session_id)) {
        // Another request holds the claim and is reassembling
        outcome.status = ChunkStatus::Finalizing;
        return Ok(outcome);
    }
    return complete_upload(descriptor, outcome, cancellation);
}

UploadResult<ChunkOutcome> UploadService::complete_upload(const SessionDescriptor& descriptor,
                                                          ChunkOutcome outcome,
                                                          const CancellationToken& cancellation) {
    const auto& session_id = descriptor.session_id;
    const auto info = tracker_.find(session_id);

    spdlog::debug("All {} chunks of {} received, reassembling", descriptor.total_chunks, session_id);

    auto artifact = reassembler_.reassemble(session_id, descriptor.total_chunks,
                                            descriptor.total_size, cancellation);
    if (artifact.is_error()) {
        tracker_.release_claim(session_id);
        return report_failure(session_id, artifact.error());
    }

    auto final_path = finalizer_.finalize(artifact.value(), descriptor.filename);
    if (final_path.is_error()) {
        tracker_.release_claim(session_id);
        return report_failure(session_id, final_path.error());
    }

    if (auto res = store_.purge_session(session_id); res.is_error()) {
        // The upload is complete; leftover chunks are removed at next startup
        spdlog::warn("Upload {} finalized but staging cleanup failed: {}",
                     session_id, res.error().message);
    }
    tracker_.mark_finalized(session_id, final_path.value(), descriptor.total_size);

    outcome.status = ChunkStatus::Complete;
    outcome.final_path = final_path.value();
    outcome.final_size = descriptor.total_size;

    events::UploadCompletedEvent completed;
    completed.session_id = session_id;
    completed.filename = descriptor.filename;
    completed.stored_as = final_path.value().filename().string();
    completed.total_bytes = descriptor.total_size;
    if (info) {
        completed.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now() - info->created_at);
    }
    event_bus_.emit(completed);

    return Ok(outcome);
}

UploadResult<AdoptedUpload> UploadService::adopt_completed_upload(const fs::path& source,
                                                                  const std::string& original_filename) {
    std::error_code ec;
    const auto size = fs::file_size(source, ec);
    if (ec) {
        return upload_error(ErrorKind::Finalize,
                            "Cannot adopt " + source.string() + ": " + ec.message());
    }

    auto final_path = finalizer_.finalize(source, original_filename);
    if (final_path.is_error()) {
        return Fail(final_path.error());
    }

    event_bus_.emit(events::UploadAdoptedEvent{
        source.string(), final_path.value().filename().string(), size});
    return Ok(AdoptedUpload{final_path.value(), size});
}

std::optional<UploadSessionInfo> UploadService::session_info(const std::string& session_id) const {
    return tracker_.find(session_id);
}

std::size_t UploadService::active_sessions() const {
    return tracker_.size();
}

std::size_t UploadService::expire_idle_sessions(std::chrono::steady_clock::time_point now) {
    const auto expired = tracker_.expire_idle(config_.session_ttl, now);
    for (const auto& session_id : expired) {
        if (auto res = store_.purge_session(session_id); res.is_error()) {
            spdlog::warn("Failed to purge expired upload {}: {}", session_id, res.error().message);
        }
        event_bus_.emit(events::SessionExpiredEvent{session_id});
    }
    return expired.size();
}

UploadResult<void> UploadService::recover_on_startup() {
    std::error_code ec;
    fs::create_directories(config_.staging_dir, ec);
    if (ec && !fs::is_directory(config_.staging_dir)) {
        return upload_error(ErrorKind::ChunkWrite,
                            "Failed to create staging directory " + config_.staging_dir.string() +
                            ": " + ec.message());
    }
    fs::create_directories(config_.upload_dir, ec);
    if (ec && !fs::is_directory(config_.upload_dir)) {
        return upload_error(ErrorKind::Finalize,
                            "Failed to create upload directory " + config_.upload_dir.string() +
                            ": " + ec.message());
    }

    auto wiped = store_.wipe();
    if (wiped.is_error()) {
        return Fail(wiped.error());
    }
    if (wiped.value() > 0) {
        spdlog::info("Removed {} stale entries from {}", wiped.value(), config_.staging_dir.string());
    }

    const auto partials = finalizer_.sweep_partials();
    if (partials > 0) {
        spdlog::info("Removed {} interrupted copies from {}", partials, config_.upload_dir.string());
    }
    return Ok();
}

} // namespace vidup::upload
