#include "vidup/upload/session_tracker.hpp"

namespace vidup::upload {

UploadResult<void> SessionTracker::check_declaration(const UploadSessionInfo* existing,
                                                     const SessionDescriptor& descriptor,
                                                     std::uint32_t chunk_index) {
    if (descriptor.total_chunks == 0) {
        return upload_error(ErrorKind::Validation, "total_chunks must be at least 1");
    }
    if (chunk_index >= descriptor.total_chunks) {
        return upload_error(ErrorKind::Validation,
                            "chunk_index " + std::to_string(chunk_index) + " out of range for " +
                            std::to_string(descriptor.total_chunks) + " chunks");
    }
    if (existing != nullptr && !(existing->descriptor == descriptor)) {
        return upload_error(ErrorKind::Validation,
                            "Upload " + descriptor.session_id + " was declared with different "
                            "filename, total_chunks or total_size");
    }
    return Ok();
}

bool SessionTracker::is_complete(const UploadSessionInfo& info) {
    const auto total = info.descriptor.total_chunks;
    if (info.received.size() != total) {
        return false;
    }
    std::uint32_t expected = 0;
    for (auto index : info.received) {
        if (index != expected++) {
            return false;
        }
    }
    return true;
}

UploadResult<void> SessionTracker::validate(const SessionDescriptor& descriptor,
                                            std::uint32_t chunk_index) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(descriptor.session_id);
    return check_declaration(it == sessions_.end() ? nullptr : &it->second, descriptor, chunk_index);
}

UploadResult<ChunkProgress> SessionTracker::record_chunk_and_check_complete(const SessionDescriptor& descriptor,
                                                                            std::uint32_t chunk_index) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(descriptor.session_id);
    const UploadSessionInfo* existing = it == sessions_.end() ? nullptr : &it->second;
    if (auto res = check_declaration(existing, descriptor, chunk_index); res.is_error()) {
        return Fail(res.error());
    }

    ChunkProgress progress;
    if (it == sessions_.end()) {
        auto done = finalized_.find(descriptor.session_id);
        if (done != finalized_.end()) {
            progress.already_finalized = true;
            progress.received = done->second.descriptor.total_chunks;
            progress.total_chunks = done->second.descriptor.total_chunks;
            progress.complete = true;
            return Ok(progress);
        }

        UploadSessionInfo info;
        info.descriptor = descriptor;
        info.created_at = std::chrono::system_clock::now();
        it = sessions_.emplace(descriptor.session_id, std::move(info)).first;
        progress.new_session = true;
    }

    auto& info = it->second;
    info.received.insert(chunk_index);
    info.last_activity = std::chrono::steady_clock::now();

    progress.received = info.received.size();
    progress.total_chunks = info.descriptor.total_chunks;
    progress.complete = is_complete(info);
    return Ok(progress);
}

bool SessionTracker::try_claim_completion(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return false;
    }
    auto& info = it->second;
    if (info.state != SessionState::Receiving || !is_complete(info)) {
        return false;
    }
    info.state = SessionState::Finalizing;
    return true;
}

void SessionTracker::release_claim(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        it->second.state = SessionState::Receiving;
        it->second.last_activity = std::chrono::steady_clock::now();
    }
}

void SessionTracker::mark_finalized(const std::string& session_id,
                                    const std::filesystem::path& final_path,
                                    std::uint64_t final_size) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return;
    }
    FinalizedUpload done;
    done.descriptor = it->second.descriptor;
    done.final_path = final_path;
    done.final_size = final_size;
    done.finalized_at = std::chrono::steady_clock::now();
    finalized_[session_id] = std::move(done);
    sessions_.erase(it);
}

std::optional<FinalizedUpload> SessionTracker::find_finalized(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    auto it = finalized_.find(session_id);
    if (it == finalized_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void SessionTracker::begin_write(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        it->second.pending_writes++;
        it->second.last_activity = std::chrono::steady_clock::now();
    }
}

void SessionTracker::end_write(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end() && it->second.pending_writes > 0) {
        it->second.pending_writes--;
    }
}

void SessionTracker::forget(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    sessions_.erase(session_id);
}

std::optional<UploadSessionInfo> SessionTracker::find(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t SessionTracker::size() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionTracker::expire_idle(std::chrono::steady_clock::duration max_idle,
                                                     std::chrono::steady_clock::time_point now) {
    std::lock_guard lock(mutex_);
    std::vector<std::string> expired;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        const auto& info = it->second;
        if (info.state == SessionState::Receiving && info.pending_writes == 0 &&
            now - info.last_activity > max_idle) {
            expired.push_back(it->first);
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto it = finalized_.begin(); it != finalized_.end();) {
        if (now - it->second.finalized_at > max_idle) {
            it = finalized_.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

} // namespace vidup::upload
