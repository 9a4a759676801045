#pragma once

#include "vidup/core/error.hpp"
#include "vidup/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vidup::upload {

/**
 * @brief In-memory registry of active upload sessions
 *
 * Sessions are created implicitly by their first recorded chunk and removed
 * by mark_finalized() after a successful finalize, by forget(), or by
 * expire_idle(). A finalized session leaves a tombstone until it is older
 * than the idle limit; chunks recorded against it never reopen the session.
 * Nothing is persisted; a restart starts from an empty registry and a wiped
 * staging area.
 *
 * Completion is decided by set equality: the received indices must be
 * exactly {0..total_chunks-1}. Re-sending an index never counts twice.
 *
 * Thread safety: all methods are safe to call concurrently.
 */
class SessionTracker {
public:
    /**
     * @brief Check a chunk against the session's declaration without recording it
     *
     * Fails with ErrorKind::Validation when the index is out of range or the
     * descriptor contradicts the one the session was created with.
     */
    UploadResult<void> validate(const SessionDescriptor& descriptor, std::uint32_t chunk_index) const;

    /**
     * @brief Record a persisted chunk and report whether the set is complete
     */
    UploadResult<ChunkProgress> record_chunk_and_check_complete(const SessionDescriptor& descriptor,
                                                                std::uint32_t chunk_index);

    /**
     * @brief Completion latch
     *
     * Returns true for exactly one caller while the session is complete and
     * Receiving; the session moves to Finalizing. Every later caller gets
     * false until release_claim() or forget().
     */
    bool try_claim_completion(const std::string& session_id);

    /// Return a Finalizing session to Receiving after a failed finalize
    void release_claim(const std::string& session_id);

    /**
     * @brief Replace a session by its tombstone once its file is in place
     */
    void mark_finalized(const std::string& session_id,
                        const std::filesystem::path& final_path,
                        std::uint64_t final_size);

    std::optional<FinalizedUpload> find_finalized(const std::string& session_id) const;

    void forget(const std::string& session_id);

    /**
     * @brief Pin an existing session while one of its chunks is being written
     *
     * A pinned session counts as active and is skipped by expire_idle().
     * Every begin_write() must be paired with end_write(); both are no-ops
     * for unknown sessions.
     */
    void begin_write(const std::string& session_id);
    void end_write(const std::string& session_id);

    std::optional<UploadSessionInfo> find(const std::string& session_id) const;

    std::size_t size() const;

    /**
     * @brief Drop Receiving sessions idle for longer than max_idle
     *
     * Sessions with a chunk write in progress are kept. Tombstones older
     * than max_idle are dropped as well.
     *
     * @return Ids of the dropped sessions (their staging data is the caller's to purge)
     */
    std::vector<std::string> expire_idle(std::chrono::steady_clock::duration max_idle,
                                         std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

private:
    static bool is_complete(const UploadSessionInfo& info);
    static UploadResult<void> check_declaration(const UploadSessionInfo* existing,
                                                const SessionDescriptor& descriptor,
                                                std::uint32_t chunk_index);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, UploadSessionInfo> sessions_;
    std::unordered_map<std::string, FinalizedUpload> finalized_;
};

} // namespace vidup::upload
