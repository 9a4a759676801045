#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace vidup::upload {

/**
 * @brief What the client declares about an upload, repeated on every chunk
 *
 * The first chunk of a session fixes the declaration; later chunks must
 * repeat it unchanged.
 */
struct SessionDescriptor {
    std::string session_id;
    std::string filename;            ///< Untrusted, sanitized before use on disk
    std::uint32_t total_chunks = 0;
    std::uint64_t total_size = 0;
};

inline bool operator==(const SessionDescriptor& a, const SessionDescriptor& b) {
    return a.session_id == b.session_id && a.filename == b.filename &&
           a.total_chunks == b.total_chunks && a.total_size == b.total_size;
}

enum class SessionState {
    Receiving,   // Accepting chunks
    Finalizing   // One request holds the completion claim
};

/**
 * @brief Tracker view of one upload session
 */
struct UploadSessionInfo {
    SessionDescriptor descriptor;
    std::set<std::uint32_t> received;   ///< Distinct chunk indices persisted so far
    SessionState state = SessionState::Receiving;
    std::chrono::system_clock::time_point created_at{};
    std::chrono::steady_clock::time_point last_activity{};
    std::uint32_t pending_writes = 0;   ///< Chunk writes in progress for this session
};

/**
 * @brief What remains of a session after its file was finalized
 *
 * Kept for a while so a re-sent chunk (e.g. after a lost response) is
 * answered with the existing result instead of starting the upload over.
 */
struct FinalizedUpload {
    SessionDescriptor descriptor;
    std::filesystem::path final_path;
    std::uint64_t final_size = 0;
    std::chrono::steady_clock::time_point finalized_at{};
};

/**
 * @brief Result of recording one chunk
 */
struct ChunkProgress {
    std::size_t received = 0;
    std::uint32_t total_chunks = 0;
    bool complete = false;      ///< Received indices are exactly {0..total_chunks-1}
    bool new_session = false;   ///< This chunk created the session
    bool already_finalized = false;   ///< The session was finalized before this chunk was recorded
};

/**
 * @brief One inbound chunk request, minus its payload
 */
struct ChunkRequest {
    SessionDescriptor descriptor;
    std::uint32_t chunk_index = 0;
};

enum class ChunkStatus {
    InProgress,   // More chunks expected
    Complete,     // This request reassembled and finalized the upload
    Finalizing    // Complete, but a concurrent request owns the finalize step
};

struct ChunkOutcome {
    ChunkStatus status = ChunkStatus::InProgress;
    std::size_t received = 0;
    std::uint32_t total_chunks = 0;
    std::uint64_t bytes_written = 0;
    std::optional<std::filesystem::path> final_path;
    std::uint64_t final_size = 0;
};

inline const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Receiving: return "receiving";
        case SessionState::Finalizing: return "finalizing";
    }
    return "unknown";
}

inline const char* to_string(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::InProgress: return "in_progress";
        case ChunkStatus::Complete: return "complete";
        case ChunkStatus::Finalizing: return "finalizing";
    }
    return "unknown";
}

} // namespace vidup::upload
