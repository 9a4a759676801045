#pragma once

#include "vidup/core/cancellation.hpp"
#include "vidup/core/config.hpp"
#include "vidup/core/error.hpp"
#include "vidup/events/event_bus.hpp"
#include "vidup/upload/byte_stream.hpp"
#include "vidup/upload/chunk_store.hpp"
#include "vidup/upload/finalizer.hpp"
#include "vidup/upload/reassembler.hpp"
#include "vidup/upload/session_tracker.hpp"
#include "vidup/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace vidup::upload {

struct AdoptedUpload {
    std::filesystem::path final_path;
    std::uint64_t size = 0;
};

/**
 * @brief Chunk ingestion pipeline: validate, persist, record, and on the
 *        last chunk reassemble and finalize
 *
 * Every failure is scoped to one session and leaves the others untouched.
 * A failed reassembly or finalize keeps the staged chunks and releases the
 * completion claim, so the client may resend and retry.
 *
 * Thread safety: handle_chunk() may run concurrently for any mix of
 * sessions and indices; exactly one request per complete session performs
 * the reassembly.
 */
class UploadService {
public:
    UploadService(const Config& config, events::EventBus& bus);

    /**
     * @brief Persist one chunk and finish the upload if it was the last one
     *
     * @param payload Chunk bytes, read to end of stream
     * @return Progress, or the upload's final location when this request
     *         completed it
     */
    UploadResult<ChunkOutcome> handle_chunk(const ChunkRequest& request,
                                            ByteSource& payload,
                                            const CancellationToken& cancellation);

    /**
     * @brief Move an upload completed outside the chunk endpoint into the output directory
     *
     * Used by resumable-upload protocol integrations that assemble the file
     * themselves. The final name follows the same convention as chunked uploads.
     */
    UploadResult<AdoptedUpload> adopt_completed_upload(const std::filesystem::path& source,
                                                       const std::string& original_filename);

    std::optional<UploadSessionInfo> session_info(const std::string& session_id) const;

    std::size_t active_sessions() const;

    /**
     * @brief Drop sessions idle for longer than the configured TTL and purge their chunks
     *
     * @return Number of sessions expired
     */
    std::size_t expire_idle_sessions(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    /**
     * @brief Clear state left by a previous process: all staging content and
     *        interrupted .partial copies in the output directory
     */
    UploadResult<void> recover_on_startup();

    const Config& config() const noexcept { return config_; }
    const ChunkStore& chunk_store() const noexcept { return store_; }

private:
    UploadResult<ChunkOutcome> complete_upload(const SessionDescriptor& descriptor,
                                               ChunkOutcome outcome,
                                               const CancellationToken& cancellation);

    ErrValue<UploadError> report_failure(const std::string& session_id, UploadError error);

    Config config_;
    events::EventBus& event_bus_;
    ChunkStore store_;
    SessionTracker tracker_;
    Reassembler reassembler_;
    Finalizer finalizer_;
};

} // namespace vidup::upload
