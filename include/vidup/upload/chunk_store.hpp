#pragma once

#include "vidup/core/cancellation.hpp"
#include "vidup/core/error.hpp"
#include "vidup/upload/byte_stream.hpp"
#include "vidup/upload/transfer_copier.hpp"

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>

namespace vidup::upload {

/**
 * @brief Per-session staging of numbered chunk files
 *
 * Layout: <staging_root>/<session_id>/chunk_<index>. A chunk is streamed
 * into chunk_<index>.part and renamed into place once complete, so an
 * interrupted write never looks like a persisted chunk. Rewriting an index
 * replaces the previous file (last write wins).
 */
class ChunkStore {
public:
    static constexpr const char* kArtifactName = "combined";

    explicit ChunkStore(std::filesystem::path staging_root, TransferCopier copier = TransferCopier{});

    UploadResult<std::uint64_t> write_chunk(const std::string& session_id,
                                            std::uint32_t chunk_index,
                                            ByteSource& source,
                                            const CancellationToken& cancellation) const;

    /// Indices of committed chunk files (in-flight .part files excluded)
    UploadResult<std::set<std::uint32_t>> list_chunks(const std::string& session_id) const;

    UploadResult<void> purge_session(const std::string& session_id) const;

    /// Remove everything below the staging root, returns entries removed
    UploadResult<std::size_t> wipe() const;

    std::filesystem::path session_dir(const std::string& session_id) const;
    std::filesystem::path chunk_path(const std::string& session_id, std::uint32_t chunk_index) const;
    std::filesystem::path artifact_path(const std::string& session_id) const;

    const std::filesystem::path& root() const noexcept { return root_; }
    const TransferCopier& copier() const noexcept { return copier_; }

    /**
     * @brief Whether the id can be used as a single path segment
     *
     * Accepts 1-128 characters from [A-Za-z0-9._-], excluding "." and "..".
     */
    static bool is_valid_session_id(const std::string& session_id);

private:
    UploadResult<void> check_session_id(const std::string& session_id) const;

    std::filesystem::path root_;
    TransferCopier copier_;
};

} // namespace vidup::upload
