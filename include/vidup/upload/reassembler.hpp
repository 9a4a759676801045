#pragma once

#include "vidup/core/cancellation.hpp"
#include "vidup/core/error.hpp"
#include "vidup/upload/chunk_store.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace vidup::upload {

/**
 * @brief Concatenates a session's chunks into one staging artifact
 *
 * Chunks are read strictly in ascending index order 0..total_chunks-1,
 * independent of arrival or directory listing order. The artifact is
 * written next to the chunks (ChunkStore::artifact_path) and is left in
 * place on a size mismatch so it can be inspected.
 */
class Reassembler {
public:
    explicit Reassembler(const ChunkStore& store) : store_(store) {}

    /**
     * @brief Build the artifact and verify its length
     *
     * @return Path of the artifact, or
     *         ErrorKind::MissingChunk (names the first missing index),
     *         ErrorKind::SizeMismatch (artifact kept),
     *         ErrorKind::Cancelled, ErrorKind::Finalize (I/O failure)
     */
    UploadResult<std::filesystem::path> reassemble(const std::string& session_id,
                                                   std::uint32_t total_chunks,
                                                   std::uint64_t total_size,
                                                   const CancellationToken& cancellation) const;

private:
    const ChunkStore& store_;
};

} // namespace vidup::upload
