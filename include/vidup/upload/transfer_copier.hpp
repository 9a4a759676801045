#pragma once

#include "vidup/core/cancellation.hpp"
#include "vidup/core/error.hpp"
#include "vidup/upload/byte_stream.hpp"

#include <cstddef>
#include <cstdint>

namespace vidup::upload {

/**
 * @brief Buffered, cancellation-aware copy between a source and a sink
 *
 * Used for every byte movement in the upload path: request body to chunk
 * file, chunk files to the staging artifact, and staging to the output
 * directory when a rename is not possible.
 *
 * The cancellation token is checked before every read, so a cancelled
 * transfer stops after at most one buffer. A short write fails the
 * transfer immediately; it is never retried.
 */
class TransferCopier {
public:
    static constexpr std::size_t kDefaultBufferSize = 32 * 1024;

    explicit TransferCopier(std::size_t buffer_size = kDefaultBufferSize);

    /**
     * @brief Copy until the source is exhausted
     *
     * @return Bytes copied, or ErrorKind::Cancelled / ErrorKind::ChunkWrite
     *         (or the source's own error kind)
     */
    UploadResult<std::uint64_t> copy(ByteSink& destination,
                                     ByteSource& source,
                                     const CancellationToken& cancellation) const;

    std::size_t buffer_size() const noexcept { return buffer_size_; }

private:
    std::size_t buffer_size_;
};

} // namespace vidup::upload
