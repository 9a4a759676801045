#include "vidup/upload/transfer_copier.hpp"

#include <string>
#include <vector>

namespace vidup::upload {

TransferCopier::TransferCopier(std::size_t buffer_size)
    : buffer_size_(buffer_size == 0 ? kDefaultBufferSize : buffer_size) {
}

UploadResult<std::uint64_t> TransferCopier::copy(ByteSink& destination,
                                                 ByteSource& source,
                                                 const CancellationToken& cancellation) const {
    std::vector<char> buffer(buffer_size_);
    std::uint64_t written = 0;

    for (;;) {
        if (cancellation.is_cancelled()) {
            return upload_error(ErrorKind::Cancelled,
                                "Transfer cancelled after " + std::to_string(written) + " bytes");
        }

        auto read_result = source.read(buffer.data(), buffer.size());
        if (read_result.is_error()) {
            return Fail(read_result.error());
        }
        const std::size_t n = read_result.value();
        if (n == 0) {
            break;
        }

        auto write_result = destination.write(buffer.data(), n);
        if (write_result.is_error()) {
            return Fail(write_result.error());
        }
        written += write_result.value();
        if (write_result.value() != n) {
            return upload_error(ErrorKind::ChunkWrite,
                                "Short write: " + std::to_string(write_result.value()) + " of " +
                                std::to_string(n) + " bytes");
        }
    }

    return Ok(written);
}

} // namespace vidup::upload
