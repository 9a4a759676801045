#include "vidup/upload/reassembler.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace vidup::upload {
namespace fs = std::filesystem;

namespace {

// Integrity and cancellation errors keep their kind; plain I/O errors
// while building the artifact are reported as finalize failures
UploadError as_reassembly_error(UploadError error) {
    if (error.kind == ErrorKind::ChunkWrite) {
        error.kind = ErrorKind::Finalize;
    }
    return error;
}

} // namespace

UploadResult<fs::path> Reassembler::reassemble(const std::string& session_id,
                                               std::uint32_t total_chunks,
                                               std::uint64_t total_size,
                                               const CancellationToken& cancellation) const {
    if (!ChunkStore::is_valid_session_id(session_id)) {
        return upload_error(ErrorKind::Validation, "Invalid upload id: '" + session_id + "'");
    }

    // Check for gaps before touching the artifact
    for (std::uint32_t index = 0; index < total_chunks; ++index) {
        std::error_code ec;
        if (!fs::is_regular_file(store_.chunk_path(session_id, index), ec)) {
            return upload_error(ErrorKind::MissingChunk,
                                "Missing chunk " + std::to_string(index) + " of upload " + session_id);
        }
    }

    const fs::path artifact = store_.artifact_path(session_id);
    auto sink_result = FileSink::create(artifact);
    if (sink_result.is_error()) {
        return Fail(as_reassembly_error(sink_result.error()));
    }
    auto& sink = *sink_result.value();

    for (std::uint32_t index = 0; index < total_chunks; ++index) {
        auto source = FileSource::open(store_.chunk_path(session_id, index));
        if (source.is_error()) {
            auto error = source.error();
            if (error.kind == ErrorKind::MissingChunk) {
                error.message = "Missing chunk " + std::to_string(index) + " of upload " + session_id;
            }
            return Fail(as_reassembly_error(std::move(error)));
        }

        auto copied = store_.copier().copy(sink, *source.value(), cancellation);
        if (copied.is_error()) {
            return Fail(as_reassembly_error(copied.error()));
        }
    }

    // Durable before the finalizer links it under its final name
    if (auto res = sink.sync(); res.is_error()) {
        return Fail(as_reassembly_error(res.error()));
    }
    if (auto res = sink.close(); res.is_error()) {
        return Fail(as_reassembly_error(res.error()));
    }

    std::error_code ec;
    const auto actual = fs::file_size(artifact, ec);
    if (ec) {
        return upload_error(ErrorKind::Finalize,
                            "Failed to stat " + artifact.string() + ": " + ec.message());
    }
    if (actual != total_size) {
        spdlog::warn("Reassembled {} has {} bytes, declared {}; keeping {} for inspection",
                     session_id, actual, total_size, artifact.string());
        return upload_error(ErrorKind::SizeMismatch,
                            "Combined file size mismatch: expected " + std::to_string(total_size) +
                            ", got " + std::to_string(actual));
    }

    return Ok(artifact);
}

} // namespace vidup::upload
