#pragma once

#include "vidup/core/result.hpp"

#include <string>

namespace vidup {

/**
 * @brief Failure categories of the upload core
 *
 * Every failure is scoped to one upload session; none of them is fatal
 * to the process.
 */
enum class ErrorKind {
    Validation,       // Missing or malformed request fields, no state change
    PayloadTooLarge,  // Body or declared size above the configured ceiling
    ChunkWrite,       // I/O failure while persisting a chunk, client resends
    MissingChunk,     // Reassembly found a gap in the chunk sequence
    SizeMismatch,     // Reassembled artifact differs from the declared size
    Finalize,         // Building or relocating the final file failed
    Cancelled         // Request deadline passed or server shutting down
};

struct UploadError {
    ErrorKind kind = ErrorKind::Validation;
    std::string message;
};

template<typename T>
using UploadResult = Result<T, UploadError>;

inline ErrValue<UploadError> upload_error(ErrorKind kind, std::string message) {
    return ErrValue<UploadError>(UploadError{kind, std::move(message)});
}

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::PayloadTooLarge: return "PayloadTooLarge";
        case ErrorKind::ChunkWrite: return "ChunkWriteError";
        case ErrorKind::MissingChunk: return "MissingChunkError";
        case ErrorKind::SizeMismatch: return "SizeMismatchError";
        case ErrorKind::Finalize: return "FinalizeError";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

inline std::string describe(const UploadError& error) {
    return std::string(to_string(error.kind)) + ": " + error.message;
}

} // namespace vidup
