#include "vidup/upload/byte_stream.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace vidup::upload {
namespace {

std::string errno_message(const std::string& action, const std::filesystem::path& path, int error) {
    return action + " " + path.string() + ": " + std::strerror(error);
}

} // namespace

UploadResult<std::size_t> MemorySource::read(char* buffer, std::size_t capacity) {
    const std::size_t count = std::min(capacity, size_ - offset_);
    if (count > 0) {
        std::memcpy(buffer, data_ + offset_, count);
        offset_ += count;
    }
    return Ok(count);
}

// ──────────────────────────────────────────────────────────
// FileSource
// ──────────────────────────────────────────────────────────

FileSource::~FileSource() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

UploadResult<std::unique_ptr<FileSource>> FileSource::open(const std::filesystem::path& path) {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int error = errno;
        // ENOENT is reported as MissingChunk so the reassembler can name the gap
        const auto kind = error == ENOENT ? ErrorKind::MissingChunk : ErrorKind::ChunkWrite;
        return upload_error(kind, errno_message("Failed to open", path, error));
    }
    return Ok(std::unique_ptr<FileSource>(new FileSource(fd, path)));
}

UploadResult<std::size_t> FileSource::read(char* buffer, std::size_t capacity) {
    for (;;) {
        const ssize_t n = ::read(fd_, buffer, capacity);
        if (n >= 0) {
            return Ok(static_cast<std::size_t>(n));
        }
        if (errno != EINTR) {
            return upload_error(ErrorKind::ChunkWrite, errno_message("Failed to read", path_, errno));
        }
    }
}

// ──────────────────────────────────────────────────────────
// FileSink
// ──────────────────────────────────────────────────────────

FileSink::~FileSink() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

UploadResult<std::unique_ptr<FileSink>> FileSink::create(const std::filesystem::path& path) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return upload_error(ErrorKind::ChunkWrite, errno_message("Failed to create", path, errno));
    }
    return Ok(std::unique_ptr<FileSink>(new FileSink(fd, path)));
}

UploadResult<std::size_t> FileSink::write(const char* data, std::size_t size) {
    for (;;) {
        const ssize_t n = ::write(fd_, data, size);
        if (n >= 0) {
            return Ok(static_cast<std::size_t>(n));
        }
        if (errno != EINTR) {
            return upload_error(ErrorKind::ChunkWrite, errno_message("Failed to write", path_, errno));
        }
    }
}

UploadResult<void> FileSink::sync() {
    if (::fsync(fd_) != 0) {
        return upload_error(ErrorKind::ChunkWrite, errno_message("Failed to sync", path_, errno));
    }
    return Ok();
}

UploadResult<void> FileSink::close() {
    if (fd_ < 0) {
        return Ok();
    }
    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        return upload_error(ErrorKind::ChunkWrite, errno_message("Failed to close", path_, errno));
    }
    return Ok();
}

} // namespace vidup::upload
