#pragma once

#include "vidup/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

namespace vidup::upload {

/**
 * @brief Pull side of a byte transfer
 *
 * read() returns the number of bytes placed in the buffer; 0 means end of
 * stream.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual UploadResult<std::size_t> read(char* buffer, std::size_t capacity) = 0;
};

/**
 * @brief Push side of a byte transfer
 *
 * write() may accept fewer bytes than offered; callers treat that as a
 * failed transfer.
 */
class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual UploadResult<std::size_t> write(const char* data, std::size_t size) = 0;
};

/**
 * @brief Reads from a caller-owned memory region (e.g. a request body slice)
 *
 * The region must outlive the source.
 */
class MemorySource : public ByteSource {
public:
    MemorySource(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}

    UploadResult<std::size_t> read(char* buffer, std::size_t capacity) override;

    std::size_t remaining() const noexcept { return size_ - offset_; }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t offset_ = 0;
};

/**
 * @brief Read-only file descriptor wrapper
 */
class FileSource : public ByteSource {
public:
    ~FileSource() override;

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    static UploadResult<std::unique_ptr<FileSource>> open(const std::filesystem::path& path);

    UploadResult<std::size_t> read(char* buffer, std::size_t capacity) override;

private:
    FileSource(int fd, std::filesystem::path path) : fd_(fd), path_(std::move(path)) {}

    int fd_;
    std::filesystem::path path_;
};

/**
 * @brief Write-only file descriptor wrapper
 *
 * The file is created (or truncated) on open. close() reports errors that
 * the destructor would otherwise swallow, so call it explicitly before
 * trusting the file contents.
 */
class FileSink : public ByteSink {
public:
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    static UploadResult<std::unique_ptr<FileSink>> create(const std::filesystem::path& path);

    UploadResult<std::size_t> write(const char* data, std::size_t size) override;

    /// Flush file data to stable storage (fsync)
    UploadResult<void> sync();

    UploadResult<void> close();

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    FileSink(int fd, std::filesystem::path path) : fd_(fd), path_(std::move(path)) {}

    int fd_;
    std::filesystem::path path_;
};

} // namespace vidup::upload
