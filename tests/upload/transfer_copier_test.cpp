#include "vidup/upload/transfer_copier.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using vidup::CancellationToken;
using vidup::ErrorKind;
using vidup::UploadResult;
using vidup::upload::ByteSink;
using vidup::upload::ByteSource;
using vidup::upload::FileSink;
using vidup::upload::FileSource;
using vidup::upload::MemorySource;
using vidup::upload::TransferCopier;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("vidup_copier_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

class StringSink : public ByteSink {
public:
    UploadResult<std::size_t> write(const char* data, std::size_t size) override {
        contents.append(data, size);
        return vidup::Ok(size);
    }
    std::string contents;
};

// Accepts at most `limit` bytes per write
class ShortSink : public ByteSink {
public:
    explicit ShortSink(std::size_t limit) : limit_(limit) {}
    UploadResult<std::size_t> write(const char*, std::size_t size) override {
        ++writes;
        return vidup::Ok(std::min(size, limit_));
    }
    int writes = 0;

private:
    std::size_t limit_;
};

// Endless source that cancels the token after `reads_before_cancel` reads
class CancellingSource : public ByteSource {
public:
    CancellingSource(CancellationToken& token, int reads_before_cancel)
        : token_(token), remaining_(reads_before_cancel) {}

    UploadResult<std::size_t> read(char* buffer, std::size_t capacity) override {
        ++reads;
        std::memset(buffer, 'x', capacity);
        if (--remaining_ == 0) {
            token_.cancel();
        }
        return vidup::Ok(capacity);
    }
    int reads = 0;

private:
    CancellationToken& token_;
    int remaining_;
};

} // namespace

TEST(TransferCopierTest, CopiesWholeSourceAcrossBuffers) {
    std::string payload(100'000, '\0');
    for (std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<char>(i % 251);
    }
    MemorySource source(reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
    StringSink sink;

    auto result = TransferCopier{}.copy(sink, source, CancellationToken::none());

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), payload.size());
    EXPECT_EQ(sink.contents, payload);
}

TEST(TransferCopierTest, EmptySourceCopiesNothing) {
    MemorySource source(nullptr, 0);
    StringSink sink;

    auto result = TransferCopier{}.copy(sink, source, CancellationToken::none());

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 0u);
}

TEST(TransferCopierTest, CancellationStopsWithinOneBuffer) {
    CancellationToken token;
    CancellingSource source(token, 3);
    StringSink sink;
    TransferCopier copier(1024);

    auto result = copier.copy(sink, source, token);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Cancelled);
    EXPECT_EQ(source.reads, 3);
    EXPECT_EQ(sink.contents.size(), 3u * 1024u);
}

TEST(TransferCopierTest, AlreadyCancelledTokenReadsNothing) {
    CancellationToken token;
    token.cancel();
    CancellingSource source(token, 100);
    StringSink sink;

    auto result = TransferCopier{}.copy(sink, source, token);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Cancelled);
    EXPECT_EQ(source.reads, 0);
}

TEST(TransferCopierTest, ShortWriteFailsWithoutRetry) {
    const std::string payload(4096, 'a');
    MemorySource source(reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
    ShortSink sink(100);

    auto result = TransferCopier{}.copy(sink, source, CancellationToken::none());

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::ChunkWrite);
    EXPECT_NE(result.error().message.find("Short write"), std::string::npos);
    EXPECT_EQ(sink.writes, 1);
}

TEST(TransferCopierTest, FileToFileCopy) {
    const auto dir = create_temp_dir();
    const fs::path from = dir / "from.bin";
    const fs::path to = dir / "to.bin";
    {
        std::ofstream out(from, std::ios::binary);
        out << std::string(70'000, 'v');
    }

    auto source = FileSource::open(from);
    ASSERT_TRUE(source.is_ok());
    auto sink = FileSink::create(to);
    ASSERT_TRUE(sink.is_ok());

    auto result = TransferCopier{}.copy(*sink.value(), *source.value(), CancellationToken::none());
    ASSERT_TRUE(result.is_ok());
    ASSERT_TRUE(sink.value()->close().is_ok());

    EXPECT_EQ(result.value(), 70'000u);
    EXPECT_EQ(read_file(to), read_file(from));

    fs::remove_all(dir);
}

TEST(TransferCopierTest, OpeningMissingFileIsMissingChunk) {
    const auto dir = create_temp_dir();
    auto source = FileSource::open(dir / "absent");

    ASSERT_TRUE(source.is_error());
    EXPECT_EQ(source.error().kind, ErrorKind::MissingChunk);

    fs::remove_all(dir);
}
