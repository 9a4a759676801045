#include "vidup/upload/service.hpp"

#include "vidup/events/components.hpp"
#include "vidup/events/event_bus.hpp"
#include "vidup/events/events.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <regex>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using vidup::CancellationToken;
using vidup::Config;
using vidup::ErrorKind;
using vidup::events::EventBus;
using vidup::events::MetricsComponent;
using vidup::upload::ChunkRequest;
using vidup::upload::ChunkStatus;
using vidup::upload::MemorySource;
using vidup::upload::UploadService;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("vidup_service_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

class UploadServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
        config_.upload_dir = root_ / "uploads";
        config_.staging_dir = root_ / "temp_uploads";
        config_.session_ttl = std::chrono::seconds(60);
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    static ChunkRequest make_request(const std::string& id, std::uint32_t index,
                                     std::uint32_t total_chunks, std::uint64_t total_size,
                                     const std::string& filename = "clip.mp4") {
        ChunkRequest request;
        request.descriptor.session_id = id;
        request.descriptor.filename = filename;
        request.descriptor.total_chunks = total_chunks;
        request.descriptor.total_size = total_size;
        request.chunk_index = index;
        return request;
    }

    static vidup::UploadResult<vidup::upload::ChunkOutcome> send(UploadService& service,
                                                                 const ChunkRequest& request,
                                                                 const std::string& data) {
        MemorySource source(reinterpret_cast<const uint8_t*>(data.data()), data.size());
        return service.handle_chunk(request, source, CancellationToken::none());
    }

    std::vector<fs::path> output_files() const {
        std::vector<fs::path> files;
        if (!fs::is_directory(config_.upload_dir)) {
            return files;
        }
        for (const auto& entry : fs::directory_iterator(config_.upload_dir)) {
            files.push_back(entry.path());
        }
        return files;
    }

    fs::path root_;
    Config config_;
    EventBus bus_;
};

} // namespace

TEST_F(UploadServiceTest, ThreeChunkUploadCompletesOnLastChunk) {
    MetricsComponent metrics(bus_);
    UploadService service(config_, bus_);
    ASSERT_TRUE(service.recover_on_startup().is_ok());

    const std::string c0(1048576, 'a');
    const std::string c1(1048576, 'b');
    const std::string c2(524288, 'c');
    const std::uint64_t total = 2621440;

    auto r0 = send(service, make_request("up_abc", 0, 3, total), c0);
    ASSERT_TRUE(r0.is_ok());
    EXPECT_EQ(r0.value().status, ChunkStatus::InProgress);
    EXPECT_EQ(r0.value().received, 1u);

    auto r1 = send(service, make_request("up_abc", 1, 3, total), c1);
    ASSERT_TRUE(r1.is_ok());
    EXPECT_EQ(r1.value().status, ChunkStatus::InProgress);
    EXPECT_EQ(r1.value().received, 2u);

    auto r2 = send(service, make_request("up_abc", 2, 3, total), c2);
    ASSERT_TRUE(r2.is_ok()) << r2.error().message;
    EXPECT_EQ(r2.value().status, ChunkStatus::Complete);
    ASSERT_TRUE(r2.value().final_path.has_value());

    const auto final_path = *r2.value().final_path;
    EXPECT_EQ(final_path.parent_path(), config_.upload_dir);
    EXPECT_TRUE(std::regex_match(final_path.filename().string(),
                                 std::regex("^[0-9a-f]{8}_[0-9]{14}_clip\\.mp4$")));
    EXPECT_EQ(fs::file_size(final_path), total);
    EXPECT_EQ(r2.value().final_size, total);

    EXPECT_FALSE(fs::exists(service.chunk_store().session_dir("up_abc")));
    EXPECT_FALSE(service.session_info("up_abc").has_value());
    EXPECT_EQ(service.active_sessions(), 0u);

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.uploads_started.load(), 1u);
    EXPECT_EQ(stats.uploads_completed.load(), 1u);
    EXPECT_EQ(stats.chunks_stored.load(), 3u);
    EXPECT_EQ(stats.bytes_received.load(), total);
}

TEST_F(UploadServiceTest, OutOfOrderChunksProduceSameBytes) {
    UploadService service(config_, bus_);
    ASSERT_TRUE(service.recover_on_startup().is_ok());

    ASSERT_TRUE(send(service, make_request("rev", 2, 3, 6), "C").is_ok());
    ASSERT_TRUE(send(service, make_request("rev", 1, 3, 6), "BB").is_ok());
    auto last = send(service, make_request("rev", 0, 3, 6), "AAA");

    ASSERT_TRUE(last.is_ok());
    ASSERT_EQ(last.value().status, ChunkStatus::Complete);
    std::ifstream in(*last.value().final_path, std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "AAABBC");
}

TEST_F(UploadServiceTest, ResentChunkDoesNotCompleteEarly) {
    UploadService service(config_, bus_);

    ASSERT_TRUE(send(service, make_request("dup", 0, 2, 4), "aa").is_ok());
    auto again = send(service, make_request("dup", 0, 2, 4), "aa");

    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value().status, ChunkStatus::InProgress);
    EXPECT_EQ(again.value().received, 1u);
    EXPECT_TRUE(output_files().empty());
}

TEST_F(UploadServiceTest, DeclaredSizeAboveLimitIsRejected) {
    config_.max_upload_size = 1024;
    MetricsComponent metrics(bus_);
    UploadService service(config_, bus_);

    auto result = send(service, make_request("big", 0, 1, 4096), "x");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::PayloadTooLarge);
    EXPECT_FALSE(fs::exists(service.chunk_store().session_dir("big")));
    EXPECT_EQ(metrics.get_stats().uploads_failed.load(), 1u);
}

TEST_F(UploadServiceTest, InvalidRequestsAreValidationErrors) {
    UploadService service(config_, bus_);

    auto bad_id = send(service, make_request("../escape", 0, 1, 1), "x");
    ASSERT_TRUE(bad_id.is_error());
    EXPECT_EQ(bad_id.error().kind, ErrorKind::Validation);

    auto no_name = send(service, make_request("ok", 0, 1, 1, ""), "x");
    ASSERT_TRUE(no_name.is_error());
    EXPECT_EQ(no_name.error().kind, ErrorKind::Validation);

    ASSERT_TRUE(send(service, make_request("decl", 0, 2, 10), "xxxxx").is_ok());
    auto changed = send(service, make_request("decl", 1, 3, 10), "xxxxx");
    ASSERT_TRUE(changed.is_error());
    EXPECT_EQ(changed.error().kind, ErrorKind::Validation);
    EXPECT_FALSE(fs::exists(service.chunk_store().chunk_path("decl", 1)));
}

TEST_F(UploadServiceTest, SizeMismatchKeepsSessionForRetry) {
    UploadService service(config_, bus_);

    ASSERT_TRUE(send(service, make_request("mm", 0, 2, 10), "abc").is_ok());
    auto last = send(service, make_request("mm", 1, 2, 10), "de");

    ASSERT_TRUE(last.is_error());
    EXPECT_EQ(last.error().kind, ErrorKind::SizeMismatch);
    EXPECT_TRUE(output_files().empty());

    auto info = service.session_info("mm");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, vidup::upload::SessionState::Receiving);

    // Correct re-send of the short chunk completes the upload
    auto retry = send(service, make_request("mm", 1, 2, 10), "defghij");
    ASSERT_TRUE(retry.is_ok()) << retry.error().message;
    EXPECT_EQ(retry.value().status, ChunkStatus::Complete);
    EXPECT_EQ(output_files().size(), 1u);
}

TEST_F(UploadServiceTest, ConcurrentChunksFinalizeExactlyOnce) {
    UploadService service(config_, bus_);
    ASSERT_TRUE(service.recover_on_startup().is_ok());
    constexpr std::uint32_t kChunks = 16;
    const std::string piece(4096, 'z');
    std::atomic<int> completed{0};
    std::atomic<int> errors{0};

    std::vector<std::thread> threads;
    for (std::uint32_t i = 0; i < kChunks; ++i) {
        threads.emplace_back([&, i]() {
            auto result = send(service, make_request("race", i, kChunks, kChunks * piece.size()), piece);
            if (result.is_error()) {
                errors++;
            } else if (result.value().status == ChunkStatus::Complete) {
                completed++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(errors.load(), 0);
    EXPECT_EQ(completed.load(), 1);
    const auto files = output_files();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(fs::file_size(files[0]), kChunks * piece.size());
}

TEST_F(UploadServiceTest, CancelledChunkIsNotRecorded) {
    UploadService service(config_, bus_);
    CancellationToken token;
    token.cancel();
    const std::string data = "payload";
    MemorySource source(reinterpret_cast<const uint8_t*>(data.data()), data.size());

    auto result = service.handle_chunk(make_request("c", 0, 1, data.size()), source, token);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Cancelled);
    EXPECT_FALSE(service.session_info("c").has_value());
}

TEST_F(UploadServiceTest, IdleSessionsExpire) {
    MetricsComponent metrics(bus_);
    UploadService service(config_, bus_);
    ASSERT_TRUE(send(service, make_request("stale", 0, 2, 2), "a").is_ok());
    ASSERT_TRUE(fs::exists(service.chunk_store().session_dir("stale")));

    EXPECT_EQ(service.expire_idle_sessions(), 0u);
    const auto later = std::chrono::steady_clock::now() + config_.session_ttl + std::chrono::seconds(1);
    EXPECT_EQ(service.expire_idle_sessions(later), 1u);

    EXPECT_FALSE(service.session_info("stale").has_value());
    EXPECT_FALSE(fs::exists(service.chunk_store().session_dir("stale")));
    EXPECT_EQ(metrics.get_stats().sessions_expired.load(), 1u);
}

TEST_F(UploadServiceTest, AdoptMovesExternalFile) {
    MetricsComponent metrics(bus_);
    UploadService service(config_, bus_);
    ASSERT_TRUE(service.recover_on_startup().is_ok());
    const auto source = root_ / "tus" / "abcdef";
    fs::create_directories(source.parent_path());
    {
        std::ofstream out(source, std::ios::binary);
        out << "resumable-bytes";
    }

    auto adopted = service.adopt_completed_upload(source, "talk.webm");

    ASSERT_TRUE(adopted.is_ok()) << adopted.error().message;
    EXPECT_EQ(adopted.value().size, 15u);
    EXPECT_TRUE(std::regex_match(adopted.value().final_path.filename().string(),
                                 std::regex("^[0-9a-f]{8}_[0-9]{14}_talk\\.webm$")));
    EXPECT_FALSE(fs::exists(source));
    EXPECT_EQ(metrics.get_stats().uploads_adopted.load(), 1u);

    auto missing = service.adopt_completed_upload(root_ / "tus" / "gone", "x.mp4");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::Finalize);
}

TEST_F(UploadServiceTest, StartupRecoveryClearsLeftovers) {
    fs::create_directories(config_.staging_dir / "old_session");
    std::ofstream(config_.staging_dir / "old_session" / "0") << "stale";
    fs::create_directories(config_.upload_dir);
    std::ofstream(config_.upload_dir / ".abcd1234_20240101000000_x.mp4.partial") << "half";
    std::ofstream(config_.upload_dir / "abcd1234_20240101000000_y.mp4") << "done";

    UploadService service(config_, bus_);
    ASSERT_TRUE(service.recover_on_startup().is_ok());

    EXPECT_TRUE(fs::is_directory(config_.staging_dir));
    EXPECT_TRUE(fs::is_empty(config_.staging_dir));
    const auto files = output_files();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].filename().string(), "abcd1234_20240101000000_y.mp4");
}

TEST_F(UploadServiceTest, ResentChunkAfterCompletionReturnsSameFile) {
    UploadService service(config_, bus_);
    ASSERT_TRUE(service.recover_on_startup().is_ok());

    auto first = send(service, make_request("up_single", 0, 1, 5), "hello");
    ASSERT_TRUE(first.is_ok());
    ASSERT_EQ(first.value().status, ChunkStatus::Complete);

    auto again = send(service, make_request("up_single", 0, 1, 5), "hello");

    ASSERT_TRUE(again.is_ok()) << again.error().message;
    EXPECT_EQ(again.value().status, ChunkStatus::Complete);
    EXPECT_EQ(again.value().final_path, first.value().final_path);
    EXPECT_EQ(again.value().final_size, 5u);
    EXPECT_EQ(output_files().size(), 1u);
    EXPECT_EQ(service.active_sessions(), 0u);
    EXPECT_FALSE(fs::exists(service.chunk_store().session_dir("up_single")));
}

TEST_F(UploadServiceTest, ResentLastChunkDoesNotReopenUpload) {
    UploadService service(config_, bus_);
    ASSERT_TRUE(service.recover_on_startup().is_ok());

    ASSERT_TRUE(send(service, make_request("up_multi", 0, 2, 6), "abc").is_ok());
    auto done = send(service, make_request("up_multi", 1, 2, 6), "def");
    ASSERT_TRUE(done.is_ok());
    ASSERT_EQ(done.value().status, ChunkStatus::Complete);

    auto resent = send(service, make_request("up_multi", 1, 2, 6), "def");

    ASSERT_TRUE(resent.is_ok());
    EXPECT_EQ(resent.value().status, ChunkStatus::Complete);
    EXPECT_EQ(resent.value().received, 2u);
    EXPECT_EQ(service.active_sessions(), 0u);
    EXPECT_FALSE(service.session_info("up_multi").has_value());
    EXPECT_FALSE(fs::exists(service.chunk_store().session_dir("up_multi")));
    EXPECT_EQ(output_files().size(), 1u);
}

TEST_F(UploadServiceTest, FinishedIdWithNewDeclarationIsRejected) {
    UploadService service(config_, bus_);
    ASSERT_TRUE(send(service, make_request("reused", 0, 1, 3), "abc").is_ok());

    auto other = send(service, make_request("reused", 0, 1, 4, "other.mp4"), "abcd");

    ASSERT_TRUE(other.is_error());
    EXPECT_EQ(other.error().kind, ErrorKind::Validation);
    EXPECT_EQ(output_files().size(), 1u);
}

TEST_F(UploadServiceTest, FinishedIdCanBeReusedAfterTtl) {
    UploadService service(config_, bus_);
    ASSERT_TRUE(send(service, make_request("cycle", 0, 1, 3), "abc").is_ok());

    const auto later = std::chrono::steady_clock::now() + config_.session_ttl + std::chrono::seconds(1);
    EXPECT_EQ(service.expire_idle_sessions(later), 0u);

    auto fresh = send(service, make_request("cycle", 0, 1, 3), "xyz");
    ASSERT_TRUE(fresh.is_ok());
    EXPECT_EQ(fresh.value().status, ChunkStatus::Complete);
    EXPECT_EQ(output_files().size(), 2u);
}
