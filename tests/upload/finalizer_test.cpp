#include "vidup/upload/finalizer.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using vidup::ErrorKind;
using vidup::upload::Finalizer;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("vidup_finalizer_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

std::size_t count_entries(const fs::path& dir) {
    std::size_t n = 0;
    for ([[maybe_unused]] const auto& entry : fs::directory_iterator(dir)) {
        ++n;
    }
    return n;
}

} // namespace

TEST(FinalizerTest, FinalNameFollowsConvention) {
    const auto root = create_temp_dir();
    const auto artifact = root / "staging" / "s1" / "combined";
    write_file(artifact, "video-bytes");
    Finalizer finalizer(root / "out");

    auto result = finalizer.finalize(artifact, "holiday.mp4");

    ASSERT_TRUE(result.is_ok()) << result.error().message;
    const auto& final_path = result.value();
    EXPECT_EQ(final_path.parent_path(), root / "out");
    EXPECT_TRUE(std::regex_match(final_path.filename().string(),
                                 std::regex("^[0-9a-f]{8}_[0-9]{14}_holiday\\.mp4$")))
        << final_path.filename().string();
    EXPECT_EQ(read_file(final_path), "video-bytes");
    EXPECT_FALSE(fs::exists(artifact));

    fs::remove_all(root);
}

TEST(FinalizerTest, TraversalFilenameStaysInOutputDir) {
    const auto root = create_temp_dir();
    const auto artifact = root / "staging" / "combined";
    write_file(artifact, "x");
    Finalizer finalizer(root / "out");

    auto result = finalizer.finalize(artifact, "../../etc/passwd");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().parent_path(), root / "out");
    EXPECT_TRUE(std::regex_match(result.value().filename().string(),
                                 std::regex("^[0-9a-f]{8}_[0-9]{14}_passwd$")));
    EXPECT_EQ(count_entries(root / "out"), 1u);

    fs::remove_all(root);
}

TEST(FinalizerTest, SecondFinalizeOfSameArtifactFails) {
    const auto root = create_temp_dir();
    const auto artifact = root / "staging" / "combined";
    write_file(artifact, "once");
    Finalizer finalizer(root / "out");

    auto first = finalizer.finalize(artifact, "a.mp4");
    auto second = finalizer.finalize(artifact, "a.mp4");

    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error().kind, ErrorKind::Finalize);
    EXPECT_EQ(count_entries(root / "out"), 1u);

    fs::remove_all(root);
}

TEST(FinalizerTest, ConcurrentFinalizeProducesOneFile) {
    const auto root = create_temp_dir();
    const auto artifact = root / "staging" / "combined";
    write_file(artifact, std::string(1 << 16, 'v'));
    Finalizer finalizer(root / "out");
    std::atomic<int> successes{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&]() {
            if (finalizer.finalize(artifact, "race.mp4").is_ok()) {
                successes++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(count_entries(root / "out"), 1u);

    fs::remove_all(root);
}

TEST(FinalizerTest, CopyThenRenameLeavesNoPartial) {
    const auto root = create_temp_dir();
    const auto source = root / "src.bin";
    const std::string content(100000, 'q');
    write_file(source, content);
    fs::create_directories(root / "out");
    Finalizer finalizer(root / "out");

    auto result = finalizer.copy_then_rename(source, root / "out" / "dest.bin");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(read_file(root / "out" / "dest.bin"), content);
    EXPECT_FALSE(fs::exists(source));
    EXPECT_FALSE(fs::exists(root / "out" / ".dest.bin.partial"));

    fs::remove_all(root);
}

TEST(FinalizerTest, CopyThenRenameKeepsExistingDestination) {
    const auto root = create_temp_dir();
    write_file(root / "src.bin", "new");
    write_file(root / "out" / "dest.bin", "old");
    Finalizer finalizer(root / "out");

    auto result = finalizer.copy_then_rename(root / "src.bin", root / "out" / "dest.bin");

    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value());
    EXPECT_EQ(read_file(root / "out" / "dest.bin"), "old");
    EXPECT_TRUE(fs::exists(root / "src.bin"));
    EXPECT_FALSE(fs::exists(root / "out" / ".dest.bin.partial"));

    fs::remove_all(root);
}

TEST(FinalizerTest, MoveFileNeverReplacesExistingFile) {
    const auto root = create_temp_dir();
    write_file(root / "staging" / "combined", "second");
    write_file(root / "out" / "taken.mp4", "first");
    Finalizer finalizer(root / "out");

    auto blocked = finalizer.move_file(root / "staging" / "combined", root / "out" / "taken.mp4");

    ASSERT_TRUE(blocked.is_ok());
    EXPECT_FALSE(blocked.value());
    EXPECT_EQ(read_file(root / "out" / "taken.mp4"), "first");
    EXPECT_TRUE(fs::exists(root / "staging" / "combined"));

    auto placed = finalizer.move_file(root / "staging" / "combined", root / "out" / "free.mp4");

    ASSERT_TRUE(placed.is_ok());
    EXPECT_TRUE(placed.value());
    EXPECT_EQ(read_file(root / "out" / "free.mp4"), "second");
    EXPECT_FALSE(fs::exists(root / "staging" / "combined"));

    fs::remove_all(root);
}

TEST(FinalizerTest, SyncDirectory) {
    const auto root = create_temp_dir();

    EXPECT_TRUE(Finalizer::sync_directory(root).is_ok());
    auto missing = Finalizer::sync_directory(root / "absent");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::Finalize);

    fs::remove_all(root);
}

TEST(FinalizerTest, CopyThenRenameMissingSourceFails) {
    const auto root = create_temp_dir();
    fs::create_directories(root / "out");
    Finalizer finalizer(root / "out");

    auto result = finalizer.copy_then_rename(root / "absent", root / "out" / "dest.bin");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Finalize);
    EXPECT_EQ(count_entries(root / "out"), 0u);

    fs::remove_all(root);
}

TEST(FinalizerTest, SweepRemovesOnlyPartials) {
    const auto root = create_temp_dir();
    write_file(root / ".abc_clip.mp4.partial", "half");
    write_file(root / ".def.partial", "half");
    write_file(root / "0123abcd_20240101120000_clip.mp4", "done");
    write_file(root / "notes.partial", "not hidden");

    Finalizer finalizer(root);

    EXPECT_EQ(finalizer.sweep_partials(), 2u);
    EXPECT_TRUE(fs::exists(root / "0123abcd_20240101120000_clip.mp4"));
    EXPECT_TRUE(fs::exists(root / "notes.partial"));
    EXPECT_EQ(finalizer.sweep_partials(), 0u);

    fs::remove_all(root);
}

TEST(FinalizerTest, SweepOnMissingDirectoryIsNoop) {
    Finalizer finalizer(fs::temp_directory_path() / "vidup_finalizer_test_absent_dir");
    EXPECT_EQ(finalizer.sweep_partials(), 0u);
}

TEST(FinalizerTest, SanitizeFilename) {
    EXPECT_EQ(Finalizer::sanitize_filename("clip.mp4"), "clip.mp4");
    EXPECT_EQ(Finalizer::sanitize_filename("dir/sub/clip.mp4"), "clip.mp4");
    EXPECT_EQ(Finalizer::sanitize_filename("C:\\Users\\me\\clip.mp4"), "clip.mp4");
    EXPECT_EQ(Finalizer::sanitize_filename("../.."), "upload.bin");
    EXPECT_EQ(Finalizer::sanitize_filename("."), "upload.bin");
    EXPECT_EQ(Finalizer::sanitize_filename(".trailer.mp4"), ".trailer.mp4");
    EXPECT_EQ(Finalizer::sanitize_filename("..."), "...");
    EXPECT_EQ(Finalizer::sanitize_filename("a\nb\tc.mp4"), "abc.mp4");
    EXPECT_EQ(Finalizer::sanitize_filename(""), "upload.bin");
    EXPECT_EQ(Finalizer::sanitize_filename("dir/"), "upload.bin");
    EXPECT_EQ(Finalizer::sanitize_filename(std::string(500, 'n')).size(), 200u);
}

TEST(FinalizerTest, SanitizeTruncatesOnCharacterBoundary) {
    // 199 ASCII bytes then a 2-byte character straddling the limit
    const std::string name = std::string(199, 'a') + "\xC3\xA9" + ".mp4";

    const auto clean = Finalizer::sanitize_filename(name);

    EXPECT_EQ(clean, std::string(199, 'a'));

    // 3-byte characters: 66 of them fill 198 bytes, the 67th would cross 200
    std::string wide;
    for (int i = 0; i < 70; ++i) {
        wide += "\xE6\x98\xA0";
    }
    EXPECT_EQ(Finalizer::sanitize_filename(wide).size(), 198u);
}

TEST(FinalizerTest, TokenAndTimestampFormat) {
    const auto token = Finalizer::generate_token();
    EXPECT_TRUE(std::regex_match(token, std::regex("^[0-9a-f]{8}$"))) << token;

    const auto stamp = Finalizer::format_timestamp(std::chrono::system_clock::now());
    EXPECT_TRUE(std::regex_match(stamp, std::regex("^[0-9]{14}$"))) << stamp;
}
