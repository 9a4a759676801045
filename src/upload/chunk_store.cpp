#include "vidup/upload/chunk_store.hpp"

#include <cctype>
#include <charconv>
#include <string_view>
#include <system_error>
#include <vector>

namespace vidup::upload {
namespace fs = std::filesystem;

namespace {

constexpr std::string_view kChunkPrefix = "chunk_";
constexpr std::size_t kMaxSessionIdLength = 128;

// "chunk_17" -> 17; anything else (chunk_17.part, combined) is rejected
bool parse_chunk_name(const std::string& name, std::uint32_t& index) {
    if (name.size() <= kChunkPrefix.size() || name.compare(0, kChunkPrefix.size(), kChunkPrefix) != 0) {
        return false;
    }
    const char* begin = name.data() + kChunkPrefix.size();
    const char* end = name.data() + name.size();
    auto [ptr, ec] = std::from_chars(begin, end, index);
    return ec == std::errc() && ptr == end;
}

UploadResult<void> ensure_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec && !fs::is_directory(dir)) {
        return upload_error(ErrorKind::ChunkWrite,
                            "Failed to create directory " + dir.string() + ": " + ec.message());
    }
    return Ok();
}

} // namespace

ChunkStore::ChunkStore(fs::path staging_root, TransferCopier copier)
    : root_(std::move(staging_root))
    , copier_(copier) {
}

bool ChunkStore::is_valid_session_id(const std::string& session_id) {
    if (session_id.empty() || session_id.size() > kMaxSessionIdLength) {
        return false;
    }
    if (session_id == "." || session_id == "..") {
        return false;
    }
    for (char c : session_id) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

UploadResult<void> ChunkStore::check_session_id(const std::string& session_id) const {
    if (!is_valid_session_id(session_id)) {
        return upload_error(ErrorKind::Validation, "Invalid upload id: '" + session_id + "'");
    }
    return Ok();
}

fs::path ChunkStore::session_dir(const std::string& session_id) const {
    return root_ / session_id;
}

fs::path ChunkStore::chunk_path(const std::string& session_id, std::uint32_t chunk_index) const {
    return session_dir(session_id) / (std::string(kChunkPrefix) + std::to_string(chunk_index));
}

fs::path ChunkStore::artifact_path(const std::string& session_id) const {
    return session_dir(session_id) / kArtifactName;
}

UploadResult<std::uint64_t> ChunkStore::write_chunk(const std::string& session_id,
                                                    std::uint32_t chunk_index,
                                                    ByteSource& source,
                                                    const CancellationToken& cancellation) const {
    if (auto res = check_session_id(session_id); res.is_error()) {
        return Fail(res.error());
    }
    if (auto res = ensure_directory(session_dir(session_id)); res.is_error()) {
        return Fail(res.error());
    }

    const fs::path final_path = chunk_path(session_id, chunk_index);
    fs::path part_path = final_path;
    part_path += ".part";

    auto sink_result = FileSink::create(part_path);
    if (sink_result.is_error()) {
        return Fail(sink_result.error());
    }
    auto& sink = *sink_result.value();

    auto copied = copier_.copy(sink, source, cancellation);
    if (copied.is_error()) {
        // The .part file stays behind; it is never counted and the next
        // attempt truncates it
        return Fail(copied.error());
    }
    if (auto res = sink.close(); res.is_error()) {
        return Fail(res.error());
    }

    std::error_code ec;
    fs::rename(part_path, final_path, ec);
    if (ec) {
        return upload_error(ErrorKind::ChunkWrite,
                            "Failed to commit chunk " + std::to_string(chunk_index) + ": " + ec.message());
    }
    return Ok(copied.value());
}

UploadResult<std::set<std::uint32_t>> ChunkStore::list_chunks(const std::string& session_id) const {
    if (auto res = check_session_id(session_id); res.is_error()) {
        return Fail(res.error());
    }

    std::set<std::uint32_t> indices;
    const fs::path dir = session_dir(session_id);
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return Ok(indices);
    }

    fs::directory_iterator it(dir, ec);
    if (ec) {
        return upload_error(ErrorKind::ChunkWrite, "Failed to list " + dir.string() + ": " + ec.message());
    }
    for (const auto& entry : it) {
        std::uint32_t index = 0;
        if (entry.is_regular_file(ec) && parse_chunk_name(entry.path().filename().string(), index)) {
            indices.insert(index);
        }
    }
    return Ok(indices);
}

UploadResult<void> ChunkStore::purge_session(const std::string& session_id) const {
    if (auto res = check_session_id(session_id); res.is_error()) {
        return res;
    }
    std::error_code ec;
    fs::remove_all(session_dir(session_id), ec);
    if (ec) {
        return upload_error(ErrorKind::Finalize,
                            "Failed to purge staging for " + session_id + ": " + ec.message());
    }
    return Ok();
}

UploadResult<std::size_t> ChunkStore::wipe() const {
    if (auto res = ensure_directory(root_); res.is_error()) {
        return Fail(res.error());
    }

    std::size_t removed = 0;
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        return upload_error(ErrorKind::ChunkWrite, "Failed to list " + root_.string() + ": " + ec.message());
    }
    std::vector<fs::path> entries;
    for (const auto& entry : it) {
        entries.push_back(entry.path());
    }
    for (const auto& path : entries) {
        std::error_code remove_ec;
        fs::remove_all(path, remove_ec);
        if (remove_ec) {
            return upload_error(ErrorKind::ChunkWrite,
                                "Failed to remove " + path.string() + ": " + remove_ec.message());
        }
        ++removed;
    }
    return Ok(removed);
}

} // namespace vidup::upload
