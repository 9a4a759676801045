#pragma once

#include "vidup/core/error.hpp"
#include "vidup/upload/transfer_copier.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>

namespace vidup::upload {

/**
 * @brief Moves completed artifacts into the output directory
 *
 * Final names are "<token>_<timestamp>_<filename>": 8 random hex characters,
 * a 14 digit local timestamp (YYYYMMDDhhmmss) and the sanitized client
 * filename. The output directory is flat; nothing is ever written outside
 * it.
 *
 * Relocation never replaces an existing file: the artifact is hard linked
 * under its final name (failing on EEXIST, in which case a fresh name is
 * drawn) and the staging name is then unlinked. Across filesystems the
 * artifact is copied to ".<name>.partial" in the output directory, synced,
 * and linked into place, so a final name never refers to a truncated file.
 * The output directory is synced after every placement. Leftover .partial
 * files are removed by sweep_partials() at startup.
 */
class Finalizer {
public:
    static constexpr const char* kPartialSuffix = ".partial";
    static constexpr int kMaxNameAttempts = 8;

    explicit Finalizer(std::filesystem::path output_root, TransferCopier copier = TransferCopier{});

    /**
     * @brief Relocate a staging artifact under a fresh unique name
     *
     * Fails with ErrorKind::Finalize when the artifact is missing (e.g. it
     * was already finalized) or is being finalized by another caller.
     */
    UploadResult<std::filesystem::path> finalize(const std::filesystem::path& staging_artifact,
                                                 const std::string& original_filename);

    /// Remove .partial files left by an interrupted cross-filesystem copy
    std::size_t sweep_partials() const;

    const std::filesystem::path& output_root() const noexcept { return output_root_; }

    /**
     * @brief Reduce an untrusted filename to a single safe path segment
     *
     * Drops every directory component ('/' and '\\') and control characters,
     * and cuts overlong names on a UTF-8 character boundary. Returns
     * "upload.bin" when the result is empty, "." or "..".
     */
    static std::string sanitize_filename(const std::string& filename);

    /// 4 random bytes as 8 lowercase hex characters
    static std::string generate_token();

    /// YYYYMMDDhhmmss in local time
    static std::string format_timestamp(std::chrono::system_clock::time_point when);

    /**
     * @brief Place source at destination without replacing anything there
     *
     * Falls back to copy_then_rename() on EXDEV.
     *
     * @return false when destination already exists; source is left in place
     */
    UploadResult<bool> move_file(const std::filesystem::path& source,
                                 const std::filesystem::path& destination) const;

    /**
     * @brief Copy through a .partial name in the destination directory, link it
     *        into place, then delete the source
     *
     * @return false when destination already exists; source is left in place
     */
    UploadResult<bool> copy_then_rename(const std::filesystem::path& source,
                                        const std::filesystem::path& destination) const;

    /// fsync a directory so renames and links inside it survive a crash
    static UploadResult<void> sync_directory(const std::filesystem::path& directory);

private:
    static std::string make_name(const std::string& filename);

    std::filesystem::path output_root_;
    TransferCopier copier_;

    std::mutex in_flight_mutex_;
    std::set<std::filesystem::path> in_flight_;
};

} // namespace vidup::upload
