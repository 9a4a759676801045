#include "vidup/upload/finalizer.hpp"

#include "vidup/core/cancellation.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace vidup::upload {
namespace fs = std::filesystem;

namespace {

constexpr const char* kFallbackFilename = "upload.bin";
// Leaves room for "<token>_<timestamp>_" and the .partial decoration within NAME_MAX
constexpr std::size_t kMaxFilenameLength = 200;

fs::path partial_path_for(const fs::path& destination) {
    return destination.parent_path() /
           ("." + destination.filename().string() + Finalizer::kPartialSuffix);
}

class InFlightGuard {
public:
    InFlightGuard(std::mutex& mutex, std::set<fs::path>& in_flight, fs::path key)
        : mutex_(mutex), in_flight_(in_flight), key_(std::move(key)) {
        std::lock_guard lock(mutex_);
        acquired_ = in_flight_.insert(key_).second;
    }

    ~InFlightGuard() {
        if (acquired_) {
            std::lock_guard lock(mutex_);
            in_flight_.erase(key_);
        }
    }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

    bool acquired() const { return acquired_; }

private:
    std::mutex& mutex_;
    std::set<fs::path>& in_flight_;
    fs::path key_;
    bool acquired_ = false;
};

} // namespace

Finalizer::Finalizer(fs::path output_root, TransferCopier copier)
    : output_root_(std::move(output_root))
    , copier_(copier) {
}

std::string Finalizer::sanitize_filename(const std::string& filename) {
    std::string base = filename;
    const auto separator = base.find_last_of("/\\");
    if (separator != std::string::npos) {
        base = base.substr(separator + 1);
    }

    std::string clean;
    clean.reserve(base.size());
    for (char c : base) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f) {
            continue;
        }
        clean += c;
    }

    if (clean.size() > kMaxFilenameLength) {
        std::size_t cut = kMaxFilenameLength;
        // Back off over continuation bytes (10xxxxxx) to the start of the character
        while (cut > 0 && (static_cast<unsigned char>(clean[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        clean.resize(cut);
    }

    if (clean.empty() || clean == "." || clean == "..") {
        return kFallbackFilename;
    }
    return clean;
}

std::string Finalizer::generate_token() {
    std::random_device device;
    std::uniform_int_distribution<std::uint32_t> dist;
    std::ostringstream hex;
    hex << std::hex << std::setw(8) << std::setfill('0') << dist(device);
    return hex.str();
}

std::string Finalizer::format_timestamp(std::chrono::system_clock::time_point when) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y%m%d%H%M%S");
    return oss.str();
}

std::string Finalizer::make_name(const std::string& filename) {
    return generate_token() + "_" + format_timestamp(std::chrono::system_clock::now()) + "_" + filename;
}

UploadResult<fs::path> Finalizer::finalize(const fs::path& staging_artifact,
                                           const std::string& original_filename) {
    InFlightGuard guard(in_flight_mutex_, in_flight_, staging_artifact);
    if (!guard.acquired()) {
        return upload_error(ErrorKind::Finalize,
                            staging_artifact.string() + " is already being finalized");
    }

    std::error_code ec;
    if (!fs::is_regular_file(staging_artifact, ec)) {
        return upload_error(ErrorKind::Finalize, "Staging artifact missing: " + staging_artifact.string());
    }

    fs::create_directories(output_root_, ec);
    if (ec && !fs::is_directory(output_root_)) {
        return upload_error(ErrorKind::Finalize,
                            "Failed to create output directory " + output_root_.string() + ": " + ec.message());
    }

    const std::string filename = sanitize_filename(original_filename);
    for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
        const fs::path destination = output_root_ / make_name(filename);
        auto placed = move_file(staging_artifact, destination);
        if (placed.is_error()) {
            return Fail(placed.error());
        }
        if (placed.value()) {
            spdlog::debug("Finalized {} -> {}", staging_artifact.string(), destination.string());
            return Ok(destination);
        }
        spdlog::debug("{} already exists, drawing a new name", destination.string());
    }
    return upload_error(ErrorKind::Finalize, "Could not find a free name for " + filename);
}

UploadResult<void> Finalizer::sync_directory(const fs::path& directory) {
    const int fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return upload_error(ErrorKind::Finalize,
                            "Failed to open " + directory.string() + ": " + std::strerror(errno));
    }
    const int rc = ::fsync(fd);
    const int sync_errno = errno;
    ::close(fd);
    if (rc != 0) {
        return upload_error(ErrorKind::Finalize,
                            "Failed to sync " + directory.string() + ": " + std::strerror(sync_errno));
    }
    return Ok();
}

UploadResult<bool> Finalizer::move_file(const fs::path& source, const fs::path& destination) const {
    if (::link(source.c_str(), destination.c_str()) != 0) {
        const int err = errno;
        if (err == EEXIST) {
            return Ok(false);
        }
        if (err == EXDEV) {
            spdlog::info("{} and {} are on different filesystems, copying",
                         source.string(), destination.parent_path().string());
            return copy_then_rename(source, destination);
        }
        return upload_error(ErrorKind::Finalize,
                            "Failed to move " + source.string() + " to " + destination.string() + ": " +
                            std::strerror(err));
    }

    std::error_code ec;
    fs::remove(source, ec);
    if (ec) {
        spdlog::warn("Finalized {} but could not remove {}: {}",
                     destination.string(), source.string(), ec.message());
    }
    if (auto res = sync_directory(destination.parent_path()); res.is_error()) {
        // The file itself is complete and in place
        spdlog::warn("{}", res.error().message);
    }
    return Ok(true);
}

UploadResult<bool> Finalizer::copy_then_rename(const fs::path& source, const fs::path& destination) const {
    const fs::path partial = partial_path_for(destination);

    auto fail = [&partial](UploadError error) -> UploadResult<bool> {
        std::error_code cleanup_ec;
        fs::remove(partial, cleanup_ec);
        error.kind = ErrorKind::Finalize;
        return Fail(std::move(error));
    };

    auto input = FileSource::open(source);
    if (input.is_error()) {
        return fail(input.error());
    }
    auto output = FileSink::create(partial);
    if (output.is_error()) {
        return fail(output.error());
    }

    // Once relocation starts it runs to completion; shutdown waits for it
    auto copied = copier_.copy(*output.value(), *input.value(), CancellationToken::none());
    if (copied.is_error()) {
        return fail(copied.error());
    }
    if (auto res = output.value()->sync(); res.is_error()) {
        return fail(res.error());
    }
    if (auto res = output.value()->close(); res.is_error()) {
        return fail(res.error());
    }

    if (::link(partial.c_str(), destination.c_str()) != 0) {
        const int err = errno;
        if (err == EEXIST) {
            std::error_code cleanup_ec;
            fs::remove(partial, cleanup_ec);
            return Ok(false);
        }
        return fail(UploadError{ErrorKind::Finalize,
                                "Failed to link " + partial.string() + ": " + std::strerror(err)});
    }

    std::error_code ec;
    fs::remove(partial, ec);
    if (auto res = sync_directory(destination.parent_path()); res.is_error()) {
        spdlog::warn("{}", res.error().message);
    }

    fs::remove(source, ec);
    if (ec) {
        // The final file is complete; a stale source only wastes staging space
        spdlog::warn("Finalized {} but could not remove {}: {}",
                     destination.string(), source.string(), ec.message());
    }
    return Ok(true);
}

std::size_t Finalizer::sweep_partials() const {
    std::error_code ec;
    if (!fs::is_directory(output_root_, ec)) {
        return 0;
    }

    std::vector<fs::path> stale;
    for (const auto& entry : fs::directory_iterator(output_root_, ec)) {
        const std::string name = entry.path().filename().string();
        const std::string suffix = kPartialSuffix;
        if (name.size() > suffix.size() + 1 && name.front() == '.' &&
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            stale.push_back(entry.path());
        }
    }

    std::size_t removed = 0;
    for (const auto& path : stale) {
        if (fs::remove(path, ec)) {
            spdlog::warn("Removed interrupted copy {}", path.string());
            ++removed;
        }
    }
    return removed;
}

} // namespace vidup::upload
