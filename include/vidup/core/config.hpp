#pragma once

#include "vidup/core/result.hpp"

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace vidup {

/**
 * @brief Process-wide settings, built once at startup and passed down
 *
 * Sizes are in bytes; the environment expresses them in MiB.
 */
struct Config {
    std::uint64_t max_upload_size = 10ULL << 30;   // Ceiling on a session's declared total size
    std::uint64_t max_memory = 256ULL << 20;       // Ceiling on one buffered request body
    std::filesystem::path upload_dir = "./uploads";
    std::filesystem::path staging_dir = "./temp_uploads";
    std::uint32_t max_concurrent_chunks = 5;       // Advertised to the browser client
    std::uint16_t port = 8080;
    std::size_t worker_threads = 2;
    std::chrono::seconds request_timeout{600};
    std::chrono::seconds session_ttl{86400};
    std::chrono::seconds shutdown_grace{10};
    spdlog::level::level_enum log_level = spdlog::level::info;
};

// Returns nullptr when the variable is unset
using EnvLookup = std::function<const char*(const char*)>;

/**
 * @brief Build a Config from environment variables
 *
 * Unset variables keep their defaults. Unparsable values are logged and
 * ignored, so a typo never prevents the server from starting.
 *
 * @param lookup Variable source, std::getenv when empty
 */
Config load_config_from_env(const EnvLookup& lookup = {});

/**
 * @brief Apply command line overrides (-p/--port, -o/--output, -s/--staging)
 *
 * @return Error describing the first malformed argument
 */
Result<void> apply_command_line(Config& config, int argc, const char* const argv[]);

} // namespace vidup
