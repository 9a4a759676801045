#include "vidup/core/config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string_view>
#include <thread>

namespace vidup {
namespace {

template<typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || text.empty()) {
        return std::nullopt;
    }
    return value;
}

void read_mebibytes(const EnvLookup& lookup, const char* name, std::uint64_t& target) {
    const char* raw = lookup(name);
    if (raw == nullptr || *raw == '\0') {
        return;
    }
    auto value = parse_number<std::uint64_t>(raw);
    if (!value || *value == 0 || *value > (std::uint64_t{1} << 43)) {
        spdlog::warn("Error parsing {}='{}', using default {} MiB", name, raw, target >> 20);
        return;
    }
    target = *value << 20;
}

template<typename T>
void read_positive(const EnvLookup& lookup, const char* name, T& target) {
    const char* raw = lookup(name);
    if (raw == nullptr || *raw == '\0') {
        return;
    }
    auto value = parse_number<T>(raw);
    if (!value || *value == 0) {
        spdlog::warn("Error parsing {}='{}', using default {}", name, raw, target);
        return;
    }
    target = *value;
}

void read_seconds(const EnvLookup& lookup, const char* name, std::chrono::seconds& target) {
    auto count = static_cast<std::uint64_t>(target.count());
    read_positive(lookup, name, count);
    target = std::chrono::seconds(count);
}

void read_path(const EnvLookup& lookup, const char* name, std::filesystem::path& target) {
    const char* raw = lookup(name);
    if (raw != nullptr && *raw != '\0') {
        target = raw;
    }
}

} // namespace

Config load_config_from_env(const EnvLookup& lookup_arg) {
    const EnvLookup lookup = lookup_arg ? lookup_arg : EnvLookup([](const char* name) {
        return static_cast<const char*>(std::getenv(name));
    });

    Config config;
    config.worker_threads = std::max<std::size_t>(2, std::thread::hardware_concurrency());

    read_mebibytes(lookup, "MAX_UPLOAD_SIZE", config.max_upload_size);
    read_mebibytes(lookup, "MAX_MEMORY", config.max_memory);
    read_path(lookup, "UPLOAD_PATH", config.upload_dir);
    read_path(lookup, "TEMP_UPLOAD_PATH", config.staging_dir);
    read_positive(lookup, "MAX_CONCURRENT_CHUNKS", config.max_concurrent_chunks);
    read_positive(lookup, "PORT", config.port);
    read_positive(lookup, "WORKER_THREADS", config.worker_threads);
    read_seconds(lookup, "REQUEST_TIMEOUT_SECONDS", config.request_timeout);
    read_seconds(lookup, "SESSION_TTL_SECONDS", config.session_ttl);
    read_seconds(lookup, "SHUTDOWN_GRACE_SECONDS", config.shutdown_grace);

    if (const char* level = lookup("LOG_LEVEL"); level != nullptr && *level != '\0') {
        const auto parsed = spdlog::level::from_str(level);
        // from_str maps unknown names to "off"
        if (parsed == spdlog::level::off && std::string_view(level) != "off") {
            spdlog::warn("Unknown LOG_LEVEL '{}', keeping info", level);
        } else {
            config.log_level = parsed;
        }
    }

    return config;
}

Result<void> apply_command_line(Config& config, int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if ((arg == "-p" || arg == "--port") && has_value) {
            auto port = parse_number<std::uint16_t>(argv[++i]);
            if (!port || *port == 0) {
                return Err<void, std::string>(std::string("Invalid port: ") + argv[i]);
            }
            config.port = *port;
        } else if ((arg == "-o" || arg == "--output") && has_value) {
            config.upload_dir = argv[++i];
        } else if ((arg == "-s" || arg == "--staging") && has_value) {
            config.staging_dir = argv[++i];
        } else {
            return Err<void, std::string>("Unknown or incomplete argument: " + arg);
        }
    }
    return Ok();
}

} // namespace vidup
