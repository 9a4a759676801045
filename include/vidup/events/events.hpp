/**
 * @file events.hpp
 * @brief Event types emitted by the upload service and the server host
 *
 * NAMING CONVENTION:
 * Events are past-tense: ChunkStoredEvent, UploadCompletedEvent
 */

#pragma once

#include "vidup/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace vidup::events {

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once the listener is bound
 *
 * WHO EMITS: main() startup
 */
struct ServerStartedEvent {
    uint16_t port;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerStartedEvent(uint16_t p)
        : port(p),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted when a shutdown signal arrives
 *
 * WHO EMITS: main() signal handler
 */
struct ServerShuttingDownEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerShuttingDownEvent(std::string r = "normal")
        : reason(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

// ════════════════════════════════════════════════════════
// Upload Events
// ════════════════════════════════════════════════════════

/**
 * @brief First chunk of a session was persisted
 */
struct UploadStartedEvent {
    std::string session_id;
    std::string filename;
    std::uint32_t total_chunks = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ChunkStoredEvent {
    std::string session_id;
    std::uint32_t chunk_index = 0;
    std::uint32_t total_chunks = 0;
    std::size_t chunks_received = 0;
    std::uint64_t bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief The final file is in the output directory and staging was purged
 */
struct UploadCompletedEvent {
    std::string session_id;
    std::string filename;
    std::string stored_as;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A chunk request or the finalize step failed
 *
 * Staging data is left in place; the session stays open for a resend.
 */
struct UploadFailedEvent {
    std::string session_id;
    ErrorKind kind = ErrorKind::Validation;
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief An idle session was dropped and its staging directory purged
 */
struct SessionExpiredEvent {
    std::string session_id;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief An upload finished by an external protocol library was adopted
 */
struct UploadAdoptedEvent {
    std::string source_path;
    std::string stored_as;
    std::uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace vidup::events
