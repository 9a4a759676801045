/**
 * @file components.hpp
 * @brief Event subscribers that log and count upload activity
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Both react to whatever UploadService emits
 */

#pragma once

#include "vidup/events/event_bus.hpp"
#include "vidup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace vidup::events {

/**
 * @brief Logs upload lifecycle events with spdlog
 *
 * Per-chunk traffic goes to debug; session start, completion and expiry to
 * info; failures to warn.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ServerStartedEvent>([this](const ServerStartedEvent& e) {
            on_server_started(e);
        });

        bus_.subscribe<ServerShuttingDownEvent>([this](const ServerShuttingDownEvent& e) {
            on_server_shutdown(e);
        });

        bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent& e) {
            on_upload_started(e);
        });

        bus_.subscribe<ChunkStoredEvent>([this](const ChunkStoredEvent& e) {
            on_chunk_stored(e);
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            on_upload_completed(e);
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            on_upload_failed(e);
        });

        bus_.subscribe<SessionExpiredEvent>([this](const SessionExpiredEvent& e) {
            spdlog::info("[SessionExpired] upload={}", e.session_id);
        });

        bus_.subscribe<UploadAdoptedEvent>([this](const UploadAdoptedEvent& e) {
            spdlog::info("[UploadAdopted] source={} stored_as={} bytes={}",
                         e.source_path, e.stored_as, e.total_bytes);
        });
    }

private:
    void on_server_started(const ServerStartedEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Upload server listening on port {}", e.port);
        spdlog::info("════════════════════════════════════════════");
    }

    void on_server_shutdown(const ServerShuttingDownEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Server shutting down: {}", e.reason);
        spdlog::info("════════════════════════════════════════════");
    }

    void on_upload_started(const UploadStartedEvent& e) {
        spdlog::info("[UploadStarted] upload={} file={} chunks={} bytes={}",
                     e.session_id, e.filename, e.total_chunks, e.total_bytes);
    }

    void on_chunk_stored(const ChunkStoredEvent& e) {
        spdlog::debug("[ChunkStored] upload={} chunk={} received={}/{} bytes={}",
                      e.session_id, e.chunk_index, e.chunks_received, e.total_chunks, e.bytes);
    }

    void on_upload_completed(const UploadCompletedEvent& e) {
        spdlog::info("[UploadCompleted] upload={} file={} stored_as={} bytes={} duration={}ms",
                     e.session_id, e.filename, e.stored_as, e.total_bytes, e.duration.count());
    }

    void on_upload_failed(const UploadFailedEvent& e) {
        spdlog::warn("[UploadFailed] upload={} kind={} message={}",
                     e.session_id, to_string(e.kind), e.message);
    }

    EventBus& bus_;
};

/**
 * @brief Counts upload activity for /healthz and the shutdown summary
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> uploads_started{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_failed{0};
        std::atomic<uint64_t> chunks_stored{0};
        std::atomic<uint64_t> bytes_received{0};
        std::atomic<uint64_t> bytes_finalized{0};
        std::atomic<uint64_t> sessions_expired{0};
        std::atomic<uint64_t> uploads_adopted{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent&) {
            stats_.uploads_started++;
        });

        bus_.subscribe<ChunkStoredEvent>([this](const ChunkStoredEvent& e) {
            stats_.chunks_stored++;
            stats_.bytes_received += e.bytes;
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            stats_.uploads_completed++;
            stats_.bytes_finalized += e.total_bytes;
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.uploads_failed++;
        });

        bus_.subscribe<SessionExpiredEvent>([this](const SessionExpiredEvent&) {
            stats_.sessions_expired++;
        });

        bus_.subscribe<UploadAdoptedEvent>([this](const UploadAdoptedEvent& e) {
            stats_.uploads_adopted++;
            stats_.bytes_finalized += e.total_bytes;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Uploads started:   {}", stats_.uploads_started.load());
        spdlog::info("  Uploads completed: {}", stats_.uploads_completed.load());
        spdlog::info("  Failed requests:   {}", stats_.uploads_failed.load());
        spdlog::info("  Chunks stored:     {}", stats_.chunks_stored.load());
        spdlog::info("  Bytes received:    {}", stats_.bytes_received.load());
        spdlog::info("  Bytes finalized:   {}", stats_.bytes_finalized.load());
        spdlog::info("  Sessions expired:  {}", stats_.sessions_expired.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace vidup::events
