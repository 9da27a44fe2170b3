/**
 * @file components.hpp
 * @brief Event-driven logging and metrics
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Both now react to every upload event emitted on bus
 */

#pragma once

#include "guestdrop/events/event_bus.hpp"
#include "guestdrop/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>

namespace guestdrop::events {

/**
 * @brief Logs upload lifecycle events through spdlog
 *
 * info for session start/finish/eviction, debug for individual chunks,
 * warn for failures.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
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

        bus_.subscribe<SessionEvictedEvent>([this](const SessionEvictedEvent& e) {
            on_session_evicted(e);
        });

        bus_.subscribe<ServerStartedEvent>([this](const ServerStartedEvent& e) {
            on_server_started(e);
        });

        bus_.subscribe<ServerShuttingDownEvent>([this](const ServerShuttingDownEvent& e) {
            on_server_shutdown(e);
        });
    }

private:
    void on_upload_started(const UploadStartedEvent& e) {
        spdlog::info("[UploadStarted] id={} guest={} file={} chunks={}",
                     e.upload_id, e.owner, e.filename, e.total_chunks);
    }

    void on_chunk_stored(const ChunkStoredEvent& e) {
        spdlog::debug("[ChunkStored] id={} chunk={} progress={}/{} bytes={}",
                      e.upload_id, e.chunk_index, e.received, e.total_chunks, e.bytes);
    }

    void on_upload_completed(const UploadCompletedEvent& e) {
        spdlog::info("[UploadCompleted] id={} path={} bytes={} duration={}ms",
                     e.upload_id, e.relative_path, e.total_bytes, e.duration.count());
    }

    void on_upload_failed(const UploadFailedEvent& e) {
        spdlog::warn("[UploadFailed] id={} kind={} reason={}", e.upload_id, to_string(e.kind), e.reason);
    }

    void on_session_evicted(const SessionEvictedEvent& e) {
        spdlog::info("[SessionEvicted] id={} guest={} file={} received={}/{}",
                     e.upload_id, e.owner, e.filename, e.received, e.total_chunks);
    }

    void on_server_started(const ServerStartedEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("guestdrop listening on {}:{}", e.address, e.port);
        spdlog::info("Uploads stored under {}", e.upload_root);
        spdlog::info("════════════════════════════════════════════");
    }

    void on_server_shutdown(const ServerShuttingDownEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Server shutting down: {}", e.reason);
        spdlog::info("════════════════════════════════════════════");
    }

    EventBus& bus_;
};

/**
 * @brief Counts upload activity for the shutdown summary
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.get_stats().uploads_completed.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> sessions_started{0};
        std::atomic<uint64_t> chunks_received{0};
        std::atomic<uint64_t> bytes_received{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> bytes_stored{0};
        std::atomic<uint64_t> uploads_failed{0};
        std::atomic<uint64_t> sessions_evicted{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent&) {
            stats_.sessions_started++;
        });

        bus_.subscribe<ChunkStoredEvent>([this](const ChunkStoredEvent& e) {
            stats_.chunks_received++;
            stats_.bytes_received += e.bytes;
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            stats_.uploads_completed++;
            stats_.bytes_stored += e.total_bytes;
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.uploads_failed++;
        });

        bus_.subscribe<SessionEvictedEvent>([this](const SessionEvictedEvent&) {
            stats_.sessions_evicted++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Sessions started:  {}", stats_.sessions_started.load());
        spdlog::info("  Chunks received:   {}", stats_.chunks_received.load());
        spdlog::info("  Bytes received:    {}", stats_.bytes_received.load());
        spdlog::info("  Uploads completed: {}", stats_.uploads_completed.load());
        spdlog::info("  Bytes stored:      {}", stats_.bytes_stored.load());
        spdlog::info("  Uploads failed:    {}", stats_.uploads_failed.load());
        spdlog::info("  Sessions evicted:  {}", stats_.sessions_evicted.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace guestdrop::events
