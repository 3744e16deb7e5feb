/**
 * @file components.hpp
 * @brief Event-driven components attached to the bus at startup
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Every upload event is now logged and counted.
 */

#pragma once

#include "edgexfer/events/event_bus.hpp"
#include "edgexfer/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace edgexfer::events {

/**
 * @brief Logs every upload and server event through spdlog
 *
 * Per-chunk traffic goes to debug; retries and failures to warn.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadPlannedEvent>([this](const UploadPlannedEvent& e) {
            on_upload_planned(e);
        });

        bus_.subscribe<DuplicateDetectedEvent>([this](const DuplicateDetectedEvent& e) {
            on_duplicate_detected(e);
        });

        bus_.subscribe<ChunkCompletedEvent>([this](const ChunkCompletedEvent& e) {
            on_chunk_completed(e);
        });

        bus_.subscribe<ChunkRetriedEvent>([this](const ChunkRetriedEvent& e) {
            on_chunk_retried(e);
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            on_upload_completed(e);
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            on_upload_failed(e);
        });

        bus_.subscribe<SessionResumedEvent>([this](const SessionResumedEvent& e) {
            on_session_resumed(e);
        });

        bus_.subscribe<ServerStartedEvent>([this](const ServerStartedEvent& e) {
            on_server_started(e);
        });

        bus_.subscribe<ServerShuttingDownEvent>([this](const ServerShuttingDownEvent& e) {
            on_server_shutdown(e);
        });
    }

private:
    void on_upload_planned(const UploadPlannedEvent& e) {
        spdlog::info("[UploadPlanned] session={} owner={} bytes={} chunks={} edges={} threads={}",
                     e.session_id, e.owner_id, e.file_size, e.total_chunks, e.edge_count, e.parallelism);
    }

    void on_duplicate_detected(const DuplicateDetectedEvent& e) {
        spdlog::info("[DuplicateDetected] hash={} owner={} bytes_saved={}",
                     e.content_hash, e.owner_id, e.bytes_saved);
    }

    void on_chunk_completed(const ChunkCompletedEvent& e) {
        spdlog::debug("[ChunkCompleted] session={} chunk={}/{} edge={} bytes={}",
                      e.session_id, e.chunk_index + 1, e.total_chunks, e.edge_id, e.bytes);
    }

    void on_chunk_retried(const ChunkRetriedEvent& e) {
        spdlog::warn("[ChunkRetried] session={} chunk={} failed_edge={} next_edge={} attempt={} reason={}",
                     e.session_id, e.chunk_index, e.failed_edge, e.next_edge, e.attempt, to_string(e.reason));
    }

    void on_upload_completed(const UploadCompletedEvent& e) {
        spdlog::info("[UploadCompleted] session={} owner={} bytes={} hash={} object={} dedup={} duration={}ms",
                     e.session_id, e.owner_id, e.total_bytes, e.content_hash, e.object_key,
                     e.deduplicated, e.duration.count());
    }

    void on_upload_failed(const UploadFailedEvent& e) {
        spdlog::warn("[UploadFailed] session={} owner={} kind={} message={}",
                     e.session_id, e.owner_id, to_string(e.kind), e.message);
    }

    void on_session_resumed(const SessionResumedEvent& e) {
        spdlog::info("[SessionResumed] session={} owner={} remaining={} generation={}",
                     e.session_id, e.owner_id, e.remaining_chunks, e.generation);
    }

    void on_server_started(const ServerStartedEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Upload accelerator listening on port {}", e.port);
        spdlog::info("Edges registered: {}", e.edge_count);
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
 * @brief Counts uploads, chunks, retries and dedup savings
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * const auto& stats = metrics.get_stats();
 * spdlog::info("Uploads completed: {}", stats.uploads_completed.load());
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> uploads_planned{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_failed{0};
        std::atomic<uint64_t> uploads_cancelled{0};
        std::atomic<uint64_t> sessions_expired{0};
        std::atomic<uint64_t> sessions_resumed{0};
        std::atomic<uint64_t> chunks_completed{0};
        std::atomic<uint64_t> chunks_retried{0};
        std::atomic<uint64_t> chunk_timeouts{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> duplicates_detected{0};
        std::atomic<uint64_t> bytes_deduplicated{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadPlannedEvent>([this](const UploadPlannedEvent&) {
            stats_.uploads_planned++;
        });

        bus_.subscribe<DuplicateDetectedEvent>([this](const DuplicateDetectedEvent& e) {
            stats_.duplicates_detected++;
            stats_.bytes_deduplicated += e.bytes_saved;
        });

        bus_.subscribe<ChunkCompletedEvent>([this](const ChunkCompletedEvent& e) {
            stats_.chunks_completed++;
            stats_.bytes_uploaded += e.bytes;
        });

        bus_.subscribe<ChunkRetriedEvent>([this](const ChunkRetriedEvent& e) {
            on_chunk_retried(e);
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            on_upload_completed(e);
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            on_upload_failed(e);
        });

        bus_.subscribe<SessionResumedEvent>([this](const SessionResumedEvent&) {
            stats_.sessions_resumed++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Uploads planned:    {}", stats_.uploads_planned.load());
        spdlog::info("  Uploads completed:  {}", stats_.uploads_completed.load());
        spdlog::info("  Uploads failed:     {}", stats_.uploads_failed.load());
        spdlog::info("  Uploads cancelled:  {}", stats_.uploads_cancelled.load());
        spdlog::info("  Sessions expired:   {}", stats_.sessions_expired.load());
        spdlog::info("  Sessions resumed:   {}", stats_.sessions_resumed.load());
        spdlog::info("  Chunks completed:   {}", stats_.chunks_completed.load());
        spdlog::info("  Chunks retried:     {}", stats_.chunks_retried.load());
        spdlog::info("  Chunk timeouts:     {}", stats_.chunk_timeouts.load());
        spdlog::info("  Bytes uploaded:     {}", stats_.bytes_uploaded.load());
        spdlog::info("  Duplicates:         {}", stats_.duplicates_detected.load());
        spdlog::info("  Bytes deduplicated: {}", stats_.bytes_deduplicated.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_chunk_retried(const ChunkRetriedEvent& e) {
        stats_.chunks_retried++;
        if (e.reason == ErrorKind::ChunkTransferTimeout) {
            stats_.chunk_timeouts++;
        }
    }

    void on_upload_completed(const UploadCompletedEvent& e) {
        stats_.uploads_completed++;
        if (e.deduplicated) {
            stats_.bytes_deduplicated += e.total_bytes;
        }
    }

    void on_upload_failed(const UploadFailedEvent& e) {
        switch (e.kind) {
            case ErrorKind::Cancelled:
                stats_.uploads_cancelled++;
                break;
            case ErrorKind::SessionExpired:
                stats_.sessions_expired++;
                break;
            default:
                stats_.uploads_failed++;
                break;
        }
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace edgexfer::events
