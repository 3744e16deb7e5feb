/**
 * @file events.hpp
 * @brief Events announced while uploads move through the system
 *
 * NAMING CONVENTION:
 * - Events are past-tense: UploadPlannedEvent, ChunkRetriedEvent
 * - Every event carries the wall-clock time it was created
 */

#pragma once

#include "edgexfer/core/error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace edgexfer::events {

// ════════════════════════════════════════════════════════
// Upload Events
// ════════════════════════════════════════════════════════

/**
 * @brief A session was created and edges were assigned
 *
 * WHO EMITS: TransferOrchestrator::start_upload
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct UploadPlannedEvent {
    std::string session_id;
    std::string owner_id;
    std::uint64_t file_size;
    std::uint32_t total_chunks;
    std::size_t edge_count;
    std::uint32_t parallelism;
    std::chrono::system_clock::time_point timestamp;

    UploadPlannedEvent(
        std::string id,
        std::string owner,
        std::uint64_t size,
        std::uint32_t chunks,
        std::size_t edges,
        std::uint32_t threads
    ) : session_id(std::move(id)),
        owner_id(std::move(owner)),
        file_size(size),
        total_chunks(chunks),
        edge_count(edges),
        parallelism(threads),
        timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Content already stored; the owner gained a reference instead of a transfer
 *
 * WHO EMITS: TransferOrchestrator::check_duplicate
 * WHO SUBSCRIBES: Logger, Metrics (bytes saved)
 */
struct DuplicateDetectedEvent {
    std::string content_hash;
    std::string owner_id;
    std::uint64_t bytes_saved;
    std::chrono::system_clock::time_point timestamp;

    DuplicateDetectedEvent(std::string hash, std::string owner, std::uint64_t bytes)
        : content_hash(std::move(hash)),
          owner_id(std::move(owner)),
          bytes_saved(bytes),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief One chunk landed in staging
 *
 * WHO EMITS: transfer workers, PUT /chunks, track-upload progress
 * WHO SUBSCRIBES: Logger (debug), Metrics
 */
struct ChunkCompletedEvent {
    std::string session_id;
    std::uint32_t chunk_index;
    std::uint32_t total_chunks;
    std::string edge_id;
    std::uint64_t bytes;
    std::chrono::system_clock::time_point timestamp;

    ChunkCompletedEvent(
        std::string id,
        std::uint32_t index,
        std::uint32_t total,
        std::string edge,
        std::uint64_t size
    ) : session_id(std::move(id)),
        chunk_index(index),
        total_chunks(total),
        edge_id(std::move(edge)),
        bytes(size),
        timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief A chunk transfer failed and was rescheduled on another edge
 *
 * WHO EMITS: transfer workers
 * WHO SUBSCRIBES: Logger (warn), Metrics
 */
struct ChunkRetriedEvent {
    std::string session_id;
    std::uint32_t chunk_index;
    std::string failed_edge;
    std::string next_edge;
    std::uint32_t attempt;
    ErrorKind reason;
    std::chrono::system_clock::time_point timestamp;

    ChunkRetriedEvent(
        std::string id,
        std::uint32_t index,
        std::string failed,
        std::string next,
        std::uint32_t attempt_number,
        ErrorKind why
    ) : session_id(std::move(id)),
        chunk_index(index),
        failed_edge(std::move(failed)),
        next_edge(std::move(next)),
        attempt(attempt_number),
        reason(why),
        timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Whole-file hash verified and the object is committed
 *
 * WHO EMITS: TransferOrchestrator finalization
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct UploadCompletedEvent {
    std::string session_id;
    std::string owner_id;
    std::string content_hash;
    std::string object_key;
    std::uint64_t total_bytes;
    bool deduplicated;  ///< Another session committed the same content first
    std::chrono::milliseconds duration;
    std::chrono::system_clock::time_point timestamp;

    UploadCompletedEvent(
        std::string id,
        std::string owner,
        std::string hash,
        std::string key,
        std::uint64_t bytes,
        bool dedup,
        std::chrono::milliseconds elapsed
    ) : session_id(std::move(id)),
        owner_id(std::move(owner)),
        content_hash(std::move(hash)),
        object_key(std::move(key)),
        total_bytes(bytes),
        deduplicated(dedup),
        duration(elapsed),
        timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief A session reached Failed (including cancellation and expiry)
 *
 * WHO EMITS: TransferOrchestrator
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct UploadFailedEvent {
    std::string session_id;
    std::string owner_id;
    ErrorKind kind;
    std::string message;
    std::chrono::system_clock::time_point timestamp;

    UploadFailedEvent(std::string id, std::string owner, ErrorKind k, std::string msg)
        : session_id(std::move(id)),
          owner_id(std::move(owner)),
          kind(k),
          message(std::move(msg)),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief A session was picked up again after an interruption
 */
struct SessionResumedEvent {
    std::string session_id;
    std::string owner_id;
    std::size_t remaining_chunks;
    std::uint32_t generation;
    std::chrono::system_clock::time_point timestamp;

    SessionResumedEvent(std::string id, std::string owner, std::size_t remaining, std::uint32_t gen)
        : session_id(std::move(id)),
          owner_id(std::move(owner)),
          remaining_chunks(remaining),
          generation(gen),
          timestamp(std::chrono::system_clock::now())
    {}
};

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when the HTTP server starts listening
 *
 * WHO EMITS: main() startup
 */
struct ServerStartedEvent {
    uint16_t port;
    std::size_t edge_count;
    std::chrono::system_clock::time_point timestamp;

    ServerStartedEvent(uint16_t p, std::size_t edges)
        : port(p),
          edge_count(edges),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted when the server is shutting down
 *
 * WHO EMITS: main() shutdown
 */
struct ServerShuttingDownEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerShuttingDownEvent(std::string r = "normal")
        : reason(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

} // namespace edgexfer::events
