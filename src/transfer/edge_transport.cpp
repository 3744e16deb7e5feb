#include "edgexfer/transfer/edge_transport.hpp"

#include "edgexfer/core/hash.hpp"

#include <spdlog/spdlog.h>

namespace edgexfer::transfer {

RelayEdgeTransport::RelayEdgeTransport(ObjectStore& store) : store_(store) {}

Result<ChunkReceipt> RelayEdgeTransport::transfer_chunk(const edge::EdgeLocation& edge,
                                                        const ChunkPayload& payload,
                                                        std::chrono::milliseconds deadline) {
    const auto started = std::chrono::steady_clock::now();
    if (deadline <= std::chrono::milliseconds::zero()) {
        return Err<ChunkReceipt>(ErrorKind::ChunkTransferTimeout,
                                 "Chunk " + std::to_string(payload.index) + " has no time left on " + edge.id);
    }

    const auto actual = core::sha256_hex(payload.data);
    if (!payload.chunk_hash.empty() && actual != payload.chunk_hash) {
        return Err<ChunkReceipt>(ErrorKind::Integrity,
                                 "Chunk " + std::to_string(payload.index) + " hash mismatch on " + edge.id);
    }

    const auto key = staging_key(payload.session_id, payload.index);
    if (auto stored = store_.put(key, payload.data); stored.is_error()) {
        return Err<ChunkReceipt>(stored.error());
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (elapsed > deadline) {
        spdlog::warn("Chunk {} of {} via {} took {}ms (deadline {}ms)",
                     payload.index, payload.session_id, edge.id, elapsed.count(), deadline.count());
        if (auto removed = store_.remove(key); removed.is_error()) {
            spdlog::warn("Could not unstage timed-out chunk {}: {}", key, removed.error().message);
        }
        return Err<ChunkReceipt>(ErrorKind::ChunkTransferTimeout,
                                 "Chunk " + std::to_string(payload.index) + " timed out on " + edge.id);
    }

    return Ok(ChunkReceipt{edge.id, static_cast<std::uint64_t>(payload.data.size()), actual});
}

} // namespace edgexfer::transfer
