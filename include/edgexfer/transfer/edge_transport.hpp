#pragma once

#include "edgexfer/core/result.hpp"
#include "edgexfer/edge/types.hpp"
#include "edgexfer/transfer/object_store.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace edgexfer::transfer {

struct ChunkPayload {
    std::string session_id;
    std::uint32_t index = 0;
    std::string chunk_hash;  ///< SHA-256 of `data`
    std::vector<std::uint8_t> data;
};

struct ChunkReceipt {
    std::string edge_id;
    std::uint64_t bytes = 0;
    std::string chunk_hash;
};

/**
 * @brief Moves one chunk through an edge into staging storage
 *
 * Implementations report a missed deadline as ChunkTransferTimeout so the
 * orchestrator can retry the chunk on another edge.
 */
class EdgeTransport {
public:
    virtual ~EdgeTransport() = default;

    virtual Result<ChunkReceipt> transfer_chunk(const edge::EdgeLocation& edge,
                                                const ChunkPayload& payload,
                                                std::chrono::milliseconds deadline) = 0;
};

/**
 * @brief Transport that relays chunks straight into an ObjectStore
 *
 * Used for the direct edge and for single-node deployments where the edges
 * share the backing store. The write itself is not interruptible: a
 * non-positive deadline is refused up front, and a chunk that lands after the
 * deadline is unstaged before the timeout is reported.
 */
class RelayEdgeTransport final : public EdgeTransport {
public:
    explicit RelayEdgeTransport(ObjectStore& store);

    Result<ChunkReceipt> transfer_chunk(const edge::EdgeLocation& edge,
                                        const ChunkPayload& payload,
                                        std::chrono::milliseconds deadline) override;

private:
    ObjectStore& store_;
};

} // namespace edgexfer::transfer
