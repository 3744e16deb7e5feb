#pragma once

#include "edgexfer/core/clock.hpp"
#include "edgexfer/core/result.hpp"
#include "edgexfer/dedup/index.hpp"
#include "edgexfer/edge/registry.hpp"
#include "edgexfer/edge/selector.hpp"
#include "edgexfer/edge/types.hpp"
#include "edgexfer/events/event_bus.hpp"
#include "edgexfer/session/store.hpp"
#include "edgexfer/session/types.hpp"
#include "edgexfer/transfer/chunk_planner.hpp"
#include "edgexfer/transfer/chunk_source.hpp"
#include "edgexfer/transfer/edge_transport.hpp"
#include "edgexfer/transfer/object_store.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace edgexfer::transfer {

struct FileMeta {
    std::string owner_id;
    std::string file_name;
    std::string content_hash;
    std::uint64_t file_size = 0;
    std::optional<edge::GeoPoint> origin;
    edge::Priority priority = edge::Priority::Balanced;
    std::optional<double> budget;  ///< Upper bound on estimated cost
};

/// Content was already stored; the caller got a reference instead of a transfer.
struct DuplicateResult {
    std::string file_id;
    std::string object_key;
    std::string url;
    std::uint64_t bytes_saved = 0;
    double cost_saved = 0.0;
    dedup::ContentRecord record;
};

struct UploadStrategy {
    std::vector<edge::EdgeScore> edges;
    ChunkPlan chunk_plan;
    TransferEstimate estimate;
    bool direct_fallback = false;  ///< No edge qualified; the direct edge carries everything
};

struct UploadPlan {
    session::UploadSessionRecord session;
    UploadStrategy strategy;
};

struct ResumePlan {
    session::UploadSessionRecord session;
    std::vector<std::uint32_t> incomplete_chunks;
    std::vector<edge::EdgeScore> edges;
    bool direct_fallback = false;
};

using Recommendation = std::variant<UploadStrategy, DuplicateResult>;
using StartOutcome = std::variant<UploadPlan, DuplicateResult>;

struct OrchestratorOptions {
    std::chrono::milliseconds chunk_timeout{std::chrono::seconds(30)};
    /// A session Verifying for this long without progress is handed back
    /// to Uploading by the next finalize, resume or transfer.
    std::chrono::milliseconds verification_lease{std::chrono::minutes(5)};
    std::uint32_t max_chunk_attempts = 3;
    std::uint64_t max_file_size = 0;     ///< 0 = unlimited
    std::uint64_t user_quota_bytes = 0;  ///< In-flight bytes per owner, 0 = unlimited
    double cost_per_gb = 0.10;
    edge::GeoPoint default_origin{37.7749, -122.4194};
    edge::EdgeLocation direct_edge{"lyve-direct", "https://s3.lyvecloud.seagate.com",
                                   "Direct", "", "lyve", {37.7749, -122.4194}, true};
};

/**
 * @brief Drives an upload from dedup check to verified object
 *
 * start_upload() consults the dedup index, selects edges, plans chunks and
 * persists a Planned session. Chunks then land either through run_transfer()
 * (server-side workers pushing through an EdgeTransport) or through
 * complete_chunk()/accept_chunk_data() as clients report them. Whichever
 * completion fills the chunk set moves the session into Verifying and
 * finalizes it: the staged chunks are re-hashed, and only a matching hash
 * is committed to the dedup index. A completed session is removed from the
 * store; its final record is kept as a receipt until the session's expiry so
 * a repeated finalize answers the same way.
 *
 * Owner-facing calls check that `owner_id` matches the session.
 */
class TransferOrchestrator {
public:
    TransferOrchestrator(edge::EdgeRegistry& registry,
                         const edge::EdgeSelector& selector,
                         ChunkPlanner planner,
                         dedup::DeduplicationIndex& dedup,
                         session::UploadSessionStore& sessions,
                         ObjectStore& objects,
                         EdgeTransport& transport,
                         events::EventBus& bus,
                         OrchestratorOptions options = {},
                         core::Clock clock = core::system_clock());

    /// Dedup hit adds a reference for the caller and reports the savings.
    Result<std::optional<DuplicateResult>> check_duplicate(const std::string& content_hash,
                                                           const std::string& owner_id,
                                                           std::uint64_t file_size = 0);

    /// Strategy without creating a session. No eligible edge is an error here.
    /// A dedup hit adds a reference, as check_duplicate() does.
    Result<Recommendation> recommend(const FileMeta& meta);

    Result<StartOutcome> start_upload(const FileMeta& meta);

    /// Pushes every incomplete chunk through the transport, then finalizes.
    Result<session::UploadSessionRecord> run_transfer(const std::string& session_id, const ChunkSource& source);

    Result<session::UploadSessionRecord> complete_chunk(const std::string& session_id,
                                                        const std::string& owner_id,
                                                        std::uint32_t index,
                                                        const std::string& chunk_hash,
                                                        const std::string& edge_id,
                                                        std::uint64_t bytes);

    Result<session::UploadSessionRecord> record_chunk(const std::string& owner_id, session::ChunkRecord chunk);

    /// Stages raw chunk bytes through the direct edge and records completion.
    Result<session::UploadSessionRecord> accept_chunk_data(const std::string& session_id,
                                                           const std::string& owner_id,
                                                           std::uint32_t index,
                                                           const std::vector<std::uint8_t>& data);

    /// Verifies and commits a fully landed session. Completed sessions are
    /// answered from their receipt.
    Result<session::UploadSessionRecord> finalize(const std::string& session_id, const std::string& owner_id);

    Result<session::UploadSessionRecord> update_progress(const std::string& session_id,
                                                         const std::string& owner_id,
                                                         std::uint32_t chunks_completed,
                                                         std::uint64_t bytes_uploaded);

    Result<ResumePlan> resume_upload(const std::string& session_id, const std::string& owner_id);

    /// Not allowed while the session is Verifying.
    Result<session::UploadSessionRecord> cancel_upload(const std::string& session_id, const std::string& owner_id);

    Result<session::UploadSessionRecord> fail_upload(const std::string& session_id,
                                                     const std::string& owner_id,
                                                     ErrorKind kind,
                                                     const std::string& message);

    Result<session::UploadSessionRecord> get_session(const std::string& session_id, const std::string& owner_id);

    /// Purges expired sessions, their staged chunks and stale receipts.
    std::size_t expire_sessions();

    [[nodiscard]] dedup::DedupSavings dedup_savings() const;

    /// Stored object for a hash, without adding a reference.
    [[nodiscard]] std::optional<dedup::ContentRecord> find_content(const std::string& content_hash) const;

    [[nodiscard]] std::string object_url(const std::string& object_key) const;

    [[nodiscard]] const OrchestratorOptions& options() const noexcept { return options_; }

private:
    struct Selection {
        std::vector<edge::EdgeScore> edges;
        bool direct_fallback = false;
    };

    Result<void> validate(const FileMeta& meta) const;
    Result<void> check_quota(const FileMeta& meta) const;
    Result<Selection> select(std::uint64_t file_size, const edge::GeoPoint& origin,
                             edge::Priority priority, bool allow_fallback,
                             const std::unordered_set<std::string>& excluded = {}) const;
    Result<UploadStrategy> plan_strategy(const FileMeta& meta, bool allow_fallback) const;

    Result<session::UploadSessionRecord> authorize(const std::string& session_id, const std::string& owner_id);

    /// Returns a stalled Verifying session to Uploading; other records pass through.
    Result<session::UploadSessionRecord> reclaim_verification(const session::UploadSessionRecord& record);

    std::optional<session::UploadSessionRecord> find_receipt(const std::string& session_id) const;
    std::optional<edge::EdgeLocation> resolve_edge(const std::string& edge_id) const;
    edge::EdgeScore direct_score(const edge::GeoPoint& origin) const;

    /// Records a completion; the call that fills the chunk set finalizes.
    Result<session::UploadSessionRecord> land_chunk(const std::string& session_id,
                                                    std::uint32_t index,
                                                    const std::string& chunk_hash,
                                                    const std::string& edge_id,
                                                    std::uint64_t bytes);

    /// Caller has won the transition into Verifying.
    Result<session::UploadSessionRecord> finalize_verified(const session::UploadSessionRecord& record);

    /// Marks the session Failed unless it already is terminal, and announces it.
    void fail_session(const std::string& session_id, ErrorKind kind, const std::string& message);

    edge::EdgeRegistry& registry_;
    const edge::EdgeSelector& selector_;
    ChunkPlanner planner_;
    dedup::DeduplicationIndex& dedup_;
    session::UploadSessionStore& sessions_;
    ObjectStore& objects_;
    EdgeTransport& transport_;
    events::EventBus& event_bus_;
    OrchestratorOptions options_;
    core::Clock clock_;

    mutable std::mutex receipts_mutex_;
    std::unordered_map<std::string, session::UploadSessionRecord> receipts_;
};

} // namespace edgexfer::transfer
