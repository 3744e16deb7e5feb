#include "edgexfer/transfer/orchestrator.hpp"

#include "edgexfer/core/hash.hpp"
#include "edgexfer/core/ids.hpp"
#include "edgexfer/events/event_queue.hpp"
#include "edgexfer/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <iterator>
#include <mutex>
#include <thread>

namespace edgexfer::transfer {
namespace {

using session::UploadSession;
using session::UploadSessionRecord;
using session::UploadStatus;

struct ChunkTask {
    std::uint32_t index = 0;
    edge::EdgeLocation edge;
    std::uint32_t attempt = 1;
    std::unordered_set<std::string> excluded;
};

// Smooth weighted round-robin over `weights`, `count` picks.
std::vector<std::size_t> spread_by_weight(std::vector<double> weights, std::size_t count) {
    std::vector<std::size_t> picks;
    if (weights.empty()) {
        return picks;
    }

    double total = 0.0;
    for (double w : weights) {
        total += w;
    }
    if (total <= 0.0) {
        std::fill(weights.begin(), weights.end(), 1.0);
        total = static_cast<double>(weights.size());
    }

    picks.reserve(count);
    std::vector<double> current(weights.size(), 0.0);
    for (std::size_t n = 0; n < count; ++n) {
        std::size_t best = 0;
        for (std::size_t i = 0; i < weights.size(); ++i) {
            current[i] += weights[i];
            if (current[i] > current[best]) {
                best = i;
            }
        }
        current[best] -= total;
        picks.push_back(best);
    }
    return picks;
}

ChunkPlan plan_of(const UploadSessionRecord& record) {
    ChunkPlan plan;
    plan.file_size = record.total_size;
    plan.chunk_size = record.chunk_size;
    plan.total_chunks = record.total_chunks;
    plan.parallelism = record.parallelism;
    return plan;
}

double cost_of(std::uint64_t bytes, double cost_per_gb) {
    const double gib = static_cast<double>(bytes) / static_cast<double>(kGiB);
    return std::round(gib * cost_per_gb * 10000.0) / 10000.0;
}

std::string file_id_from_key(const std::string& object_key) {
    const auto slash = object_key.rfind('/');
    return slash == std::string::npos ? object_key : object_key.substr(slash + 1);
}

std::vector<session::EdgeAssignment> to_assignments(const std::vector<edge::EdgeScore>& edges) {
    std::vector<session::EdgeAssignment> assignments;
    assignments.reserve(edges.size());
    for (const auto& scored : edges) {
        assignments.push_back(session::EdgeAssignment{scored.edge.id, scored.edge.url, scored.weight});
    }
    return assignments;
}

} // namespace

TransferOrchestrator::TransferOrchestrator(edge::EdgeRegistry& registry,
                                           const edge::EdgeSelector& selector,
                                           ChunkPlanner planner,
                                           dedup::DeduplicationIndex& dedup,
                                           session::UploadSessionStore& sessions,
                                           ObjectStore& objects,
                                           EdgeTransport& transport,
                                           events::EventBus& bus,
                                           OrchestratorOptions options,
                                           core::Clock clock)
    : registry_(registry),
      selector_(selector),
      planner_(std::move(planner)),
      dedup_(dedup),
      sessions_(sessions),
      objects_(objects),
      transport_(transport),
      event_bus_(bus),
      options_(std::move(options)),
      clock_(std::move(clock)) {
    options_.max_chunk_attempts = std::max<std::uint32_t>(1, options_.max_chunk_attempts);
}

// ---------------------------------------------------------------------------
// Planning
// ---------------------------------------------------------------------------

Result<std::optional<DuplicateResult>> TransferOrchestrator::check_duplicate(const std::string& content_hash,
                                                                             const std::string& owner_id,
                                                                             std::uint64_t file_size) {
    if (!core::is_sha256_hex(content_hash)) {
        return Err<std::optional<DuplicateResult>>(ErrorKind::InvalidArgument,
                                                   "Content hash must be 64 lowercase hex characters");
    }

    const auto existing = dedup_.lookup(content_hash);
    if (!existing) {
        return Ok(std::optional<DuplicateResult>{});
    }

    const auto size = file_size > 0 ? file_size : existing->size;
    auto referenced = dedup_.add_reference(content_hash, size, owner_id);
    if (referenced.is_error()) {
        return Err<std::optional<DuplicateResult>>(referenced.error());
    }

    DuplicateResult duplicate;
    duplicate.record = referenced.value().record;
    duplicate.object_key = duplicate.record.object_key;
    duplicate.file_id = file_id_from_key(duplicate.object_key);
    duplicate.url = object_url(duplicate.object_key);
    duplicate.bytes_saved = size;
    duplicate.cost_saved = cost_of(size, options_.cost_per_gb);

    if (referenced.value().added) {
        event_bus_.emit(events::DuplicateDetectedEvent{content_hash, owner_id, size});
    }
    return Ok(std::optional<DuplicateResult>(std::move(duplicate)));
}

Result<Recommendation> TransferOrchestrator::recommend(const FileMeta& meta) {
    if (auto valid = validate(meta); valid.is_error()) {
        return Err<Recommendation>(valid.error());
    }

    auto duplicate = check_duplicate(meta.content_hash, meta.owner_id, meta.file_size);
    if (duplicate.is_error()) {
        return Err<Recommendation>(duplicate.error());
    }
    if (duplicate.value()) {
        return Ok(Recommendation(std::move(*duplicate.value())));
    }

    if (auto quota = check_quota(meta); quota.is_error()) {
        return Err<Recommendation>(quota.error());
    }

    auto strategy = plan_strategy(meta, false);
    if (strategy.is_error()) {
        return Err<Recommendation>(strategy.error());
    }
    return Ok(Recommendation(std::move(strategy.value())));
}

Result<StartOutcome> TransferOrchestrator::start_upload(const FileMeta& meta) {
    if (auto valid = validate(meta); valid.is_error()) {
        return Err<StartOutcome>(valid.error());
    }

    auto duplicate = check_duplicate(meta.content_hash, meta.owner_id, meta.file_size);
    if (duplicate.is_error()) {
        return Err<StartOutcome>(duplicate.error());
    }
    if (duplicate.value()) {
        return Ok(StartOutcome(std::move(*duplicate.value())));
    }

    if (auto quota = check_quota(meta); quota.is_error()) {
        return Err<StartOutcome>(quota.error());
    }

    auto strategy = plan_strategy(meta, true);
    if (strategy.is_error()) {
        return Err<StartOutcome>(strategy.error());
    }

    const auto& plan = strategy.value().chunk_plan;
    UploadSessionRecord record;
    record.session_id = core::generate_uuid();
    record.owner_id = meta.owner_id;
    record.file_id = core::generate_uuid();
    record.file_name = meta.file_name;
    record.content_hash = meta.content_hash;
    record.total_size = meta.file_size;
    record.chunk_size = plan.chunk_size;
    record.total_chunks = plan.total_chunks;
    record.parallelism = plan.parallelism;
    record.priority = meta.priority;
    record.origin = meta.origin.value_or(options_.default_origin);
    record.assigned_edges = to_assignments(strategy.value().edges);
    record.status = UploadStatus::Planned;

    auto created = sessions_.create(std::move(record));
    if (created.is_error()) {
        return Err<StartOutcome>(created.error());
    }

    event_bus_.emit(events::UploadPlannedEvent{created.value().session_id,
                                               created.value().owner_id,
                                               created.value().total_size,
                                               created.value().total_chunks,
                                               strategy.value().edges.size(),
                                               created.value().parallelism});

    return Ok(StartOutcome(UploadPlan{std::move(created.value()), std::move(strategy.value())}));
}

Result<void> TransferOrchestrator::validate(const FileMeta& meta) const {
    if (meta.owner_id.empty()) {
        return Err<void>(ErrorKind::InvalidArgument, "Owner id is required");
    }
    if (!core::is_sha256_hex(meta.content_hash)) {
        return Err<void>(ErrorKind::InvalidArgument, "Content hash must be 64 lowercase hex characters");
    }
    if (meta.file_size == 0) {
        return Err<void>(ErrorKind::InvalidArgument, "File size must be greater than zero");
    }
    if (meta.budget && *meta.budget < 0.0) {
        return Err<void>(ErrorKind::InvalidArgument, "Budget must not be negative");
    }
    return Ok();
}

Result<void> TransferOrchestrator::check_quota(const FileMeta& meta) const {
    if (options_.max_file_size > 0 && meta.file_size > options_.max_file_size) {
        return Err<void>(ErrorKind::QuotaExceeded,
                         "File size " + std::to_string(meta.file_size) + " exceeds limit of " +
                         std::to_string(options_.max_file_size) + " bytes");
    }
    if (options_.user_quota_bytes > 0) {
        const auto in_flight = sessions_.pending_bytes(meta.owner_id);
        if (in_flight + meta.file_size > options_.user_quota_bytes) {
            return Err<void>(ErrorKind::QuotaExceeded,
                             "Owner " + meta.owner_id + " has " + std::to_string(in_flight) +
                             " bytes in flight; quota is " + std::to_string(options_.user_quota_bytes));
        }
    }
    return Ok();
}

Result<TransferOrchestrator::Selection> TransferOrchestrator::select(std::uint64_t file_size,
                                                                     const edge::GeoPoint& origin,
                                                                     edge::Priority priority,
                                                                     bool allow_fallback,
                                                                     const std::unordered_set<std::string>& excluded) const {
    auto chosen = selector_.select_edges(file_size, origin, priority, excluded);
    if (chosen.is_ok()) {
        return Ok(Selection{std::move(chosen.value()), false});
    }
    if (!allow_fallback || chosen.error().kind != ErrorKind::NoEdgesAvailable ||
        excluded.count(options_.direct_edge.id) > 0) {
        return Err<Selection>(chosen.error());
    }

    spdlog::warn("No eligible edge for {} bytes; falling back to {}", file_size, options_.direct_edge.id);
    return Ok(Selection{{direct_score(origin)}, true});
}

Result<UploadStrategy> TransferOrchestrator::plan_strategy(const FileMeta& meta, bool allow_fallback) const {
    const auto origin = meta.origin.value_or(options_.default_origin);
    auto selection = select(meta.file_size, origin, meta.priority, allow_fallback);
    if (selection.is_error()) {
        return Err<UploadStrategy>(selection.error());
    }

    auto plan = planner_.plan(meta.file_size, selection.value().edges.size());
    if (plan.is_error()) {
        return Err<UploadStrategy>(plan.error());
    }

    std::vector<double> bandwidths;
    for (const auto& scored : selection.value().edges) {
        bandwidths.push_back(scored.metric.bandwidth_mbps);
    }

    UploadStrategy strategy;
    strategy.edges = std::move(selection.value().edges);
    strategy.chunk_plan = plan.value();
    strategy.estimate = planner_.estimate(strategy.chunk_plan, bandwidths, options_.cost_per_gb);
    strategy.direct_fallback = selection.value().direct_fallback;

    if (meta.budget && strategy.estimate.cost > *meta.budget) {
        return Err<UploadStrategy>(ErrorKind::QuotaExceeded,
                                   "Estimated cost " + std::to_string(strategy.estimate.cost) +
                                   " exceeds budget " + std::to_string(*meta.budget));
    }
    return Ok(std::move(strategy));
}

edge::EdgeScore TransferOrchestrator::direct_score(const edge::GeoPoint& origin) const {
    edge::EdgeScore scored;
    scored.edge = options_.direct_edge;
    scored.metric.edge_id = options_.direct_edge.id;
    scored.metric.timestamp = clock_();
    scored.distance_km = edge::haversine_km(origin, options_.direct_edge.location);
    scored.weight = 1.0;
    return scored;
}

std::optional<edge::EdgeLocation> TransferOrchestrator::resolve_edge(const std::string& edge_id) const {
    if (edge_id == options_.direct_edge.id) {
        return options_.direct_edge;
    }
    return registry_.find_edge(edge_id);
}

std::string TransferOrchestrator::object_url(const std::string& object_key) const {
    return options_.direct_edge.url + "/" + object_key;
}

// ---------------------------------------------------------------------------
// Transfer
// ---------------------------------------------------------------------------

Result<UploadSessionRecord> TransferOrchestrator::run_transfer(const std::string& session_id,
                                                               const ChunkSource& source) {
    auto loaded = sessions_.get(session_id);
    if (loaded.is_error()) {
        return loaded;
    }
    auto reclaimed = reclaim_verification(loaded.value());
    if (reclaimed.is_error()) {
        return reclaimed;
    }
    const auto record = reclaimed.value();

    if (session::is_terminal(record.status) || record.status == UploadStatus::Verifying) {
        return Err<UploadSessionRecord>(ErrorKind::InvalidState,
                                        std::string("Cannot transfer while session is ") + to_string(record.status));
    }
    if (source.size() != record.total_size) {
        return Err<UploadSessionRecord>(ErrorKind::InvalidArgument,
                                        "Source holds " + std::to_string(source.size()) + " bytes, session expects " +
                                        std::to_string(record.total_size));
    }

    const auto pending = record.incomplete_chunks();
    if (pending.empty()) {
        return finalize(session_id, record.owner_id);
    }

    std::vector<edge::EdgeLocation> targets;
    std::vector<double> weights;
    for (const auto& assignment : record.assigned_edges) {
        if (auto location = resolve_edge(assignment.edge_id)) {
            targets.push_back(*location);
            weights.push_back(assignment.weight);
        }
    }
    if (targets.empty()) {
        targets.push_back(options_.direct_edge);
        weights.push_back(1.0);
    }

    const auto plan = plan_of(record);
    const auto picks = spread_by_weight(weights, pending.size());
    std::vector<ChunkTask> tasks;
    tasks.reserve(pending.size());
    for (std::size_t i = 0; i < pending.size(); ++i) {
        tasks.push_back(ChunkTask{pending[i], targets[picks[i]], 1, {}});
    }

    events::ThreadSafeQueue<ChunkTask> queue;
    queue.push_all(std::move(tasks));

    std::atomic<std::size_t> remaining{pending.size()};
    std::atomic<bool> aborted{false};
    std::mutex outcome_mutex;
    std::optional<Error> failure;
    std::optional<UploadSessionRecord> finalized;

    auto abort_run = [&](Error error) {
        {
            std::lock_guard lock(outcome_mutex);
            if (!failure) {
                failure = std::move(error);
            }
        }
        aborted = true;
        queue.abort();
    };

    auto process = [&](ChunkTask task) {
        const auto index = task.index;
        auto data = source.read_chunk(plan.chunk_offset(index), plan.chunk_length(index));
        if (data.is_error()) {
            abort_run(data.error());
            fail_session(session_id, data.error().kind, data.error().message);
            return;
        }

        ChunkPayload payload;
        payload.session_id = session_id;
        payload.index = index;
        payload.chunk_hash = core::sha256_hex(data.value());
        payload.data = std::move(data.value());

        session::ChunkRecord attempt;
        attempt.index = index;
        attempt.chunk_hash = payload.chunk_hash;
        attempt.edge_id = task.edge.id;
        attempt.status = session::ChunkStatus::Uploading;
        auto marked = sessions_.update(session_id, [&](UploadSession& s) {
            return s.record_chunk(attempt, clock_());
        });
        if (marked.is_error()) {
            abort_run(marked.error());
            return;
        }

        auto receipt = transport_.transfer_chunk(task.edge, payload, options_.chunk_timeout);
        if (receipt.is_ok()) {
            auto landed = land_chunk(session_id, index, receipt.value().chunk_hash,
                                     receipt.value().edge_id, receipt.value().bytes);
            if (landed.is_error()) {
                abort_run(landed.error());
                return;
            }
            if (landed.value().status == UploadStatus::Completed) {
                std::lock_guard lock(outcome_mutex);
                finalized = landed.value();
            }
            if (remaining.fetch_sub(1) == 1) {
                queue.shutdown();
            }
            return;
        }

        const auto cause = receipt.error();
        session::ChunkRecord failed;
        failed.index = index;
        failed.chunk_hash = payload.chunk_hash;
        failed.edge_id = task.edge.id;
        failed.status = session::ChunkStatus::Failed;
        failed.error_message = cause.message;
        auto noted = sessions_.update(session_id, [&](UploadSession& s) {
            return s.record_chunk(failed, clock_());
        });
        if (noted.is_error()) {
            abort_run(noted.error());
            return;
        }

        if (task.attempt >= options_.max_chunk_attempts) {
            const auto message = "Chunk " + std::to_string(index) + " failed after " +
                                 std::to_string(task.attempt) + " attempt(s): " + cause.message;
            abort_run(Error{cause.kind, message});
            fail_session(session_id, cause.kind, message);
            return;
        }

        task.excluded.insert(task.edge.id);
        auto next = select(record.total_size, record.origin, record.priority, true, task.excluded);
        if (next.is_error()) {
            const auto message = "Chunk " + std::to_string(index) + " has no edge left to retry on: " + cause.message;
            abort_run(Error{cause.kind, message});
            fail_session(session_id, cause.kind, message);
            return;
        }

        const auto& next_edge = next.value().edges.front().edge;
        event_bus_.emit(events::ChunkRetriedEvent{session_id, index, task.edge.id, next_edge.id,
                                                  task.attempt + 1, cause.kind});
        queue.push(ChunkTask{index, next_edge, task.attempt + 1, std::move(task.excluded)});
    };

    auto worker = [&]() {
        while (auto task = queue.pop()) {
            if (aborted) {
                continue;
            }
            try {
                process(std::move(*task));
            } catch (const std::exception& e) {
                spdlog::error("Transfer worker for session {} failed: {}", session_id, e.what());
                abort_run(Error{ErrorKind::Internal, e.what()});
                fail_session(session_id, ErrorKind::Internal, e.what());
            }
        }
    };

    const auto worker_count = std::max<std::size_t>(1, std::min<std::size_t>(record.parallelism, pending.size()));
    spdlog::info("Transferring {} chunk(s) of session {} over {} edge(s) with {} worker(s)",
                 pending.size(), session_id, targets.size(), worker_count);

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    if (failure) {
        return Err<UploadSessionRecord>(*failure);
    }
    if (finalized) {
        return Ok(*finalized);
    }
    return sessions_.get(session_id);
}

Result<UploadSessionRecord> TransferOrchestrator::land_chunk(const std::string& session_id,
                                                             std::uint32_t index,
                                                             const std::string& chunk_hash,
                                                             const std::string& edge_id,
                                                             std::uint64_t bytes) {
    bool newly_completed = false;
    bool won_verification = false;
    auto updated = sessions_.update(session_id, [&](UploadSession& s) -> Result<void> {
        newly_completed = false;
        won_verification = false;
        const auto before = s.record().completed_chunks.size();
        const auto now = clock_();
        auto last = s.complete_chunk(index, chunk_hash, edge_id, bytes, now);
        if (last.is_error()) {
            return Err<void>(last.error());
        }
        newly_completed = s.record().completed_chunks.size() > before;
        if (last.value()) {
            if (auto verifying = s.begin_verification(now); verifying.is_error()) {
                return verifying;
            }
            won_verification = true;
        }
        return Ok();
    });
    if (updated.is_error()) {
        return updated;
    }

    if (newly_completed) {
        event_bus_.emit(events::ChunkCompletedEvent{session_id, index, updated.value().total_chunks, edge_id, bytes});
    }
    if (won_verification) {
        return finalize_verified(updated.value());
    }
    return updated;
}

Result<UploadSessionRecord> TransferOrchestrator::complete_chunk(const std::string& session_id,
                                                                 const std::string& owner_id,
                                                                 std::uint32_t index,
                                                                 const std::string& chunk_hash,
                                                                 const std::string& edge_id,
                                                                 std::uint64_t bytes) {
    if (auto owned = authorize(session_id, owner_id); owned.is_error()) {
        return owned;
    }
    return land_chunk(session_id, index, chunk_hash, edge_id, bytes);
}

Result<UploadSessionRecord> TransferOrchestrator::record_chunk(const std::string& owner_id, session::ChunkRecord chunk) {
    if (auto owned = authorize(chunk.session_id, owner_id); owned.is_error()) {
        return owned;
    }
    if (chunk.status == session::ChunkStatus::Completed) {
        return land_chunk(chunk.session_id, chunk.index, chunk.chunk_hash, chunk.edge_id, chunk.bytes_transferred);
    }
    return sessions_.update(chunk.session_id, [&](UploadSession& s) {
        return s.record_chunk(chunk, clock_());
    });
}

Result<UploadSessionRecord> TransferOrchestrator::accept_chunk_data(const std::string& session_id,
                                                                    const std::string& owner_id,
                                                                    std::uint32_t index,
                                                                    const std::vector<std::uint8_t>& data) {
    auto owned = authorize(session_id, owner_id);
    if (owned.is_error()) {
        return owned;
    }

    const auto plan = plan_of(owned.value());
    if (index >= plan.total_chunks) {
        return Err<UploadSessionRecord>(ErrorKind::InvalidArgument,
                                        "Chunk index " + std::to_string(index) + " out of range (total " +
                                        std::to_string(plan.total_chunks) + ")");
    }
    if (data.size() != plan.chunk_length(index)) {
        return Err<UploadSessionRecord>(ErrorKind::InvalidArgument,
                                        "Chunk " + std::to_string(index) + " must be " +
                                        std::to_string(plan.chunk_length(index)) + " bytes, got " +
                                        std::to_string(data.size()));
    }
    if (session::is_terminal(owned.value().status) || owned.value().status == UploadStatus::Verifying) {
        return Err<UploadSessionRecord>(ErrorKind::InvalidState,
                                        std::string("Cannot accept chunks while ") + to_string(owned.value().status));
    }

    if (auto staged = objects_.put(staging_key(session_id, index), data); staged.is_error()) {
        return Err<UploadSessionRecord>(staged.error());
    }
    return land_chunk(session_id, index, core::sha256_hex(data), options_.direct_edge.id, data.size());
}

// ---------------------------------------------------------------------------
// Finalization
// ---------------------------------------------------------------------------

Result<UploadSessionRecord> TransferOrchestrator::finalize(const std::string& session_id, const std::string& owner_id) {
    auto owned = authorize(session_id, owner_id);
    if (owned.is_error()) {
        if (owned.error().kind == ErrorKind::NotFound) {
            if (auto receipt = find_receipt(session_id)) {
                if (receipt->owner_id != owner_id) {
                    return Err<UploadSessionRecord>(ErrorKind::Forbidden, "Session belongs to another user");
                }
                return Ok(std::move(*receipt));
            }
        }
        return owned;
    }
    if (owned.value().status == UploadStatus::Completed) {
        return owned;
    }
    if (auto reclaimed = reclaim_verification(owned.value()); reclaimed.is_error()) {
        return reclaimed;
    }

    auto verifying = sessions_.update(session_id, [&](UploadSession& s) {
        return s.begin_verification(clock_());
    });
    if (verifying.is_error()) {
        return verifying;
    }
    return finalize_verified(verifying.value());
}

Result<UploadSessionRecord> TransferOrchestrator::finalize_verified(const UploadSessionRecord& record) {
    const auto& session_id = record.session_id;
    const auto plan = plan_of(record);

    core::Sha256 hasher;
    std::vector<std::string> parts;
    parts.reserve(plan.total_chunks);
    for (std::uint32_t index = 0; index < plan.total_chunks; ++index) {
        auto key = staging_key(session_id, index);
        auto data = objects_.get(key);
        if (data.is_error() || data.value().size() != plan.chunk_length(index)) {
            const auto message = "Chunk " + std::to_string(index) + " is missing or truncated in staging";
            fail_session(session_id, ErrorKind::Integrity, message);
            return Err<UploadSessionRecord>(ErrorKind::Integrity, message);
        }
        hasher.update(data.value());
        parts.push_back(std::move(key));
    }

    const auto digest = hasher.hex_digest();
    if (digest != record.content_hash) {
        const auto message = "Content hash mismatch: expected " + record.content_hash + ", got " + digest;
        fail_session(session_id, ErrorKind::Integrity, message);
        return Err<UploadSessionRecord>(ErrorKind::Integrity, message);
    }

    const auto existing = dedup_.lookup(record.content_hash);
    const auto object_key = existing ? existing->object_key : object_key_for(record.content_hash, record.file_id);
    bool composed = false;
    if (!existing) {
        if (auto assembled = objects_.compose(object_key, parts); assembled.is_error()) {
            fail_session(session_id, assembled.error().kind, assembled.error().message);
            return Err<UploadSessionRecord>(assembled.error());
        }
        composed = true;
    }

    auto committed = dedup_.commit(record.content_hash, object_key, record.total_size, record.owner_id);
    if (committed.is_error()) {
        if (composed) {
            if (auto removed = objects_.remove(object_key); removed.is_error()) {
                spdlog::warn("Could not remove uncommitted object {}: {}", object_key, removed.error().message);
            }
        }
        fail_session(session_id, committed.error().kind, committed.error().message);
        return Err<UploadSessionRecord>(committed.error());
    }
    if (composed && !committed.value().created) {
        // Another session committed the same content between lookup and commit.
        if (auto removed = objects_.remove(object_key); removed.is_error()) {
            spdlog::warn("Could not remove redundant object {}: {}", object_key, removed.error().message);
        }
    }

    auto completed = sessions_.update(session_id, [&](UploadSession& s) {
        return s.transition_to(UploadStatus::Completed, clock_());
    });
    if (completed.is_error()) {
        // Staging is intact, so the session can be verified again once it is reclaimed.
        if (committed.value().added) {
            auto released = dedup_.release(record.content_hash, record.owner_id);
            if (released.is_error()) {
                spdlog::warn("Could not release reference of session {}: {}", session_id, released.error().message);
            } else if (released.value().removed && composed) {
                if (auto removed = objects_.remove(object_key); removed.is_error()) {
                    spdlog::warn("Could not remove orphaned object {}: {}", object_key, removed.error().message);
                }
            }
        }
        return completed;
    }

    {
        std::lock_guard lock(receipts_mutex_);
        receipts_[session_id] = completed.value();
    }
    if (auto removed = sessions_.remove(session_id); removed.is_error()) {
        spdlog::warn("Could not remove completed session {}: {}", session_id, removed.error().message);
    }
    if (auto cleaned = objects_.remove_prefix(staging_prefix(session_id)); cleaned.is_error()) {
        spdlog::warn("Could not clear staging for session {}: {}", session_id, cleaned.error().message);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        completed.value().updated_at - completed.value().created_at);
    event_bus_.emit(events::UploadCompletedEvent{session_id,
                                                 record.owner_id,
                                                 record.content_hash,
                                                 committed.value().record.object_key,
                                                 record.total_size,
                                                 !committed.value().created,
                                                 elapsed});
    return completed;
}

// ---------------------------------------------------------------------------
// Session control
// ---------------------------------------------------------------------------

Result<UploadSessionRecord> TransferOrchestrator::update_progress(const std::string& session_id,
                                                                  const std::string& owner_id,
                                                                  std::uint32_t chunks_completed,
                                                                  std::uint64_t bytes_uploaded) {
    auto owned = authorize(session_id, owner_id);
    if (owned.is_error()) {
        return owned;
    }
    if (chunks_completed > owned.value().total_chunks) {
        return Err<UploadSessionRecord>(ErrorKind::InvalidArgument,
                                        "chunksCompleted exceeds total of " +
                                        std::to_string(owned.value().total_chunks));
    }
    if (bytes_uploaded > owned.value().total_size) {
        return Err<UploadSessionRecord>(ErrorKind::InvalidArgument,
                                        "bytesUploaded exceeds file size of " +
                                        std::to_string(owned.value().total_size));
    }

    return sessions_.update(session_id, [&](UploadSession& s) -> Result<void> {
        const auto now = clock_();
        if (auto moved = s.transition_to(UploadStatus::Uploading, now); moved.is_error()) {
            return moved;
        }
        auto& progress = s.mutable_record();
        progress.bytes_uploaded = std::max(progress.bytes_uploaded, bytes_uploaded);
        progress.updated_at = now;
        return Ok();
    });
}

Result<ResumePlan> TransferOrchestrator::resume_upload(const std::string& session_id, const std::string& owner_id) {
    auto owned = authorize(session_id, owner_id);
    if (owned.is_error()) {
        return Err<ResumePlan>(owned.error());
    }
    auto reclaimed = reclaim_verification(owned.value());
    if (reclaimed.is_error()) {
        return Err<ResumePlan>(reclaimed.error());
    }

    const auto& current = reclaimed.value();
    switch (current.status) {
        case UploadStatus::Completed:
            return Err<ResumePlan>(ErrorKind::InvalidState, "Session already completed");
        case UploadStatus::Verifying:
            return Err<ResumePlan>(ErrorKind::InvalidState, "Session is being verified");
        case UploadStatus::Failed:
            if (current.failure_kind != ErrorKind::Cancelled) {
                return Err<ResumePlan>(ErrorKind::InvalidState,
                                       "Session failed and cannot be resumed: " + current.failure_message);
            }
            break;
        case UploadStatus::Planned:
        case UploadStatus::Uploading:
            break;
    }

    auto selection = select(current.total_size, current.origin, current.priority, true);
    if (selection.is_error()) {
        return Err<ResumePlan>(selection.error());
    }
    const auto assignments = to_assignments(selection.value().edges);

    auto resumed = sessions_.update(session_id, [&](UploadSession& s) -> Result<void> {
        const auto now = clock_();
        if (s.status() == UploadStatus::Failed) {
            auto reopened = UploadSession::reopen(s.record(), now);
            if (reopened.is_error()) {
                return Err<void>(reopened.error());
            }
            s = std::move(reopened.value());
        }
        s.mutable_record().assigned_edges = assignments;
        s.mutable_record().updated_at = now;
        return Ok();
    });
    if (resumed.is_error()) {
        return Err<ResumePlan>(resumed.error());
    }

    ResumePlan plan;
    plan.session = std::move(resumed.value());
    plan.incomplete_chunks = plan.session.incomplete_chunks();
    plan.edges = std::move(selection.value().edges);
    plan.direct_fallback = selection.value().direct_fallback;

    event_bus_.emit(events::SessionResumedEvent{session_id, owner_id, plan.incomplete_chunks.size(),
                                                plan.session.generation});
    return Ok(std::move(plan));
}

Result<UploadSessionRecord> TransferOrchestrator::cancel_upload(const std::string& session_id,
                                                                const std::string& owner_id) {
    return fail_upload(session_id, owner_id, ErrorKind::Cancelled, "Cancelled by owner");
}

Result<UploadSessionRecord> TransferOrchestrator::fail_upload(const std::string& session_id,
                                                              const std::string& owner_id,
                                                              ErrorKind kind,
                                                              const std::string& message) {
    if (auto owned = authorize(session_id, owner_id); owned.is_error()) {
        return owned;
    }

    auto failed = sessions_.update(session_id, [&](UploadSession& s) -> Result<void> {
        if (s.status() == UploadStatus::Verifying) {
            return Err<void>(ErrorKind::InvalidState, "Session is being verified");
        }
        return s.mark_failed(kind, message, clock_());
    });
    if (failed.is_error()) {
        return failed;
    }
    event_bus_.emit(events::UploadFailedEvent{session_id, owner_id, kind, message});
    return failed;
}

Result<UploadSessionRecord> TransferOrchestrator::get_session(const std::string& session_id,
                                                              const std::string& owner_id) {
    return authorize(session_id, owner_id);
}

std::size_t TransferOrchestrator::expire_sessions() {
    {
        const auto now = clock_();
        std::lock_guard lock(receipts_mutex_);
        for (auto it = receipts_.begin(); it != receipts_.end();) {
            it = it->second.expires_at <= now ? receipts_.erase(it) : std::next(it);
        }
    }

    const auto purged = sessions_.purge_expired();
    for (const auto& record : purged) {
        if (auto cleaned = objects_.remove_prefix(staging_prefix(record.session_id)); cleaned.is_error()) {
            spdlog::warn("Could not clear staging for expired session {}: {}",
                         record.session_id, cleaned.error().message);
        }
        if (!session::is_terminal(record.status) || record.failure_kind == ErrorKind::SessionExpired) {
            event_bus_.emit(events::UploadFailedEvent{record.session_id, record.owner_id,
                                                      ErrorKind::SessionExpired, "Session expired"});
        }
    }
    return purged.size();
}

dedup::DedupSavings TransferOrchestrator::dedup_savings() const {
    return dedup_.savings(options_.cost_per_gb);
}

std::optional<dedup::ContentRecord> TransferOrchestrator::find_content(const std::string& content_hash) const {
    return dedup_.lookup(content_hash);
}

Result<UploadSessionRecord> TransferOrchestrator::authorize(const std::string& session_id,
                                                            const std::string& owner_id) {
    if (!session::UploadSessionStore::is_valid_session_id(session_id)) {
        return Err<UploadSessionRecord>(ErrorKind::InvalidArgument, "Invalid session id");
    }
    auto record = sessions_.get(session_id);
    if (record.is_error()) {
        return record;
    }
    if (record.value().owner_id != owner_id) {
        return Err<UploadSessionRecord>(ErrorKind::Forbidden, "Session belongs to another user");
    }
    return record;
}

Result<UploadSessionRecord> TransferOrchestrator::reclaim_verification(const UploadSessionRecord& record) {
    if (record.status != UploadStatus::Verifying || clock_() - record.updated_at < options_.verification_lease) {
        return Ok(record);
    }
    auto reclaimed = sessions_.update(record.session_id, [&](UploadSession& s) -> Result<void> {
        const auto now = clock_();
        if (!s.verification_stalled(now, options_.verification_lease)) {
            return Ok();
        }
        return s.abandon_verification(now);
    });
    if (reclaimed.is_ok() && reclaimed.value().status == UploadStatus::Uploading) {
        spdlog::warn("Verification of session {} stalled; returned it to uploading", record.session_id);
    }
    return reclaimed;
}

std::optional<UploadSessionRecord> TransferOrchestrator::find_receipt(const std::string& session_id) const {
    std::lock_guard lock(receipts_mutex_);
    const auto it = receipts_.find(session_id);
    if (it == receipts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void TransferOrchestrator::fail_session(const std::string& session_id, ErrorKind kind, const std::string& message) {
    auto failed = sessions_.update(session_id, [&](UploadSession& s) {
        return s.mark_failed(kind, message, clock_());
    });
    if (failed.is_error()) {
        spdlog::warn("Could not mark session {} failed: {}", session_id, failed.error().message);
        return;
    }
    event_bus_.emit(events::UploadFailedEvent{session_id, failed.value().owner_id, kind, message});
}

} // namespace edgexfer::transfer
