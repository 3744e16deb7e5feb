#include "edgexfer/transfer/orchestrator.hpp"
#include "edgexfer/core/hash.hpp"
#include "edgexfer/core/ids.hpp"
#include "edgexfer/events/components.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <thread>
#include <variant>
#include <vector>

using namespace edgexfer;
using namespace edgexfer::transfer;
using session::UploadStatus;
namespace fs = std::filesystem;

namespace {

/// Relays into the store, but times out the first attempt at `flaky_index`
/// (or every attempt when `always` is set).
class FlakyTransport final : public EdgeTransport {
public:
    FlakyTransport(ObjectStore& store, std::uint32_t flaky_index, bool always = false)
        : relay_(store), flaky_index_(flaky_index), always_(always) {}

    Result<ChunkReceipt> transfer_chunk(const edge::EdgeLocation& edge,
                                        const ChunkPayload& payload,
                                        std::chrono::milliseconds deadline) override {
        if (payload.index == flaky_index_ && (always_ || !tripped_.exchange(true))) {
            std::lock_guard lock(mutex_);
            failed_edges_.push_back(edge.id);
            return Err<ChunkReceipt>(ErrorKind::ChunkTransferTimeout,
                                     "Chunk " + std::to_string(payload.index) + " timed out on " + edge.id);
        }
        return relay_.transfer_chunk(edge, payload, deadline);
    }

    std::vector<std::string> failed_edges() const {
        std::lock_guard lock(mutex_);
        return failed_edges_;
    }

private:
    RelayEdgeTransport relay_;
    std::uint32_t flaky_index_;
    bool always_;
    std::atomic<bool> tripped_{false};
    mutable std::mutex mutex_;
    std::vector<std::string> failed_edges_;
};

std::vector<std::uint8_t> make_payload(std::size_t size, std::uint8_t seed) {
    std::vector<std::uint8_t> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>((i * 31 + seed) & 0xff);
    }
    return data;
}

class OrchestratorTest : public ::testing::Test {
protected:
    static constexpr std::uint64_t kFileSize = 20 * 1024;

    OrchestratorTest()
        : now_(std::chrono::system_clock::time_point(std::chrono::hours(24 * 365 * 56))),
          clock_([this] { return now_; }),
          selector_(registry_, {}, clock_),
          dedup_(clock_),
          sessions_(session_options(), clock_),
          metrics_(bus_),
          data_(make_payload(kFileSize, 7)),
          hash_(core::sha256_hex(data_)) {}

    static session::SessionStoreOptions session_options() {
        session::SessionStoreOptions options;
        options.ttl = std::chrono::hours(1);
        return options;
    }

    static PlannerOptions small_chunks() {
        PlannerOptions options;
        options.bands = {{kGiB, 1024}};
        return options;
    }

    void add_edge(const std::string& id, edge::GeoPoint location, double latency) {
        ASSERT_TRUE(registry_.register_edge(
            edge::EdgeLocation{id, "https://" + id + ".example", id, "US", "test", location, true}).is_ok());
        edge::EdgeMetric metric;
        metric.edge_id = id;
        metric.timestamp = now_;
        metric.latency_ms = latency;
        metric.load_percent = 30.0;
        metric.bandwidth_mbps = 800.0;
        metric.error_rate = 0.5;
        ASSERT_TRUE(registry_.record_metric(metric).is_ok());
    }

    void add_default_edges() {
        add_edge("sfo-1", {37.7749, -122.4194}, 12.0);
        add_edge("lax-1", {34.0522, -118.2437}, 18.0);
    }

    std::unique_ptr<TransferOrchestrator> make_orchestrator(EdgeTransport& transport,
                                                            OrchestratorOptions options = {}) {
        return std::make_unique<TransferOrchestrator>(registry_, selector_, ChunkPlanner(small_chunks()),
                                                      dedup_, sessions_, objects_, transport, bus_,
                                                      std::move(options), clock_);
    }

    FileMeta meta(const std::string& owner = "alice") const {
        FileMeta m;
        m.owner_id = owner;
        m.file_name = "clip.mov";
        m.content_hash = hash_;
        m.file_size = kFileSize;
        m.priority = edge::Priority::Speed;
        return m;
    }

    std::vector<std::uint8_t> chunk(std::uint32_t index) const {
        const auto first = data_.begin() + static_cast<std::ptrdiff_t>(index * 1024);
        return std::vector<std::uint8_t>(first, first + 1024);
    }

    // Lands every chunk and wins verification without finalizing, as a
    // verifier that died mid-finalize leaves it.
    void strand_in_verification(session::UploadSessionStore& store, ObjectStore& objects,
                                const session::UploadSessionRecord& record) {
        for (std::uint32_t i = 0; i < record.total_chunks; ++i) {
            const auto data = chunk(i);
            ASSERT_TRUE(objects.put(staging_key(record.session_id, i), data).is_ok());
            ASSERT_TRUE(store.update(record.session_id, [&](session::UploadSession& s) -> Result<void> {
                auto landed = s.complete_chunk(i, core::sha256_hex(data), "sfo-1", data.size(), now_);
                if (landed.is_error()) {
                    return Err<void>(landed.error());
                }
                return Ok();
            }).is_ok());
        }
        ASSERT_TRUE(store.update(record.session_id, [&](session::UploadSession& s) {
            return s.begin_verification(now_);
        }).is_ok());
    }

    session::UploadSessionRecord start(TransferOrchestrator& orchestrator, const FileMeta& m) {
        auto started = orchestrator.start_upload(m);
        EXPECT_TRUE(started.is_ok());
        EXPECT_TRUE(std::holds_alternative<UploadPlan>(started.value()));
        return std::get<UploadPlan>(started.value()).session;
    }

    core::TimePoint now_;
    core::Clock clock_;
    edge::InMemoryEdgeRegistry registry_;
    edge::EdgeSelector selector_;
    dedup::DeduplicationIndex dedup_;
    session::UploadSessionStore sessions_;
    InMemoryObjectStore objects_;
    events::EventBus bus_;
    events::MetricsComponent metrics_;
    std::vector<std::uint8_t> data_;
    std::string hash_;
};

} // namespace

TEST_F(OrchestratorTest, DuplicateContentSkipsTransfer) {
    constexpr std::uint64_t kVideoSize = 524288000;
    const auto video_hash = core::sha256_hex(std::string_view{"lecture-recording.mp4"});
    ASSERT_TRUE(dedup_.commit(video_hash, "objects/" + video_hash + "/f1", kVideoSize).is_ok());

    add_default_edges();
    RelayEdgeTransport transport(objects_);
    auto orchestrator = make_orchestrator(transport);

    FileMeta m = meta("bob");
    m.content_hash = video_hash;
    m.file_size = kVideoSize;
    auto started = orchestrator->start_upload(m);
    ASSERT_TRUE(started.is_ok());
    ASSERT_TRUE(std::holds_alternative<DuplicateResult>(started.value()));

    const auto& duplicate = std::get<DuplicateResult>(started.value());
    EXPECT_EQ(duplicate.bytes_saved, kVideoSize);
    EXPECT_EQ(duplicate.object_key, "objects/" + video_hash + "/f1");
    EXPECT_EQ(duplicate.file_id, "f1");
    EXPECT_EQ(duplicate.record.reference_count, 2u);

    const auto savings = orchestrator->dedup_savings();
    EXPECT_EQ(savings.bytes_saved, kVideoSize);
    EXPECT_EQ(savings.duplicate_hits, 1u);
    EXPECT_EQ(sessions_.size(), 0u);
    EXPECT_EQ(metrics_.get_stats().duplicates_detected.load(), 1u);
}

TEST_F(OrchestratorTest, StartPlansSessionAcrossSelectedEdges) {
    add_default_edges();
    RelayEdgeTransport transport(objects_);
    auto orchestrator = make_orchestrator(transport);

    auto started = orchestrator->start_upload(meta());
    ASSERT_TRUE(started.is_ok());
    const auto& plan = std::get<UploadPlan>(started.value());
    EXPECT_EQ(plan.session.status, UploadStatus::Planned);
    EXPECT_EQ(plan.session.total_chunks, 20u);
    EXPECT_EQ(plan.session.chunk_size, 1024u);
    EXPECT_EQ(plan.session.parallelism, 12u);
    EXPECT_FALSE(plan.strategy.direct_fallback);
    ASSERT_EQ(plan.session.assigned_edges.size(), 2u);
    EXPECT_EQ(plan.session.assigned_edges[0].edge_id, "sfo-1");
    EXPECT_EQ(metrics_.get_stats().uploads_planned.load(), 1u);
}

TEST_F(OrchestratorTest, RunTransferCompletesAndCommitsContent) {
    add_default_edges();
    RelayEdgeTransport transport(objects_);
    auto orchestrator = make_orchestrator(transport);
    const auto record = start(*orchestrator, meta());

    MemoryChunkSource source(data_);
    auto finished = orchestrator->run_transfer(record.session_id, source);
    ASSERT_TRUE(finished.is_ok()) << finished.error().message;
    EXPECT_EQ(finished.value().status, UploadStatus::Completed);
    EXPECT_EQ(finished.value().completed_chunks.size(), 20u);
    EXPECT_EQ(finished.value().bytes_uploaded, kFileSize);

    auto stored = orchestrator->find_content(hash_);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->object_key, object_key_for(hash_, record.file_id));
    auto object = objects_.get(stored->object_key);
    ASSERT_TRUE(object.is_ok());
    EXPECT_EQ(object.value(), data_);
    EXPECT_EQ(objects_.size(), 1u);

    EXPECT_EQ(metrics_.get_stats().uploads_completed.load(), 1u);
    EXPECT_EQ(metrics_.get_stats().chunks_completed.load(), 20u);
    EXPECT_EQ(sessions_.size(), 0u);
    EXPECT_EQ(orchestrator->get_session(record.session_id, "alice").error().kind, ErrorKind::NotFound);
}

TEST_F(OrchestratorTest, TimedOutChunkIsRetriedOnAnotherEdge) {
    add_default_edges();
    FlakyTransport transport(objects_, 7);
    auto orchestrator = make_orchestrator(transport);
    const auto record = start(*orchestrator, meta());

    std::mutex retries_mutex;
    std::vector<events::ChunkRetriedEvent> retries;
    bus_.subscribe<events::ChunkRetriedEvent>([&](const events::ChunkRetriedEvent& e) {
        std::lock_guard lock(retries_mutex);
        retries.push_back(e);
    });

    MemoryChunkSource source(data_);
    auto finished = orchestrator->run_transfer(record.session_id, source);
    ASSERT_TRUE(finished.is_ok()) << finished.error().message;
    EXPECT_EQ(finished.value().status, UploadStatus::Completed);
    EXPECT_EQ(finished.value().completed_chunks.size(), 20u);

    const auto failed = transport.failed_edges();
    ASSERT_EQ(failed.size(), 1u);
    ASSERT_EQ(retries.size(), 1u);
    EXPECT_EQ(retries[0].chunk_index, 7u);
    EXPECT_EQ(retries[0].failed_edge, failed[0]);
    EXPECT_NE(retries[0].next_edge, failed[0]);
    EXPECT_EQ(retries[0].attempt, 2u);

    const auto& chunk7 = finished.value().chunks.at(7);
    EXPECT_EQ(chunk7.edge_id, retries[0].next_edge);
    EXPECT_EQ(chunk7.attempts, 2u);
    EXPECT_EQ(metrics_.get_stats().chunk_timeouts.load(), 1u);
}

TEST_F(OrchestratorTest, ChunkFailingEveryAttemptFailsSession) {
    add_default_edges();
    FlakyTransport transport(objects_, 3, true);
    auto orchestrator = make_orchestrator(transport);
    const auto record = start(*orchestrator, meta());

    MemoryChunkSource source(data_);
    auto finished = orchestrator->run_transfer(record.session_id, source);
    ASSERT_TRUE(finished.is_error());
    EXPECT_EQ(finished.error().kind, ErrorKind::ChunkTransferTimeout);
    EXPECT_EQ(transport.failed_edges().size(), 3u);

    auto stored = sessions_.get(record.session_id);
    ASSERT_TRUE(stored.is_ok());
    EXPECT_EQ(stored.value().status, UploadStatus::Failed);
    EXPECT_EQ(stored.value().failure_kind.value(), ErrorKind::ChunkTransferTimeout);
    EXPECT_FALSE(orchestrator->find_content(hash_).has_value());
}

TEST_F(OrchestratorTest, HashMismatchFailsVerification) {
    add_default_edges();
    RelayEdgeTransport transport(objects_);
    auto orchestrator = make_orchestrator(transport);

    FileMeta m = meta();
    m.content_hash = core::sha256_hex(std::string_view{"something else entirely"});
    const auto record = start(*orchestrator, m);

    MemoryChunkSource source(data_);
    auto finished = orchestrator->run_transfer(record.session_id, source);
    ASSERT_TRUE(finished.is_error());
    EXPECT_EQ(finished.error().kind, ErrorKind::Integrity);

    auto stored = sessions_.get(record.session_id);
    ASSERT_TRUE(stored.is_ok());
    EXPECT_EQ(stored.value().status, UploadStatus::Failed);
    EXPECT_EQ(stored.value().failure_kind.value(), ErrorKind::Integrity);
    EXPECT_EQ(dedup_.size(), 0u);
    EXPECT_EQ(metrics_.get_stats().uploads_failed.load(), 1u);
}

TEST_F(OrchestratorTest, ClientChunksFinalizeOnLastArrival) {
    add_default_edges();
    RelayEdgeTransport transport(objects_);
    auto orchestrator = make_orchestrator(transport);
    const auto record = start(*orchestrator, meta());

    for (std::uint32_t i = 20; i-- > 0;) {
        auto landed = orchestrator->accept_chunk_data(record.session_id, "alice", i, chunk(i));
        ASSERT_TRUE(landed.is_ok()) << landed.error().message;
        EXPECT_EQ(landed.value().status, i == 0 ? UploadStatus::Completed : UploadStatus::Uploading);
    }

    EXPECT_TRUE(orchestrator->find_content(hash_).has_value());
    for (const auto& key : objects_.keys()) {
        EXPECT_EQ(key.rfind("staging/", 0), std::string::npos) << key;
    }

    EXPECT_EQ(sessions_.size(), 0u);

    auto again = orchestrator->finalize(record.session_id, "alice");
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value().status, UploadStatus::Completed);
    EXPECT_EQ(again.value().completed_chunks.size(), 20u);
    EXPECT_EQ(dedup_.lookup(hash_)->reference_count, 1u);
    EXPECT_EQ(orchestrator->finalize(record.session_id, "bob").error().kind, ErrorKind::Forbidden);

    now_ += std::chrono::hours(2);
    orchestrator->expire_sessions();
    EXPECT_EQ(orchestrator->finalize(record.session_id, "alice").error().kind, ErrorKind::NotFound);
}

TEST_F(OrchestratorTest, ConcurrentLastChunksFinalizeOnce) {
    add_default_edges();
    RelayEdgeTransport transport(objects_);
    auto orchestrator = make_orchestrator(transport);
    const auto record = start(*orchestrator, meta());

    std::atomic<int> completions{0};
    bus_.subscribe<events::UploadCompletedEvent>([&](const events::UploadCompletedEvent&) { ++completions; });

    std::atomic<int> failures{0};
    std::vector<std::thread> senders;
    for (std::uint32_t i = 0; i < record.total_chunks; ++i) {
        senders.emplace_back([&, i] {
            if (orchestrator->accept_chunk_data(record.session_id, "alice", i, chunk(i)).is_error()) {
                ++failures;
            }
        });
    }
    for (auto& t : senders) {
        t.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(completions.load(), 1);
    ASSERT_TRUE(dedup_.lookup(hash_).has_value());
    EXPECT_EQ(dedup_.lookup(hash_)->reference_count, 1u);
    EXPECT_EQ(sessions_.size(), 0u);
    EXPECT_EQ(objects_.size(), 1u);
}

TEST_F(OrchestratorTest, StalledVerificationIsReclaimedAfterLease) {
    add_default_edges();
    RelayEdgeTransport transport(objects_);
    auto orchestrator = make_orchestrator(transport);
    const auto record = start(*orchestrator, meta());
    strand_in_verification(sessions_, objects_, record);

    now_ += std::chrono::minutes(1);
    auto early = orchestrator->finalize(record.session_id, "alice");
    ASSERT_TRUE(early.is_error());
    EXPECT_EQ(early.error().kind, ErrorKind::InvalidState);
    EXPECT_EQ(orchestrator->resume_upload(record.session_id, "alice").error().kind, ErrorKind::InvalidState);

    now_ += std::chrono::minutes(5);
    auto finished = orchestrator->finalize(record.session_id, "alice");
    ASSERT_TRUE(finished.is_ok()) << finished.error().message;
    EXPECT_EQ(finished.value().status, UploadStatus::Completed);
    EXPECT_EQ(dedup_.lookup(hash_)->reference_count, 1u);
    EXPECT_EQ(objects_.get(object_key_for(hash_, record.file_id)).value(), data_);
}

TEST_F(OrchestratorTest, CancelIsRefusedWhileVerifying) {
    add_default_edges();
    RelayEdgeTransport transport(objects_);
    auto orchestrator = make_orchestrator(transport);
    const auto record = start(*orchestrator, meta());
    strand_in_verification(sessions_, objects_, record);

    auto cancelled = orchestrator->cancel_upload(record.session_id, "alice");
    ASSERT_TRUE(cancelled.is_error());
    EXPECT_EQ(cancelled.error().kind, ErrorKind::InvalidState);
    auto failed = orchestrator->fail_upload(record.session_id, "alice", ErrorKind::Io, "client gave up");
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().kind, ErrorKind::InvalidState);
    EXPECT_EQ(sessions_.get(record.session_id).value().status, UploadStatus::Verifying);
    EXPECT_EQ(metrics_.get_stats().uploads_cancelled.load(), 0u);

    now_ += std::chrono::minutes(5);
    auto finished = orchestrator->finalize(record.session_id, "alice");
    ASSERT_TRUE(finished.is_ok()) << finished.error().message;
    EXPECT_EQ(finished.value().status, UploadStatus::Completed);
}

TEST_F(OrchestratorTest, RepeatedDuplicateChecksReferenceOncePerOwner) {
    const auto video_hash = core::sha256_hex(std::string_view{"lecture-recording.mp4"});
    ASSERT_TRUE(dedup_.commit(video_hash, "objects/" + video_hash + "/f1", kFileSize).is_ok());
    add_default_edges();
    RelayEdgeTransport transport(objects_);
    auto orchestrator = make_orchestrator(transport);

    auto checked = orchestrator->check_duplicate(video_hash, "bob", kFileSize);
    ASSERT_TRUE(checked.is_ok());
    ASSERT_TRUE(checked.value().has_value());
    EXPECT_EQ(checked.value()->record.reference_count, 2u);

    FileMeta m = meta("bob");
    m.content_hash = video_hash;
    auto recommended = orchestrator->recommend(m);
    ASSERT_TRUE(recommended.is_ok());
    ASSERT_TRUE(std::holds_alternative<DuplicateResult>(recommended.value()));
    EXPECT_EQ(std::get<DuplicateResult>(recommended.value()).record.reference_count, 2u);

    EXPECT_EQ(dedup_.lookup(video_hash)->reference_count, 2u);
    EXPECT_EQ(metrics_.get_stats().duplicates_detected.load(), 1u);
}

TEST_F(OrchestratorTest, RelayRefusesExpiredDeadlineBeforeStaging) {
    RelayEdgeTransport transport(objects_);
    ChunkPayload payload;
    payload.session_id = core::generate_uuid();
    payload.index = 0;
    payload.data = chunk(0);
    payload.chunk_hash = core::sha256_hex(payload.data);
    const edge::EdgeLocation edge{"sfo-1", "https://sfo-1.example", "sfo-1", "US", "test", {37.7749, -122.4194}, true};

    auto receipt = transport.transfer_chunk(edge, payload, std::chrono::milliseconds(0));
    ASSERT_TRUE(receipt.is_error());
    EXPECT_EQ(receipt.error().kind, ErrorKind::ChunkTransferTimeout);
    EXPECT_EQ(objects_.size(), 0u);

    auto relayed = transport.transfer_chunk(edge, payload, std::chrono::seconds(30));
    ASSERT_TRUE(relayed.is_ok());
    EXPECT_TRUE(objects_.exists(staging_key(payload.session_id, 0)));
}

TEST_F(OrchestratorTest, ChunkDataMustMatchPlannedLength) {
    add_default_edges();
    RelayEdgeTransport transport(objects_);
    auto orchestrator = make_orchestrator(transport);
    const auto record = start(*orchestrator, meta());

    auto short_chunk = orchestrator->accept_chunk_data(record.session_id, "alice", 0,
                                                       std::vector<std::uint8_t>(100, 1));
    ASSERT_TRUE(short_chunk.is_error());
    EXPECT_EQ(short_chunk.error().kind, ErrorKind::InvalidArgument);

    auto out_of_range = orchestrator->accept_chunk_data(record.session_id, "alice", 20,
                                                        std::vector<std::uint8_t>(1024, 1));
    ASSERT_TRUE(out_of_range.is_error());
    EXPECT_EQ(out_of_range.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(OrchestratorTest, CancelledSessionResumesWithRemainingChunks) {
    add_default_edges();
    RelayEdgeTransport transport(objects_);
    auto orchestrator = make_orchestrator(transport);
    const auto record = start(*orchestrator, meta());

    for (std::uint32_t i = 0; i < 5; ++i) {
        ASSERT_TRUE(orchestrator->accept_chunk_data(record.session_id, "alice", i, chunk(i)).is_ok());
    }

    auto cancelled = orchestrator->cancel_upload(record.session_id, "alice");
    ASSERT_TRUE(cancelled.is_ok());
    EXPECT_EQ(cancelled.value().status, UploadStatus::Failed);
    EXPECT_EQ(cancelled.value().failure_kind.value(), ErrorKind::Cancelled);

    auto resumed = orchestrator->resume_upload(record.session_id, "alice");
    ASSERT_TRUE(resumed.is_ok()) << resumed.error().message;
    EXPECT_EQ(resumed.value().session.status, UploadStatus::Planned);
    EXPECT_EQ(resumed.value().session.generation, 2u);
    EXPECT_EQ(resumed.value().incomplete_chunks.size(), 15u);
    EXPECT_EQ(resumed.value().incomplete_chunks.front(), 5u);

    MemoryChunkSource source(data_);
    auto finished = orchestrator->run_transfer(record.session_id, source);
    ASSERT_TRUE(finished.is_ok()) << finished.error().message;
    EXPECT_EQ(finished.value().status, UploadStatus::Completed);
    EXPECT_EQ(metrics_.get_stats().uploads_cancelled.load(), 1u);
    EXPECT_EQ(metrics_.get_stats().sessions_resumed.load(), 1u);
}

TEST_F(OrchestratorTest, FailedSessionCannotResume) {
    add_default_edges();
    RelayEdgeTransport transport(objects_);
    auto orchestrator = make_orchestrator(transport);
    const auto record = start(*orchestrator, meta());

    ASSERT_TRUE(orchestrator->fail_upload(record.session_id, "alice", ErrorKind::Io, "client gave up").is_ok());
    auto resumed = orchestrator->resume_upload(record.session_id, "alice");
    ASSERT_TRUE(resumed.is_error());
    EXPECT_EQ(resumed.error().kind, ErrorKind::InvalidState);
}

TEST_F(OrchestratorTest, SessionsAreOwnerScoped) {
    add_default_edges();
    RelayEdgeTransport transport(objects_);
    auto orchestrator = make_orchestrator(transport);
    const auto record = start(*orchestrator, meta());

    EXPECT_EQ(orchestrator->get_session(record.session_id, "bob").error().kind, ErrorKind::Forbidden);
    EXPECT_EQ(orchestrator->cancel_upload(record.session_id, "bob").error().kind, ErrorKind::Forbidden);
    EXPECT_EQ(orchestrator->get_session("no-such-session", "alice").error().kind, ErrorKind::NotFound);
    EXPECT_EQ(orchestrator->get_session("../escape", "alice").error().kind, ErrorKind::InvalidArgument);
}

TEST_F(OrchestratorTest, ExpiredSessionsArePurged) {
    add_default_edges();
    RelayEdgeTransport transport(objects_);
    auto orchestrator = make_orchestrator(transport);
    const auto record = start(*orchestrator, meta());
    ASSERT_TRUE(orchestrator->accept_chunk_data(record.session_id, "alice", 0, chunk(0)).is_ok());

    now_ += std::chrono::hours(2);
    auto expired = orchestrator->get_session(record.session_id, "alice");
    ASSERT_TRUE(expired.is_error());
    EXPECT_EQ(expired.error().kind, ErrorKind::SessionExpired);

    EXPECT_EQ(orchestrator->expire_sessions(), 1u);
    EXPECT_EQ(sessions_.size(), 0u);
    EXPECT_EQ(objects_.size(), 0u);
    EXPECT_EQ(metrics_.get_stats().sessions_expired.load(), 1u);
}

TEST_F(OrchestratorTest, StartFallsBackToDirectEdgeButRecommendDoesNot) {
    RelayEdgeTransport transport(objects_);
    auto orchestrator = make_orchestrator(transport);

    auto recommended = orchestrator->recommend(meta());
    ASSERT_TRUE(recommended.is_error());
    EXPECT_EQ(recommended.error().kind, ErrorKind::NoEdgesAvailable);

    auto started = orchestrator->start_upload(meta());
    ASSERT_TRUE(started.is_ok());
    const auto& plan = std::get<UploadPlan>(started.value());
    EXPECT_TRUE(plan.strategy.direct_fallback);
    ASSERT_EQ(plan.session.assigned_edges.size(), 1u);
    EXPECT_EQ(plan.session.assigned_edges[0].edge_id, "lyve-direct");

    MemoryChunkSource source(data_);
    auto finished = orchestrator->run_transfer(plan.session.session_id, source);
    ASSERT_TRUE(finished.is_ok()) << finished.error().message;
    EXPECT_EQ(finished.value().status, UploadStatus::Completed);
}

TEST_F(OrchestratorTest, QuotaAndBudgetAreEnforced) {
    add_default_edges();
    RelayEdgeTransport transport(objects_);
    OrchestratorOptions options;
    options.user_quota_bytes = 30 * 1024;
    auto orchestrator = make_orchestrator(transport, options);
    start(*orchestrator, meta());

    FileMeta second = meta();
    second.content_hash = core::sha256_hex(std::string_view{"second file"});
    auto over_quota = orchestrator->start_upload(second);
    ASSERT_TRUE(over_quota.is_error());
    EXPECT_EQ(over_quota.error().kind, ErrorKind::QuotaExceeded);

    auto unlimited = make_orchestrator(transport);
    FileMeta expensive = meta("bob");
    expensive.content_hash = second.content_hash;
    expensive.file_size = 10 * kGiB;
    expensive.budget = 0.5;
    auto over_budget = unlimited->recommend(expensive);
    ASSERT_TRUE(over_budget.is_error());
    EXPECT_EQ(over_budget.error().kind, ErrorKind::QuotaExceeded);

    expensive.budget = 5.0;
    auto within_budget = unlimited->recommend(expensive);
    ASSERT_TRUE(within_budget.is_ok());
    const auto& strategy = std::get<UploadStrategy>(within_budget.value());
    EXPECT_DOUBLE_EQ(strategy.estimate.cost, 1.0);
    EXPECT_EQ(strategy.chunk_plan.chunk_size, 100 * kMiB);
}

TEST_F(OrchestratorTest, RejectsInvalidFileMeta) {
    RelayEdgeTransport transport(objects_);
    auto orchestrator = make_orchestrator(transport);

    FileMeta bad_hash = meta();
    bad_hash.content_hash = "ABC";
    EXPECT_EQ(orchestrator->start_upload(bad_hash).error().kind, ErrorKind::InvalidArgument);

    FileMeta empty = meta();
    empty.file_size = 0;
    EXPECT_EQ(orchestrator->start_upload(empty).error().kind, ErrorKind::InvalidArgument);

    FileMeta anonymous = meta("");
    EXPECT_EQ(orchestrator->recommend(anonymous).error().kind, ErrorKind::InvalidArgument);
}

namespace {

class OrchestratorRestartTest : public OrchestratorTest {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("edgexfer-orchestrator-" + core::generate_uuid());
        disk_ = std::make_unique<FilesystemObjectStore>(dir_ / "objects");
        relay_ = std::make_unique<RelayEdgeTransport>(*disk_);
        add_default_edges();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::unique_ptr<session::UploadSessionStore> open_store() {
        auto options = session_options();
        options.state_dir = dir_ / "sessions";
        auto store = std::make_unique<session::UploadSessionStore>(options, clock_);
        auto loaded = store->load();
        EXPECT_TRUE(loaded.is_ok()) << loaded.error().message;
        return store;
    }

    std::unique_ptr<TransferOrchestrator> orchestrate(session::UploadSessionStore& store) {
        return std::make_unique<TransferOrchestrator>(registry_, selector_, ChunkPlanner(small_chunks()),
                                                      dedup_, store, *disk_, *relay_, bus_,
                                                      OrchestratorOptions{}, clock_);
    }

    fs::path dir_;
    std::unique_ptr<FilesystemObjectStore> disk_;
    std::unique_ptr<RelayEdgeTransport> relay_;
};

} // namespace

TEST_F(OrchestratorRestartTest, ResumesAndCompletesAfterRestart) {
    std::string session_id;
    {
        auto store = open_store();
        auto orchestrator = orchestrate(*store);
        const auto record = start(*orchestrator, meta());
        session_id = record.session_id;
        for (std::uint32_t i = 0; i < 5; ++i) {
            ASSERT_TRUE(orchestrator->accept_chunk_data(session_id, "alice", i, chunk(i)).is_ok());
        }
    }

    now_ += std::chrono::minutes(3);
    auto store = open_store();
    ASSERT_EQ(store->size(), 1u);
    auto orchestrator = orchestrate(*store);

    auto resumed = orchestrator->resume_upload(session_id, "alice");
    ASSERT_TRUE(resumed.is_ok()) << resumed.error().message;
    EXPECT_EQ(resumed.value().incomplete_chunks.size(), 15u);
    EXPECT_EQ(resumed.value().incomplete_chunks.front(), 5u);

    MemoryChunkSource source(data_);
    auto finished = orchestrator->run_transfer(session_id, source);
    ASSERT_TRUE(finished.is_ok()) << finished.error().message;
    EXPECT_EQ(finished.value().status, UploadStatus::Completed);
    EXPECT_EQ(finished.value().completed_chunks.size(), 20u);
    EXPECT_EQ(metrics_.get_stats().chunks_completed.load(), 20u);

    EXPECT_EQ(store->size(), 0u);
    EXPECT_EQ(open_store()->size(), 0u);
    const auto stored = dedup_.lookup(hash_);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(disk_->get(stored->object_key).value(), data_);
}

TEST_F(OrchestratorRestartTest, VerificationInterruptedByRestartCanFinish) {
    std::string session_id;
    {
        auto store = open_store();
        auto orchestrator = orchestrate(*store);
        const auto record = start(*orchestrator, meta());
        session_id = record.session_id;
        strand_in_verification(*store, *disk_, record);
    }

    now_ += std::chrono::minutes(1);
    auto store = open_store();
    auto orchestrator = orchestrate(*store);
    EXPECT_EQ(store->get(session_id).value().status, UploadStatus::Uploading);

    auto finished = orchestrator->finalize(session_id, "alice");
    ASSERT_TRUE(finished.is_ok()) << finished.error().message;
    EXPECT_EQ(finished.value().status, UploadStatus::Completed);
    EXPECT_EQ(dedup_.lookup(hash_)->reference_count, 1u);
    EXPECT_EQ(store->size(), 0u);
    EXPECT_TRUE(orchestrator->finalize(session_id, "alice").is_ok());
}
