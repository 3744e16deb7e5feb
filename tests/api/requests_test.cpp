#include "edgexfer/api/requests.hpp"

#include <gtest/gtest.h>

#include <string>
#include <variant>

using namespace edgexfer::api;
using edgexfer::ErrorKind;

namespace {

const std::string kHash(64, 'a');

} // namespace

TEST(RequestParsingTest, JsonBodyMustBeObject) {
    EXPECT_TRUE(parse_json_object(R"({"a":1})").is_ok());
    EXPECT_EQ(parse_json_object("{broken").error().message, "Invalid JSON");
    EXPECT_EQ(parse_json_object("[1,2]").error().kind, ErrorKind::InvalidArgument);
}

TEST(RequestParsingTest, NormalizesHashes) {
    EXPECT_EQ(normalize_hash("sha256:" + std::string(64, 'A')).value(), kHash);
    EXPECT_EQ(normalize_hash(kHash).value(), kHash);
    EXPECT_TRUE(normalize_hash("sha256:abc").is_error());
    EXPECT_TRUE(normalize_hash(std::string(64, 'z')).is_error());
}

TEST(RequestParsingTest, OptimalEdgesFullBody) {
    const json body = {
        {"userId", "alice"},
        {"fileSize", 1073741824},
        {"fileHash", "sha256:" + kHash},
        {"fileName", "movie.mkv"},
        {"userLocation", {{"lat", 40.7}, {"lng", -74.0}}},
        {"priority", "cost"},
        {"budget", 2.5},
    };

    auto parsed = parse_optimal_edges(body);
    ASSERT_TRUE(parsed.is_ok()) << parsed.error().message;
    const auto& request = parsed.value();
    EXPECT_EQ(request.user_id, "alice");
    EXPECT_EQ(request.file_size, 1073741824u);
    EXPECT_EQ(request.file_hash, kHash);
    EXPECT_EQ(request.file_name, "movie.mkv");
    ASSERT_TRUE(request.user_location.has_value());
    EXPECT_DOUBLE_EQ(request.user_location->lat, 40.7);
    EXPECT_EQ(request.priority, edgexfer::edge::Priority::Cost);
    ASSERT_TRUE(request.budget.has_value());
    EXPECT_DOUBLE_EQ(*request.budget, 2.5);
}

TEST(RequestParsingTest, OptimalEdgesDefaults) {
    auto parsed = parse_optimal_edges({{"fileSize", 10}, {"fileHash", kHash}});
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_TRUE(parsed.value().user_id.empty());
    EXPECT_EQ(parsed.value().priority, edgexfer::edge::Priority::Balanced);
    EXPECT_FALSE(parsed.value().user_location.has_value());
    EXPECT_FALSE(parsed.value().budget.has_value());
}

TEST(RequestParsingTest, OptimalEdgesRejectsBadFields) {
    EXPECT_TRUE(parse_optimal_edges({{"fileHash", kHash}}).is_error());
    EXPECT_TRUE(parse_optimal_edges({{"fileSize", 0}, {"fileHash", kHash}}).is_error());
    EXPECT_TRUE(parse_optimal_edges({{"fileSize", -5}, {"fileHash", kHash}}).is_error());
    EXPECT_TRUE(parse_optimal_edges({{"fileSize", "big"}, {"fileHash", kHash}}).is_error());
    EXPECT_TRUE(parse_optimal_edges({{"fileSize", 10}}).is_error());
    EXPECT_TRUE(parse_optimal_edges({{"fileSize", 10}, {"fileHash", kHash}, {"priority", "fastest"}}).is_error());
    EXPECT_TRUE(parse_optimal_edges({{"fileSize", 10}, {"fileHash", kHash}, {"budget", -1}}).is_error());
    EXPECT_TRUE(parse_optimal_edges({{"fileSize", 10}, {"fileHash", kHash},
                                     {"userLocation", {{"lat", 95}, {"lng", 0}}}}).is_error());
    EXPECT_TRUE(parse_optimal_edges({{"fileSize", 10}, {"fileHash", kHash},
                                     {"userLocation", {{"lat", 10}}}}).is_error());
}

TEST(RequestParsingTest, CheckDuplicate) {
    auto parsed = parse_check_duplicate({{"fileHash", kHash}, {"userId", "bob"}, {"fileSize", 42}});
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().user_id, "bob");
    EXPECT_EQ(parsed.value().file_size, 42u);

    EXPECT_EQ(parse_check_duplicate({{"userId", "bob"}}).error().message, "fileHash is required");
    EXPECT_TRUE(parse_check_duplicate({{"fileHash", kHash}, {"fileName", 7}}).is_error());
}

TEST(RequestParsingTest, CacheChunkCompletedNeedsHash) {
    auto completed = parse_cache_chunk({{"sessionId", "s1"}, {"chunkIndex", 3}, {"status", "completed"},
                                        {"chunkHash", kHash}, {"edgeId", "sfo-1"}, {"bytesUploaded", 1024}});
    ASSERT_TRUE(completed.is_ok()) << completed.error().message;
    EXPECT_EQ(completed.value().chunk_index, 3u);
    EXPECT_EQ(completed.value().status, edgexfer::session::ChunkStatus::Completed);
    EXPECT_EQ(completed.value().edge_id, "sfo-1");
    EXPECT_EQ(completed.value().bytes_uploaded, 1024u);

    EXPECT_TRUE(parse_cache_chunk({{"sessionId", "s1"}, {"chunkIndex", 3}, {"status", "completed"}}).is_error());

    auto failed = parse_cache_chunk({{"sessionId", "s1"}, {"chunkIndex", 3}, {"status", "failed"},
                                     {"errorMessage", "timeout"}});
    ASSERT_TRUE(failed.is_ok());
    EXPECT_EQ(failed.value().error_message, "timeout");
}

TEST(RequestParsingTest, CacheChunkRejectsBadFields) {
    EXPECT_TRUE(parse_cache_chunk({{"chunkIndex", 0}, {"status", "pending"}}).is_error());
    EXPECT_TRUE(parse_cache_chunk({{"sessionId", "s1"}, {"status", "pending"}}).is_error());
    EXPECT_TRUE(parse_cache_chunk({{"sessionId", "s1"}, {"chunkIndex", 0}, {"status", "done"}}).is_error());
    EXPECT_TRUE(parse_cache_chunk({{"sessionId", "s1"}, {"chunkIndex", 5000000000ULL},
                                   {"status", "pending"}}).is_error());
}

TEST(RequestParsingTest, TrackUploadActions) {
    auto start = parse_track_upload({{"action", "start"}, {"userId", "alice"}, {"fileSize", 100},
                                     {"fileHash", kHash}});
    ASSERT_TRUE(start.is_ok());
    ASSERT_TRUE(std::holds_alternative<StartUploadAction>(start.value().action));
    EXPECT_EQ(std::get<StartUploadAction>(start.value().action).file.file_size, 100u);

    auto progress = parse_track_upload({{"action", "progress"}, {"sessionId", "s1"},
                                        {"chunksCompleted", 4}, {"bytesUploaded", 4096}});
    ASSERT_TRUE(progress.is_ok());
    const auto& p = std::get<ProgressAction>(progress.value().action);
    EXPECT_EQ(p.session_id, "s1");
    EXPECT_EQ(p.chunks_completed, 4u);
    EXPECT_EQ(p.bytes_uploaded, 4096u);

    auto complete = parse_track_upload({{"action", "complete"}, {"sessionId", "s1"}});
    ASSERT_TRUE(complete.is_ok());
    EXPECT_TRUE(std::holds_alternative<CompleteAction>(complete.value().action));

    auto fail = parse_track_upload({{"action", "fail"}, {"sessionId", "s1"}});
    ASSERT_TRUE(fail.is_ok());
    EXPECT_EQ(std::get<FailAction>(fail.value().action).error_message, "Client reported failure");
}

TEST(RequestParsingTest, TrackUploadRejectsUnknownAction) {
    EXPECT_TRUE(parse_track_upload({{"sessionId", "s1"}}).is_error());
    EXPECT_TRUE(parse_track_upload({{"action", "pause"}, {"sessionId", "s1"}}).is_error());
    EXPECT_TRUE(parse_track_upload({{"action", "complete"}}).is_error());
}

TEST(RequestParsingTest, EdgeMetrics) {
    auto parsed = parse_edge_metrics({{"edgeId", "sfo-1"}, {"latencyMs", 12.5}, {"loadPercent", 40},
                                      {"bandwidthMbps", 900}, {"activeUploads", 7}});
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_DOUBLE_EQ(parsed.value().latency_ms, 12.5);
    EXPECT_EQ(parsed.value().active_uploads, 7u);
    EXPECT_DOUBLE_EQ(parsed.value().error_rate, 0.0);

    EXPECT_TRUE(parse_edge_metrics({{"edgeId", "sfo-1"}, {"latencyMs", 12}, {"loadPercent", 40}}).is_error());
    EXPECT_TRUE(parse_edge_metrics({{"edgeId", "sfo-1"}, {"latencyMs", -1}, {"loadPercent", 40},
                                    {"bandwidthMbps", 1}}).is_error());
    EXPECT_TRUE(parse_edge_metrics({{"edgeId", "sfo-1"}, {"latencyMs", 1}, {"loadPercent", 140},
                                    {"bandwidthMbps", 1}}).is_error());
}

TEST(RequestParsingTest, SessionRequest) {
    auto parsed = parse_session_request({{"sessionId", "s1"}, {"userId", "alice"}});
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().session_id, "s1");
    EXPECT_EQ(parsed.value().user_id, "alice");
    EXPECT_TRUE(parse_session_request({{"userId", "alice"}}).is_error());
}
