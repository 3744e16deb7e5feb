#include "edgexfer/dedup/index.hpp"
#include "edgexfer/core/hash.hpp"
#include "edgexfer/core/ids.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace edgexfer::dedup;
using edgexfer::ErrorKind;

namespace {

const std::string kHash = edgexfer::core::sha256_hex(std::string_view{"hello world"});
const std::string kOtherHash = edgexfer::core::sha256_hex(std::string_view{"goodbye"});

class DedupIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("edgexfer-dedup-" + edgexfer::core::generate_uuid());
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};

} // namespace

TEST_F(DedupIndexTest, CommitThenLookup) {
    DeduplicationIndex index;
    EXPECT_FALSE(index.lookup(kHash).has_value());

    auto outcome = index.commit(kHash, "objects/" + kHash, 11);
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_TRUE(outcome.value().created);
    EXPECT_EQ(outcome.value().record.reference_count, 1u);

    auto found = index.lookup(kHash);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->object_key, "objects/" + kHash);
    EXPECT_EQ(found->size, 11u);
}

TEST_F(DedupIndexTest, RepeatedCommitKeepsFirstObjectKey) {
    DeduplicationIndex index;
    ASSERT_TRUE(index.commit(kHash, "objects/first", 11).is_ok());

    auto second = index.commit(kHash, "objects/second", 11);
    ASSERT_TRUE(second.is_ok());
    EXPECT_FALSE(second.value().created);
    EXPECT_EQ(second.value().record.object_key, "objects/first");
    EXPECT_EQ(second.value().record.reference_count, 2u);
    EXPECT_EQ(index.size(), 1u);
}

TEST_F(DedupIndexTest, SizeConflictIsIntegrityError) {
    DeduplicationIndex index;
    ASSERT_TRUE(index.commit(kHash, "objects/a", 11).is_ok());

    auto conflict = index.commit(kHash, "objects/a", 12);
    ASSERT_TRUE(conflict.is_error());
    EXPECT_EQ(conflict.error().kind, ErrorKind::Integrity);
    EXPECT_EQ(index.lookup(kHash)->reference_count, 1u);
}

TEST_F(DedupIndexTest, RejectsMalformedHash) {
    DeduplicationIndex index;
    auto result = index.commit("not-a-hash", "objects/a", 1);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(DedupIndexTest, ConcurrentCommitsCountEveryReference) {
    DeduplicationIndex index;
    constexpr int kThreads = 16;

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&index] {
            auto result = index.commit(kHash, "objects/shared", 11);
            EXPECT_TRUE(result.is_ok());
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    auto record = index.lookup(kHash);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->reference_count, static_cast<std::uint64_t>(kThreads));
    EXPECT_EQ(index.size(), 1u);
}

TEST_F(DedupIndexTest, ReferencesAccumulateSavings) {
    DeduplicationIndex index;
    constexpr std::uint64_t kSize = 524288000;
    ASSERT_TRUE(index.commit(kHash, "objects/a", kSize).is_ok());
    ASSERT_TRUE(index.commit(kOtherHash, "objects/b", 10).is_ok());

    auto cloned = index.add_reference(kHash, kSize);
    ASSERT_TRUE(cloned.is_ok());
    EXPECT_TRUE(cloned.value().added);
    EXPECT_EQ(cloned.value().record.reference_count, 2u);
    EXPECT_EQ(cloned.value().record.bytes_saved, kSize);

    const auto totals = index.savings(0.02);
    EXPECT_EQ(totals.unique_objects, 2u);
    EXPECT_EQ(totals.deduplicated_objects, 1u);
    EXPECT_EQ(totals.duplicate_hits, 1u);
    EXPECT_EQ(totals.bytes_saved, kSize);
    EXPECT_NEAR(totals.cost_saved, 500.0 / 1024.0 * 0.02, 1e-12);
}

TEST_F(DedupIndexTest, OwnerHoldsAtMostOneReference) {
    DeduplicationIndex index;
    ASSERT_TRUE(index.commit(kHash, "objects/a", 11, "alice").is_ok());

    auto again = index.commit(kHash, "objects/a", 11, "alice");
    ASSERT_TRUE(again.is_ok());
    EXPECT_FALSE(again.value().created);
    EXPECT_FALSE(again.value().added);
    EXPECT_EQ(again.value().record.reference_count, 1u);

    auto first = index.add_reference(kHash, 11, "bob");
    ASSERT_TRUE(first.is_ok());
    EXPECT_TRUE(first.value().added);

    auto repeat = index.add_reference(kHash, 11, "bob");
    ASSERT_TRUE(repeat.is_ok());
    EXPECT_FALSE(repeat.value().added);
    EXPECT_EQ(repeat.value().record.reference_count, 2u);
    EXPECT_EQ(repeat.value().record.duplicate_hits, 1u);
    EXPECT_EQ(index.savings(0.1).bytes_saved, 11u);

    EXPECT_EQ(index.release(kHash, "carol").error().kind, ErrorKind::NotFound);
    auto released = index.release(kHash, "bob");
    ASSERT_TRUE(released.is_ok());
    EXPECT_EQ(released.value().record.reference_count, 1u);
    EXPECT_EQ(released.value().record.holders.count("bob"), 0u);

    auto returned = index.add_reference(kHash, 11, "bob");
    ASSERT_TRUE(returned.is_ok());
    EXPECT_TRUE(returned.value().added);
}

TEST_F(DedupIndexTest, AddReferenceToUnknownHashFails) {
    DeduplicationIndex index;
    auto result = index.add_reference(kHash, 11);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
}

TEST_F(DedupIndexTest, ReleaseRemovesLastReference) {
    DeduplicationIndex index;
    ASSERT_TRUE(index.commit(kHash, "objects/a", 11).is_ok());
    ASSERT_TRUE(index.commit(kHash, "objects/a", 11).is_ok());

    auto first = index.release(kHash);
    ASSERT_TRUE(first.is_ok());
    EXPECT_FALSE(first.value().removed);
    EXPECT_EQ(first.value().record.reference_count, 1u);

    auto second = index.release(kHash);
    ASSERT_TRUE(second.is_ok());
    EXPECT_TRUE(second.value().removed);
    EXPECT_FALSE(index.lookup(kHash).has_value());

    EXPECT_EQ(index.release(kHash).error().kind, ErrorKind::NotFound);
}

TEST_F(DedupIndexTest, PersistentIndexSurvivesReopen) {
    {
        auto opened = DeduplicationIndex::open(dir_);
        ASSERT_TRUE(opened.is_ok());
        auto& index = *opened.value();
        ASSERT_TRUE(index.commit(kHash, "objects/a", 11).is_ok());
        ASSERT_TRUE(index.add_reference(kHash, 11, "bob").is_ok());
        ASSERT_TRUE(index.commit(kOtherHash, "objects/b", 7).is_ok());
        ASSERT_TRUE(index.release(kOtherHash).is_ok());
    }

    EXPECT_TRUE(fs::exists(dir_ / kHash.substr(0, 2) / (kHash + ".json")));

    auto reopened = DeduplicationIndex::open(dir_);
    ASSERT_TRUE(reopened.is_ok());
    auto& index = *reopened.value();
    EXPECT_EQ(index.size(), 1u);

    auto record = index.lookup(kHash);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->object_key, "objects/a");
    EXPECT_EQ(record->reference_count, 2u);
    EXPECT_EQ(record->duplicate_hits, 1u);
    EXPECT_EQ(record->holders.count("bob"), 1u);
    EXPECT_FALSE(index.add_reference(kHash, 11, "bob").value().added);
    EXPECT_FALSE(index.lookup(kOtherHash).has_value());
}
