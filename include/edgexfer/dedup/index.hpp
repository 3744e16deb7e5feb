#pragma once

#include "edgexfer/core/clock.hpp"
#include "edgexfer/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace edgexfer::dedup {

/**
 * @brief One stored object, keyed by its whole-file SHA-256
 */
struct ContentRecord {
    std::string content_hash;
    std::string object_key;
    std::uint64_t size = 0;
    std::uint64_t reference_count = 0;
    core::TimePoint first_seen{};
    core::TimePoint last_accessed{};
    std::uint64_t duplicate_hits = 0;  ///< References added without a transfer
    std::uint64_t bytes_saved = 0;
    std::set<std::string> holders;  ///< Owners holding a reference
};

struct CommitOutcome {
    ContentRecord record;
    bool created = false;  ///< False when the hash was already present
    bool added = false;    ///< The owner gained a reference
};

struct ReferenceOutcome {
    ContentRecord record;
    bool added = false;  ///< False when the owner already held a reference
};

struct ReleaseOutcome {
    ContentRecord record;
    bool removed = false;  ///< Reference count reached zero; object may be deleted
};

struct DedupSavings {
    std::uint64_t unique_objects = 0;
    std::uint64_t deduplicated_objects = 0;  ///< Objects with at least one duplicate hit
    std::uint64_t duplicate_hits = 0;
    std::uint64_t bytes_saved = 0;
    double cost_saved = 0.0;
};

/**
 * @brief Exact-match content index consulted before any transfer
 *
 * Entries are spread over lock-striped shards: operations on one hash are
 * serialized, operations on hashes in different shards never contend. When
 * a persistence directory is given every record is mirrored to
 * `<dir>/<hh>/<hash>.json` and reloaded on construction.
 *
 * A record exists only for content whose hash was verified by the caller.
 */
class DeduplicationIndex {
public:
    static constexpr std::size_t kDefaultShards = 16;

    explicit DeduplicationIndex(core::Clock clock = core::system_clock(),
                                std::size_t shard_count = kDefaultShards);

    /// Opens a persistent index, loading every record under `directory`.
    static Result<std::unique_ptr<DeduplicationIndex>> open(const std::filesystem::path& directory,
                                                            core::Clock clock = core::system_clock(),
                                                            std::size_t shard_count = kDefaultShards);

    DeduplicationIndex(const DeduplicationIndex&) = delete;
    DeduplicationIndex& operator=(const DeduplicationIndex&) = delete;

    [[nodiscard]] std::optional<ContentRecord> lookup(const std::string& content_hash) const;

    /// Idempotent insert. A present hash gains a reference and the existing
    /// record is returned; a size conflict is an Integrity error.
    ///
    /// References are counted once per (owner, hash): an owner that already
    /// holds the content gains nothing. An empty owner always adds one.
    Result<CommitOutcome> commit(const std::string& content_hash,
                                 const std::string& object_key,
                                 std::uint64_t size,
                                 const std::string& owner_id = {});

    /// Zero-cost clone: a new owner references existing content.
    Result<ReferenceOutcome> add_reference(const std::string& content_hash,
                                           std::uint64_t size,
                                           const std::string& owner_id = {});

    Result<ReleaseOutcome> release(const std::string& content_hash, const std::string& owner_id = {});

    [[nodiscard]] DedupSavings savings(double cost_per_gb) const;

    [[nodiscard]] std::size_t size() const;

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, ContentRecord> records;
    };

    Shard& shard_for(const std::string& content_hash) const;

    Result<void> persist(const ContentRecord& record) const;
    Result<void> erase_persisted(const std::string& content_hash) const;
    Result<void> load();
    [[nodiscard]] std::filesystem::path record_path(const std::string& content_hash) const;

    core::Clock clock_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::optional<std::filesystem::path> directory_;
};

} // namespace edgexfer::dedup
