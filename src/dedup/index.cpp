#include "edgexfer/dedup/index.hpp"

#include "edgexfer/core/files.hpp"
#include "edgexfer/core/hash.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>

namespace edgexfer::dedup {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr double kBytesPerGiB = 1024.0 * 1024.0 * 1024.0;

json record_to_json(const ContentRecord& record) {
    json j;
    j["content_hash"] = record.content_hash;
    j["object_key"] = record.object_key;
    j["size"] = record.size;
    j["reference_count"] = record.reference_count;
    j["first_seen_ms"] = core::to_unix_millis(record.first_seen);
    j["last_accessed_ms"] = core::to_unix_millis(record.last_accessed);
    j["duplicate_hits"] = record.duplicate_hits;
    j["bytes_saved"] = record.bytes_saved;
    j["holders"] = record.holders;
    return j;
}

std::optional<ContentRecord> record_from_json(const json& j) {
    if (!j.is_object() || !j.contains("content_hash") || !j.contains("object_key")) {
        return std::nullopt;
    }
    ContentRecord record;
    record.content_hash = j.value("content_hash", std::string{});
    record.object_key = j.value("object_key", std::string{});
    record.size = j.value("size", std::uint64_t{0});
    record.reference_count = j.value("reference_count", std::uint64_t{0});
    record.first_seen = core::from_unix_millis(j.value("first_seen_ms", std::int64_t{0}));
    record.last_accessed = core::from_unix_millis(j.value("last_accessed_ms", std::int64_t{0}));
    record.duplicate_hits = j.value("duplicate_hits", std::uint64_t{0});
    record.bytes_saved = j.value("bytes_saved", std::uint64_t{0});
    for (const auto& holder : j.value("holders", json::array())) {
        if (holder.is_string()) {
            record.holders.insert(holder.get<std::string>());
        }
    }
    if (!core::is_sha256_hex(record.content_hash)) {
        return std::nullopt;
    }
    return record;
}

Result<void> validate_hash(const std::string& content_hash) {
    if (!core::is_sha256_hex(content_hash)) {
        return Err<void>(ErrorKind::InvalidArgument,
                         "Content hash must be 64 lowercase hex characters");
    }
    return Ok();
}

} // namespace

DeduplicationIndex::DeduplicationIndex(core::Clock clock, std::size_t shard_count)
    : clock_(std::move(clock)) {
    shard_count = std::max<std::size_t>(1, shard_count);
    shards_.reserve(shard_count);
    for (std::size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

Result<std::unique_ptr<DeduplicationIndex>> DeduplicationIndex::open(const fs::path& directory,
                                                                     core::Clock clock,
                                                                     std::size_t shard_count) {
    auto index = std::make_unique<DeduplicationIndex>(std::move(clock), shard_count);
    index->directory_ = directory;

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec && !fs::exists(directory)) {
        return Err<std::unique_ptr<DeduplicationIndex>>(ErrorKind::Io,
                                                        "Failed to create index directory: " + directory.string());
    }

    if (auto loaded = index->load(); loaded.is_error()) {
        return Err<std::unique_ptr<DeduplicationIndex>>(loaded.error());
    }
    return Ok(std::move(index));
}

DeduplicationIndex::Shard& DeduplicationIndex::shard_for(const std::string& content_hash) const {
    const auto slot = std::hash<std::string>{}(content_hash) % shards_.size();
    return *shards_[slot];
}

std::optional<ContentRecord> DeduplicationIndex::lookup(const std::string& content_hash) const {
    auto& shard = shard_for(content_hash);
    std::lock_guard lock(shard.mutex);
    auto it = shard.records.find(content_hash);
    if (it == shard.records.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<CommitOutcome> DeduplicationIndex::commit(const std::string& content_hash,
                                                 const std::string& object_key,
                                                 std::uint64_t size,
                                                 const std::string& owner_id) {
    if (auto valid = validate_hash(content_hash); valid.is_error()) {
        return Err<CommitOutcome>(valid.error());
    }
    if (object_key.empty()) {
        return Err<CommitOutcome>(ErrorKind::InvalidArgument, "Object key is required");
    }

    auto& shard = shard_for(content_hash);
    std::lock_guard lock(shard.mutex);
    const auto now = clock_();

    auto it = shard.records.find(content_hash);
    if (it != shard.records.end()) {
        auto& existing = it->second;
        if (existing.size != size) {
            return Err<CommitOutcome>(ErrorKind::Integrity,
                                      "Hash " + content_hash + " already stored with size " +
                                      std::to_string(existing.size) + ", got " + std::to_string(size));
        }
        if (!owner_id.empty() && existing.holders.count(owner_id) > 0) {
            return Ok(CommitOutcome{existing, false, false});
        }
        ContentRecord updated = existing;
        updated.reference_count += 1;
        updated.last_accessed = now;
        if (!owner_id.empty()) {
            updated.holders.insert(owner_id);
        }
        if (auto saved = persist(updated); saved.is_error()) {
            return Err<CommitOutcome>(saved.error());
        }
        existing = updated;
        return Ok(CommitOutcome{existing, false, true});
    }

    ContentRecord record;
    record.content_hash = content_hash;
    record.object_key = object_key;
    record.size = size;
    record.reference_count = 1;
    record.first_seen = now;
    record.last_accessed = now;
    if (!owner_id.empty()) {
        record.holders.insert(owner_id);
    }
    if (auto saved = persist(record); saved.is_error()) {
        return Err<CommitOutcome>(saved.error());
    }
    auto inserted = shard.records.emplace(content_hash, std::move(record)).first;
    spdlog::debug("Dedup index: stored {} -> {} ({} bytes)", content_hash, object_key, size);
    return Ok(CommitOutcome{inserted->second, true, true});
}

Result<ReferenceOutcome> DeduplicationIndex::add_reference(const std::string& content_hash,
                                                           std::uint64_t size,
                                                           const std::string& owner_id) {
    auto& shard = shard_for(content_hash);
    std::lock_guard lock(shard.mutex);

    auto it = shard.records.find(content_hash);
    if (it == shard.records.end()) {
        return Err<ReferenceOutcome>(ErrorKind::NotFound, "Unknown content hash: " + content_hash);
    }
    auto& existing = it->second;
    if (size != 0 && existing.size != size) {
        return Err<ReferenceOutcome>(ErrorKind::Integrity,
                                     "Hash " + content_hash + " is stored with size " +
                                     std::to_string(existing.size) + ", request claims " + std::to_string(size));
    }
    if (!owner_id.empty() && existing.holders.count(owner_id) > 0) {
        return Ok(ReferenceOutcome{existing, false});
    }

    ContentRecord updated = existing;
    updated.reference_count += 1;
    updated.duplicate_hits += 1;
    updated.bytes_saved += existing.size;
    updated.last_accessed = clock_();
    if (!owner_id.empty()) {
        updated.holders.insert(owner_id);
    }
    if (auto saved = persist(updated); saved.is_error()) {
        return Err<ReferenceOutcome>(saved.error());
    }
    existing = updated;
    return Ok(ReferenceOutcome{existing, true});
}

Result<ReleaseOutcome> DeduplicationIndex::release(const std::string& content_hash, const std::string& owner_id) {
    auto& shard = shard_for(content_hash);
    std::lock_guard lock(shard.mutex);

    auto it = shard.records.find(content_hash);
    if (it == shard.records.end()) {
        return Err<ReleaseOutcome>(ErrorKind::NotFound, "Unknown content hash: " + content_hash);
    }

    ContentRecord updated = it->second;
    if (!owner_id.empty() && updated.holders.erase(owner_id) == 0) {
        return Err<ReleaseOutcome>(ErrorKind::NotFound, owner_id + " holds no reference to " + content_hash);
    }
    if (updated.reference_count > 0) {
        updated.reference_count -= 1;
    }
    updated.last_accessed = clock_();

    if (updated.reference_count == 0) {
        if (auto erased = erase_persisted(content_hash); erased.is_error()) {
            return Err<ReleaseOutcome>(erased.error());
        }
        shard.records.erase(it);
        spdlog::debug("Dedup index: released last reference to {}", content_hash);
        return Ok(ReleaseOutcome{std::move(updated), true});
    }

    if (auto saved = persist(updated); saved.is_error()) {
        return Err<ReleaseOutcome>(saved.error());
    }
    it->second = updated;
    return Ok(ReleaseOutcome{std::move(updated), false});
}

DedupSavings DeduplicationIndex::savings(double cost_per_gb) const {
    DedupSavings totals;
    for (const auto& shard : shards_) {
        std::lock_guard lock(shard->mutex);
        for (const auto& [hash, record] : shard->records) {
            totals.unique_objects += 1;
            totals.duplicate_hits += record.duplicate_hits;
            totals.bytes_saved += record.bytes_saved;
            if (record.duplicate_hits > 0) {
                totals.deduplicated_objects += 1;
            }
        }
    }
    totals.cost_saved = static_cast<double>(totals.bytes_saved) / kBytesPerGiB * cost_per_gb;
    return totals;
}

std::size_t DeduplicationIndex::size() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard lock(shard->mutex);
        total += shard->records.size();
    }
    return total;
}

fs::path DeduplicationIndex::record_path(const std::string& content_hash) const {
    return *directory_ / content_hash.substr(0, 2) / (content_hash + ".json");
}

Result<void> DeduplicationIndex::persist(const ContentRecord& record) const {
    if (!directory_) {
        return Ok();
    }
    return core::write_file_atomic(record_path(record.content_hash), record_to_json(record).dump());
}

Result<void> DeduplicationIndex::erase_persisted(const std::string& content_hash) const {
    if (!directory_) {
        return Ok();
    }
    std::error_code ec;
    fs::remove(record_path(content_hash), ec);
    if (ec) {
        return Err<void>(ErrorKind::Io, "Failed to remove index record for " + content_hash);
    }
    return Ok();
}

Result<void> DeduplicationIndex::load() {
    std::error_code ec;
    fs::recursive_directory_iterator it(*directory_, ec);
    if (ec) {
        return Err<void>(ErrorKind::Io, "Failed to scan index directory: " + directory_->string());
    }

    std::size_t loaded = 0;
    for (const auto& entry : it) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        auto content = core::read_file(entry.path());
        if (content.is_error()) {
            return Err<void>(content.error());
        }
        auto parsed = json::parse(content.value(), nullptr, false);
        auto record = parsed.is_discarded() ? std::nullopt : record_from_json(parsed);
        if (!record) {
            spdlog::warn("Skipping unreadable index record {}", entry.path().string());
            continue;
        }
        auto& shard = shard_for(record->content_hash);
        shard.records[record->content_hash] = std::move(*record);
        ++loaded;
    }
    spdlog::info("Dedup index loaded {} record(s) from {}", loaded, directory_->string());
    return Ok();
}

} // namespace edgexfer::dedup
