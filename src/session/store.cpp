#include "edgexfer/session/store.hpp"

#include "edgexfer/core/files.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>

namespace edgexfer::session {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json chunk_to_json(const ChunkRecord& chunk) {
    json j;
    j["index"] = chunk.index;
    j["chunk_hash"] = chunk.chunk_hash;
    j["edge_id"] = chunk.edge_id;
    j["status"] = to_string(chunk.status);
    j["bytes_transferred"] = chunk.bytes_transferred;
    j["attempts"] = chunk.attempts;
    j["error_message"] = chunk.error_message;
    j["updated_at_ms"] = core::to_unix_millis(chunk.updated_at);
    return j;
}

} // namespace

std::string serialize_session(const UploadSessionRecord& record) {
    json j;
    j["session_id"] = record.session_id;
    j["owner_id"] = record.owner_id;
    j["file_id"] = record.file_id;
    j["file_name"] = record.file_name;
    j["content_hash"] = record.content_hash;
    j["total_size"] = record.total_size;
    j["chunk_size"] = record.chunk_size;
    j["total_chunks"] = record.total_chunks;
    j["parallelism"] = record.parallelism;
    j["priority"] = edge::to_string(record.priority);
    j["origin"] = {{"lat", record.origin.lat}, {"lng", record.origin.lng}};
    j["completed_chunks"] = record.completed_chunks;
    j["chunks"] = json::array();
    for (const auto& [index, chunk] : record.chunks) {
        j["chunks"].push_back(chunk_to_json(chunk));
    }
    j["assigned_edges"] = json::array();
    for (const auto& assignment : record.assigned_edges) {
        j["assigned_edges"].push_back({{"edge_id", assignment.edge_id},
                                       {"url", assignment.url},
                                       {"weight", assignment.weight}});
    }
    j["status"] = to_string(record.status);
    j["failure_kind"] = record.failure_kind ? json(to_string(*record.failure_kind)) : json(nullptr);
    j["failure_message"] = record.failure_message;
    j["bytes_uploaded"] = record.bytes_uploaded;
    j["generation"] = record.generation;
    j["created_at_ms"] = core::to_unix_millis(record.created_at);
    j["updated_at_ms"] = core::to_unix_millis(record.updated_at);
    j["expires_at_ms"] = core::to_unix_millis(record.expires_at);
    return j.dump();
}

Result<UploadSessionRecord> deserialize_session(const std::string& text) {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Err<UploadSessionRecord>(ErrorKind::InvalidArgument, "Session record is not a JSON object");
    }

    UploadSessionRecord record;
    record.session_id = j.value("session_id", std::string{});
    record.owner_id = j.value("owner_id", std::string{});
    record.file_id = j.value("file_id", std::string{});
    record.file_name = j.value("file_name", std::string{});
    record.content_hash = j.value("content_hash", std::string{});
    record.total_size = j.value("total_size", std::uint64_t{0});
    record.chunk_size = j.value("chunk_size", std::uint64_t{0});
    record.total_chunks = j.value("total_chunks", std::uint32_t{0});
    record.parallelism = j.value("parallelism", std::uint32_t{1});
    record.priority = edge::priority_from_string(j.value("priority", std::string{"balanced"}))
                          .value_or(edge::Priority::Balanced);
    if (auto origin = j.find("origin"); origin != j.end() && origin->is_object()) {
        record.origin.lat = origin->value("lat", 0.0);
        record.origin.lng = origin->value("lng", 0.0);
    }

    if (record.session_id.empty() || record.owner_id.empty()) {
        return Err<UploadSessionRecord>(ErrorKind::InvalidArgument, "Session record missing id or owner");
    }

    const auto status = upload_status_from_string(j.value("status", std::string{}));
    if (!status) {
        return Err<UploadSessionRecord>(ErrorKind::InvalidArgument,
                                        "Session record has unknown status: " + record.session_id);
    }
    record.status = *status;

    for (const auto& index : j.value("completed_chunks", json::array())) {
        if (index.is_number_unsigned()) {
            record.completed_chunks.insert(index.get<std::uint32_t>());
        }
    }
    for (const auto& item : j.value("chunks", json::array())) {
        ChunkRecord chunk;
        chunk.session_id = record.session_id;
        chunk.index = item.value("index", std::uint32_t{0});
        chunk.chunk_hash = item.value("chunk_hash", std::string{});
        chunk.edge_id = item.value("edge_id", std::string{});
        chunk.status = chunk_status_from_string(item.value("status", std::string{}))
                           .value_or(ChunkStatus::Pending);
        chunk.bytes_transferred = item.value("bytes_transferred", std::uint64_t{0});
        chunk.attempts = item.value("attempts", std::uint32_t{0});
        chunk.error_message = item.value("error_message", std::string{});
        chunk.updated_at = core::from_unix_millis(item.value("updated_at_ms", std::int64_t{0}));
        record.chunks[chunk.index] = std::move(chunk);
    }
    for (const auto& item : j.value("assigned_edges", json::array())) {
        record.assigned_edges.push_back(EdgeAssignment{item.value("edge_id", std::string{}),
                                                       item.value("url", std::string{}),
                                                       item.value("weight", 0.0)});
    }

    if (auto kind = j.find("failure_kind"); kind != j.end() && kind->is_string()) {
        record.failure_kind = error_kind_from_string(kind->get<std::string>());
    }
    record.failure_message = j.value("failure_message", std::string{});
    record.bytes_uploaded = j.value("bytes_uploaded", std::uint64_t{0});
    record.generation = j.value("generation", std::uint32_t{1});
    record.created_at = core::from_unix_millis(j.value("created_at_ms", std::int64_t{0}));
    record.updated_at = core::from_unix_millis(j.value("updated_at_ms", std::int64_t{0}));
    record.expires_at = core::from_unix_millis(j.value("expires_at_ms", std::int64_t{0}));
    return Ok(std::move(record));
}

UploadSessionStore::UploadSessionStore(SessionStoreOptions options, core::Clock clock)
    : options_(std::move(options)),
      clock_(std::move(clock)) {}

bool UploadSessionStore::is_valid_session_id(const std::string& session_id) noexcept {
    if (session_id.empty() || session_id.size() > 128) {
        return false;
    }
    for (char c : session_id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

Result<std::size_t> UploadSessionStore::load() {
    if (!options_.state_dir) {
        return Ok(std::size_t{0});
    }

    const auto& dir = *options_.state_dir;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec && !fs::exists(dir)) {
        return Err<std::size_t>(ErrorKind::Io, "Failed to create session directory: " + dir.string());
    }

    std::size_t loaded = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        auto content = core::read_file(entry.path());
        if (content.is_error()) {
            return Err<std::size_t>(content.error());
        }
        auto record = deserialize_session(content.value());
        if (record.is_error()) {
            spdlog::warn("Skipping session file {}: {}", entry.path().string(), record.error().message);
            continue;
        }
        auto session_id = record.value().session_id;
        UploadSession session(std::move(record.value()));
        if (session.status() == UploadStatus::Verifying) {
            // The verifier died with the previous process.
            if (auto released = session.abandon_verification(clock_()); released.is_error()) {
                return Err<std::size_t>(released.error());
            }
            if (auto saved = persist(session.record()); saved.is_error()) {
                return Err<std::size_t>(saved.error());
            }
            spdlog::warn("Session {} was mid-verification; returned it to uploading", session_id);
        }
        auto item = std::make_shared<Entry>(std::move(session));
        std::unique_lock lock(table_mutex_);
        sessions_[session_id] = std::move(item);
        ++loaded;
    }
    spdlog::info("Loaded {} upload session(s) from {}", loaded, dir.string());
    return Ok(loaded);
}

Result<UploadSessionRecord> UploadSessionStore::create(UploadSessionRecord record) {
    if (!is_valid_session_id(record.session_id)) {
        return Err<UploadSessionRecord>(ErrorKind::InvalidArgument, "Invalid session id: " + record.session_id);
    }

    const auto now = clock_();
    record.created_at = now;
    record.updated_at = now;
    record.expires_at = now + options_.ttl;

    const auto session_id = record.session_id;
    auto entry = std::make_shared<Entry>(UploadSession(std::move(record)));
    std::lock_guard entry_lock(entry->mutex);
    {
        std::unique_lock lock(table_mutex_);
        if (sessions_.count(session_id) > 0) {
            return Err<UploadSessionRecord>(ErrorKind::AlreadyExists, "Session already exists: " + session_id);
        }
        sessions_.emplace(session_id, entry);
    }

    if (auto saved = persist(entry->session.record()); saved.is_error()) {
        entry->removed = true;
        std::unique_lock lock(table_mutex_);
        sessions_.erase(session_id);
        return Err<UploadSessionRecord>(saved.error());
    }
    return Ok(entry->session.record());
}

Result<UploadSessionRecord> UploadSessionStore::get(const std::string& session_id) {
    auto entry = find_entry(session_id);
    if (!entry) {
        return Err<UploadSessionRecord>(ErrorKind::NotFound, "Unknown session: " + session_id);
    }

    std::lock_guard lock(entry->mutex);
    if (entry->removed) {
        return Err<UploadSessionRecord>(ErrorKind::NotFound, "Unknown session: " + session_id);
    }
    if (auto expired = expire_locked(*entry, clock_()); expired.is_error()) {
        return Err<UploadSessionRecord>(expired.error());
    }
    return Ok(entry->session.record());
}

Result<UploadSessionRecord> UploadSessionStore::update(const std::string& session_id, const Mutator& mutator) {
    auto entry = find_entry(session_id);
    if (!entry) {
        return Err<UploadSessionRecord>(ErrorKind::NotFound, "Unknown session: " + session_id);
    }

    std::lock_guard lock(entry->mutex);
    if (entry->removed) {
        return Err<UploadSessionRecord>(ErrorKind::NotFound, "Unknown session: " + session_id);
    }
    if (auto expired = expire_locked(*entry, clock_()); expired.is_error()) {
        return Err<UploadSessionRecord>(expired.error());
    }

    UploadSession working = entry->session;
    if (auto mutated = mutator(working); mutated.is_error()) {
        return Err<UploadSessionRecord>(mutated.error());
    }
    if (auto saved = persist(working.record()); saved.is_error()) {
        return Err<UploadSessionRecord>(saved.error());
    }
    entry->session = std::move(working);
    return Ok(entry->session.record());
}

Result<void> UploadSessionStore::remove(const std::string& session_id) {
    auto entry = find_entry(session_id);
    if (!entry) {
        return Err<void>(ErrorKind::NotFound, "Unknown session: " + session_id);
    }

    {
        std::lock_guard lock(entry->mutex);
        if (entry->removed) {
            return Err<void>(ErrorKind::NotFound, "Unknown session: " + session_id);
        }
        if (auto erased = erase_persisted(session_id); erased.is_error()) {
            return erased;
        }
        entry->removed = true;
    }

    std::unique_lock lock(table_mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end() && it->second == entry) {
        sessions_.erase(it);
    }
    return Ok();
}

std::vector<UploadSessionRecord> UploadSessionStore::purge_expired() {
    std::vector<std::pair<std::string, std::shared_ptr<Entry>>> candidates;
    {
        std::shared_lock lock(table_mutex_);
        candidates.assign(sessions_.begin(), sessions_.end());
    }

    const auto now = clock_();
    std::vector<UploadSessionRecord> purged;
    for (auto& [session_id, entry] : candidates) {
        {
            std::lock_guard lock(entry->mutex);
            if (entry->removed || !entry->session.is_expired(now)) {
                continue;
            }
            if (auto erased = erase_persisted(session_id); erased.is_error()) {
                spdlog::warn("Could not purge session {}: {}", session_id, erased.error().message);
                continue;
            }
            entry->removed = true;
            purged.push_back(entry->session.record());
        }

        std::unique_lock lock(table_mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end() && it->second == entry) {
            sessions_.erase(it);
        }
    }

    if (!purged.empty()) {
        spdlog::info("Purged {} expired upload session(s)", purged.size());
    }
    return purged;
}

std::vector<UploadSessionRecord> UploadSessionStore::list_by_owner(const std::string& owner_id) const {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::shared_lock lock(table_mutex_);
        for (const auto& [id, entry] : sessions_) {
            entries.push_back(entry);
        }
    }

    std::vector<UploadSessionRecord> result;
    for (const auto& entry : entries) {
        std::lock_guard lock(entry->mutex);
        if (!entry->removed && entry->session.owner_id() == owner_id) {
            result.push_back(entry->session.record());
        }
    }
    return result;
}

std::uint64_t UploadSessionStore::pending_bytes(const std::string& owner_id) const {
    std::uint64_t total = 0;
    const auto now = clock_();
    for (const auto& record : list_by_owner(owner_id)) {
        if (is_terminal(record.status) || now >= record.expires_at) {
            continue;
        }
        total += record.total_size > record.bytes_uploaded ? record.total_size - record.bytes_uploaded : 0;
    }
    return total;
}

std::size_t UploadSessionStore::size() const {
    std::shared_lock lock(table_mutex_);
    return sessions_.size();
}

std::shared_ptr<UploadSessionStore::Entry> UploadSessionStore::find_entry(const std::string& session_id) const {
    if (!is_valid_session_id(session_id)) {
        return nullptr;
    }
    std::shared_lock lock(table_mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

Result<void> UploadSessionStore::expire_locked(Entry& entry, core::TimePoint now) {
    if (!entry.session.is_expired(now)) {
        return Ok();
    }

    const auto& session_id = entry.session.session_id();
    if (!is_terminal(entry.session.status())) {
        UploadSession expired = entry.session;
        if (expired.mark_failed(ErrorKind::SessionExpired, "Session expired", now).is_ok()) {
            if (auto saved = persist(expired.record()); saved.is_error()) {
                spdlog::warn("Failed to persist expiry of session {}: {}", session_id, saved.error().message);
            } else {
                entry.session = std::move(expired);
            }
        }
    }
    return Err<void>(ErrorKind::SessionExpired, "Session expired: " + session_id);
}

fs::path UploadSessionStore::record_path(const std::string& session_id) const {
    return *options_.state_dir / (session_id + ".json");
}

Result<void> UploadSessionStore::persist(const UploadSessionRecord& record) const {
    if (!options_.state_dir) {
        return Ok();
    }
    return core::write_file_atomic(record_path(record.session_id), serialize_session(record));
}

Result<void> UploadSessionStore::erase_persisted(const std::string& session_id) const {
    if (!options_.state_dir) {
        return Ok();
    }
    std::error_code ec;
    fs::remove(record_path(session_id), ec);
    if (ec) {
        return Err<void>(ErrorKind::Io, "Failed to remove session file for " + session_id);
    }
    return Ok();
}

} // namespace edgexfer::session
