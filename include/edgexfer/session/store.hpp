#pragma once

#include "edgexfer/core/clock.hpp"
#include "edgexfer/core/result.hpp"
#include "edgexfer/session/session.hpp"
#include "edgexfer/session/types.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace edgexfer::session {

struct SessionStoreOptions {
    std::optional<std::filesystem::path> state_dir;  ///< Unset keeps sessions in memory only
    std::chrono::seconds ttl{std::chrono::hours(24 * 7)};
};

/**
 * @brief TTL-bounded, optionally durable table of upload sessions
 *
 * Each session has its own mutex; the table lock is held only long enough to
 * find the entry, so updates to different sessions never wait on each
 * other. Every successful mutation is written to `<state_dir>/<id>.json`
 * before it becomes visible, which lets a restarted process resume.
 *
 * Reading or updating a session past its expiry marks it Failed with
 * SessionExpired and reports that error.
 */
class UploadSessionStore {
public:
    using Mutator = std::function<Result<void>(UploadSession&)>;

    explicit UploadSessionStore(SessionStoreOptions options = {}, core::Clock clock = core::system_clock());

    UploadSessionStore(const UploadSessionStore&) = delete;
    UploadSessionStore& operator=(const UploadSessionStore&) = delete;

    /// Reads every persisted session from the state directory. A session
    /// found in Verifying goes back to Uploading with its chunks intact.
    Result<std::size_t> load();

    /// Stamps creation and expiry times, persists, and returns the stored record.
    Result<UploadSessionRecord> create(UploadSessionRecord record);

    Result<UploadSessionRecord> get(const std::string& session_id);

    /// Runs `mutator` under the session's lock. Changes are kept (and
    /// persisted) only if the mutator succeeds.
    Result<UploadSessionRecord> update(const std::string& session_id, const Mutator& mutator);

    Result<void> remove(const std::string& session_id);

    /// Removes expired sessions and returns what was removed.
    std::vector<UploadSessionRecord> purge_expired();

    [[nodiscard]] std::vector<UploadSessionRecord> list_by_owner(const std::string& owner_id) const;

    /// Bytes not yet uploaded across the owner's non-terminal sessions.
    [[nodiscard]] std::uint64_t pending_bytes(const std::string& owner_id) const;

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] std::chrono::seconds ttl() const noexcept { return options_.ttl; }

    [[nodiscard]] static bool is_valid_session_id(const std::string& session_id) noexcept;

private:
    struct Entry {
        explicit Entry(UploadSession s) : session(std::move(s)) {}

        std::mutex mutex;
        UploadSession session;
        bool removed = false;
    };

    std::shared_ptr<Entry> find_entry(const std::string& session_id) const;

    /// Caller holds the entry lock.
    Result<void> expire_locked(Entry& entry, core::TimePoint now);

    Result<void> persist(const UploadSessionRecord& record) const;
    Result<void> erase_persisted(const std::string& session_id) const;
    [[nodiscard]] std::filesystem::path record_path(const std::string& session_id) const;

    SessionStoreOptions options_;
    core::Clock clock_;
    mutable std::shared_mutex table_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> sessions_;
};

/// JSON form used on disk.
std::string serialize_session(const UploadSessionRecord& record);
Result<UploadSessionRecord> deserialize_session(const std::string& text);

} // namespace edgexfer::session
