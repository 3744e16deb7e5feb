#pragma once

#include "edgexfer/core/clock.hpp"
#include "edgexfer/core/result.hpp"
#include "edgexfer/session/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace edgexfer::session {

/**
 * @brief Lifecycle of one upload
 *
 * Planned -> Uploading -> Verifying -> Completed, or Failed from any
 * non-terminal state. Uploading may be re-entered. Completed and Failed
 * accept no further transitions.
 */
class UploadSession {
public:
    explicit UploadSession(UploadSessionRecord record);

    [[nodiscard]] const std::string& session_id() const noexcept { return record_.session_id; }
    [[nodiscard]] const std::string& owner_id() const noexcept { return record_.owner_id; }
    [[nodiscard]] UploadStatus status() const noexcept { return record_.status; }
    [[nodiscard]] const UploadSessionRecord& record() const noexcept { return record_; }
    [[nodiscard]] UploadSessionRecord& mutable_record() noexcept { return record_; }

    Result<void> transition_to(UploadStatus next, core::TimePoint now);
    Result<void> mark_failed(ErrorKind kind, std::string message, core::TimePoint now);

    /**
     * @brief Record a chunk completion
     *
     * Moves a Planned session to Uploading. A chunk already in the completed
     * set is accepted again without double counting.
     *
     * @return true when this call completed the last outstanding chunk
     */
    Result<bool> complete_chunk(std::uint32_t index,
                                std::string chunk_hash,
                                std::string edge_id,
                                std::uint64_t bytes,
                                core::TimePoint now);

    /// Non-completion status update (pending, uploading, failed).
    Result<void> record_chunk(ChunkRecord chunk, core::TimePoint now);

    /// Single-writer step into Verifying: succeeds once, only when every
    /// chunk has completed.
    Result<void> begin_verification(core::TimePoint now);

    /// Hands a Verifying session whose verifier is gone back to Uploading,
    /// so the next finalize can win verification again.
    Result<void> abandon_verification(core::TimePoint now);

    /// Verifying with no progress for at least `lease`.
    [[nodiscard]] bool verification_stalled(core::TimePoint now, std::chrono::milliseconds lease) const noexcept {
        return record_.status == UploadStatus::Verifying && now - record_.updated_at >= lease;
    }

    [[nodiscard]] bool is_expired(core::TimePoint now) const noexcept { return now >= record_.expires_at; }

    /**
     * @brief Fresh lifecycle for a cancelled session id
     *
     * Landed chunks are kept; status returns to Planned and the generation
     * is bumped.
     */
    static Result<UploadSession> reopen(const UploadSessionRecord& cancelled, core::TimePoint now);

private:
    [[nodiscard]] bool can_transition(UploadStatus target) const noexcept;

    UploadSessionRecord record_;
};

} // namespace edgexfer::session
