#include "edgexfer/session/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace edgexfer::session {
namespace {

bool is_progressive(UploadStatus current, UploadStatus target) {
    static const std::unordered_map<UploadStatus, std::vector<UploadStatus>> transitions {
        {UploadStatus::Planned, {UploadStatus::Uploading}},
        {UploadStatus::Uploading, {UploadStatus::Verifying}},
        {UploadStatus::Verifying, {UploadStatus::Completed}},
    };

    if (target == UploadStatus::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

UploadSession::UploadSession(UploadSessionRecord record) : record_(std::move(record)) {}

Result<void> UploadSession::transition_to(UploadStatus next, core::TimePoint now) {
    if (record_.status == next && !is_terminal(next)) {
        return Ok();
    }

    if (!can_transition(next)) {
        return Err<void>(ErrorKind::InvalidState,
                         std::string("Illegal session state transition ") + to_string(record_.status) +
                         " -> " + to_string(next));
    }

    record_.status = next;
    record_.updated_at = now;
    if (next != UploadStatus::Failed) {
        record_.failure_kind.reset();
        record_.failure_message.clear();
    }
    return Ok();
}

Result<void> UploadSession::mark_failed(ErrorKind kind, std::string message, core::TimePoint now) {
    if (is_terminal(record_.status)) {
        return Err<void>(ErrorKind::InvalidState,
                         std::string("Session already ") + to_string(record_.status));
    }
    record_.failure_kind = kind;
    record_.failure_message = std::move(message);
    return transition_to(UploadStatus::Failed, now);
}

Result<bool> UploadSession::complete_chunk(std::uint32_t index,
                                           std::string chunk_hash,
                                           std::string edge_id,
                                           std::uint64_t bytes,
                                           core::TimePoint now) {
    if (index >= record_.total_chunks) {
        return Err<bool>(ErrorKind::InvalidArgument,
                         "Chunk index " + std::to_string(index) + " out of range (total " +
                         std::to_string(record_.total_chunks) + ")");
    }
    if (record_.status != UploadStatus::Planned && record_.status != UploadStatus::Uploading) {
        return Err<bool>(ErrorKind::InvalidState,
                         std::string("Cannot accept chunks while ") + to_string(record_.status));
    }
    if (auto res = transition_to(UploadStatus::Uploading, now); res.is_error()) {
        return Err<bool>(res.error());
    }

    auto& chunk = record_.chunks[index];
    chunk.session_id = record_.session_id;
    chunk.index = index;

    if (!record_.completed_chunks.insert(index).second) {
        return Ok(false);
    }

    if (!chunk_hash.empty()) {
        chunk.chunk_hash = std::move(chunk_hash);
    }
    if (!edge_id.empty()) {
        chunk.edge_id = std::move(edge_id);
    }
    chunk.status = ChunkStatus::Completed;
    chunk.bytes_transferred = bytes;
    chunk.error_message.clear();
    chunk.updated_at = now;

    record_.bytes_uploaded += bytes;
    record_.updated_at = now;
    return Ok(record_.all_chunks_completed());
}

Result<void> UploadSession::record_chunk(ChunkRecord update, core::TimePoint now) {
    if (update.status == ChunkStatus::Completed) {
        auto completed = complete_chunk(update.index, std::move(update.chunk_hash), std::move(update.edge_id),
                                        update.bytes_transferred, now);
        if (completed.is_error()) {
            return Err<void>(completed.error());
        }
        return Ok();
    }
    if (update.index >= record_.total_chunks) {
        return Err<void>(ErrorKind::InvalidArgument,
                         "Chunk index " + std::to_string(update.index) + " out of range");
    }
    if (is_terminal(record_.status) || record_.status == UploadStatus::Verifying) {
        return Err<void>(ErrorKind::InvalidState,
                         std::string("Cannot update chunks while ") + to_string(record_.status));
    }
    if (record_.completed_chunks.count(update.index) > 0) {
        return Err<void>(ErrorKind::InvalidState,
                         "Chunk " + std::to_string(update.index) + " already completed");
    }

    auto& chunk = record_.chunks[update.index];
    chunk.session_id = record_.session_id;
    chunk.index = update.index;
    chunk.status = update.status;
    if (!update.chunk_hash.empty()) {
        chunk.chunk_hash = std::move(update.chunk_hash);
    }
    if (!update.edge_id.empty()) {
        chunk.edge_id = std::move(update.edge_id);
    }
    chunk.bytes_transferred = update.bytes_transferred;
    if (update.status == ChunkStatus::Uploading) {
        chunk.attempts += 1;
    }
    chunk.error_message = std::move(update.error_message);
    chunk.updated_at = now;

    if (update.status == ChunkStatus::Uploading) {
        return transition_to(UploadStatus::Uploading, now);
    }
    record_.updated_at = now;
    return Ok();
}

Result<void> UploadSession::begin_verification(core::TimePoint now) {
    if (record_.status == UploadStatus::Verifying) {
        return Err<void>(ErrorKind::InvalidState, "Session is already being verified");
    }
    if (!record_.all_chunks_completed()) {
        return Err<void>(ErrorKind::InvalidState,
                         std::to_string(record_.total_chunks - record_.completed_chunks.size()) +
                         " chunk(s) still outstanding");
    }
    if (record_.status == UploadStatus::Planned) {
        if (auto res = transition_to(UploadStatus::Uploading, now); res.is_error()) {
            return res;
        }
    }
    return transition_to(UploadStatus::Verifying, now);
}

Result<void> UploadSession::abandon_verification(core::TimePoint now) {
    if (record_.status != UploadStatus::Verifying) {
        return Err<void>(ErrorKind::InvalidState,
                         std::string("Session is not being verified: ") + to_string(record_.status));
    }
    record_.status = UploadStatus::Uploading;
    record_.updated_at = now;
    return Ok();
}

Result<UploadSession> UploadSession::reopen(const UploadSessionRecord& cancelled, core::TimePoint now) {
    if (cancelled.status != UploadStatus::Failed || cancelled.failure_kind != ErrorKind::Cancelled) {
        return Err<UploadSession>(ErrorKind::InvalidState,
                                  "Only cancelled sessions can be reopened");
    }

    UploadSessionRecord next = cancelled;
    next.status = UploadStatus::Planned;
    next.failure_kind.reset();
    next.failure_message.clear();
    next.generation = cancelled.generation + 1;
    next.updated_at = now;
    for (auto& [index, chunk] : next.chunks) {
        if (chunk.status != ChunkStatus::Completed) {
            chunk.status = ChunkStatus::Pending;
            chunk.error_message.clear();
        }
    }
    return Ok(UploadSession(std::move(next)));
}

bool UploadSession::can_transition(UploadStatus target) const noexcept {
    if (is_terminal(record_.status)) {
        return false;
    }

    if (record_.status == target) {
        return true;
    }

    return is_progressive(record_.status, target);
}

} // namespace edgexfer::session
