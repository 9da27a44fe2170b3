#pragma once

#include "guestdrop/core/clock.hpp"
#include "guestdrop/core/error.hpp"
#include "guestdrop/upload/types.hpp"

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace guestdrop::upload {

/**
 * @brief In-memory table of in-progress uploads
 *
 * THREAD SAFETY:
 * - The id -> entry map sits behind a reader/writer lock held only for lookup,
 *   insertion and erase.
 * - Each entry has its own mutex; chunks of one session serialize on it,
 *   unrelated sessions never contend.
 * - A chunk write is bracketed by acquire_write()/release_write().
 *   begin_completion() blocks new writes and waits for in-flight ones, so the
 *   assembler never races a half-finished chunk.
 */
class SessionRegistry {
public:
    explicit SessionRegistry(const Clock& clock);

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /// Register a session for already-sanitized names; returns its fresh id.
    UploadResult<std::string> create(std::string owner,
                                     std::string filename,
                                     std::uint32_t total_chunks,
                                     std::optional<std::uint64_t> file_size = std::nullopt);

    /**
     * @brief Announce a chunk write before touching the chunk store
     *
     * Fails with SessionNotFound, AlreadyCompleting, InvalidInput (index out
     * of range) or FileTooLarge when the stored bytes plus the writes in flight
     * would pass `max_total_bytes`. On success the caller must call
     * release_write() with the same arguments once the write has finished,
     * whatever its outcome.
     */
    UploadResult<void> acquire_write(const std::string& id,
                                     std::uint32_t index,
                                     std::uint64_t byte_count,
                                     std::uint64_t max_total_bytes);

    void release_write(const std::string& id, std::uint64_t byte_count);

    /**
     * @brief Mark chunk `index` as stored with `byte_count` bytes
     *
     * Recording an index twice leaves the count unchanged and replaces its
     * byte count. Refreshes the session's last activity.
     */
    UploadResult<ChunkProgress> record_chunk(const std::string& id,
                                             std::uint32_t index,
                                             std::uint64_t byte_count);

    UploadResult<SessionSnapshot> get(const std::string& id) const;

    /// Forget the session; no-op for an unknown id.
    void remove(const std::string& id);

    /**
     * @brief Claim the session for assembly
     *
     * Exactly one caller wins; the others get AlreadyCompleting. The winner
     * blocks until writes acquired before the claim have been released, then
     * receives the settled snapshot.
     */
    UploadResult<SessionSnapshot> begin_completion(const std::string& id);

    /// Give the claim back; the session accepts chunks again.
    void abort_completion(const std::string& id);

    /**
     * @brief Detach sessions idle for longer than `window`
     *
     * Sessions with a completion claim or a write in flight are skipped. The
     * returned sessions are already gone from the registry; the caller owns
     * cleaning their chunk directories.
     */
    std::vector<SessionSnapshot> collect_stale(Clock::time_point now, std::chrono::seconds window);

    std::size_t size() const;

private:
    struct Entry {
        mutable std::mutex mutex;
        std::condition_variable idle;
        SessionSnapshot snapshot;
        std::map<std::uint32_t, std::uint64_t> chunk_bytes;
        std::uint64_t reserved_bytes = 0;
        std::uint32_t pending_writes = 0;
        bool completing = false;
        bool removed = false;
    };

    std::shared_ptr<Entry> find(const std::string& id) const;

    const Clock& clock_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> sessions_;
};

} // namespace guestdrop::upload
