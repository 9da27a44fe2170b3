#include "guestdrop/upload/session_registry.hpp"
#include "guestdrop/core/random.hpp"

#include <algorithm>

namespace guestdrop::upload {
namespace {

constexpr std::size_t kSessionIdBytes = 16;

bool index_in_range(const SessionSnapshot& snapshot, std::uint32_t index) {
    return index >= kFirstChunkIndex && index - kFirstChunkIndex < snapshot.total_chunks;
}

UploadError out_of_range(const SessionSnapshot& snapshot, std::uint32_t index) {
    return UploadError::invalid_input("chunk index " + std::to_string(index) + " outside 1.." +
                                      std::to_string(snapshot.total_chunks));
}

} // namespace

SessionRegistry::SessionRegistry(const Clock& clock) : clock_(clock) {}

std::shared_ptr<SessionRegistry::Entry> SessionRegistry::find(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(id);
    return it != sessions_.end() ? it->second : nullptr;
}

UploadResult<std::string> SessionRegistry::create(std::string owner,
                                                  std::string filename,
                                                  std::uint32_t total_chunks,
                                                  std::optional<std::uint64_t> file_size) {
    if (owner.empty() || filename.empty()) {
        return Err(UploadError::invalid_input("owner and filename are required"));
    }
    if (total_chunks == 0) {
        return Err(UploadError::invalid_input("total_chunks must be positive"));
    }

    auto entry = std::make_shared<Entry>();
    entry->snapshot.owner = std::move(owner);
    entry->snapshot.filename = std::move(filename);
    entry->snapshot.total_chunks = total_chunks;
    entry->snapshot.file_size = file_size;
    entry->snapshot.state = UploadState::Started;
    entry->snapshot.created_at = clock_.now();
    entry->snapshot.last_activity = entry->snapshot.created_at;

    std::unique_lock lock(mutex_);
    std::string id;
    do {
        id = random_hex(kSessionIdBytes);
    } while (sessions_.count(id) != 0);

    entry->snapshot.id = id;
    sessions_.emplace(id, std::move(entry));
    return Ok(std::move(id));
}

UploadResult<void> SessionRegistry::acquire_write(const std::string& id,
                                                  std::uint32_t index,
                                                  std::uint64_t byte_count,
                                                  std::uint64_t max_total_bytes) {
    auto entry = find(id);
    if (!entry) {
        return Err(UploadError::session_not_found(id));
    }

    std::lock_guard lock(entry->mutex);
    if (entry->removed) {
        return Err(UploadError::session_not_found(id));
    }
    if (entry->completing) {
        return Err(UploadError::already_completing(id));
    }
    if (!index_in_range(entry->snapshot, index)) {
        return Err(out_of_range(entry->snapshot, index));
    }

    // A re-sent index replaces its earlier bytes rather than adding to them.
    std::uint64_t replaced = 0;
    if (auto it = entry->chunk_bytes.find(index); it != entry->chunk_bytes.end()) {
        replaced = it->second;
    }
    const std::uint64_t projected = entry->snapshot.received_bytes - replaced + entry->reserved_bytes + byte_count;
    if (projected > max_total_bytes) {
        return Err(UploadError::file_too_large("upload would exceed " + std::to_string(max_total_bytes) + " bytes"));
    }

    entry->reserved_bytes += byte_count;
    ++entry->pending_writes;
    entry->snapshot.last_activity = clock_.now();
    return Ok();
}

void SessionRegistry::release_write(const std::string& id, std::uint64_t byte_count) {
    auto entry = find(id);
    if (!entry) {
        return;
    }

    {
        std::lock_guard lock(entry->mutex);
        if (entry->pending_writes == 0) {
            return;
        }
        --entry->pending_writes;
        entry->reserved_bytes -= std::min(entry->reserved_bytes, byte_count);
    }
    entry->idle.notify_all();
}

UploadResult<ChunkProgress> SessionRegistry::record_chunk(const std::string& id,
                                                          std::uint32_t index,
                                                          std::uint64_t byte_count) {
    auto entry = find(id);
    if (!entry) {
        return Err(UploadError::session_not_found(id));
    }

    std::lock_guard lock(entry->mutex);
    if (entry->removed) {
        return Err(UploadError::session_not_found(id));
    }
    // Writes acquired before a claim may still record; new ones were refused.
    if (entry->completing && entry->pending_writes == 0) {
        return Err(UploadError::already_completing(id));
    }
    if (!index_in_range(entry->snapshot, index)) {
        return Err(out_of_range(entry->snapshot, index));
    }

    auto& snapshot = entry->snapshot;
    auto [it, inserted] = entry->chunk_bytes.emplace(index, byte_count);
    if (!inserted) {
        snapshot.received_bytes -= it->second;
        it->second = byte_count;
    }
    snapshot.received_bytes += byte_count;
    snapshot.received.insert(index);
    snapshot.last_activity = clock_.now();
    if (snapshot.state == UploadState::Started) {
        snapshot.state = UploadState::Receiving;
    }

    return Ok(ChunkProgress{static_cast<std::uint32_t>(snapshot.received.size()),
                            snapshot.total_chunks,
                            snapshot.received_bytes});
}

UploadResult<SessionSnapshot> SessionRegistry::get(const std::string& id) const {
    auto entry = find(id);
    if (!entry) {
        return Err(UploadError::session_not_found(id));
    }

    std::lock_guard lock(entry->mutex);
    if (entry->removed) {
        return Err(UploadError::session_not_found(id));
    }
    return Ok(entry->snapshot);
}

void SessionRegistry::remove(const std::string& id) {
    std::shared_ptr<Entry> entry;
    {
        std::unique_lock lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return;
        }
        entry = std::move(it->second);
        sessions_.erase(it);
    }

    {
        std::lock_guard lock(entry->mutex);
        entry->removed = true;
    }
    entry->idle.notify_all();
}

UploadResult<SessionSnapshot> SessionRegistry::begin_completion(const std::string& id) {
    auto entry = find(id);
    if (!entry) {
        return Err(UploadError::session_not_found(id));
    }

    std::unique_lock lock(entry->mutex);
    if (entry->removed) {
        return Err(UploadError::session_not_found(id));
    }
    if (entry->completing) {
        return Err(UploadError::already_completing(id));
    }

    entry->completing = true;
    entry->snapshot.state = UploadState::Completing;
    entry->idle.wait(lock, [&entry] { return entry->pending_writes == 0 || entry->removed; });

    if (entry->removed) {
        return Err(UploadError::session_not_found(id));
    }
    return Ok(entry->snapshot);
}

void SessionRegistry::abort_completion(const std::string& id) {
    auto entry = find(id);
    if (!entry) {
        return;
    }

    std::lock_guard lock(entry->mutex);
    entry->completing = false;
    entry->snapshot.state = entry->snapshot.received.empty() ? UploadState::Started : UploadState::Receiving;
    entry->snapshot.last_activity = clock_.now();
}

std::vector<SessionSnapshot> SessionRegistry::collect_stale(Clock::time_point now, std::chrono::seconds window) {
    std::vector<std::shared_ptr<Entry>> detached;
    {
        std::unique_lock lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            auto& entry = it->second;
            std::lock_guard entry_lock(entry->mutex);
            const bool busy = entry->completing || entry->pending_writes > 0;
            if (busy || now - entry->snapshot.last_activity <= window) {
                ++it;
                continue;
            }
            entry->removed = true;
            detached.push_back(entry);
            it = sessions_.erase(it);
        }
    }

    std::vector<SessionSnapshot> result;
    result.reserve(detached.size());
    for (const auto& entry : detached) {
        std::lock_guard lock(entry->mutex);
        result.push_back(entry->snapshot);
    }
    return result;
}

std::size_t SessionRegistry::size() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

} // namespace guestdrop::upload
