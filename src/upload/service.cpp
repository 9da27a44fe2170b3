#include "guestdrop/upload/service.hpp"
#include "guestdrop/events/events.hpp"
#include "guestdrop/upload/filename.hpp"

#include <spdlog/spdlog.h>

namespace guestdrop::upload {
namespace {

constexpr std::uint32_t kMaxNameAttempts = 10000;

// Releases the registry write slot however the chunk write ends.
class WriteGuard {
public:
    WriteGuard(SessionRegistry& registry, const std::string& upload_id, std::uint64_t bytes)
        : registry_(registry), upload_id_(upload_id), bytes_(bytes) {}

    ~WriteGuard() { registry_.release_write(upload_id_, bytes_); }

    WriteGuard(const WriteGuard&) = delete;
    WriteGuard& operator=(const WriteGuard&) = delete;

private:
    SessionRegistry& registry_;
    const std::string& upload_id_;
    std::uint64_t bytes_;
};

std::filesystem::path numbered(const std::filesystem::path& dir, const std::string& filename, std::uint32_t n) {
    if (n == 0) {
        return dir / filename;
    }
    const auto dot = filename.rfind('.');
    return dir / (filename.substr(0, dot) + "_" + std::to_string(n) + filename.substr(dot));
}

std::uint32_t chunks_for(std::uint64_t file_size, std::uint64_t chunk_size) {
    return static_cast<std::uint32_t>((file_size + chunk_size - 1) / chunk_size);
}

} // namespace

UploadService::UploadService(UploadOptions options,
                             FileSystem& fs,
                             SessionRegistry& registry,
                             events::EventBus& bus,
                             const Clock& clock)
    : options_(std::move(options)),
      fs_(fs),
      registry_(registry),
      bus_(bus),
      clock_(clock),
      chunks_(fs, options_.scratch_root),
      assembler_(fs, chunks_, registry) {}

UploadResult<StartedUpload> UploadService::start(const StartRequest& request) {
    std::string owner = sanitize(request.owner);
    if (owner.empty()) {
        return Err(UploadError::invalid_input("guest name is empty after sanitizing"));
    }
    std::string filename = sanitize_filename(request.filename);
    if (filename.empty()) {
        return Err(UploadError::invalid_input("filename is empty after sanitizing"));
    }
    if (classify_extension(filename) == MediaCategory::Unsupported) {
        return Err(UploadError::unsupported_type("file type ." + extension_of(filename) + " is not accepted"));
    }

    if (!request.total_chunks && !request.file_size) {
        return Err(UploadError::invalid_input("total_chunks or file_size is required"));
    }
    if (request.file_size) {
        if (*request.file_size == 0) {
            return Err(UploadError::invalid_input("file_size must be positive"));
        }
        if (*request.file_size > options_.max_file_size) {
            return Err(UploadError::file_too_large("file_size exceeds " + std::to_string(options_.max_file_size) +
                                                   " bytes"));
        }
    }

    std::uint64_t total_chunks = 0;
    if (request.total_chunks) {
        total_chunks = *request.total_chunks;
    } else {
        total_chunks = chunks_for(*request.file_size, options_.chunk_size);
    }
    if (total_chunks == 0) {
        return Err(UploadError::invalid_input("total_chunks must be positive"));
    }
    if (total_chunks > options_.max_chunks) {
        return Err(UploadError::invalid_input("total_chunks exceeds " + std::to_string(options_.max_chunks)));
    }

    const auto chunk_count = static_cast<std::uint32_t>(total_chunks);
    auto created = registry_.create(owner, filename, chunk_count, request.file_size);
    if (created.is_error()) {
        return Err(created.error());
    }

    StartedUpload started{created.value(), options_.chunk_size, chunk_count};
    bus_.emit(events::UploadStartedEvent{started.upload_id, owner, filename, chunk_count});
    return Ok(std::move(started));
}

UploadResult<ChunkProgress> UploadService::upload_chunk(const std::string& upload_id,
                                                        std::uint32_t chunk_index,
                                                        const std::vector<std::uint8_t>& bytes) {
    if (!ChunkStore::is_valid_session_id(upload_id)) {
        return Err(UploadError::session_not_found(upload_id));
    }
    if (bytes.empty()) {
        return Err(UploadError::invalid_input("chunk is empty"));
    }
    if (bytes.size() > options_.max_chunk_bytes()) {
        return Err(UploadError::invalid_input("chunk exceeds " + std::to_string(options_.max_chunk_bytes()) +
                                              " bytes"));
    }

    auto acquired = registry_.acquire_write(upload_id, chunk_index, bytes.size(), options_.max_file_size);
    if (acquired.is_error()) {
        return Err(acquired.error());
    }

    UploadResult<ChunkProgress> recorded = Err(UploadError::storage_io("chunk not recorded"));
    {
        WriteGuard guard(registry_, upload_id, bytes.size());

        auto written = chunks_.write_chunk(upload_id, chunk_index, bytes);
        if (written.is_error()) {
            terminate(upload_id, written.error());
            return Err(written.error());
        }
        recorded = registry_.record_chunk(upload_id, chunk_index, bytes.size());
    }

    if (recorded.is_error()) {
        // The session vanished while the chunk was in flight; don't leave it behind.
        auto purged = chunks_.purge(upload_id);
        if (purged.is_error()) {
            spdlog::warn("Could not purge orphaned chunk of {}: {}", upload_id, purged.error().message);
        }
        return recorded;
    }

    const auto& progress = recorded.value();
    bus_.emit(events::ChunkStoredEvent{upload_id, chunk_index, progress.received, progress.total,
                                       static_cast<std::uint64_t>(bytes.size())});
    return recorded;
}

UploadResult<CompletedUpload> UploadService::complete(const std::string& upload_id) {
    if (!ChunkStore::is_valid_session_id(upload_id)) {
        return Err(UploadError::session_not_found(upload_id));
    }

    auto claimed = registry_.begin_completion(upload_id);
    if (claimed.is_error()) {
        return Err(claimed.error());
    }
    const SessionSnapshot session = std::move(claimed.value());

    auto destination = reserve_destination(session.owner, session.filename);
    if (destination.is_error()) {
        terminate(upload_id, destination.error());
        return Err(destination.error());
    }
    const std::filesystem::path final_path = destination.value();

    auto assembled = assembler_.assemble(upload_id, session.total_chunks, final_path, options_.max_file_size);
    release_destination(final_path);

    if (assembled.is_error()) {
        const auto& error = assembled.error();
        if (error.kind == ErrorKind::IncompleteUpload) {
            registry_.abort_completion(upload_id);
            return Err(error);
        }
        terminate(upload_id, error);
        return Err(error);
    }

    if (assembled.value() == 0) {
        auto removed = fs_.remove_file(final_path);
        if (removed.is_error()) {
            spdlog::warn("Could not remove empty upload {}: {}", final_path.filename().string(),
                         removed.error().message);
        }
        const auto error = UploadError::assembly_failed("assembled file is empty");
        terminate(upload_id, error);
        return Err(error);
    }

    CompletedUpload completed;
    completed.final_path = final_path;
    completed.filename = final_path.filename().string();
    completed.relative_path = session.owner + "/" + completed.filename;
    completed.file_size = assembled.value();

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock_.now() - session.created_at);
    bus_.emit(events::UploadCompletedEvent{upload_id, session.owner, completed.relative_path,
                                           completed.file_size, elapsed});
    return Ok(std::move(completed));
}

UploadResult<UploadStatus> UploadService::status(const std::string& upload_id) const {
    auto snapshot = registry_.get(upload_id);
    if (snapshot.is_error()) {
        return Err(snapshot.error());
    }

    UploadStatus result;
    result.session = std::move(snapshot.value());
    result.missing = result.session.missing();
    return Ok(std::move(result));
}

std::size_t UploadService::evict_stale() {
    const auto evicted = registry_.collect_stale(clock_.now(), options_.stale_after);
    for (const auto& session : evicted) {
        auto purged = chunks_.purge(session.id);
        if (purged.is_error()) {
            spdlog::warn("Could not purge chunks of evicted upload {}: {}", session.id, purged.error().message);
        }
        bus_.emit(events::SessionEvictedEvent{session.id, session.owner, session.filename,
                                              static_cast<std::uint32_t>(session.received.size()),
                                              session.total_chunks});
    }
    return evicted.size();
}

UploadResult<std::filesystem::path> UploadService::reserve_destination(const std::string& owner,
                                                                      const std::string& filename) {
    const auto owner_dir = options_.upload_root / owner;
    auto dir = fs_.create_directories(owner_dir);
    if (dir.is_error()) {
        return Err(dir.error());
    }

    // Reservations keep two concurrent completions from picking the same free name.
    std::lock_guard lock(destinations_mutex_);
    for (std::uint32_t n = 0; n < kMaxNameAttempts; ++n) {
        auto candidate = numbered(owner_dir, filename, n);
        if (reserved_destinations_.count(candidate) == 0 && !fs_.exists(candidate)) {
            reserved_destinations_.insert(candidate);
            return Ok(std::move(candidate));
        }
    }
    return Err(UploadError::assembly_failed("no free name for " + filename));
}

void UploadService::release_destination(const std::filesystem::path& destination) {
    std::lock_guard lock(destinations_mutex_);
    reserved_destinations_.erase(destination);
}

void UploadService::terminate(const std::string& upload_id, const UploadError& error) {
    auto purged = chunks_.purge(upload_id);
    if (purged.is_error()) {
        spdlog::warn("Could not purge chunks of failed upload {}: {}", upload_id, purged.error().message);
    }
    registry_.remove(upload_id);
    bus_.emit(events::UploadFailedEvent{upload_id, error.kind, error.message});
}

} // namespace guestdrop::upload
