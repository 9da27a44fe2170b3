#pragma once

#include "guestdrop/core/clock.hpp"
#include "guestdrop/core/error.hpp"
#include "guestdrop/core/filesystem.hpp"
#include "guestdrop/events/event_bus.hpp"
#include "guestdrop/upload/assembler.hpp"
#include "guestdrop/upload/chunk_store.hpp"
#include "guestdrop/upload/session_registry.hpp"
#include "guestdrop/upload/types.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <set>

namespace guestdrop::upload {

struct UploadOptions {
    static constexpr std::uint64_t kDefaultChunkSize = 5ull * 1024 * 1024;
    static constexpr std::uint64_t kChunkSlack = 64 * 1024;

    std::filesystem::path upload_root = "uploads";
    std::filesystem::path scratch_root = "uploads/.chunks";
    std::uint64_t chunk_size = kDefaultChunkSize;
    std::uint64_t max_file_size = 2ull * 1024 * 1024 * 1024;
    std::uint32_t max_chunks = 10000;
    std::chrono::seconds stale_after{3600};

    /// Largest chunk payload accepted; gzip framing can push a chunk past chunk_size.
    std::uint64_t max_chunk_bytes() const { return chunk_size + kChunkSlack; }
};

/**
 * @brief The chunked upload protocol: start, upload_chunk, complete
 *
 * Coordinates the session registry, chunk store and assembler, and publishes
 * lifecycle events on the bus. All methods are safe to call from any number
 * of request threads.
 */
class UploadService {
public:
    UploadService(UploadOptions options,
                  FileSystem& fs,
                  SessionRegistry& registry,
                  events::EventBus& bus,
                  const Clock& clock);

    UploadService(const UploadService&) = delete;
    UploadService& operator=(const UploadService&) = delete;

    UploadResult<StartedUpload> start(const StartRequest& request);

    UploadResult<ChunkProgress> upload_chunk(const std::string& upload_id,
                                             std::uint32_t chunk_index,
                                             const std::vector<std::uint8_t>& bytes);

    /**
     * @brief Assemble the uploaded chunks into `<upload_root>/<owner>/<filename>`
     *
     * An existing file is never overwritten: the first free name among
     * `name.ext`, `name_1.ext`, `name_2.ext`, ... is used. IncompleteUpload
     * leaves the session open for the missing chunks; every other failure
     * ends it.
     */
    UploadResult<CompletedUpload> complete(const std::string& upload_id);

    UploadResult<UploadStatus> status(const std::string& upload_id) const;

    /// Drop sessions idle longer than stale_after; returns how many went.
    std::size_t evict_stale();

    std::size_t active_sessions() const { return registry_.size(); }
    const UploadOptions& options() const { return options_; }

private:
    UploadResult<std::filesystem::path> reserve_destination(const std::string& owner, const std::string& filename);
    void release_destination(const std::filesystem::path& destination);

    // Purge chunks and registry entry after a terminal error, then report it.
    void terminate(const std::string& upload_id, const UploadError& error);

    UploadOptions options_;
    FileSystem& fs_;
    SessionRegistry& registry_;
    events::EventBus& bus_;
    const Clock& clock_;
    ChunkStore chunks_;
    Assembler assembler_;

    std::mutex destinations_mutex_;
    std::set<std::filesystem::path> reserved_destinations_;
};

} // namespace guestdrop::upload
