#pragma once

#include "guestdrop/core/error.hpp"
#include "guestdrop/core/filesystem.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace guestdrop::upload {

/**
 * @brief Per-session scratch storage for chunk blobs
 *
 * Layout: `<scratch_root>/<session_id>/<index>.chunk`. Writes go through
 * FileSystem::write_file_atomic, so a chunk file is either absent or
 * complete; concurrent writes of one index leave whichever rename landed last.
 */
class ChunkStore {
public:
    ChunkStore(FileSystem& fs, std::filesystem::path scratch_root);

    UploadResult<void> write_chunk(const std::string& session_id,
                                   std::uint32_t index,
                                   const std::vector<std::uint8_t>& bytes);

    UploadResult<std::vector<std::uint8_t>> read_chunk(const std::string& session_id,
                                                       std::uint32_t index) const;

    /// Indices with a chunk file on disk, ascending. Empty for an unknown session.
    UploadResult<std::vector<std::uint32_t>> list_present(const std::string& session_id) const;

    /// {1..total_chunks} minus list_present(), ascending.
    UploadResult<std::vector<std::uint32_t>> list_missing(const std::string& session_id,
                                                          std::uint32_t total_chunks) const;

    std::filesystem::path chunk_path(const std::string& session_id, std::uint32_t index) const;
    std::filesystem::path session_dir(const std::string& session_id) const;

    /// Remove the session directory; succeeds when it is already gone.
    UploadResult<void> purge(const std::string& session_id);

    const std::filesystem::path& scratch_root() const { return scratch_root_; }

    /// True for ids the registry could have issued (non-empty lowercase hex).
    static bool is_valid_session_id(const std::string& session_id);

private:
    FileSystem& fs_;
    std::filesystem::path scratch_root_;
};

} // namespace guestdrop::upload
