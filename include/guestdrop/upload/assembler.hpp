#pragma once

#include "guestdrop/core/error.hpp"
#include "guestdrop/core/filesystem.hpp"
#include "guestdrop/upload/chunk_store.hpp"
#include "guestdrop/upload/session_registry.hpp"

#include <filesystem>
#include <string>

namespace guestdrop::upload {

/**
 * @brief Concatenates a session's chunks into its destination file
 *
 * WHAT IT DOES:
 * 1. Checks the chunk store for missing indices. If any are missing it
 *    returns IncompleteUpload and touches nothing.
 * 2. Creates the destination exclusively, then streams chunks 1..N into it
 *    in ascending order. Chunks starting with the gzip magic are inflated.
 * 3. On a streaming failure the partial destination is deleted and
 *    AssemblyFailed is returned.
 * 4. Once past step 1 the chunk directory and registry entry are always
 *    dropped, whether assembly succeeded or failed.
 */
class Assembler {
public:
    Assembler(FileSystem& fs, ChunkStore& chunks, SessionRegistry& registry);

    UploadResult<std::uint64_t> assemble(const std::string& session_id,
                                         std::uint32_t total_chunks,
                                         const std::filesystem::path& destination,
                                         std::uint64_t max_file_size);

private:
    UploadResult<std::uint64_t> stream_chunks(const std::string& session_id,
                                              std::uint32_t total_chunks,
                                              FileWriter& writer,
                                              std::uint64_t max_file_size);

    void cleanup(const std::string& session_id);

    FileSystem& fs_;
    ChunkStore& chunks_;
    SessionRegistry& registry_;
};

} // namespace guestdrop::upload
