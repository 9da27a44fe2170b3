#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace guestdrop::upload {

/// Chunk indices run from kFirstChunkIndex to total_chunks inclusive.
constexpr std::uint32_t kFirstChunkIndex = 1;

enum class UploadState {
    Started,
    Receiving,
    Completing,
    Done,
    Failed
};

std::string_view to_string(UploadState state) noexcept;

struct StartRequest {
    std::string owner;
    std::string filename;
    std::optional<std::uint32_t> total_chunks;
    std::optional<std::uint64_t> file_size;
};

struct StartedUpload {
    std::string upload_id;
    std::uint64_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
};

struct ChunkProgress {
    std::uint32_t received = 0;
    std::uint32_t total = 0;
    std::uint64_t received_bytes = 0;
};

struct CompletedUpload {
    std::filesystem::path final_path;
    std::string relative_path;   ///< "<owner>/<filename>", as handed to the gallery
    std::string filename;
    std::uint64_t file_size = 0;
};

struct SessionSnapshot {
    std::string id;
    std::string owner;
    std::string filename;
    std::uint32_t total_chunks = 0;
    std::optional<std::uint64_t> file_size;
    std::set<std::uint32_t> received;
    std::uint64_t received_bytes = 0;
    UploadState state = UploadState::Started;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_activity;

    [[nodiscard]] bool is_complete() const noexcept {
        return received.size() == total_chunks;
    }

    /// Indices in 1..total_chunks not yet recorded, ascending.
    [[nodiscard]] std::vector<std::uint32_t> missing() const;
};

struct UploadStatus {
    SessionSnapshot session;
    std::vector<std::uint32_t> missing;
};

} // namespace guestdrop::upload
