#include "guestdrop/upload/chunk_store.hpp"
#include "guestdrop/upload/types.hpp"

#include <algorithm>
#include <charconv>

namespace guestdrop::upload {
namespace {

constexpr std::string_view kChunkSuffix = ".chunk";

UploadError bad_session_id() {
    return UploadError::invalid_input("malformed upload id");
}

// "<digits>.chunk" -> index; temp files and strays yield false.
bool parse_chunk_name(const std::string& name, std::uint32_t& index) {
    if (name.size() <= kChunkSuffix.size() ||
        name.compare(name.size() - kChunkSuffix.size(), kChunkSuffix.size(), kChunkSuffix) != 0) {
        return false;
    }
    const char* first = name.data();
    const char* last = name.data() + name.size() - kChunkSuffix.size();
    auto [ptr, ec] = std::from_chars(first, last, index);
    return ec == std::errc() && ptr == last;
}

} // namespace

ChunkStore::ChunkStore(FileSystem& fs, std::filesystem::path scratch_root)
    : fs_(fs), scratch_root_(std::move(scratch_root)) {}

bool ChunkStore::is_valid_session_id(const std::string& session_id) {
    return !session_id.empty() && session_id.size() <= 64 &&
           std::all_of(session_id.begin(), session_id.end(), [](char c) {
               return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
           });
}

std::filesystem::path ChunkStore::session_dir(const std::string& session_id) const {
    return scratch_root_ / session_id;
}

std::filesystem::path ChunkStore::chunk_path(const std::string& session_id, std::uint32_t index) const {
    return session_dir(session_id) / (std::to_string(index) + std::string(kChunkSuffix));
}

UploadResult<void> ChunkStore::write_chunk(const std::string& session_id,
                                           std::uint32_t index,
                                           const std::vector<std::uint8_t>& bytes) {
    if (!is_valid_session_id(session_id)) {
        return Err(bad_session_id());
    }

    auto dir = fs_.create_directories(session_dir(session_id));
    if (dir.is_error()) {
        return dir;
    }
    return fs_.write_file_atomic(chunk_path(session_id, index), bytes);
}

UploadResult<std::vector<std::uint8_t>> ChunkStore::read_chunk(const std::string& session_id,
                                                               std::uint32_t index) const {
    if (!is_valid_session_id(session_id)) {
        return Err(bad_session_id());
    }
    return fs_.read_file(chunk_path(session_id, index));
}

UploadResult<std::vector<std::uint32_t>> ChunkStore::list_present(const std::string& session_id) const {
    if (!is_valid_session_id(session_id)) {
        return Err(bad_session_id());
    }

    const auto dir = session_dir(session_id);
    if (!fs_.exists(dir)) {
        return Ok(std::vector<std::uint32_t>{});
    }

    auto names = fs_.list_directory(dir);
    if (names.is_error()) {
        return Err(names.error());
    }

    std::vector<std::uint32_t> present;
    for (const auto& name : names.value()) {
        std::uint32_t index = 0;
        if (parse_chunk_name(name, index)) {
            present.push_back(index);
        }
    }
    std::sort(present.begin(), present.end());
    return Ok(std::move(present));
}

UploadResult<std::vector<std::uint32_t>> ChunkStore::list_missing(const std::string& session_id,
                                                                  std::uint32_t total_chunks) const {
    auto present = list_present(session_id);
    if (present.is_error()) {
        return Err(present.error());
    }

    const auto& on_disk = present.value();
    std::vector<std::uint32_t> missing;
    for (std::uint32_t index = kFirstChunkIndex; index < kFirstChunkIndex + total_chunks; ++index) {
        if (!std::binary_search(on_disk.begin(), on_disk.end(), index)) {
            missing.push_back(index);
        }
    }
    return Ok(std::move(missing));
}

UploadResult<void> ChunkStore::purge(const std::string& session_id) {
    if (!is_valid_session_id(session_id)) {
        return Err(bad_session_id());
    }
    return fs_.remove_tree(session_dir(session_id));
}

} // namespace guestdrop::upload
