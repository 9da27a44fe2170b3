#pragma once

#include "guestdrop/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace guestdrop {

/**
 * @brief Sequential writer for a freshly created file
 *
 * Destroying a writer without calling close() releases the handle but
 * reports nothing; callers that care about flush errors must close().
 */
class FileWriter {
public:
    virtual ~FileWriter() = default;

    virtual UploadResult<void> append(const std::uint8_t* data, std::size_t size) = 0;
    virtual UploadResult<void> close() = 0;
    virtual std::uint64_t bytes_written() const noexcept = 0;
};

/**
 * @brief Filesystem operations used by the upload core
 *
 * Every failure is reported as ErrorKind::StorageIO. Implementations must be
 * safe to call concurrently for distinct paths.
 */
class FileSystem {
public:
    virtual ~FileSystem() = default;

    /// Create `dir` and missing parents; succeeds if it already exists.
    virtual UploadResult<void> create_directories(const std::filesystem::path& dir) = 0;

    /// Replace `path` with `data` all-or-nothing (temp file + rename).
    virtual UploadResult<void> write_file_atomic(const std::filesystem::path& path,
                                                 const std::vector<std::uint8_t>& data) = 0;

    virtual UploadResult<std::vector<std::uint8_t>> read_file(const std::filesystem::path& path) const = 0;

    /// Open a new file for writing; fails if `path` already exists.
    virtual UploadResult<std::unique_ptr<FileWriter>> create_exclusive(const std::filesystem::path& path) = 0;

    virtual UploadResult<void> remove_file(const std::filesystem::path& path) = 0;

    /// Recursive remove; a missing tree is not an error.
    virtual UploadResult<void> remove_tree(const std::filesystem::path& path) = 0;

    virtual UploadResult<std::uint64_t> file_size(const std::filesystem::path& path) const = 0;

    virtual bool exists(const std::filesystem::path& path) const = 0;

    /// Names (not paths) of the entries directly inside `dir`.
    virtual UploadResult<std::vector<std::string>> list_directory(const std::filesystem::path& dir) const = 0;
};

class LocalFileSystem final : public FileSystem {
public:
    UploadResult<void> create_directories(const std::filesystem::path& dir) override;
    UploadResult<void> write_file_atomic(const std::filesystem::path& path,
                                         const std::vector<std::uint8_t>& data) override;
    UploadResult<std::vector<std::uint8_t>> read_file(const std::filesystem::path& path) const override;
    UploadResult<std::unique_ptr<FileWriter>> create_exclusive(const std::filesystem::path& path) override;
    UploadResult<void> remove_file(const std::filesystem::path& path) override;
    UploadResult<void> remove_tree(const std::filesystem::path& path) override;
    UploadResult<std::uint64_t> file_size(const std::filesystem::path& path) const override;
    bool exists(const std::filesystem::path& path) const override;
    UploadResult<std::vector<std::string>> list_directory(const std::filesystem::path& dir) const override;
};

} // namespace guestdrop
