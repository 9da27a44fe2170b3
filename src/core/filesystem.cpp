#include "guestdrop/core/filesystem.hpp"
#include "guestdrop/core/random.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>

namespace guestdrop {
namespace fs = std::filesystem;

namespace {

std::string describe(const std::string& action, const fs::path& path, const std::string& reason) {
    return action + " " + path.filename().string() + ": " + reason;
}

class StdioFileWriter final : public FileWriter {
public:
    explicit StdioFileWriter(std::FILE* file) : file_(file) {}

    ~StdioFileWriter() override {
        if (file_ != nullptr) {
            std::fclose(file_);
        }
    }

    StdioFileWriter(const StdioFileWriter&) = delete;
    StdioFileWriter& operator=(const StdioFileWriter&) = delete;

    UploadResult<void> append(const std::uint8_t* data, std::size_t size) override {
        if (file_ == nullptr) {
            return Err(UploadError::storage_io("write after close"));
        }
        if (size == 0) {
            return Ok();
        }
        if (std::fwrite(data, 1, size, file_) != size) {
            return Err(UploadError::storage_io(std::string("short write: ") + std::strerror(errno)));
        }
        written_ += size;
        return Ok();
    }

    UploadResult<void> close() override {
        if (file_ == nullptr) {
            return Ok();
        }
        const int rc = std::fclose(file_);
        file_ = nullptr;
        if (rc != 0) {
            return Err(UploadError::storage_io(std::string("close failed: ") + std::strerror(errno)));
        }
        return Ok();
    }

    std::uint64_t bytes_written() const noexcept override { return written_; }

private:
    std::FILE* file_;
    std::uint64_t written_ = 0;
};

} // namespace

UploadResult<void> LocalFileSystem::create_directories(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    // A concurrent creator may win the race; only fail if the directory is really absent.
    if (ec && !fs::is_directory(dir)) {
        return Err(UploadError::storage_io(describe("create directory", dir, ec.message())));
    }
    return Ok();
}

UploadResult<void> LocalFileSystem::write_file_atomic(const fs::path& path,
                                                      const std::vector<std::uint8_t>& data) {
    const fs::path temp = path.parent_path() / ("." + path.filename().string() + "." + random_hex(6) + ".tmp");

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err(UploadError::storage_io(describe("open", temp, std::strerror(errno))));
        }
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            fs::remove(temp, ignored);
            return Err(UploadError::storage_io(describe("write", temp, "stream error")));
        }
    }

    std::error_code ec;
    fs::rename(temp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return Err(UploadError::storage_io(describe("rename", path, ec.message())));
    }
    return Ok();
}

UploadResult<std::vector<std::uint8_t>> LocalFileSystem::read_file(const fs::path& path) const {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err(UploadError::storage_io(describe("open", path, std::strerror(errno))));
    }
    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        return Err(UploadError::storage_io(describe("read", path, "stream error")));
    }
    return Ok(std::move(data));
}

UploadResult<std::unique_ptr<FileWriter>> LocalFileSystem::create_exclusive(const fs::path& path) {
    // "x" makes fopen fail with EEXIST instead of truncating an existing file.
    std::FILE* file = std::fopen(path.c_str(), "wbx");
    if (file == nullptr) {
        return Err(UploadError::storage_io(describe("create", path, std::strerror(errno))));
    }
    return Ok(std::unique_ptr<FileWriter>(std::make_unique<StdioFileWriter>(file)));
}

UploadResult<void> LocalFileSystem::remove_file(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return Err(UploadError::storage_io(describe("remove", path, ec.message())));
    }
    return Ok();
}

UploadResult<void> LocalFileSystem::remove_tree(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec && fs::exists(path)) {
        return Err(UploadError::storage_io(describe("remove tree", path, ec.message())));
    }
    return Ok();
}

UploadResult<std::uint64_t> LocalFileSystem::file_size(const fs::path& path) const {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err(UploadError::storage_io(describe("stat", path, ec.message())));
    }
    return Ok(static_cast<std::uint64_t>(size));
}

bool LocalFileSystem::exists(const fs::path& path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}

UploadResult<std::vector<std::string>> LocalFileSystem::list_directory(const fs::path& dir) const {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return Err(UploadError::storage_io(describe("list", dir, ec.message())));
    }

    std::vector<std::string> names;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        return Err(UploadError::storage_io(describe("list", dir, ec.message())));
    }
    return Ok(std::move(names));
}

} // namespace guestdrop
