#include "guestdrop/upload/gzip.hpp"

#include <zlib.h>

#include <array>
#include <limits>
#include <string>

namespace guestdrop::upload {
namespace {

constexpr std::uint8_t kGzipMagic0 = 0x1f;
constexpr std::uint8_t kGzipMagic1 = 0x8b;
constexpr std::uint8_t kMethodDeflate = 0x08;
constexpr std::uint8_t kReservedFlagBits = 0xe0;
constexpr std::size_t kGzipHeaderSize = 10;
constexpr int kGzipWindowBits = 15 + 16;
constexpr std::size_t kOutputBlock = 64 * 1024;

class InflateStream {
public:
    InflateStream() = default;
    ~InflateStream() {
        if (initialized_) {
            inflateEnd(&stream_);
        }
    }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    bool init() {
        initialized_ = inflateInit2(&stream_, kGzipWindowBits) == Z_OK;
        return initialized_;
    }

    z_stream& get() { return stream_; }

private:
    z_stream stream_{};
    bool initialized_ = false;
};

UploadError corrupt(const std::string& detail) {
    return UploadError::assembly_failed("invalid gzip chunk: " + detail);
}

} // namespace

bool is_gzip(const std::vector<std::uint8_t>& data) noexcept {
    // RFC 1952 fixed header: magic, CM = deflate, reserved FLG bits clear.
    return data.size() >= kGzipHeaderSize && data[0] == kGzipMagic0 && data[1] == kGzipMagic1 &&
           data[2] == kMethodDeflate && (data[3] & kReservedFlagBits) == 0;
}

UploadResult<void> inflate_gzip(const std::vector<std::uint8_t>& compressed, const ByteSink& sink) {
    if (compressed.size() > std::numeric_limits<uInt>::max()) {
        return Err(corrupt("chunk too large for a single inflate pass"));
    }

    InflateStream inflater;
    if (!inflater.init()) {
        return Err(UploadError::assembly_failed("inflateInit2 failed"));
    }

    z_stream& strm = inflater.get();
    strm.next_in = const_cast<Bytef*>(compressed.data());
    strm.avail_in = static_cast<uInt>(compressed.size());

    std::array<std::uint8_t, kOutputBlock> out{};
    for (;;) {
        strm.next_out = out.data();
        strm.avail_out = static_cast<uInt>(out.size());

        const int rc = inflate(&strm, Z_NO_FLUSH);
        const std::size_t produced = out.size() - strm.avail_out;
        if (produced > 0) {
            auto written = sink(out.data(), produced);
            if (written.is_error()) {
                return written;
            }
        }

        if (rc == Z_STREAM_END) {
            if (strm.avail_in == 0) {
                return Ok();
            }
            // Another member follows only if it starts with the magic too.
            if (strm.avail_in < 2 || strm.next_in[0] != kGzipMagic0 || strm.next_in[1] != kGzipMagic1) {
                return Err(corrupt("trailing bytes after gzip member"));
            }
            if (inflateReset(&strm) != Z_OK) {
                return Err(corrupt("inflateReset failed"));
            }
            continue;
        }
        if (rc == Z_BUF_ERROR && strm.avail_in == 0 && produced == 0) {
            return Err(corrupt("truncated stream"));
        }
        if (rc != Z_OK && rc != Z_BUF_ERROR) {
            return Err(corrupt(strm.msg != nullptr ? strm.msg : "inflate error " + std::to_string(rc)));
        }
    }
}

} // namespace guestdrop::upload
