#pragma once

#include "guestdrop/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace guestdrop::upload {

/// Receives decompressed output in pieces, in order.
using ByteSink = std::function<UploadResult<void>(const std::uint8_t* data, std::size_t size)>;

/// True when `data` starts with a plausible gzip header: magic 1f 8b,
/// method 8 (deflate) and no reserved flag bits.
bool is_gzip(const std::vector<std::uint8_t>& data) noexcept;

/**
 * @brief Inflate a gzip blob into `sink`
 *
 * Concatenated members (as produced by `cat a.gz b.gz`) are inflated back to
 * back. A corrupt or truncated stream, or bytes after the last member that
 * do not start another member, yield AssemblyFailed. Errors returned by
 * the sink are passed through unchanged.
 */
UploadResult<void> inflate_gzip(const std::vector<std::uint8_t>& compressed, const ByteSink& sink);

} // namespace guestdrop::upload
