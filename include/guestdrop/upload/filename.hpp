#pragma once

#include <string>
#include <string_view>

namespace guestdrop::upload {

enum class MediaCategory {
    Image,
    Video,
    Unsupported
};

/**
 * @brief Turn an untrusted name into a single safe path segment
 *
 * Trims surrounding whitespace, drops everything except word characters,
 * whitespace and hyphens, then collapses each run of whitespace/hyphens into
 * one underscore. Well-formed multi-byte UTF-8 sequences are kept whole;
 * malformed bytes are dropped, so the result is always valid UTF-8.
 *
 * The result never contains '/', '\\' or '.'. An empty result means the
 * name is unusable and the request must be rejected.
 */
std::string sanitize(std::string_view name);

/**
 * @brief Sanitize a client filename, preserving its extension
 *
 * Directory components are discarded, stem and extension are sanitized
 * separately and the extension is lower-cased: "My Trip.JPG" -> "My_Trip.jpg".
 * Returns an empty string when either part sanitizes to nothing.
 */
std::string sanitize_filename(std::string_view filename);

/// Lower-cased extension without the dot, or empty.
std::string extension_of(std::string_view filename);

/// Allow-list lookup on the extension, case-insensitive.
MediaCategory classify_extension(std::string_view filename);

std::string_view to_string(MediaCategory category) noexcept;

} // namespace guestdrop::upload
