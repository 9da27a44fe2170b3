#include "guestdrop/upload/filename.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace guestdrop::upload {
namespace {

constexpr std::array<std::string_view, 10> kImageExtensions{
    "jpg", "jpeg", "png", "gif", "webp", "heic", "heif", "bmp", "tiff", "tif"};

constexpr std::array<std::string_view, 7> kVideoExtensions{
    "mp4", "mov", "m4v", "avi", "mkv", "webm", "3gp"};

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_word(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool in_range(std::string_view text, std::size_t pos, unsigned char low, unsigned char high) {
    if (pos >= text.size()) {
        return false;
    }
    const auto byte = static_cast<unsigned char>(text[pos]);
    return byte >= low && byte <= high;
}

// Length of the well-formed UTF-8 sequence starting at `pos`, or 0 for a
// stray, overlong, surrogate or truncated one (RFC 3629 table).
std::size_t utf8_sequence_length(std::string_view text, std::size_t pos) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    if (lead >= 0xC2 && lead <= 0xDF) {
        return in_range(text, pos + 1, 0x80, 0xBF) ? 2 : 0;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        const unsigned char low = lead == 0xE0 ? 0xA0 : 0x80;
        const unsigned char high = lead == 0xED ? 0x9F : 0xBF;
        return in_range(text, pos + 1, low, high) && in_range(text, pos + 2, 0x80, 0xBF) ? 3 : 0;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        const unsigned char low = lead == 0xF0 ? 0x90 : 0x80;
        const unsigned char high = lead == 0xF4 ? 0x8F : 0xBF;
        return in_range(text, pos + 1, low, high) && in_range(text, pos + 2, 0x80, 0xBF) &&
                       in_range(text, pos + 3, 0x80, 0xBF)
                   ? 4
                   : 0;
    }
    return 0;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

std::string_view basename_of(std::string_view filename) {
    const auto slash = filename.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        filename.remove_prefix(slash + 1);
    }
    return filename;
}

template<std::size_t N>
bool contains(const std::array<std::string_view, N>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

} // namespace

std::string sanitize(std::string_view name) {
    const auto trimmed = trim(name);

    std::string result;
    result.reserve(trimmed.size());
    bool in_separator_run = false;
    for (std::size_t pos = 0; pos < trimmed.size(); ++pos) {
        const char c = trimmed[pos];
        if (static_cast<unsigned char>(c) >= 0x80) {
            // Non-ASCII survives only as whole, valid UTF-8 so names stay JSON-safe.
            const auto length = utf8_sequence_length(trimmed, pos);
            if (length > 0) {
                result.append(trimmed.substr(pos, length));
                in_separator_run = false;
                pos += length - 1;
            }
            continue;
        }
        if (is_space(c) || c == '-') {
            if (!in_separator_run) {
                result.push_back('_');
                in_separator_run = true;
            }
            continue;
        }
        if (is_word(c)) {
            result.push_back(c);
            in_separator_run = false;
        }
        // Anything else is dropped without ending the separator run, so
        // "a - . - b" still collapses to a single underscore.
    }
    return result;
}

std::string sanitize_filename(std::string_view filename) {
    const auto base = trim(basename_of(filename));
    const auto dot = base.rfind('.');
    if (dot == std::string_view::npos) {
        return {};
    }

    const std::string stem = sanitize(base.substr(0, dot));
    const std::string extension = to_lower(sanitize(base.substr(dot + 1)));
    if (stem.empty() || extension.empty()) {
        return {};
    }
    return stem + "." + extension;
}

std::string extension_of(std::string_view filename) {
    const auto base = basename_of(filename);
    const auto dot = base.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == base.size()) {
        return {};
    }
    return to_lower(std::string(base.substr(dot + 1)));
}

MediaCategory classify_extension(std::string_view filename) {
    const auto extension = extension_of(filename);
    if (contains(kImageExtensions, extension)) {
        return MediaCategory::Image;
    }
    if (contains(kVideoExtensions, extension)) {
        return MediaCategory::Video;
    }
    return MediaCategory::Unsupported;
}

std::string_view to_string(MediaCategory category) noexcept {
    switch (category) {
        case MediaCategory::Image: return "image";
        case MediaCategory::Video: return "video";
        case MediaCategory::Unsupported: return "unsupported";
    }
    return "unsupported";
}

} // namespace guestdrop::upload
