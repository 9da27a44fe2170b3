#pragma once

#include "guestdrop/core/result.hpp"
#include "guestdrop/network/http_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace guestdrop {
namespace network {

/**
 * @brief One field of a form body
 *
 * For multipart bodies `filename` and `content_type` come from the part
 * headers; urlencoded fields leave them empty.
 */
struct FormPart {
    std::string name;
    std::string filename;
    std::string content_type;
    std::vector<uint8_t> data;

    std::string text() const { return std::string(data.begin(), data.end()); }
};

struct FormData {
    std::vector<FormPart> parts;

    /// First part called `name`, or nullptr.
    const FormPart* find(const std::string& name) const;

    /// Text value of the first part called `name`.
    std::optional<std::string> field(const std::string& name) const;
};

/// `boundary` parameter of a multipart Content-Type, or empty.
std::string extract_boundary(const std::string& content_type);

/**
 * @brief Split a multipart/form-data body on `boundary`
 *
 * Part data is binary-safe. Fails when the body does not open with the
 * boundary or a part is not terminated by a later boundary line.
 */
Result<FormData> parse_multipart(std::string_view body, const std::string& boundary);

/// Decode `a=1&b=two+words&c=%2F` style bodies and query strings.
Result<FormData> parse_urlencoded(std::string_view body);

/// Percent-decoding with '+' as space; fails on a truncated or non-hex escape.
Result<std::string> url_decode(std::string_view text);

/**
 * @brief Parse the request body according to its Content-Type
 *
 * Handles multipart/form-data and application/x-www-form-urlencoded. Any
 * other content type is an error.
 */
Result<FormData> parse_form(const HttpRequest& request);

/// Lower-cased media type without parameters: "multipart/form-data".
std::string media_type(const std::string& content_type);

} // namespace network
} // namespace guestdrop
