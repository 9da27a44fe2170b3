#pragma once

#include "guestdrop/core/result.hpp"
#include "guestdrop/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace guestdrop {
namespace network {

/**
 * @brief Where the parser is in the request
 *
 * METHOD SP URL SP VERSION CRLF    <- Request line
 * Header-Name: Header-Value CRLF   <- Headers (multiple)
 * CRLF                             <- Empty line
 * [Body]                           <- Content-Length bytes
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * Feed it bytes as they arrive from the socket. The request line and headers
 * go through a per-character state machine; the body is copied in bulk once
 * Content-Length is known, since chunk uploads carry megabytes of payload.
 *
 * A Content-Length above `max_body_bytes` fails the parse before any body
 * byte is buffered and sets body_too_large() so the server can answer 413.
 *
 * Usage:
 * ```cpp
 * HttpParser parser(limit);
 * auto result = parser.parse(data, size);
 * if (result.is_error()) { ... }
 * if (result.value()) { HttpRequest request = parser.take_request(); }
 * ```
 */
class HttpParser {
public:
    static constexpr size_t kDefaultMaxBodyBytes = 8 * 1024 * 1024;
    static constexpr size_t kMaxHeaderBytes = 64 * 1024;

    explicit HttpParser(size_t max_body_bytes = kDefaultMaxBodyBytes)
        : max_body_bytes_(max_body_bytes) {
        reset();
    }

    /**
     * @brief Consume `len` bytes
     *
     * @return true once the request is complete, false if more data is
     *         needed, or an error describing the malformed input
     */
    Result<bool> parse(const char* data, size_t len) {
        size_t i = 0;
        while (i < len) {
            switch (state_) {
                case ParseState::COMPLETE:
                    return Ok(true);

                case ParseState::PARSE_ERROR:
                    return Err(std::string("Parser in error state"));

                case ParseState::BODY: {
                    const size_t take = std::min(len - i, body_expected_ - request_.body.size());
                    request_.body.insert(request_.body.end(),
                                         reinterpret_cast<const uint8_t*>(data + i),
                                         reinterpret_cast<const uint8_t*>(data + i + take));
                    i += take;
                    if (request_.body.size() >= body_expected_) {
                        state_ = ParseState::COMPLETE;
                    }
                    break;
                }

                default: {
                    const char c = data[i++];
                    if (c == '\n') {
                        line_++;
                    }
                    if (++header_bytes_ > kMaxHeaderBytes) {
                        return fail("Request headers exceed " + std::to_string(kMaxHeaderBytes) + " bytes");
                    }
                    auto stepped = step(c);
                    if (stepped.is_error()) {
                        return stepped;
                    }
                    break;
                }
            }
        }

        return Ok(state_ == ParseState::COMPLETE);
    }

    HttpRequest get_request() const {
        return request_;
    }

    /// Move the parsed request out; the parser must be reset() before reuse.
    HttpRequest take_request() {
        return std::move(request_);
    }

    bool is_complete() const {
        return state_ == ParseState::COMPLETE;
    }

    bool body_too_large() const {
        return body_too_large_;
    }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        body_expected_ = 0;
        header_bytes_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
        body_too_large_ = false;
    }

private:
    size_t max_body_bytes_;
    ParseState state_ = ParseState::METHOD;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    size_t body_expected_ = 0;
    size_t header_bytes_ = 0;
    size_t line_ = 1;
    bool last_char_was_cr_ = false;
    bool body_too_large_ = false;

    Result<bool> fail(const std::string& message) {
        state_ = ParseState::PARSE_ERROR;
        return Err(message);
    }

    Result<bool> step(char c) {
        switch (state_) {
            case ParseState::METHOD:
                return parse_method(c) ? Ok(false) : fail("Failed to parse HTTP method at line " + std::to_string(line_));
            case ParseState::URL:
                return parse_url(c) ? Ok(false) : fail("Failed to parse URL at line " + std::to_string(line_));
            case ParseState::VERSION:
                return parse_version(c) ? Ok(false) : fail("Failed to parse HTTP version at line " + std::to_string(line_));
            case ParseState::HEADER_NAME:
                return parse_header_name(c);
            case ParseState::HEADER_VALUE:
                return parse_header_value(c) ? Ok(false) : fail("Failed to parse header value at line " + std::to_string(line_));
            default:
                return Ok(false);
        }
    }

    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }

        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.url = buffer_;
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }

        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    Result<bool> parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return Ok(false);
        }

        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return finish_headers();
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return fail("Empty header name at line " + std::to_string(line_));
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return Ok(false);
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return fail("Failed to parse header name at line " + std::to_string(line_));
        }
        buffer_ += c;
        return Ok(false);
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }

        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            request_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    Result<bool> finish_headers() {
        if (request_.has_header("Transfer-Encoding")) {
            return fail("Transfer-Encoding is not supported; send Content-Length");
        }

        const std::string content_length = request_.get_header("Content-Length");
        if (content_length.empty()) {
            state_ = ParseState::COMPLETE;
            return Ok(true);
        }

        size_t length = 0;
        const char* first = content_length.data();
        const char* last = first + content_length.size();
        auto [ptr, ec] = std::from_chars(first, last, length);
        if (ec != std::errc() || ptr != last) {
            return fail("Invalid Content-Length: " + content_length);
        }
        if (length > max_body_bytes_) {
            body_too_large_ = true;
            return fail("Request body of " + content_length + " bytes exceeds limit of " +
                        std::to_string(max_body_bytes_));
        }

        if (length == 0) {
            state_ = ParseState::COMPLETE;
            return Ok(true);
        }
        body_expected_ = length;
        request_.body.reserve(length);
        state_ = ParseState::BODY;
        return Ok(false);
    }
};

} // namespace network
} // namespace guestdrop
