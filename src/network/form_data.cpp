#include "guestdrop/network/form_data.hpp"

#include <algorithm>
#include <cctype>

namespace guestdrop {
namespace network {
namespace {

constexpr std::string_view kCrlf = "\r\n";

std::string trim(std::string_view s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && (s[start] == ' ' || s[start] == '\t')) ++start;
    while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' ||
                           s[end - 1] == '\r' || s[end - 1] == '\n')) --end;
    return std::string(s.substr(start, end - start));
}

std::string to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string unquote(std::string value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Calls visit(key_lowercase, value) for each "key=value" among ';'-separated params.
template<typename Visitor>
void for_each_param(std::string_view params, Visitor visit) {
    while (!params.empty()) {
        const auto semi = params.find(';');
        const std::string token = trim(params.substr(0, semi));
        params = semi == std::string_view::npos ? std::string_view() : params.substr(semi + 1);

        const auto eq = token.find('=');
        if (token.empty() || eq == std::string::npos) {
            continue;
        }
        visit(to_lower(trim(token.substr(0, eq))), unquote(trim(token.substr(eq + 1))));
    }
}

void parse_part_headers(std::string_view headers, FormPart& part) {
    size_t pos = 0;
    while (pos < headers.size()) {
        auto eol = headers.find(kCrlf, pos);
        if (eol == std::string_view::npos) {
            eol = headers.size();
        }
        const auto line = headers.substr(pos, eol - pos);
        pos = eol + kCrlf.size();

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        const std::string name = to_lower(trim(line.substr(0, colon)));
        const std::string value = trim(line.substr(colon + 1));

        if (name == "content-disposition") {
            for_each_param(value, [&part](const std::string& key, const std::string& val) {
                if (key == "name") {
                    part.name = val;
                } else if (key == "filename") {
                    part.filename = val;
                }
            });
        } else if (name == "content-type") {
            part.content_type = value;
        }
    }
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

const FormPart* FormData::find(const std::string& name) const {
    auto it = std::find_if(parts.begin(), parts.end(), [&name](const FormPart& part) {
        return part.name == name;
    });
    return it != parts.end() ? &*it : nullptr;
}

std::optional<std::string> FormData::field(const std::string& name) const {
    const FormPart* part = find(name);
    if (part == nullptr) {
        return std::nullopt;
    }
    return part->text();
}

std::string media_type(const std::string& content_type) {
    return to_lower(trim(std::string_view(content_type).substr(0, content_type.find(';'))));
}

std::string extract_boundary(const std::string& content_type) {
    const auto semicolon = content_type.find(';');
    if (semicolon == std::string::npos) {
        return {};
    }

    std::string boundary;
    for_each_param(std::string_view(content_type).substr(semicolon + 1),
                   [&boundary](const std::string& key, const std::string& value) {
                       if (key == "boundary" && boundary.empty()) {
                           boundary = value;
                       }
                   });
    return boundary;
}

Result<FormData> parse_multipart(std::string_view body, const std::string& boundary) {
    if (boundary.empty()) {
        return Err(std::string("multipart body without boundary"));
    }

    const std::string dash = "--" + boundary;
    const std::string marker = std::string(kCrlf) + dash;

    size_t bline = 0;
    if (body.compare(0, dash.size(), dash) != 0) {
        const auto first = body.find(marker);
        if (first == std::string_view::npos) {
            return Err(std::string("multipart body does not contain its boundary"));
        }
        bline = first + kCrlf.size();
    }

    FormData form;
    while (true) {
        const size_t after = bline + dash.size();
        if (after > body.size()) {
            return Err(std::string("truncated multipart boundary line"));
        }
        if (body.compare(after, 2, "--") == 0) {
            return Ok(std::move(form));
        }

        const auto line_end = body.find(kCrlf, after);
        if (line_end == std::string_view::npos) {
            return Err(std::string("truncated multipart boundary line"));
        }

        const size_t headers_start = line_end + kCrlf.size();
        const auto headers_end = body.find("\r\n\r\n", headers_start);
        if (headers_end == std::string_view::npos) {
            return Err(std::string("multipart part without header terminator"));
        }

        FormPart part;
        parse_part_headers(body.substr(headers_start, headers_end - headers_start), part);

        const size_t content_start = headers_end + 4;
        const auto next_marker = body.find(marker, content_start);
        if (next_marker == std::string_view::npos) {
            return Err(std::string("multipart part is not terminated"));
        }

        const auto* data = reinterpret_cast<const uint8_t*>(body.data() + content_start);
        part.data.assign(data, data + (next_marker - content_start));
        form.parts.push_back(std::move(part));

        bline = next_marker + kCrlf.size();
    }
}

Result<std::string> url_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%') {
            if (i + 2 >= text.size()) {
                return Err(std::string("truncated percent escape"));
            }
            const int hi = hex_value(text[i + 1]);
            const int lo = hex_value(text[i + 2]);
            if (hi < 0 || lo < 0) {
                return Err(std::string("invalid percent escape"));
            }
            out.push_back(static_cast<char>(hi * 16 + lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return Ok(std::move(out));
}

Result<FormData> parse_urlencoded(std::string_view body) {
    FormData form;
    while (!body.empty()) {
        const auto amp = body.find('&');
        const auto pair = body.substr(0, amp);
        body = amp == std::string_view::npos ? std::string_view() : body.substr(amp + 1);
        if (pair.empty()) {
            continue;
        }

        const auto eq = pair.find('=');
        auto key = url_decode(pair.substr(0, eq));
        auto value = url_decode(eq == std::string_view::npos ? std::string_view() : pair.substr(eq + 1));
        if (key.is_error()) {
            return Err(key.error());
        }
        if (value.is_error()) {
            return Err(value.error());
        }

        FormPart part;
        part.name = std::move(key.value());
        part.data.assign(value.value().begin(), value.value().end());
        form.parts.push_back(std::move(part));
    }
    return Ok(std::move(form));
}

Result<FormData> parse_form(const HttpRequest& request) {
    const std::string content_type = request.get_header("Content-Type");
    const std::string type = media_type(content_type);
    const std::string_view body(reinterpret_cast<const char*>(request.body.data()), request.body.size());

    if (type == "multipart/form-data") {
        return parse_multipart(body, extract_boundary(content_type));
    }
    if (type == "application/x-www-form-urlencoded") {
        return parse_urlencoded(body);
    }
    return Err("unsupported form content type '" + type + "'");
}

} // namespace network
} // namespace guestdrop
