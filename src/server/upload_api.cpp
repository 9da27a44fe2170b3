#include "guestdrop/server/upload_api.hpp"
#include "guestdrop/network/form_data.hpp"
#include "guestdrop/network/http_server_asio.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <charconv>
#include <limits>

namespace guestdrop::server {
namespace {

using json = nlohmann::json;
using network::FormData;
using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;

HttpResponse make_json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump(-1, ' ', false, json::error_handler_t::replace));
    return response;
}

HttpResponse bad_request(const std::string& detail) {
    return network::make_error_response(HttpStatus::BAD_REQUEST, std::string(to_string(ErrorKind::InvalidInput)),
                                        detail);
}

template<typename T>
std::optional<T> parse_unsigned(const std::string& text) {
    T value{};
    const char* first = text.data();
    const char* last = first + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

// Accepts a JSON number or a numeric string; the browser client sends both.
template<typename T>
Result<std::optional<T>> json_unsigned(const json& doc, const char* key) {
    if (!doc.contains(key) || doc.at(key).is_null()) {
        return Ok(std::optional<T>());
    }
    const auto& value = doc.at(key);
    if (value.is_number_unsigned()) {
        const auto raw = value.get<std::uint64_t>();
        if (raw <= std::numeric_limits<T>::max()) {
            return Ok(std::optional<T>(static_cast<T>(raw)));
        }
    } else if (value.is_string()) {
        if (auto parsed = parse_unsigned<T>(value.get<std::string>())) {
            return Ok(std::optional<T>(*parsed));
        }
    }
    return Err(std::string(key) + " must be a non-negative integer");
}

template<typename T>
Result<std::optional<T>> form_unsigned(const FormData& form, const char* key) {
    auto text = form.field(key);
    if (!text || text->empty()) {
        return Ok(std::optional<T>());
    }
    if (auto parsed = parse_unsigned<T>(*text)) {
        return Ok(std::optional<T>(*parsed));
    }
    return Err(std::string(key) + " must be a non-negative integer");
}

Result<upload::StartRequest> start_request_from_json(const std::string& body) {
    const json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Err(std::string("body is not a JSON object"));
    }

    upload::StartRequest request;
    const auto guest = doc.find("guest");
    const auto filename = doc.find("filename");
    if (guest != doc.end() && guest->is_string()) {
        request.owner = guest->get<std::string>();
    }
    if (filename != doc.end() && filename->is_string()) {
        request.filename = filename->get<std::string>();
    }

    auto total_chunks = json_unsigned<std::uint32_t>(doc, "total_chunks");
    if (total_chunks.is_error()) {
        return Err(total_chunks.error());
    }
    auto file_size = json_unsigned<std::uint64_t>(doc, "file_size");
    if (file_size.is_error()) {
        return Err(file_size.error());
    }
    request.total_chunks = total_chunks.value();
    request.file_size = file_size.value();
    return Ok(std::move(request));
}

Result<upload::StartRequest> start_request_from_form(const network::HttpRequest& http) {
    auto form = network::parse_form(http);
    if (form.is_error()) {
        return Err(form.error());
    }

    upload::StartRequest request;
    request.owner = form.value().field("guest").value_or("");
    request.filename = form.value().field("filename").value_or("");

    auto total_chunks = form_unsigned<std::uint32_t>(form.value(), "total_chunks");
    if (total_chunks.is_error()) {
        return Err(total_chunks.error());
    }
    auto file_size = form_unsigned<std::uint64_t>(form.value(), "file_size");
    if (file_size.is_error()) {
        return Err(file_size.error());
    }
    request.total_chunks = total_chunks.value();
    request.file_size = file_size.value();
    return Ok(std::move(request));
}

HttpResponse handle_start(upload::UploadService& service, const HttpContext& ctx) {
    const auto type = network::media_type(ctx.request.get_header("Content-Type"));
    auto parsed = type == "application/json" ? start_request_from_json(ctx.request.body_as_string())
                                             : start_request_from_form(ctx.request);
    if (parsed.is_error()) {
        return bad_request(parsed.error());
    }

    auto started = service.start(parsed.value());
    if (started.is_error()) {
        return upload_error_response(started.error());
    }

    const auto& result = started.value();
    return make_json_response(HttpStatus::OK, json{
        {"upload_id", result.upload_id},
        {"chunk_size", result.chunk_size},
        {"total_chunks", result.total_chunks}});
}

HttpResponse handle_chunk(upload::UploadService& service, const HttpContext& ctx) {
    auto form = network::parse_form(ctx.request);
    if (form.is_error()) {
        return bad_request(form.error());
    }

    const network::FormPart* file = form.value().find("file");
    if (file == nullptr) {
        return bad_request("missing 'file' part");
    }
    auto index = form_unsigned<std::uint32_t>(form.value(), "chunk_index");
    if (index.is_error()) {
        return bad_request(index.error());
    }
    if (!index.value()) {
        return bad_request("missing 'chunk_index' field");
    }

    auto progress = service.upload_chunk(ctx.get_param("upload_id"), *index.value(), file->data);
    if (progress.is_error()) {
        return upload_error_response(progress.error());
    }

    return make_json_response(HttpStatus::OK, json{
        {"received", progress.value().received},
        {"total", progress.value().total}});
}

HttpResponse handle_complete(upload::UploadService& service, const HttpContext& ctx) {
    auto completed = service.complete(ctx.get_param("upload_id"));
    if (completed.is_error()) {
        return upload_error_response(completed.error());
    }

    const auto& result = completed.value();
    return make_json_response(HttpStatus::OK, json{
        {"path", result.relative_path},
        {"size", result.file_size},
        {"filename", result.filename}});
}

HttpResponse handle_status(const upload::UploadService& service, const HttpContext& ctx) {
    auto status = service.status(ctx.get_param("upload_id"));
    if (status.is_error()) {
        return upload_error_response(status.error());
    }

    const auto& result = status.value();
    return make_json_response(HttpStatus::OK, json{
        {"guest", result.session.owner},
        {"filename", result.session.filename},
        {"state", std::string(upload::to_string(result.session.state))},
        {"received", result.session.received.size()},
        {"total", result.session.total_chunks},
        {"missing", result.missing}});
}

} // namespace

network::HttpStatus status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput: return HttpStatus::BAD_REQUEST;
        case ErrorKind::UnsupportedType: return HttpStatus::UNSUPPORTED_MEDIA_TYPE;
        case ErrorKind::FileTooLarge: return HttpStatus::PAYLOAD_TOO_LARGE;
        case ErrorKind::SessionNotFound: return HttpStatus::NOT_FOUND;
        case ErrorKind::AlreadyCompleting: return HttpStatus::CONFLICT;
        case ErrorKind::IncompleteUpload: return HttpStatus::CONFLICT;
        case ErrorKind::AssemblyFailed: return HttpStatus::INTERNAL_SERVER_ERROR;
        case ErrorKind::StorageIO: return HttpStatus::INTERNAL_SERVER_ERROR;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

network::HttpResponse upload_error_response(const UploadError& error) {
    const std::string kind(to_string(error.kind));
    if (!error.is_client_error()) {
        // Causes can name scratch paths; keep them in the log only.
        spdlog::error("Upload failed ({}): {}", kind, error.message);
        return network::make_error_response(status_for(error.kind), kind,
                                            "The upload could not be stored, please try again");
    }

    json body{{"error", kind}, {"detail", error.message}};
    if (error.kind == ErrorKind::IncompleteUpload) {
        body["missing"] = error.missing;
    }
    return make_json_response(status_for(error.kind), body);
}

void register_upload_routes(network::HttpRouter& router, upload::UploadService& service) {
    router.post("/api/upload/start", [&service](const HttpContext& ctx) {
        return handle_start(service, ctx);
    });

    router.post("/api/upload/chunk/:upload_id", [&service](const HttpContext& ctx) {
        return handle_chunk(service, ctx);
    });

    router.post("/api/upload/complete/:upload_id", [&service](const HttpContext& ctx) {
        return handle_complete(service, ctx);
    });

    router.get("/api/upload/status/:upload_id", [&service](const HttpContext& ctx) {
        return handle_status(service, ctx);
    });

    router.get("/api/health", [&service](const HttpContext&) {
        return make_json_response(HttpStatus::OK, json{
            {"status", "ok"},
            {"active_sessions", service.active_sessions()}});
    });

    router.set_not_found_handler([](const HttpContext& ctx) {
        return network::make_error_response(HttpStatus::NOT_FOUND, "not_found",
                                            "No route for " + ctx.request.path());
    });

    router.set_exception_handler([](const HttpContext&, const std::exception&) {
        return network::make_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "internal",
                                            "Internal server error");
    });
}

} // namespace guestdrop::server
