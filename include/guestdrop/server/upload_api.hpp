#pragma once

#include "guestdrop/core/error.hpp"
#include "guestdrop/network/http_router.hpp"
#include "guestdrop/upload/service.hpp"

namespace guestdrop::server {

/**
 * @brief Mount the upload protocol on `router`
 *
 *   POST /api/upload/start                 guest, filename, total_chunks | file_size
 *   POST /api/upload/chunk/:upload_id      multipart: file, chunk_index
 *   POST /api/upload/complete/:upload_id
 *   GET  /api/upload/status/:upload_id
 *   GET  /api/health
 *
 * Also installs JSON not-found and exception handlers. `service` must
 * outlive the router.
 */
void register_upload_routes(network::HttpRouter& router, upload::UploadService& service);

network::HttpStatus status_for(ErrorKind kind);

/// Error body for a failed upload operation; server-side failures get a generic detail.
network::HttpResponse upload_error_response(const UploadError& error);

} // namespace guestdrop::server
