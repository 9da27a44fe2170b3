#include "guestdrop/network/http_server_asio.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace guestdrop {
namespace network {

HttpResponse make_error_response(HttpStatus status, const std::string& kind, const std::string& detail) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    const nlohmann::json body{{"error", kind}, {"detail", detail}};
    response.set_body(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    return response;
}

// ──────────────────────────────────────────────────────────
// HttpConnection
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler, size_t max_body_bytes)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , parser_(max_body_bytes) {
}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    spdlog::debug("Read error: {}", ec.message());
                }
                return;
            }

            auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);
            if (parse_result.is_error()) {
                if (parser_.body_too_large()) {
                    handle_error(HttpStatus::PAYLOAD_TOO_LARGE, parse_result.error());
                } else {
                    handle_error(HttpStatus::BAD_REQUEST, parse_result.error());
                }
                return;
            }

            if (parse_result.value()) {
                handle_request();
            } else {
                do_read();
            }
        });
}

void HttpConnection::handle_request() {
    HttpRequest request = parser_.take_request();

    spdlog::debug("{} {} ({} body bytes)",
                  HttpMethodUtils::to_string(request.method), request.url, request.body.size());

    HttpResponse response;
    if (!handler_) {
        response = make_error_response(HttpStatus::SERVICE_UNAVAILABLE, "unavailable", "No handler installed");
    } else {
        try {
            response = handler_(request);
        } catch (const std::exception& e) {
            spdlog::error("Handler threw exception: {}", e.what());
            response = make_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "internal", "Internal server error");
        }
    }

    spdlog::info("{} {} -> {}", HttpMethodUtils::to_string(request.method), request.url, response.status_code);
    do_write(response);
}

void HttpConnection::do_write(const HttpResponse& response) {
    auto self = shared_from_this();

    HttpResponse outgoing = response;
    outgoing.set_header("Connection", "close");
    auto data_ptr = std::make_shared<std::vector<uint8_t>>(outgoing.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data_ptr),
        [this, self, data_ptr](boost::system::error_code ec, size_t bytes_transferred) {
            if (!ec) {
                spdlog::debug("Sent {} bytes", bytes_transferred);
                boost::system::error_code shutdown_ec;
                socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
            } else if (ec != asio::error::operation_aborted) {
                spdlog::debug("Write error: {}", ec.message());
            }
        });
}

void HttpConnection::handle_error(HttpStatus status, const std::string& message) {
    spdlog::warn("Rejecting request: {}", message);
    const std::string kind = status == HttpStatus::PAYLOAD_TOO_LARGE ? "request_too_large" : "bad_request";
    do_write(make_error_response(status, kind, message));
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context,
                               const std::string& address,
                               uint16_t port,
                               size_t max_body_bytes)
    : io_context_(io_context)
    , acceptor_(io_context)
    , max_body_bytes_(max_body_bytes)
    , port_(port) {
    const tcp::endpoint endpoint(asio::ip::make_address(address), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::start() {
    spdlog::info("HTTP server listening on {}:{}", acceptor_.local_endpoint().address().to_string(), port_);
    do_accept();
}

void HttpServerAsio::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    // Close on the io_context so it never races a pending async_accept.
    asio::post(io_context_, [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (ec) {
            spdlog::warn("Closing acceptor: {}", ec.message());
        }
    });
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || stopped_) {
                return;
            }
            if (!ec) {
                std::make_shared<HttpConnection>(std::move(socket), handler_, max_body_bytes_)->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }
            do_accept();
        });
}

} // namespace network
} // namespace guestdrop
