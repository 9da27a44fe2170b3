#pragma once

#include "guestdrop/network/http_parser.hpp"
#include "guestdrop/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace guestdrop {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Per-connection state for one request/response exchange
 *
 * Lifecycle:
 * 1. Created when a connection is accepted
 * 2. start() begins the async read chain
 * 3. Once the parser has a full request the handler runs and the response
 *    is written
 * 4. The socket is shut down and the object dies with its last async op
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler, size_t max_body_bytes);

    void start();

private:
    void do_read();
    void do_write(const HttpResponse& response);
    void handle_request();
    void handle_error(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 64 * 1024> buffer_;
};

/// JSON `{"error": kind, "detail": message}` response; shared with the API layer.
HttpResponse make_error_response(HttpStatus status, const std::string& kind, const std::string& detail);

/**
 * @brief Event-driven HTTP server on Boost.Asio
 *
 * Thread safety:
 * - Call io_context.run() from as many threads as requests should be served
 *   concurrently; the handler is invoked on those threads and may block on
 *   disk I/O without stalling other connections' workers.
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, "0.0.0.0", 8000, limit);
 * server.set_handler([&router](const HttpRequest& req) { return router.handle_request(req); });
 * server.start();
 * io_context.run();
 * ```
 */
class HttpServerAsio {
public:
    /// Binds immediately; throws boost::system::system_error if the address is unusable.
    HttpServerAsio(asio::io_context& io_context,
                   const std::string& address,
                   uint16_t port,
                   size_t max_body_bytes = HttpParser::kDefaultMaxBodyBytes);

    void set_handler(HttpRequestHandler handler);

    void start();

    /// Stop accepting; in-flight connections finish on their own.
    void stop();

    /// Bound port; differs from the requested one when that was 0.
    uint16_t get_port() const { return port_; }

private:
    void do_accept();

    asio::io_context& io_context_;
    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    size_t max_body_bytes_;
    uint16_t port_;
    std::atomic<bool> stopped_{false};
};

} // namespace network
} // namespace guestdrop
