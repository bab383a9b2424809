#pragma once

#include "mip/network/http_parser.hpp"
#include "mip/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <functional>
#include <memory>
#include <string>

namespace mip {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/// Answers through the Responder, from any thread; the write is posted back to the connection
using HttpRequestHandler = std::function<void(const HttpRequest&, Responder)>;

/**
 * @brief One accepted connection: read a request, answer it, close
 *
 * Kept alive by the shared_ptr captured in each pending async operation.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler);

    void start();

private:
    void do_read();
    void do_write(const HttpResponse& response);
    void handle_error(const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 8192> buffer_;
};

/**
 * @brief Event-driven HTTP server on a caller-owned io_context
 *
 * The handler is called on whichever thread is inside io_context::run(), so
 * it must be thread-safe when the context is run from several threads. A
 * handler that blocks holds that thread; slow work belongs on another
 * executor, answering through the Responder when done.
 * Construction binds immediately and throws boost::system::system_error if
 * the address is unavailable.
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, "127.0.0.1", 8080);
 * server.set_handler([&router](const HttpRequest& req, Responder respond) {
 *     router.dispatch(req, std::move(respond));
 * });
 * io_context.run();
 * ```
 */
class HttpServerAsio {
public:
    HttpServerAsio(asio::io_context& io_context, const std::string& host, uint16_t port);

    void set_handler(HttpRequestHandler handler);

    /// Stop accepting; in-flight connections finish on their own
    void stop();

    /// Bound port (useful when constructed with port 0)
    uint16_t get_port() const { return port_; }

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    uint16_t port_;
};

} // namespace network
} // namespace mip
