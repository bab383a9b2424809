#include "mip/network/http_server_asio.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace mip {
namespace network {

namespace {

HttpResponse error_response(HttpStatus status, const std::string& message) {
    nlohmann::json body{{"success", false}, {"error", message}};
    HttpResponse response(status);
    response.set_body(body.dump());
    response.set_header("Content-Type", "application/json");
    return response;
}

} // namespace

// ──────────────────────────────────────────────────────────
// HttpConnection
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , parser_() {
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
                    spdlog::debug("[Http] read error: {}", ec.message());
                }
                return;
            }

            auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);
            if (parse_result.is_error()) {
                handle_error(parse_result.error());
                return;
            }
            if (!parse_result.value()) {
                do_read();
                return;
            }

            const HttpRequest& request = parser_.get_request();
            spdlog::info("[Http] {} {}", HttpMethodUtils::to_string(request.method), request.url);

            Responder respond = [self](HttpResponse response) {
                auto executor = self->socket_.get_executor();
                asio::post(executor, [self, response = std::move(response)]() { self->do_write(response); });
            };
            try {
                if (handler_) {
                    handler_(request, respond);
                } else {
                    respond(error_response(HttpStatus::SERVICE_UNAVAILABLE, "No handler installed"));
                }
            } catch (const std::exception& e) {
                spdlog::error("[Http] handler threw exception: {}", e.what());
                respond(error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Internal server error"));
            }
        });
}

void HttpConnection::do_write(const HttpResponse& response) {
    auto self = shared_from_this();

    HttpResponse outgoing = response;
    outgoing.set_header("Connection", "close");
    auto data = std::make_shared<std::vector<uint8_t>>(outgoing.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data),
        [this, self, data](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("[Http] write error: {}", ec.message());
                }
                return;
            }
            spdlog::debug("[Http] sent {} bytes", bytes_transferred);

            boost::system::error_code shutdown_ec;
            socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
        });
}

void HttpConnection::handle_error(const std::string& message) {
    spdlog::warn("[Http] bad request: {}", message);
    do_write(error_response(HttpStatus::BAD_REQUEST, message));
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context, const std::string& host, uint16_t port)
    : acceptor_(io_context, tcp::endpoint(asio::ip::make_address(host), port))
    , port_(acceptor_.local_endpoint().port()) {

    spdlog::info("[Http] listening on {}:{}", host, port_);
    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("[Http] acceptor close failed: {}", ec.message());
    }
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }
            if (!ec) {
                std::make_shared<HttpConnection>(std::move(socket), handler_)->start();
            } else {
                spdlog::error("[Http] accept error: {}", ec.message());
            }
            do_accept();
        });
}

} // namespace network
} // namespace mip
