#include "vidup/network/http_server_asio.hpp"
#include "vidup/network/http_router.hpp"
#include <spdlog/spdlog.h>

namespace vidup::network {

// ──────────────────────────────────────────────────────────
// HttpConnection
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t max_body_size)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , parser_(max_body_size) {
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
                handle_error("Parse error: " + parse_result.error());
                return;
            }
            if (!parse_result.value()) {
                do_read();
                return;
            }

            HttpRequest request = parser_.take_request();
            spdlog::debug("{} {} ({} body bytes)",
                          HttpMethodUtils::to_string(request.method),
                          request.url, request.body.size());

            HttpResponse response;
            if (!handler_) {
                response = error_response(HttpStatus::SERVICE_UNAVAILABLE, "No handler installed");
            } else {
                try {
                    response = handler_(request);
                } catch (const std::exception& e) {
                    spdlog::error("Handler threw exception: {}", e.what());
                    response = error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Internal server error");
                }
            }
            do_write(response);
        });
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

void HttpConnection::handle_error(const std::string& message) {
    spdlog::warn("Connection error: {}", message);
    do_write(error_response(HttpStatus::BAD_REQUEST, message));
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context, uint16_t port, const std::string& address)
    : acceptor_(io_context)
    , port_(port) {
    tcp::endpoint endpoint(asio::ip::make_address(address), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();

    spdlog::info("HTTP server (Asio event-driven) listening on {}:{}", address, port_);
    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("Error closing acceptor: {}", ec.message());
    }
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }
            if (!ec) {
                std::make_shared<HttpConnection>(std::move(socket), handler_, max_body_size_)->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }
            do_accept();
        });
}

} // namespace vidup::network
