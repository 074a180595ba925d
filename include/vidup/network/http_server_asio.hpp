#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>
#include "vidup/network/http_parser.hpp"
#include "vidup/network/http_types.hpp"
#include <array>
#include <functional>
#include <memory>
#include <string>

namespace vidup::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Per-connection state for one request/response exchange
 *
 * Lifecycle:
 * 1. Created when a connection is accepted
 * 2. start() begins the async read chain
 * 3. Once the parser reports a complete request the handler runs and the
 *    response is written
 * 4. The socket is shut down and the object is released with the last
 *    pending callback
 *
 * Learning note: every callback captures shared_from_this(), which keeps
 * the connection alive exactly as long as an operation is pending.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t max_body_size);

    void start();

private:
    void do_read();
    void do_write(const HttpResponse& response);
    void handle_error(const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 64 * 1024> buffer_;
};

/**
 * @brief Event-driven HTTP server using Boost.Asio
 *
 * One io_context drives all connections; handlers run on whichever thread
 * calls io_context.run(). Port 0 binds an ephemeral port, which
 * get_port() then reports.
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, 8080);
 * server.set_handler([&router](const HttpRequest& req) {
 *     return router.handle_request(req);
 * });
 * io_context.run();
 * ```
 */
class HttpServerAsio {
public:
    /**
     * @param io_context Event loop (must outlive this server)
     * @param port Port to listen on, 0 for any free port
     * @param address Local address to bind
     */
    HttpServerAsio(asio::io_context& io_context, uint16_t port,
                   const std::string& address = "0.0.0.0");

    void set_handler(HttpRequestHandler handler);

    /// Requests with a larger Content-Length are rejected with 400
    void set_max_body_size(std::size_t bytes) { max_body_size_ = bytes; }

    uint16_t get_port() const { return port_; }

    /// Stop accepting; connections already in progress finish normally
    void stop();

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    std::size_t max_body_size_ = kDefaultMaxBodySize;
    uint16_t port_;
};

} // namespace vidup::network
