#pragma once

#include "edgexfer/network/http_parser.hpp"
#include "edgexfer/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <functional>
#include <memory>

namespace edgexfer::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Async I/O for one accepted connection
 *
 * Reads until the parser has a full request, hands it to the handler,
 * writes the response and closes. The shared_ptr captured by each pending
 * operation keeps the connection alive.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t max_body_size);

    void start();

private:
    void do_read();
    void do_write(const HttpResponse& response);
    void handle_error(HttpStatus status, const std::string& message);

    static HttpResponse create_error_response(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 64 * 1024> buffer_;
};

/**
 * @brief Event-driven HTTP server on a Boost.Asio io_context
 *
 * Accepts on construction. The handler is invoked on whichever thread runs
 * the io_context, so several threads may call it concurrently.
 *
 * @code
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, 8080);
 * server.set_handler([&router](const HttpRequest& req) { return router.handle_request(req); });
 * io_context.run();
 * @endcode
 */
class HttpServerAsio {
public:
    /// Port 0 binds an ephemeral port; get_port() reports the bound one.
    HttpServerAsio(asio::io_context& io_context, uint16_t port,
                   std::size_t max_body_size = HttpParser::kDefaultMaxBodySize);

    void set_handler(HttpRequestHandler handler);

    /// Stops accepting; in-flight connections finish on their own.
    void stop();

    uint16_t get_port() const { return port_; }

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    std::size_t max_body_size_;
    uint16_t port_;
};

} // namespace edgexfer::network
