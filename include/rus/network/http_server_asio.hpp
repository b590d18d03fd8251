#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "http_parser.hpp"
#include "http_types.hpp"
#include "rus/core/result.hpp"

#include <array>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace rus {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/// Headers stamped on every response that does not already carry them
using DefaultHeaders = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Per-connection handler for async HTTP requests
 *
 * Each accepted connection gets its own HttpConnection object that manages
 * the async I/O for that connection. Uses enable_shared_from_this to keep
 * the connection alive while async operations are pending.
 *
 * Lifecycle:
 * 1. Created when connection is accepted
 * 2. start() begins async read operation
 * 3. Once a full request (headers + body) is buffered the handler runs
 * 4. With keep-alive the parser is reset and reading resumes, any pipelined
 *    bytes already received are fed to the next request first
 * 5. Destroyed when the peer closes, an error occurs, or Connection: close
 *
 * A request whose body never fully arrives never reaches the handler.
 * Responses the connection produces itself (parse errors, handler
 * exceptions) still get the default headers.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket,
                   HttpRequestHandler handler,
                   ParserLimits limits,
                   std::shared_ptr<const DefaultHeaders> default_headers = nullptr);

    void start();

private:
    void do_read();

    /**
     * @brief Run bytes through the parser, dispatching a request when complete
     */
    void process(const char* data, std::size_t len);

    void dispatch(const HttpRequest& request);

    void do_write(HttpResponse response, bool keep_alive);

    void handle_error(const Error& error);

    static HttpResponse create_error_response(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    std::shared_ptr<const DefaultHeaders> default_headers_;
    HttpParser parser_;
    std::array<char, 64 * 1024> buffer_;
    std::string pending_;                   // Pipelined bytes of the next request
};

/**
 * @brief Event-driven HTTP server using Boost.Asio
 *
 * Thread safety:
 * - io_context.run() may be called from several threads; connections are
 *   independent so handlers for different connections run concurrently
 * - The request handler must therefore be thread-safe
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, "0.0.0.0", 1080);
 * server.set_handler([&](const HttpRequest& req) { return tus.handle(req); });
 * io_context.run();
 * ```
 */
class HttpServerAsio {
public:
    /**
     * @param io_context Event loop (must outlive this server)
     * @param address    Local address to bind
     * @param port       Port to listen on, 0 picks a free one
     * @param limits     Parser limits applied to every connection
     */
    HttpServerAsio(asio::io_context& io_context,
                   const std::string& address,
                   uint16_t port,
                   ParserLimits limits = {});

    void set_handler(HttpRequestHandler handler);

    /**
     * @brief Headers added to every response, including transport errors
     *
     * Applies to connections accepted afterwards; call before running.
     */
    void set_default_headers(DefaultHeaders headers);

    /**
     * @brief Stop accepting new connections
     *
     * Connections already open finish their current request.
     */
    void stop();

    /**
     * @brief Port actually bound (useful when constructed with port 0)
     */
    uint16_t get_port() const { return port_; }

private:
    void do_accept();

    tcp::acceptor acceptor_;
    asio::io_context& io_context_;
    HttpRequestHandler handler_;
    std::shared_ptr<const DefaultHeaders> default_headers_;
    ParserLimits limits_;
    uint16_t port_;
};

} // namespace network
} // namespace rus
