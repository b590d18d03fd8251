#include "rus/network/http_server_asio.hpp"

#include <spdlog/spdlog.h>

namespace rus {
namespace network {

// ──────────────────────────────────────────────────────────
// HttpConnection Implementation
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket,
                               HttpRequestHandler handler,
                               ParserLimits limits,
                               std::shared_ptr<const DefaultHeaders> default_headers)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , default_headers_(std::move(default_headers))
    , parser_(limits) {
}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();  // Keep connection alive during async operation

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (!ec) {
                process(buffer_.data(), bytes_transferred);
            } else if (ec == asio::error::eof) {
                if (!parser_.is_complete() && pending_.empty()) {
                    spdlog::debug("Peer closed connection");
                }
            } else if (ec != asio::error::operation_aborted) {
                // Includes resets in the middle of a chunk: nothing was handed
                // to the handler, so nothing was committed
                spdlog::debug("Read error: {}", ec.message());
            }
        }
    );
}

void HttpConnection::process(const char* data, std::size_t len) {
    auto parse_result = parser_.parse(data, len);

    if (parse_result.is_error()) {
        handle_error(parse_result.error());
        return;
    }

    if (!parse_result.value()) {
        do_read();
        return;
    }

    // Remember bytes that belong to the next pipelined request
    const std::size_t used = parser_.consumed();
    if (used < len) {
        pending_.assign(data + used, len - used);
    }

    dispatch(parser_.get_request());
}

void HttpConnection::dispatch(const HttpRequest& request) {
    spdlog::debug("{} {} HTTP/{} body={}B",
        HttpMethodUtils::to_string(request.method),
        request.url,
        request.version == HttpVersion::HTTP_1_1 ? "1.1" : "1.0",
        request.body.size());

    HttpResponse response;
    try {
        response = handler_(request);
    } catch (const std::exception& e) {
        spdlog::error("Handler threw exception: {}", e.what());
        response = create_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Internal server error");
    }

    const bool keep_alive = request.keep_alive() && !response.has_header("Connection");
    if (!keep_alive) {
        response.set_header("Connection", "close");
    }
    response.version = request.version;

    do_write(std::move(response), keep_alive);
}

void HttpConnection::do_write(HttpResponse response, bool keep_alive) {
    auto self = shared_from_this();

    if (default_headers_) {
        for (const auto& [name, value] : *default_headers_) {
            if (!response.has_header(name)) {
                response.set_header(name, value);
            }
        }
    }

    // Store data in shared_ptr so it stays alive during async operation
    auto data_ptr = std::make_shared<std::vector<uint8_t>>(response.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data_ptr),
        [this, self, data_ptr, keep_alive](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Write error: {}", ec.message());
                }
                return;
            }

            spdlog::trace("Sent {} bytes", bytes_transferred);

            if (!keep_alive) {
                boost::system::error_code shutdown_ec;
                socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
                return;
            }

            parser_.reset();
            if (!pending_.empty()) {
                std::string next;
                next.swap(pending_);
                process(next.data(), next.size());
            } else {
                do_read();
            }
        }
    );
}

void HttpConnection::handle_error(const Error& error) {
    spdlog::warn("Rejecting request: {}", error.message);

    const auto status = error.kind == ErrorKind::TooLarge
        ? HttpStatus::PAYLOAD_TOO_LARGE
        : HttpStatus::BAD_REQUEST;

    // The stream position is unknown after a parse error, so close afterwards
    pending_.clear();
    do_write(create_error_response(status, error.message), false);
}

HttpResponse HttpConnection::create_error_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_body(message);
    response.set_header("Content-Type", "text/plain");
    response.set_header("Connection", "close");
    return response;
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio Implementation
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context,
                               const std::string& address,
                               uint16_t port,
                               ParserLimits limits)
    : acceptor_(io_context, tcp::endpoint(asio::ip::make_address(address), port))
    , io_context_(io_context)
    , limits_(limits)
    , port_(acceptor_.local_endpoint().port()) {

    spdlog::info("HTTP server (Asio event-driven) listening on {}:{}", address, port_);

    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::set_default_headers(DefaultHeaders headers) {
    default_headers_ = std::make_shared<const DefaultHeaders>(std::move(headers));
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
            if (ec == asio::error::operation_aborted) {
                spdlog::debug("Acceptor closed");
                return;
            }

            if (!ec) {
                spdlog::debug("Accepted new connection from {}",
                              socket.remote_endpoint(ec).address().to_string());
                std::make_shared<HttpConnection>(std::move(socket), handler_, limits_, default_headers_)->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }

            do_accept();
        }
    );
}

} // namespace network
} // namespace rus
