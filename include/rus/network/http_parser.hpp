#pragma once

#include "http_types.hpp"
#include "rus/core/result.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>

#include <strings.h>

namespace rus {
namespace network {

/**
 * @brief State machine states for HTTP request parsing
 *
 * METHOD SP URL SP VERSION CRLF    <- Request line
 * Header-Name: Header-Value CRLF   <- Headers (multiple)
 * CRLF                             <- Empty line
 * [Body]                           <- Content-Length bytes
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Size limits enforced while parsing
 *
 * The body limit bounds how much of an upload chunk is buffered in memory
 * before the request reaches the handler.
 */
struct ParserLimits {
    std::size_t max_header_bytes = 16 * 1024;
    std::size_t max_body_bytes = 64 * 1024 * 1024;
};

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * Data can be fed in arbitrary pieces as it comes off the socket. parse()
 * stops at the end of the first complete request; consumed() then tells how
 * many bytes of the last buffer belonged to it, so that pipelined bytes can
 * be fed to the next request after reset().
 *
 * Errors carry ErrorKind::TooLarge when a limit is exceeded and
 * ErrorKind::Malformed otherwise.
 *
 * Usage:
 * ```cpp
 * HttpParser parser;
 * auto result = parser.parse(data, len);
 * if (result.is_ok() && result.value()) {
 *     HttpRequest request = parser.get_request();
 * }
 * ```
 */
class HttpParser {
public:
    explicit HttpParser(ParserLimits limits = {}) : limits_(limits) { reset(); }

    /**
     * @brief Feed bytes to the parser
     *
     * @return true once a whole request has been parsed, false if more data
     *         is needed
     */
    Result<bool> parse(const char* data, size_t len) {
        consumed_ = 0;

        if (state_ == ParseState::COMPLETE) {
            return Ok(true);
        }
        if (state_ == ParseState::PARSE_ERROR) {
            return fail<bool>(ErrorKind::Malformed, "Parser in error state");
        }

        size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::BODY) {
                // Bulk copy: the body is usually the bulk of an upload request
                const size_t wanted = expected_body_length_ - request_.body.size();
                const size_t take = std::min(wanted, len - i);
                request_.body.insert(request_.body.end(),
                                     reinterpret_cast<const uint8_t*>(data + i),
                                     reinterpret_cast<const uint8_t*>(data + i + take));
                i += take;
                if (request_.body.size() == expected_body_length_) {
                    state_ = ParseState::COMPLETE;
                }
            } else {
                const char c = data[i++];
                if (++header_bytes_ > limits_.max_header_bytes) {
                    return fail_with(ErrorKind::TooLarge, "Request header section too large");
                }
                if (c == '\n') {
                    line_++;
                }

                bool ok = true;
                switch (state_) {
                    case ParseState::METHOD: ok = parse_method(c); break;
                    case ParseState::URL: ok = parse_url(c); break;
                    case ParseState::VERSION: ok = parse_version(c); break;
                    case ParseState::HEADER_NAME: ok = parse_header_name(c); break;
                    case ParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                    default: break;
                }
                if (!ok) {
                    return fail_with(error_kind_, error_message_.empty()
                        ? "Malformed request at line " + std::to_string(line_)
                        : error_message_);
                }
            }

            if (state_ == ParseState::COMPLETE) {
                consumed_ = i;
                return Ok(true);
            }
        }

        consumed_ = len;
        return Ok(false);
    }

    /**
     * @brief Bytes of the last parse() input that belonged to this request
     */
    size_t consumed() const { return consumed_; }

    const HttpRequest& get_request() const { return request_; }

    HttpRequest take_request() { return std::move(request_); }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        expected_body_length_ = 0;
        header_bytes_ = 0;
        consumed_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
        error_kind_ = ErrorKind::Malformed;
        error_message_.clear();
    }

private:
    ParserLimits limits_;
    ParseState state_;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    size_t expected_body_length_;
    size_t header_bytes_;
    size_t consumed_;
    size_t line_;
    bool last_char_was_cr_;
    ErrorKind error_kind_;
    std::string error_message_;

    Result<bool> fail_with(ErrorKind kind, std::string message) {
        state_ = ParseState::PARSE_ERROR;
        return fail<bool>(kind, std::move(message));
    }

    bool reject(ErrorKind kind, std::string message) {
        error_kind_ = kind;
        error_message_ = std::move(message);
        return false;
    }

    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return reject(ErrorKind::Malformed, "Unsupported HTTP method: " + buffer_);
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }

        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.url = buffer_;
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }

        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                return reject(ErrorKind::Malformed, "Unsupported HTTP version: " + buffer_);
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return finish_headers();
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        // Skip leading whitespace after colon
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }

        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            request_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    /**
     * @brief Empty line seen: decide whether a body follows
     *
     * Only Content-Length framed bodies are accepted. Upload clients send one
     * chunk per request with a known size, so chunked transfer coding is
     * refused rather than decoded.
     */
    bool finish_headers() {
        if (request_.has_header("Transfer-Encoding")) {
            return reject(ErrorKind::Malformed, "Transfer-Encoding is not supported, send Content-Length");
        }

        const auto content_length = request_.find_header("Content-Length");
        if (!content_length) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        if (content_length->empty() ||
            !std::all_of(content_length->begin(), content_length->end(),
                         [](unsigned char ch) { return std::isdigit(ch) != 0; }) ||
            content_length->size() > 19) {
            return reject(ErrorKind::Malformed, "Invalid Content-Length: " + *content_length);
        }

        const auto body_length = std::stoull(*content_length);
        if (body_length > limits_.max_body_bytes) {
            return reject(ErrorKind::TooLarge,
                          "Request body of " + *content_length + " bytes exceeds limit of " +
                          std::to_string(limits_.max_body_bytes));
        }

        if (body_length == 0) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        expected_body_length_ = static_cast<size_t>(body_length);
        request_.body.reserve(expected_body_length_);
        state_ = ParseState::BODY;
        return true;
    }
};

} // namespace network
} // namespace rus
