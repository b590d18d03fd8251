#pragma once

#include <cstdint>
#include <cstring>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <strings.h>

namespace rus {
namespace network {

/**
 * @brief HTTP request methods understood by the server
 *
 * PATCH is what tus uses to append bytes to an upload; everything else
 * follows RFC 7231.
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    PATCH,
    DELETE_METHOD,  // Renamed to avoid clashing with a common platform macro
    HEAD,
    OPTIONS,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,  // No keep-alive unless asked for
    HTTP_1_1,  // Keep-alive by default
    UNKNOWN
};

/**
 * @brief Status codes the server can emit
 *
 * 460 is not registered with IANA; tus uses it to report a checksum mismatch.
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    FORBIDDEN = 403,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    CONFLICT = 409,
    LENGTH_REQUIRED = 411,
    PRECONDITION_FAILED = 412,
    PAYLOAD_TOO_LARGE = 413,
    UNSUPPORTED_MEDIA_TYPE = 415,
    CHECKSUM_MISMATCH = 460,
    INTERNAL_SERVER_ERROR = 500,
    NOT_IMPLEMENTED = 501,
    SERVICE_UNAVAILABLE = 503,
    INSUFFICIENT_STORAGE = 507
};

/**
 * @brief Parsed HTTP request
 *
 * Header names are stored as received; lookups are case-insensitive per
 * RFC 7230. The body is binary (upload chunks), hence std::vector<uint8_t>.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;                                      // Request target, query string included
    HttpVersion version = HttpVersion::HTTP_1_1;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    /**
     * @brief Header value, empty string if absent
     */
    std::string get_header(const std::string& name) const {
        return find_header(name).value_or("");
    }

    /**
     * @brief Header value if the header was sent at all (possibly empty)
     */
    std::optional<std::string> find_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (strcasecmp(key.c_str(), name.c_str()) == 0) {
                return value;
            }
        }
        return std::nullopt;
    }

    bool has_header(const std::string& name) const {
        return find_header(name).has_value();
    }

    /**
     * @brief URL without the query string
     */
    std::string path() const {
        const auto pos = url.find('?');
        return pos == std::string::npos ? url : url.substr(0, pos);
    }

    /**
     * @brief Whether the connection should stay open after the response
     */
    bool keep_alive() const {
        const auto connection = find_header("Connection");
        if (version == HttpVersion::HTTP_1_1) {
            return !connection || strcasecmp(connection->c_str(), "close") != 0;
        }
        return connection && strcasecmp(connection->c_str(), "keep-alive") == 0;
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

/**
 * @brief HTTP response
 *
 * HTTP/1.1 200 OK\r\n
 * Header: value\r\n
 * \r\n
 * [body]
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_body(std::vector<uint8_t> data) {
        body = std::move(data);
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string get_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (strcasecmp(key.c_str(), name.c_str()) == 0) {
                return value;
            }
        }
        return "";
    }

    bool has_header(const std::string& name) const {
        for (const auto& entry : headers) {
            if (strcasecmp(entry.first.c_str(), name.c_str()) == 0) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Serialize to the HTTP wire format
     *
     * Adds Content-Length when the handler did not set one, except for
     * 204 responses which must not carry it.
     */
    std::vector<uint8_t> serialize() const {
        std::ostringstream oss;

        oss << version_to_string(version) << " "
            << status_code << " "
            << reason_phrase << "\r\n";

        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        if (status_code != static_cast<int>(HttpStatus::NO_CONTENT) && !has_header("Content-Length")) {
            oss << "Content-Length: " << body.size() << "\r\n";
        }

        oss << "\r\n";

        std::string header_str = oss.str();
        std::vector<uint8_t> result(header_str.begin(), header_str.end());
        result.insert(result.end(), body.begin(), body.end());

        return result;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::CREATED: return "Created";
            case HttpStatus::NO_CONTENT: return "No Content";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::FORBIDDEN: return "Forbidden";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::CONFLICT: return "Conflict";
            case HttpStatus::LENGTH_REQUIRED: return "Length Required";
            case HttpStatus::PRECONDITION_FAILED: return "Precondition Failed";
            case HttpStatus::PAYLOAD_TOO_LARGE: return "Payload Too Large";
            case HttpStatus::UNSUPPORTED_MEDIA_TYPE: return "Unsupported Media Type";
            case HttpStatus::CHECKSUM_MISMATCH: return "Checksum Mismatch";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::NOT_IMPLEMENTED: return "Not Implemented";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
            case HttpStatus::INSUFFICIENT_STORAGE: return "Insufficient Storage";
        }
        return "Unknown";
    }

    static std::string version_to_string(HttpVersion version) {
        switch (version) {
            case HttpVersion::HTTP_1_0: return "HTTP/1.0";
            case HttpVersion::HTTP_1_1: return "HTTP/1.1";
            default: return "HTTP/1.1";
        }
    }
};

/**
 * @brief Helper functions for HTTP method conversions
 */
class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "PATCH") return HttpMethod::PATCH;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        if (method_str == "OPTIONS") return HttpMethod::OPTIONS;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::PATCH: return "PATCH";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::OPTIONS: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }
};

} // namespace network
} // namespace rus
