#pragma once

#include "rus/core/error.hpp"
#include "rus/network/http_router.hpp"
#include "rus/network/http_types.hpp"
#include "rus/upload/service.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rus::server {

inline constexpr const char* kTusVersion = "1.0.0";
inline constexpr const char* kTusExtensions =
    "creation,creation-defer-length,creation-with-upload,termination,concatenation,checksum,expiration";

struct HandlerOptions {
    std::string base_path{"/files"};
    std::uint64_t max_size{0};           ///< Advertised as Tus-Max-Size when non-zero
};

/**
 * @brief tus 1.0.0 protocol handler
 *
 * Turns HTTP requests into UploadService calls and their results back into
 * responses. Owns no upload state; every decision about offsets, lengths
 * and checksums is made by the service.
 *
 * Routes (under base_path, default /files):
 *   OPTIONS /files, /files/:id   capability discovery
 *   POST    /files               create, or concatenate with Upload-Concat: final
 *   HEAD    /files/:id           offset / length / metadata
 *   PATCH   /files/:id           append a chunk
 *   DELETE  /files/:id           terminate
 *   GET     /files/:id           download a complete upload
 *
 * Every response carries Tus-Resumable.
 */
class TusHandler {
public:
    TusHandler(upload::UploadService& service, HandlerOptions options = {});

    TusHandler(const TusHandler&) = delete;
    TusHandler& operator=(const TusHandler&) = delete;

    network::HttpResponse handle(const network::HttpRequest& request) const;

    const network::HttpRouter& router() const { return router_; }

private:
    void register_routes();

    network::HttpResponse handle_options(const network::HttpContext& ctx) const;
    network::HttpResponse handle_create(const network::HttpContext& ctx) const;
    network::HttpResponse handle_concatenate(const network::HttpContext& ctx,
                                             const std::string& concat_header,
                                             upload::Metadata metadata) const;
    network::HttpResponse handle_status(const network::HttpContext& ctx) const;
    network::HttpResponse handle_append(const network::HttpContext& ctx) const;
    network::HttpResponse handle_terminate(const network::HttpContext& ctx) const;
    network::HttpResponse handle_download(const network::HttpContext& ctx) const;

    network::HttpResponse error_response(const Error& error) const;

    std::string upload_url(const network::HttpRequest& request, const std::string& id) const;

    /**
     * @brief Upload id named by an absolute or relative upload URL
     */
    std::optional<std::string> id_from_url(const std::string& url) const;

    upload::UploadService& service_;
    HandlerOptions options_;
    network::HttpRouter router_;
};

/**
 * @brief HTTP status for a failed upload operation
 */
network::HttpStatus status_for(ErrorKind kind);

/**
 * @brief RFC 7231 IMF-fixdate, as used by Upload-Expires
 */
std::string format_http_date(upload::Clock::time_point time);

} // namespace rus::server
