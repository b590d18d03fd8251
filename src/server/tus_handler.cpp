#include "rus/server/tus_handler.hpp"

#include "rus/upload/checksum.hpp"
#include "rus/upload/metadata_header.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <ctime>
#include <sstream>

#include <strings.h>

namespace rus::server {

using network::HttpContext;
using network::HttpMethod;
using network::HttpMethodUtils;
using network::HttpRequest;
using network::HttpResponse;
using network::HttpStatus;

namespace {

constexpr const char* kOffsetOctetStream = "application/offset+octet-stream";

/**
 * @brief Strict non-negative decimal, no sign, no whitespace, no overflow
 */
std::optional<std::uint64_t> parse_u64(const std::string& text) {
    if (text.empty() || text.size() > 20) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        const std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

bool is_offset_octet_stream(const std::string& content_type) {
    const auto semicolon = content_type.find(';');
    std::string media = content_type.substr(0, semicolon);
    while (!media.empty() && (media.back() == ' ' || media.back() == '\t')) {
        media.pop_back();
    }
    return strcasecmp(media.c_str(), kOffsetOctetStream) == 0;
}

HttpResponse text_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_header("Content-Type", "text/plain");
    response.set_body(message);
    return response;
}

void set_expires(HttpResponse& response, const std::optional<upload::Clock::time_point>& expires_at) {
    if (expires_at) {
        response.set_header("Upload-Expires", format_http_date(*expires_at));
    }
}

} // namespace

// ────────────────────────────────────────────────────────────
// Free helpers
// ────────────────────────────────────────────────────────────

HttpStatus status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Malformed:
        case ErrorKind::InvalidLength:
        case ErrorKind::LengthRequired:
        case ErrorKind::LengthImmutable:
        case ErrorKind::UnsupportedChecksum:
        case ErrorKind::IncompleteParent:
        case ErrorKind::InvalidConcatenation:
        case ErrorKind::Incomplete:
            return HttpStatus::BAD_REQUEST;
        case ErrorKind::FinalUploadImmutable:
        case ErrorKind::AlreadyComplete:
            return HttpStatus::FORBIDDEN;
        case ErrorKind::NotFound:
            return HttpStatus::NOT_FOUND;
        case ErrorKind::Conflict:
            return HttpStatus::CONFLICT;
        case ErrorKind::ExceedsLength:
        case ErrorKind::TooLarge:
            return HttpStatus::PAYLOAD_TOO_LARGE;
        case ErrorKind::UnsupportedMediaType:
            return HttpStatus::UNSUPPORTED_MEDIA_TYPE;
        case ErrorKind::VersionMismatch:
            return HttpStatus::PRECONDITION_FAILED;
        case ErrorKind::ChecksumMismatch:
            return HttpStatus::CHECKSUM_MISMATCH;
        case ErrorKind::StorageUnavailable:
            return HttpStatus::SERVICE_UNAVAILABLE;
        case ErrorKind::StorageFull:
            return HttpStatus::INSUFFICIENT_STORAGE;
        case ErrorKind::InvalidOffset:
        case ErrorKind::Corrupted:
        case ErrorKind::Internal:
            return HttpStatus::INTERNAL_SERVER_ERROR;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

std::string format_http_date(upload::Clock::time_point time) {
    const std::time_t t = upload::Clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buffer[64];
    const auto len = std::strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return std::string(buffer, len);
}

// ────────────────────────────────────────────────────────────
// TusHandler
// ────────────────────────────────────────────────────────────

TusHandler::TusHandler(upload::UploadService& service, HandlerOptions options)
    : service_(service)
    , options_(std::move(options)) {
    register_routes();
}

HttpResponse TusHandler::handle(const HttpRequest& request) const {
    HttpResponse response;

    // Clients behind proxies that only pass GET/POST tunnel the real method
    const auto override_method = request.find_header("X-HTTP-Method-Override");
    if (override_method) {
        HttpRequest rewritten = request;
        rewritten.method = HttpMethodUtils::from_string(*override_method);
        response = router_.handle_request(rewritten);
    } else {
        response = router_.handle_request(request);
    }

    response.set_header("Tus-Resumable", kTusVersion);

    // Only a HEAD on the wire goes without a body; an overridden POST still
    // sends the bytes its Content-Length announces
    if (request.method == HttpMethod::HEAD) {
        response.body.clear();
    }
    return response;
}

void TusHandler::register_routes() {
    const std::string& base = options_.base_path;
    const std::string item = base + "/:id";

    router_.use([](const HttpContext& ctx, HttpResponse&) {
        spdlog::info("{} {}", HttpMethodUtils::to_string(ctx.request.method), ctx.request.url);
        return true;
    });

    router_.use([](const HttpContext& ctx, HttpResponse& response) {
        const auto method = ctx.request.method;
        if (method == HttpMethod::OPTIONS || method == HttpMethod::GET) {
            return true;
        }
        if (ctx.request.get_header("Tus-Resumable") == kTusVersion) {
            return true;
        }
        response = text_response(HttpStatus::PRECONDITION_FAILED,
            "Unsupported or missing Tus-Resumable, this server speaks " + std::string(kTusVersion));
        response.set_header("Tus-Version", kTusVersion);
        return false;
    });

    router_.options(base, [this](const HttpContext& ctx) { return handle_options(ctx); });
    router_.options(item, [this](const HttpContext& ctx) { return handle_options(ctx); });
    router_.post(base, [this](const HttpContext& ctx) { return handle_create(ctx); });
    router_.head(item, [this](const HttpContext& ctx) { return handle_status(ctx); });
    router_.patch(item, [this](const HttpContext& ctx) { return handle_append(ctx); });
    router_.delete_(item, [this](const HttpContext& ctx) { return handle_terminate(ctx); });
    router_.get(item, [this](const HttpContext& ctx) { return handle_download(ctx); });
}

HttpResponse TusHandler::handle_options(const HttpContext&) const {
    HttpResponse response(HttpStatus::NO_CONTENT);
    response.set_header("Tus-Version", kTusVersion);
    response.set_header("Tus-Extension", kTusExtensions);
    if (options_.max_size > 0) {
        response.set_header("Tus-Max-Size", std::to_string(options_.max_size));
    }

    std::string algorithms;
    for (const auto& algorithm : upload::supported_algorithms()) {
        if (!algorithms.empty()) {
            algorithms += ',';
        }
        algorithms += algorithm;
    }
    response.set_header("Tus-Checksum-Algorithm", algorithms);
    return response;
}

HttpResponse TusHandler::handle_create(const HttpContext& ctx) const {
    const HttpRequest& request = ctx.request;

    auto metadata = upload::parse_metadata_header(request.get_header("Upload-Metadata"));
    if (metadata.is_error()) {
        return error_response(metadata.error());
    }

    upload::CreateRequest create;
    create.metadata = std::move(metadata.value());

    if (const auto concat = request.find_header("Upload-Concat")) {
        if (concat->rfind("final;", 0) == 0) {
            return handle_concatenate(ctx, *concat, std::move(create.metadata));
        }
        if (*concat != "partial") {
            return error_response(Error(ErrorKind::Malformed, "Invalid Upload-Concat: " + *concat));
        }
        create.is_partial = true;
    }

    const auto length = request.find_header("Upload-Length");
    const auto defer = request.find_header("Upload-Defer-Length");

    if (length && defer) {
        return error_response(Error(ErrorKind::Malformed,
            "Upload-Length and Upload-Defer-Length are mutually exclusive"));
    }
    if (length) {
        create.total_length = parse_u64(*length);
        if (!create.total_length) {
            return error_response(Error(ErrorKind::Malformed, "Invalid Upload-Length: " + *length));
        }
    } else if (defer) {
        if (*defer != "1") {
            return error_response(Error(ErrorKind::Malformed, "Upload-Defer-Length must be 1"));
        }
    } else {
        return error_response(Error(ErrorKind::Malformed,
            "Upload-Length or Upload-Defer-Length: 1 is required"));
    }

    if (!request.body.empty()) {
        if (!is_offset_octet_stream(request.get_header("Content-Type"))) {
            return error_response(Error(ErrorKind::UnsupportedMediaType,
                std::string("Initial data requires Content-Type: ") + kOffsetOctetStream));
        }
        if (const auto checksum = request.find_header("Upload-Checksum")) {
            auto parsed = upload::parse_checksum_header(*checksum);
            if (parsed.is_error()) {
                return error_response(parsed.error());
            }
            create.checksum = std::move(parsed.value());
        }
        create.initial_bytes = request.body;
    }

    const bool with_body = create.initial_bytes.has_value();
    auto outcome = service_.create(std::move(create));
    if (outcome.is_error()) {
        return error_response(outcome.error());
    }

    const auto& created = outcome.value().upload;
    HttpResponse response(HttpStatus::CREATED);
    response.set_header("Location", upload_url(request, created.id));
    set_expires(response, created.expires_at);
    if (with_body) {
        response.set_header("Upload-Offset", std::to_string(created.offset));
    }
    return response;
}

HttpResponse TusHandler::handle_concatenate(const HttpContext& ctx,
                                            const std::string& concat_header,
                                            upload::Metadata metadata) const {
    const HttpRequest& request = ctx.request;

    if (request.has_header("Upload-Length") || request.has_header("Upload-Defer-Length")) {
        return error_response(Error(ErrorKind::Malformed,
            "A final upload takes its length from the partial uploads"));
    }

    std::vector<std::string> parent_ids;
    std::istringstream urls(concat_header.substr(std::string("final;").size()));
    std::string url;
    while (urls >> url) {
        auto id = id_from_url(url);
        if (!id) {
            return error_response(Error(ErrorKind::InvalidConcatenation,
                "Not an upload of this server: " + url));
        }
        parent_ids.push_back(*id);
    }

    auto final_upload = service_.concatenate(parent_ids, std::move(metadata));
    if (final_upload.is_error()) {
        return error_response(final_upload.error());
    }

    HttpResponse response(HttpStatus::CREATED);
    response.set_header("Location", upload_url(request, final_upload.value().id));
    set_expires(response, final_upload.value().expires_at);
    return response;
}

HttpResponse TusHandler::handle_status(const HttpContext& ctx) const {
    auto status = service_.status(ctx.get_param("id"));
    if (status.is_error()) {
        auto response = error_response(status.error());
        response.set_header("Cache-Control", "no-store");
        return response;
    }

    const auto& s = status.value();
    HttpResponse response(HttpStatus::OK);
    response.set_header("Cache-Control", "no-store");
    response.set_header("Upload-Offset", std::to_string(s.offset));

    if (s.total_length) {
        response.set_header("Upload-Length", std::to_string(*s.total_length));
    } else {
        response.set_header("Upload-Defer-Length", "1");
    }

    if (!s.metadata.empty()) {
        response.set_header("Upload-Metadata", upload::format_metadata_header(s.metadata));
    }

    if (s.is_partial) {
        response.set_header("Upload-Concat", "partial");
    } else if (s.is_final) {
        std::string value = "final;";
        for (std::size_t i = 0; i < s.parent_ids.size(); ++i) {
            if (i > 0) {
                value += ' ';
            }
            value += options_.base_path + "/" + s.parent_ids[i];
        }
        response.set_header("Upload-Concat", value);
    }

    set_expires(response, s.expires_at);
    return response;
}

HttpResponse TusHandler::handle_append(const HttpContext& ctx) const {
    const HttpRequest& request = ctx.request;

    if (!is_offset_octet_stream(request.get_header("Content-Type"))) {
        return error_response(Error(ErrorKind::UnsupportedMediaType,
            std::string("PATCH requires Content-Type: ") + kOffsetOctetStream));
    }

    upload::AppendRequest append;
    append.id = ctx.get_param("id");

    const auto offset_header = request.find_header("Upload-Offset");
    const auto offset = offset_header ? parse_u64(*offset_header) : std::nullopt;
    if (!offset) {
        return error_response(Error(ErrorKind::Malformed, "Missing or invalid Upload-Offset"));
    }
    append.expected_offset = *offset;

    if (const auto length = request.find_header("Upload-Length")) {
        append.declared_length = parse_u64(*length);
        if (!append.declared_length) {
            return error_response(Error(ErrorKind::Malformed, "Invalid Upload-Length: " + *length));
        }
    }

    if (const auto checksum = request.find_header("Upload-Checksum")) {
        auto parsed = upload::parse_checksum_header(*checksum);
        if (parsed.is_error()) {
            return error_response(parsed.error());
        }
        append.checksum = std::move(parsed.value());
    }

    append.bytes = request.body;

    auto appended = service_.append(append);
    if (appended.is_error()) {
        return error_response(appended.error());
    }

    HttpResponse response(HttpStatus::NO_CONTENT);
    response.set_header("Upload-Offset", std::to_string(appended.value().offset));
    set_expires(response, appended.value().expires_at);
    return response;
}

HttpResponse TusHandler::handle_terminate(const HttpContext& ctx) const {
    if (auto res = service_.terminate(ctx.get_param("id")); res.is_error()) {
        return error_response(res.error());
    }
    return HttpResponse(HttpStatus::NO_CONTENT);
}

HttpResponse TusHandler::handle_download(const HttpContext& ctx) const {
    auto bytes = service_.read(ctx.get_param("id"));
    if (bytes.is_error()) {
        return error_response(bytes.error());
    }

    HttpResponse response(HttpStatus::OK);
    response.set_header("Content-Type", "application/octet-stream");
    response.set_body(std::move(bytes.value()));
    return response;
}

HttpResponse TusHandler::error_response(const Error& error) const {
    const HttpStatus status = status_for(error.kind);

    if (static_cast<int>(status) >= 500) {
        spdlog::error("Request failed ({}): {}", to_string(error.kind), error.message);
    } else {
        spdlog::debug("Request rejected ({}): {}", to_string(error.kind), error.message);
    }

    auto response = text_response(status, error.message);

    // Tell the client where to resume
    if (error.offset) {
        response.set_header("Upload-Offset", std::to_string(*error.offset));
    }
    if (error.length) {
        response.set_header("Upload-Length", std::to_string(*error.length));
    }
    return response;
}

std::string TusHandler::upload_url(const HttpRequest& request, const std::string& id) const {
    const std::string path = options_.base_path + "/" + id;
    const auto host = request.find_header("Host");
    if (!host || host->empty()) {
        return path;
    }

    std::string scheme = request.get_header("X-Forwarded-Proto");
    if (scheme != "https") {
        scheme = "http";
    }
    return scheme + "://" + *host + path;
}

std::optional<std::string> TusHandler::id_from_url(const std::string& url) const {
    std::string path = url;

    const auto scheme_end = url.find("://");
    if (scheme_end != std::string::npos) {
        const auto path_start = url.find('/', scheme_end + 3);
        if (path_start == std::string::npos) {
            return std::nullopt;
        }
        path = url.substr(path_start);
    }

    const std::string prefix = options_.base_path + "/";
    if (path.size() <= prefix.size() || path.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    std::string id = path.substr(prefix.size());
    if (id.find('/') != std::string::npos) {
        return std::nullopt;
    }
    return id;
}

} // namespace rus::server
