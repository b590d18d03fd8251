#include "rus/server/tus_handler.hpp"

#include "rus/events/event_bus.hpp"
#include "rus/upload/memory_storage.hpp"
#include "rus/upload/registry.hpp"
#include "rus/upload/service.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace rus::network;
using rus::server::HandlerOptions;
using rus::server::TusHandler;

namespace {

std::string body_of(const HttpResponse& response) {
    return std::string(response.body.begin(), response.body.end());
}

/**
 * @brief Full handler stack over in-memory storage
 */
class TusHandlerTest : public ::testing::Test {
protected:
    TusHandlerTest()
        : service_(registry_, std::make_shared<rus::upload::MemoryStorage>(), bus_)
        , handler_(service_, handler_options()) {
    }

    static HandlerOptions handler_options() {
        HandlerOptions options;
        options.base_path = "/files";
        options.max_size = 1024;
        return options;
    }

    static HttpRequest tus_request(HttpMethod method, const std::string& url) {
        HttpRequest request;
        request.method = method;
        request.url = url;
        request.headers["Tus-Resumable"] = "1.0.0";
        return request;
    }

    HttpResponse create(const std::string& length, const std::string& extra_header = "",
                        const std::string& extra_value = "") {
        auto request = tus_request(HttpMethod::POST, "/files");
        request.headers["Upload-Length"] = length;
        if (!extra_header.empty()) {
            request.headers[extra_header] = extra_value;
        }
        return handler_.handle(request);
    }

    HttpResponse patch(const std::string& location, std::uint64_t offset, const std::string& data) {
        auto request = tus_request(HttpMethod::PATCH, location);
        request.headers["Content-Type"] = "application/offset+octet-stream";
        request.headers["Upload-Offset"] = std::to_string(offset);
        request.body.assign(data.begin(), data.end());
        return handler_.handle(request);
    }

    HttpResponse head(const std::string& location) {
        return handler_.handle(tus_request(HttpMethod::HEAD, location));
    }

    rus::upload::UploadRegistry registry_;
    rus::events::EventBus bus_;
    rus::upload::UploadService service_;
    TusHandler handler_;
};

} // namespace

TEST_F(TusHandlerTest, OptionsAdvertisesCapabilities) {
    HttpRequest request;
    request.method = HttpMethod::OPTIONS;
    request.url = "/files";

    auto response = handler_.handle(request);

    EXPECT_EQ(response.status_code, 204);
    EXPECT_EQ(response.get_header("Tus-Resumable"), "1.0.0");
    EXPECT_EQ(response.get_header("Tus-Version"), "1.0.0");
    EXPECT_EQ(response.get_header("Tus-Max-Size"), "1024");
    EXPECT_EQ(response.get_header("Tus-Checksum-Algorithm"), "sha1,sha256,md5");
    EXPECT_NE(response.get_header("Tus-Extension").find("creation-defer-length"), std::string::npos);
    EXPECT_NE(response.get_header("Tus-Extension").find("concatenation"), std::string::npos);
}

TEST_F(TusHandlerTest, MissingTusResumableIs412) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = "/files";
    request.headers["Upload-Length"] = "10";

    auto response = handler_.handle(request);
    EXPECT_EQ(response.status_code, 412);
    EXPECT_EQ(response.get_header("Tus-Version"), "1.0.0");
    EXPECT_EQ(registry_.size(), 0u);

    request.headers["Tus-Resumable"] = "0.2.2";
    EXPECT_EQ(handler_.handle(request).status_code, 412);
}

TEST_F(TusHandlerTest, CreatePatchHeadFlow) {
    auto created = create("100", "Host", "tus.example.org");
    ASSERT_EQ(created.status_code, 201);
    const auto location = created.get_header("Location");
    ASSERT_EQ(location.rfind("http://tus.example.org/files/", 0), 0u);
    EXPECT_FALSE(created.get_header("Upload-Expires").empty());

    const std::string path = location.substr(std::string("http://tus.example.org").size());

    auto first = patch(path, 0, std::string(40, 'a'));
    EXPECT_EQ(first.status_code, 204);
    EXPECT_EQ(first.get_header("Upload-Offset"), "40");

    auto status = head(path);
    EXPECT_EQ(status.status_code, 200);
    EXPECT_EQ(status.get_header("Upload-Offset"), "40");
    EXPECT_EQ(status.get_header("Upload-Length"), "100");
    EXPECT_EQ(status.get_header("Cache-Control"), "no-store");
    EXPECT_TRUE(status.body.empty());

    auto second = patch(path, 40, std::string(60, 'b'));
    EXPECT_EQ(second.status_code, 204);
    EXPECT_EQ(second.get_header("Upload-Offset"), "100");

    auto download = handler_.handle(tus_request(HttpMethod::GET, path));
    EXPECT_EQ(download.status_code, 200);
    EXPECT_EQ(body_of(download), std::string(40, 'a') + std::string(60, 'b'));
}

TEST_F(TusHandlerTest, RelativeLocationWithoutHost) {
    auto created = create("5");
    ASSERT_EQ(created.status_code, 201);
    EXPECT_EQ(created.get_header("Location").rfind("/files/", 0), 0u);
}

TEST_F(TusHandlerTest, CreateValidatesLengthHeaders) {
    auto request = tus_request(HttpMethod::POST, "/files");
    EXPECT_EQ(handler_.handle(request).status_code, 400);

    request.headers["Upload-Length"] = "-1";
    EXPECT_EQ(handler_.handle(request).status_code, 400);

    request.headers["Upload-Length"] = "10";
    request.headers["Upload-Defer-Length"] = "1";
    EXPECT_EQ(handler_.handle(request).status_code, 400);

    auto too_big = create("1025");
    EXPECT_EQ(too_big.status_code, 413);
}

TEST_F(TusHandlerTest, DeferredLengthUpload) {
    auto request = tus_request(HttpMethod::POST, "/files");
    request.headers["Upload-Defer-Length"] = "1";
    auto created = handler_.handle(request);
    ASSERT_EQ(created.status_code, 201);
    const auto location = created.get_header("Location");

    auto status = head(location);
    EXPECT_EQ(status.get_header("Upload-Defer-Length"), "1");
    EXPECT_FALSE(status.has_header("Upload-Length"));

    auto patch_request = tus_request(HttpMethod::PATCH, location);
    patch_request.headers["Content-Type"] = "application/offset+octet-stream";
    patch_request.headers["Upload-Offset"] = "0";
    patch_request.headers["Upload-Length"] = "3";
    patch_request.body = {'a', 'b', 'c'};
    auto appended = handler_.handle(patch_request);
    EXPECT_EQ(appended.status_code, 204);
    EXPECT_EQ(appended.get_header("Upload-Offset"), "3");

    EXPECT_EQ(head(location).get_header("Upload-Length"), "3");
}

TEST_F(TusHandlerTest, MetadataIsEchoedOnHead) {
    auto created = create("1", "Upload-Metadata", "filename d29ybGRfZG9taW5hdGlvbl9wbGFuLnBkZg==,is_confidential");
    ASSERT_EQ(created.status_code, 201);

    auto status = head(created.get_header("Location"));
    EXPECT_EQ(status.get_header("Upload-Metadata"),
              "filename d29ybGRfZG9taW5hdGlvbl9wbGFuLnBkZg==,is_confidential");

    auto bad = create("1", "Upload-Metadata", "filename not base64");
    EXPECT_EQ(bad.status_code, 400);
}

TEST_F(TusHandlerTest, CreationWithUpload) {
    auto request = tus_request(HttpMethod::POST, "/files");
    request.headers["Upload-Length"] = "10";
    request.headers["Content-Type"] = "application/offset+octet-stream";
    request.body = {'h', 'e', 'l', 'l', 'o'};

    auto created = handler_.handle(request);
    ASSERT_EQ(created.status_code, 201);
    EXPECT_EQ(created.get_header("Upload-Offset"), "5");

    request.headers["Content-Type"] = "text/plain";
    EXPECT_EQ(handler_.handle(request).status_code, 415);
}

TEST_F(TusHandlerTest, OffsetMismatchIs409WithCurrentOffset) {
    const auto location = create("100").get_header("Location");
    ASSERT_EQ(patch(location, 0, std::string(40, 'a')).status_code, 204);

    auto stale = patch(location, 0, std::string(40, 'a'));
    EXPECT_EQ(stale.status_code, 409);
    EXPECT_EQ(stale.get_header("Upload-Offset"), "40");
    EXPECT_EQ(stale.get_header("Tus-Resumable"), "1.0.0");
}

TEST_F(TusHandlerTest, PatchValidatesHeaders) {
    const auto location = create("10").get_header("Location");

    auto wrong_type = tus_request(HttpMethod::PATCH, location);
    wrong_type.headers["Content-Type"] = "application/octet-stream";
    wrong_type.headers["Upload-Offset"] = "0";
    EXPECT_EQ(handler_.handle(wrong_type).status_code, 415);

    auto no_offset = tus_request(HttpMethod::PATCH, location);
    no_offset.headers["Content-Type"] = "application/offset+octet-stream";
    EXPECT_EQ(handler_.handle(no_offset).status_code, 400);

    no_offset.headers["Upload-Offset"] = "abc";
    EXPECT_EQ(handler_.handle(no_offset).status_code, 400);

    EXPECT_EQ(patch(location, 0, std::string(11, 'x')).status_code, 413);
}

TEST_F(TusHandlerTest, ChecksumMismatchIs460) {
    const auto location = create("5").get_header("Location");

    auto request = tus_request(HttpMethod::PATCH, location);
    request.headers["Content-Type"] = "application/offset+octet-stream";
    request.headers["Upload-Offset"] = "0";
    request.headers["Upload-Checksum"] = "sha1 qvTGHdzF6KLavt4PO0gs2a6pQ00=";
    request.body = {'j', 'e', 'l', 'l', 'o'};
    EXPECT_EQ(handler_.handle(request).status_code, 460);
    EXPECT_EQ(head(location).get_header("Upload-Offset"), "0");

    request.body = {'h', 'e', 'l', 'l', 'o'};
    EXPECT_EQ(handler_.handle(request).status_code, 204);

    auto unknown = tus_request(HttpMethod::PATCH, create("5").get_header("Location"));
    unknown.headers["Content-Type"] = "application/offset+octet-stream";
    unknown.headers["Upload-Offset"] = "0";
    unknown.headers["Upload-Checksum"] = "crc32 AAAAAA==";
    unknown.body = {'h'};
    EXPECT_EQ(handler_.handle(unknown).status_code, 400);
}

TEST_F(TusHandlerTest, UnknownUploadIs404) {
    const std::string missing = "/files/ffffffffffffffffffffffffffffffff";
    EXPECT_EQ(head(missing).status_code, 404);
    EXPECT_EQ(patch(missing, 0, "x").status_code, 404);
    EXPECT_EQ(handler_.handle(tus_request(HttpMethod::GET, missing)).status_code, 404);
}

TEST_F(TusHandlerTest, TerminateThenGone) {
    const auto location = create("10").get_header("Location");
    ASSERT_EQ(patch(location, 0, "abc").status_code, 204);

    EXPECT_EQ(handler_.handle(tus_request(HttpMethod::DELETE_METHOD, location)).status_code, 204);
    EXPECT_EQ(handler_.handle(tus_request(HttpMethod::DELETE_METHOD, location)).status_code, 204);
    EXPECT_EQ(head(location).status_code, 404);
    EXPECT_EQ(patch(location, 3, "def").status_code, 404);
}

TEST_F(TusHandlerTest, ConcatenationFlow) {
    const auto a = create("10", "Upload-Concat", "partial").get_header("Location");
    const auto b = create("20", "Upload-Concat", "partial").get_header("Location");
    ASSERT_EQ(patch(a, 0, "0123456789").status_code, 204);

    EXPECT_EQ(head(a).get_header("Upload-Concat"), "partial");

    auto request = tus_request(HttpMethod::POST, "/files");
    request.headers["Upload-Concat"] = "final;" + a + " " + b;
    EXPECT_EQ(handler_.handle(request).status_code, 400);   // b incomplete

    ASSERT_EQ(patch(b, 0, "abcdefghijklmnopqrst").status_code, 204);
    auto joined = handler_.handle(request);
    ASSERT_EQ(joined.status_code, 201);
    const auto location = joined.get_header("Location");

    auto status = head(location);
    EXPECT_EQ(status.get_header("Upload-Offset"), "30");
    EXPECT_EQ(status.get_header("Upload-Length"), "30");
    EXPECT_EQ(status.get_header("Upload-Concat"), "final;" + a + " " + b);

    auto download = handler_.handle(tus_request(HttpMethod::GET, location));
    EXPECT_EQ(body_of(download), "0123456789abcdefghijklmnopqrst");

    EXPECT_EQ(patch(location, 30, "x").status_code, 403);
}

TEST_F(TusHandlerTest, ConcatenationRejectsForeignUrls) {
    auto request = tus_request(HttpMethod::POST, "/files");
    request.headers["Upload-Concat"] = "final;/elsewhere/abc";
    EXPECT_EQ(handler_.handle(request).status_code, 400);

    request.headers["Upload-Concat"] = "bogus";
    request.headers["Upload-Length"] = "1";
    EXPECT_EQ(handler_.handle(request).status_code, 400);
}

TEST_F(TusHandlerTest, IncompleteUploadDownloadIs400) {
    const auto location = create("10").get_header("Location");
    EXPECT_EQ(handler_.handle(tus_request(HttpMethod::GET, location)).status_code, 400);
}

TEST_F(TusHandlerTest, MethodOverrideTunnelsPatch) {
    const auto location = create("3").get_header("Location");

    auto request = tus_request(HttpMethod::POST, location);
    request.headers["X-HTTP-Method-Override"] = "PATCH";
    request.headers["Content-Type"] = "application/offset+octet-stream";
    request.headers["Upload-Offset"] = "0";
    request.body = {'a', 'b', 'c'};

    auto response = handler_.handle(request);
    EXPECT_EQ(response.status_code, 204);
    EXPECT_EQ(response.get_header("Upload-Offset"), "3");
}

TEST_F(TusHandlerTest, OverriddenHeadKeepsBodyAndLengthInStep) {
    auto tunnelled = tus_request(HttpMethod::POST, "/files/0123456789abcdef0123456789abcdef");
    tunnelled.headers["X-HTTP-Method-Override"] = "HEAD";

    auto response = handler_.handle(tunnelled);
    EXPECT_EQ(response.status_code, 404);
    EXPECT_FALSE(response.body.empty());
    EXPECT_EQ(response.get_header("Content-Length"), std::to_string(response.body.size()));

    auto real_head = head("/files/0123456789abcdef0123456789abcdef");
    EXPECT_EQ(real_head.status_code, 404);
    EXPECT_TRUE(real_head.body.empty());
}

TEST_F(TusHandlerTest, WrongMethodIs405) {
    auto response = handler_.handle(tus_request(HttpMethod::PUT, "/files/abc"));
    EXPECT_EQ(response.status_code, 405);
    EXPECT_EQ(response.get_header("Tus-Resumable"), "1.0.0");
}

TEST(TusStatusMappingTest, MapsErrorKindsToStatusCodes) {
    using rus::ErrorKind;
    using rus::server::status_for;

    EXPECT_EQ(status_for(ErrorKind::Conflict), HttpStatus::CONFLICT);
    EXPECT_EQ(status_for(ErrorKind::ChecksumMismatch), HttpStatus::CHECKSUM_MISMATCH);
    EXPECT_EQ(status_for(ErrorKind::NotFound), HttpStatus::NOT_FOUND);
    EXPECT_EQ(status_for(ErrorKind::ExceedsLength), HttpStatus::PAYLOAD_TOO_LARGE);
    EXPECT_EQ(status_for(ErrorKind::StorageFull), HttpStatus::INSUFFICIENT_STORAGE);
    EXPECT_EQ(status_for(ErrorKind::StorageUnavailable), HttpStatus::SERVICE_UNAVAILABLE);
    EXPECT_EQ(status_for(ErrorKind::FinalUploadImmutable), HttpStatus::FORBIDDEN);
    EXPECT_EQ(status_for(ErrorKind::Corrupted), HttpStatus::INTERNAL_SERVER_ERROR);
}

TEST(TusStatusMappingTest, FormatsHttpDate) {
    const auto epoch_plus_day = rus::upload::Clock::time_point{std::chrono::hours{24}};
    EXPECT_EQ(rus::server::format_http_date(epoch_plus_day), "Fri, 02 Jan 1970 00:00:00 GMT");
}
