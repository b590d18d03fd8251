#include "rus/upload/checksum.hpp"

#include "rus/core/base64.hpp"

#include <openssl/crypto.h>

#include <algorithm>
#include <cctype>

namespace rus::upload {

namespace {

const EVP_MD* digest_for(const std::string& algorithm) {
    if (algorithm == "sha1") {
        return EVP_sha1();
    }
    if (algorithm == "sha256") {
        return EVP_sha256();
    }
    if (algorithm == "md5") {
        return EVP_md5();
    }
    return nullptr;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

void HashCTXRelease::operator()(EVP_MD_CTX* ctx) const {
    ::EVP_MD_CTX_free(ctx);
}

const std::vector<std::string>& supported_algorithms() {
    static const std::vector<std::string> algorithms{"sha1", "sha256", "md5"};
    return algorithms;
}

bool is_supported_algorithm(const std::string& algorithm) {
    return digest_for(algorithm) != nullptr;
}

Result<UploadChecksum> parse_checksum_header(const std::string& value) {
    const auto space = value.find(' ');
    if (space == std::string::npos || space == 0 || space + 1 >= value.size()) {
        return fail<UploadChecksum>(ErrorKind::Malformed,
            "Upload-Checksum must be '<algorithm> <base64 digest>'");
    }

    const std::string encoded = value.substr(space + 1);
    if (encoded.find(' ') != std::string::npos) {
        return fail<UploadChecksum>(ErrorKind::Malformed, "Upload-Checksum has extra fields");
    }

    auto digest = base64_decode(encoded);
    if (digest.is_error()) {
        return fail<UploadChecksum>(ErrorKind::Malformed, "Upload-Checksum digest is not valid base64");
    }

    UploadChecksum checksum;
    checksum.algorithm = to_lower(value.substr(0, space));
    checksum.digest = std::move(digest.value());
    return Ok(std::move(checksum));
}

Result<std::vector<std::uint8_t>> compute_digest(const std::string& algorithm,
                                                 const std::uint8_t* data,
                                                 std::size_t len) {
    using Bytes = std::vector<std::uint8_t>;

    const EVP_MD* md = digest_for(algorithm);
    if (!md) {
        return fail<Bytes>(ErrorKind::UnsupportedChecksum, "Unsupported checksum algorithm: " + algorithm);
    }

    HashCTX ctx{EVP_MD_CTX_new()};
    if (!ctx) {
        return fail<Bytes>(ErrorKind::Internal, "Cannot allocate digest context");
    }

    Bytes out(EVP_MAX_MD_SIZE);
    unsigned int out_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, len) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1) {
        return fail<Bytes>(ErrorKind::Internal, "Digest computation failed for " + algorithm);
    }

    out.resize(out_len);
    return Ok(std::move(out));
}

Result<void> verify_checksum(const UploadChecksum& checksum, const std::vector<std::uint8_t>& data) {
    auto actual = compute_digest(checksum.algorithm, data.data(), data.size());
    if (actual.is_error()) {
        return Err<void>(actual.error());
    }

    const auto& digest = actual.value();
    if (digest.size() != checksum.digest.size() ||
        CRYPTO_memcmp(digest.data(), checksum.digest.data(), digest.size()) != 0) {
        return Err<void>(Error(ErrorKind::ChecksumMismatch,
            checksum.algorithm + " checksum mismatch, expected " + base64_encode(checksum.digest) +
            " but data hashes to " + base64_encode(digest)));
    }
    return Ok();
}

} // namespace rus::upload
