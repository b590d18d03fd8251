#pragma once

#include "rus/core/result.hpp"
#include "rus/upload/types.hpp"

#include <openssl/evp.h>

#include <memory>
#include <string>
#include <vector>

namespace rus::upload {

struct HashCTXRelease {
    void operator()(EVP_MD_CTX* ctx) const;
};
using HashCTX = std::unique_ptr<EVP_MD_CTX, HashCTXRelease>;

/**
 * @brief Algorithms accepted in Upload-Checksum, in advertised order
 */
const std::vector<std::string>& supported_algorithms();

bool is_supported_algorithm(const std::string& algorithm);

/**
 * @brief Parse an Upload-Checksum value ("<algorithm> <base64 digest>")
 *
 * Malformed if the shape or the base64 is wrong. An unknown algorithm is
 * not an error here; verify_checksum() reports it.
 */
Result<UploadChecksum> parse_checksum_header(const std::string& value);

Result<std::vector<std::uint8_t>> compute_digest(const std::string& algorithm,
                                                 const std::uint8_t* data,
                                                 std::size_t len);

/**
 * @brief UnsupportedChecksum or ChecksumMismatch unless `data` hashes to the digest
 */
Result<void> verify_checksum(const UploadChecksum& checksum, const std::vector<std::uint8_t>& data);

} // namespace rus::upload
