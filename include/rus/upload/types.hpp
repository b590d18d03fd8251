#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rus::upload {

using Clock = std::chrono::system_clock;

/**
 * @brief Upload-Metadata pairs in the order the client sent them
 *
 * Values stay in their base64 wire form; the server never decodes them.
 */
using Metadata = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Registry record for one upload resource
 */
struct Upload {
    std::string id;                               ///< 32 lowercase hex chars
    std::optional<std::uint64_t> total_length;    ///< Empty while deferred
    std::uint64_t offset = 0;                     ///< Bytes durably stored
    bool is_partial = false;
    bool is_final = false;
    std::vector<std::string> parent_ids;          ///< Only for final uploads
    Clock::time_point created_at{};
    std::optional<Clock::time_point> expires_at;  ///< Empty when expiry is disabled
    Metadata metadata;

    bool length_deferred() const { return !total_length.has_value(); }

    bool is_complete() const {
        return total_length.has_value() && offset == *total_length;
    }

    bool is_expired(Clock::time_point now) const {
        return expires_at.has_value() && *expires_at <= now;
    }
};

/**
 * @brief Optional Upload-Checksum carried by an append
 */
struct UploadChecksum {
    std::string algorithm;
    std::vector<std::uint8_t> digest;
};

struct CreateRequest {
    std::optional<std::uint64_t> total_length;    ///< Empty means Upload-Defer-Length: 1
    Metadata metadata;
    bool is_partial = false;
    std::optional<std::vector<std::uint8_t>> initial_bytes;   ///< creation-with-upload
    std::optional<UploadChecksum> checksum;         ///< Applies to initial_bytes
};

struct AppendRequest {
    std::string id;
    std::uint64_t expected_offset = 0;
    std::vector<std::uint8_t> bytes;
    std::optional<UploadChecksum> checksum;
    std::optional<std::uint64_t> declared_length; ///< Upload-Length sent with a PATCH
};

/**
 * @brief Snapshot returned by a status query
 */
struct UploadStatus {
    std::uint64_t offset = 0;
    std::optional<std::uint64_t> total_length;
    bool complete = false;
    bool is_partial = false;
    bool is_final = false;
    std::vector<std::string> parent_ids;
    Metadata metadata;
    std::optional<Clock::time_point> expires_at;
};

constexpr std::size_t kUploadIdLength = 32;

/**
 * @brief True for ids the registry could have generated
 */
inline bool is_valid_upload_id(const std::string& id) {
    if (id.size() != kUploadIdLength) {
        return false;
    }
    for (char c : id) {
        const bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        if (!hex) {
            return false;
        }
    }
    return true;
}

} // namespace rus::upload
