#pragma once

#include "rus/core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace rus {

/**
 * @brief Standard (RFC 4648, padded) base64 encoding
 */
std::string base64_encode(const std::uint8_t* data, std::size_t len);

inline std::string base64_encode(const std::vector<std::uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

/**
 * @brief Decode padded base64; Malformed on any invalid character or length
 */
Result<std::vector<std::uint8_t>> base64_decode(const std::string& text);

} // namespace rus
