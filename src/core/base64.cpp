#include "rus/core/base64.hpp"

#include <openssl/evp.h>

#include <cctype>

namespace rus {

std::string base64_encode(const std::uint8_t* data, std::size_t len) {
    if (len == 0) {
        return {};
    }
    // 4 output chars per 3 input bytes, plus the NUL EVP_EncodeBlock writes
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    const int written = ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                          data, static_cast<int>(len));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

Result<std::vector<std::uint8_t>> base64_decode(const std::string& text) {
    if (text.empty()) {
        return Ok(std::vector<std::uint8_t>{});
    }
    if (text.size() % 4 != 0) {
        return fail<std::vector<std::uint8_t>>(ErrorKind::Malformed, "base64 length is not a multiple of 4");
    }

    std::size_t padding = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == '=') {
            // Padding only allowed in the last two positions
            if (i + 2 < text.size()) {
                return fail<std::vector<std::uint8_t>>(ErrorKind::Malformed, "misplaced base64 padding");
            }
            ++padding;
            continue;
        }
        if (padding > 0 || !(std::isalnum(c) || c == '+' || c == '/')) {
            return fail<std::vector<std::uint8_t>>(ErrorKind::Malformed, "invalid base64 character");
        }
    }

    std::vector<std::uint8_t> out(3 * (text.size() / 4));
    const int decoded = ::EVP_DecodeBlock(out.data(),
                                          reinterpret_cast<const unsigned char*>(text.data()),
                                          static_cast<int>(text.size()));
    if (decoded < 0 || static_cast<std::size_t>(decoded) < padding) {
        return fail<std::vector<std::uint8_t>>(ErrorKind::Malformed, "invalid base64 input");
    }
    // EVP_DecodeBlock counts padding as zero bytes
    out.resize(static_cast<std::size_t>(decoded) - padding);
    return Ok(std::move(out));
}

} // namespace rus
