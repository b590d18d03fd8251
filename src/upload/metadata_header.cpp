#include "rus/upload/metadata_header.hpp"

#include "rus/core/base64.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace rus::upload {

namespace {

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

} // namespace

Result<Metadata> parse_metadata_header(const std::string& value) {
    Metadata metadata;
    if (trim(value).empty()) {
        return Ok(std::move(metadata));
    }

    std::unordered_set<std::string> seen;
    std::istringstream stream(value);
    std::string item;

    while (std::getline(stream, item, ',')) {
        const std::string pair = trim(item);
        if (pair.empty()) {
            return fail<Metadata>(ErrorKind::Malformed, "Upload-Metadata contains an empty pair");
        }

        const auto space = pair.find(' ');
        std::string key = pair.substr(0, space);
        std::string encoded = space == std::string::npos ? std::string() : pair.substr(space + 1);

        if (key.empty() || key.find('\t') != std::string::npos) {
            return fail<Metadata>(ErrorKind::Malformed, "Upload-Metadata key is invalid");
        }
        if (encoded.find(' ') != std::string::npos) {
            return fail<Metadata>(ErrorKind::Malformed, "Upload-Metadata value for '" + key + "' has extra fields");
        }
        if (base64_decode(encoded).is_error()) {
            return fail<Metadata>(ErrorKind::Malformed, "Upload-Metadata value for '" + key + "' is not base64");
        }
        if (!seen.insert(key).second) {
            return fail<Metadata>(ErrorKind::Malformed, "Upload-Metadata key '" + key + "' is duplicated");
        }

        metadata.emplace_back(std::move(key), std::move(encoded));
    }

    // getline drops a trailing empty field
    if (!value.empty() && trim(value).back() == ',') {
        return fail<Metadata>(ErrorKind::Malformed, "Upload-Metadata contains an empty pair");
    }

    return Ok(std::move(metadata));
}

std::string format_metadata_header(const Metadata& metadata) {
    std::string out;
    for (const auto& [key, value] : metadata) {
        if (!out.empty()) {
            out += ',';
        }
        out += key;
        if (!value.empty()) {
            out += ' ';
            out += value;
        }
    }
    return out;
}

} // namespace rus::upload
