#pragma once

#include "rus/core/result.hpp"
#include "rus/upload/types.hpp"

#include <string>

namespace rus::upload {

/**
 * @brief Parse Upload-Metadata: comma separated "key base64value" pairs
 *
 * A key may appear without a value. Keys must be non-empty and unique and
 * values must be valid base64, otherwise Malformed. Values are kept encoded.
 */
Result<Metadata> parse_metadata_header(const std::string& value);

std::string format_metadata_header(const Metadata& metadata);

} // namespace rus::upload
