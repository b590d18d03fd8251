#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace rus {

/**
 * @brief Every way an upload operation can fail
 *
 * The upload layer only ever reports one of these kinds. Translating a kind
 * into an HTTP status is the job of the protocol handler, nothing below it
 * knows about status codes.
 */
enum class ErrorKind {
    Malformed,              // Missing or unparsable header / argument
    NotFound,               // Unknown, deleted or expired upload
    Conflict,               // Upload-Offset does not match the committed offset
    ChecksumMismatch,       // Chunk digest disagrees with Upload-Checksum
    UnsupportedChecksum,    // Unknown checksum algorithm
    IncompleteParent,       // Concatenation input not fully uploaded yet
    InvalidConcatenation,   // Concatenation input is itself final, or missing
    AlreadyComplete,        // Append after offset reached the declared length
    FinalUploadImmutable,   // Append against a concatenated upload
    LengthRequired,         // Bytes sent to a deferred-length upload without a length
    LengthImmutable,        // Attempt to change an already declared length
    InvalidLength,          // Declared length smaller than the received bytes
    ExceedsLength,          // Chunk would run past the declared length
    TooLarge,               // Larger than the configured maximum
    UnsupportedMediaType,   // PATCH without application/offset+octet-stream
    VersionMismatch,        // Tus-Resumable missing or unsupported
    Incomplete,             // Download of an upload that is still in progress
    StorageFull,            // Backend out of space
    StorageUnavailable,     // Transient backend failure, retryable
    InvalidOffset,          // Backend or registry consistency check failed
    Corrupted,              // Persisted registry record could not be loaded
    Internal                // Anything else
};

/**
 * @brief Structured failure returned by every fallible operation
 *
 * When the failure concerns an existing upload, `offset` and `length` carry
 * its committed progress so the caller can tell the client where to resume.
 */
struct Error {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
    std::optional<std::uint64_t> offset;
    std::optional<std::uint64_t> length;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    Error& with_progress(std::uint64_t current_offset, std::optional<std::uint64_t> total_length) {
        offset = current_offset;
        length = total_length;
        return *this;
    }
};

const char* to_string(ErrorKind kind);

/**
 * @brief Whether a storage call failing with this kind may be retried as-is
 */
inline bool is_transient(ErrorKind kind) {
    return kind == ErrorKind::StorageUnavailable;
}

} // namespace rus
