#include "rus/core/error.hpp"

namespace rus {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Malformed: return "malformed";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Conflict: return "conflict";
        case ErrorKind::ChecksumMismatch: return "checksum_mismatch";
        case ErrorKind::UnsupportedChecksum: return "unsupported_checksum";
        case ErrorKind::IncompleteParent: return "incomplete_parent";
        case ErrorKind::InvalidConcatenation: return "invalid_concatenation";
        case ErrorKind::AlreadyComplete: return "already_complete";
        case ErrorKind::FinalUploadImmutable: return "final_upload_immutable";
        case ErrorKind::LengthRequired: return "length_required";
        case ErrorKind::LengthImmutable: return "length_immutable";
        case ErrorKind::InvalidLength: return "invalid_length";
        case ErrorKind::ExceedsLength: return "exceeds_length";
        case ErrorKind::TooLarge: return "too_large";
        case ErrorKind::UnsupportedMediaType: return "unsupported_media_type";
        case ErrorKind::VersionMismatch: return "version_mismatch";
        case ErrorKind::Incomplete: return "incomplete";
        case ErrorKind::StorageFull: return "storage_full";
        case ErrorKind::StorageUnavailable: return "storage_unavailable";
        case ErrorKind::InvalidOffset: return "invalid_offset";
        case ErrorKind::Corrupted: return "corrupted";
        case ErrorKind::Internal: return "internal";
    }
    return "unknown";
}

} // namespace rus
