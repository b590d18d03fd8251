#include "rus/upload/service.hpp"

#include "rus/events/events.hpp"
#include "rus/upload/checksum.hpp"

#include <spdlog/spdlog.h>

#include <thread>

namespace rus::upload {

namespace {

Error at_progress(Error error, const Upload& upload) {
    error.with_progress(upload.offset, upload.total_length);
    return error;
}

Result<Upload> reject(ErrorKind kind, std::string message, const Upload& upload) {
    return Err<Upload>(at_progress(Error(kind, std::move(message)), upload));
}

} // namespace

UploadService::UploadService(UploadRegistry& registry,
                             StorageBackendPtr storage,
                             events::EventBus& bus,
                             ServiceOptions options)
    : registry_(registry)
    , storage_(std::move(storage))
    , bus_(bus)
    , options_(options) {
    if (options_.storage_retry_attempts < 1) {
        options_.storage_retry_attempts = 1;
    }
}

// ────────────────────────────────────────────────────────────
// Create
// ────────────────────────────────────────────────────────────

Result<CreateOutcome> UploadService::create(CreateRequest request) {
    if (request.total_length && options_.max_size > 0 && *request.total_length > options_.max_size) {
        return fail<CreateOutcome>(ErrorKind::TooLarge,
            "Upload-Length " + std::to_string(*request.total_length) +
            " exceeds maximum " + std::to_string(options_.max_size));
    }

    auto created = registry_.create(std::move(request.metadata), request.total_length, request.is_partial);
    if (created.is_error()) {
        return Err<CreateOutcome>(created.error());
    }
    const Upload& upload = created.value();

    if (auto res = storage_->create(upload.id); res.is_error()) {
        spdlog::error("Cannot allocate storage for {}: {}", upload.id, res.error().message);
        registry_.remove(upload.id);
        return Err<CreateOutcome>(res.error());
    }

    bus_.emit(events::UploadCreatedEvent{upload.id, upload.total_length, upload.is_partial});

    CreateOutcome outcome{upload, std::nullopt};

    if (request.initial_bytes) {
        AppendRequest initial;
        initial.id = upload.id;
        initial.expected_offset = 0;
        initial.bytes = std::move(*request.initial_bytes);
        initial.checksum = std::move(request.checksum);

        auto appended = append(initial);
        if (appended.is_ok()) {
            outcome.upload = std::move(appended.value());
        } else {
            spdlog::warn("Upload {} created but its initial {} bytes were refused: {}",
                         upload.id, initial.bytes.size(), appended.error().message);
            outcome.initial_append_error = appended.error();
        }
    }

    return Ok(std::move(outcome));
}

// ────────────────────────────────────────────────────────────
// Append
// ────────────────────────────────────────────────────────────

Result<Upload> UploadService::append(const AppendRequest& request) {
    auto lock = locks_.acquire(request.id);

    auto result = append_locked(request);
    if (result.is_error() && result.error().kind != ErrorKind::NotFound) {
        bus_.emit(events::AppendRejectedEvent{request.id, result.error().kind});
    }
    return result;
}

Result<Upload> UploadService::append_locked(const AppendRequest& request) {
    auto found = registry_.get(request.id);
    if (found.is_error()) {
        return found;
    }
    const Upload current = found.value();
    const std::uint64_t len = request.bytes.size();

    if (current.is_final) {
        return reject(ErrorKind::FinalUploadImmutable,
            "Upload " + current.id + " is a concatenation result and cannot be appended to", current);
    }

    // Checked here but only stored once every other check passed
    std::optional<std::uint64_t> length = current.total_length;
    if (request.declared_length) {
        const auto declared = *request.declared_length;
        if (current.total_length && *current.total_length != declared) {
            return reject(ErrorKind::LengthImmutable,
                "Upload-Length is already " + std::to_string(*current.total_length), current);
        }
        if (options_.max_size > 0 && declared > options_.max_size) {
            return reject(ErrorKind::TooLarge,
                "Upload-Length " + std::to_string(declared) + " exceeds maximum " +
                std::to_string(options_.max_size), current);
        }
        if (declared < current.offset) {
            return reject(ErrorKind::InvalidLength,
                "Upload-Length " + std::to_string(declared) + " is smaller than offset " +
                std::to_string(current.offset), current);
        }
        length = declared;
    }

    if (current.is_complete()) {
        return reject(ErrorKind::AlreadyComplete, "Upload " + current.id + " is already complete", current);
    }

    if (request.expected_offset != current.offset) {
        return reject(ErrorKind::Conflict,
            "Upload-Offset " + std::to_string(request.expected_offset) +
            " does not match current offset " + std::to_string(current.offset), current);
    }

    if (!length && len > 0) {
        return reject(ErrorKind::LengthRequired,
            "Upload length must be declared before sending data", current);
    }

    if (length && len > *length - current.offset) {
        return reject(ErrorKind::ExceedsLength,
            "Chunk of " + std::to_string(len) + " bytes at offset " + std::to_string(current.offset) +
            " runs past upload length " + std::to_string(*length), current);
    }

    if (request.checksum) {
        if (auto verified = verify_checksum(*request.checksum, request.bytes); verified.is_error()) {
            return Err<Upload>(at_progress(verified.error(), current));
        }
    }

    Upload updated = current;

    if (request.declared_length && !current.total_length) {
        auto declared = registry_.declare_length(current.id, *request.declared_length);
        if (declared.is_error()) {
            return Err<Upload>(at_progress(declared.error(), current));
        }
        updated = std::move(declared.value());
    }

    if (len > 0) {
        auto written = write_with_retry(current.id, current.offset, request.bytes);
        if (written.is_error()) {
            spdlog::error("Storing {} bytes for {} at {} failed: {}",
                          len, current.id, current.offset, written.error().message);
            return Err<Upload>(at_progress(written.error(), updated));
        }
        if (written.value() != len) {
            return reject(ErrorKind::Internal,
                "Short write for " + current.id + ": " + std::to_string(written.value()) +
                " of " + std::to_string(len) + " bytes", updated);
        }

        auto advanced = registry_.advance_offset(current.id, current.offset + len);
        if (advanced.is_error()) {
            return Err<Upload>(at_progress(advanced.error(), updated));
        }
        updated = std::move(advanced.value());

        bus_.emit(events::ChunkAppendedEvent{current.id, current.offset, len, updated.offset});
    }

    if (updated.is_complete()) {
        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            registry_.now() - updated.created_at);
        bus_.emit(events::UploadCompletedEvent{updated.id, *updated.total_length, duration});
    }

    return Ok(std::move(updated));
}

Result<std::size_t> UploadService::write_with_retry(const std::string& id,
                                                    std::uint64_t offset,
                                                    const std::vector<std::uint8_t>& bytes) {
    for (int attempt = 1;; ++attempt) {
        auto written = storage_->write(id, offset, bytes);
        if (written.is_ok() || !is_transient(written.error().kind) ||
            attempt >= options_.storage_retry_attempts) {
            return written;
        }

        spdlog::warn("Transient storage failure for {} (attempt {}/{}): {}",
                     id, attempt, options_.storage_retry_attempts, written.error().message);
        std::this_thread::sleep_for(options_.storage_retry_backoff * attempt);
    }
}

// ────────────────────────────────────────────────────────────
// Status / Read
// ────────────────────────────────────────────────────────────

Result<UploadStatus> UploadService::status(const std::string& id) const {
    auto found = registry_.get(id);
    if (found.is_error()) {
        return Err<UploadStatus>(found.error());
    }

    const Upload& upload = found.value();
    UploadStatus status;
    status.offset = upload.offset;
    status.total_length = upload.total_length;
    status.complete = upload.is_complete();
    status.is_partial = upload.is_partial;
    status.is_final = upload.is_final;
    status.parent_ids = upload.parent_ids;
    status.metadata = upload.metadata;
    status.expires_at = upload.expires_at;
    return Ok(std::move(status));
}

Result<std::vector<std::uint8_t>> UploadService::read(const std::string& id) const {
    using Bytes = std::vector<std::uint8_t>;

    auto found = registry_.get(id);
    if (found.is_error()) {
        return Err<Bytes>(found.error());
    }

    const Upload& upload = found.value();
    if (!upload.is_complete()) {
        return Err<Bytes>(at_progress(Error(ErrorKind::Incomplete,
            "Upload " + id + " is not complete yet"), upload));
    }
    return storage_->read(id, 0, *upload.total_length);
}

// ────────────────────────────────────────────────────────────
// Concatenate
// ────────────────────────────────────────────────────────────

Result<Upload> UploadService::concatenate(const std::vector<std::string>& parent_ids, Metadata metadata) {
    if (parent_ids.empty()) {
        return fail<Upload>(ErrorKind::Malformed, "Concatenation needs at least one partial upload");
    }

    std::uint64_t total = 0;
    for (const auto& parent_id : parent_ids) {
        auto parent = registry_.get(parent_id);
        if (parent.is_error()) {
            if (parent.error().kind == ErrorKind::NotFound) {
                return fail<Upload>(ErrorKind::InvalidConcatenation,
                    "Partial upload " + parent_id + " not found");
            }
            return parent;
        }
        if (parent.value().is_final) {
            return fail<Upload>(ErrorKind::InvalidConcatenation,
                "Upload " + parent_id + " is itself a concatenation result");
        }
        if (!parent.value().is_complete()) {
            return fail<Upload>(ErrorKind::IncompleteParent,
                "Partial upload " + parent_id + " is not complete");
        }
        total += *parent.value().total_length;
    }

    if (options_.max_size > 0 && total > options_.max_size) {
        return fail<Upload>(ErrorKind::TooLarge,
            "Concatenated length " + std::to_string(total) + " exceeds maximum " +
            std::to_string(options_.max_size));
    }

    auto created = registry_.create_final(parent_ids, std::move(metadata), total);
    if (created.is_error()) {
        return created;
    }
    const std::string id = created.value().id;

    auto joined = storage_->concatenate(id, parent_ids);
    if (joined.is_error()) {
        discard(id);
        if (joined.error().kind == ErrorKind::NotFound) {
            return fail<Upload>(ErrorKind::InvalidConcatenation,
                "A partial upload disappeared during concatenation: " + joined.error().message);
        }
        return Err<Upload>(joined.error());
    }
    if (joined.value() != total) {
        discard(id);
        return fail<Upload>(ErrorKind::Internal,
            "Concatenated " + std::to_string(joined.value()) + " bytes, expected " + std::to_string(total));
    }

    auto completed = registry_.advance_offset(id, total);
    if (completed.is_error()) {
        discard(id);
        return completed;
    }

    bus_.emit(events::UploadConcatenatedEvent{id, parent_ids, total});
    return completed;
}

// ────────────────────────────────────────────────────────────
// Terminate
// ────────────────────────────────────────────────────────────

Result<void> UploadService::terminate(const std::string& id) {
    if (registry_.is_corrupted(id)) {
        return Err<void>(Error(ErrorKind::Corrupted, "Stored state of upload " + id + " is unreadable"));
    }

    auto lock = locks_.acquire(id);

    const bool removed = registry_.remove(id);

    // Also runs when the entry is already gone, to clear bytes a failed
    // earlier attempt left behind
    if (auto res = storage_->remove(id); res.is_error()) {
        spdlog::error("Could not delete data of {}: {}", id, res.error().message);
        return res;
    }

    if (removed) {
        bus_.emit(events::UploadTerminatedEvent{id});
    }
    return Ok();
}

void UploadService::discard(const std::string& id) {
    registry_.remove(id);
    if (auto res = storage_->remove(id); res.is_error()) {
        spdlog::warn("Could not clean up data of {}: {}", id, res.error().message);
    }
}

} // namespace rus::upload
