/**
 * @file events.hpp
 * @brief Upload lifecycle events
 *
 * NAMING CONVENTION:
 * Events are past-tense: UploadCreatedEvent, ChunkAppendedEvent
 *
 * All of them are emitted by UploadService (or the expiry sweep) after the
 * corresponding state change has been committed to the registry.
 */

#pragma once

#include "rus/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rus::events {

// ════════════════════════════════════════════════════════
// Upload Events
// ════════════════════════════════════════════════════════

/**
 * @brief A new upload resource exists
 *
 * `total_length` is empty for deferred-length uploads.
 */
struct UploadCreatedEvent {
    std::string upload_id;
    std::optional<std::uint64_t> total_length;
    bool is_partial = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Bytes were durably written and the offset advanced
 */
struct ChunkAppendedEvent {
    std::string upload_id;
    std::uint64_t previous_offset = 0;
    std::uint64_t bytes_written = 0;
    std::uint64_t new_offset = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief An append was refused without touching state
 */
struct AppendRejectedEvent {
    std::string upload_id;
    ErrorKind reason = ErrorKind::Internal;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief offset reached total_length
 */
struct UploadCompletedEvent {
    std::string upload_id;
    std::uint64_t total_length = 0;
    std::chrono::milliseconds duration{0};   // Since creation
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadConcatenatedEvent {
    std::string upload_id;
    std::vector<std::string> parent_ids;
    std::uint64_t total_length = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadTerminatedEvent {
    std::string upload_id;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadExpiredEvent {
    std::string upload_id;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when server starts
 *
 * WHO EMITS: main() startup
 */
struct ServerStartedEvent {
    uint16_t port;
    std::string storage_backend;
    std::chrono::system_clock::time_point timestamp;

    ServerStartedEvent(uint16_t p, std::string backend)
        : port(p),
          storage_backend(std::move(backend)),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted when server is shutting down
 *
 * WHO EMITS: main() on SIGINT/SIGTERM
 */
struct ServerShuttingDownEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerShuttingDownEvent(std::string r = "normal")
        : reason(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

} // namespace rus::events
