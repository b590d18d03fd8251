/**
 * @file components.hpp
 * @brief Event-driven components attached to the upload service
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Both react to upload lifecycle events emitted by UploadService
 */

#pragma once

#include "rus/events/event_bus.hpp"
#include "rus/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <string>

namespace rus::events {

/**
 * @brief Logger component - logs upload lifecycle events
 *
 * Per-chunk events are logged at debug level, everything else at info.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadCreatedEvent>([this](const UploadCreatedEvent& e) {
            on_upload_created(e);
        });

        bus_.subscribe<ChunkAppendedEvent>([this](const ChunkAppendedEvent& e) {
            on_chunk_appended(e);
        });

        bus_.subscribe<AppendRejectedEvent>([this](const AppendRejectedEvent& e) {
            on_append_rejected(e);
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            on_upload_completed(e);
        });

        bus_.subscribe<UploadConcatenatedEvent>([this](const UploadConcatenatedEvent& e) {
            on_upload_concatenated(e);
        });

        bus_.subscribe<UploadTerminatedEvent>([this](const UploadTerminatedEvent& e) {
            spdlog::info("[UploadTerminated] id={}", e.upload_id);
        });

        bus_.subscribe<UploadExpiredEvent>([this](const UploadExpiredEvent& e) {
            spdlog::info("[UploadExpired] id={}", e.upload_id);
        });

        bus_.subscribe<ServerStartedEvent>([this](const ServerStartedEvent& e) {
            on_server_started(e);
        });

        bus_.subscribe<ServerShuttingDownEvent>([this](const ServerShuttingDownEvent& e) {
            on_server_shutdown(e);
        });
    }

private:
    void on_upload_created(const UploadCreatedEvent& e) {
        spdlog::info("[UploadCreated] id={} length={} partial={}",
            e.upload_id,
            e.total_length ? std::to_string(*e.total_length) : std::string("deferred"),
            e.is_partial);
    }

    void on_chunk_appended(const ChunkAppendedEvent& e) {
        spdlog::debug("[ChunkAppended] id={} offset={}->{} bytes={}",
            e.upload_id, e.previous_offset, e.new_offset, e.bytes_written);
    }

    void on_append_rejected(const AppendRejectedEvent& e) {
        spdlog::debug("[AppendRejected] id={} reason={}", e.upload_id, to_string(e.reason));
    }

    void on_upload_completed(const UploadCompletedEvent& e) {
        spdlog::info("[UploadCompleted] id={} bytes={} duration={}ms",
            e.upload_id, e.total_length, e.duration.count());
    }

    void on_upload_concatenated(const UploadConcatenatedEvent& e) {
        spdlog::info("[UploadConcatenated] id={} parts={} bytes={}",
            e.upload_id, e.parent_ids.size(), e.total_length);
    }

    void on_server_started(const ServerStartedEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("tus server started on port {}", e.port);
        spdlog::info("Storage backend: {}", e.storage_backend);
        spdlog::info("════════════════════════════════════════════");
    }

    void on_server_shutdown(const ServerShuttingDownEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Server shutting down: {}", e.reason);
        spdlog::info("════════════════════════════════════════════");
    }

    EventBus& bus_;
};

/**
 * @brief Metrics component - tracks upload statistics
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * auto& stats = metrics.get_stats();
 * spdlog::info("Bytes received: {}", stats.bytes_received.load());
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> uploads_created{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_concatenated{0};
        std::atomic<uint64_t> uploads_terminated{0};
        std::atomic<uint64_t> uploads_expired{0};
        std::atomic<uint64_t> chunks_appended{0};
        std::atomic<uint64_t> bytes_received{0};
        std::atomic<uint64_t> appends_rejected{0};
        std::atomic<uint64_t> checksum_failures{0};
        std::atomic<uint64_t> offset_conflicts{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadCreatedEvent>([this](const UploadCreatedEvent&) {
            stats_.uploads_created++;
        });

        bus_.subscribe<ChunkAppendedEvent>([this](const ChunkAppendedEvent& e) {
            stats_.chunks_appended++;
            stats_.bytes_received += e.bytes_written;
        });

        bus_.subscribe<AppendRejectedEvent>([this](const AppendRejectedEvent& e) {
            on_append_rejected(e);
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent&) {
            stats_.uploads_completed++;
        });

        bus_.subscribe<UploadConcatenatedEvent>([this](const UploadConcatenatedEvent&) {
            stats_.uploads_concatenated++;
        });

        bus_.subscribe<UploadTerminatedEvent>([this](const UploadTerminatedEvent&) {
            stats_.uploads_terminated++;
        });

        bus_.subscribe<UploadExpiredEvent>([this](const UploadExpiredEvent&) {
            stats_.uploads_expired++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Uploads created:      {}", stats_.uploads_created.load());
        spdlog::info("  Uploads completed:    {}", stats_.uploads_completed.load());
        spdlog::info("  Uploads concatenated: {}", stats_.uploads_concatenated.load());
        spdlog::info("  Uploads terminated:   {}", stats_.uploads_terminated.load());
        spdlog::info("  Uploads expired:      {}", stats_.uploads_expired.load());
        spdlog::info("  Chunks appended:      {}", stats_.chunks_appended.load());
        spdlog::info("  Bytes received:       {}", stats_.bytes_received.load());
        spdlog::info("  Appends rejected:     {}", stats_.appends_rejected.load());
        spdlog::info("  Checksum failures:    {}", stats_.checksum_failures.load());
        spdlog::info("  Offset conflicts:     {}", stats_.offset_conflicts.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_append_rejected(const AppendRejectedEvent& e) {
        stats_.appends_rejected++;
        if (e.reason == ErrorKind::ChecksumMismatch) {
            stats_.checksum_failures++;
        } else if (e.reason == ErrorKind::Conflict) {
            stats_.offset_conflicts++;
        }
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace rus::events
