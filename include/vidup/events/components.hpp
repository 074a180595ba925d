/**
 * @file components.hpp
 * @brief Ready-made observers for upload events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * UploadController controller(api, bus);
 * // Every chunk, status change and outcome is now logged and counted
 */

#pragma once

#include "vidup/events/event_bus.hpp"
#include "vidup/events/events.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <vector>

namespace vidup::events {

/**
 * @brief Logger component - logs all upload events
 *
 * Per-chunk and progress events go to debug so that a 10 GiB upload
 * does not flood the info log with thousands of lines.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        subscriptions_.reserve(12);
        subscriptions_.push_back(bus_.subscribe_scoped<UploadStartedEvent>([](const UploadStartedEvent& e) {
            spdlog::info("[UploadStarted] session={} file={} bytes={}",
                         e.session_id, e.file_name, e.total_size);
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<ChunkAcknowledgedEvent>([](const ChunkAcknowledgedEvent& e) {
            spdlog::debug("[ChunkAcknowledged] session={} chunk={} range=[{}, {}) next={}",
                          e.session_id, e.chunk_index, e.start_offset,
                          e.start_offset + e.length, e.next_offset);
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<UploadProgressEvent>([](const UploadProgressEvent& e) {
            spdlog::debug("[Progress] session={} {}/{} ({}%)",
                          e.session_id, e.offset, e.total_size, e.percent);
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<UploadStatusChangedEvent>([](const UploadStatusChangedEvent& e) {
            spdlog::info("[StatusChanged] session={} {} -> {}",
                         e.session_id, upload::to_string(e.from), upload::to_string(e.to));
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<UploadResumedEvent>([](const UploadResumedEvent& e) {
            spdlog::info("[UploadResumed] session={} offset={}/{} ({}%)",
                         e.session_id, e.offset, e.total_size, e.resume_percent);
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<UploadCompletedEvent>([](const UploadCompletedEvent& e) {
            spdlog::info("[UploadCompleted] session={} video={} bytes={} duration={}ms",
                         e.session_id, e.video_id, e.total_size, e.duration.count());
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<UploadFailedEvent>([](const UploadFailedEvent& e) {
            spdlog::error("[UploadFailed] {}", e.error.describe());
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<ServerStartedEvent>([](const ServerStartedEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("Upload server started on port {}", e.port);
            spdlog::info("════════════════════════════════════════════");
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<ServerShuttingDownEvent>([](const ServerShuttingDownEvent& e) {
            spdlog::info("Upload server shutting down: {}", e.reason);
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<SessionOpenedEvent>([](const SessionOpenedEvent& e) {
            spdlog::info("[SessionOpened] session={} file={} bytes={}",
                         e.session_id, e.file_name, e.total_size);
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<ChunkStoredEvent>([](const ChunkStoredEvent& e) {
            spdlog::debug("[ChunkStored] session={} offset={} length={} committed={}",
                          e.session_id, e.start_offset, e.length, e.committed);
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<VideoPublishedEvent>([](const VideoPublishedEvent& e) {
            spdlog::info("[VideoPublished] session={} video={} title=\"{}\" bytes={}",
                         e.session_id, e.video_id, e.title, e.total_size);
        }));
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    EventBus& bus_;
    std::vector<Subscription> subscriptions_;
};

/**
 * @brief Metrics component - counts upload activity
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> sessions_started{0};
        std::atomic<uint64_t> sessions_resumed{0};
        std::atomic<uint64_t> sessions_completed{0};
        std::atomic<uint64_t> sessions_failed{0};
        std::atomic<uint64_t> chunks_acknowledged{0};
        std::atomic<uint64_t> bytes_acknowledged{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        started_ = bus_.subscribe_scoped<UploadStartedEvent>([this](const UploadStartedEvent&) {
            stats_.sessions_started++;
        });

        resumed_ = bus_.subscribe_scoped<UploadResumedEvent>([this](const UploadResumedEvent&) {
            stats_.sessions_resumed++;
        });

        chunk_ = bus_.subscribe_scoped<ChunkAcknowledgedEvent>([this](const ChunkAcknowledgedEvent& e) {
            stats_.chunks_acknowledged++;
            // Server-confirmed advance, not the request length
            stats_.bytes_acknowledged += e.next_offset - e.start_offset;
        });

        completed_ = bus_.subscribe_scoped<UploadCompletedEvent>([this](const UploadCompletedEvent&) {
            stats_.sessions_completed++;
        });

        failed_ = bus_.subscribe_scoped<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.sessions_failed++;
        });
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Sessions started:   {}", stats_.sessions_started.load());
        spdlog::info("  Sessions resumed:   {}", stats_.sessions_resumed.load());
        spdlog::info("  Sessions completed: {}", stats_.sessions_completed.load());
        spdlog::info("  Sessions failed:    {}", stats_.sessions_failed.load());
        spdlog::info("  Chunks acknowledged:{}", stats_.chunks_acknowledged.load());
        spdlog::info("  Bytes acknowledged: {}", stats_.bytes_acknowledged.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
    Subscription started_;
    Subscription resumed_;
    Subscription chunk_;
    Subscription completed_;
    Subscription failed_;
};

} // namespace vidup::events
