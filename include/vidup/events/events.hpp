/**
 * @file events.hpp
 * @brief Event type definitions for the upload client and server
 *
 * WHY THIS FILE EXISTS:
 * The upload controller never talks to the UI directly. Everything a
 * collaborator may observe (progress, status changes, terminal outcome)
 * is published as one of these events on the EventBus.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: UploadStartedEvent, ChunkAcknowledgedEvent
 */

#pragma once

#include "vidup/upload/types.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace vidup::events {

// ════════════════════════════════════════════════════════
// Client Upload Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once the server has issued a session id
 *
 * WHO EMITS: UploadController::start_upload
 * WHO SUBSCRIBES: Logger, Metrics, UI
 */
struct UploadStartedEvent {
    std::string session_id;
    std::string file_name;
    std::uint64_t total_size = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted after the server acknowledged one chunk
 *
 * next_offset is the server's value and may differ from
 * start_offset + length when the server deduplicated bytes.
 */
struct ChunkAcknowledgedEvent {
    std::string session_id;
    std::uint64_t chunk_index = 0;
    std::uint64_t start_offset = 0;
    std::uint64_t length = 0;
    std::uint64_t next_offset = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Derived progress, emitted after every chunk and after resume
 *
 * WHO EMITS: ProgressReporter
 * WHO SUBSCRIBES: UI progress bar, Logger
 */
struct UploadProgressEvent {
    std::string session_id;
    std::uint64_t offset = 0;
    std::uint64_t total_size = 0;
    int percent = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted on every state machine transition
 */
struct UploadStatusChangedEvent {
    std::string session_id;
    upload::UploadStatus from = upload::UploadStatus::Idle;
    upload::UploadStatus to = upload::UploadStatus::Idle;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when a controller is reattached to an existing session
 *
 * WHO EMITS: ResumeNegotiator
 */
struct UploadResumedEvent {
    std::string session_id;
    std::uint64_t offset = 0;
    std::uint64_t total_size = 0;
    int resume_percent = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Terminal success: bytes committed and finish succeeded
 */
struct UploadCompletedEvent {
    std::string session_id;
    std::uint64_t total_size = 0;
    std::string video_id;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Terminal failure (including cancellation)
 */
struct UploadFailedEvent {
    upload::UploadError error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when server starts
 *
 * WHO EMITS: main() startup
 * WHO SUBSCRIBES: Any component that needs initialization
 */
struct ServerStartedEvent {
    uint16_t port;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerStartedEvent(uint16_t p)
        : port(p),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted when server is shutting down
 */
struct ServerShuttingDownEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerShuttingDownEvent(std::string r)
        : reason(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

struct SessionOpenedEvent {
    std::string session_id;
    std::string file_name;
    std::uint64_t total_size = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ChunkStoredEvent {
    std::string session_id;
    std::uint64_t start_offset = 0;
    std::uint64_t length = 0;
    std::uint64_t committed = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct VideoPublishedEvent {
    std::string session_id;
    std::string video_id;
    std::string title;
    std::uint64_t total_size = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace vidup::events
