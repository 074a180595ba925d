#pragma once

#include "vidup/core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vidup::upload {

constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;
constexpr std::uint64_t kGiB = 1024ULL * kMiB;

/// Bytes per chunk request; the final chunk may be shorter
constexpr std::uint64_t kDefaultChunkSize = 4 * kMiB;

/// Files at or below this size go through the direct (non-resumable) path
constexpr std::uint64_t kResumableThreshold = 1 * kGiB;

enum class UploadStatus {
    Idle,
    Uploading,
    Paused,
    Completed,
    Failed
};

const char* to_string(UploadStatus status) noexcept;

inline bool is_terminal(UploadStatus status) noexcept {
    return status == UploadStatus::Completed || status == UploadStatus::Failed;
}

/**
 * @brief Tunables for one controller
 *
 * Defaults reproduce the production behaviour; tests shrink both values
 * so that scenarios run against a few MiB of data.
 */
struct UploadConfig {
    std::uint64_t chunk_size = kDefaultChunkSize;
    std::uint64_t resumable_threshold = kResumableThreshold;
};

/**
 * @brief Caller-supplied metadata forwarded verbatim to the finish call
 */
struct UploadMetadata {
    std::string title;
    std::string description;
};

/**
 * @brief Descriptor of one resumable upload
 *
 * offset is only ever assigned from a server response.
 */
struct UploadSession {
    std::string session_id;
    std::string file_name;
    std::uint64_t total_size = 0;
    std::uint64_t offset = 0;
    std::uint64_t chunk_size = kDefaultChunkSize;
    UploadStatus status = UploadStatus::Idle;
    UploadMetadata metadata;
    std::string last_error; ///< Populated when status == Failed
};

// ════════════════════════════════════════════════════════
// Errors
// ════════════════════════════════════════════════════════

enum class ErrorKind {
    Validation,       ///< Rejected before any server call
    SessionCreation,  ///< Server refused to open a session
    Transfer,         ///< A chunk could not be read, sent or acknowledged
    Finalization,     ///< All bytes sent but finish failed
    ResumeQuery,      ///< Status query for an existing session failed
    InvalidState,     ///< Operation not allowed in the current status
    Cancelled         ///< Caller abandoned the upload
};

const char* to_string(ErrorKind kind) noexcept;

/**
 * @brief Error reported to the caller at the point of failure
 *
 * Carries enough context (session id, confirmed offset, status) for the
 * caller to decide between a fresh start and a resume.
 */
struct UploadError {
    ErrorKind kind = ErrorKind::Transfer;
    std::string message;
    std::string session_id;
    std::uint64_t offset = 0;
    UploadStatus status = UploadStatus::Idle;

    std::string describe() const;
};

template<typename T>
using UploadResult = vidup::Result<T, UploadError>;

// ════════════════════════════════════════════════════════
// Server contract payloads
// ════════════════════════════════════════════════════════

struct StartRequest {
    std::uint64_t total_size = 0;
    std::string file_name;
    std::string title;
    std::string description;
};

struct StartResponse {
    std::string session_id;
};

struct ChunkRequest {
    std::string session_id;
    std::uint64_t start_offset = 0;
    std::vector<std::uint8_t> data;
};

/**
 * @brief Chunk acknowledgement
 *
 * start_offset is the NEXT offset the server expects. The name matches the
 * request field on purpose.
 */
struct ChunkResponse {
    std::uint64_t start_offset = 0;
};

struct FinishRequest {
    std::string session_id;
    std::string title;
    std::string description;
};

struct FinishResponse {
    bool success = false;
    std::string video_id;
};

struct SessionStatusResponse {
    std::uint64_t start_offset = 0;
    std::uint64_t file_size = 0;
    std::string file_name;
};

/// Readiness of a finalized video on the server side
enum class ProcessingState {
    Processing,
    Ready,
    Failed
};

const char* to_string(ProcessingState state) noexcept;
Result<ProcessingState> processing_state_from_string(const std::string& text);

} // namespace vidup::upload
