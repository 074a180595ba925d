#pragma once

#include "vidup/core/result.hpp"
#include "vidup/events/event_bus.hpp"
#include "vidup/server/staging_store.hpp"
#include "vidup/upload/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace vidup::server {

enum class ServiceErrorCode {
    BadRequest,      ///< Malformed or out-of-range input
    NotFound,        ///< Unknown session id
    OffsetMismatch,  ///< Chunk does not start at the committed offset
    QuotaExceeded,   ///< total_size above max_upload_bytes
    Conflict,        ///< Operation not valid in the session's current phase
    Storage          ///< Disk I/O failed
};

struct ServiceError {
    ServiceErrorCode code = ServiceErrorCode::BadRequest;
    std::string message;
};

template<typename T>
using ServiceResult = vidup::Result<T, ServiceError>;

/**
 * @brief Server-side state of one resumable upload
 */
struct UploadRecord {
    std::string session_id;
    std::string file_name;
    std::uint64_t total_size = 0;
    std::uint64_t committed = 0;
    std::string title;
    std::string description;
    bool finished = false;
    bool publishing = false;  ///< A finish is hashing or moving the staged file
    std::string video_id;
    upload::ProcessingState processing = upload::ProcessingState::Processing;
    std::filesystem::path published_path;
    std::chrono::steady_clock::time_point created_at{std::chrono::steady_clock::now()};
};

/**
 * @brief Reference implementation of the resumable upload protocol
 *
 * WHAT IT ENFORCES:
 * - A chunk is accepted only at the committed offset (strictly sequential)
 * - Bytes beyond total_size are rejected
 * - finish succeeds only once committed == total_size; a repeated finish
 *   returns the same video id
 *
 * THREADING: one mutex guards the registry and the staging writes, so
 * concurrent connections for the same session serialize. finish_session()
 * hashes and publishes outside the lock with the record marked publishing;
 * other finishes and appends for that session get Conflict meanwhile.
 * Events are emitted after the lock is released.
 */
class UploadService {
public:
    UploadService(std::filesystem::path data_root,
                  events::EventBus& bus,
                  std::uint64_t max_upload_bytes = 0);

    ServiceResult<std::string> start_session(const upload::StartRequest& request);

    /// @return New committed offset (the next offset the client should send)
    ServiceResult<std::uint64_t> append_chunk(const std::string& session_id,
                                              std::uint64_t start_offset,
                                              const std::vector<std::uint8_t>& data);

    ServiceResult<upload::FinishResponse> finish_session(const std::string& session_id,
                                                         const std::string& title,
                                                         const std::string& description);

    ServiceResult<upload::SessionStatusResponse> session_status(const std::string& session_id) const;

    ServiceResult<upload::ProcessingState> processing_state(const std::string& session_id) const;

    /// Copy of the record, for inspection
    ServiceResult<UploadRecord> record(const std::string& session_id) const;

    std::size_t session_count() const;

    const StagingStore& staging() const noexcept { return staging_; }

private:
    std::string generate_session_id();

    ServiceResult<UploadRecord*> find_session(const std::string& session_id);
    ServiceResult<const UploadRecord*> find_session(const std::string& session_id) const;

    events::EventBus& event_bus_;
    StagingStore staging_;
    std::uint64_t max_upload_bytes_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, UploadRecord> sessions_;
    std::mt19937_64 rng_;
    std::atomic<std::uint64_t> video_counter_{0};
};

const char* to_string(ServiceErrorCode code) noexcept;

} // namespace vidup::server
