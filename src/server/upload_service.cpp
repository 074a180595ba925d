#include "vidup/server/upload_service.hpp"

#include "vidup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <sstream>

namespace vidup::server {
namespace fs = std::filesystem;

namespace {

template<typename T>
ServiceResult<T> fail(ServiceErrorCode code, std::string message) {
    return Err<T>(ServiceError{code, std::move(message)});
}

bool valid_file_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of("/\\") == std::string::npos &&
           name.find('\0') == std::string::npos;
}

} // namespace

const char* to_string(ServiceErrorCode code) noexcept {
    switch (code) {
        case ServiceErrorCode::BadRequest: return "bad_request";
        case ServiceErrorCode::NotFound: return "not_found";
        case ServiceErrorCode::OffsetMismatch: return "offset_mismatch";
        case ServiceErrorCode::QuotaExceeded: return "quota_exceeded";
        case ServiceErrorCode::Conflict: return "conflict";
        case ServiceErrorCode::Storage: return "storage";
    }
    return "unknown";
}

UploadService::UploadService(fs::path data_root,
                             events::EventBus& bus,
                             std::uint64_t max_upload_bytes)
    : event_bus_(bus),
      staging_(std::move(data_root)),
      max_upload_bytes_(max_upload_bytes),
      rng_(std::random_device{}()) {
}

ServiceResult<std::string> UploadService::start_session(const upload::StartRequest& request) {
    if (request.total_size == 0) {
        return fail<std::string>(ServiceErrorCode::BadRequest, "total_size must be positive");
    }
    if (!valid_file_name(request.file_name)) {
        return fail<std::string>(ServiceErrorCode::BadRequest,
                                 "Invalid file_name: '" + request.file_name + "'");
    }
    if (max_upload_bytes_ != 0 && request.total_size > max_upload_bytes_) {
        return fail<std::string>(ServiceErrorCode::QuotaExceeded,
                                 "Upload of " + std::to_string(request.total_size) +
                                 " bytes exceeds limit of " + std::to_string(max_upload_bytes_));
    }

    std::string session_id;
    {
        std::lock_guard lock(mutex_);
        session_id = generate_session_id();

        UploadRecord record;
        record.session_id = session_id;
        record.file_name = request.file_name;
        record.total_size = request.total_size;
        record.title = request.title;
        record.description = request.description;
        sessions_.emplace(session_id, std::move(record));
    }

    spdlog::info("Opened upload session {} for {} ({} bytes)",
                 session_id, request.file_name, request.total_size);
    event_bus_.emit(events::SessionOpenedEvent{session_id, request.file_name, request.total_size});
    return Ok(std::move(session_id));
}

ServiceResult<std::uint64_t> UploadService::append_chunk(const std::string& session_id,
                                                         std::uint64_t start_offset,
                                                         const std::vector<std::uint8_t>& data) {
    std::uint64_t committed = 0;
    {
        std::lock_guard lock(mutex_);
        auto found = find_session(session_id);
        if (found.is_error()) {
            return Err<std::uint64_t>(found.error());
        }
        UploadRecord* record = found.value();

        if (record->finished || record->publishing) {
            return fail<std::uint64_t>(ServiceErrorCode::Conflict, "Session already finished");
        }
        if (data.empty()) {
            return fail<std::uint64_t>(ServiceErrorCode::BadRequest, "Empty chunk");
        }
        if (start_offset != record->committed) {
            return fail<std::uint64_t>(ServiceErrorCode::OffsetMismatch,
                                       "Expected offset " + std::to_string(record->committed) +
                                       ", got " + std::to_string(start_offset));
        }
        if (data.size() > record->total_size - record->committed) {
            return fail<std::uint64_t>(ServiceErrorCode::BadRequest,
                                       "Chunk of " + std::to_string(data.size()) +
                                       " bytes runs past total size " + std::to_string(record->total_size));
        }

        auto written = staging_.append(session_id, start_offset, data);
        if (written.is_error()) {
            spdlog::error("Staging write failed: {}", written.error());
            return fail<std::uint64_t>(ServiceErrorCode::Storage, written.error());
        }
        record->committed += data.size();
        committed = record->committed;
    }

    spdlog::debug("Session {} committed {} bytes", session_id, committed);
    event_bus_.emit(events::ChunkStoredEvent{session_id, start_offset, data.size(), committed});
    return Ok(committed);
}

ServiceResult<upload::FinishResponse> UploadService::finish_session(const std::string& session_id,
                                                                    const std::string& title,
                                                                    const std::string& description) {
    upload::FinishResponse response;
    std::string file_name;
    {
        std::lock_guard lock(mutex_);
        auto found = find_session(session_id);
        if (found.is_error()) {
            return Err<upload::FinishResponse>(found.error());
        }
        UploadRecord* record = found.value();

        if (record->finished) {
            response.success = true;
            response.video_id = record->video_id;
            return Ok(std::move(response));
        }
        if (record->publishing) {
            return fail<upload::FinishResponse>(ServiceErrorCode::Conflict, "Finish already in progress");
        }
        if (record->committed != record->total_size) {
            return fail<upload::FinishResponse>(ServiceErrorCode::Conflict,
                "Upload incomplete: " + std::to_string(record->committed) + " of " +
                std::to_string(record->total_size) + " bytes");
        }
        record->publishing = true;
        file_name = record->file_name;
    }

    // Hash and move the staged file without the registry lock. The staged
    // copy stays in place until the rename succeeds, so a failed finish can
    // be retried.
    auto digest = staging_.staged_checksum(session_id);
    Result<fs::path> path = digest.is_ok()
        ? staging_.publish(session_id, file_name)
        : Err<fs::path>(digest.error());

    UploadRecord published;
    {
        std::lock_guard lock(mutex_);
        auto found = find_session(session_id);
        if (found.is_error()) {
            return Err<upload::FinishResponse>(found.error());
        }
        UploadRecord* record = found.value();
        record->publishing = false;

        if (path.is_error()) {
            spdlog::error("Publishing {} failed: {}", session_id, path.error());
            return fail<upload::FinishResponse>(ServiceErrorCode::Storage, path.error());
        }

        if (!title.empty()) {
            record->title = title;
        }
        if (!description.empty()) {
            record->description = description;
        }
        record->finished = true;
        record->published_path = path.value();
        record->video_id = "vid-" + std::to_string(++video_counter_) + "-" + digest.value();
        record->processing = upload::ProcessingState::Ready;

        response.success = true;
        response.video_id = record->video_id;
        published = *record;
    }

    spdlog::info("Published {} as {} ({})", published.file_name, published.video_id,
                 published.published_path.string());
    event_bus_.emit(events::VideoPublishedEvent{
        session_id, published.video_id, published.title, published.total_size});
    return Ok(std::move(response));
}

ServiceResult<upload::SessionStatusResponse> UploadService::session_status(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    auto found = find_session(session_id);
    if (found.is_error()) {
        return Err<upload::SessionStatusResponse>(found.error());
    }
    const UploadRecord* record = found.value();
    return Ok(upload::SessionStatusResponse{record->committed, record->total_size, record->file_name});
}

ServiceResult<upload::ProcessingState> UploadService::processing_state(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    auto found = find_session(session_id);
    if (found.is_error()) {
        return Err<upload::ProcessingState>(found.error());
    }
    if (!found.value()->finished) {
        return fail<upload::ProcessingState>(ServiceErrorCode::Conflict, "Session has not been finished");
    }
    return Ok(found.value()->processing);
}

ServiceResult<UploadRecord> UploadService::record(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    auto found = find_session(session_id);
    if (found.is_error()) {
        return Err<UploadRecord>(found.error());
    }
    return Ok(*found.value());
}

std::size_t UploadService::session_count() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

std::string UploadService::generate_session_id() {
    std::string candidate;
    do {
        std::ostringstream oss;
        oss << std::hex << std::setw(16) << std::setfill('0') << rng_();
        candidate = oss.str();
    } while (sessions_.count(candidate) > 0);
    return candidate;
}

ServiceResult<UploadRecord*> UploadService::find_session(const std::string& session_id) {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return fail<UploadRecord*>(ServiceErrorCode::NotFound, "Unknown session: " + session_id);
    }
    return Ok(&it->second);
}

ServiceResult<const UploadRecord*> UploadService::find_session(const std::string& session_id) const {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return fail<const UploadRecord*>(ServiceErrorCode::NotFound, "Unknown session: " + session_id);
    }
    return Ok(static_cast<const UploadRecord*>(&it->second));
}

} // namespace vidup::server
