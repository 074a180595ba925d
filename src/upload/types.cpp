#include "vidup/upload/types.hpp"

#include <sstream>

namespace vidup::upload {

const char* to_string(UploadStatus status) noexcept {
    switch (status) {
        case UploadStatus::Idle: return "idle";
        case UploadStatus::Uploading: return "uploading";
        case UploadStatus::Paused: return "paused";
        case UploadStatus::Completed: return "completed";
        case UploadStatus::Failed: return "failed";
    }
    return "unknown";
}

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::SessionCreation: return "session_creation";
        case ErrorKind::Transfer: return "transfer";
        case ErrorKind::Finalization: return "finalization";
        case ErrorKind::ResumeQuery: return "resume_query";
        case ErrorKind::InvalidState: return "invalid_state";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* to_string(ProcessingState state) noexcept {
    switch (state) {
        case ProcessingState::Processing: return "PROCESSING";
        case ProcessingState::Ready: return "READY";
        case ProcessingState::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

Result<ProcessingState> processing_state_from_string(const std::string& text) {
    if (text == "PROCESSING") return Ok(ProcessingState::Processing);
    if (text == "READY") return Ok(ProcessingState::Ready);
    if (text == "FAILED") return Ok(ProcessingState::Failed);
    return Err<ProcessingState>(std::string("Unknown processing state: ") + text);
}

std::string UploadError::describe() const {
    std::ostringstream oss;
    oss << to_string(kind) << " error: " << message;
    if (!session_id.empty()) {
        oss << " (session=" << session_id << ", offset=" << offset
            << ", status=" << to_string(status) << ")";
    }
    return oss.str();
}

} // namespace vidup::upload
