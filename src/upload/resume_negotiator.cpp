#include "vidup/upload/resume_negotiator.hpp"

#include "vidup/events/events.hpp"
#include "vidup/upload/progress_reporter.hpp"

#include <spdlog/spdlog.h>

namespace vidup::upload {

using ControllerResult = UploadResult<std::unique_ptr<UploadController>>;

ResumeNegotiator::ResumeNegotiator(UploadApi& api, events::EventBus& bus,
                                   UploadConfig config, SessionJournal* journal)
    : api_(api), bus_(bus), config_(config), journal_(journal) {}

ControllerResult ResumeNegotiator::resume(const std::string& session_id,
                                          std::shared_ptr<MediaSource> source,
                                          UploadMetadata metadata) {
    if (session_id.empty()) {
        return Err<std::unique_ptr<UploadController>>(query_error(session_id, "Empty session id"));
    }
    if (!source) {
        return Err<std::unique_ptr<UploadController>>(query_error(session_id, "No media source supplied"));
    }

    auto status = api_.query_session(session_id);
    if (status.is_error()) {
        return Err<std::unique_ptr<UploadController>>(
            query_error(session_id, "Status query failed: " + status.error()));
    }

    const SessionStatusResponse& remote = status.value();
    if (remote.file_size == 0) {
        return Err<std::unique_ptr<UploadController>>(
            query_error(session_id, "Server reported an empty file for the session"));
    }
    if (remote.start_offset > remote.file_size) {
        return Err<std::unique_ptr<UploadController>>(query_error(session_id,
            "Server offset " + std::to_string(remote.start_offset) +
            " exceeds file size " + std::to_string(remote.file_size)));
    }

    if (source->size() != remote.file_size) {
        spdlog::warn("Resume of {}: source {} has {} bytes, session expects {}",
                     session_id, source->name(), source->size(), remote.file_size);
    }
    if (!remote.file_name.empty() && source->name() != remote.file_name) {
        spdlog::warn("Resume of {}: source name '{}' differs from session file '{}'",
                     session_id, source->name(), remote.file_name);
    }

    UploadSession session;
    session.session_id = session_id;
    session.file_name = remote.file_name.empty() ? source->name() : remote.file_name;
    session.total_size = remote.file_size;
    session.offset = remote.start_offset;
    session.chunk_size = config_.chunk_size;
    session.metadata = std::move(metadata);

    auto controller = std::make_unique<UploadController>(api_, bus_, config_);
    controller->adopt(std::move(session), std::move(source));

    const int resume_percent = ProgressReporter::percent(remote.start_offset, remote.file_size);
    spdlog::info("Negotiated resume of {} at {}/{} bytes ({}%)",
                 session_id, remote.start_offset, remote.file_size, resume_percent);

    bus_.emit(events::UploadResumedEvent{session_id, remote.start_offset, remote.file_size, resume_percent});
    ProgressReporter(bus_).report(controller->session());

    return Ok(std::move(controller));
}

ControllerResult ResumeNegotiator::resume_from_journal(const std::string& key,
                                                       std::shared_ptr<MediaSource> source,
                                                       UploadMetadata metadata) {
    if (journal_ == nullptr) {
        return Err<std::unique_ptr<UploadController>>(query_error("", "No session journal configured"));
    }

    auto entry = journal_->load(key).map_error([this](const std::string& message) {
        return query_error("", message);
    });
    if (entry.is_error()) {
        return Err<std::unique_ptr<UploadController>>(entry.error());
    }

    if (metadata.title.empty()) {
        metadata.title = entry.value().metadata.title;
    }
    if (metadata.description.empty()) {
        metadata.description = entry.value().metadata.description;
    }

    auto controller = resume(entry.value().session_id, std::move(source), std::move(metadata));
    if (controller.is_ok()) {
        controller.value()->attach_journal(journal_, key);
    }
    return controller;
}

UploadError ResumeNegotiator::query_error(const std::string& session_id, std::string message) const {
    UploadError error;
    error.kind = ErrorKind::ResumeQuery;
    error.message = std::move(message);
    error.session_id = session_id;
    spdlog::error("{}", error.describe());
    return error;
}

} // namespace vidup::upload
