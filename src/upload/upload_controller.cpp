#include "vidup/upload/upload_controller.hpp"

#include "vidup/events/events.hpp"

#include <spdlog/spdlog.h>

namespace vidup::upload {

namespace {

// Claims the running flag for one entry point and releases it on every
// exit path. Only the holder may touch the session.
class ActiveGuard {
public:
    explicit ActiveGuard(std::atomic<bool>& flag) : flag_(flag), owned_(!flag.exchange(true)) {}
    ~ActiveGuard() {
        if (owned_) {
            flag_.store(false);
        }
    }

    ActiveGuard(const ActiveGuard&) = delete;
    ActiveGuard& operator=(const ActiveGuard&) = delete;

    bool owned() const noexcept { return owned_; }

private:
    std::atomic<bool>& flag_;
    bool owned_;
};

// Built without reading the session, which belongs to the other caller
UploadResult<void> busy(const char* operation) {
    UploadError error;
    error.kind = ErrorKind::InvalidState;
    error.message = std::string(operation) + " called while another operation is running";
    spdlog::warn("Upload request rejected: {}", error.message);
    return Err<void>(std::move(error));
}

} // namespace

UploadController::UploadController(UploadApi& api, events::EventBus& bus, UploadConfig config)
    : api_(api),
      bus_(bus),
      config_(config),
      transmitter_(api),
      progress_(bus) {
    session_.chunk_size = config_.chunk_size;
}

UploadResult<void> UploadController::start_upload(std::shared_ptr<MediaSource> source,
                                                  UploadMetadata metadata) {
    ActiveGuard active(running_);
    if (!active.owned()) {
        return busy("start_upload");
    }
    if (session_.status != UploadStatus::Idle) {
        return reject(ErrorKind::InvalidState,
                      std::string("start_upload requires idle status, current: ") +
                      to_string(session_.status));
    }
    if (!source) {
        return reject(ErrorKind::Validation, "No media source supplied");
    }
    if (source->name().empty()) {
        return reject(ErrorKind::Validation, "Media source has no file name");
    }
    if (config_.chunk_size == 0) {
        return reject(ErrorKind::Validation, "Chunk size must be positive");
    }
    if (source->size() <= config_.resumable_threshold) {
        return reject(ErrorKind::Validation,
                      "File size " + std::to_string(source->size()) +
                      " does not exceed resumable threshold " +
                      std::to_string(config_.resumable_threshold) +
                      "; use the direct upload path");
    }

    source_ = std::move(source);
    session_.file_name = source_->name();
    session_.total_size = source_->size();
    session_.offset = 0;
    session_.chunk_size = config_.chunk_size;
    session_.metadata = std::move(metadata);
    started_at_ = std::chrono::steady_clock::now();

    StartRequest request;
    request.total_size = session_.total_size;
    request.file_name = session_.file_name;
    request.title = session_.metadata.title;
    request.description = session_.metadata.description;

    auto response = api_.start_session(request);
    if (response.is_error()) {
        return fail(ErrorKind::SessionCreation, "Failed to start session: " + response.error());
    }
    if (response.value().session_id.empty()) {
        return fail(ErrorKind::SessionCreation, "Server returned an empty session id");
    }

    session_.session_id = response.value().session_id;
    if (auto moved = transition_to(UploadStatus::Uploading); moved.is_error()) {
        return reject(ErrorKind::InvalidState, moved.error());
    }

    spdlog::info("Upload session {} opened for {} ({} bytes)",
                 session_.session_id, session_.file_name, session_.total_size);
    bus_.emit(events::UploadStartedEvent{session_.session_id, session_.file_name, session_.total_size});
    checkpoint();

    return run_transfer_loop();
}

void UploadController::pause() noexcept {
    pause_requested_.store(true);
}

UploadResult<void> UploadController::resume() {
    ActiveGuard active(running_);
    if (!active.owned()) {
        return busy("resume");
    }
    if (session_.status != UploadStatus::Paused) {
        return reject(ErrorKind::InvalidState,
                      std::string("resume requires paused status, current: ") +
                      to_string(session_.status));
    }
    if (!source_) {
        return reject(ErrorKind::InvalidState, "Paused session has no media source attached");
    }

    pause_requested_.store(false);
    if (auto moved = transition_to(UploadStatus::Uploading); moved.is_error()) {
        return reject(ErrorKind::InvalidState, moved.error());
    }
    spdlog::info("Resuming session {} at offset {}/{}",
                 session_.session_id, session_.offset, session_.total_size);

    return run_transfer_loop();
}

void UploadController::cancel() {
    cancel_requested_.store(true);
    ActiveGuard active(running_);
    if (!active.owned()) {
        // The active start_upload() or resume() observes the flag before
        // its next chunk
        return;
    }
    if (is_terminal(session_.status)) {
        return;
    }
    auto result = fail(ErrorKind::Cancelled, "Upload cancelled");
    spdlog::info("{}", result.error().describe());
}

void UploadController::attach_journal(SessionJournal* journal, std::string key) {
    journal_ = journal;
    journal_key_ = std::move(key);
    checkpoint();
}

void UploadController::adopt(UploadSession session, std::shared_ptr<MediaSource> source) {
    const UploadStatus previous = session_.status;
    session_ = std::move(session);
    session_.status = UploadStatus::Paused;
    session_.chunk_size = config_.chunk_size;
    source_ = std::move(source);
    started_at_ = std::chrono::steady_clock::now();

    bus_.emit(events::UploadStatusChangedEvent{session_.session_id, previous, session_.status});
}

UploadResult<void> UploadController::run_transfer_loop() {
    while (true) {
        if (cancel_requested_.load()) {
            return fail(ErrorKind::Cancelled, "Upload cancelled");
        }
        if (session_.offset == session_.total_size) {
            return finalize();
        }
        if (pause_requested_.load()) {
            if (auto moved = transition_to(UploadStatus::Paused); moved.is_error()) {
                return reject(ErrorKind::InvalidState, moved.error());
            }
            spdlog::info("Session {} paused at offset {}/{}",
                         session_.session_id, session_.offset, session_.total_size);
            checkpoint();
            return Ok<UploadError>();
        }

        const std::uint64_t start = session_.offset;
        const std::uint64_t length = ChunkTransmitter::next_chunk_length(session_);

        auto next = transmitter_.send_chunk(session_, *source_);
        if (next.is_error()) {
            return fail(ErrorKind::Transfer, next.error().message);
        }

        session_.offset = next.value();
        ++chunks_sent_;

        bus_.emit(events::ChunkAcknowledgedEvent{
            session_.session_id, chunks_sent_, start, length, session_.offset});
        progress_.report(session_);
        checkpoint();
    }
}

UploadResult<void> UploadController::finalize() {
    FinishRequest request;
    request.session_id = session_.session_id;
    request.title = session_.metadata.title;
    request.description = session_.metadata.description;

    auto response = api_.finish_session(request);
    if (response.is_error()) {
        return fail(ErrorKind::Finalization, "Finish failed: " + response.error());
    }
    if (!response.value().success) {
        return fail(ErrorKind::Finalization, "Server reported finish failure");
    }

    video_id_ = response.value().video_id;
    if (auto moved = transition_to(UploadStatus::Completed); moved.is_error()) {
        return reject(ErrorKind::InvalidState, moved.error());
    }
    forget_journal_entry();

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at_);
    spdlog::info("Upload {} completed: video_id={} ({} ms)",
                 session_.session_id, video_id_, elapsed.count());
    bus_.emit(events::UploadCompletedEvent{session_.session_id, session_.total_size, video_id_, elapsed});

    return Ok<UploadError>();
}

Result<void> UploadController::transition_to(UploadStatus next) {
    if (!can_transition(next)) {
        return Err<void>(std::string("Invalid transition from ") + to_string(session_.status) +
                         " to " + to_string(next));
    }

    const UploadStatus previous = session_.status;
    session_.status = next;
    spdlog::debug("Session {}: {} -> {}", session_.session_id, to_string(previous), to_string(next));
    bus_.emit(events::UploadStatusChangedEvent{session_.session_id, previous, next});
    return Ok();
}

bool UploadController::can_transition(UploadStatus target) const noexcept {
    switch (session_.status) {
        case UploadStatus::Idle:
            return target == UploadStatus::Uploading || target == UploadStatus::Failed;
        case UploadStatus::Uploading:
            return target == UploadStatus::Paused ||
                   target == UploadStatus::Completed ||
                   target == UploadStatus::Failed;
        case UploadStatus::Paused:
            return target == UploadStatus::Uploading || target == UploadStatus::Failed;
        case UploadStatus::Completed:
        case UploadStatus::Failed:
            return false;
    }
    return false;
}

UploadError UploadController::make_error(ErrorKind kind, std::string message) const {
    UploadError error;
    error.kind = kind;
    error.message = std::move(message);
    error.session_id = session_.session_id;
    error.offset = session_.offset;
    error.status = session_.status;
    return error;
}

UploadResult<void> UploadController::fail(ErrorKind kind, std::string message) {
    if (auto moved = transition_to(UploadStatus::Failed); moved.is_error()) {
        return reject(ErrorKind::InvalidState, moved.error());
    }
    session_.last_error = message;

    UploadError error = make_error(kind, std::move(message));
    // The server session usually survives a failure; keep the descriptor
    // so a new controller can be negotiated onto it later.
    checkpoint();
    if (kind == ErrorKind::Cancelled) {
        spdlog::info("Session {} cancelled at offset {}", session_.session_id, session_.offset);
    } else {
        spdlog::error("{}", error.describe());
    }

    bus_.emit(events::UploadFailedEvent{error});
    return Err<void>(std::move(error));
}

UploadResult<void> UploadController::reject(ErrorKind kind, std::string message) const {
    spdlog::warn("Upload request rejected: {}", message);
    return Err<void>(make_error(kind, std::move(message)));
}

void UploadController::checkpoint() {
    if (journal_ == nullptr || session_.session_id.empty()) {
        return;
    }
    auto saved = journal_->save(journal_key_, session_);
    if (saved.is_error()) {
        spdlog::warn("Journal checkpoint for {} failed: {}", session_.session_id, saved.error());
    }
}

void UploadController::forget_journal_entry() {
    if (journal_ == nullptr || !journal_->contains(journal_key_)) {
        return;
    }
    auto removed = journal_->remove(journal_key_);
    if (removed.is_error()) {
        spdlog::warn("Failed to remove journal entry {}: {}", journal_key_, removed.error());
    }
}

} // namespace vidup::upload
