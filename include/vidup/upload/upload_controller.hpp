#pragma once

#include "vidup/events/event_bus.hpp"
#include "vidup/upload/chunk_transmitter.hpp"
#include "vidup/upload/media_source.hpp"
#include "vidup/upload/progress_reporter.hpp"
#include "vidup/upload/session_journal.hpp"
#include "vidup/upload/types.hpp"
#include "vidup/upload/upload_api.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace vidup::upload {

class ResumeNegotiator;

/**
 * @brief Owns one UploadSession and drives start -> transfer -> finalize
 *
 * STATE MACHINE:
 *   Idle      -> Uploading | Failed
 *   Uploading -> Paused | Completed | Failed
 *   Paused    -> Uploading | Failed
 *   Completed, Failed: terminal
 *
 * THREADING:
 * start_upload() and resume() run the transfer loop on the calling thread
 * and return when the loop stops (paused, completed or failed). pause()
 * and cancel() only raise atomic flags and may be called from any thread,
 * including event handlers invoked from inside the loop. The flags are
 * checked once per iteration, before the next chunk is issued, so the
 * in-flight chunk always completes first.
 *
 * start_upload(), resume() and a direct cancel() each hold the running
 * flag for their whole duration, from validation through the last emit.
 * A cancel() that finds the flag taken only raises cancel_requested_, so
 * a Cancelled failure is reported exactly once. A second entry point
 * called while one is active is rejected with ErrorKind::InvalidState.
 *
 * All other session fields have a single writer (the flag holder).
 *
 * EXAMPLE:
 * @code
 * EventBus bus;
 * HttpUploadApi api(config);
 * UploadController controller(api, bus);
 * auto source = FileMediaSource::open("talk.mp4");
 * auto result = controller.start_upload(std::move(source.value()), {"Title", "Desc"});
 * if (result.is_error()) {
 *     spdlog::error("{}", result.error().describe());
 * }
 * @endcode
 */
class UploadController {
public:
    UploadController(UploadApi& api, events::EventBus& bus, UploadConfig config = {});

    UploadController(const UploadController&) = delete;
    UploadController& operator=(const UploadController&) = delete;

    /**
     * @brief Open a server session and upload the source
     *
     * Rejects sources at or below the resumable threshold with
     * ErrorKind::Validation before contacting the server.
     *
     * @return Ok when the loop stopped on pause or completion
     */
    UploadResult<void> start_upload(std::shared_ptr<MediaSource> source, UploadMetadata metadata = {});

    /// Request a cooperative pause at the next chunk boundary
    void pause() noexcept;

    /**
     * @brief Continue a paused session from its confirmed offset
     *
     * Valid only in Paused, which is also the state a ResumeNegotiator
     * hands controllers over in.
     */
    UploadResult<void> resume();

    /// Abandon the upload; irreversible. No server-side abort is issued.
    void cancel();

    /**
     * @brief Persist the descriptor under `key` while the upload runs
     *
     * The journal must outlive the controller. Pass nullptr to detach.
     */
    void attach_journal(SessionJournal* journal, std::string key);

    [[nodiscard]] const UploadSession& session() const noexcept { return session_; }
    [[nodiscard]] UploadStatus status() const noexcept { return session_.status; }
    [[nodiscard]] int percent() const noexcept {
        return ProgressReporter::percent(session_.offset, session_.total_size);
    }
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] std::uint64_t chunks_sent() const noexcept { return chunks_sent_; }
    [[nodiscard]] const std::string& video_id() const noexcept { return video_id_; }

private:
    friend class ResumeNegotiator;

    /// Take over an existing server session in the Paused state
    void adopt(UploadSession session, std::shared_ptr<MediaSource> source);

    /// Caller holds running_
    UploadResult<void> run_transfer_loop();
    UploadResult<void> finalize();

    Result<void> transition_to(UploadStatus next);
    [[nodiscard]] bool can_transition(UploadStatus target) const noexcept;

    UploadError make_error(ErrorKind kind, std::string message) const;
    UploadResult<void> fail(ErrorKind kind, std::string message);
    UploadResult<void> reject(ErrorKind kind, std::string message) const;

    void checkpoint();
    void forget_journal_entry();

    UploadApi& api_;
    events::EventBus& bus_;
    UploadConfig config_;
    ChunkTransmitter transmitter_;
    ProgressReporter progress_;

    UploadSession session_;
    std::shared_ptr<MediaSource> source_;

    std::atomic<bool> pause_requested_{false};
    std::atomic<bool> cancel_requested_{false};
    std::atomic<bool> running_{false};

    std::uint64_t chunks_sent_ = 0;
    std::string video_id_;
    std::chrono::steady_clock::time_point started_at_{};

    SessionJournal* journal_ = nullptr;
    std::string journal_key_;
};

} // namespace vidup::upload
