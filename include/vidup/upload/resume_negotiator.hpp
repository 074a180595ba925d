#pragma once

#include "vidup/events/event_bus.hpp"
#include "vidup/upload/media_source.hpp"
#include "vidup/upload/session_journal.hpp"
#include "vidup/upload/types.hpp"
#include "vidup/upload/upload_api.hpp"
#include "vidup/upload/upload_controller.hpp"

#include <memory>
#include <string>

namespace vidup::upload {

/**
 * @brief Reattaches a new controller to a server session that already exists
 *
 * WHY:
 * A paused or interrupted upload may be continued hours later, from a
 * process that never saw the original start call. The only state that
 * matters is on the server, so the negotiator asks for it and builds a
 * Paused controller from the answer.
 *
 * Learning note: the source passed in is trusted. Nothing checks that it
 * holds the same bytes as the file the session was opened for; a size or
 * name difference is only logged.
 */
class ResumeNegotiator {
public:
    ResumeNegotiator(UploadApi& api, events::EventBus& bus,
                     UploadConfig config = {}, SessionJournal* journal = nullptr);

    /**
     * @brief Query the session and hand back a Paused controller
     *
     * Call resume() on the result to continue the transfer.
     *
     * @return ErrorKind::ResumeQuery when the query fails or reports an
     *         inconsistent offset
     */
    UploadResult<std::unique_ptr<UploadController>> resume(const std::string& session_id,
                                                           std::shared_ptr<MediaSource> source,
                                                           UploadMetadata metadata = {});

    /**
     * @brief Same as resume(), with the session id taken from the journal
     *
     * Metadata left empty by the caller falls back to the journalled title
     * and description. The returned controller keeps checkpointing to the
     * same key.
     */
    UploadResult<std::unique_ptr<UploadController>> resume_from_journal(const std::string& key,
                                                                        std::shared_ptr<MediaSource> source,
                                                                        UploadMetadata metadata = {});

private:
    UploadError query_error(const std::string& session_id, std::string message) const;

    UploadApi& api_;
    events::EventBus& bus_;
    UploadConfig config_;
    SessionJournal* journal_;
};

} // namespace vidup::upload
