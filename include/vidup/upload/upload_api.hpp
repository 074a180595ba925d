#pragma once

#include "vidup/core/result.hpp"
#include "vidup/upload/types.hpp"

#include <string>

namespace vidup::upload {

/**
 * @brief Server operations consumed by the upload client
 *
 * Each call is one network round trip and the only place where the
 * transfer loop suspends. Errors are plain messages; the caller maps
 * them onto an ErrorKind depending on which phase failed.
 *
 * Implementations:
 * - network::HttpUploadApi (HTTP/JSON against the upload server)
 * - test doubles that script responses and record calls
 */
class UploadApi {
public:
    virtual ~UploadApi() = default;

    virtual Result<StartResponse> start_session(const StartRequest& request) = 0;

    virtual Result<ChunkResponse> transfer_chunk(const ChunkRequest& request) = 0;

    virtual Result<FinishResponse> finish_session(const FinishRequest& request) = 0;

    virtual Result<SessionStatusResponse> query_session(const std::string& session_id) = 0;

    /// Post-finish readiness of the published video
    virtual Result<ProcessingState> query_processing(const std::string& session_id) = 0;
};

} // namespace vidup::upload
