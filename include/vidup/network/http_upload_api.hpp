#pragma once

#include "vidup/core/config.hpp"
#include "vidup/network/http_types.hpp"
#include "vidup/upload/upload_api.hpp"

#include <string>

namespace vidup::network {

/**
 * @brief UploadApi over HTTP/JSON, one short-lived connection per call
 *
 * Routes (relative to ClientConfig::base_path, default /api/uploads):
 *   POST /                   start      -> 201 {"session_id"}
 *   PUT  /:id/chunk          chunk      -> 200 {"start_offset"}
 *   POST /:id/finish         finish     -> 200 {"success","video_id"}
 *   GET  /:id                status     -> 200 {"start_offset","file_size","file_name"}
 *   GET  /:id/processing     processing -> 200 {"status"}
 *
 * Any non-2xx answer, malformed JSON body or socket failure becomes the
 * error string of the call. Nothing is retried here.
 */
class HttpUploadApi : public upload::UploadApi {
public:
    explicit HttpUploadApi(ClientConfig config);

    Result<upload::StartResponse> start_session(const upload::StartRequest& request) override;
    Result<upload::ChunkResponse> transfer_chunk(const upload::ChunkRequest& request) override;
    Result<upload::FinishResponse> finish_session(const upload::FinishRequest& request) override;
    Result<upload::SessionStatusResponse> query_session(const std::string& session_id) override;
    Result<upload::ProcessingState> query_processing(const std::string& session_id) override;

    const ClientConfig& config() const noexcept { return config_; }

    /**
     * @brief Send one request and read the full response
     *
     * Exposed for diagnostics and tests; the typed calls above are built on it.
     */
    Result<HttpResponse> round_trip(HttpRequest request) const;

private:
    Result<std::string> session_url(const std::string& session_id, const std::string& suffix) const;

    ClientConfig config_;
};

} // namespace vidup::network
