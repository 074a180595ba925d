#pragma once

#include "vidup/network/http_router.hpp"
#include "vidup/server/upload_service.hpp"

#include <string>

namespace vidup::server {

constexpr const char* kDefaultBasePath = "/api/uploads";

/**
 * @brief Bind the upload protocol onto a router
 *
 *   POST <base>                  start a session        201 {"session_id"}
 *   PUT  <base>/:id/chunk        append at Upload-Offset 200 {"start_offset"}
 *   POST <base>/:id/finish       publish                200 {"success","video_id"}
 *   GET  <base>/:id              status                 200 {"start_offset","file_size","file_name"}
 *   GET  <base>/:id/processing   readiness              200 {"status"}
 *
 * The service must outlive the router.
 */
void register_upload_routes(network::HttpRouter& router,
                            UploadService& service,
                            const std::string& base_path = kDefaultBasePath);

network::HttpStatus to_http_status(ServiceErrorCode code) noexcept;

} // namespace vidup::server
