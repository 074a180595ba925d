#include "vidup/server/upload_routes.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace vidup::server {

using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;
using network::error_response;
using network::json_response;
using json = nlohmann::json;

namespace {

HttpResponse make_json(HttpStatus status, const json& body) {
    return json_response(status, body.dump());
}

HttpResponse service_error(const ServiceError& error) {
    return error_response(to_http_status(error.code), error.message);
}

bool parse_offset(const std::string& text, std::uint64_t& out) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        out = std::stoull(text);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

// A negative literal parses as a signed integer
bool read_size(const json& value, std::uint64_t& out) {
    if (value.is_number_unsigned()) {
        out = value.get<std::uint64_t>();
        return true;
    }
    if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
        out = static_cast<std::uint64_t>(value.get<std::int64_t>());
        return true;
    }
    return false;
}

// A missing key leaves `out` empty; a present key must hold a string
bool read_text(const json& object, const char* key, std::string& out) {
    auto it = object.find(key);
    if (it == object.end()) {
        out.clear();
        return true;
    }
    if (!it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

HttpResponse not_a_string(const char* key) {
    return error_response(HttpStatus::BAD_REQUEST, std::string(key) + " must be a string");
}

} // namespace

network::HttpStatus to_http_status(ServiceErrorCode code) noexcept {
    switch (code) {
        case ServiceErrorCode::BadRequest: return HttpStatus::BAD_REQUEST;
        case ServiceErrorCode::NotFound: return HttpStatus::NOT_FOUND;
        case ServiceErrorCode::OffsetMismatch: return HttpStatus::CONFLICT;
        case ServiceErrorCode::QuotaExceeded: return HttpStatus::PAYLOAD_TOO_LARGE;
        case ServiceErrorCode::Conflict: return HttpStatus::CONFLICT;
        case ServiceErrorCode::Storage: return HttpStatus::INTERNAL_SERVER_ERROR;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

void register_upload_routes(network::HttpRouter& router,
                            UploadService& service,
                            const std::string& base_path) {
    router.post(base_path, [&service](const HttpContext& ctx) {
        auto payload = json::parse(ctx.request.body_as_string(), nullptr, false);
        if (payload.is_discarded() || !payload.is_object()) {
            return error_response(HttpStatus::BAD_REQUEST, "Invalid JSON");
        }
        std::uint64_t total_size = 0;
        if (!payload.contains("total_size") || !read_size(payload["total_size"], total_size)) {
            return error_response(HttpStatus::BAD_REQUEST, "total_size must be a non-negative integer");
        }

        upload::StartRequest request;
        request.total_size = total_size;
        if (!read_text(payload, "file_name", request.file_name)) {
            return not_a_string("file_name");
        }
        if (!read_text(payload, "title", request.title)) {
            return not_a_string("title");
        }
        if (!read_text(payload, "description", request.description)) {
            return not_a_string("description");
        }

        auto result = service.start_session(request);
        if (result.is_error()) {
            return service_error(result.error());
        }
        return make_json(HttpStatus::CREATED, json{{"session_id", result.value()}});
    });

    router.put(base_path + "/:id/chunk", [&service](const HttpContext& ctx) {
        std::uint64_t offset = 0;
        if (!parse_offset(ctx.request.get_header("Upload-Offset"), offset)) {
            return error_response(HttpStatus::BAD_REQUEST, "Upload-Offset header required");
        }

        auto result = service.append_chunk(ctx.get_param("id"), offset, ctx.request.body);
        if (result.is_error()) {
            return service_error(result.error());
        }
        return make_json(HttpStatus::OK, json{{"start_offset", result.value()}});
    });

    router.post(base_path + "/:id/finish", [&service](const HttpContext& ctx) {
        std::string title;
        std::string description;
        if (!ctx.request.body.empty()) {
            auto payload = json::parse(ctx.request.body_as_string(), nullptr, false);
            if (payload.is_discarded() || !payload.is_object()) {
                return error_response(HttpStatus::BAD_REQUEST, "Invalid JSON");
            }
            if (!read_text(payload, "title", title)) {
                return not_a_string("title");
            }
            if (!read_text(payload, "description", description)) {
                return not_a_string("description");
            }
        }

        auto result = service.finish_session(ctx.get_param("id"), title, description);
        if (result.is_error()) {
            return service_error(result.error());
        }
        return make_json(HttpStatus::OK,
                         json{{"success", result.value().success}, {"video_id", result.value().video_id}});
    });

    router.get(base_path + "/:id", [&service](const HttpContext& ctx) {
        auto result = service.session_status(ctx.get_param("id"));
        if (result.is_error()) {
            return service_error(result.error());
        }
        const auto& status = result.value();
        return make_json(HttpStatus::OK, json{{"start_offset", status.start_offset},
                                              {"file_size", status.file_size},
                                              {"file_name", status.file_name}});
    });

    router.get(base_path + "/:id/processing", [&service](const HttpContext& ctx) {
        auto result = service.processing_state(ctx.get_param("id"));
        if (result.is_error()) {
            return service_error(result.error());
        }
        return make_json(HttpStatus::OK, json{{"status", upload::to_string(result.value())}});
    });

    spdlog::debug("Upload routes registered under {}", base_path);
}

} // namespace vidup::server
