#include "vidup/network/http_upload_api.hpp"

#include "vidup/network/http_parser.hpp"
#include "vidup/network/socket.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace vidup::network {

using json = nlohmann::json;

namespace {

constexpr std::size_t kReceiveBufferSize = 16 * 1024;

/// Body of a 2xx JSON response, or the server's {"error"} text otherwise
Result<json> json_body(const HttpResponse& response) {
    auto body = json::parse(response.body_as_string(), nullptr, false);
    if (!response.is_success()) {
        std::string detail = response.reason_phrase;
        if (!body.is_discarded() && body.is_object() && body.contains("error") && body["error"].is_string()) {
            detail = body["error"].get<std::string>();
        }
        return Err<json>("HTTP " + std::to_string(response.status_code) + ": " + detail);
    }
    if (body.is_discarded() || !body.is_object()) {
        return Err<json>(std::string("Malformed JSON response"));
    }
    return Ok(std::move(body));
}

// Optional string field: absent reads as empty, any other type is an error
Result<std::string> optional_text(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end()) {
        return Ok(std::string{});
    }
    if (!it->is_string()) {
        return Err<std::string>(std::string("Response field ") + key + " is not a string");
    }
    return Ok(it->get<std::string>());
}

HttpRequest json_request(HttpMethod method, const std::string& url, const json& payload) {
    HttpRequest request;
    request.method = method;
    request.url = url;
    request.set_header("Content-Type", "application/json");
    request.set_body(payload.dump());
    return request;
}

} // namespace

HttpUploadApi::HttpUploadApi(ClientConfig config)
    : config_(std::move(config)) {
    while (config_.base_path.size() > 1 && config_.base_path.back() == '/') {
        config_.base_path.pop_back();
    }
}

Result<HttpResponse> HttpUploadApi::round_trip(HttpRequest request) const {
    Socket socket;
    auto connected = socket.connect(config_.host, config_.port);
    if (connected.is_error()) {
        return Err<HttpResponse>(connected.error());
    }
    auto timeout = socket.set_timeout(std::chrono::duration_cast<std::chrono::milliseconds>(config_.request_timeout));
    if (timeout.is_error()) {
        return Err<HttpResponse>(timeout.error());
    }

    request.set_header("Host", config_.host + ":" + std::to_string(config_.port));
    request.set_header("Connection", "close");

    spdlog::debug("-> {} {} ({} body bytes)",
                  HttpMethodUtils::to_string(request.method), request.url, request.body.size());

    auto sent = socket.send_all(request.serialize());
    if (sent.is_error()) {
        return Err<HttpResponse>(sent.error());
    }

    HttpResponseParser parser;
    while (true) {
        auto chunk = socket.receive(kReceiveBufferSize);
        if (chunk.is_error()) {
            return Err<HttpResponse>(chunk.error());
        }
        if (chunk.value().empty()) {
            if (!parser.finish()) {
                return Err<HttpResponse>(std::string("Connection closed before response was complete"));
            }
            break;
        }
        auto parsed = parser.parse(reinterpret_cast<const char*>(chunk.value().data()), chunk.value().size());
        if (parsed.is_error()) {
            return Err<HttpResponse>("Invalid HTTP response: " + parsed.error());
        }
        if (parsed.value()) {
            break;
        }
    }

    const HttpResponse& response = parser.get_response();
    spdlog::debug("<- {} {}", response.status_code, response.reason_phrase);
    return Ok(response);
}

Result<std::string> HttpUploadApi::session_url(const std::string& session_id, const std::string& suffix) const {
    if (session_id.empty() ||
        session_id.find_first_of("/?# \r\n") != std::string::npos) {
        return Err<std::string>("Invalid session id: '" + session_id + "'");
    }
    return Ok(config_.base_path + "/" + session_id + suffix);
}

Result<upload::StartResponse> HttpUploadApi::start_session(const upload::StartRequest& request) {
    json payload{
        {"total_size", request.total_size},
        {"file_name", request.file_name},
        {"title", request.title},
        {"description", request.description}};

    auto response = round_trip(json_request(HttpMethod::POST, config_.base_path, payload));
    if (response.is_error()) {
        return Err<upload::StartResponse>(response.error());
    }
    auto body = json_body(response.value());
    if (body.is_error()) {
        return Err<upload::StartResponse>(body.error());
    }

    const json& j = body.value();
    if (!j.contains("session_id") || !j["session_id"].is_string()) {
        return Err<upload::StartResponse>(std::string("Start response has no session_id"));
    }
    return Ok(upload::StartResponse{j["session_id"].get<std::string>()});
}

Result<upload::ChunkResponse> HttpUploadApi::transfer_chunk(const upload::ChunkRequest& request) {
    auto url = session_url(request.session_id, "/chunk");
    if (url.is_error()) {
        return Err<upload::ChunkResponse>(url.error());
    }

    HttpRequest http;
    http.method = HttpMethod::PUT;
    http.url = url.value();
    http.set_header("Content-Type", "application/octet-stream");
    http.set_header("Upload-Offset", std::to_string(request.start_offset));
    http.set_body(request.data);

    auto response = round_trip(std::move(http));
    if (response.is_error()) {
        return Err<upload::ChunkResponse>(response.error());
    }
    auto body = json_body(response.value());
    if (body.is_error()) {
        return Err<upload::ChunkResponse>(body.error());
    }

    const json& j = body.value();
    if (!j.contains("start_offset") || !j["start_offset"].is_number_unsigned()) {
        return Err<upload::ChunkResponse>(std::string("Chunk response has no start_offset"));
    }
    return Ok(upload::ChunkResponse{j["start_offset"].get<std::uint64_t>()});
}

Result<upload::FinishResponse> HttpUploadApi::finish_session(const upload::FinishRequest& request) {
    auto url = session_url(request.session_id, "/finish");
    if (url.is_error()) {
        return Err<upload::FinishResponse>(url.error());
    }

    json payload{{"title", request.title}, {"description", request.description}};
    auto response = round_trip(json_request(HttpMethod::POST, url.value(), payload));
    if (response.is_error()) {
        return Err<upload::FinishResponse>(response.error());
    }
    auto body = json_body(response.value());
    if (body.is_error()) {
        return Err<upload::FinishResponse>(body.error());
    }

    const json& j = body.value();
    if (!j.contains("success") || !j["success"].is_boolean()) {
        return Err<upload::FinishResponse>(std::string("Finish response has no success flag"));
    }
    auto video_id = optional_text(j, "video_id");
    if (video_id.is_error()) {
        return Err<upload::FinishResponse>(video_id.error());
    }
    upload::FinishResponse result;
    result.success = j["success"].get<bool>();
    result.video_id = video_id.take_value();
    return Ok(std::move(result));
}

Result<upload::SessionStatusResponse> HttpUploadApi::query_session(const std::string& session_id) {
    auto url = session_url(session_id, "");
    if (url.is_error()) {
        return Err<upload::SessionStatusResponse>(url.error());
    }

    HttpRequest http;
    http.method = HttpMethod::GET;
    http.url = url.value();

    auto response = round_trip(std::move(http));
    if (response.is_error()) {
        return Err<upload::SessionStatusResponse>(response.error());
    }
    auto body = json_body(response.value());
    if (body.is_error()) {
        return Err<upload::SessionStatusResponse>(body.error());
    }

    const json& j = body.value();
    if (!j.contains("start_offset") || !j["start_offset"].is_number_unsigned() ||
        !j.contains("file_size") || !j["file_size"].is_number_unsigned()) {
        return Err<upload::SessionStatusResponse>(std::string("Status response is missing offsets"));
    }
    auto file_name = optional_text(j, "file_name");
    if (file_name.is_error()) {
        return Err<upload::SessionStatusResponse>(file_name.error());
    }
    upload::SessionStatusResponse result;
    result.start_offset = j["start_offset"].get<std::uint64_t>();
    result.file_size = j["file_size"].get<std::uint64_t>();
    result.file_name = file_name.take_value();
    return Ok(std::move(result));
}

Result<upload::ProcessingState> HttpUploadApi::query_processing(const std::string& session_id) {
    auto url = session_url(session_id, "/processing");
    if (url.is_error()) {
        return Err<upload::ProcessingState>(url.error());
    }

    HttpRequest http;
    http.method = HttpMethod::GET;
    http.url = url.value();

    auto response = round_trip(std::move(http));
    if (response.is_error()) {
        return Err<upload::ProcessingState>(response.error());
    }
    auto body = json_body(response.value());
    if (body.is_error()) {
        return Err<upload::ProcessingState>(body.error());
    }

    const json& j = body.value();
    if (!j.contains("status") || !j["status"].is_string()) {
        return Err<upload::ProcessingState>(std::string("Processing response has no status"));
    }
    return upload::processing_state_from_string(j["status"].get<std::string>());
}

} // namespace vidup::network
