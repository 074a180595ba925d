#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <cstdint>
#include <sstream>
#include <cstring>

#ifndef _WIN32
#include <strings.h>
#endif

namespace vidup::network {

/**
 * @brief HTTP request methods used by the upload protocol
 *
 * Learning note: DELETE is spelled DELETE_METHOD because <windows.h>
 * defines a DELETE macro.
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,
    HEAD,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

/**
 * @brief Status codes the upload server emits
 *
 * 409 is the answer to a chunk whose Upload-Offset does not match the
 * committed offset; 413 rejects a session above the server quota.
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    CONFLICT = 409,
    PAYLOAD_TOO_LARGE = 413,
    INTERNAL_SERVER_ERROR = 500,
    SERVICE_UNAVAILABLE = 503
};

namespace detail {

inline int strcasecmp_cross_platform(const char* s1, const char* s2) {
#ifdef _WIN32
    return _stricmp(s1, s2);
#else
    return strcasecmp(s1, s2);
#endif
}

inline std::string find_header(const std::unordered_map<std::string, std::string>& headers,
                               const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp_cross_platform(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

inline std::string version_to_string(HttpVersion version) {
    switch (version) {
        case HttpVersion::HTTP_1_0: return "HTTP/1.0";
        case HttpVersion::HTTP_1_1: return "HTTP/1.1";
        default: return "HTTP/1.1";
    }
}

} // namespace detail

/**
 * @brief Helper functions for HTTP method conversions
 */
class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            default: return "UNKNOWN";
        }
    }
};

/**
 * @brief An HTTP/1.1 request
 *
 * Parsed by HttpParser on the server and serialized by the client. The
 * body is a byte vector because chunk uploads carry raw media bytes.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;
    HttpVersion version = HttpVersion::HTTP_1_1;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    /// Case-insensitive header lookup; empty string when absent
    std::string get_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_body(std::vector<uint8_t> data) {
        body = std::move(data);
        headers["Content-Length"] = std::to_string(body.size());
    }

    /**
     * @brief Wire format of the request
     *
     * Content-Length is always written, also for an empty body, so the
     * server never waits for bytes that will not come.
     */
    std::vector<uint8_t> serialize() const {
        std::ostringstream oss;
        oss << HttpMethodUtils::to_string(method) << " " << url << " "
            << detail::version_to_string(version) << "\r\n";

        bool has_length = false;
        for (const auto& [name, value] : headers) {
            if (detail::strcasecmp_cross_platform(name.c_str(), "Content-Length") == 0) {
                has_length = true;
            }
            oss << name << ": " << value << "\r\n";
        }
        if (!has_length) {
            oss << "Content-Length: " << body.size() << "\r\n";
        }
        oss << "\r\n";

        std::string header_str = oss.str();
        std::vector<uint8_t> result(header_str.begin(), header_str.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }
};

/**
 * @brief An HTTP/1.1 response
 *
 * Example:
 * HTTP/1.1 201 Created
 * Content-Type: application/json
 * Content-Length: 27
 *
 * {"session_id":"a1b2c3d4e5"}
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    bool is_success() const { return status_code >= 200 && status_code < 300; }

    std::string get_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::vector<uint8_t> serialize() const {
        std::ostringstream oss;
        oss << detail::version_to_string(version) << " "
            << status_code << " "
            << reason_phrase << "\r\n";

        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        if (headers.find("Content-Length") == headers.end()) {
            oss << "Content-Length: " << body.size() << "\r\n";
        }
        oss << "\r\n";

        std::string header_str = oss.str();
        std::vector<uint8_t> result(header_str.begin(), header_str.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::CREATED: return "Created";
            case HttpStatus::NO_CONTENT: return "No Content";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::CONFLICT: return "Conflict";
            case HttpStatus::PAYLOAD_TOO_LARGE: return "Payload Too Large";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
        }
        return "Unknown";
    }
};

} // namespace vidup::network
