#pragma once

#include "vidup/network/http_types.hpp"
#include "vidup/core/result.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace vidup::network {

/**
 * @brief State machine states for HTTP message parsing
 *
 * HTTP Request Format:
 * METHOD SP URL SP VERSION CRLF    <- Start line (request)
 * VERSION SP CODE SP REASON CRLF   <- Start line (response)
 * Header-Name: Header-Value CRLF   <- Headers (multiple)
 * CRLF                             <- Empty line
 * [Body]                           <- Content-Length bytes
 *
 * Learning note: data arrives from the socket in arbitrary pieces, so the
 * parser must be able to stop in the middle of any token and continue
 * when the next piece shows up.
 */
enum class ParseState {
    METHOD,          // Request: method token
    URL,             // Request: target
    VERSION,         // Request: protocol version up to CRLF
    STATUS_VERSION,  // Response: protocol version up to SP
    STATUS_CODE,     // Response: three digit code
    REASON,          // Response: reason phrase up to CRLF
    HEADER_NAME,
    HEADER_VALUE,
    BODY,            // Exactly Content-Length bytes
    BODY_UNTIL_CLOSE,// Response without Content-Length
    COMPLETE,
    PARSE_ERROR
};

/// Largest body accepted unless the owner raises the limit
constexpr std::size_t kDefaultMaxBodySize = 64ULL * 1024 * 1024;

namespace detail {

inline Result<std::size_t> parse_content_length(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return Err<std::size_t>("Invalid Content-Length: " + text);
    }
    try {
        return Ok(static_cast<std::size_t>(std::stoull(text)));
    } catch (const std::out_of_range&) {
        return Err<std::size_t>("Content-Length out of range: " + text);
    }
}

/**
 * @brief Header and body half of the parser, shared by requests and responses
 *
 * Works on the headers map and body vector of whichever message the
 * owning parser is building.
 */
class MessageTail {
public:
    void reset() {
        buffer_.clear();
        current_header_name_.clear();
        expected_body_ = 0;
        last_char_was_cr_ = false;
    }

    /**
     * @brief Consume one header character
     * @return Next state, or PARSE_ERROR
     */
    ParseState header_name(char c,
                           std::unordered_map<std::string, std::string>& headers,
                           std::vector<uint8_t>& body,
                           std::size_t max_body,
                           bool body_until_close_allowed,
                           std::string& error) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return ParseState::HEADER_NAME;
        }

        if (c == '\n' && last_char_was_cr_) {
            // Empty line: headers are done
            last_char_was_cr_ = false;
            const std::string length_text = find_header(headers, "Content-Length");
            if (length_text.empty()) {
                return body_until_close_allowed ? ParseState::BODY_UNTIL_CLOSE : ParseState::COMPLETE;
            }
            auto length = parse_content_length(length_text);
            if (length.is_error()) {
                error = length.error();
                return ParseState::PARSE_ERROR;
            }
            if (length.value() > max_body) {
                error = "Body of " + length_text + " bytes exceeds limit of " + std::to_string(max_body);
                return ParseState::PARSE_ERROR;
            }
            if (length.value() == 0) {
                return ParseState::COMPLETE;
            }
            expected_body_ = length.value();
            body.reserve(expected_body_);
            return ParseState::BODY;
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                error = "Empty header name";
                return ParseState::PARSE_ERROR;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            return ParseState::HEADER_VALUE;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
            error = "Invalid character in header name";
            return ParseState::PARSE_ERROR;
        }

        buffer_ += c;
        return ParseState::HEADER_NAME;
    }

    ParseState header_value(char c, std::unordered_map<std::string, std::string>& headers) {
        // Skip leading whitespace after colon
        if (buffer_.empty() && c == ' ') {
            return ParseState::HEADER_VALUE;
        }
        if (c == '\r') {
            last_char_was_cr_ = true;
            return ParseState::HEADER_VALUE;
        }
        if (c == '\n' && last_char_was_cr_) {
            headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            return ParseState::HEADER_NAME;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return ParseState::HEADER_VALUE;
    }

    /**
     * @brief Copy as much of the body as is available in one step
     * @return Number of bytes consumed from data
     */
    std::size_t body(const char* data, std::size_t len, std::vector<uint8_t>& body) {
        const std::size_t wanted = expected_body_ - body.size();
        const std::size_t take = std::min(wanted, len);
        body.insert(body.end(),
                    reinterpret_cast<const uint8_t*>(data),
                    reinterpret_cast<const uint8_t*>(data) + take);
        return take;
    }

    bool body_done(const std::vector<uint8_t>& body) const {
        return body.size() >= expected_body_;
    }

    std::string buffer_;
    std::string current_header_name_;
    std::size_t expected_body_ = 0;
    bool last_char_was_cr_ = false;
};

} // namespace detail

/**
 * @brief Incremental HTTP request parser (server side)
 *
 * Usage example:
 * ```cpp
 * HttpParser parser;
 * auto result = parser.parse(buffer.data(), bytes_read);
 * if (result.is_error()) {
 *     // 400 Bad Request
 * } else if (result.value()) {
 *     HttpRequest request = parser.get_request();
 * }
 * ```
 *
 * The start line and headers are consumed one character at a time; the
 * body is copied in bulk once its length is known.
 */
class HttpParser {
public:
    explicit HttpParser(std::size_t max_body_size = kDefaultMaxBodySize)
        : max_body_size_(max_body_size) {
        reset();
    }

    /**
     * @brief Feed the next piece of the request
     * @return true once the request is complete, false if more data is needed
     */
    Result<bool> parse(const char* data, size_t len) {
        size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return Err<bool>("Parser in error state: " + error_);
            }

            if (state_ == ParseState::BODY) {
                i += tail_.body(data + i, len - i, request_.body);
                if (tail_.body_done(request_.body)) {
                    state_ = ParseState::COMPLETE;
                }
                continue;
            }

            const char c = data[i++];
            if (c == '\n') {
                line_++;
            }

            switch (state_) {
                case ParseState::METHOD:
                    if (!parse_method(c)) {
                        return fail("Failed to parse HTTP method at line " + std::to_string(line_));
                    }
                    break;
                case ParseState::URL:
                    if (!parse_url(c)) {
                        return fail("Failed to parse URL at line " + std::to_string(line_));
                    }
                    break;
                case ParseState::VERSION:
                    if (!parse_version(c)) {
                        return fail("Failed to parse HTTP version at line " + std::to_string(line_));
                    }
                    break;
                case ParseState::HEADER_NAME:
                    state_ = tail_.header_name(c, request_.headers, request_.body,
                                               max_body_size_, false, error_);
                    if (state_ == ParseState::PARSE_ERROR) {
                        return fail(error_ + " at line " + std::to_string(line_));
                    }
                    break;
                case ParseState::HEADER_VALUE:
                    state_ = tail_.header_value(c, request_.headers);
                    break;
                default:
                    break;
            }
        }
        return Ok(state_ == ParseState::COMPLETE);
    }

    const HttpRequest& get_request() const { return request_; }

    HttpRequest take_request() { return std::move(request_); }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        tail_.reset();
        error_.clear();
        line_ = 1;
    }

private:
    Result<bool> fail(std::string message) {
        state_ = ParseState::PARSE_ERROR;
        error_ = message;
        return Err<bool>(std::move(message));
    }

    bool parse_method(char c) {
        if (c == ' ') {
            if (tail_.buffer_.empty()) {
                return false;
            }
            request_.method = HttpMethodUtils::from_string(tail_.buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return false;
            }
            tail_.buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }
        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
        tail_.buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (tail_.buffer_.empty()) {
                return false;
            }
            request_.url = tail_.buffer_;
            tail_.buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }
        tail_.buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == '\r') {
            tail_.last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && tail_.last_char_was_cr_) {
            if (tail_.buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (tail_.buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }
            tail_.buffer_.clear();
            tail_.last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        tail_.last_char_was_cr_ = false;
        tail_.buffer_ += c;
        return true;
    }

    ParseState state_ = ParseState::METHOD;
    HttpRequest request_;
    detail::MessageTail tail_;
    std::string error_;
    std::size_t max_body_size_;
    size_t line_ = 1;
};

/**
 * @brief Incremental HTTP response parser (client side)
 *
 * A response without Content-Length is read until the peer closes the
 * connection; call finish() when the socket reports EOF.
 */
class HttpResponseParser {
public:
    explicit HttpResponseParser(std::size_t max_body_size = kDefaultMaxBodySize)
        : max_body_size_(max_body_size) {
        reset();
    }

    Result<bool> parse(const char* data, size_t len) {
        size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return Err<bool>("Parser in error state: " + error_);
            }

            if (state_ == ParseState::BODY) {
                i += tail_.body(data + i, len - i, response_.body);
                if (tail_.body_done(response_.body)) {
                    state_ = ParseState::COMPLETE;
                }
                continue;
            }
            if (state_ == ParseState::BODY_UNTIL_CLOSE) {
                if (response_.body.size() + (len - i) > max_body_size_) {
                    return fail("Response body exceeds limit");
                }
                response_.body.insert(response_.body.end(),
                                      reinterpret_cast<const uint8_t*>(data + i),
                                      reinterpret_cast<const uint8_t*>(data + len));
                i = len;
                continue;
            }

            const char c = data[i++];
            switch (state_) {
                case ParseState::STATUS_VERSION:
                    if (!parse_status_version(c)) {
                        return fail("Failed to parse response version");
                    }
                    break;
                case ParseState::STATUS_CODE:
                    if (!parse_status_code(c)) {
                        return fail("Failed to parse status code");
                    }
                    break;
                case ParseState::REASON:
                    parse_reason(c);
                    break;
                case ParseState::HEADER_NAME:
                    state_ = tail_.header_name(c, response_.headers, response_.body,
                                               max_body_size_, true, error_);
                    if (state_ == ParseState::PARSE_ERROR) {
                        return fail(error_);
                    }
                    break;
                case ParseState::HEADER_VALUE:
                    state_ = tail_.header_value(c, response_.headers);
                    break;
                default:
                    break;
            }
        }
        return Ok(state_ == ParseState::COMPLETE);
    }

    /**
     * @brief Signal end of stream
     * @return true if the response is complete at this point
     */
    bool finish() {
        if (state_ == ParseState::BODY_UNTIL_CLOSE) {
            state_ = ParseState::COMPLETE;
        }
        return state_ == ParseState::COMPLETE;
    }

    const HttpResponse& get_response() const { return response_; }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    void reset() {
        state_ = ParseState::STATUS_VERSION;
        response_ = HttpResponse();
        tail_.reset();
        error_.clear();
    }

private:
    Result<bool> fail(std::string message) {
        state_ = ParseState::PARSE_ERROR;
        error_ = message;
        return Err<bool>(std::move(message));
    }

    bool parse_status_version(char c) {
        if (c == ' ') {
            if (tail_.buffer_ == "HTTP/1.1") {
                response_.version = HttpVersion::HTTP_1_1;
            } else if (tail_.buffer_ == "HTTP/1.0") {
                response_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }
            tail_.buffer_.clear();
            state_ = ParseState::STATUS_CODE;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c)) || tail_.buffer_.size() > 8) {
            return false;
        }
        tail_.buffer_ += c;
        return true;
    }

    bool parse_status_code(char c) {
        if (c == ' ' || c == '\r') {
            if (tail_.buffer_.size() != 3) {
                return false;
            }
            response_.status_code = std::stoi(tail_.buffer_);
            tail_.buffer_.clear();
            tail_.last_char_was_cr_ = (c == '\r');
            state_ = ParseState::REASON;
            return true;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        tail_.buffer_ += c;
        return true;
    }

    void parse_reason(char c) {
        if (c == '\r') {
            tail_.last_char_was_cr_ = true;
            return;
        }
        if (c == '\n' && tail_.last_char_was_cr_) {
            response_.reason_phrase = tail_.buffer_;
            tail_.buffer_.clear();
            tail_.last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return;
        }
        tail_.last_char_was_cr_ = false;
        tail_.buffer_ += c;
    }

    ParseState state_ = ParseState::STATUS_VERSION;
    HttpResponse response_;
    detail::MessageTail tail_;
    std::string error_;
    std::size_t max_body_size_;
};

} // namespace vidup::network
