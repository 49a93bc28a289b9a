#pragma once

#include "labsync/core/result.hpp"
#include "labsync/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace labsync {
namespace network {

/**
 * @brief State machine states for HTTP message parsing
 *
 * Request line:  METHOD SP URL SP VERSION CRLF
 * Status line:   VERSION SP CODE SP REASON CRLF
 * Then headers, an empty line, and a body delimited by Content-Length,
 * chunked transfer coding, or (responses only) the end of the connection.
 */
enum class ParseState {
    METHOD,
    URL,
    REQUEST_VERSION,
    STATUS_VERSION,
    STATUS_CODE,
    REASON,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    CHUNK_SIZE,
    CHUNK_DATA,
    CHUNK_DATA_END,
    CHUNK_TRAILER,
    BODY_UNTIL_CLOSE,
    COMPLETE,
    PARSE_ERROR
};

enum class MessageKind { Request, Response };

/**
 * @brief Incremental HTTP/1.x parser
 *
 * Feed bytes as they arrive from the socket. parse() returns true once a
 * whole message has been read. A response without Content-Length or
 * chunked coding runs until the peer closes; call finish() at EOF.
 *
 * ```cpp
 * HttpParser parser(MessageKind::Response);
 * auto result = parser.parse(buffer, n);
 * if (result.is_ok() && result.value()) {
 *     const HttpResponse& response = parser.response();
 * }
 * ```
 */
class HttpParser {
public:
    explicit HttpParser(MessageKind kind = MessageKind::Request) : kind_(kind) { reset(); }

    Result<bool> parse(const char* data, size_t len) {
        size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return Err(ErrorKind::Protocol, "Parser in error state");
            }
            if (state_ == ParseState::BODY || state_ == ParseState::CHUNK_DATA ||
                state_ == ParseState::BODY_UNTIL_CLOSE) {
                i += consume_body(data + i, len - i);
                continue;
            }

            char c = data[i++];
            if (c == '\n') {
                line_++;
            }
            if (!step(c)) {
                std::string where = failure_;
                state_ = ParseState::PARSE_ERROR;
                return Err(ErrorKind::Protocol,
                           "Failed to parse " + where + " at line " + std::to_string(line_));
            }
        }
        return Ok(state_ == ParseState::COMPLETE);
    }

    /// Signal end of stream.
    Result<bool> finish() {
        if (state_ == ParseState::BODY_UNTIL_CLOSE) {
            state_ = ParseState::COMPLETE;
        }
        if (state_ == ParseState::COMPLETE) {
            return Ok(true);
        }
        return Err(ErrorKind::Protocol, "Connection closed before the message was complete");
    }

    const HttpRequest& request() const { return request_; }
    const HttpResponse& response() const { return response_; }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    void reset() {
        state_ = kind_ == MessageKind::Request ? ParseState::METHOD : ParseState::STATUS_VERSION;
        request_ = HttpRequest();
        response_ = HttpResponse();
        buffer_.clear();
        current_header_name_.clear();
        failure_.clear();
        remaining_ = 0;
        line_ = 1;
    }

private:
    MessageKind kind_;
    ParseState state_;
    HttpRequest request_;
    HttpResponse response_;
    std::string buffer_;
    std::string current_header_name_;
    std::string failure_;
    size_t remaining_;      // Bytes left in the body or current chunk
    size_t line_;

    HttpHeaders& headers() {
        return kind_ == MessageKind::Request ? request_.headers : response_.headers;
    }

    std::vector<uint8_t>& body() {
        return kind_ == MessageKind::Request ? request_.body : response_.body;
    }

    bool fail(const char* what) {
        failure_ = what;
        return false;
    }

    bool step(char c) {
        // Bare LF is accepted as a line terminator
        if (c == '\r' && state_ != ParseState::BODY) {
            return true;
        }

        switch (state_) {
            case ParseState::METHOD: return parse_method(c);
            case ParseState::URL: return parse_url(c);
            case ParseState::REQUEST_VERSION: return parse_request_version(c);
            case ParseState::STATUS_VERSION: return parse_status_version(c);
            case ParseState::STATUS_CODE: return parse_status_code(c);
            case ParseState::REASON: return parse_reason(c);
            case ParseState::HEADER_NAME: return parse_header_name(c);
            case ParseState::HEADER_VALUE: return parse_header_value(c);
            case ParseState::CHUNK_SIZE: return parse_chunk_size(c);
            case ParseState::CHUNK_DATA_END:
                if (c != '\n') {
                    return fail("chunk terminator");
                }
                state_ = ParseState::CHUNK_SIZE;
                return true;
            case ParseState::CHUNK_TRAILER: return parse_trailer(c);
            default: return fail("message");
        }
    }

    bool parse_method(char c) {
        if (c == ' ') {
            request_.method = method_from_name(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return fail("HTTP method");
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }
        if (!std::isupper(static_cast<unsigned char>(c))) {
            return fail("HTTP method");
        }
        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return fail("URL");
            }
            request_.url = buffer_;
            buffer_.clear();
            state_ = ParseState::REQUEST_VERSION;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return fail("URL");
        }
        buffer_ += c;
        return true;
    }

    bool read_version(HttpVersion& version) {
        if (buffer_ == "HTTP/1.1") {
            version = HttpVersion::HTTP_1_1;
        } else if (buffer_ == "HTTP/1.0") {
            version = HttpVersion::HTTP_1_0;
        } else {
            return false;
        }
        buffer_.clear();
        return true;
    }

    bool parse_request_version(char c) {
        if (c == '\n') {
            if (!read_version(request_.version)) {
                return fail("HTTP version");
            }
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        buffer_ += c;
        return true;
    }

    bool parse_status_version(char c) {
        if (c == ' ') {
            if (!read_version(response_.version)) {
                return fail("HTTP version");
            }
            state_ = ParseState::STATUS_CODE;
            return true;
        }
        buffer_ += c;
        return buffer_.size() <= 8 || fail("HTTP version");
    }

    bool parse_status_code(char c) {
        if (c == ' ' || c == '\n') {
            if (buffer_.size() != 3) {
                return fail("status code");
            }
            response_.status_code = std::stoi(buffer_);
            buffer_.clear();
            state_ = c == '\n' ? ParseState::HEADER_NAME : ParseState::REASON;
            return true;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return fail("status code");
        }
        buffer_ += c;
        return true;
    }

    bool parse_reason(char c) {
        if (c == '\n') {
            response_.reason_phrase = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\n') {
            if (!buffer_.empty()) {
                return fail("header name");
            }
            return begin_body();
        }
        if (c == ':') {
            if (buffer_.empty()) {
                return fail("header name");
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return fail("header name");
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }
        if (c == '\n') {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            headers()[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        buffer_ += c;
        return true;
    }

    bool begin_body() {
        std::string encoding = find_header(headers(), "Transfer-Encoding");
        std::transform(encoding.begin(), encoding.end(), encoding.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        if (encoding.find("chunked") != std::string::npos) {
            state_ = ParseState::CHUNK_SIZE;
            return true;
        }

        std::string content_length = find_header(headers(), "Content-Length");
        if (!content_length.empty()) {
            char* end = nullptr;
            unsigned long long length = std::strtoull(content_length.c_str(), &end, 10);
            if (end == content_length.c_str() || *end != '\0') {
                return fail("Content-Length");
            }
            remaining_ = static_cast<size_t>(length);
            if (remaining_ > 0) {
                body().reserve(remaining_);
                state_ = ParseState::BODY;
            } else {
                state_ = ParseState::COMPLETE;
            }
            return true;
        }

        if (kind_ == MessageKind::Request || response_.status_code == 204 ||
            response_.status_code == 304 || response_.status_code < 200) {
            state_ = ParseState::COMPLETE;
        } else {
            state_ = ParseState::BODY_UNTIL_CLOSE;
        }
        return true;
    }

    bool parse_chunk_size(char c) {
        if (c == '\n') {
            std::string digits = buffer_.substr(0, buffer_.find(';'));
            buffer_.clear();
            char* end = nullptr;
            unsigned long long size = std::strtoull(digits.c_str(), &end, 16);
            if (digits.empty() || end == digits.c_str()) {
                return fail("chunk size");
            }
            remaining_ = static_cast<size_t>(size);
            state_ = remaining_ == 0 ? ParseState::CHUNK_TRAILER : ParseState::CHUNK_DATA;
            return true;
        }
        buffer_ += c;
        return true;
    }

    bool parse_trailer(char c) {
        if (c == '\n') {
            if (buffer_.empty()) {
                state_ = ParseState::COMPLETE;
            }
            buffer_.clear();
            return true;
        }
        buffer_ += c;
        return true;
    }

    size_t consume_body(const char* data, size_t len) {
        auto& target = body();
        if (state_ == ParseState::BODY_UNTIL_CLOSE) {
            target.insert(target.end(), data, data + len);
            return len;
        }

        size_t n = std::min(remaining_, len);
        target.insert(target.end(), data, data + n);
        remaining_ -= n;
        if (remaining_ == 0) {
            state_ = state_ == ParseState::BODY ? ParseState::COMPLETE : ParseState::CHUNK_DATA_END;
        }
        return n;
    }
};

} // namespace network
} // namespace labsync
