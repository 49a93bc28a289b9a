#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <strings.h>

namespace labsync {
namespace network {

/**
 * @brief Request methods the repository client sends or the test server accepts
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1
};

/// Statuses the repository answers with that the engine names explicitly.
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    NOT_FOUND = 404,
    INTERNAL_SERVER_ERROR = 500,
    SERVICE_UNAVAILABLE = 503
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

/// Case-insensitive header lookup (RFC 7230 field names).
inline std::string find_header(const HttpHeaders& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

inline const char* version_name(HttpVersion version) {
    return version == HttpVersion::HTTP_1_0 ? "HTTP/1.0" : "HTTP/1.1";
}

inline HttpMethod method_from_name(const std::string& name) {
    static const std::pair<const char*, HttpMethod> kMethods[] = {
        {"GET", HttpMethod::GET},
        {"POST", HttpMethod::POST},
        {"PUT", HttpMethod::PUT},
        {"DELETE", HttpMethod::DELETE_METHOD},
    };
    for (const auto& [text, method] : kMethods) {
        if (name == text) {
            return method;
        }
    }
    return HttpMethod::UNKNOWN;
}

inline const char* method_name(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE_METHOD: return "DELETE";
        case HttpMethod::UNKNOWN: break;
    }
    return "UNKNOWN";
}

inline const char* reason_phrase(HttpStatus status) {
    switch (status) {
        case HttpStatus::OK: return "OK";
        case HttpStatus::CREATED: return "Created";
        case HttpStatus::BAD_REQUEST: return "Bad Request";
        case HttpStatus::UNAUTHORIZED: return "Unauthorized";
        case HttpStatus::NOT_FOUND: return "Not Found";
        case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
        case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
    }
    return "Unknown";
}

namespace detail {

/// Start line, header block and body as one wire buffer.
inline std::vector<uint8_t> wire_message(const std::string& head, const std::vector<uint8_t>& body) {
    std::vector<uint8_t> wire(head.begin(), head.end());
    wire.insert(wire.end(), body.begin(), body.end());
    return wire;
}

inline std::string body_text(const std::vector<uint8_t>& body) {
    return std::string(body.begin(), body.end());
}

} // namespace detail

/**
 * @brief An HTTP request
 *
 * `url` is the request target as sent on the request line: an origin-form
 * path with optional query string ("/api/v1/user/?format=json").
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;
    HttpVersion version = HttpVersion::HTTP_1_1;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::string get_header(const std::string& name) const { return find_header(headers, name); }
    bool has_header(const std::string& name) const { return !get_header(name).empty(); }
    std::string body_as_string() const { return detail::body_text(body); }

    /// Path component of url, without the query string.
    std::string path() const { return url.substr(0, url.find('?')); }

    void set_body(const std::string& content) { body.assign(content.begin(), content.end()); }

    /**
     * @brief Wire form of the request sent to `host`
     *
     * Host, Content-Length and Connection: close are always written; the
     * client reads the reply until the repository closes the connection.
     */
    std::vector<uint8_t> serialize(const std::string& host) const {
        std::ostringstream head;
        head << method_name(method) << ' ' << url << ' ' << version_name(version) << "\r\n"
             << "Host: " << host << "\r\n";
        for (const auto& [name, value] : headers) {
            head << name << ": " << value << "\r\n";
        }
        head << "Content-Length: " << body.size() << "\r\n"
             << "Connection: close\r\n\r\n";
        return detail::wire_message(head.str(), body);
    }
};

/**
 * @brief An HTTP response
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status)), reason_phrase(network::reason_phrase(status)) {}

    bool is_success() const { return status_code >= 200 && status_code < 300; }

    std::string get_header(const std::string& name) const { return find_header(headers, name); }
    std::string body_as_string() const { return detail::body_text(body); }

    /// Replace the body and keep Content-Length in step with it.
    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_header(const std::string& name, const std::string& value) { headers[name] = value; }

    std::vector<uint8_t> serialize() const {
        std::ostringstream head;
        head << version_name(version) << ' ' << status_code << ' ' << reason_phrase << "\r\n";
        for (const auto& [name, value] : headers) {
            head << name << ": " << value << "\r\n";
        }
        head << "\r\n";
        return detail::wire_message(head.str(), body);
    }
};

} // namespace network
} // namespace labsync
