#include "labsync/network/url.hpp"

#include <algorithm>
#include <cctype>

namespace labsync {
namespace network {

Result<Url> Url::parse(const std::string& text) {
    Url url;
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return Err(ErrorKind::Configuration, "URL has no scheme: " + text);
    }
    url.scheme = text.substr(0, scheme_end);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (url.scheme != "http" && url.scheme != "https") {
        return Err(ErrorKind::Configuration, "Unsupported URL scheme: " + url.scheme);
    }

    const auto authority_start = scheme_end + 3;
    const auto path_start = text.find_first_of("/?", authority_start);
    std::string authority = text.substr(authority_start, path_start - authority_start);
    url.target = path_start == std::string::npos ? "/" : text.substr(path_start);
    if (url.target.front() == '?') {
        url.target.insert(url.target.begin(), '/');
    }

    const auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority.erase(0, at + 1);
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
        url.host = authority.substr(0, colon);
        url.port = authority.substr(colon + 1);
        if (url.port.empty() ||
            !std::all_of(url.port.begin(), url.port.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return Err(ErrorKind::Configuration, "Invalid port in URL: " + text);
        }
    } else {
        url.host = authority;
        url.port = url.is_tls() ? "443" : "80";
    }

    if (url.host.size() > 2 && url.host.front() == '[' && url.host.back() == ']') {
        url.host = url.host.substr(1, url.host.size() - 2);
    }
    if (url.host.empty()) {
        return Err(ErrorKind::Configuration, "URL has no host: " + text);
    }
    return Ok(std::move(url));
}

std::string Url::authority() const {
    const bool default_port = (is_tls() && port == "443") || (!is_tls() && port == "80");
    const std::string bracketed = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return default_port ? bracketed : bracketed + ":" + port;
}

Url Url::with_target(std::string new_target) const {
    Url copy = *this;
    copy.target = std::move(new_target);
    return copy;
}

std::string url_encode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::string build_query(const std::vector<std::pair<std::string, std::string>>& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) {
            query += '&';
        }
        query += url_encode(key);
        query += '=';
        query += url_encode(value);
    }
    return query;
}

} // namespace network
} // namespace labsync
