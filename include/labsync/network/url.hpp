#pragma once

#include "labsync/core/result.hpp"

#include <string>
#include <utility>
#include <vector>

namespace labsync {
namespace network {

/**
 * @brief Absolute http(s) URL split into the parts a client needs
 */
struct Url {
    std::string scheme;     ///< "http" or "https"
    std::string host;
    std::string port;       ///< Explicit or scheme default
    std::string target;     ///< Path plus query, at least "/"

    static Result<Url> parse(const std::string& text);

    bool is_tls() const { return scheme == "https"; }

    /// Host header value; the port is omitted when it is the scheme default.
    std::string authority() const;

    /// Resolve an absolute path ("/api/v1/...") against this URL's origin.
    Url with_target(std::string new_target) const;
};

/// Percent-encode everything except RFC 3986 unreserved characters.
std::string url_encode(const std::string& value);

/// "a=1&b=x%20y" from ordered key/value pairs.
std::string build_query(const std::vector<std::pair<std::string, std::string>>& params);

} // namespace network
} // namespace labsync
