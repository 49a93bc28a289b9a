#pragma once

#include "labsync/core/result.hpp"
#include "labsync/network/http_types.hpp"
#include "labsync/network/url.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace labsync {
namespace network {

/**
 * @brief Blocking HTTP/1.1 client built on Boost.Asio
 *
 * Each call opens a fresh connection (plain TCP or TLS, by URL scheme),
 * sends one request with Connection: close and reads the response. The
 * whole exchange, from name resolution to the last response byte, runs
 * against a single deadline; running out of time is a Transport error.
 *
 * A non-2xx status is a successful exchange here. Callers decide what the
 * status means.
 *
 * Thread safety: calls share no mutable state and may run concurrently.
 */
class HttpClient {
public:
    struct Options {
        std::chrono::milliseconds timeout{30000};
        bool verify_tls = true;
        HttpHeaders default_headers;    ///< Added to every request unless overridden
    };

    explicit HttpClient(Options options);

    Result<HttpResponse> send(const Url& url, HttpRequest request) const;

    Result<HttpResponse> get(const Url& url) const;
    Result<HttpResponse> post(const Url& url,
                              const std::string& content_type,
                              std::vector<uint8_t> body) const;
    Result<HttpResponse> post_json(const Url& url, const std::string& json) const;

    const Options& options() const { return options_; }

private:
    Options options_;
};

/**
 * @brief multipart/form-data body builder
 *
 * ```cpp
 * MultipartForm form;
 * form.add_field("json_data", descriptor.dump());
 * form.add_file("attached_file", "image.tif", bytes);
 * client.post(url, form.content_type(), form.finish());
 * ```
 */
class MultipartForm {
public:
    MultipartForm();
    explicit MultipartForm(std::string boundary);

    void add_field(const std::string& name, const std::string& value);
    void add_file(const std::string& name,
                  const std::string& filename,
                  const std::vector<uint8_t>& data,
                  const std::string& content_type = "application/octet-stream");

    std::string content_type() const;
    const std::string& boundary() const { return boundary_; }

    /// Close the body. The form must not be modified afterwards.
    std::vector<uint8_t> finish();

private:
    void append(const std::string& text);

    std::string boundary_;
    std::vector<uint8_t> body_;
};

} // namespace network
} // namespace labsync
