#include "labsync/network/http_client.hpp"
#include "labsync/network/http_parser.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <functional>
#include <random>

namespace labsync {
namespace network {

namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = asio::ip::tcp;

namespace {

/**
 * @brief Shared deadline for one request/response exchange
 *
 * run() drives the io_context until the pending operation completes. If
 * the deadline passes first the socket is closed, the aborted handler is
 * drained and run() returns false.
 */
class Deadline {
public:
    explicit Deadline(std::chrono::milliseconds timeout)
        : at_(std::chrono::steady_clock::now() + timeout) {}

    bool run(asio::io_context& io, tcp::socket& socket) {
        return run(io, [&socket]() {
            boost::system::error_code ignored;
            socket.close(ignored);
        });
    }

    bool run(asio::io_context& io, const std::function<void()>& abort) {
        io.restart();
        const auto left = at_ - std::chrono::steady_clock::now();
        if (left > std::chrono::steady_clock::duration::zero()) {
            io.run_for(left);
        }
        if (io.stopped()) {
            return true;
        }
        abort();
        io.run();
        return false;
    }

private:
    std::chrono::steady_clock::time_point at_;
};

Error timed_out(const std::string& step, const Url& url) {
    return Error(ErrorKind::Transport, "Timed out " + step + " " + url.authority());
}

Result<tcp::resolver::results_type> resolve(asio::io_context& io, const Url& url,
                                            Deadline& deadline) {
    tcp::resolver resolver(io);
    boost::system::error_code ec = asio::error::would_block;
    tcp::resolver::results_type results;
    resolver.async_resolve(url.host, url.port,
        [&](const boost::system::error_code& e, tcp::resolver::results_type r) {
            ec = e;
            results = std::move(r);
        });
    if (!deadline.run(io, [&resolver]() { resolver.cancel(); })) {
        return Err(timed_out("resolving", url));
    }
    if (ec) {
        return Err(ErrorKind::Transport, "Cannot resolve " + url.host + ": " + ec.message());
    }
    return Ok(std::move(results));
}

Result<void> connect(asio::io_context& io, const Url& url, tcp::socket& socket, Deadline& deadline) {
    auto endpoints = resolve(io, url, deadline);
    if (endpoints.is_error()) {
        return Err(endpoints.error());
    }
    boost::system::error_code ec = asio::error::would_block;
    asio::async_connect(socket, endpoints.value(),
        [&ec](const boost::system::error_code& e, const tcp::endpoint&) { ec = e; });
    if (!deadline.run(io, socket)) {
        return Err(timed_out("connecting to", url));
    }
    if (ec) {
        return Err(ErrorKind::Transport, "Cannot connect to " + url.authority() + ": " + ec.message());
    }
    return Ok();
}

bool is_end_of_stream(const boost::system::error_code& ec) {
    return ec == asio::error::eof || ec == ssl::error::stream_truncated;
}

template<typename Stream>
Result<HttpResponse> transact(asio::io_context& io, Stream& stream, tcp::socket& socket,
                              const std::vector<uint8_t>& wire, const Url& url, Deadline& deadline) {
    boost::system::error_code ec = asio::error::would_block;
    asio::async_write(stream, asio::buffer(wire),
        [&ec](const boost::system::error_code& e, std::size_t) { ec = e; });
    if (!deadline.run(io, socket)) {
        return Err(timed_out("sending request to", url));
    }
    if (ec) {
        return Err(ErrorKind::Transport, "Send to " + url.authority() + " failed: " + ec.message());
    }

    HttpParser parser(MessageKind::Response);
    std::array<char, 16384> buffer;
    for (;;) {
        std::size_t received = 0;
        ec = asio::error::would_block;
        stream.async_read_some(asio::buffer(buffer),
            [&](const boost::system::error_code& e, std::size_t bytes) {
                ec = e;
                received = bytes;
            });
        if (!deadline.run(io, socket)) {
            return Err(timed_out("waiting for response from", url));
        }

        if (received > 0) {
            auto parsed = parser.parse(buffer.data(), received);
            if (parsed.is_error()) {
                return Err(parsed.error());
            }
            if (parsed.value()) {
                return Ok(parser.response());
            }
        }
        if (is_end_of_stream(ec)) {
            auto finished = parser.finish();
            if (finished.is_error()) {
                return Err(finished.error());
            }
            return Ok(parser.response());
        }
        if (ec) {
            return Err(ErrorKind::Transport,
                       "Receive from " + url.authority() + " failed: " + ec.message());
        }
    }
}

} // namespace

HttpClient::HttpClient(Options options) : options_(std::move(options)) {}

Result<HttpResponse> HttpClient::send(const Url& url, HttpRequest request) const {
    request.url = url.target;
    for (const auto& [name, value] : options_.default_headers) {
        if (!request.has_header(name)) {
            request.headers[name] = value;
        }
    }
    const auto wire = request.serialize(url.authority());
    spdlog::debug("{} {}://{}{}", method_name(request.method),
                  url.scheme, url.authority(), url.target);

    Deadline deadline(options_.timeout);
    asio::io_context io;

    if (!url.is_tls()) {
        tcp::socket socket(io);
        auto connected = connect(io, url, socket, deadline);
        if (connected.is_error()) {
            return Err(connected.error());
        }
        return transact(io, socket, socket, wire, url, deadline);
    }

    ssl::context context(ssl::context::tls_client);
    context.set_default_verify_paths();
    ssl::stream<tcp::socket> stream(io, context);
    if (options_.verify_tls) {
        stream.set_verify_mode(ssl::verify_peer);
        stream.set_verify_callback(ssl::host_name_verification(url.host));
    } else {
        stream.set_verify_mode(ssl::verify_none);
    }
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        return Err(ErrorKind::Transport, "Cannot set TLS server name for " + url.host);
    }

    auto connected = connect(io, url, stream.next_layer(), deadline);
    if (connected.is_error()) {
        return Err(connected.error());
    }

    boost::system::error_code ec = asio::error::would_block;
    stream.async_handshake(ssl::stream_base::client,
        [&ec](const boost::system::error_code& e) { ec = e; });
    if (!deadline.run(io, stream.next_layer())) {
        return Err(timed_out("in TLS handshake with", url));
    }
    if (ec) {
        return Err(ErrorKind::Transport, "TLS handshake with " + url.authority() + " failed: " + ec.message());
    }
    return transact(io, stream, stream.next_layer(), wire, url, deadline);
}

Result<HttpResponse> HttpClient::get(const Url& url) const {
    HttpRequest request;
    request.method = HttpMethod::GET;
    return send(url, std::move(request));
}

Result<HttpResponse> HttpClient::post(const Url& url,
                                      const std::string& content_type,
                                      std::vector<uint8_t> body) const {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.headers["Content-Type"] = content_type;
    request.body = std::move(body);
    return send(url, std::move(request));
}

Result<HttpResponse> HttpClient::post_json(const Url& url, const std::string& json) const {
    return post(url, "application/json", std::vector<uint8_t>(json.begin(), json.end()));
}

// ──────────────────────────────────────────────────────────
// MultipartForm
// ──────────────────────────────────────────────────────────

namespace {

std::string random_boundary() {
    static const char* hex = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dist(0, 15);
    std::string boundary = "----labsync";
    for (int i = 0; i < 24; ++i) {
        boundary += hex[dist(gen)];
    }
    return boundary;
}

} // namespace

MultipartForm::MultipartForm() : MultipartForm(random_boundary()) {}

MultipartForm::MultipartForm(std::string boundary) : boundary_(std::move(boundary)) {}

void MultipartForm::append(const std::string& text) {
    body_.insert(body_.end(), text.begin(), text.end());
}

void MultipartForm::add_field(const std::string& name, const std::string& value) {
    append("--" + boundary_ + "\r\n");
    append("Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n");
    append(value);
    append("\r\n");
}

void MultipartForm::add_file(const std::string& name,
                             const std::string& filename,
                             const std::vector<uint8_t>& data,
                             const std::string& content_type) {
    append("--" + boundary_ + "\r\n");
    append("Content-Disposition: form-data; name=\"" + name + "\"; filename=\"" + filename + "\"\r\n");
    append("Content-Type: " + content_type + "\r\n\r\n");
    body_.insert(body_.end(), data.begin(), data.end());
    append("\r\n");
}

std::string MultipartForm::content_type() const {
    return "multipart/form-data; boundary=" + boundary_;
}

std::vector<uint8_t> MultipartForm::finish() {
    append("--" + boundary_ + "--\r\n");
    return std::move(body_);
}

} // namespace network
} // namespace labsync
