#include "codestorage/network/http_client.hpp"
#include "codestorage/network/http_response_parser.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <chrono>
#include <sstream>
#include <utility>

namespace codestorage::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

// Upper bound on how long a cancel() goes unnoticed while an operation is pending.
constexpr std::chrono::milliseconds kCancellationPollInterval{50};

std::string to_lower(std::string value) {
    for (auto& c : value) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return value;
}

std::string chunk_header(std::size_t size) {
    std::ostringstream oss;
    oss << std::hex << size << "\r\n";
    return oss.str();
}

bool is_cancelled(const HttpStreamRequest& request) {
    return request.cancellation && request.cancellation->is_cancelled();
}

/**
 * @brief One client connection whose operations can be cancelled mid-flight
 *
 * Every operation is started asynchronously and the io_context is driven in
 * short slices. Between slices the cancellation token and the deadline are
 * checked; when either fires the socket is closed, which aborts the pending
 * operation.
 */
class Connection {
public:
    Connection(const HttpStreamRequest& request, std::string peer, std::chrono::milliseconds io_timeout)
        : request_(request), peer_(std::move(peer)), io_timeout_(io_timeout), socket_(io_context_) {
    }

    Result<void> connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
        tcp::resolver resolver(io_context_);
        boost::system::error_code ec;
        const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (ec) {
            return Err<void>(std::string("Failed to resolve ") + host + ": " + ec.message());
        }

        bool done = false;
        boost::system::error_code connect_ec;
        asio::async_connect(socket_, endpoints,
            [&done, &connect_ec](const boost::system::error_code& result, const tcp::endpoint&) {
                connect_ec = result;
                done = true;
            });
        if (auto waited = wait(done, timeout, "Timed out connecting to "); waited.is_error()) {
            return waited;
        }
        if (connect_ec) {
            return Err<void>(std::string("Failed to connect to ") + peer_ + ": " + connect_ec.message());
        }
        return Ok();
    }

    template <typename ConstBufferSequence>
    Result<void> write(const ConstBufferSequence& buffers) {
        bool done = false;
        boost::system::error_code write_ec;
        asio::async_write(socket_, buffers,
            [&done, &write_ec](const boost::system::error_code& result, std::size_t) {
                write_ec = result;
                done = true;
            });
        if (auto waited = wait(done, io_timeout_, "Timed out waiting for "); waited.is_error()) {
            return waited;
        }
        if (write_ec) {
            return Err<void>(std::string("Write error: ") + write_ec.message());
        }
        return Ok();
    }

    Result<void> write(const std::string& data) {
        return write(asio::buffer(data));
    }

    /// Reads what is available; `eof` is set once the peer closed the stream.
    Result<std::size_t> read_some(asio::mutable_buffer buffer, bool& eof) {
        bool done = false;
        boost::system::error_code read_ec;
        std::size_t received = 0;
        socket_.async_read_some(buffer,
            [&done, &read_ec, &received](const boost::system::error_code& result, std::size_t n) {
                read_ec = result;
                received = n;
                done = true;
            });
        if (auto waited = wait(done, io_timeout_, "Timed out waiting for "); waited.is_error()) {
            return Err<std::size_t>(waited.error());
        }
        eof = read_ec == asio::error::eof;
        if (read_ec && !eof) {
            return Err<std::size_t>(std::string("Read error: ") + read_ec.message());
        }
        return Ok(received);
    }

    void close() {
        boost::system::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

private:
    Result<void> wait(const bool& done, std::chrono::milliseconds timeout, const char* timeout_message) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!done) {
            if (is_cancelled(request_)) {
                abort();
                spdlog::debug("Request to {} cancelled", peer_);
                return Err<void>(std::string("Request cancelled"));
            }
            if (timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline) {
                abort();
                return Err<void>(timeout_message + peer_);
            }
            io_context_.restart();
            io_context_.run_for(kCancellationPollInterval);
        }
        return Ok();
    }

    // Closing the socket completes the pending handler with operation_aborted.
    void abort() {
        boost::system::error_code ec;
        socket_.close(ec);
        io_context_.restart();
        io_context_.run();
    }

    const HttpStreamRequest& request_;
    std::string peer_;
    std::chrono::milliseconds io_timeout_;
    asio::io_context io_context_;
    tcp::socket socket_;
};

} // namespace

// ──────────────────────────────────────────────────────────
// Url
// ──────────────────────────────────────────────────────────

Result<Url> Url::parse(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return Err<Url>(std::string("URL is missing a scheme: ") + text);
    }

    Url url;
    url.scheme = to_lower(text.substr(0, scheme_end));
    if (url.scheme != "http" && url.scheme != "https") {
        return Err<Url>(std::string("Unsupported URL scheme: ") + url.scheme);
    }

    const auto authority_start = scheme_end + 3;
    const auto path_start = text.find_first_of("/?", authority_start);
    std::string authority = text.substr(authority_start, path_start - authority_start);
    url.target = path_start == std::string::npos ? "/" : text.substr(path_start);
    if (url.target.front() == '?') {
        url.target.insert(url.target.begin(), '/');
    }

    url.port = url.scheme == "https" ? 443 : 80;

    std::string port_text;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return Err<Url>(std::string("Malformed IPv6 host in URL: ") + text);
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return Err<Url>(std::string("Malformed authority in URL: ") + text);
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        const auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            url.host = authority.substr(0, colon);
            port_text = authority.substr(colon + 1);
        } else {
            url.host = authority;
        }
    }

    if (url.host.empty()) {
        return Err<Url>(std::string("URL has no host: ") + text);
    }

    if (!port_text.empty()) {
        unsigned long port = 0;
        for (char c : port_text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return Err<Url>(std::string("Invalid port in URL: ") + text);
            }
            port = port * 10 + static_cast<unsigned long>(c - '0');
            if (port > 65535) {
                return Err<Url>(std::string("Invalid port in URL: ") + text);
            }
        }
        url.port = static_cast<uint16_t>(port);
    }

    return Ok(std::move(url));
}

std::string Url::host_header() const {
    const bool default_port = (scheme == "http" && port == 80) || (scheme == "https" && port == 443);
    const std::string host_part = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return default_port ? host_part : host_part + ":" + std::to_string(port);
}

// ──────────────────────────────────────────────────────────
// AsioHttpClient
// ──────────────────────────────────────────────────────────

AsioHttpClient::AsioHttpClient(std::chrono::milliseconds connect_timeout,
                               std::chrono::milliseconds io_timeout)
    : connect_timeout_(connect_timeout), io_timeout_(io_timeout) {
}

Result<HttpResponse> AsioHttpClient::send(HttpStreamRequest& request) {
    auto url_result = Url::parse(request.url);
    if (url_result.is_error()) {
        return Err<HttpResponse>(url_result.error());
    }
    const Url& url = url_result.value();

    if (url.scheme != "http") {
        return Err<HttpResponse>(std::string("TLS is not handled by AsioHttpClient; use a transport that supports https for ") +
                                 request.url);
    }

    if (is_cancelled(request)) {
        return Err<HttpResponse>(std::string("Request cancelled"));
    }

    // Non-streaming bodies are drained up front so the length is known.
    std::string buffered_body;
    if (!request.streaming_body && request.body) {
        while (true) {
            auto piece = request.body();
            if (piece.is_error()) {
                return Err<HttpResponse>(piece.error());
            }
            if (!piece.value()) {
                break;
            }
            buffered_body += *piece.value();
        }
    }

    Connection connection(request, url.host_header(), io_timeout_);
    if (auto connected = connection.connect(url.host, url.port, connect_timeout_); connected.is_error()) {
        return Err<HttpResponse>(connected.error());
    }

    spdlog::debug("Connected to {}", url.host_header());

    std::ostringstream head;
    head << request.method << " " << url.target << " HTTP/1.1\r\n";
    head << "Host: " << url.host_header() << "\r\n";
    for (const auto& [name, value] : request.headers) {
        head << name << ": " << value << "\r\n";
    }
    if (request.streaming_body && request.body) {
        head << "Transfer-Encoding: chunked\r\n";
    } else {
        head << "Content-Length: " << buffered_body.size() << "\r\n";
    }
    head << "Connection: close\r\n\r\n";

    if (auto res = connection.write(head.str()); res.is_error()) {
        return Err<HttpResponse>(res.error());
    }

    std::size_t body_bytes = 0;
    if (request.streaming_body && request.body) {
        while (true) {
            if (is_cancelled(request)) {
                connection.close();
                spdlog::debug("Request to {} cancelled after {} body bytes", url.host_header(), body_bytes);
                return Err<HttpResponse>(std::string("Request cancelled"));
            }

            auto piece = request.body();
            if (piece.is_error()) {
                connection.close();
                return Err<HttpResponse>(piece.error());
            }
            if (!piece.value()) {
                break;
            }

            const std::string& data = *piece.value();
            if (data.empty()) {
                continue;  // A zero-size chunk would terminate the body
            }

            const std::string size_line = chunk_header(data.size());
            const std::array<asio::const_buffer, 3> buffers{
                asio::buffer(size_line),
                asio::buffer(data),
                asio::buffer("\r\n", 2)};
            if (auto res = connection.write(buffers); res.is_error()) {
                return Err<HttpResponse>(res.error());
            }
            body_bytes += data.size();
        }

        if (auto res = connection.write(std::string("0\r\n\r\n")); res.is_error()) {
            return Err<HttpResponse>(res.error());
        }
    } else if (!buffered_body.empty()) {
        if (auto res = connection.write(buffered_body); res.is_error()) {
            return Err<HttpResponse>(res.error());
        }
        body_bytes = buffered_body.size();
    }

    spdlog::debug("Sent {} {} with {} body bytes", request.method, url.target, body_bytes);

    HttpResponseParser parser;
    std::array<char, kReadBufferSize> buffer{};
    while (true) {
        bool eof = false;
        auto read = connection.read_some(asio::buffer(buffer), eof);
        if (read.is_error()) {
            return Err<HttpResponse>(read.error());
        }
        if (read.value() > 0) {
            auto parsed = parser.parse(buffer.data(), read.value());
            if (parsed.is_error()) {
                return Err<HttpResponse>(std::string("Parse error: ") + parsed.error());
            }
            if (parsed.value()) {
                break;
            }
        }
        if (eof) {
            auto finished = parser.finish();
            if (finished.is_error()) {
                return Err<HttpResponse>(finished.error());
            }
            break;
        }
    }

    connection.close();

    HttpResponse response = parser.get_response();
    spdlog::debug("Received HTTP {} from {}", response.status_code, url.host_header());
    return Ok(std::move(response));
}

} // namespace codestorage::network
