#pragma once

#include "codestorage/core/result.hpp"
#include "codestorage/network/cancellation.hpp"
#include "codestorage/network/http_types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace codestorage::network {

/**
 * @brief Pull-based request body
 *
 * Each call yields the next piece of the body, std::nullopt once the body is
 * exhausted, or an error that aborts the request. The client only pulls when
 * it is ready to write, so the producer is paced by the connection.
 */
using BodyProducer = std::function<Result<std::optional<std::string>>()>;

/**
 * @brief Components of an absolute http(s) URL
 */
struct Url {
    std::string scheme;   // "http" or "https"
    std::string host;
    uint16_t port = 0;
    std::string target;   // Path plus query, always starting with '/'

    static Result<Url> parse(const std::string& text);

    /// Host header value; the port is omitted when it is the scheme default.
    std::string host_header() const;
};

struct HttpStreamRequest {
    std::string method = "POST";
    std::string url;
    HeaderList headers;
    BodyProducer body;

    /**
     * When set the body is sent with chunked transfer encoding as it is
     * produced; the whole body is written before the response is read
     * (half-duplex). When clear the body is drained first and sent with a
     * Content-Length.
     */
    bool streaming_body = false;

    std::shared_ptr<CancellationToken> cancellation;
};

/**
 * @brief Transport capable of sending a streamed request body
 *
 * Errors are transport failures (resolve, connect, I/O, cancellation, body
 * producer failure). Any HTTP status, including 4xx/5xx, is a successful
 * send and is returned as a response.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual Result<HttpResponse> send(HttpStreamRequest& request) = 0;
};

/**
 * @brief Blocking HTTP/1.1 client built on Boost.Asio
 *
 * One connection per request (Connection: close). Plain TCP only; https
 * URLs are rejected because TLS setup is left to the embedding application.
 *
 * Connect, writes and reads are cancellable while in flight: the request's
 * cancellation token is polled during every socket operation and the socket
 * is closed once it is set. A non-zero io_timeout bounds how long a single
 * write or read may wait for the peer.
 *
 * Usage:
 * ```cpp
 * AsioHttpClient client;
 * HttpStreamRequest request;
 * request.url = "http://localhost:8080/api/v1/repos/commit-pack";
 * request.body = producer;
 * request.streaming_body = true;
 * auto response = client.send(request);
 * ```
 */
class AsioHttpClient : public HttpClient {
public:
    static constexpr std::size_t kReadBufferSize = 8192;

    explicit AsioHttpClient(std::chrono::milliseconds connect_timeout = std::chrono::seconds(30),
                            std::chrono::milliseconds io_timeout = std::chrono::milliseconds::zero());

    Result<HttpResponse> send(HttpStreamRequest& request) override;

private:
    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds io_timeout_;
};

} // namespace codestorage::network
