#pragma once

#include "codestorage/commit/errors.hpp"
#include "codestorage/commit/frame_encoder.hpp"
#include "codestorage/commit/types.hpp"
#include "codestorage/core/result.hpp"
#include "codestorage/network/cancellation.hpp"
#include "codestorage/network/http_client.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace codestorage::commit {

struct CommitTransportRequest {
    std::string authorization;  // Bearer token, without the "Bearer " prefix
    std::shared_ptr<network::CancellationToken> cancellation;
    CommitMetadata metadata;
    std::vector<BlobSource> blobs;
};

/**
 * @brief Delivers a commit-pack request and returns the service's ack
 *
 * Implementations report connection problems as Transport errors, failure
 * responses as RefUpdate errors and malformed success bodies as Schema
 * errors. An in-band success:false ack is returned as-is; turning it into an
 * error is left to build_commit_result().
 */
class CommitTransport {
public:
    virtual ~CommitTransport() = default;

    virtual Result<CommitPackAck, CommitError> send(CommitTransportRequest request) = 0;
};

struct TransportConfig {
    std::string base_url;      // Without trailing slash
    int api_version = 1;
};

/**
 * @brief Streams the NDJSON body to {base}/api/v{version}/repos/commit-pack
 */
class HttpCommitTransport : public CommitTransport {
public:
    HttpCommitTransport(TransportConfig config, std::shared_ptr<network::HttpClient> http);

    Result<CommitPackAck, CommitError> send(CommitTransportRequest request) override;

    std::string endpoint() const;

private:
    TransportConfig config_;
    std::shared_ptr<network::HttpClient> http_;
};

} // namespace codestorage::commit
