#include "codestorage/commit/transport.hpp"

#include "codestorage/commit/commit_pack.hpp"
#include "codestorage/core/version.hpp"

#include <spdlog/spdlog.h>

namespace codestorage::commit {

HttpCommitTransport::HttpCommitTransport(TransportConfig config,
                                         std::shared_ptr<network::HttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {
    while (!config_.base_url.empty() && config_.base_url.back() == '/') {
        config_.base_url.pop_back();
    }
}

std::string HttpCommitTransport::endpoint() const {
    return config_.base_url + "/api/v" + std::to_string(config_.api_version) + "/repos/commit-pack";
}

Result<CommitPackAck, CommitError> HttpCommitTransport::send(CommitTransportRequest request) {
    if (!http_) {
        return Err<CommitPackAck>(CommitError::transport("No HTTP client configured"));
    }

    auto encoder = std::make_shared<FrameEncoder>(std::move(request.metadata), std::move(request.blobs));

    network::HttpStreamRequest http_request;
    http_request.method = "POST";
    http_request.url = endpoint();
    http_request.headers = {
        {"Authorization", "Bearer " + request.authorization},
        {"Content-Type", "application/x-ndjson"},
        {"Accept", "application/json"},
        {"Code-Storage-Agent", user_agent()},
    };
    http_request.body = [encoder]() { return encoder->next(); };
    http_request.streaming_body = true;
    http_request.cancellation = request.cancellation;

    auto sent = http_->send(http_request).map_error(CommitError::transport);
    if (sent.is_error()) {
        return Err<CommitPackAck>(sent.error());
    }

    const network::HttpResponse& response = sent.value();
    spdlog::debug("commit-pack responded {} after {} frames", response.status_code, encoder->frames_emitted());

    if (!response.is_success()) {
        std::string fallback = "createCommit request failed (" + std::to_string(response.status_code);
        if (!response.reason_phrase.empty()) {
            fallback += " " + response.reason_phrase;
        }
        fallback += ")";

        CommitPackFailure failure = parse_commit_pack_error(response.status_code,
                                                            response.body_as_string(),
                                                            fallback);
        spdlog::warn("commit-pack failed with HTTP {} ({}): {}",
                     response.status_code, failure.status_label, failure.message);
        return Err<CommitPackAck>(CommitError::ref_update_failure(std::move(failure.message),
                                                                  std::move(failure.status_label),
                                                                  std::move(failure.ref_update)));
    }

    return parse_commit_pack_ack(response.body_as_string());
}

} // namespace codestorage::commit
