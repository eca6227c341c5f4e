#include "codestorage/client.hpp"

#include <spdlog/spdlog.h>

namespace codestorage {

CodeStorageClient::CodeStorageClient(ClientConfig config,
                                     commit::AuthTokenProvider token_provider,
                                     std::shared_ptr<commit::CommitTransport> transport)
    : config_(std::move(config)),
      token_provider_(std::move(token_provider)),
      transport_(std::move(transport)) {}

Result<CodeStorageClient> CodeStorageClient::create(ClientConfig config,
                                                    commit::AuthTokenProvider token_provider,
                                                    std::shared_ptr<network::HttpClient> http) {
    while (!config.api_base_url.empty() && config.api_base_url.back() == '/') {
        config.api_base_url.pop_back();
    }
    if (config.api_base_url.empty()) {
        return Err<CodeStorageClient>(std::string("api_base_url is required"));
    }
    auto url = network::Url::parse(config.api_base_url);
    if (url.is_error()) {
        return Err<CodeStorageClient>(std::string("Invalid api_base_url: ") + url.error());
    }
    if (config.api_version < 1) {
        return Err<CodeStorageClient>(std::string("api_version must be >= 1"));
    }
    if (!token_provider) {
        return Err<CodeStorageClient>(std::string("A token provider is required"));
    }
    if (!http) {
        http = std::make_shared<network::AsioHttpClient>();
    }

    auto transport = std::make_shared<commit::HttpCommitTransport>(
        commit::TransportConfig{config.api_base_url, config.api_version}, std::move(http));
    spdlog::debug("Code storage client targeting {}", transport->endpoint());

    return Ok(CodeStorageClient(std::move(config), std::move(token_provider), std::move(transport)));
}

std::unique_ptr<commit::CommitBuilder> CodeStorageClient::create_commit(commit::CommitOptions options) const {
    commit::BuilderDeps deps;
    deps.token_provider = token_provider_;
    deps.transport = transport_;
    deps.content_id_generator = content_ids_;
    return std::make_unique<commit::CommitBuilder>(std::move(options), std::move(deps));
}

} // namespace codestorage
