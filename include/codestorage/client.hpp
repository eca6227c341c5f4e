#pragma once

#include "codestorage/commit/builder.hpp"
#include "codestorage/commit/transport.hpp"
#include "codestorage/core/result.hpp"
#include "codestorage/network/http_client.hpp"

#include <memory>
#include <string>

namespace codestorage {

struct ClientConfig {
    std::string api_base_url;   // http:// or https://; trailing slashes are ignored
    int api_version = 1;
};

/**
 * @brief Entry point for talking to the storage service
 *
 * Holds the shared pieces (HTTP client, commit transport, token provider) and
 * hands out one-shot CommitBuilders.
 *
 * Usage:
 * ```cpp
 * auto client = CodeStorageClient::create({"http://localhost:8080"}, mint_token);
 * auto builder = client.value().create_commit(options);
 * builder->add_file_from_string("a.txt", "hi");
 * auto result = builder->send();
 * ```
 */
class CodeStorageClient {
public:
    /**
     * @brief Validate the configuration and wire the transport
     *
     * @param http Defaults to an AsioHttpClient when null
     */
    static Result<CodeStorageClient> create(ClientConfig config,
                                            commit::AuthTokenProvider token_provider,
                                            std::shared_ptr<network::HttpClient> http = nullptr);

    std::unique_ptr<commit::CommitBuilder> create_commit(commit::CommitOptions options) const;

    const ClientConfig& config() const { return config_; }

    /// Overrides content id generation for builders created afterwards.
    void set_content_id_generator(ContentIdGenerator generator) { content_ids_ = std::move(generator); }

private:
    CodeStorageClient(ClientConfig config,
                      commit::AuthTokenProvider token_provider,
                      std::shared_ptr<commit::CommitTransport> transport);

    ClientConfig config_;
    commit::AuthTokenProvider token_provider_;
    std::shared_ptr<commit::CommitTransport> transport_;
    ContentIdGenerator content_ids_;
};

} // namespace codestorage
