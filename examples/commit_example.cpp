/**
 * @file commit_example.cpp
 * @brief Streams a commit to a storage service
 *
 * Usage: commit_example <api-base-url> <token> <branch> [file...]
 *
 * Every file named on the command line is uploaded under its own path; a
 * README.md generated from a string is always included. Files are opened
 * only when the request body reaches them, so large files are never held
 * in memory.
 *
 * Learning note: the builder is one-shot. A second send() on the same
 * builder is rejected before anything touches the network, so retries
 * always start from a fresh builder.
 */

#include "codestorage/client.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <string>

using namespace codestorage;

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::debug);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " <api-base-url> <token> <branch> [file...]\n";
        return 1;
    }

    const std::string token = argv[2];
    auto client = CodeStorageClient::create(
        ClientConfig{argv[1], 1},
        [token](std::uint32_t ttl_seconds) -> Result<std::string> {
            spdlog::debug("Using static token (requested ttl {}s)", ttl_seconds);
            return Ok(token);
        });
    if (client.is_error()) {
        spdlog::error("Invalid configuration: {}", client.error());
        return 1;
    }

    commit::CommitOptions options;
    options.target_branch = argv[3];
    options.commit_message = "Upload from commit_example";
    options.author = {"Example Bot", "bot@example.com"};

    auto builder = client.value().create_commit(options);

    if (auto added = builder->add_file_from_string("README.md", "# Uploaded by commit_example\n");
        added.is_error()) {
        spdlog::error("{}", added.error().message);
        return 1;
    }
    for (int i = 4; i < argc; ++i) {
        auto added = builder->add_file(argv[i], commit::ByteSource::from_file(argv[i]));
        if (added.is_error()) {
            spdlog::error("Cannot add {}: {}", argv[i], added.error().message);
            return 1;
        }
    }

    auto result = builder->send();
    if (result.is_error()) {
        const auto& error = result.error();
        spdlog::error("Commit failed [{}]: {}", commit::to_string(error.kind), error.message);
        if (error.is_ref_update_error()) {
            spdlog::error("  status: {} (reason: {})", error.status, commit::to_string(error.reason));
            if (error.ref_update) {
                spdlog::error("  branch: {} old: {} new: {}",
                              error.ref_update->branch.value_or("?"),
                              error.ref_update->old_sha.value_or("?"),
                              error.ref_update->new_sha.value_or("?"));
            }
        }
        return 2;
    }

    const auto& committed = result.value();
    spdlog::info("Committed {} to {} ({} blobs, {} pack bytes)",
                 committed.commit_sha, committed.target_branch, committed.blob_count, committed.pack_bytes);
    spdlog::info("{}: {} -> {}", committed.ref_update.branch, committed.ref_update.old_sha,
                 committed.ref_update.new_sha);
    return 0;
}
