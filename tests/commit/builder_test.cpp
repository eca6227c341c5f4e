#include "codestorage/commit/builder.hpp"
#include "codestorage/commit/transport.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

using codestorage::Result;
using codestorage::commit::BuilderDeps;
using codestorage::commit::ByteSource;
using codestorage::commit::CommitBuilder;
using codestorage::commit::CommitError;
using codestorage::commit::CommitErrorKind;
using codestorage::commit::CommitOptions;
using codestorage::commit::CommitPackAck;
using codestorage::commit::CommitTransportRequest;
using codestorage::commit::FrameEncoder;
using json = nlohmann::json;

namespace {

class FakeTransport : public codestorage::commit::CommitTransport {
public:
    Result<CommitPackAck, CommitError> send(CommitTransportRequest request) override {
        ++calls;
        authorization = request.authorization;
        FrameEncoder encoder(request.metadata, std::move(request.blobs));
        lines.clear();
        while (true) {
            auto line = encoder.next();
            if (line.is_error()) {
                return codestorage::Err<CommitPackAck>(CommitError::transport(line.error()));
            }
            if (!line.value()) {
                break;
            }
            lines.push_back(*line.value());
        }
        return codestorage::Ok<CommitPackAck, CommitError>(ack);
    }

    json metadata() const { return json::parse(lines.at(0))["metadata"]; }

    int calls = 0;
    std::string authorization;
    std::vector<std::string> lines;
    CommitPackAck ack = successful_ack();

private:
    static CommitPackAck successful_ack() {
        CommitPackAck ack;
        ack.commit = {"c1", "t1", "main", 42, 1};
        ack.result.branch = "main";
        ack.result.old_sha = "o1";
        ack.result.new_sha = "c1";
        ack.result.success = true;
        ack.result.status = "ok";
        return ack;
    }
};

/// Honours the request's token the way AsioHttpClient does, and cancels it
/// while the first body piece is being pulled.
class CancellingHttpClient : public codestorage::network::HttpClient {
public:
    Result<codestorage::network::HttpResponse> send(codestorage::network::HttpStreamRequest& request) override {
        seen_token = request.cancellation;
        while (true) {
            if (request.cancellation && request.cancellation->is_cancelled()) {
                return codestorage::Err<codestorage::network::HttpResponse>(std::string("Request cancelled"));
            }
            auto piece = request.body();
            ++pulls;
            if (request.cancellation) {
                request.cancellation->cancel();
            }
            if (piece.is_error()) {
                return codestorage::Err<codestorage::network::HttpResponse>(piece.error());
            }
            if (!piece.value()) {
                break;
            }
        }
        codestorage::network::HttpResponse response;
        response.status_code = 500;
        return codestorage::Ok(response);
    }

    std::shared_ptr<codestorage::network::CancellationToken> seen_token;
    int pulls = 0;
};

struct Harness {
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::vector<std::uint32_t> ttls;
    int next_id = 0;

    BuilderDeps deps() {
        BuilderDeps deps;
        deps.transport = transport;
        deps.token_provider = [this](std::uint32_t ttl) -> Result<std::string> {
            ttls.push_back(ttl);
            return codestorage::Ok(std::string("jwt"));
        };
        deps.content_id_generator = [this] { return "cid-" + std::to_string(++next_id); };
        return deps;
    }
};

CommitOptions sample_options() {
    CommitOptions options;
    options.target_branch = "main";
    options.commit_message = "m";
    options.author = {"A", "a@x"};
    return options;
}

} // namespace

TEST(CommitBuilderTest, SendsSingleStringFile) {
    Harness harness;
    CommitBuilder builder(sample_options(), harness.deps());
    ASSERT_TRUE(builder.add_file_from_string("a.txt", "hi").is_ok());

    auto result = builder.send();
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(result.value().commit_sha, "c1");
    EXPECT_EQ(builder.state(), CommitBuilder::State::Sent);

    ASSERT_EQ(harness.transport->lines.size(), 2u);
    const json metadata = harness.transport->metadata();
    EXPECT_EQ(metadata["target_branch"], "main");
    EXPECT_EQ(metadata["files"][0]["path"], "a.txt");
    EXPECT_EQ(metadata["files"][0]["content_id"], "cid-1");
    EXPECT_EQ(metadata["files"][0]["mode"], "100644");

    const json chunk = json::parse(harness.transport->lines[1])["blob_chunk"];
    EXPECT_EQ(chunk["content_id"], "cid-1");
    EXPECT_EQ(chunk["data"], "aGk=");
    EXPECT_EQ(chunk["eof"], true);

    EXPECT_EQ(harness.transport->authorization, "jwt");
    EXPECT_EQ(harness.ttls, (std::vector<std::uint32_t>{3600}));
}

TEST(CommitBuilderTest, SecondSendFailsWithoutNetworkCall) {
    Harness harness;
    CommitBuilder builder(sample_options(), harness.deps());
    ASSERT_TRUE(builder.send().is_ok());

    auto again = builder.send();
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().kind, CommitErrorKind::Validation);
    EXPECT_EQ(again.error().message, "createCommit builder cannot be reused after send()");
    EXPECT_EQ(harness.transport->calls, 1);

    EXPECT_TRUE(builder.add_file_from_string("late.txt", "x").is_error());
    EXPECT_TRUE(builder.delete_path("late.txt").is_error());
}

TEST(CommitBuilderTest, RejectsRefsPrefixedBaseBranch) {
    Harness harness;
    CommitOptions options = sample_options();
    options.base_branch = "refs/heads/develop";
    CommitBuilder builder(options, harness.deps());

    auto result = builder.send();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, CommitErrorKind::Validation);
    EXPECT_EQ(result.error().message, "createCommit baseBranch must not include refs/ prefix");
    EXPECT_EQ(harness.transport->calls, 0);
    EXPECT_EQ(builder.state(), CommitBuilder::State::Created);
}

TEST(CommitBuilderTest, EphemeralBaseRequiresBaseBranch) {
    Harness harness;
    CommitOptions options = sample_options();
    options.ephemeral_base = true;
    options.base_branch = "   ";
    CommitBuilder builder(options, harness.deps());

    auto result = builder.send();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().message, "createCommit ephemeralBase requires baseBranch");
    EXPECT_EQ(harness.transport->calls, 0);
}

TEST(CommitBuilderTest, RequiresMessageAndAuthor) {
    Harness harness;
    CommitOptions no_message = sample_options();
    no_message.commit_message = "  ";
    EXPECT_EQ(CommitBuilder(no_message, harness.deps()).send().error().message,
              "createCommit commitMessage is required");

    CommitOptions no_email = sample_options();
    no_email.author.email = "";
    EXPECT_EQ(CommitBuilder(no_email, harness.deps()).send().error().message,
              "createCommit author name and email are required");
    EXPECT_EQ(harness.transport->calls, 0);
}

TEST(CommitBuilderTest, TargetBranchNormalisation) {
    CommitOptions options = sample_options();
    options.target_branch = "refs/heads/main";
    EXPECT_EQ(codestorage::commit::resolve_target_branch(options).value(), "main");

    options.target_branch = "  main  ";
    EXPECT_EQ(codestorage::commit::resolve_target_branch(options).value(), "main");

    options.target_branch = "refs/tags/v1";
    EXPECT_TRUE(codestorage::commit::resolve_target_branch(options).is_error());

    options.target_branch = "";
    options.target_ref = "refs/heads/release";
    EXPECT_EQ(codestorage::commit::resolve_target_branch(options).value(), "release");

    options.target_ref = "release";
    EXPECT_EQ(codestorage::commit::resolve_target_branch(options).error().message,
              "createCommit targetRef must start with refs/heads/");

    options.target_ref.reset();
    EXPECT_EQ(codestorage::commit::resolve_target_branch(options).error().message,
              "createCommit targetBranch is required");
}

TEST(CommitBuilderTest, TargetBranchWinsOverLegacyRef) {
    CommitOptions options = sample_options();
    options.target_branch = "feature";
    options.target_ref = "refs/heads/other";
    EXPECT_EQ(codestorage::commit::resolve_target_branch(options).value(), "feature");
}

TEST(CommitBuilderTest, MetadataCarriesOptionalFields) {
    Harness harness;
    CommitOptions options = sample_options();
    options.commit_message = "  message  ";
    options.expected_head_sha = " abc ";
    options.base_branch = " develop ";
    options.committer = codestorage::commit::CommitSignature{"C", "c@x"};
    options.ephemeral = true;
    options.ephemeral_base = true;
    options.ttl_seconds = 120;
    CommitBuilder builder(options, harness.deps());

    ASSERT_TRUE(builder.send().is_ok());
    const json metadata = harness.transport->metadata();
    EXPECT_EQ(metadata["commit_message"], "message");
    EXPECT_EQ(metadata["expected_head_sha"], "abc");
    EXPECT_EQ(metadata["base_branch"], "develop");
    EXPECT_EQ(metadata["committer"]["name"], "C");
    EXPECT_EQ(metadata["ephemeral"], true);
    EXPECT_EQ(metadata["ephemeral_base"], true);
    EXPECT_EQ(harness.ttls, (std::vector<std::uint32_t>{120}));
}

TEST(CommitBuilderTest, PathsAreNormalisedAndValidated) {
    Harness harness;
    CommitBuilder builder(sample_options(), harness.deps());

    EXPECT_TRUE(builder.add_file_from_string("/docs/readme.md", "x").is_ok());
    EXPECT_EQ(builder.add_file_from_string("   ", "x").error().message, "File path must be a non-empty string");
    EXPECT_TRUE(builder.add_file_from_string("/", "x").is_error());
    EXPECT_TRUE(builder.delete_path("docs/readme.md").is_error());
    ASSERT_TRUE(builder.delete_path("/old.txt").is_ok());

    ASSERT_TRUE(builder.send().is_ok());
    const json files = harness.transport->metadata()["files"];
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0]["path"], "docs/readme.md");
    EXPECT_EQ(files[1]["path"], "old.txt");
    EXPECT_EQ(files[1]["operation"], "delete");
    EXPECT_FALSE(files[1].contains("mode"));
    // Deletes produce no blob frames.
    EXPECT_EQ(harness.transport->lines.size(), 2u);
}

TEST(CommitBuilderTest, CustomModeIsForwarded) {
    Harness harness;
    CommitBuilder builder(sample_options(), harness.deps());
    codestorage::commit::FileOptions options;
    options.mode = "100755";
    ASSERT_TRUE(builder.add_file("run.sh", ByteSource::from_string("#!/bin/sh\n"), options).is_ok());

    ASSERT_TRUE(builder.send().is_ok());
    EXPECT_EQ(harness.transport->metadata()["files"][0]["mode"], "100755");
}

TEST(CommitBuilderTest, DuplicateContentIdIsRejected) {
    Harness harness;
    BuilderDeps deps = harness.deps();
    deps.content_id_generator = [] { return std::string("same"); };
    CommitBuilder builder(sample_options(), deps);

    EXPECT_TRUE(builder.add_file_from_string("a.txt", "a").is_ok());
    EXPECT_TRUE(builder.add_file_from_string("b.txt", "b").is_error());
    EXPECT_EQ(builder.operation_count(), 1u);
}

TEST(CommitBuilderTest, DeferredSourceSeesLateMutation) {
    Harness harness;
    CommitBuilder builder(sample_options(), harness.deps());

    auto content = std::make_shared<std::string>("before");
    auto source = ByteSource::from_opener([content]() {
        return std::move(ByteSource::from_string(*content).open().value());
    });
    ASSERT_TRUE(builder.add_file("late.txt", source).is_ok());
    *content = "after";

    ASSERT_TRUE(builder.send().is_ok());
    const json chunk = json::parse(harness.transport->lines[1])["blob_chunk"];
    EXPECT_EQ(chunk["data"], codestorage::base64_encode(codestorage::to_bytes("after")));
}

TEST(CommitBuilderTest, NonUtf8TextUsesEncoder) {
    Harness harness;
    CommitBuilder builder(sample_options(), harness.deps());

    codestorage::commit::TextFileOptions latin1;
    latin1.encoding = "ISO-8859-1";
    ASSERT_TRUE(builder.add_file_from_string("latin.txt", "\xC3\xA9", latin1).is_ok());

    codestorage::commit::TextFileOptions bogus;
    bogus.encoding = "no-such-encoding";
    auto rejected = builder.add_file_from_string("bogus.txt", "x", bogus);
    ASSERT_TRUE(rejected.is_error());
    EXPECT_NE(rejected.error().message.find("Unsupported encoding"), std::string::npos);

    ASSERT_TRUE(builder.send().is_ok());
    const json chunk = json::parse(harness.transport->lines[1])["blob_chunk"];
    EXPECT_EQ(chunk["data"], "6Q==");
}

TEST(CommitBuilderTest, InBandFailureSurfacesRefUpdateError) {
    Harness harness;
    harness.transport->ack.result.success = false;
    harness.transport->ack.result.status = "precondition_failed";
    CommitBuilder builder(sample_options(), harness.deps());

    auto result = builder.send();
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is_ref_update_error());
    EXPECT_EQ(result.error().message, "Commit failed with status precondition_failed");
    EXPECT_EQ(result.error().ref_update->new_sha, std::optional<std::string>("c1"));
}

TEST(CommitBuilderTest, TokenFailureIsTransportError) {
    Harness harness;
    BuilderDeps deps = harness.deps();
    deps.token_provider = [](std::uint32_t) -> Result<std::string> {
        return codestorage::Err<std::string>(std::string("key expired"));
    };
    CommitBuilder builder(sample_options(), deps);

    auto result = builder.send();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, CommitErrorKind::Transport);
    EXPECT_EQ(harness.transport->calls, 0);
}

TEST(CommitBuilderTest, ResolvesTtl) {
    EXPECT_EQ(codestorage::commit::resolve_commit_ttl_seconds(std::nullopt), 3600u);
    EXPECT_EQ(codestorage::commit::resolve_commit_ttl_seconds(0u), 3600u);
    EXPECT_EQ(codestorage::commit::resolve_commit_ttl_seconds(60u), 60u);
}

TEST(CommitBuilderTest, CancellationTokenReachesHttpClient) {
    auto http = std::make_shared<CancellingHttpClient>();
    auto token = std::make_shared<codestorage::network::CancellationToken>();

    Harness harness;
    BuilderDeps deps = harness.deps();
    deps.transport = std::make_shared<codestorage::commit::HttpCommitTransport>(
        codestorage::commit::TransportConfig{"http://git.example.com", 1}, http);

    CommitOptions options = sample_options();
    options.cancellation = token;
    CommitBuilder builder(options, deps);
    ASSERT_TRUE(builder.add_file_from_string("a.txt", "one").is_ok());
    ASSERT_TRUE(builder.add_file_from_string("b.txt", "two").is_ok());

    auto result = builder.send();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, CommitErrorKind::Transport);
    EXPECT_NE(result.error().message.find("Request cancelled"), std::string::npos) << result.error().message;
    EXPECT_EQ(http->seen_token, token);
    EXPECT_EQ(http->pulls, 1);
    EXPECT_TRUE(token->is_cancelled());
}
