#include "codestorage/commit/frame_encoder.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using codestorage::commit::BlobSource;
using codestorage::commit::ByteSource;
using codestorage::commit::ChunkSegment;
using codestorage::commit::CommitFileEntry;
using codestorage::commit::CommitMetadata;
using codestorage::commit::FileOperationKind;
using codestorage::commit::FrameEncoder;
using json = nlohmann::json;

namespace {

CommitMetadata sample_metadata() {
    CommitMetadata metadata;
    metadata.target_branch = "main";
    metadata.commit_message = "m";
    metadata.author = {"A", "a@x"};
    return metadata;
}

std::vector<std::string> drain(FrameEncoder& encoder) {
    std::vector<std::string> lines;
    while (true) {
        auto line = encoder.next();
        EXPECT_TRUE(line.is_ok());
        if (line.is_error() || !line.value()) {
            break;
        }
        lines.push_back(*line.value());
    }
    return lines;
}

} // namespace

TEST(FrameEncoderTest, SingleSmallFileProducesTwoLines) {
    CommitMetadata metadata = sample_metadata();
    metadata.files.push_back(CommitFileEntry{"a.txt", "cid-1", FileOperationKind::Upsert, std::string("100644")});

    std::vector<BlobSource> blobs;
    blobs.push_back(BlobSource{"cid-1", ByteSource::from_string("hi")});

    FrameEncoder encoder(metadata, std::move(blobs));
    const auto lines = drain(encoder);

    ASSERT_EQ(lines.size(), 2u);
    for (const auto& line : lines) {
        ASSERT_FALSE(line.empty());
        EXPECT_EQ(line.back(), '\n');
        EXPECT_EQ(line.find('\n'), line.size() - 1);
    }

    const json first = json::parse(lines[0]);
    ASSERT_TRUE(first.contains("metadata"));
    EXPECT_EQ(first["metadata"]["target_branch"], "main");
    EXPECT_EQ(first["metadata"]["commit_message"], "m");
    EXPECT_EQ(first["metadata"]["author"], (json{{"name", "A"}, {"email", "a@x"}}));
    EXPECT_EQ(first["metadata"]["files"][0]["path"], "a.txt");
    EXPECT_EQ(first["metadata"]["files"][0]["operation"], "upsert");
    EXPECT_EQ(first["metadata"]["files"][0]["mode"], "100644");

    const json second = json::parse(lines[1]);
    EXPECT_EQ(second["blob_chunk"]["content_id"], "cid-1");
    EXPECT_EQ(second["blob_chunk"]["data"], "aGk=");
    EXPECT_EQ(second["blob_chunk"]["eof"], true);
    EXPECT_EQ(encoder.frames_emitted(), 2u);
}

TEST(FrameEncoderTest, OptionalMetadataFieldsAreOmittedUntilSet) {
    CommitMetadata metadata = sample_metadata();
    json payload = codestorage::commit::metadata_to_json(metadata);

    for (const char* key : {"expected_head_sha", "base_branch", "committer", "ephemeral", "ephemeral_base"}) {
        EXPECT_FALSE(payload.contains(key)) << key;
    }
    EXPECT_TRUE(payload["files"].is_array());

    metadata.expected_head_sha = "abc123";
    metadata.base_branch = "develop";
    metadata.committer = codestorage::commit::CommitSignature{"C", "c@x"};
    metadata.ephemeral = true;
    metadata.ephemeral_base = true;
    payload = codestorage::commit::metadata_to_json(metadata);

    EXPECT_EQ(payload["expected_head_sha"], "abc123");
    EXPECT_EQ(payload["base_branch"], "develop");
    EXPECT_EQ(payload["committer"]["email"], "c@x");
    EXPECT_EQ(payload["ephemeral"], true);
    EXPECT_EQ(payload["ephemeral_base"], true);
}

TEST(FrameEncoderTest, DeleteEntriesCarryNoMode) {
    CommitMetadata metadata = sample_metadata();
    metadata.files.push_back(CommitFileEntry{"gone.txt", "cid-9", FileOperationKind::Delete, std::nullopt});

    const json payload = codestorage::commit::metadata_to_json(metadata);
    EXPECT_EQ(payload["files"][0]["operation"], "delete");
    EXPECT_FALSE(payload["files"][0].contains("mode"));
}

TEST(FrameEncoderTest, BlobsAreDrainedInOrderWithoutInterleaving) {
    std::vector<BlobSource> blobs;
    blobs.push_back(BlobSource{"first", ByteSource::from_string("0123456789")});
    blobs.push_back(BlobSource{"second", ByteSource::from_string("")});
    blobs.push_back(BlobSource{"third", ByteSource::from_string("abcde")});

    FrameEncoder encoder(sample_metadata(), std::move(blobs), 4);
    const auto lines = drain(encoder);

    std::vector<std::string> ids;
    std::vector<bool> eofs;
    for (std::size_t i = 1; i < lines.size(); ++i) {
        const json frame = json::parse(lines[i]);
        ids.push_back(frame["blob_chunk"]["content_id"].get<std::string>());
        eofs.push_back(frame["blob_chunk"]["eof"].get<bool>());
    }

    EXPECT_EQ(ids, (std::vector<std::string>{"first", "first", "first", "second", "third", "third"}));
    EXPECT_EQ(eofs, (std::vector<bool>{false, false, true, true, false, true}));
}

TEST(FrameEncoderTest, SourcesOpenOnlyWhenReached) {
    int opened = 0;
    auto counting = [&opened](std::string text) {
        return ByteSource::from_opener([&opened, text]() {
            ++opened;
            return std::move(ByteSource::from_string(text).open().value());
        });
    };

    std::vector<BlobSource> blobs;
    blobs.push_back(BlobSource{"a", counting("aa")});
    blobs.push_back(BlobSource{"b", counting("bb")});

    FrameEncoder encoder(sample_metadata(), std::move(blobs));
    ASSERT_TRUE(encoder.next().is_ok());   // metadata
    EXPECT_EQ(opened, 0);
    ASSERT_TRUE(encoder.next().is_ok());   // a
    EXPECT_EQ(opened, 1);
    ASSERT_TRUE(encoder.next().is_ok());   // b
    EXPECT_EQ(opened, 2);
}

TEST(FrameEncoderTest, ReadFailureNamesTheContent) {
    std::vector<BlobSource> blobs;
    blobs.push_back(BlobSource{"broken", ByteSource::from_file("/nonexistent/codestorage/blob")});

    FrameEncoder encoder(sample_metadata(), std::move(blobs));
    ASSERT_TRUE(encoder.next().is_ok());

    auto failed = encoder.next();
    ASSERT_TRUE(failed.is_error());
    EXPECT_NE(failed.error().find("broken"), std::string::npos);
    EXPECT_FALSE(encoder.next().value().has_value());
}

TEST(FrameEncoderTest, BlobChunkFrameEncodesBinaryData) {
    ChunkSegment segment;
    segment.data = {0x00, 0xFF, 0x10};
    segment.eof = false;

    const json frame = json::parse(codestorage::commit::encode_blob_chunk_frame("id", segment));
    EXPECT_EQ(frame["blob_chunk"]["data"], "AP8Q");
    EXPECT_EQ(frame["blob_chunk"]["eof"], false);
}
