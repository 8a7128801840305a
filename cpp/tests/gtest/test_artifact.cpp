// =============================================================================
// Artifact Serialization Tests
// =============================================================================

#include <gtest/gtest.h>
#include "merklegate/commitment.hpp"
#include "merklegate/error.hpp"
#include "merklegate/io/artifact.hpp"
#include "merklegate/leaf_hasher.hpp"
#include "merklegate/merkle_proof.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace merklegate;
using namespace merklegate::io;

class ArtifactTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("merklegate_artifact_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);

        VoterRecordAdapter adapter;
        report_ = CommitmentBuilder().build(
            "address,name,email\n"
            "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed,Alice,alice@example.com\n"
            "0xfb6916095ca1df60bb79ce92ce3ea74c37c5d359,\"Bob\",\n"
            "0xdbf03b407c01e7cd3cbea99509d93f8dddc8c6fb\n",
            adapter);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    static std::string slurp(const std::filesystem::path& p) {
        std::ifstream in(p);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::filesystem::path dir_;
    CommitmentReport report_;
};

TEST_F(ArtifactTest, MerkleLayout) {
    std::string json = render_merkle_json(report_);

    EXPECT_EQ(json.rfind("{\n  \"root\": \"" + report_.root.to_hex() + "\",\n", 0), 0u);
    EXPECT_NE(json.find("\"leaves\": [\n    \"" + report_.leaves[0].to_hex() + "\""), std::string::npos);
    EXPECT_NE(json.find("\"0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed\": ["), std::string::npos);
    EXPECT_EQ(json.back(), '\n');
}

TEST_F(ArtifactTest, MerkleRoundTripThroughParser) {
    MerkleArtifact artifact = parse_merkle_json(render_merkle_json(report_));

    EXPECT_EQ(artifact.root, report_.root);
    EXPECT_EQ(artifact.leaves, report_.leaves);
    ASSERT_EQ(artifact.proofs.size(), 3u);

    const Proof* proof = artifact.find_proof("0xFB6916095CA1DF60BB79CE92CE3EA74C37C5D359");
    ASSERT_NE(proof, nullptr);
    EXPECT_TRUE(verify_proof(report_.leaves[1], *proof, artifact.root));
    EXPECT_EQ(artifact.find_proof("0xd1220a0cf47c7b9be7a2e6ba89f429762e7b9adb"), nullptr);
}

TEST_F(ArtifactTest, SingleLeafHasEmptyProofArray) {
    CsvRecordAdapter adapter;
    auto single = CommitmentBuilder().build("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed", adapter);
    std::string json = render_merkle_json(single);
    EXPECT_NE(json.find("\"0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed\": []"), std::string::npos);

    auto parsed = parse_merkle_json(json);
    ASSERT_EQ(parsed.proofs.size(), 1u);
    EXPECT_TRUE(parsed.proofs[0].second.empty());
    EXPECT_EQ(parsed.root, single.leaves[0]);
}

TEST_F(ArtifactTest, MalformedArtifactRejected) {
    EXPECT_THROW(parse_merkle_json("{}"), InputError);
    EXPECT_THROW(parse_merkle_json("{\"root\": \"0x12\", \"leaves\": [], \"proofs\": {}}"), InputError);

    // Proof count disagrees with leaf count
    std::string json = render_merkle_json(report_);
    auto pos = json.find("\"0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed\"");
    ASSERT_NE(pos, std::string::npos);
    json.replace(pos + 3, 1, "Z");
    try {
        parse_merkle_json(json);
        FAIL() << "Expected InputError";
    } catch (const InputError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MALFORMED_ARTIFACT);
    }
}

TEST_F(ArtifactTest, MalformedProofDigestRejected) {
    const std::string digest = "\"0x" + std::string(64, '1') + "\"";
    const std::string head = "{ \"root\": " + digest + ", \"leaves\": [" + digest + "], \"proofs\": { "
                             "\"0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed\": ";

    // Short and non-hex entries must not be dropped silently
    for (const std::string& entries : {std::string("[\"0x33333\", \"0xZZ\"]"),
                                       std::string("[" + digest + ", \"0x1234\"]"),
                                       std::string("[12]")}) {
        try {
            parse_merkle_json(head + entries + " } }");
            FAIL() << "Expected InputError for " << entries;
        } catch (const InputError& e) {
            EXPECT_EQ(e.code(), ErrorCode::MALFORMED_ARTIFACT) << entries;
        }
    }

    auto ok = parse_merkle_json(head + "[" + digest + "] } }");
    ASSERT_EQ(ok.proofs.size(), 1u);
    EXPECT_EQ(ok.proofs[0].second.size(), 1u);
}

TEST_F(ArtifactTest, VotersLayout) {
    std::string json = render_voters_json(report_, "2026-01-01T00:00:00.000Z");

    EXPECT_NE(json.find("\"merkleRoot\": \"" + report_.root.to_hex() + "\""), std::string::npos);
    EXPECT_NE(json.find("\"totalVoters\": 3,"), std::string::npos);
    EXPECT_NE(json.find("\"address\": \"0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed\""), std::string::npos);
    EXPECT_NE(json.find("\"name\": \"Alice\""), std::string::npos);
    EXPECT_NE(json.find("\"email\": \"alice@example.com\""), std::string::npos);
    // Quotes inside metadata are escaped
    EXPECT_NE(json.find("\"name\": \"\\\"Bob\\\"\""), std::string::npos);
    EXPECT_NE(json.find("\"generatedAt\": \"2026-01-01T00:00:00.000Z\""), std::string::npos);
}

TEST_F(ArtifactTest, WriteCreatesDirectoriesAndLeavesNoTempFile) {
    auto path = dir_ / "nested" / "merkle.json";
    write_artifact(report_, path);

    ASSERT_TRUE(std::filesystem::exists(path));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "nested" / "merkle.json.tmp"));
    EXPECT_EQ(slurp(path), render_merkle_json(report_));

    MerkleArtifact back = read_merkle_artifact(path);
    EXPECT_EQ(back.root, report_.root);
}

TEST_F(ArtifactTest, SplitProofFiles) {
    ArtifactOptions options;
    options.format = ArtifactFormat::VOTERS;
    options.split_proofs = true;

    auto path = dir_ / "voterList.json";
    write_artifact(report_, path, options);

    EXPECT_EQ(slurp(dir_ / "merkleRoot.txt"), report_.root.to_hex());
    auto proof_file = dir_ / "proofs" / "0xfb6916095ca1df60bb79ce92ce3ea74c37c5d359.json";
    ASSERT_TRUE(std::filesystem::exists(proof_file));
    EXPECT_NE(slurp(proof_file).find("\"address\": \"0xfb6916095ca1df60bb79ce92ce3ea74c37c5d359\""),
              std::string::npos);
}

TEST_F(ArtifactTest, SplitProofFailureLeavesNoArtifact) {
    std::filesystem::create_directories(dir_);
    // A regular file where the proofs directory belongs
    std::ofstream(dir_ / "proofs") << "x";

    ArtifactOptions options;
    options.split_proofs = true;
    auto path = dir_ / "merkle.json";

    try {
        write_artifact(report_, path, options);
        FAIL() << "Expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::WRITE_FAILED);
    }

    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "merkle.json.tmp"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "merkleRoot.txt"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "proofs.tmp"));
    EXPECT_TRUE(std::filesystem::is_regular_file(dir_ / "proofs"));
}

TEST_F(ArtifactTest, SplitProofsReplaceStaleFiles) {
    ArtifactOptions options;
    options.split_proofs = true;
    auto path = dir_ / "merkle.json";
    write_artifact(report_, path, options);

    auto dropped = dir_ / "proofs" / "0xdbf03b407c01e7cd3cbea99509d93f8dddc8c6fb.json";
    ASSERT_TRUE(std::filesystem::exists(dropped));

    CsvRecordAdapter adapter;
    auto smaller = CommitmentBuilder().build(
        "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed\n0xfb6916095ca1df60bb79ce92ce3ea74c37c5d359\n", adapter);
    write_artifact(smaller, path, options);

    EXPECT_FALSE(std::filesystem::exists(dropped));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "proofs" / "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed.json"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "proofs.tmp"));
    EXPECT_EQ(slurp(dir_ / "merkleRoot.txt"), smaller.root.to_hex());
    EXPECT_EQ(read_merkle_artifact(path).root, smaller.root);
}

TEST_F(ArtifactTest, UnwritableDestinationThrows) {
    std::filesystem::create_directories(dir_);
    // A regular file where a directory is needed
    std::ofstream(dir_ / "blocker") << "x";
    EXPECT_THROW(write_artifact(report_, dir_ / "blocker" / "merkle.json"), IOError);
}

TEST_F(ArtifactTest, FormatNames) {
    EXPECT_EQ(parse_artifact_format("merkle"), ArtifactFormat::MERKLE);
    EXPECT_EQ(parse_artifact_format("voters"), ArtifactFormat::VOTERS);
    EXPECT_THROW(parse_artifact_format("yaml"), InvalidArgumentError);
    EXPECT_STREQ(artifact_format_name(ArtifactFormat::VOTERS), "voters");
}

TEST_F(ArtifactTest, JsonEscape) {
    EXPECT_EQ(json_escape("a\"b\\c\n"), "a\\\"b\\\\c\\n");
    EXPECT_EQ(json_escape(std::string(1, '\x01')), "\\u0001");
}
