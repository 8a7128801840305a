// =============================================================================
// Merkle Tree and Proof Tests
// =============================================================================

#include <gtest/gtest.h>
#include "merklegate/address.hpp"
#include "merklegate/error.hpp"
#include "merklegate/keccak.hpp"
#include "merklegate/leaf_hasher.hpp"
#include "merklegate/merkle_proof.hpp"
#include "merklegate/merkle_tree.hpp"

#include <algorithm>
#include <cstdio>
#include <string>
#include <thread>

using namespace merklegate;

class MerkleTreeTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* text : {
                 "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed",
                 "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359",
                 "0xdbF03B407c01E7cD3CBea99509d93f8DDDC8C6FB",
                 "0xD1220A0cf47c7B9Be7A2E6BA89F429762e7b9aDb"}) {
            leaves_.push_back(hash_leaf(*Address::parse(text)));
        }
    }

    // n distinct synthetic leaves
    static std::vector<Digest> synthetic(size_t n) {
        std::vector<Digest> out;
        for (size_t i = 0; i < n; ++i) {
            out.push_back(Keccak256Hasher::hash(std::string_view(std::to_string(i))));
        }
        return out;
    }

    static Digest hex(const char* s) { return *Digest::from_hex(s); }

    std::vector<Digest> leaves_;
};

TEST_F(MerkleTreeTest, LeafDigestKnownValues) {
    EXPECT_EQ(leaves_[0].to_hex(), "0x793f88740e3ced5d3b007ab91feb3feb22d76afe4b9e849aa48d4d35f740fb4e");
    EXPECT_EQ(leaves_[1].to_hex(), "0x913c99ea930c78868f1535d34cd705ab85929b2eaaf70fcd09677ecd6e5d75e9");
    EXPECT_EQ(leaves_[2].to_hex(), "0x1a984f78b5313eb7dc3985bc550deeae6f699f0d0ffb80ad45d4fe793350e52f");
}

TEST_F(MerkleTreeTest, HashPairIsCommutative) {
    EXPECT_EQ(hash_pair(leaves_[0], leaves_[1]), hash_pair(leaves_[1], leaves_[0]));
    EXPECT_EQ(hash_pair(leaves_[0], leaves_[1]),
              hex("0xc28556462c3c3f80e401dc00768c21afed89e873283ae69bea90d5ff1d81448b"));
}

TEST_F(MerkleTreeTest, SingleLeaf) {
    auto tree = MerkleTree::build({leaves_[0]});
    EXPECT_EQ(tree.root(), leaves_[0]);
    EXPECT_EQ(tree.height(), 0u);
    EXPECT_TRUE(tree.proof(0).empty());
    EXPECT_TRUE(verify_proof(leaves_[0], {}, tree.root()));
}

TEST_F(MerkleTreeTest, KnownRoots) {
    auto two = MerkleTree::build({leaves_[0], leaves_[1]});
    EXPECT_EQ(two.root(), hex("0xc28556462c3c3f80e401dc00768c21afed89e873283ae69bea90d5ff1d81448b"));
    EXPECT_EQ(two.height(), 1u);

    auto three = MerkleTree::build({leaves_[0], leaves_[1], leaves_[2]});
    EXPECT_EQ(three.root(), hex("0xd139822b52fcd4e29b077667e0aa9a9ce5326ee4ad70dd0d5154ee001cd3fa08"));
    EXPECT_EQ(three.height(), 2u);

    auto four = MerkleTree::build(leaves_);
    EXPECT_EQ(four.root(), hex("0xfec528d611b07f8f5a85137b3a2c62e2aad6f8b9f8c175cb28615761dee30f63"));
    EXPECT_EQ(four.height(), 2u);
}

// Odd trailing node is promoted, not duplicated
TEST_F(MerkleTreeTest, OddNodeCarried) {
    auto tree = MerkleTree::build({leaves_[0], leaves_[1], leaves_[2]});
    ASSERT_EQ(tree.levels().size(), 3u);
    EXPECT_EQ(tree.levels()[1][1], leaves_[2]);

    auto carried = tree.node(1, 1);
    EXPECT_TRUE(carried.carried);
    EXPECT_FALSE(carried.children.has_value());

    auto paired = tree.node(1, 0);
    EXPECT_FALSE(paired.carried);
    ASSERT_TRUE(paired.children.has_value());
    EXPECT_EQ(paired.children->first, 0u);
    EXPECT_EQ(paired.children->second, 1u);

    // Carried leaf skips level 0
    EXPECT_EQ(tree.proof(2).size(), 1u);
    EXPECT_EQ(tree.proof(0).size(), 2u);
}

TEST_F(MerkleTreeTest, ProofContents) {
    auto tree = MerkleTree::build({leaves_[0], leaves_[1], leaves_[2]});
    Proof p0 = tree.proof(0);
    ASSERT_EQ(p0.size(), 2u);
    EXPECT_EQ(p0[0], leaves_[1]);
    EXPECT_EQ(p0[1], leaves_[2]);

    Proof p2 = tree.proof(2);
    ASSERT_EQ(p2.size(), 1u);
    EXPECT_EQ(p2[0], hash_pair(leaves_[0], leaves_[1]));
}

TEST_F(MerkleTreeTest, EveryProofVerifies) {
    for (size_t n : {1u, 2u, 3u, 5u, 7u, 8u, 13u, 100u}) {
        auto leaves = synthetic(n);
        auto tree = MerkleTree::build(leaves);
        EXPECT_FALSE(tree.verify_all().has_value()) << "n=" << n;
        for (size_t i = 0; i < n; ++i) {
            Proof p = tree.proof(i);
            EXPECT_LE(p.size(), tree.height());
            EXPECT_TRUE(verify_proof(leaves[i], p, tree.root())) << "n=" << n << " i=" << i;
        }
    }
}

TEST_F(MerkleTreeTest, WrongProofFails) {
    auto tree = MerkleTree::build(leaves_);
    Proof p = tree.proof(0);
    EXPECT_FALSE(verify_proof(leaves_[1], p, tree.root()));

    p[0] = leaves_[3];
    EXPECT_FALSE(verify_proof(leaves_[0], p, tree.root()));
    EXPECT_FALSE(verify_proof(leaves_[0], {}, tree.root()));
}

TEST_F(MerkleTreeTest, RootDependsOnPairing) {
    auto abc = MerkleTree::build({leaves_[0], leaves_[1], leaves_[2]}).root();
    auto cba = MerkleTree::build({leaves_[2], leaves_[1], leaves_[0]}).root();
    auto bac = MerkleTree::build({leaves_[1], leaves_[0], leaves_[2]}).root();

    EXPECT_NE(abc, cba);
    EXPECT_EQ(cba, hex("0x1c191ff7d305d2e286f8d6722f7e61274388a89d0abef845805f754fb0bf0dfc"));
    // Swapping within a pair does not change the parent
    EXPECT_EQ(abc, bac);
}

TEST_F(MerkleTreeTest, IndexOfAndBounds) {
    auto tree = MerkleTree::build(leaves_);
    EXPECT_EQ(tree.index_of(leaves_[2]), 2u);
    EXPECT_FALSE(tree.index_of(Digest{}).has_value());

    EXPECT_THROW(tree.proof(4), InvalidArgumentError);
    EXPECT_THROW(tree.node(3, 0), InvalidArgumentError);
    EXPECT_THROW(tree.node(1, 2), InvalidArgumentError);
    EXPECT_EQ(tree.node(2, 0).digest, tree.root());
}

TEST_F(MerkleTreeTest, EmptyLeavesThrow) {
    EXPECT_THROW(MerkleTree::build({}), InvalidArgumentError);
}

TEST_F(MerkleTreeTest, ParallelLeafHashingPreservesOrder) {
    std::vector<Address> addresses;
    for (size_t i = 0; i < 5000; ++i) {
        char buf[43];
        std::snprintf(buf, sizeof(buf), "0x%040zx", i + 1);
        addresses.push_back(*Address::parse(buf));
    }

    auto serial = hash_leaves(addresses, 1);
    auto parallel = hash_leaves(addresses, 4);
    ASSERT_EQ(serial.size(), addresses.size());
    EXPECT_EQ(serial, parallel);
    EXPECT_EQ(serial[17], hash_leaf(addresses[17]));
}

TEST_F(MerkleTreeTest, ThreadCountIsClamped) {
    const size_t hw = std::thread::hardware_concurrency();

    EXPECT_EQ(effective_hash_threads(0, 100), 1u);
    EXPECT_EQ(effective_hash_threads(1, 100), 1u);
    EXPECT_EQ(effective_hash_threads(8, 0), 1u);
    EXPECT_EQ(effective_hash_threads(64, 3), std::min<size_t>(3, hw > 0 ? hw : 3));
    if (hw > 0) {
        EXPECT_LE(effective_hash_threads(5000, 5000), hw);
    }
}

// An absurd request runs on at most the hardware thread count
TEST_F(MerkleTreeTest, OversizedThreadRequestStillHashes) {
    std::vector<Address> addresses;
    for (size_t i = 0; i < 5000; ++i) {
        char buf[43];
        std::snprintf(buf, sizeof(buf), "0x%040zx", i + 1);
        addresses.push_back(*Address::parse(buf));
    }

    EXPECT_EQ(hash_leaves(addresses, 5000), hash_leaves(addresses, 1));
}
