#include "core/integrity/merkletree.hpp"
#include "core/digest.hpp"
#include "mocks/eventfactory.hpp"
#include "test_config.h"
#include <gtest/gtest.h>
#include <atomic>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace ledgerseal::core;
using ledgerseal::test::fixedTime;
using ledgerseal::test::makeChain;

class MerkleTreeTest : public ::testing::Test {
protected:
    void SetUp() override {
        tree_ = std::make_unique<MerkleTree>();
        tree_->enableDebugOutput();
        logFile_.open(std::string(TEST_OUTPUT_DIR) + "/merkle_test.log",
                      std::ios::out | std::ios::app);
        logFile_ << "=== " << ::testing::UnitTest::GetInstance()->current_test_info()->name()
                 << " ===\n";
    }

    void TearDown() override {
        logFile_ << tree_->getDebugOutput() << "\n" << std::flush;
        logFile_.close();
    }

    std::vector<AuditEvent> events(size_t count) {
        return makeChain("tenant-m", count, fixedTime("2024-06-01T00:00:00Z"));
    }

    std::unique_ptr<MerkleTree> tree_;
    std::ofstream logFile_;
};

TEST_F(MerkleTreeTest, EmptyTree) {
    auto root = tree_->buildTree(std::vector<AuditEvent>{});
    EXPECT_EQ(root.hash, MerkleTree::emptyTreeHash());
    EXPECT_EQ(root.hash, Digest::sha256Hex(""));
    EXPECT_EQ(root.leafCount, 0u);
    EXPECT_FALSE(root.firstEventId.has_value());
}

TEST_F(MerkleTreeTest, SingleLeafIsRoot) {
    auto leaves = events(1);
    auto root = tree_->buildTree(leaves);
    EXPECT_EQ(root.hash, leaves[0].hash);

    auto proof = tree_->generateProof(leaves[0], root);
    ASSERT_TRUE(proof.has_value());
    EXPECT_TRUE(proof->siblingHashes.empty());
    EXPECT_TRUE(tree_->verifyProof(leaves[0], *proof, root));
}

TEST_F(MerkleTreeTest, TwoLeaves) {
    auto leaves = events(2);
    auto root = tree_->buildTree(leaves);
    EXPECT_EQ(root.hash, MerkleTree::hashPair(leaves[0].hash, leaves[1].hash));
    EXPECT_EQ(root.hash, Digest::sha256Hex(leaves[0].hash + leaves[1].hash));
    EXPECT_EQ(root.firstEventId, leaves[0].id);
    EXPECT_EQ(root.lastEventId, leaves[1].id);
}

TEST_F(MerkleTreeTest, OddLevelDuplicatesLastNode) {
    auto leaves = events(3);
    auto root = tree_->buildTree(leaves);
    auto left = MerkleTree::hashPair(leaves[0].hash, leaves[1].hash);
    auto right = MerkleTree::hashPair(leaves[2].hash, leaves[2].hash);
    EXPECT_EQ(root.hash, MerkleTree::hashPair(left, right));
    EXPECT_EQ(root.leafCount, 3u);
}

TEST_F(MerkleTreeTest, ProofRoundTripForEveryLeaf) {
    for (size_t count : {1u, 2u, 3u, 5u, 7u, 8u, 13u}) {
        auto leaves = events(count);
        auto root = tree_->buildTree(leaves);
        for (const auto& leaf : leaves) {
            auto proof = tree_->generateProof(leaf, root);
            ASSERT_TRUE(proof.has_value()) << "count=" << count << " leaf=" << leaf.id;
            EXPECT_TRUE(tree_->verifyProof(leaf, *proof, root)) << "count=" << count;
        }
        tree_->clearDebugOutput();
    }
}

TEST_F(MerkleTreeTest, EightLeavesGiveThreeSiblings) {
    auto leaves = events(8);
    auto root = tree_->buildTree(leaves);

    for (const auto& leaf : leaves) {
        auto proof = tree_->generateProof(leaf, root);
        ASSERT_TRUE(proof.has_value());
        ASSERT_EQ(proof->siblingHashes.size(), 3u);
        ASSERT_EQ(proof->directions.size(), 3u);

        for (size_t i = 0; i < proof->siblingHashes.size(); ++i) {
            MerkleProof corrupted = *proof;
            corrupted.siblingHashes[i][0] = corrupted.siblingHashes[i][0] == '0' ? '1' : '0';
            EXPECT_FALSE(tree_->verifyProof(leaf, corrupted, root)) << "sibling " << i;
        }
    }
}

TEST_F(MerkleTreeTest, ProofRunsLeafToRoot) {
    auto leaves = events(4);
    auto root = tree_->buildTree(leaves);
    auto proof = tree_->generateProof(leaves[0], root);
    ASSERT_TRUE(proof.has_value());
    ASSERT_EQ(proof->siblingHashes.size(), 2u);
    EXPECT_EQ(proof->siblingHashes[0], leaves[1].hash);
    EXPECT_EQ(proof->directions[0], ProofDirection::Right);
    EXPECT_EQ(proof->siblingHashes[1], MerkleTree::hashPair(leaves[2].hash, leaves[3].hash));

    auto last = tree_->generateProof(leaves[3], root);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->siblingHashes[0], leaves[2].hash);
    EXPECT_EQ(last->directions[0], ProofDirection::Left);
}

TEST_F(MerkleTreeTest, FlippedLeafOrForeignRootFails) {
    auto leaves = events(6);
    auto root = tree_->buildTree(leaves);
    auto proof = tree_->generateProof(leaves[4], root);
    ASSERT_TRUE(proof.has_value());

    AuditEvent flipped = leaves[4];
    flipped.hash[0] = flipped.hash[0] == 'a' ? 'b' : 'a';
    EXPECT_FALSE(tree_->verifyProof(flipped, *proof, root));

    auto otherRoot = tree_->buildTree(makeChain("tenant-x", 6, fixedTime("2024-06-02T00:00:00Z")));
    EXPECT_FALSE(tree_->verifyProof(leaves[4], *proof, otherRoot));

    // Even with the proof's root field rewritten to match
    MerkleProof rebound = *proof;
    rebound.rootHash = otherRoot.hash;
    EXPECT_FALSE(tree_->verifyProof(leaves[4], rebound, otherRoot));
}

TEST_F(MerkleTreeTest, UnknownEventHasNoProof) {
    auto leaves = events(4);
    auto root = tree_->buildTree(leaves);
    auto stranger = makeChain("tenant-x", 1, fixedTime("2024-06-02T00:00:00Z"))[0];
    EXPECT_FALSE(tree_->generateProof(stranger, root).has_value());
}

TEST_F(MerkleTreeTest, ProofJsonRoundTrip) {
    auto leaves = events(5);
    auto root = tree_->buildTree(leaves);
    auto proof = tree_->generateProof(leaves[2], root);
    ASSERT_TRUE(proof.has_value());

    auto restored = MerkleProof::fromJson(proof->toJson());
    EXPECT_EQ(restored.siblingHashes, proof->siblingHashes);
    EXPECT_EQ(restored.directions, proof->directions);
    EXPECT_TRUE(tree_->verifyProof(leaves[2], restored, root));

    auto bad = proof->toJson();
    bad["proof_directions"][0] = "up";
    EXPECT_THROW(MerkleProof::fromJson(bad), std::runtime_error);
}

TEST_F(MerkleTreeTest, DebugOutputCanBeDisabled) {
    tree_->clearDebugOutput();
    tree_->disableDebugOutput();
    tree_->buildTree(events(3));
    EXPECT_TRUE(tree_->getDebugOutput().empty());

    tree_->enableDebugOutput();
    tree_->buildTree(events(3));
    EXPECT_NE(tree_->getDebugOutput().find("Root hash"), std::string::npos);
}

TEST_F(MerkleTreeTest, SharedTreeAcrossThreads) {
    auto leaves = events(9);
    const auto expected = tree_->buildTree(leaves).hash;
    tree_->clearDebugOutput();

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 25; ++i) {
                const auto& leaf = leaves[i % leaves.size()];
                auto root = tree_->buildTree(leaves);
                auto proof = tree_->generateProof(leaf, root);
                if (root.hash != expected || !proof || !tree_->verifyProof(leaf, *proof, root)) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_NE(tree_->getDebugOutput().find("Verification result: true"), std::string::npos);
}
