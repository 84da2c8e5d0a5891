#pragma once

#include "core/core_export.hpp"
#include "core/compat/clock.hpp"
#include "core/event/auditevent.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace ledgerseal::core {

/**
 * @brief Node of a Merkle tree over event hashes
 *
 * Children are shared because an odd level repeats its last node as its
 * own sibling.
 */
struct LEDGERSEAL_CORE_EXPORT MerkleNode {
    std::string hash;
    std::shared_ptr<MerkleNode> left;
    std::shared_ptr<MerkleNode> right;
    std::optional<std::string> leafEventId;

    bool isLeaf() const { return !left && !right; }
};

struct LEDGERSEAL_CORE_EXPORT MerkleRoot {
    std::string hash;
    size_t leafCount{0};
    compat::Timestamp createdAt{};
    std::shared_ptr<MerkleNode> tree;
    std::optional<std::string> firstEventId;
    std::optional<std::string> lastEventId;

    nlohmann::json toJson() const;
};

/**
 * @brief Side on which a proof's sibling hash sits
 */
enum class ProofDirection {
    Left,   // sibling is the left operand: H(sibling || current)
    Right   // sibling is the right operand: H(current || sibling)
};

LEDGERSEAL_CORE_EXPORT std::string toString(ProofDirection direction);

/**
 * @brief Inclusion proof, sibling hashes ordered leaf to root
 */
struct LEDGERSEAL_CORE_EXPORT MerkleProof {
    std::string eventId;
    std::string eventHash;
    std::vector<std::string> siblingHashes;
    std::vector<ProofDirection> directions;
    std::string rootHash;

    nlohmann::json toJson() const;

    /**
     * @throws std::runtime_error on malformed input
     */
    static MerkleProof fromJson(const nlohmann::json& json);
};

/**
 * @brief Merkle tree engine for audit event inclusion proofs
 *
 * Leaves are event hashes in the given order. Internal nodes hash the
 * concatenation of their children's hex digests, left then right. A level
 * with an odd number of nodes repeats its last node. The empty tree hashes
 * to SHA-256 of the empty string.
 *
 * Building and verifying are pure per call, so one instance may be shared
 * between threads. Debug output, when enabled, is collected per instance
 * under a lock; lines from concurrent calls may interleave.
 */
class LEDGERSEAL_CORE_EXPORT MerkleTree {
public:
    MerkleTree() = default;

    // Prevent copying
    MerkleTree(const MerkleTree&) = delete;
    MerkleTree& operator=(const MerkleTree&) = delete;

    /**
     * @brief Parent hash: SHA-256 over leftHex || rightHex
     */
    static std::string hashPair(const std::string& left, const std::string& right);

    /**
     * @brief Hash of a tree with no leaves
     */
    static std::string emptyTreeHash();

    /**
     * @brief Build a tree whose leaves are the events' hashes
     * @param events Events in arrival order
     */
    MerkleRoot buildTree(const std::vector<AuditEvent>& events) const;

    /**
     * @brief Build a tree from (event id, hash) leaves
     */
    MerkleRoot buildTree(const std::vector<std::pair<std::string, std::string>>& leaves) const;

    /**
     * @brief Generate an inclusion proof for an event
     * @return Proof, or nullopt if the event's hash is not a leaf of @p root
     */
    std::optional<MerkleProof> generateProof(const AuditEvent& event,
                                             const MerkleRoot& root) const;

    /**
     * @brief Verify an inclusion proof without walking the tree
     */
    bool verifyProof(const AuditEvent& event,
                     const MerkleProof& proof,
                     const MerkleRoot& root) const;

    // Debug helpers
    void enableDebugOutput() { debugEnabled_ = true; }
    void disableDebugOutput() { debugEnabled_ = false; }
    std::string getDebugOutput() const;
    void clearDebugOutput();

private:
    bool findPath(const std::shared_ptr<MerkleNode>& node,
                  const std::string& leafHash,
                  std::vector<std::pair<std::string, ProofDirection>>& path) const;

    void debug(const std::string& message) const;

    std::atomic<bool> debugEnabled_{false};
    mutable std::mutex debugMutex_;
    mutable std::stringstream debugStream_;
};

} // namespace ledgerseal::core
