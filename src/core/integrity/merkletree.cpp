#include "core/integrity/merkletree.hpp"
#include "core/digest.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace ledgerseal::core {

std::string toString(ProofDirection direction) {
    return direction == ProofDirection::Left ? "left" : "right";
}

nlohmann::json MerkleRoot::toJson() const {
    return {
        {"root_hash", hash},
        {"event_count", leafCount},
        {"created_at", compat::toIso8601(createdAt)},
        {"first_event_id", firstEventId ? nlohmann::json(*firstEventId) : nlohmann::json()},
        {"last_event_id", lastEventId ? nlohmann::json(*lastEventId) : nlohmann::json()}
    };
}

nlohmann::json MerkleProof::toJson() const {
    nlohmann::json dirs = nlohmann::json::array();
    for (auto direction : directions) {
        dirs.push_back(toString(direction));
    }
    return {
        {"event_id", eventId},
        {"event_hash", eventHash},
        {"proof_hashes", siblingHashes},
        {"proof_directions", dirs},
        {"root_hash", rootHash}
    };
}

MerkleProof MerkleProof::fromJson(const nlohmann::json& json) {
    try {
        MerkleProof proof;
        proof.eventId = json.at("event_id").get<std::string>();
        proof.eventHash = json.at("event_hash").get<std::string>();
        proof.siblingHashes = json.at("proof_hashes").get<std::vector<std::string>>();
        for (const auto& dir : json.at("proof_directions")) {
            const auto text = dir.get<std::string>();
            if (text == "left") {
                proof.directions.push_back(ProofDirection::Left);
            } else if (text == "right") {
                proof.directions.push_back(ProofDirection::Right);
            } else {
                throw std::runtime_error("Unknown proof direction: " + text);
            }
        }
        proof.rootHash = json.at("root_hash").get<std::string>();
        return proof;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed Merkle proof: ") + e.what());
    }
}

std::string MerkleTree::hashPair(const std::string& left, const std::string& right) {
    return Digest::sha256Hex(left + right);
}

std::string MerkleTree::emptyTreeHash() {
    return Digest::sha256Hex("");
}

void MerkleTree::debug(const std::string& message) const {
    if (debugEnabled_) {
        std::lock_guard<std::mutex> lock(debugMutex_);
        debugStream_ << message << std::endl;
    }
}

std::string MerkleTree::getDebugOutput() const {
    std::lock_guard<std::mutex> lock(debugMutex_);
    return debugStream_.str();
}

void MerkleTree::clearDebugOutput() {
    std::lock_guard<std::mutex> lock(debugMutex_);
    debugStream_.str("");
}

MerkleRoot MerkleTree::buildTree(const std::vector<AuditEvent>& events) const {
    std::vector<std::pair<std::string, std::string>> leaves;
    leaves.reserve(events.size());
    for (const auto& event : events) {
        leaves.emplace_back(event.id, event.hash);
    }
    return buildTree(leaves);
}

MerkleRoot MerkleTree::buildTree(
    const std::vector<std::pair<std::string, std::string>>& leaves) const {
    debug("\n=== buildTree: " + std::to_string(leaves.size()) + " leaves ===");

    MerkleRoot root;
    root.createdAt = compat::now();
    root.leafCount = leaves.size();

    if (leaves.empty()) {
        root.hash = emptyTreeHash();
        root.tree = std::make_shared<MerkleNode>();
        root.tree->hash = root.hash;
        debug("Empty tree");
        return root;
    }

    root.firstEventId = leaves.front().first;
    root.lastEventId = leaves.back().first;

    std::vector<std::shared_ptr<MerkleNode>> level;
    level.reserve(leaves.size());
    for (const auto& leaf : leaves) {
        auto node = std::make_shared<MerkleNode>();
        node->hash = leaf.second;
        node->leafEventId = leaf.first;
        level.push_back(std::move(node));
    }

    size_t depth = 0;
    while (level.size() > 1) {
        if (level.size() % 2 != 0) {
            debug("Level " + std::to_string(depth) + " is odd, repeating last node");
            level.push_back(level.back());
        }

        std::vector<std::shared_ptr<MerkleNode>> parents;
        parents.reserve(level.size() / 2);
        for (size_t i = 0; i < level.size(); i += 2) {
            auto parent = std::make_shared<MerkleNode>();
            parent->left = level[i];
            parent->right = level[i + 1];
            parent->hash = hashPair(parent->left->hash, parent->right->hash);
            debug("Level " + std::to_string(depth + 1) + " node " +
                  std::to_string(i / 2) + ": " + parent->hash);
            parents.push_back(std::move(parent));
        }
        level = std::move(parents);
        ++depth;
    }

    root.tree = level.front();
    root.hash = root.tree->hash;
    debug("Root hash: " + root.hash);
    logger()->trace("Built Merkle tree over {} leaves, depth {}", leaves.size(), depth);
    return root;
}

bool MerkleTree::findPath(const std::shared_ptr<MerkleNode>& node,
                          const std::string& leafHash,
                          std::vector<std::pair<std::string, ProofDirection>>& path) const {
    if (!node) {
        return false;
    }
    if (node->isLeaf()) {
        return node->leafEventId.has_value() && node->hash == leafHash;
    }

    if (node->left) {
        path.emplace_back(node->right ? node->right->hash : node->left->hash,
                          ProofDirection::Right);
        if (findPath(node->left, leafHash, path)) {
            return true;
        }
        path.pop_back();
    }
    if (node->right) {
        path.emplace_back(node->left ? node->left->hash : node->right->hash,
                          ProofDirection::Left);
        if (findPath(node->right, leafHash, path)) {
            return true;
        }
        path.pop_back();
    }
    return false;
}

std::optional<MerkleProof> MerkleTree::generateProof(const AuditEvent& event,
                                                     const MerkleRoot& root) const {
    debug("\n=== Generating proof for event " + event.id + " ===");
    std::vector<std::pair<std::string, ProofDirection>> path;
    if (!findPath(root.tree, event.hash, path)) {
        debug("Event hash is not a leaf of this tree");
        return std::nullopt;
    }

    // Path was collected root to leaf
    std::reverse(path.begin(), path.end());

    MerkleProof proof;
    proof.eventId = event.id;
    proof.eventHash = event.hash;
    proof.rootHash = root.hash;
    for (const auto& step : path) {
        debug("Sibling (" + toString(step.second) + "): " + step.first);
        proof.siblingHashes.push_back(step.first);
        proof.directions.push_back(step.second);
    }
    debug("Proof generated with " + std::to_string(proof.siblingHashes.size()) + " elements");
    return proof;
}

bool MerkleTree::verifyProof(const AuditEvent& event,
                             const MerkleProof& proof,
                             const MerkleRoot& root) const {
    debug("\n=== Verifying proof for event " + event.id + " ===");
    if (event.hash != proof.eventHash) {
        debug("Event hash does not match proof");
        return false;
    }
    if (root.hash != proof.rootHash) {
        debug("Root hash does not match proof");
        return false;
    }
    if (proof.siblingHashes.size() != proof.directions.size()) {
        debug("Proof hashes and directions differ in length");
        return false;
    }

    std::string current = event.hash;
    for (size_t i = 0; i < proof.siblingHashes.size(); ++i) {
        const auto& sibling = proof.siblingHashes[i];
        current = proof.directions[i] == ProofDirection::Left
                      ? hashPair(sibling, current)
                      : hashPair(current, sibling);
        debug("Step " + std::to_string(i) + ": " + current);
    }

    bool result = current == root.hash;
    debug("Verification result: " + std::string(result ? "true" : "false"));
    return result;
}

} // namespace ledgerseal::core
