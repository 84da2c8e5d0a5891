#include "core/checkpoint/checkpoint.hpp"
#include "core/checkpoint/checkpointstore.hpp"
#include "core/digest.hpp"
#include "core/logging.hpp"
#include "storage/auditstorage.hpp"
#include <algorithm>
#include <stdexcept>

namespace ledgerseal::core {

namespace {

void sortAscending(std::vector<AuditEvent>& events) {
    std::stable_sort(events.begin(), events.end(),
                     [](const AuditEvent& a, const AuditEvent& b) {
                         return a.timestamp < b.timestamp;
                     });
}

} // anonymous namespace

nlohmann::json Checkpoint::hashedFields() const {
    return {
        {"checkpoint_date", date.toString()},
        {"tenant_id", tenantId},
        {"merkle_root", merkleRoot},
        {"event_count", eventCount},
        {"first_event_hash", firstEventHash},
        {"last_event_hash", lastEventHash},
        {"previous_checkpoint_hash", previousCheckpointHash}
    };
}

std::string Checkpoint::computeHash() const {
    return Digest::sha256Hex(hashedFields().dump(-1, ' ', false,
                                                 nlohmann::json::error_handler_t::replace));
}

nlohmann::json Checkpoint::toJson() const {
    auto json = hashedFields();
    json["timestamp_token"] = timestampToken ? timestampToken->toJson() : nlohmann::json();
    json["checkpoint_hash"] = checkpointHash;
    json["created_at"] = compat::toIso8601(createdAt);
    return json;
}

Checkpoint Checkpoint::fromJson(const nlohmann::json& json) {
    try {
        Checkpoint checkpoint;
        auto date = compat::CivilDate::parse(json.at("checkpoint_date").get<std::string>());
        if (!date) {
            throw std::runtime_error("Malformed checkpoint: bad checkpoint_date");
        }
        checkpoint.date = *date;
        checkpoint.tenantId = json.at("tenant_id").get<std::string>();
        checkpoint.merkleRoot = json.at("merkle_root").get<std::string>();
        checkpoint.eventCount = json.at("event_count").get<size_t>();
        checkpoint.firstEventHash = json.at("first_event_hash").get<std::string>();
        checkpoint.lastEventHash = json.at("last_event_hash").get<std::string>();
        checkpoint.previousCheckpointHash = json.at("previous_checkpoint_hash").get<std::string>();
        checkpoint.checkpointHash = json.at("checkpoint_hash").get<std::string>();
        if (json.contains("timestamp_token") && !json.at("timestamp_token").is_null()) {
            checkpoint.timestampToken = TimestampToken::fromJson(json.at("timestamp_token"));
        }
        if (json.contains("created_at")) {
            auto created = compat::parseIso8601(json.at("created_at").get<std::string>());
            if (!created) {
                throw std::runtime_error("Malformed checkpoint: bad created_at");
            }
            checkpoint.createdAt = *created;
        }
        return checkpoint;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed checkpoint: ") + e.what());
    }
}

nlohmann::json CheckpointVerificationResult::toJson() const {
    return {
        {"status", toString(status)},
        {"checkpoint_date", date.toString()},
        {"checkpoint_hash_valid", checkpointHashValid},
        {"merkle_root_valid", merkleRootValid},
        {"timestamp_valid", timestampValid},
        {"chain_valid", chainValid},
        {"errors", errors},
        {"verified_at", compat::toIso8601(verifiedAt)}
    };
}

AuditCheckpoint::AuditCheckpoint(storage::AuditStorage& storage,
                                 MerkleTree& merkleTree,
                                 TimestampAuthority& timestampAuthority,
                                 CheckpointStore& store)
    : storage_(storage)
    , merkleTree_(merkleTree)
    , timestampAuthority_(timestampAuthority)
    , store_(store) {}

std::vector<AuditEvent> AuditCheckpoint::eventsForDay(const std::string& tenantId,
                                                      const compat::CivilDate& date) const {
    auto filter = EventFilter::forTenant(tenantId, date.startOfDay(), date.next().startOfDay(),
                                         EventFilter::NO_LIMIT);
    auto events = storage_.query(filter);
    sortAscending(events);
    return events;
}

std::optional<Checkpoint> AuditCheckpoint::createCheckpoint(const std::string& tenantId,
                                                            const compat::CivilDate& date) {
    if (auto existing = store_.get(tenantId, date)) {
        logger()->debug("Checkpoint for {} on {} already exists", tenantId, date.toString());
        return existing;
    }

    // Checkpoints link to their predecessor, so days are sealed in order
    if (auto latest = store_.latest(tenantId); latest && date < latest->date) {
        logger()->warn("Checkpoint for {} on {} refused: {} is already checkpointed",
                       tenantId, date.toString(), latest->date.toString());
        return std::nullopt;
    }

    auto events = eventsForDay(tenantId, date);
    if (events.empty()) {
        logger()->info("No events for {} on {}, no checkpoint created", tenantId, date.toString());
        return std::nullopt;
    }

    auto root = merkleTree_.buildTree(events);

    Checkpoint checkpoint;
    checkpoint.date = date;
    checkpoint.tenantId = tenantId;
    checkpoint.merkleRoot = root.hash;
    checkpoint.eventCount = events.size();
    checkpoint.firstEventHash = events.front().hash;
    checkpoint.lastEventHash = events.back().hash;
    checkpoint.createdAt = compat::now();

    checkpoint.timestampToken = timestampAuthority_.getToken(root.hash);
    if (!checkpoint.timestampToken) {
        logger()->warn("Timestamp authority {} issued no token for checkpoint {} {}",
                       timestampAuthority_.name(), tenantId, date.toString());
    }

    if (auto previous = store_.latestBefore(tenantId, date)) {
        checkpoint.previousCheckpointHash = previous->checkpointHash;
    }
    checkpoint.checkpointHash = checkpoint.computeHash();

    if (!store_.save(checkpoint)) {
        // Another writer stored this day first
        if (auto stored = store_.get(tenantId, date)) {
            return stored;
        }
        throw std::runtime_error("Checkpoint store rejected checkpoint for " + tenantId +
                                 " on " + date.toString());
    }

    logger()->info("Created checkpoint {} for {} on {} over {} events",
                   checkpoint.checkpointHash, tenantId, date.toString(), checkpoint.eventCount);
    return checkpoint;
}

CheckpointVerificationResult AuditCheckpoint::verifyCheckpoint(const Checkpoint& checkpoint,
                                                               std::vector<AuditEvent> events) const {
    CheckpointVerificationResult result;
    result.date = checkpoint.date;
    result.verifiedAt = compat::now();

    result.checkpointHashValid = checkpoint.computeHash() == checkpoint.checkpointHash;
    if (!result.checkpointHashValid) {
        result.errors.push_back("Checkpoint hash does not match its fields");
    }

    if (events.empty()) {
        result.errors.push_back("No events found for verification");
    } else {
        sortAscending(events);
        auto root = merkleTree_.buildTree(events);
        result.merkleRootValid = root.hash == checkpoint.merkleRoot;
        if (!result.merkleRootValid) {
            result.errors.push_back("Merkle root does not match events");
        }
        if (events.size() != checkpoint.eventCount) {
            result.errors.push_back("Event count is " + std::to_string(events.size()) +
                                    ", checkpoint records " +
                                    std::to_string(checkpoint.eventCount));
        }
    }

    if (checkpoint.timestampToken) {
        result.timestampValid = timestampAuthority_.verifyToken(*checkpoint.timestampToken,
                                                                checkpoint.merkleRoot);
        if (!result.timestampValid) {
            result.errors.push_back("Timestamp token does not verify");
        }
    } else {
        result.errors.push_back("No timestamp token present");
    }

    auto previous = store_.latestBefore(checkpoint.tenantId, checkpoint.date);
    const std::string expectedPrevious = previous ? previous->checkpointHash : std::string();
    result.chainValid = checkpoint.previousCheckpointHash == expectedPrevious;
    if (!result.chainValid) {
        result.errors.push_back("Previous checkpoint hash does not match stored predecessor");
    }

    if (result.checkpointHashValid && result.merkleRootValid) {
        result.status = VerificationStatus::Valid;
    } else if (result.checkpointHashValid || result.merkleRootValid) {
        result.status = VerificationStatus::Incomplete;
    } else {
        result.status = VerificationStatus::Invalid;
    }
    return result;
}

CheckpointVerificationResult AuditCheckpoint::verifyStoredCheckpoint(
    const Checkpoint& checkpoint) const {
    return verifyCheckpoint(checkpoint, eventsForDay(checkpoint.tenantId, checkpoint.date));
}

CheckpointChainResult AuditCheckpoint::verifyCheckpointChain(const std::string& tenantId,
                                                             const compat::CivilDate& from,
                                                             const compat::CivilDate& to) const {
    CheckpointChainResult result;
    auto checkpoints = store_.list(tenantId, from, to);
    result.checkpointsChecked = checkpoints.size();

    std::string expectedPrevious;
    if (!checkpoints.empty()) {
        if (auto before = store_.latestBefore(tenantId, checkpoints.front().date)) {
            expectedPrevious = before->checkpointHash;
        }
    }

    for (const auto& checkpoint : checkpoints) {
        if (checkpoint.computeHash() != checkpoint.checkpointHash) {
            result.hashMismatches.push_back(checkpoint.date);
            result.errors.push_back("Checkpoint hash mismatch on " + checkpoint.date.toString());
        }
        if (checkpoint.previousCheckpointHash != expectedPrevious) {
            result.brokenLinks.push_back(checkpoint.date);
            result.errors.push_back("Checkpoint chain broken on " + checkpoint.date.toString());
        }
        expectedPrevious = checkpoint.checkpointHash;
    }

    result.valid = result.errors.empty();
    return result;
}

nlohmann::json AuditCheckpoint::exportCheckpoint(
    const Checkpoint& checkpoint,
    const SecureMemory::SecureVector<uint8_t>& signingKey) const {
    auto body = checkpoint.toJson();
    auto signature = signer_.sign(
        body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), signingKey);
    if (signature.empty()) {
        throw std::runtime_error("Failed to sign checkpoint export");
    }
    auto publicKey = signer_.derivePublicKey(signingKey);

    return {
        {"version", EXPORT_VERSION},
        {"checkpoint", body},
        {"exported_at", compat::toIso8601(compat::now())},
        {"signature", Digest::toHex(signature)},
        {"public_key", publicKey ? Digest::toHex(*publicKey) : std::string()}
    };
}

bool AuditCheckpoint::verifyExport(const nlohmann::json& document,
                                   const std::vector<uint8_t>& publicKey) const {
    if (!document.is_object() || !document.contains("checkpoint") ||
        !document.contains("signature") || !document["signature"].is_string()) {
        return false;
    }

    auto signature = Digest::fromHex(document["signature"].get<std::string>());
    if (!signature) {
        return false;
    }
    const auto& body = document["checkpoint"];
    if (!signer_.verify(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                         *signature, publicKey)) {
        logger()->warn("Checkpoint export signature does not verify");
        return false;
    }

    try {
        auto checkpoint = Checkpoint::fromJson(body);
        return checkpoint.computeHash() == checkpoint.checkpointHash;
    } catch (const std::runtime_error& e) {
        logger()->warn("Checkpoint export is malformed: {}", e.what());
        return false;
    }
}

} // namespace ledgerseal::core
