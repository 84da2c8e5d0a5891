#pragma once

#include "core/core_export.hpp"
#include "core/chain/auditchain.hpp"
#include "core/compat/clock.hpp"
#include "core/crypto/signaturesystem.hpp"
#include "core/event/auditevent.hpp"
#include "core/integrity/merkletree.hpp"
#include "core/securememory.hpp"
#include "core/timestamp/timestampauthority.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ledgerseal::storage {
class AuditStorage;
}

namespace ledgerseal::core {

class CheckpointStore;

/**
 * @brief Daily integrity anchor for one tenant
 *
 * checkpointHash covers date, tenant, Merkle root, event count, first and
 * last event hash and the previous checkpoint's hash. The timestamp token
 * and creation time are not part of it.
 */
struct LEDGERSEAL_CORE_EXPORT Checkpoint {
    compat::CivilDate date;
    std::string tenantId;
    std::string merkleRoot;
    size_t eventCount{0};
    std::string firstEventHash;
    std::string lastEventHash;
    std::optional<TimestampToken> timestampToken;
    std::string previousCheckpointHash;
    std::string checkpointHash;
    compat::Timestamp createdAt{};

    /**
     * @brief Canonical hashed fields as JSON
     */
    nlohmann::json hashedFields() const;

    std::string computeHash() const;

    nlohmann::json toJson() const;

    /**
     * @throws std::runtime_error on malformed input
     */
    static Checkpoint fromJson(const nlohmann::json& json);
};

struct LEDGERSEAL_CORE_EXPORT CheckpointVerificationResult {
    VerificationStatus status{VerificationStatus::Unknown};
    compat::CivilDate date;
    bool checkpointHashValid{false};
    bool merkleRootValid{false};
    bool timestampValid{false};
    bool chainValid{false};
    std::vector<std::string> errors;
    compat::Timestamp verifiedAt{};

    nlohmann::json toJson() const;
};

/**
 * @brief Result of walking the stored checkpoint chain
 */
struct LEDGERSEAL_CORE_EXPORT CheckpointChainResult {
    bool valid{true};
    size_t checkpointsChecked{0};
    std::vector<compat::CivilDate> brokenLinks;
    std::vector<compat::CivilDate> hashMismatches;
    std::vector<std::string> errors;
};

/**
 * @brief Creates and verifies daily checkpoints
 *
 * Events are read through the storage contract, summarized by a Merkle
 * root, attested by the timestamp authority and chained to the tenant's
 * latest earlier checkpoint in the checkpoint store.
 */
class LEDGERSEAL_CORE_EXPORT AuditCheckpoint {
public:
    static constexpr const char* EXPORT_VERSION = "1.0";

    AuditCheckpoint(storage::AuditStorage& storage,
                    MerkleTree& merkleTree,
                    TimestampAuthority& timestampAuthority,
                    CheckpointStore& store);

    // Prevent copying
    AuditCheckpoint(const AuditCheckpoint&) = delete;
    AuditCheckpoint& operator=(const AuditCheckpoint&) = delete;

    /**
     * @brief Create (or return the existing) checkpoint for a tenant's day
     * @return nullopt when the tenant has no events on @p date, or when a
     *         later day of the tenant is already checkpointed
     */
    std::optional<Checkpoint> createCheckpoint(const std::string& tenantId,
                                               const compat::CivilDate& date);

    /**
     * @brief Verify a checkpoint against the events of its day
     *
     * Status is Valid when both the checkpoint hash and the Merkle root
     * hold, Incomplete when exactly one holds, Invalid otherwise. The
     * timestamp and previous-checkpoint link are reported separately.
     */
    CheckpointVerificationResult verifyCheckpoint(const Checkpoint& checkpoint,
                                                  std::vector<AuditEvent> events) const;

    /**
     * @brief Verify a stored checkpoint against the stored events of its day
     */
    CheckpointVerificationResult verifyStoredCheckpoint(const Checkpoint& checkpoint) const;

    /**
     * @brief Check hashes and links of stored checkpoints in [from, to]
     */
    CheckpointChainResult verifyCheckpointChain(const std::string& tenantId,
                                                const compat::CivilDate& from,
                                                const compat::CivilDate& to) const;

    /**
     * @brief Portable signed checkpoint document
     *
     * The signature is Ed25519 over the compact JSON of the "checkpoint"
     * member.
     * @throws std::runtime_error if signing fails
     */
    nlohmann::json exportCheckpoint(const Checkpoint& checkpoint,
                                    const SecureMemory::SecureVector<uint8_t>& signingKey) const;

    /**
     * @brief Check an exported document's signature and checkpoint hash
     */
    bool verifyExport(const nlohmann::json& document,
                      const std::vector<uint8_t>& publicKey) const;

private:
    std::vector<AuditEvent> eventsForDay(const std::string& tenantId,
                                         const compat::CivilDate& date) const;

    storage::AuditStorage& storage_;
    MerkleTree& merkleTree_;
    TimestampAuthority& timestampAuthority_;
    CheckpointStore& store_;
    SignatureSystem signer_;
};

} // namespace ledgerseal::core
