#pragma once

#include "core/core_export.hpp"
#include "core/compat/clock.hpp"
#include "core/event/eventtypes.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace ledgerseal::core {

/**
 * @brief One audit fact in a tenant's hash chain
 *
 * The hash covers every field except @c hash itself, encoded as compact
 * JSON with sorted keys (nested payloads included), absent optionals as
 * null, the timestamp as ISO-8601 UTC and enumerations as their tags.
 * An event is sealed once its hash has been computed and is not changed
 * afterwards by the ledger.
 */
struct LEDGERSEAL_CORE_EXPORT AuditEvent {
    // Identification
    std::string id;
    compat::Timestamp timestamp{};
    std::string tenantId;
    std::optional<std::string> projectId;

    // Actor
    ActorType actorType{ActorType::System};
    std::string actorId{"system"};
    std::optional<std::string> actorEmail;
    std::optional<std::string> actorIp;
    std::optional<std::string> actorUserAgent;

    // Classification
    EventCategory category{EventCategory::Data};
    std::string eventType;
    Severity severity{Severity::Info};

    // Resource
    std::string resourceType;
    std::string resourceId;
    std::optional<std::string> resourceName;

    // Change details
    Action action{Action::Read};
    std::optional<nlohmann::json> previousState;
    std::optional<nlohmann::json> newState;
    std::optional<nlohmann::json> metadata;

    // Correlation
    std::string requestId;
    std::optional<std::string> sessionId;

    // Integrity
    std::string hash;
    std::string previousHash;

    /**
     * @brief Canonical hash input (all fields except hash)
     */
    nlohmann::json canonicalJson() const;

    /**
     * @brief SHA-256 of the canonical encoding as lowercase hex
     */
    std::string computeHash() const;

    /**
     * @brief Compute and store the hash
     */
    void seal();

    /**
     * @brief Check the stored hash against a fresh computation
     */
    bool verifyHash() const;

    /**
     * @brief Check the link to the chronologically preceding event
     * @param predecessor Preceding event, or nullptr for the first event of a chain
     * @return true if previousHash is "" (no predecessor) or equals predecessor->hash
     */
    bool verifyChain(const AuditEvent* predecessor) const;

    /**
     * @brief Dedup key: tenant:event_type:resource_type:resource_id:action
     */
    std::string deduplicationKey() const;

    /**
     * @brief Serialized record: canonical fields plus the stored hash
     */
    nlohmann::json toJson() const;

    /**
     * @brief Rebuild an event from its serialized record
     *
     * The stored hash is kept as-is so that altered records stay detectable.
     * @throws std::runtime_error on missing fields or malformed values
     */
    static AuditEvent fromJson(const nlohmann::json& json);
};

} // namespace ledgerseal::core
