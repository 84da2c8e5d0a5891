#pragma once

#include "core/core_export.hpp"
#include "core/compat/clock.hpp"
#include "core/event/auditevent.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ledgerseal::core {

/**
 * @brief Outcome of a verification pass
 */
enum class VerificationStatus {
    Valid,
    Invalid,
    Incomplete,
    Unknown
};

/**
 * @brief Kind of integrity finding
 */
enum class TamperingType {
    HashMismatch,
    ChainBreak,
    TimestampAnomaly,
    DuplicateEvent
};

LEDGERSEAL_CORE_EXPORT std::string toString(VerificationStatus status);
LEDGERSEAL_CORE_EXPORT std::string toString(TamperingType type);

/**
 * @brief Detail of one failed check in a chain verification
 */
struct LEDGERSEAL_CORE_EXPORT ChainError {
    std::string eventId;
    TamperingType kind{TamperingType::HashMismatch};
    std::string expected;
    std::string actual;
};

struct LEDGERSEAL_CORE_EXPORT ChainVerificationResult {
    VerificationStatus status{VerificationStatus::Unknown};
    size_t totalEvents{0};
    size_t validEvents{0};
    size_t invalidEvents{0};
    std::optional<std::string> firstEventId;
    std::optional<std::string> lastEventId;
    std::vector<std::string> brokenLinks;
    std::vector<std::string> hashMismatches;
    std::vector<ChainError> errors;
    compat::Timestamp verifiedAt{};

    nlohmann::json toJson() const;
};

/**
 * @brief One suspected tampering finding
 *
 * Severity ranges from 1 (informational) to 10 (integrity broken).
 */
struct LEDGERSEAL_CORE_EXPORT TamperingIndicator {
    std::string eventId;
    TamperingType type{TamperingType::HashMismatch};
    int severity{1};
    std::string description;
    nlohmann::json evidence;
    compat::Timestamp detectedAt{};

    nlohmann::json toJson() const;
};

/**
 * @brief Hash-chain verification over a set of audit events
 *
 * Stateless apart from the clock skew tolerance; safe to share between
 * threads.
 */
class LEDGERSEAL_CORE_EXPORT AuditChain {
public:
    static constexpr int HASH_MISMATCH_SEVERITY = 10;
    static constexpr int CHAIN_BREAK_SEVERITY = 10;
    static constexpr int DUPLICATE_EVENT_SEVERITY = 9;
    static constexpr int TIMESTAMP_ORDER_SEVERITY = 8;
    static constexpr int TIMESTAMP_FUTURE_SEVERITY = 7;

    /**
     * @brief Constructor
     * @param clockSkewTolerance How far in the future a timestamp may be
     *        before it is reported as an anomaly
     */
    explicit AuditChain(compat::Timestamp::duration clockSkewTolerance = compat::minutes(5));

    /**
     * @brief Canonical event hash (see AuditEvent::computeHash)
     */
    static std::string computeEventHash(const AuditEvent& event);

    /**
     * @brief previous_hash value for an event following @p predecessor
     * @return "" when there is no predecessor, else the predecessor's hash
     */
    static std::string linkToChain(const AuditEvent* predecessor);

    /**
     * @brief Verify hashes and links of a sequence
     *
     * Events are ordered by timestamp (stable). An event whose hash does not
     * match is counted invalid and its link is not checked. The first event
     * in the window is not link-checked. Status is Valid with no failures,
     * Invalid when no event passed, Incomplete otherwise.
     */
    ChainVerificationResult verifyChain(std::vector<AuditEvent> events) const;

    /**
     * @brief Detect tampering indicators
     *
     * Reports hash mismatches and chain breaks (as verifyChain), repeated
     * event ids, events timestamped earlier than the event their
     * previous_hash links to, and events timestamped further in the future
     * than the clock skew tolerance. One event may produce several indicators.
     */
    std::vector<TamperingIndicator> findTampering(std::vector<AuditEvent> events) const;

    compat::Timestamp::duration clockSkewTolerance() const { return clockSkewTolerance_; }

private:
    compat::Timestamp::duration clockSkewTolerance_;
};

} // namespace ledgerseal::core
