#include "core/chain/auditchain.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <set>
#include <unordered_map>

namespace ledgerseal::core {

namespace {

void sortByTimestamp(std::vector<AuditEvent>& events) {
    std::stable_sort(events.begin(), events.end(),
                     [](const AuditEvent& a, const AuditEvent& b) {
                         return a.timestamp < b.timestamp;
                     });
}

} // anonymous namespace

std::string toString(VerificationStatus status) {
    switch (status) {
        case VerificationStatus::Valid: return "valid";
        case VerificationStatus::Invalid: return "invalid";
        case VerificationStatus::Incomplete: return "incomplete";
        case VerificationStatus::Unknown: return "unknown";
    }
    return "unknown";
}

std::string toString(TamperingType type) {
    switch (type) {
        case TamperingType::HashMismatch: return "hash_mismatch";
        case TamperingType::ChainBreak: return "chain_break";
        case TamperingType::TimestampAnomaly: return "timestamp_anomaly";
        case TamperingType::DuplicateEvent: return "duplicate_event";
    }
    return "hash_mismatch";
}

nlohmann::json ChainVerificationResult::toJson() const {
    nlohmann::json errorList = nlohmann::json::array();
    for (const auto& error : errors) {
        errorList.push_back({
            {"event_id", error.eventId},
            {"type", toString(error.kind)},
            {"expected", error.expected},
            {"actual", error.actual}
        });
    }
    return {
        {"status", toString(status)},
        {"total_events", totalEvents},
        {"valid_events", validEvents},
        {"invalid_events", invalidEvents},
        {"first_event_id", firstEventId ? nlohmann::json(*firstEventId) : nlohmann::json()},
        {"last_event_id", lastEventId ? nlohmann::json(*lastEventId) : nlohmann::json()},
        {"broken_links", brokenLinks},
        {"hash_mismatches", hashMismatches},
        {"errors", errorList},
        {"verified_at", compat::toIso8601(verifiedAt)}
    };
}

nlohmann::json TamperingIndicator::toJson() const {
    return {
        {"event_id", eventId},
        {"tampering_type", toString(type)},
        {"severity", severity},
        {"description", description},
        {"evidence", evidence},
        {"detected_at", compat::toIso8601(detectedAt)}
    };
}

AuditChain::AuditChain(compat::Timestamp::duration clockSkewTolerance)
    : clockSkewTolerance_(clockSkewTolerance) {}

std::string AuditChain::computeEventHash(const AuditEvent& event) {
    return event.computeHash();
}

std::string AuditChain::linkToChain(const AuditEvent* predecessor) {
    return predecessor ? predecessor->hash : std::string();
}

ChainVerificationResult AuditChain::verifyChain(std::vector<AuditEvent> events) const {
    ChainVerificationResult result;
    result.verifiedAt = compat::now();
    if (events.empty()) {
        result.status = VerificationStatus::Valid;
        return result;
    }

    sortByTimestamp(events);
    result.totalEvents = events.size();
    result.firstEventId = events.front().id;
    result.lastEventId = events.back().id;

    for (size_t i = 0; i < events.size(); ++i) {
        const auto& event = events[i];

        const std::string computed = event.computeHash();
        if (computed != event.hash) {
            result.hashMismatches.push_back(event.id);
            result.errors.push_back({event.id, TamperingType::HashMismatch, computed, event.hash});
            ++result.invalidEvents;
            continue;
        }

        if (i > 0 && !event.verifyChain(&events[i - 1])) {
            result.brokenLinks.push_back(event.id);
            result.errors.push_back({event.id, TamperingType::ChainBreak,
                                     events[i - 1].hash, event.previousHash});
            ++result.invalidEvents;
            continue;
        }

        ++result.validEvents;
    }

    if (result.invalidEvents == 0) {
        result.status = VerificationStatus::Valid;
    } else if (result.validEvents == 0) {
        result.status = VerificationStatus::Invalid;
    } else {
        result.status = VerificationStatus::Incomplete;
    }

    logger()->trace("Chain verification: {} events, {} valid, {} invalid",
                    result.totalEvents, result.validEvents, result.invalidEvents);
    return result;
}

std::vector<TamperingIndicator> AuditChain::findTampering(std::vector<AuditEvent> events) const {
    std::vector<TamperingIndicator> indicators;
    if (events.empty()) {
        return indicators;
    }

    sortByTimestamp(events);
    const auto detectedAt = compat::now();
    const auto futureLimit = detectedAt + clockSkewTolerance_;

    // Stored hash -> position, for following previous_hash links
    std::unordered_map<std::string, size_t> byHash;
    for (size_t i = 0; i < events.size(); ++i) {
        byHash.emplace(events[i].hash, i);
    }
    std::set<std::string> seenIds;

    auto report = [&](const AuditEvent& event, TamperingType type, int severity,
                      std::string description, nlohmann::json evidence) {
        indicators.push_back({event.id, type, severity, std::move(description),
                              std::move(evidence), detectedAt});
    };

    for (size_t i = 0; i < events.size(); ++i) {
        const auto& event = events[i];

        if (!seenIds.insert(event.id).second) {
            report(event, TamperingType::DuplicateEvent, DUPLICATE_EVENT_SEVERITY,
                   "Event id appears more than once",
                   {{"event_hash", event.hash}});
        }

        const std::string computed = event.computeHash();
        if (computed != event.hash) {
            report(event, TamperingType::HashMismatch, HASH_MISMATCH_SEVERITY,
                   "Event hash does not match content",
                   {{"expected_hash", computed}, {"actual_hash", event.hash}});
        }

        if (i > 0 && !event.verifyChain(&events[i - 1])) {
            const auto& previous = events[i - 1];
            report(event, TamperingType::ChainBreak, CHAIN_BREAK_SEVERITY,
                   "Chain broken: previous_hash does not match preceding event",
                   {{"expected_previous_hash", previous.hash},
                    {"actual_previous_hash", event.previousHash},
                    {"previous_event_id", previous.id}});
        }

        if (!event.previousHash.empty()) {
            auto linked = byHash.find(event.previousHash);
            if (linked != byHash.end() && linked->second != i &&
                events[linked->second].timestamp > event.timestamp) {
                const auto& predecessor = events[linked->second];
                report(event, TamperingType::TimestampAnomaly, TIMESTAMP_ORDER_SEVERITY,
                       "Event timestamp is before its chain predecessor",
                       {{"event_timestamp", compat::toIso8601(event.timestamp)},
                        {"previous_timestamp", compat::toIso8601(predecessor.timestamp)},
                        {"previous_event_id", predecessor.id}});
            }
        }

        if (event.timestamp > futureLimit) {
            report(event, TamperingType::TimestampAnomaly, TIMESTAMP_FUTURE_SEVERITY,
                   "Event timestamp is in the future",
                   {{"event_timestamp", compat::toIso8601(event.timestamp)},
                    {"current_time", compat::toIso8601(detectedAt)}});
        }
    }

    if (!indicators.empty()) {
        logger()->warn("Tampering scan found {} indicator(s) over {} events",
                       indicators.size(), events.size());
    }
    return indicators;
}

} // namespace ledgerseal::core
