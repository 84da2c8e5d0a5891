#include "service/integrityauditor.hpp"
#include "core/event/eventfilter.hpp"
#include "core/logging.hpp"
#include <algorithm>

namespace ledgerseal::service {

using core::VerificationStatus;

nlohmann::json VerificationReport::toJson() const {
    nlohmann::json indicators = nlohmann::json::array();
    for (const auto& indicator : tamperingIndicators) {
        indicators.push_back(indicator.toJson());
    }
    nlohmann::json checkpoints = nlohmann::json::array();
    for (const auto& result : checkpointsVerified) {
        checkpoints.push_back(result.toJson());
    }
    return {
        {"tenant_id", tenantId},
        {"time_range", {
            {"start", core::compat::toIso8601(start)},
            {"end", core::compat::toIso8601(end)}
        }},
        {"chain_result", chainResult.toJson()},
        {"tampering_indicators", indicators},
        {"checkpoints_verified", checkpoints},
        {"overall_status", core::toString(overallStatus)},
        {"generated_at", core::compat::toIso8601(generatedAt)}
    };
}

IntegrityAuditor::IntegrityAuditor(storage::AuditStorage& storage,
                                   const core::AuditChain& chain,
                                   const core::AuditCheckpoint& checkpoints,
                                   core::CheckpointStore& checkpointStore)
    : storage_(storage)
    , chain_(chain)
    , checkpoints_(checkpoints)
    , checkpointStore_(checkpointStore) {}

VerificationReport IntegrityAuditor::generateReport(const std::string& tenantId,
                                                    core::compat::Timestamp start,
                                                    core::compat::Timestamp end) const {
    VerificationReport report;
    report.tenantId = tenantId;
    report.start = start;
    report.end = end;

    auto events = storage_.query(
        core::EventFilter::forTenant(tenantId, start, end, core::EventFilter::NO_LIMIT));

    report.chainResult = chain_.verifyChain(events);
    report.tamperingIndicators = chain_.findTampering(std::move(events));

    if (start < end) {
        const auto firstDay = core::compat::CivilDate::fromTimestamp(start);
        const auto lastDay = core::compat::CivilDate::fromTimestamp(end - core::compat::microseconds(1));
        for (const auto& checkpoint : checkpointStore_.list(tenantId, firstDay, lastDay)) {
            report.checkpointsVerified.push_back(checkpoints_.verifyStoredCheckpoint(checkpoint));
        }
    }

    const bool checkpointsValid = std::all_of(
        report.checkpointsVerified.begin(), report.checkpointsVerified.end(),
        [](const core::CheckpointVerificationResult& r) { return r.status == VerificationStatus::Valid; });

    if (report.chainResult.status == VerificationStatus::Valid
        && report.tamperingIndicators.empty() && checkpointsValid) {
        report.overallStatus = VerificationStatus::Valid;
    } else if (report.chainResult.status == VerificationStatus::Invalid) {
        report.overallStatus = VerificationStatus::Invalid;
    } else {
        report.overallStatus = VerificationStatus::Incomplete;
    }
    report.generatedAt = core::compat::now();

    core::logger()->info("Verification report for tenant {}: {} ({} events, {} indicators, {} checkpoints)",
                         tenantId, core::toString(report.overallStatus),
                         report.chainResult.totalEvents, report.tamperingIndicators.size(),
                         report.checkpointsVerified.size());
    return report;
}

} // namespace ledgerseal::service
