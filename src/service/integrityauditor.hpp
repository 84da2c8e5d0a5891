#pragma once

#include "core/core_export.hpp"
#include "core/chain/auditchain.hpp"
#include "core/checkpoint/checkpoint.hpp"
#include "core/checkpoint/checkpointstore.hpp"
#include "core/compat/clock.hpp"
#include "storage/auditstorage.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ledgerseal::service {

/**
 * @brief Combined verification of one tenant's window
 */
struct LEDGERSEAL_CORE_EXPORT VerificationReport {
    std::string tenantId;
    core::compat::Timestamp start{};
    core::compat::Timestamp end{};
    core::ChainVerificationResult chainResult;
    std::vector<core::TamperingIndicator> tamperingIndicators;
    std::vector<core::CheckpointVerificationResult> checkpointsVerified;
    core::VerificationStatus overallStatus{core::VerificationStatus::Unknown};
    core::compat::Timestamp generatedAt{};

    nlohmann::json toJson() const;
};

/**
 * @brief Runs chain, tampering and checkpoint verification over stored history
 *
 * Read-only; findings are returned as data.
 */
class LEDGERSEAL_CORE_EXPORT IntegrityAuditor {
public:
    IntegrityAuditor(storage::AuditStorage& storage,
                     const core::AuditChain& chain,
                     const core::AuditCheckpoint& checkpoints,
                     core::CheckpointStore& checkpointStore);

    // Prevent copying
    IntegrityAuditor(const IntegrityAuditor&) = delete;
    IntegrityAuditor& operator=(const IntegrityAuditor&) = delete;

    /**
     * @brief Verify the tenant's events in [start, end) and the stored
     *        checkpoints of the days the window touches
     *
     * Overall status is Valid only when the chain is valid, no tampering
     * indicator was found and every checkpoint verified as Valid. It is
     * Invalid when the chain is Invalid, Incomplete otherwise.
     */
    VerificationReport generateReport(const std::string& tenantId,
                                      core::compat::Timestamp start,
                                      core::compat::Timestamp end) const;

private:
    storage::AuditStorage& storage_;
    const core::AuditChain& chain_;
    const core::AuditCheckpoint& checkpoints_;
    core::CheckpointStore& checkpointStore_;
};

} // namespace ledgerseal::service
