#pragma once

#include "core/core_export.hpp"
#include "core/compat/clock.hpp"
#include "core/event/auditevent.hpp"
#include "core/event/eventfilter.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ledgerseal::storage {

/**
 * @brief Result of re-verifying a stored window
 */
struct LEDGERSEAL_CORE_EXPORT IntegrityReport {
    bool valid{true};
    size_t totalEvents{0};
    size_t verifiedEvents{0};
    std::vector<std::string> errors;

    nlohmann::json toJson() const;
};

/**
 * @brief Append-only event store contract
 *
 * Implementations must be safe to call from several threads: the capture
 * service flushes from background workers while readers query.
 */
class LEDGERSEAL_CORE_EXPORT AuditStorage {
public:
    virtual ~AuditStorage() = default;

    /**
     * @brief Append one event
     * @return false (without throwing) if an event with this id already exists
     * @throws std::runtime_error on I/O failure
     */
    virtual bool writeEvent(const core::AuditEvent& event) = 0;

    /**
     * @brief Append events best-effort
     * @return Number of events actually written
     */
    virtual size_t writeBatch(const std::vector<core::AuditEvent>& events);

    /**
     * @brief Point lookup by event id
     */
    virtual std::optional<core::AuditEvent> readEvent(const std::string& eventId) = 0;

    /**
     * @brief Events matching @p filter, newest first, paginated
     */
    virtual std::vector<core::AuditEvent> query(const core::EventFilter& filter) = 0;

    /**
     * @brief Recompute hashes and links over a tenant's window [start, end)
     *
     * Read-only. verifiedEvents counts events with no finding.
     */
    virtual IntegrityReport verifyIntegrity(const std::string& tenantId,
                                            std::optional<core::compat::Timestamp> start = std::nullopt,
                                            std::optional<core::compat::Timestamp> end = std::nullopt);

protected:
    AuditStorage() = default;

    /**
     * @brief Order matches newest first and apply offset/limit
     */
    static std::vector<core::AuditEvent> paginate(std::vector<core::AuditEvent> matches,
                                                  const core::EventFilter& filter);

private:
    // Prevent copying
    AuditStorage(const AuditStorage&) = delete;
    AuditStorage& operator=(const AuditStorage&) = delete;
};

} // namespace ledgerseal::storage
