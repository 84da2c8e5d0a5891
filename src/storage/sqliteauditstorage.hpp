#pragma once

#include "core/core_export.hpp"
#include "storage/auditstorage.hpp"
#include <memory>
#include <string>

namespace ledgerseal::storage {

/**
 * @brief Retention-locked SQLite event store
 *
 * One row per event, keyed by event id. Every row carries a retain_until
 * instant (write time plus the retention period). Triggers abort any
 * UPDATE and any DELETE of a row whose retention has not expired, so the
 * lock also holds against other connections to the same file.
 */
class LEDGERSEAL_CORE_EXPORT SqliteAuditStorage : public AuditStorage {
public:
    static constexpr int DEFAULT_RETENTION_DAYS = 2555;

    /**
     * @brief Open or create the event database
     * @param dbPath Database file, or ":memory:"
     * @param retentionDays Retention lock applied to newly written events
     * @throws std::runtime_error if the database cannot be opened or initialized
     */
    explicit SqliteAuditStorage(const std::string& dbPath,
                                int retentionDays = DEFAULT_RETENTION_DAYS);
    ~SqliteAuditStorage() override;

    bool writeEvent(const core::AuditEvent& event) override;

    /**
     * @brief Write events in one transaction
     *
     * Rows whose id already exists are skipped and not counted.
     * @throws std::runtime_error if the transaction fails
     */
    size_t writeBatch(const std::vector<core::AuditEvent>& events) override;

    std::optional<core::AuditEvent> readEvent(const std::string& eventId) override;
    std::vector<core::AuditEvent> query(const core::EventFilter& filter) override;

    /**
     * @brief Delete rows whose retention lock has expired
     * @return Number of rows removed
     */
    size_t purgeExpired();

    /**
     * @brief Retention expiry of a stored event
     */
    std::optional<core::compat::Timestamp> retainUntil(const std::string& eventId);

    int retentionDays() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ledgerseal::storage
