#pragma once

#include "core/core_export.hpp"
#include "storage/auditstorage.hpp"
#include <filesystem>
#include <memory>

namespace ledgerseal::storage {

/**
 * @brief Filesystem event store
 *
 * Layout: <base>/<tenant>/<YYYY>/<MM>/<DD>/<event_id>.json. Each file is
 * written once and then made read-only. An id index, rebuilt from disk on
 * construction, rejects repeated ids across days. Tenant and event ids
 * must be path-safe (letters, digits, '-', '_', '.', not starting with '.').
 */
class LEDGERSEAL_CORE_EXPORT LocalAuditStorage : public AuditStorage {
public:
    /**
     * @brief Open or create a store rooted at @p basePath
     * @throws std::runtime_error if the directory cannot be created or scanned
     */
    explicit LocalAuditStorage(std::filesystem::path basePath);
    ~LocalAuditStorage() override;

    bool writeEvent(const core::AuditEvent& event) override;
    std::optional<core::AuditEvent> readEvent(const std::string& eventId) override;
    std::vector<core::AuditEvent> query(const core::EventFilter& filter) override;

    const std::filesystem::path& basePath() const;

    /**
     * @brief Path an event is (or would be) stored at
     */
    std::filesystem::path eventPath(const core::AuditEvent& event) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ledgerseal::storage
