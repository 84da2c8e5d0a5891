#pragma once

#include "core/core_export.hpp"
#include "core/checkpoint/checkpointstore.hpp"
#include <memory>
#include <string>

namespace ledgerseal::storage {

/**
 * @brief SQLite checkpoint store
 *
 * One row per (tenant, date). Triggers reject UPDATE and DELETE, so a
 * stored checkpoint can only be read back.
 */
class LEDGERSEAL_CORE_EXPORT SqliteCheckpointStore : public core::CheckpointStore {
public:
    /**
     * @throws std::runtime_error if the database cannot be opened or initialized
     */
    explicit SqliteCheckpointStore(const std::string& dbPath);
    ~SqliteCheckpointStore() override;

    bool save(const core::Checkpoint& checkpoint) override;
    std::optional<core::Checkpoint> get(const std::string& tenantId,
                                        const core::compat::CivilDate& date) override;
    std::optional<core::Checkpoint> latestBefore(const std::string& tenantId,
                                                 const core::compat::CivilDate& date) override;
    std::optional<core::Checkpoint> latest(const std::string& tenantId) override;
    std::vector<core::Checkpoint> list(const std::string& tenantId,
                                       const core::compat::CivilDate& from,
                                       const core::compat::CivilDate& to) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ledgerseal::storage
