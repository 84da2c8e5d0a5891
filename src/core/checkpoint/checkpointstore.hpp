#pragma once

#include "core/core_export.hpp"
#include "core/checkpoint/checkpoint.hpp"
#include "core/compat/clock.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ledgerseal::core {

/**
 * @brief Write-once persistence for checkpoints, keyed by tenant and date
 */
class LEDGERSEAL_CORE_EXPORT CheckpointStore {
public:
    virtual ~CheckpointStore() = default;

    /**
     * @brief Store a checkpoint
     * @return false if one already exists for its tenant and date
     */
    virtual bool save(const Checkpoint& checkpoint) = 0;

    virtual std::optional<Checkpoint> get(const std::string& tenantId,
                                          const compat::CivilDate& date) = 0;

    /**
     * @brief The tenant's latest checkpoint strictly before @p date
     */
    virtual std::optional<Checkpoint> latestBefore(const std::string& tenantId,
                                                   const compat::CivilDate& date) = 0;

    /**
     * @brief The tenant's most recent checkpoint
     */
    virtual std::optional<Checkpoint> latest(const std::string& tenantId) = 0;

    /**
     * @brief The tenant's checkpoints in [from, to], oldest first
     */
    virtual std::vector<Checkpoint> list(const std::string& tenantId,
                                         const compat::CivilDate& from,
                                         const compat::CivilDate& to) = 0;
};

/**
 * @brief Process-local checkpoint store
 */
class LEDGERSEAL_CORE_EXPORT MemoryCheckpointStore : public CheckpointStore {
public:
    MemoryCheckpointStore() = default;

    bool save(const Checkpoint& checkpoint) override;
    std::optional<Checkpoint> get(const std::string& tenantId,
                                  const compat::CivilDate& date) override;
    std::optional<Checkpoint> latestBefore(const std::string& tenantId,
                                           const compat::CivilDate& date) override;
    std::optional<Checkpoint> latest(const std::string& tenantId) override;
    std::vector<Checkpoint> list(const std::string& tenantId,
                                 const compat::CivilDate& from,
                                 const compat::CivilDate& to) override;

private:
    using Key = std::pair<std::string, compat::CivilDate>;

    std::mutex mutex_;
    std::map<Key, Checkpoint> checkpoints_;
};

} // namespace ledgerseal::core
