#include "core/checkpoint/checkpointstore.hpp"

namespace ledgerseal::core {

bool MemoryCheckpointStore::save(const Checkpoint& checkpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    return checkpoints_.emplace(Key{checkpoint.tenantId, checkpoint.date}, checkpoint).second;
}

std::optional<Checkpoint> MemoryCheckpointStore::get(const std::string& tenantId,
                                                     const compat::CivilDate& date) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = checkpoints_.find(Key{tenantId, date});
    if (it == checkpoints_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Checkpoint> MemoryCheckpointStore::latestBefore(const std::string& tenantId,
                                                              const compat::CivilDate& date) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = checkpoints_.lower_bound(Key{tenantId, date});
    if (it == checkpoints_.begin()) {
        return std::nullopt;
    }
    --it;
    if (it->first.first != tenantId) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Checkpoint> MemoryCheckpointStore::latest(const std::string& tenantId) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Every key of the tenant sorts before the smallest longer tenant id
    auto it = checkpoints_.lower_bound(Key{tenantId + '\0', compat::CivilDate()});
    if (it == checkpoints_.begin()) {
        return std::nullopt;
    }
    --it;
    if (it->first.first != tenantId) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Checkpoint> MemoryCheckpointStore::list(const std::string& tenantId,
                                                    const compat::CivilDate& from,
                                                    const compat::CivilDate& to) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Checkpoint> result;
    for (auto it = checkpoints_.lower_bound(Key{tenantId, from});
         it != checkpoints_.end() && it->first.first == tenantId && it->first.second <= to;
         ++it) {
        result.push_back(it->second);
    }
    return result;
}

} // namespace ledgerseal::core
