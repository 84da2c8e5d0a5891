#pragma once

#include "storage/auditstorage.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace ledgerseal::test {

/**
 * In-memory AuditStorage that records every batch it receives.
 */
class RecordingStorage : public storage::AuditStorage {
public:
    bool writeEvent(const core::AuditEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return insert(event);
    }

    size_t writeBatch(const std::vector<core::AuditEvent>& events) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++batchCount_;
        if (failBatches_) {
            throw std::runtime_error("storage unavailable");
        }
        size_t written = 0;
        for (const auto& event : events) {
            if (insert(event)) {
                ++written;
            }
        }
        return written;
    }

    std::optional<core::AuditEvent> readEvent(const std::string& eventId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = events_.find(eventId);
        if (it == events_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<core::AuditEvent> query(const core::EventFilter& filter) override {
        std::vector<core::AuditEvent> matches;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& entry : events_) {
                if (filter.matches(entry.second)) {
                    matches.push_back(entry.second);
                }
            }
        }
        return paginate(std::move(matches), filter);
    }

    /// Events in the order they were written
    std::vector<core::AuditEvent> written() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<core::AuditEvent> result;
        for (const auto& id : order_) {
            result.push_back(events_.at(id));
        }
        return result;
    }

    size_t eventCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    size_t batchCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return batchCount_;
    }

    void setFailBatches(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        failBatches_ = fail;
    }

private:
    bool insert(const core::AuditEvent& event) {
        if (!events_.emplace(event.id, event).second) {
            return false;
        }
        order_.push_back(event.id);
        return true;
    }

    mutable std::mutex mutex_;
    std::map<std::string, core::AuditEvent> events_;
    std::vector<std::string> order_;
    size_t batchCount_{0};
    bool failBatches_{false};
};

} // namespace ledgerseal::test
