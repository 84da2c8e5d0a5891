#include "storage/auditstorage.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <iterator>
#include <set>

namespace ledgerseal::storage {

nlohmann::json IntegrityReport::toJson() const {
    return {
        {"valid", valid},
        {"total_events", totalEvents},
        {"verified_events", verifiedEvents},
        {"errors", errors}
    };
}

size_t AuditStorage::writeBatch(const std::vector<core::AuditEvent>& events) {
    size_t written = 0;
    for (const auto& event : events) {
        try {
            if (writeEvent(event)) {
                ++written;
            }
        } catch (const std::exception& e) {
            core::logger()->error("Failed to write audit event {}: {}", event.id, e.what());
        }
    }
    return written;
}

IntegrityReport AuditStorage::verifyIntegrity(const std::string& tenantId,
                                              std::optional<core::compat::Timestamp> start,
                                              std::optional<core::compat::Timestamp> end) {
    auto filter = core::EventFilter::forTenant(tenantId, start, end, core::EventFilter::NO_LIMIT);
    auto events = query(filter);
    std::stable_sort(events.begin(), events.end(),
                     [](const core::AuditEvent& a, const core::AuditEvent& b) {
                         return a.timestamp < b.timestamp;
                     });

    IntegrityReport report;
    report.totalEvents = events.size();
    std::set<std::string> failing;

    for (size_t i = 0; i < events.size(); ++i) {
        const auto& event = events[i];
        if (!event.verifyHash()) {
            report.errors.push_back("Hash mismatch for event " + event.id);
            failing.insert(event.id);
        }
        if (i > 0 && !event.verifyChain(&events[i - 1])) {
            report.errors.push_back("Chain break at event " + event.id);
            failing.insert(event.id);
        }
    }

    report.verifiedEvents = report.totalEvents - failing.size();
    report.valid = report.errors.empty();
    if (!report.valid) {
        core::logger()->warn("Integrity check for tenant {} found {} error(s)",
                             tenantId, report.errors.size());
    }
    return report;
}

std::vector<core::AuditEvent> AuditStorage::paginate(std::vector<core::AuditEvent> matches,
                                                     const core::EventFilter& filter) {
    std::stable_sort(matches.begin(), matches.end(),
                     [](const core::AuditEvent& a, const core::AuditEvent& b) {
                         return a.timestamp > b.timestamp;
                     });
    if (filter.offset >= matches.size()) {
        return {};
    }
    auto first = matches.begin() + static_cast<std::ptrdiff_t>(filter.offset);
    size_t available = matches.size() - filter.offset;
    auto last = first + static_cast<std::ptrdiff_t>(std::min(available, filter.limit));
    return std::vector<core::AuditEvent>(std::make_move_iterator(first),
                                         std::make_move_iterator(last));
}

} // namespace ledgerseal::storage
