#include "core/event/eventfilter.hpp"

namespace ledgerseal::core {

namespace {

template<typename T>
bool fieldMatches(const std::optional<T>& wanted, const T& actual) {
    return !wanted || *wanted == actual;
}

template<typename T>
bool fieldMatches(const std::optional<T>& wanted, const std::optional<T>& actual) {
    return !wanted || (actual && *wanted == *actual);
}

} // anonymous namespace

bool EventFilter::matches(const AuditEvent& event) const {
    if (start && event.timestamp < *start) {
        return false;
    }
    if (end && event.timestamp >= *end) {
        return false;
    }
    return fieldMatches(tenantId, event.tenantId) &&
           fieldMatches(projectId, event.projectId) &&
           fieldMatches(actorType, event.actorType) &&
           fieldMatches(actorId, event.actorId) &&
           fieldMatches(actorEmail, event.actorEmail) &&
           fieldMatches(category, event.category) &&
           fieldMatches(eventType, event.eventType) &&
           fieldMatches(severity, event.severity) &&
           fieldMatches(resourceType, event.resourceType) &&
           fieldMatches(resourceId, event.resourceId) &&
           fieldMatches(action, event.action);
}

EventFilter EventFilter::forTenant(const std::string& tenantId,
                                   std::optional<compat::Timestamp> start,
                                   std::optional<compat::Timestamp> end,
                                   size_t limit) {
    EventFilter filter;
    filter.tenantId = tenantId;
    filter.start = start;
    filter.end = end;
    filter.limit = limit;
    return filter;
}

} // namespace ledgerseal::core
