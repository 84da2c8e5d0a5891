#pragma once

#include "core/core_export.hpp"
#include "core/compat/clock.hpp"
#include "core/event/auditevent.hpp"
#include <cstddef>
#include <limits>
#include <optional>
#include <string>

namespace ledgerseal::core {

/**
 * @brief Read-side predicate over audit events
 *
 * Every present field must match (AND). The time window is [start, end).
 * limit/offset paginate the descending-by-timestamp result of a query.
 */
struct LEDGERSEAL_CORE_EXPORT EventFilter {
    static constexpr size_t DEFAULT_LIMIT = 100;
    static constexpr size_t NO_LIMIT = std::numeric_limits<size_t>::max();

    std::optional<std::string> tenantId;
    std::optional<std::string> projectId;
    std::optional<ActorType> actorType;
    std::optional<std::string> actorId;
    std::optional<std::string> actorEmail;
    std::optional<EventCategory> category;
    std::optional<std::string> eventType;
    std::optional<Severity> severity;
    std::optional<std::string> resourceType;
    std::optional<std::string> resourceId;
    std::optional<Action> action;
    std::optional<compat::Timestamp> start;
    std::optional<compat::Timestamp> end;

    size_t limit{DEFAULT_LIMIT};
    size_t offset{0};

    /**
     * @brief Test the predicate part (pagination is not applied)
     */
    bool matches(const AuditEvent& event) const;

    /**
     * @brief Filter selecting one tenant's events in [start, end)
     */
    static EventFilter forTenant(const std::string& tenantId,
                                 std::optional<compat::Timestamp> start = std::nullopt,
                                 std::optional<compat::Timestamp> end = std::nullopt,
                                 size_t limit = DEFAULT_LIMIT);
};

} // namespace ledgerseal::core
