#pragma once

#include "core/core_export.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace ledgerseal::core {

/**
 * @brief Who performed an audited action
 */
enum class ActorType {
    User,
    Service,
    System
};

/**
 * @brief High-level event classification
 */
enum class EventCategory {
    Auth,
    Data,
    Config,
    Admin,
    Eval
};

enum class Severity {
    Info,
    Warning,
    Critical
};

/**
 * @brief Action performed on the audited resource
 */
enum class Action {
    Create,
    Read,
    Update,
    Delete,
    Export
};

LEDGERSEAL_CORE_EXPORT std::string toString(ActorType value);
LEDGERSEAL_CORE_EXPORT std::string toString(EventCategory value);
LEDGERSEAL_CORE_EXPORT std::string toString(Severity value);
LEDGERSEAL_CORE_EXPORT std::string toString(Action value);

LEDGERSEAL_CORE_EXPORT std::optional<ActorType> actorTypeFromString(const std::string& text);
LEDGERSEAL_CORE_EXPORT std::optional<EventCategory> categoryFromString(const std::string& text);
LEDGERSEAL_CORE_EXPORT std::optional<Severity> severityFromString(const std::string& text);
LEDGERSEAL_CORE_EXPORT std::optional<Action> actionFromString(const std::string& text);

/**
 * @brief Built-in event type names, grouped by category
 */
namespace event_types {

// Auth
inline constexpr const char* USER_LOGIN = "user.login";
inline constexpr const char* USER_LOGOUT = "user.logout";
inline constexpr const char* USER_LOGIN_FAILED = "user.login_failed";
inline constexpr const char* API_KEY_CREATED = "api_key.created";
inline constexpr const char* API_KEY_REVOKED = "api_key.revoked";
inline constexpr const char* SSO_INITIATED = "sso.initiated";
inline constexpr const char* SSO_COMPLETED = "sso.completed";
inline constexpr const char* SSO_FAILED = "sso.failed";
inline constexpr const char* TOKEN_REFRESHED = "token.refreshed";
inline constexpr const char* PASSWORD_CHANGED = "password.changed";
inline constexpr const char* PASSWORD_RESET = "password.reset";

// Data
inline constexpr const char* TRACE_CREATED = "trace.created";
inline constexpr const char* TRACE_VIEWED = "trace.viewed";
inline constexpr const char* TRACE_EXPORTED = "trace.exported";
inline constexpr const char* TRACE_DELETED = "trace.deleted";
inline constexpr const char* TRACE_SHARED = "trace.shared";
inline constexpr const char* EVALUATION_CREATED = "evaluation.created";
inline constexpr const char* EVALUATION_VIEWED = "evaluation.viewed";
inline constexpr const char* EVALUATION_DELETED = "evaluation.deleted";
inline constexpr const char* DATASET_CREATED = "dataset.created";
inline constexpr const char* DATASET_UPDATED = "dataset.updated";
inline constexpr const char* DATASET_DELETED = "dataset.deleted";

// Config
inline constexpr const char* PROJECT_CREATED = "project.created";
inline constexpr const char* PROJECT_UPDATED = "project.updated";
inline constexpr const char* PROJECT_DELETED = "project.deleted";
inline constexpr const char* RETENTION_POLICY_UPDATED = "retention_policy.updated";
inline constexpr const char* EVALUATOR_CREATED = "evaluator.created";
inline constexpr const char* EVALUATOR_UPDATED = "evaluator.updated";
inline constexpr const char* EVALUATOR_DELETED = "evaluator.deleted";
inline constexpr const char* TEST_SUITE_CREATED = "test_suite.created";
inline constexpr const char* TEST_SUITE_UPDATED = "test_suite.updated";
inline constexpr const char* TEST_SUITE_DELETED = "test_suite.deleted";
inline constexpr const char* ALERT_RULE_CREATED = "alert_rule.created";
inline constexpr const char* ALERT_RULE_UPDATED = "alert_rule.updated";
inline constexpr const char* ALERT_RULE_DELETED = "alert_rule.deleted";

// Admin
inline constexpr const char* USER_INVITED = "user.invited";
inline constexpr const char* USER_ROLE_CHANGED = "user.role_changed";
inline constexpr const char* USER_REMOVED = "user.removed";
inline constexpr const char* USER_SUSPENDED = "user.suspended";
inline constexpr const char* USER_REACTIVATED = "user.reactivated";
inline constexpr const char* ORGANIZATION_SETTINGS_UPDATED = "organization.settings_updated";
inline constexpr const char* BILLING_PLAN_CHANGED = "billing.plan_changed";
inline constexpr const char* COMPLIANCE_EXPORT_REQUESTED = "compliance.export_requested";
inline constexpr const char* AUDIT_LOG_VIEWED = "audit_log.viewed";
inline constexpr const char* AUDIT_LOG_EXPORTED = "audit_log.exported";

// Eval
inline constexpr const char* EVALUATION_STARTED = "evaluation.started";
inline constexpr const char* EVALUATION_COMPLETED = "evaluation.completed";
inline constexpr const char* EVALUATION_FAILED = "evaluation.failed";
inline constexpr const char* BASELINE_UPDATED = "baseline.updated";
inline constexpr const char* BENCHMARK_STARTED = "benchmark.started";
inline constexpr const char* BENCHMARK_COMPLETED = "benchmark.completed";

} // namespace event_types

/**
 * @brief Per-category registry of known event type names
 *
 * Starts with the built-in catalog. Applications may register their own
 * names; unregistered names are only accepted through the capture
 * request's custom opt-in when strict validation is enabled.
 * Thread-safe.
 */
class LEDGERSEAL_CORE_EXPORT EventTypeRegistry {
public:
    EventTypeRegistry();

    // Prevent copying
    EventTypeRegistry(const EventTypeRegistry&) = delete;
    EventTypeRegistry& operator=(const EventTypeRegistry&) = delete;

    bool isRegistered(EventCategory category, const std::string& eventType) const;

    /**
     * @brief Add a type name to a category
     * @return false if the name was already registered or is empty
     */
    bool registerType(EventCategory category, const std::string& eventType);

    std::set<std::string> typesFor(EventCategory category) const;

    /**
     * @brief The catalog shipped with the library
     */
    static const std::map<EventCategory, std::set<std::string>>& builtinCatalog();

private:
    mutable std::mutex mutex_;
    std::map<EventCategory, std::set<std::string>> types_;
};

} // namespace ledgerseal::core
