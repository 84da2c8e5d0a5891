#include "core/event/eventtypes.hpp"

namespace ledgerseal::core {

std::string toString(ActorType value) {
    switch (value) {
        case ActorType::User: return "user";
        case ActorType::Service: return "service";
        case ActorType::System: return "system";
    }
    return "system";
}

std::string toString(EventCategory value) {
    switch (value) {
        case EventCategory::Auth: return "auth";
        case EventCategory::Data: return "data";
        case EventCategory::Config: return "config";
        case EventCategory::Admin: return "admin";
        case EventCategory::Eval: return "eval";
    }
    return "data";
}

std::string toString(Severity value) {
    switch (value) {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Critical: return "critical";
    }
    return "info";
}

std::string toString(Action value) {
    switch (value) {
        case Action::Create: return "create";
        case Action::Read: return "read";
        case Action::Update: return "update";
        case Action::Delete: return "delete";
        case Action::Export: return "export";
    }
    return "read";
}

std::optional<ActorType> actorTypeFromString(const std::string& text) {
    if (text == "user") return ActorType::User;
    if (text == "service") return ActorType::Service;
    if (text == "system") return ActorType::System;
    return std::nullopt;
}

std::optional<EventCategory> categoryFromString(const std::string& text) {
    if (text == "auth") return EventCategory::Auth;
    if (text == "data") return EventCategory::Data;
    if (text == "config") return EventCategory::Config;
    if (text == "admin") return EventCategory::Admin;
    if (text == "eval") return EventCategory::Eval;
    return std::nullopt;
}

std::optional<Severity> severityFromString(const std::string& text) {
    if (text == "info") return Severity::Info;
    if (text == "warning") return Severity::Warning;
    if (text == "critical") return Severity::Critical;
    return std::nullopt;
}

std::optional<Action> actionFromString(const std::string& text) {
    if (text == "create") return Action::Create;
    if (text == "read") return Action::Read;
    if (text == "update") return Action::Update;
    if (text == "delete") return Action::Delete;
    if (text == "export") return Action::Export;
    return std::nullopt;
}

const std::map<EventCategory, std::set<std::string>>& EventTypeRegistry::builtinCatalog() {
    using namespace event_types;
    static const std::map<EventCategory, std::set<std::string>> catalog = {
        {EventCategory::Auth, {
            USER_LOGIN, USER_LOGOUT, USER_LOGIN_FAILED, API_KEY_CREATED, API_KEY_REVOKED,
            SSO_INITIATED, SSO_COMPLETED, SSO_FAILED, TOKEN_REFRESHED, PASSWORD_CHANGED,
            PASSWORD_RESET}},
        {EventCategory::Data, {
            TRACE_CREATED, TRACE_VIEWED, TRACE_EXPORTED, TRACE_DELETED, TRACE_SHARED,
            EVALUATION_CREATED, EVALUATION_VIEWED, EVALUATION_DELETED, DATASET_CREATED,
            DATASET_UPDATED, DATASET_DELETED}},
        {EventCategory::Config, {
            PROJECT_CREATED, PROJECT_UPDATED, PROJECT_DELETED, RETENTION_POLICY_UPDATED,
            EVALUATOR_CREATED, EVALUATOR_UPDATED, EVALUATOR_DELETED, TEST_SUITE_CREATED,
            TEST_SUITE_UPDATED, TEST_SUITE_DELETED, ALERT_RULE_CREATED, ALERT_RULE_UPDATED,
            ALERT_RULE_DELETED}},
        {EventCategory::Admin, {
            USER_INVITED, USER_ROLE_CHANGED, USER_REMOVED, USER_SUSPENDED, USER_REACTIVATED,
            ORGANIZATION_SETTINGS_UPDATED, BILLING_PLAN_CHANGED, COMPLIANCE_EXPORT_REQUESTED,
            AUDIT_LOG_VIEWED, AUDIT_LOG_EXPORTED}},
        {EventCategory::Eval, {
            EVALUATION_STARTED, EVALUATION_COMPLETED, EVALUATION_FAILED, BASELINE_UPDATED,
            BENCHMARK_STARTED, BENCHMARK_COMPLETED}},
    };
    return catalog;
}

EventTypeRegistry::EventTypeRegistry() : types_(builtinCatalog()) {}

bool EventTypeRegistry::isRegistered(EventCategory category, const std::string& eventType) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = types_.find(category);
    return it != types_.end() && it->second.count(eventType) > 0;
}

bool EventTypeRegistry::registerType(EventCategory category, const std::string& eventType) {
    if (eventType.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return types_[category].insert(eventType).second;
}

std::set<std::string> EventTypeRegistry::typesFor(EventCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = types_.find(category);
    return it != types_.end() ? it->second : std::set<std::string>{};
}

} // namespace ledgerseal::core
