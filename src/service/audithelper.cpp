#include "service/audithelper.hpp"
#include "core/logging.hpp"
#include <exception>

namespace ledgerseal::service {

using core::Action;
using core::EventCategory;
using core::Severity;
namespace types = core::event_types;

namespace {

nlohmann::json withEntry(std::optional<nlohmann::json> metadata, const std::string& key,
                         nlohmann::json value) {
    nlohmann::json result = metadata && metadata->is_object() ? std::move(*metadata)
                                                              : nlohmann::json::object();
    result[key] = std::move(value);
    return result;
}

} // anonymous namespace

CaptureRequest RequestContext::makeRequest() const {
    CaptureRequest request;
    request.tenantId = tenantId;
    request.actorType = actorType;
    request.actorId = actorId;
    request.actorEmail = actorEmail;
    request.actorIp = actorIp;
    request.actorUserAgent = actorUserAgent;
    request.requestId = requestId;
    request.sessionId = sessionId;
    return request;
}

AuditHelper::AuditHelper(AuditService& service) : service_(service) {}

std::string AuditHelper::userLogin(const RequestContext& ctx, const std::string& userId,
                                   const std::string& userEmail, bool success,
                                   std::optional<nlohmann::json> metadata) {
    auto request = ctx.makeRequest();
    request.category = EventCategory::Auth;
    request.eventType = success ? types::USER_LOGIN : types::USER_LOGIN_FAILED;
    request.resourceType = "user";
    request.resourceId = userId;
    request.resourceName = userEmail;
    request.action = Action::Read;
    request.severity = success ? Severity::Info : Severity::Warning;
    request.metadata = std::move(metadata);
    return service_.capture(request);
}

std::string AuditHelper::userLoginFailed(const RequestContext& ctx, const std::string& userId,
                                         const std::string& userEmail,
                                         std::optional<nlohmann::json> metadata) {
    return userLogin(ctx, userId, userEmail, false, std::move(metadata));
}

std::string AuditHelper::userLogout(const RequestContext& ctx, const std::string& userId,
                                    const std::string& userEmail) {
    auto request = ctx.makeRequest();
    request.category = EventCategory::Auth;
    request.eventType = types::USER_LOGOUT;
    request.resourceType = "user";
    request.resourceId = userId;
    request.resourceName = userEmail;
    request.action = Action::Read;
    return service_.capture(request);
}

std::string AuditHelper::apiKeyCreated(const RequestContext& ctx, const std::string& keyId,
                                       const std::string& keyName) {
    auto request = ctx.makeRequest();
    request.category = EventCategory::Auth;
    request.eventType = types::API_KEY_CREATED;
    request.resourceType = "api_key";
    request.resourceId = keyId;
    request.resourceName = keyName;
    request.action = Action::Create;
    return service_.capture(request);
}

std::string AuditHelper::apiKeyRevoked(const RequestContext& ctx, const std::string& keyId,
                                       const std::string& keyName) {
    auto request = ctx.makeRequest();
    request.category = EventCategory::Auth;
    request.eventType = types::API_KEY_REVOKED;
    request.resourceType = "api_key";
    request.resourceId = keyId;
    request.resourceName = keyName;
    request.action = Action::Delete;
    request.severity = Severity::Warning;
    return service_.capture(request);
}

std::string AuditHelper::resourceCreated(const RequestContext& ctx, const std::string& resourceType,
                                         const std::string& resourceId,
                                         std::optional<nlohmann::json> newState,
                                         std::optional<std::string> projectId) {
    auto request = ctx.makeRequest();
    request.category = EventCategory::Data;
    request.eventType = resourceType + ".created";
    request.customEventType = true;
    request.resourceType = resourceType;
    request.resourceId = resourceId;
    request.action = Action::Create;
    request.newState = std::move(newState);
    request.projectId = std::move(projectId);
    return service_.capture(request);
}

std::string AuditHelper::resourceViewed(const RequestContext& ctx, const std::string& resourceType,
                                        const std::string& resourceId,
                                        std::optional<std::string> projectId) {
    auto request = ctx.makeRequest();
    request.category = EventCategory::Data;
    request.eventType = resourceType + ".viewed";
    request.customEventType = true;
    request.resourceType = resourceType;
    request.resourceId = resourceId;
    request.action = Action::Read;
    request.projectId = std::move(projectId);
    return service_.capture(request);
}

std::string AuditHelper::resourceExported(const RequestContext& ctx, const std::string& resourceType,
                                          const std::string& resourceId,
                                          const std::string& exportFormat,
                                          std::optional<std::string> projectId) {
    auto request = ctx.makeRequest();
    request.category = EventCategory::Data;
    request.eventType = resourceType + ".exported";
    request.customEventType = true;
    request.resourceType = resourceType;
    request.resourceId = resourceId;
    request.action = Action::Export;
    request.severity = Severity::Warning;
    request.metadata = withEntry(std::nullopt, "export_format", exportFormat);
    request.projectId = std::move(projectId);
    return service_.capture(request);
}

std::string AuditHelper::resourceDeleted(const RequestContext& ctx, const std::string& resourceType,
                                         const std::string& resourceId,
                                         std::optional<nlohmann::json> previousState,
                                         std::optional<std::string> projectId) {
    auto request = ctx.makeRequest();
    request.category = EventCategory::Data;
    request.eventType = resourceType + ".deleted";
    request.customEventType = true;
    request.resourceType = resourceType;
    request.resourceId = resourceId;
    request.action = Action::Delete;
    request.severity = Severity::Warning;
    request.previousState = std::move(previousState);
    request.projectId = std::move(projectId);
    return service_.capture(request);
}

std::string AuditHelper::projectCreated(const RequestContext& ctx, const std::string& projectId,
                                        const std::string& projectName,
                                        std::optional<nlohmann::json> settings) {
    auto request = ctx.makeRequest();
    request.category = EventCategory::Config;
    request.eventType = types::PROJECT_CREATED;
    request.resourceType = "project";
    request.resourceId = projectId;
    request.resourceName = projectName;
    request.projectId = projectId;
    request.action = Action::Create;
    request.newState = std::move(settings);
    return service_.capture(request);
}

std::string AuditHelper::projectUpdated(const RequestContext& ctx, const std::string& projectId,
                                        const std::string& projectName,
                                        const nlohmann::json& previousSettings,
                                        const nlohmann::json& newSettings) {
    auto request = ctx.makeRequest();
    request.category = EventCategory::Config;
    request.eventType = types::PROJECT_UPDATED;
    request.resourceType = "project";
    request.resourceId = projectId;
    request.resourceName = projectName;
    request.projectId = projectId;
    request.action = Action::Update;
    request.previousState = previousSettings;
    request.newState = newSettings;
    return service_.capture(request);
}

std::string AuditHelper::projectDeleted(const RequestContext& ctx, const std::string& projectId,
                                        const std::string& projectName,
                                        std::optional<nlohmann::json> projectData) {
    auto request = ctx.makeRequest();
    request.category = EventCategory::Config;
    request.eventType = types::PROJECT_DELETED;
    request.resourceType = "project";
    request.resourceId = projectId;
    request.resourceName = projectName;
    request.projectId = projectId;
    request.action = Action::Delete;
    request.severity = Severity::Warning;
    request.previousState = std::move(projectData);
    return service_.capture(request);
}

std::string AuditHelper::userInvited(const RequestContext& ctx, const std::string& userEmail,
                                     const std::string& role) {
    auto request = ctx.makeRequest();
    request.category = EventCategory::Admin;
    request.eventType = types::USER_INVITED;
    request.resourceType = "user";
    request.resourceId = userEmail;
    request.resourceName = userEmail;
    request.action = Action::Create;
    request.metadata = withEntry(std::nullopt, "role", role);
    return service_.capture(request);
}

std::string AuditHelper::userRoleChanged(const RequestContext& ctx, const std::string& userId,
                                         const std::string& userEmail, const std::string& oldRole,
                                         const std::string& newRole) {
    auto request = ctx.makeRequest();
    request.category = EventCategory::Admin;
    request.eventType = types::USER_ROLE_CHANGED;
    request.resourceType = "user";
    request.resourceId = userId;
    request.resourceName = userEmail;
    request.action = Action::Update;
    request.severity = Severity::Warning;
    request.previousState = nlohmann::json{{"role", oldRole}};
    request.newState = nlohmann::json{{"role", newRole}};
    return service_.capture(request);
}

std::string AuditHelper::userRemoved(const RequestContext& ctx, const std::string& userId,
                                     const std::string& userEmail) {
    auto request = ctx.makeRequest();
    request.category = EventCategory::Admin;
    request.eventType = types::USER_REMOVED;
    request.resourceType = "user";
    request.resourceId = userId;
    request.resourceName = userEmail;
    request.action = Action::Delete;
    request.severity = Severity::Warning;
    return service_.capture(request);
}

std::string AuditHelper::evaluationStarted(const RequestContext& ctx, const std::string& projectId,
                                           const std::string& evaluationId,
                                           const std::string& evaluatorName) {
    auto request = ctx.makeRequest();
    request.category = EventCategory::Eval;
    request.eventType = types::EVALUATION_STARTED;
    request.resourceType = "evaluation";
    request.resourceId = evaluationId;
    request.resourceName = evaluatorName;
    request.projectId = projectId;
    request.action = Action::Create;
    return service_.capture(request);
}

std::string AuditHelper::evaluationCompleted(const RequestContext& ctx, const std::string& projectId,
                                             const std::string& evaluationId,
                                             const std::string& evaluatorName,
                                             std::optional<nlohmann::json> results) {
    auto request = ctx.makeRequest();
    request.category = EventCategory::Eval;
    request.eventType = types::EVALUATION_COMPLETED;
    request.resourceType = "evaluation";
    request.resourceId = evaluationId;
    request.resourceName = evaluatorName;
    request.projectId = projectId;
    request.action = Action::Update;
    request.newState = std::move(results);
    return service_.capture(request);
}

std::string AuditHelper::evaluationFailed(const RequestContext& ctx, const std::string& projectId,
                                          const std::string& evaluationId,
                                          const std::string& evaluatorName,
                                          const std::string& error) {
    auto request = ctx.makeRequest();
    request.category = EventCategory::Eval;
    request.eventType = types::EVALUATION_FAILED;
    request.resourceType = "evaluation";
    request.resourceId = evaluationId;
    request.resourceName = evaluatorName;
    request.projectId = projectId;
    request.action = Action::Update;
    request.severity = Severity::Warning;
    request.metadata = withEntry(std::nullopt, "error", error);
    return service_.capture(request);
}

ScopedAudit::ScopedAudit(AuditService& service, CaptureRequest request)
    : service_(service),
      request_(std::move(request)),
      uncaughtOnEntry_(std::uncaught_exceptions()) {}

ScopedAudit::~ScopedAudit() {
    if (!done_) {
        fire(std::uncaught_exceptions() > uncaughtOnEntry_);
    }
}

std::string ScopedAudit::commit() {
    if (done_) {
        return std::string();
    }
    return fire(false);
}

std::string ScopedAudit::fire(bool failed) {
    done_ = true;
    request_.metadata = withEntry(std::move(request_.metadata), "outcome",
                                  failed ? "failed" : "succeeded");
    if (failed && request_.severity == Severity::Info) {
        request_.severity = Severity::Warning;
    }
    auto eventId = service_.capture(request_);
    if (eventId.empty()) {
        core::logger()->warn("Scoped audit of {} on {}/{} was not captured",
                             request_.eventType, request_.resourceType, request_.resourceId);
    }
    return eventId;
}

void ScopedAudit::setPreviousState(nlohmann::json state) {
    request_.previousState = std::move(state);
}

void ScopedAudit::setNewState(nlohmann::json state) {
    request_.newState = std::move(state);
}

void ScopedAudit::addMetadata(const std::string& key, nlohmann::json value) {
    request_.metadata = withEntry(std::move(request_.metadata), key, std::move(value));
}

void ScopedAudit::cancel() {
    done_ = true;
}

} // namespace ledgerseal::service
