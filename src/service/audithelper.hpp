#pragma once

#include "core/core_export.hpp"
#include "core/event/eventtypes.hpp"
#include "service/auditservice.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace ledgerseal::service {

/**
 * @brief Caller identity and correlation ids of one request
 *
 * Passed explicitly into every helper call.
 */
struct LEDGERSEAL_CORE_EXPORT RequestContext {
    std::string tenantId;
    core::ActorType actorType{core::ActorType::System};
    std::string actorId{"system"};
    std::optional<std::string> actorEmail;
    std::optional<std::string> actorIp;
    std::optional<std::string> actorUserAgent;
    std::optional<std::string> requestId;
    std::optional<std::string> sessionId;

    /**
     * @brief Capture request pre-filled with the actor and correlation fields
     */
    CaptureRequest makeRequest() const;
};

/**
 * @brief Intention-revealing capture calls for common audit scenarios
 *
 * Every call returns the id from AuditService::capture ("" on rejection).
 */
class LEDGERSEAL_CORE_EXPORT AuditHelper {
public:
    explicit AuditHelper(AuditService& service);

    // Authentication
    std::string userLogin(const RequestContext& ctx, const std::string& userId,
                          const std::string& userEmail, bool success = true,
                          std::optional<nlohmann::json> metadata = std::nullopt);
    std::string userLoginFailed(const RequestContext& ctx, const std::string& userId,
                                const std::string& userEmail,
                                std::optional<nlohmann::json> metadata = std::nullopt);
    std::string userLogout(const RequestContext& ctx, const std::string& userId,
                           const std::string& userEmail);
    std::string apiKeyCreated(const RequestContext& ctx, const std::string& keyId,
                              const std::string& keyName);
    std::string apiKeyRevoked(const RequestContext& ctx, const std::string& keyId,
                              const std::string& keyName);

    /**
     * @name Generic data resources
     * The event type is "<resourceType>.<verb>", e.g. "trace.deleted".
     * @{
     */
    std::string resourceCreated(const RequestContext& ctx, const std::string& resourceType,
                                const std::string& resourceId,
                                std::optional<nlohmann::json> newState = std::nullopt,
                                std::optional<std::string> projectId = std::nullopt);
    std::string resourceViewed(const RequestContext& ctx, const std::string& resourceType,
                               const std::string& resourceId,
                               std::optional<std::string> projectId = std::nullopt);
    std::string resourceExported(const RequestContext& ctx, const std::string& resourceType,
                                 const std::string& resourceId, const std::string& exportFormat,
                                 std::optional<std::string> projectId = std::nullopt);
    std::string resourceDeleted(const RequestContext& ctx, const std::string& resourceType,
                                const std::string& resourceId,
                                std::optional<nlohmann::json> previousState = std::nullopt,
                                std::optional<std::string> projectId = std::nullopt);
    /** @} */

    // Configuration
    std::string projectCreated(const RequestContext& ctx, const std::string& projectId,
                               const std::string& projectName,
                               std::optional<nlohmann::json> settings = std::nullopt);
    std::string projectUpdated(const RequestContext& ctx, const std::string& projectId,
                               const std::string& projectName,
                               const nlohmann::json& previousSettings,
                               const nlohmann::json& newSettings);
    std::string projectDeleted(const RequestContext& ctx, const std::string& projectId,
                               const std::string& projectName,
                               std::optional<nlohmann::json> projectData = std::nullopt);

    // Administration
    std::string userInvited(const RequestContext& ctx, const std::string& userEmail,
                            const std::string& role);
    std::string userRoleChanged(const RequestContext& ctx, const std::string& userId,
                                const std::string& userEmail, const std::string& oldRole,
                                const std::string& newRole);
    std::string userRemoved(const RequestContext& ctx, const std::string& userId,
                            const std::string& userEmail);

    // Evaluations
    std::string evaluationStarted(const RequestContext& ctx, const std::string& projectId,
                                  const std::string& evaluationId, const std::string& evaluatorName);
    std::string evaluationCompleted(const RequestContext& ctx, const std::string& projectId,
                                    const std::string& evaluationId, const std::string& evaluatorName,
                                    std::optional<nlohmann::json> results = std::nullopt);
    std::string evaluationFailed(const RequestContext& ctx, const std::string& projectId,
                                 const std::string& evaluationId, const std::string& evaluatorName,
                                 const std::string& error);

    AuditService& service() { return service_; }

private:
    AuditService& service_;
};

/**
 * @brief Captures one event with before/after state when leaving scope
 *
 * If the scope is left by an exception the event is captured with
 * severity Warning and metadata "outcome": "failed"; otherwise "outcome"
 * is "succeeded". commit() captures early; cancel() suppresses the capture.
 */
class LEDGERSEAL_CORE_EXPORT ScopedAudit {
public:
    ScopedAudit(AuditService& service, CaptureRequest request);
    ~ScopedAudit();

    // Prevent copying
    ScopedAudit(const ScopedAudit&) = delete;
    ScopedAudit& operator=(const ScopedAudit&) = delete;

    void setPreviousState(nlohmann::json state);
    void setNewState(nlohmann::json state);
    void addMetadata(const std::string& key, nlohmann::json value);
    void cancel();

    /**
     * @brief Capture now as succeeded
     * @return Event id, or "" if already captured, cancelled or rejected
     */
    std::string commit();

private:
    std::string fire(bool failed);

    AuditService& service_;
    CaptureRequest request_;
    int uncaughtOnEntry_;
    bool done_{false};
};

} // namespace ledgerseal::service
