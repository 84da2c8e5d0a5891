#pragma once

#include "core/core_export.hpp"
#include "core/compat/clock.hpp"
#include "core/event/auditevent.hpp"
#include "core/event/eventfilter.hpp"
#include "core/event/eventtypes.hpp"
#include "storage/auditstorage.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ledgerseal::service {

/**
 * @brief Batching and deduplication settings of the capture service
 */
struct LEDGERSEAL_CORE_EXPORT CaptureConfig {
    size_t batchSize{100};
    core::compat::milliseconds batchInterval{5000};
    bool enableDeduplication{true};
    core::compat::seconds deduplicationWindow{60};
    /// Reject event types missing from the registry unless the request opts in
    bool strictEventTypes{false};
};

/**
 * @brief Fields supplied by the caller of AuditService::capture
 */
struct LEDGERSEAL_CORE_EXPORT CaptureRequest {
    std::string tenantId;
    core::EventCategory category{core::EventCategory::Data};
    std::string eventType;
    std::string resourceType;
    std::string resourceId;
    core::Action action{core::Action::Read};

    core::ActorType actorType{core::ActorType::System};
    std::string actorId{"system"};
    std::optional<std::string> actorEmail;
    std::optional<std::string> actorIp;
    std::optional<std::string> actorUserAgent;

    std::optional<std::string> projectId;
    std::optional<std::string> resourceName;
    std::optional<nlohmann::json> previousState;
    std::optional<nlohmann::json> newState;
    std::optional<nlohmann::json> metadata;
    std::optional<std::string> requestId;
    std::optional<std::string> sessionId;
    core::Severity severity{core::Severity::Info};

    /// Accept an event type that is not in the registry
    bool customEventType{false};
};

/**
 * @brief Asynchronous audit event capture
 *
 * capture() builds and seals an event linked to the tenant's chain tip,
 * drops duplicates inside the dedup window, runs enrichment callbacks and
 * queues the event. Queued events are written in batches by a periodic
 * flush loop (started by start()), by size-triggered background flushes,
 * and by the final drain in stop(). capture() never throws. Its only storage
 * I/O is one query the first time a tenant is seen, which resumes the chain
 * from the newest persisted event of that tenant.
 */
class LEDGERSEAL_CORE_EXPORT AuditService {
public:
    using EnrichmentCallback = std::function<void(const core::AuditEvent&)>;
    using WriteFailureHandler = std::function<void(const std::vector<core::AuditEvent>& batch,
                                                   size_t written)>;

    explicit AuditService(storage::AuditStorage& storage, CaptureConfig config = CaptureConfig());

    /**
     * @brief Destructor
     *
     * Stops the service (draining the queue) if it is running.
     */
    ~AuditService();

    // Prevent copying
    AuditService(const AuditService&) = delete;
    AuditService& operator=(const AuditService&) = delete;

    /**
     * @brief Launch the periodic flush loop. No-op if already running.
     */
    void start();

    /**
     * @brief Stop the flush loop and drain every queued event
     *
     * Waits for in-flight size-triggered flushes. No-op if not running.
     */
    void stop();

    bool isRunning() const;

    /**
     * @brief Capture one audit event
     * @return Event id (also for duplicates), or "" if the request was
     *         rejected or could not be processed
     */
    std::string capture(const CaptureRequest& request);

    /**
     * @brief Register a callback run over each accepted event, in order
     *
     * Callbacks observe the sealed event and run while the tenant's chain is
     * locked. A throwing callback is logged and skipped. A callback may capture
     * events for other tenants; a capture for the event's own tenant from
     * inside a callback is rejected and returns "".
     */
    void addEnrichmentCallback(EnrichmentCallback callback);

    /**
     * @brief Invoked whenever a flush writes fewer events than submitted
     *        or the storage throws. The default only logs.
     */
    void setWriteFailureHandler(WriteFailureHandler handler);

    /**
     * @brief Synchronously write the queued events
     * @return Number of events the storage reported written
     */
    size_t flush();

    size_t pendingCount() const;

    std::optional<core::AuditEvent> getEvent(const std::string& eventId);
    std::vector<core::AuditEvent> queryEvents(const core::EventFilter& filter);
    storage::IntegrityReport verifyIntegrity(const std::string& tenantId,
                                             std::optional<core::compat::Timestamp> start = std::nullopt,
                                             std::optional<core::compat::Timestamp> end = std::nullopt);

    core::EventTypeRegistry& registry();
    const CaptureConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ledgerseal::service
