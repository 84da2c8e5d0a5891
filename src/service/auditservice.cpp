#include "service/auditservice.hpp"
#include "core/identifiers.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace ledgerseal::service {

namespace {

/// Chain state of one tenant; the mutex serializes capture per tenant
struct TenantState {
    std::mutex mutex;
    bool loaded{false};
    std::string tipHash;
    core::compat::Timestamp lastTimestamp{};
};

/// Tenants whose capture is in progress on this thread
thread_local std::vector<const TenantState*> capturingTenants;

class CaptureScope {
public:
    explicit CaptureScope(const TenantState& tenant) {
        capturingTenants.push_back(&tenant);
    }

    ~CaptureScope() {
        capturingTenants.pop_back();
    }

    static bool active(const TenantState& tenant) {
        return std::find(capturingTenants.begin(), capturingTenants.end(), &tenant)
               != capturingTenants.end();
    }

    // Prevent copying
    CaptureScope(const CaptureScope&) = delete;
    CaptureScope& operator=(const CaptureScope&) = delete;
};

} // anonymous namespace

class AuditService::Impl {
public:
    Impl(storage::AuditStorage& storage, CaptureConfig config)
        : storage_(storage)
        , config_(std::move(config)) {
        if (config_.batchSize == 0) {
            config_.batchSize = 1;
        }
    }

    ~Impl() {
        stop();
        waitForBackgroundFlushes();
        flush();
    }

    void start() {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (running_) {
            return;
        }
        running_ = true;
        flushThread_ = std::thread([this]() { flushLoop(); });
        core::logger()->info("Audit service started (batch size {}, interval {} ms)",
                             config_.batchSize, config_.batchInterval.count());
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (!running_) {
                return;
            }
            running_ = false;
        }
        wakeup_.notify_all();
        if (flushThread_.joinable()) {
            flushThread_.join();
        }
        waitForBackgroundFlushes();
        flush();
        core::logger()->info("Audit service stopped, queue drained");
    }

    bool isRunning() const {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return running_;
    }

    std::string capture(const CaptureRequest& request) {
        try {
            return captureImpl(request);
        } catch (const std::exception& e) {
            core::logger()->error("Audit capture of {} for tenant {} failed: {}",
                                  request.eventType, request.tenantId, e.what());
        } catch (...) {
            core::logger()->error("Audit capture of {} for tenant {} failed: unknown exception",
                                  request.eventType, request.tenantId);
        }
        return std::string();
    }

    void addEnrichmentCallback(EnrichmentCallback callback) {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callbacks_.push_back(std::move(callback));
    }

    void setWriteFailureHandler(WriteFailureHandler handler) {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        failureHandler_ = std::move(handler);
    }

    size_t flush() {
        std::vector<core::AuditEvent> batch;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (queue_.empty()) {
                return 0;
            }
            batch.swap(queue_);
        }

        size_t written = 0;
        try {
            written = storage_.writeBatch(batch);
        } catch (const std::exception& e) {
            core::logger()->error("Audit batch write of {} events failed: {}", batch.size(), e.what());
            reportWriteFailure(batch, 0);
            return 0;
        } catch (...) {
            core::logger()->error("Audit batch write of {} events failed: unknown exception",
                                  batch.size());
            reportWriteFailure(batch, 0);
            return 0;
        }

        if (written != batch.size()) {
            core::logger()->warn("Only {}/{} audit events written", written, batch.size());
            reportWriteFailure(batch, written);
        } else {
            core::logger()->debug("Flushed {} audit events", written);
        }
        return written;
    }

    size_t pendingCount() const {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return queue_.size();
    }

    storage::AuditStorage& storage() { return storage_; }
    core::EventTypeRegistry& registry() { return registry_; }
    const CaptureConfig& config() const { return config_; }

private:
    std::string captureImpl(const CaptureRequest& request) {
        if (request.tenantId.empty() || request.eventType.empty()) {
            core::logger()->warn("Audit event rejected: tenant and event type are required");
            return std::string();
        }
        if (config_.strictEventTypes && !request.customEventType
            && !registry_.isRegistered(request.category, request.eventType)) {
            core::logger()->warn("Audit event rejected: unregistered type {} in category {}",
                                 request.eventType, core::toString(request.category));
            return std::string();
        }

        TenantState& tenant = tenantState(request.tenantId);
        if (CaptureScope::active(tenant)) {
            core::logger()->warn("Audit event {} for tenant {} rejected: captured from an "
                                 "enrichment callback of the same tenant",
                                 request.eventType, request.tenantId);
            return std::string();
        }
        std::lock_guard<std::mutex> tenantLock(tenant.mutex);
        CaptureScope scope(tenant);
        if (!tenant.loaded) {
            loadChainTip(request.tenantId, tenant);
        }

        core::AuditEvent event;
        event.id = core::generateUuid();
        event.timestamp = core::compat::now();
        if (event.timestamp <= tenant.lastTimestamp) {
            event.timestamp = tenant.lastTimestamp + core::compat::microseconds(1);
        }
        event.tenantId = request.tenantId;
        event.projectId = request.projectId;
        event.actorType = request.actorType;
        event.actorId = request.actorId;
        event.actorEmail = request.actorEmail;
        event.actorIp = request.actorIp;
        event.actorUserAgent = request.actorUserAgent;
        event.category = request.category;
        event.eventType = request.eventType;
        event.severity = request.severity;
        event.resourceType = request.resourceType;
        event.resourceId = request.resourceId;
        event.resourceName = request.resourceName;
        event.action = request.action;
        event.previousState = request.previousState;
        event.newState = request.newState;
        event.metadata = request.metadata;
        event.requestId = request.requestId && !request.requestId->empty()
                              ? *request.requestId
                              : core::generateUuid();
        event.sessionId = request.sessionId;
        event.previousHash = tenant.tipHash;
        event.seal();

        const std::string key = event.deduplicationKey();
        if (config_.enableDeduplication && isDuplicate(key, event.timestamp)) {
            core::logger()->debug("Duplicate audit event {} skipped ({})", event.id, key);
            return event.id;
        }

        runEnrichment(event);

        tenant.tipHash = event.hash;
        tenant.lastTimestamp = event.timestamp;

        bool batchFull = false;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            queue_.push_back(event);
            batchFull = queue_.size() >= config_.batchSize;
        }
        if (batchFull) {
            launchBackgroundFlush();
        }

        if (config_.enableDeduplication) {
            trackEvent(key, event.timestamp);
        }
        return event.id;
    }

    TenantState& tenantState(const std::string& tenantId) {
        std::lock_guard<std::mutex> lock(tenantsMutex_);
        auto& slot = tenants_[tenantId];
        if (!slot) {
            slot = std::make_unique<TenantState>();
        }
        return *slot;
    }

    // Continues the chain already persisted for the tenant, if any
    void loadChainTip(const std::string& tenantId, TenantState& tenant) {
        auto newest = storage_.query(core::EventFilter::forTenant(tenantId, std::nullopt, std::nullopt, 1));
        if (!newest.empty()) {
            tenant.tipHash = newest.front().hash;
            tenant.lastTimestamp = newest.front().timestamp;
            core::logger()->debug("Resuming chain of tenant {} at event {}", tenantId, newest.front().id);
        }
        tenant.loaded = true;
    }

    bool isDuplicate(const std::string& key, core::compat::Timestamp timestamp) {
        std::lock_guard<std::mutex> lock(dedupMutex_);
        auto it = recentEvents_.find(key);
        return it != recentEvents_.end() && timestamp - it->second < config_.deduplicationWindow;
    }

    void trackEvent(const std::string& key, core::compat::Timestamp timestamp) {
        std::lock_guard<std::mutex> lock(dedupMutex_);
        recentEvents_[key] = timestamp;

        const auto now = core::compat::now();
        for (auto it = recentEvents_.begin(); it != recentEvents_.end();) {
            if (now - it->second > config_.deduplicationWindow) {
                it = recentEvents_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void runEnrichment(const core::AuditEvent& event) {
        std::vector<EnrichmentCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(callbackMutex_);
            callbacks = callbacks_;
        }
        for (const auto& callback : callbacks) {
            try {
                callback(event);
            } catch (const std::exception& e) {
                core::logger()->warn("Enrichment callback failed for event {}: {}", event.id, e.what());
            } catch (...) {
                core::logger()->warn("Enrichment callback failed for event {}: unknown exception",
                                     event.id);
            }
        }
    }

    void reportWriteFailure(const std::vector<core::AuditEvent>& batch, size_t written) {
        WriteFailureHandler handler;
        {
            std::lock_guard<std::mutex> lock(callbackMutex_);
            handler = failureHandler_;
        }
        if (!handler) {
            return;
        }
        try {
            handler(batch, written);
        } catch (const std::exception& e) {
            core::logger()->error("Write failure handler threw: {}", e.what());
        } catch (...) {
            core::logger()->error("Write failure handler threw an unknown exception");
        }
    }

    void launchBackgroundFlush() {
        std::lock_guard<std::mutex> lock(flushesMutex_);
        backgroundFlushes_.erase(
            std::remove_if(backgroundFlushes_.begin(), backgroundFlushes_.end(),
                           [](const std::future<void>& f) {
                               return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                           }),
            backgroundFlushes_.end());
        backgroundFlushes_.push_back(std::async(std::launch::async, [this]() { flush(); }));
    }

    void waitForBackgroundFlushes() {
        std::vector<std::future<void>> flushes;
        {
            std::lock_guard<std::mutex> lock(flushesMutex_);
            flushes.swap(backgroundFlushes_);
        }
        for (auto& f : flushes) {
            f.wait();
        }
    }

    void flushLoop() {
        std::unique_lock<std::mutex> lock(stateMutex_);
        while (running_) {
            if (wakeup_.wait_for(lock, config_.batchInterval, [this]() { return !running_; })) {
                break;
            }
            lock.unlock();
            flush();
            lock.lock();
        }
    }

    storage::AuditStorage& storage_;
    CaptureConfig config_;
    core::EventTypeRegistry registry_;

    mutable std::mutex stateMutex_;
    std::condition_variable wakeup_;
    bool running_{false};
    std::thread flushThread_;

    std::mutex tenantsMutex_;
    std::unordered_map<std::string, std::unique_ptr<TenantState>> tenants_;

    mutable std::mutex queueMutex_;
    std::vector<core::AuditEvent> queue_;

    std::mutex dedupMutex_;
    std::unordered_map<std::string, core::compat::Timestamp> recentEvents_;

    std::mutex callbackMutex_;
    std::vector<EnrichmentCallback> callbacks_;
    WriteFailureHandler failureHandler_;

    std::mutex flushesMutex_;
    std::vector<std::future<void>> backgroundFlushes_;
};

AuditService::AuditService(storage::AuditStorage& storage, CaptureConfig config)
    : impl_(std::make_unique<Impl>(storage, std::move(config))) {}

AuditService::~AuditService() = default;

void AuditService::start() {
    impl_->start();
}

void AuditService::stop() {
    impl_->stop();
}

bool AuditService::isRunning() const {
    return impl_->isRunning();
}

std::string AuditService::capture(const CaptureRequest& request) {
    return impl_->capture(request);
}

void AuditService::addEnrichmentCallback(EnrichmentCallback callback) {
    impl_->addEnrichmentCallback(std::move(callback));
}

void AuditService::setWriteFailureHandler(WriteFailureHandler handler) {
    impl_->setWriteFailureHandler(std::move(handler));
}

size_t AuditService::flush() {
    return impl_->flush();
}

size_t AuditService::pendingCount() const {
    return impl_->pendingCount();
}

std::optional<core::AuditEvent> AuditService::getEvent(const std::string& eventId) {
    return impl_->storage().readEvent(eventId);
}

std::vector<core::AuditEvent> AuditService::queryEvents(const core::EventFilter& filter) {
    return impl_->storage().query(filter);
}

storage::IntegrityReport AuditService::verifyIntegrity(const std::string& tenantId,
                                                       std::optional<core::compat::Timestamp> start,
                                                       std::optional<core::compat::Timestamp> end) {
    return impl_->storage().verifyIntegrity(tenantId, start, end);
}

core::EventTypeRegistry& AuditService::registry() {
    return impl_->registry();
}

const CaptureConfig& AuditService::config() const {
    return impl_->config();
}

} // namespace ledgerseal::service
