#include "service/auditservice.hpp"
#include "core/chain/auditchain.hpp"
#include "mocks/recordingstorage.hpp"
#include "storage/sqliteauditstorage.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace ledgerseal;
using ledgerseal::test::RecordingStorage;

namespace {

service::CaptureRequest traceView(const std::string& tenant, const std::string& traceId) {
    service::CaptureRequest request;
    request.tenantId = tenant;
    request.category = core::EventCategory::Data;
    request.eventType = core::event_types::TRACE_VIEWED;
    request.resourceType = "trace";
    request.resourceId = traceId;
    request.action = core::Action::Read;
    request.actorType = core::ActorType::User;
    request.actorId = "user-7";
    return request;
}

// Polls until @p predicate holds or the timeout passes
template <typename Predicate>
bool waitFor(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

} // anonymous namespace

class AuditServiceTest : public ::testing::Test {
protected:
    service::CaptureConfig config(size_t batchSize = 10) {
        service::CaptureConfig cfg;
        cfg.batchSize = batchSize;
        cfg.batchInterval = core::compat::milliseconds(60000);
        return cfg;
    }

    RecordingStorage storage_;
    core::AuditChain chain_;
};

TEST_F(AuditServiceTest, CapturedEventsFormOneChain) {
    service::AuditService service(storage_, config(10));
    service.start();

    std::vector<std::string> ids;
    for (const char* trace : {"tr-1", "tr-2", "tr-3"}) {
        ids.push_back(service.capture(traceView("t1", trace)));
        EXPECT_FALSE(ids.back().empty());
    }
    EXPECT_EQ(service.pendingCount(), 3u);
    EXPECT_EQ(storage_.eventCount(), 0u);

    service.stop();
    EXPECT_FALSE(service.isRunning());
    EXPECT_EQ(service.pendingCount(), 0u);

    auto written = storage_.written();
    ASSERT_EQ(written.size(), 3u);
    EXPECT_EQ(written[0].id, ids[0]);
    EXPECT_TRUE(written[0].previousHash.empty());
    EXPECT_EQ(written[1].previousHash, written[0].hash);
    EXPECT_EQ(written[2].previousHash, written[1].hash);
    EXPECT_LT(written[0].timestamp, written[1].timestamp);
    EXPECT_LT(written[1].timestamp, written[2].timestamp);
    EXPECT_FALSE(written[0].requestId.empty());

    auto result = chain_.verifyChain(written);
    EXPECT_EQ(result.status, core::VerificationStatus::Valid);
    EXPECT_EQ(result.totalEvents, 3u);
    EXPECT_EQ(result.validEvents, 3u);

    EXPECT_TRUE(service.verifyIntegrity("t1").valid);
    ASSERT_TRUE(service.getEvent(ids[1]).has_value());
    EXPECT_EQ(service.queryEvents(core::EventFilter::forTenant("t1")).size(), 3u);
}

TEST_F(AuditServiceTest, DuplicatesAreAcknowledgedButNotStored) {
    service::AuditService service(storage_, config());

    auto first = service.capture(traceView("t1", "tr-1"));
    auto second = service.capture(traceView("t1", "tr-1"));
    auto third = service.capture(traceView("t1", "tr-2"));
    EXPECT_FALSE(first.empty());
    EXPECT_FALSE(second.empty());
    EXPECT_NE(first, second);
    EXPECT_FALSE(third.empty());

    // Another tenant or action is a different key
    EXPECT_FALSE(service.capture(traceView("t2", "tr-1")).empty());
    auto exported = traceView("t1", "tr-1");
    exported.action = core::Action::Export;
    EXPECT_FALSE(service.capture(exported).empty());

    EXPECT_EQ(service.pendingCount(), 4u);
    EXPECT_EQ(service.flush(), 4u);
    EXPECT_FALSE(service.getEvent(second).has_value());

    auto t1 = storage_.query(core::EventFilter::forTenant("t1"));
    ASSERT_EQ(t1.size(), 3u);
    EXPECT_EQ(chain_.verifyChain(t1).status, core::VerificationStatus::Valid);
}

TEST_F(AuditServiceTest, DeduplicationCanBeDisabled) {
    auto cfg = config();
    cfg.enableDeduplication = false;
    service::AuditService service(storage_, cfg);

    service.capture(traceView("t1", "tr-1"));
    service.capture(traceView("t1", "tr-1"));
    EXPECT_EQ(service.flush(), 2u);
}

TEST_F(AuditServiceTest, ExpiredDedupWindowAllowsRepeat) {
    auto cfg = config();
    cfg.deduplicationWindow = core::compat::seconds(0);
    service::AuditService service(storage_, cfg);

    service.capture(traceView("t1", "tr-1"));
    service.capture(traceView("t1", "tr-1"));
    EXPECT_EQ(service.flush(), 2u);
}

TEST_F(AuditServiceTest, StopWritesEveryAcceptedEvent) {
    for (size_t batchSize : {1u, 3u, 7u, 1000u}) {
        RecordingStorage storage;
        {
            service::AuditService service(storage, config(batchSize));
            service.start();
            for (int i = 0; i < 20; ++i) {
                EXPECT_FALSE(service.capture(traceView("t1", "tr-" + std::to_string(i))).empty());
            }
            service.capture(traceView("t1", "tr-0"));
            service.stop();
        }
        EXPECT_EQ(storage.eventCount(), 20u) << "batch size " << batchSize;
        EXPECT_EQ(chain_.verifyChain(storage.written()).status, core::VerificationStatus::Valid);
    }
}

TEST_F(AuditServiceTest, DestructorDrainsQueue) {
    {
        service::AuditService service(storage_, config());
        service.capture(traceView("t1", "tr-1"));
        service.capture(traceView("t1", "tr-2"));
    }
    EXPECT_EQ(storage_.eventCount(), 2u);
}

TEST_F(AuditServiceTest, FullBatchIsFlushedInBackground) {
    service::AuditService service(storage_, config(5));
    for (int i = 0; i < 5; ++i) {
        service.capture(traceView("t1", "tr-" + std::to_string(i)));
    }
    EXPECT_TRUE(waitFor([this]() { return storage_.eventCount() == 5; }));
    EXPECT_GE(storage_.batchCount(), 1u);
}

TEST_F(AuditServiceTest, PeriodicFlush) {
    auto cfg = config(1000);
    cfg.batchInterval = core::compat::milliseconds(20);
    service::AuditService service(storage_, cfg);
    service.start();

    service.capture(traceView("t1", "tr-1"));
    EXPECT_TRUE(waitFor([this]() { return storage_.eventCount() == 1; }));
    service.stop();
}

TEST_F(AuditServiceTest, StartAndStopAreIdempotent) {
    service::AuditService service(storage_, config());
    service.stop();
    EXPECT_FALSE(service.isRunning());
    service.start();
    service.start();
    EXPECT_TRUE(service.isRunning());
    service.stop();
    service.stop();
    EXPECT_FALSE(service.isRunning());

    service.start();
    EXPECT_TRUE(service.isRunning());
}

TEST_F(AuditServiceTest, RejectsIncompleteRequests) {
    service::AuditService service(storage_, config());
    EXPECT_TRUE(service.capture(traceView("", "tr-1")).empty());

    auto noType = traceView("t1", "tr-1");
    noType.eventType.clear();
    EXPECT_TRUE(service.capture(noType).empty());
    EXPECT_EQ(service.pendingCount(), 0u);
}

TEST_F(AuditServiceTest, StrictModeRequiresRegisteredTypes) {
    auto cfg = config();
    cfg.strictEventTypes = true;
    service::AuditService service(storage_, cfg);

    auto custom = traceView("t1", "tr-1");
    custom.eventType = "trace.annotated";
    EXPECT_TRUE(service.capture(custom).empty());

    // Category must match the registration
    auto wrongCategory = traceView("t1", "tr-1");
    wrongCategory.category = core::EventCategory::Auth;
    EXPECT_TRUE(service.capture(wrongCategory).empty());

    EXPECT_FALSE(service.capture(traceView("t1", "tr-1")).empty());

    custom.customEventType = true;
    EXPECT_FALSE(service.capture(custom).empty());

    auto registered = traceView("t1", "tr-2");
    registered.eventType = "trace.shared";
    EXPECT_TRUE(service.registry().registerType(core::EventCategory::Data, "trace.shared"));
    EXPECT_FALSE(service.capture(registered).empty());

    EXPECT_EQ(service.flush(), 3u);
}

TEST_F(AuditServiceTest, EnrichmentCallbacksObserveEvents) {
    service::AuditService service(storage_, config());
    std::vector<std::string> seen;
    std::atomic<int> calls{0};

    service.addEnrichmentCallback([](const core::AuditEvent&) {
        throw std::runtime_error("enricher down");
    });
    service.addEnrichmentCallback([&](const core::AuditEvent& event) {
        seen.push_back(event.id);
        EXPECT_TRUE(event.verifyHash());
        ++calls;
    });

    auto id = service.capture(traceView("t1", "tr-1"));
    ASSERT_FALSE(id.empty());
    service.capture(traceView("t1", "tr-1"));

    EXPECT_EQ(calls.load(), 1);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], id);
    EXPECT_EQ(service.flush(), 1u);
}

TEST_F(AuditServiceTest, NonStandardCallbackExceptionsAreIsolated) {
    service::AuditService service(storage_, config());
    int laterCalls = 0;
    service.addEnrichmentCallback([](const core::AuditEvent&) { throw 42; });
    service.addEnrichmentCallback([&](const core::AuditEvent&) { ++laterCalls; });

    std::string id;
    EXPECT_NO_THROW(id = service.capture(traceView("t1", "tr-1")));
    EXPECT_FALSE(id.empty());
    EXPECT_EQ(laterCalls, 1);
    EXPECT_EQ(service.flush(), 1u);
}

TEST_F(AuditServiceTest, CallbackCannotCaptureForItsOwnTenant) {
    service::AuditService service(storage_, config());
    std::string nestedSameTenant = "unset";
    std::string nestedOtherTenant;
    service.addEnrichmentCallback([&](const core::AuditEvent& event) {
        if (event.tenantId != "t1") {
            return;
        }
        nestedSameTenant = service.capture(traceView("t1", "forwarded"));
        nestedOtherTenant = service.capture(traceView("siem", event.id));
    });

    auto id = service.capture(traceView("t1", "tr-1"));
    EXPECT_FALSE(id.empty());
    EXPECT_TRUE(nestedSameTenant.empty());
    EXPECT_FALSE(nestedOtherTenant.empty());

    // The tenant is usable again once the outer capture returns
    EXPECT_FALSE(service.capture(traceView("t1", "tr-2")).empty());
    EXPECT_EQ(service.flush(), 3u);
}

TEST_F(AuditServiceTest, ChainResumesAfterRestart) {
    storage::SqliteAuditStorage store(":memory:");
    {
        service::AuditService first(store, config());
        ASSERT_FALSE(first.capture(traceView("t1", "a")).empty());
        first.stop();
    }
    {
        service::AuditService second(store, config());
        ASSERT_FALSE(second.capture(traceView("t1", "b")).empty());
    }

    auto report = store.verifyIntegrity("t1");
    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.totalEvents, 2u);
    EXPECT_EQ(report.verifiedEvents, 2u);
    EXPECT_TRUE(report.errors.empty());
}

TEST_F(AuditServiceTest, ResumedChainKeepsTimestampsIncreasing) {
    core::AuditEvent stored;
    stored.id = "stored-1";
    stored.tenantId = "t1";
    stored.eventType = core::event_types::TRACE_VIEWED;
    stored.timestamp = core::compat::now() + std::chrono::hours(1);
    stored.seal();
    ASSERT_TRUE(storage_.writeEvent(stored));

    service::AuditService service(storage_, config());
    auto id = service.capture(traceView("t1", "tr-1"));
    ASSERT_FALSE(id.empty());
    service.capture(traceView("other", "tr-1"));
    EXPECT_EQ(service.flush(), 2u);

    auto event = storage_.readEvent(id);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->previousHash, stored.hash);
    EXPECT_GT(event->timestamp, stored.timestamp);
    EXPECT_EQ(chain_.verifyChain({stored, *event}).status, core::VerificationStatus::Valid);
}

TEST_F(AuditServiceTest, WriteFailuresReachHandler) {
    service::AuditService service(storage_, config());
    size_t failedBatch = 0;
    size_t reportedWritten = 99;
    service.setWriteFailureHandler([&](const std::vector<core::AuditEvent>& batch, size_t written) {
        failedBatch = batch.size();
        reportedWritten = written;
    });

    service.capture(traceView("t1", "tr-1"));
    service.capture(traceView("t1", "tr-2"));
    storage_.setFailBatches(true);

    EXPECT_EQ(service.flush(), 0u);
    EXPECT_EQ(failedBatch, 2u);
    EXPECT_EQ(reportedWritten, 0u);
    EXPECT_EQ(service.pendingCount(), 0u);

    storage_.setFailBatches(false);
    EXPECT_EQ(service.flush(), 0u);
}

TEST_F(AuditServiceTest, PartialWriteReachesHandler) {
    service::AuditService service(storage_, config());
    size_t reportedWritten = 0;
    service.setWriteFailureHandler([&](const std::vector<core::AuditEvent>&, size_t written) {
        reportedWritten = written;
    });

    auto id = service.capture(traceView("t1", "tr-1"));
    service.capture(traceView("t1", "tr-2"));

    // Pre-store an event under the first id so the batch write skips it
    core::AuditEvent clash;
    clash.id = id;
    clash.tenantId = "other";
    ASSERT_TRUE(storage_.writeEvent(clash));

    EXPECT_EQ(service.flush(), 1u);
    EXPECT_EQ(reportedWritten, 1u);
}

TEST_F(AuditServiceTest, ConcurrentCapturesKeepPerTenantChains) {
    service::AuditService service(storage_, config(16));
    service.start();

    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 50;
    std::vector<std::thread> threads;
    std::atomic<int> accepted{0};
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&service, &accepted, t]() {
            const std::string tenant = t % 2 == 0 ? "even" : "odd";
            for (int i = 0; i < PER_THREAD; ++i) {
                auto id = service.capture(
                    traceView(tenant, "tr-" + std::to_string(t) + "-" + std::to_string(i)));
                if (!id.empty()) {
                    ++accepted;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    service.stop();

    EXPECT_EQ(accepted.load(), THREADS * PER_THREAD);
    EXPECT_EQ(storage_.eventCount(), static_cast<size_t>(THREADS * PER_THREAD));

    for (const char* tenant : {"even", "odd"}) {
        auto filter = core::EventFilter::forTenant(tenant);
        filter.limit = core::EventFilter::NO_LIMIT;
        auto events = storage_.query(filter);
        ASSERT_EQ(events.size(), static_cast<size_t>(THREADS / 2 * PER_THREAD));
        auto result = chain_.verifyChain(events);
        EXPECT_EQ(result.status, core::VerificationStatus::Valid) << tenant;
        EXPECT_TRUE(chain_.findTampering(events).empty()) << tenant;
    }
}

TEST_F(AuditServiceTest, ConcurrentDuplicatesPersistOnce) {
    service::AuditService service(storage_, config());
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&service]() {
            for (int i = 0; i < 20; ++i) {
                service.capture(traceView("t1", "same-trace"));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(service.flush(), 1u);
}

TEST_F(AuditServiceTest, ZeroBatchSizeIsCoerced) {
    service::AuditService service(storage_, config(0));
    EXPECT_EQ(service.config().batchSize, 1u);
}
