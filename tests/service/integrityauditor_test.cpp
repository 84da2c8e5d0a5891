#include "service/integrityauditor.hpp"
#include "mocks/eventfactory.hpp"
#include "mocks/recordingstorage.hpp"
#include <gtest/gtest.h>

using namespace ledgerseal;
using ledgerseal::test::RecordingStorage;
using ledgerseal::test::fixedTime;
using ledgerseal::test::makeChain;
using ledgerseal::test::makeEvent;

class IntegrityAuditorTest : public ::testing::Test {
protected:
    void SetUp() override {
        events_ = makeChain("tenant-r", 6, fixedTime("2024-06-01T09:00:00Z"));
        day_ = *core::compat::CivilDate::parse("2024-06-01");
    }

    service::VerificationReport reportForDay() {
        return auditor_.generateReport("tenant-r", fixedTime("2024-06-01T00:00:00Z"),
                                       fixedTime("2024-06-02T00:00:00Z"));
    }

    RecordingStorage storage_;
    core::MerkleTree tree_;
    core::LocalTimestampAuthority authority_;
    core::MemoryCheckpointStore store_;
    core::AuditChain chain_;
    core::AuditCheckpoint checkpoints_{storage_, tree_, authority_, store_};
    service::IntegrityAuditor auditor_{storage_, chain_, checkpoints_, store_};

    std::vector<core::AuditEvent> events_;
    core::compat::CivilDate day_;
};

TEST_F(IntegrityAuditorTest, IntactHistoryIsValid) {
    ASSERT_EQ(storage_.writeBatch(events_), 6u);
    ASSERT_TRUE(checkpoints_.createCheckpoint("tenant-r", day_).has_value());

    auto report = reportForDay();
    EXPECT_EQ(report.overallStatus, core::VerificationStatus::Valid);
    EXPECT_EQ(report.chainResult.totalEvents, 6u);
    EXPECT_TRUE(report.tamperingIndicators.empty());
    ASSERT_EQ(report.checkpointsVerified.size(), 1u);
    EXPECT_EQ(report.checkpointsVerified[0].status, core::VerificationStatus::Valid);

    auto json = report.toJson();
    EXPECT_EQ(json["tenant_id"], "tenant-r");
    EXPECT_EQ(json["overall_status"], core::toString(core::VerificationStatus::Valid));
    EXPECT_EQ(json["time_range"]["start"], "2024-06-01T00:00:00.000000Z");
    EXPECT_EQ(json["checkpoints_verified"].size(), 1u);
    EXPECT_TRUE(json["tampering_indicators"].empty());
}

TEST_F(IntegrityAuditorTest, EmptyWindowWithoutCheckpoints) {
    ASSERT_EQ(storage_.writeBatch(events_), 6u);
    auto report = auditor_.generateReport("tenant-r", fixedTime("2024-07-01T00:00:00Z"),
                                          fixedTime("2024-07-02T00:00:00Z"));
    EXPECT_EQ(report.chainResult.totalEvents, 0u);
    EXPECT_TRUE(report.checkpointsVerified.empty());
    EXPECT_EQ(report.overallStatus, core::VerificationStatus::Valid);
}

TEST_F(IntegrityAuditorTest, EditedEventMakesReportIncomplete) {
    events_[2].resourceId = "trace-forged";
    ASSERT_EQ(storage_.writeBatch(events_), 6u);

    auto report = reportForDay();
    EXPECT_EQ(report.overallStatus, core::VerificationStatus::Incomplete);
    ASSERT_EQ(report.chainResult.hashMismatches.size(), 1u);
    EXPECT_EQ(report.chainResult.hashMismatches[0], events_[2].id);
    EXPECT_FALSE(report.tamperingIndicators.empty());
}

TEST_F(IntegrityAuditorTest, WhollyCorruptHistoryIsInvalid) {
    for (auto& event : events_) {
        event.hash = std::string(64, 'f');
    }
    ASSERT_EQ(storage_.writeBatch(events_), 6u);

    auto report = reportForDay();
    EXPECT_EQ(report.chainResult.status, core::VerificationStatus::Invalid);
    EXPECT_EQ(report.overallStatus, core::VerificationStatus::Invalid);
}

TEST_F(IntegrityAuditorTest, LateInsertionBreaksCheckpoint) {
    ASSERT_EQ(storage_.writeBatch(events_), 6u);
    ASSERT_TRUE(checkpoints_.createCheckpoint("tenant-r", day_).has_value());

    // Correctly chained, but written after the day was sealed
    auto late = makeEvent("late-1", "tenant-r", fixedTime("2024-06-01T18:00:00Z"), events_.back().hash);
    ASSERT_TRUE(storage_.writeEvent(late));

    auto report = reportForDay();
    EXPECT_EQ(report.chainResult.status, core::VerificationStatus::Valid);
    ASSERT_EQ(report.checkpointsVerified.size(), 1u);
    EXPECT_FALSE(report.checkpointsVerified[0].merkleRootValid);
    EXPECT_EQ(report.overallStatus, core::VerificationStatus::Incomplete);
}
