#include "storage/sqlitecheckpointstore.hpp"
#include "core/timestamp/timestampauthority.hpp"
#include "test_config.h"
#include <gtest/gtest.h>
#include <sqlite3.h>
#include <filesystem>

using namespace ledgerseal;

namespace fs = std::filesystem;

class SqliteCheckpointStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dbPath_ = (fs::path(TEST_OUTPUT_DIR) / "sqlite_checkpoint_test.db").string();
        fs::remove(dbPath_);
        store_ = std::make_unique<storage::SqliteCheckpointStore>(dbPath_);
    }

    void TearDown() override {
        store_.reset();
        std::error_code ec;
        fs::remove(dbPath_, ec);
    }

    core::Checkpoint make(const std::string& tenant, const std::string& date) {
        core::Checkpoint checkpoint;
        checkpoint.tenantId = tenant;
        checkpoint.date = *core::compat::CivilDate::parse(date);
        checkpoint.merkleRoot = std::string(64, 'e');
        checkpoint.eventCount = 12;
        checkpoint.firstEventHash = std::string(64, '1');
        checkpoint.lastEventHash = std::string(64, '2');
        checkpoint.timestampToken = authority_.getToken(checkpoint.merkleRoot);
        checkpoint.createdAt = core::compat::now();
        checkpoint.checkpointHash = checkpoint.computeHash();
        return checkpoint;
    }

    std::string dbPath_;
    core::LocalTimestampAuthority authority_;
    std::unique_ptr<storage::SqliteCheckpointStore> store_;
};

TEST_F(SqliteCheckpointStoreTest, SaveAndGet) {
    auto checkpoint = make("tenant-a", "2024-02-28");
    ASSERT_TRUE(store_->save(checkpoint));

    auto loaded = store_->get("tenant-a", checkpoint.date);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->checkpointHash, checkpoint.checkpointHash);
    EXPECT_EQ(loaded->computeHash(), checkpoint.checkpointHash);
    EXPECT_EQ(loaded->eventCount, 12u);
    ASSERT_TRUE(loaded->timestampToken.has_value());
    EXPECT_TRUE(authority_.verifyToken(*loaded->timestampToken, loaded->merkleRoot));

    EXPECT_FALSE(store_->get("tenant-b", checkpoint.date).has_value());
}

TEST_F(SqliteCheckpointStoreTest, SecondSaveForSameDayIsRejected) {
    auto checkpoint = make("tenant-a", "2024-02-28");
    ASSERT_TRUE(store_->save(checkpoint));

    auto replacement = checkpoint;
    replacement.eventCount = 1;
    replacement.checkpointHash = replacement.computeHash();
    EXPECT_FALSE(store_->save(replacement));
    EXPECT_EQ(store_->get("tenant-a", checkpoint.date)->eventCount, 12u);
}

TEST_F(SqliteCheckpointStoreTest, LatestBeforeAndList) {
    ASSERT_TRUE(store_->save(make("tenant-a", "2024-02-27")));
    ASSERT_TRUE(store_->save(make("tenant-a", "2024-03-02")));
    ASSERT_TRUE(store_->save(make("tenant-a", "2024-02-29")));
    ASSERT_TRUE(store_->save(make("tenant-b", "2024-03-01")));

    auto latest = store_->latestBefore("tenant-a", *core::compat::CivilDate::parse("2024-03-02"));
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->date.toString(), "2024-02-29");
    EXPECT_FALSE(store_->latestBefore("tenant-a", *core::compat::CivilDate::parse("2024-02-27")).has_value());

    auto newest = store_->latest("tenant-a");
    ASSERT_TRUE(newest.has_value());
    EXPECT_EQ(newest->date.toString(), "2024-03-02");
    EXPECT_FALSE(store_->latest("tenant-z").has_value());

    auto listed = store_->list("tenant-a", *core::compat::CivilDate::parse("2024-02-28"),
                               *core::compat::CivilDate::parse("2024-03-02"));
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0].date.toString(), "2024-02-29");
    EXPECT_EQ(listed[1].date.toString(), "2024-03-02");
}

TEST_F(SqliteCheckpointStoreTest, StoredRowsAreImmutable) {
    ASSERT_TRUE(store_->save(make("tenant-a", "2024-02-28")));

    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(dbPath_.c_str(), &db), SQLITE_OK);
    EXPECT_EQ(sqlite3_exec(db, "UPDATE checkpoints SET checkpoint_hash = 'x';", nullptr, nullptr, nullptr),
              SQLITE_CONSTRAINT);
    EXPECT_EQ(sqlite3_exec(db, "DELETE FROM checkpoints;", nullptr, nullptr, nullptr),
              SQLITE_CONSTRAINT);
    sqlite3_close(db);

    EXPECT_TRUE(store_->get("tenant-a", *core::compat::CivilDate::parse("2024-02-28")).has_value());
}

TEST_F(SqliteCheckpointStoreTest, PersistsAcrossReopen) {
    ASSERT_TRUE(store_->save(make("tenant-a", "2024-02-28")));
    store_ = std::make_unique<storage::SqliteCheckpointStore>(dbPath_);
    EXPECT_TRUE(store_->get("tenant-a", *core::compat::CivilDate::parse("2024-02-28")).has_value());
}
