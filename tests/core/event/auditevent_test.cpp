#include "core/event/auditevent.hpp"
#include "mocks/eventfactory.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace ledgerseal::core;
using ledgerseal::test::fixedTime;
using ledgerseal::test::makeEvent;

class AuditEventTest : public ::testing::Test {
protected:
    void SetUp() override {
        event_ = makeEvent("evt-1", "tenant-a", fixedTime("2024-05-01T10:00:00.000001Z"));
        event_.previousState = nlohmann::json{{"name", "old"}, {"tags", {"a", "b"}}};
        event_.newState = nlohmann::json{{"name", "new"}};
        event_.metadata = nlohmann::json{{"source", "api"}};
        event_.actorEmail = "alice@example.com";
        event_.seal();
    }

    AuditEvent event_;
};

TEST_F(AuditEventTest, HashIsDeterministic) {
    AuditEvent copy = event_;
    copy.seal();
    EXPECT_EQ(copy.hash, event_.hash);
    EXPECT_EQ(event_.hash.size(), 64u);
    EXPECT_TRUE(event_.verifyHash());
}

TEST_F(AuditEventTest, HashIgnoresPayloadKeyOrder) {
    AuditEvent reordered = event_;
    nlohmann::json state = nlohmann::json::object();
    state["tags"] = {"a", "b"};
    state["name"] = "old";
    reordered.previousState = state;
    EXPECT_EQ(reordered.computeHash(), event_.hash);
}

TEST_F(AuditEventTest, HashIsSensitiveToEveryField) {
    auto mutated = [this](auto mutate) {
        AuditEvent copy = event_;
        mutate(copy);
        return copy;
    };

    std::vector<AuditEvent> variants = {
        mutated([](AuditEvent& e) { e.resourceId = "trace-other"; }),
        mutated([](AuditEvent& e) { e.timestamp += compat::microseconds(1); }),
        mutated([](AuditEvent& e) { e.action = Action::Delete; }),
        mutated([](AuditEvent& e) { e.severity = Severity::Critical; }),
        mutated([](AuditEvent& e) { e.actorEmail.reset(); }),
        mutated([](AuditEvent& e) { e.newState = nlohmann::json{{"name", "newer"}}; }),
        mutated([](AuditEvent& e) { e.metadata.reset(); }),
        mutated([](AuditEvent& e) { e.previousHash = "00"; }),
        mutated([](AuditEvent& e) { e.sessionId = "sess-1"; }),
    };

    for (const auto& variant : variants) {
        EXPECT_NE(variant.computeHash(), event_.hash);
        EXPECT_FALSE(variant.verifyHash());
    }
}

TEST_F(AuditEventTest, HashExcludesItself) {
    AuditEvent copy = event_;
    copy.hash = "something else";
    EXPECT_EQ(copy.computeHash(), event_.hash);
}

TEST_F(AuditEventTest, EmptyHashNeverVerifies) {
    AuditEvent copy = event_;
    copy.hash.clear();
    EXPECT_FALSE(copy.verifyHash());
}

TEST_F(AuditEventTest, GenesisEventLinksToNothing) {
    EXPECT_EQ(event_.previousHash, "");
    EXPECT_TRUE(event_.verifyChain(nullptr));

    AuditEvent linked = makeEvent("evt-2", "tenant-a", event_.timestamp + compat::seconds(1),
                                  event_.hash);
    EXPECT_FALSE(linked.verifyChain(nullptr));
    EXPECT_TRUE(linked.verifyChain(&event_));

    AuditEvent unrelated = makeEvent("evt-3", "tenant-a", event_.timestamp, "");
    EXPECT_FALSE(linked.verifyChain(&unrelated));
}

TEST_F(AuditEventTest, CanonicalJsonUsesTagsAndNulls) {
    auto json = event_.canonicalJson();
    EXPECT_FALSE(json.contains("hash"));
    EXPECT_EQ(json["timestamp"], "2024-05-01T10:00:00.000001Z");
    EXPECT_EQ(json["actor_type"], "user");
    EXPECT_EQ(json["event_category"], "data");
    EXPECT_EQ(json["action"], "read");
    EXPECT_TRUE(json["project_id"].is_null());
    EXPECT_TRUE(json["session_id"].is_null());
}

TEST_F(AuditEventTest, DeduplicationKey) {
    EXPECT_EQ(event_.deduplicationKey(), "tenant-a:trace.viewed:trace:trace-evt-1:read");
}

TEST_F(AuditEventTest, JsonRoundTripKeepsStoredHash) {
    auto restored = AuditEvent::fromJson(event_.toJson());
    EXPECT_EQ(restored.hash, event_.hash);
    EXPECT_TRUE(restored.verifyHash());
    EXPECT_EQ(restored.previousState, event_.previousState);
    EXPECT_EQ(restored.actorEmail, event_.actorEmail);
    EXPECT_FALSE(restored.projectId.has_value());

    auto tampered = event_.toJson();
    tampered["resource_id"] = "trace-forged";
    auto forged = AuditEvent::fromJson(tampered);
    EXPECT_EQ(forged.hash, event_.hash);
    EXPECT_FALSE(forged.verifyHash());
}

TEST_F(AuditEventTest, FromJsonRejectsMalformedRecords) {
    auto json = event_.toJson();

    auto missing = json;
    missing.erase("tenant_id");
    EXPECT_THROW(AuditEvent::fromJson(missing), std::runtime_error);

    auto badEnum = json;
    badEnum["action"] = "obliterate";
    EXPECT_THROW(AuditEvent::fromJson(badEnum), std::runtime_error);

    auto badTimestamp = json;
    badTimestamp["timestamp"] = "yesterday";
    EXPECT_THROW(AuditEvent::fromJson(badTimestamp), std::runtime_error);

    EXPECT_THROW(AuditEvent::fromJson(nlohmann::json::array()), std::runtime_error);
}

TEST_F(AuditEventTest, InvalidUtf8StillHashes) {
    AuditEvent copy = event_;
    copy.resourceName = std::string("bad\xff\xfe");
    EXPECT_NO_THROW(copy.seal());
    EXPECT_TRUE(copy.verifyHash());
}
