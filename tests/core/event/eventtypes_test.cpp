#include "core/event/eventtypes.hpp"
#include <gtest/gtest.h>

using namespace ledgerseal::core;

TEST(EventTypesTest, TagsRoundTrip) {
    for (auto value : {Action::Create, Action::Read, Action::Update, Action::Delete, Action::Export}) {
        EXPECT_EQ(actionFromString(toString(value)), value);
    }
    for (auto value : {EventCategory::Auth, EventCategory::Data, EventCategory::Config,
                       EventCategory::Admin, EventCategory::Eval}) {
        EXPECT_EQ(categoryFromString(toString(value)), value);
    }
    for (auto value : {Severity::Info, Severity::Warning, Severity::Critical}) {
        EXPECT_EQ(severityFromString(toString(value)), value);
    }
    for (auto value : {ActorType::User, ActorType::Service, ActorType::System}) {
        EXPECT_EQ(actorTypeFromString(toString(value)), value);
    }
    EXPECT_FALSE(actionFromString("READ").has_value());
    EXPECT_FALSE(categoryFromString("").has_value());
}

TEST(EventTypeRegistryTest, BuiltinCatalog) {
    EventTypeRegistry registry;
    EXPECT_TRUE(registry.isRegistered(EventCategory::Auth, event_types::USER_LOGIN));
    EXPECT_TRUE(registry.isRegistered(EventCategory::Data, event_types::TRACE_DELETED));
    EXPECT_TRUE(registry.isRegistered(EventCategory::Config, event_types::PROJECT_UPDATED));
    EXPECT_TRUE(registry.isRegistered(EventCategory::Admin, event_types::AUDIT_LOG_EXPORTED));
    EXPECT_TRUE(registry.isRegistered(EventCategory::Eval, event_types::EVALUATION_COMPLETED));

    // Registered under a different category
    EXPECT_FALSE(registry.isRegistered(EventCategory::Data, event_types::USER_LOGIN));
    EXPECT_FALSE(registry.isRegistered(EventCategory::Data, "widget.polished"));
}

TEST(EventTypeRegistryTest, RegisterCustomType) {
    EventTypeRegistry registry;
    EXPECT_TRUE(registry.registerType(EventCategory::Data, "widget.polished"));
    EXPECT_TRUE(registry.isRegistered(EventCategory::Data, "widget.polished"));
    EXPECT_FALSE(registry.registerType(EventCategory::Data, "widget.polished"));
    EXPECT_FALSE(registry.registerType(EventCategory::Data, ""));
    EXPECT_EQ(registry.typesFor(EventCategory::Data).count("widget.polished"), 1u);

    // Instances do not share registrations
    EventTypeRegistry fresh;
    EXPECT_FALSE(fresh.isRegistered(EventCategory::Data, "widget.polished"));
    EXPECT_EQ(EventTypeRegistry::builtinCatalog().at(EventCategory::Data).count("widget.polished"), 0u);
}
