#include <gtest/gtest.h>
#include "../core/domain/ReconciliationState.hpp"

using namespace nearme;
using domain::ReconciliationState;

TEST(ReconciliationStateTest, UnknownKeyIsOutside) {
    ReconciliationState state;
    EXPECT_FALSE(state.isInside("a::Home"));
    EXPECT_FALSE(state.entry("a::Home").has_value());
    EXPECT_EQ(state.lastEventSummary(), "None");
}

TEST(ReconciliationStateTest, TransitionsSetInsideFlag) {
    ReconciliationState state;

    state.applyTransition({"a::Home", TransitionKind::Enter, "2024-05-01T12:00:00.000Z"});
    EXPECT_TRUE(state.isInside("a::Home"));

    state.applyTransition({"a::Home", TransitionKind::Exit, "2024-05-01T12:10:00.000Z"});
    EXPECT_FALSE(state.isInside("a::Home"));

    auto entry = state.entry("a::Home");
    ASSERT_TRUE(entry.has_value());
    ASSERT_TRUE(entry->lastEvent.has_value());
    EXPECT_EQ(entry->lastEvent->kind, TransitionKind::Exit);
    EXPECT_EQ(entry->lastEvent->timestamp, "2024-05-01T12:10:00.000Z");
}

TEST(ReconciliationStateTest, ArrivalOrderWins) {
    ReconciliationState state;

    // Exit stamped later arrives first; the older enter still overwrites it
    state.applyTransition({"a::Home", TransitionKind::Exit, "2024-05-01T12:10:00.000Z"});
    state.applyTransition({"a::Home", TransitionKind::Enter, "2024-05-01T12:00:00.000Z"});

    EXPECT_TRUE(state.isInside("a::Home"));
}

TEST(ReconciliationStateTest, KeysAreIndependent) {
    ReconciliationState state;
    state.applyTransition({"a::Home", TransitionKind::Enter, ""});
    state.applyTransition({"b::Work", TransitionKind::Exit, ""});

    EXPECT_TRUE(state.isInside("a::Home"));
    EXPECT_FALSE(state.isInside("b::Work"));
    EXPECT_EQ(state.entries().size(), 2u);
}

TEST(ReconciliationStateTest, SummaryShowsNameAndTimestamp) {
    ReconciliationState state;

    state.applyTransition({"a::Home", TransitionKind::Enter, "2024-05-01T12:00:00.000Z"});
    EXPECT_EQ(state.lastEventSummary(), "enter: Home @ 2024-05-01T12:00:00.000Z");

    state.applyTransition({"b::Work", TransitionKind::Exit, ""});
    EXPECT_EQ(state.lastEventSummary(), "exit: Work");
    ASSERT_TRUE(state.lastEvent().has_value());
    EXPECT_EQ(state.lastEvent()->geofenceKey, "b::Work");
}

TEST(ReconciliationStateTest, DistanceIsDisplayOnly) {
    Target home;
    home.id = "a";
    home.name = "Home";
    home.latitude = 37.7749;
    home.longitude = -122.4194;

    ReconciliationState state;
    Location atHome{37.7749, -122.4194, 5.0};
    EXPECT_NEAR(ReconciliationState::distanceTo(home, atHome), 0.0, 0.01);
    EXPECT_FALSE(state.isInside(home.geofenceKey()));

    // About 1.11 km per 0.01 degree of latitude
    Location north{37.7849, -122.4194, 5.0};
    EXPECT_NEAR(ReconciliationState::distanceTo(home, north), 1112.0, 5.0);
}
