#include <gtest/gtest.h>
#include "../crypto/NotificationId.hpp"

using namespace nearme;

TEST(NotificationIdTest, StableForSameTransition) {
    int first = NotificationId::forTransition("a::Home", TransitionKind::Enter);
    int second = NotificationId::forTransition("a::Home", TransitionKind::Enter);

    EXPECT_EQ(first, second);
    EXPECT_GE(first, 0);
}

TEST(NotificationIdTest, DiffersByKindAndKey) {
    int enter = NotificationId::forTransition("a::Home", TransitionKind::Enter);
    int exit = NotificationId::forTransition("a::Home", TransitionKind::Exit);
    int other = NotificationId::forTransition("b::Work", TransitionKind::Enter);

    EXPECT_NE(enter, exit);
    EXPECT_NE(enter, other);
}

TEST(NotificationIdTest, MatchesKnownValues) {
    // First four bytes of SHA-256("a::Home\0enter"), masked to 31 bits
    EXPECT_EQ(NotificationId::forTransition("a::Home", TransitionKind::Enter), 971879013);
    EXPECT_EQ(NotificationId::forTransition("a::Home", TransitionKind::Exit), 107990087);
}

TEST(NotificationIdTest, NonNegativeAcrossManyKeys) {
    for (int i = 0; i < 200; ++i) {
        std::string key = "id" + std::to_string(i) + "::Place " + std::to_string(i);
        EXPECT_GE(NotificationId::forTransition(key, TransitionKind::Enter), 0);
        EXPECT_GE(NotificationId::forTransition(key, TransitionKind::Exit), 0);
    }
}
