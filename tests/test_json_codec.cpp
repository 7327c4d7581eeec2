#include <gtest/gtest.h>
#include "../core/JsonCodec.hpp"

using namespace nearme;

TEST(JsonCodecTest, EncodesTransitionAsFlatObject) {
    TransitionEvent event{"a::Home", TransitionKind::Exit, "2024-05-01T12:00:00.000Z"};
    auto json = nlohmann::json::parse(JsonCodec::encodeTransition(event));

    EXPECT_EQ(json["id"], "a::Home");
    EXPECT_EQ(json["event"], "exit");
    EXPECT_EQ(json["timestamp"], "2024-05-01T12:00:00.000Z");
}

TEST(JsonCodecTest, DecodesRelayPayload) {
    auto event = JsonCodec::decodeTransition(
        R"({"id": "b::Office", "event": "enter", "timestamp": "2024-05-01T08:30:00.123Z"})");

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->geofenceKey, "b::Office");
    EXPECT_EQ(event->kind, TransitionKind::Enter);
    EXPECT_EQ(event->timestamp, "2024-05-01T08:30:00.123Z");
}

TEST(JsonCodecTest, TimestampIsOptional) {
    auto event = JsonCodec::decodeTransition(R"({"id": "b::Office", "event": "exit"})");
    ASSERT_TRUE(event.has_value());
    EXPECT_TRUE(event->timestamp.empty());
}

TEST(JsonCodecTest, RejectsMalformedRelayPayloads) {
    EXPECT_FALSE(JsonCodec::decodeTransition("").has_value());
    EXPECT_FALSE(JsonCodec::decodeTransition("{broken").has_value());
    EXPECT_FALSE(JsonCodec::decodeTransition("[1, 2]").has_value());
    EXPECT_FALSE(JsonCodec::decodeTransition(R"({"event": "enter"})").has_value());
    EXPECT_FALSE(JsonCodec::decodeTransition(R"({"id": 5, "event": "enter"})").has_value());
    EXPECT_FALSE(JsonCodec::decodeTransition(R"({"id": "a::A", "event": "dwell"})").has_value());
}

TEST(JsonCodecTest, ParseErrorsNameTheRecord) {
    try {
        JsonCodec::parseTargets(R"([{"id": "a", "latitude": 0, "longitude": 0}, {"id": "b"}])");
        FAIL() << "expected invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("record 1"), std::string::npos);
    }
}
