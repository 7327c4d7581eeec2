#include <gtest/gtest.h>
#include "../core/domain/BackgroundEventHandler.hpp"
#include "../core/domain/RelayReceivePort.hpp"
#include "../core/sim/RecordingNotificationChannel.hpp"
#include "../core/Target.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include "../crypto/NotificationId.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace nearme;
using domain::BackgroundEventHandler;

namespace {

class ThrowingNotificationChannel : public ports::INotificationChannel {
public:
    bool initialize(const ports::NotificationChannelSettings&) override { return true; }
    bool show(int, const std::string&, const std::string&) override {
        throw std::runtime_error("notification service crashed");
    }
};

class ThrowingSendPort : public ports::ISendPort {
public:
    bool send(const TransitionEvent& event) override {
        attempts.push_back(event.geofenceKey);
        throw std::runtime_error("payload not encodable");
    }

    std::vector<std::string> attempts;
};

} // namespace

class BackgroundEventHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        notifications_ = std::make_shared<sim::RecordingNotificationChannel>();
        registry_ = std::make_shared<domain::PortRegistry>();
        clock_ = std::make_shared<sim::SimulatedClock>(sim::SimulatedClock::fromUtc("2024-05-01T12:00:00"));

        port_ = std::make_shared<domain::RelayReceivePort>();
        port_->listen([this](const TransitionEvent& event) { relayed_.push_back(event); });
        registry_->registerPortWithName(port_, domain::kGeofenceRelayPortName);

        handler_ = std::make_unique<BackgroundEventHandler>(notifications_, registry_, clock_);
    }

    std::shared_ptr<sim::RecordingNotificationChannel> notifications_;
    std::shared_ptr<domain::PortRegistry> registry_;
    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<domain::RelayReceivePort> port_;
    std::unique_ptr<BackgroundEventHandler> handler_;
    std::vector<TransitionEvent> relayed_;
};

TEST_F(BackgroundEventHandlerTest, EnterShowsNotificationAndRelays) {
    int handled = handler_->onTransition({{"a::Home"}, GeofenceEvent::Enter});
    EXPECT_EQ(handled, 1);

    auto shown = notifications_->last();
    ASSERT_TRUE(shown.has_value());
    EXPECT_EQ(shown->title, "Entered: Home");
    EXPECT_NE(shown->body.find("enter"), std::string::npos);
    EXPECT_EQ(shown->id, NotificationId::forTransition("a::Home", TransitionKind::Enter));

    EXPECT_EQ(port_->processEvents(), 1u);
    ASSERT_EQ(relayed_.size(), 1u);
    EXPECT_EQ(relayed_[0].geofenceKey, "a::Home");
    EXPECT_EQ(relayed_[0].kind, TransitionKind::Enter);
    EXPECT_EQ(relayed_[0].timestamp, "2024-05-01T12:00:00.000Z");
}

TEST_F(BackgroundEventHandlerTest, ExitUsesExitTitle) {
    handler_->onTransition({{"b::Work"}, GeofenceEvent::Exit});

    auto shown = notifications_->last();
    ASSERT_TRUE(shown.has_value());
    EXPECT_EQ(shown->title, "Exited: Work");
    EXPECT_EQ(shown->body, "Geofence exit detected.");
}

TEST_F(BackgroundEventHandlerTest, DwellIsIgnored) {
    EXPECT_EQ(handler_->onTransition({{"a::Home"}, GeofenceEvent::Dwell}), 0);

    EXPECT_TRUE(notifications_->history().empty());
    EXPECT_EQ(port_->pending(), 0u);
}

TEST_F(BackgroundEventHandlerTest, EachKeyHandledIndependently) {
    int handled = handler_->onTransition({{"a::Home", "b::Work"}, GeofenceEvent::Enter});

    EXPECT_EQ(handled, 2);
    EXPECT_EQ(notifications_->visible().size(), 2u);
    EXPECT_EQ(port_->processEvents(), 2u);
}

TEST_F(BackgroundEventHandlerTest, MissingPortOnlyShowsNotification) {
    registry_->removePortNameMapping(domain::kGeofenceRelayPortName);

    EXPECT_NO_THROW(handler_->onTransition({{"a::Home"}, GeofenceEvent::Enter}));
    EXPECT_EQ(notifications_->history().size(), 1u);
    EXPECT_EQ(port_->pending(), 0u);
}

TEST_F(BackgroundEventHandlerTest, ClosedPortDoesNotThrow) {
    port_->close();

    EXPECT_EQ(handler_->onTransition({{"a::Home"}, GeofenceEvent::Exit}), 1);
    EXPECT_EQ(notifications_->history().size(), 1u);
}

TEST_F(BackgroundEventHandlerTest, RedeliveryReplacesVisibleNotification) {
    handler_->onTransition({{"a::Home"}, GeofenceEvent::Enter});
    clock_->advance(std::chrono::seconds(30));
    handler_->onTransition({{"a::Home"}, GeofenceEvent::Enter});

    EXPECT_EQ(notifications_->history().size(), 2u);
    EXPECT_EQ(notifications_->visible().size(), 1u);

    // Both copies are relayed; the receiver tolerates duplicates
    EXPECT_EQ(port_->processEvents(), 2u);
    EXPECT_EQ(relayed_[1].timestamp, "2024-05-01T12:00:30.000Z");
}

TEST_F(BackgroundEventHandlerTest, DeniedNotificationStillRelays) {
    notifications_->setPermitted(false);

    handler_->onTransition({{"a::Home"}, GeofenceEvent::Enter});

    EXPECT_TRUE(notifications_->history().empty());
    EXPECT_EQ(port_->processEvents(), 1u);
}

TEST_F(BackgroundEventHandlerTest, NotificationFailureStillRelays) {
    BackgroundEventHandler handler(std::make_shared<ThrowingNotificationChannel>(), registry_, clock_);

    EXPECT_NO_THROW(handler.onTransition({{"a::Home"}, GeofenceEvent::Enter}));
    EXPECT_EQ(port_->processEvents(), 1u);
}

TEST_F(BackgroundEventHandlerTest, RelayFailureDoesNotStopTheBatch) {
    auto throwingPort = std::make_shared<ThrowingSendPort>();
    registry_->removePortNameMapping(domain::kGeofenceRelayPortName);
    registry_->registerPortWithName(throwingPort, domain::kGeofenceRelayPortName);

    int handled = 0;
    EXPECT_NO_THROW(handled = handler_->onTransition({{"a::Home", "b::Work"}, GeofenceEvent::Exit}));

    EXPECT_EQ(handled, 2);
    EXPECT_EQ(throwingPort->attempts.size(), 2u);
    ASSERT_EQ(notifications_->history().size(), 2u);
    EXPECT_EQ(notifications_->last()->title, "Exited: Work");
}

TEST_F(BackgroundEventHandlerTest, EntryPointBuildsItsOwnChannel) {
    int built = 0;
    domain::BackgroundBootstrap bootstrap;
    bootstrap.notificationFactory = [&]() {
        built++;
        return notifications_;
    };
    bootstrap.registry = registry_;
    bootstrap.clock = clock_;

    auto entryPoint = domain::makeBackgroundEntryPoint(bootstrap);
    entryPoint({{"a::Home"}, GeofenceEvent::Enter});
    entryPoint({{"a::Home"}, GeofenceEvent::Exit});

    EXPECT_EQ(built, 2);
    EXPECT_EQ(notifications_->initializeCount(), 2);
    ASSERT_TRUE(notifications_->settings().has_value());
    EXPECT_EQ(notifications_->settings()->channelId, "nearby_alerts");
    EXPECT_EQ(port_->processEvents(), 2u);
}

TEST_F(BackgroundEventHandlerTest, EntryPointContainsFailures) {
    domain::BackgroundBootstrap bootstrap;
    bootstrap.notificationFactory = []() -> std::shared_ptr<ports::INotificationChannel> {
        throw std::runtime_error("cold start failed");
    };
    bootstrap.registry = registry_;

    auto entryPoint = domain::makeBackgroundEntryPoint(bootstrap);
    EXPECT_NO_THROW(entryPoint({{"a::Home"}, GeofenceEvent::Enter}));
}

TEST(BackgroundEventHandlerTitles, KeyWithoutSeparatorUsesWholeKey) {
    EXPECT_EQ(BackgroundEventHandler::titleFor(TransitionKind::Enter, geofenceNameFromKey("legacy")),
              "Entered: legacy");
}
