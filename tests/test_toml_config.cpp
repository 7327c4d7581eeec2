#include <gtest/gtest.h>
#include "../platform/desktop/TomlConfig.hpp"
#include <cstdlib>

using namespace nearme;
using ports::PermissionStatus;

TEST(TomlConfigTest, EmptyTextGivesDefaults) {
    auto config = TomlConfig::loadFromString("");

    EXPECT_EQ(config.targetsFile, "assets/coordinates.json");
    EXPECT_EQ(config.responsivenessSeconds, 60);
    EXPECT_TRUE(config.initialTrigger);
    EXPECT_EQ(config.capacity, 100u);
    EXPECT_EQ(config.location, PermissionStatus::Granted);
    EXPECT_FALSE(config.startPosition.has_value());
    EXPECT_TRUE(config.route.empty());
    EXPECT_FALSE(config.useMqttRelay());
    EXPECT_EQ(config.relayPortName, domain::kGeofenceRelayPortName);
}

TEST(TomlConfigTest, ParsesAllSections) {
    auto config = TomlConfig::loadFromString(R"(
# comment line
[targets]
file = "places.json"

[geofence]
responsiveness_seconds = 5
initial_trigger = false
capacity = 20

[permissions]
service_enabled = true
location = "granted"
always = "denied"       # while in use only
notification = "permanently_denied"

[location]
accuracy = "reduced"
supports_accuracy_status = false
distance_filter_meters = 25.5
start_lat = 1.5
start_lon = -2.5
route_steps = 10
step_ms = 100

[relay]
mode = "mqtt"
host = "broker.local"
port = 8883
client_id = "device-1"
tls = true
ca_path = "/etc/ssl/ca.pem"
port_name = "custom_port"
)");

    EXPECT_EQ(config.targetsFile, "places.json");
    EXPECT_EQ(config.responsivenessSeconds, 5);
    EXPECT_FALSE(config.initialTrigger);
    EXPECT_EQ(config.capacity, 20u);
    EXPECT_EQ(config.locationAlways, PermissionStatus::Denied);
    EXPECT_EQ(config.notification, PermissionStatus::PermanentlyDenied);
    EXPECT_EQ(config.accuracy, ports::LocationAccuracyStatus::Reduced);
    EXPECT_FALSE(config.supportsAccuracyStatus);
    EXPECT_DOUBLE_EQ(config.distanceFilterMeters, 25.5);
    ASSERT_TRUE(config.startPosition.has_value());
    EXPECT_DOUBLE_EQ(config.startPosition->lat, 1.5);
    EXPECT_DOUBLE_EQ(config.startPosition->lon, -2.5);
    EXPECT_EQ(config.routeSteps, 10);
    EXPECT_EQ(config.stepMilliseconds, 100);

    EXPECT_TRUE(config.useMqttRelay());
    EXPECT_EQ(config.mqttHost, "broker.local");
    EXPECT_EQ(config.mqttPort, 8883);
    EXPECT_EQ(config.mqttClientId, "device-1");
    EXPECT_TRUE(config.mqttTls);
    EXPECT_EQ(config.mqttCaPath, "/etc/ssl/ca.pem");
    EXPECT_EQ(config.relayPortName, "custom_port");
}

TEST(TomlConfigTest, RouteTablesAppendWaypoints) {
    auto config = TomlConfig::loadFromString(R"(
[[route]]
lat = 1.0
lon = 2.0

[[route]]
lat = 3.0
lon = 4.0
)");

    ASSERT_EQ(config.route.size(), 2u);
    EXPECT_DOUBLE_EQ(config.route[0].lat, 1.0);
    EXPECT_DOUBLE_EQ(config.route[1].lon, 4.0);
}

TEST(TomlConfigTest, InvalidValuesKeepDefaults) {
    auto config = TomlConfig::loadFromString(R"(
[geofence]
capacity = lots
[permissions]
location = "maybe"
[relay]
mode = "carrier-pigeon"
port = 70000
)");

    EXPECT_EQ(config.capacity, 100u);
    EXPECT_EQ(config.location, PermissionStatus::Granted);
    EXPECT_EQ(config.relayMode, "local");
    EXPECT_EQ(config.mqttPort, 1883);
}

TEST(TomlConfigTest, MissingFileUsesDefaults) {
    auto config = TomlConfig::loadFromFile(::testing::TempDir() + "nearme_no_such_config.toml");
    EXPECT_EQ(config.capacity, 100u);
}

TEST(TomlConfigTest, EnvironmentOverridesFile) {
    setenv("NEARME_MQTT_HOST", "env-broker", 1);
    setenv("NEARME_MQTT_PORT", "1999", 1);

    AppConfig config;
    TomlConfig::applyEnvironment(config);

    unsetenv("NEARME_MQTT_HOST");
    unsetenv("NEARME_MQTT_PORT");

    EXPECT_EQ(config.mqttHost, "env-broker");
    EXPECT_EQ(config.mqttPort, 1999);
}

TEST(TomlConfigTest, PermissionStatusNames) {
    EXPECT_EQ(TomlConfig::parsePermissionStatus("granted"), PermissionStatus::Granted);
    EXPECT_EQ(TomlConfig::parsePermissionStatus("denied"), PermissionStatus::Denied);
    EXPECT_EQ(TomlConfig::parsePermissionStatus("permanently_denied"), PermissionStatus::PermanentlyDenied);
    EXPECT_THROW(TomlConfig::parsePermissionStatus("Granted"), std::invalid_argument);
}
