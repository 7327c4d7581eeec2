/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the desktop front-ends
 *
 * Supported Sections:
 * - [targets]: location of the saved-places JSON file
 * - [geofence]: platform hints and the simulated service's capacity
 * - [permissions]: initial state of the simulated permission subsystem
 * - [location]: simulated location provider and stream settings
 * - [[route]]: waypoints driven through by `nearme_cli --drive`
 * - [relay]: in-process relay or cross-process relay over MQTT
 *
 * Environment overrides (applied after the file): NEARME_TARGETS,
 * NEARME_MQTT_HOST, NEARME_MQTT_PORT.
 *
 * @note Simple line-based parser; arrays and inline tables are not supported
 */

#pragma once

#include "../../core/Geo.hpp"
#include "../../core/domain/PortRegistry.hpp"
#include "../../core/ports/IPermissionSubsystem.hpp"
#include "../../core/ports/ILocationProvider.hpp"
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <string>
#include <vector>

namespace nearme {

struct AppConfig {
    // [targets]
    std::string targetsFile = "assets/coordinates.json";

    // [geofence]
    int responsivenessSeconds = 60;
    bool initialTrigger = true;
    std::size_t capacity = 100;

    // [permissions]
    bool locationServiceEnabled = true;
    ports::PermissionStatus location = ports::PermissionStatus::Granted;
    ports::PermissionStatus locationAlways = ports::PermissionStatus::Granted;
    ports::PermissionStatus notification = ports::PermissionStatus::Granted;

    // [location]
    bool supportsAccuracyStatus = true;
    ports::LocationAccuracyStatus accuracy = ports::LocationAccuracyStatus::Precise;
    bool highAccuracy = true;
    double distanceFilterMeters = 10.0;
    std::optional<Location> startPosition;
    int routeSteps = 20;
    int stepMilliseconds = 500;

    // [[route]]
    std::vector<RoutePoint> route;

    // [relay]
    std::string relayMode = "local";  ///< "local" or "mqtt"
    std::string mqttHost = "localhost";
    std::uint16_t mqttPort = 1883;
    std::string mqttClientId = "nearme";
    std::string mqttUsername;
    std::string mqttPassword;
    bool mqttTls = false;
    std::string mqttCaPath;
    std::string relayPortName = domain::kGeofenceRelayPortName;

    bool useMqttRelay() const { return relayMode == "mqtt"; }
};

class TomlConfig {
public:
    /**
     * @brief Load a configuration file, then apply environment overrides
     * @note A missing file is not an error: defaults are used with a warning
     */
    static AppConfig loadFromFile(const std::string& filename) {
        AppConfig config;
        std::ifstream file(filename);

        if (!file.is_open()) {
            std::cerr << "[Config] Could not open config file: " << filename << ", using defaults" << std::endl;
        } else {
            parse(file, config);
        }

        applyEnvironment(config);
        return config;
    }

    /// Parses TOML text without reading the environment
    static AppConfig loadFromString(const std::string& text) {
        AppConfig config;
        std::istringstream stream(text);
        parse(stream, config);
        return config;
    }

    static void applyEnvironment(AppConfig& config) {
        if (const char* targets = std::getenv("NEARME_TARGETS")) {
            config.targetsFile = targets;
        }
        if (const char* host = std::getenv("NEARME_MQTT_HOST")) {
            config.mqttHost = host;
        }
        if (const char* port = std::getenv("NEARME_MQTT_PORT")) {
            setValue("NEARME_MQTT_PORT", port, [&](const std::string& v) { config.mqttPort = parsePort(v); });
        }
    }

    static ports::PermissionStatus parsePermissionStatus(const std::string& value) {
        if (value == "granted") return ports::PermissionStatus::Granted;
        if (value == "denied") return ports::PermissionStatus::Denied;
        if (value == "permanently_denied") return ports::PermissionStatus::PermanentlyDenied;
        throw std::invalid_argument("expected granted, denied or permanently_denied");
    }

private:
    static void parse(std::istream& input, AppConfig& config) {
        std::string currentSection;
        std::string line;
        while (std::getline(input, line)) {
            // Remove comments and trim whitespace
            size_t commentPos = line.find('#');
            if (commentPos != std::string::npos) {
                line = line.substr(0, commentPos);
            }
            trim(line);

            if (line.empty()) {
                continue;
            }

            if (line.rfind("[[", 0) == 0) {
                if (line.size() > 4 && line.compare(line.size() - 2, 2, "]]") == 0) {
                    currentSection = line.substr(2, line.length() - 4);
                    trim(currentSection);
                    if (currentSection == "route") {
                        config.route.push_back({});
                    }
                }
                continue;
            }

            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                }
                continue;
            }

            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                continue;
            }

            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);
            unquote(value);

            setValue(currentSection + "." + key, value, [&](const std::string& v) {
                apply(config, currentSection, key, v);
            });
        }
    }

    static void apply(AppConfig& config, const std::string& section, const std::string& key,
                      const std::string& value) {
        if (section == "targets") {
            if (key == "file") {
                config.targetsFile = value;
            }
        } else if (section == "geofence") {
            if (key == "responsiveness_seconds") {
                config.responsivenessSeconds = std::stoi(value);
            } else if (key == "initial_trigger") {
                config.initialTrigger = parseBool(value);
            } else if (key == "capacity") {
                config.capacity = static_cast<std::size_t>(std::stoul(value));
            }
        } else if (section == "permissions") {
            if (key == "service_enabled") {
                config.locationServiceEnabled = parseBool(value);
            } else if (key == "location") {
                config.location = parsePermissionStatus(value);
            } else if (key == "always") {
                config.locationAlways = parsePermissionStatus(value);
            } else if (key == "notification") {
                config.notification = parsePermissionStatus(value);
            }
        } else if (section == "location") {
            if (key == "accuracy") {
                config.accuracy = parseAccuracy(value);
            } else if (key == "supports_accuracy_status") {
                config.supportsAccuracyStatus = parseBool(value);
            } else if (key == "high_accuracy") {
                config.highAccuracy = parseBool(value);
            } else if (key == "distance_filter_meters") {
                config.distanceFilterMeters = std::stod(value);
            } else if (key == "start_lat") {
                ensureStart(config).lat = std::stod(value);
            } else if (key == "start_lon") {
                ensureStart(config).lon = std::stod(value);
            } else if (key == "route_steps") {
                config.routeSteps = std::stoi(value);
            } else if (key == "step_ms") {
                config.stepMilliseconds = std::stoi(value);
            }
        } else if (section == "route") {
            if (config.route.empty()) {
                config.route.push_back({});
            }
            if (key == "lat") {
                config.route.back().lat = std::stod(value);
            } else if (key == "lon") {
                config.route.back().lon = std::stod(value);
            }
        } else if (section == "relay") {
            if (key == "mode") {
                if (value != "local" && value != "mqtt") {
                    throw std::invalid_argument("expected local or mqtt");
                }
                config.relayMode = value;
            } else if (key == "host") {
                config.mqttHost = value;
            } else if (key == "port") {
                config.mqttPort = parsePort(value);
            } else if (key == "client_id") {
                config.mqttClientId = value;
            } else if (key == "username") {
                config.mqttUsername = value;
            } else if (key == "password") {
                config.mqttPassword = value;
            } else if (key == "tls") {
                config.mqttTls = parseBool(value);
            } else if (key == "ca_path") {
                config.mqttCaPath = value;
            } else if (key == "port_name") {
                config.relayPortName = value;
            }
        }
    }

    /// Runs a setter and downgrades a bad value to a warning
    template <typename Setter>
    static void setValue(const std::string& name, const std::string& value, Setter setter) {
        try {
            setter(value);
        } catch (const std::exception& e) {
            std::cerr << "[Config] Ignoring invalid value for " << name << " (" << value << "): "
                      << e.what() << std::endl;
        }
    }

    static Location& ensureStart(AppConfig& config) {
        if (!config.startPosition) {
            config.startPosition = Location{};
        }
        return *config.startPosition;
    }

    static bool parseBool(const std::string& value) {
        if (value == "true" || value == "1") return true;
        if (value == "false" || value == "0") return false;
        throw std::invalid_argument("expected true or false");
    }

    static ports::LocationAccuracyStatus parseAccuracy(const std::string& value) {
        if (value == "precise") return ports::LocationAccuracyStatus::Precise;
        if (value == "reduced") return ports::LocationAccuracyStatus::Reduced;
        throw std::invalid_argument("expected precise or reduced");
    }

    static std::uint16_t parsePort(const std::string& value) {
        int port = std::stoi(value);
        if (port <= 0 || port > 65535) {
            throw std::out_of_range("port out of range");
        }
        return static_cast<std::uint16_t>(port);
    }

    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }

    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
};

} // namespace nearme
