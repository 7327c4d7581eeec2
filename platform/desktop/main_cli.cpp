/**
 * @file main_cli.cpp
 * @brief Command-line front-end for Near Me Alerts
 *
 * Runs the foreground monitor against simulated platform services, drives
 * the simulated device along a route, or acts as a cold-started background
 * invocation that raises one transition and relays it over MQTT.
 */

#include "ConsoleNotificationChannel.hpp"
#include "DesktopRuntime.hpp"
#include "TomlConfig.hpp"
#include "../../core/adapters/MqttRelayPort.hpp"
#include "../../core/domain/BackgroundEventHandler.hpp"
#include "../../net/mqtt/PahoMqttClient.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <signal.h>
#include <sstream>
#include <thread>

using namespace nearme;

/// Global flag for graceful shutdown coordination
static volatile sig_atomic_t g_running = 1;

void signalHandler(int signal) {
    (void)signal;
    g_running = 0;
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config [file]      Configuration file (default: nearme.toml)\n"
              << "  --drive              Drive the simulated device along the route, then exit\n"
              << "  --headless           Keep monitoring until interrupted\n"
              << "  --background         Act as a background invocation (needs --key and --event)\n"
              << "  --key [geofenceKey]  Geofence key for --background, e.g. \"home::Home\"\n"
              << "  --event [enter|exit] Transition for --background\n"
              << "  --help               Show this help message\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [targets]\n"
              << "  file = \"assets/coordinates.json\"\n"
              << "  [relay]\n"
              << "  mode = \"local\"        # or \"mqtt\"\n"
              << std::endl;
}

static NotificationFactory consoleNotifications() {
    return [] { return std::make_shared<ConsoleNotificationChannel>(); };
}

static void printState(domain::MonitoringController& controller) {
    std::cout << "Status:      " << controller.status() << "\n"
              << "Permissions: " << controller.permissionStatus() << "\n"
              << "Geofences:   " << (controller.geofencesRegistered() ? "Active" : "Inactive") << "\n"
              << "Last event:  " << controller.lastEvent() << "\n";

    if (const auto& position = controller.currentPosition()) {
        std::cout << "Position:    " << std::fixed << std::setprecision(5)
                  << position->lat << ", " << position->lon << "\n";
    } else {
        std::cout << "Position:    Unknown\n";
    }
    if (controller.needsSettings()) {
        std::cout << "Some permissions are blocked. Use 'o' to open settings.\n";
    }

    for (const auto& row : controller.rows()) {
        std::cout << DesktopRuntime::describeRow(row) << "\n";
    }
    std::cout << std::defaultfloat << std::setprecision(6) << std::flush;
}

/**
 * @brief Cold-start background invocation
 *
 * Shares nothing with a running monitor except the broker. With the relay in
 * local mode there is no receiver and the transition only produces the
 * notification.
 */
static int runBackground(const AppConfig& config, const std::string& key, const std::string& eventName) {
    auto kind = stringToTransitionKind(eventName);
    if (!kind || key.empty()) {
        std::cerr << "--background needs --key and --event enter|exit" << std::endl;
        return 1;
    }

    auto registry = std::make_shared<domain::PortRegistry>();
    std::shared_ptr<PahoMqttClient> mqttClient;
    if (config.useMqttRelay()) {
        mqttClient = std::make_shared<PahoMqttClient>();
        if (DesktopRuntime::connectRelayClient(*mqttClient, config, "-bg-once")) {
            registry->registerPortWithName(
                std::make_shared<adapters::MqttRelayPort>(mqttClient, config.relayPortName),
                config.relayPortName);
        } else {
            std::cerr << "[Relay] Broker unreachable, transition will not be relayed" << std::endl;
        }
    }

    domain::BackgroundBootstrap bootstrap;
    bootstrap.notificationFactory = consoleNotifications();
    bootstrap.registry = registry;
    bootstrap.clock = std::make_shared<SystemClock>();
    bootstrap.relayPortName = config.relayPortName;

    auto entryPoint = domain::makeBackgroundEntryPoint(bootstrap);
    entryPoint({{key}, *kind == TransitionKind::Enter ? GeofenceEvent::Enter : GeofenceEvent::Exit});

    if (mqttClient) {
        // QoS 0 publish is asynchronous; give it a moment to leave
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        mqttClient->disconnect();
    }
    return 0;
}

static void runDrive(DesktopRuntime& runtime) {
    auto route = runtime.route();
    if (route.empty()) {
        std::cerr << "No route configured and no saved locations to drive past" << std::endl;
        return;
    }

    const int steps = std::max(1, runtime.config().routeSteps);
    std::cout << "Driving " << route.size() << " waypoints in " << steps << " steps..." << std::endl;

    for (int step = 0; step <= steps && g_running; ++step) {
        double progress = static_cast<double>(step) / steps;
        runtime.moveTo(Geo::interpolateRoute(route, progress));
        runtime.controller().processEvents();
        std::this_thread::sleep_for(std::chrono::milliseconds(runtime.config().stepMilliseconds));
    }

    // Let relayed events from the last step arrive
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    runtime.controller().processEvents();
}

static void runInteractive(DesktopRuntime& runtime) {
    auto& controller = runtime.controller();
    std::cout << "\nInteractive mode. Commands:\n"
              << "  p              - Print state\n"
              << "  r              - Refresh location\n"
              << "  g              - Re-register geofences\n"
              << "  o              - Open settings\n"
              << "  m <lat> <lon>  - Move the simulated device\n"
              << "  q              - Quit\n" << std::endl;

    std::string line;
    while (g_running && std::getline(std::cin, line)) {
        std::istringstream input(line);
        char cmd = 0;
        input >> cmd;

        switch (cmd) {
            case 'p':
                break;
            case 'r':
                controller.refreshLocation();
                break;
            case 'g':
                controller.reregister();
                break;
            case 'o':
                controller.openSettings();
                break;
            case 'm': {
                double lat = 0.0;
                double lon = 0.0;
                if (input >> lat >> lon) {
                    runtime.moveTo({lat, lon, 5.0});
                } else {
                    std::cout << "Usage: m <lat> <lon>" << std::endl;
                }
                break;
            }
            case 'q':
                g_running = 0;
                continue;
            case 0:
                break;
            default:
                std::cout << "Unknown command" << std::endl;
                break;
        }

        controller.processEvents();
        printState(controller);
    }
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    bool driveMode = false;
    bool headless = false;
    bool background = false;
    std::string key;
    std::string eventName;

    std::string configFile = "nearme.toml";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 < argc) {
                configFile = argv[++i];
            }
        } else if (arg == "--drive") {
            driveMode = true;
        } else if (arg == "--headless") {
            headless = true;
        } else if (arg == "--background") {
            background = true;
        } else if (arg == "--key") {
            if (i + 1 < argc) {
                key = argv[++i];
            }
        } else if (arg == "--event") {
            if (i + 1 < argc) {
                eventName = argv[++i];
            }
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    auto config = TomlConfig::loadFromFile(configFile);

    if (background) {
        return runBackground(config, key, eventName);
    }

    std::cout << "Starting Near Me Alerts (relay: " << config.relayMode << ")" << std::endl;

    DesktopRuntime runtime(config, consoleNotifications());
    runtime.start();
    printState(runtime.controller());

    if (driveMode) {
        runDrive(runtime);
        printState(runtime.controller());
    } else if (headless) {
        std::cout << "Running in headless mode. Press Ctrl+C to stop." << std::endl;
        while (g_running) {
            if (runtime.controller().processEvents() > 0) {
                printState(runtime.controller());
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
        }
    } else {
        runInteractive(runtime);
    }

    std::cout << "Stopping monitor..." << std::endl;
    runtime.stop();
    return 0;
}
