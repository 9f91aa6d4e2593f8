#include "bulbnet/discovery/BulbDiscovery.hpp"
#include "bulbnet/log/Log.hpp"
#include "bulbnet/service/BulbService.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace bulbnet;

namespace {

void printUsage() {
    std::cerr <<
        "usage: bulbctl [--bulb host:port] <command> [args]\n"
        "  discover [timeout-ms]\n"
        "  connect host:port\n"
        "  on | off | status | ping\n"
        "  brightness <0-100>\n"
        "  color <#RRGGBB>\n"
        "  statuses\n"
        "environment: BULB_IP (default " << config::BULB_HOST_DEFAULT << "), "
        "BULB_PORT (default " << config::BULB_PORT_DEFAULT << ")\n";
}

// Default bulb comes from the environment; the library itself never reads it.
BulbConfig defaultBulbFromEnvironment() {
    BulbConfig bulb(config::BULB_HOST_DEFAULT, config::BULB_PORT_DEFAULT);
    if (const char* host = std::getenv("BULB_IP"); host && *host) {
        bulb.address.host = host;
    }
    if (const char* port = std::getenv("BULB_PORT"); port && *port) {
        const auto value = parseInt(port);
        if (value && *value > 0 && *value <= 65535) {
            bulb.address.port = static_cast<unsigned short>(*value);
        } else {
            logError("[bulbctl] ignoring invalid BULB_PORT '", port, "'\n");
        }
    }
    return bulb;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::optional<BulbAddress> target;

    if (args.size() >= 2 && args[0] == "--bulb") {
        auto parsed = parseAddress(args[1]);
        if (!parsed) {
            std::cerr << "Invalid bulb address: " << args[1] << "\n";
            return 2;
        }
        target = *parsed;
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty()) {
        printUsage();
        return 2;
    }

    BulbDiscovery discovery;
    BulbService service(discovery);
    const auto& command = args[0];

    // Commands that act on a bulb need a live registry entry first.
    const bool needsBulb = command != "discover" && command != "connect";
    if (needsBulb) {
        if (target) {
            if (auto connected = discovery.connectToBulb(*target); !connected) {
                std::cerr << "Connect failed: " << connected.error().message() << "\n";
            }
        } else if (auto connected = service.connectDefault(defaultBulbFromEnvironment()); !connected) {
            std::cerr << "Connect failed: " << connected.error().message() << "\n";
        }
    }

    nlohmann::json result;
    if (command == "discover") {
        std::chrono::milliseconds timeout = config::DISCOVERY_TIMEOUT_DEFAULT;
        if (args.size() > 1) {
            auto ms = parseInt(args[1]);
            if (!ms || *ms <= 0) {
                printUsage();
                return 2;
            }
            timeout = std::chrono::milliseconds{*ms};
        }
        result = service.discover(timeout);
    } else if (command == "connect" && args.size() > 1) {
        auto address = parseAddress(args[1]);
        if (!address) {
            std::cerr << "Invalid bulb address: " << args[1] << "\n";
            return 2;
        }
        result = service.connect(*address);
    } else if (command == "on") {
        result = service.turnOn(target);
    } else if (command == "off") {
        result = service.turnOff(target);
    } else if (command == "brightness" && args.size() > 1) {
        auto level = parseInt(args[1]);
        if (!level) {
            printUsage();
            return 2;
        }
        result = service.setBrightness(*level, target);
    } else if (command == "color" && args.size() > 1) {
        result = service.setColor(args[1], target);
    } else if (command == "status") {
        result = service.getStatus(target);
    } else if (command == "statuses") {
        result = service.getAllStatuses();
    } else if (command == "ping") {
        result = service.ping(target);
    } else {
        printUsage();
        return 2;
    }

    std::cout << result.dump(2) << std::endl;
    discovery.closeAll();
    return result.value("success", false) ? 0 : 1;
}
