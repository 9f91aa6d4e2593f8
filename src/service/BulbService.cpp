#include "bulbnet/service/BulbService.hpp"

#include "bulbnet/bulb/BulbCommand.hpp"
#include "bulbnet/log/Log.hpp"

#include <utility>

namespace bulbnet {

using nlohmann::json;

namespace {

json failure(std::string message) {
    return json{{"success", false}, {"error", std::move(message)}};
}

json bulbEntry(const BulbAddress& address, const BulbState& status) {
    return json{{"address", address.toString()}, {"status", status.toJson()}};
}

} // namespace

BulbService::BulbService(BulbDiscovery& discovery)
: discovery_(discovery) {}

expected<void> BulbService::connectDefault(const BulbConfig& config) {
    auto client = discovery_.connectToBulb(config);
    if (!client) {
        logError("[BulbService] failed to connect to default bulb ",
                 config.address.toString(), ": ", client.error().message(), "\n");
        return unexpected(client.error());
    }
    defaultBulb_ = config.address;
    logInfo("[BulbService] default bulb: ", config.address.toString(), "\n");
    return {};
}

expected<BulbClient*, std::string>
BulbService::resolveBulb(const std::optional<BulbAddress>& address) const {
    if (address) {
        if (auto* client = discovery_.get(*address)) {
            return client;
        }
        return unexpected("No connection to bulb at " + address->toString());
    }
    if (defaultBulb_) {
        if (auto* client = discovery_.get(*defaultBulb_)) {
            return client;
        }
    }
    return unexpected(std::string("No default bulb connection available"));
}

json BulbService::discover(std::chrono::milliseconds timeout) {
    logInfo("[BulbService] scanning network for smart bulbs (timeout ", timeout.count(), "ms)\n");
    auto found = discovery_.discover(timeout);
    if (!found) {
        return failure("Discovery failed: " + found.error().message());
    }

    json bulbs = json::array();
    for (const auto& bulb : *found) {
        json entry = {
            {"ip", bulb.address.host},
            {"port", bulb.address.port},
            {"response_time", bulb.responseTime.count() / 1000.0}
        };
        if (bulb.macAddress) entry["mac_address"] = *bulb.macAddress;
        if (bulb.model) entry["model"] = *bulb.model;
        if (bulb.firmwareVersion) entry["firmware_version"] = *bulb.firmwareVersion;
        bulbs.push_back(std::move(entry));
    }

    const auto count = bulbs.size();
    return json{
        {"success", true},
        {"discovered_bulbs", std::move(bulbs)},
        {"count", count},
        {"message", "Found " + std::to_string(count) + " smart bulbs on the network"}
    };
}

json BulbService::connect(const BulbAddress& address) {
    auto client = discovery_.connectToBulb(address);
    if (!client) {
        return failure("Failed to connect to bulb at " + address.toString() + ": " +
                       client.error().message());
    }
    const auto status = (*client)->getStatus();
    return json{
        {"success", true},
        {"message", "Successfully connected to bulb at " + address.toString()},
        {"bulb", bulbEntry(address, status)}
    };
}

json BulbService::mutate(const std::optional<BulbAddress>& address,
                         const std::function<expected<void>(BulbClient&)>& operation,
                         const std::string& action,
                         const std::string& failureMessage) {
    auto client = resolveBulb(address);
    if (!client) {
        return failure(client.error());
    }
    BulbClient& bulb = **client;

    logInfo("[BulbService] ", action, " on bulb at ", bulb.address().toString(), "\n");
    if (auto result = operation(bulb); !result) {
        return failure(failureMessage + ": " + result.error().message());
    }

    const auto status = bulb.getStatus();
    return json{
        {"success", true},
        {"message", action + " on bulb at " + bulb.address().toString()},
        {"bulb", bulbEntry(bulb.address(), status)}
    };
}

json BulbService::turnOn(const std::optional<BulbAddress>& address) {
    return mutate(address, [](BulbClient& bulb) { return bulb.turnOn(); },
                  "Turned ON", "Failed to turn on bulb");
}

json BulbService::turnOff(const std::optional<BulbAddress>& address) {
    return mutate(address, [](BulbClient& bulb) { return bulb.turnOff(); },
                  "Turned OFF", "Failed to turn off bulb");
}

json BulbService::setBrightness(int brightness, const std::optional<BulbAddress>& address) {
    if (brightness < protocol::BRIGHTNESS_MIN || brightness > protocol::BRIGHTNESS_MAX) {
        return failure("Brightness must be between 0 and 100");
    }
    return mutate(address,
                  [brightness](BulbClient& bulb) { return bulb.setBrightness(brightness); },
                  "Set brightness to " + std::to_string(brightness) + "%",
                  "Failed to set brightness");
}

json BulbService::setColor(std::string_view hex, const std::optional<BulbAddress>& address) {
    if (!parseHexColor(hex)) {
        return failure("Invalid hex color: " + std::string(hex));
    }
    const std::string text(hex);
    return mutate(address,
                  [text](BulbClient& bulb) { return bulb.setColorHex(text); },
                  "Set color to " + text,
                  "Failed to set color");
}

json BulbService::getStatus(const std::optional<BulbAddress>& address) {
    auto client = resolveBulb(address);
    if (!client) {
        return failure(client.error());
    }
    BulbClient& bulb = **client;
    const auto status = bulb.getStatus();
    return json{
        {"success", true},
        {"bulb", bulbEntry(bulb.address(), status)}
    };
}

json BulbService::getAllStatuses() {
    json bulbs = json::array();
    for (const auto& report : discovery_.getAllStatuses()) {
        json status = report.status.toJson();
        if (report.error) {
            status["error"] = *report.error;
        }
        bulbs.push_back(json{{"bulb", report.address.toString()}, {"status", std::move(status)}});
    }

    const auto count = bulbs.size();
    return json{
        {"success", true},
        {"bulbs", std::move(bulbs)},
        {"count", count},
        {"message", "Retrieved status from " + std::to_string(count) + " connected bulbs"}
    };
}

json BulbService::ping(const std::optional<BulbAddress>& address) {
    auto client = resolveBulb(address);
    if (!client) {
        return failure(client.error());
    }
    BulbClient& bulb = **client;
    const bool ok = bulb.ping();
    const auto where = bulb.address().toString();
    return json{
        {"success", ok},
        {"bulb", where},
        {"message", std::string("Ping ") + (ok ? "successful" : "failed") + " for bulb at " + where}
    };
}

} // namespace bulbnet
