#pragma once

#include "bulbnet/bulb/BulbConfig.hpp"
#include "bulbnet/core/Expected.hpp"
#include "bulbnet/discovery/BulbDiscovery.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace bulbnet {

/**
 * @brief Tool-facing operations over a discovery registry.
 *
 * Every call returns a JSON object with a boolean "success" and either a
 * payload or an "error" string; nothing throws. Operations that take an
 * optional address fall back to the default bulb chosen by `connectDefault()`.
 */
class BulbService {
public:
    explicit BulbService(BulbDiscovery& discovery);

    /// Connect the configured bulb and make it the default target.
    expected<void> connectDefault(const BulbConfig& config);
    const std::optional<BulbAddress>& defaultBulb() const { return defaultBulb_; }

    nlohmann::json discover(std::chrono::milliseconds timeout = config::DISCOVERY_TIMEOUT_DEFAULT);
    nlohmann::json connect(const BulbAddress& address);
    nlohmann::json turnOn(const std::optional<BulbAddress>& address = std::nullopt);
    nlohmann::json turnOff(const std::optional<BulbAddress>& address = std::nullopt);
    nlohmann::json setBrightness(int brightness,
                                 const std::optional<BulbAddress>& address = std::nullopt);
    nlohmann::json setColor(std::string_view hex,
                            const std::optional<BulbAddress>& address = std::nullopt);
    nlohmann::json getStatus(const std::optional<BulbAddress>& address = std::nullopt);
    nlohmann::json getAllStatuses();
    nlohmann::json ping(const std::optional<BulbAddress>& address = std::nullopt);

private:
    expected<BulbClient*, std::string> resolveBulb(const std::optional<BulbAddress>& address) const;
    nlohmann::json mutate(const std::optional<BulbAddress>& address,
                          const std::function<expected<void>(BulbClient&)>& operation,
                          const std::string& action,
                          const std::string& failureMessage);

    BulbDiscovery& discovery_;
    std::optional<BulbAddress> defaultBulb_;
};

} // namespace bulbnet
