#pragma once

#include "bulbnet/bulb/Color.hpp"

#include <nlohmann/json.hpp>

namespace bulbnet {

/**
 * @brief Best-known snapshot of one bulb, kept by its client.
 *
 * `reachable` reflects the outcome of the last connect/status exchange; it is
 * reported as "connected" on the wire and in service output.
 */
struct BulbState {
    bool power = false;
    int brightness = 0;         // 0-100
    RgbColor color{255, 255, 255};
    bool reachable = false;

    /**
     * @brief Fold the `data` object of a get_status reply into this snapshot.
     *
     * Recognised keys: power (bool), brightness (0-100), color {r,g,b} (0-255
     * each), connected (bool). Missing keys and values of the wrong type or
     * range leave the corresponding field untouched.
     */
    void merge(const nlohmann::json& data);

    nlohmann::json toJson() const;

    friend bool operator==(const BulbState& a, const BulbState& b) {
        return a.power == b.power && a.brightness == b.brightness
            && a.color == b.color && a.reachable == b.reachable;
    }
    friend bool operator!=(const BulbState& a, const BulbState& b) { return !(a == b); }
};

} // namespace bulbnet
