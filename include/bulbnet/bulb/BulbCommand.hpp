// BulbCommand.hpp
// -----------------------------------------------------------------------------
// Request side of the bulb wire protocol. One command per datagram, encoded as
// a JSON object:
//   { "command": <name>, "id": <correlation id>, "params": { ... } }
// "params" is omitted when the command carries none.

#pragma once

#include "bulbnet/bulb/Color.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace bulbnet::protocol {

constexpr const char* CMD_SET_POWER = "set_power";
constexpr const char* CMD_SET_BRIGHTNESS = "set_brightness";
constexpr const char* CMD_SET_COLOR = "set_color";
constexpr const char* CMD_GET_STATUS = "get_status";
constexpr const char* CMD_PING = "ping";

constexpr int BRIGHTNESS_MIN = 0;
constexpr int BRIGHTNESS_MAX = 100;

} // namespace bulbnet::protocol

namespace bulbnet {

struct BulbCommand {
    std::string name;
    std::optional<nlohmann::json> params;
    std::string id;   // empty = let the client assign one

    std::string encode() const;

    /// Parse a request datagram. Returns false (leaving *this untouched) on malformed input.
    bool decode(std::string_view payload);

    static BulbCommand setPower(bool on);
    static BulbCommand setBrightness(int brightness);
    static BulbCommand setColor(const RgbColor& color);
    static BulbCommand getStatus();
    static BulbCommand ping();
};

} // namespace bulbnet
