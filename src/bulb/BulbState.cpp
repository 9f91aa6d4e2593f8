#include "bulbnet/bulb/BulbState.hpp"
#include "bulbnet/bulb/BulbCommand.hpp"

namespace bulbnet {

using nlohmann::json;

namespace {

bool readInt(const json& object, const char* key, int lo, int hi, int& out) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_number_integer()) {
        return false;
    }
    const auto value = it->get<long long>();
    if (value < lo || value > hi) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

} // namespace

void BulbState::merge(const json& data) {
    if (!data.is_object()) {
        return;
    }

    if (const auto it = data.find("power"); it != data.end() && it->is_boolean()) {
        power = it->get<bool>();
    }

    int level = 0;
    if (readInt(data, "brightness", protocol::BRIGHTNESS_MIN, protocol::BRIGHTNESS_MAX, level)) {
        brightness = level;
    }

    if (const auto it = data.find("color"); it != data.end() && it->is_object()) {
        int r = 0, g = 0, b = 0;
        if (readInt(*it, "r", 0, 255, r) && readInt(*it, "g", 0, 255, g) &&
            readInt(*it, "b", 0, 255, b)) {
            color = RgbColor{static_cast<std::uint8_t>(r),
                             static_cast<std::uint8_t>(g),
                             static_cast<std::uint8_t>(b)};
        }
    }

    if (const auto it = data.find("connected"); it != data.end() && it->is_boolean()) {
        reachable = it->get<bool>();
    }
}

json BulbState::toJson() const {
    return json{
        {"power", power},
        {"brightness", brightness},
        {"color", {{"r", color.r}, {"g", color.g}, {"b", color.b}}},
        {"connected", reachable}
    };
}

} // namespace bulbnet
