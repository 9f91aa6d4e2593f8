#include "bulbnet/bulb/BulbCommand.hpp"

namespace bulbnet {

using nlohmann::json;

std::string BulbCommand::encode() const {
    json message = {
        {"command", name},
        {"id", id}
    };
    if (params && !params->is_null() && !params->empty()) {
        message["params"] = *params;
    }
    return message.dump();
}

bool BulbCommand::decode(std::string_view payload) {
    const json message = json::parse(payload.begin(), payload.end(), nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        return false;
    }

    const auto command = message.find("command");
    const auto identifier = message.find("id");
    if (command == message.end() || !command->is_string() ||
        identifier == message.end() || !identifier->is_string()) {
        return false;
    }

    std::optional<json> decodedParams;
    if (const auto p = message.find("params"); p != message.end() && !p->is_null()) {
        if (!p->is_object()) {
            return false;
        }
        decodedParams = *p;
    }

    name = command->get<std::string>();
    id = identifier->get<std::string>();
    params = std::move(decodedParams);
    return true;
}

BulbCommand BulbCommand::setPower(bool on) {
    return BulbCommand{protocol::CMD_SET_POWER, json{{"power", on}}, {}};
}

BulbCommand BulbCommand::setBrightness(int brightness) {
    return BulbCommand{protocol::CMD_SET_BRIGHTNESS, json{{"brightness", brightness}}, {}};
}

BulbCommand BulbCommand::setColor(const RgbColor& color) {
    json rgb = {{"r", color.r}, {"g", color.g}, {"b", color.b}};
    return BulbCommand{protocol::CMD_SET_COLOR, json{{"color", rgb}}, {}};
}

BulbCommand BulbCommand::getStatus() {
    return BulbCommand{protocol::CMD_GET_STATUS, std::nullopt, {}};
}

BulbCommand BulbCommand::ping() {
    return BulbCommand{protocol::CMD_PING, std::nullopt, {}};
}

} // namespace bulbnet
