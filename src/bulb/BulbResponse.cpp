#include "bulbnet/bulb/BulbResponse.hpp"
#include "bulbnet/core/Error.hpp"

namespace bulbnet {

using nlohmann::json;

bool BulbResponse::decode(std::string_view payload) {
    const json message = json::parse(payload.begin(), payload.end(), nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        return false;
    }

    const auto successField = message.find("success");
    const auto identifier = message.find("id");
    if (successField == message.end() || !successField->is_boolean() ||
        identifier == message.end() || !identifier->is_string()) {
        return false;
    }

    std::optional<json> decodedData;
    if (const auto d = message.find("data"); d != message.end() && !d->is_null()) {
        if (!d->is_object()) {
            return false;
        }
        decodedData = *d;
    }

    std::optional<std::string> decodedError;
    if (const auto e = message.find("error"); e != message.end() && !e->is_null()) {
        if (!e->is_string()) {
            return false;
        }
        decodedError = e->get<std::string>();
    }

    success = successField->get<bool>();
    id = identifier->get<std::string>();
    data = std::move(decodedData);
    error = std::move(decodedError);
    code = success ? std::error_code{} : make_error_code(Errc::DeviceError);
    return true;
}

std::string BulbResponse::encode() const {
    json message = {
        {"success", success},
        {"id", id}
    };
    if (data) {
        message["data"] = *data;
    }
    if (error) {
        message["error"] = *error;
    }
    return message.dump();
}

BulbResponse BulbResponse::ok(std::string id, std::optional<json> data) {
    BulbResponse response;
    response.success = true;
    response.id = std::move(id);
    response.data = std::move(data);
    return response;
}

BulbResponse BulbResponse::failure(std::string id, std::error_code code, std::string message) {
    BulbResponse response;
    response.success = false;
    response.id = std::move(id);
    response.code = code;
    response.error = message.empty() ? code.message() : std::move(message);
    return response;
}

} // namespace bulbnet
