#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace bulbnet {

/**
 * @brief Reply to one command, or the synthetic failure the client produced
 * in its place.
 *
 * Wire form: { "success": bool, "data": {...}?, "error": "..."?, "id": "..." }.
 * `code` never travels on the wire: it is empty for a successful reply and
 * holds a bulbnet::Errc for every failure (DeviceError when the bulb itself
 * answered success=false).
 */
struct BulbResponse {
    bool success = false;
    std::optional<nlohmann::json> data;
    std::optional<std::string> error;
    std::string id;
    std::error_code code;

    /// Parse a reply datagram. Returns false (leaving *this untouched) on malformed input.
    bool decode(std::string_view payload);
    std::string encode() const;

    static BulbResponse ok(std::string id, std::optional<nlohmann::json> data = std::nullopt);
    static BulbResponse failure(std::string id, std::error_code code, std::string message = {});
};

} // namespace bulbnet
