#include "bulbnet/bulb/BulbConfig.hpp"
#include "bulbnet/core/Error.hpp"

#include <charconv>

namespace bulbnet {

expected<BulbAddress> parseAddress(std::string_view text) {
    if (text.empty()) {
        return unexpected(make_error_code(Errc::CallerError));
    }

    const auto colon = text.rfind(':');
    if (colon == std::string_view::npos) {
        return BulbAddress{std::string(text), config::BULB_PORT_DEFAULT};
    }

    const auto host = text.substr(0, colon);
    const auto portText = text.substr(colon + 1);
    if (host.empty() || portText.empty()) {
        return unexpected(make_error_code(Errc::CallerError));
    }

    unsigned int port = 0;
    const auto* first = portText.data();
    const auto* last = portText.data() + portText.size();
    auto [ptr, ec] = std::from_chars(first, last, port);
    if (ec != std::errc{} || ptr != last || port == 0 || port > 65535) {
        return unexpected(make_error_code(Errc::CallerError));
    }

    return BulbAddress{std::string(host), static_cast<unsigned short>(port)};
}

expected<int> parseInt(std::string_view text) {
    int value = 0;
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (text.empty() || ec != std::errc{} || ptr != last) {
        return unexpected(make_error_code(Errc::CallerError));
    }
    return value;
}

} // namespace bulbnet
