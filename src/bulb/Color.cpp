#include "bulbnet/bulb/Color.hpp"
#include "bulbnet/core/Error.hpp"

namespace bulbnet {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool inChannelRange(int value) {
    return value >= 0 && value <= 255;
}

} // namespace

expected<RgbColor> makeRgb(int r, int g, int b) {
    if (!inChannelRange(r) || !inChannelRange(g) || !inChannelRange(b)) {
        return unexpected(make_error_code(Errc::CallerError));
    }
    return RgbColor{static_cast<std::uint8_t>(r),
                    static_cast<std::uint8_t>(g),
                    static_cast<std::uint8_t>(b)};
}

expected<RgbColor> parseHexColor(std::string_view text) {
    if (!text.empty() && text.front() == '#') {
        text.remove_prefix(1);
    }
    if (text.size() != 6) {
        return unexpected(make_error_code(Errc::CallerError));
    }

    std::uint8_t channels[3]{};
    for (std::size_t i = 0; i < 3; ++i) {
        const int hi = hexValue(text[i * 2]);
        const int lo = hexValue(text[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return unexpected(make_error_code(Errc::CallerError));
        }
        channels[i] = static_cast<std::uint8_t>(hi * 16 + lo);
    }
    return RgbColor{channels[0], channels[1], channels[2]};
}

std::string toHex(const RgbColor& color) {
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string out(7, '#');
    const std::uint8_t channels[3] = {color.r, color.g, color.b};
    for (std::size_t i = 0; i < 3; ++i) {
        out[1 + i * 2] = digits[channels[i] >> 4];
        out[2 + i * 2] = digits[channels[i] & 0x0F];
    }
    return out;
}

} // namespace bulbnet
