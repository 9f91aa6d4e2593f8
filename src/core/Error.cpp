#include "bulbnet/core/Error.hpp"

#include "bulbnet/net/NetConfig.hpp"

namespace bulbnet {

namespace {

class BulbnetCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "bulbnet"; }

    std::string message(int value) const override {
        switch (static_cast<Errc>(value)) {
            case Errc::CallerError:      return "invalid argument";
            case Errc::NotConnected:     return "not connected to bulb";
            case Errc::Timeout:          return "command timeout";
            case Errc::TransportFailure: return "transport failure";
            case Errc::Cancelled:        return "command cancelled";
            case Errc::ProtocolError:    return "protocol error";
            case Errc::DeviceError:      return "bulb rejected command";
        }
        return "unknown bulbnet error";
    }
};

} // namespace

const std::error_category& bulbnet_category() noexcept {
    static const BulbnetCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), bulbnet_category()};
}

std::error_code classify_transport_error(const std::error_code& ec) noexcept {
    if (!ec) {
        return {};
    }
    if (ec.category() == bulbnet_category()) {
        return ec;
    }
    if (ec == net::asio::error::timed_out) {
        return make_error_code(Errc::Timeout);
    }
    if (ec == net::asio::error::operation_aborted) {
        return make_error_code(Errc::Cancelled);
    }
    return make_error_code(Errc::TransportFailure);
}

} // namespace bulbnet
