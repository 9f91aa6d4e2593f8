#include "bulbnet/discovery/LocalNetwork.hpp"

#include "bulbnet/core/Error.hpp"
#include "bulbnet/log/Log.hpp"
#include "bulbnet/net/UdpSocket.hpp"

namespace bulbnet::discovery {

namespace ip = net::asio::ip;

expected<ip::address_v4> localIPv4Address() {
    net::asio::io_context io;
    std::error_code ec;
    const auto routeProbe = ip::make_address_v4(config::DISCOVERY_ROUTE_PROBE_HOST, ec);
    if (ec) {
        return unexpected(make_error_code(Errc::ProtocolError));
    }

    ip::address_v4 local;
    ec = net::UdpSocket::local_address_for(
        io, net::udp::endpoint(routeProbe, config::DISCOVERY_ROUTE_PROBE_PORT), local);
    if (ec) {
        logError("[LocalNetwork] could not determine local IP address: ", ec.message(), "\n");
        return unexpected(make_error_code(Errc::TransportFailure));
    }
    return local;
}

std::vector<BulbAddress> subnetCandidates(const ip::address_v4& local, const PortRange& ports) {
    std::vector<BulbAddress> candidates;
    if (!ports.valid()) {
        return candidates;
    }

    auto prefix = local.to_bytes();
    const std::size_t portCount = static_cast<std::size_t>(ports.last - ports.first) + 1;
    candidates.reserve(254 * portCount);

    for (int host = 1; host <= 254; ++host) {
        prefix[3] = static_cast<unsigned char>(host);
        const auto hostText = ip::address_v4(prefix).to_string();
        for (unsigned int port = ports.first; port <= ports.last; ++port) {
            candidates.push_back(BulbAddress{hostText, static_cast<unsigned short>(port)});
        }
    }
    return candidates;
}

} // namespace bulbnet::discovery
