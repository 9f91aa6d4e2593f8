#pragma once
#include "bulbnet/net/NetConfig.hpp"
#include <string>

namespace bulbnet::net {

/**
 * resolve
 *
 * Turn a configured bulb host into a UDP endpoint. Dotted quads are parsed
 * directly; anything else goes through a synchronous resolver lookup and the
 * first IPv4 result wins.
 */
inline error_code resolve(
    asio::io_context& io,
    const std::string& host,
    unsigned short port,
    udp::endpoint& out)
{
    error_code ec;
    auto address = asio::ip::make_address(host, ec);
    if (!ec) {
        out = udp::endpoint(address, port);
        return ec;
    }

    ec.clear();
    udp::resolver r(io);
    auto results = r.resolve(udp::v4(), host, std::to_string(port), ec);
    if (ec) {
        return ec;
    }
    if (results.empty()) {
        return asio::error::host_not_found;
    }
    out = results.begin()->endpoint();
    return ec;
}

} // namespace bulbnet::net
