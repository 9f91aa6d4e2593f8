#pragma once

#include "bulbnet/bulb/BulbConfig.hpp"
#include "bulbnet/core/Expected.hpp"
#include "bulbnet/net/NetConfig.hpp"

#include <vector>

namespace bulbnet::discovery {

/// Inclusive port range scanned on every host.
struct PortRange {
    unsigned short first = config::DISCOVERY_PORT_FIRST;
    unsigned short last = config::DISCOVERY_PORT_LAST;

    bool valid() const { return first != 0 && first <= last; }
};

/**
 * @brief Local IPv4 address of the interface carrying the default route.
 *
 * Determined by asking the kernel which source address it would use to reach
 * a public host; nothing is sent.
 */
expected<net::asio::ip::address_v4> localIPv4Address();

/**
 * @brief Every (host, port) pair of the /24 that contains @p local.
 *
 * Hosts .1 to .254 are produced (network and broadcast addresses skipped),
 * host-major, ports ascending. The local address itself is included.
 */
std::vector<BulbAddress> subnetCandidates(const net::asio::ip::address_v4& local,
                                          const PortRange& ports);

} // namespace bulbnet::discovery
