#pragma once

#include "bulbnet/core/Expected.hpp"
#include "bulbnet/net/TimeoutConfig.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

namespace bulbnet {

namespace config {

// Networking ------------------------------------------------------------------
constexpr unsigned short BULB_PORT_DEFAULT = 4000;
constexpr const char* BULB_HOST_DEFAULT = "192.168.1.45";

// Discovery -------------------------------------------------------------------
constexpr unsigned short DISCOVERY_PORT_FIRST = 4000;
constexpr unsigned short DISCOVERY_PORT_LAST = 4010;
constexpr std::chrono::milliseconds DISCOVERY_TIMEOUT_DEFAULT{5000};
constexpr int DISCOVERY_PROBE_TIMEOUT_DIVISOR = 10;   // probe timeout = scan timeout / 10
constexpr std::size_t DISCOVERY_MAX_CONCURRENT_PROBES = 256;
constexpr const char* DISCOVERY_ROUTE_PROBE_HOST = "8.8.8.8";
constexpr unsigned short DISCOVERY_ROUTE_PROBE_PORT = 80;

// Client ----------------------------------------------------------------------
constexpr std::chrono::milliseconds CLOSE_TIMEOUT{1000};
constexpr std::size_t CORRELATION_ID_LENGTH = 8;

} // namespace config

/**
 * @brief Network identity of a bulb. Registry key and dedup key.
 */
struct BulbAddress {
    std::string host;
    unsigned short port = config::BULB_PORT_DEFAULT;

    std::string toString() const { return host + ":" + std::to_string(port); }

    friend bool operator==(const BulbAddress& a, const BulbAddress& b) {
        return a.port == b.port && a.host == b.host;
    }
    friend bool operator!=(const BulbAddress& a, const BulbAddress& b) { return !(a == b); }
    friend bool operator<(const BulbAddress& a, const BulbAddress& b) {
        return std::tie(a.host, a.port) < std::tie(b.host, b.port);
    }
};

/// Parse "host:port". A missing port falls back to BULB_PORT_DEFAULT.
expected<BulbAddress> parseAddress(std::string_view text);

/// Parse a whole decimal int. Trailing text or a value outside int is Errc::CallerError.
expected<int> parseInt(std::string_view text);

/**
 * @brief Everything a client needs: where the bulb lives and how long to wait
 * for each reply.
 */
struct BulbConfig {
    BulbAddress address;
    std::chrono::milliseconds timeout = net::TimeoutConfig::defaultTimeout();

    BulbConfig() = default;
    explicit BulbConfig(BulbAddress addr,
                        std::chrono::milliseconds replyTimeout = net::TimeoutConfig::defaultTimeout())
    : address(std::move(addr))
    , timeout(net::TimeoutConfig::sanitize(replyTimeout)) {}

    BulbConfig(std::string host, unsigned short port,
               std::chrono::milliseconds replyTimeout = net::TimeoutConfig::defaultTimeout())
    : BulbConfig(BulbAddress{std::move(host), port}, replyTimeout) {}
};

} // namespace bulbnet
