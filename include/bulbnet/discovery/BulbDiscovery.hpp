#pragma once

#include "bulbnet/bulb/BulbClient.hpp"
#include "bulbnet/bulb/BulbConfig.hpp"
#include "bulbnet/bulb/BulbState.hpp"
#include "bulbnet/core/Expected.hpp"
#include "bulbnet/discovery/LocalNetwork.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace bulbnet {

struct DiscoveredBulb {
    BulbAddress address;
    std::optional<std::string> macAddress;
    std::optional<std::string> model;
    std::optional<std::string> firmwareVersion;
    std::chrono::milliseconds responseTime{0};   // measured connect round trip
};

struct BulbStatusReport {
    BulbAddress address;
    BulbState status;
    std::optional<std::string> error;
};

/**
 * @brief Finds bulbs on the local subnet and owns the live connections to them.
 *
 * Discovery:
 * - Every candidate is probed by its own short-lived client whose timeout is
 *   1/10 of the scan timeout. A candidate counts only if that client reaches
 *   Connected. Probe failures never fail the scan.
 * - Probes run on a fixed-width pool of worker threads
 *   (`setMaxConcurrentProbes`). The pool is widened only as far as needed to
 *   fit every candidate into the scan timeout (candidates / 10 workers), and a
 *   probe never runs past the scan deadline.
 *
 * Registry:
 * - Keyed by address, one client per bulb. The registry owns every client;
 *   callers get borrowed pointers that stay valid until `disconnect()` or
 *   `closeAll()` removes the entry.
 * - All registry methods are thread-safe.
 */
class BulbDiscovery {
public:
    using ClientFactory = std::function<std::unique_ptr<BulbClient>(const BulbConfig&)>;
    using CloseFailure = std::pair<BulbAddress, std::error_code>;

    BulbDiscovery();
    explicit BulbDiscovery(ClientFactory factory);
    ~BulbDiscovery();

    BulbDiscovery(const BulbDiscovery&) = delete;
    BulbDiscovery& operator=(const BulbDiscovery&) = delete;

    void setMaxConcurrentProbes(std::size_t width);
    std::size_t maxConcurrentProbes() const { return maxConcurrentProbes_; }

    /**
     * @brief Scan the /24 of the default-route interface.
     *
     * Fails only if the local address cannot be determined. Results are
     * sorted by response time, fastest first. Returns within roughly
     * @p timeout; candidates still unclaimed at the deadline are skipped.
     */
    expected<std::vector<DiscoveredBulb>>
    discover(std::chrono::milliseconds timeout = config::DISCOVERY_TIMEOUT_DEFAULT,
             discovery::PortRange ports = {});

    /// Probe an explicit candidate list. Same semantics as the subnet scan.
    std::vector<DiscoveredBulb>
    discover(const std::vector<BulbAddress>& candidates, std::chrono::milliseconds timeout);

    /**
     * @brief Return the registered client for @p address, connecting and
     * registering a new one if there is none.
     *
     * A connect failure is returned as-is and nothing is registered.
     */
    expected<BulbClient*> connectToBulb(const BulbAddress& address);
    expected<BulbClient*> connectToBulb(const BulbConfig& config);

    BulbClient* get(const BulbAddress& address) const;
    std::map<BulbAddress, BulbClient*> getAll() const;
    bool isConnected(const BulbAddress& address) const;
    std::size_t size() const;

    /// Close and remove one entry. Returns false if there was none.
    bool disconnect(const BulbAddress& address);

    /**
     * @brief Close every client and empty the registry.
     *
     * A client that fails to close is logged and reported; the rest are still
     * closed and the registry always ends empty.
     */
    std::vector<CloseFailure> closeAll();

    /// Status of every registered bulb. Unreachable bulbs are reported, not skipped.
    std::vector<BulbStatusReport> getAllStatuses();

private:
    std::optional<DiscoveredBulb> probe(const BulbAddress& candidate,
                                        std::chrono::milliseconds probeTimeout);

    ClientFactory factory_;
    std::size_t maxConcurrentProbes_ = config::DISCOVERY_MAX_CONCURRENT_PROBES;

    std::mutex connectMutex_;    // serializes connectToBulb
    mutable std::mutex registryMutex_;
    std::map<BulbAddress, std::shared_ptr<BulbClient>> clients_;
};

} // namespace bulbnet
