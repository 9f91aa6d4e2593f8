#include "bulbnet/discovery/BulbDiscovery.hpp"

#include "bulbnet/core/Error.hpp"
#include "bulbnet/log/Log.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>

namespace bulbnet {

namespace {

std::unique_ptr<BulbClient> makeDefaultClient(const BulbConfig& config) {
    return std::make_unique<BulbClient>(config);
}

std::optional<std::string> stringField(const nlohmann::json& data, const char* key) {
    const auto it = data.find(key);
    if (it == data.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

BulbDiscovery::BulbDiscovery()
: BulbDiscovery(makeDefaultClient) {}

BulbDiscovery::BulbDiscovery(ClientFactory factory)
: factory_(factory ? std::move(factory) : ClientFactory(makeDefaultClient)) {}

BulbDiscovery::~BulbDiscovery() {
    closeAll();
}

void BulbDiscovery::setMaxConcurrentProbes(std::size_t width) {
    maxConcurrentProbes_ = std::max<std::size_t>(width, 1);
}

expected<std::vector<DiscoveredBulb>>
BulbDiscovery::discover(std::chrono::milliseconds timeout, discovery::PortRange ports) {
    if (!ports.valid()) {
        return unexpected(make_error_code(Errc::CallerError));
    }

    auto local = discovery::localIPv4Address();
    if (!local) {
        return unexpected(local.error());
    }

    auto bytes = local->to_bytes();
    logInfo("[BulbDiscovery] scanning ", int(bytes[0]), ".", int(bytes[1]), ".", int(bytes[2]),
            ".1-254 ports ", ports.first, "-", ports.last, " for smart bulbs\n");

    return discover(discovery::subnetCandidates(*local, ports), timeout);
}

std::vector<DiscoveredBulb>
BulbDiscovery::discover(const std::vector<BulbAddress>& candidates,
                        std::chrono::milliseconds timeout) {
    std::vector<DiscoveredBulb> discovered;
    if (candidates.empty()) {
        return discovered;
    }

    const auto probeTimeout = std::max(std::chrono::milliseconds{1},
                                       timeout / config::DISCOVERY_PROBE_TIMEOUT_DIVISOR);
    const auto budgetEnd = std::chrono::steady_clock::now() + timeout;

    // One slot per candidate; each worker writes only the slots it claimed.
    std::vector<std::optional<DiscoveredBulb>> outcomes(candidates.size());
    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> faults{0};
    std::atomic<std::size_t> skipped{0};

    auto worker = [&] {
        for (;;) {
            const auto index = next.fetch_add(1);
            if (index >= candidates.size()) {
                return;
            }
            // No probe may outlive the scan budget.
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                budgetEnd - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                skipped.fetch_add(1);
                continue;
            }
            try {
                outcomes[index] = probe(candidates[index], std::min(probeTimeout, remaining));
            } catch (const std::exception& e) {
                faults.fetch_add(1);
                logError("[BulbDiscovery] probe of ", candidates[index].toString(),
                         " raised: ", e.what(), "\n");
            }
        }
    };

    // Wide enough that every candidate gets a probe slot within the budget
    // (at most DISCOVERY_PROBE_TIMEOUT_DIVISOR waves), capped by the candidate count.
    const auto budgetWidth = (candidates.size() + config::DISCOVERY_PROBE_TIMEOUT_DIVISOR - 1)
                           / config::DISCOVERY_PROBE_TIMEOUT_DIVISOR;
    const auto width = std::min(std::max(maxConcurrentProbes_, budgetWidth), candidates.size());
    std::vector<std::thread> pool;
    pool.reserve(width);
    for (std::size_t i = 0; i < width; ++i) {
        try {
            pool.emplace_back(worker);
        } catch (const std::system_error& e) {
            // Narrower pool; the workers already running drain the queue.
            logError("[BulbDiscovery] could only start ", pool.size(), " probe workers: ",
                     e.what(), "\n");
            break;
        }
    }
    if (pool.empty()) {
        worker();
    }
    for (auto& t : pool) {
        t.join();
    }

    for (auto& outcome : outcomes) {
        if (outcome) {
            logInfo("[BulbDiscovery] discovered bulb at ", outcome->address.toString(), "\n");
            discovered.push_back(std::move(*outcome));
        }
    }
    std::stable_sort(discovered.begin(), discovered.end(),
        [](const DiscoveredBulb& a, const DiscoveredBulb& b) {
            return a.responseTime < b.responseTime;
        });

    logInfo("[BulbDiscovery] discovery completed: ", discovered.size(), " bulb(s) out of ",
            candidates.size(), " candidate(s)",
            faults.load() ? " with probe faults" : "", "\n");
    if (skipped.load()) {
        logError("[BulbDiscovery] scan budget of ", timeout.count(), "ms spent; ",
                 skipped.load(), " candidate(s) not probed\n");
    }
    return discovered;
}

std::optional<DiscoveredBulb>
BulbDiscovery::probe(const BulbAddress& candidate, std::chrono::milliseconds probeTimeout) {
    auto client = factory_(BulbConfig(candidate, probeTimeout));
    if (!client) {
        return std::nullopt;
    }

    const auto started = std::chrono::steady_clock::now();
    const auto connected = client->connect();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    std::optional<DiscoveredBulb> found;
    if (connected) {
        found = DiscoveredBulb{candidate, std::nullopt, std::nullopt, std::nullopt, elapsed};

        // Identity fields are optional extras; a failed status fetch keeps the hit.
        const auto reply = client->sendCommand(BulbCommand::getStatus());
        if (reply.success && reply.data) {
            found->macAddress = stringField(*reply.data, "mac");
            found->model = stringField(*reply.data, "model");
            found->firmwareVersion = stringField(*reply.data, "firmware");
        }
    }

    if (auto closed = client->close(); !closed) {
        logError("[BulbDiscovery] probe client for ", candidate.toString(),
                 " failed to close: ", closed.error().message(), "\n");
    }
    return found;
}

expected<BulbClient*> BulbDiscovery::connectToBulb(const BulbAddress& address) {
    return connectToBulb(BulbConfig(address));
}

expected<BulbClient*> BulbDiscovery::connectToBulb(const BulbConfig& config) {
    std::lock_guard connectLock(connectMutex_);
    const auto& address = config.address;

    {
        std::lock_guard lock(registryMutex_);
        auto it = clients_.find(address);
        if (it != clients_.end() && it->second->state() != ConnectionState::Closed) {
            logInfo("[BulbDiscovery] already connected to bulb at ", address.toString(), "\n");
            return it->second.get();
        }
    }

    std::shared_ptr<BulbClient> client = factory_(config);
    if (!client) {
        return unexpected(make_error_code(Errc::TransportFailure));
    }
    if (auto connected = client->connect(); !connected) {
        logError("[BulbDiscovery] failed to connect to bulb at ", address.toString(), ": ",
                 connected.error().message(), "\n");
        return unexpected(connected.error());
    }

    BulbClient* borrowed = client.get();
    std::shared_ptr<BulbClient> replaced;
    {
        std::lock_guard lock(registryMutex_);
        auto& slot = clients_[address];
        replaced = std::move(slot);
        slot = std::move(client);
    }
    logInfo("[BulbDiscovery] successfully connected to bulb at ", address.toString(), "\n");
    return borrowed;
}

BulbClient* BulbDiscovery::get(const BulbAddress& address) const {
    std::lock_guard lock(registryMutex_);
    auto it = clients_.find(address);
    return it == clients_.end() ? nullptr : it->second.get();
}

std::map<BulbAddress, BulbClient*> BulbDiscovery::getAll() const {
    std::map<BulbAddress, BulbClient*> snapshot;
    std::lock_guard lock(registryMutex_);
    for (const auto& [address, client] : clients_) {
        snapshot.emplace(address, client.get());
    }
    return snapshot;
}

bool BulbDiscovery::isConnected(const BulbAddress& address) const {
    std::lock_guard lock(registryMutex_);
    return clients_.count(address) != 0;
}

std::size_t BulbDiscovery::size() const {
    std::lock_guard lock(registryMutex_);
    return clients_.size();
}

bool BulbDiscovery::disconnect(const BulbAddress& address) {
    std::shared_ptr<BulbClient> client;
    {
        std::lock_guard lock(registryMutex_);
        auto it = clients_.find(address);
        if (it == clients_.end()) {
            return false;
        }
        client = std::move(it->second);
        clients_.erase(it);
    }

    if (auto closed = client->close(); !closed) {
        logError("[BulbDiscovery] error closing bulb at ", address.toString(), ": ",
                 closed.error().message(), "\n");
    }
    logInfo("[BulbDiscovery] disconnected from bulb at ", address.toString(), "\n");
    return true;
}

std::vector<BulbDiscovery::CloseFailure> BulbDiscovery::closeAll() {
    std::map<BulbAddress, std::shared_ptr<BulbClient>> closing;
    {
        std::lock_guard lock(registryMutex_);
        closing.swap(clients_);
    }

    std::vector<CloseFailure> failures;
    for (auto& [address, client] : closing) {
        if (auto closed = client->close(); !closed) {
            logError("[BulbDiscovery] error closing bulb connection ", address.toString(), ": ",
                     closed.error().message(), "\n");
            failures.emplace_back(address, closed.error());
        }
    }

    if (!closing.empty()) {
        logInfo("[BulbDiscovery] closed all bulb connections\n");
    }
    return failures;
}

std::vector<BulbStatusReport> BulbDiscovery::getAllStatuses() {
    std::vector<std::pair<BulbAddress, std::shared_ptr<BulbClient>>> entries;
    {
        std::lock_guard lock(registryMutex_);
        entries.assign(clients_.begin(), clients_.end());
    }

    std::vector<BulbStatusReport> reports;
    reports.reserve(entries.size());
    for (auto& [address, client] : entries) {
        BulbStatusReport report{address, client->getStatus(), std::nullopt};
        if (!report.status.reachable) {
            logError("[BulbDiscovery] failed to get status for bulb ", address.toString(), "\n");
            report.error = "status unavailable";
        }
        reports.push_back(std::move(report));
    }
    return reports;
}

} // namespace bulbnet
