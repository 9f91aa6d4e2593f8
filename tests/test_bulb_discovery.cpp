#include "bulbnet/discovery/BulbDiscovery.hpp"
#include "bulbnet/discovery/LocalNetwork.hpp"
#include "bulbnet/core/Error.hpp"
#include "bulbnet/log/Log.hpp"

#include "DummyBulbServer.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace bulbnet;
using namespace std::chrono_literals;
using bulbtest::DummyBulbServer;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { bulbnet::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { bulbnet::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", _va, " != ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

namespace {

BulbAddress loopbackAddress(const DummyBulbServer& server) {
    return BulbAddress{"127.0.0.1", server.port()};
}

std::atomic<int> g_closeCalls{0};

class CountingClient : public BulbClient {
public:
    using BulbClient::BulbClient;

    expected<void> close() override {
        g_closeCalls.fetch_add(1);
        return BulbClient::close();
    }
};

/// Closes like any client, then reports a transport failure.
class FailingCloseClient : public BulbClient {
public:
    using BulbClient::BulbClient;

    expected<void> close() override {
        g_closeCalls.fetch_add(1);
        if (auto closed = BulbClient::close(); !closed) {
            return closed;
        }
        return unexpected(make_error_code(Errc::TransportFailure));
    }
};

void testDiscoverCandidates() {
    DummyBulbServer lamp;
    DummyBulbServer strip;
    DummyBulbServer mute(DummyBulbServer::Mode::Silent);
    DummyBulbServer gone;
    gone.stop();

    lamp.setIdentity({{"mac", "AA:BB:CC:DD:EE:01"}, {"model", "LX-100"}, {"firmware", "1.4.2"}});

    BulbDiscovery discovery;
    discovery.setMaxConcurrentProbes(2);
    ASSERT_EQ(discovery.maxConcurrentProbes(), std::size_t{2}, "probe width applied");

    const std::vector<BulbAddress> candidates = {
        loopbackAddress(mute), loopbackAddress(lamp), loopbackAddress(gone), loopbackAddress(strip)
    };
    const auto found = discovery.discover(candidates, 2000ms);

    ASSERT_EQ(found.size(), std::size_t{2}, "only responding candidates are reported");
    for (std::size_t i = 1; i < found.size(); ++i) {
        ASSERT_TRUE(found[i - 1].responseTime <= found[i].responseTime, "sorted by response time");
    }

    bool sawLamp = false;
    bool sawStrip = false;
    for (const auto& bulb : found) {
        if (bulb.address == loopbackAddress(lamp)) {
            sawLamp = true;
            ASSERT_EQ(bulb.macAddress.value_or(""), std::string("AA:BB:CC:DD:EE:01"), "mac from status");
            ASSERT_EQ(bulb.model.value_or(""), std::string("LX-100"), "model from status");
            ASSERT_EQ(bulb.firmwareVersion.value_or(""), std::string("1.4.2"), "firmware from status");
        } else if (bulb.address == loopbackAddress(strip)) {
            sawStrip = true;
            ASSERT_TRUE(!bulb.macAddress && !bulb.model && !bulb.firmwareVersion,
                        "identity fields absent when the bulb omits them");
        }
    }
    ASSERT_TRUE(sawLamp && sawStrip, "both responding bulbs found");
    ASSERT_EQ(discovery.size(), std::size_t{0}, "discovery does not register probe clients");
    ASSERT_EQ(mute.commandCount("ping"), 1, "silent candidate probed once");

    ASSERT_TRUE(discovery.discover({}, 1000ms).empty(), "empty candidate list yields nothing");
}

void testScanStaysWithinBudget() {
    std::vector<std::unique_ptr<DummyBulbServer>> mutes;
    for (int i = 0; i < 4; ++i) {
        mutes.push_back(std::make_unique<DummyBulbServer>(DummyBulbServer::Mode::Silent));
    }
    std::vector<BulbAddress> candidates;
    for (int i = 0; i < 40; ++i) {
        candidates.push_back(loopbackAddress(*mutes[i % mutes.size()]));
    }

    BulbDiscovery discovery;
    discovery.setMaxConcurrentProbes(2);

    const auto budget = 1000ms;
    const auto started = std::chrono::steady_clock::now();
    const auto found = discovery.discover(candidates, budget);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(found.empty(), "silent candidates are not discovered");
    ASSERT_TRUE(elapsed < budget + 500ms, "scan of silent candidates respects its timeout");

    int pinged = 0;
    for (const auto& mute : mutes) {
        pinged += mute->commandCount("ping");
    }
    ASSERT_TRUE(pinged >= 20, "narrow width still reaches most candidates within the budget");
}

void testSubnetCandidates() {
    const auto local = net::asio::ip::make_address_v4("192.168.7.42");
    const auto candidates = discovery::subnetCandidates(local, discovery::PortRange{4000, 4001});

    ASSERT_EQ(candidates.size(), std::size_t{508}, "254 hosts x 2 ports");
    ASSERT_TRUE(candidates.front() == (BulbAddress{"192.168.7.1", 4000}), "first candidate");
    ASSERT_TRUE(candidates[1] == (BulbAddress{"192.168.7.1", 4001}), "ports vary fastest");
    ASSERT_TRUE(candidates.back() == (BulbAddress{"192.168.7.254", 4001}), "last candidate");

    ASSERT_TRUE(discovery::subnetCandidates(local, discovery::PortRange{4010, 4000}).empty(),
                "inverted port range yields nothing");

    BulbDiscovery scanner;
    auto invalid = scanner.discover(1000ms, discovery::PortRange{0, 10});
    ASSERT_TRUE(!invalid && invalid.error() == make_error_code(Errc::CallerError),
                "invalid port range rejected");
}

void testRegistry() {
    DummyBulbServer lamp;
    DummyBulbServer mute(DummyBulbServer::Mode::Silent);

    BulbDiscovery discovery;
    const auto address = loopbackAddress(lamp);

    auto first = discovery.connectToBulb(BulbConfig(address, 500ms));
    ASSERT_TRUE(first.has_value(), "connect registers bulb");
    auto second = discovery.connectToBulb(BulbConfig(address, 500ms));
    ASSERT_TRUE(second.has_value(), "second connect succeeds");
    ASSERT_TRUE(first && second && *first == *second, "second connect returns the same client");
    ASSERT_EQ(lamp.commandCount("ping"), 1, "second connect reuses the live connection");

    ASSERT_TRUE(discovery.isConnected(address), "address registered");
    ASSERT_TRUE(first && discovery.get(address) == *first, "get returns the registered client");
    ASSERT_EQ(discovery.getAll().size(), std::size_t{1}, "one registry entry");

    auto failed = discovery.connectToBulb(BulbConfig(loopbackAddress(mute), 200ms));
    ASSERT_TRUE(!failed && failed.error() == make_error_code(Errc::Timeout), "connect failure returned");
    ASSERT_TRUE(!discovery.isConnected(loopbackAddress(mute)), "failed connect not registered");
    ASSERT_TRUE(discovery.get(loopbackAddress(mute)) == nullptr, "failed connect not retrievable");
    ASSERT_EQ(discovery.size(), std::size_t{1}, "registry unchanged by failure");

    ASSERT_TRUE(discovery.disconnect(address), "disconnect removes entry");
    ASSERT_TRUE(!discovery.disconnect(address), "second disconnect finds nothing");
    ASSERT_TRUE(discovery.get(address) == nullptr, "entry gone after disconnect");

    auto again = discovery.connectToBulb(BulbConfig(address, 500ms));
    ASSERT_TRUE(again.has_value(), "reconnect after disconnect");
    ASSERT_EQ(lamp.commandCount("ping"), 2, "reconnect pings again");
}

void testCloseAllReportsFailures() {
    DummyBulbServer lamp;
    DummyBulbServer strip;
    const auto failing = loopbackAddress(strip);

    g_closeCalls.store(0);
    BulbDiscovery discovery([failing](const BulbConfig& config) -> std::unique_ptr<BulbClient> {
        if (config.address == failing) {
            return std::make_unique<FailingCloseClient>(config);
        }
        return std::make_unique<CountingClient>(config);
    });

    ASSERT_TRUE(discovery.connectToBulb(BulbConfig(loopbackAddress(lamp), 500ms)).has_value(), "connect lamp");
    ASSERT_TRUE(discovery.connectToBulb(BulbConfig(failing, 500ms)).has_value(), "connect strip");
    ASSERT_EQ(discovery.size(), std::size_t{2}, "two bulbs registered");

    const auto failures = discovery.closeAll();
    ASSERT_EQ(failures.size(), std::size_t{1}, "one close failure reported");
    ASSERT_TRUE(!failures.empty() && failures.front().first == failing, "failure names the bulb");
    ASSERT_TRUE(!failures.empty() &&
                failures.front().second == make_error_code(Errc::TransportFailure),
                "failure carries the close error");
    ASSERT_EQ(g_closeCalls.load(), 2, "every client closed despite the failure");
    ASSERT_EQ(discovery.size(), std::size_t{0}, "registry empty after closeAll");
    ASSERT_TRUE(discovery.closeAll().empty(), "closeAll on empty registry");
}

void testAllStatuses() {
    DummyBulbServer lamp;
    DummyBulbServer strip;

    BulbDiscovery discovery;
    ASSERT_TRUE(discovery.getAllStatuses().empty(), "no statuses without bulbs");
    ASSERT_TRUE(discovery.connectToBulb(BulbConfig(loopbackAddress(lamp), 300ms)).has_value(), "connect lamp");
    ASSERT_TRUE(discovery.connectToBulb(BulbConfig(loopbackAddress(strip), 300ms)).has_value(), "connect strip");

    strip.ignoreCommand("get_status");
    const auto reports = discovery.getAllStatuses();
    ASSERT_EQ(reports.size(), std::size_t{2}, "unreachable bulb still reported");

    for (const auto& report : reports) {
        if (report.address == loopbackAddress(lamp)) {
            ASSERT_TRUE(report.status.reachable, "lamp reachable");
            ASSERT_EQ(report.status.brightness, 50, "lamp status fetched");
            ASSERT_TRUE(!report.error, "no error for lamp");
        } else {
            ASSERT_TRUE(!report.status.reachable, "strip unreachable");
            ASSERT_EQ(report.error.value_or(""), std::string("status unavailable"), "strip error text");
        }
    }
}

} // namespace

int main() {
    testDiscoverCandidates();
    testScanStaysWithinBudget();
    testSubnetCandidates();
    testRegistry();
    testCloseAllReportsFailures();
    testAllStatuses();

    if (g_failures) {
        bulbnet::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    bulbnet::logInfo("Discovery tests passed.\n");
    return 0;
}
