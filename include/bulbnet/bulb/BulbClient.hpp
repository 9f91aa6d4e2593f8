#pragma once
#include "bulbnet/core/Expected.hpp"
#include "bulbnet/bulb/BulbCommand.hpp"
#include "bulbnet/bulb/BulbConfig.hpp"
#include "bulbnet/bulb/BulbResponse.hpp"
#include "bulbnet/bulb/BulbState.hpp"
#include "bulbnet/bulb/Color.hpp"
#include "bulbnet/net/NetConfig.hpp"
#include "bulbnet/net/NetService.hpp"
#include "bulbnet/net/UdpSocket.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>

namespace bulbnet {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Closed
};

const char* toString(ConnectionState state);

/**
 * @brief Request/response client for one bulb over UDP.
 *
 * Turns the connectionless datagram channel into blocking calls with
 * per-command correlation ids and timeouts.
 *
 * Lifecycle: Disconnected -> Connecting -> Connected -> Closed.
 * - `connect()` opens the endpoint, starts the receive loop and pings the bulb.
 *   On failure the client drops back to Disconnected and may be retried.
 * - `close()` is terminal from any state. Every in-flight command resolves
 *   with Errc::Cancelled.
 *
 * Threading:
 * - Any number of caller threads may issue commands concurrently. Replies are
 *   matched by correlation id, so out-of-order replies are fine.
 * - The receive loop runs on the shared I/O thread; it and the callers meet
 *   only in the pending table, which is guarded by a mutex.
 * - Never call into a client from a completion handler on the I/O thread.
 *
 * No method throws. Failures come back as `BulbResponse::code` or as the error
 * of an `expected`.
 */
class BulbClient {
public:
    explicit BulbClient(BulbConfig config,
                        std::shared_ptr<net::asio::io_context> io = net::shared_io_context());
    virtual ~BulbClient();

    // non-copyable / non-movable
    BulbClient(const BulbClient&) = delete;
    BulbClient& operator=(const BulbClient&) = delete;
    BulbClient(BulbClient&&) = delete;
    BulbClient& operator=(BulbClient&&) = delete;

    /// Open the endpoint and confirm the bulb answers a ping.
    virtual expected<void> connect();

    /// Cancel pending commands and release the endpoint. Idempotent.
    virtual expected<void> close();

    /**
     * @brief Send one command and wait for its reply or the configured timeout.
     *
     * Assigns a correlation id when `command.id` is empty. A caller-supplied id
     * that is already in flight is rejected with Errc::CallerError. The returned
     * response always carries the command's correlation id.
     */
    BulbResponse sendCommand(BulbCommand command);

    expected<void> turnOn();
    expected<void> turnOff();

    /// Brightness in percent. Values outside 0-100 are rejected without sending.
    expected<void> setBrightness(int brightness);

    expected<void> setColor(const RgbColor& color);
    expected<void> setColorRgb(int r, int g, int b);

    /// "#RRGGBB" or "RRGGBB". Malformed strings are rejected without sending.
    expected<void> setColorHex(std::string_view hex);

    /**
     * @brief Fetch status from the bulb and return the updated snapshot.
     *
     * On failure the cached snapshot is marked unreachable and otherwise left
     * as it was.
     */
    BulbState getStatus();

    bool ping();

    /// Cached snapshot; no network traffic.
    BulbState lastStatus() const;

    const BulbConfig& config() const { return config_; }
    const BulbAddress& address() const { return config_.address; }
    ConnectionState state() const { return state_.load(); }
    bool isConnected() const { return state() == ConnectionState::Connected; }

    /// Number of commands currently awaiting a reply.
    std::size_t pendingCount() const;

private:
    using PendingCall = std::promise<BulbResponse>;

    BulbResponse transact(BulbCommand command);
    expected<void> runMutation(BulbCommand command,
                               const std::function<void(BulbState&)>& apply,
                               std::string_view description);

    void handleDatagram(const std::error_code& ec, std::string_view payload);
    std::shared_ptr<PendingCall> takePending(const std::string& id);
    void cancelPending();
    std::string generateIdLocked();
    void setReachable(bool reachable);
    expected<void> shutdown();
    bool leaveConnecting(ConnectionState next);

    BulbConfig config_;
    std::shared_ptr<net::asio::io_context> io_;
    net::udp::endpoint remote_;
    net::UdpSocket socket_;
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::mutex connectMutex_;

    mutable std::mutex pendingMutex_;
    std::unordered_map<std::string, std::shared_ptr<PendingCall>> pending_;
    std::mt19937 idEngine_;

    mutable std::mutex stateMutex_;
    BulbState lastStatus_{};
};

} // namespace bulbnet
