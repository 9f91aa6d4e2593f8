/**
 * @brief Implements the bulb correlation client: lifecycle, pending table,
 * receive loop dispatch and the device-level operations.
 */
#include "bulbnet/bulb/BulbClient.hpp"

#include "bulbnet/core/Error.hpp"
#include "bulbnet/log/Log.hpp"
#include "bulbnet/net/Resolve.hpp"

#include <chrono>
#include <utility>

namespace bulbnet {

using namespace std::chrono_literals;

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Closed:       return "closed";
    }
    return "unknown";
}

BulbClient::BulbClient(BulbConfig config, std::shared_ptr<net::asio::io_context> io)
: config_(std::move(config))
, io_(std::move(io))
, socket_(*io_)
, idEngine_(std::random_device{}())
{}

BulbClient::~BulbClient() {
    // Never dispatch to an override from the destructor.
    if (auto result = shutdown(); !result) {
        logError("[BulbClient] close during destruction failed: ",
                 result.error().message(), "\n");
    }
}

expected<void> BulbClient::connect() {
    std::lock_guard lock(connectMutex_);

    auto current = state_.load();
    if (current == ConnectionState::Connected) {
        return {};
    }
    if (current == ConnectionState::Closed ||
        !state_.compare_exchange_strong(current, ConnectionState::Connecting)) {
        return unexpected(make_error_code(Errc::NotConnected));
    }

    const auto& addr = config_.address;
    if (auto ec = net::resolve(*io_, addr.host, addr.port, remote_); ec) {
        logError("[BulbClient] cannot resolve ", addr.toString(), ": ", ec.message(), "\n");
        leaveConnecting(ConnectionState::Disconnected);
        setReachable(false);
        return unexpected(make_error_code(Errc::ProtocolError));
    }

    if (auto ec = socket_.open_v4(); ec) {
        logError("[BulbClient] failed to open socket for ", addr.toString(), ": ",
                 ec.message(), "\n");
        leaveConnecting(ConnectionState::Disconnected);
        setReachable(false);
        return unexpected(make_error_code(Errc::TransportFailure));
    }

    socket_.start_receive(
        [this](const std::error_code& ec, std::string_view payload, const net::udp::endpoint&) {
            handleDatagram(ec, payload);
        });

    auto reply = transact(BulbCommand::ping());
    if (!reply.success) {
        logError("[BulbClient] failed to connect to bulb at ", addr.toString(), ": ",
                 reply.error.value_or(reply.code.message()), "\n");
        if (auto ec = socket_.close(config::CLOSE_TIMEOUT); ec) {
            logError("[BulbClient] socket close after failed connect: ", ec.message(), "\n");
        }
        leaveConnecting(ConnectionState::Disconnected);
        setReachable(false);
        return unexpected(reply.code ? reply.code : make_error_code(Errc::DeviceError));
    }

    if (!leaveConnecting(ConnectionState::Connected)) {
        // close() ran while the ping was in flight.
        return unexpected(make_error_code(Errc::Cancelled));
    }
    setReachable(true);
    logInfo("[BulbClient] connected to bulb at ", addr.toString(), "\n");
    return {};
}

expected<void> BulbClient::close() {
    return shutdown();
}

expected<void> BulbClient::shutdown() {
    const auto previous = state_.exchange(ConnectionState::Closed);
    cancelPending();

    const auto ec = socket_.close(config::CLOSE_TIMEOUT);
    if (previous != ConnectionState::Closed) {
        logInfo("[BulbClient] closed connection to bulb at ", config_.address.toString(), "\n");
    }
    if (ec) {
        logError("[BulbClient] error closing socket for ", config_.address.toString(), ": ",
                 ec.message(), "\n");
        return unexpected(make_error_code(Errc::TransportFailure));
    }
    return {};
}

bool BulbClient::leaveConnecting(ConnectionState next) {
    auto expectedState = ConnectionState::Connecting;
    return state_.compare_exchange_strong(expectedState, next);
}

BulbResponse BulbClient::sendCommand(BulbCommand command) {
    if (state_.load() != ConnectionState::Connected) {
        return BulbResponse::failure(std::move(command.id),
                                     make_error_code(Errc::NotConnected),
                                     "Not connected to bulb");
    }
    return transact(std::move(command));
}

BulbResponse BulbClient::transact(BulbCommand command) {
    if (command.name.empty()) {
        return BulbResponse::failure(std::move(command.id),
                                     make_error_code(Errc::CallerError),
                                     "Command name must not be empty");
    }

    auto call = std::make_shared<PendingCall>();
    auto reply = call->get_future();
    {
        std::lock_guard lock(pendingMutex_);
        // Checked under the lock so close() either sees this entry or we see Closed.
        if (state_.load() == ConnectionState::Closed) {
            return BulbResponse::failure(std::move(command.id),
                                         make_error_code(Errc::Cancelled),
                                         "Client closed");
        }
        if (command.id.empty()) {
            command.id = generateIdLocked();
        } else if (pending_.count(command.id) != 0) {
            return BulbResponse::failure(std::move(command.id),
                                         make_error_code(Errc::CallerError),
                                         "Correlation id already in flight");
        }
        // Registered before sending so a fast reply always finds its entry.
        pending_.emplace(command.id, call);
    }

    const auto deadline = std::chrono::steady_clock::now() + config_.timeout;
    const std::string payload = command.encode();

    if (auto ec = socket_.send_to(payload.data(), payload.size(), remote_, config_.timeout); ec) {
        if (takePending(command.id)) {
            logError("[BulbClient] failed to send command ", command.name, " to ",
                     config_.address.toString(), ": ", ec.message(), "\n");
            return BulbResponse::failure(std::move(command.id), classify_transport_error(ec),
                                         ec.message());
        }
        // Resolved elsewhere (reply or close) while the send was failing.
        return reply.get();
    }

    if (reply.wait_until(deadline) == std::future_status::ready) {
        return reply.get();
    }

    if (takePending(command.id)) {
        logError("[BulbClient] command ", command.name, " (", command.id, ") to ",
                 config_.address.toString(), " timed out after ",
                 config_.timeout.count(), "ms\n");
        return BulbResponse::failure(std::move(command.id), make_error_code(Errc::Timeout),
                                     "Command timeout");
    }
    // Lost the race: the entry was resolved just as the deadline hit.
    return reply.get();
}

void BulbClient::handleDatagram(const std::error_code& ec, std::string_view payload) {
    if (ec) {
        logError("[BulbClient] receive loop for ", config_.address.toString(),
                 " stopped: ", ec.message(), "\n");
        return;
    }

    BulbResponse response;
    if (!response.decode(payload)) {
        return;
    }

    auto call = takePending(response.id);
    if (!call) {
        return;
    }
    call->set_value(std::move(response));
}

std::shared_ptr<BulbClient::PendingCall> BulbClient::takePending(const std::string& id) {
    std::lock_guard lock(pendingMutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return nullptr;
    }
    auto call = std::move(it->second);
    pending_.erase(it);
    return call;
}

void BulbClient::cancelPending() {
    std::unordered_map<std::string, std::shared_ptr<PendingCall>> cancelled;
    {
        std::lock_guard lock(pendingMutex_);
        cancelled.swap(pending_);
    }
    for (auto& [id, call] : cancelled) {
        call->set_value(BulbResponse::failure(id, make_error_code(Errc::Cancelled),
                                              "Client closed"));
    }
}

std::string BulbClient::generateIdLocked() {
    static constexpr char digits[] = "0123456789abcdef";
    std::uniform_int_distribution<int> nibble(0, 15);
    std::string id;
    do {
        id.assign(config::CORRELATION_ID_LENGTH, '0');
        for (auto& c : id) {
            c = digits[nibble(idEngine_)];
        }
    } while (pending_.count(id) != 0);
    return id;
}

std::size_t BulbClient::pendingCount() const {
    std::lock_guard lock(pendingMutex_);
    return pending_.size();
}

expected<void> BulbClient::runMutation(BulbCommand command,
                                       const std::function<void(BulbState&)>& apply,
                                       std::string_view description) {
    const auto response = sendCommand(std::move(command));
    if (!response.success) {
        return unexpected(response.code ? response.code : make_error_code(Errc::DeviceError));
    }
    {
        std::lock_guard lock(stateMutex_);
        apply(lastStatus_);
    }
    logInfo("[BulbClient] ", description, " on bulb at ", config_.address.toString(), "\n");
    return {};
}

expected<void> BulbClient::turnOn() {
    return runMutation(BulbCommand::setPower(true),
                       [](BulbState& s) { s.power = true; },
                       "turned on");
}

expected<void> BulbClient::turnOff() {
    return runMutation(BulbCommand::setPower(false),
                       [](BulbState& s) { s.power = false; },
                       "turned off");
}

expected<void> BulbClient::setBrightness(int brightness) {
    if (brightness < protocol::BRIGHTNESS_MIN || brightness > protocol::BRIGHTNESS_MAX) {
        return unexpected(make_error_code(Errc::CallerError));
    }
    return runMutation(BulbCommand::setBrightness(brightness),
                       [brightness](BulbState& s) { s.brightness = brightness; },
                       "set brightness to " + std::to_string(brightness) + "%");
}

expected<void> BulbClient::setColor(const RgbColor& color) {
    return runMutation(BulbCommand::setColor(color),
                       [color](BulbState& s) { s.color = color; },
                       "set color to " + toHex(color));
}

expected<void> BulbClient::setColorRgb(int r, int g, int b) {
    auto color = makeRgb(r, g, b);
    if (!color) {
        return unexpected(color.error());
    }
    return setColor(*color);
}

expected<void> BulbClient::setColorHex(std::string_view hex) {
    auto color = parseHexColor(hex);
    if (!color) {
        return unexpected(color.error());
    }
    return setColor(*color);
}

BulbState BulbClient::getStatus() {
    const auto response = sendCommand(BulbCommand::getStatus());

    std::lock_guard lock(stateMutex_);
    if (response.success) {
        if (response.data) {
            lastStatus_.merge(*response.data);
        }
        lastStatus_.reachable = true;
    } else {
        lastStatus_.reachable = false;
    }
    return lastStatus_;
}

bool BulbClient::ping() {
    const auto response = sendCommand(BulbCommand::ping());
    if (response.success) {
        setReachable(true);
    }
    return response.success;
}

BulbState BulbClient::lastStatus() const {
    std::lock_guard lock(stateMutex_);
    return lastStatus_;
}

void BulbClient::setReachable(bool reachable) {
    std::lock_guard lock(stateMutex_);
    lastStatus_.reachable = reachable;
}

} // namespace bulbnet
