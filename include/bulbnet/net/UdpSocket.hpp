#pragma once
#include "bulbnet/net/NetConfig.hpp"
#include "bulbnet/net/Deadline.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace bulbnet::net {

/**
 * UdpSocket
 *
 * Datagram endpoint owned by exactly one bulb client.
 *
 * - All socket work runs on a private strand of the shared I/O loop, so the
 *   receive loop, sends and close never touch the socket concurrently.
 * - `send_to` blocks the caller through `with_deadline`.
 * - `start_receive` keeps one `async_receive_from` armed until `close()`;
 *   every datagram is handed to the callback on the strand.
 * - `close()` waits for the receive loop to wind down, so no handler touches
 *   the object after it returns.
 */
class UdpSocket {
public:
    static constexpr std::size_t kMaxDatagram = 2048;

    /// Called on the strand for each datagram, or with an error that ended the loop.
    using ReceiveHandler =
        std::function<void(const error_code&, std::string_view, const udp::endpoint&)>;

    explicit UdpSocket(asio::io_context& io)
    : strand_(asio::make_strand(io))
    , sock_(strand_) {}

    ~UdpSocket() {
        close(std::chrono::milliseconds{1000});
        // A close that timed out still has a strand handler holding `this`.
        std::lock_guard<std::mutex> lock(controlMutex_);
        settle_previous_close(std::chrono::milliseconds{1000});
    }

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    /**
     * @brief Open an IPv4 socket bound to an ephemeral local port.
     *
     * If an earlier close() timed out, its strand work must finish first;
     * `in_progress` is returned if it still has not after a grace period.
     */
    error_code open_v4() {
        std::lock_guard<std::mutex> lock(controlMutex_);
        if (open_) {
            return asio::error::already_open;
        }
        if (!settle_previous_close(kReopenGrace)) {
            return asio::error::in_progress;
        }
        error_code ec;
        sock_.open(udp::v4(), ec);
        if (ec) return ec;
        sock_.bind(udp::endpoint(udp::v4(), 0), ec);
        if (ec) {
            error_code ignore;
            sock_.close(ignore);
            return ec;
        }
        open_ = true;
        return ec;
    }

    bool is_open() const { return open_.load(); }

    // Send one datagram, fail if not sent within timeout.
    error_code send_to(const void* data, std::size_t n,
                       const udp::endpoint& ep, milliseconds timeout) {
        if (!open_) {
            return asio::error::not_connected;
        }
        // The caller may return on timeout before asio is done with the bytes.
        auto payload = std::make_shared<std::vector<char>>(
            static_cast<const char*>(data), static_cast<const char*>(data) + n);
        return with_deadline(timeout,
            [this, payload, ep](auto completion){
                asio::post(strand_, [this, payload, ep, completion]{
                    sock_.async_send_to(asio::buffer(*payload), ep,
                        [payload, completion](const error_code& ec, std::size_t){
                            completion(ec);
                        });
                });
            },
            [this]{
                asio::post(strand_, [this]{
                    error_code ignore;
                    sock_.cancel(ignore);
                });
            });
    }

    /// Arm the background receive loop. Only the first call has any effect.
    void start_receive(ReceiveHandler handler) {
        std::lock_guard<std::mutex> lock(controlMutex_);
        if (!open_ || receiver_) {
            return;
        }
        receiver_ = std::make_shared<Receiver>();
        receiver_->handler = std::move(handler);
        receiverStopped_ = receiver_->stopped.get_future();
        auto rx = receiver_;
        asio::post(strand_, [this, rx]{ arm(rx); });
    }

    /**
     * @brief Cancel outstanding operations, close the socket and wait for the
     * receive loop to exit. Idempotent.
     * @return the close error, or `timed_out` if the I/O loop did not respond.
     */
    error_code close(milliseconds timeout) {
        std::lock_guard<std::mutex> lock(controlMutex_);
        if (!open_.exchange(false)) {
            return {};
        }
        // Detach the current receive loop whatever happens below; a loop
        // that has not stopped yet winds down on its own once the strand runs.
        auto rx = std::move(receiver_);
        auto rxStopped = std::move(receiverStopped_);
        if (rx) {
            rx->cancelled = true;
        }

        auto closed = std::make_shared<std::promise<error_code>>();
        pendingClose_ = closed->get_future().share();
        asio::post(strand_, [this, closed]{
            error_code ec;
            sock_.cancel(ec);
            sock_.close(ec);
            closed->set_value(ec);
        });

        if (pendingClose_.wait_for(timeout) != std::future_status::ready) {
            return asio::error::timed_out;
        }
        auto ec = pendingClose_.get();

        if (rxStopped.valid() && rxStopped.wait_for(timeout) != std::future_status::ready) {
            return asio::error::timed_out;
        }
        return ec;
    }

    /**
     * @brief Ask the routing table which local IPv4 address would be used to
     * reach @p remote. No datagram is sent.
     */
    static error_code local_address_for(asio::io_context& io,
                                        const udp::endpoint& remote,
                                        asio::ip::address_v4& out) {
        error_code ec;
        udp::socket probe(io);
        probe.open(udp::v4(), ec);
        if (ec) return ec;
        probe.connect(remote, ec);
        if (!ec) {
            auto local = probe.local_endpoint(ec);
            if (!ec) {
                out = local.address().to_v4();
            }
        }
        error_code ignore;
        probe.close(ignore);
        return ec;
    }

private:
    static constexpr milliseconds kReopenGrace{1000};

    struct Receiver {
        ReceiveHandler handler;
        std::atomic<bool> cancelled{false};
        std::array<char, kMaxDatagram> buffer{};
        udp::endpoint sender;
        std::promise<void> stopped;
        bool finished = false;

        void finish() {
            if (finished) return;
            finished = true;
            stopped.set_value();
        }
    };

    static bool transient(const error_code& ec) {
        return ec == asio::error::operation_aborted
            || ec == asio::error::connection_refused
            || ec == asio::error::connection_reset
            || ec == asio::error::message_size;
    }

    // Caller holds controlMutex_. True once no earlier close is still queued.
    bool settle_previous_close(milliseconds grace) {
        if (!pendingClose_.valid()) {
            return true;
        }
        if (pendingClose_.wait_for(grace) != std::future_status::ready) {
            return false;
        }
        pendingClose_ = {};
        return true;
    }

    // Runs on the strand only.
    void arm(std::shared_ptr<Receiver> rx) {
        if (rx->cancelled || !sock_.is_open()) {
            rx->finish();
            return;
        }
        sock_.async_receive_from(asio::buffer(rx->buffer), rx->sender,
            [this, rx](const error_code& ec, std::size_t n){
                if (rx->cancelled) {
                    rx->finish();
                    return;
                }
                if (ec) {
                    if (!transient(ec)) {
                        rx->handler(ec, {}, rx->sender);
                        rx->finish();
                        return;
                    }
                    arm(rx);
                    return;
                }
                rx->handler({}, std::string_view(rx->buffer.data(), n), rx->sender);
                arm(rx);
            });
    }

    asio::strand<asio::io_context::executor_type> strand_;
    udp::socket sock_;
    std::mutex controlMutex_;   // open/start/close
    std::atomic<bool> open_{false};
    std::shared_ptr<Receiver> receiver_;
    std::future<void> receiverStopped_;
    std::shared_future<error_code> pendingClose_;   // last close posted to the strand
};

} // namespace bulbnet::net
