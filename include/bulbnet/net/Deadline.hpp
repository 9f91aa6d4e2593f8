#pragma once
#include "bulbnet/net/NetConfig.hpp"
#include "bulbnet/log/Log.hpp"

#include <atomic>
#include <future>
#include <memory>

namespace bulbnet::net {

/**
 * @brief Block the calling thread on one async operation for at most @p timeout.
 *
 * `start_async` receives a completion callback taking `const error_code&` and
 * must launch exactly one operation whose handler invokes it. If the deadline
 * passes first, `cancel()` is called, the late completion is discarded and
 * `asio::error::timed_out` is returned.
 *
 * The completion and the waiter race on a shared flag; whichever claims it
 * first decides the result, so a completion arriving just after the deadline
 * is never reported twice.
 *
 * The io_context must be running on another thread. Calling this from a
 * completion handler deadlocks until the timeout.
 */
template<typename StartAsync, typename Cancel>
error_code with_deadline(milliseconds timeout, StartAsync start_async, Cancel cancel) {
    struct Outcome {
        std::promise<error_code> result;
        std::atomic<bool> claimed{false};
    };

    auto outcome = std::make_shared<Outcome>();
    auto settled = outcome->result.get_future();

    start_async([outcome](const error_code& ec) {
        if (!outcome->claimed.exchange(true)) {
            outcome->result.set_value(ec);
        }
    });

    if (settled.wait_for(timeout) == std::future_status::ready) {
        return settled.get();
    }
    if (outcome->claimed.exchange(true)) {
        // Completed between the wait and the claim; the value is on its way.
        return settled.get();
    }

    logError("[with_deadline] operation abandoned after ", timeout.count(), "ms\n");
    cancel();
    return asio::error::timed_out;
}

} // namespace bulbnet::net
