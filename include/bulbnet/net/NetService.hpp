#pragma once
#include "bulbnet/net/NetConfig.hpp"
#include <atomic>
#include <cstddef>
#include <thread>
#include <memory>

namespace bulbnet::net {

/**
 * @brief RAII wrapper around `asio::io_context` that runs a dedicated I/O thread.
 *
 * Every bulb client posts its socket work to this loop: receive loops, sends
 * and deadline timers all complete here, while callers block on the result
 * from their own threads.
 *
 * Lifetime notes:
 * - Close clients before `NetService` goes away so their handlers complete
 *   while the `io_context` is still running.
 * - The destructor releases the work guard, calls `stop()`, and joins the thread.
 * - Never block inside a completion handler: the loop is single-threaded.
 * - A handler that throws is logged and counted; the loop then resumes.
 */
class NetService {
public:
    NetService();
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;
    NetService(NetService&&) = delete;
    NetService& operator=(NetService&&) = delete;

    std::shared_ptr<asio::io_context> io() { return io_; }

    std::size_t handlerFailures() const { return handlerFailures_.load(); }

private:
    void runLoop();

    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::atomic<std::size_t> handlerFailures_{0};
    std::thread t_;
};

std::shared_ptr<asio::io_context> shared_io_context();

} // namespace bulbnet::net
