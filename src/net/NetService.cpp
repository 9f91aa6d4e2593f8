#include "bulbnet/net/NetService.hpp"
#include "bulbnet/log/Log.hpp"

#include <exception>

namespace bulbnet::net {

namespace {
NetService& static_service() {
    static NetService service;
    return service;
}
} // namespace

NetService::NetService()
: io_(std::make_shared<asio::io_context>())
, work_guard_(asio::make_work_guard(*io_))
, t_([this]{ runLoop(); })
{
    logInfo("[NetService] I/O thread started\n");
}

NetService::~NetService() {
    work_guard_.reset();
    io_->stop();
    if (t_.joinable()) t_.join();
    logInfo("[NetService] I/O thread stopped after ", handlerFailures_.load(), " handler failure(s)\n");
}

void NetService::runLoop() {
    // A throwing completion handler must not take every bulb's receive loop down with it.
    while (!io_->stopped()) {
        try {
            io_->run();
        } catch (const std::exception& e) {
            handlerFailures_.fetch_add(1);
            logError("[NetService] completion handler threw: ", e.what(), "\n");
        }
    }
}

std::shared_ptr<asio::io_context> shared_io_context() {
    return static_service().io();
}

} // namespace bulbnet::net
