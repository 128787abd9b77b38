#include "hs602/net/NetService.hpp"
#include "hs602/log/Log.hpp"

namespace hs602::net {

namespace {
NetService& static_service() {
    static NetService service;
    return service;
}
} // namespace

NetService::NetService()
: io_(std::make_shared<asio::io_context>())
, work_guard_(asio::make_work_guard(*io_))
, t_([this]{
    // A throwing handler must not take the whole loop (and every pending
    // deadline) down with it.
    for (;;) {
        try {
            io_->run();
            break;
        } catch (const std::exception& e) {
            logError("[NetService] handler threw: ", e.what(), "\n");
        }
    }
})
{
    logDebug("[NetService] I/O thread started\n");
}

NetService::~NetService() {
    work_guard_.reset();
    io_->stop();
    if (t_.joinable()) t_.join();
}

NetService& ensureNetService() {
    return static_service();
}

std::shared_ptr<asio::io_context> shared_io_context() {
    return static_service().io();
}

asio::io_context& io_context() {
    return *static_service().io();
}

} // namespace hs602::net
