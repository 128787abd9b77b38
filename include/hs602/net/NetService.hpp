#pragma once
#include "hs602/net/NetConfig.hpp"
#include <thread>
#include <memory>

namespace hs602::net {

/**
 * @brief RAII wrapper around `asio::io_context` that runs a dedicated I/O thread.
 *
 * Every socket completion and every request deadline timer in the library is
 * executed on this one loop. Blocking helpers (`with_deadline`, the
 * dispatcher's `call`) park the calling thread while the loop does the work,
 * so the loop must never be blocked itself.
 *
 * Lifetime notes:
 * - Destroy connections and dispatchers before `NetService` so their handlers
 *   complete while the `io_context` is still running.
 * - The destructor releases the work guard, calls `stop()`, and joins the thread.
 *
 * `shared_io_context()` returns the process-wide instance.
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

    /// True when called from the I/O thread; blocking there would deadlock.
    bool runningInThisThread() const { return std::this_thread::get_id() == t_.get_id(); }

private:
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread t_;
};

NetService& ensureNetService();
std::shared_ptr<asio::io_context> shared_io_context();
asio::io_context& io_context();

} // namespace hs602::net
