#pragma once
#include "hs602/net/NetConfig.hpp"
#include "hs602/net/Deadline.hpp"
#include "hs602/net/NetService.hpp"
#include "hs602/log/Log.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>

namespace hs602::net {

/**
 * @brief Thin wrapper around `tcp::socket` with deadlines and low-latency options.
 *
 * - `connect(...)` enforces a per-attempt timeout.
 * - `write_all(...)` blocks the caller while enforcing a deadline. Concurrent
 *   writers must be serialised by the caller.
 * - `read_some(...)` blocks until bytes arrive or the socket is closed; it is
 *   meant for a dedicated reader thread, so it has no deadline of its own.
 * - All socket work runs on a strand of the shared `NetService` loop; `close()`
 *   is marshalled onto that strand so it is safe from any non-I/O thread.
 */
class TcpClient {
public:
    using duration = std::chrono::milliseconds;

    TcpClient()
    : io_(shared_io_context())
    , strand_(asio::make_strand(*io_))
    , socket_(strand_)
    {}

    ~TcpClient() { close(); }

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;

    std::error_code connect(const tcp::endpoint& endpoint, duration timeout) {
        close();
        socket_ = tcp::socket(strand_);
        auto ex = socket_.get_executor();
        auto ec = with_deadline(ex, sanitize(timeout),
            [&](auto completion){ socket_.async_connect(endpoint, completion); },
            [this]{ std::error_code ignore; socket_.cancel(ignore); }
        );
        if (!ec) {
            open_.store(true);
        } else {
            closeOnStrand();
        }
        return ec;
    }

    std::error_code write_all(const void* buf, std::size_t n, duration timeout) {
        if (!is_open()) {
            return asio::error::not_connected;
        }
        auto ex = socket_.get_executor();
        return with_deadline(ex, sanitize(timeout),
            [this, buf, n](auto completion){
                asio::dispatch(strand_, [this, buf, n, completion]{
                    asio::async_write(socket_, asio::buffer(buf, n),
                        [completion](const std::error_code& op_ec, std::size_t){
                            completion(op_ec);
                        });
                });
            },
            [this]{ std::error_code ignore; socket_.cancel(ignore); }
        );
    }

    // Blocks until at least one byte is available, the peer closes
    // (asio::error::eof) or close() aborts the read.
    std::error_code read_some(void* buf, std::size_t n, std::size_t& bytesRead) {
        bytesRead = 0;
        if (!is_open()) {
            return asio::error::not_connected;
        }
        struct Result {
            std::error_code ec;
            std::size_t transferred = 0;
        };
        auto done = std::make_shared<std::promise<Result>>();
        auto result = done->get_future();
        asio::dispatch(strand_, [this, buf, n, done]{
            socket_.async_read_some(asio::buffer(buf, n),
                [done](const std::error_code& ec, std::size_t transferred){
                    done->set_value(Result{ec, transferred});
                });
        });
        const Result r = result.get();
        bytesRead = r.transferred;
        return r.ec;
    }

    void setLowLatency() {
        asio::dispatch(strand_, [this]{
            std::error_code ec;
            socket_.set_option(tcp::no_delay(true), ec);
            socket_.set_option(asio::socket_base::keep_alive(true), ec);
        });
    }

    bool is_open() const { return open_.load(); }

    // Pattern: cancel -> shutdown -> close, executed on the strand.
    void close() {
        if (!open_.exchange(false)) {
            return;
        }
        logDebug("[TcpClient] close()\n");
        if (ensureNetService().runningInThisThread()) {
            closeOnStrand();
            return;
        }
        std::promise<void> closed;
        auto finished = closed.get_future();
        asio::post(strand_, [this, &closed]{
            closeOnStrand();
            closed.set_value();
        });
        finished.wait();
    }

private:
    void closeOnStrand() {
        if (!socket_.is_open()) return;
        std::error_code ec;
        socket_.cancel(ec);
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    static duration sanitize(duration timeout) {
        return timeout.count() < 0 ? duration::zero() : timeout;
    }

    std::shared_ptr<asio::io_context> io_;
    asio::strand<asio::io_context::executor_type> strand_;
    tcp::socket socket_;
    std::atomic<bool> open_{false};
};

} // namespace hs602::net
