#pragma once
#include "hs602/net/NetConfig.hpp"
#include "hs602/log/Log.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <memory>

namespace hs602::net {

/**
 * @brief Run an async operation with a deadline enforced by an Asio timer.
 *
 * The operation and an `asio::steady_timer` are started on the same
 * executor; whichever completes first wins and the calling thread is released
 * with either the operation's error code or `asio::error::timed_out`.
 *
 * - Completion handlers capture a `shared_ptr<State>` so a late handler never
 *   touches a destroyed condition variable after this function has returned.
 * - `cancel()` must cancel the object that launched the operation; callers
 *   supply it so ownership stays at the call site.
 * - The executor's `io_context` must be running on another thread.
 *
 * Socket-level deadlines only: TCP connect (`ConnectOptions::connectTimeout`),
 * every control-frame write (`ConnectOptions::sendTimeout`), the knock and the
 * discovery datagrams. A write that times out cancels the pending read too,
 * which CommandDispatcher's reader treats as benign. Command response
 * deadlines are separate timers owned by CommandDispatcher.
 */
template<typename StartAsync, typename Cancel>
std::error_code with_deadline(
    asio::any_io_executor ex,
    std::chrono::milliseconds timeout,
    StartAsync start_async,
    Cancel cancel)
{
    struct State {
        std::mutex m;
        std::condition_variable cv;
        bool done = false;
        std::error_code ec = asio::error::would_block;
    };

    auto st = std::make_shared<State>();
    auto timer = std::make_shared<asio::steady_timer>(ex);

    auto op_handler = [st, timer](const std::error_code& op_ec, auto&&... /*ignored*/) {
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done) return;           // deadline already won
            st->ec = op_ec;
            st->done = true;
        }
        st->cv.notify_one();
        timer->cancel();
    };

    start_async(op_handler);

    timer->expires_after(timeout);
    timer->async_wait([st, cancel, timer, timeout](const std::error_code& tec){
        if (tec == asio::error::operation_aborted) {
            return;                         // operation finished first
        }
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done) {
                return;
            }
            st->ec = asio::error::timed_out;
            st->done = true;
        }
        logDebug("[with_deadline] timeout fired after ", timeout.count(), "ms\n");
        cancel();
        st->cv.notify_one();
    });

    std::unique_lock<std::mutex> lk(st->m);
    st->cv.wait(lk, [&]{ return st->done; });
    return st->ec;
}

} // namespace hs602::net
