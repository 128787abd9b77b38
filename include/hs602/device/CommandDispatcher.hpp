#pragma once

#include "hs602/core/Expected.hpp"
#include "hs602/net/Connection.hpp"
#include "hs602/protocol/Frame.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace hs602::device {

using protocol::Opcode;
using protocol::Payload;

/**
 * @brief Request/response correlation over one device connection.
 *
 * Every request gets a sequence id that is unique among the requests in
 * flight, a PendingRequest in the pending map, and an asio deadline timer.
 * A dedicated reader thread decodes inbound frames and completes the request
 * whose sequence id matches; frames that match nothing are logged and
 * dropped.
 *
 * Completion rules:
 * - response frame       -> payload (a Nack frame -> `Errc::device_rejected`)
 * - deadline passes      -> `Errc::timed_out`, the id leaves the map
 * - connection goes away -> every pending request fails with
 *                           `Errc::connection_closed`; the dispatcher is then
 *                           closed for good and rejects new calls.
 *
 * Nothing is retried here: a StreamToggle that timed out may still have
 * reached the device.
 *
 * Threading: `submit`/`call` may be used from any number of threads except
 * the NetService I/O thread. The pending map is guarded by one mutex; sends
 * are serialised by a second one.
 */
class CommandDispatcher {
public:
    using Result = expected<Payload>;
    using ClosedHandler = std::function<void(const std::error_code&)>;

    explicit CommandDispatcher(std::shared_ptr<net::Connection> connection);
    ~CommandDispatcher();

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;
    CommandDispatcher(CommandDispatcher&&) = delete;
    CommandDispatcher& operator=(CommandDispatcher&&) = delete;

    /// Called once, from the reader thread, when the peer closes or the
    /// connection fails. Not called for an explicit `close()`.
    void setClosedHandler(ClosedHandler handler);

    /// Launch the reader thread. Calls made before `start()` still go out but
    /// their responses are only read once it runs.
    void start();

    /// Send a request and block until it completes or its deadline passes.
    Result call(Opcode opcode, std::uint16_t parameterId, Payload payload,
                std::chrono::milliseconds timeout);

    /// Send a request and return immediately. Dropping the future is allowed;
    /// the response (or timeout) is still consumed and discarded.
    std::future<Result> submit(Opcode opcode, std::uint16_t parameterId, Payload payload,
                               std::chrono::milliseconds timeout);

    /// Close the connection, fail everything pending and join the reader.
    void close();

    bool isClosed() const;

    /// False once a malformed frame has been seen on this connection.
    bool isHealthy() const { return healthy.load(); }

    std::size_t pendingCount() const;
    bool isPending(std::uint16_t sequenceId) const;

private:
    struct PendingRequest {
        std::uint16_t sequenceId = 0;
        Opcode opcode = Opcode::Keepalive;
        std::uint16_t parameterId = 0;
        std::chrono::steady_clock::time_point sentAt{};
        std::chrono::steady_clock::time_point deadline{};
        std::promise<Result> result;
    };

    // Shared with deadline timers, which may fire after the dispatcher is gone.
    struct State {
        mutable std::mutex mutex;
        std::map<std::uint16_t, std::shared_ptr<PendingRequest>> pending;
        std::uint16_t nextSequence = 1;
        bool closed = false;
    };

    static std::future<Result> failed(std::error_code ec);

    bool allocateSequence(std::uint16_t& sequenceId);
    void armDeadline(const std::shared_ptr<PendingRequest>& request);
    static void expire(const std::weak_ptr<State>& state,
                       const std::weak_ptr<PendingRequest>& request);

    void readLoop();
    void complete(protocol::CommandFrame frame);
    void shutdown(const std::error_code& reason, bool notify);

    std::shared_ptr<net::Connection> connection;
    std::shared_ptr<State> state;
    std::mutex sendMutex;
    std::mutex handlerMutex;
    ClosedHandler closedHandler;
    std::thread reader;
    std::atomic<bool> healthy{true};
    std::atomic<bool> closing{false};
};

} // namespace hs602::device
