/**
 * @brief Sequence-id correlation, deadlines and the per-connection reader thread.
 */
#include "hs602/device/CommandDispatcher.hpp"

#include "hs602/core/Error.hpp"
#include "hs602/log/Log.hpp"
#include "hs602/net/NetService.hpp"
#include "hs602/protocol/FrameCodec.hpp"

#include <array>
#include <limits>
#include <vector>

namespace hs602::device {

namespace asio = hs602::net::asio;
using Result = CommandDispatcher::Result;

namespace {
constexpr std::size_t READ_CHUNK = 4096;
// Sequence id 0 is what discovery frames carry; control requests never use it.
constexpr std::size_t MAX_IN_FLIGHT = std::numeric_limits<std::uint16_t>::max();
} // namespace

CommandDispatcher::CommandDispatcher(std::shared_ptr<net::Connection> connection)
: connection(std::move(connection))
, state(std::make_shared<State>())
{}

CommandDispatcher::~CommandDispatcher() {
    close();
}

void CommandDispatcher::setClosedHandler(ClosedHandler handler) {
    std::lock_guard lock(handlerMutex);
    closedHandler = std::move(handler);
}

void CommandDispatcher::start() {
    if (reader.joinable() || isClosed()) {
        return;
    }
    reader = std::thread([this]{ readLoop(); });
}

Result CommandDispatcher::call(Opcode opcode, std::uint16_t parameterId, Payload payload,
                               std::chrono::milliseconds timeout) {
    return submit(opcode, parameterId, std::move(payload), timeout).get();
}

std::future<Result> CommandDispatcher::failed(std::error_code ec) {
    std::promise<Result> p;
    p.set_value(unexpected(ec));
    return p.get_future();
}

bool CommandDispatcher::allocateSequence(std::uint16_t& sequenceId) {
    // Caller holds state->mutex.
    if (state->pending.size() >= MAX_IN_FLIGHT) {
        return false;
    }
    for (;;) {
        const std::uint16_t candidate = state->nextSequence++;
        if (candidate == 0 || state->pending.count(candidate) != 0) {
            continue;
        }
        sequenceId = candidate;
        return true;
    }
}

std::future<Result> CommandDispatcher::submit(Opcode opcode, std::uint16_t parameterId,
                                              Payload payload, std::chrono::milliseconds timeout) {
    auto request = std::make_shared<PendingRequest>();
    request->opcode = opcode;
    request->parameterId = parameterId;
    auto future = request->result.get_future();

    {
        std::lock_guard lock(state->mutex);
        if (state->closed) {
            return failed(make_error_code(Errc::connection_closed));
        }
        if (!allocateSequence(request->sequenceId)) {
            logError("[CommandDispatcher] ", state->pending.size(), " requests in flight, refusing more\n");
            return failed(make_error_code(Errc::too_many_requests));
        }
        request->sentAt = std::chrono::steady_clock::now();
        request->deadline = request->sentAt + (timeout.count() < 0 ? std::chrono::milliseconds{0} : timeout);
        state->pending.emplace(request->sequenceId, request);
    }

    protocol::CommandFrame frame;
    frame.opcode = opcode;
    frame.parameterId = parameterId;
    frame.sequenceId = request->sequenceId;
    frame.payload = std::move(payload);

    auto bytes = protocol::encodeFrame(frame);
    if (!bytes) {
        std::lock_guard lock(state->mutex);
        state->pending.erase(request->sequenceId);
        return failed(bytes.error());
    }

    armDeadline(request);

    logDebug("[CommandDispatcher] TX ", protocol::describe(frame), "\n");
    std::error_code sendError;
    {
        std::lock_guard lock(sendMutex);
        sendError = connection->send(bytes->data(), bytes->size());
    }
    if (sendError) {
        logError("[CommandDispatcher] send to ", connection->describe(), " failed: ",
                 sendError.message(), "\n");
        // A stream we could not write to is not trustworthy any more.
        shutdown(sendError, true);
    }

    return future;
}

void CommandDispatcher::armDeadline(const std::shared_ptr<PendingRequest>& request) {
    auto timer = std::make_shared<asio::steady_timer>(net::io_context());
    timer->expires_at(request->deadline);
    std::weak_ptr<State> weakState = state;
    std::weak_ptr<PendingRequest> weakRequest = request;
    timer->async_wait([timer, weakState, weakRequest](const std::error_code&) {
        expire(weakState, weakRequest);
    });
}

void CommandDispatcher::expire(const std::weak_ptr<State>& weakState,
                               const std::weak_ptr<PendingRequest>& weakRequest) {
    auto st = weakState.lock();
    auto request = weakRequest.lock();
    if (!st || !request) {
        return; // completed or dispatcher gone
    }

    {
        std::lock_guard lock(st->mutex);
        auto it = st->pending.find(request->sequenceId);
        // The id may already belong to a newer request; only expire our own.
        if (it == st->pending.end() || it->second != request) {
            return;
        }
        st->pending.erase(it);
    }

    const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - request->sentAt);
    logError("[CommandDispatcher] ", protocol::toString(request->opcode),
             " seq=", request->sequenceId, " timed out after ", waited.count(), "ms\n");
    request->result.set_value(unexpected(make_error_code(Errc::timed_out)));
}

void CommandDispatcher::readLoop() {
    std::array<std::uint8_t, READ_CHUNK> chunk{};
    protocol::FrameDecoder decoder;

    for (;;) {
        auto received = connection->receive(chunk.data(), chunk.size());
        if (!received) {
            const auto ec = received.error();
            // A send that hit its deadline cancels every operation on the
            // socket, our read included; the connection itself is still fine.
            if (ec == asio::error::operation_aborted && connection->isOpen() && !closing.load()) {
                continue;
            }
            if (!closing.load()) {
                logError("[CommandDispatcher] connection to ", connection->describe(),
                         " lost: ", ec.message(), "\n");
            }
            shutdown(ec, true);
            return;
        }

        auto batch = decoder.feed(chunk.data(), *received);
        if (batch.error) {
            // The decoder already skipped the bad bytes; keep reading.
            healthy.store(false);
            logError("[CommandDispatcher] malformed frame from ", connection->describe(),
                     ": ", batch.error.message(), "\n");
        }
        for (auto& frame : batch.frames) {
            complete(std::move(frame));
        }
    }
}

void CommandDispatcher::complete(protocol::CommandFrame frame) {
    logDebug("[CommandDispatcher] RX ", protocol::describe(frame), "\n");

    std::shared_ptr<PendingRequest> request;
    {
        std::lock_guard lock(state->mutex);
        auto it = state->pending.find(frame.sequenceId);
        if (it != state->pending.end()) {
            request = std::move(it->second);
            state->pending.erase(it);
        }
    }

    if (!request) {
        logInfo("[CommandDispatcher] dropping unmatched ", protocol::describe(frame), "\n");
        return;
    }

    if (frame.opcode == Opcode::Nack) {
        logError("[CommandDispatcher] device rejected ", protocol::toString(request->opcode),
                 " param=", request->parameterId, " seq=", request->sequenceId, "\n");
        request->result.set_value(unexpected(make_error_code(Errc::device_rejected)));
        return;
    }

    if (frame.opcode != request->opcode) {
        logError("[CommandDispatcher] seq=", frame.sequenceId, " answered with ",
                 protocol::toString(frame.opcode), ", expected ",
                 protocol::toString(request->opcode), "\n");
        healthy.store(false);
        request->result.set_value(unexpected(make_error_code(Errc::protocol_error)));
        return;
    }

    request->result.set_value(std::move(frame.payload));
}

void CommandDispatcher::shutdown(const std::error_code& reason, bool notify) {
    std::map<std::uint16_t, std::shared_ptr<PendingRequest>> abandoned;
    {
        std::lock_guard lock(state->mutex);
        if (state->closed) {
            return;
        }
        state->closed = true;
        abandoned.swap(state->pending);
    }

    if (!abandoned.empty()) {
        logInfo("[CommandDispatcher] failing ", abandoned.size(), " pending request(s): ",
                reason.message(), "\n");
    }
    for (auto& entry : abandoned) {
        entry.second->result.set_value(unexpected(make_error_code(Errc::connection_closed)));
    }

    connection->close();

    if (!notify || closing.load()) {
        return;
    }
    ClosedHandler handler;
    {
        std::lock_guard lock(handlerMutex);
        handler = closedHandler;
    }
    if (handler) {
        handler(reason);
    }
}

void CommandDispatcher::close() {
    closing.store(true);
    shutdown(make_error_code(Errc::connection_closed), false);
    if (reader.joinable()) {
        if (reader.get_id() == std::this_thread::get_id()) {
            reader.detach();
        } else {
            reader.join();
        }
    }
}

bool CommandDispatcher::isClosed() const {
    std::lock_guard lock(state->mutex);
    return state->closed;
}

std::size_t CommandDispatcher::pendingCount() const {
    std::lock_guard lock(state->mutex);
    return state->pending.size();
}

bool CommandDispatcher::isPending(std::uint16_t sequenceId) const {
    std::lock_guard lock(state->mutex);
    return state->pending.count(sequenceId) != 0;
}

} // namespace hs602::device
