#include "FakeConnection.hpp"

#include "hs602/core/Error.hpp"
#include "hs602/device/CommandDispatcher.hpp"
#include "hs602/log/Log.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using namespace hs602;
using hs602::device::CommandDispatcher;
using hs602::test::FakeConnection;
using hs602::protocol::Opcode;
using hs602::protocol::Payload;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { hs602::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { hs602::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static bool waitFor(const std::function<bool()>& condition, std::chrono::milliseconds limit = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

// Concurrent callers, responses delivered out of order: everyone gets their own answer.
static void testConcurrentCallsNoCrossTalk() {
    auto connection = std::make_shared<FakeConnection>();

    // Hold replies back and release them four at a time, newest first.
    auto held = std::make_shared<std::vector<protocol::CommandFrame>>();
    connection->setResponder([held](const protocol::CommandFrame& request) {
        held->push_back(request);
        held->back().payload = {static_cast<std::uint8_t>(request.parameterId & 0xFF),
                                static_cast<std::uint8_t>(request.parameterId >> 8)};
        std::vector<protocol::CommandFrame> out;
        if (held->size() == 4) {
            out.assign(held->rbegin(), held->rend());
            held->clear();
        }
        return out;
    });

    CommandDispatcher dispatcher(connection);
    dispatcher.start();

    constexpr int kCallers = 32;
    std::atomic<int> correct{0};
    std::vector<std::thread> callers;
    for (int i = 0; i < kCallers; ++i) {
        callers.emplace_back([&, i] {
            const auto parameterId = static_cast<std::uint16_t>(0x0100 + i);
            auto result = dispatcher.call(Opcode::Get, parameterId, {}, 2000ms);
            if (result && result->size() == 2 &&
                ((*result)[0] | ((*result)[1] << 8)) == parameterId) {
                correct.fetch_add(1);
            }
        });
    }
    for (auto& t : callers) t.join();

    ASSERT_EQ(correct.load(), kCallers, "every caller received its own response");
    ASSERT_EQ(dispatcher.pendingCount(), std::size_t{0}, "nothing left pending");

    // Sequence ids in flight at once were distinct and never 0.
    std::vector<bool> seen(65536, false);
    bool distinct = true;
    for (const auto& frame : connection->sentFrames()) {
        if (frame.sequenceId == 0 || seen[frame.sequenceId]) distinct = false;
        seen[frame.sequenceId] = true;
    }
    ASSERT_TRUE(distinct, "sequence ids unique and non-zero");
    dispatcher.close();
}

static void testTimeoutRemovesPending() {
    auto connection = std::make_shared<FakeConnection>(); // never answers
    CommandDispatcher dispatcher(connection);
    dispatcher.start();

    const auto started = std::chrono::steady_clock::now();
    auto future = dispatcher.submit(Opcode::Get, 0x0002, {}, 100ms);
    const auto sent = connection->sentFrames();
    ASSERT_EQ(sent.size(), std::size_t{1}, "request written");
    const auto sequenceId = sent.empty() ? std::uint16_t{0} : sent[0].sequenceId;
    ASSERT_TRUE(dispatcher.isPending(sequenceId), "pending while waiting");

    auto result = future.get();
    const auto waited = std::chrono::steady_clock::now() - started;
    ASSERT_TRUE(!result && result.error() == Errc::timed_out, "times out");
    ASSERT_TRUE(waited >= 90ms && waited < 1000ms, "times out close to the deadline");
    ASSERT_TRUE(!dispatcher.isPending(sequenceId), "timed out id left the pending map");

    // A response arriving after the timeout is dropped and nothing breaks.
    protocol::CommandFrame late;
    late.opcode = Opcode::Get;
    late.parameterId = 0x0002;
    late.sequenceId = sequenceId;
    connection->push(late);
    std::this_thread::sleep_for(50ms);
    ASSERT_TRUE(dispatcher.isHealthy(), "late response is not a protocol error");
    ASSERT_TRUE(!dispatcher.isClosed(), "still usable");
    dispatcher.close();
}

static void testCloseFailsEveryPending() {
    auto connection = std::make_shared<FakeConnection>();
    CommandDispatcher dispatcher(connection);
    dispatcher.start();

    constexpr int kPending = 5;
    std::vector<std::future<CommandDispatcher::Result>> futures;
    for (int i = 0; i < kPending; ++i) {
        futures.push_back(dispatcher.submit(Opcode::Get, static_cast<std::uint16_t>(i + 1), {}, 5000ms));
    }
    ASSERT_EQ(dispatcher.pendingCount(), std::size_t{kPending}, "all pending");

    dispatcher.close();
    int closed = 0;
    for (auto& f : futures) {
        auto result = f.get();
        if (!result && result.error() == Errc::connection_closed) ++closed;
    }
    ASSERT_EQ(closed, kPending, "every pending request failed with connection_closed");
    ASSERT_EQ(dispatcher.pendingCount(), std::size_t{0}, "map emptied");

    auto after = dispatcher.call(Opcode::Get, 1, {}, 100ms);
    ASSERT_TRUE(!after && after.error() == Errc::connection_closed, "closed dispatcher rejects new calls");
    ASSERT_EQ(connection->sendCount(), std::size_t{kPending}, "rejected call was not sent");
}

static void testRemoteCloseNotifies() {
    auto connection = std::make_shared<FakeConnection>();
    CommandDispatcher dispatcher(connection);

    std::promise<std::error_code> notified;
    auto reason = notified.get_future();
    dispatcher.setClosedHandler([&notified](const std::error_code& ec) { notified.set_value(ec); });
    dispatcher.start();

    auto pending = dispatcher.submit(Opcode::Get, 1, {}, 5000ms);
    connection->hangUp();

    ASSERT_TRUE(reason.wait_for(2s) == std::future_status::ready, "closed handler called");
    auto result = pending.get();
    ASSERT_TRUE(!result && result.error() == Errc::connection_closed, "pending request failed");
    ASSERT_TRUE(dispatcher.isClosed(), "dispatcher closed for good");
    dispatcher.close();
}

static void testUnmatchedResponseDropped() {
    auto connection = std::make_shared<FakeConnection>();
    connection->setResponder(FakeConnection::echo);
    CommandDispatcher dispatcher(connection);
    dispatcher.start();

    protocol::CommandFrame stray;
    stray.opcode = Opcode::Get;
    stray.sequenceId = 4242;
    connection->push(stray);

    auto result = dispatcher.call(Opcode::Keepalive, 0, {}, 1000ms);
    ASSERT_TRUE(result.has_value(), "calls still work after an unmatched frame");
    ASSERT_TRUE(dispatcher.isHealthy(), "unmatched frame is not a protocol error");
    dispatcher.close();
}

static void testNackAndOpcodeMismatch() {
    auto connection = std::make_shared<FakeConnection>();
    connection->setResponder([](const protocol::CommandFrame& request) {
        auto reply = request;
        if (request.parameterId == 1) reply.opcode = Opcode::Nack;
        if (request.parameterId == 2) reply.opcode = Opcode::Keepalive;
        return std::vector<protocol::CommandFrame>{reply};
    });
    CommandDispatcher dispatcher(connection);
    dispatcher.start();

    auto rejected = dispatcher.call(Opcode::Set, 1, {1}, 1000ms);
    ASSERT_TRUE(!rejected && rejected.error() == Errc::device_rejected, "nack surfaces device_rejected");
    ASSERT_TRUE(dispatcher.isHealthy(), "nack is a valid answer");

    auto mismatched = dispatcher.call(Opcode::Get, 2, {}, 1000ms);
    ASSERT_TRUE(!mismatched && mismatched.error() == Errc::protocol_error, "wrong opcode is a protocol error");
    ASSERT_TRUE(!dispatcher.isHealthy(), "mismatch marks the connection unhealthy");
    dispatcher.close();
}

static void testMalformedFrameKeepsReaderAlive() {
    auto connection = std::make_shared<FakeConnection>();
    connection->setResponder(FakeConnection::echo);
    CommandDispatcher dispatcher(connection);
    dispatcher.start();

    // Unknown opcode 0x33 with a two byte payload.
    connection->pushRaw({0x33, 0x00, 0x01, 0x00, 0x01, 0x00, 0x02, 0x00, 0xEE, 0xEE});
    ASSERT_TRUE(waitFor([&]{ return !dispatcher.isHealthy(); }), "malformed frame observed");

    auto result = dispatcher.call(Opcode::Get, 0x0A00, {}, 1000ms);
    ASSERT_TRUE(result.has_value(), "reader survives a malformed frame");
    ASSERT_TRUE(!dispatcher.isClosed(), "connection kept open");
    dispatcher.close();
}

static void testSendFailureClosesDispatcher() {
    auto connection = std::make_shared<FakeConnection>();
    connection->setFailSends(true);
    CommandDispatcher dispatcher(connection);
    std::atomic<bool> notified{false};
    dispatcher.setClosedHandler([&notified](const std::error_code&) { notified.store(true); });
    dispatcher.start();

    auto result = dispatcher.call(Opcode::Get, 1, {}, 1000ms);
    ASSERT_TRUE(!result && result.error() == Errc::connection_closed, "failed send fails the request");
    ASSERT_TRUE(dispatcher.isClosed(), "failed send closes the dispatcher");
    ASSERT_TRUE(notified.load(), "owner told about the failure");
    dispatcher.close();
}

// Drive the id counter past 65535 while one request stays pending: 0 and the
// held id are skipped, everything else is reused.
static void testSequenceWrapSkipsHeldId() {
    constexpr std::uint16_t kHeldParameter = 0xBEEF;
    auto connection = std::make_shared<FakeConnection>();
    connection->setResponder([](const protocol::CommandFrame& request) {
        if (request.parameterId == kHeldParameter) {
            return std::vector<protocol::CommandFrame>{};
        }
        return FakeConnection::echo(request);
    });
    CommandDispatcher dispatcher(connection);
    dispatcher.start();

    auto held = dispatcher.submit(Opcode::Get, kHeldParameter, {}, 60000ms);
    ASSERT_TRUE(dispatcher.isPending(1), "first request takes id 1");

    constexpr std::size_t kCalls = 65535;
    constexpr std::size_t kBatch = 512;
    std::size_t answered = 0;
    for (std::size_t done = 0; done < kCalls; ) {
        std::vector<std::future<CommandDispatcher::Result>> batch;
        for (std::size_t i = 0; i < kBatch && done < kCalls; ++i, ++done) {
            batch.push_back(dispatcher.submit(Opcode::Keepalive, 0, {}, 5000ms));
        }
        for (auto& f : batch) {
            if (f.get().has_value()) ++answered;
        }
    }
    ASSERT_EQ(answered, kCalls, "every call across the wrap answered");
    ASSERT_TRUE(dispatcher.isPending(1), "held request still pending");
    ASSERT_EQ(dispatcher.pendingCount(), std::size_t{1}, "only the held request left");

    const auto sent = connection->sentFrames();
    ASSERT_EQ(sent.size(), kCalls + 1, "every request written");
    bool zeroUsed = false;
    bool heldReused = false;
    for (std::size_t i = 1; i < sent.size(); ++i) {
        if (sent[i].sequenceId == 0) zeroUsed = true;
        if (sent[i].sequenceId == 1) heldReused = true;
    }
    ASSERT_TRUE(!zeroUsed, "id 0 never used");
    ASSERT_TRUE(!heldReused, "pending id never handed out twice");
    if (sent.size() == kCalls + 1) {
        ASSERT_EQ(sent[kCalls - 1].sequenceId, 0xFFFF, "counter reached the top");
        ASSERT_EQ(sent[kCalls].sequenceId, 2, "wrapped past 0 and the held id");
    }

    dispatcher.close();
    auto heldResult = held.get();
    ASSERT_TRUE(!heldResult && heldResult.error() == Errc::connection_closed, "held request failed on close");
}

// With every non-zero id in flight the next request is refused, not sent.
static void testAllIdsInFlightRefused() {
    auto connection = std::make_shared<FakeConnection>(); // never answers
    CommandDispatcher dispatcher(connection);
    dispatcher.start();

    constexpr std::size_t kIds = 65535;
    for (std::size_t i = 0; i < kIds; ++i) {
        // Dropped futures: the requests stay pending regardless.
        dispatcher.submit(Opcode::Get, 0x0002, {}, 60000ms);
    }
    ASSERT_EQ(dispatcher.pendingCount(), kIds, "every id in flight");
    ASSERT_TRUE(!dispatcher.isPending(0), "id 0 not in flight");

    auto refused = dispatcher.call(Opcode::Get, 0x0002, {}, 1000ms);
    ASSERT_TRUE(!refused && refused.error() == Errc::too_many_requests, "refused with too_many_requests");
    ASSERT_EQ(connection->sendCount(), kIds, "refused request never written");
    ASSERT_TRUE(!dispatcher.isClosed(), "refusal does not close the dispatcher");

    dispatcher.close();
    ASSERT_EQ(dispatcher.pendingCount(), std::size_t{0}, "close drains the map");
}

// Requests whose futures were dropped still finish and free their ids.
static void testAbandonedRequestsDoNotLeak() {
    constexpr std::uint16_t kSilentParameter = 0x00AA;
    auto connection = std::make_shared<FakeConnection>();
    connection->setResponder([](const protocol::CommandFrame& request) {
        if (request.parameterId == kSilentParameter) {
            return std::vector<protocol::CommandFrame>{};
        }
        return FakeConnection::echo(request);
    });
    CommandDispatcher dispatcher(connection);
    dispatcher.start();

    // Never answered: the deadline consumes it.
    dispatcher.submit(Opcode::Get, kSilentParameter, {0x01}, 50ms);
    // Answered straight away.
    dispatcher.submit(Opcode::Get, 0x00BB, {0x02}, 5000ms);
    ASSERT_TRUE(waitFor([&]{ return dispatcher.pendingCount() == 0; }), "abandoned requests left the map");

    // The silent request's answer turns up after its deadline.
    const auto sent = connection->sentFrames();
    ASSERT_EQ(sent.size(), std::size_t{2}, "both written");
    if (!sent.empty()) {
        auto late = sent[0];
        late.payload = {0xDE, 0xAD};
        connection->push(late);
    }

    auto result = dispatcher.call(Opcode::Get, 0x00CC, {0x5A}, 1000ms);
    ASSERT_TRUE(result && *result == Payload{0x5A}, "next call gets its own response");
    ASSERT_TRUE(dispatcher.isHealthy(), "late answer is not a protocol error");
    ASSERT_EQ(dispatcher.pendingCount(), std::size_t{0}, "nothing left pending");
    dispatcher.close();
}

int main() {
    testConcurrentCallsNoCrossTalk();
    testTimeoutRemovesPending();
    testCloseFailsEveryPending();
    testRemoteCloseNotifies();
    testUnmatchedResponseDropped();
    testNackAndOpcodeMismatch();
    testMalformedFrameKeepsReaderAlive();
    testSendFailureClosesDispatcher();
    testSequenceWrapSkipsHeldId();
    testAllIdsInFlightRefused();
    testAbandonedRequestsDoNotLeak();

    if (g_failures) {
        logError("Command dispatcher tests failed: ", g_failures, "\n");
        return 1;
    }
    logInfo("Command dispatcher tests passed.\n");
    return 0;
}
