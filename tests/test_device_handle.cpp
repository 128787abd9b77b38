#include "FakeConnection.hpp"

#include "hs602/core/Error.hpp"
#include "hs602/device/DeviceHandle.hpp"
#include "hs602/log/Log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace std::chrono_literals;
using namespace hs602;
using namespace hs602::device;
using hs602::test::FakeConnection;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { hs602::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { hs602::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define REQUIRE(cond, msg) \
    do { \
        if (!(cond)) { \
            std::fprintf(stderr, "REQUIRE FAILED: %s @ %s:%d\n", msg, __FILE__, __LINE__); \
            std::exit(1); \
        } \
    } while (0)

namespace {

// Payload a well-behaved device would return for a GET of `parameter`.
Payload sampleValue(const Parameter& parameter) {
    switch (parameter.kind) {
        case ValueKind::Int: {
            const auto v = static_cast<std::uint32_t>(parameter.minimum);
            return {static_cast<std::uint8_t>(v), static_cast<std::uint8_t>(v >> 8),
                    static_cast<std::uint8_t>(v >> 16), static_cast<std::uint8_t>(v >> 24)};
        }
        case ValueKind::String: return {'o', 'k'};
        case ValueKind::Enum:   return {parameter.options.front().code};
        case ValueKind::Bool:   return {1};
        case ValueKind::Size:   return {0x00, 0x05, 0xD0, 0x02};
    }
    return {};
}

// Replies like the appliance: GETs get a value, everything else is echoed.
std::vector<protocol::CommandFrame> applianceReply(const protocol::CommandFrame& request) {
    auto reply = request;
    if (request.opcode == Opcode::Get) {
        for (const auto& p : ParameterRegistry::defaults().parameters()) {
            if (p.parameterId == request.parameterId) {
                reply.payload = sampleValue(p);
            }
        }
    }
    return {reply};
}

// Builds handles whose connections are FakeConnections, remembering the last one.
struct FakeFactory {
    std::mutex mutex;
    std::shared_ptr<FakeConnection> last;
    FakeConnection::Responder responder = applianceReply;
    int opened = 0;

    ConnectionFactory make() {
        return [this](const DeviceAddress&) -> expected<std::shared_ptr<net::Connection>> {
            auto connection = std::make_shared<FakeConnection>();
            std::lock_guard lock(mutex);
            connection->setResponder(responder);
            last = connection;
            ++opened;
            return std::shared_ptr<net::Connection>(connection);
        };
    }

    std::shared_ptr<FakeConnection> current() {
        std::lock_guard lock(mutex);
        return last;
    }
};

DeviceOptions fakeOptions(FakeFactory& factory, std::chrono::milliseconds timeout = 500ms) {
    DeviceOptions options;
    options.connectionFactory = factory.make();
    options.commandTimeout = timeout;
    return options;
}

bool waitFor(const std::function<bool()>& condition, std::chrono::milliseconds limit = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

// Loopback stand-in for the appliance's TCP control port.
class DummyDeviceServer {
public:
    DummyDeviceServer() {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(listenFd_ >= 0, "socket");

        int opt = 1;
        ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;

        REQUIRE(::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0, "bind");
        REQUIRE(::listen(listenFd_, 4) == 0, "listen");

        socklen_t len = sizeof(addr);
        REQUIRE(::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0, "getsockname");
        port_ = ntohs(addr.sin_port);

        running_.store(true);
        thread_ = std::thread([this]{ run(); });
    }

    ~DummyDeviceServer() {
        stop();
    }

    void stop() {
        bool expected = true;
        if (!running_.compare_exchange_strong(expected, false)) {
            return;
        }
        ::shutdown(listenFd_, SHUT_RDWR);
        dropClient();
        if (thread_.joinable()) {
            thread_.join();
        }
        ::close(listenFd_);
    }

    /// Close the current control connection from the device side.
    void dropClient() {
        const int fd = clientFd_.load();
        if (fd >= 0) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }

    std::uint16_t port() const { return port_; }
    int framesSeen() const { return frames_.load(); }

private:
    void run() {
        while (running_.load()) {
            int client = ::accept(listenFd_, nullptr, nullptr);
            if (client < 0) {
                if (!running_.load()) break;
                continue;
            }
            clientFd_.store(client);
            serve(client);
            clientFd_.store(-1);
            ::close(client);
        }
    }

    void serve(int client) {
        protocol::FrameDecoder decoder;
        std::uint8_t buffer[1024];
        for (;;) {
            const auto n = ::recv(client, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                return;
            }
            auto batch = decoder.feed(buffer, static_cast<std::size_t>(n));
            for (const auto& frame : batch.frames) {
                frames_.fetch_add(1);
                for (const auto& reply : applianceReply(frame)) {
                    auto bytes = protocol::encodeFrame(reply);
                    if (bytes) {
                        ::send(client, bytes->data(), bytes->size(), MSG_NOSIGNAL);
                    }
                }
            }
        }
    }

    int listenFd_ = -1;
    std::atomic<int> clientFd_{-1};
    std::uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<int> frames_{0};
    std::thread thread_;
};

std::uint16_t unusedTcpPort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(fd >= 0, "socket");
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    REQUIRE(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0, "bind");
    socklen_t len = sizeof(addr);
    REQUIRE(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0, "getsockname");
    ::close(fd);
    return ntohs(addr.sin_port);
}

const DeviceAddress kDevice{"10.0.0.42", config::HS602_CONTROL_PORT_DEFAULT, "HS602"};

} // namespace

static void testNotConnected() {
    FakeFactory factory;
    DeviceHandle handle(fakeOptions(factory));
    ASSERT_TRUE(handle.state() == ConnectionState::Disconnected, "starts disconnected");

    auto value = handle.get("bitrate");
    ASSERT_TRUE(!value && value.error() == Errc::not_connected, "get needs a connection");
    auto set = handle.set("bitrate", ParameterValue{std::int64_t{1000}});
    ASSERT_TRUE(!set && set.error() == Errc::not_connected, "set needs a connection");
    auto start = handle.startStreaming();
    ASSERT_TRUE(!start && start.error() == Errc::not_connected, "start needs a connection");
    auto stop = handle.stopStreaming();
    ASSERT_TRUE(!stop && stop.error() == Errc::not_connected, "stop needs a connection");
    ASSERT_EQ(factory.opened, 0, "nothing was opened");

    handle.disconnect();
    handle.disconnect();
    ASSERT_TRUE(handle.state() == ConnectionState::Disconnected, "disconnect is idempotent");
}

static void testCommandsOverFakeConnection() {
    FakeFactory factory;
    DeviceHandle handle(fakeOptions(factory));

    auto connected = handle.connect(kDevice);
    ASSERT_TRUE(connected.has_value(), "connect succeeds");
    ASSERT_TRUE(handle.state() == ConnectionState::Connected, "connected");
    ASSERT_TRUE(handle.address() && *handle.address() == kDevice, "address remembered");

    auto bitrate = handle.get("bitrate");
    ASSERT_TRUE(bitrate && std::get<std::int64_t>(*bitrate) == 500, "bitrate read");

    auto set = handle.set("bitrate", ParameterValue{std::int64_t{8000}});
    ASSERT_TRUE(set.has_value(), "bitrate written");

    auto invalid = handle.set("bitrate", ParameterValue{std::int64_t{-1}});
    ASSERT_TRUE(!invalid && invalid.error() == Errc::validation_failed, "invalid value rejected");

    ASSERT_TRUE(handle.startStreaming().has_value(), "start streaming");
    ASSERT_TRUE(handle.stopStreaming().has_value(), "stop streaming");
    ASSERT_TRUE(handle.keepalive().has_value(), "keepalive echoed");
    ASSERT_TRUE(handle.identify().has_value(), "identify acknowledged");

    const auto sent = factory.current()->sentFrames();
    ASSERT_EQ(sent.size(), std::size_t{6}, "invalid set never sent");
    if (sent.size() == 6) {
        ASSERT_TRUE(sent[2].opcode == Opcode::StreamToggle && sent[2].payload == Payload{1}, "start toggles on");
        ASSERT_TRUE(sent[3].opcode == Opcode::StreamToggle && sent[3].payload == Payload{0}, "stop toggles off");
        ASSERT_TRUE(sent[4].opcode == Opcode::Keepalive, "keepalive opcode");
        ASSERT_EQ(sent[5].parameterId, 0x0037, "identify writes the led");
    }

    auto all = handle.settings();
    ASSERT_TRUE(all.has_value(), "settings snapshot");
    if (all) {
        ASSERT_TRUE(all->count("firmware") == 1, "read-only values included");
        ASSERT_TRUE(all->count("led") == 0, "write-only values skipped");
        ASSERT_TRUE(all->count("picture") == 1 &&
                    std::get<PictureSize>(all->at("picture")) == (PictureSize{1280, 720}), "size decoded");
    }

    handle.disconnect();
    ASSERT_TRUE(handle.state() == ConnectionState::Disconnected, "disconnected");
    ASSERT_TRUE(!handle.address(), "address cleared");
    ASSERT_TRUE(!factory.current()->isOpen(), "connection closed");
}

static void testSingleOwnerPerDevice() {
    FakeFactory factory;
    DeviceHandle first(fakeOptions(factory));
    DeviceHandle second(fakeOptions(factory));

    ASSERT_TRUE(first.connect(kDevice).has_value(), "first owner connects");
    auto busy = second.connect(kDevice);
    ASSERT_TRUE(!busy && busy.error() == Errc::device_busy, "second owner refused");
    ASSERT_TRUE(second.state() == ConnectionState::Disconnected, "refused handle stays usable");

    DeviceAddress other = kDevice;
    other.host = "10.0.0.43";
    ASSERT_TRUE(second.connect(other).has_value(), "other devices are free");
    second.disconnect();

    first.disconnect();
    ASSERT_TRUE(second.connect(kDevice).has_value(), "claim released on disconnect");
    second.disconnect();
}

static void testConnectFailureIsTerminal() {
    DeviceOptions options;
    options.connectionFactory = [](const DeviceAddress&) -> expected<std::shared_ptr<net::Connection>> {
        return unexpected(make_error_code(Errc::connect_failed));
    };
    DeviceHandle handle(std::move(options));

    auto result = handle.connect(kDevice);
    ASSERT_TRUE(!result && result.error() == Errc::connect_failed, "connect fails");
    ASSERT_TRUE(handle.state() == ConnectionState::Failed, "handle failed");
    auto again = handle.connect(kDevice);
    ASSERT_TRUE(!again && handle.state() == ConnectionState::Failed, "failed handle stays failed");

    FakeFactory factory;
    DeviceHandle fresh(fakeOptions(factory));
    ASSERT_TRUE(fresh.connect(kDevice).has_value(), "failed attempt released the claim");
    fresh.disconnect();
}

static void testRemoteCloseDisconnects() {
    FakeFactory factory;
    DeviceHandle handle(fakeOptions(factory));
    ASSERT_TRUE(handle.connect(kDevice).has_value(), "connect");

    factory.current()->hangUp();
    ASSERT_TRUE(waitFor([&]{ return handle.state() == ConnectionState::Disconnected; }),
                "device hang-up observed");
    auto value = handle.get("bitrate");
    ASSERT_TRUE(!value && value.error() == Errc::not_connected, "commands need a new connect");

    FakeFactory otherFactory;
    DeviceHandle other(fakeOptions(otherFactory));
    ASSERT_TRUE(other.connect(kDevice).has_value(), "claim released after hang-up");
    other.disconnect();

    ASSERT_TRUE(handle.connect(kDevice).has_value(), "reconnect after hang-up");
    ASSERT_EQ(factory.opened, 2, "new connection opened");
    handle.disconnect();
}

static void testGetRetriedOnTimeoutOnly() {
    FakeFactory factory;
    auto gets = std::make_shared<std::atomic<int>>(0);
    factory.responder = [gets](const protocol::CommandFrame& request) {
        if (request.opcode == Opcode::Get && gets->fetch_add(1) == 0) {
            return std::vector<protocol::CommandFrame>{}; // first GET is lost
        }
        if (request.opcode == Opcode::Set) {
            return std::vector<protocol::CommandFrame>{}; // SETs are never answered
        }
        return applianceReply(request);
    };

    DeviceHandle handle(fakeOptions(factory, 100ms));
    ASSERT_TRUE(handle.connect(kDevice).has_value(), "connect");

    auto value = handle.get("fps");
    ASSERT_TRUE(value.has_value(), "second attempt answered");
    ASSERT_EQ(gets->load(), 2, "GET sent twice");

    auto set = handle.set("fps", ParameterValue{std::int64_t{30}});
    ASSERT_TRUE(!set && set.error() == Errc::timed_out, "SET times out");
    std::size_t setsSent = 0;
    for (const auto& frame : factory.current()->sentFrames()) {
        if (frame.opcode == Opcode::Set) ++setsSent;
    }
    ASSERT_EQ(setsSent, std::size_t{1}, "SET not retried");
    handle.disconnect();

    FakeFactory strict;
    strict.responder = [](const protocol::CommandFrame&) { return std::vector<protocol::CommandFrame>{}; };
    DeviceOptions options = fakeOptions(strict, 100ms);
    options.getRetries = 0;
    DeviceHandle noRetry(std::move(options));
    ASSERT_TRUE(noRetry.connect(kDevice).has_value(), "connect");
    auto timedOut = noRetry.get("fps");
    ASSERT_TRUE(!timedOut && timedOut.error() == Errc::timed_out, "no retry configured");
    ASSERT_EQ(strict.current()->sendCount(), std::size_t{1}, "single attempt");
    noRetry.disconnect();
}

static void testOverLoopbackTcp() {
    DummyDeviceServer server;

    DeviceOptions options;
    options.connect.knock = false;
    options.commandTimeout = 1000ms;
    DeviceHandle handle(std::move(options));

    const DeviceAddress address{"127.0.0.1", server.port(), {}};
    auto connected = handle.connect(address);
    ASSERT_TRUE(connected.has_value(), "tcp connect succeeds");
    if (!connected) return;

    auto fps = handle.get("fps");
    ASSERT_TRUE(fps && std::get<std::int64_t>(*fps) == 1, "fps read over tcp");
    ASSERT_TRUE(handle.set("name", ParameterValue{std::string("studio")}).has_value(), "name written");
    ASSERT_TRUE(handle.startStreaming().has_value(), "streaming started over tcp");
    ASSERT_EQ(server.framesSeen(), 3, "server saw every request");

    server.dropClient();
    ASSERT_TRUE(waitFor([&]{ return handle.state() == ConnectionState::Disconnected; }),
                "server-side close observed");
    handle.disconnect();
}

static void testRefusedTcpConnect() {
    DeviceOptions options;
    options.connect.knock = false;
    options.connect.connectTimeout = 500ms;
    DeviceHandle handle(std::move(options));

    auto result = handle.connect(DeviceAddress{"127.0.0.1", unusedTcpPort(), {}});
    ASSERT_TRUE(!result && result.error() == Errc::connect_failed, "refused connect reported");
    ASSERT_TRUE(handle.state() == ConnectionState::Failed, "handle failed");
}

int main() {
    testNotConnected();
    testCommandsOverFakeConnection();
    testSingleOwnerPerDevice();
    testConnectFailureIsTerminal();
    testRemoteCloseDisconnects();
    testGetRetriedOnTimeoutOnly();
    testOverLoopbackTcp();
    testRefusedTcpConnect();

    if (g_failures) {
        logError("Device handle tests failed: ", g_failures, "\n");
        return 1;
    }
    logInfo("Device handle tests passed.\n");
    return 0;
}
