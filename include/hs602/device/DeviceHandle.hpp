#pragma once

#include "hs602/core/Config.hpp"
#include "hs602/core/DeviceAddress.hpp"
#include "hs602/core/Expected.hpp"
#include "hs602/device/CommandDispatcher.hpp"
#include "hs602/device/ParameterRegistry.hpp"
#include "hs602/net/TcpConnection.hpp"
#include "hs602/net/TimeoutConfig.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace hs602::device {

enum class ConnectionState : std::uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Failed      ///< connect failed; terminal for this handle
};

const char* toString(ConnectionState state);

using ConnectionFactory =
    std::function<expected<std::shared_ptr<net::Connection>>(const DeviceAddress&)>;

struct DeviceOptions {
    net::ConnectOptions connect{};

    /// Deadline for every command; defaults to the process-wide TimeoutConfig.
    std::optional<std::chrono::milliseconds> commandTimeout{};

    /// Extra attempts for a GET that timed out. GETs have no side effects;
    /// SET and StreamToggle are never repeated.
    int getRetries = 1;

    /// Replaces TcpConnection::open, e.g. with an in-memory stub.
    ConnectionFactory connectionFactory{};
};

/// Every readable parameter, by name.
using Settings = std::map<std::string, ParameterValue, std::less<>>;

/**
 * @brief Public entry point for controlling one HS602 appliance.
 *
 * State machine:
 *   Disconnected --connect--> Connecting --ok--> Connected
 *   Connected --disconnect / connection lost--> Disconnected
 *   Connecting --error--> Failed (terminal: build a new handle to retry)
 *
 * Only one connected handle may own a given (host, port) inside the process;
 * a second `connect` fails with `Errc::device_busy`. Every operation other
 * than `connect` fails with `Errc::not_connected` unless Connected.
 *
 * Methods may be called concurrently; each command is correlated on its own
 * sequence id by the dispatcher.
 */
class DeviceHandle {
public:
    explicit DeviceHandle(DeviceOptions options = {},
                          const ParameterRegistry& registry = ParameterRegistry::defaults());
    ~DeviceHandle();

    DeviceHandle(const DeviceHandle&) = delete;
    DeviceHandle& operator=(const DeviceHandle&) = delete;
    DeviceHandle(DeviceHandle&&) = delete;
    DeviceHandle& operator=(DeviceHandle&&) = delete;

    expected<void> connect(const DeviceAddress& address);

    /// Idempotent. Pending commands fail with `Errc::connection_closed`.
    void disconnect();

    ConnectionState state() const { return currentState.load(); }
    bool isConnected() const { return state() == ConnectionState::Connected; }
    std::optional<DeviceAddress> address() const;

    expected<ParameterValue> get(std::string_view name);
    expected<void> set(std::string_view name, const ParameterValue& value);

    expected<void> startStreaming();
    expected<void> stopStreaming();

    /// Round-trips a Keepalive frame.
    expected<void> keepalive();

    /// Flashes the front LED so the box can be found on a shelf.
    expected<void> identify();

    /// Reads every readable parameter. Stops at the first failure.
    expected<Settings> settings();

    const ParameterRegistry& parameters() const { return registry; }

private:
    std::shared_ptr<CommandDispatcher> activeDispatcher() const;
    std::chrono::milliseconds commandTimeout() const;
    expected<void> toggleStreaming(bool enabled);
    void onConnectionLost(const std::error_code& reason);
    void releaseClaim();

    DeviceOptions options;
    const ParameterRegistry& registry;

    mutable std::mutex mutex;
    std::shared_ptr<CommandDispatcher> dispatcher;
    std::optional<DeviceAddress> connectedAddress;
    std::atomic<ConnectionState> currentState{ConnectionState::Disconnected};
};

} // namespace hs602::device
