#include "hs602/device/DeviceHandle.hpp"

#include "hs602/core/Error.hpp"
#include "hs602/log/Log.hpp"

#include <set>

namespace hs602::device {

namespace {

// Addresses owned by a connected handle somewhere in this process.
struct Claims {
    std::mutex mutex;
    std::set<DeviceAddress> owned;
};

Claims& claims() {
    static Claims instance;
    return instance;
}

bool claim(const DeviceAddress& address) {
    auto& c = claims();
    std::lock_guard lock(c.mutex);
    return c.owned.insert(address).second;
}

void release(const DeviceAddress& address) {
    auto& c = claims();
    std::lock_guard lock(c.mutex);
    c.owned.erase(address);
}

} // namespace

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Failed:       return "failed";
    }
    return "unknown";
}

DeviceHandle::DeviceHandle(DeviceOptions options, const ParameterRegistry& registry)
: options(std::move(options))
, registry(registry)
{
    if (!this->options.connectionFactory) {
        const auto connectOptions = this->options.connect;
        this->options.connectionFactory = [connectOptions](const DeviceAddress& address) {
            return net::TcpConnection::open(address, connectOptions);
        };
    }
}

DeviceHandle::~DeviceHandle() {
    disconnect();
}

expected<void> DeviceHandle::connect(const DeviceAddress& address) {
    std::shared_ptr<CommandDispatcher> stale;
    {
        std::lock_guard lock(mutex);
        switch (currentState.load()) {
            case ConnectionState::Failed:
                logError("[DeviceHandle] handle failed earlier, create a new one to reach ", address, "\n");
                return unexpected(make_error_code(Errc::connect_failed));
            case ConnectionState::Connecting:
                return unexpected(make_error_code(Errc::device_busy));
            case ConnectionState::Connected:
                if (connectedAddress && *connectedAddress == address) {
                    return {};
                }
                logError("[DeviceHandle] already connected to ", *connectedAddress, "\n");
                return unexpected(make_error_code(Errc::device_busy));
            case ConnectionState::Disconnected:
                break;
        }
        if (!claim(address)) {
            logError("[DeviceHandle] ", address, " is owned by another handle\n");
            return unexpected(make_error_code(Errc::device_busy));
        }
        // Left behind by a connection the device dropped.
        stale = std::move(dispatcher);
        connectedAddress = address;
        currentState.store(ConnectionState::Connecting);
    }
    if (stale) {
        stale->close();
    }

    logInfo("[DeviceHandle] connecting to ", address, "\n");
    auto connection = options.connectionFactory(address);
    if (!connection) {
        logError("[DeviceHandle] connect to ", address, " failed: ", connection.error().message(), "\n");
        release(address);
        std::lock_guard lock(mutex);
        connectedAddress.reset();
        currentState.store(ConnectionState::Failed);
        return unexpected(make_error_code(Errc::connect_failed));
    }

    auto fresh = std::make_shared<CommandDispatcher>(std::move(*connection));
    CommandDispatcher* raw = fresh.get();
    fresh->setClosedHandler([this, raw](const std::error_code& reason) {
        std::lock_guard lock(mutex);
        if (dispatcher.get() != raw || currentState.load() != ConnectionState::Connected) {
            return;
        }
        onConnectionLost(reason);
    });

    {
        std::lock_guard lock(mutex);
        dispatcher = fresh;
        currentState.store(ConnectionState::Connected);
    }
    fresh->start();
    logInfo("[DeviceHandle] connected to ", address, "\n");
    return {};
}

void DeviceHandle::onConnectionLost(const std::error_code& reason) {
    // Caller holds `mutex`. The dispatcher stays in place until the next
    // connect or disconnect; it cannot be destroyed from its own reader.
    logError("[DeviceHandle] lost ", *connectedAddress, ": ", reason.message(), "\n");
    releaseClaim();
    currentState.store(ConnectionState::Disconnected);
}

void DeviceHandle::releaseClaim() {
    if (connectedAddress) {
        release(*connectedAddress);
        connectedAddress.reset();
    }
}

void DeviceHandle::disconnect() {
    std::shared_ptr<CommandDispatcher> closing;
    {
        std::lock_guard lock(mutex);
        closing = std::move(dispatcher);
        if (currentState.load() == ConnectionState::Connected) {
            logInfo("[DeviceHandle] disconnecting from ", *connectedAddress, "\n");
            releaseClaim();
            currentState.store(ConnectionState::Disconnected);
        }
    }
    // Outside the lock: close() joins the reader, which may be waiting for it.
    if (closing) {
        closing->close();
    }
}

std::optional<DeviceAddress> DeviceHandle::address() const {
    std::lock_guard lock(mutex);
    return connectedAddress;
}

std::shared_ptr<CommandDispatcher> DeviceHandle::activeDispatcher() const {
    std::lock_guard lock(mutex);
    if (currentState.load() != ConnectionState::Connected) {
        return nullptr;
    }
    return dispatcher;
}

std::chrono::milliseconds DeviceHandle::commandTimeout() const {
    if (options.commandTimeout) {
        return net::TimeoutConfig::sanitize(*options.commandTimeout);
    }
    return net::TimeoutConfig::defaultTimeout();
}

expected<ParameterValue> DeviceHandle::get(std::string_view name) {
    auto active = activeDispatcher();
    if (!active) {
        return unexpected(make_error_code(Errc::not_connected));
    }

    const int attempts = 1 + (options.getRetries > 0 ? options.getRetries : 0);
    expected<ParameterValue> result = unexpected(make_error_code(Errc::timed_out));
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        result = registry.get(*active, name, commandTimeout());
        if (result || result.error() != make_error_code(Errc::timed_out)) {
            break;
        }
        if (attempt < attempts) {
            logInfo("[DeviceHandle] GET ", name, " timed out, retry ", attempt, "/", attempts - 1, "\n");
        }
    }
    return result;
}

expected<void> DeviceHandle::set(std::string_view name, const ParameterValue& value) {
    auto active = activeDispatcher();
    if (!active) {
        return unexpected(make_error_code(Errc::not_connected));
    }
    return registry.set(*active, name, value, commandTimeout());
}

expected<void> DeviceHandle::toggleStreaming(bool enabled) {
    auto active = activeDispatcher();
    if (!active) {
        return unexpected(make_error_code(Errc::not_connected));
    }
    auto ack = active->call(Opcode::StreamToggle, 0, Payload{std::uint8_t(enabled ? 1 : 0)},
                            commandTimeout());
    if (!ack) {
        return unexpected(ack.error());
    }
    logInfo("[DeviceHandle] streaming ", enabled ? "started" : "stopped", "\n");
    return {};
}

expected<void> DeviceHandle::startStreaming() {
    return toggleStreaming(true);
}

expected<void> DeviceHandle::stopStreaming() {
    return toggleStreaming(false);
}

expected<void> DeviceHandle::keepalive() {
    auto active = activeDispatcher();
    if (!active) {
        return unexpected(make_error_code(Errc::not_connected));
    }
    auto echo = active->call(Opcode::Keepalive, 0, {}, commandTimeout());
    if (!echo) {
        return unexpected(echo.error());
    }
    return {};
}

expected<void> DeviceHandle::identify() {
    return set("led", ParameterValue{true});
}

expected<Settings> DeviceHandle::settings() {
    if (!activeDispatcher()) {
        return unexpected(make_error_code(Errc::not_connected));
    }
    Settings snapshot;
    for (const auto& parameter : registry.parameters()) {
        if (!parameter.readable()) {
            continue;
        }
        auto value = get(parameter.name);
        if (!value) {
            return unexpected(value.error());
        }
        snapshot.emplace(std::string(parameter.name), std::move(*value));
    }
    return snapshot;
}

} // namespace hs602::device
