#pragma once

#include "hs602/core/Config.hpp"
#include "hs602/core/DeviceAddress.hpp"
#include "hs602/core/Expected.hpp"
#include "hs602/net/Connection.hpp"
#include "hs602/net/TcpClient.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace hs602::net {

struct ConnectOptions {
    std::chrono::milliseconds connectTimeout = config::HS602_CONNECT_TIMEOUT;
    std::chrono::milliseconds sendTimeout = config::HS602_SEND_TIMEOUT;

    /// Send the wake-up datagram to `knockPort` before opening the TCP socket.
    bool knock = true;
    std::uint16_t knockPort = config::HS602_DISCOVERY_PORT_DEFAULT;
};

/**
 * @brief TCP control connection to an HS602 appliance.
 *
 * The appliance keeps its command port closed until it receives a knock:
 * a UDP datagram of `0x43` followed by the device's own IPv4 octets in
 * reverse order. `open()` sends it (when enabled) and then connects.
 */
class TcpConnection : public Connection {
public:
    static expected<std::shared_ptr<Connection>>
    open(const DeviceAddress& address, const ConnectOptions& options = {});

    ~TcpConnection() override;

    std::error_code send(const std::uint8_t* data, std::size_t size) override;
    expected<std::size_t> receive(std::uint8_t* buffer, std::size_t capacity) override;
    void close() override;
    bool isOpen() const override;
    std::string describe() const override;

private:
    TcpConnection(DeviceAddress address, std::chrono::milliseconds sendTimeout);

    DeviceAddress address;
    std::chrono::milliseconds sendTimeout;
    TcpClient tcpClient;
};

/// Send the knock datagram for `device` to `port`. Exposed for the CLI and tests.
std::error_code sendKnock(const asio::ip::address_v4& device, std::uint16_t port,
                          std::chrono::milliseconds timeout);

} // namespace hs602::net
