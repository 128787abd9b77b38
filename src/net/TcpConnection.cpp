/**
 * @brief TCP transport for the HS602 control protocol: knock, connect, raw I/O.
 */
#include "hs602/net/TcpConnection.hpp"

#include "hs602/core/Error.hpp"
#include "hs602/log/Log.hpp"
#include "hs602/net/NetService.hpp"
#include "hs602/net/Resolve.hpp"
#include "hs602/net/UdpSocket.hpp"

#include <array>

namespace hs602::net {

std::error_code sendKnock(const asio::ip::address_v4& device, std::uint16_t port,
                          std::chrono::milliseconds timeout) {
    const auto octets = device.to_bytes();
    const std::array<std::uint8_t, 5> knock{
        config::HS602_KNOCK_OPCODE, octets[3], octets[2], octets[1], octets[0]};

    UdpSocket socket(io_context());
    if (auto ec = socket.open_v4(); ec) {
        return ec;
    }
    // A knock to the subnet broadcast address needs SO_BROADCAST.
    if (auto ec = socket.enable_broadcast(); ec) {
        logDebug("[TcpConnection] SO_BROADCAST unavailable for knock: ", ec.message(), "\n");
    }
    return socket.send_to(knock.data(), knock.size(), udp::endpoint(device, port), timeout);
}

TcpConnection::TcpConnection(DeviceAddress address, std::chrono::milliseconds sendTimeout)
: address(std::move(address))
, sendTimeout(sendTimeout)
{}

TcpConnection::~TcpConnection() {
    close();
}

expected<std::shared_ptr<Connection>>
TcpConnection::open(const DeviceAddress& address, const ConnectOptions& options) {
    auto ip = resolveV4(io_context(), address.host);
    if (!ip) {
        logError("[TcpConnection] cannot resolve ", address.host, ": ",
                 ip.error().message(), "\n");
        return unexpected(make_error_code(Errc::connect_failed));
    }

    if (options.knock) {
        if (auto ec = sendKnock(*ip, options.knockPort, options.connectTimeout); ec) {
            logError("[TcpConnection] knock to ", ip->to_string(), ":", options.knockPort,
                     " failed: ", ec.message(), "\n");
            return unexpected(make_error_code(Errc::connect_failed));
        }
    }

    std::shared_ptr<TcpConnection> connection(new TcpConnection(address, options.sendTimeout));
    const tcp::endpoint endpoint(*ip, address.port);
    if (auto ec = connection->tcpClient.connect(endpoint, options.connectTimeout); ec) {
        logError("[TcpConnection] connect failed: ", ec.message(),
                 " (to ", address.toString(), ")",
                 " timeout=", options.connectTimeout.count(), "ms\n");
        return unexpected(make_error_code(Errc::connect_failed));
    }

    connection->tcpClient.setLowLatency();
    logInfo("[TcpConnection] connected to ", address.toString(), "\n");
    return std::shared_ptr<Connection>(std::move(connection));
}

std::error_code TcpConnection::send(const std::uint8_t* data, std::size_t size) {
    return tcpClient.write_all(data, size, sendTimeout);
}

expected<std::size_t> TcpConnection::receive(std::uint8_t* buffer, std::size_t capacity) {
    std::size_t received = 0;
    if (auto ec = tcpClient.read_some(buffer, capacity, received); ec) {
        return unexpected(ec);
    }
    return received;
}

void TcpConnection::close() {
    if (!tcpClient.is_open()) {
        return;
    }
    logInfo("[TcpConnection] closing ", address.toString(), "\n");
    tcpClient.close();
}

bool TcpConnection::isOpen() const {
    return tcpClient.is_open();
}

std::string TcpConnection::describe() const {
    return address.toString();
}

} // namespace hs602::net
