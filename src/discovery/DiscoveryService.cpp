#include "hs602/discovery/DiscoveryService.hpp"

#include "hs602/log/Log.hpp"
#include "hs602/net/NetService.hpp"
#include "hs602/net/UdpSocket.hpp"
#include "hs602/protocol/FrameCodec.hpp"

#include <algorithm>
#include <array>

namespace hs602::discovery {

namespace asio = hs602::net::asio;
using hs602::net::udp;
using hs602::protocol::CommandFrame;
using hs602::protocol::Opcode;

DiscoveryService::DiscoveryService(DiscoveryConfig config)
: config(std::move(config))
{}

expected<std::vector<DeviceAddress>>
DiscoveryService::discover(std::chrono::milliseconds window) const {
    std::error_code ec;
    const auto target = asio::ip::make_address_v4(config.broadcastAddress, ec);
    if (ec) {
        logError("[Discovery] invalid broadcast address ", config.broadcastAddress,
                 ": ", ec.message(), "\n");
        return unexpected(ec);
    }

    net::UdpSocket socket(net::io_context());
    if (ec = socket.open_v4(); ec) {
        logError("[Discovery] open failed: ", ec.message(), "\n");
        return unexpected(ec);
    }
    if (ec = socket.enable_broadcast(); ec) {
        logError("[Discovery] SO_BROADCAST failed: ", ec.message(), "\n");
        return unexpected(ec);
    }
    if (ec = socket.bind_any(config.bindPort); ec) {
        logError("[Discovery] bind to port ", config.bindPort, " failed: ", ec.message(), "\n");
        return unexpected(ec);
    }

    CommandFrame probe;
    probe.opcode = Opcode::DiscoverProbe;
    auto probeBytes = protocol::encodeFrame(probe);
    if (!probeBytes) {
        return unexpected(probeBytes.error());
    }

    const auto deadline = std::chrono::steady_clock::now() + window;
    const udp::endpoint destination(target, config.discoveryPort);
    if (ec = socket.send_to(probeBytes->data(), probeBytes->size(), destination, window); ec) {
        logError("[Discovery] probe to ", destination.address().to_string(), ":",
                 destination.port(), " failed: ", ec.message(), "\n");
        return unexpected(ec);
    }
    logInfo("[Discovery] probe sent to ", destination.address().to_string(), ":",
            destination.port(), ", listening for ", window.count(), "ms\n");

    std::vector<DeviceAddress> found;
    std::array<std::uint8_t, config::HS602_MAX_DATAGRAM> datagram{};

    for (;;) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);

        udp::endpoint sender;
        std::size_t received = 0;
        ec = socket.recv_from(datagram.data(), datagram.size(), sender, received, remaining);
        if (ec == asio::error::timed_out) {
            break;
        }
        if (ec) {
            // ICMP noise (e.g. connection_refused on Linux) must not end the window early.
            logDebug("[Discovery] receive error ignored: ", ec.message(), "\n");
            continue;
        }

        std::size_t used = 0;
        auto reply = protocol::decodeFrame(datagram.data(), received, used);
        if (!reply || reply->opcode != Opcode::DiscoverReply) {
            logDebug("[Discovery] ignoring datagram from ", sender.address().to_string(),
                     " | ", protocol::toHexLine(datagram.data(), received), "\n");
            continue;
        }

        DeviceAddress device;
        device.host = sender.address().to_string();
        device.port = config.controlPort;
        device.model.assign(reply->payload.begin(), reply->payload.end());

        const bool duplicate = std::any_of(found.begin(), found.end(),
            [&](const DeviceAddress& known){ return known.host == device.host; });
        if (duplicate) {
            continue;
        }
        logInfo("[Discovery] found ", device, "\n");
        found.push_back(std::move(device));
    }

    return found;
}

} // namespace hs602::discovery
