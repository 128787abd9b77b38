#pragma once

#include "hs602/core/Config.hpp"
#include "hs602/core/DeviceAddress.hpp"
#include "hs602/core/Expected.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace hs602::discovery {

struct DiscoveryConfig {
    /// Where the probe is sent. A unicast address works too (useful on
    /// networks that filter broadcast, and in tests).
    std::string broadcastAddress = config::HS602_BROADCAST_ADDRESS;
    std::uint16_t discoveryPort = config::HS602_DISCOVERY_PORT_DEFAULT;

    /// Local port to bind; 0 picks an ephemeral port.
    std::uint16_t bindPort = 0;

    /// Control port recorded in every discovered DeviceAddress.
    std::uint16_t controlPort = config::HS602_CONTROL_PORT_DEFAULT;
};

/**
 * @brief Finds HS602 appliances on the local network.
 *
 * `discover(window)` broadcasts one DiscoverProbe frame and collects
 * DiscoverReply frames until the window closes. There is no signal that every
 * device has answered, so the call always lasts the full window; replies that
 * arrive later are never seen. Results are deduplicated by source host and
 * returned in arrival order. Nothing is kept between calls.
 */
class DiscoveryService {
public:
    explicit DiscoveryService(DiscoveryConfig config = {});

    expected<std::vector<DeviceAddress>>
    discover(std::chrono::milliseconds window = config::HS602_DISCOVERY_WINDOW) const;

    const DiscoveryConfig& configuration() const { return config; }

private:
    DiscoveryConfig config;
};

} // namespace hs602::discovery
