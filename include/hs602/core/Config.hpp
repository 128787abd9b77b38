#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace hs602::config {

/**
 * @brief Constants that define HS602 networking and protocol limits.
 *
 * Keeping the values here prevents magic numbers from drifting across
 * translation units. Anything a caller may want to change per device is
 * exposed through the option structs instead (DiscoveryConfig,
 * ConnectOptions, DeviceOptions).
 */

// Networking ------------------------------------------------------------------
constexpr std::uint16_t HS602_CONTROL_PORT_DEFAULT = 8087;   // TCP command port
constexpr std::uint16_t HS602_DISCOVERY_PORT_DEFAULT = 8086; // UDP broadcast / knock port
constexpr const char* HS602_BROADCAST_ADDRESS = "255.255.255.255";

// Protocol --------------------------------------------------------------------
constexpr std::size_t HS602_MAX_PAYLOAD = 1024;       // larger declared lengths are rejected
constexpr std::size_t HS602_MAX_DATAGRAM = 2048;
constexpr std::size_t HS602_MAX_STRING_LENGTH = 255;  // device-side string buffers
constexpr std::uint8_t HS602_KNOCK_OPCODE = 0x43;

// Timing ----------------------------------------------------------------------
constexpr std::chrono::milliseconds HS602_DISCOVERY_WINDOW{2000};
constexpr std::chrono::milliseconds HS602_CONNECT_TIMEOUT{3000};
constexpr std::chrono::milliseconds HS602_COMMAND_TIMEOUT{1000};
constexpr std::chrono::milliseconds HS602_SEND_TIMEOUT{1000};

} // namespace hs602::config
