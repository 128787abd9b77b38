// Frame.hpp
// -----------------------------------------------------------------------------
// HS602 command frame: an 8-byte little-endian header followed by the payload.
//
//   offset  size  field
//   0       1     opcode
//   1       1     reserved (always 0)
//   2       2     parameterId
//   4       2     sequenceId
//   6       2     payloadLength  (<= HS602_MAX_PAYLOAD)

#pragma once

#include "hs602/core/Config.hpp"
#include "hs602/protocol/ByteBuffer.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace hs602::protocol {

enum class Opcode : std::uint8_t {
    Keepalive     = 0x00,
    Get           = 0x01,
    Set           = 0x02,
    StreamToggle  = 0x0F,
    DiscoverProbe = 0x43,
    DiscoverReply = 0x44,
    Nack          = 0x7F
};

constexpr std::size_t HS602_HEADER_SIZE = 8;

struct CommandFrame {
    Opcode opcode = Opcode::Keepalive;
    std::uint16_t parameterId = 0;
    std::uint16_t sequenceId = 0;
    Payload payload;

    friend bool operator==(const CommandFrame& a, const CommandFrame& b) {
        return a.opcode == b.opcode && a.parameterId == b.parameterId &&
               a.sequenceId == b.sequenceId && a.payload == b.payload;
    }
    friend bool operator!=(const CommandFrame& a, const CommandFrame& b) { return !(a == b); }
};

const char* toString(Opcode opcode);

/// One-line summary for logs, e.g. "GET param=0x0002 seq=17 len=0".
std::string describe(const CommandFrame& frame);

std::string toHexLine(const std::uint8_t* data, std::size_t size);

} // namespace hs602::protocol
