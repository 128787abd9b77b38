#include "hs602/protocol/Frame.hpp"

#include <iomanip>
#include <sstream>

namespace hs602::protocol {

const char* toString(Opcode opcode) {
    switch (opcode) {
        case Opcode::Keepalive:     return "KEEPALIVE";
        case Opcode::Get:           return "GET";
        case Opcode::Set:           return "SET";
        case Opcode::StreamToggle:  return "STREAM_TOGGLE";
        case Opcode::DiscoverProbe: return "DISCOVER_PROBE";
        case Opcode::DiscoverReply: return "DISCOVER_REPLY";
        case Opcode::Nack:          return "NACK";
    }
    return "unknown";
}

std::string describe(const CommandFrame& frame) {
    std::ostringstream os;
    os << toString(frame.opcode)
       << " param=0x" << std::hex << std::setw(4) << std::setfill('0') << frame.parameterId
       << std::dec << std::setfill(' ')
       << " seq=" << frame.sequenceId
       << " len=" << frame.payload.size();
    return os.str();
}

std::string toHexLine(const std::uint8_t* data, std::size_t size) {
    if (!data || size == 0) {
        return {};
    }

    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < size; ++i) {
        if (i) os << ' ';
        os << std::setw(2) << static_cast<int>(data[i]);
    }
    return os.str();
}

} // namespace hs602::protocol
