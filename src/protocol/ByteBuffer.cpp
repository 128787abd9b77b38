#include "hs602/protocol/ByteBuffer.hpp"

namespace hs602::protocol {

void ByteBuffer::appendUInt8(std::uint8_t value) {
    buffer.push_back(value);
}

void ByteBuffer::appendUInt16(std::uint16_t value) {
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
}

void ByteBuffer::appendUInt32(std::uint32_t value) {
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFFu));
}

void ByteBuffer::appendInt32(std::int32_t value) {
    appendUInt32(static_cast<std::uint32_t>(value));
}

void ByteBuffer::appendString(std::string_view text) {
    for (char c : text) {
        buffer.push_back(static_cast<std::uint8_t>(c));
    }
}

std::uint16_t readUInt16(const std::uint8_t* data) {
    return static_cast<std::uint16_t>(data[0])
         | static_cast<std::uint16_t>(static_cast<std::uint16_t>(data[1]) << 8);
}

std::uint32_t readUInt32(const std::uint8_t* data) {
    return static_cast<std::uint32_t>(data[0])
         | (static_cast<std::uint32_t>(data[1]) << 8)
         | (static_cast<std::uint32_t>(data[2]) << 16)
         | (static_cast<std::uint32_t>(data[3]) << 24);
}

std::int32_t readInt32(const std::uint8_t* data) {
    return static_cast<std::int32_t>(readUInt32(data));
}

} // namespace hs602::protocol
