#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace hs602::protocol {

using Payload = std::vector<std::uint8_t>;

/// Growable little-endian writer used to build frame payloads.
class ByteBuffer {
public:
    ByteBuffer() = default;

    void appendUInt8(std::uint8_t value);
    void appendUInt16(std::uint16_t value);
    void appendUInt32(std::uint32_t value);
    void appendInt32(std::int32_t value);
    void appendString(std::string_view text);

    Payload release() { return std::move(buffer); }

private:
    Payload buffer;
};

std::uint16_t readUInt16(const std::uint8_t* data);
std::uint32_t readUInt32(const std::uint8_t* data);
std::int32_t readInt32(const std::uint8_t* data);

} // namespace hs602::protocol
