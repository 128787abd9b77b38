#pragma once

#include "hs602/core/Expected.hpp"
#include "hs602/protocol/Frame.hpp"

#include <cstddef>
#include <cstdint>
#include <system_error>
#include <vector>

namespace hs602::protocol {

/**
 * @brief Serialise a frame into header + payload bytes.
 *
 * Fails with `Errc::protocol_error` if the payload exceeds the protocol maximum.
 */
expected<Payload> encodeFrame(const CommandFrame& frame);

/**
 * @brief Decode the frame at the front of a byte buffer.
 *
 * On success `consumed` is the full frame length. Errors:
 * - `Errc::incomplete_frame`: the buffer ends before the frame does
 *   (`consumed` is 0, wait for more bytes).
 * - `Errc::protocol_error`: unknown opcode, non-zero reserved byte or an
 *   implausible payload length. `consumed` is the number of bytes the caller
 *   should discard: the whole frame when its length is believable, otherwise
 *   the whole buffer since the stream cannot be resynchronised.
 */
expected<CommandFrame> decodeFrame(const std::uint8_t* data, std::size_t size,
                                   std::size_t& consumed);

/// Every complete frame in a buffer plus how many bytes they used.
struct DecodeBatch {
    std::vector<CommandFrame> frames;
    std::size_t consumed = 0;
    std::error_code error; ///< first protocol error seen, if any
};

/// Decodes frames until the buffer is exhausted or ends in a partial frame.
/// Malformed frames are discarded and reported through `error`.
DecodeBatch decodeFrames(const std::uint8_t* data, std::size_t size);

/**
 * @brief Stream reassembler: feed arbitrary chunks, pull whole frames.
 *
 * Bytes of a truncated trailing frame stay buffered for the next `feed`.
 */
class FrameDecoder {
public:
    /// Appends bytes and returns every frame completed by them.
    DecodeBatch feed(const std::uint8_t* data, std::size_t size);

    std::size_t buffered() const { return pending.size(); }

private:
    Payload pending;
};

} // namespace hs602::protocol
