// FrameCodec.cpp
// -----------------------------------------------------------------------------
// Header layout lives in two schemas: a permissive one that only needs the
// bytes to be present (used to learn the payload length of a frame we may
// have to skip), and the strict one that enforces the opcode table, the
// reserved byte and the payload limit.

#include "hs602/protocol/FrameCodec.hpp"

#include "hs602/core/Error.hpp"
#include "hs602/log/Log.hpp"
#include "hs602/schema/hs602_schema.hpp"

namespace hs602::protocol {

namespace {

namespace sch = ::hs602::schema;

struct FrameHeader {
    Opcode opcode = Opcode::Keepalive;
    std::uint8_t reserved = 0;
    std::uint16_t parameterId = 0;
    std::uint16_t sequenceId = 0;
    std::uint16_t payloadLength = 0;
};

using KnownOpcodes = sch::OneOf<0x00, 0x01, 0x02, 0x0F, 0x43, 0x44, 0x7F>;
using PayloadLimit = sch::AtMost<static_cast<unsigned>(config::HS602_MAX_PAYLOAD)>;

const auto rawHeaderSchema = sch::makeSchema<FrameHeader>(std::make_tuple(
    sch::field<&FrameHeader::opcode       >("opcode"       , sch::LeU8{} ),
    sch::field<&FrameHeader::reserved     >("reserved"     , sch::LeU8{} ),
    sch::field<&FrameHeader::parameterId  >("parameterId"  , sch::LeU16{}),
    sch::field<&FrameHeader::sequenceId   >("sequenceId"   , sch::LeU16{}),
    sch::field<&FrameHeader::payloadLength>("payloadLength", sch::LeU16{})
));

const auto headerSchema = sch::makeSchema<FrameHeader>(std::make_tuple(
    sch::field<&FrameHeader::opcode       >("opcode"       , sch::LeU8{} , KnownOpcodes{}),
    sch::field<&FrameHeader::reserved     >("reserved"     , sch::LeU8{} , sch::Equals<0>{}),
    sch::field<&FrameHeader::parameterId  >("parameterId"  , sch::LeU16{}),
    sch::field<&FrameHeader::sequenceId   >("sequenceId"   , sch::LeU16{}),
    sch::field<&FrameHeader::payloadLength>("payloadLength", sch::LeU16{}, PayloadLimit{})
));

} // namespace

expected<Payload> encodeFrame(const CommandFrame& frame) {
    if (frame.payload.size() > config::HS602_MAX_PAYLOAD) {
        logError("[FrameCodec] payload of ", frame.payload.size(), " bytes exceeds ",
                 config::HS602_MAX_PAYLOAD, "\n");
        return unexpected(make_error_code(Errc::protocol_error));
    }

    FrameHeader header;
    header.opcode = frame.opcode;
    header.parameterId = frame.parameterId;
    header.sequenceId = frame.sequenceId;
    header.payloadLength = static_cast<std::uint16_t>(frame.payload.size());

    Payload bytes;
    bytes.reserve(HS602_HEADER_SIZE + frame.payload.size());
    if (auto ok = sch::encode(headerSchema, header, bytes); !ok) {
        logError("[FrameCodec] cannot encode ", ok.error().where, ": ", ok.error().what, "\n");
        return unexpected(make_error_code(Errc::protocol_error));
    }
    bytes.insert(bytes.end(), frame.payload.begin(), frame.payload.end());
    return bytes;
}

expected<CommandFrame> decodeFrame(const std::uint8_t* data, std::size_t size,
                                   std::size_t& consumed) {
    consumed = 0;
    sch::ByteView view(data, size);

    auto raw = sch::decode(rawHeaderSchema, view);
    if (!raw) {
        return unexpected(make_error_code(Errc::incomplete_frame));
    }

    if (raw->payloadLength > config::HS602_MAX_PAYLOAD) {
        logError("[FrameCodec] implausible payload length ", raw->payloadLength,
                 ", dropping ", size, " buffered bytes\n");
        consumed = size;
        return unexpected(make_error_code(Errc::protocol_error));
    }

    const std::size_t frameSize = HS602_HEADER_SIZE + raw->payloadLength;
    if (size < frameSize) {
        return unexpected(make_error_code(Errc::incomplete_frame));
    }

    sch::ByteView strictView(data, size);
    auto header = sch::decode(headerSchema, strictView);
    if (!header) {
        logError("[FrameCodec] bad header field ", header.error().where, ": ",
                 header.error().what, " | ", toHexLine(data, HS602_HEADER_SIZE), "\n");
        consumed = frameSize;
        return unexpected(make_error_code(Errc::protocol_error));
    }

    CommandFrame frame;
    frame.opcode = header->opcode;
    frame.parameterId = header->parameterId;
    frame.sequenceId = header->sequenceId;
    frame.payload.assign(data + HS602_HEADER_SIZE, data + frameSize);
    consumed = frameSize;
    return frame;
}

DecodeBatch decodeFrames(const std::uint8_t* data, std::size_t size) {
    DecodeBatch batch;
    while (batch.consumed < size) {
        std::size_t used = 0;
        auto frame = decodeFrame(data + batch.consumed, size - batch.consumed, used);
        if (frame) {
            batch.frames.push_back(std::move(*frame));
        } else if (frame.error() == Errc::incomplete_frame) {
            break;
        } else if (!batch.error) {
            batch.error = frame.error();
        }
        batch.consumed += used;
    }
    return batch;
}

DecodeBatch FrameDecoder::feed(const std::uint8_t* data, std::size_t size) {
    pending.insert(pending.end(), data, data + size);
    auto batch = decodeFrames(pending.data(), pending.size());
    pending.erase(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(batch.consumed));
    return batch;
}

} // namespace hs602::protocol
