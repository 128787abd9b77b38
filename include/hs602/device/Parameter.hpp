#pragma once

#include "hs602/core/Expected.hpp"
#include "hs602/protocol/ByteBuffer.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hs602::device {

enum class ValueKind : std::uint8_t {
    Int,     ///< i32, little-endian
    String,  ///< raw bytes, 1-255 long
    Enum,    ///< one byte code, exposed by name
    Bool,    ///< one byte, 0 or 1
    Size     ///< u16 width + u16 height
};

enum class Access : std::uint8_t { ReadWrite, ReadOnly, WriteOnly };

struct PictureSize {
    std::uint16_t width = 0;
    std::uint16_t height = 0;

    friend bool operator==(const PictureSize& a, const PictureSize& b) {
        return a.width == b.width && a.height == b.height;
    }
    friend bool operator!=(const PictureSize& a, const PictureSize& b) { return !(a == b); }
};

/// Enum parameters travel as their option name (e.g. "hdmi").
using ParameterValue = std::variant<std::int64_t, std::string, bool, PictureSize>;

struct EnumOption {
    std::string_view name;
    std::uint8_t code = 0;
};

/**
 * @brief Static description of one device setting.
 *
 * `minimum`/`maximum` bound the value of Int parameters and the length of
 * String parameters. `minSize`/`maxSize` bound Size parameters. Enum
 * parameters accept exactly the names in `options`.
 */
struct Parameter {
    std::string_view name;
    std::uint16_t parameterId = 0;
    ValueKind kind = ValueKind::Int;
    Access access = Access::ReadWrite;
    std::int64_t minimum = 0;
    std::int64_t maximum = 0;
    PictureSize minSize{};
    PictureSize maxSize{};
    std::vector<EnumOption> options{};

    /// Credentials; never written to the log.
    bool secret = false;

    bool readable() const { return access != Access::WriteOnly; }
    bool writable() const { return access != Access::ReadOnly; }
};

const char* toString(ValueKind kind);

/// Checks kind, access and limits. Fails with `Errc::validation_failed`.
expected<void> validate(const Parameter& parameter, const ParameterValue& value);

/// Validates, then encodes the SET payload.
expected<protocol::Payload> encodeValue(const Parameter& parameter, const ParameterValue& value);

/// Decodes a GET response payload. Fails with `Errc::protocol_error`.
expected<ParameterValue> decodeValue(const Parameter& parameter, const protocol::Payload& payload);

/// Turns user text into a value of the parameter's kind ("1280x720" for
/// sizes, "true"/"on"/"1" for bools). Range checks are left to `validate`.
expected<ParameterValue> parseValue(const Parameter& parameter, std::string_view text);

std::string formatValue(const ParameterValue& value);

/// `formatValue`, or "***" for secret parameters.
std::string displayValue(const Parameter& parameter, const ParameterValue& value);

std::ostream& operator<<(std::ostream& os, const ParameterValue& value);

} // namespace hs602::device
