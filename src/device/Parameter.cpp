#include "hs602/device/Parameter.hpp"

#include "hs602/core/Error.hpp"
#include "hs602/log/Log.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <type_traits>

namespace hs602::device {

using protocol::ByteBuffer;
using protocol::Payload;

namespace {

unexpected_t<std::error_code> rejected(const Parameter& parameter, std::string_view why) {
    logError("[Parameter] ", parameter.name, ": ", why, "\n");
    return unexpected(make_error_code(Errc::validation_failed));
}

unexpected_t<std::error_code> malformed(const Parameter& parameter, std::string_view why) {
    logError("[Parameter] bad ", parameter.name, " response: ", why, "\n");
    return unexpected(make_error_code(Errc::protocol_error));
}

const EnumOption* findOption(const Parameter& parameter, std::string_view name) {
    auto it = std::find_if(parameter.options.begin(), parameter.options.end(),
        [&](const EnumOption& option){ return option.name == name; });
    return it == parameter.options.end() ? nullptr : &*it;
}

const EnumOption* findOption(const Parameter& parameter, std::uint8_t code) {
    auto it = std::find_if(parameter.options.begin(), parameter.options.end(),
        [&](const EnumOption& option){ return option.code == code; });
    return it == parameter.options.end() ? nullptr : &*it;
}

bool holdsKind(const Parameter& parameter, const ParameterValue& value) {
    switch (parameter.kind) {
        case ValueKind::Int:    return std::holds_alternative<std::int64_t>(value);
        case ValueKind::String:
        case ValueKind::Enum:   return std::holds_alternative<std::string>(value);
        case ValueKind::Bool:   return std::holds_alternative<bool>(value);
        case ValueKind::Size:   return std::holds_alternative<PictureSize>(value);
    }
    return false;
}

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return out;
}

bool parseInteger(std::string_view text, std::int64_t& out) {
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

} // namespace

const char* toString(ValueKind kind) {
    switch (kind) {
        case ValueKind::Int:    return "int";
        case ValueKind::String: return "string";
        case ValueKind::Enum:   return "enum";
        case ValueKind::Bool:   return "bool";
        case ValueKind::Size:   return "size";
    }
    return "unknown";
}

expected<void> validate(const Parameter& parameter, const ParameterValue& value) {
    if (!parameter.writable()) {
        return rejected(parameter, "parameter is read-only");
    }
    if (!holdsKind(parameter, value)) {
        return rejected(parameter, std::string("expected a ") + toString(parameter.kind) + " value");
    }

    switch (parameter.kind) {
        case ValueKind::Int: {
            const auto v = std::get<std::int64_t>(value);
            if (v < parameter.minimum || v > parameter.maximum) {
                std::ostringstream why;
                why << v << " outside " << parameter.minimum << "-" << parameter.maximum;
                return rejected(parameter, why.str());
            }
            break;
        }
        case ValueKind::String: {
            const auto& text = std::get<std::string>(value);
            const auto length = static_cast<std::int64_t>(text.size());
            if (length < parameter.minimum || length > parameter.maximum) {
                std::ostringstream why;
                why << "length " << length << " outside " << parameter.minimum << "-" << parameter.maximum;
                return rejected(parameter, why.str());
            }
            // The device reads strings up to the first NUL.
            if (text.find('\0') != std::string::npos) {
                return rejected(parameter, "embedded NUL byte");
            }
            const bool blank = std::all_of(text.begin(), text.end(),
                [](unsigned char c){ return std::isspace(c) != 0; });
            if (blank) {
                return rejected(parameter, "value is only whitespace");
            }
            break;
        }
        case ValueKind::Enum: {
            const auto& name = std::get<std::string>(value);
            if (!findOption(parameter, std::string_view(name))) {
                return rejected(parameter, "unknown option '" + name + "'");
            }
            break;
        }
        case ValueKind::Bool:
            break;
        case ValueKind::Size: {
            const auto size = std::get<PictureSize>(value);
            if (size.width < parameter.minSize.width || size.width > parameter.maxSize.width ||
                size.height < parameter.minSize.height || size.height > parameter.maxSize.height) {
                std::ostringstream why;
                why << size.width << "x" << size.height << " outside "
                    << parameter.minSize.width << "x" << parameter.minSize.height << "-"
                    << parameter.maxSize.width << "x" << parameter.maxSize.height;
                return rejected(parameter, why.str());
            }
            break;
        }
    }
    return {};
}

expected<Payload> encodeValue(const Parameter& parameter, const ParameterValue& value) {
    if (auto ok = validate(parameter, value); !ok) {
        return unexpected(ok.error());
    }

    ByteBuffer out;
    switch (parameter.kind) {
        case ValueKind::Int:
            out.appendInt32(static_cast<std::int32_t>(std::get<std::int64_t>(value)));
            break;
        case ValueKind::String:
            out.appendString(std::get<std::string>(value));
            break;
        case ValueKind::Enum:
            out.appendUInt8(findOption(parameter, std::string_view(std::get<std::string>(value)))->code);
            break;
        case ValueKind::Bool:
            out.appendUInt8(std::get<bool>(value) ? 1 : 0);
            break;
        case ValueKind::Size: {
            const auto size = std::get<PictureSize>(value);
            out.appendUInt16(size.width);
            out.appendUInt16(size.height);
            break;
        }
    }
    return out.release();
}

expected<ParameterValue> decodeValue(const Parameter& parameter, const Payload& payload) {
    switch (parameter.kind) {
        case ValueKind::Int:
            if (payload.size() < 4) return malformed(parameter, "need 4 bytes");
            return ParameterValue{static_cast<std::int64_t>(protocol::readInt32(payload.data()))};
        case ValueKind::String: {
            // Device buffers are NUL padded.
            auto end = std::find(payload.begin(), payload.end(), std::uint8_t{0});
            return ParameterValue{std::string(payload.begin(), end)};
        }
        case ValueKind::Enum: {
            if (payload.empty()) return malformed(parameter, "need 1 byte");
            const auto* option = findOption(parameter, payload[0]);
            if (!option) {
                return malformed(parameter, "unknown code " + std::to_string(payload[0]));
            }
            return ParameterValue{std::string(option->name)};
        }
        case ValueKind::Bool:
            if (payload.empty()) return malformed(parameter, "need 1 byte");
            return ParameterValue{payload[0] != 0};
        case ValueKind::Size:
            if (payload.size() < 4) return malformed(parameter, "need 4 bytes");
            return ParameterValue{PictureSize{protocol::readUInt16(payload.data()),
                                              protocol::readUInt16(payload.data() + 2)}};
    }
    return malformed(parameter, "unsupported kind");
}

expected<ParameterValue> parseValue(const Parameter& parameter, std::string_view text) {
    switch (parameter.kind) {
        case ValueKind::Int: {
            std::int64_t v = 0;
            if (!parseInteger(text, v)) return rejected(parameter, "not an integer");
            return ParameterValue{v};
        }
        case ValueKind::String:
        case ValueKind::Enum:
            return ParameterValue{std::string(text)};
        case ValueKind::Bool: {
            const auto word = lowercase(text);
            if (word == "1" || word == "true" || word == "on" || word == "yes") return ParameterValue{true};
            if (word == "0" || word == "false" || word == "off" || word == "no") return ParameterValue{false};
            return rejected(parameter, "not a boolean");
        }
        case ValueKind::Size: {
            const auto split = text.find_first_of("x,");
            std::int64_t width = 0;
            std::int64_t height = 0;
            if (split == std::string_view::npos ||
                !parseInteger(text.substr(0, split), width) ||
                !parseInteger(text.substr(split + 1), height) ||
                width < 0 || width > 0xFFFF || height < 0 || height > 0xFFFF) {
                return rejected(parameter, "expected WIDTHxHEIGHT");
            }
            return ParameterValue{PictureSize{static_cast<std::uint16_t>(width),
                                              static_cast<std::uint16_t>(height)}};
        }
    }
    return rejected(parameter, "unsupported kind");
}

std::string formatValue(const ParameterValue& value) {
    std::ostringstream os;
    os << value;
    return os.str();
}

std::string displayValue(const Parameter& parameter, const ParameterValue& value) {
    return parameter.secret ? std::string("***") : formatValue(value);
}

std::ostream& operator<<(std::ostream& os, const ParameterValue& value) {
    std::visit([&os](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            os << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, PictureSize>) {
            os << v.width << "x" << v.height;
        } else {
            os << v;
        }
    }, value);
    return os;
}

} // namespace hs602::device
