#include "hs602/device/ParameterRegistry.hpp"

#include "hs602/core/Config.hpp"
#include "hs602/core/Error.hpp"
#include "hs602/log/Log.hpp"

#include <algorithm>

namespace hs602::device {

namespace {

constexpr std::int64_t MAX_TEXT = static_cast<std::int64_t>(config::HS602_MAX_STRING_LENGTH);

Parameter text(std::string_view name, std::uint16_t id, Access access = Access::ReadWrite) {
    Parameter p;
    p.name = name;
    p.parameterId = id;
    p.kind = ValueKind::String;
    p.access = access;
    p.minimum = 1;
    p.maximum = MAX_TEXT;
    return p;
}

Parameter credential(std::string_view name, std::uint16_t id) {
    Parameter p = text(name, id);
    p.secret = true;
    return p;
}

Parameter integer(std::string_view name, std::uint16_t id, std::int64_t lo, std::int64_t hi,
                  Access access = Access::ReadWrite) {
    Parameter p;
    p.name = name;
    p.parameterId = id;
    p.kind = ValueKind::Int;
    p.access = access;
    p.minimum = lo;
    p.maximum = hi;
    return p;
}

Parameter flag(std::string_view name, std::uint16_t id, Access access) {
    Parameter p;
    p.name = name;
    p.parameterId = id;
    p.kind = ValueKind::Bool;
    p.access = access;
    return p;
}

Parameter choice(std::string_view name, std::uint16_t id, std::vector<EnumOption> options,
                 Access access = Access::ReadWrite) {
    Parameter p;
    p.name = name;
    p.parameterId = id;
    p.kind = ValueKind::Enum;
    p.access = access;
    p.options = std::move(options);
    return p;
}

// Input timings reported by the capture chip, indexed by code.
std::vector<EnumOption> inputTimings() {
    static const char* const names[] = {
        "1920x1080 60Hz", "1280x720 60Hz",  "720x480 60Hz",   "720x480 60Hz",
        "720x480 60Hz",   "1920x1080 50Hz", "1280x720 50Hz",  "720x576 50Hz",
        "720x576 50Hz",   "720x576 50Hz",   "1920x1080 60Hz", "1280x720 60Hz",
        "720x480 60Hz",   "720x480 60Hz",   "1920x1080 50Hz", "1280x720 50Hz",
        "720x576 50Hz",   "720x576 50Hz",   "720x480 60Hz",   "720x576 50Hz",
        "1920x1080 25Hz", "1920x1080 30Hz", "0x0 60Hz",       "640x480 60Hz",
        "1920x1080 30Hz", "1920x1080 25Hz", "1920x1080 50Hz", "1920x1080 60Hz",
        "1920x1080 24Hz", "1920x1080 60Hz", "1920x1080 50Hz", "1920x1080 24Hz",
        "800x600 60Hz",   "1024x768 60Hz",  "1152x864 60Hz",  "1280x768 60Hz",
        "1280x800 60Hz",  "1280x960 60Hz",  "1280x1024 60Hz", "1360x768 60Hz",
        "1440x900 60Hz",  "1600x900 60Hz",  "1680x1050 60Hz",
    };
    std::vector<EnumOption> options;
    std::uint8_t code = 0;
    for (const char* name : names) {
        options.push_back(EnumOption{name, code++});
    }
    return options;
}

} // namespace

std::vector<Parameter> ParameterRegistry::defaultTable() {
    std::vector<Parameter> table;

    // RTMP target
    table.push_back(text("url",      0x0010));
    table.push_back(credential("key",      0x0011));
    table.push_back(credential("username", 0x0014));
    table.push_back(credential("password", 0x0015));
    table.push_back(text("name",     0x0017));

    // Colour, 0x0A00 | channel
    table.push_back(integer("brightness", 0x0A00, 0, 255));
    table.push_back(integer("contrast",   0x0A01, 0, 255));
    table.push_back(integer("hue",        0x0A02, 0, 255));
    table.push_back(integer("saturation", 0x0A03, 0, 255));

    // Encoder
    table.push_back(choice("source", 0x0001, {{"analogue", 2}, {"hdmi", 3}}));
    table.push_back(integer("bitrate", 0x0002, 500, 20000));

    Parameter picture;
    picture.name = "picture";
    picture.parameterId = 0x0003;
    picture.kind = ValueKind::Size;
    picture.minSize = PictureSize{1, 1};
    picture.maxSize = PictureSize{1920, 1080};
    table.push_back(picture);

    table.push_back(integer("fps", 0x0013, 1, 60));
    table.push_back(choice("mode", 0x0008, {{"unicast", 0}, {"broadcast", 1}, {"tcp", 2}}));

    // Status
    table.push_back(flag("streaming", 0x000F, Access::ReadOnly));
    table.push_back(choice("resolution", 0x0004, inputTimings(), Access::ReadOnly));
    table.push_back(flag("hdcp", 0x0005, Access::ReadOnly));
    table.push_back(integer("clients", 0x0032, 0, 255, Access::ReadOnly));
    table.push_back(text("firmware", 0x0038, Access::ReadOnly));

    // Writing `true` flashes the front LED.
    table.push_back(flag("led", 0x0037, Access::WriteOnly));

    return table;
}

const ParameterRegistry& ParameterRegistry::defaults() {
    static const ParameterRegistry registry(defaultTable());
    return registry;
}

ParameterRegistry::ParameterRegistry(std::vector<Parameter> parameters) {
    table.reserve(parameters.size());
    for (auto& parameter : parameters) {
        const bool clash = std::any_of(table.begin(), table.end(), [&](const Parameter& known){
            return known.name == parameter.name || known.parameterId == parameter.parameterId;
        });
        if (clash) {
            logError("[ParameterRegistry] duplicate entry '", parameter.name, "' (id ",
                     parameter.parameterId, ") ignored\n");
            continue;
        }
        table.push_back(std::move(parameter));
    }
}

expected<const Parameter*> ParameterRegistry::find(std::string_view name) const {
    auto it = std::find_if(table.begin(), table.end(),
        [&](const Parameter& p){ return p.name == name; });
    if (it == table.end()) {
        logError("[ParameterRegistry] unknown parameter '", name, "'\n");
        return unexpected(make_error_code(Errc::unknown_parameter));
    }
    return &*it;
}

expected<ParameterValue> ParameterRegistry::get(CommandDispatcher& dispatcher, std::string_view name,
                                                std::chrono::milliseconds timeout) const {
    auto parameter = find(name);
    if (!parameter) {
        return unexpected(parameter.error());
    }
    const Parameter& p = **parameter;
    if (!p.readable()) {
        logError("[ParameterRegistry] '", p.name, "' is write-only\n");
        return unexpected(make_error_code(Errc::validation_failed));
    }

    auto response = dispatcher.call(Opcode::Get, p.parameterId, {}, timeout);
    if (!response) {
        return unexpected(response.error());
    }
    return decodeValue(p, *response);
}

expected<void> ParameterRegistry::set(CommandDispatcher& dispatcher, std::string_view name,
                                      const ParameterValue& value,
                                      std::chrono::milliseconds timeout) const {
    auto parameter = find(name);
    if (!parameter) {
        return unexpected(parameter.error());
    }
    const Parameter& p = **parameter;

    auto payload = encodeValue(p, value);
    if (!payload) {
        return unexpected(payload.error());
    }

    // The ACK echoes the value; the device signals refusal with a Nack.
    auto ack = dispatcher.call(Opcode::Set, p.parameterId, std::move(*payload), timeout);
    if (!ack) {
        return unexpected(ack.error());
    }
    logInfo("[ParameterRegistry] ", p.name, " = ", displayValue(p, value), "\n");
    return {};
}

} // namespace hs602::device
