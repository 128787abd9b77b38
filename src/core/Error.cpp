#include "hs602/core/Error.hpp"

#include <string>

namespace hs602 {

namespace {

class Hs602Category final : public std::error_category {
public:
    const char* name() const noexcept override { return "hs602"; }

    std::string message(int value) const override {
        switch (static_cast<Errc>(value)) {
            case Errc::connect_failed:     return "could not connect to device";
            case Errc::protocol_error:     return "malformed protocol frame";
            case Errc::incomplete_frame:   return "incomplete frame";
            case Errc::timed_out:          return "device did not respond in time";
            case Errc::connection_closed:  return "connection closed";
            case Errc::validation_failed:  return "value rejected by parameter validator";
            case Errc::unknown_parameter:  return "unknown parameter";
            case Errc::not_connected:      return "device handle is not connected";
            case Errc::device_rejected:    return "device rejected the command";
            case Errc::device_busy:        return "device already owned by another handle";
            case Errc::too_many_requests:  return "too many requests in flight";
        }
        return "unknown hs602 error";
    }
};

} // namespace

const std::error_category& category() noexcept {
    static const Hs602Category instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), category()};
}

} // namespace hs602
