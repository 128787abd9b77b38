#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <tuple>

namespace hs602 {

/**
 * @brief Where a device lives on the network and what it said it is.
 *
 * Value type; equality and ordering only look at (host, port), the model
 * string is informational.
 */
struct DeviceAddress {
    std::string host;
    std::uint16_t port = 0;
    std::string model;

    friend bool operator==(const DeviceAddress& a, const DeviceAddress& b) {
        return a.host == b.host && a.port == b.port;
    }
    friend bool operator!=(const DeviceAddress& a, const DeviceAddress& b) {
        return !(a == b);
    }
    friend bool operator<(const DeviceAddress& a, const DeviceAddress& b) {
        return std::tie(a.host, a.port) < std::tie(b.host, b.port);
    }

    std::string toString() const {
        return host + ":" + std::to_string(port);
    }
};

inline std::ostream& operator<<(std::ostream& os, const DeviceAddress& address) {
    os << address.toString();
    if (!address.model.empty()) {
        os << " (" << address.model << ")";
    }
    return os;
}

} // namespace hs602
