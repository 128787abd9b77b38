#pragma once
#include "hs602/net/NetConfig.hpp"
#include "hs602/core/Expected.hpp"

#include <string>

namespace hs602::net {

/**
 * resolveV4
 *
 * Synchronous lookup that turns a dotted quad or host name into the first
 * IPv4 address it resolves to. Devices only speak IPv4, and the knock
 * datagram needs the raw octets.
 */
inline expected<asio::ip::address_v4> resolveV4(asio::io_context& io, const std::string& host) {
    error_code ec;
    auto literal = asio::ip::make_address_v4(host, ec);
    if (!ec) {
        return literal;
    }

    tcp::resolver resolver(io);
    auto results = resolver.resolve(tcp::v4(), host, "", ec);
    if (ec) {
        return unexpected(ec);
    }
    for (const auto& entry : results) {
        const auto address = entry.endpoint().address();
        if (address.is_v4()) {
            return address.to_v4();
        }
    }
    return unexpected(error_code(asio::error::host_not_found));
}

} // namespace hs602::net
