#pragma once

#include <asio.hpp>       // standalone Asio (ASIO_STANDALONE)
#include <chrono>
#include <system_error>   // std::error_code

namespace hs602::net {

/**
 * @brief Centralises networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `hs602::net::asio` as the standalone Asio namespace.
 * - `hs602::net::tcp` and `hs602::net::udp` as protocol aliases.
 * - `error_code` / `milliseconds` shorthands used by the socket helpers.
 */
namespace asio = ::asio;

using tcp = asio::ip::tcp;
using udp = asio::ip::udp;
using error_code = std::error_code;
using milliseconds = std::chrono::milliseconds;

} // namespace hs602::net
