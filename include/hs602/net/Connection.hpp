#pragma once

#include "hs602/core/Expected.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

namespace hs602::net {

/**
 * @brief One stream-oriented control channel to a device.
 *
 * The command dispatcher only talks to this interface, which lets tests swap
 * the TCP transport for an in-memory stub.
 *
 * Contract:
 * - `send` writes every byte or returns an error; callers serialise sends.
 * - `receive` blocks until bytes arrive. It fails with `asio::error::eof` when
 *   the peer closed the stream, and with `asio::error::operation_aborted` (or
 *   another error) once `close()` has been called.
 * - `close` is idempotent and unblocks a pending `receive`.
 */
class Connection {
public:
    virtual ~Connection() = default;

    virtual std::error_code send(const std::uint8_t* data, std::size_t size) = 0;
    virtual expected<std::size_t> receive(std::uint8_t* buffer, std::size_t capacity) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    /// Peer description used in log lines.
    virtual std::string describe() const = 0;
};

} // namespace hs602::net
