#pragma once

#include <system_error>

namespace hs602 {

/**
 * @brief Error kinds reported by the public hs602 API.
 *
 * Values are carried in `std::error_code` under `hs602::category()` so they
 * travel through `hs602::expected<T>` alongside raw asio errors from the
 * socket layer.
 */
enum class Errc {
    connect_failed = 1,  ///< transport could not establish a connection
    protocol_error,      ///< malformed frame (bad opcode, implausible length)
    incomplete_frame,    ///< buffer ends before the frame does
    timed_out,           ///< no response before the request deadline
    connection_closed,   ///< connection dropped while the request was pending
    validation_failed,   ///< value rejected locally, nothing was sent
    unknown_parameter,   ///< name not present in the parameter registry
    not_connected,       ///< handle is not in the Connected state
    device_rejected,     ///< device answered with a Nack frame
    device_busy,         ///< another handle in this process owns the device
    too_many_requests    ///< every sequence id is in flight
};

const std::error_category& category() noexcept;

std::error_code make_error_code(Errc e) noexcept;

} // namespace hs602

namespace std {
template <>
struct is_error_code_enum<hs602::Errc> : true_type {};
} // namespace std
