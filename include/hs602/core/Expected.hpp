// Expected.hpp
// -----------------------------------------------------------------------------
// Result type used by every fallible hs602 operation. Success carries the
// value; failure carries a std::error_code, either from the hs602 category
// (see Error.hpp) or, at the socket layer, straight from asio.

#pragma once

#include <system_error>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

namespace hs602 {

template <typename T, typename E = std::error_code>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

} // namespace hs602
