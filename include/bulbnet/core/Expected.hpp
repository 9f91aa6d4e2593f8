// Expected.hpp
// -----------------------------------------------------------------------------
// Success/error pair used across bulbnet. The default error type is
// std::error_code so asio failures and bulbnet::Errc values travel the same
// way. BulbService overrides it with a message string for lookup failures
// that end up verbatim in its JSON replies.

#pragma once

#include <system_error>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

namespace bulbnet {

template <typename T, typename E = std::error_code>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

} // namespace bulbnet
