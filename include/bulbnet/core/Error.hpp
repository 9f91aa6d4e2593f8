#pragma once

#include <string>
#include <system_error>

namespace bulbnet {

/**
 * @brief Failure taxonomy of the device communication layer.
 *
 * - CallerError: invalid argument, rejected before any network I/O.
 * - NotConnected: the client is not in the Connected state.
 * - Timeout: no reply within the configured window.
 * - TransportFailure: endpoint-level send/receive/close failure.
 * - Cancelled: the pending call was invalidated by close().
 * - ProtocolError: malformed reply or unresolvable device address.
 * - DeviceError: the bulb replied with success=false.
 */
enum class Errc {
    CallerError = 1,
    NotConnected,
    Timeout,
    TransportFailure,
    Cancelled,
    ProtocolError,
    DeviceError
};

const std::error_category& bulbnet_category() noexcept;

std::error_code make_error_code(Errc e) noexcept;

/// Map an asio / system error observed on a socket onto the bulbnet taxonomy.
std::error_code classify_transport_error(const std::error_code& ec) noexcept;

} // namespace bulbnet

namespace std {
template <>
struct is_error_code_enum<bulbnet::Errc> : true_type {};
} // namespace std
