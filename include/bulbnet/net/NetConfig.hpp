#pragma once

#ifndef ASIO_STANDALONE
#define ASIO_STANDALONE
#endif
#include <asio.hpp>
#include <chrono>
#include <system_error>

namespace bulbnet::net {

/**
 * @brief Centralises networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `bulbnet::net::asio` as the standalone Asio namespace.
 * - `bulbnet::net::udp` for the datagram protocol every bulb speaks.
 */
namespace asio = ::asio;

using udp = asio::ip::udp;
using error_code = std::error_code;
using milliseconds = std::chrono::milliseconds;

} // namespace bulbnet::net
