// Switchyard Socket Utilities - Header

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace switchyard::core {

/// Create blocking listening socket
/// @return fd, or -1 with errno set
[[nodiscard]] int create_listening_socket(
    std::string_view address,
    uint16_t port,
    int backlog = 128);

[[nodiscard]] std::error_code set_reuseaddr(int fd);

/// Apply SO_RCVTIMEO / SO_SNDTIMEO (zero disables the timeout)
[[nodiscard]] std::error_code set_recv_timeout(int fd, std::chrono::milliseconds timeout);
[[nodiscard]] std::error_code set_send_timeout(int fd, std::chrono::milliseconds timeout);

/// Write the whole buffer, retrying on EINTR and short writes
[[nodiscard]] std::error_code send_all(int fd, std::span<const uint8_t> data);
[[nodiscard]] std::error_code send_all(int fd, std::string_view data);

/// Local port a socket is bound to (0 on error)
[[nodiscard]] uint16_t local_port(int fd);

/// Peer IPv4 address as dotted quad ("unknown" on error)
[[nodiscard]] std::string peer_address(int fd);

/// Wake threads blocked in accept/recv on this fd without releasing it
void shutdown_fd(int fd);

void close_fd(int fd);

} // namespace switchyard::core
