/*
 * Copyright 2025 Switchyard Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Switchyard Socket Utilities - Implementation

#include "socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>

namespace switchyard::core {

namespace {

std::error_code set_timeout_option(int fd, int option, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) < 0) {
        return std::error_code(errno, std::system_category());
    }
    return {};
}

}  // namespace

int create_listening_socket(std::string_view address, uint16_t port, int backlog) {
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return -1;
    }

    // SO_REUSEADDR - allows binding to same address immediately after restart
    if (set_reuseaddr(fd)) {
        close_fd(fd);
        return -1;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    std::string addr_str{address};
    if (inet_pton(AF_INET, addr_str.c_str(), &addr.sin_addr) <= 0) {
        close_fd(fd);
        errno = EINVAL;
        return -1;
    }

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close_fd(fd);
        errno = err;
        return -1;
    }

    if (listen(fd, backlog) < 0) {
        int err = errno;
        close_fd(fd);
        errno = err;
        return -1;
    }

    return fd;
}

std::error_code set_reuseaddr(int fd) {
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return std::error_code(errno, std::system_category());
    }
    return {};
}

std::error_code set_recv_timeout(int fd, std::chrono::milliseconds timeout) {
    return set_timeout_option(fd, SO_RCVTIMEO, timeout);
}

std::error_code set_send_timeout(int fd, std::chrono::milliseconds timeout) {
    return set_timeout_option(fd, SO_SNDTIMEO, timeout);
}

std::error_code send_all(int fd, std::span<const uint8_t> data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                // SO_SNDTIMEO expired
                return std::make_error_code(std::errc::timed_out);
            }
            return std::error_code(errno, std::system_category());
        }
        sent += static_cast<size_t>(n);
    }
    return {};
}

std::error_code send_all(int fd, std::string_view data) {
    return send_all(fd, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()),
                                                 data.size()));
}

uint16_t local_port(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

std::string peer_address(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return "unknown";
    }

    char buf[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf)) == nullptr) {
        return "unknown";
    }
    return std::string(buf);
}

void shutdown_fd(int fd) {
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

void close_fd(int fd) {
    if (fd >= 0) {
        close(fd);
    }
}

}  // namespace switchyard::core
