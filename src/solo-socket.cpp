/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo-socket.cpp
 * @brief Implementation of Solo_Local_Socket — a Unix-domain stream socket
 *        carrying argument frames.
 *
 * The connecting constructor creates an AF_UNIX/SOCK_STREAM socket with
 * close-on-exec and connects it to the endpoint path. readBytes() and
 * writeBytes() loop over recv()/send() until the requested amount is
 * transferred, retrying EINTR; read()/write() put the frame codec on top.
 */

#include "solo-socket.hpp"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "solo-frame.hpp"

namespace solo {

auto makeLocalAddress(std::string_view path) -> struct sockaddr_un {
  struct sockaddr_un addr{};

  if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
    throw std::runtime_error("Invalid socket path length (" +
                             std::to_string(path.size()) +
                             "): " + std::string{path});
  }

  addr.sun_family = AF_UNIX;
  memcpy(addr.sun_path, path.data(), path.size());

  return addr;
}

Solo_Local_Socket::Solo_Local_Socket(std::string_view path) : m_path{path} {
  const struct sockaddr_un addr = makeLocalAddress(m_path);

  m_fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (m_fd < 0) {
    throw std::runtime_error("Error creating socket: " +
                             std::system_category().message(errno));
  }

  if (connect(m_fd,
              reinterpret_cast<const struct sockaddr *>(
                  &addr), // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
              sizeof(addr)) < 0) {
    const int connect_errno = errno;

    ::close(m_fd);
    m_fd = -1;

    throw std::runtime_error("Error in connect(" + m_path + "): " +
                             std::system_category().message(connect_errno));
  }
}

Solo_Local_Socket::Solo_Local_Socket(int fd) : m_fd{fd} {}

Solo_Local_Socket::~Solo_Local_Socket() noexcept {
  if (-1 != m_fd) {
    ::close(m_fd);
  }
}

auto Solo_Local_Socket::readBytes(char *buf, size_t size) -> size_t {
  size_t n_total{};

  while (n_total < size) {
    const ssize_t n_read = recv(m_fd, buf + n_total, size - n_total, 0);
    if (n_read < 0) {
      if (EINTR == errno) {
        continue;
      }

      throw std::runtime_error("Error in recv: " +
                               std::system_category().message(errno));
    }

    if (0 == n_read) {
      break;
    }

    n_total += static_cast<size_t>(n_read);
  }

  return n_total;
}

void Solo_Local_Socket::writeBytes(std::string_view bytes) {
  size_t n_total{};

  while (n_total < bytes.size()) {
    const ssize_t n_write = send(m_fd, bytes.data() + n_total,
                                 bytes.size() - n_total, MSG_NOSIGNAL);
    if (n_write < 0) {
      if (EINTR == errno) {
        continue;
      }

      throw std::runtime_error("Error in send: " +
                               std::system_category().message(errno));
    }

    n_total += static_cast<size_t>(n_write);
  }
}

auto Solo_Local_Socket::read() -> std::optional<Solo_Args> {
  return decodeFrame(Solo_Frame_Reader{[this](char *buf, size_t size) {
    return this->readBytes(buf, size);
  }});
}

void Solo_Local_Socket::write(Solo_Args &item) {
  writeBytes(encodeFrame(item));
}

void Solo_Local_Socket::write(Solo_Args &&item) {
  // Move into a named local so the lvalue overload can be reused.
  Solo_Args moved_item = std::move(item);

  write(moved_item);
}

void Solo_Local_Socket::close() {
  const int fd = m_fd;

  if (-1 == fd) {
    return;
  }

  m_fd = -1;

  if (::close(fd) < 0) {
    throw std::runtime_error("Error in close: " +
                             std::system_category().message(errno));
  }
}

void Solo_Local_Socket::shutdownWrite() {
  if (shutdown(m_fd, SHUT_WR) < 0) {
    throw std::runtime_error("Error in shutdown: " +
                             std::system_category().message(errno));
  }
}

} // namespace solo
