/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo-socket.hpp
 * @brief Unix-domain stream socket that implements Solo_Io<Solo_Args>.
 *
 * @details
 * Solo_Local_Socket wraps one connected AF_UNIX/SOCK_STREAM descriptor and
 * transfers whole argument frames over it: write() encodes and sends one
 * frame, read() receives and decodes one frame. It is the transport of both
 * the dialer (connecting side) and the listener (accepted side).
 *
 * The socket performs blocking I/O without timeouts and does not create any
 * thread of its own. Blocking calls are pthread cancellation points, so a
 * Solo_Proc blocked in read() can be cancelled.
 *
 * Notes:
 *  - read() returns std::nullopt when the peer closes before sending a byte,
 *    and throws Solo_Frame_Error on a malformed or truncated frame.
 *  - write() throws std::runtime_error on I/O failure; SIGPIPE is suppressed.
 */

#ifndef SOLO_SOCKET_HPP_
#define SOLO_SOCKET_HPP_

#include <sys/un.h>

#include <optional>
#include <string>
#include <string_view>

#include "solo-frame.hpp"
#include "solo-io.hpp"

namespace solo {

/**
 * @brief Fill a sockaddr_un for @p path.
 *
 * @throws std::runtime_error if @p path does not fit in sun_path.
 */
auto makeLocalAddress(std::string_view path) -> struct sockaddr_un;

/**
 * @class Solo_Local_Socket
 *
 * Thread-safety: not thread-safe; one connection is served by one task.
 *
 * Lifetime/ownership: the descriptor is owned and closed in the destructor.
 * Copy and move are deleted.
 */
class Solo_Local_Socket : public Solo_Io<Solo_Args> {
public:
  /**
   * @brief Connect to the Unix-domain endpoint at @p path.
   *
   * @throws std::runtime_error if the socket cannot be created, the path is
   *         too long, or connect() fails (e.g. no leader is listening).
   */
  explicit Solo_Local_Socket(std::string_view path);

  /**
   * @brief Adopt an already connected descriptor (e.g. from accept()).
   */
  explicit Solo_Local_Socket(int fd);

  virtual ~Solo_Local_Socket() noexcept;

  Solo_Local_Socket(const Solo_Local_Socket &obj) = delete;
  const Solo_Local_Socket &operator=(const Solo_Local_Socket &obj) = delete;
  Solo_Local_Socket(Solo_Local_Socket &&obj) = delete;
  Solo_Local_Socket &operator=(Solo_Local_Socket &&obj) = delete;

  /**
   * @brief Receive and decode one frame.
   *
   * @return the argument list, or std::nullopt if the peer closed without
   *         sending anything.
   * @throws Solo_Frame_Error on a malformed or truncated frame.
   * @throws std::runtime_error on I/O error.
   */
  auto read() -> std::optional<Solo_Args> override;

  /**
   * @brief Encode and send one frame, retrying short writes.
   */
  void write(Solo_Args &item) override;
  void write(Solo_Args &&item) override;

  /**
   * @brief Raw byte read used by the frame decoder: fill up to @p size bytes,
   *        returning fewer only at end-of-stream.
   */
  auto readBytes(char *buf, size_t size) -> size_t;

  /**
   * @brief Raw byte write of the whole buffer.
   */
  void writeBytes(std::string_view bytes);

  /**
   * @brief Half-close the sending direction to signal end-of-message.
   */
  void shutdownWrite();

  /**
   * @brief Close the descriptor now; the peer reads end-of-stream. Further
   *        close() calls and the destructor do nothing.
   *
   * @throws std::runtime_error if close() fails; the descriptor is released
   *         regardless.
   */
  void close();

  auto fd() const -> int { return m_fd; }

private:
  std::string m_path{}; ///< endpoint path, empty for adopted descriptors

  int m_fd{-1};
};

} // namespace solo

#endif // SOLO_SOCKET_HPP_
