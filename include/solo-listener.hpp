/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo-listener.hpp
 * @brief Leader-side endpoint: accepts follower connections and hands each
 *        received argument list to a handler.
 *
 * @details
 * Solo_Listener binds a Unix-domain stream socket at the endpoint path and
 * runs an accept loop. Every accepted connection is served by its own
 * Solo_Proc task which decodes exactly one frame, invokes the handler with
 * it and closes the connection. A peer that is slow, silent, sends garbage
 * or disconnects mid-frame only ever occupies its own task; the accept loop
 * and the other connections carry on.
 *
 * Handler invocations from different connections are concurrent and
 * unordered. Within one connection the frame is fully decoded before the
 * handler runs.
 *
 * The accept loop never ends on its own. stop() (also run by the
 * destructor) cancels it together with every connection task still in
 * flight, which is how an owner tears a listener down.
 */

#ifndef SOLO_LISTENER_HPP_
#define SOLO_LISTENER_HPP_

#include <sys/socket.h>

#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "solo-frame.hpp"
#include "solo-lock.hpp"
#include "solo-proc.hpp"
#include "solo-socket.hpp"

namespace solo {

class Solo_Listener {
public:
  using Handler = std::function<void(Solo_Args &&)>;

  /**
   * @brief Bind and listen on @p endpointPath.
   *
   * The parent directory must exist and no entry may exist at the path
   * (Solo_Lock::tryAcquire() removes a stale one).
   *
   * @param endpointPath filesystem path of the endpoint.
   * @param lock         optional leadership handle kept alive at least as
   *                     long as any task of this listener.
   * @param backlog      listen() backlog.
   * @throws std::runtime_error on socket(), bind() or listen() failure.
   */
  explicit Solo_Listener(std::string_view endpointPath,
                         std::shared_ptr<Solo_Lock> lock = {},
                         int backlog = SOMAXCONN);

  virtual ~Solo_Listener() noexcept;

  Solo_Listener(const Solo_Listener &obj) = delete;
  const Solo_Listener &operator=(const Solo_Listener &obj) = delete;
  Solo_Listener(Solo_Listener &&obj) = delete;
  Solo_Listener &operator=(Solo_Listener &&obj) = delete;

  /**
   * @brief Run the accept loop on the calling thread.
   *
   * Never returns normally. It ends only by cancellation of the calling
   * thread or by throwing std::runtime_error on an unrecoverable accept()
   * error. EINTR and ECONNABORTED are retried.
   */
  void accept(Handler handler);

  /**
   * @brief Run accept() on the listener's own task and return immediately.
   *
   * @throws std::runtime_error if the loop is already running or the task
   *         cannot be started.
   */
  void start(Handler handler);

  /**
   * @brief Cancel the accept loop and all connection tasks, and join them.
   */
  void stop();

  /**
   * @brief Number of connections whose task is still running. A connection
   *        is closed by its task once its frame has been handled.
   */
  auto connectionCount() -> size_t;

  auto path() const -> const std::string & { return m_path; }

private:
  struct Connection {
    std::unique_ptr<Solo_Local_Socket> m_socket{};
    std::unique_ptr<Solo_Proc> m_proc{}; // destroyed before m_socket
  };

  void serveConnection(Solo_Local_Socket &socket, const Handler &handler);
  void addConnection(int fd, const Handler &handler);
  void reapConnections();

  const std::string m_path{};
  std::shared_ptr<Solo_Lock> m_lock{};

  int m_fd{-1};

  std::unique_ptr<Solo_Proc> m_acceptProc{};

  std::mutex m_mutex{};
  std::list<std::unique_ptr<Connection>> m_connections{};
  unsigned long m_next_id{};
}; // class Solo_Listener

} // namespace solo

#endif // SOLO_LISTENER_HPP_
