/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo-listener.cpp
 * @brief Implementation of Solo_Listener.
 *
 * The accept loop holds m_mutex only to register or reap connection tasks,
 * and does so with pthread cancellation disabled: reaping joins finished
 * threads, and pthread_join() is a cancellation point that must not fire
 * inside Solo_Proc's noexcept destructor. accept() is therefore the only
 * place where the accept task can be cancelled.
 */

#include "solo-listener.hpp"

#include <cxxabi.h>
#include <pthread.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <functional>
#include <iterator>
#include <list>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "solo-debug.hpp"
#include "solo-frame.hpp"
#include "solo-proc.hpp"
#include "solo-socket.hpp"

namespace solo {

namespace {

// Disables pthread cancellation of the current thread for its scope.
class Solo_Cancel_Disabler {
public:
  Solo_Cancel_Disabler() {
    pthread_setcancelstate(PTHREAD_CANCEL_DISABLE, &m_old_state);
  }

  ~Solo_Cancel_Disabler() noexcept {
    int ignored_state{};

    pthread_setcancelstate(m_old_state, &ignored_state);
  }

  Solo_Cancel_Disabler(const Solo_Cancel_Disabler &obj) = delete;
  Solo_Cancel_Disabler &operator=(const Solo_Cancel_Disabler &obj) = delete;

private:
  int m_old_state{};
};

} // namespace

Solo_Listener::Solo_Listener(std::string_view endpointPath,
                             std::shared_ptr<Solo_Lock> lock, int backlog)
    : m_path{endpointPath}, m_lock{std::move(lock)} {
  const struct sockaddr_un addr = makeLocalAddress(m_path);

  m_fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (m_fd < 0) {
    throw std::runtime_error("Error creating socket: " +
                             std::system_category().message(errno));
  }

  if (bind(m_fd,
           reinterpret_cast<const struct sockaddr *>(
               &addr), // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
           sizeof(addr)) < 0) {
    const int bind_errno = errno;

    close(m_fd);
    m_fd = -1;

    throw std::runtime_error("Error in bind(" + m_path + "): " +
                             std::system_category().message(bind_errno));
  }

  if (listen(m_fd, backlog) < 0) {
    const int listen_errno = errno;

    close(m_fd);
    m_fd = -1;

    throw std::runtime_error("Error in listen(" + m_path + "): " +
                             std::system_category().message(listen_errno));
  }

  SOLO_DEBUG_PRINT(std::cerr << "listening on " << m_path << "\n");
}

Solo_Listener::~Solo_Listener() noexcept {
  try {
    stop();
  } catch (const std::exception &e) {
    SOLO_DEBUG_PRINT(std::cerr << "stop listener " << m_path
                               << " failed: " << e.what() << "\n");
  }

  if (-1 != m_fd) {
    close(m_fd);
  }
}

void Solo_Listener::accept(Handler handler) {
  while (true) {
    reapConnections();

    const int fd = accept4(m_fd, nullptr, nullptr, SOCK_CLOEXEC);
    if (fd < 0) {
      if (EINTR == errno || ECONNABORTED == errno) {
        continue;
      }

      throw std::runtime_error("Error in accept(" + m_path + "): " +
                               std::system_category().message(errno));
    }

    addConnection(fd, handler);
  }
}

void Solo_Listener::start(Handler handler) {
  if (m_acceptProc) {
    throw std::runtime_error("Listener on " + m_path + " already started");
  }

  m_acceptProc = std::make_unique<Solo_Proc>(
      "solo-accept", [this, handler = std::move(handler)]() {
        try {
          this->accept(handler);
        } catch (const std::exception &e) {
          SOLO_DEBUG_PRINT(std::cerr << "accept loop on " << m_path
                                     << " terminated: " << e.what() << "\n");
        }
      });

  if (!m_acceptProc->exec()) {
    m_acceptProc = {};

    throw std::runtime_error("Error starting accept task for " + m_path);
  }
}

void Solo_Listener::stop() {
  std::list<std::unique_ptr<Connection>> connections{};

  if (m_acceptProc) {
    m_acceptProc->stopExec();
    m_acceptProc = {};
  }

  {
    const std::lock_guard<std::mutex> lock{m_mutex};

    connections.swap(m_connections);
  }

  // Each Connection cancels and joins its task before closing its socket.
  connections.clear();
}

auto Solo_Listener::connectionCount() -> size_t {
  const std::lock_guard<std::mutex> lock{m_mutex};

  return static_cast<size_t>(
      std::count_if(m_connections.begin(), m_connections.end(),
                    [](const std::unique_ptr<Connection> &conn) {
                      return !conn->m_proc->isDone();
                    }));
}

void Solo_Listener::serveConnection(Solo_Local_Socket &socket,
                                    const Handler &handler) {
  try {
    auto args = socket.read();
    if (!args) {
      SOLO_DEBUG_PRINT(std::cerr << "peer on fd " << socket.fd()
                                 << " closed without a frame\n");
      return;
    }

    handler(std::move(*args));
  } catch (const Solo_Frame_Error &e) {
    SOLO_DEBUG_PRINT(std::cerr << "dropping frame on fd " << socket.fd()
                               << ": " << e.what() << "\n");
  } catch (const std::exception &e) {
    SOLO_DEBUG_PRINT(std::cerr << "connection on fd " << socket.fd()
                               << " failed: " << e.what() << "\n");
  } catch (abi::__forced_unwind &) {
    throw; // cancelled by stop()
  } catch (...) {
    SOLO_DEBUG_PRINT(std::cerr << "handler on fd " << socket.fd()
                               << " threw a non-standard exception\n");
  }

  // The peer sees end-of-stream here, not when the task is reaped.
  const Solo_Cancel_Disabler no_cancel{};

  try {
    socket.close();
  } catch (const std::exception &e) {
    SOLO_DEBUG_PRINT(std::cerr << "closing connection failed: " << e.what()
                               << "\n");
  }
}

void Solo_Listener::addConnection(int fd, const Handler &handler) {
  const Solo_Cancel_Disabler no_cancel{};

  auto conn = std::make_unique<Connection>();
  conn->m_socket = std::make_unique<Solo_Local_Socket>(fd);
  conn->m_proc = std::make_unique<Solo_Proc>(
      "solo-conn-" + std::to_string(m_next_id++),
      [this, socket = conn->m_socket.get(), handler]() {
        this->serveConnection(*socket, handler);
      });

  if (!conn->m_proc->exec()) {
    SOLO_DEBUG_PRINT(std::cerr << "no task for connection fd " << fd
                               << ", dropped\n");
    return;
  }

  const std::lock_guard<std::mutex> lock{m_mutex};

  m_connections.push_back(std::move(conn));
}

void Solo_Listener::reapConnections() {
  const Solo_Cancel_Disabler no_cancel{};
  std::list<std::unique_ptr<Connection>> finished{};

  {
    const std::lock_guard<std::mutex> lock{m_mutex};

    for (auto it = m_connections.begin(); it != m_connections.end();) {
      if ((*it)->m_proc->isDone()) {
        auto next = std::next(it);

        finished.splice(finished.end(), m_connections, it);
        it = next;
      } else {
        ++it;
      }
    }
  }

  // Joins the finished threads outside of m_mutex.
  finished.clear();
}

} // namespace solo
