/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo-instance.hpp
 * @brief Single-instance entry point: elect a leader, forward arguments of
 *        every later launch to it.
 *
 * @details
 * Solo_Single_Instance is created once near the top of main() with the
 * endpoint path of the application (see socketPath()). run() then either
 *
 *  - makes this process the leader: the lock is taken, the endpoint is
 *    bound, the accept loop starts on its own thread and run() returns true
 *    at once so the application proceeds with its own arguments; or
 *  - makes it a follower: the arguments are sent to the leader and the exit
 *    hook is invoked. The default hook ends the process with EXIT_SUCCESS.
 *
 * Received argument lists are delivered either to the handler passed to
 * run(), called from the connection's task, or, with the handler-less
 * overload, to a queue drained through receivedArgs().
 *
 * The object owns the leadership: it must live for as long as the process
 * is meant to be the leader, normally until exit. Destroying it stops the
 * listener and releases the lock.
 *
 * Usage:
 * ```
 * solo::Solo_Single_Instance instance{solo::socketPath("com.example.app")};
 *
 * instance.run(args, [](solo::Solo_Args &&received) { ... });
 * ```
 */

#ifndef SOLO_INSTANCE_HPP_
#define SOLO_INSTANCE_HPP_

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "solo-buffer.hpp"
#include "solo-frame.hpp"
#include "solo-listener.hpp"
#include "solo-lock.hpp"

namespace solo {

/**
 * @brief Endpoint path for @p identifier in the temp directory:
 *        <tmp>/<identifier>.sock.
 *
 * The identifier must be usable as a file name. The result is not checked
 * against the sun_path limit; bind()/connect() report a path that is too
 * long.
 */
auto socketPath(std::string_view identifier) -> std::string;

/**
 * @brief Lock path co-located with @p endpointPath: a trailing ".sock" is
 *        replaced with ".lock", otherwise ".lock" is appended.
 */
auto lockPathFor(std::string_view endpointPath) -> std::string;

class Solo_Single_Instance {
public:
  using ExitHook = std::function<void()>;
  using Handler = Solo_Listener::Handler;

  /**
   * @brief Default exit hook: std::exit(EXIT_SUCCESS).
   */
  static void defaultExit();

  explicit Solo_Single_Instance(
      std::string endpointPath,
      ExitHook onExit = &Solo_Single_Instance::defaultExit);
  virtual ~Solo_Single_Instance() noexcept;

  Solo_Single_Instance(const Solo_Single_Instance &obj) = delete;
  const Solo_Single_Instance &operator=(const Solo_Single_Instance &obj) =
      delete;
  Solo_Single_Instance(Solo_Single_Instance &&obj) = delete;
  Solo_Single_Instance &operator=(Solo_Single_Instance &&obj) = delete;

  /**
   * @brief Elect, then listen (leader) or forward @p args and exit
   *        (follower).
   *
   * @param args           this process's arguments, forwarded when follower.
   * @param onArgsReceived called once per follower connection, on that
   *                       connection's task, concurrently and unordered.
   * @return true if this process is the leader; false if it is a follower
   *         and the exit hook returned.
   * @throws std::runtime_error on environment failure (parent directory,
   *         lock file, bind) or if the leader cannot be reached.
   * @throws std::logic_error if called more than once.
   */
  auto run(const Solo_Args &args, Handler onArgsReceived) -> bool;

  /**
   * @brief As run(args, handler), with received lists queued for
   *        receivedArgs().
   */
  auto run(const Solo_Args &args) -> bool;

  /**
   * @brief Queue of argument lists received by the handler-less run().
   */
  auto receivedArgs() -> Solo_Buffer<Solo_Args> & { return m_received; }

  auto isLeader() const -> bool { return static_cast<bool>(m_lock); }

  auto endpointPath() const -> const std::string & { return m_endpointPath; }
  auto lockPath() const -> const std::string & { return m_lockPath; }

private:
  void ensureParentDirectory();

  const std::string m_endpointPath{};
  const std::string m_lockPath{};
  ExitHook m_onExit{};

  bool m_ran{};

  Solo_Buffer<Solo_Args> m_received{};

  // Destroyed in reverse order: the listener (and all its tasks) goes before
  // the lock, which it also co-owns.
  std::shared_ptr<Solo_Lock> m_lock{};
  std::unique_ptr<Solo_Listener> m_listener{};
}; // class Solo_Single_Instance

} // namespace solo

#endif // SOLO_INSTANCE_HPP_
