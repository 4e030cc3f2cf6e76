/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo-proc.hpp
 * @brief Lightweight RAII wrapper around native pthread functionality.
 *
 * Solo_Proc encapsulates a pthread and executes a user-provided callable
 * (std::function<void()>) in it. Behaviour is varied by the task handed in,
 * not by subclassing. Every independently scheduled task of the library (the
 * accept loop and each accepted connection) runs on a Solo_Proc.
 *
 * Key characteristics and expectations:
 * - RAII: the destructor cancels and joins a running thread. The task must
 *   therefore reach pthread cancellation points (blocking socket calls,
 *   condition waits, or Solo_Proc::yield()) for destruction to complete.
 * - Cancellation is deferred. In glibc it unwinds the thread stack with a
 *   forced-unwind exception: a task may catch std::exception, but must not
 *   swallow everything with catch (...) without rethrowing.
 *
 * The macros below wrap pthread_cleanup_push/pop for the common pattern of
 * unlocking a pthread mutex when a thread is cancelled inside a critical
 * region.
 */

#ifndef SOLO_PROC_HPP_
#define SOLO_PROC_HPP_

#include <pthread.h>

#include <atomic>
#include <functional>
#include <string>
#include <string_view>

/**
 * Push a pthread cleanup handler that unlocks the given mutex if the thread
 * is cancelled inside the protected region.
 *
 *   SOLO_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(&mutex);
 *   ... protected code ...
 *   SOLO_PROC_EXIT_PTHREAD_MUTEX_CLEANUP();
 */
#define SOLO_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(mutex)                           \
  pthread_cleanup_push(&solo::cleanupFuncToUnlockPthreadMutex, (mutex))

/**
 * Pop the handler pushed by SOLO_PROC_ENTER_PTHREAD_MUTEX_CLEANUP without
 * executing it.
 */
#define SOLO_PROC_EXIT_PTHREAD_MUTEX_CLEANUP(...) pthread_cleanup_pop(0)

namespace solo {

/**
 * Cleanup function used with pthread_cleanup_push/pop. Expects a pointer to
 * a pthread_mutex_t and unlocks it.
 */
void cleanupFuncToUnlockPthreadMutex(void *arg);

/**
 * Solo_Proc
 *
 * - Construct with a name and optionally a task. The name is used for
 *   diagnostics only.
 * - exec(): start the thread with the given task (or the one set at
 *   construction). Returns true on successful start.
 * - wait(): join the thread.
 * - isDone(): true once the task has returned (not when it was cancelled).
 * - stopExec(): cancel the running thread and join it.
 */
class Solo_Proc {
  using Task = std::function<void()>;

  enum class State { kInvalid, kNew, kReady, kRunning };

public:
  explicit Solo_Proc(std::string_view name, const Solo_Proc::Task &fnc = {});
  virtual ~Solo_Proc() noexcept;

  Solo_Proc(const Solo_Proc &obj) = delete;
  const Solo_Proc &operator=(const Solo_Proc &obj) = delete;
  Solo_Proc(Solo_Proc &&obj) = delete;
  Solo_Proc &operator=(Solo_Proc &&obj) = delete;

  /**
   * Execute the task in a new thread.
   *
   * @param fnc Optional task replacing the one set at construction.
   * @return true if the thread was started successfully.
   * @throws std::runtime_error if no task has been assigned.
   */
  auto exec(const Solo_Proc::Task &fnc = {}) -> bool;

  /**
   * Join the thread.
   *
   * @return true if the thread was joined successfully.
   * @throws std::runtime_error if the thread is not running or join fails.
   */
  auto wait() -> bool;

  /**
   * Cancel the running thread and join it. No-op when not running.
   */
  auto stopExec() -> bool;

  auto isDone() const -> bool;

  auto getName() const -> const std::string &;

  /**
   * Cancellation point.
   */
  static void testcancel();

  /**
   * Yield to other threads after testing for cancellation.
   */
  static void yield();

protected:
  auto getState() const -> Solo_Proc::State;
  auto setState(Solo_Proc::State state) -> Solo_Proc::State;
  void setTask(Solo_Proc::Task fnc);

  auto runExec() -> bool;

private:
  static auto runFnInThreadHelper(void *context) -> void *;

  const std::string m_name{};

  Solo_Proc::Task m_fnc{};
  Solo_Proc::State m_state{};
  std::atomic<bool> m_done{};
  pthread_t m_th{};
}; // class Solo_Proc

} // namespace solo

#endif // SOLO_PROC_HPP_
