/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo-proc.cpp
 * @brief Lightweight RAII wrapper around native pthread functionality.
 */

#include "solo-proc.hpp"

#include <pthread.h>
#include <sched.h>

#include <cassert>
#include <cerrno>
#include <exception>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "solo-debug.hpp"

namespace solo {

void cleanupFuncToUnlockPthreadMutex(void *arg) {
  auto *mutex = static_cast<pthread_mutex_t *>(arg);

  pthread_mutex_unlock(mutex);
}

/**
 * @brief Constructs a new Solo_Proc, optionally with its task.
 *
 * The object starts in the New state and moves to Ready once a task is set.
 */
Solo_Proc::Solo_Proc(std::string_view name, const Solo_Proc::Task &fnc)
    : m_name{name} {
  setState(State::kNew);

  if (fnc) {
    setTask(fnc);
  }
}

/**
 * @brief Cancels and joins a running thread.
 */
Solo_Proc::~Solo_Proc() noexcept try {
  if (getState() == State::kRunning) {
    stopExec();
  }

  setState(State::kInvalid);
} catch (const std::exception &e) {
  SOLO_DEBUG_PRINT(std::cerr << "Solo_Proc (" << m_name
                             << ") stop failed: " << e.what() << "\n");

  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Solo_Proc::exec(const Solo_Proc::Task &fnc) -> bool {
  if (fnc) {
    setTask(fnc);
  }

  return runExec();
}

auto Solo_Proc::getState() const -> Solo_Proc::State { return m_state; }

auto Solo_Proc::getName() const -> const std::string & { return m_name; }

auto Solo_Proc::isDone() const -> bool { return m_done.load(); }

/**
 * @brief Sets a new state and returns the previous state.
 */
auto Solo_Proc::setState(State state) -> Solo_Proc::State {
  const State old_state = this->m_state;

  this->m_state = state;

  return old_state;
}

void Solo_Proc::setTask(Solo_Proc::Task fnc) {
  assert(getState() == State::kNew || getState() == State::kReady);

  this->m_fnc = std::move(fnc);
  setState(State::kReady);
}

/**
 * @brief Joins the running thread; the state goes back to Ready.
 *
 * @throws std::runtime_error if no thread is running or pthread_join fails
 */
auto Solo_Proc::wait() -> bool {
  int err{};
  void *ret{};

  if (getState() != State::kRunning) {
    throw std::runtime_error("No task is exec (" + m_name + ")");
  }

  err = pthread_join(m_th, &ret);
  if (0 != err) {
    throw std::runtime_error(std::system_category().message(err));
  }

  setState(State::kReady);

  return 0 == err;
}

void Solo_Proc::testcancel() { pthread_testcancel(); }

void Solo_Proc::yield() {
  Solo_Proc::testcancel();

  sched_yield();
}

/**
 * @brief Sends a cancellation request to the thread and joins it.
 *
 * A thread whose task already returned is joined without error, as
 * pthread_cancel() on a finished but unjoined thread succeeds.
 *
 * @return true if the thread was stopped or was not running
 * @throws std::runtime_error if pthread_cancel fails
 */
auto Solo_Proc::stopExec() -> bool {
  int err{};

  if (getState() != State::kRunning) {
    return true;
  }

  err = pthread_cancel(m_th);
  if (0 != err && ESRCH != err) {
    throw std::runtime_error(std::system_category().message(err));
  }

  return wait();
}

auto Solo_Proc::runExec() -> bool {
  int err{};
  State old_state{};

  if (getState() != State::kReady) {
    throw std::runtime_error("No task is assigned to the Solo_Proc (" +
                             m_name + ")");
  }

  m_done = false;
  old_state = setState(State::kRunning);
  err = pthread_create(&m_th, nullptr, &(Solo_Proc::runFnInThreadHelper), this);
  if (0 != err) {
    setState(old_state);
    return false;
  }

  return true;
}

/**
 * @brief Thread entry point.
 *
 * Enables deferred cancellation, then runs the assigned task.
 */
auto Solo_Proc::runFnInThreadHelper(void *context) -> void * {
  int old_state{};
  int err{};

  err = pthread_setcancelstate(PTHREAD_CANCEL_ENABLE, &old_state);
  if (0 != err) {
    throw std::runtime_error(std::system_category().message(err));
  }

  err = pthread_setcanceltype(PTHREAD_CANCEL_DEFERRED, &old_state);
  if (0 != err) {
    throw std::runtime_error(std::system_category().message(err));
  }

  auto *proc = static_cast<Solo_Proc *>(context);
  proc->m_fnc();
  proc->m_done = true;

  return nullptr;
}

} // namespace solo
