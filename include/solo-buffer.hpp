/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo-buffer.hpp
 * @brief Thread-safe FIFO buffer (queue) for passing items between threads.
 *
 * Overview
 * --------
 * Solo_Buffer<T> is the queue through which the leader can hand received
 * argument lists to application code instead of calling back into it from a
 * connection thread. Connection tasks push, the application pops.
 *  - push operations never wait for consumers.
 *  - pop() blocks until an item is available.
 *  - pop(timeout) blocks at most `timeout` microseconds and returns
 *    std::nullopt on expiry.
 *  - popNoWait() returns std::nullopt when the queue is empty.
 *
 * Synchronization
 * ---------------
 * A pthread mutex protects the std::deque and the push counter; a
 * pthread condition variable is signalled on every push. Waits are
 * cancellation points, and the mutex is released by the cleanup handler
 * (SOLO_PROC_ENTER_PTHREAD_MUTEX_CLEANUP) if a waiting Solo_Proc thread is
 * cancelled.
 *
 * Errors from pthread functions are reported as std::runtime_error with the
 * strerror() text.
 */

#ifndef SOLO_BUFFER_HPP_
#define SOLO_BUFFER_HPP_

#include <pthread.h>

#include <cerrno>
#include <cstring>
#include <ctime>
#include <deque>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>

#include "solo-proc.hpp"

namespace solo {

template <typename T = std::string> class Solo_Buffer {
public:
  Solo_Buffer();
  Solo_Buffer(std::initializer_list<T> list);
  virtual ~Solo_Buffer() noexcept;

  Solo_Buffer(const Solo_Buffer<T> &obj) = delete;
  const Solo_Buffer<T> &operator=(const Solo_Buffer<T> &obj) = delete;
  Solo_Buffer(Solo_Buffer<T> &&obj) = delete;
  Solo_Buffer<T> &operator=(Solo_Buffer<T> &&obj) = delete;

  /**
   * @brief Remove and return the front item, blocking while empty.
   */
  virtual auto pop() -> T;

  /**
   * @brief Remove and return the front item, waiting at most @p timeout
   *        microseconds.
   *
   * @param timeout Maximum wait in microseconds; 0 means do not wait.
   * @return the front item, or std::nullopt if none arrived in time.
   */
  virtual auto pop(long timeout) -> std::optional<T>;

  /**
   * @brief Non-blocking pop; std::nullopt if the queue is empty.
   */
  virtual auto popNoWait() -> std::optional<T>;

  /**
   * @brief Push an rvalue (moved with move_if_noexcept).
   */
  virtual void push(T &&item);

  /**
   * @brief Push an lvalue, moved from when @p move is true, else copied.
   */
  virtual void push(T &item, bool move = true);

  /**
   * @brief Number of items currently queued.
   */
  auto size() -> size_t;

  /**
   * @brief Total number of items ever pushed.
   */
  auto pushCount() -> size_t;

private:
  void lock();
  void unlock();

  std::deque<T> m_queue{};
  pthread_mutex_t m_mutex{};
  pthread_cond_t m_cond{}; // signalled on every push
  size_t m_push_count{};
}; // class Solo_Buffer

template <typename T> Solo_Buffer<T>::Solo_Buffer() {
  int err{};

  err = pthread_mutex_init(&m_mutex, nullptr);
  if (err) {
    throw std::runtime_error(strerror(err));
  }

  err = pthread_cond_init(&m_cond, nullptr);
  if (err) {
    pthread_mutex_destroy(&m_mutex);

    throw std::runtime_error(strerror(err));
  }
}

template <typename T>
Solo_Buffer<T>::Solo_Buffer(std::initializer_list<T> list) : Solo_Buffer{} {
  for (auto data : list) {
    this->push(data);
  }
}

template <typename T> Solo_Buffer<T>::~Solo_Buffer() noexcept {
  // Wake a waiter before destroying the primitives. The destructor must only
  // run once no other thread will touch the buffer.
  pthread_cond_broadcast(&m_cond);

  pthread_cond_destroy(&m_cond);
  pthread_mutex_destroy(&m_mutex);
}

template <typename T> void Solo_Buffer<T>::lock() {
  const int err = pthread_mutex_lock(&m_mutex);
  if (err) {
    throw std::runtime_error(strerror(err));
  }
}

template <typename T> void Solo_Buffer<T>::unlock() {
  const int err = pthread_mutex_unlock(&m_mutex);
  if (err) {
    throw std::runtime_error(strerror(err));
  }
}

template <typename T> auto Solo_Buffer<T>::pop() -> T {
  int err{};
  T val{};

  lock();

  SOLO_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(&m_mutex);

  pthread_testcancel();

  while (m_queue.empty() && 0 == err) {
    err = pthread_cond_wait(&m_cond, &m_mutex);

    pthread_testcancel();
  }

  if (0 == err) {
    val = std::move_if_noexcept(m_queue.front());
    m_queue.pop_front();
  }

  SOLO_PROC_EXIT_PTHREAD_MUTEX_CLEANUP();

  unlock();

  if (err) {
    throw std::runtime_error(strerror(err));
  }

  return val;
}

template <typename T>
auto Solo_Buffer<T>::pop(long timeout) -> std::optional<T> {
  struct timespec timeoutTs{};
  std::optional<T> val{};
  int err{};

  clock_gettime(CLOCK_REALTIME, &timeoutTs);

  timeoutTs.tv_sec += (timeout / 1000000L);
  timeoutTs.tv_nsec += (timeout % 1000000L) * 1000L;
  if (timeoutTs.tv_nsec >= 1000000000L) {
    timeoutTs.tv_sec += 1;
    timeoutTs.tv_nsec -= 1000000000L;
  }

  lock();

  SOLO_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(&m_mutex);

  pthread_testcancel();

  while (m_queue.empty() && 0 == err) {
    err = pthread_cond_timedwait(&m_cond, &m_mutex, &timeoutTs);

    pthread_testcancel();
  }

  if (!m_queue.empty()) {
    val = std::move_if_noexcept(m_queue.front());
    m_queue.pop_front();
  }

  SOLO_PROC_EXIT_PTHREAD_MUTEX_CLEANUP();

  unlock();

  if (err && ETIMEDOUT != err) {
    throw std::runtime_error(strerror(err));
  }

  return val;
}

template <typename T> auto Solo_Buffer<T>::popNoWait() -> std::optional<T> {
  std::optional<T> val{};

  lock();

  if (!m_queue.empty()) {
    val = std::move_if_noexcept(m_queue.front());
    m_queue.pop_front();
  }

  unlock();

  return val;
}

template <typename T> void Solo_Buffer<T>::push(T &&item) {
  T moved_item = std::move_if_noexcept(item);

  push(moved_item, true);
}

template <typename T> void Solo_Buffer<T>::push(T &item, bool move) {
  int err{};

  lock();

  if (move) {
    m_queue.push_back(std::move_if_noexcept(item));
  } else {
    m_queue.push_back(item);
  }

  ++m_push_count;

  err = pthread_cond_signal(&m_cond);
  if (err) {
    pthread_mutex_unlock(&m_mutex);

    throw std::runtime_error(strerror(err));
  }

  unlock();
}

template <typename T> auto Solo_Buffer<T>::size() -> size_t {
  size_t count{};

  lock();
  count = m_queue.size();
  unlock();

  return count;
}

template <typename T> auto Solo_Buffer<T>::pushCount() -> size_t {
  size_t count{};

  lock();
  count = m_push_count;
  unlock();

  return count;
}

} // namespace solo

#endif // SOLO_BUFFER_HPP_
