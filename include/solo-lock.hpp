/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo-lock.hpp
 * @brief Leader election through an exclusive advisory file lock.
 *
 * @details
 * The first process to take a non-blocking flock(LOCK_EX) on the lock file
 * is the leader for the identity key. The kernel ties the lock to the open
 * file description, so it is released automatically when the holder dies
 * (normally or not) and also as soon as the descriptor is closed. A leader
 * therefore keeps its Solo_Lock alive for as long as it wants to lead,
 * normally the whole process lifetime.
 *
 * There is an accepted race: the lock of a terminating leader can be seen as
 * free before that leader has finished its teardown. The same race exists at
 * every step of the protocol and nothing depends on closing it.
 */

#ifndef SOLO_LOCK_HPP_
#define SOLO_LOCK_HPP_

#include <memory>
#include <string>
#include <string_view>

namespace solo {

class Solo_Lock {
  struct Key {
    explicit Key() = default;
  };

public:
  /**
   * @brief Try to become leader.
   *
   * Opens (creating if absent) @p lockPath and attempts a non-blocking
   * exclusive lock on it. On success any stale filesystem entry at
   * @p endpointPath, left behind by a leader that died without cleanup, is
   * removed so the endpoint can be bound again.
   *
   * @param lockPath     path of the lock file.
   * @param endpointPath path of the listening endpoint guarded by the lock.
   * @return the lock handle, or nullptr if another process holds the lock.
   * @throws std::runtime_error if the lock file cannot be opened, flock()
   *         fails for a reason other than contention, or the stale endpoint
   *         cannot be removed.
   */
  static auto tryAcquire(std::string_view lockPath,
                         std::string_view endpointPath)
      -> std::unique_ptr<Solo_Lock>;

  /**
   * Closing the descriptor drops leadership.
   */
  ~Solo_Lock() noexcept;

  Solo_Lock(const Solo_Lock &obj) = delete;
  const Solo_Lock &operator=(const Solo_Lock &obj) = delete;
  Solo_Lock(Solo_Lock &&obj) = delete;
  Solo_Lock &operator=(Solo_Lock &&obj) = delete;

  /**
   * Only tryAcquire() can create a Solo_Lock, through the private Key.
   */
  Solo_Lock(Key key, std::string_view path, int fd);

  auto path() const -> const std::string & { return m_path; }

private:

  const std::string m_path{};
  int m_fd{-1};
}; // class Solo_Lock

} // namespace solo

#endif // SOLO_LOCK_HPP_
