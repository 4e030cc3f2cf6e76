/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo-lock.cpp
 * @brief Implementation of Solo_Lock — flock() based leader election.
 */

#include "solo-lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "solo-debug.hpp"

namespace solo {

Solo_Lock::Solo_Lock(Key, std::string_view path, int fd)
    : m_path{path}, m_fd{fd} {}

Solo_Lock::~Solo_Lock() noexcept {
  if (-1 != m_fd) {
    close(m_fd);
  }
}

auto Solo_Lock::tryAcquire(std::string_view lockPath,
                           std::string_view endpointPath)
    -> std::unique_ptr<Solo_Lock> {
  const std::string lock_path{lockPath};
  const std::string endpoint_path{endpointPath};

  const int fd = open(lock_path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw std::runtime_error("Error opening lock file " + lock_path + ": " +
                             std::system_category().message(errno));
  }

  if (flock(fd, LOCK_EX | LOCK_NB) < 0) {
    const int lock_errno = errno;

    close(fd);

    if (EWOULDBLOCK == lock_errno) {
      SOLO_DEBUG_PRINT(std::cerr << lock_path << " already locked\n");

      return nullptr;
    }

    throw std::runtime_error("Error in flock(" + lock_path + "): " +
                             std::system_category().message(lock_errno));
  }

  auto lock = std::make_unique<Solo_Lock>(Key{}, lock_path, fd);

  // Lock held: no other instance is running, so whatever sits at the
  // endpoint path is a leftover and must go before bind().
  if (unlink(endpoint_path.c_str()) < 0 && ENOENT != errno) {
    throw std::runtime_error("Error removing stale endpoint " +
                             endpoint_path + ": " +
                             std::system_category().message(errno));
  }

  SOLO_DEBUG_PRINT(std::cerr << lock_path << " acquired\n");

  return lock;
}

} // namespace solo
