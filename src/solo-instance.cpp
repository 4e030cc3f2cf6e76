/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo-instance.cpp
 * @brief Implementation of Solo_Single_Instance and the path helpers.
 *
 * run() goes through the election synchronously on the caller's thread:
 * parent directory, Solo_Lock::tryAcquire(), then either bind and start the
 * listener (leader) or dial() and the exit hook (follower). Nothing is
 * retried; failures surface as exceptions from run().
 */

#include "solo-instance.hpp"

#include <cstdlib>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "solo-debug.hpp"
#include "solo-dialer.hpp"
#include "solo-listener.hpp"
#include "solo-lock.hpp"

namespace solo {

auto socketPath(std::string_view identifier) -> std::string {
  const std::filesystem::path tmp_dir = std::filesystem::temp_directory_path();

  return (tmp_dir / (std::string{identifier} + ".sock")).string();
}

auto lockPathFor(std::string_view endpointPath) -> std::string {
  constexpr std::string_view sock_suffix{".sock"};

  if (endpointPath.ends_with(sock_suffix)) {
    endpointPath.remove_suffix(sock_suffix.size());
  }

  return std::string{endpointPath} + ".lock";
}

void Solo_Single_Instance::defaultExit() { std::exit(EXIT_SUCCESS); }

Solo_Single_Instance::Solo_Single_Instance(std::string endpointPath,
                                           ExitHook onExit)
    : m_endpointPath{std::move(endpointPath)},
      m_lockPath{lockPathFor(m_endpointPath)}, m_onExit{std::move(onExit)} {}

Solo_Single_Instance::~Solo_Single_Instance() noexcept {
  // Stop every task before the lock and the queue they use go away.
  m_listener = {};
  m_lock = {};
}

auto Solo_Single_Instance::run(const Solo_Args &args, Handler onArgsReceived)
    -> bool {
  if (m_ran) {
    throw std::logic_error("Solo_Single_Instance::run() on " + m_endpointPath +
                           " called twice");
  }

  m_ran = true;

  ensureParentDirectory();

  std::shared_ptr<Solo_Lock> lock =
      Solo_Lock::tryAcquire(m_lockPath, m_endpointPath);
  if (lock) {
    auto listener = std::make_unique<Solo_Listener>(m_endpointPath, lock);

    listener->start(std::move(onArgsReceived));

    m_lock = std::move(lock);
    m_listener = std::move(listener);

    SOLO_DEBUG_PRINT(std::cerr << "leader for " << m_endpointPath << "\n");

    return true;
  }

  // There is a race where the leader holding the lock terminates before the
  // dial completes. It is left unhandled: the same thing can happen right
  // after a successful dial.
  dial(m_endpointPath, args);

  if (m_onExit) {
    m_onExit();
  }

  return false;
}

auto Solo_Single_Instance::run(const Solo_Args &args) -> bool {
  return run(args, [this](Solo_Args &&received) {
    m_received.push(std::move(received));
  });
}

void Solo_Single_Instance::ensureParentDirectory() {
  const std::filesystem::path parent =
      std::filesystem::path{m_endpointPath}.parent_path();

  // Throws std::filesystem::filesystem_error on failure.
  if (!parent.empty()) {
    std::filesystem::create_directories(parent);
  }
}

} // namespace solo
