/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo-example.cpp
 * @brief Example program: solo-example <identifier> [args...]
 *
 * The first process started for an identifier becomes the leader. It prints
 * its own arguments, then one line per argument list forwarded by a later
 * launch, until SIGINT or SIGTERM. Later launches forward their arguments
 * and exit 0; if the leader cannot be reached they print the error and
 * exit 1.
 */

#include <pthread.h>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

#include "solo.hpp"

namespace {

std::mutex s_print_mutex{};

void printArgs(std::string_view who, const solo::Solo_Args &args) {
  const std::lock_guard<std::mutex> lock{s_print_mutex};

  std::cout << who << ":";
  for (const auto &arg : args) {
    std::cout << " [" << arg << "]";
  }

  std::cout << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <identifier> [args...]\n";

    return EXIT_FAILURE;
  }

  const solo::Solo_Args args(argv + 2, argv + argc);

  // Block the termination signals before any thread exists so only the
  // sigwait() below receives them.
  sigset_t mask{};
  sigemptyset(&mask);
  sigaddset(&mask, SIGINT);
  sigaddset(&mask, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &mask, nullptr);

  try {
    solo::Solo_Single_Instance instance{solo::socketPath(argv[1])};

    instance.run(args, [](solo::Solo_Args &&received) {
      printArgs("received", received);
    });

    printArgs("leader", args);

    int signo{};
    sigwait(&mask, &signo);

    SOLO_DEBUG_PRINT(std::cerr << "exiting on signal " << signo << "\n");
  } catch (const std::exception &e) {
    std::cerr << argv[0] << ": " << e.what() << "\n";

    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
