/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo-test-instance-2.cpp
 * @brief The unit test for solo-instance module, leader and followers in
 *        separate processes.
 */

#include <gtest/gtest.h>

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "solo-dialer.hpp"
#include "solo-frame.hpp"
#include "solo-instance.hpp"
#include "solo-lock.hpp"

#ifndef SOLO_EXAMPLE_PATH
#define SOLO_EXAMPLE_PATH "solo-example"
#endif

namespace {

constexpr long kWaitUs{5000000};

// Spawn solo-example with TMPDIR pointing at @p tmpDir, return its exit
// status or -1.
int spawnExample(const std::filesystem::path &tmpDir,
                 const std::vector<std::string> &args) {
  std::vector<std::string> argvStrings{SOLO_EXAMPLE_PATH};
  argvStrings.insert(argvStrings.end(), args.begin(), args.end());

  std::vector<char *> argv{};
  for (auto &arg : argvStrings) {
    argv.push_back(arg.data());
  }

  argv.push_back(nullptr);

  std::string tmpEnv{"TMPDIR=" + tmpDir.string()};
  char *envp[] = {tmpEnv.data(), nullptr};

  pid_t pid{};
  if (0 != posix_spawn(&pid, SOLO_EXAMPLE_PATH, nullptr, nullptr, argv.data(),
                       envp)) {
    return -1;
  }

  int status{};
  if (waitpid(pid, &status, 0) != pid || !WIFEXITED(status)) {
    return -1;
  }

  return WEXITSTATUS(status);
}

} // namespace

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  const std::filesystem::path dir =
      std::filesystem::temp_directory_path() /
      ("solo-test-instance-2-" + std::to_string(getpid()));
  std::filesystem::create_directories(dir);

  const std::string sockPath = (dir / "app.sock").string();
  const std::string lockPath = solo::lockPathFor(sockPath);

  // A child process is the leader. Forked while this process has no other
  // thread.
  int ready[2]{};
  EXPECT_TRUE(0 == pipe(ready));

  std::cout.flush();

  const pid_t leaderPid = fork();
  if (0 == leaderPid) {
    close(ready[0]);

    try {
      solo::Solo_Single_Instance instance{sockPath, {}};

      if (instance.run({"--child"})) {
        const char c{'1'};

        if (1 == write(ready[1], &c, 1)) {
          while (true) {
            pause();
          }
        }
      }
    } catch (const std::exception &e) {
      std::cerr << "leader child: " << e.what() << "\n";
    }

    _exit(1);
  }

  EXPECT_TRUE(leaderPid > 0);
  close(ready[1]);

  char c{};
  EXPECT_TRUE(1 == read(ready[0], &c, 1));
  close(ready[0]);

  auto probe = solo::Solo_Lock::tryAcquire(lockPath, sockPath);
  EXPECT_TRUE(!probe);

  bool dialed{};
  try {
    solo::dial(sockPath, {"--to-child"});
    dialed = true;
  } catch (const std::exception &e) {
    std::cout << "dial child: " << e.what() << "\n";
  }

  EXPECT_TRUE(dialed);

  // the kernel releases the lock of a killed leader, the endpoint stays
  EXPECT_TRUE(0 == kill(leaderPid, SIGKILL));

  int status{};
  EXPECT_TRUE(leaderPid == waitpid(leaderPid, &status, 0));
  EXPECT_TRUE(WIFSIGNALED(status));
  EXPECT_TRUE(std::filesystem::exists(sockPath));

  solo::Solo_Single_Instance leader{sockPath, {}};
  EXPECT_TRUE(leader.run({"--parent"}));
  EXPECT_TRUE(leader.isLeader());
  EXPECT_TRUE(std::filesystem::is_socket(sockPath));

  // a forked follower ends through the default exit hook
  std::cout.flush();

  const pid_t followerPid = fork();
  if (0 == followerPid) {
    try {
      solo::Solo_Single_Instance follower{sockPath};

      follower.run({"--bar", "baz"});
    } catch (const std::exception &e) {
      std::cerr << "follower child: " << e.what() << "\n";

      _exit(3);
    }

    // run() returned: the exit hook did not end the process
    _exit(2);
  }

  EXPECT_TRUE(followerPid > 0);

  status = 0;
  EXPECT_TRUE(followerPid == waitpid(followerPid, &status, 0));
  EXPECT_TRUE(WIFEXITED(status));
  EXPECT_TRUE(EXIT_SUCCESS == WEXITSTATUS(status));

  auto args = leader.receivedArgs().pop(kWaitUs);
  EXPECT_TRUE(args);
  EXPECT_TRUE((solo::Solo_Args{"--bar", "baz"}) ==
              args.value_or(solo::Solo_Args{}));

  // the example program as a follower
  std::cout.flush();

  EXPECT_TRUE(EXIT_SUCCESS == spawnExample(dir, {"app", "--spawned", "x"}));

  args = leader.receivedArgs().pop(kWaitUs);
  EXPECT_TRUE(args);
  EXPECT_TRUE((solo::Solo_Args{"--spawned", "x"}) ==
              args.value_or(solo::Solo_Args{}));

  // the example program with a lock held but no leader listening
  const std::string lonelyPath = (dir / "lonely.sock").string();
  auto lonelyLock =
      solo::Solo_Lock::tryAcquire(solo::lockPathFor(lonelyPath), lonelyPath);
  EXPECT_TRUE(lonelyLock);

  EXPECT_TRUE(EXIT_FAILURE == spawnExample(dir, {"lonely", "--nobody"}));

  EXPECT_TRUE(!leader.receivedArgs().popNoWait());

  std::filesystem::remove_all(dir);

  return RUN_ALL_TESTS();
}
