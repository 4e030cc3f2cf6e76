/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo-test-proc.cpp
 * @brief The unit test for solo-proc module.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "solo-buffer.hpp"
#include "solo-proc.hpp"

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);
  using namespace std::string_literals;

  // exec and wait
  std::atomic<int> count{};
  solo::Solo_Proc proc{"counter", [&count]() { count++; }};

  EXPECT_TRUE("counter" == proc.getName());
  EXPECT_TRUE(!proc.isDone());

  EXPECT_TRUE(proc.exec());
  EXPECT_TRUE(proc.wait());
  EXPECT_TRUE(proc.isDone());
  EXPECT_TRUE(1 == count);

  // the task can be replaced on a later exec
  EXPECT_TRUE(proc.exec([&count]() { count += 10; }));
  EXPECT_TRUE(proc.wait());
  EXPECT_TRUE(11 == count);

  // wait without a running task
  bool waitThrown{};
  try {
    proc.wait();
  } catch (const std::runtime_error &e) {
    std::cout << "wait: " << e.what() << "\n";
    waitThrown = true;
  }

  EXPECT_TRUE(waitThrown);

  // exec without a task
  bool execThrown{};
  solo::Solo_Proc empty{"empty"};
  try {
    empty.exec();
  } catch (const std::runtime_error &e) {
    std::cout << "exec: " << e.what() << "\n";
    execThrown = true;
  }

  EXPECT_TRUE(execThrown);

  // stopExec on a task parked in Solo_Buffer::pop()
  solo::Solo_Buffer<std::string> buf{};
  std::atomic<bool> popped{};
  auto blocked = std::make_unique<solo::Solo_Proc>("blocked", [&buf, &popped]() {
    buf.pop();
    popped = true;
  });

  EXPECT_TRUE(blocked->exec());
  std::this_thread::sleep_for(std::chrono::milliseconds(500));

  EXPECT_TRUE(blocked->stopExec());
  EXPECT_TRUE(!blocked->isDone());
  EXPECT_TRUE(!popped);

  // stopExec is a no-op once stopped
  EXPECT_TRUE(blocked->stopExec());

  // the cancelled pop released the buffer mutex
  buf.push("after cancel"s);
  EXPECT_TRUE(1 == buf.size());
  EXPECT_TRUE("after cancel" == buf.pop());

  // destroying a running proc cancels it
  std::atomic<bool> started{};
  blocked = std::make_unique<solo::Solo_Proc>("destroyed", [&buf, &started]() {
    started = true;
    buf.pop();
  });

  EXPECT_TRUE(blocked->exec());
  while (!started) {
    solo::Solo_Proc::yield();
  }

  blocked = {};

  buf.push("still usable"s);
  EXPECT_TRUE("still usable" == buf.pop());

  // a task that checks for cancellation itself
  solo::Solo_Proc spinner{"spinner", []() {
                            while (true) {
                              solo::Solo_Proc::yield();
                            }
                          }};

  EXPECT_TRUE(spinner.exec());
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  EXPECT_TRUE(spinner.stopExec());
  EXPECT_TRUE(!spinner.isDone());

  return RUN_ALL_TESTS();
}
