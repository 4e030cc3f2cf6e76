/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo-test-listener.cpp
 * @brief The unit test for solo-listener, solo-dialer and solo-socket
 *        modules.
 */

#include <gtest/gtest.h>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "solo-buffer.hpp"
#include "solo-dialer.hpp"
#include "solo-frame.hpp"
#include "solo-listener.hpp"
#include "solo-socket.hpp"

namespace {

constexpr long kWaitUs{5000000};

std::string bigEndian(std::uint32_t value) {
  std::string out{};

  out.push_back(static_cast<char>((value >> 24) & 0xFF));
  out.push_back(static_cast<char>((value >> 16) & 0xFF));
  out.push_back(static_cast<char>((value >> 8) & 0xFF));
  out.push_back(static_cast<char>(value & 0xFF));

  return out;
}

// True if the peer of @p socket closed within @p timeoutMs.
bool seesEndOfStream(solo::Solo_Local_Socket &socket, int timeoutMs) {
  struct pollfd pfd{};
  char byte{};

  pfd.fd = socket.fd();
  pfd.events = POLLIN;

  return 1 == poll(&pfd, 1, timeoutMs) && 0 == socket.readBytes(&byte, 1);
}

} // namespace

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  const std::filesystem::path dir =
      std::filesystem::temp_directory_path() /
      ("solo-test-listener-" + std::to_string(getpid()));
  std::filesystem::create_directories(dir);

  const std::string sockPath = (dir / "app.sock").string();

  // frames over a connected socket pair
  int pair[2]{};
  EXPECT_TRUE(0 == socketpair(AF_UNIX, SOCK_STREAM, 0, pair));

  {
    solo::Solo_Local_Socket writer{pair[0]};
    solo::Solo_Local_Socket reader{pair[1]};

    writer.write(solo::Solo_Args{"--foo", "bar"});
    writer.shutdownWrite();

    auto args = reader.read();
    EXPECT_TRUE(args);
    EXPECT_TRUE((solo::Solo_Args{"--foo", "bar"}) == *args);

    EXPECT_TRUE(!reader.read());
  }

  // paths that do not fit in sockaddr_un
  bool thrown{};
  try {
    solo::Solo_Listener tooLong{(dir / std::string(200, 'a')).string()};
  } catch (const std::runtime_error &e) {
    std::cout << "too long: " << e.what() << "\n";
    thrown = true;
  }

  EXPECT_TRUE(thrown);

  // nobody listening
  thrown = false;
  try {
    solo::dial(sockPath, {"--foo"});
  } catch (const std::runtime_error &e) {
    std::cout << "no listener: " << e.what() << "\n";
    thrown = true;
  }

  EXPECT_TRUE(thrown);

  const solo::Solo_Args none{};
  solo::Solo_Buffer<solo::Solo_Args> received{};
  solo::Solo_Buffer<std::string> gate{};

  auto listener = std::make_unique<solo::Solo_Listener>(sockPath);
  listener->start([&received, &gate](solo::Solo_Args &&args) {
    if (!args.empty() && "block" == args[0]) {
      gate.pop();
    }

    if (!args.empty() && "throw" == args[0]) {
      throw 42;
    }

    received.push(std::move(args));
  });

  EXPECT_TRUE(std::filesystem::is_socket(sockPath));

  // a second listener on the same path
  thrown = false;
  try {
    solo::Solo_Listener second{sockPath};
  } catch (const std::runtime_error &e) {
    std::cout << "second bind: " << e.what() << "\n";
    thrown = true;
  }

  EXPECT_TRUE(thrown);

  // a plain dial
  solo::dial(sockPath, {"--bar", "baz"});

  auto args = received.pop(kWaitUs);
  EXPECT_TRUE(args);
  EXPECT_TRUE((solo::Solo_Args{"--bar", "baz"}) == args.value_or(none));

  // the connection is closed once its frame is handled
  {
    solo::Solo_Local_Socket client{sockPath};
    client.write(solo::Solo_Args{"--x"});
    client.shutdownWrite();

    args = received.pop(kWaitUs);
    EXPECT_TRUE((solo::Solo_Args{"--x"}) == args.value_or(none));
    EXPECT_TRUE(seesEndOfStream(client, 2000));
  }

  // a handler throwing something that is not a std::exception only ends its
  // own connection
  {
    solo::Solo_Local_Socket client{sockPath};
    client.write(solo::Solo_Args{"throw"});
    client.shutdownWrite();

    EXPECT_TRUE(seesEndOfStream(client, 2000));
  }

  solo::dial(sockPath, {"after throw"});

  args = received.pop(kWaitUs);
  EXPECT_TRUE((solo::Solo_Args{"after throw"}) == args.value_or(none));

  // an empty list is still a list
  solo::dial(sockPath, {});

  args = received.pop(kWaitUs);
  EXPECT_TRUE(args);
  EXPECT_TRUE(args.value_or(solo::Solo_Args{"not empty"}).empty());

  // a peer that connects and never writes
  solo::Solo_Local_Socket silent{sockPath};

  // a peer that sends half of a header
  {
    solo::Solo_Local_Socket partial{sockPath};
    partial.writeBytes(std::string(2, '\0'));
    partial.shutdownWrite();
  }

  // a peer that sends an out-of-range count
  {
    solo::Solo_Local_Socket garbage{sockPath};
    garbage.writeBytes(bigEndian(5000));
    garbage.shutdownWrite();
  }

  // none of the above is delivered, nor holds up the next dial
  solo::dial(sockPath, {"after"});

  args = received.pop(kWaitUs);
  EXPECT_TRUE(args);
  EXPECT_TRUE((solo::Solo_Args{"after"}) == args.value_or(none));

  // a handler blocked on one connection does not hold up another
  solo::dial(sockPath, {"block"});
  solo::dial(sockPath, {"free"});

  args = received.pop(kWaitUs);
  EXPECT_TRUE(args);
  EXPECT_TRUE((solo::Solo_Args{"free"}) == args.value_or(none));

  gate.push(std::string{"go"});

  args = received.pop(kWaitUs);
  EXPECT_TRUE(args);
  EXPECT_TRUE((solo::Solo_Args{"block"}) == args.value_or(none));

  EXPECT_TRUE(!received.popNoWait());

  // only the silent peer is left open
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (listener->connectionCount() > 1 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  std::cout << "connections before stop: " << listener->connectionCount()
            << "\n";
  EXPECT_TRUE(1 == listener->connectionCount());
  EXPECT_TRUE(!seesEndOfStream(silent, 200));

  // stop returns with the silent peer still connected, and closes it
  listener->stop();
  EXPECT_TRUE(0 == listener->connectionCount());
  EXPECT_TRUE(seesEndOfStream(silent, 2000));

  listener = {};

  // the endpoint is left for the next lock holder to remove
  EXPECT_TRUE(std::filesystem::exists(sockPath));

  thrown = false;
  try {
    solo::dial(sockPath, {"--foo"});
  } catch (const std::runtime_error &e) {
    std::cout << "after stop: " << e.what() << "\n";
    thrown = true;
  }

  EXPECT_TRUE(thrown);

  std::filesystem::remove_all(dir);

  return RUN_ALL_TESTS();
}
