/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo-frame.cpp
 * @brief Implementation of the argument frame codec.
 *
 * Integers go through htonl()/ntohl() and memcpy so the codec does not depend
 * on host byte order or alignment of the byte buffer.
 */

#include "solo-frame.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace solo {

namespace {

void appendInt(std::string &out, std::uint32_t value) {
  std::array<char, kFrameIntSize> buf{};
  const std::uint32_t net_value = htonl(value);

  memcpy(buf.data(), &net_value, buf.size());
  out.append(buf.data(), buf.size());
}

auto toInt(const std::array<char, kFrameIntSize> &buf) -> std::uint32_t {
  std::uint32_t net_value{};

  memcpy(&net_value, buf.data(), buf.size());

  return ntohl(net_value);
}

// Reports the value the way the peer encoded it, as a signed int32.
auto asSigned(std::uint32_t value) -> std::string {
  return std::to_string(static_cast<std::int32_t>(value));
}

void checkCount(std::uint32_t count) {
  if (count > kFrameMaxCount) {
    throw Solo_Frame_Error("arg count out of range: " + asSigned(count));
  }
}

void checkLength(std::uint32_t len) {
  if (len < kFrameMinLength || len > kFrameMaxLength) {
    throw Solo_Frame_Error("arg len out of range: " + asSigned(len));
  }
}

auto readInt(const Solo_Frame_Reader &reader, std::string_view what)
    -> std::uint32_t {
  std::array<char, kFrameIntSize> buf{};

  if (reader(buf.data(), buf.size()) != buf.size()) {
    throw Solo_Frame_Error("frame truncated while reading " +
                           std::string{what});
  }

  return toInt(buf);
}

} // namespace

auto encodeFrame(const Solo_Args &args) -> std::string {
  std::string out{};

  checkCount(static_cast<std::uint32_t>(std::min<size_t>(
      args.size(), static_cast<size_t>(kFrameMaxCount) + 1)));

  size_t total = kFrameIntSize;
  for (const auto &arg : args) {
    checkLength(static_cast<std::uint32_t>(std::min<size_t>(
        arg.size(), static_cast<size_t>(kFrameMaxLength) + 1)));

    total += kFrameIntSize + arg.size();
  }

  out.reserve(total);

  appendInt(out, static_cast<std::uint32_t>(args.size()));
  for (const auto &arg : args) {
    appendInt(out, static_cast<std::uint32_t>(arg.size()));
    out.append(arg);
  }

  return out;
}

auto decodeFrame(const Solo_Frame_Reader &reader) -> std::optional<Solo_Args> {
  std::array<char, kFrameIntSize> header{};
  Solo_Args args{};

  const size_t n_read = reader(header.data(), header.size());
  if (0 == n_read) {
    return {};
  }

  if (n_read != header.size()) {
    throw Solo_Frame_Error("frame truncated while reading count");
  }

  const std::uint32_t count = toInt(header);
  checkCount(count);

  args.reserve(count);

  for (std::uint32_t i = 0; i < count; i++) {
    const std::uint32_t len = readInt(reader, "arg len");
    checkLength(len);

    std::string arg(len, '\0');
    if (reader(arg.data(), len) != len) {
      throw Solo_Frame_Error("frame truncated while reading arg " +
                             std::to_string(i));
    }

    args.push_back(std::move(arg));
  }

  return args;
}

auto decodeFrame(std::string_view bytes) -> Solo_Args {
  size_t offset{};

  auto reader = [&bytes, &offset](char *buf, size_t size) -> size_t {
    const size_t n = std::min(size, bytes.size() - offset);

    if (n > 0) {
      memcpy(buf, bytes.data() + offset, n);
      offset += n;
    }

    return n;
  };

  auto args = decodeFrame(Solo_Frame_Reader{reader});
  if (!args) {
    throw Solo_Frame_Error("frame truncated while reading count");
  }

  if (offset != bytes.size()) {
    throw Solo_Frame_Error("trailing bytes after frame: " +
                           std::to_string(bytes.size() - offset));
  }

  return std::move(*args);
}

} // namespace solo
