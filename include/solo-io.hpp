/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo-io.hpp
 * @brief Generic IO interface used by the Solo library.
 *
 * Solo_Io<T> declares a minimal, transport-agnostic interface for reading and
 * writing values of type T. In this library it is implemented by the local
 * stream socket, where one T is one decoded argument frame.
 *
 * Semantics:
 *  - read(): Returns the next available item wrapped in std::optional<T>.
 *    The call blocks until data becomes available. If the underlying source
 *    reaches end-of-stream before an item starts, std::nullopt is returned.
 *    A malformed or truncated item is an error and is reported by throwing.
 *
 *  - write(T &item): Takes an lvalue reference and does not take ownership.
 *
 *  - write(T &&item): Takes an rvalue reference; implementations SHOULD move
 *    from the item when possible.
 *
 * Thread-safety:
 *  - The interface does not mandate any concurrency guarantees.
 */

#ifndef SOLO_IO_HPP_
#define SOLO_IO_HPP_

#include <optional>

namespace solo {

template <typename T> class Solo_Io {
public:
  virtual ~Solo_Io() noexcept = default;

  /**
   * @brief Read and return the next available item.
   *
   * @return optional<T> containing the next item, or std::nullopt on
   *         end-of-stream.
   */
  virtual auto read() -> std::optional<T> = 0;

  /**
   * @brief Write (copy) an item to the sink.
   *
   * @param item The item to write.
   */
  virtual void write(T &item) = 0;

  /**
   * @brief Write (move) an item to the sink.
   *
   * @param item The item to write (may be moved from).
   */
  virtual void write(T &&item) = 0;
};

} // namespace solo

#endif // SOLO_IO_HPP_
