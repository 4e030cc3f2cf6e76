/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo-frame.hpp
 * @brief Length-prefixed binary framing of an argument list.
 *
 * Wire format of one frame, all integers 4-byte big-endian:
 *
 *   [count]                    0 <= count <= kFrameMaxCount
 *   repeat count times:
 *     [length]                 kFrameMinLength <= length <= kFrameMaxLength
 *     [length bytes of UTF-8]
 *
 * The frame is self-delimiting, so exactly one frame is sent per connection
 * and no terminator follows it. Bounds are checked as soon as each integer
 * is read, before any payload byte behind it is consumed, so a hostile peer
 * can never make the decoder read more than
 * 4 + kFrameMaxCount * (4 + kFrameMaxLength) bytes.
 *
 * Integers are transported as signed 32-bit values; a value with the high
 * bit set is negative and therefore out of bounds.
 */

#ifndef SOLO_FRAME_HPP_
#define SOLO_FRAME_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace solo {

using Solo_Args = std::vector<std::string>;

inline constexpr std::uint32_t kFrameMaxCount{1024};
inline constexpr std::uint32_t kFrameMinLength{1};
inline constexpr std::uint32_t kFrameMaxLength{1024};
inline constexpr std::size_t kFrameIntSize{4};

/**
 * @brief Thrown for a malformed, truncated or out-of-bounds frame.
 */
class Solo_Frame_Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * Byte source for the streaming decoder: fill up to @p size bytes into
 * @p buf and return how many were filled. A return value smaller than
 * @p size means the stream ended. I/O errors are reported by throwing.
 */
using Solo_Frame_Reader = std::function<size_t(char *buf, size_t size)>;

/**
 * @brief Encode an argument list into one frame.
 *
 * @throws Solo_Frame_Error if the list has more than kFrameMaxCount entries
 *         or an entry's byte length is outside
 *         [kFrameMinLength, kFrameMaxLength], i.e. the list would be
 *         rejected by the receiving decoder.
 */
auto encodeFrame(const Solo_Args &args) -> std::string;

/**
 * @brief Decode one frame from a byte stream.
 *
 * @return the decoded list, or std::nullopt if the stream ended before the
 *         first byte of the frame.
 * @throws Solo_Frame_Error on out-of-bounds values or if the stream ends
 *         inside the frame.
 */
auto decodeFrame(const Solo_Frame_Reader &reader) -> std::optional<Solo_Args>;

/**
 * @brief Decode a complete in-memory frame.
 *
 * @throws Solo_Frame_Error on out-of-bounds values, truncated input or
 *         trailing bytes after the frame.
 */
auto decodeFrame(std::string_view bytes) -> Solo_Args;

} // namespace solo

#endif // SOLO_FRAME_HPP_
