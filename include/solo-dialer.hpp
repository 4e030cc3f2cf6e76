/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo-dialer.hpp
 * @brief Follower-side transfer of an argument list to the leader.
 */

#ifndef SOLO_DIALER_HPP_
#define SOLO_DIALER_HPP_

#include <string_view>

#include "solo-frame.hpp"

namespace solo {

/**
 * @brief Connect to the leader's endpoint and send @p args as one frame.
 *
 * The connection is half-closed after the frame and then closed. There is
 * no retry: if the leader died between the lock check and this call, the
 * connect error is reported to the caller as is.
 *
 * @throws std::runtime_error if the endpoint cannot be reached or the write
 *         fails.
 * @throws Solo_Frame_Error if @p args cannot be framed within the bounds.
 */
void dial(std::string_view endpointPath, const Solo_Args &args);

} // namespace solo

#endif // SOLO_DIALER_HPP_
