/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo-dialer.cpp
 * @brief Implementation of dial().
 */

#include "solo-dialer.hpp"

#include <string>
#include <string_view>

#include "solo-debug.hpp"
#include "solo-frame.hpp"
#include "solo-socket.hpp"

namespace solo {

void dial(std::string_view endpointPath, const Solo_Args &args) {
  // Encode first so an unframeable list fails before the leader sees a
  // connection.
  const std::string frame = encodeFrame(args);

  Solo_Local_Socket socket{endpointPath};

  socket.writeBytes(frame);
  socket.shutdownWrite();

  SOLO_DEBUG_PRINT(std::cerr << "sent " << args.size() << " args to "
                             << endpointPath << "\n");
}

} // namespace solo
