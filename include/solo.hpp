/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file solo.hpp
 * @brief Convenience umbrella header for the Solo single-instance library.
 *
 * Pulls in the full public API. Prefer including only the headers a
 * translation unit needs; most applications only need solo-instance.hpp.
 */

#ifndef SOLO_HPP_
#define SOLO_HPP_

#include "solo-buffer.hpp"
#include "solo-debug.hpp"
#include "solo-dialer.hpp"
#include "solo-frame.hpp"
#include "solo-instance.hpp"
#include "solo-io.hpp"
#include "solo-listener.hpp"
#include "solo-lock.hpp"
#include "solo-proc.hpp"
#include "solo-socket.hpp"

#endif // SOLO_HPP_
