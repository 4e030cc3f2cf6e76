/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file include/solo-debug.hpp
 * @brief Lightweight debug-print macro controlled by the preprocessor.
 *
 * SOLO_DEBUG_PRINT(print_stmt) evaluates the given statement when NDEBUG is
 * not defined and compiles to an empty statement when it is (typically for
 * release builds):
 *
 *   SOLO_DEBUG_PRINT(std::cerr << "accepted fd " << fd << '\n');
 *
 * The expansion is wrapped in do { ... } while (false) so the macro is safe
 * inside if/else without braces. Under NDEBUG the statement is not evaluated,
 * so it must not carry side effects the program relies on.
 */

#ifndef SOLO_DEBUG_HPP_
#define SOLO_DEBUG_HPP_

#include <iostream>

#ifdef NDEBUG
#define SOLO_DEBUG_PRINT(print_stmt)                                           \
  do {                                                                         \
  } while (false)
#else
#define SOLO_DEBUG_PRINT(print_stmt)                                           \
  do {                                                                         \
    (print_stmt);                                                              \
  } while (false)
#endif

#endif // SOLO_DEBUG_HPP_
