/**
 * @file cfile.hpp
 * @date 19 Oct 2026
 * @addtogroup Cpp
 *
 * @brief C++ bindings for the LibC buffered files, providing:
 * - @b RAII ownership of `std::FILE` streams.
 * - @b Monadic error handling with the native `errno` preserved.
 * - @b JSON configurations for opening and buffering.
 */

#pragma once
#include "cfile/cpp/file.hpp"
