/*
 * exceptions.cpp - exception class implementations
 * This file is part of StreamMux.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
 *
 * StreamMux is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#include "streammux.h"

namespace StreamMux {
namespace Core {

/**
 * @brief Constructs an InvalidStreamException.
 *
 * Thrown when a stream wrapper is given a stream it cannot work with, such
 * as a null handler or one that does not support seeking.
 * @param why A string describing the reason for the failure.
 */
InvalidStreamException::InvalidStreamException(const std::string &why)
    : std::exception(), m_why(why) {
  // ctor
}

/**
 * @brief Returns the exception's explanatory string.
 * @return A C-style string detailing why the stream was rejected.
 */
const char *InvalidStreamException::what() const noexcept {
  return m_why.c_str();
}

/**
 * @brief Constructs an IOException.
 *
 * Used when a backing resource such as a file cannot be opened.
 * @param why A string describing the I/O error.
 */
IOException::IOException(const std::string &why)
    : std::exception(), m_why(why) {
  // ctor
}

/**
 * @brief Returns the exception's explanatory string.
 * @return A C-style string detailing the I/O error.
 */
const char *IOException::what() const noexcept { return m_why.c_str(); }

} // namespace Core
} // namespace StreamMux
