/*
 * exceptions.h - exception classes
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

#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

namespace StreamMux {
namespace Core {

// A stream handed to a wrapper cannot be used by it (null, not seekable).
class InvalidStreamException : public std::exception
{
    public:
        InvalidStreamException(const std::string &why);
        ~InvalidStreamException() noexcept override = default;
        const char *what() const noexcept override;
    protected:
    private:
        std::string m_why;
};

// The backing resource could not be opened or accessed.
class IOException : public std::exception
{
    public:
        IOException(const std::string &why);
        ~IOException() noexcept override = default;
        const char *what() const noexcept override;
    protected:
    private:
        std::string m_why;
};

} // namespace Core
} // namespace StreamMux

#endif // EXCEPTIONS_H
