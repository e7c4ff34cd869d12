/*
 * RAIIFileHandle.h - RAII wrapper for stdio FILE* handles
 * This file is part of StreamMux.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
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

#ifndef RAIIFILEHANDLE_H
#define RAIIFILEHANDLE_H

// No direct includes - all includes should be in streammux.h

namespace StreamMux {
namespace IO {

/**
 * @brief Move-only owner of a FILE* handle
 *
 * The handle is closed on destruction unless it was released first.
 */
class RAIIFileHandle {
public:
    RAIIFileHandle() noexcept;

    /**
     * @brief Take ownership of an already open FILE* handle
     * @param file FILE* handle to manage (can be nullptr)
     */
    explicit RAIIFileHandle(FILE* file) noexcept;

    RAIIFileHandle(RAIIFileHandle&& other) noexcept;
    RAIIFileHandle& operator=(RAIIFileHandle&& other) noexcept;

    ~RAIIFileHandle() noexcept;

    RAIIFileHandle(const RAIIFileHandle&) = delete;
    RAIIFileHandle& operator=(const RAIIFileHandle&) = delete;

    /**
     * @brief Open a file, closing any handle currently held
     * @param filename Path to the file to open
     * @param mode fopen() mode string
     * @return true if file was opened successfully; errno is left set otherwise
     */
    bool open(const char* filename, const char* mode) noexcept;

    /**
     * @brief Close the file handle
     * @return 0 on success, EOF on error (same as fclose)
     */
    int close() noexcept;

    /**
     * @brief Release ownership of the file handle
     * @return The FILE* handle (caller takes ownership)
     */
    FILE* release() noexcept;

    /**
     * @brief Close the current handle and take ownership of another
     */
    void reset(FILE* file = nullptr) noexcept;

    FILE* get() const noexcept;
    bool is_valid() const noexcept;
    explicit operator bool() const noexcept;

    void swap(RAIIFileHandle& other) noexcept;

private:
    FILE* m_file;
};

void swap(RAIIFileHandle& lhs, RAIIFileHandle& rhs) noexcept;

} // namespace IO
} // namespace StreamMux

#endif // RAIIFILEHANDLE_H
