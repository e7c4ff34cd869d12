/*
 * RAIIFileHandle.cpp - RAII wrapper for stdio FILE* handles
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

#include "streammux.h"

namespace StreamMux {
namespace IO {

RAIIFileHandle::RAIIFileHandle() noexcept : m_file(nullptr) {
}

RAIIFileHandle::RAIIFileHandle(FILE* file) noexcept : m_file(file) {
}

RAIIFileHandle::RAIIFileHandle(RAIIFileHandle&& other) noexcept
    : m_file(other.m_file) {
    other.m_file = nullptr;
}

RAIIFileHandle& RAIIFileHandle::operator=(RAIIFileHandle&& other) noexcept {
    if (this != &other) {
        close();
        m_file = other.m_file;
        other.m_file = nullptr;
    }
    return *this;
}

RAIIFileHandle::~RAIIFileHandle() noexcept {
    close();
}

bool RAIIFileHandle::open(const char* filename, const char* mode) noexcept {
    close();

    if (!filename || !mode) {
        Debug::log("raii", "RAIIFileHandle::open() - Invalid parameters");
        errno = EINVAL;
        return false;
    }

    m_file = fopen(filename, mode);
    if (m_file) {
        Debug::log("raii", "RAIIFileHandle::open() - Opened ", filename, " mode ", mode);
    } else {
        Debug::log("raii", "RAIIFileHandle::open() - Failed to open ", filename, ": ", strerror(errno));
    }

    return m_file != nullptr;
}

int RAIIFileHandle::close() noexcept {
    int result = 0;

    if (m_file) {
        result = fclose(m_file);
        if (result != 0) {
            Debug::log("raii", "RAIIFileHandle::close() - Error closing file: ", strerror(errno));
        }
    }

    m_file = nullptr;
    return result;
}

FILE* RAIIFileHandle::release() noexcept {
    FILE* file = m_file;
    m_file = nullptr;
    return file;
}

void RAIIFileHandle::reset(FILE* file) noexcept {
    close();
    m_file = file;
}

FILE* RAIIFileHandle::get() const noexcept {
    return m_file;
}

bool RAIIFileHandle::is_valid() const noexcept {
    return m_file != nullptr;
}

RAIIFileHandle::operator bool() const noexcept {
    return is_valid();
}

void RAIIFileHandle::swap(RAIIFileHandle& other) noexcept {
    std::swap(m_file, other.m_file);
}

void swap(RAIIFileHandle& lhs, RAIIFileHandle& rhs) noexcept {
    lhs.swap(rhs);
}

} // namespace IO
} // namespace StreamMux
