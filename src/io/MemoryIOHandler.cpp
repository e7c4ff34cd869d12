/*
 * MemoryIOHandler.cpp - Memory-backed I/O handler
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

MemoryIOHandler::MemoryIOHandler(const void* data, size_t size, bool copy)
    : m_own_buffer(copy), m_pos(0) {
    if (copy) {
        if (data && size > 0) {
            m_buffer.assign(static_cast<const uint8_t*>(data), static_cast<const uint8_t*>(data) + size);
        }
    } else {
        m_external_data = static_cast<const uint8_t*>(data);
        m_external_size = data ? size : 0;
    }
    Debug::log("io", "MemoryIOHandler::MemoryIOHandler() - ", (copy ? "owned" : "referenced"),
               " buffer of ", size_unlocked(), " bytes");
}

MemoryIOHandler::MemoryIOHandler()
    : m_own_buffer(true), m_pos(0) {
}

MemoryIOHandler::~MemoryIOHandler() = default;

size_t MemoryIOHandler::size_unlocked() const {
    return m_own_buffer ? m_buffer.size() : m_external_size;
}

size_t MemoryIOHandler::read(void* buffer, size_t size, size_t count) {
    // We override read() completely to ensure exclusive access because we update m_pos
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);

    if (m_closed.load()) {
        updateErrorState(EBADF);
        return 0;
    }

    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }

    updateErrorState(0);

    if (size == 0 || count == 0) return 0;
    if (count > std::numeric_limits<size_t>::max() / size) {
        updateErrorState(EOVERFLOW);
        return 0;
    }

    size_t total = size_unlocked();
    size_t available = (m_pos < total) ? total - m_pos : 0;

    // Only whole elements are transferred, like fread
    size_t elements = std::min(count, available / size);
    size_t to_read = elements * size;

    if (to_read > 0) {
        const uint8_t* source = (m_own_buffer ? m_buffer.data() : m_external_data) + m_pos;
        std::memcpy(buffer, source, to_read);
        m_pos += to_read;
        updatePosition(static_cast<off_t>(m_pos));
    }

    updateEofState(elements < count || m_pos >= total);
    return elements;
}

size_t MemoryIOHandler::write(const void* buffer, size_t size, size_t count) {
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);

    if (m_closed.load()) {
        updateErrorState(EBADF);
        return 0;
    }

    if (!m_own_buffer) {
        updateErrorState(EBADF, "MemoryIOHandler::write() - Cannot write to a referenced buffer");
        return 0;
    }

    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }

    updateErrorState(0);

    if (size == 0 || count == 0) return 0;
    if (count > std::numeric_limits<size_t>::max() / size) {
        updateErrorState(EOVERFLOW);
        return 0;
    }

    size_t bytes = size * count;
    if (m_pos > std::numeric_limits<size_t>::max() - bytes) {
        updateErrorState(EOVERFLOW);
        return 0;
    }

    try {
        // Writing past the end zero-fills the gap, like a sparse file
        if (m_pos + bytes > m_buffer.size()) {
            m_buffer.resize(m_pos + bytes, 0);
        }
    } catch (const std::bad_alloc&) {
        updateErrorState(ENOMEM, "MemoryIOHandler::write() - Allocation of " + std::to_string(m_pos + bytes) + " bytes failed");
        return 0;
    }

    std::memcpy(m_buffer.data() + m_pos, buffer, bytes);
    m_pos += bytes;
    updatePosition(static_cast<off_t>(m_pos));
    updateEofState(m_pos >= m_buffer.size());

    return count;
}

int MemoryIOHandler::seek(off_t offset, int whence) {
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);

    if (m_closed.load()) {
        updateErrorState(EBADF);
        return -1;
    }

    off_t total = static_cast<off_t>(size_unlocked());
    off_t base = 0;

    switch (whence) {
        case SEEK_SET:
            base = 0;
            break;
        case SEEK_CUR:
            base = static_cast<off_t>(m_pos);
            break;
        case SEEK_END:
            base = total;
            break;
        default:
            updateErrorState(EINVAL);
            return -1;
    }

    if (offset > 0 && base > std::numeric_limits<off_t>::max() - offset) {
        updateErrorState(EOVERFLOW);
        return -1;
    }

    off_t new_pos = base + offset;
    if (new_pos < 0) {
        updateErrorState(EINVAL);
        return -1;
    }

    // It is valid to seek past end of buffer (read returns 0, write extends)
    m_pos = static_cast<size_t>(new_pos);
    updatePosition(new_pos);
    updateEofState(new_pos >= total);
    updateErrorState(0);

    return 0;
}

off_t MemoryIOHandler::tell() {
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);
    if (m_closed.load()) {
        updateErrorState(EBADF);
        return -1;
    }
    return static_cast<off_t>(m_pos);
}

int MemoryIOHandler::close() {
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);
    m_closed.store(true);
    m_buffer.clear();
    m_buffer.shrink_to_fit();
    m_external_data = nullptr;
    m_external_size = 0;
    m_pos = 0;
    return 0;
}

bool MemoryIOHandler::eof() {
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);
    return m_closed.load() || m_pos >= size_unlocked();
}

off_t MemoryIOHandler::getFileSize() {
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);
    if (m_closed.load()) {
        return -1;
    }
    return static_cast<off_t>(size_unlocked());
}

int MemoryIOHandler::setFileSize(off_t length) {
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);

    if (m_closed.load() || !m_own_buffer) {
        updateErrorState(EBADF);
        return -1;
    }

    if (length < 0) {
        updateErrorState(EINVAL);
        return -1;
    }

    try {
        m_buffer.resize(static_cast<size_t>(length), 0);
    } catch (const std::bad_alloc&) {
        updateErrorState(ENOMEM, "MemoryIOHandler::setFileSize() - Allocation of " + std::to_string(length) + " bytes failed");
        return -1;
    }

    updateErrorState(0);
    updateEofState(m_pos >= m_buffer.size());
    return 0;
}

int MemoryIOHandler::flush() {
    if (m_closed.load()) {
        updateErrorState(EBADF);
        return -1;
    }
    // Nothing is buffered between us and the bytes
    return 0;
}

bool MemoryIOHandler::canRead() const {
    return !m_closed.load();
}

bool MemoryIOHandler::canWrite() const {
    return !m_closed.load() && m_own_buffer;
}

bool MemoryIOHandler::canSeek() const {
    return !m_closed.load();
}

std::vector<uint8_t> MemoryIOHandler::getData() const {
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);
    if (m_own_buffer) {
        return m_buffer;
    }
    return std::vector<uint8_t>(m_external_data, m_external_data + m_external_size);
}

} // namespace IO
} // namespace StreamMux
