/*
 * IOHandler.cpp - Base I/O handler implementation
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

IOHandler::IOHandler() = default;

IOHandler::~IOHandler() = default;

size_t IOHandler::read(void* buffer, size_t size, size_t count) {
    // Thread-safe read operation using shared lock (allows concurrent reads)
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);

    return read_unlocked(buffer, size, count);
}

size_t IOHandler::read_unlocked(void* buffer, size_t size, size_t count) {
    // Default implementation has no data; fread-like 0 means EOF or error
    updateErrorState(0);

    if (m_closed.load()) {
        updateErrorState(EBADF);
        return 0;
    }

    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }

    if (size == 0 || count == 0) {
        return 0;
    }

    updateEofState(true);
    return 0;
}

size_t IOHandler::write(const void* buffer, size_t size, size_t count) {
    (void)buffer;
    (void)size;
    (void)count;
    updateErrorState(EBADF, "IOHandler::write() - handler is not writable");
    return 0;
}

int IOHandler::readByte() {
    unsigned char byte = 0;
    if (read(&byte, 1, 1) != 1) {
        return -1;
    }
    return byte;
}

int IOHandler::seek(off_t offset, int whence) {
    // Thread-safe seek operation using exclusive lock
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);

    return seek_unlocked(offset, whence);
}

int IOHandler::seek_unlocked(off_t offset, int whence) {
    updateErrorState(0);

    if (m_closed.load()) {
        updateErrorState(EBADF);
        return -1;
    }

    off_t new_position = m_position.load();
    switch (whence) {
        case SEEK_SET:
            new_position = offset;
            break;
        case SEEK_CUR:
            if (offset > 0 && new_position > std::numeric_limits<off_t>::max() - offset) {
                updateErrorState(EOVERFLOW);
                return -1;
            }
            new_position += offset;
            break;
        case SEEK_END:
            // Can't determine end position in base class
            updateErrorState(EINVAL);
            return -1;
        default:
            updateErrorState(EINVAL);
            return -1;
    }

    if (!updatePosition(new_position)) {
        updateErrorState(EINVAL);
        return -1;
    }

    updateEofState(false);
    return 0;
}

off_t IOHandler::tell() {
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);

    return tell_unlocked();
}

off_t IOHandler::tell_unlocked() {
    if (m_closed.load()) {
        updateErrorState(EBADF);
        return -1;
    }

    return m_position.load();
}

int IOHandler::close() {
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);

    return close_unlocked();
}

int IOHandler::close_unlocked() {
    updateErrorState(0);

    if (m_closed.load()) {
        // Already closed, not an error
        return 0;
    }

    updateClosedState(true);
    updateEofState(true);
    return 0;
}

bool IOHandler::eof() {
    return m_closed.load() || m_eof.load();
}

off_t IOHandler::getFileSize() {
    // Base implementation doesn't know the size
    return -1;
}

int IOHandler::setFileSize(off_t length) {
    (void)length;
    updateErrorState(EBADF, "IOHandler::setFileSize() - handler is not writable");
    return -1;
}

int IOHandler::flush() {
    return 0;
}

bool IOHandler::canRead() const {
    return !m_closed.load();
}

bool IOHandler::canWrite() const {
    return false;
}

bool IOHandler::canSeek() const {
    return false;
}

int IOHandler::getLastError() const {
    return m_error.load();
}

std::string IOHandler::getErrorMessage(int error_code, const std::string& context) {
    std::string message;

    if (!context.empty()) {
        message = context + ": ";
    }

    const char* error_str = strerror(error_code);
    if (error_str) {
        message += error_str;
    } else {
        message += "Unknown error " + std::to_string(error_code);
    }

    return message;
}

bool IOHandler::isRecoverableError(int error_code) {
    switch (error_code) {
        // Temporary I/O errors that might be recoverable
        case EIO:
        case EAGAIN:
        case EINTR:
        case ENOMEM:
        case ENOSPC:
            return true;

        // Caller or state errors; retrying the same call cannot succeed
        case EBADF:
        case EINVAL:
        case ERANGE:
        case ESPIPE:
        case EOVERFLOW:
        case EACCES:
        case ENOENT:
            return false;

        default:
            return false;
    }
}

bool IOHandler::updatePosition(off_t new_position) {
    if (new_position < 0) {
        Debug::log("io", "IOHandler::updatePosition() - Negative position rejected: ", static_cast<long long>(new_position));
        return false;
    }

    m_position.store(new_position);
    return true;
}

void IOHandler::updateErrorState(int error_code, const std::string& error_message) {
    m_error.store(error_code);

    if (error_code != 0 && !error_message.empty()) {
        Debug::log("error", "IOHandler::updateErrorState() - Error ", std::to_string(error_code), ": ", error_message);
    }
}

void IOHandler::updateEofState(bool eof_state) {
    m_eof.store(eof_state);
}

void IOHandler::updateClosedState(bool closed_state) {
    m_closed.store(closed_state);
}

} // namespace IO
} // namespace StreamMux
