/*
 * FileIOHandler.cpp - File I/O handler implementation
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
namespace File {

namespace {

const char* fopenMode(FileIOHandler::OpenMode mode) {
    switch (mode) {
        case FileIOHandler::OpenMode::ReadWrite:
            return "r+b";
        case FileIOHandler::OpenMode::Create:
            return "w+b";
        case FileIOHandler::OpenMode::Read:
        default:
            return "rb";
    }
}

} // namespace

/**
 * @brief Constructs a FileIOHandler and opens the specified file.
 *
 * @param path The path to the file to be opened.
 * @param mode Read-only, read-write on an existing file, or create/truncate.
 * @throws StreamMux::Core::IOException if the file cannot be opened
 */
FileIOHandler::FileIOHandler(const std::string& path, OpenMode mode)
    : m_file_path(path), m_mode(mode) {
    if (path.empty()) {
        Debug::log("io", "FileIOHandler::FileIOHandler() - Empty path");
        throw Core::IOException(getErrorMessage(ENOENT, "Empty file path"));
    }

    if (!m_file_handle.open(path.c_str(), fopenMode(mode))) {
        int open_error = errno;
        std::string errorMsg = getErrorMessage(open_error, "Could not open file '" + path + "'");
        Debug::log("io", "FileIOHandler::FileIOHandler() - ", errorMsg);
        if (isRecoverableError(open_error)) {
            Debug::log("io", "FileIOHandler::FileIOHandler() - Error may be recoverable: ", strerror(open_error));
        }
        throw Core::IOException(errorMsg);
    }

    Debug::log("io", "FileIOHandler::FileIOHandler() - Opened ", path, ", size ",
               static_cast<long long>(getFileSize_unlocked()), " bytes");
}

FileIOHandler::~FileIOHandler() {
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);
    close_unlocked();
}

size_t FileIOHandler::read(void* buffer, size_t size, size_t count) {
    // fread moves the file position, so reads are exclusive too
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);
    return read_unlocked(buffer, size, count);
}

size_t FileIOHandler::read_unlocked(void* buffer, size_t size, size_t count) {
    updateErrorState(0);

    if (!m_file_handle) {
        updateErrorState(EBADF, "Bad file descriptor in read");
        return 0;
    }

    if (!buffer) {
        updateErrorState(EINVAL, "Null buffer in read");
        return 0;
    }

    if (size == 0 || count == 0) {
        return 0;
    }

    if (!switchDirection_unlocked(LastOp::Read)) {
        return 0;
    }

    errno = 0;
    size_t elements = fread(buffer, size, count, m_file_handle.get());
    if (elements < count) {
        if (ferror(m_file_handle.get())) {
            int read_error = errno ? errno : EIO;
            clearerr(m_file_handle.get());
            updateErrorState(read_error, getErrorMessage(read_error, "FileIOHandler::read() - " + m_file_path));
        } else {
            updateEofState(true);
        }
    }

    off_t position = ftello(m_file_handle.get());
    if (position >= 0) {
        updatePosition(position);
    }

    return elements;
}

size_t FileIOHandler::write(const void* buffer, size_t size, size_t count) {
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);

    updateErrorState(0);

    if (!m_file_handle) {
        updateErrorState(EBADF, "Bad file descriptor in write");
        return 0;
    }

    if (m_mode == OpenMode::Read) {
        updateErrorState(EBADF, "FileIOHandler::write() - " + m_file_path + " is open read-only");
        return 0;
    }

    if (!buffer) {
        updateErrorState(EINVAL, "Null buffer in write");
        return 0;
    }

    if (size == 0 || count == 0) {
        return 0;
    }

    if (!switchDirection_unlocked(LastOp::Write)) {
        return 0;
    }

    errno = 0;
    size_t elements = fwrite(buffer, size, count, m_file_handle.get());
    if (elements < count) {
        int write_error = errno ? errno : EIO;
        clearerr(m_file_handle.get());
        updateErrorState(write_error, getErrorMessage(write_error, "FileIOHandler::write() - " + m_file_path));
    }

    off_t position = ftello(m_file_handle.get());
    if (position >= 0) {
        updatePosition(position);
    }
    updateEofState(false);

    return elements;
}

int FileIOHandler::seek(off_t offset, int whence) {
    // Use base class locking - call base class seek which will call our seek_unlocked
    return IOHandler::seek(offset, whence);
}

int FileIOHandler::seek_unlocked(off_t offset, int whence) {
    updateErrorState(0);

    if (!m_file_handle) {
        updateErrorState(EBADF, "Bad file descriptor in seek");
        return -1;
    }

    if (whence != SEEK_SET && whence != SEEK_CUR && whence != SEEK_END) {
        updateErrorState(EINVAL, "Invalid whence parameter in seek");
        return -1;
    }

    if (whence == SEEK_SET && offset < 0) {
        updateErrorState(EINVAL, "Negative offset in SEEK_SET");
        return -1;
    }

    if (fseeko(m_file_handle.get(), offset, whence) != 0) {
        int seek_error = errno;
        updateErrorState(seek_error, getErrorMessage(seek_error, "FileIOHandler::seek() - " + m_file_path));
        return -1;
    }

    // A successful fseeko resets the stdio read/write direction
    m_last_op = LastOp::None;

    off_t position = ftello(m_file_handle.get());
    if (position < 0) {
        int tell_error = errno;
        updateErrorState(tell_error, getErrorMessage(tell_error, "FileIOHandler::seek() - ftello"));
        return -1;
    }

    updatePosition(position);
    updateEofState(false);
    return 0;
}

off_t FileIOHandler::tell() {
    return IOHandler::tell();
}

off_t FileIOHandler::tell_unlocked() {
    if (!m_file_handle) {
        updateErrorState(EBADF);
        return -1;
    }
    return m_position.load();
}

int FileIOHandler::close() {
    return IOHandler::close();
}

int FileIOHandler::close_unlocked() {
    updateErrorState(0);

    if (!m_file_handle) {
        // Already closed, not an error
        return 0;
    }

    int result = m_file_handle.close();
    updateClosedState(true);
    updateEofState(true);

    if (result != 0) {
        int close_error = errno;
        updateErrorState(close_error, getErrorMessage(close_error, "FileIOHandler::close() - " + m_file_path));
        return -1;
    }

    Debug::log("io", "FileIOHandler::close() - Closed ", m_file_path);
    return 0;
}

bool FileIOHandler::eof() {
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);
    return !m_file_handle || m_eof.load();
}

off_t FileIOHandler::getFileSize() {
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);
    return getFileSize_unlocked();
}

off_t FileIOHandler::getFileSize_unlocked() {
    if (!m_file_handle) {
        updateErrorState(EBADF);
        return -1;
    }

    // Pending stdio output is not visible to fstat
    if (m_last_op == LastOp::Write && fflush(m_file_handle.get()) != 0) {
        int flush_error = errno;
        updateErrorState(flush_error, getErrorMessage(flush_error, "FileIOHandler::getFileSize() - fflush"));
        return -1;
    }

    struct stat file_stat;
    if (fstat(fileno(m_file_handle.get()), &file_stat) != 0) {
        int stat_error = errno;
        updateErrorState(stat_error, getErrorMessage(stat_error, "FileIOHandler::getFileSize() - " + m_file_path));
        return -1;
    }

    return file_stat.st_size;
}

int FileIOHandler::setFileSize(off_t length) {
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);

    updateErrorState(0);

    if (!m_file_handle) {
        updateErrorState(EBADF, "Bad file descriptor in setFileSize");
        return -1;
    }

    if (m_mode == OpenMode::Read) {
        updateErrorState(EBADF, "FileIOHandler::setFileSize() - " + m_file_path + " is open read-only");
        return -1;
    }

    if (length < 0) {
        updateErrorState(EINVAL, "Negative length in setFileSize");
        return -1;
    }

    if (fflush(m_file_handle.get()) != 0 || ftruncate(fileno(m_file_handle.get()), length) != 0) {
        int truncate_error = errno;
        updateErrorState(truncate_error, getErrorMessage(truncate_error, "FileIOHandler::setFileSize() - " + m_file_path));
        return -1;
    }

    Debug::log("io", "FileIOHandler::setFileSize() - ", m_file_path, " is now ", static_cast<long long>(length), " bytes");
    return 0;
}

int FileIOHandler::flush() {
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);

    if (!m_file_handle) {
        updateErrorState(EBADF, "Bad file descriptor in flush");
        return -1;
    }

    if (fflush(m_file_handle.get()) != 0) {
        int flush_error = errno;
        updateErrorState(flush_error, getErrorMessage(flush_error, "FileIOHandler::flush() - " + m_file_path));
        return -1;
    }

    return 0;
}

bool FileIOHandler::canRead() const {
    return !m_closed.load();
}

bool FileIOHandler::canWrite() const {
    return !m_closed.load() && m_mode != OpenMode::Read;
}

bool FileIOHandler::canSeek() const {
    return !m_closed.load();
}

bool FileIOHandler::switchDirection_unlocked(LastOp next) {
    if (m_last_op != LastOp::None && m_last_op != next) {
        if (fseeko(m_file_handle.get(), 0, SEEK_CUR) != 0) {
            int seek_error = errno;
            updateErrorState(seek_error, getErrorMessage(seek_error, "FileIOHandler - direction switch"));
            return false;
        }
    }
    m_last_op = next;
    return true;
}

} // namespace File
} // namespace IO
} // namespace StreamMux
