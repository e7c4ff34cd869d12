/*
 * IOHandler.h - Abstract I/O handler interface
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

#ifndef IOHANDLER_H
#define IOHANDLER_H

// No direct includes - all includes should be in streammux.h

namespace StreamMux {
namespace IO {

/**
 * @brief Base IOHandler interface for random-access byte streams
 *
 * Provides fread/fwrite/fseek-like semantics over memory buffers, files and
 * wrappers around other handlers. Per-call failures are reported through
 * return values and getLastError(); exceptions are reserved for
 * constructors that cannot produce a usable handler.
 *
 * Every public call on a concrete handler is atomic with respect to other
 * calls on the same handler, but there is only one position: a seek from
 * one thread followed by a read from another still races. Wrap the handler
 * in a MultiplexedIOHandler when several threads need their own cursor.
 */
class IOHandler {
public:
    /**
     * @brief Constructor for IOHandler base class
     */
    IOHandler();

    /**
     * @brief Virtual destructor for proper polymorphic cleanup
     */
    virtual ~IOHandler();

    IOHandler(const IOHandler&) = delete;
    IOHandler& operator=(const IOHandler&) = delete;

    /**
     * @brief Read data from the source with fread-like semantics
     * @param buffer Buffer to read data into
     * @param size Size of each element to read
     * @param count Number of elements to read
     * @return Number of elements successfully read
     */
    virtual size_t read(void* buffer, size_t size, size_t count);

    /**
     * @brief Write data at the current position with fwrite-like semantics
     * @param buffer Data to write
     * @param size Size of each element
     * @param count Number of elements
     * @return Number of elements successfully written
     */
    virtual size_t write(const void* buffer, size_t size, size_t count);

    /**
     * @brief Read a single byte
     * @return The byte value (0-255), or -1 at end of stream or on error
     */
    virtual int readByte();

    /**
     * @brief Seek to a position in the source
     * @param offset Offset to seek to (off_t for large file support)
     * @param whence SEEK_SET, SEEK_CUR, or SEEK_END positioning mode
     * @return 0 on success, -1 on failure
     */
    virtual int seek(off_t offset, int whence);

    /**
     * @brief Get current byte offset position
     * @return Current position as off_t for large file support, -1 on failure
     */
    virtual off_t tell();

    /**
     * @brief Close the I/O source and cleanup resources
     * @return 0 on success, standard error codes on failure
     */
    virtual int close();

    /**
     * @brief Check if at end-of-stream condition
     * @return true if at end of stream, false otherwise
     */
    virtual bool eof();

    /**
     * @brief Get total size of the source in bytes
     * @return Size in bytes, or -1 if unknown
     */
    virtual off_t getFileSize();

    /**
     * @brief Change the size of the source, truncating or zero-extending it
     * @param length New size in bytes
     * @return 0 on success, -1 on failure
     */
    virtual int setFileSize(off_t length);

    /**
     * @brief Push buffered writes down to the backing resource
     * @return 0 on success, -1 on failure
     */
    virtual int flush();

    virtual bool canRead() const;
    virtual bool canWrite() const;
    virtual bool canSeek() const;

    /**
     * @brief Get the last error code
     * @return Error code (0 = no error)
     */
    virtual int getLastError() const;

    /**
     * @brief Convert error code to consistent error message across platforms
     * @param error_code The error code to convert
     * @param context Additional context for the error
     * @return Descriptive error message
     */
    static std::string getErrorMessage(int error_code, const std::string& context = "");

    /**
     * @brief Check if the given error code represents a temporary/recoverable error
     * @param error_code The error code to check
     * @return true if error is potentially recoverable, false otherwise
     */
    static bool isRecoverableError(int error_code);

private:
    // Private unlocked methods for thread-safe implementation
    virtual size_t read_unlocked(void* buffer, size_t size, size_t count);
    virtual int seek_unlocked(off_t offset, int whence);
    virtual off_t tell_unlocked();
    virtual int close_unlocked();

protected:
    /**
     * @brief Common state tracking for derived classes
     */
    std::atomic<bool> m_closed{false};   // Indicates if the handler is closed (thread-safe)
    std::atomic<bool> m_eof{false};      // Indicates end-of-stream condition (thread-safe)
    std::atomic<off_t> m_position{0};    // Current byte offset position (thread-safe)
    std::atomic<int> m_error{0};         // Last error code (0 = no error) (thread-safe)

    // Thread safety synchronization
    mutable std::shared_mutex m_operation_mutex;  // Allows concurrent reads, exclusive writes

    /**
     * @brief Thread-safe position update with overflow protection
     * @param new_position New position value
     * @return true if position was updated successfully, false if it was negative
     */
    bool updatePosition(off_t new_position);

    /**
     * @brief Thread-safe error state update
     * @param error_code New error code
     * @param error_message Optional error message for logging
     */
    void updateErrorState(int error_code, const std::string& error_message = "");

    void updateEofState(bool eof_state);
    void updateClosedState(bool closed_state);
};

} // namespace IO
} // namespace StreamMux

#endif // IOHANDLER_H
