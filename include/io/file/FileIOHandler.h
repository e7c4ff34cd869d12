/*
 * FileIOHandler.h - File I/O handler implementation
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

#ifndef FILEIOHANDLER_H
#define FILEIOHANDLER_H

// No direct includes - all includes should be in streammux.h

namespace StreamMux {
namespace IO {
namespace File {

/**
 * @brief File-based IOHandler implementation on top of stdio
 *
 * Large files are supported through off_t offsets and fseeko/ftello.
 */
class FileIOHandler : public IOHandler {
public:
    enum class OpenMode {
        Read,       ///< Existing file, read only ("rb")
        ReadWrite,  ///< Existing file, read and write ("r+b")
        Create      ///< Create or truncate, read and write ("w+b")
    };

    /**
     * @brief Open a file
     * @param path Path to the file
     * @param mode How to open it
     * @throws StreamMux::Core::IOException if the file cannot be opened
     */
    explicit FileIOHandler(const std::string& path, OpenMode mode = OpenMode::Read);

    ~FileIOHandler() override;

    size_t read(void* buffer, size_t size, size_t count) override;
    size_t write(const void* buffer, size_t size, size_t count) override;
    int seek(off_t offset, int whence) override;
    off_t tell() override;
    int close() override;
    bool eof() override;
    off_t getFileSize() override;
    int setFileSize(off_t length) override;
    int flush() override;
    bool canRead() const override;
    bool canWrite() const override;
    bool canSeek() const override;

    const std::string& getPath() const { return m_file_path; }

private:
    size_t read_unlocked(void* buffer, size_t size, size_t count) override;
    int seek_unlocked(off_t offset, int whence) override;
    off_t tell_unlocked() override;
    int close_unlocked() override;

    // stdio requires a positioning call between a write and a read
    enum class LastOp { None, Read, Write };

    bool switchDirection_unlocked(LastOp next);
    off_t getFileSize_unlocked();

    RAIIFileHandle m_file_handle;
    std::string m_file_path;
    OpenMode m_mode;
    LastOp m_last_op = LastOp::None;
};

} // namespace File
} // namespace IO
} // namespace StreamMux

#endif // FILEIOHANDLER_H
