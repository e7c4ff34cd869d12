/*
 * MultiplexedIOHandler.h - Per-thread cursors over one shared IOHandler
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

#ifndef MULTIPLEXEDIOHANDLER_H
#define MULTIPLEXEDIOHANDLER_H

// No direct includes - all includes should be in streammux.h

namespace StreamMux {
namespace IO {

/**
 * @brief Gives every calling thread its own cursor on one shared IOHandler
 *
 * The wrapped handler has a single physical position. Each thread that
 * calls into this handler gets a logical position of its own; before every
 * read or write the physical position is moved to the caller's logical one
 * while the I/O lock is held.
 *
 * Locking:
 *  - m_cursor_mutex (shared_mutex) guards the cursor registry. Lookups take
 *    it shared; inserting a cursor and reordering take it exclusive.
 *  - m_io_mutex guards the wrapped handler, the cached length and the
 *    single byte scratch buffer.
 * A call always finishes with the registry before taking the I/O lock, so
 * the two are never held together.
 *
 * Per-call failures follow the IOHandler convention (return value plus
 * getLastError()). getLastError() reports the calling thread's own last
 * error, so one thread's failure is never seen by another.
 *
 * The wrapped handler is shared, not owned: destroying or closing this
 * handler leaves it open.
 */
class MultiplexedIOHandler : public IOHandler {
public:
    /**
     * @brief Tuning knobs
     */
    struct Options {
        size_t reorder_interval;   ///< Full lookups between registry reorder passes, 0 disables
        std::string name;          ///< Label used in log output

        Options() : reorder_interval(50), name("mux") {}
    };

    /**
     * @brief One registry entry as seen at snapshot time
     */
    struct CursorSnapshot {
        CursorOwner::id_type owner;
        off_t position;
        uint64_t hit_count;
    };

    /**
     * @brief Wrap an open, seekable handler
     * @param underlying The shared handler
     * @param options Tuning knobs
     * @throws StreamMux::Core::InvalidStreamException if the handler is null,
     *         cannot seek, or cannot report its size
     */
    explicit MultiplexedIOHandler(std::shared_ptr<IOHandler> underlying, const Options& options = Options());

    /**
     * @brief Clears the registry; the wrapped handler stays open
     */
    ~MultiplexedIOHandler() override;

    // IOHandler interface, all relative to the calling thread's cursor
    size_t read(void* buffer, size_t size, size_t count) override;
    size_t write(const void* buffer, size_t size, size_t count) override;
    int readByte() override;

    /**
     * @brief Move the calling thread's cursor
     *
     * SEEK_END is relative to the cached length. Targets below zero or past
     * the cached length fail with ERANGE and leave the cursor where it was.
     * @return 0 on success, -1 on failure
     */
    int seek(off_t offset, int whence) override;

    off_t tell() override;

    /**
     * @brief Mark closed and drop every cursor; the wrapped handler stays open
     *
     * Calls already past their open check when close() runs still finish,
     * and may register a cursor or touch the wrapped handler afterwards.
     */
    int close() override;

    bool eof() override;

    /**
     * @brief Cached length, no call into the wrapped handler
     */
    off_t getFileSize() override;

    /**
     * @brief Resize the wrapped handler
     *
     * Cursors beyond the new end are left alone; their next read, write or
     * relative seek fails with ERANGE.
     */
    int setFileSize(off_t length) override;

    int flush() override;
    bool canRead() const override;
    bool canWrite() const override;
    bool canSeek() const override;
    int getLastError() const override;

    /**
     * @brief Counters: cursors, full_resolutions, fast_path_hits,
     *        reorder_passes, reorder_moves
     */
    std::map<std::string, size_t> getCursorStats() const;

    /**
     * @brief Registry contents in scan order
     */
    std::vector<CursorSnapshot> getCursorSnapshot() const;

    std::shared_ptr<IOHandler> getUnderlying() const { return m_underlying; }

private:
    struct CursorEntry {
        explicit CursorEntry(CursorOwner::id_type owner_id) : owner(owner_id) {}

        const CursorOwner::id_type owner;
        std::atomic<off_t> position{0};
        std::atomic<uint64_t> hit_count{1};
        std::atomic<int> last_error{0};
    };

    using CursorPtr = std::shared_ptr<CursorEntry>;

    // Registry
    CursorPtr resolveCursor() const;
    void maybeReorderCursors() const;
    bool needsReorder_unlocked() const;
    size_t reorderCursors_unlocked() const;

    // Caller must hold m_io_mutex
    bool reposition_unlocked(CursorEntry& cursor);

    void setCursorError(CursorEntry& cursor, int error_code, const std::string& error_message = "") const;
    bool checkOpen();

    std::shared_ptr<IOHandler> m_underlying;
    Options m_options;

    // Registry state. Lookups are logically const, so these are mutable.
    mutable std::list<CursorPtr> m_cursors;
    mutable std::shared_mutex m_cursor_mutex;
    mutable CursorPtr m_last_cursor;   // fast path slot, std::atomic_load/atomic_store only

    mutable std::atomic<size_t> m_full_resolutions{0};
    mutable std::atomic<size_t> m_fast_path_hits{0};
    mutable std::atomic<size_t> m_reorder_passes{0};
    mutable std::atomic<size_t> m_reorder_moves{0};

    // I/O state
    std::mutex m_io_mutex;
    std::atomic<off_t> m_length{0};   // written under m_io_mutex, read without it
    unsigned char m_scratch_byte = 0; // readByte() buffer, m_io_mutex only
};

} // namespace IO
} // namespace StreamMux

#endif // MULTIPLEXEDIOHANDLER_H
