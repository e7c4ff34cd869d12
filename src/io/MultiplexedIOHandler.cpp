/*
 * MultiplexedIOHandler.cpp - Per-thread cursors over one shared IOHandler
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

MultiplexedIOHandler::MultiplexedIOHandler(std::shared_ptr<IOHandler> underlying, const Options& options)
    : m_underlying(std::move(underlying)), m_options(options) {
    if (!m_underlying) {
        Debug::log("mux", "MultiplexedIOHandler::MultiplexedIOHandler() - [", m_options.name, "] null stream");
        throw Core::InvalidStreamException("MultiplexedIOHandler requires a stream");
    }

    if (!m_underlying->canSeek()) {
        Debug::log("mux", "MultiplexedIOHandler::MultiplexedIOHandler() - [", m_options.name, "] stream cannot seek");
        throw Core::InvalidStreamException("MultiplexedIOHandler requires a seekable stream");
    }

    off_t length = m_underlying->getFileSize();
    if (length < 0) {
        std::string why = getErrorMessage(m_underlying->getLastError(), "Cannot determine stream length");
        Debug::log("mux", "MultiplexedIOHandler::MultiplexedIOHandler() - [", m_options.name, "] ", why);
        throw Core::InvalidStreamException(why);
    }
    m_length.store(length);

    Debug::log("mux", "MultiplexedIOHandler::MultiplexedIOHandler() - [", m_options.name, "] length ",
               static_cast<long long>(length), ", reorder every ", std::to_string(m_options.reorder_interval),
               " lookups");
}

MultiplexedIOHandler::~MultiplexedIOHandler() {
    std::unique_lock<std::shared_mutex> lock(m_cursor_mutex);
    m_cursors.clear();
    std::atomic_store(&m_last_cursor, CursorPtr());
}

/**
 * @brief Find or create the calling thread's cursor
 *
 * Checks the last-used slot first. On a miss, every reorder_interval-th
 * lookup may reorder the registry, then the registry is scanned under the
 * shared lock. An owner not found gets a new cursor at position 0 appended
 * under the exclusive lock.
 */
MultiplexedIOHandler::CursorPtr MultiplexedIOHandler::resolveCursor() const {
    const CursorOwner::id_type owner = CursorOwner::current();

    CursorPtr cursor = std::atomic_load(&m_last_cursor);
    if (cursor && cursor->owner == owner) {
        m_fast_path_hits.fetch_add(1, std::memory_order_relaxed);
        return cursor;
    }

    size_t lookups = m_full_resolutions.fetch_add(1, std::memory_order_relaxed) + 1;
    if (m_options.reorder_interval > 0 && lookups % m_options.reorder_interval == 0) {
        maybeReorderCursors();
    }

    {
        std::shared_lock<std::shared_mutex> lock(m_cursor_mutex);
        for (const CursorPtr& entry : m_cursors) {
            if (entry->owner == owner) {
                // Other scanners may be counting too, hence the atomic
                entry->hit_count.fetch_add(1, std::memory_order_relaxed);
                std::atomic_store(&m_last_cursor, entry);
                return entry;
            }
        }
    }

    cursor = std::make_shared<CursorEntry>(owner);
    {
        std::unique_lock<std::shared_mutex> lock(m_cursor_mutex);
        m_cursors.push_back(cursor);
    }
    std::atomic_store(&m_last_cursor, cursor);
    return cursor;
}

void MultiplexedIOHandler::maybeReorderCursors() const {
    {
        std::shared_lock<std::shared_mutex> lock(m_cursor_mutex);
        if (!needsReorder_unlocked()) {
            return;
        }
    }

    size_t moves;
    {
        std::unique_lock<std::shared_mutex> lock(m_cursor_mutex);
        moves = reorderCursors_unlocked();
    }

    m_reorder_passes.fetch_add(1, std::memory_order_relaxed);
    m_reorder_moves.fetch_add(moves, std::memory_order_relaxed);
    Debug::log("mux", "MultiplexedIOHandler::maybeReorderCursors() - [", m_options.name, "] moved ",
               std::to_string(moves), " cursors");
}

bool MultiplexedIOHandler::needsReorder_unlocked() const {
    // The insertion pass moves an entry only when its predecessor has fewer hits
    auto it = m_cursors.begin();
    if (it == m_cursors.end()) {
        return false;
    }
    uint64_t previous = (*it)->hit_count.load(std::memory_order_relaxed);
    for (++it; it != m_cursors.end(); ++it) {
        uint64_t current = (*it)->hit_count.load(std::memory_order_relaxed);
        if (previous < current) {
            return true;
        }
        previous = current;
    }
    return false;
}

/**
 * @brief One insertion sort pass, descending hit count, stable for ties
 * @return Number of entries moved
 */
size_t MultiplexedIOHandler::reorderCursors_unlocked() const {
    size_t moves = 0;
    auto current = m_cursors.begin();
    while (current != m_cursors.end()) {
        auto next = std::next(current);
        uint64_t hits = (*current)->hit_count.load(std::memory_order_relaxed);

        auto destination = current;
        while (destination != m_cursors.begin()) {
            auto previous = std::prev(destination);
            if ((*previous)->hit_count.load(std::memory_order_relaxed) >= hits) {
                break;
            }
            destination = previous;
        }

        if (destination != current) {
            m_cursors.splice(destination, m_cursors, current);
            ++moves;
        }
        current = next;
    }
    return moves;
}

bool MultiplexedIOHandler::reposition_unlocked(CursorEntry& cursor) {
    off_t logical = cursor.position.load();
    if (logical > m_length.load()) {
        setCursorError(cursor, ERANGE, "MultiplexedIOHandler - [" + m_options.name + "] cursor at " +
                       std::to_string(static_cast<long long>(logical)) + " is past the end");
        return false;
    }

    if (m_underlying->tell() == logical) {
        return true;
    }

    if (m_underlying->seek(logical, SEEK_SET) != 0) {
        setCursorError(cursor, m_underlying->getLastError());
        return false;
    }
    return true;
}

void MultiplexedIOHandler::setCursorError(CursorEntry& cursor, int error_code, const std::string& error_message) const {
    cursor.last_error.store(error_code);
    if (error_code != 0 && !error_message.empty()) {
        Debug::log("mux", error_message, " (", strerror(error_code), ")");
    }
}

bool MultiplexedIOHandler::checkOpen() {
    if (m_closed.load()) {
        updateErrorState(EBADF, "MultiplexedIOHandler - [" + m_options.name + "] used after close");
        return false;
    }
    return true;
}

size_t MultiplexedIOHandler::read(void* buffer, size_t size, size_t count) {
    if (!checkOpen()) {
        return 0;
    }

    CursorPtr cursor = resolveCursor();

    if (!buffer) {
        setCursorError(*cursor, EINVAL);
        return 0;
    }

    if (size == 0 || count == 0) {
        setCursorError(*cursor, 0);
        return 0;
    }

    if (count > std::numeric_limits<size_t>::max() / size) {
        setCursorError(*cursor, EOVERFLOW);
        return 0;
    }

    std::lock_guard<std::mutex> lock(m_io_mutex);
    if (!reposition_unlocked(*cursor)) {
        return 0;
    }

    size_t elements = m_underlying->read(buffer, size, count);
    cursor->position.fetch_add(static_cast<off_t>(elements * size));
    setCursorError(*cursor, elements < count ? m_underlying->getLastError() : 0);
    return elements;
}

size_t MultiplexedIOHandler::write(const void* buffer, size_t size, size_t count) {
    if (!checkOpen()) {
        return 0;
    }

    CursorPtr cursor = resolveCursor();

    if (!buffer) {
        setCursorError(*cursor, EINVAL);
        return 0;
    }

    if (size == 0 || count == 0) {
        setCursorError(*cursor, 0);
        return 0;
    }

    if (count > std::numeric_limits<size_t>::max() / size) {
        setCursorError(*cursor, EOVERFLOW);
        return 0;
    }

    std::lock_guard<std::mutex> lock(m_io_mutex);
    if (!reposition_unlocked(*cursor)) {
        return 0;
    }

    size_t elements = m_underlying->write(buffer, size, count);
    int write_error = elements < count ? m_underlying->getLastError() : 0;
    off_t end = cursor->position.fetch_add(static_cast<off_t>(elements * size)) +
                static_cast<off_t>(elements * size);

    off_t length = m_underlying->getFileSize();
    if (length < 0) {
        // Keep what we know for certain
        length = std::max(m_length.load(), end);
    }
    m_length.store(length);

    setCursorError(*cursor, write_error);
    return elements;
}

int MultiplexedIOHandler::readByte() {
    if (!checkOpen()) {
        return -1;
    }

    CursorPtr cursor = resolveCursor();

    std::lock_guard<std::mutex> lock(m_io_mutex);
    if (!reposition_unlocked(*cursor)) {
        return -1;
    }

    if (m_underlying->read(&m_scratch_byte, 1, 1) != 1) {
        setCursorError(*cursor, m_underlying->getLastError());
        return -1;
    }

    cursor->position.fetch_add(1);
    setCursorError(*cursor, 0);
    return m_scratch_byte;
}

int MultiplexedIOHandler::seek(off_t offset, int whence) {
    if (!checkOpen()) {
        return -1;
    }

    CursorPtr cursor = resolveCursor();

    if (!m_underlying->canSeek()) {
        setCursorError(*cursor, ESPIPE, "MultiplexedIOHandler - [" + m_options.name + "] stream cannot seek");
        return -1;
    }

    off_t base;
    switch (whence) {
        case SEEK_SET:
            base = 0;
            break;
        case SEEK_CUR:
            base = cursor->position.load();
            break;
        case SEEK_END:
            base = m_length.load();
            break;
        default:
            setCursorError(*cursor, EINVAL);
            return -1;
    }

    off_t length = m_length.load();
    // base and length are never negative, so neither test can overflow
    bool out_of_range;
    if (offset > 0) {
        out_of_range = offset > length - base;
    } else {
        out_of_range = base + offset < 0 || base + offset > length;
    }
    if (out_of_range) {
        setCursorError(*cursor, ERANGE, "MultiplexedIOHandler::seek() - [" + m_options.name + "] target outside 0.." +
                       std::to_string(static_cast<long long>(length)));
        return -1;
    }

    cursor->position.store(base + offset);
    setCursorError(*cursor, 0);
    return 0;
}

off_t MultiplexedIOHandler::tell() {
    if (!checkOpen()) {
        return -1;
    }
    return resolveCursor()->position.load();
}

int MultiplexedIOHandler::close() {
    if (m_closed.exchange(true)) {
        return 0;
    }

    size_t dropped;
    {
        std::unique_lock<std::shared_mutex> lock(m_cursor_mutex);
        dropped = m_cursors.size();
        m_cursors.clear();
    }
    std::atomic_store(&m_last_cursor, CursorPtr());
    updateEofState(true);

    Debug::log("mux", "MultiplexedIOHandler::close() - [", m_options.name, "] dropped ",
               std::to_string(dropped), " cursors");
    return 0;
}

bool MultiplexedIOHandler::eof() {
    if (m_closed.load()) {
        return true;
    }
    return resolveCursor()->position.load() >= m_length.load();
}

off_t MultiplexedIOHandler::getFileSize() {
    if (!checkOpen()) {
        return -1;
    }
    return m_length.load();
}

int MultiplexedIOHandler::setFileSize(off_t length) {
    if (!checkOpen()) {
        return -1;
    }

    CursorPtr cursor = resolveCursor();

    std::lock_guard<std::mutex> lock(m_io_mutex);
    if (m_underlying->setFileSize(length) != 0) {
        setCursorError(*cursor, m_underlying->getLastError());
        return -1;
    }

    m_length.store(length);
    setCursorError(*cursor, 0);
    Debug::log("mux", "MultiplexedIOHandler::setFileSize() - [", m_options.name, "] length now ",
               static_cast<long long>(length));
    return 0;
}

int MultiplexedIOHandler::flush() {
    if (!checkOpen()) {
        return -1;
    }

    CursorPtr cursor = resolveCursor();

    std::lock_guard<std::mutex> lock(m_io_mutex);
    if (m_underlying->flush() != 0) {
        setCursorError(*cursor, m_underlying->getLastError());
        return -1;
    }
    setCursorError(*cursor, 0);
    return 0;
}

bool MultiplexedIOHandler::canRead() const {
    return !m_closed.load() && m_underlying->canRead();
}

bool MultiplexedIOHandler::canWrite() const {
    return !m_closed.load() && m_underlying->canWrite();
}

bool MultiplexedIOHandler::canSeek() const {
    return !m_closed.load() && m_underlying->canSeek();
}

int MultiplexedIOHandler::getLastError() const {
    if (m_closed.load()) {
        return m_error.load();
    }
    return resolveCursor()->last_error.load();
}

std::map<std::string, size_t> MultiplexedIOHandler::getCursorStats() const {
    std::map<std::string, size_t> stats;
    {
        std::shared_lock<std::shared_mutex> lock(m_cursor_mutex);
        stats["cursors"] = m_cursors.size();
    }
    stats["full_resolutions"] = m_full_resolutions.load();
    stats["fast_path_hits"] = m_fast_path_hits.load();
    stats["reorder_passes"] = m_reorder_passes.load();
    stats["reorder_moves"] = m_reorder_moves.load();
    return stats;
}

std::vector<MultiplexedIOHandler::CursorSnapshot> MultiplexedIOHandler::getCursorSnapshot() const {
    std::shared_lock<std::shared_mutex> lock(m_cursor_mutex);
    std::vector<CursorSnapshot> snapshot;
    snapshot.reserve(m_cursors.size());
    for (const CursorPtr& entry : m_cursors) {
        snapshot.push_back({entry->owner, entry->position.load(), entry->hit_count.load()});
    }
    return snapshot;
}

} // namespace IO
} // namespace StreamMux
