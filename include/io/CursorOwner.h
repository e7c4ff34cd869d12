/*
 * CursorOwner.h - Per-thread identity for multiplexed stream cursors
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

#ifndef CURSOROWNER_H
#define CURSOROWNER_H

// No direct includes - all includes should be in streammux.h

namespace StreamMux {
namespace IO {

/**
 * @brief Identity of the calling thread for cursor lookup
 *
 * Tokens come from a process-wide counter and are never reused, so a thread
 * started after another one exited cannot inherit the dead thread's cursor
 * (std::thread::id values may be recycled). Zero is never issued.
 */
class CursorOwner {
public:
    using id_type = uint64_t;

    static constexpr id_type invalid_id = 0;

    /**
     * @brief Token of the calling thread, assigned on its first call
     */
    static id_type current() noexcept;

private:
    static std::atomic<id_type> s_next_id;
};

} // namespace IO
} // namespace StreamMux

#endif // CURSOROWNER_H
