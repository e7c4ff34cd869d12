/*
 * test_multiplexed_ogg_readers.cpp - Concurrent Ogg page scanning through MultiplexedIOHandler
 * This file is part of StreamMux.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * StreamMux is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Several threads run their own libogg sync state over one shared stream.
 * CRC checked page capture makes any cursor mix-up visible as lost sync.
 */

#include "streammux.h"
#include "test_framework.h"
#include "test_framework_threading.h"

#ifdef HAVE_OGG
#include <ogg/ogg.h>
#endif

using namespace StreamMux::IO;
using namespace TestFramework;
using namespace TestFramework::Threading;

#ifdef HAVE_OGG

namespace {

struct PageInfo {
    long serial;
    long pageno;
    off_t offset;
    long size;

    bool operator==(const PageInfo& other) const {
        return serial == other.serial && pageno == other.pageno &&
               offset == other.offset && size == other.size;
    }
};

/**
 * @brief Two interleaved logical streams with pages of uneven size
 */
class OggFixture {
public:
    static constexpr long kFirstSerial = 0x1234;
    static constexpr long kSecondSerial = 0x5678;

    OggFixture() {
        ogg_stream_state first;
        ogg_stream_state second;
        ogg_stream_init(&first, static_cast<int>(kFirstSerial));
        ogg_stream_init(&second, static_cast<int>(kSecondSerial));

        const int packets = 120;
        for (int i = 0; i < packets; ++i) {
            addPacket(first, i, packets, 100 + (i * 37) % 2900);
            addPacket(second, i, packets, 60 + (i * 53) % 1700);
        }

        ogg_stream_clear(&first);
        ogg_stream_clear(&second);
    }

    const std::vector<uint8_t>& bytes() const { return m_bytes; }
    const std::vector<PageInfo>& pages() const { return m_pages; }

private:
    void addPacket(ogg_stream_state& state, int index, int total, int size) {
        std::vector<unsigned char> payload(static_cast<size_t>(size));
        for (int j = 0; j < size; ++j) {
            payload[static_cast<size_t>(j)] = static_cast<unsigned char>(index * 31 + j);
        }

        ogg_packet packet;
        packet.packet = payload.data();
        packet.bytes = size;
        packet.b_o_s = index == 0 ? 1 : 0;
        packet.e_o_s = index == total - 1 ? 1 : 0;
        packet.granulepos = index;
        packet.packetno = index;

        if (ogg_stream_packetin(&state, &packet) != 0) {
            throw TestSetupFailure("ogg_stream_packetin failed");
        }

        ogg_page page;
        // Flush every third packet so pages stay small and numerous
        if (index % 3 == 2 || index == total - 1) {
            while (ogg_stream_flush(&state, &page) != 0) {
                appendPage(page);
            }
        } else {
            while (ogg_stream_pageout(&state, &page) != 0) {
                appendPage(page);
            }
        }
    }

    void appendPage(const ogg_page& page) {
        PageInfo info;
        info.serial = ogg_page_serialno(&page);
        info.pageno = ogg_page_pageno(&page);
        info.offset = static_cast<off_t>(m_bytes.size());
        info.size = page.header_len + page.body_len;
        m_pages.push_back(info);

        m_bytes.insert(m_bytes.end(), page.header, page.header + page.header_len);
        m_bytes.insert(m_bytes.end(), page.body, page.body + page.body_len);
    }

    std::vector<uint8_t> m_bytes;
    std::vector<PageInfo> m_pages;
};

/**
 * @brief Forward page scanner over an IOHandler, one per thread
 */
class PageScanner {
public:
    PageScanner(IOHandler& handler, size_t chunk_size)
        : m_handler(handler), m_chunk_size(chunk_size) {
        ogg_sync_init(&m_sync);
    }

    ~PageScanner() {
        ogg_sync_clear(&m_sync);
    }

    PageScanner(const PageScanner&) = delete;
    PageScanner& operator=(const PageScanner&) = delete;

    /**
     * @brief Start scanning at offset, dropping buffered data
     */
    bool seekTo(off_t offset) {
        if (m_handler.seek(offset, SEEK_SET) != 0) {
            return false;
        }
        ogg_sync_reset(&m_sync);
        m_offset = offset;
        return true;
    }

    /**
     * @return 1 with info filled, 0 at end of stream, -1 on I/O error
     */
    int nextPage(PageInfo& info) {
        ogg_page page;
        for (;;) {
            int consumed = ogg_sync_pageseek(&m_sync, &page);
            if (consumed > 0) {
                info.serial = ogg_page_serialno(&page);
                info.pageno = ogg_page_pageno(&page);
                info.offset = m_offset;
                info.size = consumed;
                m_offset += consumed;
                return 1;
            }

            if (consumed < 0) {
                m_skipped += static_cast<size_t>(-consumed);
                m_offset += -consumed;
                continue;
            }

            char* buffer = ogg_sync_buffer(&m_sync, static_cast<long>(m_chunk_size));
            if (!buffer) {
                return -1;
            }
            size_t bytes_read = m_handler.read(buffer, 1, m_chunk_size);
            if (bytes_read == 0) {
                return m_handler.getLastError() == 0 ? 0 : -1;
            }
            ogg_sync_wrote(&m_sync, static_cast<long>(bytes_read));
        }
    }

    size_t skipped() const { return m_skipped; }

private:
    IOHandler& m_handler;
    size_t m_chunk_size;
    ogg_sync_state m_sync;
    off_t m_offset = 0;
    size_t m_skipped = 0;
};

std::string describe(const PageInfo& page) {
    return "serial " + std::to_string(page.serial) + " page " + std::to_string(page.pageno) +
           " at " + std::to_string(static_cast<long long>(page.offset));
}

} // namespace

class FixtureSanityTest : public TestCase {
public:
    FixtureSanityTest() : TestCase("Single reader sees every page") {}

protected:
    void runTest() override {
        OggFixture fixture;
        ASSERT_TRUE(fixture.pages().size() > 50, "Fixture has many pages");

        MultiplexedIOHandler mux(std::make_shared<MemoryIOHandler>(fixture.bytes().data(), fixture.bytes().size()));
        PageScanner scanner(mux, 4096);

        std::vector<PageInfo> seen;
        PageInfo info;
        int result;
        while ((result = scanner.nextPage(info)) == 1) {
            seen.push_back(info);
        }

        ASSERT_EQUALS(0, result, "Scan ends cleanly");
        ASSERT_EQUALS(0u, scanner.skipped(), "No bytes skipped");
        ASSERT_EQUALS(fixture.pages().size(), seen.size(), "Page count");
        ASSERT_TRUE(seen == fixture.pages(), "Pages match the fixture");
    }
};

class ConcurrentFullScanTest : public TestCase {
public:
    ConcurrentFullScanTest() : TestCase("Concurrent readers each see every page") {}

protected:
    void runTest() override {
        const size_t readers = 8;
        OggFixture fixture;
        MultiplexedIOHandler mux(std::make_shared<MemoryIOHandler>(fixture.bytes().data(), fixture.bytes().size()));

        TestBarrier barrier(readers);
        std::mutex results_mutex;
        std::vector<std::string> failures;
        std::vector<std::thread> threads;

        for (size_t reader = 0; reader < readers; ++reader) {
            threads.emplace_back([&, reader]() {
                // Odd chunk sizes keep the readers' offsets apart
                PageScanner scanner(mux, 97 + reader * 211);
                std::vector<PageInfo> seen;

                barrier.wait();
                for (int pass = 0; pass < 3; ++pass) {
                    seen.clear();
                    if (!scanner.seekTo(0)) {
                        std::lock_guard<std::mutex> lock(results_mutex);
                        failures.push_back("reader " + std::to_string(reader) + " could not rewind");
                        return;
                    }

                    PageInfo info;
                    int result;
                    while ((result = scanner.nextPage(info)) == 1) {
                        seen.push_back(info);
                    }

                    std::string problem;
                    if (result != 0) {
                        problem = "I/O error";
                    } else if (scanner.skipped() != 0) {
                        problem = "lost sync, skipped " + std::to_string(scanner.skipped()) + " bytes";
                    } else if (seen.size() != fixture.pages().size()) {
                        problem = "saw " + std::to_string(seen.size()) + " pages";
                    } else {
                        for (size_t i = 0; i < seen.size(); ++i) {
                            if (!(seen[i] == fixture.pages()[i])) {
                                problem = "expected " + describe(fixture.pages()[i]) + ", got " + describe(seen[i]);
                                break;
                            }
                        }
                    }

                    if (!problem.empty()) {
                        std::lock_guard<std::mutex> lock(results_mutex);
                        failures.push_back("reader " + std::to_string(reader) + " pass " +
                                           std::to_string(pass) + ": " + problem);
                        return;
                    }
                }
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }

        ASSERT_TRUE(failures.empty(), failures.empty() ? std::string() : failures.front());
        ASSERT_EQUALS(readers, mux.getCursorStats()["cursors"], "One cursor per reader");
    }
};

class ConcurrentPartialScanTest : public TestCase {
public:
    ConcurrentPartialScanTest() : TestCase("Readers starting at different pages stay in sync") {}

protected:
    void runTest() override {
        OggFixture fixture;
        const auto& pages = fixture.pages();
        MultiplexedIOHandler mux(std::make_shared<MemoryIOHandler>(fixture.bytes().data(), fixture.bytes().size()));

        const size_t readers = 6;
        std::atomic<size_t> failures{0};
        std::vector<std::thread> threads;
        TestBarrier barrier(readers);

        for (size_t reader = 0; reader < readers; ++reader) {
            threads.emplace_back([&, reader]() {
                const size_t first_page = (pages.size() * reader) / readers;
                PageScanner scanner(mux, 512 + reader * 64);

                barrier.wait();
                if (!scanner.seekTo(pages[first_page].offset)) {
                    failures.fetch_add(1);
                    return;
                }

                size_t expected = first_page;
                PageInfo info;
                while (scanner.nextPage(info) == 1) {
                    if (expected >= pages.size() || !(info == pages[expected])) {
                        failures.fetch_add(1);
                        return;
                    }
                    ++expected;
                }
                if (expected != pages.size() || scanner.skipped() != 0) {
                    failures.fetch_add(1);
                }
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }

        ASSERT_EQUALS(0u, failures.load(), "Every reader saw the pages after its start");
    }
};

#endif // HAVE_OGG

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

#ifdef HAVE_OGG
    TestSuite suite("MultiplexedIOHandler Ogg Reader Tests");

    suite.addTest(std::make_unique<FixtureSanityTest>());
    suite.addTest(std::make_unique<ConcurrentFullScanTest>());
    suite.addTest(std::make_unique<ConcurrentPartialScanTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
#else
    std::cout << "libogg not available - Ogg reader tests skipped" << std::endl;
    return 0;
#endif
}
