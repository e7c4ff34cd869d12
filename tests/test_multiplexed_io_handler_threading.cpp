/*
 * test_multiplexed_io_handler_threading.cpp - Concurrency tests for MultiplexedIOHandler
 * This file is part of StreamMux.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * StreamMux is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "streammux.h"
#include "test_framework.h"
#include "test_framework_threading.h"

using namespace StreamMux::IO;
using namespace StreamMux::IO::File;
using namespace TestFramework;
using namespace TestFramework::Threading;

namespace {

/**
 * @brief Collects failures from worker threads for the main thread to assert on
 */
class FailureLog {
public:
    void add(const std::string& message) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_messages.size() < 16) {
            m_messages.push_back(message);
        }
        m_count++;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_count;
    }

    std::string first() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_messages.empty() ? std::string() : m_messages.front();
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_messages;
    size_t m_count = 0;
};

uint8_t patternByte(size_t owner, size_t iteration, size_t offset) {
    return static_cast<uint8_t>(owner * 7 + iteration * 13 + offset);
}

/**
 * @brief Every thread owns block i of a K*K stream and hammers it
 *
 * Each iteration writes a thread and iteration specific pattern, seeks back
 * and reads it again. Any cross-talk between cursors shows up as a mismatch.
 */
void runDistinctBlocks(MultiplexedIOHandler& mux, size_t owners, size_t iterations, FailureLog& failures) {
    TestBarrier barrier(owners);
    std::vector<std::thread> threads;

    for (size_t owner = 0; owner < owners; ++owner) {
        threads.emplace_back([&mux, &barrier, &failures, owner, owners, iterations]() {
            const off_t block = static_cast<off_t>(owner * owners);
            std::vector<uint8_t> out(owners);
            std::vector<uint8_t> in(owners);

            barrier.wait();

            for (size_t iteration = 0; iteration < iterations; ++iteration) {
                for (size_t i = 0; i < owners; ++i) {
                    out[i] = patternByte(owner, iteration, i);
                }

                if (mux.seek(block, SEEK_SET) != 0) {
                    failures.add("seek failed for owner " + std::to_string(owner));
                    return;
                }
                if (mux.write(out.data(), 1, owners) != owners) {
                    failures.add("short write for owner " + std::to_string(owner));
                    return;
                }
                if (mux.tell() != block + static_cast<off_t>(owners)) {
                    failures.add("position after write wrong for owner " + std::to_string(owner));
                    return;
                }
                if (mux.seek(-static_cast<off_t>(owners), SEEK_CUR) != 0) {
                    failures.add("relative seek failed for owner " + std::to_string(owner));
                    return;
                }
                if (mux.read(in.data(), 1, owners) != owners) {
                    failures.add("short read for owner " + std::to_string(owner));
                    return;
                }
                if (in != out) {
                    failures.add("owner " + std::to_string(owner) + " read foreign data in iteration " +
                                 std::to_string(iteration));
                    return;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }
}

} // namespace

// ============================================================================
// Isolation
// ============================================================================

class InterleavedIsolationTest : public TestCase {
public:
    InterleavedIsolationTest() : TestCase("Interleaved calls keep separate positions") {}

protected:
    void runTest() override {
        const std::string digits = "0123456789";
        MultiplexedIOHandler mux(std::make_shared<MemoryIOHandler>(digits.data(), digits.size()));
        DedicatedThread a;
        DedicatedThread b;

        a.run([&mux]() { ASSERT_EQUALS(0, mux.seek(2, SEEK_SET), "A seeks to 2"); });
        b.run([&mux]() { ASSERT_EQUALS(0, mux.seek(7, SEEK_SET), "B seeks to 7"); });

        a.run([&mux]() {
            char buffer[3];
            ASSERT_EQUALS(3u, mux.read(buffer, 1, 3), "A reads three");
            ASSERT_EQUALS(std::string("234"), std::string(buffer, 3), "A reads from its own position");
        });
        b.run([&mux]() {
            char buffer[2];
            ASSERT_EQUALS(2u, mux.read(buffer, 1, 2), "B reads two");
            ASSERT_EQUALS(std::string("78"), std::string(buffer, 2), "B reads from its own position");
        });

        a.run([&mux]() {
            ASSERT_EQUALS(5, mux.tell(), "A advanced by three");
            ASSERT_EQUALS('5', mux.readByte(), "A continues where it stopped");
        });
        b.run([&mux]() {
            ASSERT_EQUALS(9, mux.tell(), "B advanced by two");
            ASSERT_EQUALS(1u, mux.write("X", 1, 1), "B writes at 9");
        });
        a.run([&mux]() {
            ASSERT_EQUALS(6, mux.tell(), "B's write did not move A");
            ASSERT_EQUALS(0, mux.seek(9, SEEK_SET), "A seeks to B's write");
            ASSERT_EQUALS('X', mux.readByte(), "A sees B's write");
        });

        ASSERT_EQUALS(2u, mux.getCursorStats()["cursors"], "One cursor per thread");
    }
};

// ============================================================================
// Concurrent distinctness
// ============================================================================

class ConcurrentMemoryBlocksTest : public TestCase {
public:
    ConcurrentMemoryBlocksTest() : TestCase("64 threads own disjoint blocks of a memory stream") {}

protected:
    void runTest() override {
        const size_t owners = 64;
        auto stream = std::make_shared<MemoryIOHandler>();
        ASSERT_EQUALS(0, stream->setFileSize(static_cast<off_t>(owners * owners)), "Size the stream");

        MultiplexedIOHandler mux(stream);
        FailureLog failures;
        runDistinctBlocks(mux, owners, 200, failures);

        ASSERT_EQUALS(0u, failures.count(), failures.first());
        ASSERT_EQUALS(static_cast<off_t>(owners * owners), mux.getFileSize(), "Length unchanged");

        auto stats = mux.getCursorStats();
        ASSERT_EQUALS(owners, stats["cursors"], "One cursor per thread");
        ASSERT_TRUE(stats["reorder_passes"] <= stats["full_resolutions"] / 50, "Reorder runs at most every 50 lookups");

        // The last iteration of every owner must be what the stream holds
        std::vector<uint8_t> data = stream->getData();
        for (size_t owner = 0; owner < owners; ++owner) {
            for (size_t i = 0; i < owners; ++i) {
                ASSERT_EQUALS(static_cast<int>(patternByte(owner, 199, i)),
                              static_cast<int>(data[owner * owners + i]), "Final block content");
            }
        }
    }
};

class ConcurrentFileBlocksTest : public TestCase {
public:
    ConcurrentFileBlocksTest() : TestCase("Threads own disjoint blocks of a file") {}

protected:
    void setUp() override {
        char path[] = "/tmp/streammux_mux_XXXXXX";
        int fd = mkstemp(path);
        if (fd < 0) {
            throw TestSetupFailure(std::string("mkstemp failed: ") + strerror(errno));
        }
        ::close(fd);
        m_path = path;
    }

    void tearDown() override {
        unlink(m_path.c_str());
    }

    void runTest() override {
        const size_t owners = 50;
        auto file = std::make_shared<FileIOHandler>(m_path, FileIOHandler::OpenMode::ReadWrite);
        ASSERT_EQUALS(0, file->setFileSize(static_cast<off_t>(owners * owners)), "Size the file");

        MultiplexedIOHandler::Options options;
        options.name = "file";
        MultiplexedIOHandler mux(file, options);

        FailureLog failures;
        runDistinctBlocks(mux, owners, 40, failures);
        ASSERT_EQUALS(0u, failures.count(), failures.first());
        ASSERT_EQUALS(0, mux.flush(), "Flush the file");
        ASSERT_EQUALS(static_cast<off_t>(owners * owners), file->getFileSize(), "File size unchanged");
    }

private:
    std::string m_path;
};

class MixedOperationStressTest : public TestCase {
public:
    MixedOperationStressTest() : TestCase("Mixed operations with frequent reordering") {}

protected:
    void runTest() override {
        const size_t workers = 16;
        const off_t block = 32;

        auto stream = std::make_shared<MemoryIOHandler>();
        ASSERT_EQUALS(0, stream->setFileSize(block * static_cast<off_t>(workers)), "Size the stream");

        MultiplexedIOHandler::Options options;
        options.reorder_interval = 3;
        options.name = "stress";
        MultiplexedIOHandler mux(stream, options);

        ThreadSafetyTester::Config config;
        config.num_threads = workers;
        config.operations_per_thread = 300;
        config.test_duration = std::chrono::milliseconds(20000);
        config.max_delay = std::chrono::microseconds(20);
        ThreadSafetyTester tester(config);

        auto results = tester.runTest([&mux, block](size_t index) -> bool {
            const off_t start = static_cast<off_t>(index) * block;
            const uint8_t value = static_cast<uint8_t>(index + 1);
            std::vector<uint8_t> out(static_cast<size_t>(block), value);
            std::vector<uint8_t> in(static_cast<size_t>(block));

            // Uneven call counts per worker give the reorder pass something to move
            for (size_t extra = 0; extra <= (index % 4); ++extra) {
                if (mux.getLastError() != 0) {
                    return false;
                }
            }

            if (mux.seek(start, SEEK_SET) != 0) return false;
            if (mux.write(out.data(), 1, out.size()) != out.size()) return false;
            if (mux.seek(start, SEEK_SET) != 0) return false;
            for (size_t i = 0; i < in.size(); ++i) {
                int byte = mux.readByte();
                if (byte < 0) return false;
                in[i] = static_cast<uint8_t>(byte);
            }
            return in == out && mux.tell() == start + block;
        }, "mixed");

        ASSERT_EQUALS(0u, results.error_messages.size(), "No exceptions in workers");
        ASSERT_EQUALS(0u, results.failed_operations, "Every operation saw its own data");
        ASSERT_EQUALS(workers * config.operations_per_thread, results.total_operations, "Every worker finished");
        ASSERT_EQUALS(results.total_operations, results.successful_operations, "Every operation succeeded");

        auto stats = mux.getCursorStats();
        ASSERT_EQUALS(workers, stats["cursors"], "One cursor per worker");
        ASSERT_TRUE(stats["full_resolutions"] > 0, "Lookups happened");
    }
};

// ============================================================================
// Registry maintenance
// ============================================================================

class ReorderPreservesCursorsTest : public TestCase {
public:
    ReorderPreservesCursorsTest() : TestCase("Reordering keeps every cursor's state") {}

protected:
    void runTest() override {
        const std::string digits = "0123456789";
        MultiplexedIOHandler mux(std::make_shared<MemoryIOHandler>(digits.data(), digits.size()));

        // Registered in the order d, c, b, a; a ends up used most
        DedicatedThread a;
        DedicatedThread b;
        DedicatedThread c;
        DedicatedThread d;
        std::vector<DedicatedThread*> registration = {&d, &c, &b};
        std::vector<DedicatedThread*> pattern = {&a, &b, &a, &c, &a, &b, &a, &d};

        auto touch = [&mux](DedicatedThread* thread, off_t position) {
            thread->run([&mux, position]() {
                ASSERT_EQUALS(0, mux.seek(position, SEEK_SET), "Seek");
            });
        };

        off_t position = 0;
        for (DedicatedThread* thread : registration) {
            touch(thread, position++ % 10);
        }

        // Consecutive calls come from different threads, so each is a full lookup
        size_t step = 0;
        while (mux.getCursorStats()["full_resolutions"] < 49) {
            touch(pattern[step % pattern.size()], position++ % 10);
            ++step;
        }

        auto stats = mux.getCursorStats();
        ASSERT_EQUALS(49u, stats["full_resolutions"], "One lookup before the pass");
        ASSERT_EQUALS(0u, stats["reorder_passes"], "No pass yet");

        auto before = mux.getCursorSnapshot();
        ASSERT_EQUALS(4u, before.size(), "Four cursors");
        CursorOwner::id_type busiest = a.call<CursorOwner::id_type>([]() { return CursorOwner::current(); });
        ASSERT_TRUE(before[0].owner != busiest, "Busiest cursor not first yet");

        // The 50th full lookup, from a new thread, runs the pass
        ASSERT_EQUALS(0, mux.tell(), "Main thread joins");

        stats = mux.getCursorStats();
        ASSERT_EQUALS(1u, stats["reorder_passes"], "One pass ran");
        ASSERT_TRUE(stats["reorder_moves"] >= 1u, "Something moved");

        auto after = mux.getCursorSnapshot();
        ASSERT_EQUALS(before.size() + 1, after.size(), "Only the new cursor was added");
        ASSERT_EQUALS(busiest, after[0].owner, "Busiest cursor moved to the front");

        for (const auto& old_entry : before) {
            bool found = false;
            for (const auto& new_entry : after) {
                if (new_entry.owner == old_entry.owner) {
                    found = true;
                    ASSERT_EQUALS(old_entry.position, new_entry.position, "Position preserved");
                    ASSERT_EQUALS(old_entry.hit_count, new_entry.hit_count, "Hit count preserved");
                }
            }
            ASSERT_TRUE(found, "Cursor survived the pass");
        }

        for (size_t i = 1; i < after.size(); ++i) {
            ASSERT_TRUE(after[i - 1].hit_count >= after[i].hit_count, "Sorted by descending hits");
        }
        ASSERT_EQUALS(CursorOwner::current(), after.back().owner, "New cursor appended last");
    }
};

class SortedRegistryUntouchedTest : public TestCase {
public:
    SortedRegistryUntouchedTest() : TestCase("An already sorted registry is never reordered") {}

protected:
    void runTest() override {
        const std::string digits = "0123456789";
        MultiplexedIOHandler mux(std::make_shared<MemoryIOHandler>(digits.data(), digits.size()));

        DedicatedThread a;
        DedicatedThread b;
        DedicatedThread c;

        auto touch = [&mux](DedicatedThread& thread, off_t position) {
            thread.run([&mux, position]() {
                ASSERT_EQUALS(0, mux.seek(position, SEEK_SET), "Seek");
            });
        };

        // Registered a, b, c. The pattern a, b, a, c keeps hits(a) >= hits(b) >= hits(c)
        // after every single call, so no pass ever finds anything to move.
        touch(a, 1);
        touch(b, 2);
        touch(c, 3);

        std::vector<DedicatedThread*> pattern = {&a, &b, &a, &c};
        size_t step = 0;
        while (mux.getCursorStats()["full_resolutions"] < 160) {
            touch(*pattern[step % pattern.size()], static_cast<off_t>(step % 10));
            ++step;

            auto snapshot = mux.getCursorSnapshot();
            for (size_t i = 1; i < snapshot.size(); ++i) {
                ASSERT_TRUE(snapshot[i - 1].hit_count >= snapshot[i].hit_count, "Access pattern keeps the order sorted");
            }
        }

        auto stats = mux.getCursorStats();
        ASSERT_EQUALS(160u, stats["full_resolutions"], "Three maintenance points crossed");
        ASSERT_EQUALS(0u, stats["reorder_passes"], "No pass took the exclusive lock");
        ASSERT_EQUALS(0u, stats["reorder_moves"], "Nothing moved");

        auto snapshot = mux.getCursorSnapshot();
        ASSERT_EQUALS(3u, snapshot.size(), "Three cursors");
        ASSERT_EQUALS(a.call<CursorOwner::id_type>([]() { return CursorOwner::current(); }), snapshot[0].owner,
                      "First registered stays first");
        ASSERT_EQUALS(b.call<CursorOwner::id_type>([]() { return CursorOwner::current(); }), snapshot[1].owner,
                      "Second registered stays second");
        ASSERT_EQUALS(c.call<CursorOwner::id_type>([]() { return CursorOwner::current(); }), snapshot[2].owner,
                      "Third registered stays third");
    }
};

class ConcurrentRegistrationTest : public TestCase {
public:
    ConcurrentRegistrationTest() : TestCase("Simultaneous first use registers each thread once") {}

protected:
    void runTest() override {
        const size_t threads_count = 32;
        const std::string digits = "0123456789012345678901234567890123456789";
        MultiplexedIOHandler mux(std::make_shared<MemoryIOHandler>(digits.data(), digits.size()));

        TestBarrier barrier(threads_count);
        FailureLog failures;
        std::vector<std::thread> threads;
        for (size_t i = 0; i < threads_count; ++i) {
            threads.emplace_back([&mux, &barrier, &failures, i]() {
                barrier.wait();
                if (mux.tell() != 0) {
                    failures.add("new cursor not at 0");
                }
                if (mux.seek(static_cast<off_t>(i), SEEK_SET) != 0 || mux.tell() != static_cast<off_t>(i)) {
                    failures.add("cursor " + std::to_string(i) + " lost its position");
                }
                barrier.wait();
                if (mux.tell() != static_cast<off_t>(i)) {
                    failures.add("cursor " + std::to_string(i) + " moved by another thread");
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        ASSERT_EQUALS(0u, failures.count(), failures.first());

        auto snapshot = mux.getCursorSnapshot();
        ASSERT_EQUALS(threads_count, snapshot.size(), "One cursor per thread");
        std::vector<CursorOwner::id_type> owners;
        for (const auto& entry : snapshot) {
            owners.push_back(entry.owner);
        }
        std::sort(owners.begin(), owners.end());
        ASSERT_TRUE(std::adjacent_find(owners.begin(), owners.end()) == owners.end(), "No owner registered twice");
    }
};

class OwnerTokensNotReusedTest : public TestCase {
public:
    OwnerTokensNotReusedTest() : TestCase("A new thread never inherits a finished thread's cursor") {}

protected:
    void runTest() override {
        const std::string digits = "0123456789";
        MultiplexedIOHandler mux(std::make_shared<MemoryIOHandler>(digits.data(), digits.size()));

        for (int round = 0; round < 20; ++round) {
            std::thread worker([&mux]() {
                // Every short-lived thread must start from zero
                if (mux.tell() == 0) {
                    mux.seek(9, SEEK_SET);
                }
            });
            worker.join();
        }

        auto snapshot = mux.getCursorSnapshot();
        ASSERT_EQUALS(20u, snapshot.size(), "Each thread got its own cursor");
        for (const auto& entry : snapshot) {
            ASSERT_EQUALS(9, entry.position, "Each thread started at zero and moved to 9");
        }
    }
};

class CloseWhileBusyTest : public TestCase {
public:
    CloseWhileBusyTest() : TestCase("close() during concurrent calls stops every thread") {}

protected:
    void runTest() override {
        const std::string digits = "0123456789";
        auto stream = std::make_shared<MemoryIOHandler>(digits.data(), digits.size());
        MultiplexedIOHandler mux(stream);

        const size_t threads_count = 8;
        TestBarrier barrier(threads_count + 1);
        std::atomic<size_t> stopped{0};
        std::atomic<size_t> bad_reads{0};
        std::vector<std::thread> threads;

        for (size_t t = 0; t < threads_count; ++t) {
            threads.emplace_back([&]() {
                barrier.wait();
                for (;;) {
                    if (mux.seek(0, SEEK_SET) != 0 || mux.tell() < 0) {
                        break;
                    }
                    int byte = mux.readByte();
                    if (byte < 0) {
                        break;
                    }
                    if (byte != '0') {
                        bad_reads.fetch_add(1);
                    }
                }
                stopped.fetch_add(1);
            });
        }

        barrier.wait();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ASSERT_EQUALS(0, mux.close(), "close succeeds");

        for (auto& thread : threads) {
            thread.join();
        }

        ASSERT_EQUALS(threads_count, stopped.load(), "Every thread saw the close");
        ASSERT_EQUALS(0u, bad_reads.load(), "Reads before the close were correct");
        ASSERT_EQUALS(-1, mux.tell(), "Calls after close fail");
        ASSERT_EQUALS(EBADF, mux.getLastError(), "Closed handler reports EBADF");

        // The wrapped stream is untouched by the close
        ASSERT_EQUALS(0, stream->seek(3, SEEK_SET), "Wrapped stream still seeks");
        ASSERT_EQUALS('3', stream->readByte(), "Wrapped stream still reads");
    }
};

// ============================================================================
// Test Registration
// ============================================================================

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("MultiplexedIOHandler Threading Tests");

    suite.addTest(std::make_unique<InterleavedIsolationTest>());
    suite.addTest(std::make_unique<ConcurrentMemoryBlocksTest>());
    suite.addTest(std::make_unique<ConcurrentFileBlocksTest>());
    suite.addTest(std::make_unique<MixedOperationStressTest>());
    suite.addTest(std::make_unique<ReorderPreservesCursorsTest>());
    suite.addTest(std::make_unique<SortedRegistryUntouchedTest>());
    suite.addTest(std::make_unique<ConcurrentRegistrationTest>());
    suite.addTest(std::make_unique<OwnerTokensNotReusedTest>());
    suite.addTest(std::make_unique<CloseWhileBusyTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
