/*
 * stress.cpp - streammux-stress, hammers one stream from many threads
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
#include <getopt.h>

using namespace StreamMux;
using namespace StreamMux::IO;

namespace {

struct StressOptions {
    size_t threads = 64;
    size_t iterations = 1000;
    size_t block_size = 64;
    size_t reorder_interval = 50;
    std::string debug_channels;
    std::string logfile;
    std::string path;
};

void about_console() {
    std::cout << "streammux-stress " << STREAMMUX_VERSION << std::endl
              << "Copyright (C) 2025 " << STREAMMUX_MAINTAINER << std::endl
              << "ISC License" << std::endl;
}

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [options] [file]" << std::endl
              << "  -t, --threads N            worker threads (default 64)" << std::endl
              << "  -i, --iterations N         write/read cycles per thread (default 1000)" << std::endl
              << "  -b, --block-size N         bytes per thread block (default 64)" << std::endl
              << "  -r, --reorder-interval N   lookups between reorder passes, 0 disables (default 50)" << std::endl
              << "  -d, --debug CHANNELS       comma separated debug channels (io,mux,raii,error,all)" << std::endl
              << "  -l, --logfile PATH         write debug output to PATH" << std::endl
              << "  -v, --version              print version and exit" << std::endl
              << "Without a file a memory stream is used. A given file is created or truncated." << std::endl;
}

bool parseCount(const char* text, size_t& value, bool allow_zero) {
    char* end = nullptr;
    errno = 0;
    unsigned long long parsed = strtoull(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || text[0] == '-') {
        return false;
    }
    if (!allow_zero && parsed == 0) {
        return false;
    }
    value = static_cast<size_t>(parsed);
    return true;
}

uint8_t patternByte(size_t worker, size_t iteration, size_t offset) {
    return static_cast<uint8_t>(worker * 131 + iteration * 7 + offset);
}

std::shared_ptr<IOHandler> openStream(const StressOptions& options) {
    std::shared_ptr<IOHandler> stream;
    if (options.path.empty()) {
        stream = std::make_shared<MemoryIOHandler>();
    } else {
        stream = std::make_shared<File::FileIOHandler>(options.path, File::FileIOHandler::OpenMode::Create);
    }

    off_t size = static_cast<off_t>(options.threads * options.block_size);
    if (stream->setFileSize(size) != 0) {
        throw Core::IOException(IOHandler::getErrorMessage(stream->getLastError(), "Cannot size the stream"));
    }
    return stream;
}

/**
 * @brief One worker: write a pattern into its block, read it back, compare
 * @return Number of failed cycles
 */
size_t runWorker(MultiplexedIOHandler& mux, size_t worker, const StressOptions& options) {
    const off_t start = static_cast<off_t>(worker * options.block_size);
    std::vector<uint8_t> out(options.block_size);
    std::vector<uint8_t> in(options.block_size);
    size_t failures = 0;

    for (size_t iteration = 0; iteration < options.iterations; ++iteration) {
        for (size_t i = 0; i < out.size(); ++i) {
            out[i] = patternByte(worker, iteration, i);
        }

        bool ok = mux.seek(start, SEEK_SET) == 0 &&
                  mux.write(out.data(), 1, out.size()) == out.size() &&
                  mux.seek(start, SEEK_SET) == 0 &&
                  mux.read(in.data(), 1, in.size()) == in.size() &&
                  in == out;
        if (!ok) {
            int error = mux.getLastError();
            Debug::log("mux", "worker ", std::to_string(worker), " iteration ", std::to_string(iteration), " failed: ",
                       error ? strerror(error) : "data mismatch");
            failures++;
        }
    }
    return failures;
}

} // namespace

int main(int argc, char *argv[]) {
    StressOptions options;

    static const struct option long_options[] = {
        {"threads", required_argument, 0, 't'},
        {"iterations", required_argument, 0, 'i'},
        {"block-size", required_argument, 0, 'b'},
        {"reorder-interval", required_argument, 0, 'r'},
        {"debug", required_argument, 0, 'd'},
        {"logfile", required_argument, 0, 'l'},
        {"version", no_argument, 0, 'v'},
        {0, 0, 0, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "t:i:b:r:d:l:v", long_options, nullptr)) != -1) {
        switch (opt) {
            case 't':
                if (!parseCount(optarg, options.threads, false)) {
                    std::cerr << argv[0] << ": invalid thread count '" << optarg << "'" << std::endl;
                    return 1;
                }
                break;
            case 'i':
                if (!parseCount(optarg, options.iterations, false)) {
                    std::cerr << argv[0] << ": invalid iteration count '" << optarg << "'" << std::endl;
                    return 1;
                }
                break;
            case 'b':
                if (!parseCount(optarg, options.block_size, false)) {
                    std::cerr << argv[0] << ": invalid block size '" << optarg << "'" << std::endl;
                    return 1;
                }
                break;
            case 'r':
                if (!parseCount(optarg, options.reorder_interval, true)) {
                    std::cerr << argv[0] << ": invalid reorder interval '" << optarg << "'" << std::endl;
                    return 1;
                }
                break;
            case 'd':
                options.debug_channels = optarg;
                break;
            case 'l':
                options.logfile = optarg;
                break;
            case 'v':
                about_console();
                return 0;
            case '?': // Invalid option
            default:
                usage(argv[0]);
                return 1; // getopt_long already prints an error message.
        }
    }

    if (optind < argc) {
        options.path = argv[optind];
        if (optind + 1 < argc) {
            std::cerr << argv[0] << ": only one file may be given" << std::endl;
            usage(argv[0]);
            return 1;
        }
    }

    if (!options.debug_channels.empty()) {
        Debug::init(options.logfile, Debug::parseChannels(options.debug_channels));
    }

    MultiplexedIOHandler::Options mux_options;
    mux_options.reorder_interval = options.reorder_interval;
    mux_options.name = options.path.empty() ? "memory" : options.path;

    std::shared_ptr<IOHandler> stream;
    std::unique_ptr<MultiplexedIOHandler> mux_handler;
    try {
        stream = openStream(options);
        mux_handler = std::make_unique<MultiplexedIOHandler>(stream, mux_options);
    } catch (const std::exception& e) {
        std::cerr << argv[0] << ": " << e.what() << std::endl;
        Debug::shutdown();
        return 1;
    }
    MultiplexedIOHandler& mux = *mux_handler;

    std::atomic<size_t> failures{0};
    std::vector<std::thread> workers;
    auto start_time = std::chrono::steady_clock::now();
    for (size_t worker = 0; worker < options.threads; ++worker) {
        workers.emplace_back([&mux, &failures, &options, worker]() {
            failures.fetch_add(runWorker(mux, worker, options));
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time);

    int flush_result = mux.flush();
    int flush_error = flush_result != 0 ? mux.getLastError() : 0;

    std::cout << "threads:          " << options.threads << std::endl
              << "iterations:       " << options.iterations << std::endl
              << "block size:       " << options.block_size << std::endl
              << "elapsed:          " << elapsed.count() << " ms" << std::endl;
    for (const auto& stat : mux.getCursorStats()) {
        std::cout << std::left << std::setw(18) << (stat.first + ":") << stat.second << std::endl;
    }
    std::cout << "failures:         " << failures.load() << std::endl;

    mux.close();
    stream->close();
    Debug::shutdown();

    if (flush_result != 0) {
        std::cerr << argv[0] << ": " << IOHandler::getErrorMessage(flush_error, "flush failed") << std::endl;
        return 1;
    }
    return failures.load() == 0 ? 0 : 1;
}
