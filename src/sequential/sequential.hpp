#ifndef SEQUENTIAL_AGGREGATOR_H
#define SEQUENTIAL_AGGREGATOR_H

#include <iostream>
#include <vector>
#include <string>
#include <chrono>

#include "../include/chunk_aggregate.hpp"
#include "../include/input_file.hpp"
#include "../chunking/chunking.hpp"
#include "../merging/merging.hpp"

// Single worker on the calling thread. Same chunk loop as the parallel
// backends, used as the reference result.
class SequentialAggregator {
private:
    uint64_t chunk_size_;
    uint64_t lookback_margin_;
    bool verbose_;

public:
    SequentialAggregator(uint64_t chunk_size = DEFAULT_CHUNK_SIZE,
                         uint64_t lookback_margin = DEFAULT_LOOKBACK_MARGIN,
                         bool verbose = true)
        : chunk_size_(chunk_size), lookback_margin_(lookback_margin), verbose_(verbose) {}

    GlobalMap aggregate_file(const std::string& input_file) {
        using Clock = std::chrono::high_resolution_clock;

        InputFile file(input_file);
        if (verbose_) {
            double file_size_mb = static_cast<double>(file.size()) / (1024 * 1024);
            std::cout << "[SEQ] input=" << input_file << " (" << file_size_mb << " MB)"
                      << ", chunk=" << (chunk_size_ / 1024) << " KB"
                      << ", lookback=" << lookback_margin_ << " B" << std::endl;
        }

        auto t1 = Clock::now();

        WorkDistributor distributor(file.size(), chunk_size_);
        ChunkLocator locator(file, chunk_size_, lookback_margin_);
        GlobalMerger merger;

        std::vector<char> buffer(locator.buffer_size());
        LocalAggregator local;
        size_t records = aggregate_until_exhausted(distributor, locator, buffer, local);

        auto t2 = Clock::now();
        merger.merge_in(local);
        auto t3 = Clock::now();

        if (verbose_) {
            std::chrono::duration<double> scan_time = t2 - t1;
            std::chrono::duration<double> merge_time = t3 - t2;
            std::cout << "[LOG] " << records << " records, " << local.size() << " keys" << std::endl;
            std::cout << "[TIMING] Scan time: " << scan_time.count() << " s" << std::endl;
            std::cout << "[TIMING] Merge time: " << merge_time.count() << " s" << std::endl;
        }

        return merger.take();
    }
};

#endif
