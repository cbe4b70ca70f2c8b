#ifndef OPENMP_AGGREGATOR_H
#define OPENMP_AGGREGATOR_H

#include <iostream>
#include <vector>
#include <string>
#include <cstdint>
#include <exception>
#include <mutex>
#include <omp.h>

#include "../include/chunk_aggregate.hpp"
#include "../include/input_file.hpp"
#include "../chunking/chunking.hpp"
#include "../merging/merging.hpp"

/**
 * Parallel chunked scan with OpenMP.
 *
 * One parallel region, one thread per core unless told otherwise. Every thread
 * claims chunks from the shared atomic cursor, aggregates into its own
 * LocalAggregator and merges it into the GlobalMerger once, when the cursor
 * runs dry. Exceptions cannot leave a parallel region, so the first failure
 * is captured and rethrown on the calling thread after the region joins.
 */
class OpenMPAggregator {
private:
    uint64_t chunk_size_;           // Nominal bytes per claim
    int num_threads_;               // Number of OpenMP threads
    uint64_t lookback_margin_;      // Bytes searched back for a record boundary
    bool verbose_;

public:
    OpenMPAggregator(uint64_t chunk_size = DEFAULT_CHUNK_SIZE,
                     int num_threads = 0,
                     uint64_t lookback_margin = DEFAULT_LOOKBACK_MARGIN,
                     bool verbose = true)
        : chunk_size_(chunk_size),
          lookback_margin_(lookback_margin),
          verbose_(verbose)
        {
        // 0 threads means one per available core
        num_threads_ = (num_threads <= 0) ? omp_get_max_threads() : num_threads;
    }

    int num_threads() const { return num_threads_; }

    GlobalMap aggregate_file(const std::string& input_file) {
        InputFile file(input_file);
        if (verbose_) {
            double file_size_mb = static_cast<double>(file.size()) / (1024 * 1024);
            std::cout << "[OMP] input=" << input_file << " (" << file_size_mb << " MB)"
                      << ", threads=" << num_threads_
                      << ", chunk=" << (chunk_size_ / 1024) << " KB"
                      << ", lookback=" << lookback_margin_ << " B" << std::endl;
        }

        WorkDistributor distributor(file.size(), chunk_size_);
        GlobalMap results = aggregate_stripe(file, distributor);
        return results;
    }

    // Run the thread pool over whatever the distributor hands out.
    // The MPI backend calls this with a striped distributor.
    GlobalMap aggregate_stripe(const InputFile& file, WorkDistributor& distributor) {
        ChunkLocator locator(file, chunk_size_, lookback_margin_);
        GlobalMerger merger;

        std::exception_ptr failure;
        std::mutex failure_mutex;
        size_t total_records = 0;

        double t1 = omp_get_wtime();

        #pragma omp parallel num_threads(num_threads_) reduction(+:total_records)
        {
            try {
                std::vector<char> buffer(locator.buffer_size());
                LocalAggregator local;
                total_records += aggregate_until_exhausted(distributor, locator, buffer, local);
                merger.merge_in(local);
            } catch (...) {
                distributor.abandon();
                std::lock_guard<std::mutex> lock(failure_mutex);
                if (!failure) failure = std::current_exception();
            }
        }

        double t2 = omp_get_wtime();

        if (failure) std::rethrow_exception(failure);

        if (verbose_) {
            std::cout << "[LOG] " << total_records << " records, " << merger.size() << " keys" << std::endl;
            std::cout << "[TIMING] Scan + merge time: " << (t2 - t1) << " s" << std::endl;
        }

        return merger.take();
    }
};

#endif
