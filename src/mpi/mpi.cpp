#include "mpi.hpp"
#include "../include/input_file.hpp"

#include <iostream>
#include <limits>
#include <stdexcept>

GlobalMap MPIAggregator::aggregate_file(const std::string& input_file) {
    double t1 = MPI_Wtime();

    InputFile file(input_file);
    if (rank_ == 0 && verbose_) {
        double file_size_mb = static_cast<double>(file.size()) / (1024 * 1024);
        std::cout << "[MPI] input=" << input_file << " (" << file_size_mb << " MB)"
                  << ", ranks=" << size_
                  << ", chunk=" << (chunk_size_ / 1024) << " KB"
                  << ", lookback=" << lookback_margin_ << " B" << std::endl;
    }

    // This rank's stripe of the chunk grid
    WorkDistributor distributor(file.size(), chunk_size_,
                                static_cast<uint64_t>(rank_), static_cast<uint64_t>(size_));
    OpenMPAggregator engine(chunk_size_, num_threads_, lookback_margin_, false);
    GlobalMap local_results = engine.aggregate_stripe(file, distributor);

    double t2 = MPI_Wtime();
    if (verbose_) {
        std::cout << "[LOG] Rank " << rank_ << ": " << local_results.size() << " keys, "
                  << engine.num_threads() << " threads, " << (t2 - t1) << " s" << std::endl;
    }

    GlobalMap results = gather_results(local_results);

    double t3 = MPI_Wtime();
    if (rank_ == 0 && verbose_) {
        std::cout << "[TIMING] Scan time (rank 0): " << (t2 - t1) << " s" << std::endl;
        std::cout << "[TIMING] Gather + merge time: " << (t3 - t2) << " s" << std::endl;
    }
    return results;
}

GlobalMap MPIAggregator::gather_results(const GlobalMap& local_results) {
    std::vector<char> payload = serialize_results(local_results);
    if (payload.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("rank result too large to gather");
    }
    int payload_size = static_cast<int>(payload.size());

    // Step 1: every rank reports how many bytes it will send
    std::vector<int> sizes(rank_ == 0 ? size_ : 0);
    MPI_Gather(&payload_size, 1, MPI_INT, sizes.data(), 1, MPI_INT, 0, MPI_COMM_WORLD);

    // Step 2: gather the serialized maps into one buffer on rank 0
    std::vector<int> displs;
    std::vector<char> received;
    if (rank_ == 0) {
        displs.resize(size_);
        long long total = 0;
        for (int r = 0; r < size_; ++r) {
            displs[r] = static_cast<int>(total);
            total += sizes[r];
        }
        if (total > std::numeric_limits<int>::max()) {
            throw std::runtime_error("gathered results too large");
        }
        received.resize(static_cast<size_t>(total));
    }

    MPI_Gatherv(payload.data(), payload_size, MPI_CHAR,
                received.data(), sizes.data(), displs.data(), MPI_CHAR,
                0, MPI_COMM_WORLD);

    if (rank_ != 0) return GlobalMap();

    // Step 3: merge every rank's map (rank 0's own map included)
    GlobalMerger merger;
    for (int r = 0; r < size_; ++r) {
        merger.merge_in(deserialize_results(received.data() + displs[r], static_cast<size_t>(sizes[r])));
    }
    return merger.take();
}
