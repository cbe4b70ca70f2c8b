#ifndef MPI_AGGREGATOR_HPP
#define MPI_AGGREGATOR_HPP

#include <mpi.h>
#include <cstdint>
#include <string>
#include <vector>

#include "../chunking/chunking.hpp"
#include "../merging/merging.hpp"
#include "../openmp/omp.hpp"

/**
 * Distributed scan: MPI between processes, OpenMP inside each process.
 *
 * The chunk grid is striped over the ranks (rank r owns chunk indices
 * r, r + size, r + 2*size, ...). Each rank runs the OpenMP aggregator on its
 * stripe, then rank 0 gathers the serialized rank maps and merges them.
 * Every rank needs to see the input file at the same path.
 */
class MPIAggregator {
private:
    int rank_;
    int size_;
    uint64_t chunk_size_;
    int num_threads_;
    uint64_t lookback_margin_;
    bool verbose_;

public:
    MPIAggregator(int rank, int size,
                  uint64_t chunk_size = DEFAULT_CHUNK_SIZE,
                  int num_threads = 0,
                  uint64_t lookback_margin = DEFAULT_LOOKBACK_MARGIN,
                  bool verbose = true)
        : rank_(rank), size_(size), chunk_size_(chunk_size), num_threads_(num_threads),
          lookback_margin_(lookback_margin), verbose_(verbose) {}

    // Collective call. Rank 0 returns the merged results of all ranks,
    // the other ranks return an empty map.
    GlobalMap aggregate_file(const std::string& input_file);

private:
    // Rank 0: receive every rank's serialized map and merge it with its own
    GlobalMap gather_results(const GlobalMap& local_results);
};

#endif
