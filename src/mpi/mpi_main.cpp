#include <iostream>
#include <mpi.h>
#include <omp.h>
#include <filesystem>
#include <exception>

#include "mpi.hpp"
#include "../include/aggregation_error.hpp"
#include "../report/report.hpp"

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <command> [arguments]" << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  run <input_file> [chunk_MB] [num_threads] [lookback_bytes]" << std::endl;
    std::cout << "    - Aggregate input_file using MPI + OpenMP, rank 0 prints the report" << std::endl;
    std::cout << "    - chunk_MB: bytes claimed per chunk, in MB (default 16)" << std::endl;
    std::cout << "    - num_threads: OpenMP threads per rank (default: all cores)" << std::endl;
    std::cout << "  benchmark <input_file> [chunk_MB] [num_threads]" << std::endl;
    std::cout << "    - Run and output performance timing only (CSV style)" << std::endl;
}

int main(int argc, char* argv[]) {
    MPI_Init(&argc, &argv);

    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    if (argc < 3) {
        if (rank == 0) {
            print_usage(argv[0]);
        }
        MPI_Finalize();
        return 1;
    }

    std::string command = argv[1];
    std::string input_file = argv[2];

    if (command != "run" && command != "benchmark") {
        if (rank == 0) {
            std::cerr << "Error: Unknown command '" << command << "'" << std::endl;
            print_usage(argv[0]);
        }
        MPI_Finalize();
        return 1;
    }

    try {
        size_t chunk_mb = (argc >= 4) ? std::stoul(argv[3]) : DEFAULT_CHUNK_SIZE / (1024 * 1024);
        uint64_t chunk_bytes = static_cast<uint64_t>(chunk_mb) * 1024 * 1024;
        int num_threads = (argc >= 5) ? std::stoi(argv[4]) : 0;
        uint64_t lookback = (argc >= 6) ? std::stoull(argv[5]) : DEFAULT_LOOKBACK_MARGIN;

        bool benchmark = (command == "benchmark");
        MPIAggregator aggregator(rank, size, chunk_bytes, num_threads, lookback, !benchmark);

        double start = MPI_Wtime();
        GlobalMap results = aggregator.aggregate_file(input_file);
        double end = MPI_Wtime();

        if (rank == 0) {
            if (benchmark) {
                std::cout << "[MPI] Procs=" << size
                          << " Threads=" << (num_threads > 0 ? num_threads : omp_get_max_threads())
                          << " Chunk=" << chunk_mb
                          << " Keys=" << results.size()
                          << " Time=" << (end - start) << std::endl;
            } else {
                std::cout << "Aggregation completed in " << (end - start) << " seconds" << std::endl;
                write_report(std::cout, results);
            }
        }

    } catch (const AggregationError& e) {
        std::cerr << "Rank " << rank << " " << describe_error(e) << std::endl;
        MPI_Abort(MPI_COMM_WORLD, 1);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Rank " << rank << " error: " << e.what() << std::endl;
        MPI_Abort(MPI_COMM_WORLD, 1);
        return 1;
    }

    MPI_Finalize();
    return 0;
}
