#include <iostream>
#include <string>
#include <chrono>
#include <filesystem>
#include <exception>
#include <omp.h>

#include "omp.hpp"
#include "../include/aggregation_error.hpp"
#include "../sequential/sequential.hpp"
#include "../report/report.hpp"
#include "../filegen/filegen.hpp"

void print_usage(const std::string& prog_name) {
    std::cout << "\n========================================\n";
    std::cout << " OpenMP Key Aggregation - CLI Usage\n";
    std::cout << "========================================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << prog_name << " run <input_file> [chunk_MB] [num_threads] [lookback_bytes]\n";
    std::cout << "  " << prog_name << " benchmark <input_file> [chunk_MB] [num_threads]\n";
    std::cout << "  " << prog_name << " verify <input_file> [chunk_MB] [num_threads]\n\n";

    std::cout << "Commands:\n";
    std::cout << "  run              Aggregate the file and print key: min/mean/max, sorted by key\n";
    std::cout << "                   - chunk_MB: bytes claimed per chunk, in MB (default 16)\n";
    std::cout << "                   - num_threads: number of OpenMP threads (default: all cores)\n";
    std::cout << "                   - lookback_bytes: boundary search margin (default 64)\n\n";
    std::cout << "  benchmark        Aggregate and print only the timing line\n";
    std::cout << "  verify           Compare the OpenMP result with the sequential one\n\n";

    std::cout << "Examples:\n";
    std::cout << "  " << prog_name << " run measurements.txt           # 16MB chunks, all cores\n";
    std::cout << "  " << prog_name << " run measurements.txt 32 8      # 32MB chunks, 8 threads\n";
    std::cout << "  " << prog_name << " benchmark measurements.txt 16 4\n\n";
}

int main(int argc, char* argv[]) {
    // Check command-line arguments
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string input_file = argv[2];

    if (!std::filesystem::exists(input_file)) {
        std::cerr << "Error: Input file not found: " << input_file << "\n";
        return 1;
    }

    try {
        // Parse command-line arguments (if they exist)
        size_t chunk_mb = (argc >= 4) ? std::stoul(argv[3]) : DEFAULT_CHUNK_SIZE / (1024 * 1024);
        uint64_t chunk_bytes = static_cast<uint64_t>(chunk_mb) * 1024 * 1024;
        int threads = (argc >= 5) ? std::stoi(argv[4]) : 0;
        uint64_t lookback = (argc >= 6) ? std::stoull(argv[5]) : DEFAULT_LOOKBACK_MARGIN;

        if (command == "run") {
            OpenMPAggregator aggregator(chunk_bytes, threads, lookback);

            auto start = std::chrono::high_resolution_clock::now();
            GlobalMap results = aggregator.aggregate_file(input_file);
            auto end = std::chrono::high_resolution_clock::now();

            double duration = std::chrono::duration<double>(end - start).count();
            std::cout << "Aggregation completed in " << duration << " seconds\n";

            write_report(std::cout, results);
        }
        else if (command == "benchmark") {
            OpenMPAggregator aggregator(chunk_bytes, threads, lookback, false);

            auto start = std::chrono::high_resolution_clock::now();
            GlobalMap results = aggregator.aggregate_file(input_file);
            auto end = std::chrono::high_resolution_clock::now();

            double duration = std::chrono::duration<double>(end - start).count();

            // Output only performance data (file name, number of threads, time) for CSV
            std::cout << "[OMP] File=" << input_file
                      << " Threads=" << aggregator.num_threads()
                      << " Chunk=" << chunk_mb
                      << " Keys=" << results.size()
                      << " Time=" << duration << std::endl;
        }
        else if (command == "verify") {
            SequentialAggregator reference(chunk_bytes, lookback, false);
            OpenMPAggregator aggregator(chunk_bytes, threads, lookback, false);

            GlobalMap expected = reference.aggregate_file(input_file);
            GlobalMap actual = aggregator.aggregate_file(input_file);

            if (compare_results(expected, actual)) {
                std::cout << "Verification PASSED! Keys compared: " << expected.size() << std::endl;
            } else {
                std::cerr << "Verification FAILED" << std::endl;
                return 1;
            }
        }
        else {
            std::cerr << "Unknown command: " << command << "\n";
            print_usage(argv[0]);
            return 1;
        }
    } catch (const AggregationError& e) {
        std::cerr << describe_error(e) << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
