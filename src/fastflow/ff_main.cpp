#include <iostream>
#include <chrono>
#include <string>
#include <vector>
#include <filesystem>
#include <exception>
#include <thread>

#include "ff.hpp"
#include "../include/aggregation_error.hpp"
#include "../sequential/sequential.hpp"
#include "../report/report.hpp"
#include "../filegen/filegen.hpp"

namespace fs = std::filesystem;

void print_usage(const std::string& exe_name) {
    std::cout << "==================================================\n";
    std::cout << " FastFlow Key Aggregation - Command Line Tool\n";
    std::cout << "==================================================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << exe_name << " run <input_file> [chunk_MB] [num_workers] [lookback_bytes]\n";
    std::cout << "  " << exe_name << " benchmark <input_file> [chunk_MB] [num_workers]\n";
    std::cout << "  " << exe_name << " verify <input_file> [chunk_MB] [num_workers]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  input_file        Path to the measurement file (<key>;<value> per line).\n";
    std::cout << "  chunk_MB          Optional. Bytes claimed per chunk, in MB (default: 16).\n";
    std::cout << "  num_workers       Optional. Number of FastFlow workers (default: all cores).\n";
    std::cout << "  lookback_bytes    Optional. Record boundary search margin (default: 64).\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << exe_name << " run measurements.txt\n";
    std::cout << "  " << exe_name << " run measurements.txt 32 8\n\n";
}

int main(int argc, char* argv[]) {

    // Check command-line arguments
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string input_file = argv[2];
    if (!fs::exists(input_file)) {
        std::cerr << "Error: Input file does not exist.\n";
        return 1;
    }

    try {
        size_t chunk_mb = (argc >= 4) ? std::stoul(argv[3]) : DEFAULT_CHUNK_SIZE / (1024 * 1024);
        uint64_t chunk_bytes = static_cast<uint64_t>(chunk_mb) * 1024 * 1024;
        int workers = (argc >= 5) ? std::stoi(argv[4]) : static_cast<int>(std::thread::hardware_concurrency());
        uint64_t lookback = (argc >= 6) ? std::stoull(argv[5]) : DEFAULT_LOOKBACK_MARGIN;

        if (command == "run") {
            std::cout << "\n=== FastFlow Key Aggregation ===\n";
            std::cout << "Input File      : " << input_file << "\n";
            std::cout << "Chunk Size      : " << chunk_mb << " MB\n";
            std::cout << "Worker Threads  : " << workers << "\n";

            FastFlowAggregator aggregator(chunk_bytes, workers, lookback);

            auto start = std::chrono::high_resolution_clock::now();
            GlobalMap results = aggregator.aggregate_file(input_file);
            auto end = std::chrono::high_resolution_clock::now();

            auto duration = std::chrono::duration<double>(end - start).count();
            std::cout << "Aggregation completed in " << duration << " seconds.\n";

            write_report(std::cout, results);
        } else if (command == "benchmark") {
            FastFlowAggregator aggregator(chunk_bytes, workers, lookback, false);

            auto start = std::chrono::high_resolution_clock::now();
            GlobalMap results = aggregator.aggregate_file(input_file);
            auto end = std::chrono::high_resolution_clock::now();

            double duration = std::chrono::duration<double>(end - start).count();

            // Output only performance data (compatible with bash parsing)
            std::cout << "[FF] Workers=" << workers
                      << " Chunk=" << chunk_mb
                      << " Keys=" << results.size()
                      << " Time=" << duration << std::endl;
        } else if (command == "verify") {
            SequentialAggregator reference(chunk_bytes, lookback, false);
            FastFlowAggregator aggregator(chunk_bytes, workers, lookback, false);

            bool same = compare_results(reference.aggregate_file(input_file),
                                        aggregator.aggregate_file(input_file));
            std::cout << "Verification: " << (same ? "PASS" : "FAIL") << std::endl;
            if (!same) return 1;
        }
        else {
            std::cerr << "Unknown command: " << command << std::endl;
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
