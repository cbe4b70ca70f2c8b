#include <iostream>
#include <string>
#include <chrono>
#include <filesystem>
#include <exception>
#include "sequential.hpp"
#include "../include/aggregation_error.hpp"
#include "../report/report.hpp"

void print_usage(const std::string& prog) {
    std::cout << "Usage:\n"
              << "  " << prog << " run <input_file> [chunk_MB] [lookback_bytes]\n"
              << "  " << prog << " benchmark <input_file> [chunk_MB]\n";
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];
    std::string input_file = argv[2];

    if (!std::filesystem::exists(input_file)) {
        std::cerr << "File not found: " << input_file << std::endl;
        return 1;
    }

    try {
        size_t chunk_mb = (argc >= 4) ? std::stoul(argv[3]) : DEFAULT_CHUNK_SIZE / (1024 * 1024);
        uint64_t chunk_bytes = static_cast<uint64_t>(chunk_mb) * 1024 * 1024;
        uint64_t lookback = (argc >= 5) ? std::stoull(argv[4]) : DEFAULT_LOOKBACK_MARGIN;

        if (cmd == "run") {
            SequentialAggregator aggregator(chunk_bytes, lookback);
            GlobalMap results = aggregator.aggregate_file(input_file);
            write_report(std::cout, results);
        }
        else if (cmd == "benchmark") {
            SequentialAggregator aggregator(chunk_bytes, lookback, false);

            auto start = std::chrono::high_resolution_clock::now();
            GlobalMap results = aggregator.aggregate_file(input_file);
            auto end = std::chrono::high_resolution_clock::now();
            double dur = std::chrono::duration<double>(end - start).count();

            std::cout << "[SEQ] File=" << input_file
                      << " Chunk=" << chunk_mb
                      << " Keys=" << results.size()
                      << " Time=" << dur << std::endl;
        }
        else {
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
