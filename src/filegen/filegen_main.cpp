#include <iostream>
#include <string>
#include <cstdlib>
#include <exception>
#include "filegen.hpp"

void print_usage(const std::string& prog) {
    std::cout << "Usage:\n";
    std::cout << "  " << prog << " gen_count <filename> <num_records> [seed]\n";
    std::cout << "  " << prog << " gen_size  <filename> <size_in_MB> [seed]\n";
}

int main(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];
    std::string filename = argv[2];

    try {
        uint64_t seed = (argc >= 5) ? std::stoull(argv[4]) : 42;
        FileGenerator gen(seed);

        if (cmd == "gen_count") {
            size_t num_records = std::stoull(argv[3]);
            gen.generateFile(filename, num_records);
            std::cout << "Generated file: " << filename << " with " << num_records << " records\n";
        }

        else if (cmd == "gen_size") {
            size_t size_mb = std::stoull(argv[3]);
            gen.generateFileBySize(filename, size_mb * 1024 * 1024);
            std::cout << "Generated file: " << filename << " (~" << size_mb << " MB)\n";
        }

        else {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}


/* ## Example Usage ##

# Generate 10M records
./keyagg_filegen gen_count measurements.txt 10000000

# Generate file ~500MB with another seed
./keyagg_filegen gen_size measurements_500mb.txt 500 7
 */
