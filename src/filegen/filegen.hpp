#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "../include/statistics.hpp"

// Writes "<station>;<value>\n" measurement files for benchmarks and tests
class FileGenerator {
public:
    explicit FileGenerator(uint64_t seed = 42) : seed_(seed) {}

    void generateFile(const std::string& filename, size_t num_records);
    void generateFileBySize(const std::string& filename, size_t target_size_bytes);

private:
    uint64_t seed_;
};

// true if both maps have the same keys and the same min/mean/max at `precision` digits
bool compare_results(const GlobalMap& expected, const GlobalMap& actual, int precision = 1);

#endif // FILE_UTILS_HPP
