#include "filegen.hpp"
#include "../include/record.hpp"
#include "../report/report.hpp"

#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>
#include <vector>

namespace {

const std::vector<std::string> STATIONS = {
    "Abha", "Abidjan", "Accra", "Addis Ababa", "Adelaide", "Alexandria", "Algiers",
    "Amsterdam", "Anchorage", "Athens", "Baghdad", "Bangkok", "Barcelona", "Beirut",
    "Belgrade", "Berlin", "Bogotá", "Bratislava", "Brussels", "Bucharest", "Budapest",
    "Cairo", "Cape Town", "Chicago", "Copenhagen", "Dakar", "Dublin", "Edinburgh",
    "Halifax", "Hamburg", "Helsinki", "Hong Kong", "Istanbul", "Jakarta", "Kyiv",
    "Lagos", "Lima", "Lisbon", "Ljubljana", "London", "Madrid", "Marseille", "Milan",
    "Montréal", "Moscow", "Mumbai", "Nairobi", "Oslo", "Palermo", "Paris", "Prague",
    "Reykjavík", "Riga", "Rome", "San José", "São Paulo", "Seoul", "Sofia", "Stockholm",
    "Sydney", "Tallinn", "Tokyo", "Toronto", "Vienna", "Vilnius", "Warsaw", "Zagreb",
    "Zürich"
};

// One record: random station, value in [-99.9, 99.9] with one fractional digit
std::string random_record(std::mt19937_64& rng) {
    std::uniform_int_distribution<size_t> pick(0, STATIONS.size() - 1);
    std::uniform_int_distribution<int> tenths(-999, 999);

    int v = tenths(rng);
    int magnitude = v < 0 ? -v : v;
    std::string line = STATIONS[pick(rng)];
    line += FIELD_SEPARATOR;
    if (v < 0) line += '-';
    line += std::to_string(magnitude / 10);
    line += '.';
    line += static_cast<char>('0' + magnitude % 10);
    line += RECORD_TERMINATOR;
    return line;
}

} // namespace

/**
 * Generate a file with a specific number of records
 *
 * @param filename The file to generate
 * @param num_records The number of records to generate
 */
void FileGenerator::generateFile(const std::string& filename, size_t num_records) {
    std::ofstream file(filename, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to create file: " + filename);
    }

    std::mt19937_64 rng(seed_);
    for (size_t i = 0; i < num_records; ++i) {
        file << random_record(rng);
    }

    if (!file) {
        throw std::runtime_error("Failed to write file: " + filename);
    }
}

/**
 * Generate a file with records until it reaches a certain byte size
 *
 * The last record may push the file slightly past @p target_size_bytes;
 * records are never cut.
 *
 * @param filename The name of the file to be generated
 * @param target_size_bytes The approximate target size of the generated file in bytes
 */
void FileGenerator::generateFileBySize(const std::string& filename, size_t target_size_bytes) {
    std::ofstream file(filename, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to create file: " + filename);
    }

    std::mt19937_64 rng(seed_);
    size_t written = 0;
    while (written < target_size_bytes) {
        std::string line = random_record(rng);
        file << line;
        written += line.size();
    }

    if (!file) {
        throw std::runtime_error("Failed to write file: " + filename);
    }
}

/**
 * Compare two result maps the way a reader of the report would
 *
 * Keys must match exactly; min, mean and max must render identically at
 * @p precision fractional digits (summation order differs between backends).
 * The first mismatch is reported on stderr.
 */
bool compare_results(const GlobalMap& expected, const GlobalMap& actual, int precision) {
    if (expected.size() != actual.size()) {
        std::cerr << "Key count mismatch: " << expected.size() << " vs " << actual.size() << std::endl;
        return false;
    }

    for (const auto& [key, stats] : expected) {
        auto it = actual.find(key);
        if (it == actual.end()) {
            std::cerr << "Missing key: " << key << std::endl;
            return false;
        }
        if (stats.count != it->second.count) {
            std::cerr << "Count mismatch for " << key << ": " << stats.count
                      << " vs " << it->second.count << std::endl;
            return false;
        }
        std::string a = format_statistics(stats, precision);
        std::string b = format_statistics(it->second, precision);
        if (a != b) {
            std::cerr << "Mismatch for " << key << ": " << a << " vs " << b << std::endl;
            return false;
        }
    }
    return true;
}
