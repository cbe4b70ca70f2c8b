#pragma once
#include <algorithm>
#include <string>
#include <unordered_map>

// Running min/max/sum/count of the values observed for one key
struct Statistics {
    double sum;
    double count;
    double min;
    double max;

    // Default constructor
    Statistics() : sum(0.0), count(0.0), min(0.0), max(0.0) {}

    // First observation of a key
    explicit Statistics(double value)
        : sum(value), count(1.0), min(value), max(value) {}

    // Fold one more observation into the running values
    void update(double value) {
        sum += value;
        count += 1.0;
        min = std::min(min, value);
        max = std::max(max, value);
    }

    // Entrywise combination of two partial aggregates (commutative and associative)
    void merge(const Statistics& other) {
        sum += other.sum;
        count += other.count;
        min = std::min(min, other.min);
        max = std::max(max, other.max);
    }

    double mean() const {
        return sum / count;
    }

    bool operator==(const Statistics& other) const = default;
};

// Final key -> statistics mapping handed to the reporting stage
using GlobalMap = std::unordered_map<std::string, Statistics>;
