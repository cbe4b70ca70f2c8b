#ifndef REPORT_HPP
#define REPORT_HPP

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "../include/statistics.hpp"

constexpr int REPORT_PRECISION = 1; // fractional digits printed for min/mean/max

// Entries ordered by key (byte-wise ascending)
std::vector<std::pair<std::string, Statistics>> sorted_results(const GlobalMap& results);

// "min/mean/max", ex: "1.0/2.0/3.0"
std::string format_statistics(const Statistics& stats, int precision = REPORT_PRECISION);

// One "key: min/mean/max" line per key, sorted by key
void write_report(std::ostream& out, const GlobalMap& results, int precision = REPORT_PRECISION);

// Single line summary, ex: "{AA=1.0/2.0/3.0, BB=4.0/4.0/4.0}"
std::string format_summary(const GlobalMap& results, int precision = REPORT_PRECISION);

#endif // REPORT_HPP
