#include "report.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

std::vector<std::pair<std::string, Statistics>> sorted_results(const GlobalMap& results) {
    std::vector<std::pair<std::string, Statistics>> entries(results.begin(), results.end());
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return entries;
}

std::string format_statistics(const Statistics& stats, int precision) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision)
        << stats.min << '/' << stats.mean() << '/' << stats.max;
    return out.str();
}

void write_report(std::ostream& out, const GlobalMap& results, int precision) {
    for (const auto& [key, stats] : sorted_results(results)) {
        out << key << ": " << format_statistics(stats, precision) << '\n';
    }
    out.flush();
}

std::string format_summary(const GlobalMap& results, int precision) {
    std::string text = "{";
    bool first = true;
    for (const auto& [key, stats] : sorted_results(results)) {
        if (!first) text += ", ";
        text += key + "=" + format_statistics(stats, precision);
        first = false;
    }
    return text + "}";
}
