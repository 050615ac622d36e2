#include "fairness.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

FairnessReport ComputeFairness(const std::map<std::string, long long>& counts)
{
    FairnessReport report;
    for (const auto& entry : counts) {
        report.total += entry.second;
    }

    double lowest = 1.0;
    double highest = 0.0;
    for (const auto& entry : counts) {
        InstanceShare share;
        share.instance = entry.first;
        share.count = entry.second;
        share.share = report.total > 0 ? static_cast<double>(entry.second) / report.total : 0.0;
        lowest = std::min(lowest, share.share);
        highest = std::max(highest, share.share);
        report.shares.push_back(share);
    }

    if (report.shares.size() > 1 && report.total > 0) {
        report.max_deviation = highest - lowest;
    }
    return report;
}

std::string FormatFairness(const FairnessReport& report)
{
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1);
    ss << "Instances:           " << report.shares.size() << "\n"
       << "Total Requests:      " << report.total << "\n";
    for (const auto& share : report.shares) {
        ss << "  " << std::left << std::setw(24) << share.instance << std::right
           << std::setw(10) << share.count << "  " << share.share * 100.0 << "%\n";
    }
    ss << "Max Share Deviation: " << report.max_deviation * 100.0 << "%\n";
    return ss.str();
}

std::map<std::string, long long> ParseInstanceCounts(const std::string& metrics_text)
{
    static const std::string prefix = "instance.";

    std::map<std::string, long long> counts;
    std::istringstream in(metrics_text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        std::size_t colon = line.rfind(':');
        if (colon == std::string::npos || colon <= prefix.size()) {
            continue;
        }
        try {
            std::size_t used = 0;
            std::string value = line.substr(colon + 1);
            long long count = std::stoll(value, &used);
            if (used != value.size() || count < 0) {
                continue;
            }
            counts[line.substr(prefix.size(), colon - prefix.size())] = count;
        } catch (const std::invalid_argument&) {
            continue;
        } catch (const std::out_of_range&) {
            continue;
        }
    }
    return counts;
}
