#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

struct InstanceShare {
    std::string instance;
    long long count = 0;
    double share = 0.0;  // fraction of the total, 0..1
};

/**
 * @brief How evenly requests spread over the serving instances.
 *
 * `max_deviation` is the largest share minus the smallest share; 0 means a
 * perfectly even spread (and is also reported for zero or one instance).
 */
struct FairnessReport {
    long long total = 0;
    std::vector<InstanceShare> shares;  // ordered by instance id
    double max_deviation = 0.0;
};

FairnessReport ComputeFairness(const std::map<std::string, long long>& counts);

// Multi-line text block with one line per instance.
std::string FormatFairness(const FairnessReport& report);

/**
 * @brief Extracts `instance.<id>:<count>` lines from a `/metrics?format=text`
 * body. Lines that are not instance counters, or do not parse, are skipped.
 */
std::map<std::string, long long> ParseInstanceCounts(const std::string& metrics_text);
