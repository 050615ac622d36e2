#pragma once

#include "run_summary.hpp"
#include <string>

constexpr const char* kDefaultLogPath = "/tmp/traffic_gen.log";
constexpr const char* kDefaultResultsPath = "results.json";

// Appends the summary as a JSON object to a file holding a JSON array.
// Returns false if the file could not be written.
bool append_result_to_file(const RunSummary& r, const std::string& path);

// Appends the text summary block to the agent log.
bool append_summary_to_log(const RunSummary& r, const std::string& path);
