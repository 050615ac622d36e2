#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "fairness.hpp"
#include "user_session.hpp"

struct LatencyStats {
    long long count = 0;
    double mean_ms = 0.0;
    double min_ms = 0.0;
    double p50_ms = 0.0;
    double p95_ms = 0.0;
    double p99_ms = 0.0;
    double max_ms = 0.0;
};

// Nearest-rank percentiles over successful-request latencies.
LatencyStats compute_latency_stats(std::vector<long long> samples_us);

/**
 * @brief Aggregate of every session one agent invocation completed.
 *
 * Merging only adds counts and appends samples, so the order in which
 * workers report does not matter.
 */
struct RunSummary {
    std::string label;  // profile key, "mix", or scenario stage
    int concurrency = 0;
    int planned_duration_sec = 0;

    long long sessions = 0;
    long long aborted_sessions = 0;  // could not start or threw; not in `sessions`
    long long requests = 0;
    long long successes = 0;
    long long errors = 0;
    std::vector<long long> latencies_us;
    std::map<std::string, long long> endpoint_hits;
    std::map<std::string, long long> server_hits;
    std::map<std::string, long long> profile_sessions;
    std::map<int, long long> status_codes;

    std::chrono::system_clock::time_point started{};
    std::chrono::system_clock::time_point finished{};
    bool cancelled = false;

    void Merge(const SessionResult& session);

    LatencyStats Latency() const { return compute_latency_stats(latencies_us); }
    FairnessReport Fairness() const { return ComputeFairness(server_hits); }

    double ElapsedSeconds() const;
    double SuccessPercent() const;
    double ErrorPercent() const;

    // The greppable text block printed at the end of a run.
    std::string Format() const;

    // One JSON object, suitable for appending to the results array file.
    std::string ToJson() const;
};
