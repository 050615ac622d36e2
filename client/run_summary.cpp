#include "run_summary.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "JsonText.h"

namespace {

const std::string kRule(60, '=');

std::string format_time(std::chrono::system_clock::time_point tp)
{
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

template <typename K>
void write_json_map(std::ostringstream& ss, const std::map<K, long long>& m)
{
    ss << "{";
    bool first = true;
    for (const auto& entry : m) {
        if (!first) ss << ", ";
        first = false;
        std::ostringstream key;
        key << entry.first;
        ss << "\"" << json_escape(key.str()) << "\": " << entry.second;
    }
    ss << "}";
}

double percent(long long part, long long whole)
{
    return whole > 0 ? static_cast<double>(part) * 100.0 / static_cast<double>(whole) : 0.0;
}

}

LatencyStats compute_latency_stats(std::vector<long long> samples_us)
{
    LatencyStats stats;
    if (samples_us.empty()) {
        return stats;
    }
    std::sort(samples_us.begin(), samples_us.end());

    const double size = static_cast<double>(samples_us.size());
    auto rank = [&](double fraction) {
        auto idx = static_cast<std::size_t>(std::ceil(size * fraction));
        return samples_us[idx == 0 ? 0 : idx - 1] / 1000.0;
    };

    double mean = 0.0;
    for (long long s : samples_us) {
        mean += static_cast<double>(s) / size;
    }

    stats.count = static_cast<long long>(samples_us.size());
    stats.mean_ms = mean / 1000.0;
    stats.min_ms = samples_us.front() / 1000.0;
    stats.p50_ms = rank(0.50);
    stats.p95_ms = rank(0.95);
    stats.p99_ms = rank(0.99);
    stats.max_ms = samples_us.back() / 1000.0;
    return stats;
}

void RunSummary::Merge(const SessionResult& session)
{
    sessions++;
    requests += session.requests;
    successes += session.successes;
    errors += session.failures;
    latencies_us.insert(latencies_us.end(), session.latencies_us.begin(), session.latencies_us.end());
    for (const auto& e : session.endpoint_hits) endpoint_hits[e.first] += e.second;
    for (const auto& e : session.server_hits) server_hits[e.first] += e.second;
    for (const auto& e : session.status_codes) status_codes[e.first] += e.second;
    if (!session.profile_key.empty()) {
        profile_sessions[session.profile_key]++;
    }
}

double RunSummary::ElapsedSeconds() const
{
    if (finished < started) {
        return 0.0;
    }
    return std::chrono::duration<double>(finished - started).count();
}

double RunSummary::SuccessPercent() const
{
    return percent(successes, requests);
}

double RunSummary::ErrorPercent() const
{
    return percent(errors, requests);
}

std::string RunSummary::Format() const
{
    const LatencyStats lat = Latency();
    const FairnessReport fairness = Fairness();
    const double elapsed = ElapsedSeconds();

    std::ostringstream ss;
    ss << std::fixed;
    ss << "\n" << kRule << "\n"
       << "TRAFFIC GENERATION SUMMARY\n"
       << kRule << "\n"
       << "Label:               " << label << "\n"
       << "Concurrency:         " << concurrency << "\n"
       << "Started:             " << format_time(started) << "\n"
       << "Finished:            " << format_time(finished) << "\n"
       << std::setprecision(1)
       << "Duration:            " << elapsed << "s\n"
       << "Total Sessions:      " << sessions << "\n";
    if (aborted_sessions > 0) {
        ss << "Aborted Sessions:    " << aborted_sessions << "\n";
    }
    ss << std::setprecision(1)
       << "Total Requests:      " << requests << "\n"
       << "Successful:          " << successes << " (" << SuccessPercent() << "%)\n"
       << "Errors:              " << errors << " (" << ErrorPercent() << "%)\n"
       << std::setprecision(3)
       << "Avg Response Time:   " << lat.mean_ms / 1000.0 << "s\n"
       << "Latency p50/p95/p99: " << lat.p50_ms / 1000.0 << "s / " << lat.p95_ms / 1000.0
       << "s / " << lat.p99_ms / 1000.0 << "s\n"
       << std::setprecision(2)
       << "Throughput:          " << (elapsed > 0.0 ? requests / elapsed : 0.0) << " req/s\n";

    for (const auto& e : profile_sessions) {
        ss << "Profile Sessions:    " << e.first << " = " << e.second << "\n";
    }
    for (const auto& e : endpoint_hits) {
        ss << "Endpoint Hits:       " << e.first << " = " << e.second << "\n";
    }
    for (const auto& e : status_codes) {
        ss << "Status Codes:        " << (e.first == 0 ? std::string("error") : std::to_string(e.first))
           << " = " << e.second << "\n";
    }

    ss << "Servers Hit:         " << server_hits.size() << " (";
    bool first = true;
    for (const auto& e : server_hits) {
        if (!first) ss << ", ";
        first = false;
        ss << e.first;
    }
    ss << ")\n";
    for (const auto& e : server_hits) {
        ss << "Server Hits:         " << e.first << " = " << e.second << "\n";
    }
    ss << std::setprecision(1)
       << "Max Share Deviation: " << fairness.max_deviation * 100.0 << "%\n";
    if (cancelled) {
        ss << "Cancelled:           yes\n";
    }
    ss << kRule << "\n";
    return ss.str();
}

std::string RunSummary::ToJson() const
{
    const LatencyStats lat = Latency();
    const double elapsed = ElapsedSeconds();

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << "{"
       << "\"label\": \"" << json_escape(label) << "\", "
       << "\"concurrency\": " << concurrency << ", "
       << "\"planned_duration_sec\": " << planned_duration_sec << ", "
       << "\"started\": \"" << format_time(started) << "\", "
       << "\"finished\": \"" << format_time(finished) << "\", "
       << "\"elapsed_sec\": " << elapsed << ", "
       << "\"cancelled\": " << (cancelled ? "true" : "false") << ", "
       << "\"sessions\": " << sessions << ", "
       << "\"aborted_sessions\": " << aborted_sessions << ", "
       << "\"requests\": " << requests << ", "
       << "\"successes\": " << successes << ", "
       << "\"errors\": " << errors << ", "
       << "\"throughput\": " << (elapsed > 0.0 ? requests / elapsed : 0.0) << ", "
       << "\"avg_response_ms\": " << lat.mean_ms << ", "
       << "\"p50_ms\": " << lat.p50_ms << ", "
       << "\"p95_ms\": " << lat.p95_ms << ", "
       << "\"p99_ms\": " << lat.p99_ms << ", "
       << "\"max_ms\": " << lat.max_ms << ", "
       << "\"max_share_deviation\": " << Fairness().max_deviation << ", "
       << "\"endpoint_hits\": ";
    write_json_map(ss, endpoint_hits);
    ss << ", \"server_hits\": ";
    write_json_map(ss, server_hits);
    ss << ", \"profile_sessions\": ";
    write_json_map(ss, profile_sessions);
    ss << ", \"status_codes\": ";
    write_json_map(ss, status_codes);
    ss << "}";
    return ss.str();
}
