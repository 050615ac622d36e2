#pragma once

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Thread-safe request counters keyed by serving instance and endpoint.
 *
 * One tally is created by the server at startup and injected into every
 * component that records requests. Counters only ever grow; the sum of the
 * per-instance counts always equals Total().
 */
class RequestTally {
public:
    using Entry = std::pair<std::string, long long>;

    RequestTally() = default;

    RequestTally(const RequestTally&) = delete;
    RequestTally& operator=(const RequestTally&) = delete;

    /**
     * @brief Counts one request served by `instance_id` on `endpoint`.
     */
    void Increment(const std::string& instance_id, const std::string& endpoint);

    // Per-instance counts ordered by instance id.
    std::vector<Entry> Snapshot() const;

    // Per-endpoint counts ordered by endpoint name.
    std::vector<Entry> EndpointSnapshot() const;

    long long Total() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, long long> by_instance_;
    std::map<std::string, long long> by_endpoint_;
    long long total_ = 0;
};
