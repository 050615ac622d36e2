#include "request_tally.hpp"

void RequestTally::Increment(const std::string& instance_id, const std::string& endpoint)
{
    std::lock_guard<std::mutex> lock(mutex_);
    by_instance_[instance_id]++;
    by_endpoint_[endpoint]++;
    total_++;
}

std::vector<RequestTally::Entry> RequestTally::Snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Entry>(by_instance_.begin(), by_instance_.end());
}

std::vector<RequestTally::Entry> RequestTally::EndpointSnapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Entry>(by_endpoint_.begin(), by_endpoint_.end());
}

long long RequestTally::Total() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}
