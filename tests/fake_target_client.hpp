#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "target_client.hpp"

/**
 * @brief Shared log of the requests issued through FakeTargetClient.
 */
struct FakeTarget {
    std::mutex mutex;
    std::vector<std::string> paths;
    std::atomic<int> clients_created{0};

    // Every n-th request (1-based) fails when non-zero.
    int fail_every = 0;
    // The factory throws this many times before it starts handing out clients.
    std::atomic<int> factory_failures{0};
    std::string server_id = "fake-1";

    std::size_t RequestCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return paths.size();
    }
};

class FakeTargetClient : public ITargetClient {
public:
    explicit FakeTargetClient(FakeTarget& target) : target_(target) {}

    RequestOutcome Get(const std::string& path) override {
        std::size_t n;
        {
            std::lock_guard<std::mutex> lock(target_.mutex);
            target_.paths.push_back(path);
            n = target_.paths.size();
        }
        RequestOutcome outcome;
        outcome.latency = std::chrono::microseconds(1500);
        if (target_.fail_every > 0 && n % static_cast<std::size_t>(target_.fail_every) == 0) {
            outcome.status = 503;
            return outcome;
        }
        outcome.ok = true;
        outcome.status = 200;
        outcome.server_id = target_.server_id;
        return outcome;
    }

    static TargetClientFactory Factory(FakeTarget& target) {
        return [&target]() -> std::unique_ptr<ITargetClient> {
            if (target.factory_failures.fetch_sub(1) > 0) {
                throw std::runtime_error("connection setup failed");
            }
            target.clients_created++;
            return std::make_unique<FakeTargetClient>(target);
        };
    }

private:
    FakeTarget& target_;
};
