#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "request_tally.hpp"

TEST(RequestTallyTest, CountsPerInstanceAndEndpoint) {
    RequestTally tally;
    tally.Increment("node-b", "homepage");
    tally.Increment("node-a", "homepage");
    tally.Increment("node-a", "product");

    auto instances = tally.Snapshot();
    ASSERT_EQ(instances.size(), 2u);
    EXPECT_EQ(instances[0], RequestTally::Entry("node-a", 2));
    EXPECT_EQ(instances[1], RequestTally::Entry("node-b", 1));

    auto endpoints = tally.EndpointSnapshot();
    ASSERT_EQ(endpoints.size(), 2u);
    EXPECT_EQ(endpoints[0], RequestTally::Entry("homepage", 2));
    EXPECT_EQ(endpoints[1], RequestTally::Entry("product", 1));

    EXPECT_EQ(tally.Total(), 3);
}

TEST(RequestTallyTest, ConcurrentIncrementsMatchSequentialTotals) {
    RequestTally concurrent;
    RequestTally sequential;
    const int threads = 8;
    const int per_thread = 5000;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&concurrent, t]() {
            std::string id = "node-" + std::to_string(t % 3);
            for (int i = 0; i < per_thread; ++i) {
                concurrent.Increment(id, i % 2 == 0 ? "homepage" : "api_data");
            }
        });
    }
    for (auto& w : workers) w.join();

    for (int t = 0; t < threads; ++t) {
        std::string id = "node-" + std::to_string(t % 3);
        for (int i = 0; i < per_thread; ++i) {
            sequential.Increment(id, i % 2 == 0 ? "homepage" : "api_data");
        }
    }

    EXPECT_EQ(concurrent.Total(), static_cast<long long>(threads) * per_thread);
    EXPECT_EQ(concurrent.Snapshot(), sequential.Snapshot());
    EXPECT_EQ(concurrent.EndpointSnapshot(), sequential.EndpointSnapshot());

    long long sum = 0;
    for (const auto& entry : concurrent.Snapshot()) sum += entry.second;
    EXPECT_EQ(sum, concurrent.Total());
}
