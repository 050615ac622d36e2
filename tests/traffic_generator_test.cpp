#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <thread>

#include "fake_target_client.hpp"
#include "traffic_generator.hpp"

namespace {

class TrafficGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        quick_ = std::make_shared<const SessionProfile>(
            "quick", "Quick", Range<double>{60, 60}, Range<int>{3, 3}, Range<double>{0.01, 0.01},
            std::vector<std::pair<std::string, double>>{{"/", 0.5}, {"/api/data", 0.5}});
        slow_ = std::make_shared<const SessionProfile>(
            "slow", "Slow", Range<double>{600, 600}, Range<int>{50, 50}, Range<double>{300, 300},
            std::vector<std::pair<std::string, double>>{{"/dashboard", 1.0}});
        registry_ = std::make_unique<ProfileRegistry>(std::vector<ProfilePtr>{quick_, slow_},
                                                      std::vector<double>{1.0, 0.0});
    }

    GeneratorConfig Config(const std::string& profile, int users, int duration_sec) {
        GeneratorConfig config;
        config.target_url = "http://127.0.0.1:1";
        config.concurrency = users;
        config.duration_sec = duration_sec;
        config.profile = profile;
        config.seed = 7;
        config.registry = registry_.get();
        config.client_factory = FakeTargetClient::Factory(target_);
        return config;
    }

    FakeTarget target_;
    ProfilePtr quick_;
    ProfilePtr slow_;
    std::unique_ptr<ProfileRegistry> registry_;
};

}

TEST_F(TrafficGeneratorTest, RunsSessionsUntilTheWindowCloses) {
    TrafficGenerator generator(Config("quick", 4, 1));

    auto start = std::chrono::steady_clock::now();
    RunSummary summary = generator.Run();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, std::chrono::milliseconds(950));
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_FALSE(summary.cancelled);
    EXPECT_EQ(summary.label, "quick");
    EXPECT_EQ(summary.concurrency, 4);
    // Each session takes about 20 ms, so every worker cycles many times.
    EXPECT_GT(summary.sessions, 4);
    EXPECT_EQ(summary.requests, static_cast<long long>(target_.RequestCount()));
    EXPECT_EQ(summary.successes, summary.requests);
    EXPECT_EQ(summary.profile_sessions.at("quick"), summary.sessions);
    EXPECT_EQ(summary.server_hits.at("fake-1"), summary.requests);
    EXPECT_EQ(target_.clients_created.load(), generator.SessionsStarted());
}

TEST_F(TrafficGeneratorTest, FailedSessionStartsDoNotShrinkTheWorkerPool) {
    target_.factory_failures = 2;
    TrafficGenerator generator(Config("quick", 2, 1));

    auto start = std::chrono::steady_clock::now();
    RunSummary summary = generator.Run();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, std::chrono::milliseconds(950));
    EXPECT_EQ(summary.aborted_sessions, 2);
    EXPECT_GT(summary.sessions, 2);
    EXPECT_EQ(summary.sessions + summary.aborted_sessions, generator.SessionsStarted());
    EXPECT_EQ(summary.requests, static_cast<long long>(target_.RequestCount()));
    EXPECT_NE(summary.Format().find("Aborted Sessions:    2"), std::string::npos);
}

TEST_F(TrafficGeneratorTest, MixDrawsOnlyWeightedProfiles) {
    TrafficGenerator generator(Config("mix", 3, 1));
    RunSummary summary = generator.Run();

    EXPECT_GT(summary.sessions, 0);
    EXPECT_EQ(summary.profile_sessions.count("slow"), 0u);
    EXPECT_EQ(summary.profile_sessions.at("quick"), summary.sessions);
}

TEST_F(TrafficGeneratorTest, StopEndsThinkingSessionsImmediately) {
    TrafficGenerator generator(Config("slow", 5, 600));

    std::thread stopper([&generator]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        generator.Stop();
    });

    auto start = std::chrono::steady_clock::now();
    RunSummary summary = generator.Run();
    auto elapsed = std::chrono::steady_clock::now() - start;
    stopper.join();

    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_TRUE(summary.cancelled);
    // Five workers, one session each, one request before the long think.
    EXPECT_EQ(summary.sessions, 5);
    EXPECT_EQ(summary.requests, 5);
}

TEST_F(TrafficGeneratorTest, ZeroDurationStartsNoSession) {
    TrafficGenerator generator(Config("quick", 3, 0));
    RunSummary summary = generator.Run();

    EXPECT_EQ(summary.sessions, 0);
    EXPECT_EQ(summary.requests, 0);
    EXPECT_EQ(target_.RequestCount(), 0u);
}

TEST_F(TrafficGeneratorTest, RejectsBadConfiguration) {
    EXPECT_THROW(TrafficGenerator(Config("quick", 0, 1)), std::invalid_argument);
    EXPECT_THROW(TrafficGenerator(Config("quick", 2, -1)), std::invalid_argument);
    EXPECT_THROW(TrafficGenerator(Config("nobody", 2, 1)), std::invalid_argument);
}

TEST_F(TrafficGeneratorTest, DefaultRegistryKnowsEveryProfile) {
    GeneratorConfig config = Config("bot", 1, 0);
    config.registry = nullptr;
    EXPECT_NO_THROW(TrafficGenerator{config});
}

TEST(ScenarioTest, CatalogMatchesPresets) {
    ASSERT_EQ(scenarios().size(), 4u);

    const Scenario* normal = find_scenario("normal");
    ASSERT_NE(normal, nullptr);
    ASSERT_EQ(normal->stages.size(), 1u);
    EXPECT_EQ(normal->stages[0].users, 50);
    EXPECT_EQ(normal->stages[0].duration_sec, 600);

    const Scenario* ramp = find_scenario("gradual-ramp");
    ASSERT_NE(ramp, nullptr);
    ASSERT_EQ(ramp->stages.size(), 5u);
    for (std::size_t i = 0; i < ramp->stages.size(); ++i) {
        EXPECT_EQ(ramp->stages[i].users, 20 * static_cast<int>(i + 1));
        EXPECT_EQ(ramp->stages[i].duration_sec, 30);
    }

    EXPECT_EQ(find_scenario("flash-sale")->stages[0].users, 150);
    EXPECT_EQ(find_scenario("stress")->stages[0].users, 200);
    EXPECT_EQ(find_scenario("unknown"), nullptr);
}

TEST(ScenarioTest, RunsEachStageWithItsOwnSummary) {
    FakeTarget target;
    auto profile = std::make_shared<const SessionProfile>(
        "quick", "Quick", Range<double>{60, 60}, Range<int>{2, 2}, Range<double>{0.01, 0.01},
        std::vector<std::pair<std::string, double>>{{"/", 1.0}});
    ProfileRegistry registry({profile}, {1.0});

    Scenario scenario{"tiny-ramp", "Tiny ramp", {{1, 0}, {2, 0}}};
    GeneratorConfig base;
    base.target_url = "http://127.0.0.1:1";
    base.registry = &registry;
    base.client_factory = FakeTargetClient::Factory(target);

    std::vector<RunSummary> summaries = run_scenario(scenario, base);

    ASSERT_EQ(summaries.size(), 2u);
    EXPECT_EQ(summaries[0].label, "tiny-ramp/stage1");
    EXPECT_EQ(summaries[0].concurrency, 1);
    EXPECT_EQ(summaries[1].label, "tiny-ramp/stage2");
    EXPECT_EQ(summaries[1].concurrency, 2);
}

TEST(ScenarioTest, StopSkipsRemainingStages) {
    Scenario scenario{"never", "Never runs", {{1, 0}, {1, 0}}};
    GeneratorConfig base;
    base.target_url = "http://127.0.0.1:1";
    StopSignal stop;
    stop.Request();

    EXPECT_TRUE(run_scenario(scenario, base, &stop).empty());
}
