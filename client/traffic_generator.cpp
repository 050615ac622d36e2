#include "traffic_generator.hpp"

#include <algorithm>
#include <functional>
#include <iostream>
#include <random>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace {

constexpr std::chrono::milliseconds kAbortedSessionBackoff(100);

}

TrafficGenerator::TrafficGenerator(GeneratorConfig config, StopSignal* stop)
    : config_(std::move(config)),
      registry_(config_.registry != nullptr ? config_.registry : &ProfileRegistry::Default()),
      stop_(stop != nullptr ? stop : &own_stop_)
{
    if (config_.concurrency <= 0) {
        throw std::invalid_argument("Concurrency must be > 0");
    }
    if (config_.duration_sec < 0) {
        throw std::invalid_argument("Duration must be >= 0");
    }
    if (config_.request_timeout_sec <= 0) {
        throw std::invalid_argument("Request timeout must be > 0");
    }
    if (config_.profile != "mix") {
        fixed_profile_ = registry_->Find(config_.profile);
        if (!fixed_profile_) {
            throw std::invalid_argument("Unknown profile: " + config_.profile);
        }
    }
    if (!config_.client_factory) {
        config_.client_factory = HttplibTargetClient::Factory(config_.target_url, config_.request_timeout_sec);
    }
    if (config_.label.empty()) {
        config_.label = config_.profile;
    }
}

ProfilePtr TrafficGenerator::PickProfile(std::mt19937& gen) const
{
    return fixed_profile_ ? fixed_profile_ : registry_->PickMixed(gen);
}

RunSummary TrafficGenerator::Run()
{
    RunSummary summary;
    summary.label = config_.label;
    summary.concurrency = config_.concurrency;
    summary.planned_duration_sec = config_.duration_sec;
    next_session_.store(0);

    std::cout << "[Agent] Starting traffic generation\n"
              << "   Target:    " << config_.target_url << "\n"
              << "   Users:     " << config_.concurrency << "\n"
              << "   Duration:  " << config_.duration_sec << " seconds\n"
              << "   Profile:   " << config_.profile << "\n";
    if (config_.seed >= 0) {
        std::cout << "   Seed:      " << config_.seed << " (session i uses seed + i)\n" << std::endl;
    } else {
        std::cout << "   Seed:      Random\n" << std::endl;
    }

    summary.started = std::chrono::system_clock::now();
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config_.duration_sec);

    std::vector<std::thread> threads;
    threads.reserve(static_cast<std::size_t>(config_.concurrency));
    try {
        for (int i = 0; i < config_.concurrency; ++i) {
            threads.emplace_back(&TrafficGenerator::Worker, this, deadline, std::ref(summary));
        }
    } catch (const std::system_error& e) {
        std::cerr << "[Agent] could only start " << threads.size() << " of " << config_.concurrency
                  << " workers: " << e.what() << std::endl;
    }

    for (auto& t : threads) t.join();

    summary.finished = std::chrono::system_clock::now();
    summary.cancelled = stop_->Requested();

    std::cout << "[Agent] " << (summary.cancelled ? "Stopped" : "Finished") << " after "
              << summary.sessions << " sessions, " << summary.requests << " requests";
    if (summary.aborted_sessions > 0) {
        std::cout << ", " << summary.aborted_sessions << " sessions aborted";
    }
    std::cout << std::endl;
    return summary;
}

void TrafficGenerator::Worker(std::chrono::steady_clock::time_point deadline, RunSummary& summary)
{
    SessionBounds bounds;
    bounds.run_deadline = deadline;
    bounds.stop = stop_;

    while (std::chrono::steady_clock::now() < deadline && !stop_->Requested()) {
        const long long session_index = next_session_.fetch_add(1);

        std::mt19937 gen;
        if (config_.seed < 0) {
            gen.seed(std::random_device{}());
        } else {
            gen.seed(static_cast<std::mt19937::result_type>(config_.seed + session_index));
        }

        SessionResult result;
        try {
            std::unique_ptr<ITargetClient> client = config_.client_factory();
            result = RunSession(*PickProfile(gen), *client, gen, bounds);
        } catch (const std::exception& e) {
            std::cerr << "[Agent] session " << session_index << " aborted: " << e.what() << std::endl;
            {
                std::lock_guard<std::mutex> lock(summary_mutex_);
                summary.aborted_sessions++;
            }
            // The worker stays in the pool; it backs off briefly and starts the next session.
            const std::chrono::steady_clock::time_point retry = std::chrono::steady_clock::now() + kAbortedSessionBackoff;
            stop_->WaitUntil(std::min(retry, deadline));
            continue;
        }

        std::lock_guard<std::mutex> lock(summary_mutex_);
        summary.Merge(result);
    }
}

const std::vector<Scenario>& scenarios()
{
    static const std::vector<Scenario> all = {
        {"normal", "Normal day traffic", {{50, 600}}},
        {"flash-sale", "Flash sale burst", {{150, 300}}},
        {"gradual-ramp", "Gradual ramp up", {{20, 30}, {40, 30}, {60, 30}, {80, 30}, {100, 30}}},
        {"stress", "High load stress test", {{200, 180}}},
    };
    return all;
}

const Scenario* find_scenario(const std::string& name)
{
    for (const auto& scenario : scenarios()) {
        if (scenario.name == name) {
            return &scenario;
        }
    }
    return nullptr;
}

std::vector<RunSummary> run_scenario(const Scenario& scenario, const GeneratorConfig& base, StopSignal* stop)
{
    std::vector<RunSummary> summaries;
    std::cout << "[Agent] Scenario: " << scenario.description << std::endl;

    for (std::size_t i = 0; i < scenario.stages.size(); ++i) {
        const ScenarioStage& stage = scenario.stages[i];
        if (stop != nullptr && stop->Requested()) {
            break;
        }

        GeneratorConfig config = base;
        config.concurrency = stage.users;
        config.duration_sec = stage.duration_sec;
        config.label = scenario.name;
        if (scenario.stages.size() > 1) {
            config.label += "/stage" + std::to_string(i + 1);
            std::cout << "   Stage " << i + 1 << ": " << stage.users << " concurrent users for "
                      << stage.duration_sec << "s" << std::endl;
        }

        TrafficGenerator generator(config, stop);
        summaries.push_back(generator.Run());
    }
    return summaries;
}
