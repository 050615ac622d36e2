#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "run_summary.hpp"
#include "session_profile.hpp"
#include "stop_signal.hpp"
#include "target_client.hpp"

/**
 * @brief Settings for one traffic run.
 */
struct GeneratorConfig {
    std::string target_url;
    int concurrency = 50;
    int duration_sec = 300;
    std::string profile = "mix";  // a profile key, or "mix" to draw per session
    long long seed = -1;          // -1 seeds every session from random_device
    int request_timeout_sec = 10;
    std::string label;            // defaults to `profile`

    // Builds the client each session uses. Defaults to HttplibTargetClient.
    TargetClientFactory client_factory;
    // Defaults to ProfileRegistry::Default().
    const ProfileRegistry* registry = nullptr;
};

/**
 * @brief Keeps `concurrency` user sessions active until the window closes.
 *
 * Each of the `concurrency` worker threads runs sessions back to back. Once
 * the deadline passes or a stop is requested no new session or request
 * starts; requests already in flight finish within the request timeout.
 */
class TrafficGenerator {
public:
    /**
     * @param stop external cancellation; when null the generator owns one
     * reachable through Stop().
     * @throws std::invalid_argument for a non-positive concurrency, a
     * negative duration, or an unknown profile.
     */
    explicit TrafficGenerator(GeneratorConfig config, StopSignal* stop = nullptr);

    TrafficGenerator(const TrafficGenerator&) = delete;
    TrafficGenerator& operator=(const TrafficGenerator&) = delete;

    RunSummary Run();

    void Stop() { stop_->Request(); }

    const GeneratorConfig& config() const { return config_; }

    // Sessions started so far in the current run.
    long long SessionsStarted() const { return next_session_.load(); }

private:
    void Worker(std::chrono::steady_clock::time_point deadline, RunSummary& summary);
    ProfilePtr PickProfile(std::mt19937& gen) const;

    GeneratorConfig config_;
    const ProfileRegistry* registry_;
    ProfilePtr fixed_profile_;
    StopSignal own_stop_;
    StopSignal* stop_;
    std::mutex summary_mutex_;
    std::atomic<long long> next_session_{0};
};

struct ScenarioStage {
    int users;
    int duration_sec;
};

/**
 * @brief A named traffic shape: one or more stages run back to back.
 */
struct Scenario {
    std::string name;
    std::string description;
    std::vector<ScenarioStage> stages;
};

// normal, flash-sale, gradual-ramp, stress.
const std::vector<Scenario>& scenarios();

// nullptr when no scenario has that name.
const Scenario* find_scenario(const std::string& name);

/**
 * @brief Runs every stage of `scenario` with `base` for everything except
 * concurrency and duration. Returns one summary per stage that ran; a stop
 * ends the current stage and skips the rest.
 */
std::vector<RunSummary> run_scenario(const Scenario& scenario, const GeneratorConfig& base,
                                     StopSignal* stop = nullptr);
