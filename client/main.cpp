#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "SignalWatcher.h"
#include "stop_signal.hpp"
#include "traffic_generator.hpp"
#include "utils.h"

namespace {

void print_usage(const char* prog)
{
    std::cerr << "Usage: " << prog << " <target_url> <users> <duration_sec> [profile|mix] [seed]\n"
              << "       " << prog << " <target_url> --scenario <name> [seed]\n"
              << "Profiles: ";
    for (const auto& profile : ProfileRegistry::Default().profiles()) {
        std::cerr << profile->key() << ", ";
    }
    std::cerr << "mix\nScenarios: ";
    for (const auto& scenario : scenarios()) {
        std::cerr << scenario.name << " ";
    }
    std::cerr << "\nExample: " << prog << " http://192.168.2.50:7777 50 300 mix\n"
              << "Example (fixed seed): " << prog << " http://192.168.2.50:7777 20 60 shopper 12345\n"
              << "Environment: TRAFFIC_GEN_LOG (default " << kDefaultLogPath << "), "
              << "TRAFFIC_GEN_RESULTS (default " << kDefaultResultsPath << ")\n";
}

std::string env_or(const char* name, const char* fallback)
{
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : fallback;
}

}

int main(int argc, char* argv[]) {
    if (argc < 3 || argc > 6) {
        print_usage(argv[0]);
        return 1;
    }

    GeneratorConfig config;
    const Scenario* scenario = nullptr;

    try {
        config.target_url = argv[1];
        std::string mode = argv[2];

        if (mode == "--scenario") {
            if (argc < 4 || argc > 5) throw std::invalid_argument("--scenario takes a name and an optional seed");
            scenario = find_scenario(argv[3]);
            if (scenario == nullptr) throw std::invalid_argument(std::string("Unknown scenario: ") + argv[3]);
            if (argc == 5) config.seed = std::stoll(argv[4]);
        } else {
            if (argc < 4) throw std::invalid_argument("Missing duration");
            config.concurrency = std::stoi(argv[2]);
            config.duration_sec = std::stoi(argv[3]);
            if (argc >= 5) config.profile = argv[4];
            if (argc == 6) config.seed = std::stoll(argv[5]);
        }
        if (config.seed < -1) throw std::invalid_argument("Seed must be >= 0");

        // Validates the url, profile and bounds up front, and builds one client
        // so an unusable target fails here instead of in every session.
        config.client_factory = HttplibTargetClient::Factory(config.target_url, config.request_timeout_sec);
        if (scenario == nullptr) {
            TrafficGenerator check(config);
        }
        std::unique_ptr<ITargetClient> first_client = config.client_factory();
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    const std::string log_path = env_or("TRAFFIC_GEN_LOG", kDefaultLogPath);
    const std::string results_path = env_or("TRAFFIC_GEN_RESULTS", kDefaultResultsPath);

    // SIGINT/SIGTERM end the run through the stop signal; a partial summary
    // is still written. A second signal exits at once.
    StopSignal stop;
    SignalWatcher watcher([&stop](int sig, int count) {
        if (sig == 0) {
            return;
        }
        if (count == 1) {
            std::cout << "\n[Agent] received signal " << sig << ", stopping sessions" << std::endl;
            stop.Request();
        } else {
            std::cerr << "[Agent] received signal " << sig << " again, exiting without a summary" << std::endl;
            std::_Exit(128 + sig);
        }
    });

    std::vector<RunSummary> summaries;
    int rc = 0;
    try {
        if (scenario != nullptr) {
            summaries = run_scenario(*scenario, config, &stop);
        } else {
            TrafficGenerator generator(config, &stop);
            summaries.push_back(generator.Run());
        }
    } catch (const std::exception& e) {
        std::cerr << "[Agent] run failed: " << e.what() << std::endl;
        rc = 1;
    }

    watcher.Close();

    for (const auto& summary : summaries) {
        std::cout << summary.Format();
        if (!append_summary_to_log(summary, log_path)) {
            std::cerr << "[Agent] could not write log " << log_path << std::endl;
        }
        if (!append_result_to_file(summary, results_path)) {
            std::cerr << "[Agent] could not write results " << results_path << std::endl;
        }
    }

    std::cout << "Summary written to '" << log_path << "', results appended to '" << results_path << "'\n";
    return rc;
}
