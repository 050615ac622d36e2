#include <algorithm>
#include <chrono>
#include <httplib.h>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>

#include "fairness.hpp"
#include "target_client.hpp"

// Polls the tally of whichever replica the load balancer routes each request
// to, keeping the newest count seen per instance.
int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 4) {
        std::cerr << "Usage: " << argv[0] << " <target_url> [polls] [interval_ms]\n"
                  << "Example: " << argv[0] << " http://192.168.2.50:7777 30 200\n";
        return 1;
    }

    std::string base;
    int polls = 20;
    int interval_ms = 100;
    try {
        base = normalize_base_url(argv[1]);
        if (argc > 2) polls = std::stoi(argv[2]);
        if (argc > 3) interval_ms = std::stoi(argv[3]);
        if (polls <= 0) throw std::invalid_argument("polls must be > 0");
        if (interval_ms < 0) throw std::invalid_argument("interval_ms must be >= 0");
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        return 1;
    }

    httplib::Client cli(base);
    cli.set_connection_timeout(5);
    cli.set_read_timeout(5);
    // A fresh connection per poll lets the balancer pick a new replica.
    cli.set_keep_alive(false);

    std::map<std::string, long long> latest;
    int answered = 0;
    for (int i = 0; i < polls; ++i) {
        auto res = cli.Get("/metrics?format=text");
        if (!res) {
            std::cerr << "[Fairness] poll " << i + 1 << " failed: " << httplib::to_string(res.error()) << std::endl;
        } else if (res->status != 200) {
            std::cerr << "[Fairness] poll " << i + 1 << " returned HTTP " << res->status << std::endl;
        } else {
            answered++;
            for (const auto& entry : ParseInstanceCounts(res->body)) {
                long long& count = latest[entry.first];
                count = std::max(count, entry.second);
            }
        }
        if (i + 1 < polls) {
            std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
        }
    }

    if (answered == 0) {
        std::cerr << "[Fairness] no replica answered at " << base << std::endl;
        return 1;
    }

    std::cout << "\n--- Fairness Report (" << answered << "/" << polls << " polls answered) ---\n"
              << FormatFairness(ComputeFairness(latest));
    return 0;
}
