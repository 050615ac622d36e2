#include <csignal>
#include <iostream>
#include <pthread.h>
#include <string>

#include "SignalWatcher.h"
#include "TrafficHeaders.h"
#include "fairness_recorder.hpp"
#include "request_tally.hpp"
#include "saturation_controller.hpp"
#include "stress_server.hpp"

int main(int argc, char* argv[])
{
    if (argc < 2 || argc > 5) {
        std::cerr << "Usage: " << argv[0]
                  << " <port> [threads] [instance_id] [max_memory_mb]\n"
                  << "Example: " << argv[0] << " " << kDefaultServerPort << " 64\n";
        return 1;
    }

    int port;
    int num_threads = 32;
    std::string instance_arg;
    SaturationLimits limits = SaturationLimits::Defaults();

    try {
        port = std::stoi(argv[1]);
        if (argc > 2) num_threads = std::stoi(argv[2]);
        if (argc > 3) instance_arg = argv[3];
        if (argc > 4) limits.max_memory_mb = std::stoi(argv[4]);

        if (port <= 0 || port > 65535) throw std::invalid_argument("port out of range");
        if (num_threads <= 0) throw std::invalid_argument("threads must be > 0");
        if (limits.max_memory_mb < 0) throw std::invalid_argument("max_memory_mb must be >= 0");
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        return 1;
    }

    // Blocked before any other thread exists; every thread created below
    // inherits the mask.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    RequestTally tally;
    SaturationController saturation(limits);
    StressServer svr(tally, saturation, FairnessRecorder::ResolveInstanceId(instance_arg), num_threads);

    // Stop() has no effect until the listener is running, so after the first
    // signal it is repeated on every tick until Listen returns.
    SignalWatcher watcher([&svr](int sig, int) {
        if (sig > 0) {
            std::cout << "[Server] received signal " << sig << ", stopping" << std::endl;
        }
        svr.Stop();
    });

    int rc = svr.Listen(port);

    watcher.Close();
    saturation.Shutdown();

    std::cout << "[Server] served " << tally.Total() << " tracked requests" << std::endl;
    return rc == 0 ? 0 : 1;
}
