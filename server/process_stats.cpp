#include "process_stats.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <sys/resource.h>
#include <unistd.h>

ProcessStats read_process_stats()
{
    ProcessStats stats;

    // statm: size resident shared text lib data dt (in pages)
    std::ifstream statm("/proc/self/statm");
    if (statm.good()) {
        long long size_pages = 0;
        long long resident_pages = 0;
        if (statm >> size_pages >> resident_pages) {
            long page = sysconf(_SC_PAGESIZE);
            stats.virtual_bytes = size_pages * page;
            stats.rss_bytes = resident_pages * page;
        }
    }

    std::ifstream status("/proc/self/status");
    std::string line;
    while (std::getline(status, line)) {
        if (line.rfind("Threads:", 0) == 0) {
            std::istringstream ss(line.substr(8));
            ss >> stats.threads;
            break;
        }
    }

    struct rusage usage;
    if (getrusage(RUSAGE_SELF, &usage) == 0) {
        stats.cpu_user_seconds = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec / 1e6;
        stats.cpu_system_seconds = usage.ru_stime.tv_sec + usage.ru_stime.tv_usec / 1e6;
    }
    return stats;
}
