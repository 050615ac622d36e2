#pragma once

// Resource gauges for the current process, read from /proc and getrusage().
struct ProcessStats {
    long long rss_bytes = 0;
    long long virtual_bytes = 0;
    int threads = 0;
    double cpu_user_seconds = 0.0;
    double cpu_system_seconds = 0.0;
};

ProcessStats read_process_stats();
