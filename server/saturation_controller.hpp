#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

// Largest single write used when streaming a network payload.
constexpr int kMaxNetworkChunkKb = 4096;

/**
 * @brief Ceilings applied to every saturation request before anything runs.
 */
struct SaturationLimits {
    int max_cpu_workers = 16;
    int max_duration_seconds = 3600;
    int max_memory_mb = 4096;      // across all active memory jobs
    int max_network_mb = 1024;     // per response
    int max_active_jobs = 64;

    // Worker ceiling scaled to this machine (4 per hardware thread).
    static SaturationLimits Defaults();
};

/**
 * @brief What one saturation job should consume.
 */
struct SaturationRequest {
    bool cpu = false;
    int cpu_seconds = 0;
    int cpu_workers = 0;

    bool memory = false;
    int memory_mb = 0;
    int memory_hold_seconds = 0;
};

enum class SaturationKind { Cpu, Memory, CpuMemory };

std::string to_string(SaturationKind kind);

/**
 * @brief Acknowledgment handed back to the caller once a job is running.
 */
struct JobTicket {
    long long id = 0;
    SaturationKind kind = SaturationKind::Cpu;
    int duration_seconds = 0;   // until the last resource is released
    int cpu_workers = 0;
    int memory_mb = 0;
};

struct SaturationStats {
    long long active_jobs = 0;
    long long active_cpu_workers = 0;
    long long bytes_held = 0;
    long long jobs_accepted = 0;
    long long jobs_completed = 0;
    long long jobs_failed = 0;
    long long jobs_rejected = 0;
    long long cpu_iterations = 0;
    long long network_bytes_sent = 0;
};

/**
 * @brief Thrown when a valid request cannot run right now (capacity, shutdown).
 */
class JobRejected : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Runs bounded CPU and memory consumption jobs in the background.
 *
 * Submit() validates synchronously and throws std::invalid_argument for
 * degenerate parameters before allocating anything. Accepted jobs run on
 * their own threads and release every buffer and worker at their deadline,
 * on allocation failure, or when Shutdown() is called (the destructor calls
 * it). Network saturation is streamed by the caller; the controller only
 * validates its size and counts the bytes.
 */
class SaturationController {
public:
    explicit SaturationController(SaturationLimits limits = SaturationLimits::Defaults());
    ~SaturationController();

    SaturationController(const SaturationController&) = delete;
    SaturationController& operator=(const SaturationController&) = delete;

    JobTicket SubmitCpu(int duration_seconds, int workers);
    JobTicket SubmitMemory(int megabytes, int hold_seconds);

    // CPU and memory over one window: memory is held for the CPU duration.
    JobTicket SubmitCpuMemory(int cpu_seconds, int memory_mb, int workers);

    JobTicket Submit(const SaturationRequest& request);

    /**
     * @brief Checks a network payload request against the configured ceiling.
     * @throws std::invalid_argument when the size or chunk is out of range.
     */
    void ValidateNetwork(int megabytes, int chunk_kb) const;

    void RecordNetworkBytes(std::size_t bytes);

    SaturationStats Stats() const;

    // Blocks until no job is running or the timeout passes.
    bool WaitIdle(std::chrono::milliseconds timeout);

    // Stops every worker, releases every buffer and joins all job threads.
    void Shutdown();

    const SaturationLimits& Limits() const { return limits_; }

private:
    using Clock = std::chrono::steady_clock;
    struct Job;

    void Validate(const SaturationRequest& request) const;
    void Execute(Job* job);
    void SpinCpu(Job* job);
    void HoldMemory(Job* job);
    void ReapFinishedLocked();

    const SaturationLimits limits_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stopping_{false};
    std::list<std::unique_ptr<Job>> jobs_;
    long long next_id_ = 1;
    long long reserved_mb_ = 0;

    std::atomic<long long> active_jobs_{0};
    std::atomic<long long> active_cpu_workers_{0};
    std::atomic<long long> bytes_held_{0};
    std::atomic<long long> jobs_accepted_{0};
    std::atomic<long long> jobs_completed_{0};
    std::atomic<long long> jobs_failed_{0};
    std::atomic<long long> jobs_rejected_{0};
    std::atomic<long long> cpu_iterations_{0};
    std::atomic<long long> network_bytes_sent_{0};
};
