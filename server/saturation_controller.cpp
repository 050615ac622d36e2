#include "saturation_controller.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <new>
#include <random>
#include <system_error>
#include <vector>

#include <sys/mman.h>

namespace {

constexpr std::size_t kChunkBytes = 64ULL * 1024 * 1024;
constexpr std::size_t kPageBytes = 4096;
constexpr int kSpinBatch = 10000;

/**
 * @brief One anonymous mapping; its pages return to the kernel on destruction.
 */
class MappedChunk {
public:
    explicit MappedChunk(std::size_t bytes) : size_(bytes)
    {
        void* p = mmap(nullptr, bytes, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
        if (p == MAP_FAILED) {
            throw std::bad_alloc();
        }
        data_ = static_cast<char*>(p);
    }

    ~MappedChunk()
    {
        if (data_ != nullptr) {
            munmap(data_, size_);
        }
    }

    MappedChunk(const MappedChunk&) = delete;
    MappedChunk& operator=(const MappedChunk&) = delete;

    char* data() const { return data_; }
    std::size_t size() const { return size_; }

private:
    char* data_ = nullptr;
    std::size_t size_;
};

/**
 * @brief Owns the chunks of one memory job and keeps the held-bytes gauge honest.
 *
 * Every byte added to the gauge is removed again by Release(), which the
 * destructor calls.
 */
class MemoryBlock {
public:
    explicit MemoryBlock(std::atomic<long long>& gauge) : gauge_(gauge) {}

    ~MemoryBlock() { Release(); }

    MemoryBlock(const MemoryBlock&) = delete;
    MemoryBlock& operator=(const MemoryBlock&) = delete;

    // Maps and touches `bytes`, one page at a time so it is resident.
    void Grow(std::size_t bytes)
    {
        std::unique_ptr<MappedChunk> chunk(new MappedChunk(bytes));
        char* data = chunk->data();
        for (std::size_t off = 0; off < bytes; off += kPageBytes) {
            data[off] = static_cast<char>((off / kPageBytes) & 0x7F);
        }
        data[bytes - 1] = 1;
        chunks_.push_back(std::move(chunk));
        held_ += static_cast<long long>(bytes);
        gauge_ += static_cast<long long>(bytes);
    }

    // Reads back one byte per page; keeps the allocation observable.
    long long Checksum() const
    {
        long long sum = 0;
        for (const auto& chunk : chunks_) {
            for (std::size_t off = 0; off < chunk->size(); off += kPageBytes) {
                sum += chunk->data()[off];
            }
        }
        return sum;
    }

    void Release()
    {
        chunks_.clear();
        gauge_ -= held_;
        held_ = 0;
    }

    long long held() const { return held_; }

private:
    std::atomic<long long>& gauge_;
    std::vector<std::unique_ptr<MappedChunk>> chunks_;
    long long held_ = 0;
};

}

std::string to_string(SaturationKind kind)
{
    switch (kind) {
        case SaturationKind::Cpu: return "cpu";
        case SaturationKind::Memory: return "memory";
        case SaturationKind::CpuMemory: return "cpu-memory";
    }
    return "unknown";
}

SaturationLimits SaturationLimits::Defaults()
{
    SaturationLimits limits;
    unsigned hw = std::thread::hardware_concurrency();
    limits.max_cpu_workers = static_cast<int>(std::max(1u, hw)) * 4;
    return limits;
}

struct SaturationController::Job {
    long long id = 0;
    SaturationRequest request;
    SaturationKind kind = SaturationKind::Cpu;
    Clock::time_point cpu_deadline;
    Clock::time_point memory_deadline;

    std::atomic<bool> abort{false};
    std::atomic<bool> finished{false};
    std::atomic<long long> iterations{0};
    bool failed = false;
    std::thread runner;
};

SaturationController::SaturationController(SaturationLimits limits)
    : limits_(limits)
{
}

SaturationController::~SaturationController()
{
    Shutdown();
}

JobTicket SaturationController::SubmitCpu(int duration_seconds, int workers)
{
    SaturationRequest request;
    request.cpu = true;
    request.cpu_seconds = duration_seconds;
    request.cpu_workers = workers;
    return Submit(request);
}

JobTicket SaturationController::SubmitMemory(int megabytes, int hold_seconds)
{
    SaturationRequest request;
    request.memory = true;
    request.memory_mb = megabytes;
    request.memory_hold_seconds = hold_seconds;
    return Submit(request);
}

JobTicket SaturationController::SubmitCpuMemory(int cpu_seconds, int memory_mb, int workers)
{
    SaturationRequest request;
    request.cpu = true;
    request.cpu_seconds = cpu_seconds;
    request.cpu_workers = workers;
    request.memory = true;
    request.memory_mb = memory_mb;
    request.memory_hold_seconds = cpu_seconds;
    return Submit(request);
}

void SaturationController::Validate(const SaturationRequest& request) const
{
    if (!request.cpu && !request.memory) {
        throw std::invalid_argument("Select at least one resource (cpu, memory)");
    }
    if (request.cpu) {
        if (request.cpu_seconds < 0) {
            throw std::invalid_argument("CPU duration must be >= 0 seconds");
        }
        if (request.cpu_seconds > limits_.max_duration_seconds) {
            throw std::invalid_argument("CPU duration exceeds the limit of " +
                                        std::to_string(limits_.max_duration_seconds) + " seconds");
        }
        if (request.cpu_workers <= 0) {
            throw std::invalid_argument("CPU workers must be > 0");
        }
        if (request.cpu_workers > limits_.max_cpu_workers) {
            throw std::invalid_argument("CPU workers exceed the limit of " +
                                        std::to_string(limits_.max_cpu_workers));
        }
    }
    if (request.memory) {
        if (request.memory_mb < 0) {
            throw std::invalid_argument("Memory size must be >= 0 MB");
        }
        if (request.memory_mb > limits_.max_memory_mb) {
            throw std::invalid_argument("Memory size exceeds the limit of " +
                                        std::to_string(limits_.max_memory_mb) + " MB");
        }
        if (request.memory_hold_seconds < 0) {
            throw std::invalid_argument("Memory hold must be >= 0 seconds");
        }
        if (request.memory_hold_seconds > limits_.max_duration_seconds) {
            throw std::invalid_argument("Memory hold exceeds the limit of " +
                                        std::to_string(limits_.max_duration_seconds) + " seconds");
        }
    }
}

void SaturationController::ValidateNetwork(int megabytes, int chunk_kb) const
{
    if (megabytes < 0) {
        throw std::invalid_argument("Network payload must be >= 0 MB");
    }
    if (megabytes > limits_.max_network_mb) {
        throw std::invalid_argument("Network payload exceeds the limit of " +
                                    std::to_string(limits_.max_network_mb) + " MB");
    }
    if (chunk_kb <= 0 || chunk_kb > kMaxNetworkChunkKb) {
        throw std::invalid_argument("Network chunk must be between 1 and " +
                                    std::to_string(kMaxNetworkChunkKb) + " KB");
    }
}

JobTicket SaturationController::Submit(const SaturationRequest& request)
{
    try {
        Validate(request);
    } catch (const std::invalid_argument&) {
        jobs_rejected_++;
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
        jobs_rejected_++;
        throw JobRejected("Saturation controller is shutting down");
    }

    ReapFinishedLocked();
    if (static_cast<long long>(jobs_.size()) >= limits_.max_active_jobs) {
        jobs_rejected_++;
        throw JobRejected("Too many active saturation jobs (limit " +
                          std::to_string(limits_.max_active_jobs) + ")");
    }
    long long wanted_mb = request.memory ? request.memory_mb : 0;
    if (reserved_mb_ + wanted_mb > limits_.max_memory_mb) {
        jobs_rejected_++;
        throw JobRejected("Memory already reserved by active jobs: " +
                          std::to_string(reserved_mb_) + " MB of " +
                          std::to_string(limits_.max_memory_mb) + " MB");
    }

    auto job = std::make_unique<Job>();
    job->id = next_id_++;
    job->request = request;
    job->kind = request.cpu && request.memory ? SaturationKind::CpuMemory
              : request.cpu ? SaturationKind::Cpu : SaturationKind::Memory;
    auto start = Clock::now();
    job->cpu_deadline = start + std::chrono::seconds(request.cpu ? request.cpu_seconds : 0);
    job->memory_deadline = start + std::chrono::seconds(request.memory ? request.memory_hold_seconds : 0);

    Job* raw = job.get();
    try {
        raw->runner = std::thread(&SaturationController::Execute, this, raw);
    } catch (const std::system_error& e) {
        jobs_rejected_++;
        throw JobRejected(std::string("Could not start saturation job: ") + e.what());
    }
    jobs_.push_back(std::move(job));
    reserved_mb_ += wanted_mb;
    active_jobs_++;
    jobs_accepted_++;

    JobTicket ticket;
    ticket.id = raw->id;
    ticket.kind = raw->kind;
    ticket.cpu_workers = request.cpu ? request.cpu_workers : 0;
    ticket.memory_mb = request.memory ? request.memory_mb : 0;
    ticket.duration_seconds = std::max(request.cpu ? request.cpu_seconds : 0,
                                       request.memory ? request.memory_hold_seconds : 0);

    std::cout << "[Saturation] job " << ticket.id << " accepted: " << to_string(ticket.kind)
              << " cpu=" << ticket.cpu_workers << "x" << (request.cpu ? request.cpu_seconds : 0) << "s"
              << " memory=" << ticket.memory_mb << "MB/" << (request.memory ? request.memory_hold_seconds : 0) << "s"
              << std::endl;
    return ticket;
}

void SaturationController::Execute(Job* job)
{
    std::vector<std::thread> workers;
    try {
        if (job->request.cpu) {
            workers.reserve(static_cast<std::size_t>(job->request.cpu_workers));
            for (int i = 0; i < job->request.cpu_workers; ++i) {
                workers.emplace_back(&SaturationController::SpinCpu, this, job);
            }
        }
    } catch (const std::system_error& e) {
        std::cerr << "[Saturation] job " << job->id << " could not start workers: " << e.what() << std::endl;
        job->failed = true;
        job->abort = true;
    }

    if (job->request.memory && !job->abort) {
        HoldMemory(job);
    }

    for (auto& worker : workers) {
        worker.join();
    }
    cpu_iterations_ += job->iterations.load();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        reserved_mb_ -= job->request.memory ? job->request.memory_mb : 0;
        active_jobs_--;
        if (job->failed) {
            jobs_failed_++;
        } else {
            jobs_completed_++;
        }
    }
    std::cout << "[Saturation] job " << job->id << (job->failed ? " failed" : " finished")
              << " after " << job->iterations.load() << " cpu iterations" << std::endl;
    cv_.notify_all();
    job->finished = true;
}

void SaturationController::SpinCpu(Job* job)
{
    active_cpu_workers_++;
    std::mt19937 gen(std::random_device{}());
    std::uniform_real_distribution<double> dist(0.0, 1.0);

    double acc = 0.0;
    long long iterations = 0;
    do {
        for (int i = 0; i < kSpinBatch; ++i) {
            acc += std::sqrt(dist(gen) * 99999.0);
        }
        iterations += kSpinBatch;
    } while (Clock::now() < job->cpu_deadline && !stopping_ && !job->abort);

    volatile double sink = acc;
    (void)sink;
    job->iterations += iterations;
    active_cpu_workers_--;
}

void SaturationController::HoldMemory(Job* job)
{
    MemoryBlock block(bytes_held_);
    std::size_t remaining = static_cast<std::size_t>(job->request.memory_mb) * 1024 * 1024;
    try {
        while (remaining > 0 && !stopping_) {
            std::size_t size = std::min(kChunkBytes, remaining);
            block.Grow(size);
            remaining -= size;
        }
    } catch (const std::bad_alloc&) {
        std::cerr << "[Saturation] job " << job->id << " could not allocate "
                  << job->request.memory_mb << " MB, releasing "
                  << block.held() / (1024 * 1024) << " MB" << std::endl;
        job->failed = true;
        job->abort = true;
        return;
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, job->memory_deadline, [this] { return stopping_.load(); });
    }

    std::cout << "[Saturation] job " << job->id << " releasing " << block.held() / (1024 * 1024)
              << " MB (checksum " << block.Checksum() << ")" << std::endl;
}

void SaturationController::ReapFinishedLocked()
{
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        if ((*it)->finished) {
            if ((*it)->runner.joinable()) {
                (*it)->runner.join();
            }
            it = jobs_.erase(it);
        } else {
            ++it;
        }
    }
}

void SaturationController::RecordNetworkBytes(std::size_t bytes)
{
    network_bytes_sent_ += static_cast<long long>(bytes);
}

SaturationStats SaturationController::Stats() const
{
    SaturationStats stats;
    stats.active_jobs = active_jobs_;
    stats.active_cpu_workers = active_cpu_workers_;
    stats.bytes_held = bytes_held_;
    stats.jobs_accepted = jobs_accepted_;
    stats.jobs_completed = jobs_completed_;
    stats.jobs_failed = jobs_failed_;
    stats.jobs_rejected = jobs_rejected_;
    stats.cpu_iterations = cpu_iterations_;
    stats.network_bytes_sent = network_bytes_sent_;
    return stats;
}

bool SaturationController::WaitIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return active_jobs_ == 0; });
}

void SaturationController::Shutdown()
{
    std::list<std::unique_ptr<Job>> draining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        draining.swap(jobs_);
    }
    cv_.notify_all();

    for (auto& job : draining) {
        if (job->runner.joinable()) {
            job->runner.join();
        }
    }
    if (!draining.empty()) {
        std::cout << "[Saturation] shut down, " << draining.size() << " job(s) released" << std::endl;
    }
}
