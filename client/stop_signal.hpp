#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * @brief One-shot cancellation flag that sleeping threads can wait on.
 *
 * Request() is sticky: once set it stays set and every current and future
 * wait returns immediately.
 */
class StopSignal {
public:
    StopSignal() = default;

    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    void Request();

    bool Requested() const { return stopped_.load(); }

    /**
     * @brief Sleeps until `deadline` or until a stop is requested.
     * @return true if the stop was requested.
     */
    bool WaitUntil(std::chrono::steady_clock::time_point deadline);

    template <typename Rep, typename Period>
    bool WaitFor(std::chrono::duration<Rep, Period> timeout)
    {
        return WaitUntil(std::chrono::steady_clock::now() +
                         std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout));
    }

private:
    std::atomic<bool> stopped_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};
