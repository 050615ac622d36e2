#pragma once

#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <functional>
#include <pthread.h>
#include <thread>
#include <utility>

/**
 * @brief Takes SIGINT/SIGTERM on a dedicated thread so shutdown runs outside
 * signal context.
 *
 * The constructor blocks both signals in the calling thread; threads created
 * afterwards inherit the mask. The handler runs on the watcher thread with the
 * signal number and the number of signals received so far. Once a signal has
 * arrived the handler is also called on every tick with signal 0, until
 * Close().
 */
class SignalWatcher {
public:
    using Handler = std::function<void(int signal, int count)>;

    explicit SignalWatcher(Handler handler,
                           std::chrono::milliseconds tick = std::chrono::milliseconds(100))
        : handler_(std::move(handler))
    {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals_, nullptr);

        tick_.tv_sec = static_cast<time_t>(tick.count() / 1000);
        tick_.tv_nsec = static_cast<long>(tick.count() % 1000) * 1000000L;
        thread_ = std::thread(&SignalWatcher::Watch, this);
    }

    ~SignalWatcher() { Close(); }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    // Stops watching; signals stay blocked.
    void Close()
    {
        closed_ = true;
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    int Received() const { return received_.load(); }

private:
    void Watch()
    {
        while (!closed_.load()) {
            int sig = sigtimedwait(&signals_, nullptr, &tick_);
            if (sig > 0) {
                handler_(sig, ++received_);
            } else if (received_.load() > 0) {
                handler_(0, received_.load());
            }
        }
    }

    Handler handler_;
    sigset_t signals_;
    timespec tick_{};
    std::atomic<bool> closed_{false};
    std::atomic<int> received_{0};
    std::thread thread_;
};
