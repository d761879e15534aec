
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Process-wide cancellation shared by reference between the feed monitor, the
// executor and the service. Stopping is one-way.
class StopToken {
public:
    StopToken() = default;
    StopToken(const StopToken&) = delete;
    StopToken& operator=(const StopToken&) = delete;

    void request_stop();
    bool stop_requested() const { return stopped_.load(); }

    // Sleeps up to `duration`; returns false if woken by request_stop().
    bool wait_for(std::chrono::milliseconds duration);

    // Blocks until request_stop() is called.
    void wait();

private:
    std::atomic<bool> stopped_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};
