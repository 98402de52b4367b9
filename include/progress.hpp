#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <deque>
#include <mutex>
#include <vector>

namespace progress {

struct ProgressSnapshot {
    uint64_t current_size = 0;
    uint64_t total_size = 0;
    double percentage = 0.0;
    double elapsed_time = 0.0;  // seconds
    double speed_mbps = 0.0;
    double eta_seconds = 0.0;
};

// Rate-limited progress computation for one transfer attempt.
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    ProgressTracker(uint64_t total_size, double update_interval_seconds = 1.0);

    // True when no update has been accepted yet or the interval has elapsed
    // since the last one.
    bool should_update() const;
    ProgressSnapshot update(uint64_t current_size);

    uint64_t total_size() const { return total_size_; }

private:
    uint64_t total_size_;
    std::chrono::duration<double> interval_;
    Clock::time_point start_;
    Clock::time_point last_update_;
    bool updated_ = false;
};

// Hands snapshots from the transfer thread to whoever polls for them.
class ProgressChannel {
public:
    explicit ProgressChannel(size_t capacity = 1024) : capacity_(capacity) {}

    void publish(const ProgressSnapshot& snapshot);
    std::vector<ProgressSnapshot> drain();
    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::deque<ProgressSnapshot> queue_;
    size_t capacity_;
};

std::string format_size(uint64_t bytes);
std::string format_speed(double speed_mbps);
std::string format_time(double seconds);
std::string format_snapshot(const ProgressSnapshot& snapshot);

} // namespace progress
