#include "progress.hpp"
#include <cstdio>
#include <sstream>
#include <iomanip>

namespace progress {

ProgressTracker::ProgressTracker(uint64_t total_size, double update_interval_seconds)
    : total_size_(total_size),
      interval_(update_interval_seconds),
      start_(Clock::now()),
      last_update_(start_) {}

bool ProgressTracker::should_update() const {
    if (!updated_) return true;
    return Clock::now() - last_update_ >= interval_;
}

ProgressSnapshot ProgressTracker::update(uint64_t current_size) {
    auto now = Clock::now();
    double elapsed = std::chrono::duration<double>(now - start_).count();

    ProgressSnapshot snap;
    snap.current_size = current_size;
    snap.total_size = total_size_;
    snap.elapsed_time = elapsed;
    snap.percentage = (total_size_ > 0)
        ? (static_cast<double>(current_size) / static_cast<double>(total_size_)) * 100.0
        : 0.0;

    if (elapsed > 0) {
        double bytes_per_sec = current_size / elapsed;
        snap.speed_mbps = (bytes_per_sec * 8) / (1024.0 * 1024.0);
        if (current_size > 0 && current_size < total_size_) {
            snap.eta_seconds = (total_size_ - current_size) / bytes_per_sec;
        }
    }

    last_update_ = now;
    updated_ = true;
    return snap;
}

void ProgressChannel::publish(const ProgressSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    // A slow consumer loses the oldest snapshots, never the latest one.
    if (queue_.size() >= capacity_) {
        queue_.pop_front();
    }
    queue_.push_back(snapshot);
}

std::vector<ProgressSnapshot> ProgressChannel::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProgressSnapshot> out(queue_.begin(), queue_.end());
    queue_.clear();
    return out;
}

bool ProgressChannel::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

std::string format_size(uint64_t bytes) {
    double size = bytes;
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int i = 0;
    while (size >= 1024 && i < 4) {
        size /= 1024;
        i++;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f %s", size, units[i]);
    return std::string(buf);
}

std::string format_speed(double speed_mbps) {
    char buf[32];
    if (speed_mbps < 1.0) {
        snprintf(buf, sizeof(buf), "%.1f Kbps", speed_mbps * 1000);
    } else {
        snprintf(buf, sizeof(buf), "%.1f Mbps", speed_mbps);
    }
    return std::string(buf);
}

std::string format_time(double seconds) {
    char buf[32];
    if (seconds < 60) {
        snprintf(buf, sizeof(buf), "%.1f seconds", seconds);
    } else if (seconds < 3600) {
        snprintf(buf, sizeof(buf), "%.1f minutes", seconds / 60);
    } else {
        snprintf(buf, sizeof(buf), "%.1f hours", seconds / 3600);
    }
    return std::string(buf);
}

std::string format_snapshot(const ProgressSnapshot& snapshot) {
    int eta = static_cast<int>(snapshot.eta_seconds);
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << snapshot.percentage << "% | "
        << format_size(snapshot.current_size) << " / " << format_size(snapshot.total_size) << " | "
        << format_speed(snapshot.speed_mbps) << " | ETA "
        << std::setfill('0') << std::setw(2) << eta / 60 << ":"
        << std::setfill('0') << std::setw(2) << eta % 60;
    return oss.str();
}

} // namespace progress
