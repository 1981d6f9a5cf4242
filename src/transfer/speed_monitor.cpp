#include "lanshare/transfer/speed_monitor.h"
#include "lanshare/base/config.h"
#include <algorithm>
#include <cstdio>
#include <numeric>

namespace lanshare {

SpeedMonitor::SpeedMonitor(std::size_t window_size)
    : window_size_(std::max<std::size_t>(1, window_size)) {}

void SpeedMonitor::add_sample(uint64_t bytes_transferred, double elapsed_sec) {
    double speed = elapsed_sec > 0.0
        ? static_cast<double>(bytes_transferred) / elapsed_sec / MiB
        : 0.0;

    std::lock_guard<std::mutex> lock(mutex_);
    samples_.push_back(speed);
    while (samples_.size() > window_size_) {
        samples_.pop_front();
    }
}

double SpeedMonitor::average_speed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (samples_.empty()) return 0.0;
    return std::accumulate(samples_.begin(), samples_.end(), 0.0) / samples_.size();
}

double SpeedMonitor::current_speed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.empty() ? 0.0 : samples_.back();
}

std::size_t SpeedMonitor::sample_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

void SpeedMonitor::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.clear();
}

std::string SpeedMonitor::format_speed(double speed_mbps) {
    char buf[32];
    if (speed_mbps < 1.0) {
        std::snprintf(buf, sizeof(buf), "%.1f KB/s", speed_mbps * 1024.0);
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f MB/s", speed_mbps);
    }
    return buf;
}

} // namespace lanshare
