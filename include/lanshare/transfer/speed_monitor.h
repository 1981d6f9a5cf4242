#ifndef LANSHARE_TRANSFER_SPEED_MONITOR_H
#define LANSHARE_TRANSFER_SPEED_MONITOR_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace lanshare {

// Sliding window of throughput samples in MB/s
class SpeedMonitor {
public:
    explicit SpeedMonitor(std::size_t window_size = 10);

    void add_sample(uint64_t bytes_transferred, double elapsed_sec);

    double average_speed() const;
    double current_speed() const;
    std::size_t sample_count() const;

    void reset();

    // "512.0 KB/s" below 1 MB/s, "12.3 MB/s" otherwise
    static std::string format_speed(double speed_mbps);

private:
    std::size_t window_size_;
    std::deque<double> samples_;
    mutable std::mutex mutex_;
};

} // namespace lanshare

#endif // LANSHARE_TRANSFER_SPEED_MONITOR_H
