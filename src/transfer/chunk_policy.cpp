#include "lanshare/transfer/chunk_policy.h"
#include <algorithm>

namespace lanshare {

std::size_t adaptive_buffer_size(uint64_t total_size) {
    if (total_size < 10 * MiB) return 8 * KiB;
    if (total_size < 100 * MiB) return 64 * KiB;
    if (total_size < GiB) return 512 * KiB;
    return MiB;
}

ChunkPolicy::ChunkPolicy(const TransferConfig& config)
    : enabled_(config.enable_multithread),
      min_size_(config.multithread_min_size),
      max_workers_(std::max<uint32_t>(1, config.max_download_threads)),
      chunk_size_(std::max<uint64_t>(1, config.thread_chunk_size)) {}

bool ChunkPolicy::should_use_multithread(uint64_t total_size) const {
    return enabled_ && total_size >= min_size_;
}

uint32_t ChunkPolicy::optimal_workers(uint64_t total_size) const {
    uint32_t workers;
    if (total_size < 50 * MiB) {
        workers = std::min<uint32_t>(2, max_workers_);
    } else if (total_size < 500 * MiB) {
        workers = std::min<uint32_t>(4, max_workers_);
    } else {
        workers = max_workers_;
    }
    return std::clamp<uint32_t>(workers, 1, max_workers_);
}

std::vector<ChunkRange> ChunkPolicy::plan(uint64_t total_size) const {
    std::vector<ChunkRange> chunks;
    chunks.reserve(static_cast<std::size_t>((total_size + chunk_size_ - 1) / chunk_size_));

    uint64_t offset = 0;
    uint32_t id = 0;
    while (offset < total_size) {
        uint64_t end = std::min(offset + chunk_size_ - 1, total_size - 1);
        chunks.push_back(ChunkRange{id++, offset, end, end - offset + 1});
        offset = end + 1;
    }
    return chunks;
}

double estimate_transfer_time(uint64_t size_bytes, double speed_mbps) {
    if (speed_mbps <= 0.0) return 0.0;
    return (static_cast<double>(size_bytes) / MiB) / speed_mbps;
}

std::string format_duration(double seconds) {
    auto total = static_cast<uint64_t>(seconds < 0 ? 0 : seconds);
    if (total < 60) {
        return std::to_string(total) + "s";
    }
    if (total < 3600) {
        return std::to_string(total / 60) + "m " + std::to_string(total % 60) + "s";
    }
    return std::to_string(total / 3600) + "h " + std::to_string((total % 3600) / 60) + "m";
}

} // namespace lanshare
