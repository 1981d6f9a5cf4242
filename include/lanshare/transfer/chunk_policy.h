#ifndef LANSHARE_TRANSFER_CHUNK_POLICY_H
#define LANSHARE_TRANSFER_CHUNK_POLICY_H

#include "lanshare/base/config.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lanshare {

// One independently fetched byte range; end_byte is inclusive
struct ChunkRange {
    uint32_t id = 0;
    uint64_t start_byte = 0;
    uint64_t end_byte = 0;
    uint64_t size_bytes = 0;
};

// I/O buffer size for a transfer of total_size bytes.
// Shared by the server's streaming writer and the client's readers.
std::size_t adaptive_buffer_size(uint64_t total_size);

class ChunkPolicy {
public:
    explicit ChunkPolicy(const TransferConfig& config);

    bool should_use_multithread(uint64_t total_size) const;

    // Worker count in [1, max_download_threads], nondecreasing in total_size
    uint32_t optimal_workers(uint64_t total_size) const;

    uint64_t chunk_size() const { return chunk_size_; }
    uint32_t max_workers() const { return max_workers_; }

    // Partition [0, total_size) into chunk_size() ranges, last one possibly shorter
    std::vector<ChunkRange> plan(uint64_t total_size) const;

private:
    bool enabled_;
    uint64_t min_size_;
    uint32_t max_workers_;
    uint64_t chunk_size_;
};

// Seconds to move size_bytes at speed_mbps (MB/s); 0 when speed is unknown
double estimate_transfer_time(uint64_t size_bytes, double speed_mbps);

// "42s", "3m 5s", "2h 10m"
std::string format_duration(double seconds);

} // namespace lanshare

#endif // LANSHARE_TRANSFER_CHUNK_POLICY_H
