#ifndef LANSHARE_TRANSFER_CHUNKED_DOWNLOAD_CLIENT_H
#define LANSHARE_TRANSFER_CHUNKED_DOWNLOAD_CLIENT_H

#include "lanshare/base/config.h"
#include "lanshare/base/error_code.h"
#include "lanshare/transfer/chunk_policy.h"
#include "lanshare/transfer/resume_store.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lanshare {

enum class DownloadState {
    Pending,
    Downloading,
    Completed,
    Failed,
    Cancelled
};

std::string to_string(DownloadState state);
bool is_terminal(DownloadState state);

struct DownloadProgress {
    uint64_t downloaded_bytes = 0;
    uint64_t total_bytes = 0;
    double percent = 0.0;
    double speed_mbps = 0.0;
    DownloadState state = DownloadState::Pending;
};

// Called from worker threads without any client lock held
class DownloadObserver {
public:
    virtual ~DownloadObserver() = default;
    virtual void on_progress(const DownloadProgress& progress) = 0;
};

struct DownloadRequest {
    std::string url;
    std::string destination_path;
    uint64_t total_size = 0;      // 0: probe with HEAD
    uint32_t worker_hint = 0;     // 0: use the chunk policy
    std::optional<std::string> expected_checksum;
    std::string checksum_algorithm = "sha256";
    bool enable_resume = true;
    std::optional<std::string> token;
};

struct DownloadResult {
    bool success = false;
    DownloadState state = DownloadState::Pending;
    ErrorCode error = ErrorCode::Success;
    std::string message;
    uint64_t downloaded_bytes = 0;
    std::string job_id;
};

// Downloads one file. Below the multithread threshold the body is streamed
// into <dest>.partial; above it, fixed-size chunks are fetched in parallel
// into <dest>.part<id> and merged. dest only appears after verification.
// One instance runs download() once; cancel() may be called from any thread.
class ChunkedDownloadClient {
public:
    ChunkedDownloadClient(DownloadRequest request, const TransferConfig& config);
    ~ChunkedDownloadClient();

    ChunkedDownloadClient(const ChunkedDownloadClient&) = delete;
    ChunkedDownloadClient& operator=(const ChunkedDownloadClient&) = delete;

    // Blocks until the job reaches a terminal state
    DownloadResult download();

    void cancel();
    bool is_cancelled() const;

    DownloadState state() const;
    DownloadProgress progress() const;

    // Whether a saved record can continue this job: <dest>.partial below the
    // multithread threshold, the <dest>.part<id> files above it.
    // Requires a known total size.
    ResumeCheck can_resume() const;

    // Empty until the total size is known
    std::string job_id() const;
    uint64_t total_size() const;

    std::vector<ChunkRange> chunk_plan() const;
    // Workers the parallel path starts for the current size
    uint32_t worker_count() const;

    // Observers are not owned and must outlive download()
    void add_observer(DownloadObserver* observer);
    void remove_observer(DownloadObserver* observer);

    static std::string make_job_id(const std::string& url,
                                   const std::string& destination,
                                   uint64_t total_size);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lanshare

#endif // LANSHARE_TRANSFER_CHUNKED_DOWNLOAD_CLIENT_H
