#ifndef LANSHARE_CLIENT_DOWNLOAD_MANAGER_H
#define LANSHARE_CLIENT_DOWNLOAD_MANAGER_H

#include "lanshare/base/config.h"
#include "lanshare/client/catalog_client.h"
#include "lanshare/transfer/chunked_download_client.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lanshare {

struct DownloadStatus {
    std::string download_id;   // "<server_url>_<file_id>"
    std::string file_name;
    std::string save_path;
    DownloadState state = DownloadState::Pending;
    double percent = 0.0;
    double speed_mbps = 0.0;
    uint64_t downloaded_bytes = 0;
    uint64_t total_bytes = 0;
    ErrorCode error = ErrorCode::Success;
    std::string message;
};

class DownloadManagerObserver {
public:
    virtual ~DownloadManagerObserver() = default;
    virtual void on_download_update(const DownloadStatus& status) = 0;
};

// Runs catalog downloads in the background, at most
// max_concurrent_downloads at a time; the rest wait for a slot.
class DownloadManager {
public:
    DownloadManager(const TransferConfig& transfer, const ClientConfig& client);
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // Returns the download id. An id that is already in flight is not restarted.
    std::string download(const std::string& server_url,
                         const RemoteFile& file,
                         const std::string& save_directory = "");

    std::vector<std::string> download_many(const std::string& server_url,
                                           const std::vector<RemoteFile>& files,
                                           const std::string& save_directory = "");

    std::optional<DownloadStatus> status(const std::string& download_id) const;
    std::vector<DownloadStatus> all() const;
    std::size_t active_count() const;

    bool cancel(const std::string& download_id);

    // Forgets finished jobs; returns how many were removed
    std::size_t clear_completed();

    // Blocks until every known job is terminal
    void wait_all();

    // Not owned
    void add_observer(DownloadManagerObserver* observer);
    void remove_observer(DownloadManagerObserver* observer);

    // name, or name_1.ext, name_2.ext ... if taken on disk
    static std::string unique_destination(const std::string& directory, const std::string& file_name);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lanshare

#endif // LANSHARE_CLIENT_DOWNLOAD_MANAGER_H
