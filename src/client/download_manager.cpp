#include "lanshare/client/download_manager.h"
#include "lanshare/base/logger.h"
#include <algorithm>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <thread>

namespace fs = std::filesystem;

namespace lanshare {

namespace {

class JobProgressForwarder : public DownloadObserver {
public:
    using Callback = std::function<void(const DownloadProgress&)>;
    explicit JobProgressForwarder(Callback cb) : cb_(std::move(cb)) {}
    void on_progress(const DownloadProgress& progress) override { cb_(progress); }

private:
    Callback cb_;
};

} // anonymous namespace

struct DownloadManager::Impl {
    struct Job {
        DownloadStatus status;
        DownloadRequest request;
        std::shared_ptr<ChunkedDownloadClient> client;
        std::unique_ptr<JobProgressForwarder> forwarder;
        std::thread thread;
        bool cancel_requested = false;
    };

    TransferConfig transfer;
    ClientConfig client;

    mutable std::mutex mutex;
    std::condition_variable slot_cv;
    std::condition_variable done_cv;
    std::map<std::string, std::shared_ptr<Job>> jobs;
    std::set<std::string> reserved_paths;
    uint32_t active = 0;

    std::mutex observer_mutex;
    std::vector<DownloadManagerObserver*> observers;

    Impl(const TransferConfig& t, const ClientConfig& c) : transfer(t), client(c) {}

    uint32_t slot_limit() const { return std::max<uint32_t>(1, transfer.max_concurrent_downloads); }

    void notify(const DownloadStatus& status) {
        std::vector<DownloadManagerObserver*> targets;
        {
            std::lock_guard<std::mutex> lock(observer_mutex);
            targets = observers;
        }
        for (auto* o : targets) {
            try {
                o->on_download_update(status);
            } catch (const std::exception& e) {
                Logger::instance().error(std::string("Download observer failed: ") + e.what());
            }
        }
    }

    // Waits for a slot; false if the job was cancelled while queued
    bool acquire_slot(const std::shared_ptr<Job>& job) {
        std::unique_lock<std::mutex> lock(mutex);
        slot_cv.wait(lock, [&] { return job->cancel_requested || active < slot_limit(); });
        if (job->cancel_requested) return false;
        ++active;
        job->status.state = DownloadState::Downloading;
        return true;
    }

    void release_slot() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (active > 0) --active;
        }
        slot_cv.notify_one();
    }

    void run_job(std::shared_ptr<Job> job) {
        if (!acquire_slot(job)) {
            finish_job(job, DownloadState::Cancelled, ErrorCode::Cancelled, "Download cancelled", 0);
            return;
        }

        DownloadStatus started;
        {
            std::lock_guard<std::mutex> lock(mutex);
            started = job->status;
        }
        Logger::instance().info("Starting download: " + started.file_name + " -> " + started.save_path);
        notify(started);

        DownloadResult result;
        try {
            result = job->client->download();
        } catch (const std::exception& e) {
            result.success = false;
            result.state = DownloadState::Failed;
            result.error = ErrorCode::InternalError;
            result.message = e.what();
        }
        release_slot();

        if (result.success) {
            Logger::instance().info("Download completed: " + started.save_path);
        } else if (result.state == DownloadState::Cancelled) {
            Logger::instance().info("Download cancelled: " + started.file_name);
        } else {
            Logger::instance().error("Download failed: " + started.file_name + ": " + result.message);
        }
        finish_job(job, result.state, result.error, result.message, result.downloaded_bytes);
    }

    void finish_job(const std::shared_ptr<Job>& job, DownloadState state, ErrorCode error,
                    const std::string& message, uint64_t downloaded) {
        DownloadStatus snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto& s = job->status;
            s.state = is_terminal(state) ? state : DownloadState::Failed;
            s.error = error;
            s.message = message;
            s.downloaded_bytes = downloaded;
            if (s.state == DownloadState::Completed) {
                s.percent = 100.0;
                s.downloaded_bytes = s.total_bytes;
            }
            reserved_paths.erase(s.save_path);
            snapshot = s;
        }
        done_cv.notify_all();
        notify(snapshot);
    }

    void on_job_progress(const std::shared_ptr<Job>& job, const DownloadProgress& p) {
        DownloadStatus snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto& s = job->status;
            if (is_terminal(s.state)) return;
            s.downloaded_bytes = p.downloaded_bytes;
            if (p.total_bytes > 0) s.total_bytes = p.total_bytes;
            s.percent = p.percent;
            s.speed_mbps = p.speed_mbps;
            snapshot = s;
        }
        notify(snapshot);
    }

    void join_all(std::vector<std::shared_ptr<Job>>& list) {
        for (auto& job : list) {
            if (job->thread.joinable()) job->thread.join();
        }
    }
};

DownloadManager::DownloadManager(const TransferConfig& transfer, const ClientConfig& client)
    : impl_(std::make_unique<Impl>(transfer, client)) {}

DownloadManager::~DownloadManager() {
    std::vector<std::shared_ptr<Impl::Job>> list;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (auto& [id, job] : impl_->jobs) {
            job->cancel_requested = true;
            if (job->client) job->client->cancel();
            list.push_back(job);
        }
    }
    impl_->slot_cv.notify_all();
    impl_->join_all(list);
}

std::string DownloadManager::unique_destination(const std::string& directory, const std::string& file_name) {
    fs::path dir(directory.empty() ? "." : directory);
    fs::path candidate = dir / file_name;
    if (!fs::exists(candidate)) return candidate.string();

    fs::path name(file_name);
    std::string stem = name.stem().string();
    std::string ext = name.extension().string();
    for (int counter = 1;; ++counter) {
        candidate = dir / (stem + "_" + std::to_string(counter) + ext);
        if (!fs::exists(candidate)) return candidate.string();
    }
}

std::string DownloadManager::download(const std::string& server_url,
                                      const RemoteFile& file,
                                      const std::string& save_directory) {
    std::string download_id = server_url + "_" + file.id;
    std::string dir = save_directory.empty() ? impl_->client.download_dir : save_directory;

    std::error_code ec;
    fs::create_directories(dir.empty() ? "." : dir, ec);
    if (ec) {
        throw LanShareError(ErrorCode::ResourceError, "Cannot create " + dir + ": " + ec.message());
    }

    std::shared_ptr<Impl::Job> previous;
    auto job = std::make_shared<Impl::Job>();
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->jobs.find(download_id);
        if (it != impl_->jobs.end()) {
            if (!is_terminal(it->second->status.state)) {
                Logger::instance().warning("Download already in progress: " + download_id);
                return download_id;
            }
            previous = it->second;
        }

        // Names reserved by in-flight jobs count as taken
        std::string dest = unique_destination(dir, file.name);
        for (int counter = 1; impl_->reserved_paths.count(dest) > 0; ++counter) {
            fs::path name(file.name);
            dest = unique_destination(dir, name.stem().string() + "_" + std::to_string(counter) +
                                               name.extension().string());
        }
        impl_->reserved_paths.insert(dest);

        job->status.download_id = download_id;
        job->status.file_name = file.name;
        job->status.save_path = dest;
        job->status.total_bytes = file.size_bytes;

        job->request.url = CatalogClient::download_url(server_url, file.id);
        job->request.destination_path = dest;
        job->request.total_size = file.size_bytes;
        job->request.checksum_algorithm = impl_->transfer.checksum_algorithm;
        job->request.enable_resume = impl_->transfer.enable_resume;
        job->request.token = impl_->client.token;

        job->client = std::make_shared<ChunkedDownloadClient>(job->request, impl_->transfer);
        std::weak_ptr<Impl::Job> weak = job;
        Impl* impl = impl_.get();
        job->forwarder = std::make_unique<JobProgressForwarder>([impl, weak](const DownloadProgress& p) {
            if (auto j = weak.lock()) impl->on_job_progress(j, p);
        });
        job->client->add_observer(job->forwarder.get());

        impl_->jobs[download_id] = job;
    }

    if (previous && previous->thread.joinable()) previous->thread.join();

    DownloadStatus queued;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        queued = job->status;
    }
    impl_->notify(queued);
    job->thread = std::thread([impl = impl_.get(), job] { impl->run_job(job); });
    return download_id;
}

std::vector<std::string> DownloadManager::download_many(const std::string& server_url,
                                                        const std::vector<RemoteFile>& files,
                                                        const std::string& save_directory) {
    std::vector<std::string> ids;
    ids.reserve(files.size());
    for (const auto& f : files) {
        ids.push_back(download(server_url, f, save_directory));
    }
    return ids;
}

std::optional<DownloadStatus> DownloadManager::status(const std::string& download_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->jobs.find(download_id);
    if (it == impl_->jobs.end()) return std::nullopt;
    return it->second->status;
}

std::vector<DownloadStatus> DownloadManager::all() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<DownloadStatus> list;
    list.reserve(impl_->jobs.size());
    for (const auto& [id, job] : impl_->jobs) {
        list.push_back(job->status);
    }
    return list;
}

std::size_t DownloadManager::active_count() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->active;
}

bool DownloadManager::cancel(const std::string& download_id) {
    std::shared_ptr<ChunkedDownloadClient> client;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->jobs.find(download_id);
        if (it == impl_->jobs.end() || is_terminal(it->second->status.state)) {
            return false;
        }
        it->second->cancel_requested = true;
        client = it->second->client;
    }
    impl_->slot_cv.notify_all();
    if (client) client->cancel();
    return true;
}

std::size_t DownloadManager::clear_completed() {
    std::vector<std::shared_ptr<Impl::Job>> removed;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (auto it = impl_->jobs.begin(); it != impl_->jobs.end();) {
            if (is_terminal(it->second->status.state)) {
                removed.push_back(it->second);
                it = impl_->jobs.erase(it);
            } else {
                ++it;
            }
        }
    }
    impl_->join_all(removed);
    return removed.size();
}

void DownloadManager::wait_all() {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    impl_->done_cv.wait(lock, [&] {
        return std::all_of(impl_->jobs.begin(), impl_->jobs.end(),
                           [](const auto& entry) { return is_terminal(entry.second->status.state); });
    });
}

void DownloadManager::add_observer(DownloadManagerObserver* observer) {
    if (!observer) return;
    std::lock_guard<std::mutex> lock(impl_->observer_mutex);
    impl_->observers.push_back(observer);
}

void DownloadManager::remove_observer(DownloadManagerObserver* observer) {
    std::lock_guard<std::mutex> lock(impl_->observer_mutex);
    auto& v = impl_->observers;
    v.erase(std::remove(v.begin(), v.end(), observer), v.end());
}

} // namespace lanshare
