#include "lanshare/transfer/chunked_download_client.h"
#include "lanshare/base/logger.h"
#include "lanshare/http/fetcher.h"
#include "lanshare/transfer/integrity_verifier.h"
#include "lanshare/transfer/speed_monitor.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <queue>
#include <thread>

namespace lanshare {

namespace fs = std::filesystem;

namespace {

constexpr auto kSampleInterval = std::chrono::milliseconds(100);

double now_seconds() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

uint64_t file_size_or_zero(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : size;
}

void remove_quietly(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        Logger::instance().warning("Cannot remove " + path + ": " + ec.message());
    }
}

ErrorCode error_for_status(int status) {
    switch (status) {
        case 401: return ErrorCode::AuthenticationFailed;
        case 403: return ErrorCode::AccessDenied;
        case 404: return ErrorCode::NotFound;
        case 416: return ErrorCode::RangeNotSatisfiable;
        case 429: return ErrorCode::RateLimited;
        default: return ErrorCode::UnexpectedStatus;
    }
}

std::string describe_status(const HttpResponseHead& head) {
    return "HTTP " + std::to_string(head.status) + " " +
           (head.reason.empty() ? status_reason(head.status) : head.reason);
}

} // anonymous namespace

std::string to_string(DownloadState state) {
    switch (state) {
        case DownloadState::Pending: return "pending";
        case DownloadState::Downloading: return "downloading";
        case DownloadState::Completed: return "completed";
        case DownloadState::Failed: return "failed";
        case DownloadState::Cancelled: return "cancelled";
    }
    return "unknown";
}

bool is_terminal(DownloadState state) {
    return state == DownloadState::Completed ||
           state == DownloadState::Failed ||
           state == DownloadState::Cancelled;
}

struct ChunkedDownloadClient::Impl {
    DownloadRequest request;
    TransferConfig config;
    ChunkPolicy policy;
    ResumeStore resume_store;

    std::atomic<bool> cancelled{false};
    std::atomic<bool> started{false};

    // Guards everything below
    mutable std::mutex mutex;
    DownloadState state = DownloadState::Pending;
    uint64_t total_size = 0;
    std::string job_id;
    uint64_t downloaded = 0;
    uint64_t completed_bytes = 0;   // bytes in fully written chunks
    std::vector<std::pair<ErrorCode, std::string>> errors;
    std::vector<std::string> temp_files;
    SpeedMonitor speed;
    uint64_t bytes_since_sample = 0;
    std::chrono::steady_clock::time_point last_sample = std::chrono::steady_clock::now();

    mutable std::mutex observer_mutex;
    std::vector<DownloadObserver*> observers;

    std::mutex queue_mutex;
    std::queue<ChunkRange> pending_chunks;

    Impl(DownloadRequest req, const TransferConfig& cfg)
        : request(std::move(req)),
          config(cfg),
          policy(cfg),
          resume_store(cfg.resume_dir.empty() ? ResumeStore::default_directory()
                                              : fs::path(cfg.resume_dir)),
          speed(cfg.speed_window) {
        total_size = request.total_size;
        if (total_size > 0) {
            job_id = make_job_id(request.url, request.destination_path, total_size);
        }
    }

    std::string partial_path() const { return request.destination_path + ".partial"; }
    std::string merged_path() const { return request.destination_path + ".merged"; }
    std::string part_path(uint32_t id) const {
        return request.destination_path + ".part" + std::to_string(id);
    }

    // Parallel jobs never exceed the configured maximum or the chunk count
    uint32_t worker_count(uint64_t total, std::size_t chunks) const {
        uint32_t workers = request.worker_hint > 0 ? request.worker_hint : policy.optimal_workers(total);
        workers = std::min(workers, policy.max_workers());
        return std::max<uint32_t>(1, std::min<uint32_t>(workers, static_cast<uint32_t>(chunks)));
    }

    // Bytes held by part files whose size matches their chunk
    uint64_t valid_part_bytes(const std::vector<ChunkRange>& plan) const {
        uint64_t bytes = 0;
        for (const auto& chunk : plan) {
            if (IntegrityVerifier::verify_chunk(part_path(chunk.id), chunk.size_bytes)) {
                bytes += chunk.size_bytes;
            }
        }
        return bytes;
    }

    // Part files count only under a record for this url and total whose
    // downloaded bytes equal what the part files hold
    ResumeCheck check_parts(const std::string& id, uint64_t total, const std::vector<ChunkRange>& plan) const {
        ResumeCheck result;
        if (id.empty() || !resume_store.exists(id)) {
            return result;
        }
        result.status = ResumeStatus::Inconsistent;
        auto record = resume_store.load(id);
        if (!record || record->total_size != total || record->url != request.url) {
            return result;
        }
        uint64_t present = valid_part_bytes(plan);
        if (record->downloaded == present && present > 0 && present < total) {
            result.status = ResumeStatus::Resumable;
            result.offset = present;
        }
        return result;
    }

    // Every <dest>.part<N>, including ids outside the current plan
    void remove_part_files() const {
        fs::path dest(request.destination_path);
        fs::path dir = dest.parent_path().empty() ? fs::path(".") : dest.parent_path();
        const std::string prefix = dest.filename().string() + ".part";

        std::vector<std::string> stale;
        std::error_code ec;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            std::string name = it->path().filename().string();
            if (name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0 &&
                std::all_of(name.begin() + static_cast<std::ptrdiff_t>(prefix.size()), name.end(),
                            [](unsigned char c) { return std::isdigit(c) != 0; })) {
                stale.push_back(it->path().string());
            }
        }
        for (const auto& path : stale) {
            remove_quietly(path);
        }
    }

    FetchOptions fetch_options() const {
        FetchOptions options;
        options.connect_timeout = std::chrono::seconds(config.connection_timeout_sec);
        options.io_timeout = std::chrono::seconds(config.connection_timeout_sec);
        options.total_timeout = std::chrono::seconds(config.download_timeout_sec);
        options.buffer_size = adaptive_buffer_size(total_size);
        return options;
    }

    HeaderList base_headers() const {
        HeaderList headers;
        if (request.token && !request.token->empty()) {
            headers.emplace_back("Authorization", "Bearer " + *request.token);
        }
        return headers;
    }

    DownloadProgress snapshot_locked() const {
        DownloadProgress p;
        p.downloaded_bytes = downloaded;
        p.total_bytes = total_size;
        p.percent = total_size > 0
            ? std::min(100.0, static_cast<double>(downloaded) * 100.0 / static_cast<double>(total_size))
            : 0.0;
        if (state == DownloadState::Completed) p.percent = 100.0;
        p.speed_mbps = speed.average_speed();
        p.state = state;
        return p;
    }

    void notify(const DownloadProgress& progress) {
        std::vector<DownloadObserver*> targets;
        {
            std::lock_guard<std::mutex> lock(observer_mutex);
            targets = observers;
        }
        for (auto* observer : targets) {
            observer->on_progress(progress);
        }
    }

    // Terminal states are final
    void set_state(DownloadState next) {
        DownloadProgress snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (is_terminal(state) || state == next) return;
            state = next;
            snapshot = snapshot_locked();
        }
        notify(snapshot);
    }

    // Every increment is reported; speed samples are taken at most every kSampleInterval
    void add_progress(uint64_t bytes) {
        DownloadProgress snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            downloaded += bytes;
            bytes_since_sample += bytes;
            auto now = std::chrono::steady_clock::now();
            auto elapsed = now - last_sample;
            if (elapsed >= kSampleInterval) {
                speed.add_sample(bytes_since_sample, std::chrono::duration<double>(elapsed).count());
                bytes_since_sample = 0;
                last_sample = now;
            }
            snapshot = snapshot_locked();
        }
        notify(snapshot);
    }

    void record_error(ErrorCode code, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex);
        errors.emplace_back(code, message);
    }

    bool has_error() const {
        std::lock_guard<std::mutex> lock(mutex);
        return !errors.empty();
    }

    void register_temp(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex);
        if (std::find(temp_files.begin(), temp_files.end(), path) == temp_files.end()) {
            temp_files.push_back(path);
        }
    }

    bool should_stop() const {
        return cancelled.load() || has_error();
    }

    DownloadResult finish(DownloadState final_state, ErrorCode code, const std::string& message) {
        set_state(final_state);
        DownloadResult result;
        result.state = final_state;
        result.success = final_state == DownloadState::Completed;
        result.error = code;
        result.message = message;
        std::lock_guard<std::mutex> lock(mutex);
        result.downloaded_bytes = downloaded;
        result.job_id = job_id;
        return result;
    }

    // The Completed transition doubles as the final 100% notification
    DownloadResult complete() {
        double average;
        {
            std::lock_guard<std::mutex> lock(mutex);
            downloaded = total_size;
            average = speed.average_speed();
        }
        auto result = finish(DownloadState::Completed, ErrorCode::Success, "Download completed");
        Logger::instance().info("Downloaded " + request.url + " to " + request.destination_path +
                                " (" + format_file_size(total_size) + ", avg " +
                                SpeedMonitor::format_speed(average) + ")");
        return result;
    }

    DownloadResult fail_with_first_error() {
        ErrorCode code;
        std::string message;
        {
            std::lock_guard<std::mutex> lock(mutex);
            code = errors.front().first;
            message = errors.front().second;
        }
        Logger::instance().error("Download of " + request.url + " failed: " + message);
        return finish(DownloadState::Failed, code, "Download failed: " + message);
    }

    DownloadResult cancel_job(uint64_t resumable_bytes) {
        ResumeRecord record;
        record.url = request.url;
        record.save_path = request.destination_path;
        record.total_size = total_size;
        record.downloaded = resumable_bytes;
        record.checksum = request.expected_checksum;
        record.timestamp = now_seconds();
        if (!job_id.empty()) {
            resume_store.save(job_id, record);
        }
        Logger::instance().info("Download of " + request.url + " cancelled at " +
                                std::to_string(resumable_bytes) + " bytes");
        return finish(DownloadState::Cancelled, ErrorCode::Cancelled, "Download cancelled");
    }

    void save_progress_record(uint64_t bytes) {
        if (!request.enable_resume || bytes == 0 || job_id.empty()) return;
        ResumeRecord record{request.url, request.destination_path, total_size, bytes,
                            request.expected_checksum, now_seconds()};
        resume_store.save(job_id, record);
    }

    // HEAD -> Content-Length
    bool probe_size(std::string& error, ErrorCode& code) {
        auto url = HttpUrl::parse(request.url);
        if (!url) {
            code = ErrorCode::InvalidArgument;
            error = "Invalid URL: " + request.url;
            return false;
        }
        try {
            HttpFetcher fetcher(fetch_options());
            auto head = fetcher.head(*url, base_headers());
            if (head.status != 200) {
                code = error_for_status(head.status);
                error = "Size probe returned " + describe_status(head);
                return false;
            }
            auto length = head.content_length();
            if (!length) {
                code = ErrorCode::ProtocolError;
                error = "Size probe returned no Content-Length";
                return false;
            }
            std::lock_guard<std::mutex> lock(mutex);
            total_size = *length;
            job_id = make_job_id(request.url, request.destination_path, total_size);
            return true;
        } catch (const LanShareError& e) {
            code = e.code();
            error = e.what();
            return false;
        }
    }

    DownloadResult run_sequential(const HttpUrl& url, HashAlgorithm algorithm) {
        const std::string partial = partial_path();
        uint64_t offset = 0;

        if (request.enable_resume) {
            auto check = resume_store.check(job_id, partial, total_size);
            if (check.resumable()) {
                offset = check.offset;
                Logger::instance().info("Resuming " + request.url + " from byte " + std::to_string(offset));
            } else if (check.status == ResumeStatus::Inconsistent) {
                Logger::instance().warning("Discarding inconsistent resume state for " + request.url);
                resume_store.remove(job_id);
            }
        }
        if (offset == 0) {
            remove_quietly(partial);
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            downloaded = offset;
        }

        std::ofstream out(partial, std::ios::binary | (offset > 0 ? std::ios::app : std::ios::trunc));
        if (!out.is_open()) {
            return finish(DownloadState::Failed, ErrorCode::PermissionDenied,
                          "Download failed: cannot create " + partial);
        }

        HeaderList headers = base_headers();
        if (offset > 0) {
            headers.emplace_back("Range", "bytes=" + std::to_string(offset) + "-");
        }

        bool write_failed = false;
        try {
            HttpFetcher fetcher(fetch_options());
            fetcher.get(url, headers,
                [&](const HttpResponseHead& head) {
                    if (offset == 0 && head.status == 200) return true;
                    if (offset > 0 && head.status == 206) {
                        auto cr = parse_content_range(head.header("content-range").value_or(""));
                        if (cr && cr->start == offset) return true;
                        record_error(ErrorCode::ProtocolError,
                                     "resume response starts at the wrong offset");
                        return false;
                    }
                    record_error(error_for_status(head.status), describe_status(head));
                    return false;
                },
                [&](const char* data, std::size_t size) {
                    if (cancelled.load()) return false;
                    out.write(data, static_cast<std::streamsize>(size));
                    if (!out) {
                        write_failed = true;
                        return false;
                    }
                    add_progress(size);
                    return true;
                });
        } catch (const LanShareError& e) {
            record_error(e.code(), e.what());
        }
        out.close();

        if (write_failed) {
            record_error(ErrorCode::ResourceError, "write failed on " + partial);
        }
        if (cancelled.load()) {
            return cancel_job(file_size_or_zero(partial));
        }
        if (has_error()) {
            save_progress_record(file_size_or_zero(partial));
            return fail_with_first_error();
        }

        uint64_t actual = file_size_or_zero(partial);
        if (actual != total_size) {
            resume_store.remove(job_id);
            return finish(DownloadState::Failed, ErrorCode::SizeMismatch,
                          "Size mismatch: expected " + std::to_string(total_size) +
                          ", got " + std::to_string(actual));
        }
        if (request.expected_checksum && !request.expected_checksum->empty()) {
            auto verified = IntegrityVerifier::verify(partial, *request.expected_checksum, algorithm);
            if (!verified.matched) {
                resume_store.remove(job_id);
                Logger::instance().error("Checksum mismatch for " + partial + ": got " + verified.actual);
                return finish(DownloadState::Failed, ErrorCode::ChecksumMismatch,
                              "Checksum mismatch: file may be corrupted");
            }
        }

        std::error_code ec;
        fs::rename(partial, request.destination_path, ec);
        if (ec) {
            return finish(DownloadState::Failed, ErrorCode::ResourceError,
                          "Download failed: cannot move " + partial + " into place: " + ec.message());
        }
        resume_store.remove(job_id);
        return complete();
    }

    // Fetch one chunk into its part file; errors go to the shared list
    void fetch_chunk(const HttpUrl& url, const ChunkRange& chunk) {
        const std::string part = part_path(chunk.id);
        register_temp(part);

        std::ofstream out(part, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            record_error(ErrorCode::PermissionDenied, "Chunk " + std::to_string(chunk.id) +
                                                      ": cannot create " + part);
            return;
        }

        HeaderList headers = base_headers();
        headers.emplace_back("Range", "bytes=" + std::to_string(chunk.start_byte) + "-" +
                                      std::to_string(chunk.end_byte));

        uint64_t received = 0;
        std::string chunk_error;
        ErrorCode chunk_code = ErrorCode::Success;
        try {
            HttpFetcher fetcher(fetch_options());
            fetcher.get(url, headers,
                [&](const HttpResponseHead& head) {
                    if (head.status != 206) {
                        chunk_code = error_for_status(head.status);
                        chunk_error = "expected 206, got " + describe_status(head);
                        return false;
                    }
                    auto cr = parse_content_range(head.header("content-range").value_or(""));
                    if (!cr || cr->start != chunk.start_byte || cr->end != chunk.end_byte) {
                        chunk_code = ErrorCode::ProtocolError;
                        chunk_error = "Content-Range does not match bytes " +
                                      std::to_string(chunk.start_byte) + "-" + std::to_string(chunk.end_byte);
                        return false;
                    }
                    return true;
                },
                [&](const char* data, std::size_t size) {
                    if (should_stop()) return false;
                    if (received + size > chunk.size_bytes) {
                        chunk_code = ErrorCode::SizeMismatch;
                        chunk_error = "server sent more than " + std::to_string(chunk.size_bytes) + " bytes";
                        return false;
                    }
                    out.write(data, static_cast<std::streamsize>(size));
                    if (!out) {
                        chunk_code = ErrorCode::ResourceError;
                        chunk_error = "write failed on " + part;
                        return false;
                    }
                    received += size;
                    add_progress(size);
                    return true;
                });
        } catch (const LanShareError& e) {
            chunk_code = e.code();
            chunk_error = e.what();
        }
        out.close();

        if (chunk_error.empty() && !should_stop() && received != chunk.size_bytes) {
            chunk_code = ErrorCode::SizeMismatch;
            chunk_error = "expected " + std::to_string(chunk.size_bytes) + " bytes, got " +
                          std::to_string(received);
        }

        if (!chunk_error.empty()) {
            record_error(chunk_code, "Chunk " + std::to_string(chunk.id) + ": " + chunk_error);
            remove_quietly(part);
            return;
        }
        if (received != chunk.size_bytes) {
            // Interrupted by cancel or another worker's failure
            remove_quietly(part);
            return;
        }

        std::lock_guard<std::mutex> lock(mutex);
        completed_bytes += received;
    }

    void worker_loop(const HttpUrl& url) {
        while (!should_stop()) {
            ChunkRange chunk;
            {
                std::lock_guard<std::mutex> lock(queue_mutex);
                if (pending_chunks.empty()) return;
                chunk = pending_chunks.front();
                pending_chunks.pop();
            }
            fetch_chunk(url, chunk);
        }
    }

    DownloadResult run_multithreaded(const HttpUrl& url, HashAlgorithm algorithm) {
        auto plan = policy.plan(total_size);
        const uint32_t workers = worker_count(total_size, plan.size());

        bool reuse_parts = false;
        if (request.enable_resume) {
            auto check = check_parts(job_id, total_size, plan);
            if (check.resumable()) {
                reuse_parts = true;
            } else if (check.status == ResumeStatus::Inconsistent) {
                Logger::instance().warning("Discarding inconsistent chunk state for " + request.url);
                resume_store.remove(job_id);
            }
        }
        if (!reuse_parts) {
            remove_part_files();
        }

        std::vector<std::string> parts;
        parts.reserve(plan.size());
        uint32_t reused = 0;
        uint64_t reused_bytes = 0;
        for (const auto& chunk : plan) {
            std::string part = part_path(chunk.id);
            parts.push_back(part);
            if (reuse_parts && IntegrityVerifier::verify_chunk(part, chunk.size_bytes)) {
                register_temp(part);
                ++reused;
                reused_bytes += chunk.size_bytes;
                continue;
            }
            remove_quietly(part);
            pending_chunks.push(chunk);
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            downloaded = reused_bytes;
            completed_bytes = reused_bytes;
        }
        if (reused > 0) {
            Logger::instance().info("Reusing " + std::to_string(reused) + " completed chunks for " + request.url);
        }

        Logger::instance().info("Downloading " + request.url + " (" + format_file_size(total_size) + ") in " +
                                std::to_string(plan.size()) + " chunks with " + std::to_string(workers) +
                                " workers");

        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (uint32_t i = 0; i < workers; ++i) {
            threads.emplace_back([this, &url]() { worker_loop(url); });
        }
        for (auto& t : threads) {
            t.join();
        }

        if (cancelled.load()) {
            uint64_t kept;
            {
                std::lock_guard<std::mutex> lock(mutex);
                kept = completed_bytes;
            }
            return cancel_job(kept);
        }
        if (has_error()) {
            if (request.enable_resume) {
                // completed parts stay for the next attempt
                uint64_t kept;
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    kept = completed_bytes;
                }
                save_progress_record(kept);
            } else {
                cleanup_temp_files();
            }
            return fail_with_first_error();
        }

        const std::string merged = merged_path();
        auto merge = IntegrityVerifier::merge_and_verify(parts, merged, total_size,
                                                         request.expected_checksum, algorithm);
        if (!merge.success) {
            cleanup_temp_files();
            resume_store.remove(job_id);
            Logger::instance().error("Merge of " + request.url + " failed: " + merge.message);
            return finish(DownloadState::Failed, merge.error, merge.message);
        }

        std::error_code ec;
        fs::rename(merged, request.destination_path, ec);
        if (ec) {
            return finish(DownloadState::Failed, ErrorCode::ResourceError,
                          "Download failed: cannot move " + merged + " into place: " + ec.message());
        }
        cleanup_temp_files();
        resume_store.remove(job_id);
        return complete();
    }

    void cleanup_temp_files() {
        std::vector<std::string> files;
        {
            std::lock_guard<std::mutex> lock(mutex);
            files.swap(temp_files);
        }
        for (const auto& f : files) {
            remove_quietly(f);
        }
    }
};

ChunkedDownloadClient::ChunkedDownloadClient(DownloadRequest request, const TransferConfig& config)
    : impl_(std::make_unique<Impl>(std::move(request), config)) {}

ChunkedDownloadClient::~ChunkedDownloadClient() = default;

std::string ChunkedDownloadClient::make_job_id(const std::string& url,
                                               const std::string& destination,
                                               uint64_t total_size) {
    return IntegrityVerifier::digest(url + "_" + destination + "_" + std::to_string(total_size),
                                     HashAlgorithm::MD5);
}

DownloadResult ChunkedDownloadClient::download() {
    auto& impl = *impl_;
    if (impl.started.exchange(true)) {
        DownloadResult result;
        result.state = state();
        result.error = ErrorCode::InvalidArgument;
        result.message = "Download already started";
        return result;
    }

    if (impl.cancelled.load()) {
        return impl.cancel_job(0);
    }
    impl.set_state(DownloadState::Downloading);

    auto algorithm = parse_hash_algorithm(impl.request.checksum_algorithm);
    if (!algorithm) {
        return impl.finish(DownloadState::Failed, ErrorCode::InvalidArgument,
                           "Download failed: unsupported checksum algorithm " + impl.request.checksum_algorithm);
    }
    auto url = HttpUrl::parse(impl.request.url);
    if (!url) {
        return impl.finish(DownloadState::Failed, ErrorCode::InvalidArgument,
                           "Download failed: invalid URL " + impl.request.url);
    }

    if (impl.total_size == 0) {
        std::string error;
        ErrorCode code = ErrorCode::Success;
        if (!impl.probe_size(error, code)) {
            Logger::instance().error("Cannot determine size of " + impl.request.url + ": " + error);
            return impl.finish(DownloadState::Failed, code, "Download failed: " + error);
        }
    }

    if (impl.total_size == 0) {
        // Nothing to fetch; an empty destination is the whole file
        std::ofstream touch(impl.request.destination_path, std::ios::binary | std::ios::trunc);
        if (!touch.is_open()) {
            return impl.finish(DownloadState::Failed, ErrorCode::PermissionDenied,
                               "Download failed: cannot create " + impl.request.destination_path);
        }
        return impl.complete();
    }

    if (impl.policy.should_use_multithread(impl.total_size)) {
        return impl.run_multithreaded(*url, *algorithm);
    }
    return impl.run_sequential(*url, *algorithm);
}

void ChunkedDownloadClient::cancel() {
    if (!impl_->cancelled.exchange(true)) {
        Logger::instance().info("Cancelling download of " + impl_->request.url);
    }
}

bool ChunkedDownloadClient::is_cancelled() const {
    return impl_->cancelled.load();
}

DownloadState ChunkedDownloadClient::state() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->state;
}

DownloadProgress ChunkedDownloadClient::progress() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->snapshot_locked();
}

ResumeCheck ChunkedDownloadClient::can_resume() const {
    std::string id = job_id();
    uint64_t total = total_size();
    if (!impl_->request.enable_resume || id.empty()) {
        return {};
    }
    if (impl_->policy.should_use_multithread(total)) {
        return impl_->check_parts(id, total, impl_->policy.plan(total));
    }
    return impl_->resume_store.check(id, impl_->partial_path(), total);
}

uint32_t ChunkedDownloadClient::worker_count() const {
    uint64_t total = total_size();
    return impl_->worker_count(total, impl_->policy.plan(total).size());
}

std::string ChunkedDownloadClient::job_id() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->job_id;
}

uint64_t ChunkedDownloadClient::total_size() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->total_size;
}

std::vector<ChunkRange> ChunkedDownloadClient::chunk_plan() const {
    return impl_->policy.plan(total_size());
}

void ChunkedDownloadClient::add_observer(DownloadObserver* observer) {
    if (!observer) return;
    std::lock_guard<std::mutex> lock(impl_->observer_mutex);
    impl_->observers.push_back(observer);
}

void ChunkedDownloadClient::remove_observer(DownloadObserver* observer) {
    std::lock_guard<std::mutex> lock(impl_->observer_mutex);
    auto& obs = impl_->observers;
    obs.erase(std::remove(obs.begin(), obs.end(), observer), obs.end());
}

} // namespace lanshare
