#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <filesystem>
#include <mutex>
#include <thread>
#include <vector>
#include "lanshare/base/config.h"
#include "lanshare/client/catalog_client.h"
#include "lanshare/client/download_manager.h"
#include "lanshare/http/fetcher.h"
#include "lanshare/server/access_gate.h"
#include "lanshare/server/file_server.h"
#include "lanshare/server/share_catalog.h"
#include "lanshare/transfer/chunked_download_client.h"
#include "lanshare/transfer/integrity_verifier.h"
#include "lanshare/transfer/resume_store.h"
#include "test_support.h"

using namespace lanshare;
using lanshare::test::TempDir;

namespace {

class ProgressRecorder : public DownloadObserver {
public:
    void on_progress(const DownloadProgress& p) override {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(p);
    }
    std::vector<DownloadProgress> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }

private:
    std::mutex mutex;
    std::vector<DownloadProgress> events;
};

class CancelOnFirstUpdate : public DownloadObserver {
public:
    explicit CancelOnFirstUpdate(ChunkedDownloadClient& client) : client_(client) {}
    void on_progress(const DownloadProgress&) override { client_.cancel(); }

private:
    ChunkedDownloadClient& client_;
};

class StatusRecorder : public DownloadManagerObserver {
public:
    void on_download_update(const DownloadStatus& s) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (is_terminal(s.state)) ++terminal_updates;
    }
    int terminal() {
        std::lock_guard<std::mutex> lock(mutex);
        return terminal_updates;
    }

private:
    std::mutex mutex;
    int terminal_updates = 0;
};

// A sharing peer on 127.0.0.1 with an ephemeral port
struct LocalPeer {
    TempDir dir{"peer"};
    ShareCatalog catalog;
    std::unique_ptr<TokenAccessGate> gate;
    std::unique_ptr<FileServer> server;

    explicit LocalPeer(bool require_token = false) {
        SecurityConfig security;
        security.enable_auth = require_token;
        security.rate_limit_per_minute = 0;
        gate = std::make_unique<TokenAccessGate>(security);

        NodeConfig node;
        node.bind_address = "127.0.0.1";
        node.service_port = 0;
        server = std::make_unique<FileServer>(node, ServerContext{catalog, gate.get(), ServerConfig{}});
    }
    ~LocalPeer() { server->stop(); }

    std::string share(const std::string& name, const std::string& content) {
        auto path = dir.file(name);
        test::write_file(path, content);
        auto id = catalog.add_file(path);
        REQUIRE(id.has_value());
        return *id;
    }

    std::string base_url() const {
        return "http://127.0.0.1:" + std::to_string(server->get_listen_port());
    }
    std::string download_url(const std::string& id) const {
        return CatalogClient::download_url(base_url(), id);
    }
};

TransferConfig transfer_in(const TempDir& dir) {
    TransferConfig config;
    config.resume_dir = dir.file("resume");
    config.connection_timeout_sec = 5;
    config.download_timeout_sec = 60;
    return config;
}

} // anonymous namespace

TEST_CASE("Server answers range requests over the wire", "[e2e][server]") {
    LocalPeer peer;
    auto data = test::pattern_data(5000);
    auto id = peer.share("data.bin", data);
    REQUIRE(peer.server->start());
    REQUIRE(peer.server->is_running());
    REQUIRE(peer.server->get_listen_port() != 0);

    HttpFetcher fetcher;
    auto url = HttpUrl::parse(peer.download_url(id));
    REQUIRE(url.has_value());

    std::string body;
    auto collect = [&](const char* p, std::size_t n) {
        body.append(p, n);
        return true;
    };

    auto partial = fetcher.get(*url, {{"Range", "bytes=1000-"}}, nullptr, collect);
    REQUIRE(partial.head.status == 206);
    REQUIRE(partial.head.header("content-range") == std::optional<std::string>("bytes 1000-4999/5000"));
    REQUIRE(body == data.substr(1000));

    body.clear();
    auto full = fetcher.get(*url, {}, nullptr, collect);
    REQUIRE(full.head.status == 200);
    REQUIRE(body == data);

    auto head = fetcher.head(*url);
    REQUIRE(head.status == 200);
    REQUIRE(head.content_length() == std::optional<uint64_t>(5000));

    body.clear();
    auto bad = fetcher.get(*url, {{"Range", "bytes=6000-7000"}}, nullptr, collect);
    REQUIRE(bad.head.status == 416);
    REQUIRE(bad.head.header("content-range") == std::optional<std::string>("bytes */5000"));

    auto missing = fetcher.get(*HttpUrl::parse(peer.download_url("nope")), {}, nullptr, nullptr);
    REQUIRE(missing.head.status == 404);

    peer.server->stop();
    REQUIRE_FALSE(peer.server->is_running());
    peer.server->stop();
}

TEST_CASE("Parallel chunked download is byte-identical", "[e2e][download][parallel]") {
    TempDir work("e2e_parallel");
    LocalPeer peer;
    const uint64_t size = 25 * MiB;
    auto data = test::pattern_data(size);
    auto id = peer.share("big.bin", data);
    REQUIRE(peer.server->start());

    DownloadRequest request;
    request.url = peer.download_url(id);
    request.destination_path = work.file("big.bin");
    request.total_size = size;
    request.worker_hint = 4;
    request.expected_checksum = IntegrityVerifier::digest(data);

    ChunkedDownloadClient client(request, transfer_in(work));
    REQUIRE(client.chunk_plan().size() == 13);
    REQUIRE(client.worker_count() == 4);

    ProgressRecorder progress;
    client.add_observer(&progress);
    auto result = client.download();

    REQUIRE(result.success);
    REQUIRE(result.state == DownloadState::Completed);
    REQUIRE(result.downloaded_bytes == size);
    REQUIRE(test::read_file(request.destination_path) == data);
    REQUIRE(client.state() == DownloadState::Completed);

    auto events = progress.snapshot();
    REQUIRE_FALSE(events.empty());
    REQUIRE(events.back().state == DownloadState::Completed);
    REQUIRE(events.back().percent == 100.0);
    REQUIRE(events.back().downloaded_bytes == size);

    // Each received block is reported, so every chunk shows up at least once
    auto updates = std::count_if(events.begin(), events.end(), [](const DownloadProgress& p) {
        return p.state == DownloadState::Downloading && p.downloaded_bytes > 0;
    });
    REQUIRE(updates >= 13);
    for (const auto& p : events) {
        REQUIRE(p.downloaded_bytes <= size);
    }

    // No temporaries or resume state left behind
    for (uint32_t i = 0; i < 13; ++i) {
        REQUIRE_FALSE(std::filesystem::exists(request.destination_path + ".part" + std::to_string(i)));
    }
    REQUIRE_FALSE(std::filesystem::exists(request.destination_path + ".merged"));
    ResumeStore store(work.file("resume"));
    REQUIRE_FALSE(store.exists(result.job_id));

    SECTION("A second download() call is refused") {
        auto again = client.download();
        REQUIRE_FALSE(again.success);
        REQUIRE(again.error == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Worker count stays within the configured maximum", "[download][workers]") {
    TempDir work("workers");
    auto transfer = transfer_in(work);
    transfer.max_download_threads = 4;

    DownloadRequest request;
    request.url = "http://127.0.0.1:9/download/x";
    request.destination_path = work.file("x.bin");
    request.total_size = 12 * MiB;

    SECTION("Hint above the maximum") {
        request.worker_hint = 16;
        ChunkedDownloadClient client(request, transfer);
        REQUIRE(client.worker_count() == 4);
    }

    SECTION("Hint below the maximum") {
        request.worker_hint = 3;
        ChunkedDownloadClient client(request, transfer);
        REQUIRE(client.worker_count() == 3);
    }

    SECTION("No hint follows the size bands") {
        ChunkedDownloadClient client(request, transfer);
        REQUIRE(client.worker_count() == 2);
    }

    SECTION("Never more workers than chunks") {
        transfer.max_download_threads = 8;
        request.worker_hint = 16;
        ChunkedDownloadClient client(request, transfer);
        REQUIRE(client.chunk_plan().size() == 6);
        REQUIRE(client.worker_count() == 6);
    }
}

TEST_CASE("A failing chunk stops the parallel download", "[e2e][download][parallel]") {
    TempDir work("e2e_chunk_failure");
    LocalPeer peer;
    auto data = test::pattern_data(12 * MiB);
    auto id = peer.share("short.bin", data);
    REQUIRE(peer.server->start());

    // The claimed size is larger than the shared file, so chunk 6 gets 416
    auto transfer = transfer_in(work);
    ResumeStore store(transfer.resume_dir);
    DownloadRequest request;
    request.url = peer.download_url(id);
    request.destination_path = work.file("short.bin");
    request.total_size = 14 * MiB;
    request.worker_hint = 4;

    SECTION("Temporaries are removed without resume") {
        request.enable_resume = false;
        ChunkedDownloadClient client(request, transfer);
        REQUIRE(client.chunk_plan().size() == 7);

        auto result = client.download();
        REQUIRE_FALSE(result.success);
        REQUIRE(result.state == DownloadState::Failed);
        REQUIRE(result.error == ErrorCode::RangeNotSatisfiable);
        REQUIRE(result.message.rfind("Download failed: Chunk 6: ", 0) == 0);
        REQUIRE_FALSE(std::filesystem::exists(request.destination_path));
        REQUIRE_FALSE(std::filesystem::exists(request.destination_path + ".merged"));
        for (uint32_t i = 0; i < 7; ++i) {
            REQUIRE_FALSE(std::filesystem::exists(request.destination_path + ".part" + std::to_string(i)));
        }
        REQUIRE_FALSE(store.exists(result.job_id));
    }

    SECTION("Completed chunks are kept for the next attempt") {
        ChunkedDownloadClient client(request, transfer);
        auto result = client.download();
        REQUIRE(result.state == DownloadState::Failed);
        REQUIRE(result.error == ErrorCode::RangeNotSatisfiable);
        REQUIRE_FALSE(std::filesystem::exists(request.destination_path));

        // Chunk 6 is only handed out after three other chunks finished
        auto record = store.load(result.job_id);
        REQUIRE(record.has_value());
        REQUIRE(record->total_size == 14 * MiB);
        REQUIRE(record->downloaded >= 6 * MiB);

        auto check = client.can_resume();
        REQUIRE(check.resumable());
        REQUIRE(check.offset == record->downloaded);

        uint64_t kept = 0;
        for (const auto& chunk : client.chunk_plan()) {
            auto part = request.destination_path + ".part" + std::to_string(chunk.id);
            if (!std::filesystem::exists(part)) continue;
            REQUIRE(test::read_file(part) == data.substr(chunk.start_byte, chunk.size_bytes));
            kept += chunk.size_bytes;
        }
        REQUIRE(kept == record->downloaded);
    }
}

TEST_CASE("Small files stream sequentially and probe their size", "[e2e][download][sequential]") {
    TempDir work("e2e_seq");
    LocalPeer peer;
    auto data = test::pattern_data(300 * 1024);
    auto id = peer.share("small.bin", data);
    auto empty_id = peer.share("empty.bin", "");
    REQUIRE(peer.server->start());

    SECTION("Unknown size is probed with HEAD") {
        DownloadRequest request;
        request.url = peer.download_url(id);
        request.destination_path = work.file("small.bin");
        ChunkedDownloadClient client(request, transfer_in(work));

        auto result = client.download();
        REQUIRE(result.success);
        REQUIRE(client.total_size() == data.size());
        REQUIRE(test::read_file(request.destination_path) == data);
        REQUIRE_FALSE(std::filesystem::exists(request.destination_path + ".partial"));
    }

    SECTION("Empty file") {
        DownloadRequest request;
        request.url = peer.download_url(empty_id);
        request.destination_path = work.file("empty.bin");
        ChunkedDownloadClient client(request, transfer_in(work));

        auto result = client.download();
        REQUIRE(result.success);
        REQUIRE(std::filesystem::exists(request.destination_path));
        REQUIRE(std::filesystem::file_size(request.destination_path) == 0);
    }

    SECTION("Unknown id") {
        DownloadRequest request;
        request.url = peer.download_url("no-such-id");
        request.destination_path = work.file("nothing.bin");
        ChunkedDownloadClient client(request, transfer_in(work));

        auto result = client.download();
        REQUIRE_FALSE(result.success);
        REQUIRE(result.state == DownloadState::Failed);
        REQUIRE(result.error == ErrorCode::NotFound);
        REQUIRE_FALSE(std::filesystem::exists(request.destination_path));
    }

    SECTION("Nobody listening") {
        auto port = peer.server->get_listen_port();
        peer.server->stop();

        DownloadRequest request;
        request.url = "http://127.0.0.1:" + std::to_string(port) + "/download/" + id;
        request.destination_path = work.file("offline.bin");
        ChunkedDownloadClient client(request, transfer_in(work));

        auto result = client.download();
        REQUIRE_FALSE(result.success);
        REQUIRE(kind_of(result.error) == ErrorKind::Network);
    }
}

TEST_CASE("Checksum mismatch fails without publishing the file", "[e2e][download][integrity]") {
    TempDir work("e2e_checksum");
    LocalPeer peer;
    auto data = test::pattern_data(12 * MiB);
    auto id = peer.share("tampered.bin", data);
    REQUIRE(peer.server->start());

    auto transfer = transfer_in(work);
    DownloadRequest request;
    request.url = peer.download_url(id);
    request.total_size = data.size();
    request.expected_checksum = std::string(64, '0');

    SECTION("Parallel path") {
        request.destination_path = work.file("parallel.bin");
        ChunkedDownloadClient client(request, transfer);
        auto result = client.download();
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == ErrorCode::ChecksumMismatch);
        REQUIRE(kind_of(result.error) == ErrorKind::Integrity);
        REQUIRE(result.message == "Checksum mismatch: file may be corrupted");
        REQUIRE_FALSE(std::filesystem::exists(request.destination_path));
    }

    SECTION("Sequential path") {
        transfer.enable_multithread = false;
        request.destination_path = work.file("sequential.bin");
        ChunkedDownloadClient client(request, transfer);
        auto result = client.download();
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == ErrorCode::ChecksumMismatch);
        REQUIRE_FALSE(std::filesystem::exists(request.destination_path));
    }
}

TEST_CASE("Cancelled downloads leave a resume record", "[e2e][download][cancel]") {
    TempDir work("e2e_cancel");
    LocalPeer peer;
    auto data = test::pattern_data(16 * MiB);
    auto id = peer.share("cancel.bin", data);
    REQUIRE(peer.server->start());

    DownloadRequest request;
    request.url = peer.download_url(id);
    request.destination_path = work.file("cancel.bin");
    request.total_size = data.size();

    ChunkedDownloadClient client(request, transfer_in(work));
    CancelOnFirstUpdate canceller(client);
    client.add_observer(&canceller);

    auto result = client.download();
    REQUIRE_FALSE(result.success);
    REQUIRE(result.state == DownloadState::Cancelled);
    REQUIRE(result.error == ErrorCode::Cancelled);
    REQUIRE(client.is_cancelled());
    REQUIRE_FALSE(std::filesystem::exists(request.destination_path));

    ResumeStore store(work.file("resume"));
    REQUIRE(store.exists(client.job_id()));
    auto record = store.load(client.job_id());
    REQUIRE(record.has_value());
    REQUIRE(record->url == request.url);
    REQUIRE(record->total_size == data.size());
}

TEST_CASE("Cancelled parallel job reports its completed chunks", "[e2e][download][cancel][resume]") {
    TempDir work("e2e_cancel_parts");
    LocalPeer peer;
    auto data = test::pattern_data(12 * MiB);
    auto id = peer.share("parts.bin", data);
    REQUIRE(peer.server->start());

    auto transfer = transfer_in(work);
    ResumeStore store(transfer.resume_dir);
    DownloadRequest request;
    request.url = peer.download_url(id);
    request.destination_path = work.file("parts.bin");
    request.total_size = data.size();

    // Two whole chunks from an earlier attempt
    test::write_file(request.destination_path + ".part0", data.substr(0, 2 * MiB));
    test::write_file(request.destination_path + ".part1", data.substr(2 * MiB, 2 * MiB));
    auto job_id = ChunkedDownloadClient::make_job_id(request.url, request.destination_path, data.size());
    REQUIRE(store.save(job_id, ResumeRecord{request.url, request.destination_path, data.size(),
                                            4 * MiB, std::nullopt, 0.0}));

    ChunkedDownloadClient client(request, transfer);
    CancelOnFirstUpdate canceller(client);
    client.add_observer(&canceller);

    auto result = client.download();
    REQUIRE(result.state == DownloadState::Cancelled);

    auto record = store.load(job_id);
    REQUIRE(record.has_value());
    REQUIRE(record->downloaded == 4 * MiB);

    auto check = client.can_resume();
    REQUIRE(check.resumable());
    REQUIRE(check.offset == 4 * MiB);

    SECTION("The next attempt finishes the file") {
        ChunkedDownloadClient again(request, transfer);
        REQUIRE(again.can_resume().resumable());
        auto finished = again.download();
        REQUIRE(finished.success);
        REQUIRE(test::read_file(request.destination_path) == data);
        REQUIRE_FALSE(store.exists(job_id));
    }
}

TEST_CASE("Cancel before start", "[e2e][download][cancel]") {
    TempDir work("e2e_cancel_early");
    DownloadRequest request;
    request.url = "http://127.0.0.1:9/download/x";
    request.destination_path = work.file("x.bin");
    request.total_size = 100;

    ChunkedDownloadClient client(request, transfer_in(work));
    client.cancel();
    auto result = client.download();
    REQUIRE(result.state == DownloadState::Cancelled);
    REQUIRE(client.state() == DownloadState::Cancelled);
}

TEST_CASE("Interrupted downloads resume", "[e2e][download][resume]") {
    TempDir work("e2e_resume");
    LocalPeer peer;
    REQUIRE(peer.server->start());
    auto transfer = transfer_in(work);
    ResumeStore store(transfer.resume_dir);

    SECTION("Sequential download continues from the partial file") {
        auto data = test::pattern_data(MiB);
        auto id = peer.share("seq.bin", data);

        DownloadRequest request;
        request.url = peer.download_url(id);
        request.destination_path = work.file("seq.bin");
        request.total_size = data.size();

        const uint64_t have = 400000;
        test::write_file(request.destination_path + ".partial", data.substr(0, have));
        auto job_id = ChunkedDownloadClient::make_job_id(request.url, request.destination_path, data.size());
        ResumeRecord record{request.url, request.destination_path, data.size(), have, std::nullopt, 0.0};
        REQUIRE(store.save(job_id, record));

        ChunkedDownloadClient client(request, transfer);
        auto check = client.can_resume();
        REQUIRE(check.resumable());
        REQUIRE(check.offset == have);

        auto result = client.download();
        REQUIRE(result.success);
        REQUIRE(test::read_file(request.destination_path) == data);
        REQUIRE_FALSE(store.exists(job_id));
    }

    SECTION("Inconsistent record restarts from zero") {
        auto data = test::pattern_data(MiB);
        auto id = peer.share("restart.bin", data);

        DownloadRequest request;
        request.url = peer.download_url(id);
        request.destination_path = work.file("restart.bin");
        request.total_size = data.size();

        test::write_file(request.destination_path + ".partial", std::string(1000, 'z'));
        auto job_id = ChunkedDownloadClient::make_job_id(request.url, request.destination_path, data.size());
        ResumeRecord record{request.url, request.destination_path, data.size(), 5000, std::nullopt, 0.0};
        REQUIRE(store.save(job_id, record));

        ChunkedDownloadClient client(request, transfer);
        REQUIRE(client.can_resume().status == ResumeStatus::Inconsistent);
        auto result = client.download();
        REQUIRE(result.success);
        REQUIRE(test::read_file(request.destination_path) == data);
    }

    SECTION("Completed chunks are reused under a matching record") {
        auto data = test::pattern_data(12 * MiB);
        auto id = peer.share("chunks.bin", data);

        DownloadRequest request;
        request.url = peer.download_url(id);
        request.destination_path = work.file("chunks.bin");
        request.total_size = data.size();

        // A part file of the right size is trusted, so marker bytes survive the merge
        std::string marker(2 * MiB, 'M');
        test::write_file(request.destination_path + ".part0", marker);
        auto job_id = ChunkedDownloadClient::make_job_id(request.url, request.destination_path, data.size());
        REQUIRE(store.save(job_id, ResumeRecord{request.url, request.destination_path, data.size(),
                                                2 * MiB, std::nullopt, 0.0}));

        ChunkedDownloadClient client(request, transfer);
        REQUIRE(client.can_resume().resumable());
        auto result = client.download();
        REQUIRE(result.success);

        auto merged = test::read_file(request.destination_path);
        REQUIRE(merged.size() == data.size());
        REQUIRE(merged.substr(0, 2 * MiB) == marker);
        REQUIRE(merged.substr(2 * MiB) == data.substr(2 * MiB));
    }

    SECTION("Part files without a record are fetched again") {
        auto data = test::pattern_data(12 * MiB);
        auto id = peer.share("foreign.bin", data);

        DownloadRequest request;
        request.url = peer.download_url(id);
        request.destination_path = work.file("foreign.bin");
        request.total_size = data.size();

        // Left over from some other transfer to the same destination
        test::write_file(request.destination_path + ".part0", std::string(2 * MiB, 'X'));
        test::write_file(request.destination_path + ".part9", std::string(2 * MiB, 'X'));

        ChunkedDownloadClient client(request, transfer);
        REQUIRE(client.can_resume().status == ResumeStatus::NoRecord);
        auto result = client.download();
        REQUIRE(result.success);
        REQUIRE(test::read_file(request.destination_path) == data);
        REQUIRE_FALSE(std::filesystem::exists(request.destination_path + ".part9"));
    }

    SECTION("Part files that disagree with the record are fetched again") {
        auto data = test::pattern_data(12 * MiB);
        auto id = peer.share("stale.bin", data);

        DownloadRequest request;
        request.url = peer.download_url(id);
        request.destination_path = work.file("stale.bin");
        request.total_size = data.size();

        test::write_file(request.destination_path + ".part0", std::string(2 * MiB, 'X'));
        auto job_id = ChunkedDownloadClient::make_job_id(request.url, request.destination_path, data.size());
        REQUIRE(store.save(job_id, ResumeRecord{request.url, request.destination_path, data.size(),
                                                4 * MiB, std::nullopt, 0.0}));

        ChunkedDownloadClient client(request, transfer);
        REQUIRE(client.can_resume().status == ResumeStatus::Inconsistent);
        auto result = client.download();
        REQUIRE(result.success);
        REQUIRE(test::read_file(request.destination_path) == data);
        REQUIRE_FALSE(store.exists(job_id));
    }
}

TEST_CASE("Catalog client reads a live peer", "[e2e][catalog]") {
    LocalPeer peer;
    auto report_id = peer.share("Quarterly Report.pdf", "pdf bytes");
    peer.share("holiday.jpg", "jpg bytes");
    REQUIRE(peer.server->start());

    ClientConfig config;
    CatalogClient client(config);

    auto files = client.list_files(peer.base_url());
    REQUIRE(files.size() == 2);

    auto hits = client.search(peer.base_url(), "REPORT");
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].id == report_id);
    REQUIRE(hits[0].size_bytes == 9);
    REQUIRE(hits[0].extension == ".pdf");

    REQUIRE(client.find(peer.base_url(), report_id).has_value());
    REQUIRE_FALSE(client.find(peer.base_url(), "missing").has_value());

    SECTION("Cached listing survives the peer going away") {
        peer.server->stop();
        REQUIRE(client.list_files(peer.base_url()).size() == 2);
        REQUIRE_THROWS_AS(client.list_files(peer.base_url(), true), LanShareError);
    }

    SECTION("Trailing slash is the same server") {
        REQUIRE(client.list_files(peer.base_url() + "/").size() == 2);
        REQUIRE(CatalogClient::download_url(peer.base_url() + "/", "abc") == peer.base_url() + "/download/abc");
        REQUIRE(CatalogClient::preview_url(peer.base_url(), "abc") == peer.base_url() + "/files/abc");
    }
}

TEST_CASE("Catalog client and downloads honour tokens", "[e2e][catalog][auth]") {
    TempDir work("e2e_auth");
    LocalPeer peer(true);
    auto data = test::pattern_data(64 * 1024);
    auto id = peer.share("secret.bin", data);
    REQUIRE(peer.server->start());
    auto token = peer.gate->generate_token();

    ClientConfig config;
    CatalogClient client(config);
    try {
        client.list_files(peer.base_url());
        FAIL("listing without a token should fail");
    } catch (const LanShareError& e) {
        REQUIRE(e.code() == ErrorCode::AuthenticationFailed);
        REQUIRE(e.kind() == ErrorKind::Access);
    }

    client.set_token(token);
    REQUIRE(client.list_files(peer.base_url()).size() == 1);

    DownloadRequest request;
    request.url = peer.download_url(id);
    request.destination_path = work.file("secret.bin");

    SECTION("Without a token") {
        ChunkedDownloadClient anonymous(request, transfer_in(work));
        auto result = anonymous.download();
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == ErrorCode::AuthenticationFailed);
    }

    SECTION("With a token") {
        request.token = token;
        ChunkedDownloadClient authorised(request, transfer_in(work));
        auto result = authorised.download();
        REQUIRE(result.success);
        REQUIRE(test::read_file(request.destination_path) == data);
    }
}

TEST_CASE("Catalog parsing rejects malformed listings", "[catalog][parse]") {
    auto files = CatalogClient::parse_catalog(
        R"([{"id":"a","name":"x.txt","size":"1 B","size_bytes":1,"modified":"2024-01-01 00:00:00","folder":"","extension":".txt"}])");
    REQUIRE(files.size() == 1);
    REQUIRE(files[0].name == "x.txt");

    REQUIRE(CatalogClient::parse_catalog("[]").empty());
    REQUIRE_THROWS_AS(CatalogClient::parse_catalog(R"({"files":[]})"), LanShareError);
    REQUIRE_THROWS_AS(CatalogClient::parse_catalog(R"([{"name":"no id"}])"), LanShareError);
    REQUIRE_THROWS_AS(CatalogClient::parse_catalog("<html>"), LanShareError);
}

TEST_CASE("Download manager runs catalog downloads", "[e2e][manager]") {
    TempDir work("e2e_manager");
    LocalPeer peer;
    auto a = test::pattern_data(200 * 1024);
    auto b = test::pattern_data(300 * 1024);
    auto c = test::pattern_data(400 * 1024);
    peer.share("a.bin", a);
    peer.share("b.bin", b);
    peer.share("c.bin", c);
    REQUIRE(peer.server->start());

    ClientConfig client_config;
    client_config.download_dir = work.file("downloads");
    CatalogClient catalog(client_config);
    auto files = catalog.list_files(peer.base_url());
    REQUIRE(files.size() == 3);

    auto transfer = transfer_in(work);
    transfer.max_concurrent_downloads = 2;

    // An existing a.bin forces the name to be deduplicated
    std::filesystem::create_directories(client_config.download_dir);
    test::write_file(work.file("downloads/a.bin"), "already here");

    StatusRecorder recorder;
    {
        DownloadManager manager(transfer, client_config);
        manager.add_observer(&recorder);
        auto ids = manager.download_many(peer.base_url(), files);
        REQUIRE(ids.size() == 3);
        REQUIRE(ids[0] == peer.base_url() + "_" + files[0].id);

        manager.wait_all();
        REQUIRE(manager.active_count() == 0);

        auto statuses = manager.all();
        REQUIRE(statuses.size() == 3);
        for (const auto& s : statuses) {
            REQUIRE(s.state == DownloadState::Completed);
            REQUIRE(s.percent == 100.0);
        }

        auto a_status = std::find_if(statuses.begin(), statuses.end(),
                                     [](const DownloadStatus& s) { return s.file_name == "a.bin"; });
        REQUIRE(a_status != statuses.end());
        REQUIRE(std::filesystem::path(a_status->save_path).filename() == "a_1.bin");

        REQUIRE_FALSE(manager.cancel(ids[0]));
        REQUIRE(manager.clear_completed() == 3);
        REQUIRE(manager.all().empty());
        REQUIRE_FALSE(manager.status(ids[0]).has_value());
        manager.remove_observer(&recorder);
    }

    REQUIRE(recorder.terminal() == 3);
    REQUIRE(test::read_file(work.file("downloads/a.bin")) == "already here");
    REQUIRE(test::read_file(work.file("downloads/a_1.bin")) == a);
    REQUIRE(test::read_file(work.file("downloads/b.bin")) == b);
    REQUIRE(test::read_file(work.file("downloads/c.bin")) == c);
}

TEST_CASE("Unique destination names", "[manager][names]") {
    TempDir dir("names");
    REQUIRE(DownloadManager::unique_destination(dir.path().string(), "photo.jpg") == dir.file("photo.jpg"));

    test::write_file(dir.file("photo.jpg"), "x");
    REQUIRE(DownloadManager::unique_destination(dir.path().string(), "photo.jpg") == dir.file("photo_1.jpg"));

    test::write_file(dir.file("photo_1.jpg"), "x");
    REQUIRE(DownloadManager::unique_destination(dir.path().string(), "photo.jpg") == dir.file("photo_2.jpg"));

    test::write_file(dir.file("README"), "x");
    REQUIRE(DownloadManager::unique_destination(dir.path().string(), "README") == dir.file("README_1"));
}
