#include <iostream>
#include <memory>
#include <string>
#include <csignal>
#include <thread>
#include <chrono>
#include <atomic>
#include <filesystem>

#include <fmt/format.h>

#include "lanshare/base/logger.h"
#include "lanshare/base/config.h"
#include "lanshare/base/error_code.h"
#include "lanshare/server/share_catalog.h"
#include "lanshare/server/access_gate.h"
#include "lanshare/server/file_server.h"
#include "lanshare/discovery/peer_registry.h"
#include "lanshare/discovery/peer_discovery.h"
#include "lanshare/client/catalog_client.h"
#include "lanshare/client/download_manager.h"
#include "lanshare/transfer/chunked_download_client.h"

using namespace lanshare;

// Global flag for signal handling
static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

namespace {

class PeerLogger : public PeerRegistryObserver {
public:
    void on_peers_changed(const PeerList& peers) override {
        Logger::instance().info("Known peers: " + std::to_string(peers.size()));
        for (const auto& p : peers) {
            Logger::instance().debug("  " + p.url);
        }
    }
};

class ConsoleProgress : public DownloadObserver {
public:
    void on_progress(const DownloadProgress& p) override {
        std::cout << fmt::format("\r{:6.2f}%  {} / {}  {:.2f} MB/s  [{}]",
                                 p.percent, format_file_size(p.downloaded_bytes),
                                 format_file_size(p.total_bytes), p.speed_mbps, to_string(p.state))
                  << std::flush;
        if (is_terminal(p.state)) std::cout << std::endl;
    }
};

class ManagerProgress : public DownloadManagerObserver {
public:
    void on_download_update(const DownloadStatus& s) override {
        if (is_terminal(s.state)) {
            Logger::instance().info("{} -> {} [{}] {}", s.file_name, s.save_path, to_string(s.state), s.message);
        }
    }
};

void configure_logging(const LogConfig& log) {
    Logger::instance().set_level(parse_log_level(log.level));
    if (log.output == "stderr") {
        Logger::instance().set_output(LogOutput::Stderr);
    } else if (log.output == "file" && !log.file_path.empty()) {
        if (!Logger::instance().set_file_output(log.file_path)) {
            Logger::instance().warning("Cannot open log file " + log.file_path + ", logging to stdout");
        }
    }
}

std::string default_output_for(const std::string& url, const std::string& download_dir) {
    std::string name = url;
    auto query = name.find('?');
    if (query != std::string::npos) name.resize(query);
    auto slash = name.find_last_of('/');
    if (slash != std::string::npos) name = name.substr(slash + 1);
    if (name.empty()) name = "download";
    return (std::filesystem::path(download_dir) / name).string();
}

} // anonymous namespace

class LanShareApplication {
public:
    LanShareApplication() = default;
    ~LanShareApplication() {
        stop();
    }

    bool initialize(int argc, char* argv[]) {
        Config::instance().load_from_env();

        // Returns false for --help, --version and parse errors
        if (!Config::instance().parse_command_line(argc, argv)) {
            return false;
        }

        auto& config = Config::instance().get();
        configure_logging(config.log);

        if (!Config::instance().validate()) {
            return false;
        }
        Config::instance().print();
        return true;
    }

    int run_list() {
        const auto& config = Config::instance().get();
        CatalogClient catalog(config.client);
        std::vector<RemoteFile> files;
        try {
            files = catalog.list_files(config.command.list_url);
        } catch (const LanShareError& e) {
            Logger::instance().error("Cannot list " + config.command.list_url + ": " + e.what());
            return 1;
        }

        std::cout << fmt::format("{} file(s) shared by {}", files.size(), config.command.list_url) << std::endl;
        for (const auto& f : files) {
            std::cout << fmt::format("  {:36}  {:>10}  {}  {}{}", f.id, f.size, f.modified,
                                     f.folder.empty() ? "" : f.folder + "/", f.name)
                      << std::endl;
        }

        if (config.command.get_ids.empty()) return 0;

        DownloadManager manager(config.transfer, config.client);
        ManagerProgress progress;
        manager.add_observer(&progress);
        for (const auto& id : config.command.get_ids) {
            auto file = catalog.find(config.command.list_url, id);
            if (!file) {
                Logger::instance().error("No file with id " + id + " on " + config.command.list_url);
                continue;
            }
            manager.download(config.command.list_url, *file);
        }
        manager.wait_all();
        manager.remove_observer(&progress);

        int failures = 0;
        for (const auto& s : manager.all()) {
            if (s.state != DownloadState::Completed) ++failures;
        }
        return failures == 0 ? 0 : 1;
    }

    int run_fetch() {
        const auto& config = Config::instance().get();
        DownloadRequest request;
        request.url = config.command.fetch_url;
        request.destination_path = config.command.output_path.empty()
            ? default_output_for(request.url, config.client.download_dir)
            : config.command.output_path;
        request.checksum_algorithm = config.transfer.checksum_algorithm;
        request.enable_resume = config.transfer.enable_resume;
        request.token = config.client.token;
        if (!config.command.expected_checksum.empty()) {
            request.expected_checksum = config.command.expected_checksum;
        }

        ChunkedDownloadClient client(request, config.transfer);
        ConsoleProgress progress;
        client.add_observer(&progress);

        // Cancel on SIGINT so the resume record gets written
        std::atomic<bool> finished{false};
        std::thread watcher([&] {
            while (!finished.load()) {
                if (!g_running) {
                    client.cancel();
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        auto result = client.download();
        finished = true;
        watcher.join();
        client.remove_observer(&progress);

        if (!result.success) {
            Logger::instance().error("{} ({}): {}", to_string(result.state), to_string(result.error), result.message);
            return 1;
        }
        Logger::instance().info("Saved " + request.destination_path);
        return 0;
    }

    bool start_share() {
        const auto& config = Config::instance().get();
        Logger::instance().info("Starting LanShare...");

        catalog_ = std::make_unique<ShareCatalog>(config.server);
        for (const auto& path : config.command.share_paths) {
            std::error_code ec;
            if (std::filesystem::is_directory(path, ec)) {
                auto ids = catalog_->add_folder(path);
                Logger::instance().info("Shared " + std::to_string(ids.size()) + " file(s) from " + path);
            } else if (!catalog_->add_file(path)) {
                Logger::instance().warning("Skipped " + path);
            }
        }

        gate_ = std::make_unique<TokenAccessGate>(config.security);
        if (config.security.enable_auth) {
            Logger::instance().info("Access token: " + gate_->generate_token());
        }

        ServerContext context{*catalog_, gate_.get(), config.server};
        file_server_ = std::make_unique<FileServer>(config.node, context);
        if (!file_server_->start()) {
            Logger::instance().error("Failed to start file server");
            return false;
        }
        Logger::instance().info("File server listening on port " +
                                std::to_string(file_server_->get_listen_port()));

        registry_ = std::make_unique<PeerRegistry>(std::chrono::seconds(config.discovery.stale_timeout_sec));
        registry_->add_observer(&peer_logger_);
        if (config.discovery.enable) {
            discovery_ = std::make_unique<PeerDiscovery>(config.node, config.discovery, *registry_);
            if (!discovery_->start()) {
                Logger::instance().warning("Peer discovery unavailable, serving without it");
                discovery_.reset();
            }
        }

        Logger::instance().info("Sharing " + std::to_string(catalog_->size()) + " file(s), " +
                                format_file_size(catalog_->total_bytes()));
        return true;
    }

    void run_share() {
        auto last_cleanup = std::chrono::steady_clock::now();
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            auto now = std::chrono::steady_clock::now();
            if (now - last_cleanup >= std::chrono::seconds(60)) {
                last_cleanup = now;
                if (discovery_) discovery_->cleanup();
                if (gate_) gate_->cleanup_expired_tokens();
            }
        }
        stop();
    }

    void stop() {
        if (stopped_) return;
        stopped_ = true;
        if (!file_server_ && !discovery_) return;

        Logger::instance().info("Stopping LanShare...");
        if (discovery_) {
            discovery_->stop();
        }
        if (file_server_) {
            file_server_->stop();
        }
        if (registry_) {
            registry_->remove_observer(&peer_logger_);
        }
        Logger::instance().info("LanShare stopped");
    }

private:
    std::unique_ptr<ShareCatalog> catalog_;
    std::unique_ptr<TokenAccessGate> gate_;
    std::unique_ptr<FileServer> file_server_;
    std::unique_ptr<PeerRegistry> registry_;
    std::unique_ptr<PeerDiscovery> discovery_;
    PeerLogger peer_logger_;
    bool stopped_ = false;
};

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        LanShareApplication app;

        if (!app.initialize(argc, argv)) {
            return 1;
        }

        const auto& command = Config::instance().get().command;
        if (!command.list_url.empty()) {
            return app.run_list();
        }
        if (!command.fetch_url.empty()) {
            return app.run_fetch();
        }

        if (!app.start_share()) {
            std::cerr << "Failed to start application" << std::endl;
            return 1;
        }
        app.run_share();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
