#ifndef LANSHARE_BASE_CONFIG_H
#define LANSHARE_BASE_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lanshare {

constexpr uint64_t KiB = 1024;
constexpr uint64_t MiB = 1024 * KiB;
constexpr uint64_t GiB = 1024 * MiB;

// Log configuration
struct LogConfig {
    std::string level = "info";
    std::string output = "stdout";  // stdout, stderr, file
    std::string file_path = "";
};

// Node identity on the LAN
struct NodeConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t service_port = 8000;    // HTTP file server
    uint16_t discovery_port = 8001;  // UDP beacons
};

// File server configuration
struct ServerConfig {
    uint32_t scheduler_threads = 2;
    uint32_t max_request_head_bytes = 16 * 1024;
    uint64_t max_file_size_mb = 10240;
    uint64_t warn_file_size_mb = 1024;
};

// Download engine configuration
struct TransferConfig {
    bool enable_multithread = true;
    uint64_t multithread_min_size = 10 * MiB;
    uint32_t max_download_threads = 4;
    uint64_t thread_chunk_size = 2 * MiB;
    uint32_t connection_timeout_sec = 30;
    uint32_t download_timeout_sec = 300;
    uint32_t max_concurrent_downloads = 5;
    uint32_t speed_window = 10;
    bool enable_resume = true;
    std::string resume_dir;  // empty means $HOME/.lan_file_share/resume
    std::string checksum_algorithm = "sha256";
};

// Peer discovery configuration
struct DiscoveryConfig {
    bool enable = true;
    bool enable_scan = true;
    uint32_t broadcast_interval_sec = 30;
    uint32_t scan_interval_sec = 300;
    uint32_t stale_timeout_sec = 300;
    uint32_t probe_timeout_ms = 2000;
    uint32_t probe_delay_ms = 100;
    uint32_t error_backoff_sec = 5;
    uint32_t scan_error_backoff_sec = 60;
    std::string broadcast_address = "255.255.255.255";
    std::string arp_table_path = "/proc/net/arp";
};

// Pre-request access gate
struct SecurityConfig {
    bool enable_auth = false;
    uint32_t token_expiry_hours = 24;
    uint32_t rate_limit_per_minute = 60;
    std::vector<std::string> allowed_ips;
    std::vector<std::string> blocked_ips;
};

// Remote catalog client
struct ClientConfig {
    std::string download_dir = ".";
    uint32_t catalog_cache_sec = 60;
    std::optional<std::string> token;
};

// What the process was asked to do on the command line
struct CommandConfig {
    std::vector<std::string> share_paths;
    std::string list_url;
    std::vector<std::string> get_ids;  // catalog ids to download from list_url
    std::string fetch_url;
    std::string output_path;
    std::string expected_checksum;
};

// Global configuration
struct GlobalConfig {
    LogConfig log;
    NodeConfig node;
    ServerConfig server;
    TransferConfig transfer;
    DiscoveryConfig discovery;
    SecurityConfig security;
    ClientConfig client;
    CommandConfig command;
};

struct FileSizeCheck {
    bool allowed = true;
    std::optional<std::string> message;  // set for rejections and warnings
};

// "512 B", "1.5 KB", "12.0 MB", "1.25 GB"
std::string format_file_size(uint64_t size_bytes);
FileSizeCheck validate_file_size(uint64_t size_bytes, const ServerConfig& config);

class Config {
public:
    static Config& instance();

    // Load configuration from file (INI, or JSON by extension)
    bool load_from_file(const std::string& path);

    // Load configuration from LANSHARE_* environment variables
    bool load_from_env();

    // Parse command line arguments and override config.
    // Returns false for --help/--version and for parse errors.
    bool parse_command_line(int argc, char* argv[]);

    const GlobalConfig& get() const { return config_; }
    GlobalConfig& get() { return config_; }

    const std::string& get_config_file() const { return config_file_; }

    bool validate() const;

    void print() const;

    // Restore defaults; used by tests
    void reset();

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    using Sections = std::map<std::string, std::map<std::string, std::string>>;

    bool load_json(const std::string& path, Sections& sections);
    void apply_sections(const Sections& sections);

    GlobalConfig config_;
    std::string config_file_;
};

} // namespace lanshare

#endif // LANSHARE_BASE_CONFIG_H
