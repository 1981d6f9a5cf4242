#include "lanshare/base/config.h"
#include "lanshare/base/logger.h"
#include "CLI/CLI.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace lanshare {

using json = nlohmann::json;

namespace {

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

bool parse_bool(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    return v == "true" || v == "1" || v == "yes" || v == "on";
}

std::vector<std::string> parse_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

// Simple INI-style parser for config files
void parse_ini_file(const std::string& path, std::map<std::string, std::map<std::string, std::string>>& sections) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string current_section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            sections[current_section];
            continue;
        }

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            // Remove quotes
            if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
                value = value.substr(1, value.size() - 2);
            }
            sections[current_section][key] = value;
        }
    }
}

std::string json_scalar_to_string(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
    if (value.is_array()) {
        std::string joined;
        for (const auto& item : value) {
            if (!joined.empty()) joined += ",";
            joined += json_scalar_to_string(item);
        }
        return joined;
    }
    return value.dump();
}

} // anonymous namespace

std::string format_file_size(uint64_t size_bytes) {
    char buf[64];
    if (size_bytes < KiB) {
        std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(size_bytes));
    } else if (size_bytes < MiB) {
        std::snprintf(buf, sizeof(buf), "%.1f KB", static_cast<double>(size_bytes) / KiB);
    } else if (size_bytes < GiB) {
        std::snprintf(buf, sizeof(buf), "%.1f MB", static_cast<double>(size_bytes) / MiB);
    } else {
        std::snprintf(buf, sizeof(buf), "%.2f GB", static_cast<double>(size_bytes) / GiB);
    }
    return buf;
}

FileSizeCheck validate_file_size(uint64_t size_bytes, const ServerConfig& config) {
    FileSizeCheck check;
    if (size_bytes > config.max_file_size_mb * MiB) {
        check.allowed = false;
        check.message = "File exceeds maximum size limit of " + std::to_string(config.max_file_size_mb) + " MB";
    } else if (size_bytes > config.warn_file_size_mb * MiB) {
        check.message = "Large file (" + format_file_size(size_bytes) + ") - transfer may take time";
    }
    return check;
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    config_ = GlobalConfig{};
    config_file_.clear();
}

bool Config::load_from_file(const std::string& path) {
    Logger::instance().info("Loading config from file: " + path);

    if (!std::filesystem::exists(path)) {
        Logger::instance().warning("Config file not found: " + path);
        return false;
    }

    Sections sections;
    std::string ext = std::filesystem::path(path).extension().string();
    if (ext == ".json") {
        if (!load_json(path, sections)) {
            return false;
        }
    } else {
        parse_ini_file(path, sections);
    }

    try {
        apply_sections(sections);
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid value in config file " + path + ": " + e.what());
        return false;
    }

    config_file_ = path;
    Logger::instance().info("Config loaded successfully from: " + path);
    return true;
}

bool Config::load_json(const std::string& path, Sections& sections) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::instance().error("Cannot open config file: " + path);
        return false;
    }

    json doc = json::parse(file, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        Logger::instance().error("Config file is not a JSON object: " + path);
        return false;
    }

    for (const auto& [section, values] : doc.items()) {
        if (!values.is_object()) {
            Logger::instance().warning("Ignoring non-object config section: " + section);
            continue;
        }
        auto& target = sections[section];
        for (const auto& [key, value] : values.items()) {
            target[key] = json_scalar_to_string(value);
        }
    }
    return true;
}

void Config::apply_sections(const Sections& sections) {
    auto section = [&](const char* name) -> const std::map<std::string, std::string>* {
        auto it = sections.find(name);
        return it == sections.end() ? nullptr : &it->second;
    };

    if (auto* s = section("log")) {
        if (s->count("level")) config_.log.level = s->at("level");
        if (s->count("output")) config_.log.output = s->at("output");
        if (s->count("file_path")) config_.log.file_path = s->at("file_path");
    }

    if (auto* s = section("node")) {
        if (s->count("bind_address")) config_.node.bind_address = s->at("bind_address");
        if (s->count("service_port")) config_.node.service_port = static_cast<uint16_t>(std::stoi(s->at("service_port")));
        if (s->count("discovery_port")) config_.node.discovery_port = static_cast<uint16_t>(std::stoi(s->at("discovery_port")));
    }

    if (auto* s = section("server")) {
        if (s->count("scheduler_threads")) config_.server.scheduler_threads = std::stoul(s->at("scheduler_threads"));
        if (s->count("max_file_size_mb")) config_.server.max_file_size_mb = std::stoull(s->at("max_file_size_mb"));
        if (s->count("warn_file_size_mb")) config_.server.warn_file_size_mb = std::stoull(s->at("warn_file_size_mb"));
    }

    if (auto* s = section("transfer")) {
        if (s->count("enable_multithread")) config_.transfer.enable_multithread = parse_bool(s->at("enable_multithread"));
        if (s->count("multithread_min_size")) config_.transfer.multithread_min_size = std::stoull(s->at("multithread_min_size"));
        if (s->count("max_download_threads")) config_.transfer.max_download_threads = std::stoul(s->at("max_download_threads"));
        if (s->count("thread_chunk_size")) config_.transfer.thread_chunk_size = std::stoull(s->at("thread_chunk_size"));
        if (s->count("connection_timeout_sec")) config_.transfer.connection_timeout_sec = std::stoul(s->at("connection_timeout_sec"));
        if (s->count("download_timeout_sec")) config_.transfer.download_timeout_sec = std::stoul(s->at("download_timeout_sec"));
        if (s->count("max_concurrent_downloads")) config_.transfer.max_concurrent_downloads = std::stoul(s->at("max_concurrent_downloads"));
        if (s->count("speed_window")) config_.transfer.speed_window = std::stoul(s->at("speed_window"));
        if (s->count("enable_resume")) config_.transfer.enable_resume = parse_bool(s->at("enable_resume"));
        if (s->count("resume_dir")) config_.transfer.resume_dir = s->at("resume_dir");
        if (s->count("checksum_algorithm")) config_.transfer.checksum_algorithm = s->at("checksum_algorithm");
    }

    if (auto* s = section("discovery")) {
        if (s->count("enable")) config_.discovery.enable = parse_bool(s->at("enable"));
        if (s->count("enable_scan")) config_.discovery.enable_scan = parse_bool(s->at("enable_scan"));
        if (s->count("broadcast_interval_sec")) config_.discovery.broadcast_interval_sec = std::stoul(s->at("broadcast_interval_sec"));
        if (s->count("scan_interval_sec")) config_.discovery.scan_interval_sec = std::stoul(s->at("scan_interval_sec"));
        if (s->count("stale_timeout_sec")) config_.discovery.stale_timeout_sec = std::stoul(s->at("stale_timeout_sec"));
        if (s->count("probe_timeout_ms")) config_.discovery.probe_timeout_ms = std::stoul(s->at("probe_timeout_ms"));
        if (s->count("probe_delay_ms")) config_.discovery.probe_delay_ms = std::stoul(s->at("probe_delay_ms"));
        if (s->count("broadcast_address")) config_.discovery.broadcast_address = s->at("broadcast_address");
    }

    if (auto* s = section("security")) {
        if (s->count("enable_auth")) config_.security.enable_auth = parse_bool(s->at("enable_auth"));
        if (s->count("token_expiry_hours")) config_.security.token_expiry_hours = std::stoul(s->at("token_expiry_hours"));
        if (s->count("rate_limit_per_minute")) config_.security.rate_limit_per_minute = std::stoul(s->at("rate_limit_per_minute"));
        if (s->count("allowed_ips")) config_.security.allowed_ips = parse_list(s->at("allowed_ips"));
        if (s->count("blocked_ips")) config_.security.blocked_ips = parse_list(s->at("blocked_ips"));
    }

    if (auto* s = section("client")) {
        if (s->count("download_dir")) config_.client.download_dir = s->at("download_dir");
        if (s->count("catalog_cache_sec")) config_.client.catalog_cache_sec = std::stoul(s->at("catalog_cache_sec"));
        if (s->count("token")) config_.client.token = s->at("token");
    }

    Logger::instance().set_level(parse_log_level(config_.log.level));
}

bool Config::load_from_env() {
    Logger::instance().info("Loading config from environment variables");

    try {
        if (const char* val = std::getenv("LANSHARE_BIND_ADDRESS")) {
            config_.node.bind_address = val;
        }
        if (const char* val = std::getenv("LANSHARE_SERVICE_PORT")) {
            config_.node.service_port = static_cast<uint16_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("LANSHARE_DISCOVERY_PORT")) {
            config_.node.discovery_port = static_cast<uint16_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("LANSHARE_LOG_LEVEL")) {
            config_.log.level = val;
            Logger::instance().set_level(parse_log_level(config_.log.level));
        }
        if (const char* val = std::getenv("LANSHARE_MAX_THREADS")) {
            config_.transfer.max_download_threads = std::stoul(val);
        }
        if (const char* val = std::getenv("LANSHARE_RESUME_DIR")) {
            config_.transfer.resume_dir = val;
        }
        if (const char* val = std::getenv("LANSHARE_DOWNLOAD_DIR")) {
            config_.client.download_dir = val;
        }
        if (const char* val = std::getenv("LANSHARE_TOKEN")) {
            config_.client.token = val;
        }
        if (const char* val = std::getenv("LANSHARE_ENABLE_AUTH")) {
            config_.security.enable_auth = parse_bool(val);
        }
    } catch (const std::exception& e) {
        Logger::instance().error(std::string("Invalid LANSHARE_* environment value: ") + e.what());
        return false;
    }
    return true;
}

bool Config::parse_command_line(int argc, char* argv[]) {
    // The config file is applied first so explicit flags override it
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string path;
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            path = argv[i + 1];
        } else if (arg.rfind("--config=", 0) == 0) {
            path = arg.substr(9);
        }
        if (!path.empty() && !load_from_file(path)) {
            return false;
        }
    }

    CLI::App app{"LanShare - LAN peer file sharing"};

    std::string config_file;
    std::string token;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    // Commands
    app.add_option("-s,--share", config_.command.share_paths, "File or folder to share (repeatable)");
    app.add_option("--list", config_.command.list_url, "Print the catalog of a peer (http://host:port)");
    app.add_option("-g,--get", config_.command.get_ids, "Catalog id to download from the --list peer (repeatable)");
    app.add_option("--fetch", config_.command.fetch_url, "Download a URL with the chunked client");
    app.add_option("-o,--output", config_.command.output_path, "Destination path for --fetch");
    app.add_option("--checksum", config_.command.expected_checksum, "Expected checksum for --fetch");
    app.add_option("--token", token, "Bearer token sent to peers");

    // Node options
    app.add_option("--bind-address", config_.node.bind_address, "Bind address");
    app.add_option("--port", config_.node.service_port, "HTTP file server port");
    app.add_option("--discovery-port", config_.node.discovery_port, "UDP discovery port");

    // Log options
    app.add_option("--log-level", config_.log.level, "Log level (debug, info, warning, error)");
    app.add_option("--log-output", config_.log.output, "Log output (stdout, stderr, file)");
    app.add_option("--log-file", config_.log.file_path, "Log file path");

    // Transfer options
    app.add_option("--threads", config_.transfer.max_download_threads, "Maximum download threads");
    app.add_option("--chunk-size", config_.transfer.thread_chunk_size, "Range request size (bytes)");
    app.add_option("--multithread-min-size", config_.transfer.multithread_min_size, "Minimum size for parallel download (bytes)");
    app.add_option("--connection-timeout", config_.transfer.connection_timeout_sec, "Connection timeout (seconds)");
    app.add_option("--download-timeout", config_.transfer.download_timeout_sec, "Per-request download timeout (seconds)");
    app.add_option("--max-downloads", config_.transfer.max_concurrent_downloads, "Maximum concurrent downloads");
    app.add_option("--resume-dir", config_.transfer.resume_dir, "Resume record directory");
    app.add_flag("--resume,!--no-resume", config_.transfer.enable_resume, "Enable resumable downloads");
    app.add_option("--download-dir", config_.client.download_dir, "Directory for catalog downloads");

    // Discovery options
    app.add_flag("--discovery,!--no-discovery", config_.discovery.enable, "Enable peer discovery");
    app.add_flag("--scan,!--no-scan", config_.discovery.enable_scan, "Enable active network scanning");
    app.add_option("--broadcast-interval", config_.discovery.broadcast_interval_sec, "Beacon interval (seconds)");
    app.add_option("--scan-interval", config_.discovery.scan_interval_sec, "Active scan interval (seconds)");

    // Security options
    app.add_flag("--auth", config_.security.enable_auth, "Require bearer tokens for every request");
    app.add_option("--allow-ip", config_.security.allowed_ips, "Allowed client address (repeatable)");
    app.add_option("--block-ip", config_.security.blocked_ips, "Blocked client address (repeatable)");
    app.add_option("--rate-limit", config_.security.rate_limit_per_minute, "Requests per minute per client");

    app.set_version_flag("-v,--version", "0.1.0");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Help and version exit with code 0 and should not be treated as errors
        int code = app.exit(e);
        if (code != 0) {
            std::cerr << "Command line parse error: " << e.what() << std::endl;
        }
        return false;
    }

    if (!token.empty()) {
        config_.client.token = token;
    }
    if (!config_.log.level.empty()) {
        Logger::instance().set_level(parse_log_level(config_.log.level));
    }

    return true;
}

bool Config::validate() const {
    if (config_.node.service_port == 0) {
        Logger::instance().error("node.service_port must be set");
        return false;
    }
    if (config_.node.discovery_port == config_.node.service_port) {
        Logger::instance().error("node.discovery_port must differ from node.service_port");
        return false;
    }
    if (config_.transfer.max_download_threads == 0) {
        Logger::instance().error("transfer.max_download_threads must be at least 1");
        return false;
    }
    if (config_.transfer.thread_chunk_size == 0) {
        Logger::instance().error("transfer.thread_chunk_size must be positive");
        return false;
    }
    return true;
}

void Config::print() const {
    Logger::instance().info("=== Configuration ===");
    Logger::instance().info("Log Level: " + config_.log.level);
    Logger::instance().info("Bind Address: " + config_.node.bind_address);
    Logger::instance().info("Service Port: " + std::to_string(config_.node.service_port));
    Logger::instance().info("Discovery Port: " + std::to_string(config_.node.discovery_port));
    Logger::instance().info("Download Threads: " + std::to_string(config_.transfer.max_download_threads));
    Logger::instance().info("Chunk Size: " + format_file_size(config_.transfer.thread_chunk_size));
    Logger::instance().info("Multithread Threshold: " + format_file_size(config_.transfer.multithread_min_size));
    Logger::instance().info(std::string("Resume: ") + (config_.transfer.enable_resume ? "enabled" : "disabled"));
    Logger::instance().info(std::string("Auth: ") + (config_.security.enable_auth ? "enabled" : "disabled"));
}

} // namespace lanshare
