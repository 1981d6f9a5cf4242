#include "lanshare/discovery/peer_discovery.h"
#include "lanshare/base/logger.h"
#include <nlohmann/json.hpp>
#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <mutex>
#include <netinet/in.h>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>
#include <unordered_set>

namespace lanshare {

using json = nlohmann::json;

namespace {

constexpr std::size_t kDatagramSize = 1024;

bool is_ipv4(const std::string& ip) {
    struct in_addr addr;
    return inet_pton(AF_INET, ip.c_str(), &addr) == 1;
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

// Closes the descriptor on scope exit
struct FdGuard {
    int fd;
    explicit FdGuard(int f) : fd(f) {}
    ~FdGuard() {
        if (fd >= 0) ::close(fd);
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
};

} // anonymous namespace

struct PeerDiscovery::Impl {
    NodeConfig node;
    DiscoveryConfig config;

    std::atomic<bool> running{false};
    std::atomic<bool> stop_requested{false};
    std::atomic<uint64_t> scans{0};

    std::mutex wait_mutex;
    std::condition_variable wake;
    bool scan_requested = false;

    std::thread broadcast_thread;
    std::thread listen_thread;
    std::thread scan_thread;

    Impl(const NodeConfig& n, const DiscoveryConfig& c) : node(n), config(c) {}

    // Sleeps up to duration; returns false once stop was requested
    bool wait_for(std::chrono::milliseconds duration) {
        std::unique_lock<std::mutex> lock(wait_mutex);
        wake.wait_for(lock, duration, [this]() { return stop_requested.load(); });
        return !stop_requested.load();
    }
};

PeerDiscovery::PeerDiscovery(const NodeConfig& node, const DiscoveryConfig& config, PeerRegistry& registry)
    : impl_(std::make_unique<Impl>(node, config)), registry_(registry) {}

PeerDiscovery::~PeerDiscovery() {
    stop();
}

std::string PeerDiscovery::build_announcement() const {
    json beacon = {
        {"type", "announcement"},
        {"port", impl_->node.service_port},
        {"timestamp", PeerRegistry::now_seconds()}
    };
    return beacon.dump();
}

bool PeerDiscovery::handle_announcement(const std::string& payload, const std::string& sender_ip) {
    json message = json::parse(payload, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        Logger::instance().debug("Ignoring non-JSON datagram from " + sender_ip);
        return false;
    }

    auto type = message.find("type");
    if (type == message.end() || !type->is_string() || type->get<std::string>() != "announcement") {
        Logger::instance().debug("Ignoring datagram without announcement type from " + sender_ip);
        return false;
    }

    auto port_it = message.find("port");
    if (port_it == message.end() || !port_it->is_number_integer()) {
        Logger::instance().debug("Ignoring announcement without port from " + sender_ip);
        return false;
    }
    int64_t port = port_it->get<int64_t>();
    if (port <= 0 || port > 65535) {
        Logger::instance().debug("Ignoring announcement with port " + std::to_string(port) + " from " + sender_ip);
        return false;
    }

    // Our own beacon comes back through the broadcast address
    if (static_cast<uint16_t>(port) == impl_->node.service_port) {
        return false;
    }

    double timestamp = 0.0;
    auto ts = message.find("timestamp");
    if (ts != message.end() && ts->is_number()) {
        timestamp = ts->get<double>();
    }

    registry_.upsert(sender_ip, static_cast<uint16_t>(port), PeerRegistry::now_seconds(), timestamp);
    return true;
}

bool PeerDiscovery::start() {
    if (impl_->running.exchange(true)) {
        Logger::instance().warning("Peer discovery already running");
        return true;
    }
    impl_->stop_requested = false;

    Logger::instance().info("Starting peer discovery on UDP port " +
                            std::to_string(impl_->node.discovery_port) + " for service port " +
                            std::to_string(impl_->node.service_port));

    impl_->broadcast_thread = std::thread([this]() {
        auto& impl = *impl_;
        FdGuard sock(::socket(AF_INET, SOCK_DGRAM, 0));
        if (sock.fd < 0) {
            Logger::instance().error("Failed to create broadcast socket: " + std::string(strerror(errno)));
            return;
        }
        int one = 1;
        setsockopt(sock.fd, SOL_SOCKET, SO_BROADCAST, &one, sizeof(one));

        struct sockaddr_in dest;
        std::memset(&dest, 0, sizeof(dest));
        dest.sin_family = AF_INET;
        dest.sin_port = htons(impl.node.discovery_port);
        if (inet_pton(AF_INET, impl.config.broadcast_address.c_str(), &dest.sin_addr) != 1) {
            Logger::instance().error("Invalid broadcast address " + impl.config.broadcast_address);
            return;
        }

        while (!impl.stop_requested.load()) {
            std::string beacon = build_announcement();
            ssize_t sent = ::sendto(sock.fd, beacon.data(), beacon.size(), 0,
                                    reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));
            if (sent < 0) {
                Logger::instance().warning("Broadcast error: " + std::string(strerror(errno)));
                if (!impl.wait_for(std::chrono::seconds(impl.config.error_backoff_sec))) break;
                continue;
            }
            Logger::instance().debug("Sent discovery beacon");
            if (!impl.wait_for(std::chrono::seconds(impl.config.broadcast_interval_sec))) break;
        }
    });

    impl_->listen_thread = std::thread([this]() {
        auto& impl = *impl_;
        FdGuard sock(::socket(AF_INET, SOCK_DGRAM, 0));
        if (sock.fd < 0) {
            Logger::instance().error("Failed to create listen socket: " + std::string(strerror(errno)));
            return;
        }
        int one = 1;
        setsockopt(sock.fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        struct timeval tv{1, 0};
        setsockopt(sock.fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(impl.node.discovery_port);
        if (::bind(sock.fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            Logger::instance().error("Failed to bind discovery port " +
                                     std::to_string(impl.node.discovery_port) + ": " + strerror(errno));
            return;
        }

        char buffer[kDatagramSize];
        while (!impl.stop_requested.load()) {
            struct sockaddr_in sender;
            socklen_t sender_len = sizeof(sender);
            ssize_t n = ::recvfrom(sock.fd, buffer, sizeof(buffer), 0,
                                   reinterpret_cast<struct sockaddr*>(&sender), &sender_len);
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                Logger::instance().warning("Listen error: " + std::string(strerror(errno)));
                if (!impl.wait_for(std::chrono::seconds(impl.config.error_backoff_sec))) break;
                continue;
            }
            char ip[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET, &sender.sin_addr, ip, sizeof(ip));
            handle_announcement(std::string(buffer, static_cast<size_t>(n)), ip);
        }
    });

    if (impl_->config.enable_scan) {
        impl_->scan_thread = std::thread([this]() {
            auto& impl = *impl_;
            while (!impl.stop_requested.load()) {
                {
                    std::lock_guard<std::mutex> lock(impl.wait_mutex);
                    impl.scan_requested = false;
                }
                try {
                    scan_once();
                } catch (const std::exception& e) {
                    Logger::instance().error("Network scan error: " + std::string(e.what()));
                    if (!impl.wait_for(std::chrono::seconds(impl.config.scan_error_backoff_sec))) break;
                    continue;
                }

                std::unique_lock<std::mutex> lock(impl.wait_mutex);
                impl.wake.wait_for(lock, std::chrono::seconds(impl.config.scan_interval_sec), [&impl]() {
                    return impl.stop_requested.load() || impl.scan_requested;
                });
            }
        });
    }

    return true;
}

void PeerDiscovery::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }

    Logger::instance().info("Stopping peer discovery");
    {
        std::lock_guard<std::mutex> lock(impl_->wait_mutex);
        impl_->stop_requested = true;
    }
    impl_->wake.notify_all();

    for (auto* t : {&impl_->broadcast_thread, &impl_->listen_thread, &impl_->scan_thread}) {
        if (t->joinable()) {
            t->join();
        }
    }
    Logger::instance().info("Peer discovery stopped");
}

bool PeerDiscovery::is_running() const {
    return impl_->running.load();
}

void PeerDiscovery::trigger_scan() {
    if (!impl_->running.load()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(impl_->wait_mutex);
        impl_->scan_requested = true;
    }
    impl_->wake.notify_all();
}

std::size_t PeerDiscovery::cleanup() {
    return registry_.remove_stale();
}

uint64_t PeerDiscovery::scan_count() const {
    return impl_->scans.load();
}

std::size_t PeerDiscovery::scan_once() {
    auto& impl = *impl_;
    const std::string local = local_ip();
    std::size_t found = 0;

    auto candidates = parse_arp_table(impl.config.arp_table_path, local);
    bool from_arp = !candidates.empty();
    if (!from_arp) {
        candidates = subnet_candidates(local);
        Logger::instance().debug("ARP table empty, scanning " + std::to_string(candidates.size()) +
                                 " subnet addresses");
    } else {
        Logger::instance().debug("Scanning " + std::to_string(candidates.size()) + " hosts from ARP table");
    }

    for (const auto& ip : candidates) {
        if (impl.stop_requested.load()) break;
        if (probe(ip)) {
            Logger::instance().info("Found server at " + ip + ":" + std::to_string(impl.node.service_port));
            registry_.upsert(ip, impl.node.service_port);
            ++found;
        }
        if (!from_arp && impl.config.probe_delay_ms > 0) {
            if (!impl.wait_for(std::chrono::milliseconds(impl.config.probe_delay_ms))) break;
        }
    }

    ++impl.scans;
    Logger::instance().debug("Scan complete, " + std::to_string(found) + " peers responded");
    return found;
}

bool PeerDiscovery::probe(const std::string& ip) const {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(impl_->node.service_port);
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        return false;
    }

    FdGuard sock(::socket(AF_INET, SOCK_STREAM, 0));
    if (sock.fd < 0) {
        return false;
    }
    int flags = fcntl(sock.fd, F_GETFL, 0);
    fcntl(sock.fd, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(sock.fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (rc == 0) {
        return true;
    }
    if (errno != EINPROGRESS) {
        return false;
    }

    struct pollfd pfd{sock.fd, POLLOUT, 0};
    if (::poll(&pfd, 1, static_cast<int>(impl_->config.probe_timeout_ms)) <= 0) {
        return false;
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
        return false;
    }
    return so_error == 0;
}

std::vector<std::string> PeerDiscovery::parse_arp_table(const std::string& path, const std::string& local_ip) {
    std::vector<std::string> hosts;
    std::ifstream in(path);
    if (!in.is_open()) {
        Logger::instance().debug("ARP table not readable: " + path);
        return hosts;
    }

    std::unordered_set<std::string> seen;
    std::string line;
    std::getline(in, line);  // column header
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string ip, hw_type, flags;
        if (!(fields >> ip >> hw_type >> flags)) continue;
        if (flags == "0x0") continue;  // incomplete entry
        if (!is_ipv4(ip)) continue;
        if (starts_with(ip, "127.") || starts_with(ip, "169.254.") || ip == local_ip) continue;
        if (seen.insert(ip).second) {
            hosts.push_back(ip);
        }
    }
    return hosts;
}

std::vector<std::string> PeerDiscovery::subnet_candidates(const std::string& local_ip) {
    std::vector<std::string> hosts;
    auto range = network_range(local_ip);
    if (!range) {
        return hosts;
    }
    std::string base = local_ip.substr(0, local_ip.rfind('.') + 1);
    hosts.reserve(253);
    for (int i = 1; i < 255; ++i) {
        std::string ip = base + std::to_string(i);
        if (ip != local_ip) {
            hosts.push_back(std::move(ip));
        }
    }
    return hosts;
}

std::optional<std::string> PeerDiscovery::network_range(const std::string& local_ip) {
    if (!is_ipv4(local_ip) || starts_with(local_ip, "127.")) {
        return std::nullopt;
    }
    return local_ip.substr(0, local_ip.rfind('.')) + ".0/24";
}

std::string PeerDiscovery::local_ip() {
    FdGuard sock(::socket(AF_INET, SOCK_DGRAM, 0));
    if (sock.fd < 0) {
        return "127.0.0.1";
    }

    // connect() on UDP only selects a route, nothing is sent
    struct sockaddr_in remote;
    std::memset(&remote, 0, sizeof(remote));
    remote.sin_family = AF_INET;
    remote.sin_port = htons(80);
    inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);
    if (::connect(sock.fd, reinterpret_cast<struct sockaddr*>(&remote), sizeof(remote)) < 0) {
        return "127.0.0.1";
    }

    struct sockaddr_in local;
    socklen_t len = sizeof(local);
    if (getsockname(sock.fd, reinterpret_cast<struct sockaddr*>(&local), &len) < 0) {
        return "127.0.0.1";
    }
    char ip[INET_ADDRSTRLEN] = {0};
    if (!inet_ntop(AF_INET, &local.sin_addr, ip, sizeof(ip))) {
        return "127.0.0.1";
    }
    return ip;
}

} // namespace lanshare
