#ifndef LANSHARE_DISCOVERY_PEER_DISCOVERY_H
#define LANSHARE_DISCOVERY_PEER_DISCOVERY_H

#include "lanshare/base/config.h"
#include "lanshare/discovery/peer_registry.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lanshare {

// Finds other peers on the LAN three ways: periodic UDP broadcast beacons,
// a beacon listener, and TCP probes of ARP neighbours (or the local /24).
// Every hit lands in the registry passed in; loops log errors and back off.
class PeerDiscovery {
public:
    PeerDiscovery(const NodeConfig& node, const DiscoveryConfig& config, PeerRegistry& registry);
    ~PeerDiscovery();

    // Launches the broadcast, listen and scan threads
    bool start();

    // Idempotent; wakes and joins all threads
    void stop();

    bool is_running() const;

    // Wakes the scan thread for an immediate scan
    void trigger_scan();

    // Removes stale peers, returns how many were removed
    std::size_t cleanup();

    // Registers the sender of a valid beacon. Returns false for malformed
    // datagrams and for our own beacons.
    bool handle_announcement(const std::string& payload, const std::string& sender_ip);

    std::string build_announcement() const;

    // One full scan pass; returns the number of peers found
    std::size_t scan_once();

    // Non-blocking connect to ip:service_port bounded by probe_timeout_ms
    bool probe(const std::string& ip) const;

    PeerRegistry& registry() { return registry_; }
    uint64_t scan_count() const;

    // Neighbour addresses from a /proc/net/arp style table, without
    // incomplete entries, loopback, link-local and local_ip
    static std::vector<std::string> parse_arp_table(const std::string& path, const std::string& local_ip);

    // x.y.z.1 .. x.y.z.254 except local_ip; empty for loopback
    static std::vector<std::string> subnet_candidates(const std::string& local_ip);

    // "x.y.z.0/24", or nullopt for loopback
    static std::optional<std::string> network_range(const std::string& local_ip);

    // Address of the interface that routes outward, 127.0.0.1 on failure
    static std::string local_ip();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    PeerRegistry& registry_;
};

} // namespace lanshare

#endif // LANSHARE_DISCOVERY_PEER_DISCOVERY_H
