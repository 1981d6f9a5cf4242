#ifndef LANSHARE_DISCOVERY_PEER_REGISTRY_H
#define LANSHARE_DISCOVERY_PEER_REGISTRY_H

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lanshare {

// Times are seconds since the epoch
struct PeerRecord {
    std::string address;
    uint16_t port = 0;
    std::string url;               // http://address:port
    double first_announced = 0.0;
    double last_seen = 0.0;
    double beacon_timestamp = 0.0; // sender's clock, 0 for scan hits

    std::string key() const { return address + ":" + std::to_string(port); }
};

using PeerList = std::vector<PeerRecord>;

class PeerRegistryObserver {
public:
    virtual ~PeerRegistryObserver() = default;
    // Snapshot after a mutation, delivered without the registry lock held
    virtual void on_peers_changed(const PeerList& peers) = 0;
};

// Known peers keyed by address:port
class PeerRegistry {
public:
    explicit PeerRegistry(std::chrono::seconds stale_timeout = std::chrono::seconds(300));

    // Insert or refresh; returns true when the peer is new
    bool upsert(const std::string& address, uint16_t port,
                double now = now_seconds(), double beacon_timestamp = 0.0);

    bool remove(const std::string& address, uint16_t port);

    // Drops peers whose last_seen is older than the stale timeout
    std::size_t remove_stale(double now = now_seconds());

    std::optional<PeerRecord> find(const std::string& address, uint16_t port) const;
    PeerList peers() const;  // sorted by key
    std::size_t size() const;
    void clear();

    // Not owned. A new observer is told about peers already known.
    void add_observer(PeerRegistryObserver* observer);
    void remove_observer(PeerRegistryObserver* observer);

    std::chrono::seconds stale_timeout() const { return stale_timeout_; }

    static double now_seconds();

private:
    PeerList snapshot_locked() const;
    void notify(const PeerList& peers);

    std::chrono::seconds stale_timeout_;
    std::unordered_map<std::string, PeerRecord> peers_;
    std::vector<PeerRegistryObserver*> observers_;
    mutable std::mutex mutex_;
    mutable std::mutex observer_mutex_;
};

} // namespace lanshare

#endif // LANSHARE_DISCOVERY_PEER_REGISTRY_H
