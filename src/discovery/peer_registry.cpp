#include "lanshare/discovery/peer_registry.h"
#include "lanshare/base/logger.h"
#include <algorithm>

namespace lanshare {

PeerRegistry::PeerRegistry(std::chrono::seconds stale_timeout)
    : stale_timeout_(stale_timeout) {}

double PeerRegistry::now_seconds() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

bool PeerRegistry::upsert(const std::string& address, uint16_t port, double now, double beacon_timestamp) {
    PeerList snapshot;
    bool inserted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string key = address + ":" + std::to_string(port);
        auto it = peers_.find(key);
        if (it == peers_.end()) {
            PeerRecord record;
            record.address = address;
            record.port = port;
            record.url = "http://" + key;
            record.first_announced = now;
            record.last_seen = now;
            record.beacon_timestamp = beacon_timestamp;
            peers_.emplace(key, std::move(record));
            inserted = true;
        } else {
            it->second.last_seen = std::max(it->second.last_seen, now);
            if (beacon_timestamp > 0.0) {
                it->second.beacon_timestamp = beacon_timestamp;
            }
        }
        snapshot = snapshot_locked();
    }

    if (inserted) {
        Logger::instance().info("Discovered peer http://" + address + ":" + std::to_string(port));
    }
    notify(snapshot);
    return inserted;
}

bool PeerRegistry::remove(const std::string& address, uint16_t port) {
    PeerList snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (peers_.erase(address + ":" + std::to_string(port)) == 0) {
            return false;
        }
        snapshot = snapshot_locked();
    }
    notify(snapshot);
    return true;
}

std::size_t PeerRegistry::remove_stale(double now) {
    PeerList snapshot;
    std::size_t removed = 0;
    const double timeout = static_cast<double>(stale_timeout_.count());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = peers_.begin(); it != peers_.end();) {
            if (now - it->second.last_seen > timeout) {
                Logger::instance().debug("Removed stale peer " + it->first);
                it = peers_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        if (removed == 0) {
            return 0;
        }
        snapshot = snapshot_locked();
    }
    notify(snapshot);
    return removed;
}

std::optional<PeerRecord> PeerRegistry::find(const std::string& address, uint16_t port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(address + ":" + std::to_string(port));
    if (it == peers_.end()) return std::nullopt;
    return it->second;
}

PeerList PeerRegistry::peers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_locked();
}

std::size_t PeerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.size();
}

void PeerRegistry::clear() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (peers_.empty()) return;
        peers_.clear();
    }
    notify({});
}

void PeerRegistry::add_observer(PeerRegistryObserver* observer) {
    if (!observer) return;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observers_.push_back(observer);
    }
    auto current = peers();
    if (!current.empty()) {
        observer->on_peers_changed(current);
    }
}

void PeerRegistry::remove_observer(PeerRegistryObserver* observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

PeerList PeerRegistry::snapshot_locked() const {
    PeerList list;
    list.reserve(peers_.size());
    for (const auto& [key, record] : peers_) {
        list.push_back(record);
    }
    std::sort(list.begin(), list.end(), [](const PeerRecord& a, const PeerRecord& b) {
        return a.key() < b.key();
    });
    return list;
}

void PeerRegistry::notify(const PeerList& peers) {
    std::vector<PeerRegistryObserver*> targets;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        targets = observers_;
    }
    for (auto* observer : targets) {
        try {
            observer->on_peers_changed(peers);
        } catch (const std::exception& e) {
            Logger::instance().error("Peer observer error: " + std::string(e.what()));
        }
    }
}

} // namespace lanshare
