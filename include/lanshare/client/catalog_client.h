#ifndef LANSHARE_CLIENT_CATALOG_CLIENT_H
#define LANSHARE_CLIENT_CATALOG_CLIENT_H

#include "lanshare/base/config.h"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lanshare {

// One entry of a peer's /api/files listing
struct RemoteFile {
    std::string id;
    std::string name;
    std::string size;        // human readable
    uint64_t size_bytes = 0;
    std::string modified;
    std::string folder;
    std::string extension;
};

// Reads remote catalogs over elio's HTTP client and caches them per server.
// Failures throw LanShareError; a stale cached listing is returned instead
// when one exists.
class CatalogClient {
public:
    explicit CatalogClient(const ClientConfig& config);

    std::vector<RemoteFile> list_files(const std::string& server_url, bool force_refresh = false);

    // Case-insensitive substring match on the file name
    std::vector<RemoteFile> search(const std::string& server_url, const std::string& term);

    std::optional<RemoteFile> find(const std::string& server_url, const std::string& file_id);

    void set_token(std::optional<std::string> token);
    void clear_cache();

    static std::string download_url(const std::string& server_url, const std::string& file_id);
    static std::string preview_url(const std::string& server_url, const std::string& file_id);

    // Throws LanShareError(ProtocolError) on anything but a JSON array of entries
    static std::vector<RemoteFile> parse_catalog(const std::string& body);

private:
    struct CacheEntry {
        std::vector<RemoteFile> files;
        std::chrono::steady_clock::time_point fetched_at;
    };

    std::vector<RemoteFile> fetch(const std::string& server_url);

    std::chrono::seconds cache_ttl_;
    std::optional<std::string> token_;
    std::unordered_map<std::string, CacheEntry> cache_;
    std::mutex mutex_;
};

} // namespace lanshare

#endif // LANSHARE_CLIENT_CATALOG_CLIENT_H
