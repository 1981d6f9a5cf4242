#ifndef LANSHARE_SERVER_SHARE_CATALOG_H
#define LANSHARE_SERVER_SHARE_CATALOG_H

#include "lanshare/base/config.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace lanshare {

struct ShareEntry {
    std::string id;
    std::string display_name;
    uint64_t size_bytes = 0;
    std::chrono::system_clock::time_point modified_time;
    std::string local_path;
    std::string extension;  // lowercase, with leading dot
    std::string folder;     // relative folder when added through a directory
};

// Files this peer serves, keyed by an opaque id that is never reused.
// Mutations happen out of band; request handlers only read.
class ShareCatalog {
public:
    explicit ShareCatalog(ServerConfig config = {});

    // Returns the new id, or nullopt if the file is missing, unreadable or too large
    std::optional<std::string> add_file(const std::string& path, const std::string& folder = "");

    // Recursively adds regular files; returns the ids added
    std::vector<std::string> add_folder(const std::string& path);

    bool remove(const std::string& id);
    void clear();

    std::optional<ShareEntry> find(const std::string& id) const;
    std::vector<ShareEntry> entries() const;  // sorted by display name
    std::size_t size() const;
    uint64_t total_bytes() const;

    // JSON array of {id, name, size, size_bytes, modified, folder, extension}
    std::string to_json() const;
    std::string to_html() const;

    static std::string generate_id();
    static std::string format_modified(std::chrono::system_clock::time_point tp);

private:
    ServerConfig config_;
    std::unordered_map<std::string, ShareEntry> entries_;
    mutable std::shared_mutex mutex_;
};

} // namespace lanshare

#endif // LANSHARE_SERVER_SHARE_CATALOG_H
