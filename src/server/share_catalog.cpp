#include "lanshare/server/share_catalog.h"
#include "lanshare/base/error_code.h"
#include "lanshare/base/logger.h"
#include <nlohmann/json.hpp>
#include <openssl/rand.h>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <mutex>
#include <sstream>
#include <sys/stat.h>

namespace lanshare {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

json entry_to_json(const ShareEntry& e) {
    return json{
        {"id", e.id},
        {"name", e.display_name},
        {"size", format_file_size(e.size_bytes)},
        {"size_bytes", e.size_bytes},
        {"modified", ShareCatalog::format_modified(e.modified_time)},
        {"folder", e.folder},
        {"extension", e.extension}
    };
}

} // anonymous namespace

ShareCatalog::ShareCatalog(ServerConfig config)
    : config_(std::move(config)) {}

std::string ShareCatalog::generate_id() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw LanShareError(ErrorCode::InternalError, "RAND_bytes failed while generating file id");
    }
    // RFC 4122 version 4 layout
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

    static const char digits[] = "0123456789abcdef";
    std::string id;
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) id.push_back('-');
        id.push_back(digits[bytes[i] >> 4]);
        id.push_back(digits[bytes[i] & 0x0f]);
    }
    return id;
}

std::string ShareCatalog::format_modified(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return buf;
}

std::optional<std::string> ShareCatalog::add_file(const std::string& path, const std::string& folder) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        Logger::instance().error("Cannot share " + path + ": not a readable regular file");
        return std::nullopt;
    }

    uint64_t size = static_cast<uint64_t>(st.st_size);
    auto check = validate_file_size(size, config_);
    if (!check.allowed) {
        Logger::instance().error("Cannot share " + path + ": " + check.message.value_or("too large"));
        return std::nullopt;
    }
    if (check.message) {
        Logger::instance().warning(*check.message + ": " + path);
    }

    ShareEntry entry;
    entry.local_path = fs::absolute(path).string();
    entry.display_name = fs::path(path).filename().string();
    entry.size_bytes = size;
    entry.modified_time = std::chrono::system_clock::from_time_t(st.st_mtime);
    entry.extension = fs::path(path).extension().string();
    std::transform(entry.extension.begin(), entry.extension.end(), entry.extension.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    entry.folder = folder;

    std::unique_lock lock(mutex_);
    do {
        entry.id = generate_id();
    } while (entries_.count(entry.id));
    std::string id = entry.id;
    entries_.emplace(id, std::move(entry));
    lock.unlock();

    Logger::instance().info("Sharing " + path + " (" + format_file_size(size) + ") as " + id);
    return id;
}

std::vector<std::string> ShareCatalog::add_folder(const std::string& path) {
    std::vector<std::string> ids;
    std::error_code ec;
    fs::path root(path);
    if (!fs::is_directory(root, ec)) {
        Logger::instance().error("Cannot share folder " + path + ": not a directory");
        return ids;
    }

    std::string root_name = root.filename().string();
    if (root_name.empty()) root_name = root.parent_path().filename().string();

    for (auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        fs::path rel_dir = fs::relative(it->path().parent_path(), root, ec);
        std::string folder = root_name;
        if (!rel_dir.empty() && rel_dir != ".") {
            folder += "/" + rel_dir.generic_string();
        }
        if (auto id = add_file(it->path().string(), folder)) {
            ids.push_back(*id);
        }
    }
    if (ec) {
        Logger::instance().warning("Stopped scanning " + path + ": " + ec.message());
    }

    Logger::instance().info("Added " + std::to_string(ids.size()) + " files from folder " + path);
    return ids;
}

bool ShareCatalog::remove(const std::string& id) {
    std::unique_lock lock(mutex_);
    return entries_.erase(id) > 0;
}

void ShareCatalog::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

std::optional<ShareEntry> ShareCatalog::find(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::vector<ShareEntry> ShareCatalog::entries() const {
    std::vector<ShareEntry> result;
    {
        std::shared_lock lock(mutex_);
        result.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            result.push_back(entry);
        }
    }
    std::sort(result.begin(), result.end(), [](const ShareEntry& a, const ShareEntry& b) {
        return a.display_name != b.display_name ? a.display_name < b.display_name : a.id < b.id;
    });
    return result;
}

std::size_t ShareCatalog::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

uint64_t ShareCatalog::total_bytes() const {
    std::shared_lock lock(mutex_);
    uint64_t total = 0;
    for (const auto& [id, entry] : entries_) {
        total += entry.size_bytes;
    }
    return total;
}

std::string ShareCatalog::to_json() const {
    json files = json::array();
    for (const auto& entry : entries()) {
        files.push_back(entry_to_json(entry));
    }
    return files.dump();
}

std::string ShareCatalog::to_html() const {
    auto files = entries();

    std::ostringstream html;
    html << "<!DOCTYPE html>\n<html>\n<head>\n<title>LAN File Share</title>\n"
         << "<meta charset=\"UTF-8\">\n"
         << "<style>body{font-family:sans-serif;margin:40px}"
         << ".file-item{border:1px solid #ddd;padding:12px;margin:8px 0;border-radius:5px}"
         << ".file-name{font-weight:bold}.file-info{color:#666;font-size:14px}</style>\n"
         << "</head>\n<body>\n<h1>LAN File Share</h1>\n";

    if (files.empty()) {
        html << "<div class=\"no-files\">No files are currently being shared.</div>\n";
    }
    for (const auto& f : files) {
        html << "<div class=\"file-item\">\n"
             << "  <div class=\"file-name\">" << html_escape(f.display_name) << "</div>\n"
             << "  <div class=\"file-info\">Size: " << format_file_size(f.size_bytes)
             << " | Modified: " << format_modified(f.modified_time);
        if (!f.folder.empty()) {
            html << " | Folder: " << html_escape(f.folder);
        }
        html << "</div>\n"
             << "  <a href=\"/download/" << f.id << "\">Download</a>\n"
             << "  <a href=\"/files/" << f.id << "\" target=\"_blank\">Preview</a>\n"
             << "</div>\n";
    }
    html << "</body>\n</html>\n";
    return html.str();
}

} // namespace lanshare
