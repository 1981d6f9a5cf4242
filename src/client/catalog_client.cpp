#include "lanshare/client/catalog_client.h"
#include "lanshare/base/error_code.h"
#include "lanshare/base/logger.h"
#include "lanshare/http/message.h"
#include <elio/elio.hpp>
#include <elio/http/http.hpp>
#include <elio/runtime/async_main.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iterator>

namespace lanshare {

using json = nlohmann::json;

namespace {

std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

} // anonymous namespace

CatalogClient::CatalogClient(const ClientConfig& config)
    : cache_ttl_(config.catalog_cache_sec), token_(config.token) {}

std::string CatalogClient::download_url(const std::string& server_url, const std::string& file_id) {
    return trim_trailing_slash(server_url) + "/download/" + file_id;
}

std::string CatalogClient::preview_url(const std::string& server_url, const std::string& file_id) {
    return trim_trailing_slash(server_url) + "/files/" + file_id;
}

void CatalogClient::set_token(std::optional<std::string> token) {
    std::lock_guard<std::mutex> lock(mutex_);
    token_ = std::move(token);
}

void CatalogClient::clear_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

std::vector<RemoteFile> CatalogClient::parse_catalog(const std::string& body) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        throw LanShareError(ErrorCode::ProtocolError, "catalog is not a JSON array");
    }

    std::vector<RemoteFile> files;
    files.reserve(doc.size());
    try {
        for (const auto& item : doc) {
            RemoteFile f;
            f.id = item.at("id").get<std::string>();
            f.name = item.at("name").get<std::string>();
            f.size = item.value("size", std::string());
            f.size_bytes = item.value("size_bytes", uint64_t{0});
            f.modified = item.value("modified", std::string());
            f.folder = item.value("folder", std::string());
            f.extension = item.value("extension", std::string());
            files.push_back(std::move(f));
        }
    } catch (const json::exception& e) {
        throw LanShareError(ErrorCode::ProtocolError, std::string("malformed catalog entry: ") + e.what());
    }
    return files;
}

std::vector<RemoteFile> CatalogClient::fetch(const std::string& server_url) {
    std::string url = trim_trailing_slash(server_url) + "/api/files";
    auto target = HttpUrl::parse(url);
    auto parsed_url = elio::http::url::parse(url);
    if (!target || !parsed_url) {
        throw LanShareError(ErrorCode::InvalidArgument, "Invalid server URL: " + server_url);
    }

    std::optional<std::string> token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        token = token_;
    }

    bool responded = false;
    int status = 0;
    std::string body;

    elio::run([&]() -> elio::coro::task<void> {
        elio::http::client http_client;
        elio::http::request req(elio::http::method::GET, target->target);
        req.set_host(target->authority());
        req.set_header("Accept", "application/json");
        if (token && !token->empty()) {
            req.set_header("Authorization", "Bearer " + *token);
        }

        auto response = co_await http_client.send(req, *parsed_url);
        if (!response) {
            co_return;
        }
        responded = true;
        status = static_cast<int>(response->status_code());
        body = std::string(response->body());
        co_return;
    }());

    if (!responded) {
        throw LanShareError(ErrorCode::ConnectionFailed, "Connection error: cannot reach " + server_url);
    }
    switch (status) {
        case 200:
            break;
        case 401:
            throw LanShareError(ErrorCode::AuthenticationFailed, "Authentication required - token needed");
        case 403:
            throw LanShareError(ErrorCode::AccessDenied, "Access denied");
        case 429:
            throw LanShareError(ErrorCode::RateLimited, "Too many requests");
        default:
            throw LanShareError(ErrorCode::UnexpectedStatus,
                                "HTTP Error " + std::to_string(status) + ": " + status_reason(status));
    }

    auto files = parse_catalog(body);
    Logger::instance().debug("Fetched " + std::to_string(files.size()) + " entries from " + server_url);
    return files;
}

std::vector<RemoteFile> CatalogClient::list_files(const std::string& server_url, bool force_refresh) {
    const std::string key = trim_trailing_slash(server_url);
    if (!force_refresh) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end() &&
            std::chrono::steady_clock::now() - it->second.fetched_at < cache_ttl_) {
            return it->second.files;
        }
    }

    try {
        auto files = fetch(key);
        std::lock_guard<std::mutex> lock(mutex_);
        cache_[key] = CacheEntry{files, std::chrono::steady_clock::now()};
        return files;
    } catch (const LanShareError& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        // Access errors must surface even when an old listing exists
        if (it == cache_.end() || e.kind() == ErrorKind::Access) {
            throw;
        }
        Logger::instance().warning("Using cached catalog for " + key + ": " + e.what());
        return it->second.files;
    }
}

std::vector<RemoteFile> CatalogClient::search(const std::string& server_url, const std::string& term) {
    auto files = list_files(server_url);
    std::string needle = to_lower(term);
    std::vector<RemoteFile> matches;
    std::copy_if(files.begin(), files.end(), std::back_inserter(matches), [&](const RemoteFile& f) {
        return to_lower(f.name).find(needle) != std::string::npos;
    });
    return matches;
}

std::optional<RemoteFile> CatalogClient::find(const std::string& server_url, const std::string& file_id) {
    for (auto& f : list_files(server_url)) {
        if (f.id == file_id) return f;
    }
    return std::nullopt;
}

} // namespace lanshare
