#include "lanshare/server/request_handler.h"
#include "lanshare/base/logger.h"
#include <nlohmann/json.hpp>
#include <sstream>
#include <sys/stat.h>
#include <unordered_map>

namespace lanshare {

namespace {

constexpr std::string_view kDownloadPrefix = "/download/";
constexpr std::string_view kPreviewPrefix = "/files/";

// Id that follows prefix, or empty when the path does not match
std::string route_id(const std::string& path, std::string_view prefix) {
    if (path.compare(0, prefix.size(), prefix) != 0) return {};
    std::string id = path.substr(prefix.size());
    if (id.find('/') != std::string::npos) return {};
    return id;
}

std::string filename_of(const ShareEntry& entry) {
    // Quotes would break the header value
    std::string name;
    for (char c : entry.display_name) {
        if (c == '"' || c == '\r' || c == '\n') continue;
        name.push_back(c);
    }
    return name;
}

} // anonymous namespace

std::optional<std::string> ResponsePlan::header(const std::string& name) const {
    std::string key = to_lower(name);
    for (const auto& [n, v] : headers) {
        if (to_lower(n) == key) return v;
    }
    return std::nullopt;
}

void ResponsePlan::set_header(const std::string& name, const std::string& value) {
    std::string key = to_lower(name);
    for (auto& [n, v] : headers) {
        if (to_lower(n) == key) {
            v = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

std::string ResponsePlan::serialize_head() const {
    std::ostringstream out;
    out << "HTTP/1.1 " << status << " " << status_reason(status) << "\r\n";
    for (const auto& [name, value] : headers) {
        out << name << ": " << value << "\r\n";
    }
    out << "\r\n";
    return out.str();
}

RequestHandler::RequestHandler(ServerContext context)
    : context_(std::move(context)) {}

ResponsePlan RequestHandler::error(int status, const std::string& message, HeaderList extra) {
    ResponsePlan plan;
    plan.status = status;
    plan.body = nlohmann::json{{"error", message}, {"status", status}}.dump();
    plan.headers = std::move(extra);
    plan.set_header("Content-Type", "application/json");
    plan.set_header("Content-Length", std::to_string(plan.body.size()));
    return plan;
}

std::string RequestHandler::preview_mime_type(const std::string& extension) {
    static const std::unordered_map<std::string, std::string> types = {
        {".txt", "text/plain; charset=utf-8"},
        {".py", "text/plain; charset=utf-8"},
        {".js", "text/plain; charset=utf-8"},
        {".html", "text/plain; charset=utf-8"},
        {".css", "text/plain; charset=utf-8"},
        {".json", "application/json"},
        {".xml", "text/xml"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png", "image/png"},
        {".gif", "image/gif"},
        {".pdf", "application/pdf"},
        {".csv", "text/csv"},
    };
    auto it = types.find(to_lower(extension));
    return it != types.end() ? it->second : "application/octet-stream";
}

ResponsePlan RequestHandler::handle(const HttpRequest& request) const {
    ResponsePlan plan;
    bool head_only = request.method == "HEAD";
    bool rejected = false;

    if (context_.gate) {
        auto decision = context_.gate->check(request);
        if (!decision.allowed) {
            plan = error(decision.status, decision.reason, decision.headers);
            rejected = true;
        }
    }

    if (!rejected) {
        if (request.method != "GET" && !head_only) {
            plan = error(405, "Method not allowed", {{"Allow", "GET, HEAD"}});
        } else if (request.path == "/") {
            plan = serve_index(head_only);
        } else if (request.path == "/api/files") {
            plan = serve_catalog(head_only);
        } else if (auto download_id = route_id(request.path, kDownloadPrefix); !download_id.empty()) {
            plan = serve_file(request, download_id, true);
        } else if (auto preview_id = route_id(request.path, kPreviewPrefix); !preview_id.empty()) {
            plan = serve_file(request, preview_id, false);
        } else {
            plan = error(404, "Not found");
        }
    }

    if (head_only) {
        plan.body.clear();
        plan.file.reset();
    }
    plan.set_header("Connection", "close");
    return plan;
}

ResponsePlan RequestHandler::serve_index(bool head_only) const {
    ResponsePlan plan;
    std::string html = context_.catalog.to_html();
    plan.set_header("Content-Type", "text/html; charset=utf-8");
    plan.set_header("Content-Length", std::to_string(html.size()));
    plan.set_header("X-Content-Type-Options", "nosniff");
    plan.set_header("X-Frame-Options", "DENY");
    if (!head_only) plan.body = std::move(html);
    return plan;
}

ResponsePlan RequestHandler::serve_catalog(bool head_only) const {
    ResponsePlan plan;
    std::string json = context_.catalog.to_json();
    plan.set_header("Content-Type", "application/json");
    plan.set_header("Content-Length", std::to_string(json.size()));
    plan.set_header("Cache-Control", "no-cache");
    if (!head_only) plan.body = std::move(json);
    return plan;
}

ResponsePlan RequestHandler::serve_file(const HttpRequest& request,
                                        const std::string& id,
                                        bool as_attachment) const {
    auto entry = context_.catalog.find(id);
    if (!entry) {
        return error(404, "File not found");
    }

    struct stat st;
    if (::stat(entry->local_path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        Logger::instance().warning("Shared file is gone: " + entry->local_path);
        return error(404, "File not found");
    }
    uint64_t size = static_cast<uint64_t>(st.st_size);

    ResponsePlan plan;
    if (as_attachment) {
        plan.set_header("Content-Type", "application/octet-stream");
        plan.set_header("Content-Disposition", "attachment; filename=\"" + filename_of(*entry) + "\"");
    } else {
        std::string mime = preview_mime_type(entry->extension);
        plan.set_header("Content-Type", mime);
        plan.set_header("Content-Disposition", "inline; filename=\"" + filename_of(*entry) + "\"");
        if (mime.compare(0, 5, "text/") == 0) {
            plan.set_header("Content-Security-Policy", "default-src 'self'");
        }
    }
    plan.set_header("Accept-Ranges", "bytes");
    plan.set_header("X-Content-Type-Options", "nosniff");

    uint64_t offset = 0;
    uint64_t length = size;

    // HEAD reports the whole file whatever Range says
    auto range_header = request.method == "HEAD" ? std::nullopt : request.header("range");
    if (range_header) {
        auto range = parse_range_header(*range_header, size);
        if (range.status == RangeStatus::Malformed) {
            return error(400, "Invalid range header");
        }
        if (range.status == RangeStatus::Unsatisfiable) {
            auto plan416 = error(416, "Requested range not satisfiable",
                                 {{"Content-Range", "bytes */" + std::to_string(size)}});
            plan416.set_header("Accept-Ranges", "bytes");
            return plan416;
        }
        offset = range.start;
        length = range.length();
        plan.status = 206;
        plan.set_header("Content-Range", "bytes " + std::to_string(range.start) + "-" +
                                         std::to_string(range.end) + "/" + std::to_string(size));
    }

    plan.set_header("Content-Length", std::to_string(length));
    if (length > 0) {
        plan.file = FileSlice{entry->local_path, offset, length};
    }

    Logger::instance().debug("{} {} bytes {}+{} of {}", as_attachment ? "Download" : "Preview",
                             entry->display_name, offset, length, size);
    return plan;
}

} // namespace lanshare
