#ifndef LANSHARE_HTTP_MESSAGE_H
#define LANSHARE_HTTP_MESSAGE_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lanshare {

// Header names are stored lowercased
using HeaderMap = std::map<std::string, std::string>;

// Ordered headers for responses we emit
using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method;
    std::string target;   // raw request target
    std::string path;     // decoded path without query
    std::string query;    // raw query string without '?'
    std::string version;
    HeaderMap headers;
    std::string client_address;

    std::optional<std::string> header(const std::string& name) const;
    std::optional<std::string> query_param(const std::string& name) const;
};

struct HttpResponseHead {
    int status = 0;
    std::string reason;
    HeaderMap headers;

    std::optional<std::string> header(const std::string& name) const;
    std::optional<uint64_t> content_length() const;
};

// Parse everything before the blank line of a request or response
std::optional<HttpRequest> parse_request_head(std::string_view head);
std::optional<HttpResponseHead> parse_response_head(std::string_view head);

enum class RangeStatus {
    Valid,
    Malformed,      // 400
    Unsatisfiable   // 416
};

struct ByteRange {
    RangeStatus status = RangeStatus::Malformed;
    uint64_t start = 0;
    uint64_t end = 0;  // inclusive

    uint64_t length() const { return end - start + 1; }
};

// Parse "bytes=start-end" against a resource of file_size bytes.
// An empty start means 0 and an empty end means the last byte.
ByteRange parse_range_header(std::string_view value, uint64_t file_size);

// Parse a "bytes start-end/total" response header
struct ContentRange {
    uint64_t start = 0;
    uint64_t end = 0;
    std::optional<uint64_t> total;
};
std::optional<ContentRange> parse_content_range(std::string_view value);

std::string status_reason(int status);
std::string url_decode(std::string_view value);
std::string to_lower(std::string_view value);

struct HttpUrl {
    std::string host;
    uint16_t port = 80;
    std::string target = "/";

    static std::optional<HttpUrl> parse(const std::string& url);
    std::string authority() const;
    std::string to_string() const;
};

} // namespace lanshare

#endif // LANSHARE_HTTP_MESSAGE_H
