#include "lanshare/http/message.h"
#include <algorithm>
#include <cctype>
#include <limits>

namespace lanshare {

namespace {

std::string_view trim_view(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::optional<uint64_t> parse_u64(std::string_view s) {
    if (s.empty() || s.size() > 20) return std::nullopt;
    uint64_t value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

// Split head into lines, returning the first and collecting headers from the rest
bool split_head(std::string_view head, std::string_view& first_line, HeaderMap& headers) {
    auto next_line = [&head]() -> std::optional<std::string_view> {
        if (head.empty()) return std::nullopt;
        auto pos = head.find('\n');
        std::string_view line = head.substr(0, pos);
        head = (pos == std::string_view::npos) ? std::string_view{} : head.substr(pos + 1);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        return line;
    };

    auto first = next_line();
    if (!first || first->empty()) return false;
    first_line = *first;

    while (auto line = next_line()) {
        if (line->empty()) break;
        auto colon = line->find(':');
        if (colon == std::string_view::npos || colon == 0) return false;
        std::string name = to_lower(trim_view(line->substr(0, colon)));
        std::string value(trim_view(line->substr(colon + 1)));
        auto it = headers.find(name);
        if (it != headers.end()) {
            it->second += ", " + value;
        } else {
            headers.emplace(std::move(name), std::move(value));
        }
    }
    return true;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string to_lower(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

std::string url_decode(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '%' && i + 2 < value.size()) {
            int hi = hex_value(value[i + 1]);
            int lo = hex_value(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(c == '+' ? ' ' : c);
    }
    return out;
}

std::optional<std::string> HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> HttpRequest::query_param(const std::string& name) const {
    std::string_view rest = query;
    while (!rest.empty()) {
        auto amp = rest.find('&');
        std::string_view pair = rest.substr(0, amp);
        rest = (amp == std::string_view::npos) ? std::string_view{} : rest.substr(amp + 1);

        auto eq = pair.find('=');
        std::string key = url_decode(pair.substr(0, eq));
        if (key == name) {
            return eq == std::string_view::npos ? std::string{} : url_decode(pair.substr(eq + 1));
        }
    }
    return std::nullopt;
}

std::optional<std::string> HttpResponseHead::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

std::optional<uint64_t> HttpResponseHead::content_length() const {
    auto value = header("content-length");
    if (!value) return std::nullopt;
    return parse_u64(trim_view(*value));
}

std::optional<HttpRequest> parse_request_head(std::string_view head) {
    std::string_view first_line;
    HttpRequest req;
    if (!split_head(head, first_line, req.headers)) return std::nullopt;

    auto sp1 = first_line.find(' ');
    if (sp1 == std::string_view::npos) return std::nullopt;
    auto sp2 = first_line.find(' ', sp1 + 1);
    if (sp2 == std::string_view::npos) return std::nullopt;

    req.method = std::string(first_line.substr(0, sp1));
    req.target = std::string(first_line.substr(sp1 + 1, sp2 - sp1 - 1));
    req.version = std::string(first_line.substr(sp2 + 1));
    if (req.method.empty() || req.target.empty() || req.version.rfind("HTTP/", 0) != 0) {
        return std::nullopt;
    }

    auto qpos = req.target.find('?');
    req.path = url_decode(std::string_view(req.target).substr(0, qpos));
    if (qpos != std::string::npos) {
        req.query = req.target.substr(qpos + 1);
    }
    return req;
}

std::optional<HttpResponseHead> parse_response_head(std::string_view head) {
    std::string_view first_line;
    HttpResponseHead resp;
    if (!split_head(head, first_line, resp.headers)) return std::nullopt;

    // e.g. "HTTP/1.1 206 Partial Content"
    if (first_line.rfind("HTTP/", 0) != 0) return std::nullopt;
    auto sp1 = first_line.find(' ');
    if (sp1 == std::string_view::npos) return std::nullopt;
    auto code = first_line.substr(sp1 + 1, 3);
    auto status = parse_u64(code);
    if (!status || code.size() != 3) return std::nullopt;
    resp.status = static_cast<int>(*status);
    if (first_line.size() > sp1 + 5) {
        resp.reason = std::string(first_line.substr(sp1 + 5));
    }
    return resp;
}

ByteRange parse_range_header(std::string_view value, uint64_t file_size) {
    ByteRange range;
    value = trim_view(value);

    constexpr std::string_view prefix = "bytes=";
    if (value.substr(0, prefix.size()) != prefix) {
        return range;
    }
    value.remove_prefix(prefix.size());

    auto dash = value.find('-');
    if (dash == std::string_view::npos || value.find('-', dash + 1) != std::string_view::npos) {
        return range;
    }

    std::string_view start_str = trim_view(value.substr(0, dash));
    std::string_view end_str = trim_view(value.substr(dash + 1));

    uint64_t start = 0;
    if (!start_str.empty()) {
        auto parsed = parse_u64(start_str);
        if (!parsed) return range;
        start = *parsed;
    }

    uint64_t end = 0;
    bool open_ended = end_str.empty();
    if (!open_ended) {
        auto parsed = parse_u64(end_str);
        if (!parsed) return range;
        end = *parsed;
    }

    if (file_size == 0 || start >= file_size) {
        range.status = RangeStatus::Unsatisfiable;
        return range;
    }
    if (open_ended) {
        end = file_size - 1;
    }
    if (end >= file_size || start > end) {
        range.status = RangeStatus::Unsatisfiable;
        return range;
    }

    range.status = RangeStatus::Valid;
    range.start = start;
    range.end = end;
    return range;
}

std::optional<ContentRange> parse_content_range(std::string_view value) {
    value = trim_view(value);
    constexpr std::string_view prefix = "bytes ";
    if (value.substr(0, prefix.size()) != prefix) return std::nullopt;
    value.remove_prefix(prefix.size());

    auto dash = value.find('-');
    auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash) {
        return std::nullopt;
    }

    auto start = parse_u64(value.substr(0, dash));
    auto end = parse_u64(value.substr(dash + 1, slash - dash - 1));
    if (!start || !end || *start > *end) return std::nullopt;

    ContentRange cr{*start, *end, std::nullopt};
    auto total_str = value.substr(slash + 1);
    if (total_str != "*") {
        auto total = parse_u64(total_str);
        if (!total) return std::nullopt;
        cr.total = *total;
    }
    return cr;
}

std::string status_reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 206: return "Partial Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 416: return "Requested Range Not Satisfiable";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::optional<HttpUrl> HttpUrl::parse(const std::string& url) {
    constexpr std::string_view scheme = "http://";
    std::string_view rest = url;
    if (rest.substr(0, scheme.size()) != scheme) return std::nullopt;
    rest.remove_prefix(scheme.size());

    auto slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    HttpUrl parsed;
    parsed.target = (slash == std::string_view::npos) ? "/" : std::string(rest.substr(slash));

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        auto port = parse_u64(authority.substr(colon + 1));
        if (!port || *port == 0 || *port > 65535) return std::nullopt;
        parsed.port = static_cast<uint16_t>(*port);
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) return std::nullopt;
    parsed.host = std::string(authority);
    return parsed;
}

std::string HttpUrl::authority() const {
    return port == 80 ? host : host + ":" + std::to_string(port);
}

std::string HttpUrl::to_string() const {
    return "http://" + authority() + target;
}

} // namespace lanshare
