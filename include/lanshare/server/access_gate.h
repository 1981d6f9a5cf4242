#ifndef LANSHARE_SERVER_ACCESS_GATE_H
#define LANSHARE_SERVER_ACCESS_GATE_H

#include "lanshare/base/config.h"
#include "lanshare/http/message.h"
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace lanshare {

// Outcome of the pre-request gate. A rejection carries the status and
// any extra headers the response must include.
struct GateDecision {
    bool allowed = true;
    int status = 200;
    std::string reason;
    HeaderList headers;

    static GateDecision allow() { return {}; }
    static GateDecision reject(int status, std::string reason, HeaderList headers = {}) {
        return {false, status, std::move(reason), std::move(headers)};
    }
};

// Invoked by the file server before any routing
class AccessGate {
public:
    virtual ~AccessGate() = default;
    virtual GateDecision check(const HttpRequest& request) = 0;
};

// IP lists, per-IP sliding-minute rate limit and bearer tokens
class TokenAccessGate : public AccessGate {
public:
    using Clock = std::chrono::steady_clock;

    explicit TokenAccessGate(const SecurityConfig& config);

    GateDecision check(const HttpRequest& request) override;

    void allow_ip(const std::string& ip);
    void block_ip(const std::string& ip);
    bool is_ip_allowed(const std::string& ip) const;

    // Records the request when under the limit
    bool check_rate_limit(const std::string& ip, Clock::time_point now = Clock::now());

    // 32 random bytes, base64url without padding
    std::string generate_token();
    std::string generate_token(std::chrono::seconds lifetime);
    bool validate_token(const std::string& token);
    bool revoke_token(const std::string& token);
    std::size_t cleanup_expired_tokens();
    std::size_t token_count() const;

    void set_require_token(bool required);
    bool require_token() const;

    // From "Authorization: Bearer <t>" or the token query parameter
    static std::optional<std::string> extract_token(const HttpRequest& request);

private:
    struct TokenInfo {
        Clock::time_point created;
        Clock::time_point expires;
        uint64_t uses = 0;
    };

    bool require_token_;
    std::chrono::seconds token_lifetime_;
    uint32_t rate_limit_per_minute_;
    std::unordered_set<std::string> allowed_ips_;
    std::unordered_set<std::string> blocked_ips_;
    std::unordered_map<std::string, TokenInfo> tokens_;
    std::unordered_map<std::string, std::deque<Clock::time_point>> request_times_;
    mutable std::mutex mutex_;
};

} // namespace lanshare

#endif // LANSHARE_SERVER_ACCESS_GATE_H
