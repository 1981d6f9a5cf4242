#include "lanshare/server/access_gate.h"
#include "lanshare/base/error_code.h"
#include "lanshare/base/logger.h"
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace lanshare {

namespace {

std::string base64url(const unsigned char* data, int len) {
    std::string out(static_cast<std::size_t>(4 * ((len + 2) / 3)), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data, len);
    out.resize(static_cast<std::size_t>(written));
    while (!out.empty() && out.back() == '=') out.pop_back();
    for (auto& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

} // anonymous namespace

TokenAccessGate::TokenAccessGate(const SecurityConfig& config)
    : require_token_(config.enable_auth),
      token_lifetime_(std::chrono::hours(config.token_expiry_hours)),
      rate_limit_per_minute_(config.rate_limit_per_minute),
      allowed_ips_(config.allowed_ips.begin(), config.allowed_ips.end()),
      blocked_ips_(config.blocked_ips.begin(), config.blocked_ips.end()) {}

GateDecision TokenAccessGate::check(const HttpRequest& request) {
    const std::string& ip = request.client_address;

    if (!is_ip_allowed(ip)) {
        Logger::instance().warning("Access denied for " + ip);
        return GateDecision::reject(403, "Access denied");
    }

    if (!check_rate_limit(ip)) {
        Logger::instance().warning("Rate limit exceeded for " + ip);
        return GateDecision::reject(429, "Too many requests");
    }

    if (require_token()) {
        auto token = extract_token(request);
        if (!token || !validate_token(*token)) {
            Logger::instance().debug("Rejected unauthenticated request from " + ip + " for " + request.path);
            return GateDecision::reject(401, "Authentication required", {{"WWW-Authenticate", "Bearer"}});
        }
    }

    return GateDecision::allow();
}

void TokenAccessGate::allow_ip(const std::string& ip) {
    std::lock_guard<std::mutex> lock(mutex_);
    allowed_ips_.insert(ip);
}

void TokenAccessGate::block_ip(const std::string& ip) {
    std::lock_guard<std::mutex> lock(mutex_);
    blocked_ips_.insert(ip);
}

bool TokenAccessGate::is_ip_allowed(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (blocked_ips_.count(ip)) return false;
    return allowed_ips_.empty() || allowed_ips_.count(ip) > 0;
}

bool TokenAccessGate::check_rate_limit(const std::string& ip, Clock::time_point now) {
    if (rate_limit_per_minute_ == 0) return true;

    std::lock_guard<std::mutex> lock(mutex_);
    auto& times = request_times_[ip];
    auto window_start = now - std::chrono::minutes(1);
    while (!times.empty() && times.front() <= window_start) {
        times.pop_front();
    }
    if (times.size() >= rate_limit_per_minute_) {
        return false;
    }
    times.push_back(now);
    return true;
}

std::string TokenAccessGate::generate_token() {
    return generate_token(token_lifetime_);
}

std::string TokenAccessGate::generate_token(std::chrono::seconds lifetime) {
    unsigned char bytes[32];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw LanShareError(ErrorCode::InternalError, "RAND_bytes failed while generating token");
    }
    std::string token = base64url(bytes, sizeof(bytes));

    auto now = Clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_[token] = TokenInfo{now, now + lifetime, 0};
    return token;
}

bool TokenAccessGate::validate_token(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(token);
    if (it == tokens_.end()) return false;
    if (Clock::now() >= it->second.expires) {
        tokens_.erase(it);
        return false;
    }
    ++it->second.uses;
    return true;
}

bool TokenAccessGate::revoke_token(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.erase(token) > 0;
}

std::size_t TokenAccessGate::cleanup_expired_tokens() {
    auto now = Clock::now();
    std::size_t removed = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = tokens_.begin(); it != tokens_.end();) {
        if (now >= it->second.expires) {
            it = tokens_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t TokenAccessGate::token_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size();
}

void TokenAccessGate::set_require_token(bool required) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_token_ = required;
}

bool TokenAccessGate::require_token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return require_token_;
}

std::optional<std::string> TokenAccessGate::extract_token(const HttpRequest& request) {
    if (auto auth = request.header("authorization")) {
        constexpr std::string_view prefix = "Bearer ";
        if (auth->compare(0, prefix.size(), prefix) == 0 && auth->size() > prefix.size()) {
            return auth->substr(prefix.size());
        }
    }
    auto token = request.query_param("token");
    if (token && !token->empty()) {
        return token;
    }
    return std::nullopt;
}

} // namespace lanshare
