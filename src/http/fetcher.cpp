#include "lanshare/http/fetcher.h"
#include "lanshare/base/error_code.h"
#include "lanshare/base/logger.h"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <vector>

namespace lanshare {

namespace {

constexpr std::size_t kMaxResponseHead = 64 * 1024;

class Socket {
public:
    Socket() = default;
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket() {
        if (fd_ >= 0) ::close(fd_);
    }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket(Socket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    Socket& operator=(Socket&& other) noexcept {
        if (this != &other) {
            if (fd_ >= 0) ::close(fd_);
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int fd() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};

void set_io_timeout(int fd, std::chrono::milliseconds timeout) {
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

// Non-blocking connect bounded by poll(), then back to blocking mode
Socket connect_with_timeout(const HttpUrl& url, const FetchOptions& options) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    std::string port = std::to_string(url.port);
    int rc = getaddrinfo(url.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0 || result == nullptr) {
        throw LanShareError(ErrorCode::ConnectionFailed,
                            "cannot resolve " + url.host + ": " + gai_strerror(rc));
    }

    std::string last_error = "no usable address";
    for (auto* ai = result; ai != nullptr; ai = ai->ai_next) {
        Socket sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!sock.valid()) {
            last_error = std::strerror(errno);
            continue;
        }

        int flags = fcntl(sock.fd(), F_GETFL, 0);
        fcntl(sock.fd(), F_SETFL, flags | O_NONBLOCK);

        rc = ::connect(sock.fd(), ai->ai_addr, ai->ai_addrlen);
        if (rc < 0 && errno != EINPROGRESS) {
            last_error = std::strerror(errno);
            continue;
        }
        if (rc < 0) {
            struct pollfd pfd{sock.fd(), POLLOUT, 0};
            int ready = ::poll(&pfd, 1, static_cast<int>(options.connect_timeout.count()));
            if (ready == 0) {
                last_error = "connect timed out after " + std::to_string(options.connect_timeout.count()) + " ms";
                continue;
            }
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            getsockopt(sock.fd(), SOL_SOCKET, SO_ERROR, &so_error, &len);
            if (ready < 0 || so_error != 0) {
                last_error = std::strerror(ready < 0 ? errno : so_error);
                continue;
            }
        }

        fcntl(sock.fd(), F_SETFL, flags);
        set_io_timeout(sock.fd(), options.io_timeout);
        int one = 1;
        setsockopt(sock.fd(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        freeaddrinfo(result);
        return sock;
    }

    freeaddrinfo(result);
    throw LanShareError(ErrorCode::ConnectionFailed,
                        "cannot connect to " + url.authority() + ": " + last_error);
}

void send_all(int fd, const std::string& data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw LanShareError(ErrorCode::Timeout, "send timed out");
            }
            throw LanShareError(ErrorCode::SendFailed, std::strerror(errno));
        }
        sent += static_cast<std::size_t>(n);
    }
}

// recv() that maps timeouts and errors to exceptions; returns 0 on orderly close
std::size_t recv_some(int fd, char* buf, std::size_t len) {
    while (true) {
        ssize_t n = ::recv(fd, buf, len, 0);
        if (n >= 0) return static_cast<std::size_t>(n);
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            throw LanShareError(ErrorCode::Timeout, "read timed out");
        }
        throw LanShareError(ErrorCode::ReceiveFailed, std::strerror(errno));
    }
}

} // anonymous namespace

HttpFetcher::HttpFetcher(FetchOptions options)
    : options_(options) {}

HttpResponseHead HttpFetcher::head(const HttpUrl& url, const HeaderList& headers) {
    return execute("HEAD", url, headers, nullptr, nullptr).head;
}

FetchOutcome HttpFetcher::get(const HttpUrl& url,
                              const HeaderList& headers,
                              const HeadCheck& on_head,
                              const BodySink& on_body) {
    return execute("GET", url, headers, on_head, on_body);
}

FetchOutcome HttpFetcher::execute(const std::string& method,
                                  const HttpUrl& url,
                                  const HeaderList& headers,
                                  const HeadCheck& on_head,
                                  const BodySink& on_body) {
    auto deadline = std::chrono::steady_clock::now() + options_.total_timeout;
    auto check_deadline = [&]() {
        if (std::chrono::steady_clock::now() > deadline) {
            throw LanShareError(ErrorCode::Timeout,
                                method + " " + url.to_string() + " exceeded " +
                                std::to_string(options_.total_timeout.count() / 1000) + "s");
        }
    };

    Socket sock = connect_with_timeout(url, options_);

    std::ostringstream request;
    request << method << " " << url.target << " HTTP/1.1\r\n";
    request << "Host: " << url.authority() << "\r\n";
    request << "User-Agent: lanshare/0.1\r\n";
    for (const auto& [name, value] : headers) {
        request << name << ": " << value << "\r\n";
    }
    request << "Connection: close\r\n\r\n";
    send_all(sock.fd(), request.str());

    // Read until the blank line that ends the head
    std::vector<char> buffer(std::max<std::size_t>(options_.buffer_size, 4096));
    std::string head_bytes;
    std::size_t head_end = std::string::npos;
    while (head_end == std::string::npos) {
        check_deadline();
        std::size_t n = recv_some(sock.fd(), buffer.data(), buffer.size());
        if (n == 0) {
            throw LanShareError(ErrorCode::ConnectionClosed, "connection closed before response head");
        }
        head_bytes.append(buffer.data(), n);
        head_end = head_bytes.find("\r\n\r\n");
        if (head_end == std::string::npos && head_bytes.size() > kMaxResponseHead) {
            throw LanShareError(ErrorCode::ProtocolError, "response head too large");
        }
    }

    auto parsed = parse_response_head(std::string_view(head_bytes).substr(0, head_end + 2));
    if (!parsed) {
        throw LanShareError(ErrorCode::ProtocolError, "malformed response head from " + url.authority());
    }

    FetchOutcome outcome;
    outcome.head = std::move(*parsed);
    if (method == "HEAD") {
        return outcome;
    }
    if (on_head && !on_head(outcome.head)) {
        outcome.stopped = true;
        return outcome;
    }

    auto te = outcome.head.header("transfer-encoding");
    if (te && to_lower(*te) != "identity") {
        throw LanShareError(ErrorCode::ProtocolError, "unsupported transfer encoding: " + *te);
    }

    auto expected = outcome.head.content_length();
    auto deliver = [&](const char* data, std::size_t size) -> bool {
        if (expected) {
            size = static_cast<std::size_t>(std::min<uint64_t>(size, *expected - outcome.body_bytes));
        }
        if (size == 0) return true;
        outcome.body_bytes += size;
        return !on_body || on_body(data, size);
    };

    // Body bytes that arrived together with the head
    std::size_t leftover = head_bytes.size() - (head_end + 4);
    if (leftover > 0 && !deliver(head_bytes.data() + head_end + 4, leftover)) {
        outcome.stopped = true;
        return outcome;
    }

    while (!expected || outcome.body_bytes < *expected) {
        check_deadline();
        std::size_t n = recv_some(sock.fd(), buffer.data(), buffer.size());
        if (n == 0) {
            if (expected) {
                throw LanShareError(ErrorCode::ConnectionClosed,
                                    "connection closed after " + std::to_string(outcome.body_bytes) +
                                    " of " + std::to_string(*expected) + " body bytes");
            }
            break;
        }
        if (!deliver(buffer.data(), n)) {
            outcome.stopped = true;
            break;
        }
    }
    return outcome;
}

} // namespace lanshare
