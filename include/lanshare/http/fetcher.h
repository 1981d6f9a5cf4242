#ifndef LANSHARE_HTTP_FETCHER_H
#define LANSHARE_HTTP_FETCHER_H

#include "lanshare/http/message.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace lanshare {

struct FetchOptions {
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds io_timeout{30000};      // per socket read/write
    std::chrono::milliseconds total_timeout{300000};  // whole request
    std::size_t buffer_size = 64 * 1024;
};

struct FetchOutcome {
    HttpResponseHead head;
    uint64_t body_bytes = 0;
    bool stopped = false;  // a callback asked to stop early
};

// Blocking HTTP/1.1 client with explicit timeouts on every network step.
// One connection per request ("Connection: close"). Transport and framing
// failures throw LanShareError with a network or protocol code.
class HttpFetcher {
public:
    // Return false to abandon the response without reading the body
    using HeadCheck = std::function<bool(const HttpResponseHead&)>;
    // Return false to stop reading further body bytes
    using BodySink = std::function<bool(const char* data, std::size_t size)>;

    explicit HttpFetcher(FetchOptions options = {});

    HttpResponseHead head(const HttpUrl& url, const HeaderList& headers = {});

    FetchOutcome get(const HttpUrl& url,
                     const HeaderList& headers,
                     const HeadCheck& on_head,
                     const BodySink& on_body);

    const FetchOptions& options() const { return options_; }

private:
    FetchOutcome execute(const std::string& method,
                         const HttpUrl& url,
                         const HeaderList& headers,
                         const HeadCheck& on_head,
                         const BodySink& on_body);

    FetchOptions options_;
};

} // namespace lanshare

#endif // LANSHARE_HTTP_FETCHER_H
