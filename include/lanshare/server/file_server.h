#ifndef LANSHARE_SERVER_FILE_SERVER_H
#define LANSHARE_SERVER_FILE_SERVER_H

#include "lanshare/base/config.h"
#include "lanshare/server/request_handler.h"
#include <cstdint>
#include <memory>

namespace lanshare {

struct ServerMetrics {
    uint64_t total_requests = 0;
    uint64_t rejected_requests = 0;   // 4xx/5xx responses
    uint64_t aborted_responses = 0;   // write failed mid-stream
    uint64_t bytes_served = 0;        // file bytes only
};

// HTTP/1.1 file server on an elio scheduler running in its own thread.
// One request per connection; every response closes the connection.
class FileServer {
public:
    FileServer(const NodeConfig& node, ServerContext context);
    ~FileServer();

    // Binds and starts accepting. Port 0 picks an ephemeral port.
    bool start();

    // Idempotent
    void stop();

    bool is_running() const;

    // Actual bound port, 0 before start()
    uint16_t get_listen_port() const;

    ServerMetrics get_metrics() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lanshare

#endif // LANSHARE_SERVER_FILE_SERVER_H
