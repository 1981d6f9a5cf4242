#ifndef LANSHARE_SERVER_REQUEST_HANDLER_H
#define LANSHARE_SERVER_REQUEST_HANDLER_H

#include "lanshare/base/config.h"
#include "lanshare/http/message.h"
#include "lanshare/server/access_gate.h"
#include "lanshare/server/share_catalog.h"
#include <cstdint>
#include <optional>
#include <string>

namespace lanshare {

// Byte range of a local file to stream after the response head
struct FileSlice {
    std::string path;
    uint64_t offset = 0;
    uint64_t length = 0;
};

// Everything the server needs to write one response
struct ResponsePlan {
    int status = 200;
    HeaderList headers;
    std::string body;                // in-memory body, empty for HEAD
    std::optional<FileSlice> file;   // streamed after the head when set

    std::optional<std::string> header(const std::string& name) const;
    void set_header(const std::string& name, const std::string& value);

    // Status line and headers including the terminating blank line
    std::string serialize_head() const;
};

struct ServerContext {
    const ShareCatalog& catalog;
    AccessGate* gate = nullptr;  // optional, not owned
    ServerConfig config;
};

// Routes a parsed request to a ResponsePlan. Holds no per-request state,
// so one instance is shared by all connections.
class RequestHandler {
public:
    explicit RequestHandler(ServerContext context);

    ResponsePlan handle(const HttpRequest& request) const;

    // Error plan with a small JSON body
    static ResponsePlan error(int status, const std::string& message, HeaderList extra = {});

    // Content type used by the inline preview route, keyed by lowercase extension
    static std::string preview_mime_type(const std::string& extension);

private:
    ResponsePlan serve_index(bool head_only) const;
    ResponsePlan serve_catalog(bool head_only) const;
    ResponsePlan serve_file(const HttpRequest& request, const std::string& id, bool as_attachment) const;

    ServerContext context_;
};

} // namespace lanshare

#endif // LANSHARE_SERVER_REQUEST_HANDLER_H
