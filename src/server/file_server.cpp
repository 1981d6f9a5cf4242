#include "lanshare/server/file_server.h"
#include "lanshare/base/logger.h"
#include "lanshare/transfer/chunk_policy.h"
#include <elio/elio.hpp>
#include <elio/net/tcp.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <fstream>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace lanshare {

namespace {

// "10.0.0.5:41234" or "[::1]:41234" -> address part only
std::string host_of(const std::string& endpoint) {
    if (!endpoint.empty() && endpoint.front() == '[') {
        auto close = endpoint.find(']');
        return close == std::string::npos ? endpoint : endpoint.substr(1, close - 1);
    }
    auto colon = endpoint.rfind(':');
    if (colon == std::string::npos || endpoint.find(':') != colon) return endpoint;
    return endpoint.substr(0, colon);
}

} // anonymous namespace

struct FileServer::Impl {
    NodeConfig node;
    ServerConfig server_config;
    RequestHandler handler;

    std::shared_ptr<elio::runtime::scheduler> scheduler;
    std::optional<elio::net::tcp_listener> tcp_listener;
    std::thread server_thread;
    std::atomic<bool> running{false};
    std::atomic<uint16_t> listen_port{0};

    ServerMetrics metrics;
    mutable std::mutex metrics_mutex;

    Impl(const NodeConfig& n, ServerContext context)
        : node(n), server_config(context.config), handler(std::move(context)) {}

    void record(int status, uint64_t file_bytes, bool aborted) {
        std::lock_guard<std::mutex> lock(metrics_mutex);
        ++metrics.total_requests;
        if (status >= 400) ++metrics.rejected_requests;
        if (aborted) ++metrics.aborted_responses;
        metrics.bytes_served += file_bytes;
    }

    elio::coro::task<bool> write_all(elio::net::tcp_stream& stream, const char* data, size_t size) {
        size_t sent = 0;
        while (sent < size) {
            auto result = co_await stream.write(data + sent, size - sent);
            if (result.result <= 0) {
                co_return false;
            }
            sent += static_cast<size_t>(result.result);
        }
        co_return true;
    }

    // Reads up to the blank line; nullopt with status set when the head is unusable
    elio::coro::task<std::optional<std::string>> read_head(elio::net::tcp_stream& stream, int& status) {
        std::string head;
        char buffer[4096];
        const size_t limit = server_config.max_request_head_bytes;

        while (true) {
            auto result = co_await stream.read(buffer, sizeof(buffer));
            if (result.result <= 0) {
                status = 0;  // peer went away, nothing to answer
                co_return std::nullopt;
            }
            head.append(buffer, static_cast<size_t>(result.result));
            auto end = head.find("\r\n\r\n");
            if (end != std::string::npos) {
                if (end + 4 > limit) break;
                head.resize(end + 2);
                co_return head;
            }
            if (head.size() > limit) break;
        }
        status = 431;
        co_return std::nullopt;
    }

    // Streams the slice; returns bytes written, stops at the first write failure
    elio::coro::task<uint64_t> stream_slice(elio::net::tcp_stream& stream, const FileSlice& slice) {
        std::ifstream file(slice.path, std::ios::binary);
        if (!file) {
            Logger::instance().error("Cannot open shared file " + slice.path);
            co_return 0;
        }
        file.seekg(static_cast<std::streamoff>(slice.offset));

        std::vector<char> buffer(adaptive_buffer_size(slice.length));
        uint64_t remaining = slice.length;
        uint64_t written = 0;
        while (remaining > 0) {
            auto want = static_cast<std::streamsize>(std::min<uint64_t>(remaining, buffer.size()));
            file.read(buffer.data(), want);
            auto got = file.gcount();
            if (got <= 0) {
                Logger::instance().warning("Short read from " + slice.path + " at offset " +
                                           std::to_string(slice.offset + written));
                break;
            }
            if (!co_await write_all(stream, buffer.data(), static_cast<size_t>(got))) {
                break;
            }
            written += static_cast<uint64_t>(got);
            remaining -= static_cast<uint64_t>(got);
        }
        co_return written;
    }

    elio::coro::task<void> handle_connection(elio::net::tcp_stream stream) {
        auto peer = stream.peer_address();
        std::string client = peer ? host_of(peer->to_string()) : "unknown";

        try {
            int status = 0;
            auto head = co_await read_head(stream, status);

            ResponsePlan plan;
            std::optional<HttpRequest> request;
            if (head) {
                request = parse_request_head(*head);
                if (request) {
                    request->client_address = client;
                    plan = handler.handle(*request);
                } else {
                    plan = RequestHandler::error(400, "Malformed request");
                }
            } else if (status != 0) {
                plan = RequestHandler::error(status, "Request head too large");
            } else {
                co_await stream.close();
                co_return;
            }
            plan.set_header("Connection", "close");

            std::string out = plan.serialize_head();
            out += plan.body;
            bool ok = co_await write_all(stream, out.data(), out.size());

            uint64_t file_bytes = 0;
            if (ok && plan.file) {
                file_bytes = co_await stream_slice(stream, *plan.file);
                ok = file_bytes == plan.file->length;
            }
            if (!ok) {
                Logger::instance().debug("Response to " + client + " aborted after " +
                                         std::to_string(file_bytes) + " file bytes");
            }

            record(plan.status, file_bytes, !ok);
            Logger::instance().debug("{} {} {} -> {}", client,
                                     request ? request->method : std::string("-"),
                                     request ? request->target : std::string("-"), plan.status);
        } catch (const std::exception& e) {
            Logger::instance().error("Connection handler error for " + client + ": " + e.what());
        }

        co_await stream.close();
        co_return;
    }

    elio::coro::task<void> accept_loop() {
        if (!tcp_listener) {
            co_return;
        }

        while (running.load()) {
            auto stream_result = co_await tcp_listener->accept();
            if (!stream_result) {
                if (running.load()) {
                    Logger::instance().error("Accept error: " + std::string(strerror(errno)));
                }
                continue;
            }

            auto handler_task = handle_connection(std::move(*stream_result));
            scheduler->spawn(handler_task.release());
        }

        Logger::instance().debug("File server accept loop stopped");
    }
};

FileServer::FileServer(const NodeConfig& node, ServerContext context)
    : impl_(std::make_unique<Impl>(node, std::move(context))) {}

FileServer::~FileServer() {
    stop();
}

bool FileServer::start() {
    if (impl_->running.load()) {
        Logger::instance().warning("File server already running");
        return true;
    }

    impl_->running = true;
    std::promise<bool> bound;
    auto bound_future = bound.get_future();

    impl_->server_thread = std::thread([this, &bound]() {
        auto& impl = *impl_;
        uint16_t port = impl.node.service_port;

        impl.scheduler = std::make_shared<elio::runtime::scheduler>(
            std::max<uint32_t>(1, impl.server_config.scheduler_threads));
        impl.scheduler->start();

        elio::net::tcp_options opts;
        opts.reuse_addr = true;
        opts.no_delay = true;
        opts.backlog = 64;

        auto bind_addr = impl.node.bind_address == "0.0.0.0"
            ? elio::net::socket_address(elio::net::ipv4_address(port))
            : elio::net::socket_address(impl.node.bind_address, port);
        auto listener_result = elio::net::tcp_listener::bind(bind_addr, opts);

        if (!listener_result) {
            Logger::instance().error("Failed to bind file server on " + impl.node.bind_address + ":" +
                                     std::to_string(port) + ": " + std::string(strerror(errno)));
            impl.running = false;
            impl.scheduler->shutdown();
            bound.set_value(false);
            return;
        }

        impl.tcp_listener = std::move(*listener_result);
        impl.listen_port = impl.tcp_listener->local_address().port();
        Logger::instance().info("File server listening on " + impl.node.bind_address + ":" +
                                std::to_string(impl.listen_port.load()));

        auto loop = impl.accept_loop();
        impl.scheduler->spawn(loop.release());
        bound.set_value(true);

        while (impl.running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (impl.tcp_listener) {
            impl.tcp_listener->close();
        }
    });

    bool ok = bound_future.get();
    if (!ok && impl_->server_thread.joinable()) {
        impl_->server_thread.join();
    }
    return ok;
}

void FileServer::stop() {
    if (!impl_->running.exchange(false)) {
        if (impl_->server_thread.joinable()) {
            impl_->server_thread.join();
        }
        return;
    }

    Logger::instance().info("Stopping file server");

    if (impl_->server_thread.joinable()) {
        impl_->server_thread.join();
    }
    if (impl_->scheduler) {
        impl_->scheduler->shutdown();
        impl_->scheduler.reset();
    }
    impl_->tcp_listener.reset();

    Logger::instance().info("File server stopped");
}

bool FileServer::is_running() const {
    return impl_->running.load();
}

uint16_t FileServer::get_listen_port() const {
    return impl_->listen_port.load();
}

ServerMetrics FileServer::get_metrics() const {
    std::lock_guard<std::mutex> lock(impl_->metrics_mutex);
    return impl_->metrics;
}

} // namespace lanshare
