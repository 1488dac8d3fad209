#pragma once
#include "request.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mcpgate {

// Minimal HTTP/1.1 server: one request per connection, "Connection: close".
// An accept thread hands connections to a fixed pool of worker threads, so a
// handler blocked on outbound I/O does not hold up other requests.
class HttpServer {
public:
    using Handler = std::function<ServerResponse(ServerRequest&)>;

    // listen_addr: "host:port", e.g. "127.0.0.1:8000"
    // max_body:    maximum request body size in bytes; larger bodies get 413
    // workers:     number of handler threads (at least 1)
    HttpServer(std::string listen_addr, uint32_t max_body, uint32_t workers,
               Handler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind, listen and start threads. Returns false and populates error on failure.
    bool start(std::string& error);

    // Signal all threads to stop and join them. Queued connections are closed.
    void stop();

    // Port parsed from listen_addr; 0 before start().
    uint16_t port() const { return port_; }

private:
    void accept_loop();
    void worker_loop();
    void handle_connection(int client_fd) const;

    std::string listen_addr_;
    uint32_t    max_body_;
    uint32_t    worker_count_;
    Handler     handler_;
    uint16_t    port_ = 0;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    std::vector<std::thread> workers_;
    std::deque<int> pending_;
    std::mutex pending_mutex_;
    std::condition_variable pending_cv_;
};

// Parse "host:port" into host and port.  Returns false if the string is
// malformed or the port is out of range.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Parse the request line and headers (everything before the blank line).
// Returns false if the request line is malformed.
bool parse_request_head(const std::string& head, ServerRequest& req);

// Status line reason phrase for the codes this server emits.
const char* status_reason(int status);

// Serialize a full HTTP/1.1 response including Content-Length.
std::string serialize_response(const ServerResponse& resp);

} // namespace mcpgate
