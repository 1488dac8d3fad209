#include "http_server.hpp"
#include "../util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace mcpgate {

// ── URL helpers ───────────────────────────────────────────────────────────────

static std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            char hex[3] = {s[i + 1], s[i + 2], '\0'};
            char* end;
            long val = std::strtol(hex, &end, 16);
            if (end == hex + 2) {
                out += static_cast<char>(val);
                i += 2;
                continue;
            }
        } else if (s[i] == '+') {
            out += ' ';
            continue;
        }
        out += s[i];
    }
    return out;
}

static std::map<std::string, std::string> parse_query_string(const std::string& qs) {
    std::map<std::string, std::string> result;
    size_t start = 0;
    while (start <= qs.size()) {
        size_t amp = qs.find('&', start);
        if (amp == std::string::npos) amp = qs.size();
        std::string pair = qs.substr(start, amp - start);
        auto eq = pair.find('=');
        if (eq != std::string::npos) {
            result[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        } else if (!pair.empty()) {
            result[url_decode(pair)] = "";
        }
        start = amp + 1;
    }
    return result;
}

std::string ServerRequest::query_param(const std::string& key) const {
    auto it = query_params.find(key);
    return it != query_params.end() ? it->second : "";
}

std::string ServerRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it != headers.end() ? it->second : "";
}

ServerResponse json_response(int status, const nlohmann::json& body) {
    ServerResponse resp;
    resp.status = status;
    resp.content_type = "application/json";
    resp.body = body.dump();
    return resp;
}

// ── Address parsing ───────────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    try {
        int p = std::stoi(addr.substr(pos + 1));
        if (p <= 0 || p > 65535) return false;
        port = static_cast<uint16_t>(p);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

// ── Request / response framing ────────────────────────────────────────────────

bool parse_request_head(const std::string& head, ServerRequest& req) {
    auto rl_end = head.find("\r\n");
    std::string request_line = head.substr(0, rl_end);

    {
        std::istringstream ss(request_line);
        std::string pq, ver;
        if (!(ss >> req.method >> pq >> ver)) return false;
        if (!starts_with(ver, "HTTP/")) return false;
        auto q = pq.find('?');
        if (q != std::string::npos) {
            req.path         = pq.substr(0, q);
            req.query_params = parse_query_string(pq.substr(q + 1));
        } else {
            req.path = pq;
        }
    }

    if (rl_end == std::string::npos) return true;

    size_t pos = rl_end + 2;
    while (pos < head.size()) {
        auto ne = head.find("\r\n", pos);
        if (ne == std::string::npos) ne = head.size();
        std::string hline = head.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }
    return true;
}

const char* status_reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        default:  return "OK";
    }
}

std::string serialize_response(const ServerResponse& resp) {
    std::string out =
        "HTTP/1.1 " + std::to_string(resp.status) + " " + status_reason(resp.status) + "\r\n"
        "Content-Type: " + resp.content_type + "\r\n"
        "Content-Length: " + std::to_string(resp.body.size()) + "\r\n";
    for (const auto& [name, value] : resp.headers) {
        out += name + ": " + value + "\r\n";
    }
    out += "Connection: close\r\n\r\n";
    out += resp.body;
    return out;
}

static void send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            return;  // peer went away; nothing left to do for this connection
        }
        sent += static_cast<size_t>(n);
    }
}

static void send_plain(int fd, int status, const std::string& body) {
    ServerResponse resp;
    resp.status = status;
    resp.body = body;
    send_all(fd, serialize_response(resp));
}

// ── HttpServer ────────────────────────────────────────────────────────────────

HttpServer::HttpServer(std::string listen_addr, uint32_t max_body, uint32_t workers,
                       Handler handler)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
    , worker_count_(workers == 0 ? 1 : workers)
    , handler_(std::move(handler))
{}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(std::string& error) {
    std::string host;
    uint16_t port;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    auto close_all = [this]() {
        if (server_fd_ >= 0) { ::close(server_fd_); server_fd_ = -1; }
        ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1;
        ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1;
    };

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        error = "Failed to create server socket";
        close_all();
        return false;
    }

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        error = "Invalid bind address: " + host;
        close_all();
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        error = std::string("bind failed: ") + std::strerror(errno);
        close_all();
        return false;
    }

    if (::listen(server_fd_, 64) != 0) {
        error = std::string("listen failed: ") + std::strerror(errno);
        close_all();
        return false;
    }

    port_ = port;
    running_.store(true);
    workers_.reserve(worker_count_);
    for (uint32_t i = 0; i < worker_count_; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
    accept_thread_ = std::thread([this]() { accept_loop(); });
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0 && ::write(shutdown_pipe_[1], &b, 1) < 0) {
        std::cerr << "[server] Failed to signal shutdown pipe: " << std::strerror(errno) << "\n";
    }
    if (accept_thread_.joinable()) accept_thread_.join();

    pending_cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        for (int fd : pending_) ::close(fd);
        pending_.clear();
    }

    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }
}

void HttpServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen);
        if (cfd < 0) continue;

        struct timeval tv{10, 0};  // 10s recv timeout
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_.push_back(cfd);
        }
        pending_cv_.notify_one();
    }
}

void HttpServer::worker_loop() {
    while (true) {
        int fd = -1;
        {
            std::unique_lock<std::mutex> lock(pending_mutex_);
            pending_cv_.wait(lock, [this]() { return !running_.load() || !pending_.empty(); });
            if (!running_.load()) return;
            fd = pending_.front();
            pending_.pop_front();
        }
        handle_connection(fd);
        ::close(fd);
    }
}

void HttpServer::handle_connection(int fd) const {
    // Read until end-of-headers (CRLFCRLF), cap at 16 KB.
    std::string buf;
    buf.reserve(4096);
    char tmp[4096];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > 16384) {
            send_plain(fd, 400, "Headers too large");
            return;
        }
    }

    auto hdr_end = buf.find("\r\n\r\n");
    ServerRequest req;
    if (!parse_request_head(buf.substr(0, hdr_end), req)) {
        send_plain(fd, 400, "Malformed request line");
        return;
    }
    std::string leftover = buf.substr(hdr_end + 4);

    size_t content_len = 0;
    std::string cl = req.header("content-length");
    if (!cl.empty()) {
        try {
            content_len = std::stoul(cl);
        } catch (const std::exception&) {
            send_plain(fd, 400, "Invalid Content-Length");
            return;
        }
    }

    if (content_len > max_body_) {
        send_plain(fd, 413, "Payload too large");
        return;
    }

    req.body = std::move(leftover);
    while (req.body.size() < content_len) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) break;
        req.body.append(tmp, static_cast<size_t>(n));
    }
    if (req.body.size() > content_len) req.body.resize(content_len);

    ServerResponse resp;
    try {
        resp = handler_(req);
    } catch (const std::exception& e) {
        std::cerr << "[server] Handler error on " << req.method << " " << req.path
                  << ": " << e.what() << "\n";
        resp = json_response(500, {{"error", "internal_error"}});
    }
    send_all(fd, serialize_response(resp));
}

} // namespace mcpgate
