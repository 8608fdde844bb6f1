#include "http_server.hpp"
#include "server.hpp"
#include "../util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace browsetrail {

// ── Address parsing ───────────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    std::string digits = addr.substr(pos + 1);
    if (digits.empty() || digits.size() > 5 ||
        digits.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    int p = std::stoi(digits);
    if (p <= 0 || p > 65535) return false;
    port = static_cast<uint16_t>(p);
    return true;
}

// ── HttpServer ────────────────────────────────────────────────────────────────

HttpServer::HttpServer(std::string listen_addr, uint32_t max_body, Handler handler)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
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
    if (host == "localhost") host = "127.0.0.1";

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        error = "Failed to create server socket";
        ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1;
        ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1;
        return false;
    }

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    auto fail = [this, &error](const std::string& msg) {
        error = msg;
        ::close(server_fd_); server_fd_ = -1;
        ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1;
        ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1;
        return false;
    };

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        return fail("Invalid bind address: " + host);
    }
    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        return fail(std::string("bind failed: ") + std::strerror(errno));
    }
    if (::listen(server_fd_, 64) != 0) {
        return fail(std::string("listen failed: ") + std::strerror(errno));
    }

    port_ = port;
    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    std::cerr << "[http] Listening on " << host << ":" << port_ << "\n";
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0) {
        ssize_t n = ::write(shutdown_pipe_[1], &b, 1);
        (void)n;
    }
    if (thread_.joinable()) thread_.join();

    {
        std::unique_lock<std::mutex> lock(workers_mutex_);
        workers_cv_.wait(lock, [this] { return active_workers_ == 0; });
    }

    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }
    std::cerr << "[http] Stopped\n";
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
            std::unique_lock<std::mutex> lock(workers_mutex_);
            workers_cv_.wait(lock, [this] { return active_workers_ < kMaxConnections; });
            ++active_workers_;
        }

        try {
            std::thread([this, cfd]() {
                handle_connection(cfd);
                ::close(cfd);
                std::lock_guard<std::mutex> lock(workers_mutex_);
                --active_workers_;
                workers_cv_.notify_all();
            }).detach();
        } catch (const std::system_error& e) {
            std::cerr << "[http] Failed to spawn worker: " << e.what() << "\n";
            ::close(cfd);
            std::lock_guard<std::mutex> lock(workers_mutex_);
            --active_workers_;
            workers_cv_.notify_all();
        }
    }
}

// ── HTTP helpers ──────────────────────────────────────────────────────────────

static void send_http_response(int fd, int status, const std::string& content_type,
                               const std::string& body) {
    const char* reason = "OK";
    if      (status == 202) reason = "Accepted";
    else if (status == 400) reason = "Bad Request";
    else if (status == 404) reason = "Not Found";
    else if (status == 405) reason = "Method Not Allowed";
    else if (status == 413) reason = "Payload Too Large";
    else if (status == 500) reason = "Internal Server Error";

    std::string resp =
        "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n"
        "Content-Type: " + content_type + "\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "Connection: close\r\n\r\n" + body;

    size_t sent = 0;
    while (sent < resp.size()) {
        ssize_t n = ::send(fd, resp.data() + sent, resp.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;
        sent += static_cast<size_t>(n);
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
            send_http_response(fd, 400, "text/plain", "Headers too large");
            return;
        }
    }

    auto hdr_end  = buf.find("\r\n\r\n");
    std::string headers_raw = buf.substr(0, hdr_end);
    std::string leftover    = buf.substr(hdr_end + 4);

    // Request line; a bare request line has no trailing CRLF inside headers_raw
    auto rl_end = headers_raw.find("\r\n");
    if (rl_end == std::string::npos) rl_end = headers_raw.size();

    HttpRequest req;
    {
        std::istringstream ss(headers_raw.substr(0, rl_end));
        std::string pq, ver;
        if (!(ss >> req.method >> pq >> ver)) {
            send_http_response(fd, 400, "text/plain", "Malformed request line");
            return;
        }
        req.path = pq.substr(0, pq.find('?'));
    }

    size_t pos = rl_end + 2;
    while (pos < headers_raw.size()) {
        auto ne = headers_raw.find("\r\n", pos);
        if (ne == std::string::npos) ne = headers_raw.size();
        std::string hline = headers_raw.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }

    if (req.method == "POST") {
        size_t content_len = 0;
        auto it = req.headers.find("content-length");
        if (it != req.headers.end()) {
            const std::string& v = it->second;
            if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos ||
                v.size() > 12) {
                send_http_response(fd, 400, "text/plain", "Invalid Content-Length");
                return;
            }
            content_len = static_cast<size_t>(std::stoull(v));
        }

        if (content_len > max_body_) {
            send_http_response(fd, 413, "text/plain", "Payload too large");
            return;
        }

        req.body = std::move(leftover);
        while (req.body.size() < content_len) {
            ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
            if (n <= 0) break;
            req.body.append(tmp, static_cast<size_t>(n));
        }
        if (req.body.size() > content_len) req.body.resize(content_len);
    }

    HttpReply resp;
    try {
        resp = handler_(req);
    } catch (const std::exception& e) {
        std::cerr << "[http] Handler failed: " << e.what() << "\n";
        resp = HttpReply{500, "text/plain", "Internal server error"};
    }
    send_http_response(fd, resp.status, resp.content_type, resp.body);
}

// ── MCP routing ───────────────────────────────────────────────────────────────

HttpServer::Handler make_mcp_handler(const McpServer& server, std::string mcp_path) {
    return [&server, mcp_path](const HttpRequest& req) -> HttpReply {
        if (req.path == mcp_path) {
            if (req.method != "POST") {
                return HttpReply{405, "text/plain", "Method not allowed"};
            }
            std::string out = server.handle_text(req.body);
            if (out.empty()) return HttpReply{202, "application/json", ""};
            return HttpReply{200, "application/json", out};
        }
        if (req.path == "/") {
            if (req.method != "GET") {
                return HttpReply{405, "text/plain", "Method not allowed"};
            }
            return HttpReply{200, "text/plain", "browsetrail MCP server is running"};
        }
        return HttpReply{404, "text/plain", "Not found"};
    };
}

} // namespace browsetrail
