#pragma once
#include <string>
#include <functional>
#include <map>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <cstdint>

namespace browsetrail {

class McpServer;

// A parsed inbound HTTP request.
struct HttpRequest {
    std::string method;   // "GET", "POST", ...
    std::string path;     // e.g. "/mcp", query string dropped
    std::map<std::string, std::string> headers;  // header names lowercased
    std::string body;
};

struct HttpReply {
    int         status       = 200;
    std::string content_type = "text/plain";
    std::string body;
};

// Minimal HTTP/1.1 server for local MCP clients. Each accepted connection
// is served on its own worker thread (bounded by kMaxConnections) and
// closed after one response. The accept loop runs in a background thread.
class HttpServer {
public:
    using Handler = std::function<HttpReply(const HttpRequest&)>;

    static constexpr int kMaxConnections = 16;

    // listen_addr: "host:port", e.g. "127.0.0.1:3000"
    // max_body:    maximum POST body size in bytes; larger bodies get 413
    HttpServer(std::string listen_addr, uint32_t max_body, Handler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Stop accepting, then wait for in-flight connections to finish.
    void stop();

    // Valid after a successful start()
    uint16_t port() const { return port_; }

private:
    void accept_loop();
    void handle_connection(int client_fd) const;

    std::string listen_addr_;
    uint32_t    max_body_;
    Handler     handler_;
    uint16_t    port_ = 0;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex workers_mutex_;
    std::condition_variable workers_cv_;
    int active_workers_ = 0;
};

// Parse "host:port" into host and port.  Returns false if the string is
// malformed or the port is out of range.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Route HTTP requests to an MCP dispatcher: POST <mcp_path> carries JSON-RPC,
// GET / answers a liveness probe.
HttpServer::Handler make_mcp_handler(const McpServer& server, std::string mcp_path);

} // namespace browsetrail
