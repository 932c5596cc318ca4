#pragma once
#include <string>
#include <functional>
#include <map>
#include <vector>
#include <atomic>
#include <thread>
#include <cstdint>

namespace docserve {

// A parsed inbound HTTP request.
struct HttpRequest {
    std::string method;   // "GET", "POST", ...
    std::string path;     // e.g. "/api/render", without the query string
    std::map<std::string, std::string> query_params;  // URL-decoded query parameters
    std::map<std::string, std::string> headers;        // header names lowercased
    std::string body;

    // Return a query parameter value, or "" if absent.
    std::string query_param(const std::string& key) const;
};

struct HttpResponse {
    int         status       = 200;
    std::string content_type = "application/json";
    std::string body;
};

// Minimal HTTP/1.1 server: one request per connection, Connection: close.
// `workers` threads share the listening socket and each handles one
// connection at a time, so the handler must be thread-safe.
class HttpServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    // listen_addr: "host:port", e.g. "127.0.0.1:3000". Port 0 binds an
    // ephemeral port (see port()).
    // max_body:    maximum request body size in bytes; larger bodies get 413
    HttpServer(std::string listen_addr, uint32_t workers, uint32_t max_body, Handler handler);
    ~HttpServer();

    // Bind and start the worker threads. Returns false and populates error
    // on failure.
    bool start(std::string& error);

    // Signal the workers to stop and join them.
    void stop();

    // Port actually bound, valid after a successful start().
    uint16_t port() const { return bound_port_; }

private:
    void worker_loop();
    void handle_connection(int client_fd) const;

    std::string listen_addr_;
    uint32_t    workers_;
    uint32_t    max_body_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_   = 0;
    std::atomic<bool> running_{false};
    std::vector<std::thread> threads_;
};

// Parse "host:port" into host and port. Returns false if the string is
// malformed or the port is out of range.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Parse "a=1&b=two" into URL-decoded pairs.
std::map<std::string, std::string> parse_query_string(const std::string& qs);

// Reason phrase for a status code ("OK" for anything unknown).
const char* status_reason(int status);

} // namespace docserve
