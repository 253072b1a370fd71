#pragma once
// Socket Server: Unix domain socket server for the embedding worker
//
// Newline-delimited messages over a non-blocking AF_UNIX socket,
// multiplexed with poll(). Clients are addressed by a connection id rather
// than their fd so a late response never lands on a recycled descriptor.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mm {

// One complete line received from a client
struct ClientRequest {
    uint64_t client_id;
    std::string data;
};

// Connection state for a single client
struct ClientConnection {
    uint64_t id = 0;
    int fd = -1;
    std::string read_buffer;
    std::string write_buffer;
    bool wants_close = false;

    bool has_complete_message() const;
    std::string extract_message();
};

// True if something accepts a connection on path within timeout
bool probe_socket(const std::string& path, std::chrono::milliseconds timeout);

class SocketServer {
public:
    static constexpr int MAX_CONNECTIONS = 32;
    static constexpr size_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;  // 16MB

    explicit SocketServer(std::string socket_path);
    ~SocketServer();

    // Non-copyable, non-movable (owns file descriptors)
    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;
    SocketServer(SocketServer&&) = delete;
    SocketServer& operator=(SocketServer&&) = delete;

    // Bind and listen. Removes a stale socket file first, so probe before
    // calling this if another server may be alive.
    bool start();
    void stop();
    bool running() const { return server_fd_ >= 0; }

    // One round of I/O. Returns complete lines. wake_fd, when >= 0, is
    // polled too and drained so another thread can interrupt the wait.
    // timeout_ms: -1 = block, 0 = non-blocking, >0 = wait up to N ms
    std::vector<ClientRequest> poll(int timeout_ms, int wake_fd = -1);

    // Queue a response line; dropped if the client is gone
    void respond(uint64_t client_id, const std::string& response);

    size_t connection_count() const { return connections_.size(); }
    uint64_t accepted_total() const { return next_id_ - 1; }

    const std::string& socket_path() const { return socket_path_; }
    const std::string& last_error() const { return last_error_; }

private:
    std::string socket_path_;
    int server_fd_ = -1;
    uint64_t next_id_ = 1;
    std::vector<ClientConnection> connections_;
    std::string last_error_;

    bool create_socket();
    void accept_new_connections();
    void cleanup_closed_connections();
};

} // namespace mm
