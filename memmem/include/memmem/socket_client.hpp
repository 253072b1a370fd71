#pragma once
// Socket Client: line-oriented Unix socket client
//
// Used by WorkerEmbedder and by the worker tests. request() sends one line
// and waits for one line back; send_line()/read_line() let a caller keep
// several requests in flight on one connection.

#include <cstddef>
#include <optional>
#include <string>

namespace mm {

class SocketClient {
public:
    static constexpr int CONNECT_TIMEOUT_MS = 5000;
    static constexpr int RESPONSE_TIMEOUT_MS = 30000;
    static constexpr size_t MAX_RESPONSE_SIZE = 16 * 1024 * 1024;

    explicit SocketClient(std::string socket_path);
    ~SocketClient();

    // Non-copyable, non-movable (owns file descriptor)
    SocketClient(const SocketClient&) = delete;
    SocketClient& operator=(const SocketClient&) = delete;
    SocketClient(SocketClient&&) = delete;
    SocketClient& operator=(SocketClient&&) = delete;

    bool connect();
    void disconnect();
    bool connected() const { return fd_ >= 0; }

    // Send one line, wait for one line
    std::optional<std::string> request(const std::string& line,
                                       int timeout_ms = RESPONSE_TIMEOUT_MS);

    bool send_line(const std::string& line);
    std::optional<std::string> read_line(int timeout_ms = RESPONSE_TIMEOUT_MS);

    // Poll until something accepts connections on the path
    bool wait_for_socket(int timeout_ms);

    const std::string& last_error() const { return last_error_; }
    const std::string& socket_path() const { return socket_path_; }

private:
    std::string socket_path_;
    int fd_ = -1;
    std::string buffer_;    // Bytes past the last returned line
    std::string last_error_;
};

} // namespace mm
