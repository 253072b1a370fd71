#include <memmem/socket_client.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <thread>

namespace mm {

SocketClient::SocketClient(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

SocketClient::~SocketClient() {
    disconnect();
}

bool SocketClient::connect() {
    if (fd_ >= 0) return true;  // Already connected

    fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd_ < 0) {
        last_error_ = std::string("socket() failed: ") + strerror(errno);
        return false;
    }

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        last_error_ = std::string("connect() failed: ") + strerror(errno);
        close(fd_);
        fd_ = -1;
        return false;
    }

    buffer_.clear();
    return true;
}

void SocketClient::disconnect() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
    buffer_.clear();
}

bool SocketClient::wait_for_socket(int timeout_ms) {
    auto start = std::chrono::steady_clock::now();

    while (true) {
        if (access(socket_path_.c_str(), F_OK) == 0 && connect()) {
            disconnect();  // Caller reconnects
            return true;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (elapsed >= timeout_ms) {
            last_error_ = "socket not available after " + std::to_string(timeout_ms) + "ms";
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

bool SocketClient::send_line(const std::string& line) {
    if (fd_ < 0) {
        last_error_ = "Not connected";
        return false;
    }

    std::string msg = line + "\n";
    size_t sent = 0;
    while (sent < msg.size()) {
        ssize_t n = send(fd_, msg.data() + sent, msg.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
                pollfd pfd = {fd_, POLLOUT, 0};
                poll(&pfd, 1, 1000);
                continue;
            }
            last_error_ = std::string("write() failed: ") + strerror(errno);
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

std::optional<std::string> SocketClient::read_line(int timeout_ms) {
    if (fd_ < 0) {
        last_error_ = "Not connected";
        return std::nullopt;
    }

    pollfd pfd = {fd_, POLLIN, 0};

    while (true) {
        size_t pos = buffer_.find('\n');
        if (pos != std::string::npos) {
            std::string line = buffer_.substr(0, pos);
            buffer_.erase(0, pos + 1);
            return line;
        }

        int ret = poll(&pfd, 1, timeout_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            last_error_ = std::string("poll() failed: ") + strerror(errno);
            return std::nullopt;
        }
        if (ret == 0) {
            last_error_ = "Response timeout";
            return std::nullopt;
        }

        char buf[4096];
        ssize_t n = read(fd_, buf, sizeof(buf));
        if (n <= 0) {
            last_error_ = n == 0 ? "Connection closed" :
                          std::string("read() failed: ") + strerror(errno);
            return std::nullopt;
        }

        buffer_.append(buf, static_cast<size_t>(n));
        if (buffer_.size() > MAX_RESPONSE_SIZE) {
            last_error_ = "Response too large";
            return std::nullopt;
        }
    }
}

std::optional<std::string> SocketClient::request(const std::string& line, int timeout_ms) {
    if (!send_line(line)) return std::nullopt;
    return read_line(timeout_ms);
}

} // namespace mm
