#include <memmem/socket_server.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <algorithm>

namespace mm {

namespace {

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

sockaddr_un make_address(const std::string& path) {
    sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    return addr;
}

}  // anonymous namespace

// Message framing: newline-delimited JSON
bool ClientConnection::has_complete_message() const {
    return read_buffer.find('\n') != std::string::npos;
}

std::string ClientConnection::extract_message() {
    size_t pos = read_buffer.find('\n');
    if (pos == std::string::npos) return "";

    std::string msg = read_buffer.substr(0, pos);
    read_buffer.erase(0, pos + 1);
    return msg;
}

bool probe_socket(const std::string& path, std::chrono::milliseconds timeout) {
    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) return false;
    set_nonblocking(fd);

    sockaddr_un addr = make_address(path);
    bool alive = false;
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
        alive = true;
    } else if (errno == EINPROGRESS || errno == EAGAIN) {
        // Backlog full or still connecting - wait for writability
        pollfd pfd = {fd, POLLOUT, 0};
        if (::poll(&pfd, 1, static_cast<int>(timeout.count())) > 0) {
            int err = 0;
            socklen_t len = sizeof(err);
            alive = getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0;
        }
    }
    close(fd);
    return alive;
}

SocketServer::SocketServer(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

SocketServer::~SocketServer() {
    stop();
}

bool SocketServer::start() {
    if (server_fd_ >= 0) return true;  // Already running

    if (!create_socket()) {
        return false;
    }

    std::cerr << "[socket_server] Listening on " << socket_path_ << "\n";
    return true;
}

void SocketServer::stop() {
    for (auto& conn : connections_) {
        if (conn.fd >= 0) {
            close(conn.fd);
        }
    }
    connections_.clear();

    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
        // Only the owner removes the socket file
        unlink(socket_path_.c_str());
    }
}

bool SocketServer::create_socket() {
    // Remove stale socket file
    unlink(socket_path_.c_str());

    server_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        last_error_ = std::string("socket() failed: ") + strerror(errno);
        std::cerr << "[socket_server] " << last_error_ << "\n";
        return false;
    }

    set_nonblocking(server_fd_);

    sockaddr_un addr = make_address(socket_path_);
    if (bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        last_error_ = std::string("bind() failed: ") + strerror(errno);
        std::cerr << "[socket_server] " << last_error_ << "\n";
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    // User read/write only
    chmod(socket_path_.c_str(), 0600);

    if (listen(server_fd_, MAX_CONNECTIONS) < 0) {
        last_error_ = std::string("listen() failed: ") + strerror(errno);
        std::cerr << "[socket_server] " << last_error_ << "\n";
        close(server_fd_);
        server_fd_ = -1;
        unlink(socket_path_.c_str());
        return false;
    }

    return true;
}

std::vector<ClientRequest> SocketServer::poll(int timeout_ms, int wake_fd) {
    std::vector<ClientRequest> requests;

    if (server_fd_ < 0) return requests;

    std::vector<pollfd> fds;
    fds.reserve(2 + connections_.size());

    fds.push_back({server_fd_, POLLIN, 0});
    fds.push_back({wake_fd, POLLIN, 0});  // Negative fd is ignored by poll()

    for (const auto& conn : connections_) {
        short events = POLLIN;
        if (!conn.write_buffer.empty()) {
            events |= POLLOUT;
        }
        fds.push_back({conn.fd, events, 0});
    }

    int ret = ::poll(fds.data(), fds.size(), timeout_ms);
    if (ret < 0) {
        if (errno != EINTR) {
            std::cerr << "[socket_server] poll() error: " << strerror(errno) << "\n";
        }
        return requests;
    }

    if (ret == 0) return requests;  // Timeout

    if (fds[1].revents & POLLIN) {
        char drain[64];
        while (read(wake_fd, drain, sizeof(drain)) > 0) {}
    }

    // Client sockets first; accept afterwards so indices stay aligned
    for (size_t i = 2; i < fds.size() && i - 2 < connections_.size(); ++i) {
        auto& conn = connections_[i - 2];

        if (fds[i].revents & POLLIN) {
            char buf[4096];
            ssize_t n = read(conn.fd, buf, sizeof(buf));

            if (n > 0) {
                conn.read_buffer.append(buf, static_cast<size_t>(n));

                if (conn.read_buffer.size() > MAX_MESSAGE_SIZE) {
                    std::cerr << "[socket_server] Client message too large, closing\n";
                    conn.wants_close = true;
                }
            } else if (n == 0 || (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK)) {
                conn.wants_close = true;
            }
        }

        if (fds[i].revents & POLLOUT) {
            if (!conn.write_buffer.empty()) {
                ssize_t n = send(conn.fd, conn.write_buffer.data(), conn.write_buffer.size(),
                                 MSG_NOSIGNAL);
                if (n > 0) {
                    conn.write_buffer.erase(0, static_cast<size_t>(n));
                } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                    conn.wants_close = true;
                }
            }
        }

        if (fds[i].revents & (POLLERR | POLLHUP | POLLNVAL)) {
            conn.wants_close = true;
        }
    }

    if (fds[0].revents & POLLIN) {
        accept_new_connections();
    }

    // Complete lines only; the remainder stays buffered
    for (auto& conn : connections_) {
        while (conn.has_complete_message()) {
            requests.push_back({conn.id, conn.extract_message()});
        }
    }

    cleanup_closed_connections();

    return requests;
}

void SocketServer::respond(uint64_t client_id, const std::string& response) {
    for (auto& conn : connections_) {
        if (conn.id == client_id) {
            conn.write_buffer += response + "\n";
            return;
        }
    }
}

void SocketServer::accept_new_connections() {
    while (true) {
        int client_fd = accept(server_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                std::cerr << "[socket_server] accept() error: " << strerror(errno) << "\n";
            }
            break;
        }

        if (connections_.size() >= MAX_CONNECTIONS) {
            std::cerr << "[socket_server] Max connections reached, rejecting\n";
            close(client_fd);
            continue;
        }

        set_nonblocking(client_fd);

        ClientConnection conn;
        conn.id = next_id_++;
        conn.fd = client_fd;
        connections_.push_back(std::move(conn));
        std::cerr << "[socket_server] Client connected (id=" << connections_.back().id
                  << ", total=" << connections_.size() << ")\n";
    }
}

void SocketServer::cleanup_closed_connections() {
    auto it = std::remove_if(connections_.begin(), connections_.end(),
        [](const ClientConnection& conn) {
            if (conn.wants_close) {
                std::cerr << "[socket_server] Client disconnected (id=" << conn.id << ")\n";
                close(conn.fd);
                return true;
            }
            return false;
        });
    connections_.erase(it, connections_.end());
}

} // namespace mm
