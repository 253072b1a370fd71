#include <memmem/worker_client.hpp>
#include <memmem/socket_client.hpp>
#include <memmem/socket_server.hpp>
#include <memmem/worker_protocol.hpp>
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>

namespace mm {

namespace fs = std::filesystem;

WorkerEmbedder::WorkerEmbedder(std::string socket_path, int timeout_ms)
    : socket_path_(std::move(socket_path)), timeout_ms_(timeout_ms) {}

bool WorkerEmbedder::ready() const {
    return probe_socket(socket_path_, std::chrono::milliseconds(500));
}

std::optional<Vector> WorkerEmbedder::embed(const std::string& text) {
    if (text.empty()) return std::nullopt;

    const std::string id = std::to_string(getpid()) + "-" + std::to_string(++counter_);

    SocketClient client(socket_path_);
    if (!client.connect()) {
        throw ProviderError("embedding worker unreachable: " + client.last_error());
    }

    auto line = client.request(wire::encode_request(id, text), timeout_ms_);
    if (!line) {
        throw ProviderError("embedding worker: " + client.last_error());
    }

    wire::EmbedResponse response = wire::decode_response(*line);
    if (response.id != id) {
        throw ProtocolError("response id " + response.id + " does not match request " + id);
    }
    if (response.embedding) return response.embedding;
    if (response.error == wire::NULL_EMBEDDING_ERROR) return std::nullopt;
    throw ProviderError("embedding worker: " + response.error);
}

bool WorkerEmbedder::ensure_worker_running(const std::vector<std::string>& argv,
                                           const std::string& log_path) {
    if (ready()) return true;
    if (argv.empty()) {
        last_error_ = "no worker command";
        return false;
    }

    std::error_code ec;
    fs::create_directories(fs::path(log_path).parent_path(), ec);

    std::cerr << "[worker_client] Starting embedding worker...\n";

    pid_t pid = fork();
    if (pid < 0) {
        last_error_ = std::string("fork() failed: ") + strerror(errno);
        return false;
    }

    if (pid == 0) {
        // First child: new session, then fork again so the worker is
        // reparented and never becomes our zombie
        setsid();
        pid_t worker = fork();
        if (worker != 0) _exit(worker < 0 ? 1 : 0);

        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
            close(null_fd);
        }
        int log_fd = open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0600);
        if (log_fd < 0) log_fd = open("/dev/null", O_WRONLY);
        if (log_fd >= 0) {
            dup2(log_fd, STDOUT_FILENO);
            dup2(log_fd, STDERR_FILENO);
            close(log_fd);
        }

        std::vector<const char*> args;
        for (const auto& a : argv) args.push_back(a.c_str());
        args.push_back(nullptr);
        execv(args[0], const_cast<char* const*>(args.data()));
        _exit(127);
    }

    int status = 0;
    waitpid(pid, &status, 0);
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        last_error_ = "failed to detach embedding worker";
        return false;
    }

    SocketClient probe(socket_path_);
    if (!probe.wait_for_socket(SocketClient::CONNECT_TIMEOUT_MS)) {
        last_error_ = "worker started but " + probe.last_error();
        return false;
    }
    return true;
}

} // namespace mm
