#include <memmem/llm.hpp>
#include <sys/wait.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>

namespace mm {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

std::string describe_exit(int status) {
    if (WIFEXITED(status)) return "exit " + std::to_string(WEXITSTATUS(status));
    if (WIFSIGNALED(status)) return "signal " + std::to_string(WTERMSIG(status));
    return "status " + std::to_string(status);
}

} // namespace

CommandLlmProvider::CommandLlmProvider(std::vector<std::string> argv,
                                       std::shared_ptr<RateLimiter> limiter, int timeout_ms)
    : argv_(std::move(argv)), limiter_(std::move(limiter)), timeout_ms_(timeout_ms) {
    if (argv_.empty()) throw ValidationError("LLM command is empty");
}

std::string CommandLlmProvider::name() const {
    return argv_.front();
}

std::string CommandLlmProvider::complete(const std::string& prompt, const LlmOptions& options) {
    if (limiter_) limiter_->acquire();

    std::string input;
    if (!options.system_prompt.empty()) input = options.system_prompt + "\n\n";
    input += prompt;

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        close_fd(in_pipe[0]);
        close_fd(in_pipe[1]);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
    };
    if (pipe(in_pipe) < 0 || pipe(out_pipe) < 0) {
        std::string err = strerror(errno);
        close_all();
        throw ProviderError("pipe() failed: " + err);
    }

    pid_t pid = fork();
    if (pid < 0) {
        std::string err = strerror(errno);
        close_all();
        throw ProviderError("fork() failed: " + err);
    }

    if (pid == 0) {
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        close(in_pipe[0]);
        close(in_pipe[1]);
        close(out_pipe[0]);
        close(out_pipe[1]);

        std::string max_tokens = std::to_string(options.max_tokens);
        setenv("MEMMEM_MAX_TOKENS", max_tokens.c_str(), 1);

        std::vector<const char*> args;
        for (const auto& a : argv_) args.push_back(a.c_str());
        args.push_back(nullptr);
        execvp(args[0], const_cast<char* const*>(args.data()));
        _exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    int to_child = in_pipe[1];
    int from_child = out_pipe[0];
    fcntl(to_child, F_SETFL, fcntl(to_child, F_GETFL, 0) | O_NONBLOCK);

    // Feed stdin and drain stdout together so neither side can block on a full pipe
    std::string output;
    size_t written = 0;
    bool timed_out = false;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);

    while (from_child >= 0) {
        if (to_child >= 0 && written >= input.size()) close_fd(to_child);

        pollfd fds[2];
        nfds_t n = 0;
        fds[n++] = {from_child, POLLIN, 0};
        if (to_child >= 0) fds[n++] = {to_child, POLLOUT, 0};

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            timed_out = true;
            break;
        }

        int rc = poll(fds, n, static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            char buf[4096];
            ssize_t got = read(from_child, buf, sizeof(buf));
            if (got > 0) {
                output.append(buf, static_cast<size_t>(got));
            } else if (got == 0 || errno != EINTR) {
                close_fd(from_child);
            }
        }

        if (n > 1 && (fds[1].revents & (POLLOUT | POLLERR | POLLHUP))) {
            ssize_t sent = write(to_child, input.data() + written, input.size() - written);
            if (sent > 0) {
                written += static_cast<size_t>(sent);
            } else if (errno != EAGAIN && errno != EINTR) {
                // Child stopped reading; keep collecting what it prints
                close_fd(to_child);
                written = input.size();
            }
        }
    }

    close_fd(to_child);
    close_fd(from_child);

    if (timed_out) kill(pid, SIGKILL);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if (timed_out) {
        throw ProviderError(name() + " timed out after " + std::to_string(timeout_ms_) + "ms");
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        throw ProviderError(name() + " failed (" + describe_exit(status) + ")");
    }
    return output;
}

} // namespace mm
