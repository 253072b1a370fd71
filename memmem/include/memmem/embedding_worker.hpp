#pragma once
// Embedding Worker: long-lived process that owns the embedding model
//
// Serves the line protocol in worker_protocol.hpp on a Unix socket.
// start() probes the socket first: if another worker answers, nothing is
// bound and AlreadyRunning is returned. run() polls until stop() or until
// no client has been connected for the idle timeout, then removes the
// socket file and returns.
//
// Requests are handed to a small thread pool. Each one takes a token from
// the shared RateLimiter before calling the provider, so responses on one
// connection may come back in any order; each carries its request id.

#include <memmem/config.hpp>
#include <memmem/embedder.hpp>
#include <memmem/ratelimiter.hpp>
#include <memmem/socket_server.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace mm {

enum class StartResult {
    Started,
    AlreadyRunning,
    Failed,
};

class EmbeddingWorker {
public:
    EmbeddingWorker(std::string socket_path,
                    std::shared_ptr<Embedder> provider,
                    std::shared_ptr<RateLimiter> limiter,
                    WorkerSettings settings = {});
    ~EmbeddingWorker();

    EmbeddingWorker(const EmbeddingWorker&) = delete;
    EmbeddingWorker& operator=(const EmbeddingWorker&) = delete;

    StartResult start();

    // Serve until idle timeout or stop(). Returns process exit code.
    int run();

    // Safe from any thread or a signal-forwarding thread
    void stop();

    // Full handling of one request line -> response line
    std::string process(const std::string& line);

    size_t requests_served() const { return served_.load(); }
    const std::string& last_error() const { return last_error_; }
    const std::string& socket_path() const { return socket_path_; }

private:
    void request_loop();
    void wake();
    void flush_outbox();
    void shutdown();
    bool acquire_bind_lock();
    void release_resources();     // Wake pipe and bind lock

    std::string socket_path_;
    std::shared_ptr<Embedder> provider_;
    std::shared_ptr<RateLimiter> limiter_;
    WorkerSettings settings_;
    SocketServer server_;

    std::mutex wake_mutex_;       // Guards wake_pipe_ against stop() from other threads
    int wake_pipe_[2] = {-1, -1};
    int lock_fd_ = -1;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ClientRequest> inbox_;
    std::vector<std::pair<uint64_t, std::string>> outbox_;
    std::vector<std::thread> pool_;

    std::atomic<bool> stopping_{false};
    std::atomic<size_t> served_{0};
    std::string last_error_;
};

} // namespace mm
