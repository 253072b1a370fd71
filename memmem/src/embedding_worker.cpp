#include <memmem/embedding_worker.hpp>
#include <memmem/worker_protocol.hpp>
#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>

namespace mm {

namespace fs = std::filesystem;

EmbeddingWorker::EmbeddingWorker(std::string socket_path,
                                 std::shared_ptr<Embedder> provider,
                                 std::shared_ptr<RateLimiter> limiter,
                                 WorkerSettings settings)
    : socket_path_(std::move(socket_path)),
      provider_(std::move(provider)),
      limiter_(std::move(limiter)),
      settings_(settings),
      server_(socket_path_) {}

EmbeddingWorker::~EmbeddingWorker() {
    shutdown();
}

bool EmbeddingWorker::acquire_bind_lock() {
    const std::string lock_path = socket_path_ + ".lock";
    lock_fd_ = open(lock_path.c_str(), O_CREAT | O_RDWR, 0600);
    if (lock_fd_ < 0) {
        last_error_ = "cannot open " + lock_path + ": " + strerror(errno);
        return false;
    }
    // flock() conflicts between descriptors even inside one process
    if (flock(lock_fd_, LOCK_EX | LOCK_NB) < 0) {
        close(lock_fd_);
        lock_fd_ = -1;
        return false;
    }
    return true;
}

StartResult EmbeddingWorker::start() {
    if (server_.running()) return StartResult::Started;

    // Duplicate-start detection: never touch a live socket
    if (probe_socket(socket_path_, settings_.probe_timeout)) {
        std::cerr << "[worker] Already running at " << socket_path_ << "\n";
        return StartResult::AlreadyRunning;
    }

    std::error_code ec;
    fs::create_directories(fs::path(socket_path_).parent_path(), ec);

    if (!acquire_bind_lock()) {
        if (!last_error_.empty()) {
            std::cerr << "[worker] " << last_error_ << "\n";
            return StartResult::Failed;
        }
        // Another worker holds the lock and is about to bind
        std::cerr << "[worker] Another worker is starting at " << socket_path_ << "\n";
        return StartResult::AlreadyRunning;
    }

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (pipe(wake_pipe_) < 0) {
            wake_pipe_[0] = wake_pipe_[1] = -1;
            last_error_ = std::string("pipe() failed: ") + strerror(errno);
        } else {
            for (int fd : wake_pipe_) {
                int flags = fcntl(fd, F_GETFL, 0);
                if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
            }
        }
    }
    if (wake_pipe_[0] < 0) {
        std::cerr << "[worker] " << last_error_ << "\n";
        release_resources();
        return StartResult::Failed;
    }

    if (!server_.start()) {
        last_error_ = server_.last_error();
        release_resources();
        return StartResult::Failed;
    }

    stopping_ = false;
    size_t threads = std::max<size_t>(1, settings_.request_threads);
    for (size_t i = 0; i < threads; ++i) {
        pool_.emplace_back([this] { request_loop(); });
    }

    std::cerr << "[worker] Started (threads=" << threads
              << ", idle_timeout=" << settings_.idle_timeout.count() << "ms)\n";
    return StartResult::Started;
}

int EmbeddingWorker::run() {
    if (!server_.running()) return 1;

    using Clock = std::chrono::steady_clock;
    std::optional<Clock::time_point> idle_since;
    uint64_t seen_accepts = server_.accepted_total();

    const int poll_ms = static_cast<int>(std::min<int64_t>(100, settings_.idle_timeout.count()));

    while (!stopping_) {
        auto requests = server_.poll(std::max(poll_ms, 1), wake_pipe_[0]);

        if (!requests.empty()) {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& req : requests) {
                // Blank lines carry no request
                if (req.data.find_first_not_of(" \t\r") == std::string::npos) continue;
                inbox_.push_back(std::move(req));
            }
            cv_.notify_all();
        }

        flush_outbox();

        // Idle timer runs only while nobody is connected; a new connection resets it
        bool new_client = server_.accepted_total() != seen_accepts;
        seen_accepts = server_.accepted_total();
        if (server_.connection_count() == 0 && !new_client) {
            if (!idle_since) {
                idle_since = Clock::now();
            } else if (Clock::now() - *idle_since >= settings_.idle_timeout) {
                std::cerr << "[worker] Idle for " << settings_.idle_timeout.count()
                          << "ms, shutting down\n";
                break;
            }
        } else {
            idle_since.reset();
        }
    }

    shutdown();
    std::cerr << "[worker] Stopped (served=" << served_.load() << ")\n";
    return 0;
}

void EmbeddingWorker::stop() {
    stopping_ = true;
    cv_.notify_all();
    wake();
}

std::string EmbeddingWorker::process(const std::string& line) {
    wire::EmbedRequest request;
    try {
        request = wire::decode_request(line);
    } catch (const ProtocolError& e) {
        // Answered in-band; the connection stays open
        return wire::encode_error(wire::request_id_of(line), e.what());
    }

    limiter_->acquire();

    try {
        auto embedding = provider_->embed(request.text);
        if (!embedding) {
            return wire::encode_error(request.id, wire::NULL_EMBEDDING_ERROR);
        }
        return wire::encode_embedding(request.id, *embedding);
    } catch (const std::exception& e) {
        std::cerr << "[worker] Provider failed for " << request.id << ": " << e.what() << "\n";
        return wire::encode_error(request.id, e.what());
    }
}

void EmbeddingWorker::request_loop() {
    while (true) {
        ClientRequest req;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !inbox_.empty(); });
            if (stopping_) return;
            req = std::move(inbox_.front());
            inbox_.pop_front();
        }

        std::string response = process(req.data);
        ++served_;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            outbox_.emplace_back(req.client_id, std::move(response));
        }
        wake();
    }
}

void EmbeddingWorker::wake() {
    // Held across the write so shutdown() cannot close the fd underneath it
    std::lock_guard<std::mutex> lock(wake_mutex_);
    if (wake_pipe_[1] >= 0) {
        char byte = 1;
        // Full pipe means a wakeup is already pending
        if (write(wake_pipe_[1], &byte, 1) < 0 && errno != EAGAIN) {
            std::cerr << "[worker] wake write failed: " << strerror(errno) << "\n";
        }
    }
}

void EmbeddingWorker::flush_outbox() {
    std::vector<std::pair<uint64_t, std::string>> ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready.swap(outbox_);
    }
    for (const auto& [client, response] : ready) {
        server_.respond(client, response);
    }
}

void EmbeddingWorker::shutdown() {
    stopping_ = true;
    cv_.notify_all();
    for (auto& t : pool_) {
        if (t.joinable()) t.join();
    }
    pool_.clear();

    server_.stop();
    release_resources();
}

void EmbeddingWorker::release_resources() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        for (int& fd : wake_pipe_) {
            if (fd >= 0) {
                close(fd);
                fd = -1;
            }
        }
    }
    if (lock_fd_ >= 0) {
        close(lock_fd_);  // Releases the flock
        lock_fd_ = -1;
    }
}

} // namespace mm
