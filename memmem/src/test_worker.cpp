// Embedding worker tests: real sockets under /tmp, HashEmbedder as provider
#include <memmem/embedding_worker.hpp>
#include <memmem/socket_client.hpp>
#include <memmem/socket_server.hpp>
#include <memmem/worker_client.hpp>
#include <memmem/worker_protocol.hpp>
#include <sys/file.h>
#include <fcntl.h>
#include <unistd.h>
#include <iostream>
#include <atomic>
#include <cassert>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace mm;
namespace fs = std::filesystem;

std::string fresh_socket(const std::string& name) {
    std::string dir = "/tmp/memmem_worker_test_" + name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir + "/embed.sock";
}

std::shared_ptr<RateLimiter> fast_limiter() {
    return std::make_shared<RateLimiter>(RateLimitSettings{1000.0, 100.0});
}

WorkerSettings quick_settings() {
    WorkerSettings settings;
    settings.idle_timeout = std::chrono::milliseconds(60000);
    settings.probe_timeout = std::chrono::milliseconds(200);
    settings.request_threads = 4;
    return settings;
}

// Embedder whose backend always fails
class BrokenEmbedder : public Embedder {
public:
    std::optional<Vector> embed(const std::string&) override {
        throw ProviderError("model crashed");
    }
    size_t dimension() const override { return EMBED_DIM; }
    bool ready() const override { return true; }
};

// Worker serving on a background thread for the lifetime of the object
struct RunningWorker {
    EmbeddingWorker worker;
    std::thread thread;
    int exit_code = -1;

    RunningWorker(const std::string& socket, std::shared_ptr<Embedder> provider)
        : worker(socket, std::move(provider), fast_limiter(), quick_settings()) {
        StartResult started = worker.start();
        assert(started == StartResult::Started);
        thread = std::thread([this] { exit_code = worker.run(); });
    }

    ~RunningWorker() {
        worker.stop();
        if (thread.joinable()) thread.join();
    }
};

// ═══════════════════════════════════════════════════════════════════
// Request handling
// ═══════════════════════════════════════════════════════════════════

void test_process() {
    std::cout << "Testing EmbeddingWorker::process..." << std::endl;

    EmbeddingWorker worker(fresh_socket("process"), std::make_shared<HashEmbedder>(),
                           fast_limiter());

    auto ok = wire::decode_response(worker.process(wire::encode_request("a-1", "fix the auth bug")));
    assert(ok.id == "a-1");
    assert(ok.embedding.has_value());
    assert(ok.embedding->size() == EMBED_DIM);

    auto empty = wire::decode_response(worker.process(wire::encode_request("a-2", "")));
    assert(empty.id == "a-2");
    assert(!empty.embedding);
    assert(empty.error == wire::NULL_EMBEDDING_ERROR);

    auto garbage = wire::decode_response(worker.process("{not json"));
    assert(garbage.id == wire::UNKNOWN_ID);
    assert(!garbage.error.empty());

    // Recoverable id still comes back on a bad request
    auto no_text = wire::decode_response(worker.process(R"({"id": "a-3"})"));
    assert(no_text.id == "a-3");
    assert(no_text.error.find("missing text") != std::string::npos);

    EmbeddingWorker broken(fresh_socket("process_broken"), std::make_shared<BrokenEmbedder>(),
                           fast_limiter());
    auto failed = wire::decode_response(broken.process(wire::encode_request("b-1", "hello")));
    assert(failed.id == "b-1");
    assert(failed.error.find("model crashed") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Serving over the socket
// ═══════════════════════════════════════════════════════════════════

void test_serve_pipelined() {
    std::cout << "Testing pipelined requests on one connection..." << std::endl;

    std::string socket = fresh_socket("pipelined");
    auto provider = std::make_shared<HashEmbedder>();
    RunningWorker running(socket, provider);
    assert(probe_socket(socket, std::chrono::milliseconds(500)));

    SocketClient client(socket);
    assert(client.connect());

    std::map<std::string, std::string> texts;
    for (int i = 0; i < 8; ++i) {
        std::string id = "req-" + std::to_string(i);
        texts[id] = "message number " + std::to_string(i) + " about sqlite and sockets";
        assert(client.send_line(wire::encode_request(id, texts[id])));
    }
    // Interleaved malformed and blank lines do not break the connection
    assert(client.send_line("garbage"));
    assert(client.send_line(""));

    HashEmbedder local;
    std::set<std::string> seen;
    size_t errors = 0;
    for (int i = 0; i < 9; ++i) {
        auto line = client.read_line(5000);
        assert(line.has_value());
        auto response = wire::decode_response(*line);
        if (response.id == wire::UNKNOWN_ID) {
            ++errors;
            continue;
        }
        assert(texts.count(response.id) == 1);
        assert(response.embedding.has_value());
        // Each response belongs to its own request
        auto expected = local.embed(texts[response.id]);
        assert(expected.has_value());
        assert(response.embedding->cosine(*expected) > 0.9999f);
        seen.insert(response.id);
    }
    assert(seen.size() == 8);
    assert(errors == 1);
    assert(running.worker.requests_served() == 9);

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_clients() {
    std::cout << "Testing concurrent clients..." << std::endl;

    std::string socket = fresh_socket("clients");
    RunningWorker running(socket, std::make_shared<HashEmbedder>());

    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 5; ++i) {
                SocketClient client(socket);
                if (!client.connect()) continue;
                std::string id = std::to_string(t) + "-" + std::to_string(i);
                auto line = client.request(wire::encode_request(id, "thread text " + id), 5000);
                if (!line) continue;
                auto response = wire::decode_response(*line);
                if (response.id == id && response.embedding) ++ok;
            }
        });
    }
    for (auto& t : threads) t.join();
    assert(ok == 20);

    std::cout << "  PASS" << std::endl;
}

void test_duplicate_start() {
    std::cout << "Testing duplicate start..." << std::endl;

    std::string socket = fresh_socket("duplicate");
    RunningWorker running(socket, std::make_shared<HashEmbedder>());

    {
        EmbeddingWorker second(socket, std::make_shared<HashEmbedder>(), fast_limiter(),
                               quick_settings());
        assert(second.start() == StartResult::AlreadyRunning);
        assert(second.run() == 1);
    }

    // The loser must not have removed the live socket
    assert(fs::exists(socket));
    SocketClient client(socket);
    assert(client.connect());
    auto line = client.request(wire::encode_request("still-there", "hello"), 5000);
    assert(line.has_value());
    assert(wire::decode_response(*line).embedding.has_value());

    std::cout << "  PASS" << std::endl;
}

void test_bind_lock() {
    std::cout << "Testing bind lock held by another starter..." << std::endl;

    std::string socket = fresh_socket("bind_lock");
    int fd = open((socket + ".lock").c_str(), O_CREAT | O_RDWR, 0600);
    assert(fd >= 0);
    assert(flock(fd, LOCK_EX | LOCK_NB) == 0);

    EmbeddingWorker worker(socket, std::make_shared<HashEmbedder>(), fast_limiter(),
                           quick_settings());
    assert(worker.start() == StartResult::AlreadyRunning);
    assert(!fs::exists(socket));

    close(fd);
    assert(worker.start() == StartResult::Started);
    assert(fs::exists(socket));
    worker.stop();
    assert(worker.run() == 0);
    assert(!fs::exists(socket));

    std::cout << "  PASS" << std::endl;
}

void test_failed_start_releases_lock() {
    std::cout << "Testing failed start releases the bind lock..." << std::endl;

    std::string socket = fresh_socket("failed_start");
    // A directory squatting on the socket path makes bind() fail
    fs::create_directories(socket);

    EmbeddingWorker worker(socket, std::make_shared<HashEmbedder>(), fast_limiter(),
                           quick_settings());
    assert(worker.start() == StartResult::Failed);
    assert(!worker.last_error().empty());

    // Another starter can take the lock right away
    int fd = open((socket + ".lock").c_str(), O_CREAT | O_RDWR, 0600);
    assert(fd >= 0);
    assert(flock(fd, LOCK_EX | LOCK_NB) == 0);
    close(fd);

    // And so can the same worker once the path is free
    fs::remove_all(socket);
    assert(worker.start() == StartResult::Started);
    worker.stop();
    assert(worker.run() == 0);
    assert(!fs::exists(socket));

    std::cout << "  PASS" << std::endl;
}

void test_stop_during_shutdown() {
    std::cout << "Testing stop() racing shutdown..." << std::endl;

    std::string socket = fresh_socket("stop_race");
    WorkerSettings settings = quick_settings();
    settings.idle_timeout = std::chrono::milliseconds(100);

    EmbeddingWorker worker(socket, std::make_shared<HashEmbedder>(), fast_limiter(), settings);
    assert(worker.start() == StartResult::Started);

    std::atomic<bool> finished{false};
    std::thread stopper([&] {
        while (!finished) {
            worker.stop();
            std::this_thread::yield();
        }
        // Still safe after the pipe is closed
        worker.stop();
    });

    int code = worker.run();
    finished = true;
    stopper.join();

    assert(code == 0);
    assert(!fs::exists(socket));

    std::cout << "  PASS" << std::endl;
}

void test_idle_shutdown() {
    std::cout << "Testing idle shutdown..." << std::endl;

    std::string socket = fresh_socket("idle");
    WorkerSettings settings = quick_settings();
    settings.idle_timeout = std::chrono::milliseconds(200);

    EmbeddingWorker worker(socket, std::make_shared<HashEmbedder>(), fast_limiter(), settings);
    assert(worker.start() == StartResult::Started);
    assert(fs::exists(socket));

    auto t0 = std::chrono::steady_clock::now();
    int code = worker.run();
    auto elapsed = std::chrono::steady_clock::now() - t0;

    assert(code == 0);
    assert(elapsed >= std::chrono::milliseconds(200));
    assert(elapsed < std::chrono::seconds(5));
    assert(!fs::exists(socket));
    assert(!probe_socket(socket, std::chrono::milliseconds(100)));

    std::cout << "  PASS" << std::endl;
}

void test_idle_timer_waits_for_clients() {
    std::cout << "Testing idle timer with a connected client..." << std::endl;

    std::string socket = fresh_socket("idle_client");
    WorkerSettings settings = quick_settings();
    settings.idle_timeout = std::chrono::milliseconds(200);

    EmbeddingWorker worker(socket, std::make_shared<HashEmbedder>(), fast_limiter(), settings);
    assert(worker.start() == StartResult::Started);

    std::atomic<bool> finished{false};
    std::thread runner([&] {
        worker.run();
        finished = true;
    });

    {
        SocketClient client(socket);
        assert(client.connect());
        std::this_thread::sleep_for(std::chrono::milliseconds(600));
        // Held connection keeps the worker alive past the idle timeout
        assert(!finished);
        auto line = client.request(wire::encode_request("late", "still here"), 5000);
        assert(line.has_value());
    }

    runner.join();
    assert(finished);
    assert(!fs::exists(socket));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// WorkerEmbedder
// ═══════════════════════════════════════════════════════════════════

void test_worker_embedder() {
    std::cout << "Testing WorkerEmbedder..." << std::endl;

    std::string socket = fresh_socket("embedder");
    WorkerEmbedder remote(socket, 5000);
    assert(!remote.ready());

    bool threw = false;
    try {
        remote.embed("nobody is listening");
    } catch (const ProviderError&) {
        threw = true;
    }
    assert(threw);

    // Empty command cannot spawn anything
    assert(!remote.ensure_worker_running({}, "/tmp/memmem_worker_test_embedder/worker.log"));
    assert(!remote.last_error().empty());

    {
        RunningWorker running(socket, std::make_shared<HashEmbedder>());
        assert(remote.ready());
        // Already answering, nothing is spawned
        assert(remote.ensure_worker_running({"/bin/false"}, "/tmp/memmem_worker_test_embedder/worker.log"));

        auto v = remote.embed("jwt token expiry");
        assert(v.has_value());
        assert(v->size() == EMBED_DIM);
        HashEmbedder local;
        assert(v->cosine(*local.embed("jwt token expiry")) > 0.9999f);

        assert(!remote.embed("").has_value());
    }

    assert(!remote.ready());

    {
        RunningWorker running(socket, std::make_shared<BrokenEmbedder>());
        threw = false;
        try {
            remote.embed("anything");
        } catch (const ProviderError& e) {
            threw = std::string(e.what()).find("model crashed") != std::string::npos;
        }
        assert(threw);
    }

    std::cout << "  PASS" << std::endl;
}

int main() {
    // Writes to closed sockets must not kill the runner
    std::signal(SIGPIPE, SIG_IGN);

    std::cout << "=== memmem worker tests ===" << std::endl;
    test_process();

    std::cout << std::endl;
    std::cout << "=== Serving ===" << std::endl;
    test_serve_pipelined();
    test_concurrent_clients();
    test_duplicate_start();
    test_bind_lock();
    test_failed_start_releases_lock();
    test_stop_during_shutdown();
    test_idle_shutdown();
    test_idle_timer_waits_for_clients();

    std::cout << std::endl;
    std::cout << "=== WorkerEmbedder ===" << std::endl;
    test_worker_embedder();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
