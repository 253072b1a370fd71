#pragma once
// WorkerEmbedder: Embedder backed by the embedding worker process
//
// One connection per embed() call, so any number of threads may share an
// instance. "embedding returned null" maps to nullopt; transport failures
// raise ProviderError, malformed replies ProtocolError.

#include <memmem/embedder.hpp>
#include <atomic>
#include <string>
#include <vector>

namespace mm {

class WorkerEmbedder : public Embedder {
public:
    explicit WorkerEmbedder(std::string socket_path, int timeout_ms = 30000);

    std::optional<Vector> embed(const std::string& text) override;
    size_t dimension() const override { return EMBED_DIM; }

    // True if a worker answers the socket probe
    bool ready() const override;

    // Spawn `argv` detached with output appended to log_path, unless a
    // worker already answers. Waits for the socket to come up.
    bool ensure_worker_running(const std::vector<std::string>& argv,
                               const std::string& log_path);

    const std::string& last_error() const { return last_error_; }

private:
    std::string socket_path_;
    int timeout_ms_;
    std::atomic<uint64_t> counter_{0};
    std::string last_error_;
};

} // namespace mm
