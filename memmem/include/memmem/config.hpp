#pragma once
// Config: process-wide settings, built once in main() and passed down
//
// Components take a const Config& (or the sub-struct they need) and never
// read the environment themselves.

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace mm {

struct RateLimitSettings {
    double requests_per_second = 5.0;
    double burst_size = 10.0;    // Default 2x rps

    static RateLimitSettings embedding() { return {5.0, 10.0}; }
    static RateLimitSettings llm() { return {2.0, 4.0}; }
};

struct InjectSettings {
    size_t max_observations = 30;
    size_t max_tokens = 1000;
    int recency_days = 7;
    bool project_only = true;
};

struct ExtractionSettings {
    size_t batch_size = 15;
    size_t min_events = 3;
    size_t dedup_context = 3;    // Previous titles sent with each batch
};

struct WorkerSettings {
    std::chrono::milliseconds idle_timeout{60000};
    std::chrono::milliseconds probe_timeout{500};
    size_t request_threads = 4;
};

struct Config {
    std::string config_dir;      // ~/.config/memmem
    std::string archive_dir;     // config_dir/conversation-archive
    std::string index_dir;       // config_dir/conversation-index
    std::string db_path;         // index_dir/conversations.db
    std::string socket_path;     // config_dir/embedding-worker.sock
    std::string log_dir;         // config_dir/logs
    std::string projects_dir;    // ~/.claude/projects

    // ONNX model (used only when built with MEMMEM_WITH_ONNX)
    std::string model_path;
    std::string vocab_path;

    // External LLM command for observation extraction; empty = no provider
    std::vector<std::string> llm_command;

    std::vector<std::string> exclude_projects;

    RateLimitSettings embedding_limit = RateLimitSettings::embedding();
    RateLimitSettings llm_limit = RateLimitSettings::llm();
    InjectSettings inject;
    ExtractionSettings extraction;
    WorkerSettings worker;

    // Paths derived from a home directory
    static Config defaults(const std::string& home);

    // Defaults + MEMMEM_* environment overrides + config.json + exclude.txt.
    // Only main() calls this.
    static Config from_environment();

    // Overlay settings from a JSON file. Missing file is not an error;
    // a malformed one is reported to stderr and ignored.
    bool load_file(const std::string& path);

    // Read exclude.txt (one project per line, '#' comments)
    void load_exclude_file(const std::string& path);

    // Re-derive db/archive/socket paths after config_dir changes
    void rebase(const std::string& dir);

    bool is_excluded(const std::string& project) const;

    std::string config_file() const { return config_dir + "/config.json"; }
    std::string exclude_file() const { return index_dir + "/exclude.txt"; }
    std::string worker_log_path() const { return log_dir + "/embedding-worker.log"; }
};

} // namespace mm
