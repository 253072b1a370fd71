#include <memmem/config.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace mm {

using json = nlohmann::json;

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split_list(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, sep)) {
        item = trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

void read_limit(const json& j, RateLimitSettings& out) {
    if (!j.is_object()) return;
    if (j.contains("requestsPerSecond")) {
        out.requests_per_second = j["requestsPerSecond"].get<double>();
        // Burst follows rps unless given explicitly
        out.burst_size = out.requests_per_second * 2.0;
    }
    if (j.contains("burstSize")) {
        out.burst_size = j["burstSize"].get<double>();
    }
}

}  // anonymous namespace

Config Config::defaults(const std::string& home) {
    Config config;
    config.rebase(home + "/.config/memmem");
    config.projects_dir = home + "/.claude/projects";
    return config;
}

void Config::rebase(const std::string& dir) {
    config_dir = dir;
    archive_dir = config_dir + "/conversation-archive";
    index_dir = config_dir + "/conversation-index";
    db_path = index_dir + "/conversations.db";
    socket_path = config_dir + "/embedding-worker.sock";
    log_dir = config_dir + "/logs";
    model_path = config_dir + "/models/model.onnx";
    vocab_path = config_dir + "/models/vocab.txt";
}

Config Config::from_environment() {
    const char* home = std::getenv("HOME");
    Config config = defaults(home ? home : ".");

    if (const char* dir = std::getenv("MEMMEM_CONFIG_DIR")) {
        config.rebase(dir);
    }

    config.load_file(config.config_file());

    if (const char* db = std::getenv("MEMMEM_DB_PATH")) {
        config.db_path = db;
    }
    if (const char* archive = std::getenv("MEMMEM_ARCHIVE_DIR")) {
        config.archive_dir = archive;
    }
    if (const char* projects = std::getenv("MEMMEM_PROJECTS_DIR")) {
        config.projects_dir = projects;
    }
    if (const char* llm = std::getenv("MEMMEM_LLM_COMMAND")) {
        config.llm_command = split_list(llm, ' ');
    }

    // Env list wins over exclude.txt
    if (const char* exclude = std::getenv("MEMMEM_EXCLUDE_PROJECTS")) {
        config.exclude_projects = split_list(exclude, ',');
    } else if (config.exclude_projects.empty()) {
        config.load_exclude_file(config.exclude_file());
    }

    return config;
}

bool Config::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) return false;

    try {
        json j = json::parse(in);

        if (j.contains("ratelimit")) {
            const auto& rl = j["ratelimit"];
            if (rl.contains("embedding")) read_limit(rl["embedding"], embedding_limit);
            if (rl.contains("llm")) read_limit(rl["llm"], llm_limit);
        }

        if (j.contains("llm") && j["llm"].contains("command")) {
            const auto& cmd = j["llm"]["command"];
            if (cmd.is_array()) {
                llm_command = cmd.get<std::vector<std::string>>();
            } else if (cmd.is_string()) {
                llm_command = split_list(cmd.get<std::string>(), ' ');
            }
        }

        if (j.contains("worker") && j["worker"].contains("idleTimeoutMs")) {
            worker.idle_timeout = std::chrono::milliseconds(
                j["worker"]["idleTimeoutMs"].get<int64_t>());
        }

        if (j.contains("inject")) {
            const auto& in_cfg = j["inject"];
            inject.max_observations = in_cfg.value("maxObservations", inject.max_observations);
            inject.max_tokens = in_cfg.value("maxTokens", inject.max_tokens);
            inject.recency_days = in_cfg.value("recencyDays", inject.recency_days);
            inject.project_only = in_cfg.value("projectOnly", inject.project_only);
        }

        if (j.contains("extraction")) {
            const auto& ex = j["extraction"];
            extraction.batch_size = ex.value("batchSize", extraction.batch_size);
            extraction.min_events = ex.value("minEvents", extraction.min_events);
        }

        if (j.contains("excludeProjects")) {
            exclude_projects = j["excludeProjects"].get<std::vector<std::string>>();
        }

        if (j.contains("model")) {
            model_path = j["model"].value("path", model_path);
            vocab_path = j["model"].value("vocab", vocab_path);
        }
    } catch (const json::exception& e) {
        std::cerr << "[config] Ignoring malformed " << path << ": " << e.what() << "\n";
        return false;
    }

    if (extraction.batch_size == 0) extraction.batch_size = 1;
    return true;
}

void Config::load_exclude_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) return;

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        exclude_projects.push_back(line);
    }
}

bool Config::is_excluded(const std::string& project) const {
    return std::find(exclude_projects.begin(), exclude_projects.end(), project)
        != exclude_projects.end();
}

} // namespace mm
