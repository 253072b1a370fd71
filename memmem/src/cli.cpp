// memmem: command-line interface and host hook adapters
//
// Usage: memmem <command> [options]
//
// Commands:
//   sync       Copy new transcripts into the archive and index them
//   rebuild    Drop the index and re-index the whole archive
//   verify     Report archive/index drift (exit 2 when issues found)
//   repair     Verify, then fix what can be fixed
//   search     Hybrid search over exchanges and observations
//   stats      Index statistics
//   read       Print exchanges from an archive line range
//   inject     SessionStart hook: recent-context digest on stdout
//   observe    PostToolUse hook: queue one tool event
//   stop       Stop hook: extract observations from queued events
//   worker     Run the embedding worker
//   help       Show this help

#include <memmem/compress.hpp>
#include <memmem/config.hpp>
#include <memmem/embedding_worker.hpp>
#include <memmem/hooks.hpp>
#include <memmem/indexer.hpp>
#include <memmem/llm.hpp>
#include <memmem/parser.hpp>
#include <memmem/search.hpp>
#include <memmem/storage.hpp>
#include <memmem/verifier.hpp>
#include <memmem/version.hpp>
#include <memmem/worker_client.hpp>
#ifdef MEMMEM_WITH_ONNX
#include <memmem/onnx_embedder.hpp>
#endif
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>
#include <limits.h>
#include <unistd.h>

using namespace mm;
using json = nlohmann::json;

void print_usage(const char* prog) {
    std::cerr << "memmem " << MEMMEM_VERSION << " - memory for assistant sessions\n\n"
              << "Usage: " << prog << " <command> [options]\n\n"
              << "Commands:\n"
              << "  sync               Archive new transcripts and index them\n"
              << "  rebuild            Drop the index and re-index the archive\n"
              << "  verify             Check archive against index (exit 2 on issues)\n"
              << "  repair             Verify and fix missing/outdated/orphaned files\n"
              << "  search <query>...  Search (two or more queries: multi-concept AND)\n"
              << "  stats              Show index statistics\n"
              << "  read <file> <start> <end>\n"
              << "                     Print exchanges from archive lines start..end\n"
              << "  inject             SessionStart hook: print recent context\n"
              << "  observe            PostToolUse hook: queue tool event from stdin\n"
              << "  stop               Stop hook: extract observations for the session\n"
              << "  worker             Run the embedding worker in the foreground\n"
              << "  help               Show this help\n\n"
              << "Sync options:\n"
              << "  --concurrency N    Files processed in parallel (1-16, default 1)\n"
              << "  --no-index         Copy only\n"
              << "  --no-embed         Index without embeddings\n\n"
              << "Search options:\n"
              << "  --vector | --text | --both  Search mode (default both)\n"
              << "  --limit N          Max results (1-50, default 10)\n"
              << "  --after DATE       Only records on or after YYYY-MM-DD\n"
              << "  --before DATE      Only records on or before YYYY-MM-DD\n"
              << "  --project P        Restrict to project (repeatable)\n"
              << "  --file F           Observations touching file (repeatable)\n"
              << "  --type T           Observation type (repeatable)\n"
              << "  --concept C        Observation concept (repeatable)\n"
              << "  --multi-concept    Treat the queries as a 2-5 concept AND list\n"
              << "  --json             JSON output\n\n"
              << "Common options:\n"
              << "  --project P        Project for inject/observe/stop\n"
              << "  --session ID       Session for stop\n"
              << "  -v, --version      Show version\n";
}

// ═══════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════

std::string read_stdin() {
    if (isatty(STDIN_FILENO)) return "";
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

std::string self_executable(const char* argv0) {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) return argv0;
    buf[len] = '\0';
    return buf;
}

// Explicit --project, then the host's project dir, then its project name
std::string resolve_project(const std::string& explicit_project, const HookInput& input) {
    if (!explicit_project.empty()) return explicit_project;
    if (const char* dir = std::getenv("CLAUDE_PROJECT_DIR")) {
        if (*dir) return project_slug(dir);
    }
    if (!input.cwd.empty()) return project_slug(input.cwd);
    if (const char* name = std::getenv("CLAUDE_PROJECT")) {
        if (*name) return name;
    }
    return "default";
}

std::string resolve_session(const std::string& explicit_session, const HookInput& input) {
    if (!explicit_session.empty()) return explicit_session;
    if (!input.session_id.empty()) return input.session_id;
    if (const char* id = std::getenv("CLAUDE_SESSION_ID")) {
        if (*id) return id;
    }
    return "unknown";
}

// In-process model: ONNX when built in and loadable, hashing otherwise
std::shared_ptr<Embedder> local_embedder(const Config& config) {
#ifdef MEMMEM_WITH_ONNX
    auto onnx = std::make_shared<OnnxEmbedder>();
    if (onnx->load(config.model_path, config.vocab_path)) {
        std::cerr << "[embedder] Loaded ONNX model " << config.model_path << "\n";
        return onnx;
    }
    std::cerr << "[embedder] " << onnx->error() << ", using hash embeddings\n";
#else
    (void)config;
#endif
    return std::make_shared<HashEmbedder>();
}

// Shared worker when it can be reached or spawned, in-process model otherwise
std::shared_ptr<Embedder> make_embedder(const Config& config, const std::string& self) {
    auto worker = std::make_shared<WorkerEmbedder>(config.socket_path);
    if (worker->ensure_worker_running({self, "worker"}, config.worker_log_path())) {
        return worker;
    }
    std::cerr << "[cli] Embedding worker unavailable (" << worker->last_error()
              << "), embedding in-process\n";
    auto limiter = std::make_shared<RateLimiter>(config.embedding_limit);
    return std::make_shared<LimitedEmbedder>(local_embedder(config), limiter);
}

std::shared_ptr<LlmProvider> make_llm(const Config& config) {
    if (config.llm_command.empty()) return nullptr;
    auto limiter = std::make_shared<RateLimiter>(config.llm_limit);
    return std::make_shared<CommandLlmProvider>(config.llm_command, limiter);
}

void print_file_errors(const std::vector<FileError>& errors) {
    for (const auto& err : errors) {
        std::cerr << "  " << err.file << ": " << err.error << "\n";
    }
}

std::string one_line(const std::string& text, size_t max_chars) {
    std::string out = text.substr(0, max_chars);
    for (char& c : out) {
        if (c == '\n' || c == '\r' || c == '\t') c = ' ';
    }
    if (text.size() > max_chars) out += "...";
    return out;
}

// ═══════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════

int cmd_sync(Indexer& indexer, const Config& config, const SyncOptions& options) {
    auto result = indexer.sync(config.projects_dir, config.archive_dir, options);

    std::cout << "Sync complete:\n"
              << "  Copied:     " << result.copied << "\n"
              << "  Skipped:    " << result.skipped << "\n"
              << "  Indexed:    " << result.indexed << "\n"
              << "  Summarized: " << result.summarized << "\n";
    if (!result.errors.empty()) {
        std::cerr << result.errors.size() << " file(s) had errors:\n";
        print_file_errors(result.errors);
    }
    return 0;
}

int cmd_rebuild(Indexer& indexer, const Config& config, const SyncOptions& options) {
    std::cerr << "[cli] Rebuilding index from " << config.archive_dir << "\n";
    auto result = indexer.rebuild(config.archive_dir, options);

    std::cout << "Rebuild complete: " << result.indexed << " files indexed, "
              << result.summarized << " embedded\n";
    if (!result.errors.empty()) {
        std::cerr << result.errors.size() << " file(s) had errors:\n";
        print_file_errors(result.errors);
    }
    return 0;
}

void print_issues(const char* label, const std::vector<IntegrityIssue>& issues) {
    if (issues.empty()) return;
    std::cout << label << " (" << issues.size() << "):\n";
    for (const auto& issue : issues) {
        std::cout << "  [" << issue.project << "] " << issue.archive_path << "\n"
                  << "      " << issue.detail << "\n";
    }
}

void print_report(const VerifyReport& report) {
    if (report.clean()) {
        std::cout << "Index is consistent with the archive.\n";
        return;
    }
    std::cout << report.total() << " issue(s) found\n";
    print_issues("Missing", report.missing);
    print_issues("Orphaned", report.orphaned);
    print_issues("Outdated", report.outdated);
    print_issues("Corrupted", report.corrupted);
}

int cmd_verify(const Verifier& verifier) {
    auto report = verifier.verify();
    print_report(report);
    return report.clean() ? 0 : 2;
}

int cmd_repair(Verifier& verifier) {
    auto report = verifier.verify();
    print_report(report);
    if (report.clean()) return 0;

    auto result = verifier.repair(report);
    std::cout << "Repaired: " << result.reindexed << " re-indexed, " << result.removed
              << " orphaned removed\n";
    if (!report.corrupted.empty()) {
        std::cout << report.corrupted.size() << " corrupted file(s) need manual review\n";
    }
    if (!result.errors.empty()) {
        std::cerr << result.errors.size() << " repair(s) failed:\n";
        print_file_errors(result.errors);
        return 1;
    }
    return 0;
}

void print_result(size_t rank, const SearchResult& r) {
    std::cout << rank << ". [" << r.project() << ", " << format_date(r.timestamp()) << "] "
              << std::fixed << std::setprecision(0) << r.score * 100 << "% match";
    if (r.vector_match && r.text_match) std::cout << " (vector+text)";
    else if (r.text_match) std::cout << " (text)";
    std::cout << "\n";

    if (r.is_exchange()) {
        const auto& ex = r.exchange();
        std::cout << "   \"" << one_line(ex.user_message, 200) << "\"\n"
                  << "   Lines " << ex.line_start << "-" << ex.line_end << " in "
                  << ex.archive_path << "\n";
    } else {
        const auto& obs = r.observation();
        std::cout << "   [" << obs.type << "] " << obs.title << "\n"
                  << "   " << one_line(obs.narrative, 200) << "\n";
    }
    if (!r.concept_scores.empty()) {
        std::cout << "   Concepts:";
        for (float s : r.concept_scores) {
            std::cout << " " << std::fixed << std::setprecision(0) << s * 100 << "%";
        }
        std::cout << "\n";
    }
    std::cout << "\n";
}

int cmd_search(const SearchEngine& engine, const std::vector<std::string>& queries,
               const SearchOptions& options, bool multi_concept, bool json_output) {
    auto results = engine.search_queries(queries, options, multi_concept);

    if (json_output) {
        json out = json::array();
        for (const auto& r : results) out.push_back(to_json(r));
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    if (results.empty()) {
        std::cout << "No results found.\n";
        return 0;
    }
    std::cout << "Found " << results.size() << " result(s):\n\n";
    for (size_t i = 0; i < results.size(); ++i) print_result(i + 1, results[i]);
    return 0;
}

int cmd_stats(const Storage& storage, bool json_output) {
    auto stats = storage.stats();

    if (json_output) {
        json out = {
            {"version", MEMMEM_VERSION},
            {"exchanges", stats.exchanges},
            {"embeddedExchanges", stats.embedded_exchanges},
            {"toolCalls", stats.tool_calls},
            {"observations", stats.observations},
            {"pendingEvents", stats.pending_events},
            {"indexedFiles", stats.indexed_files},
            {"projects", stats.exchanges_per_project},
        };
        if (stats.earliest) out["earliest"] = format_iso8601(*stats.earliest);
        if (stats.latest) out["latest"] = format_iso8601(*stats.latest);
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    std::cout << "memmem " << MEMMEM_VERSION << " (" << storage.path() << ")\n"
              << "  Exchanges:      " << stats.exchanges << " (" << stats.embedded_exchanges
              << " embedded)\n"
              << "  Tool calls:     " << stats.tool_calls << "\n"
              << "  Observations:   " << stats.observations << "\n"
              << "  Pending events: " << stats.pending_events << "\n"
              << "  Indexed files:  " << stats.indexed_files << "\n";
    if (stats.earliest && stats.latest) {
        std::cout << "  Date range:     " << format_date(*stats.earliest) << " to "
                  << format_date(*stats.latest) << "\n";
    }
    if (!stats.exchanges_per_project.empty()) {
        std::cout << "  Projects:\n";
        for (const auto& [project, count] : stats.exchanges_per_project) {
            std::cout << "    " << std::left << std::setw(40) << project << count << "\n";
        }
    }
    return 0;
}

int cmd_read(const std::string& path, int start, int end) {
    auto exchanges = read_range(path, project_from_path(path), start, end);
    if (exchanges.empty()) {
        std::cerr << "No exchanges in lines " << start << "-" << end << " of " << path << "\n";
        return 1;
    }
    for (const auto& ex : exchanges) {
        std::cout << "## " << format_iso8601(ex.timestamp) << " (lines " << ex.line_start << "-"
                  << ex.line_end << ")\n\n"
                  << "**User:** " << ex.user_message << "\n\n"
                  << "**Assistant:** " << ex.assistant_message << "\n";
        if (!ex.tool_calls.empty()) {
            std::cout << "\n_Tools:_ " << summarize_tool_calls(ex.tool_calls) << "\n";
        }
        std::cout << "\n";
    }
    return 0;
}

// Hook commands always exit 0 so the host session is never interrupted

int cmd_inject(const Storage& storage, const std::string& project, const InjectSettings& settings) {
    auto result = session_start(storage, project, settings);
    if (!result) {
        std::cerr << "[memmem] Inject error: " << result.error() << "\n";
        return 0;
    }
    if (result->included_count > 0) std::cout << result->markdown;
    return 0;
}

int cmd_observe(ObservationExtractor& extractor, const HookInput& input,
                const std::string& project) {
    // Some tools send nothing
    if (input.tool_name.empty()) return 0;

    auto status = post_tool_use(extractor, input, project);
    if (!status) std::cerr << "[memmem] Error in observe: " << status.error() << "\n";
    return 0;
}

int cmd_stop(ObservationExtractor& extractor, const std::string& session_id,
             const std::string& project) {
    auto result = session_stop(extractor, session_id, project);
    if (!result) {
        std::cerr << "[memmem] Error in stop: " << result.error() << "\n";
        return 0;
    }
    if (result->no_provider) {
        std::cerr << "[memmem] No LLM command configured, " << result->pending
                  << " event(s) left queued\n";
    } else if (result->below_threshold) {
        std::cerr << "[memmem] " << result->pending << " event(s), below extraction threshold\n";
    }
    return 0;
}

static std::atomic<bool> worker_running{true};

void worker_signal_handler(int sig) {
    (void)sig;
    worker_running = false;
}

int cmd_worker(const Config& config) {
    auto limiter = std::make_shared<RateLimiter>(config.embedding_limit);
    EmbeddingWorker worker(config.socket_path, local_embedder(config), limiter, config.worker);

    switch (worker.start()) {
        case StartResult::AlreadyRunning:
            std::cerr << "[worker] Already running on " << config.socket_path << "\n";
            return 0;
        case StartResult::Failed:
            std::cerr << "[worker] Failed to start: " << worker.last_error() << "\n";
            return 1;
        case StartResult::Started:
            break;
    }

    std::signal(SIGTERM, worker_signal_handler);
    std::signal(SIGINT, worker_signal_handler);

    std::cerr << "[worker] Started (socket=" << config.socket_path << ", pid=" << getpid()
              << ", idle=" << config.worker.idle_timeout.count() << "ms)\n";

    // Forward signals to the worker from a normal thread
    std::atomic<bool> done{false};
    std::thread watcher([&]() {
        while (!done) {
            if (!worker_running) {
                worker.stop();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    int code = worker.run();
    done = true;
    watcher.join();

    std::cerr << "[worker] Stopped after " << worker.requests_served() << " request(s)\n";
    return code;
}

// ═══════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    // Broken pipes (LLM command, worker clients) surface as write errors
    std::signal(SIGPIPE, SIG_IGN);

    std::string command;
    std::vector<std::string> positional;
    SyncOptions sync_options;
    SearchOptions search_options;
    std::string project;
    std::string session;
    bool json_output = false;
    bool multi_concept = false;

    for (int i = 1; i < argc; ++i) {
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw ValidationError(std::string(argv[i]) + " needs a value");
            return argv[++i];
        };
        try {
            if (strcmp(argv[i], "--concurrency") == 0) {
                sync_options.concurrency = std::stoi(next());
            } else if (strcmp(argv[i], "--no-index") == 0) {
                sync_options.skip_index = true;
            } else if (strcmp(argv[i], "--no-embed") == 0) {
                sync_options.skip_summaries = true;
            } else if (strcmp(argv[i], "--vector") == 0) {
                search_options.mode = SearchMode::Vector;
            } else if (strcmp(argv[i], "--text") == 0) {
                search_options.mode = SearchMode::Text;
            } else if (strcmp(argv[i], "--both") == 0) {
                search_options.mode = SearchMode::Both;
            } else if (strcmp(argv[i], "--mode") == 0) {
                std::string name = next();
                auto mode = parse_search_mode(name);
                if (!mode) throw ValidationError("unknown search mode: " + name);
                search_options.mode = *mode;
            } else if (strcmp(argv[i], "--limit") == 0) {
                search_options.limit = std::stoi(next());
            } else if (strcmp(argv[i], "--after") == 0) {
                search_options.after = next();
            } else if (strcmp(argv[i], "--before") == 0) {
                search_options.before = next();
            } else if (strcmp(argv[i], "--project") == 0) {
                project = next();
                search_options.projects.push_back(project);
            } else if (strcmp(argv[i], "--file") == 0) {
                search_options.files.push_back(next());
            } else if (strcmp(argv[i], "--type") == 0) {
                search_options.types.push_back(next());
            } else if (strcmp(argv[i], "--concept") == 0) {
                search_options.concepts.push_back(next());
            } else if (strcmp(argv[i], "--multi-concept") == 0) {
                multi_concept = true;
            } else if (strcmp(argv[i], "--session") == 0) {
                session = next();
            } else if (strcmp(argv[i], "--json") == 0) {
                json_output = true;
            } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
                std::cout << "memmem " << MEMMEM_VERSION << "\n";
                return 0;
            } else if (argv[i][0] != '-') {
                if (command.empty()) command = argv[i];
                else positional.push_back(argv[i]);
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        } catch (const std::exception& e) {
            std::cerr << "Invalid argument: " << e.what() << "\n";
            return 1;
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    Config config = Config::from_environment();
    const std::string self = self_executable(argv[0]);

    // Worker owns the model; it never opens the database
    if (command == "worker") {
        return cmd_worker(config);
    }

    // Hook commands: read the host payload, never fail the host
    if (command == "inject" || command == "observe" || command == "stop") {
        auto input = parse_hook_input(read_stdin());
        if (!input) {
            std::cerr << "[memmem] Ignoring hook input: " << input.error() << "\n";
            return 0;
        }
        const HookInput& hook = input.value();
        const std::string hook_project = resolve_project(project, hook);
        if (config.is_excluded(hook_project)) return 0;

        try {
            Storage storage(config.db_path);
            if (command == "inject") {
                return cmd_inject(storage, hook_project, config.inject);
            }
            if (command == "observe") {
                ObservationExtractor extractor(storage, nullptr, nullptr, config.extraction);
                return cmd_observe(extractor, hook, hook_project);
            }
            auto llm = make_llm(config);
            auto embedder = llm ? make_embedder(config, self) : nullptr;
            ObservationExtractor extractor(storage, llm, embedder, config.extraction);
            return cmd_stop(extractor, resolve_session(session, hook), hook_project);
        } catch (const std::exception& e) {
            std::cerr << "[memmem] " << command << " failed: " << e.what() << "\n";
            return 0;
        }
    }

    try {
        if (command == "read") {
            if (positional.size() != 3) {
                std::cerr << "Usage: memmem read <archive.jsonl> <start> <end>\n";
                return 1;
            }
            return cmd_read(positional[0], std::stoi(positional[1]), std::stoi(positional[2]));
        }

        Storage storage(config.db_path);

        if (command == "stats") {
            return cmd_stats(storage, json_output);
        }

        if (command == "search") {
            if (positional.empty()) {
                std::cerr << "Usage: memmem search [options] <query> [query2] ...\n";
                return 1;
            }
            std::shared_ptr<Embedder> embedder;
            if (search_options.mode != SearchMode::Text || multi_concept || positional.size() > 1) {
                embedder = make_embedder(config, self);
            }
            SearchEngine engine(storage, embedder);
            return cmd_search(engine, positional, search_options, multi_concept, json_output);
        }

        if (command == "sync" || command == "rebuild" || command == "verify" ||
            command == "repair") {
            std::shared_ptr<Embedder> embedder;
            if (!sync_options.skip_summaries && command != "verify") {
                embedder = make_embedder(config, self);
            }
            Indexer indexer(storage, embedder, config);

            if (command == "sync") return cmd_sync(indexer, config, sync_options);
            if (command == "rebuild") return cmd_rebuild(indexer, config, sync_options);

            Verifier verifier(storage, indexer, config);
            if (command == "verify") return cmd_verify(verifier);
            return cmd_repair(verifier);
        }
    } catch (const ValidationError& e) {
        std::cerr << "Invalid input: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
