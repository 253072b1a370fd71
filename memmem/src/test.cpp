#include <memmem/compress.hpp>
#include <memmem/config.hpp>
#include <memmem/embedder.hpp>
#include <memmem/extraction.hpp>
#include <memmem/hooks.hpp>
#include <memmem/indexer.hpp>
#include <memmem/injector.hpp>
#include <memmem/llm.hpp>
#include <memmem/parser.hpp>
#include <memmem/ratelimiter.hpp>
#include <memmem/search.hpp>
#include <memmem/storage.hpp>
#include <memmem/verifier.hpp>
#include <iostream>
#include <atomic>
#include <cassert>
#include <cmath>
#include <csignal>
#include <cstring>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace mm;
using json = nlohmann::json;
namespace fs = std::filesystem;

// ═══════════════════════════════════════════════════════════════════
// Fixtures
// ═══════════════════════════════════════════════════════════════════

std::string fresh_dir(const std::string& name) {
    std::string dir = "/tmp/memmem_test_" + name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_file(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

std::string user_line(const std::string& text, const std::string& ts,
                      const std::string& session = "sess-1") {
    json j = {
        {"type", "user"},
        {"timestamp", ts},
        {"sessionId", session},
        {"cwd", "/home/me/app"},
        {"gitBranch", "main"},
        {"message", {{"role", "user"}, {"content", text}}},
    };
    return j.dump();
}

std::string assistant_line(const std::string& text, const std::string& ts,
                           const json& tool_use = nullptr) {
    json content = json::array();
    if (!text.empty()) content.push_back(json{{"type", "text"}, {"text", text}});
    if (!tool_use.is_null()) content.push_back(tool_use);
    json j = {
        {"type", "assistant"},
        {"timestamp", ts},
        {"sessionId", "sess-1"},
        {"version", "1.0.0"},
        {"message", {{"role", "assistant"}, {"content", content}}},
    };
    return j.dump();
}

std::string tool_result_line(const std::string& tool_use_id, const std::string& output,
                             const std::string& ts) {
    json block = {{"type", "tool_result"}, {"tool_use_id", tool_use_id}, {"content", output}};
    json j = {
        {"type", "user"},
        {"timestamp", ts},
        {"sessionId", "sess-1"},
        {"message", {{"role", "user"}, {"content", json::array({block})}}},
    };
    return j.dump();
}

// Two exchanges: lines 1-4 (with a Read tool call) and 7-8
std::string jwt_conversation() {
    json read_call = {
        {"type", "tool_use"},
        {"id", "tu-1"},
        {"name", "Read"},
        {"input", {{"file_path", "/src/auth.ts"}}},
    };
    return user_line("How do I fix JWT authentication errors?", "2025-10-01T10:00:00.000Z") + "\n" +
           assistant_line("Let me check the auth module.", "2025-10-01T10:00:05.000Z", read_call) + "\n" +
           tool_result_line("tu-1", "export function verify(token) {}", "2025-10-01T10:00:06.000Z") + "\n" +
           assistant_line("The JWT expiry is compared in seconds, not milliseconds. Fixed it.",
                          "2025-10-01T10:00:10.000Z") + "\n" +
           "\n" +
           R"({"type":"summary","summary":"JWT fix","leafUuid":"x"})" + "\n" +
           user_line("Now run the tests for commit a1b2c3d4e5f6", "2025-10-02T09:00:00.000Z") + "\n" +
           assistant_line("All 42 tests pass.", "2025-10-02T09:00:30.000Z") + "\n";
}

Config test_config(const std::string& dir) {
    Config config = Config::defaults(dir + "/home");
    config.rebase(dir + "/memmem");
    config.projects_dir = dir + "/projects";
    return config;
}

// Scripted completions; records every prompt
class FakeLlm : public LlmProvider {
public:
    explicit FakeLlm(std::string response, bool fail = false)
        : response_(std::move(response)), fail_(fail) {}

    std::string complete(const std::string& prompt, const LlmOptions& options) override {
        assert(!options.system_prompt.empty());
        prompts.push_back(prompt);
        if (fail_) throw ProviderError("model unavailable");
        return response_;
    }
    std::string name() const override { return "fake"; }

    std::vector<std::string> prompts;

private:
    std::string response_;
    bool fail_;
};

const char* const ONE_INSIGHT =
    "```json\n"
    "[{\"title\": \"Fixed JWT expiry\", \"content\": \"Expiry compared seconds to ms\", "
    "\"type\": \"bugfix\", \"concepts\": [\"auth\"], \"files_modified\": [\"/src/auth.ts\"]}]\n"
    "```";

Observation make_observation(const std::string& project, const std::string& title,
                             const std::string& narrative, Timestamp ts) {
    Observation obs;
    obs.project = project;
    obs.session_id = "sess-obs";
    obs.timestamp = ts;
    obs.type = "learning";
    obs.title = title;
    obs.narrative = narrative;
    return obs;
}

// ═══════════════════════════════════════════════════════════════════
// Types and embeddings
// ═══════════════════════════════════════════════════════════════════

void test_libc_memmem_visible() {
    std::cout << "Testing libc memmem alongside the mm namespace..." << std::endl;

    // glibc declares ::memmem under _GNU_SOURCE; the project namespace must not collide
    const char hay[] = "session transcript";
    const void* hit = ::memmem(hay, sizeof(hay) - 1, "trans", 5);
    assert(hit == hay + 8);
    assert(memmem(hay, sizeof(hay) - 1, "absent", 6) == nullptr);
    assert(mm::Status::ok().is_ok());

    std::cout << "  PASS" << std::endl;
}

void test_time_helpers() {
    std::cout << "Testing time helpers..." << std::endl;

    auto ts = parse_iso8601("2025-10-01T10:00:05.250Z");
    assert(ts.has_value());
    assert(format_iso8601(*ts) == "2025-10-01T10:00:05.250Z");
    assert(format_date(*ts) == "2025-10-01");
    assert(!parse_iso8601("yesterday").has_value());
    assert(!parse_iso8601("2025-13-01").has_value());

    assert(parse_date("2025-10-01") == *parse_iso8601("2025-10-01T00:00:00Z"));
    bool threw = false;
    try { parse_date("2024-02-31"); } catch (const ValidationError&) { threw = true; }
    assert(threw);
    threw = false;
    try { parse_date("10/01/2025"); } catch (const ValidationError&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_hash_embedder() {
    std::cout << "Testing HashEmbedder..." << std::endl;

    HashEmbedder embedder;
    auto a = embedder.embed("JWT authentication tokens");
    auto b = embedder.embed("fix authentication with JWT");
    auto c = embedder.embed("JWT authentication tokens");
    assert(a && b && c);

    assert(a->size() == EMBED_DIM);
    assert(std::abs(a->norm() - 1.0f) < 1e-4f);
    assert(a->cosine(*c) > 0.999f);
    assert(a->cosine(*b) > 0.0f);
    assert(a->cosine(*b) > a->cosine(*embedder.embed("banana smoothie recipe")));

    assert(!embedder.embed("").has_value());
    assert(!embedder.embed("  ... !!").has_value());

    std::string prepared = prepare_embedding_text(std::string(10000, 'x'));
    assert(prepared.rfind(EMBED_PREFIX, 0) == 0);
    assert(prepared.size() <= std::string(EMBED_PREFIX).size() + MAX_EMBED_CHARS);

    std::cout << "  PASS" << std::endl;
}

void test_pool_model_output() {
    std::cout << "Testing pool_model_output..." << std::endl;

    const int64_t dim = static_cast<int64_t>(EMBED_DIM);

    // [1, 3, 768]: token 0 points along axis 0, token 1 along axis 1, token 2 is padding
    std::vector<float> states(3 * EMBED_DIM, 0.0f);
    states[0] = 1.0f;
    states[EMBED_DIM + 1] = 1.0f;
    states[2 * EMBED_DIM + 2] = 50.0f;
    Vector pooled = pool_model_output(states.data(), {1, 3, dim}, {1, 1, 0});
    assert(std::abs(pooled[0] - pooled[1]) < 1e-6f);
    assert(pooled[0] > 0.7f);
    assert(pooled[2] == 0.0f);
    assert(std::abs(pooled.norm() - 1.0f) < 1e-4f);

    std::vector<float> flat(EMBED_DIM, 0.0f);
    flat[5] = 3.0f;
    Vector direct = pool_model_output(flat.data(), {1, dim}, {});
    assert(std::abs(direct[5] - 1.0f) < 1e-6f);

    // A smaller model must be rejected, never read past its buffer
    std::vector<float> small(3 * 384, 1.0f);
    bool threw = false;
    try { pool_model_output(small.data(), {1, 3, 384}, {1, 1, 1}); } catch (const ProviderError&) { threw = true; }
    assert(threw);

    threw = false;
    try { pool_model_output(states.data(), {1, 4, dim}, {1, 1, 1}); } catch (const ProviderError&) { threw = true; }
    assert(threw);

    threw = false;
    try { pool_model_output(flat.data(), {dim}, {}); } catch (const ProviderError&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Parser
// ═══════════════════════════════════════════════════════════════════

void test_parse_record() {
    std::cout << "Testing parse_record..." << std::endl;

    Record user = parse_record(user_line("hello", "2025-10-01T10:00:00Z"), 1);
    assert(std::holds_alternative<UserMessage>(user));
    const auto& msg = std::get<UserMessage>(user);
    assert(text_of(msg.content) == "hello");
    assert(msg.meta.session_id == "sess-1");
    assert(msg.meta.git_branch == "main");

    Record summary = parse_record(R"({"type":"summary","summary":"x"})", 2);
    assert(std::holds_alternative<SystemMessage>(summary));
    assert(std::get<SystemMessage>(summary).type == "summary");

    bool threw = false;
    try {
        parse_record("{not json", 7);
    } catch (const ParseError& e) {
        threw = true;
        assert(e.line() == 7);
    }
    assert(threw);

    threw = false;
    try { parse_record(R"({"type":"user","message":{}})", 3); } catch (const ParseError&) { threw = true; }
    assert(threw);

    threw = false;
    try { parse_record(R"({"message":{"content":"x"}})", 4); } catch (const ParseError&) { threw = true; }
    assert(threw);

    assert(has_exclusion_marker("please do not index this chat, thanks"));
    assert(!has_exclusion_marker("index this chat"));

    std::cout << "  PASS" << std::endl;
}

void test_exchange_stream() {
    std::cout << "Testing ExchangeStream..." << std::endl;

    std::string dir = fresh_dir("stream");
    std::string path = dir + "/-home-me-app/conv.jsonl";
    write_file(path, jwt_conversation() + "{broken line\n");

    ExchangeStream stream(path, "-home-me-app");
    assert(stream.is_open());

    auto first = stream.next();
    assert(first.has_value());
    assert(first->line_start == 1);
    assert(first->line_end == 4);
    assert(first->user_message == "How do I fix JWT authentication errors?");
    assert(first->assistant_message.find("Let me check") != std::string::npos);
    assert(first->assistant_message.find("Fixed it.") != std::string::npos);
    assert(first->timestamp == *parse_iso8601("2025-10-01T10:00:10.000Z"));
    assert(first->session_id == "sess-1");
    assert(first->git_branch == "main");
    assert(first->tool_calls.size() == 1);
    assert(first->tool_calls[0].tool_name == "Read");
    assert(first->tool_calls[0].tool_result == "export function verify(token) {}");
    assert(first->tool_calls[0].exchange_id == first->id);
    assert(first->compressed_tool_summary.has_value());
    assert(first->id.size() == 16);

    auto second = stream.next();
    assert(second.has_value());
    assert(second->line_start == 7);
    assert(second->line_end == 8);
    assert(second->tool_calls.empty());

    assert(!stream.next().has_value());
    assert(stream.errors().size() == 1);
    assert(stream.errors()[0].line() == 9);
    assert(!stream.excluded());

    // Restartable, same ids
    stream.reset();
    auto again = stream.next();
    assert(again && again->id == first->id);

    ExchangeStream missing(dir + "/nope.jsonl", "x");
    assert(!missing.is_open());
    assert(!missing.next().has_value());

    std::cout << "  PASS" << std::endl;
}

void test_parse_conversation_exclusion() {
    std::cout << "Testing exclusion marker..." << std::endl;

    std::string dir = fresh_dir("exclude");
    std::string path = dir + "/p/secret.jsonl";
    write_file(path, user_line("DO NOT INDEX THIS CHAT", "2025-10-01T10:00:00Z") + "\n" +
                     assistant_line("Understood.", "2025-10-01T10:00:01Z") + "\n" +
                     user_line("my password is hunter2", "2025-10-01T10:01:00Z") + "\n" +
                     assistant_line("Noted.", "2025-10-01T10:01:01Z") + "\n");

    auto parsed = parse_conversation(path, "p");
    assert(parsed.excluded);
    assert(parsed.exchanges.empty());

    bool threw = false;
    try { parse_conversation(dir + "/missing.jsonl", "p"); } catch (const NotFoundError&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_undated_records() {
    std::cout << "Testing records without timestamps..." << std::endl;

    std::string dir = fresh_dir("undated");
    std::string path = dir + "/-home-me-app/undated.jsonl";

    auto undated = [](const std::string& type, const std::string& text) {
        json j = {
            {"type", type},
            {"sessionId", "sess-1"},
            {"message", {{"role", type}, {"content", text}}},
        };
        return j.dump();
    };
    write_file(path,
               undated("user", "first question") + "\n" +
               assistant_line("dated answer", "2025-10-01T10:00:10.000Z") + "\n" +
               undated("user", "second question") + "\n" +
               undated("assistant", "undated answer") + "\n");

    auto first = parse_conversation(path, "-home-me-app");
    assert(first.exchanges.size() == 2);
    // Dated reply supplies the time
    assert(first.exchanges[0].timestamp == *parse_iso8601("2025-10-01T10:00:10.000Z"));
    // Nothing dated in the turn: the previous record's time
    assert(first.exchanges[1].timestamp == first.exchanges[0].timestamp);

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    auto again = parse_conversation(path, "-home-me-app");
    assert(again.exchanges.size() == 2);
    for (size_t i = 0; i < 2; ++i) {
        assert(again.exchanges[i].timestamp == first.exchanges[i].timestamp);
        assert(again.exchanges[i].id == first.exchanges[i].id);
    }

    std::cout << "  PASS" << std::endl;
}

void test_read_range() {
    std::cout << "Testing read_range..." << std::endl;

    std::string dir = fresh_dir("range");
    std::string path = dir + "/-home-me-app/conv.jsonl";
    write_file(path, jwt_conversation());

    auto parsed = parse_conversation(path, "-home-me-app");
    assert(parsed.exchanges.size() == 2);

    // Any stored exchange can be re-read from its own line range
    for (const auto& ex : parsed.exchanges) {
        auto range = read_range(path, "-home-me-app", ex.line_start, ex.line_end);
        assert(range.size() == 1);
        assert(range[0].id == ex.id);
        assert(range[0].user_message == ex.user_message);
    }

    assert(read_range(path, "-home-me-app", 1, 8).size() == 2);
    assert(read_range(path, "-home-me-app", 2, 3).empty());

    bool threw = false;
    try { read_range(path, "-home-me-app", 5, 2); } catch (const ValidationError&) { threw = true; }
    assert(threw);

    assert(project_from_path(path) == "-home-me-app");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Rate limiter, compression, config
// ═══════════════════════════════════════════════════════════════════

void test_rate_limiter() {
    std::cout << "Testing RateLimiter..." << std::endl;

    RateLimiter limiter(RateLimitSettings{10.0, 3.0});
    assert(limiter.available_tokens() == 3);
    assert(limiter.try_acquire());
    assert(limiter.try_acquire());
    assert(limiter.try_acquire());
    assert(!limiter.try_acquire());

    // Next token is due in ~100ms
    auto start = std::chrono::steady_clock::now();
    limiter.acquire();
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    assert(waited >= 50);
    assert(limiter.waiting() == 0);

    // Concurrent callers all get through
    std::atomic<int> done{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&]() { limiter.acquire(); ++done; });
    }
    for (auto& t : threads) t.join();
    assert(done == 4);

    bool threw = false;
    try { RateLimiter bad(RateLimitSettings{0.0, 1.0}); } catch (const ValidationError&) { threw = true; }
    assert(threw);
    threw = false;
    try { RateLimiter bad(RateLimitSettings{1.0, 0.5}); } catch (const ValidationError&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_compress() {
    std::cout << "Testing compress..." << std::endl;

    json bash = merge_tool_data({{"command", "npm test"}}, {{"exitCode", 0}, {"stdout", "ok"}});
    auto ran = compress_tool_event("Bash", bash);
    assert(ran && *ran == "Ran `npm test` \xE2\x86\x92 exit 0");

    json failed = {{"command", "make"}, {"exitCode", 2}, {"stderr", "missing rule\nmore"}};
    assert(*compress_tool_event("Bash", failed) == "Ran `make` \xE2\x86\x92 exit 2: missing rule");

    json read = {{"file_path", "/src/a.ts"}, {"lines", 245}};
    assert(*compress_tool_event("Read", read) == "Read /src/a.ts (245 lines)");

    assert(!compress_tool_event("Glob", json::object()).has_value());
    assert(!compress_tool_event("TodoWrite", json::object()).has_value());

    json big = {{"command", std::string(2000, 'x')}};
    assert(compress_tool_event("Bash", big)->size() <= MAX_EVENT_CHARS);

    // Input keys win over response keys
    json merged = merge_tool_data({{"file_path", "/a"}}, {{"file_path", "/b"}, {"extra", 1}});
    assert(merged["file_path"] == "/a");
    assert(merged["extra"] == 1);
    assert(merge_tool_data(nullptr, "text output")["output"] == "text output");

    // Never splits a UTF-8 sequence
    std::string korean = "\xEC\x9D\xB4\xEC\x9D\xB4\xEC\x9D\xB4";
    std::string cut = truncate_text(korean, 7);
    assert(cut == "\xEC\x9D\xB4...");

    assert(normalize_tool_name("mcp__plugin_memmem__search") == "search");
    assert(normalize_tool_name("Read") == "Read");

    ToolCall call;
    call.tool_name = "Bash";
    call.tool_input = R"({"command":"npm test"})";
    assert(summarize_tool_calls({call}).find("`npm test`") != std::string::npos);
    assert(summarize_tool_calls({}).empty());

    std::cout << "  PASS" << std::endl;
}

void test_config() {
    std::cout << "Testing Config..." << std::endl;

    Config config = Config::defaults("/home/me");
    assert(config.config_dir == "/home/me/.config/memmem");
    assert(config.archive_dir == "/home/me/.config/memmem/conversation-archive");
    assert(config.db_path == "/home/me/.config/memmem/conversation-index/conversations.db");
    assert(config.socket_path == "/home/me/.config/memmem/embedding-worker.sock");
    assert(config.projects_dir == "/home/me/.claude/projects");
    assert(config.embedding_limit.requests_per_second == 5.0);
    assert(config.embedding_limit.burst_size == 10.0);
    assert(config.llm_limit.requests_per_second == 2.0);

    std::string dir = fresh_dir("config");
    write_file(dir + "/config.json", R"({
        "ratelimit": {"embedding": {"requestsPerSecond": 8}, "llm": {"requestsPerSecond": 1, "burstSize": 1}},
        "llm": {"command": ["claude", "-p"]},
        "worker": {"idleTimeoutMs": 1500},
        "inject": {"maxObservations": 5, "projectOnly": false},
        "extraction": {"batchSize": 4},
        "excludeProjects": ["-tmp-scratch"]
    })");
    assert(config.load_file(dir + "/config.json"));
    assert(config.embedding_limit.requests_per_second == 8.0);
    assert(config.embedding_limit.burst_size == 16.0);
    assert(config.llm_limit.burst_size == 1.0);
    assert(config.llm_command.size() == 2 && config.llm_command[0] == "claude");
    assert(config.worker.idle_timeout.count() == 1500);
    assert(config.inject.max_observations == 5);
    assert(!config.inject.project_only);
    assert(config.inject.max_tokens == 1000);
    assert(config.extraction.batch_size == 4);
    assert(config.is_excluded("-tmp-scratch"));
    assert(!config.is_excluded("-home-me-app"));

    // Malformed file keeps what is already set
    write_file(dir + "/bad.json", "{ nope");
    assert(!config.load_file(dir + "/bad.json"));
    assert(config.extraction.batch_size == 4);
    assert(!config.load_file(dir + "/absent.json"));

    Config excl = Config::defaults("/home/me");
    write_file(dir + "/exclude.txt", "# private\n-home-me-secret\n\n  -home-me-other  \n");
    excl.load_exclude_file(dir + "/exclude.txt");
    assert(excl.exclude_projects.size() == 2);
    assert(excl.is_excluded("-home-me-other"));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Storage
// ═══════════════════════════════════════════════════════════════════

void test_storage_exchanges() {
    std::cout << "Testing Storage exchanges..." << std::endl;

    std::string dir = fresh_dir("storage");
    Storage storage(dir + "/db/conversations.db");
    HashEmbedder embedder;

    std::string path = dir + "/-home-me-app/conv.jsonl";
    write_file(path, jwt_conversation());
    auto parsed = parse_conversation(path, "-home-me-app");

    Exchange ex = parsed.exchanges[0];
    ex.embedding = embedder.embed(exchange_embedding_text(ex));
    storage.insert_exchange(ex);
    assert(storage.has_exchange(ex.id));

    auto loaded = storage.get_exchange(ex.id);
    assert(loaded.has_value());
    assert(loaded->project == "-home-me-app");
    assert(loaded->line_start == 1 && loaded->line_end == 4);
    assert(loaded->tool_calls.size() == 1);
    assert(loaded->tool_calls[0].tool_result == ex.tool_calls[0].tool_result);
    assert(loaded->compressed_tool_summary == ex.compressed_tool_summary);

    auto vec = storage.exchange_embedding(ex.id);
    assert(vec.has_value());
    assert(vec->cosine(*ex.embedding) > 0.999f);

    // Re-insert replaces, never duplicates
    storage.insert_exchange(ex);
    assert(storage.stats().exchanges == 1);
    assert(storage.stats().tool_calls == 1);

    Exchange bad = parsed.exchanges[1];
    bad.embedding = Vector(std::vector<float>(12, 1.0f));
    bool threw = false;
    try { storage.insert_exchange(bad); } catch (const ValidationError&) { threw = true; }
    assert(threw);
    assert(!storage.has_exchange(bad.id));

    // Tool calls and the vector go with the exchange
    assert(storage.delete_exchange(ex.id));
    assert(!storage.delete_exchange(ex.id));
    assert(!storage.exchange_embedding(ex.id).has_value());
    assert(storage.stats().tool_calls == 0);
    assert(!storage.get_exchange("0000000000000000").has_value());

    std::cout << "  PASS" << std::endl;
}

void test_storage_queries() {
    std::cout << "Testing Storage exchange queries..." << std::endl;

    std::string dir = fresh_dir("queries");
    Storage storage(dir + "/conversations.db");

    std::string path = dir + "/-home-me-app/conv.jsonl";
    write_file(path, jwt_conversation());
    auto parsed = parse_conversation(path, "-home-me-app");
    assert(parsed.exchanges.size() == 2);
    for (const auto& ex : parsed.exchanges) storage.insert_exchange(ex);

    Exchange side = parsed.exchanges[1];
    side.id = "ffffffffffffffff";
    side.project = "-home-me-other";
    side.session_id = "sess-2";
    side.archive_path = dir + "/-home-me-other/side.jsonl";
    side.is_sidechain = true;
    side.timestamp = parsed.exchanges[0].timestamp - 1000;
    storage.insert_exchange(side);

    auto session = storage.exchanges_by_session("sess-1");
    assert(session.size() == 2);
    assert(session[0].line_start == 1);
    assert(session[0].tool_calls.size() == 1);
    assert(storage.exchanges_by_session("nope").empty());

    auto project = storage.exchanges_by_project("-home-me-app", 10);
    assert(project.size() == 2);
    assert(project.front().line_start == 7);  // Newest first
    assert(storage.exchanges_by_project("-home-me-app", 1).size() == 1);

    auto sidechain = storage.exchanges_by_sidechain(true, 10);
    assert(sidechain.size() == 1);
    assert(sidechain[0].id == side.id);
    assert(sidechain[0].is_sidechain);
    assert(storage.exchanges_by_sidechain(false, 10).size() == 2);

    auto archived = storage.exchanges_for_archive(path);
    assert(archived.size() == 2);
    assert(archived[0].line_start == 1 && archived[1].line_start == 7);
    assert(archived[0].tool_calls.size() == 1);

    auto recent = storage.recent_exchanges(10);
    assert(recent.size() == 3);
    assert(recent.front().id == parsed.exchanges[1].id);
    assert(recent.back().id == side.id);

    auto reads = storage.tool_calls_by_name("Read", 10);
    assert(reads.size() == 1);
    assert(reads[0].id == "tu-1");
    assert(reads[0].exchange_id == parsed.exchanges[0].id);
    assert(storage.tool_calls_by_name("Bash", 10).empty());

    std::cout << "  PASS" << std::endl;
}

void test_storage_pending_events() {
    std::cout << "Testing Storage pending events..." << std::endl;

    std::string dir = fresh_dir("pending");
    Storage storage(dir + "/conversations.db");

    std::vector<int64_t> ids;
    for (int i = 0; i < 3; ++i) {
        PendingEvent ev;
        ev.session_id = "s";
        ev.project = "p";
        ev.tool_name = "Bash";
        ev.merged_data = "Ran `step " + std::to_string(i) + "`";
        ev.timestamp = 1000 + i;
        ids.push_back(storage.insert_pending_event(ev));
    }
    assert(storage.pending_event_count("s") == 3);
    assert(storage.pending_event_count("other") == 0);
    assert(storage.pending_events("s").front().merged_data == "Ran `step 0`");

    Observation obs = make_observation("p", "Ran steps", "Steps 0 and 1 ran", 5000);
    obs.session_id = "s";
    obs.concepts = {"build"};
    obs.files_modified = {"/src/main.cpp"};
    auto new_ids = storage.commit_extraction({obs}, {ids[0], ids[1]});
    assert(new_ids.size() == 1);
    assert(storage.pending_event_count("s") == 1);

    auto stored = storage.get_observation(new_ids[0]);
    assert(stored.has_value());
    assert(stored->concepts == std::vector<std::string>{"build"});
    assert(stored->files_modified == std::vector<std::string>{"/src/main.cpp"});
    assert(storage.observations_by_session("s").size() == 1);

    assert(storage.delete_pending_events({ids[2]}) == 1);
    assert(storage.pending_event_count() == 0);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Indexer
// ═══════════════════════════════════════════════════════════════════

void test_sync() {
    std::cout << "Testing Indexer sync..." << std::endl;

    std::string dir = fresh_dir("sync");
    Config config = test_config(dir);
    write_file(config.projects_dir + "/-home-me-app/conv.jsonl", jwt_conversation());
    write_file(config.projects_dir + "/-home-me-app/agent-123.jsonl", jwt_conversation());
    write_file(config.projects_dir + "/-home-me-app/notes.txt", "not a transcript");

    Storage storage(config.db_path);
    auto embedder = std::make_shared<HashEmbedder>();
    Indexer indexer(storage, embedder, config);

    auto first = indexer.sync(config.projects_dir, config.archive_dir);
    assert(first.copied == 1);
    assert(first.indexed == 1);
    assert(first.summarized == 1);
    assert(first.skipped == 0);
    assert(first.errors.empty());
    assert(fs::exists(config.archive_dir + "/-home-me-app/conv.jsonl"));
    assert(!fs::exists(config.archive_dir + "/-home-me-app/agent-123.jsonl"));

    auto stats = storage.stats();
    assert(stats.exchanges == 2);
    assert(stats.embedded_exchanges == 2);
    assert(stats.indexed_files == 1);

    // Nothing changed: nothing copied, nothing re-indexed
    auto second = indexer.sync(config.projects_dir, config.archive_dir);
    assert(second.copied == 0);
    assert(second.indexed == 0);
    assert(second.skipped == 1);
    assert(second.errors.empty());
    assert(storage.stats().exchanges == 2);

    // A grown source is recopied and re-indexed
    std::string source = config.projects_dir + "/-home-me-app/conv.jsonl";
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    write_file(source, jwt_conversation() +
                       user_line("And the refresh token?", "2025-10-03T08:00:00Z") + "\n" +
                       assistant_line("Same bug there.", "2025-10-03T08:00:10Z") + "\n");
    auto third = indexer.sync(config.projects_dir, config.archive_dir);
    assert(third.copied == 1 && third.indexed == 1);
    assert(storage.stats().exchanges == 3);

    // Empty source: all zeros
    std::string empty = dir + "/empty";
    fs::create_directories(empty);
    auto none = indexer.sync(empty, config.archive_dir);
    assert(none.copied == 0 && none.indexed == 0 && none.skipped == 0 && none.errors.empty());

    auto missing = indexer.sync(dir + "/does-not-exist", config.archive_dir);
    assert(missing.errors.size() == 1);

    bool threw = false;
    try { indexer.sync(config.projects_dir, config.archive_dir, {false, false, 0}); }
    catch (const ValidationError&) { threw = true; }
    assert(threw);
    threw = false;
    try { indexer.sync(config.projects_dir, config.archive_dir, {false, false, 17}); }
    catch (const ValidationError&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_sync_options() {
    std::cout << "Testing Indexer options and concurrency..." << std::endl;

    std::string dir = fresh_dir("sync_opts");
    Config config = test_config(dir);
    for (int i = 0; i < 6; ++i) {
        write_file(config.projects_dir + "/-home-me-app/conv" + std::to_string(i) + ".jsonl",
                   jwt_conversation());
    }
    write_file(config.projects_dir + "/-home-me-secret/conv.jsonl", jwt_conversation());
    write_file(config.projects_dir + "/-home-me-broken/conv.jsonl",
               jwt_conversation() + "{oops\n");
    config.exclude_projects = {"-home-me-secret"};

    Storage storage(config.db_path);
    Indexer indexer(storage, std::make_shared<HashEmbedder>(), config);

    // Copy only
    auto copied = indexer.sync(config.projects_dir, config.archive_dir, {true, false, 1});
    assert(copied.copied == 7);
    assert(copied.indexed == 0);
    assert(storage.stats().exchanges == 0);
    assert(!fs::exists(config.archive_dir + "/-home-me-secret"));

    // Index without embeddings, in parallel
    auto plain = indexer.sync(config.projects_dir, config.archive_dir, {false, true, 4});
    assert(plain.indexed == 7);
    assert(plain.summarized == 0);
    assert(storage.stats().exchanges == 14);
    assert(storage.stats().embedded_exchanges == 0);

    // The malformed line is reported, the good exchanges are still stored
    assert(plain.errors.size() == 1);
    assert(plain.errors[0].file.find("-home-me-broken") != std::string::npos);
    assert(storage.stats().exchanges_per_project.at("-home-me-broken") == 2);

    // Rebuild from the archive with embeddings
    auto rebuilt = indexer.rebuild(config.archive_dir, {false, false, 3});
    assert(rebuilt.indexed == 7);
    assert(storage.stats().embedded_exchanges == 14);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Verifier
// ═══════════════════════════════════════════════════════════════════

void test_verify_repair() {
    std::cout << "Testing Verifier..." << std::endl;

    std::string dir = fresh_dir("verify");
    Config config = test_config(dir);
    write_file(config.projects_dir + "/-home-me-app/a.jsonl", jwt_conversation());
    write_file(config.projects_dir + "/-home-me-app/b.jsonl", jwt_conversation());

    Storage storage(config.db_path);
    Indexer indexer(storage, std::make_shared<HashEmbedder>(), config);
    indexer.sync(config.projects_dir, config.archive_dir);
    indexer.rebuild(config.archive_dir);

    Verifier verifier(storage, indexer, config);
    assert(verifier.verify().clean());

    const std::string archived_a = config.archive_dir + "/-home-me-app/a.jsonl";
    const std::string archived_b = config.archive_dir + "/-home-me-app/b.jsonl";

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    fs::remove(archived_a);                                            // orphaned
    write_file(archived_b, jwt_conversation());                        // outdated
    write_file(config.archive_dir + "/-home-me-app/c.jsonl", jwt_conversation());   // missing
    write_file(config.archive_dir + "/-home-me-app/d.jsonl",                       // corrupted
               jwt_conversation() + "{half a record\n");

    auto report = verifier.verify();
    assert(!report.clean());
    assert(report.orphaned.size() == 1 && report.orphaned[0].archive_path == archived_a);
    assert(report.outdated.size() == 1 && report.outdated[0].archive_path == archived_b);
    assert(report.missing.size() == 2);
    assert(report.corrupted.size() == 1);
    assert(report.corrupted[0].project == "-home-me-app");
    assert(report.total() == 5);

    // verify() only reads
    assert(storage.indexed_file(archived_a).has_value());

    auto result = verifier.repair(report);
    assert(result.reindexed == 3);
    assert(result.removed == 1);
    assert(result.errors.empty());
    assert(!storage.indexed_file(archived_a).has_value());

    auto after = verifier.verify();
    assert(after.missing.empty());
    assert(after.orphaned.empty());
    assert(after.outdated.empty());
    assert(after.corrupted.size() == 1);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Search
// ═══════════════════════════════════════════════════════════════════

void test_search() {
    std::cout << "Testing SearchEngine..." << std::endl;

    std::string dir = fresh_dir("search");
    Config config = test_config(dir);
    write_file(config.projects_dir + "/-home-me-app/conv.jsonl", jwt_conversation());

    Storage storage(config.db_path);
    auto embedder = std::make_shared<HashEmbedder>();
    Indexer indexer(storage, embedder, config);
    indexer.sync(config.projects_dir, config.archive_dir);

    SearchEngine engine(storage, embedder);

    SearchOptions vector_only;
    vector_only.mode = SearchMode::Vector;
    auto hits = engine.search("JWT authentication", vector_only);
    assert(!hits.empty());
    assert(hits[0].is_exchange());
    assert(hits[0].score > 0.0f);
    assert(hits[0].vector_match);
    assert(hits[0].project() == "-home-me-app");
    assert(hits[0].timestamp() > 0);
    assert(hits[0].exchange().user_message.find("JWT") != std::string::npos);
    for (size_t i = 1; i < hits.size(); ++i) assert(hits[i - 1].score >= hits[i].score);

    // Exact strings such as commit hashes
    SearchOptions text_only;
    text_only.mode = SearchMode::Text;
    auto sha = engine.search("A1B2C3D4E5F6", text_only);
    assert(sha.size() == 1);
    assert(sha[0].text_match && !sha[0].vector_match);
    assert(sha[0].score == TEXT_MATCH_BOOST);
    assert(sha[0].exchange().line_start == 7);

    // Found by both: one result carrying both flags
    SearchOptions both;
    auto merged = engine.search("a1b2c3d4e5f6", both);
    size_t with_sha = 0;
    for (const auto& r : merged) {
        if (r.is_exchange() && r.exchange().line_start == 7) {
            ++with_sha;
            assert(r.text_match);
        }
    }
    assert(with_sha == 1);

    // Date filters
    SearchOptions late = text_only;
    late.after = "2025-10-02";
    assert(engine.search("tests", late).size() == 1);
    late.after.clear();
    late.before = "2025-10-01";
    assert(engine.search("a1b2c3d4e5f6", late).empty());

    SearchOptions other_project = text_only;
    other_project.projects = {"-home-me-other"};
    assert(engine.search("JWT", other_project).empty());

    SearchOptions limited = vector_only;
    limited.limit = 1;
    assert(engine.search("tests pass", limited).size() == 1);

    // Validation
    auto expect_invalid = [&](const std::string& query, const SearchOptions& options) {
        bool threw = false;
        try { engine.search(query, options); } catch (const ValidationError&) { threw = true; }
        assert(threw);
    };
    expect_invalid("", both);
    expect_invalid("   ", both);
    SearchOptions bad = both;
    bad.limit = 0;
    expect_invalid("jwt", bad);
    bad.limit = 51;
    expect_invalid("jwt", bad);
    bad = both;
    bad.after = "2025-1-01";
    expect_invalid("jwt", bad);
    bad = both;
    bad.after = "2025-10-05";
    bad.before = "2025-10-01";
    expect_invalid("jwt", bad);

    // No provider: Both degrades to text, Vector refuses
    SearchEngine text_engine(storage, nullptr);
    auto fallback = text_engine.search("a1b2c3d4e5f6", both);
    assert(fallback.size() == 1 && fallback[0].text_match);
    bool threw = false;
    try { text_engine.search("jwt", vector_only); } catch (const ProviderError&) { threw = true; }
    assert(threw);

    assert(parse_search_mode("vector") == SearchMode::Vector);
    assert(!parse_search_mode("fuzzy").has_value());
    json j = to_json(hits[0]);
    assert(j["kind"] == "exchange");
    assert(j["project"] == "-home-me-app");

    std::cout << "  PASS" << std::endl;
}

void test_multi_concept_search() {
    std::cout << "Testing multi-concept search..." << std::endl;

    std::string dir = fresh_dir("concepts");
    Config config = test_config(dir);
    write_file(config.projects_dir + "/-home-me-app/conv.jsonl", jwt_conversation());

    Storage storage(config.db_path);
    auto embedder = std::make_shared<HashEmbedder>();
    Indexer indexer(storage, embedder, config);
    indexer.sync(config.projects_dir, config.archive_dir);
    SearchEngine engine(storage, embedder);

    SearchOptions options;
    bool threw = false;
    try { engine.search_multi_concept({"authentication"}, options); }
    catch (const ValidationError&) { threw = true; }
    assert(threw);

    threw = false;
    try { engine.search_multi_concept({"a", "b", "c", "d", "e", "f"}, options); }
    catch (const ValidationError&) { threw = true; }
    assert(threw);

    auto results = engine.search_multi_concept({"JWT authentication", "expiry seconds"}, options);
    assert(!results.empty());
    assert(results[0].exchange().line_start == 1);
    for (const auto& r : results) {
        assert(r.concept_scores.size() == 2);
        for (float s : r.concept_scores) assert(s >= CONCEPT_SIMILARITY_FLOOR);
        float mean = (r.concept_scores[0] + r.concept_scores[1]) / 2.0f;
        assert(std::abs(mean - r.score) < 1e-5f);
    }

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Observation extraction
// ═══════════════════════════════════════════════════════════════════

void test_search_query_dispatch() {
    std::cout << "Testing search query dispatch..." << std::endl;

    std::string dir = fresh_dir("dispatch");
    Config config = test_config(dir);
    write_file(config.projects_dir + "/-home-me-app/conv.jsonl", jwt_conversation());

    Storage storage(config.db_path);
    auto embedder = std::make_shared<HashEmbedder>();
    Indexer indexer(storage, embedder, config);
    indexer.sync(config.projects_dir, config.archive_dir);
    SearchEngine engine(storage, embedder);
    SearchOptions options;

    bool threw = false;
    try { engine.search_queries({}, options); } catch (const ValidationError&) { threw = true; }
    assert(threw);

    // One query is a plain search
    auto plain = engine.search_queries({"JWT authentication"}, options);
    assert(!plain.empty());
    for (const auto& r : plain) assert(r.concept_scores.empty());

    // A one-element concept list is rejected, not downgraded
    threw = false;
    try { engine.search_queries({"JWT authentication"}, options, true); }
    catch (const ValidationError&) { threw = true; }
    assert(threw);

    auto multi = engine.search_queries({"JWT authentication", "expiry seconds"}, options);
    assert(!multi.empty());
    for (const auto& r : multi) assert(r.concept_scores.size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_parse_batch_response() {
    std::cout << "Testing parse_batch_response..." << std::endl;

    auto fenced = parse_batch_response(ONE_INSIGHT);
    assert(fenced && fenced->size() == 1);
    assert((*fenced)[0].title == "Fixed JWT expiry");
    assert((*fenced)[0].type == "bugfix");
    assert((*fenced)[0].files_modified.size() == 1);

    auto prose = parse_batch_response(
        "Here you go: [{\"title\": \"A\", \"content\": \"B\", \"type\": \"nonsense\"}] done");
    assert(prose && prose->size() == 1);
    assert((*prose)[0].type == "learning");

    auto partial = parse_batch_response(
        R"([{"title": "ok", "content": "fine"}, {"title": "", "content": "x"}, {"content": "no title"}, 7])");
    assert(partial && partial->size() == 1);

    // An empty array is an answer; text without an array is not
    auto none = parse_batch_response("[]");
    assert(none && none->empty());
    assert(!parse_batch_response("I could not find anything.").has_value());
    assert(!parse_batch_response("{\"title\": \"not an array\"}").has_value());
    assert(!parse_batch_response("").has_value());

    PendingEvent ev;
    ev.tool_name = "Bash";
    ev.merged_data = "Ran `make` \xE2\x86\x92 exit 0";
    ev.timestamp = *parse_iso8601("2025-10-01T10:00:00Z");
    Observation prev = make_observation("p", "Earlier", "something", 0);
    std::string prompt = build_batch_prompt({ev}, {prev});
    assert(prompt.find("<previous_observations>") != std::string::npos);
    assert(prompt.find("- Earlier: something") != std::string::npos);
    assert(prompt.find("[2025-10-01T10:00:00.000Z] Bash: Ran `make`") != std::string::npos);
    assert(build_batch_prompt({ev}, {}).find("<previous_observations>") == std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void queue_events(ObservationExtractor& extractor, const std::string& session, int count) {
    for (int i = 0; i < count; ++i) {
        auto id = extractor.queue_tool_event(session, "-home-me-app", "Bash",
                                             {{"command", "step " + std::to_string(i)}},
                                             {{"exitCode", 0}});
        assert(id.has_value());
    }
}

void test_extraction() {
    std::cout << "Testing ObservationExtractor..." << std::endl;

    std::string dir = fresh_dir("extract");
    Storage storage(dir + "/conversations.db");
    auto embedder = std::make_shared<HashEmbedder>();
    auto llm = std::make_shared<FakeLlm>(ONE_INSIGHT);

    ObservationExtractor extractor(storage, llm, embedder, ExtractionSettings{2, 3, 3});

    // Skipped tools are never queued
    assert(!extractor.queue_tool_event("s1", "-home-me-app", "Glob", {{"pattern", "*"}}, nullptr));

    queue_events(extractor, "s1", 4);
    assert(storage.pending_event_count("s1") == 4);

    auto report = extractor.session_stop("s1", "-home-me-app");
    assert(report.is_ok());
    assert(report->pending == 4);
    assert(report->batches == 2);
    assert(report->failed_batches == 0);
    assert(report->observations == 2);
    assert(report->events_consumed == 4);
    assert(storage.pending_event_count("s1") == 0);

    // Second batch saw the first batch's observation
    assert(llm->prompts.size() == 2);
    assert(llm->prompts[0].find("<previous_observations>") == std::string::npos);
    assert(llm->prompts[1].find("- Fixed JWT expiry:") != std::string::npos);
    assert(llm->prompts[0].find("Ran `step 0`") != std::string::npos);

    auto stored = storage.observations_by_session("s1");
    assert(stored.size() == 2);
    assert(stored[0].type == "bugfix");
    assert(stored[0].project == "-home-me-app");
    assert(stored[0].embedding.has_value());
    assert(stored[0].files_modified == std::vector<std::string>{"/src/auth.ts"});

    // Below threshold: nothing sent, nothing consumed
    queue_events(extractor, "s2", 2);
    auto small = extractor.session_stop("s2", "-home-me-app");
    assert(small.is_ok() && small->below_threshold);
    assert(storage.pending_event_count("s2") == 2);
    assert(llm->prompts.size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_extraction_failures() {
    std::cout << "Testing ObservationExtractor failures..." << std::endl;

    std::string dir = fresh_dir("extract_fail");
    Storage storage(dir + "/conversations.db");

    // No provider: the Bash event stays queued
    ObservationExtractor bare(storage, nullptr, nullptr);
    auto id = bare.queue_tool_event("s", "p", "Bash", {{"command", "ls"}}, {{"exitCode", 0}});
    assert(id.has_value());
    auto report = bare.session_stop("s", "p");
    assert(report.is_ok());
    assert(report->no_provider);
    assert(storage.pending_event_count("s") == 1);
    assert(storage.pending_events("s")[0].tool_name == "Bash");

    // Provider failure leaves every event for a later run
    auto failing = std::make_shared<FakeLlm>("", true);
    ObservationExtractor broken(storage, failing, nullptr, ExtractionSettings{15, 1, 3});
    auto failed = broken.session_stop("s", "p");
    assert(failed.is_ok());
    assert(failed->failed_batches == 1);
    assert(failed->observations == 0);
    assert(storage.pending_event_count("s") == 1);

    // A reply with no JSON array is a failure too, not an empty answer
    auto rambling = std::make_shared<FakeLlm>("Sorry, I can't help with that right now.");
    ObservationExtractor garbled(storage, rambling, nullptr, ExtractionSettings{15, 1, 3});
    auto kept = garbled.session_stop("s", "p");
    assert(kept.is_ok());
    assert(rambling->prompts.size() == 1);
    assert(kept->failed_batches == 1);
    assert(kept->batches == 0);
    assert(kept->events_consumed == 0);
    assert(storage.pending_event_count("s") == 1);
    assert(storage.observations_by_session("s").empty());

    // Empty array consumes the batch without observations
    auto quiet = std::make_shared<FakeLlm>("[]");
    ObservationExtractor low_value(storage, quiet, nullptr, ExtractionSettings{15, 1, 3});
    auto consumed = low_value.session_stop("s", "p");
    assert(consumed.is_ok());
    assert(consumed->events_consumed == 1);
    assert(consumed->observations == 0);
    assert(storage.pending_event_count("s") == 0);

    std::cout << "  PASS" << std::endl;
}

void test_command_llm() {
    std::cout << "Testing CommandLlmProvider..." << std::endl;

    CommandLlmProvider echo({"cat"}, nullptr);
    LlmOptions options;
    options.system_prompt = "system";
    assert(echo.complete("prompt", options) == "system\n\nprompt");
    assert(echo.name() == "cat");

    CommandLlmProvider failing({"false"}, nullptr);
    bool threw = false;
    try { failing.complete("x", options); } catch (const ProviderError&) { threw = true; }
    assert(threw);

    CommandLlmProvider slow({"sleep", "5"}, nullptr, 200);
    threw = false;
    try { slow.complete("x", options); } catch (const ProviderError&) { threw = true; }
    assert(threw);

    threw = false;
    try { CommandLlmProvider none({}, nullptr); } catch (const ValidationError&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Injector and hooks
// ═══════════════════════════════════════════════════════════════════

void test_injector() {
    std::cout << "Testing injector..." << std::endl;

    std::string dir = fresh_dir("inject");
    Storage storage(dir + "/conversations.db");

    const Timestamp at = *parse_iso8601("2025-10-05T12:00:00Z");
    const Timestamp hour = 3600 * 1000;
    storage.insert_observation(make_observation("p", "Recent fix", "short", at - hour));
    storage.insert_observation(make_observation("p", "Older note", "also short", at - 2 * hour));
    storage.insert_observation(make_observation("p", "Two days ago", "earlier work", at - 2 * MS_PER_DAY));
    storage.insert_observation(make_observation("p", "Stale", "too old", at - 10 * MS_PER_DAY));
    storage.insert_observation(make_observation("q", "Elsewhere", "other project", at - hour));

    InjectSettings settings;
    auto full = inject(storage, "p", settings, at);
    assert(full.included_count == 3);
    assert(full.markdown.rfind("# p recent context (memmem)\n", 0) == 0);
    assert(full.markdown.find("## 2025-10-05") != std::string::npos);
    assert(full.markdown.find("## 2025-10-03") != std::string::npos);
    assert(full.markdown.find("- Recent fix: short\n") != std::string::npos);
    assert(full.markdown.find("- Recent fix") < full.markdown.find("- Older note"));
    assert(full.markdown.find("Stale") == std::string::npos);
    assert(full.markdown.find("Elsewhere") == std::string::npos);
    assert(full.token_count == estimate_tokens(full.markdown));
    assert(full.token_count <= settings.max_tokens);

    InjectSettings everywhere = settings;
    everywhere.project_only = false;
    assert(inject(storage, "p", everywhere, at).included_count == 4);

    InjectSettings capped = settings;
    capped.max_observations = 2;
    assert(inject(storage, "p", capped, at).included_count == 2);

    // Header + first day + first bullet is 63 chars (16 tokens); the next bullet overflows
    InjectSettings tight = settings;
    tight.max_tokens = 20;
    auto small = inject(storage, "p", tight, at);
    assert(small.included_count == 1);
    assert(small.token_count <= 20);

    InjectSettings tiny = settings;
    tiny.max_tokens = 5;
    auto nothing = inject(storage, "p", tiny, at);
    assert(nothing.included_count == 0 && nothing.markdown.empty() && nothing.token_count == 0);

    auto unknown = inject(storage, "nobody", settings, at);
    assert(unknown.included_count == 0 && unknown.markdown.empty());

    assert(estimate_tokens("") == 0);
    assert(estimate_tokens("abcde") == 2);

    std::cout << "  PASS" << std::endl;
}

void test_hooks() {
    std::cout << "Testing hook boundary..." << std::endl;

    auto blank = parse_hook_input("  \n");
    assert(blank.is_ok() && blank->session_id.empty());
    assert(!parse_hook_input("{nope").is_ok());
    assert(!parse_hook_input("[1, 2]").is_ok());

    auto input = parse_hook_input(R"({"session_id": "abc", "cwd": "/home/me/app",
        "tool_name": "Edit", "tool_input": {"file_path": "/src/a.ts", "old_string": "x",
        "new_string": "y"}, "tool_response": {"success": true}})");
    assert(input.is_ok());
    assert(input->session_id == "abc");
    assert(input->tool_name == "Edit");
    assert(input->tool_input["file_path"] == "/src/a.ts");

    assert(project_slug("/home/me/my.app") == "-home-me-my-app");

    std::string dir = fresh_dir("hooks");
    Storage storage(dir + "/conversations.db");
    ObservationExtractor extractor(storage, nullptr, nullptr);

    assert(post_tool_use(extractor, input.value(), "-home-me-app").is_ok());
    assert(storage.pending_event_count("abc") == 1);
    assert(storage.pending_events("abc")[0].merged_data.rfind("Edited /src/a.ts", 0) == 0);

    HookInput no_tool;
    no_tool.session_id = "abc";
    auto status = post_tool_use(extractor, no_tool, "-home-me-app");
    assert(!status.is_ok() && !status.error().empty());

    assert(!session_stop(extractor, "", "p").is_ok());
    auto stopped = session_stop(extractor, "abc", "-home-me-app");
    assert(stopped.is_ok() && stopped->no_provider);

    storage.insert_observation(make_observation("-home-me-app", "Hooked", "via hook", now()));
    auto started = session_start(storage, "-home-me-app", InjectSettings{});
    assert(started.is_ok());
    assert(started->included_count == 1);
    assert(started->markdown.find("- Hooked: via hook") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

int main() {
    // Pipes to child processes must not kill the runner
    std::signal(SIGPIPE, SIG_IGN);

    std::cout << "=== memmem tests ===" << std::endl;
    test_libc_memmem_visible();
    test_time_helpers();
    test_hash_embedder();
    test_pool_model_output();

    std::cout << std::endl;
    std::cout << "=== Parser ===" << std::endl;
    test_parse_record();
    test_exchange_stream();
    test_parse_conversation_exclusion();
    test_undated_records();
    test_read_range();

    std::cout << std::endl;
    std::cout << "=== Support ===" << std::endl;
    test_rate_limiter();
    test_compress();
    test_config();

    std::cout << std::endl;
    std::cout << "=== Storage and indexing ===" << std::endl;
    test_storage_exchanges();
    test_storage_queries();
    test_storage_pending_events();
    test_sync();
    test_sync_options();
    test_verify_repair();

    std::cout << std::endl;
    std::cout << "=== Search ===" << std::endl;
    test_search();
    test_multi_concept_search();
    test_search_query_dispatch();

    std::cout << std::endl;
    std::cout << "=== Observations ===" << std::endl;
    test_parse_batch_response();
    test_extraction();
    test_extraction_failures();
    test_command_llm();
    test_injector();
    test_hooks();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
