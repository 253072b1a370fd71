#include <memmem/storage.hpp>
#include <memmem/version.hpp>
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <variant>

namespace mm {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

using Param = std::variant<int64_t, std::string>;

[[noreturn]] void fail(sqlite3* db, const std::string& what) {
    throw StorageError(what + ": " + sqlite3_errmsg(db));
}

void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) == SQLITE_OK) return;
    std::string message = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw StorageError(message);
}

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            fail(db_, "sqlite prepare failed");
        }
    }

    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int idx, int64_t value) {
        if (sqlite3_bind_int64(stmt_, idx, value) != SQLITE_OK) fail(db_, "sqlite bind failed");
    }

    void bind(int idx, const std::string& value) {
        if (sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()),
                              SQLITE_TRANSIENT) != SQLITE_OK) {
            fail(db_, "sqlite bind failed");
        }
    }

    void bind(int idx, const std::optional<std::string>& value) {
        if (value) {
            bind(idx, *value);
        } else if (sqlite3_bind_null(stmt_, idx) != SQLITE_OK) {
            fail(db_, "sqlite bind failed");
        }
    }

    void bind(int idx, const Vector& v) {
        int bytes = static_cast<int>(v.size() * sizeof(float));
        if (sqlite3_bind_blob(stmt_, idx, v.as_ptr(), bytes, SQLITE_TRANSIENT) != SQLITE_OK) {
            fail(db_, "sqlite bind failed");
        }
    }

    void bind_all(const std::vector<Param>& params, int first = 1) {
        int idx = first;
        for (const auto& p : params) {
            std::visit([&](const auto& value) { bind(idx, value); }, p);
            ++idx;
        }
    }

    // True while rows remain
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        fail(db_, "sqlite step failed");
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    int64_t int_at(int col) const { return sqlite3_column_int64(stmt_, col); }

    std::string text_at(int col) const {
        const unsigned char* text = sqlite3_column_text(stmt_, col);
        if (!text) return "";
        return std::string(reinterpret_cast<const char*>(text),
                           static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
    }

    bool is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

    std::optional<Vector> vector_at(int col) const {
        if (is_null(col)) return std::nullopt;
        const void* blob = sqlite3_column_blob(stmt_, col);
        size_t bytes = static_cast<size_t>(sqlite3_column_bytes(stmt_, col));
        if (bytes != EMBED_DIM * sizeof(float) || !blob) {
            throw StorageError("vector blob has " + std::to_string(bytes) + " bytes, expected " +
                               std::to_string(EMBED_DIM * sizeof(float)));
        }
        Vector v;
        std::memcpy(v.as_ptr(), blob, bytes);
        return v;
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// BEGIN IMMEDIATE on construction, ROLLBACK unless commit() ran
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        exec(db_, "BEGIN IMMEDIATE");
    }

    ~Transaction() {
        if (done_) return;
        char* err = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
            std::cerr << "[storage] Rollback failed: " << (err ? err : "unknown") << "\n";
        }
        sqlite3_free(err);
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec(db_, "COMMIT");
        done_ = true;
    }

private:
    sqlite3* db_;
    bool done_ = false;
};

// WHERE clause assembled from optional pieces
struct Where {
    std::vector<std::string> clauses;
    std::vector<Param> params;

    void add(std::string clause) { clauses.push_back(std::move(clause)); }

    std::string sql() const {
        if (clauses.empty()) return "";
        std::string out = " WHERE ";
        for (size_t i = 0; i < clauses.size(); ++i) {
            if (i > 0) out += " AND ";
            out += clauses[i];
        }
        return out;
    }
};

std::string placeholders(size_t n) {
    std::string out = "(";
    for (size_t i = 0; i < n; ++i) out += i ? ",?" : "?";
    return out + ")";
}

// LIKE pattern matching `needle` anywhere, with \ as escape
std::string like_pattern(const std::string& needle) {
    std::string out = "%";
    for (char c : needle) {
        if (c == '%' || c == '_' || c == '\\') out += '\\';
        out += c;
    }
    return out + "%";
}

int64_t sql_limit(size_t limit) {
    return limit == 0 ? -1 : static_cast<int64_t>(limit);
}

void check_embedding(const std::optional<Vector>& embedding, const std::string& owner) {
    if (embedding && embedding->size() != EMBED_DIM) {
        throw ValidationError("embedding for " + owner + " has " +
                              std::to_string(embedding->size()) + " dimensions, expected " +
                              std::to_string(EMBED_DIM));
    }
}

Vector normalized(const Vector& v) {
    Vector out = v;
    out.normalize();
    return out;
}

std::vector<std::string> string_list(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    std::vector<std::string> out;
    if (!j.is_array()) return out;
    for (const auto& item : j) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

const char* SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS exchanges (
    id TEXT PRIMARY KEY,
    project TEXT NOT NULL,
    timestamp INTEGER NOT NULL,
    user_message TEXT NOT NULL,
    assistant_message TEXT NOT NULL,
    archive_path TEXT NOT NULL,
    line_start INTEGER NOT NULL,
    line_end INTEGER NOT NULL,
    session_id TEXT NOT NULL DEFAULT '',
    cwd TEXT NOT NULL DEFAULT '',
    git_branch TEXT NOT NULL DEFAULT '',
    assistant_version TEXT NOT NULL DEFAULT '',
    parent_uuid TEXT NOT NULL DEFAULT '',
    is_sidechain INTEGER NOT NULL DEFAULT 0,
    compressed_tool_summary TEXT,
    CHECK (line_start <= line_end)
);
CREATE INDEX IF NOT EXISTS idx_exchanges_timestamp ON exchanges(timestamp DESC);
CREATE INDEX IF NOT EXISTS idx_exchanges_session ON exchanges(session_id);
CREATE INDEX IF NOT EXISTS idx_exchanges_project ON exchanges(project);
CREATE INDEX IF NOT EXISTS idx_exchanges_sidechain ON exchanges(is_sidechain);
CREATE INDEX IF NOT EXISTS idx_exchanges_archive ON exchanges(archive_path);

CREATE TABLE IF NOT EXISTS tool_calls (
    seq INTEGER PRIMARY KEY,
    id TEXT NOT NULL,
    exchange_id TEXT NOT NULL REFERENCES exchanges(id) ON DELETE CASCADE,
    tool_name TEXT NOT NULL,
    tool_input TEXT NOT NULL DEFAULT '',
    tool_result TEXT NOT NULL DEFAULT '',
    is_error INTEGER NOT NULL DEFAULT 0,
    timestamp INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_tool_calls_name ON tool_calls(tool_name);
CREATE INDEX IF NOT EXISTS idx_tool_calls_exchange ON tool_calls(exchange_id);

CREATE TABLE IF NOT EXISTS vec_exchanges (
    id TEXT PRIMARY KEY REFERENCES exchanges(id) ON DELETE CASCADE,
    embedding BLOB NOT NULL
);

CREATE TABLE IF NOT EXISTS observations (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    project TEXT NOT NULL,
    session_id TEXT NOT NULL,
    timestamp INTEGER NOT NULL,
    type TEXT NOT NULL,
    title TEXT NOT NULL,
    subtitle TEXT NOT NULL DEFAULT '',
    narrative TEXT NOT NULL DEFAULT '',
    facts TEXT NOT NULL DEFAULT '[]',
    concepts TEXT NOT NULL DEFAULT '[]',
    files_read TEXT NOT NULL DEFAULT '[]',
    files_modified TEXT NOT NULL DEFAULT '[]'
);
CREATE INDEX IF NOT EXISTS idx_observations_timestamp ON observations(timestamp DESC);
CREATE INDEX IF NOT EXISTS idx_observations_project ON observations(project);
CREATE INDEX IF NOT EXISTS idx_observations_session ON observations(session_id);

CREATE TABLE IF NOT EXISTS observation_concepts (
    observation_id INTEGER NOT NULL REFERENCES observations(id) ON DELETE CASCADE,
    concept TEXT NOT NULL,
    PRIMARY KEY (observation_id, concept)
);
CREATE INDEX IF NOT EXISTS idx_observation_concepts ON observation_concepts(concept);

CREATE TABLE IF NOT EXISTS observation_files (
    observation_id INTEGER NOT NULL REFERENCES observations(id) ON DELETE CASCADE,
    path TEXT NOT NULL,
    kind TEXT NOT NULL CHECK (kind IN ('read', 'modified')),
    PRIMARY KEY (observation_id, path, kind)
);

CREATE TABLE IF NOT EXISTS vec_observations (
    id INTEGER PRIMARY KEY REFERENCES observations(id) ON DELETE CASCADE,
    embedding BLOB NOT NULL
);

CREATE TABLE IF NOT EXISTS pending_events (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    session_id TEXT NOT NULL,
    project TEXT NOT NULL,
    tool_name TEXT NOT NULL,
    merged_data TEXT NOT NULL,
    timestamp INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_pending_events_session ON pending_events(session_id);

CREATE TABLE IF NOT EXISTS indexed_files (
    archive_path TEXT PRIMARY KEY,
    project TEXT NOT NULL,
    indexed_at INTEGER NOT NULL,
    exchange_count INTEGER NOT NULL,
    excluded INTEGER NOT NULL DEFAULT 0
);
)SQL";

// ═══════════════════════════════════════════════════════════════════
// Row mapping
// ═══════════════════════════════════════════════════════════════════

const char* EXCHANGE_SELECT =
    "SELECT e.id, e.project, e.timestamp, e.user_message, e.assistant_message, "
    "e.archive_path, e.line_start, e.line_end, e.session_id, e.cwd, e.git_branch, "
    "e.assistant_version, e.parent_uuid, e.is_sidechain, e.compressed_tool_summary, "
    "v.embedding FROM exchanges e LEFT JOIN vec_exchanges v ON v.id = e.id";

const char* OBSERVATION_SELECT =
    "SELECT o.id, o.project, o.session_id, o.timestamp, o.type, o.title, o.subtitle, "
    "o.narrative, o.facts, o.concepts, o.files_read, o.files_modified, v.embedding "
    "FROM observations o LEFT JOIN vec_observations v ON v.id = o.id";

const char* TOOL_CALL_SELECT =
    "SELECT id, exchange_id, tool_name, tool_input, tool_result, is_error, timestamp "
    "FROM tool_calls";

Exchange read_exchange(const Statement& s) {
    Exchange ex;
    ex.id = s.text_at(0);
    ex.project = s.text_at(1);
    ex.timestamp = s.int_at(2);
    ex.user_message = s.text_at(3);
    ex.assistant_message = s.text_at(4);
    ex.archive_path = s.text_at(5);
    ex.line_start = static_cast<int>(s.int_at(6));
    ex.line_end = static_cast<int>(s.int_at(7));
    ex.session_id = s.text_at(8);
    ex.cwd = s.text_at(9);
    ex.git_branch = s.text_at(10);
    ex.assistant_version = s.text_at(11);
    ex.parent_uuid = s.text_at(12);
    ex.is_sidechain = s.int_at(13) != 0;
    if (!s.is_null(14)) ex.compressed_tool_summary = s.text_at(14);
    ex.embedding = s.vector_at(15);
    return ex;
}

Observation read_observation(const Statement& s) {
    Observation obs;
    obs.id = s.int_at(0);
    obs.project = s.text_at(1);
    obs.session_id = s.text_at(2);
    obs.timestamp = s.int_at(3);
    obs.type = s.text_at(4);
    obs.title = s.text_at(5);
    obs.subtitle = s.text_at(6);
    obs.narrative = s.text_at(7);
    obs.facts = string_list(s.text_at(8));
    obs.concepts = string_list(s.text_at(9));
    obs.files_read = string_list(s.text_at(10));
    obs.files_modified = string_list(s.text_at(11));
    obs.embedding = s.vector_at(12);
    return obs;
}

ToolCall read_tool_call(const Statement& s) {
    ToolCall call;
    call.id = s.text_at(0);
    call.exchange_id = s.text_at(1);
    call.tool_name = s.text_at(2);
    call.tool_input = s.text_at(3);
    call.tool_result = s.text_at(4);
    call.is_error = s.int_at(5) != 0;
    call.timestamp = s.int_at(6);
    return call;
}

// ═══════════════════════════════════════════════════════════════════
// Filters
// ═══════════════════════════════════════════════════════════════════

void add_time_and_project(Where& where, const RecordFilter& filter, const char* alias) {
    const std::string a = alias;
    if (filter.after) {
        where.add(a + ".timestamp >= ?");
        where.params.emplace_back(*filter.after);
    }
    if (filter.before) {
        where.add(a + ".timestamp <= ?");
        where.params.emplace_back(*filter.before);
    }
    if (!filter.projects.empty()) {
        where.add(a + ".project IN " + placeholders(filter.projects.size()));
        for (const auto& p : filter.projects) where.params.emplace_back(p);
    }
}

Where exchange_where(const RecordFilter& filter) {
    Where where;
    add_time_and_project(where, filter, "e");
    if (!filter.files.empty()) {
        std::string any;
        for (const auto& file : filter.files) {
            if (!any.empty()) any += " OR ";
            any += "e.user_message LIKE ? ESCAPE '\\' OR e.assistant_message LIKE ? ESCAPE '\\' "
                   "OR EXISTS (SELECT 1 FROM tool_calls t WHERE t.exchange_id = e.id "
                   "AND t.tool_input LIKE ? ESCAPE '\\')";
            std::string pattern = like_pattern(file);
            for (int i = 0; i < 3; ++i) where.params.emplace_back(pattern);
        }
        where.add("(" + any + ")");
    }
    return where;
}

Where observation_where(const RecordFilter& filter) {
    Where where;
    add_time_and_project(where, filter, "o");
    if (!filter.types.empty()) {
        where.add("o.type IN " + placeholders(filter.types.size()));
        for (const auto& t : filter.types) where.params.emplace_back(t);
    }
    if (!filter.concepts.empty()) {
        where.add("EXISTS (SELECT 1 FROM observation_concepts c WHERE c.observation_id = o.id "
                  "AND c.concept IN " + placeholders(filter.concepts.size()) + ")");
        for (const auto& c : filter.concepts) where.params.emplace_back(c);
    }
    if (!filter.files.empty()) {
        std::string any;
        for (const auto& file : filter.files) {
            if (!any.empty()) any += " OR ";
            any += "o.narrative LIKE ? ESCAPE '\\' OR EXISTS (SELECT 1 FROM observation_files f "
                   "WHERE f.observation_id = o.id AND f.path LIKE ? ESCAPE '\\')";
            std::string pattern = like_pattern(file);
            where.params.emplace_back(pattern);
            where.params.emplace_back(pattern);
        }
        where.add("(" + any + ")");
    }
    return where;
}

template<typename T>
void rank(std::vector<Scored<T>>& scored, size_t limit) {
    std::sort(scored.begin(), scored.end(), [](const Scored<T>& a, const Scored<T>& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.item.timestamp != b.item.timestamp) return a.item.timestamp > b.item.timestamp;
        return a.item.id < b.item.id;
    });
    if (limit > 0 && scored.size() > limit) scored.resize(limit);
}

} // namespace

// ═══════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════

Storage::Storage(const std::string& db_path) : path_(db_path) {
    fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) throw StorageError("cannot create " + parent.string() + ": " + ec.message());
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("cannot open " + path_ + ": " + message);
    }

    try {
        sqlite3_busy_timeout(db_, 5000);
        exec(db_, "PRAGMA journal_mode=WAL");
        exec(db_, "PRAGMA synchronous=NORMAL");
        exec(db_, "PRAGMA foreign_keys=ON");
        create_schema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

Storage::~Storage() {
    if (db_) sqlite3_close(db_);
}

void Storage::create_schema() {
    int64_t version = 0;
    {
        Statement s(db_, "PRAGMA user_version");
        if (s.step()) version = s.int_at(0);
    }
    if (version > MEMMEM_SCHEMA_VERSION) {
        throw StorageError("database schema " + std::to_string(version) +
                           " is newer than supported " + std::to_string(MEMMEM_SCHEMA_VERSION));
    }

    exec(db_, SCHEMA_SQL);
    if (version != MEMMEM_SCHEMA_VERSION) {
        std::string pragma = "PRAGMA user_version=" + std::to_string(MEMMEM_SCHEMA_VERSION);
        exec(db_, pragma.c_str());
    }
}

// ═══════════════════════════════════════════════════════════════════
// Exchanges
// ═══════════════════════════════════════════════════════════════════

void Storage::erase_exchange(const std::string& id) {
    for (const char* sql : {"DELETE FROM vec_exchanges WHERE id = ?",
                            "DELETE FROM tool_calls WHERE exchange_id = ?",
                            "DELETE FROM exchanges WHERE id = ?"}) {
        Statement s(db_, sql);
        s.bind(1, id);
        s.step();
    }
}

void Storage::write_exchange(const Exchange& ex) {
    if (ex.id.empty()) throw ValidationError("exchange without id");
    if (ex.line_start > ex.line_end) {
        throw ValidationError("exchange " + ex.id + " has line_start > line_end");
    }
    check_embedding(ex.embedding, "exchange " + ex.id);

    erase_exchange(ex.id);

    Statement row(db_,
        "INSERT INTO exchanges (id, project, timestamp, user_message, assistant_message, "
        "archive_path, line_start, line_end, session_id, cwd, git_branch, assistant_version, "
        "parent_uuid, is_sidechain, compressed_tool_summary) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    row.bind(1, ex.id);
    row.bind(2, ex.project);
    row.bind(3, ex.timestamp);
    row.bind(4, ex.user_message);
    row.bind(5, ex.assistant_message);
    row.bind(6, ex.archive_path);
    row.bind(7, static_cast<int64_t>(ex.line_start));
    row.bind(8, static_cast<int64_t>(ex.line_end));
    row.bind(9, ex.session_id);
    row.bind(10, ex.cwd);
    row.bind(11, ex.git_branch);
    row.bind(12, ex.assistant_version);
    row.bind(13, ex.parent_uuid);
    row.bind(14, static_cast<int64_t>(ex.is_sidechain ? 1 : 0));
    row.bind(15, ex.compressed_tool_summary);
    row.step();

    if (!ex.tool_calls.empty()) {
        Statement call(db_,
            "INSERT INTO tool_calls (id, exchange_id, tool_name, tool_input, tool_result, "
            "is_error, timestamp) VALUES (?, ?, ?, ?, ?, ?, ?)");
        for (const auto& tc : ex.tool_calls) {
            call.reset();
            call.bind(1, tc.id);
            call.bind(2, ex.id);
            call.bind(3, tc.tool_name);
            call.bind(4, tc.tool_input);
            call.bind(5, tc.tool_result);
            call.bind(6, static_cast<int64_t>(tc.is_error ? 1 : 0));
            call.bind(7, tc.timestamp);
            call.step();
        }
    }

    if (ex.embedding) {
        Statement vec(db_, "INSERT INTO vec_exchanges (id, embedding) VALUES (?, ?)");
        vec.bind(1, ex.id);
        vec.bind(2, normalized(*ex.embedding));
        vec.step();
    }
}

void Storage::load_tool_calls(Exchange& ex) const {
    Statement s(db_, std::string(TOOL_CALL_SELECT) + " WHERE exchange_id = ? ORDER BY seq");
    s.bind(1, ex.id);
    ex.tool_calls.clear();
    while (s.step()) ex.tool_calls.push_back(read_tool_call(s));
}

void Storage::insert_exchange(const Exchange& ex) {
    std::unique_lock lock(mutex_);
    Transaction tx(db_);
    write_exchange(ex);
    tx.commit();
}

bool Storage::delete_exchange(const std::string& id) {
    std::unique_lock lock(mutex_);
    Transaction tx(db_);
    erase_exchange(id);
    bool removed = sqlite3_changes(db_) > 0;
    tx.commit();
    return removed;
}

bool Storage::has_exchange(const std::string& id) const {
    std::shared_lock lock(mutex_);
    Statement s(db_, "SELECT 1 FROM exchanges WHERE id = ?");
    s.bind(1, id);
    return s.step();
}

std::optional<Exchange> Storage::get_exchange(const std::string& id) const {
    std::shared_lock lock(mutex_);
    Statement s(db_, std::string(EXCHANGE_SELECT) + " WHERE e.id = ?");
    s.bind(1, id);
    if (!s.step()) return std::nullopt;
    Exchange ex = read_exchange(s);
    load_tool_calls(ex);
    return ex;
}

std::optional<Vector> Storage::exchange_embedding(const std::string& id) const {
    std::shared_lock lock(mutex_);
    Statement s(db_, "SELECT embedding FROM vec_exchanges WHERE id = ?");
    s.bind(1, id);
    if (!s.step()) return std::nullopt;
    return s.vector_at(0);
}

void Storage::replace_archive(const IndexedFile& record, const std::vector<Exchange>& exchanges) {
    for (const auto& ex : exchanges) check_embedding(ex.embedding, "exchange " + ex.id);

    std::unique_lock lock(mutex_);
    Transaction tx(db_);

    std::vector<std::string> stale;
    {
        Statement s(db_, "SELECT id FROM exchanges WHERE archive_path = ?");
        s.bind(1, record.archive_path);
        while (s.step()) stale.push_back(s.text_at(0));
    }
    for (const auto& id : stale) erase_exchange(id);

    for (const auto& ex : exchanges) write_exchange(ex);

    Statement file(db_,
        "INSERT OR REPLACE INTO indexed_files (archive_path, project, indexed_at, "
        "exchange_count, excluded) VALUES (?, ?, ?, ?, ?)");
    file.bind(1, record.archive_path);
    file.bind(2, record.project);
    file.bind(3, record.indexed_at);
    file.bind(4, static_cast<int64_t>(record.exchange_count));
    file.bind(5, static_cast<int64_t>(record.excluded ? 1 : 0));
    file.step();

    tx.commit();
}

size_t Storage::delete_archive(const std::string& archive_path) {
    std::unique_lock lock(mutex_);
    Transaction tx(db_);

    std::vector<std::string> ids;
    {
        Statement s(db_, "SELECT id FROM exchanges WHERE archive_path = ?");
        s.bind(1, archive_path);
        while (s.step()) ids.push_back(s.text_at(0));
    }
    for (const auto& id : ids) erase_exchange(id);

    Statement file(db_, "DELETE FROM indexed_files WHERE archive_path = ?");
    file.bind(1, archive_path);
    file.step();

    tx.commit();
    return ids.size();
}

std::vector<Exchange> Storage::exchanges_by_session(const std::string& session_id) const {
    std::shared_lock lock(mutex_);
    Statement s(db_, std::string(EXCHANGE_SELECT) +
                     " WHERE e.session_id = ? ORDER BY e.timestamp ASC, e.line_start ASC");
    s.bind(1, session_id);
    std::vector<Exchange> out;
    while (s.step()) out.push_back(read_exchange(s));
    for (auto& ex : out) load_tool_calls(ex);
    return out;
}

std::vector<Exchange> Storage::exchanges_by_project(const std::string& project, size_t limit) const {
    std::shared_lock lock(mutex_);
    Statement s(db_, std::string(EXCHANGE_SELECT) +
                     " WHERE e.project = ? ORDER BY e.timestamp DESC, e.id LIMIT ?");
    s.bind(1, project);
    s.bind(2, sql_limit(limit));
    std::vector<Exchange> out;
    while (s.step()) out.push_back(read_exchange(s));
    return out;
}

std::vector<Exchange> Storage::exchanges_by_sidechain(bool is_sidechain, size_t limit) const {
    std::shared_lock lock(mutex_);
    Statement s(db_, std::string(EXCHANGE_SELECT) +
                     " WHERE e.is_sidechain = ? ORDER BY e.timestamp DESC, e.id LIMIT ?");
    s.bind(1, static_cast<int64_t>(is_sidechain ? 1 : 0));
    s.bind(2, sql_limit(limit));
    std::vector<Exchange> out;
    while (s.step()) out.push_back(read_exchange(s));
    return out;
}

std::vector<Exchange> Storage::exchanges_for_archive(const std::string& archive_path) const {
    std::shared_lock lock(mutex_);
    Statement s(db_, std::string(EXCHANGE_SELECT) +
                     " WHERE e.archive_path = ? ORDER BY e.line_start ASC");
    s.bind(1, archive_path);
    std::vector<Exchange> out;
    while (s.step()) out.push_back(read_exchange(s));
    for (auto& ex : out) load_tool_calls(ex);
    return out;
}

std::vector<Exchange> Storage::recent_exchanges(size_t limit) const {
    std::shared_lock lock(mutex_);
    Statement s(db_, std::string(EXCHANGE_SELECT) + " ORDER BY e.timestamp DESC, e.id LIMIT ?");
    s.bind(1, sql_limit(limit));
    std::vector<Exchange> out;
    while (s.step()) out.push_back(read_exchange(s));
    return out;
}

std::vector<ToolCall> Storage::tool_calls_by_name(const std::string& tool_name, size_t limit) const {
    std::shared_lock lock(mutex_);
    Statement s(db_, std::string(TOOL_CALL_SELECT) +
                     " WHERE tool_name = ? ORDER BY timestamp DESC, seq DESC LIMIT ?");
    s.bind(1, tool_name);
    s.bind(2, sql_limit(limit));
    std::vector<ToolCall> out;
    while (s.step()) out.push_back(read_tool_call(s));
    return out;
}

std::vector<std::string> Storage::exchange_archive_paths() const {
    std::shared_lock lock(mutex_);
    Statement s(db_, "SELECT DISTINCT archive_path FROM exchanges ORDER BY archive_path");
    std::vector<std::string> out;
    while (s.step()) out.push_back(s.text_at(0));
    return out;
}

// ═══════════════════════════════════════════════════════════════════
// Observations and pending events
// ═══════════════════════════════════════════════════════════════════

int64_t Storage::write_observation(const Observation& obs) {
    if (obs.title.empty()) throw ValidationError("observation without title");
    check_embedding(obs.embedding, "observation '" + obs.title + "'");

    Statement row(db_,
        "INSERT INTO observations (project, session_id, timestamp, type, title, subtitle, "
        "narrative, facts, concepts, files_read, files_modified) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    row.bind(1, obs.project);
    row.bind(2, obs.session_id);
    row.bind(3, obs.timestamp);
    row.bind(4, obs.type);
    row.bind(5, obs.title);
    row.bind(6, obs.subtitle);
    row.bind(7, obs.narrative);
    row.bind(8, json(obs.facts).dump());
    row.bind(9, json(obs.concepts).dump());
    row.bind(10, json(obs.files_read).dump());
    row.bind(11, json(obs.files_modified).dump());
    row.step();
    int64_t id = sqlite3_last_insert_rowid(db_);

    if (!obs.concepts.empty()) {
        Statement s(db_, "INSERT OR IGNORE INTO observation_concepts (observation_id, concept) "
                         "VALUES (?, ?)");
        for (const auto& concept_name : obs.concepts) {
            s.reset();
            s.bind(1, id);
            s.bind(2, concept_name);
            s.step();
        }
    }

    if (!obs.files_read.empty() || !obs.files_modified.empty()) {
        Statement s(db_, "INSERT OR IGNORE INTO observation_files (observation_id, path, kind) "
                         "VALUES (?, ?, ?)");
        auto add = [&](const std::vector<std::string>& paths, const std::string& kind) {
            for (const auto& path : paths) {
                s.reset();
                s.bind(1, id);
                s.bind(2, path);
                s.bind(3, kind);
                s.step();
            }
        };
        add(obs.files_read, "read");
        add(obs.files_modified, "modified");
    }

    if (obs.embedding) {
        Statement vec(db_, "INSERT INTO vec_observations (id, embedding) VALUES (?, ?)");
        vec.bind(1, id);
        vec.bind(2, normalized(*obs.embedding));
        vec.step();
    }
    return id;
}

int64_t Storage::insert_observation(const Observation& obs) {
    std::unique_lock lock(mutex_);
    Transaction tx(db_);
    int64_t id = write_observation(obs);
    tx.commit();
    return id;
}

std::optional<Observation> Storage::get_observation(int64_t id) const {
    std::shared_lock lock(mutex_);
    Statement s(db_, std::string(OBSERVATION_SELECT) + " WHERE o.id = ?");
    s.bind(1, id);
    if (!s.step()) return std::nullopt;
    return read_observation(s);
}

std::vector<Observation> Storage::recent_observations(Timestamp since, const std::string& project,
                                                      size_t limit) const {
    std::shared_lock lock(mutex_);
    std::string sql = std::string(OBSERVATION_SELECT) + " WHERE o.timestamp >= ?";
    if (!project.empty()) sql += " AND o.project = ?";
    sql += " ORDER BY o.timestamp DESC, o.id DESC LIMIT ?";

    Statement s(db_, sql);
    int idx = 1;
    s.bind(idx++, since);
    if (!project.empty()) s.bind(idx++, project);
    s.bind(idx, sql_limit(limit));

    std::vector<Observation> out;
    while (s.step()) out.push_back(read_observation(s));
    return out;
}

std::vector<Observation> Storage::observations_by_session(const std::string& session_id) const {
    std::shared_lock lock(mutex_);
    Statement s(db_, std::string(OBSERVATION_SELECT) +
                     " WHERE o.session_id = ? ORDER BY o.timestamp ASC, o.id ASC");
    s.bind(1, session_id);
    std::vector<Observation> out;
    while (s.step()) out.push_back(read_observation(s));
    return out;
}

int64_t Storage::insert_pending_event(const PendingEvent& event) {
    std::unique_lock lock(mutex_);
    Statement s(db_, "INSERT INTO pending_events (session_id, project, tool_name, merged_data, "
                     "timestamp) VALUES (?, ?, ?, ?, ?)");
    s.bind(1, event.session_id);
    s.bind(2, event.project);
    s.bind(3, event.tool_name);
    s.bind(4, event.merged_data);
    s.bind(5, event.timestamp);
    s.step();
    return sqlite3_last_insert_rowid(db_);
}

std::vector<PendingEvent> Storage::pending_events(const std::string& session_id) const {
    std::shared_lock lock(mutex_);
    Statement s(db_, "SELECT id, session_id, project, tool_name, merged_data, timestamp "
                     "FROM pending_events WHERE session_id = ? ORDER BY timestamp ASC, id ASC");
    s.bind(1, session_id);
    std::vector<PendingEvent> out;
    while (s.step()) {
        PendingEvent ev;
        ev.id = s.int_at(0);
        ev.session_id = s.text_at(1);
        ev.project = s.text_at(2);
        ev.tool_name = s.text_at(3);
        ev.merged_data = s.text_at(4);
        ev.timestamp = s.int_at(5);
        out.push_back(std::move(ev));
    }
    return out;
}

size_t Storage::delete_pending_events(const std::vector<int64_t>& ids) {
    if (ids.empty()) return 0;
    std::unique_lock lock(mutex_);
    Transaction tx(db_);
    size_t removed = 0;
    Statement s(db_, "DELETE FROM pending_events WHERE id = ?");
    for (int64_t id : ids) {
        s.reset();
        s.bind(1, id);
        s.step();
        removed += static_cast<size_t>(sqlite3_changes(db_));
    }
    tx.commit();
    return removed;
}

size_t Storage::pending_event_count(const std::string& session_id) const {
    std::shared_lock lock(mutex_);
    if (session_id.empty()) {
        Statement s(db_, "SELECT COUNT(*) FROM pending_events");
        return s.step() ? static_cast<size_t>(s.int_at(0)) : 0;
    }
    Statement s(db_, "SELECT COUNT(*) FROM pending_events WHERE session_id = ?");
    s.bind(1, session_id);
    return s.step() ? static_cast<size_t>(s.int_at(0)) : 0;
}

std::vector<int64_t> Storage::commit_extraction(const std::vector<Observation>& observations,
                                                const std::vector<int64_t>& consumed_events) {
    std::unique_lock lock(mutex_);
    Transaction tx(db_);

    std::vector<int64_t> ids;
    ids.reserve(observations.size());
    for (const auto& obs : observations) ids.push_back(write_observation(obs));

    Statement s(db_, "DELETE FROM pending_events WHERE id = ?");
    for (int64_t id : consumed_events) {
        s.reset();
        s.bind(1, id);
        s.step();
    }

    tx.commit();
    return ids;
}

// ═══════════════════════════════════════════════════════════════════
// Retrieval
// ═══════════════════════════════════════════════════════════════════

std::vector<Exchange> Storage::embedded_exchanges(const RecordFilter& filter) const {
    if (filter.observations_only()) return {};

    std::shared_lock lock(mutex_);
    Where where = exchange_where(filter);
    where.add("v.embedding IS NOT NULL");
    Statement s(db_, std::string(EXCHANGE_SELECT) + where.sql());
    s.bind_all(where.params);

    std::vector<Exchange> out;
    while (s.step()) out.push_back(read_exchange(s));
    return out;
}

std::vector<Observation> Storage::embedded_observations(const RecordFilter& filter) const {
    std::shared_lock lock(mutex_);
    Where where = observation_where(filter);
    where.add("v.embedding IS NOT NULL");
    Statement s(db_, std::string(OBSERVATION_SELECT) + where.sql());
    s.bind_all(where.params);

    std::vector<Observation> out;
    while (s.step()) out.push_back(read_observation(s));
    return out;
}

std::vector<Scored<Exchange>> Storage::nearest_exchanges(const Vector& query, size_t limit,
                                                         const RecordFilter& filter) const {
    std::vector<Scored<Exchange>> scored;
    for (auto& ex : embedded_exchanges(filter)) {
        float similarity = ex.embedding->cosine(query);
        scored.push_back({std::move(ex), similarity});
    }
    rank(scored, limit);
    return scored;
}

std::vector<Scored<Observation>> Storage::nearest_observations(const Vector& query, size_t limit,
                                                               const RecordFilter& filter) const {
    std::vector<Scored<Observation>> scored;
    for (auto& obs : embedded_observations(filter)) {
        float similarity = obs.embedding->cosine(query);
        scored.push_back({std::move(obs), similarity});
    }
    rank(scored, limit);
    return scored;
}

std::vector<Exchange> Storage::text_match_exchanges(const std::string& needle, size_t limit,
                                                    const RecordFilter& filter) const {
    if (filter.observations_only() || needle.empty()) return {};

    std::shared_lock lock(mutex_);
    Where where = exchange_where(filter);
    where.add("(e.user_message LIKE ? ESCAPE '\\' OR e.assistant_message LIKE ? ESCAPE '\\')");
    std::string pattern = like_pattern(needle);
    where.params.emplace_back(pattern);
    where.params.emplace_back(pattern);

    Statement s(db_, std::string(EXCHANGE_SELECT) + where.sql() +
                     " ORDER BY e.timestamp DESC, e.id LIMIT ?");
    s.bind_all(where.params);
    s.bind(static_cast<int>(where.params.size()) + 1, sql_limit(limit));

    std::vector<Exchange> out;
    while (s.step()) out.push_back(read_exchange(s));
    return out;
}

std::vector<Observation> Storage::text_match_observations(const std::string& needle, size_t limit,
                                                          const RecordFilter& filter) const {
    if (needle.empty()) return {};

    std::shared_lock lock(mutex_);
    Where where = observation_where(filter);
    where.add("(o.title LIKE ? ESCAPE '\\' OR o.subtitle LIKE ? ESCAPE '\\' "
              "OR o.narrative LIKE ? ESCAPE '\\' OR o.facts LIKE ? ESCAPE '\\')");
    std::string pattern = like_pattern(needle);
    for (int i = 0; i < 4; ++i) where.params.emplace_back(pattern);

    Statement s(db_, std::string(OBSERVATION_SELECT) + where.sql() +
                     " ORDER BY o.timestamp DESC, o.id DESC LIMIT ?");
    s.bind_all(where.params);
    s.bind(static_cast<int>(where.params.size()) + 1, sql_limit(limit));

    std::vector<Observation> out;
    while (s.step()) out.push_back(read_observation(s));
    return out;
}

// ═══════════════════════════════════════════════════════════════════
// Bookkeeping
// ═══════════════════════════════════════════════════════════════════

namespace {

IndexedFile read_indexed_file(const Statement& s) {
    IndexedFile f;
    f.archive_path = s.text_at(0);
    f.project = s.text_at(1);
    f.indexed_at = s.int_at(2);
    f.exchange_count = static_cast<int>(s.int_at(3));
    f.excluded = s.int_at(4) != 0;
    return f;
}

size_t count_rows(sqlite3* db, const char* sql) {
    Statement s(db, sql);
    return s.step() ? static_cast<size_t>(s.int_at(0)) : 0;
}

} // namespace

std::optional<IndexedFile> Storage::indexed_file(const std::string& archive_path) const {
    std::shared_lock lock(mutex_);
    Statement s(db_, "SELECT archive_path, project, indexed_at, exchange_count, excluded "
                     "FROM indexed_files WHERE archive_path = ?");
    s.bind(1, archive_path);
    if (!s.step()) return std::nullopt;
    return read_indexed_file(s);
}

std::vector<IndexedFile> Storage::indexed_files() const {
    std::shared_lock lock(mutex_);
    Statement s(db_, "SELECT archive_path, project, indexed_at, exchange_count, excluded "
                     "FROM indexed_files ORDER BY archive_path");
    std::vector<IndexedFile> out;
    while (s.step()) out.push_back(read_indexed_file(s));
    return out;
}

IndexStats Storage::stats() const {
    std::shared_lock lock(mutex_);
    IndexStats stats;
    stats.exchanges = count_rows(db_, "SELECT COUNT(*) FROM exchanges");
    stats.embedded_exchanges = count_rows(db_, "SELECT COUNT(*) FROM vec_exchanges");
    stats.tool_calls = count_rows(db_, "SELECT COUNT(*) FROM tool_calls");
    stats.observations = count_rows(db_, "SELECT COUNT(*) FROM observations");
    stats.pending_events = count_rows(db_, "SELECT COUNT(*) FROM pending_events");
    stats.indexed_files = count_rows(db_, "SELECT COUNT(*) FROM indexed_files");

    {
        Statement s(db_, "SELECT MIN(timestamp), MAX(timestamp) FROM exchanges");
        if (s.step() && !s.is_null(0)) {
            stats.earliest = s.int_at(0);
            stats.latest = s.int_at(1);
        }
    }
    {
        Statement s(db_, "SELECT project, COUNT(*) FROM exchanges GROUP BY project");
        while (s.step()) {
            stats.exchanges_per_project[s.text_at(0)] = static_cast<size_t>(s.int_at(1));
        }
    }
    return stats;
}

void Storage::clear_index() {
    std::unique_lock lock(mutex_);
    Transaction tx(db_);
    exec(db_, "DELETE FROM vec_exchanges");
    exec(db_, "DELETE FROM tool_calls");
    exec(db_, "DELETE FROM exchanges");
    exec(db_, "DELETE FROM indexed_files");
    tx.commit();
    std::cerr << "[storage] Cleared exchange index\n";
}

} // namespace mm
