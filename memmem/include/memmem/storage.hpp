#pragma once
// Storage: SQLite home for exchanges, observations and their vectors
//
// Tables
//   exchanges, tool_calls           raw turns (tool calls cascade)
//   observations                    distilled insights, append-only
//   observation_concepts/_files     lookup side tables
//   pending_events                  compressed tool events awaiting extraction
//   indexed_files                   per-archive bookkeeping
//   vec_exchanges, vec_observations id -> 768 float BLOB
//
// A vector row exists iff its owner row has an embedding: both are written
// and deleted in one transaction. Writers hold mutex_ exclusively, readers
// share it. Nearest-neighbour lookup is an exact cosine scan.

#include <memmem/errors.hpp>
#include <memmem/types.hpp>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

struct sqlite3;

namespace mm {

// Hard filters shared by search and the storage scans.
// Empty lists mean "no restriction".
struct RecordFilter {
    std::optional<Timestamp> after;     // Inclusive
    std::optional<Timestamp> before;    // Inclusive
    std::vector<std::string> projects;
    std::vector<std::string> files;
    std::vector<std::string> types;     // Observations only
    std::vector<std::string> concepts;  // Observations only

    // types/concepts can only be satisfied by observations
    bool observations_only() const { return !types.empty() || !concepts.empty(); }
};

template<typename T>
struct Scored {
    T item;
    float score = 0.0f;
};

class Storage {
public:
    // Opens (creating if needed) the database and its parent directory.
    // Throws StorageError.
    explicit Storage(const std::string& db_path);
    ~Storage();

    Storage(const Storage&) = delete;
    Storage& operator=(const Storage&) = delete;

    const std::string& path() const { return path_; }

    // ═══════════════════════════════════════════════════════════════════
    // Exchanges
    // ═══════════════════════════════════════════════════════════════════

    // Insert or overwrite one exchange with its tool calls and vector
    void insert_exchange(const Exchange& ex);
    bool delete_exchange(const std::string& id);
    bool has_exchange(const std::string& id) const;

    // With tool calls and embedding
    std::optional<Exchange> get_exchange(const std::string& id) const;

    // Stored vector only, for reuse when a file is re-indexed
    std::optional<Vector> exchange_embedding(const std::string& id) const;

    // Atomically swap everything indexed from one archive file
    void replace_archive(const IndexedFile& record, const std::vector<Exchange>& exchanges);

    // Drop an archive's exchanges and its indexed_files entry.
    // Returns exchanges removed.
    size_t delete_archive(const std::string& archive_path);

    std::vector<Exchange> exchanges_by_session(const std::string& session_id) const;
    std::vector<Exchange> exchanges_by_project(const std::string& project, size_t limit) const;
    std::vector<Exchange> exchanges_by_sidechain(bool is_sidechain, size_t limit) const;
    std::vector<Exchange> exchanges_for_archive(const std::string& archive_path) const;
    std::vector<Exchange> recent_exchanges(size_t limit) const;
    std::vector<ToolCall> tool_calls_by_name(const std::string& tool_name, size_t limit) const;

    // Distinct archive paths referenced by exchange rows
    std::vector<std::string> exchange_archive_paths() const;

    // ═══════════════════════════════════════════════════════════════════
    // Observations and pending events
    // ═══════════════════════════════════════════════════════════════════

    // Returns the new id
    int64_t insert_observation(const Observation& obs);
    std::optional<Observation> get_observation(int64_t id) const;

    // Newest first, timestamp >= since; empty project = all projects
    std::vector<Observation> recent_observations(Timestamp since, const std::string& project,
                                                 size_t limit) const;
    std::vector<Observation> observations_by_session(const std::string& session_id) const;

    int64_t insert_pending_event(const PendingEvent& event);

    // Oldest first
    std::vector<PendingEvent> pending_events(const std::string& session_id) const;
    size_t delete_pending_events(const std::vector<int64_t>& ids);
    size_t pending_event_count(const std::string& session_id = "") const;

    // One transaction: the observations appear and the events they were
    // distilled from disappear together. Returns the new ids.
    std::vector<int64_t> commit_extraction(const std::vector<Observation>& observations,
                                           const std::vector<int64_t>& consumed_events);

    // ═══════════════════════════════════════════════════════════════════
    // Retrieval
    // ═══════════════════════════════════════════════════════════════════

    // Every embedded exchange passing the filter, embedding populated
    std::vector<Exchange> embedded_exchanges(const RecordFilter& filter) const;
    std::vector<Observation> embedded_observations(const RecordFilter& filter) const;

    // Cosine descending, ties by timestamp descending
    std::vector<Scored<Exchange>> nearest_exchanges(const Vector& query, size_t limit,
                                                    const RecordFilter& filter) const;
    std::vector<Scored<Observation>> nearest_observations(const Vector& query, size_t limit,
                                                          const RecordFilter& filter) const;

    // Case-insensitive substring over message / narrative text, newest first
    std::vector<Exchange> text_match_exchanges(const std::string& needle, size_t limit,
                                               const RecordFilter& filter) const;
    std::vector<Observation> text_match_observations(const std::string& needle, size_t limit,
                                                     const RecordFilter& filter) const;

    // ═══════════════════════════════════════════════════════════════════
    // Bookkeeping
    // ═══════════════════════════════════════════════════════════════════

    std::optional<IndexedFile> indexed_file(const std::string& archive_path) const;
    std::vector<IndexedFile> indexed_files() const;

    IndexStats stats() const;

    // Drop every exchange, tool call, vector and indexed_files row.
    // Observations and pending events survive.
    void clear_index();

private:
    void create_schema();
    void write_exchange(const Exchange& ex);
    void erase_exchange(const std::string& id);
    int64_t write_observation(const Observation& obs);
    void load_tool_calls(Exchange& ex) const;

    std::string path_;
    sqlite3* db_ = nullptr;
    mutable std::shared_mutex mutex_;
};

} // namespace mm
