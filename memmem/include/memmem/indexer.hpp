#pragma once
// Indexer: keep the archive and the index in step with the transcripts
//
// sync() walks <source>/<project>/*.jsonl, copies new or changed files
// verbatim to <dest>/<project>/, then parses, embeds and stores them.
// One bad file never stops the run; it lands in SyncResult::errors.
//
// Up to `concurrency` files are processed at once (copy, parse, embed).
// Their writes still go through Storage one replace_archive() at a time.

#include <memmem/config.hpp>
#include <memmem/embedder.hpp>
#include <memmem/parser.hpp>
#include <memmem/storage.hpp>
#include <memory>
#include <string>
#include <vector>

namespace mm {

constexpr int MIN_CONCURRENCY = 1;
constexpr int MAX_CONCURRENCY = 16;

struct SyncOptions {
    bool skip_index = false;       // Copy only
    bool skip_summaries = false;   // Index without embeddings
    int concurrency = 1;           // 1..16
};

struct FileError {
    std::string file;
    std::string error;
};

struct SyncResult {
    size_t copied = 0;
    size_t skipped = 0;
    size_t indexed = 0;
    size_t summarized = 0;
    std::vector<FileError> errors;
};

// Modification time in Unix millis; nullopt if the file is missing
std::optional<Timestamp> file_mtime_ms(const std::string& path);

// Transcripts the indexer considers: *.jsonl, excluding agent-*.jsonl
bool is_conversation_file(const std::string& filename);

class Indexer {
public:
    // embedder may be null: exchanges are then stored without vectors
    Indexer(Storage& storage, std::shared_ptr<Embedder> embedder, const Config& config);

    // Throws ValidationError when concurrency is outside [1, 16]
    SyncResult sync(const std::string& source_dir, const std::string& dest_dir,
                    const SyncOptions& options = {});

    // Parse, embed and store one archived file, replacing whatever the
    // index held for it. Returns the number of exchanges stored.
    // Throws NotFoundError, ProviderError or StorageError.
    size_t index_archive_file(const std::string& archive_path, const std::string& project,
                              bool embed = true);

    // Clear the exchange index and re-index every archived file
    SyncResult rebuild(const std::string& archive_dir, const SyncOptions& options = {});

private:
    struct FileTask {
        std::string source;        // Empty when indexing an archive in place
        std::string archive;
        std::string project;
    };

    struct FileOutcome {
        bool copied = false;
        bool indexed = false;
        bool summarized = false;
        std::optional<FileError> error;
    };

    struct Stored {
        size_t exchanges = 0;
        bool summarized = false;
        std::vector<ParseError> parse_errors;
    };

    // dest_dir empty: tasks index files under root in place
    std::vector<FileTask> scan(const std::string& root, const std::string& dest_dir) const;
    SyncResult run(const std::vector<FileTask>& tasks, const SyncOptions& options, bool force_index);
    FileOutcome process(const FileTask& task, const SyncOptions& options, bool force_index);
    Stored store(const std::string& archive_path, const std::string& project, bool embed);

    // Reuses vectors already stored under the same id; embeds the rest
    // when embed_new. Returns true when any exchange ends up with a vector.
    bool attach_embeddings(std::vector<Exchange>& exchanges, bool embed_new);

    Storage& storage_;
    std::shared_ptr<Embedder> embedder_;
    const Config& config_;
};

} // namespace mm
