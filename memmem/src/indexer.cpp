#include <memmem/indexer.hpp>
#include <sys/stat.h>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <iostream>
#include <thread>

namespace mm {

namespace fs = std::filesystem;

std::optional<Timestamp> file_mtime_ms(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) return std::nullopt;
    return static_cast<Timestamp>(st.st_mtim.tv_sec) * 1000 + st.st_mtim.tv_nsec / 1000000;
}

bool is_conversation_file(const std::string& filename) {
    const std::string ext = ".jsonl";
    if (filename.size() <= ext.size()) return false;
    if (filename.compare(filename.size() - ext.size(), ext.size(), ext) != 0) return false;
    // Subagent transcripts duplicate their parent's content
    return filename.rfind("agent-", 0) != 0;
}

namespace {

void check_concurrency(int concurrency) {
    if (concurrency < MIN_CONCURRENCY || concurrency > MAX_CONCURRENCY) {
        throw ValidationError("concurrency must be between " + std::to_string(MIN_CONCURRENCY) +
                              " and " + std::to_string(MAX_CONCURRENCY) + ", got " +
                              std::to_string(concurrency));
    }
}

std::vector<fs::path> sorted_entries(const fs::path& dir) {
    std::vector<fs::path> out;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) out.push_back(entry.path());
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

Indexer::Indexer(Storage& storage, std::shared_ptr<Embedder> embedder, const Config& config)
    : storage_(storage), embedder_(std::move(embedder)), config_(config) {}

// ═══════════════════════════════════════════════════════════════════
// Entry points
// ═══════════════════════════════════════════════════════════════════

SyncResult Indexer::sync(const std::string& source_dir, const std::string& dest_dir,
                         const SyncOptions& options) {
    check_concurrency(options.concurrency);

    if (!fs::is_directory(source_dir)) {
        SyncResult result;
        result.errors.push_back({source_dir, "source directory not found"});
        return result;
    }

    auto tasks = scan(source_dir, dest_dir);
    if (!tasks.empty()) {
        std::cerr << "[indexer] Syncing " << tasks.size() << " conversations from "
                  << source_dir << " (concurrency " << options.concurrency << ")\n";
    }
    return run(tasks, options, false);
}

SyncResult Indexer::rebuild(const std::string& archive_dir, const SyncOptions& options) {
    check_concurrency(options.concurrency);

    storage_.clear_index();
    if (!fs::is_directory(archive_dir)) return {};

    SyncOptions rebuild_options = options;
    rebuild_options.skip_index = false;

    auto tasks = scan(archive_dir, "");
    std::cerr << "[indexer] Rebuilding index from " << tasks.size() << " archived conversations\n";
    return run(tasks, rebuild_options, true);
}

size_t Indexer::index_archive_file(const std::string& archive_path, const std::string& project,
                                   bool embed) {
    Stored stored = store(archive_path, project, embed);
    return stored.exchanges;
}

// ═══════════════════════════════════════════════════════════════════
// Internals
// ═══════════════════════════════════════════════════════════════════

std::vector<Indexer::FileTask> Indexer::scan(const std::string& root,
                                             const std::string& dest_dir) const {
    std::vector<FileTask> tasks;
    for (const auto& project_dir : sorted_entries(root)) {
        std::error_code ec;
        if (!fs::is_directory(project_dir, ec)) continue;

        const std::string project = project_dir.filename().string();
        if (config_.is_excluded(project)) {
            std::cerr << "[indexer] Skipping excluded project " << project << "\n";
            continue;
        }

        for (const auto& file : sorted_entries(project_dir)) {
            if (!fs::is_regular_file(file, ec)) continue;
            const std::string name = file.filename().string();
            if (!is_conversation_file(name)) continue;

            FileTask task;
            task.project = project;
            if (dest_dir.empty()) {
                task.archive = file.string();
            } else {
                task.source = file.string();
                task.archive = (fs::path(dest_dir) / project / name).string();
            }
            tasks.push_back(std::move(task));
        }
    }
    return tasks;
}

SyncResult Indexer::run(const std::vector<FileTask>& tasks, const SyncOptions& options,
                        bool force_index) {
    std::vector<FileOutcome> outcomes(tasks.size());
    std::atomic<size_t> next{0};

    auto work = [&]() {
        for (size_t i = next++; i < tasks.size(); i = next++) {
            outcomes[i] = process(tasks[i], options, force_index);
        }
    };

    size_t threads = std::min<size_t>(static_cast<size_t>(options.concurrency), tasks.size());
    if (threads <= 1) {
        work();
    } else {
        std::vector<std::thread> pool;
        for (size_t i = 0; i < threads; ++i) pool.emplace_back(work);
        for (auto& t : pool) t.join();
    }

    SyncResult result;
    for (auto& outcome : outcomes) {
        if (outcome.copied) ++result.copied;
        if (outcome.indexed) ++result.indexed;
        if (outcome.summarized) ++result.summarized;
        if (outcome.error) {
            result.errors.push_back(std::move(*outcome.error));
        } else if (!outcome.copied && !outcome.indexed) {
            ++result.skipped;
        }
    }

    if (!tasks.empty()) {
        std::cerr << "[indexer] Done: copied=" << result.copied << " indexed=" << result.indexed
                  << " summarized=" << result.summarized << " skipped=" << result.skipped
                  << " errors=" << result.errors.size() << "\n";
    }
    return result;
}

Indexer::FileOutcome Indexer::process(const FileTask& task, const SyncOptions& options,
                                      bool force_index) {
    FileOutcome outcome;
    const std::string& label = task.source.empty() ? task.archive : task.source;

    try {
        if (!task.source.empty()) {
            auto source_mtime = file_mtime_ms(task.source);
            auto archive_mtime = file_mtime_ms(task.archive);
            if (!archive_mtime || (source_mtime && *source_mtime > *archive_mtime)) {
                fs::create_directories(fs::path(task.archive).parent_path());
                fs::copy_file(task.source, task.archive, fs::copy_options::overwrite_existing);
                // Keep the source mtime so an unchanged source is not recopied
                fs::last_write_time(task.archive, fs::last_write_time(task.source));
                outcome.copied = true;
            }
        }

        if (options.skip_index) return outcome;

        bool needs_index = force_index || outcome.copied;
        if (!needs_index) {
            auto record = storage_.indexed_file(task.archive);
            auto mtime = file_mtime_ms(task.archive);
            needs_index = !record || (mtime && *mtime > record->indexed_at);
        }
        if (!needs_index) return outcome;

        Stored stored = store(task.archive, task.project, !options.skip_summaries);
        outcome.indexed = true;
        outcome.summarized = stored.summarized;

        if (!stored.parse_errors.empty()) {
            outcome.error = FileError{
                label, std::to_string(stored.parse_errors.size()) + " malformed record(s), first: " +
                       stored.parse_errors.front().what()};
        }
    } catch (const std::exception& e) {
        std::cerr << "[indexer] Failed " << label << ": " << e.what() << "\n";
        outcome.error = FileError{label, e.what()};
    }
    return outcome;
}

Indexer::Stored Indexer::store(const std::string& archive_path, const std::string& project,
                               bool embed) {
    ParsedConversation parsed = parse_conversation(archive_path, project, archive_path);

    Stored stored;
    stored.exchanges = parsed.exchanges.size();
    stored.parse_errors = std::move(parsed.errors);

    // Vectors already stored survive a re-index even under skip_summaries
    bool embed_new = embed && embedder_;
    bool any_vector = attach_embeddings(parsed.exchanges, embed_new);
    stored.summarized = embed_new && any_vector;

    IndexedFile record;
    record.archive_path = archive_path;
    record.project = project;
    record.indexed_at = now();
    record.exchange_count = static_cast<int>(parsed.exchanges.size());
    record.excluded = parsed.excluded;
    storage_.replace_archive(record, parsed.exchanges);

    if (parsed.excluded) {
        std::cerr << "[indexer] Excluded " << archive_path << " (marker found)\n";
    } else {
        std::cerr << "[indexer] Indexed " << fs::path(archive_path).filename().string() << ": "
                  << stored.exchanges << " exchanges\n";
    }
    return stored;
}

bool Indexer::attach_embeddings(std::vector<Exchange>& exchanges, bool embed_new) {
    bool any = false;
    for (auto& ex : exchanges) {
        if (auto existing = storage_.exchange_embedding(ex.id)) {
            ex.embedding = std::move(existing);
        } else if (embed_new) {
            ex.embedding = embedder_->embed(exchange_embedding_text(ex));
        }
        if (ex.embedding) any = true;
    }
    return any;
}

} // namespace mm
