#include <memmem/verifier.hpp>
#include <memmem/parser.hpp>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <set>

namespace mm {

namespace fs = std::filesystem;

Verifier::Verifier(Storage& storage, Indexer& indexer, const Config& config)
    : storage_(storage), indexer_(indexer), config_(config) {}

VerifyReport Verifier::verify() const {
    VerifyReport report;
    std::set<std::string> on_disk;

    std::error_code ec;
    if (fs::is_directory(config_.archive_dir, ec)) {
        std::vector<fs::path> files;
        for (const auto& project_dir : fs::directory_iterator(config_.archive_dir, ec)) {
            if (!project_dir.is_directory(ec)) continue;
            if (config_.is_excluded(project_dir.path().filename().string())) continue;
            for (const auto& entry : fs::directory_iterator(project_dir.path(), ec)) {
                if (entry.is_regular_file(ec) &&
                    is_conversation_file(entry.path().filename().string())) {
                    files.push_back(entry.path());
                }
            }
        }
        std::sort(files.begin(), files.end());

        for (const auto& file : files) {
            const std::string path = file.string();
            const std::string project = file.parent_path().filename().string();
            on_disk.insert(path);

            auto record = storage_.indexed_file(path);
            if (!record) {
                report.missing.push_back({path, project, "not in index"});
            } else {
                auto mtime = file_mtime_ms(path);
                if (mtime && *mtime > record->indexed_at) {
                    report.outdated.push_back({path, project,
                        "modified " + format_iso8601(*mtime) + ", indexed " +
                        format_iso8601(record->indexed_at)});
                }
            }

            ExchangeStream stream(path, project, path);
            while (stream.next()) {}
            if (!stream.is_open()) {
                report.corrupted.push_back({path, project, "cannot open file"});
            } else if (!stream.errors().empty()) {
                report.corrupted.push_back({path, project,
                    std::to_string(stream.errors().size()) + " malformed record(s), first: " +
                    stream.errors().front().what()});
            }
        }
    }

    // Index rows whose archive file is gone
    std::set<std::string> reported;
    auto check_orphan = [&](const std::string& path, const std::string& project) {
        if (on_disk.count(path) || reported.count(path)) return;
        if (fs::exists(path, ec)) return;
        reported.insert(path);
        report.orphaned.push_back({path, project, "archive file no longer exists"});
    };
    for (const auto& record : storage_.indexed_files()) {
        check_orphan(record.archive_path, record.project);
    }
    for (const auto& path : storage_.exchange_archive_paths()) {
        check_orphan(path, project_from_path(path));
    }

    return report;
}

RepairResult Verifier::repair(const VerifyReport& report) {
    RepairResult result;

    auto reindex = [&](const IntegrityIssue& issue) {
        try {
            indexer_.index_archive_file(issue.archive_path, issue.project);
            ++result.reindexed;
        } catch (const std::exception& e) {
            std::cerr << "[verifier] Re-index failed for " << issue.archive_path << ": "
                      << e.what() << "\n";
            result.errors.push_back({issue.archive_path, e.what()});
        }
    };
    for (const auto& issue : report.missing) reindex(issue);
    for (const auto& issue : report.outdated) reindex(issue);

    for (const auto& issue : report.orphaned) {
        try {
            size_t rows = storage_.delete_archive(issue.archive_path);
            ++result.removed;
            std::cerr << "[verifier] Removed " << rows << " exchanges of " << issue.archive_path
                      << "\n";
        } catch (const std::exception& e) {
            result.errors.push_back({issue.archive_path, e.what()});
        }
    }

    if (!report.corrupted.empty()) {
        std::cerr << "[verifier] " << report.corrupted.size()
                  << " corrupted file(s) left for manual review\n";
    }
    return result;
}

} // namespace mm
