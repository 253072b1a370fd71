#pragma once
// Verifier: compare the archive on disk with what the index holds
//
//   missing    archived file with no index record
//   orphaned   index record whose archive file is gone
//   outdated   archive modified after it was indexed
//   corrupted  archive has records that do not parse
//
// verify() only reads. repair() re-indexes missing and outdated files,
// drops orphaned rows and leaves corrupted files alone for a human.

#include <memmem/config.hpp>
#include <memmem/indexer.hpp>
#include <memmem/storage.hpp>
#include <string>
#include <vector>

namespace mm {

// Reported data, not an exception
struct IntegrityIssue {
    std::string archive_path;
    std::string project;
    std::string detail;
};

struct VerifyReport {
    std::vector<IntegrityIssue> missing;
    std::vector<IntegrityIssue> orphaned;
    std::vector<IntegrityIssue> outdated;
    std::vector<IntegrityIssue> corrupted;

    bool clean() const {
        return missing.empty() && orphaned.empty() && outdated.empty() && corrupted.empty();
    }
    size_t total() const {
        return missing.size() + orphaned.size() + outdated.size() + corrupted.size();
    }
};

struct RepairResult {
    size_t reindexed = 0;
    size_t removed = 0;
    std::vector<FileError> errors;
};

class Verifier {
public:
    Verifier(Storage& storage, Indexer& indexer, const Config& config);

    VerifyReport verify() const;
    RepairResult repair(const VerifyReport& report);

private:
    Storage& storage_;
    Indexer& indexer_;
    const Config& config_;
};

} // namespace mm
