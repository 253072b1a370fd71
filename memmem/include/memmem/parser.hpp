#pragma once
// Parser: transcript JSONL -> Exchanges
//
// Each line is parsed at the boundary into a closed set of variants.
// Anything that does not fit raises ParseError for that line only; the
// rest of the file still parses.
//
// Grouping: a user record with prompt text opens an Exchange, assistant
// records append to it, user records carrying only tool results are folded
// in and paired with their tool_use by id.

#include <memmem/errors.hpp>
#include <memmem/types.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mm {

struct TextBlock {
    std::string text;
};

struct ToolUseBlock {
    std::string id;
    std::string name;
    nlohmann::json input;
};

struct ToolResultBlock {
    std::string tool_use_id;
    std::string content;
    bool is_error = false;
};

using ContentBlock = std::variant<TextBlock, ToolUseBlock, ToolResultBlock>;

// Fields shared by user and assistant records
struct RecordMeta {
    std::optional<Timestamp> timestamp;
    std::string session_id;
    std::string cwd;
    std::string git_branch;
    std::string version;
    std::string parent_uuid;
    bool is_sidechain = false;
};

struct UserMessage {
    RecordMeta meta;
    std::vector<ContentBlock> content;
};

struct AssistantMessage {
    RecordMeta meta;
    std::vector<ContentBlock> content;
};

// system, summary, file-history-snapshot, ... (discarded)
struct SystemMessage {
    std::string type;
};

using Record = std::variant<UserMessage, AssistantMessage, SystemMessage>;

// Parse one JSONL line. Throws ParseError.
Record parse_record(const std::string& line, int line_number = 0);

// Text blocks joined by '\n'
std::string text_of(const std::vector<ContentBlock>& content);

// Case-insensitive check for "DO NOT INDEX THIS CHAT" and friends
bool has_exclusion_marker(const std::string& text);

// 16 hex chars, FNV-1a 64
std::string exchange_id(const std::string& project, const std::string& file_stem,
                        int line_start, int line_end);

// "/x/projects/-home-me-app/abc.jsonl" -> "-home-me-app"
std::string project_from_path(const std::string& path);

// Lazy, finite, restartable sequence of Exchanges
class ExchangeStream {
public:
    // archive_path is recorded on each Exchange; defaults to path
    ExchangeStream(std::string path, std::string project, std::string archive_path = "");

    ExchangeStream(const ExchangeStream&) = delete;
    ExchangeStream& operator=(const ExchangeStream&) = delete;

    // Next Exchange, or nullopt at end of file
    std::optional<Exchange> next();

    // Rewind to the first line; clears errors
    void reset();

    const std::vector<ParseError>& errors() const { return errors_; }

    // True once any yielded Exchange contained an exclusion marker
    bool excluded() const { return excluded_; }

    bool is_open() const { return in_.is_open(); }

private:
    struct Pending {
        Exchange exchange;
        std::vector<std::string> assistant_parts;
    };

    std::optional<Exchange> finalize();
    void open_exchange(const UserMessage& user, const std::string& text, int line);
    void apply_assistant(const AssistantMessage& msg, int line);
    void apply_tool_results(const UserMessage& user, int line);

    std::string path_;
    std::string project_;
    std::string archive_path_;
    std::string file_stem_;
    std::ifstream in_;
    int line_no_ = 0;
    bool eof_ = false;
    bool excluded_ = false;
    Timestamp last_timestamp_ = 0;  // Latest time seen on any record
    std::optional<Pending> current_;
    std::vector<ParseError> errors_;
};

// Whole-file parse with exclusion applied: an excluded conversation
// yields no exchanges.
struct ParsedConversation {
    std::vector<Exchange> exchanges;
    std::vector<ParseError> errors;
    bool excluded = false;
};

// Throws NotFoundError if the file cannot be opened
ParsedConversation parse_conversation(const std::string& path, const std::string& project,
                                      const std::string& archive_path = "");

// Exchanges lying within [line_start, line_end] (1-indexed, inclusive)
std::vector<Exchange> read_range(const std::string& path, const std::string& project,
                                 int line_start, int line_end);

} // namespace mm
