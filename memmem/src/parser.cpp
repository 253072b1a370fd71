#include <memmem/parser.hpp>
#include <memmem/compress.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>

namespace mm {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

const char* const EXCLUSION_MARKERS[] = {
    "DO NOT INDEX THIS CHAT",
    "DO NOT INDEX THIS CONVERSATION",
    "\xEC\x9D\xB4 \xEB\x8C\x80\xED\x99\x94\xEB\x8A\x94 \xEC\x9D\xB8\xEB\x8D\xB1\xEC\x8B\xB1\xED\x95\x98\xEC\xA7\x80 \xEB\xA7\x88\xEC\x84\xB8\xEC\x9A\x94",  // 이 대화는 인덱싱하지 마세요
    "\xEC\x9D\xB4 \xEB\x8C\x80\xED\x99\x94\xEB\x8A\x94 \xEA\xB2\x80\xEC\x83\x89\xEC\x97\x90\xEC\x84\x9C \xEC\xA0\x9C\xEC\x99\xB8\xED\x95\x98\xEC\x84\xB8\xEC\x9A\x94",  // 이 대화는 검색에서 제외하세요
};

std::string upper_ascii(const std::string& s) {
    std::string out = s;
    for (char& c : out) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return out;
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string opt_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

// tool_result content is a string or a list of text blocks
std::string tool_result_text(const json& content) {
    if (content.is_string()) return content.get<std::string>();
    if (!content.is_array()) return "";

    std::string out;
    for (const auto& block : content) {
        if (block.is_object() && opt_string(block, "type") == "text") {
            if (!out.empty()) out += "\n";
            out += opt_string(block, "text");
        }
    }
    return out;
}

ContentBlock parse_block(const json& block, int line_number) {
    if (!block.is_object()) {
        throw ParseError("content block is not an object", line_number);
    }
    auto type_it = block.find("type");
    if (type_it == block.end() || !type_it->is_string()) {
        throw ParseError("content block without type", line_number);
    }
    const std::string type = type_it->get<std::string>();

    if (type == "tool_use") {
        ToolUseBlock use;
        use.id = opt_string(block, "id");
        use.name = opt_string(block, "name");
        if (use.name.empty()) use.name = "unknown";
        if (block.contains("input")) use.input = block["input"];
        return use;
    }
    if (type == "tool_result") {
        ToolResultBlock result;
        result.tool_use_id = opt_string(block, "tool_use_id");
        if (block.contains("content")) result.content = tool_result_text(block["content"]);
        auto err = block.find("is_error");
        result.is_error = err != block.end() && err->is_boolean() && err->get<bool>();
        return result;
    }
    // text; thinking/image blocks are reduced to empty text and dropped by text_of
    return TextBlock{type == "text" ? opt_string(block, "text") : ""};
}

RecordMeta parse_meta(const json& j) {
    RecordMeta meta;
    std::string ts = opt_string(j, "timestamp");
    if (!ts.empty()) meta.timestamp = parse_iso8601(ts);
    meta.session_id = opt_string(j, "sessionId");
    meta.cwd = opt_string(j, "cwd");
    meta.git_branch = opt_string(j, "gitBranch");
    meta.version = opt_string(j, "version");
    meta.parent_uuid = opt_string(j, "parentUuid");
    auto side = j.find("isSidechain");
    meta.is_sidechain = side != j.end() && side->is_boolean() && side->get<bool>();
    return meta;
}

bool has_tool_results(const std::vector<ContentBlock>& content) {
    return std::any_of(content.begin(), content.end(), [](const ContentBlock& b) {
        return std::holds_alternative<ToolResultBlock>(b);
    });
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

}  // anonymous namespace

Record parse_record(const std::string& line, int line_number) {
    json j;
    try {
        j = json::parse(line);
    } catch (const json::parse_error& e) {
        throw ParseError(std::string("invalid JSON: ") + e.what(), line_number);
    }

    if (!j.is_object()) {
        throw ParseError("record is not an object", line_number);
    }

    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_string()) {
        throw ParseError("record without type", line_number);
    }
    const std::string type = type_it->get<std::string>();

    if (type != "user" && type != "assistant") {
        return SystemMessage{type};
    }

    auto msg = j.find("message");
    if (msg == j.end() || !msg->is_object()) {
        throw ParseError(type + " record without message", line_number);
    }
    auto content = msg->find("content");
    if (content == msg->end() || content->is_null()) {
        throw ParseError(type + " record without message.content", line_number);
    }

    std::vector<ContentBlock> blocks;
    if (content->is_string()) {
        blocks.push_back(TextBlock{content->get<std::string>()});
    } else if (content->is_array()) {
        for (const auto& block : *content) {
            blocks.push_back(parse_block(block, line_number));
        }
    } else {
        throw ParseError("message.content must be a string or an array", line_number);
    }

    if (type == "user") {
        return UserMessage{parse_meta(j), std::move(blocks)};
    }
    return AssistantMessage{parse_meta(j), std::move(blocks)};
}

std::string text_of(const std::vector<ContentBlock>& content) {
    std::vector<std::string> parts;
    for (const auto& block : content) {
        if (const auto* text = std::get_if<TextBlock>(&block)) {
            if (!text->text.empty()) parts.push_back(text->text);
        }
    }
    return join(parts, "\n");
}

bool has_exclusion_marker(const std::string& text) {
    const std::string upper = upper_ascii(text);
    for (const char* marker : EXCLUSION_MARKERS) {
        if (upper.find(marker) != std::string::npos) return true;
    }
    return false;
}

std::string exchange_id(const std::string& project, const std::string& file_stem,
                        int line_start, int line_end) {
    const std::string key = project + "/" + file_stem + ":" +
                            std::to_string(line_start) + "-" + std::to_string(line_end);
    uint64_t hash = 14695981039346656037ULL;
    for (char c : key) {
        hash ^= static_cast<unsigned char>(c);
        hash *= 1099511628211ULL;
    }
    char buf[17];
    snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return buf;
}

std::string project_from_path(const std::string& path) {
    std::string parent = fs::path(path).parent_path().filename().string();
    return parent.empty() ? "unknown" : parent;
}

// ═══════════════════════════════════════════════════════════════════════════
// ExchangeStream
// ═══════════════════════════════════════════════════════════════════════════

ExchangeStream::ExchangeStream(std::string path, std::string project, std::string archive_path)
    : path_(std::move(path)),
      project_(std::move(project)),
      archive_path_(std::move(archive_path)) {
    if (archive_path_.empty()) archive_path_ = path_;
    file_stem_ = fs::path(archive_path_).stem().string();
    in_.open(path_);
}

void ExchangeStream::reset() {
    in_.close();
    in_.clear();
    in_.open(path_);
    line_no_ = 0;
    eof_ = false;
    excluded_ = false;
    last_timestamp_ = 0;
    current_.reset();
    errors_.clear();
}

std::optional<Exchange> ExchangeStream::next() {
    if (!in_.is_open()) return std::nullopt;

    std::string line;
    while (!eof_) {
        if (!std::getline(in_, line)) {
            eof_ = true;
            break;
        }
        ++line_no_;
        if (is_blank(line)) continue;

        Record record;
        try {
            record = parse_record(line, line_no_);
        } catch (const ParseError& e) {
            errors_.push_back(e);
            continue;
        }

        if (const auto* user = std::get_if<UserMessage>(&record)) {
            std::string text = text_of(user->content);
            bool results = has_tool_results(user->content);

            if (!is_blank(text)) {
                if (results && current_) apply_tool_results(*user, line_no_);
                auto done = finalize();
                open_exchange(*user, text, line_no_);
                if (done) return done;
            } else if (results) {
                if (!current_) open_exchange(*user, "(tool results only)", line_no_);
                apply_tool_results(*user, line_no_);
            }
            if (user->meta.timestamp) last_timestamp_ = *user->meta.timestamp;
        } else if (const auto* assistant = std::get_if<AssistantMessage>(&record)) {
            if (current_) apply_assistant(*assistant, line_no_);
            if (assistant->meta.timestamp) last_timestamp_ = *assistant->meta.timestamp;
        }
        // SystemMessage: discarded
    }

    return finalize();
}

void ExchangeStream::open_exchange(const UserMessage& user, const std::string& text, int line) {
    Pending pending;
    Exchange& ex = pending.exchange;
    ex.project = project_;
    ex.archive_path = archive_path_;
    ex.user_message = text;
    ex.line_start = line;
    ex.line_end = line;
    // Undated prompt: the assistant reply overrides this when it carries a time
    ex.timestamp = user.meta.timestamp.value_or(last_timestamp_);
    ex.session_id = user.meta.session_id;
    ex.cwd = user.meta.cwd;
    ex.git_branch = user.meta.git_branch;
    ex.assistant_version = user.meta.version;
    ex.parent_uuid = user.meta.parent_uuid;
    ex.is_sidechain = user.meta.is_sidechain;
    current_ = std::move(pending);
}

void ExchangeStream::apply_assistant(const AssistantMessage& msg, int line) {
    std::string text = text_of(msg.content);
    std::vector<ToolCall> calls;
    for (const auto& block : msg.content) {
        if (const auto* use = std::get_if<ToolUseBlock>(&block)) {
            ToolCall call;
            call.id = use->id;
            call.tool_name = use->name;
            call.tool_input = use->input.is_null() ? "" : use->input.dump();
            call.timestamp = msg.meta.timestamp.value_or(current_->exchange.timestamp);
            calls.push_back(std::move(call));
        }
    }
    if (is_blank(text) && calls.empty()) return;

    Exchange& ex = current_->exchange;
    if (!is_blank(text)) current_->assistant_parts.push_back(text);
    for (auto& call : calls) ex.tool_calls.push_back(std::move(call));
    ex.line_end = line;

    // Timestamp and session metadata follow the latest assistant record
    if (msg.meta.timestamp) ex.timestamp = *msg.meta.timestamp;
    if (!msg.meta.session_id.empty()) ex.session_id = msg.meta.session_id;
    if (!msg.meta.cwd.empty()) ex.cwd = msg.meta.cwd;
    if (!msg.meta.git_branch.empty()) ex.git_branch = msg.meta.git_branch;
    if (!msg.meta.version.empty()) ex.assistant_version = msg.meta.version;
}

void ExchangeStream::apply_tool_results(const UserMessage& user, int line) {
    Exchange& ex = current_->exchange;
    for (const auto& block : user.content) {
        const auto* result = std::get_if<ToolResultBlock>(&block);
        if (!result) continue;
        for (auto& call : ex.tool_calls) {
            if (!call.id.empty() && call.id == result->tool_use_id) {
                call.tool_result = result->content;
                call.is_error = result->is_error;
                break;
            }
        }
    }
    ex.line_end = std::max(ex.line_end, line);
}

std::optional<Exchange> ExchangeStream::finalize() {
    if (!current_) return std::nullopt;

    Pending pending = std::move(*current_);
    current_.reset();

    Exchange& ex = pending.exchange;
    if (pending.assistant_parts.empty() && ex.tool_calls.empty()) {
        return std::nullopt;
    }

    ex.assistant_message = join(pending.assistant_parts, "\n\n");
    ex.id = exchange_id(project_, file_stem_, ex.line_start, ex.line_end);

    for (size_t i = 0; i < ex.tool_calls.size(); ++i) {
        auto& call = ex.tool_calls[i];
        call.exchange_id = ex.id;
        if (call.id.empty()) call.id = ex.id + "-" + std::to_string(i);
    }
    if (!ex.tool_calls.empty()) {
        ex.compressed_tool_summary = summarize_tool_calls(ex.tool_calls);
    }

    if (has_exclusion_marker(ex.user_message) || has_exclusion_marker(ex.assistant_message)) {
        excluded_ = true;
    }
    return std::move(ex);
}

// ═══════════════════════════════════════════════════════════════════════════
// Whole-file helpers
// ═══════════════════════════════════════════════════════════════════════════

ParsedConversation parse_conversation(const std::string& path, const std::string& project,
                                      const std::string& archive_path) {
    ExchangeStream stream(path, project, archive_path);
    if (!stream.is_open()) {
        throw NotFoundError("cannot open transcript: " + path);
    }

    ParsedConversation result;
    while (auto ex = stream.next()) {
        result.exchanges.push_back(std::move(*ex));
    }
    result.errors = stream.errors();
    result.excluded = stream.excluded();
    if (result.excluded) result.exchanges.clear();
    return result;
}

std::vector<Exchange> read_range(const std::string& path, const std::string& project,
                                 int line_start, int line_end) {
    if (line_start < 1 || line_end < line_start) {
        throw ValidationError("invalid line range " + std::to_string(line_start) +
                              "-" + std::to_string(line_end));
    }

    ExchangeStream stream(path, project);
    if (!stream.is_open()) {
        throw NotFoundError("cannot open transcript: " + path);
    }

    std::vector<Exchange> out;
    while (auto ex = stream.next()) {
        if (ex->line_start > line_end) break;
        if (ex->line_start >= line_start && ex->line_end <= line_end) {
            out.push_back(std::move(*ex));
        }
    }
    return out;
}

} // namespace mm
