#include <memmem/compress.hpp>
#include <map>
#include <set>
#include <sstream>

namespace mm {

using json = nlohmann::json;

namespace {

const std::set<std::string> SKIPPED_TOOLS = {
    "Glob", "LSP", "TodoWrite", "TaskCreate", "TaskUpdate", "TaskList",
    "TaskGet", "AskUserQuestion", "EnterPlanMode", "ExitPlanMode",
    "NotebookEdit", "Skill",
};

std::string str_field(const json& j, const char* key) {
    if (!j.is_object()) return "";
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

std::optional<int64_t> int_field(const json& j, const char* key) {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return std::nullopt;
    return it->get<int64_t>();
}

std::optional<int64_t> line_count(const json& data) {
    if (auto lines = int_field(data, "lines")) return lines;
    if (data.is_object() && data.contains("file")) {
        return int_field(data["file"], "numLines");
    }
    return std::nullopt;
}

std::string compress_read(const json& data) {
    std::string out = "Read";
    std::string path = str_field(data, "file_path");
    if (!path.empty()) out += " " + path;
    if (auto lines = line_count(data)) out += " (" + std::to_string(*lines) + " lines)";
    return out;
}

std::string compress_edit(const json& data) {
    if (!data.is_object()) return "Edited";

    std::string path = str_field(data, "file_path");
    if (path.empty()) path = "unknown file";
    std::string old_str = first_line(str_field(data, "old_string"));
    std::string new_str = first_line(str_field(data, "new_string"));

    std::string out = "Edited " + path + ":";
    out += old_str.empty() ? " (no old string)" : " " + truncate_text(old_str, 40);
    out += " \xE2\x86\x92";  // →
    out += new_str.empty() ? " (no new string)" : " " + truncate_text(new_str, 40);
    return out;
}

std::string compress_write(const json& data) {
    std::string out = "Created";
    std::string path = str_field(data, "file_path");
    if (!path.empty()) out += " " + path;
    if (auto lines = line_count(data)) out += " (" + std::to_string(*lines) + " lines)";
    return out;
}

std::string compress_bash(const json& data) {
    if (!data.is_object()) return "Ran";

    std::string command = str_field(data, "command");
    if (command.empty()) command = "command";
    std::string out = "Ran `" + command + "` \xE2\x86\x92";

    auto exit_code = int_field(data, "exitCode");
    if (exit_code) out += " exit " + std::to_string(*exit_code);

    std::string err = first_line(str_field(data, "stderr"));
    if (exit_code && *exit_code != 0 && !err.empty()) {
        out += ": " + truncate_text(err, 100);
    }
    return out;
}

std::string compress_grep(const json& data) {
    if (!data.is_object()) return "Searched";

    int64_t matches = 0;
    if (auto count = int_field(data, "count")) {
        matches = *count;
    } else if (data.contains("matches") && data["matches"].is_array()) {
        matches = static_cast<int64_t>(data["matches"].size());
    }

    std::string out = "Searched '" + str_field(data, "pattern") + "'";
    std::string path = str_field(data, "path");
    if (!path.empty()) out += " in " + path;
    out += " \xE2\x86\x92 " + std::to_string(matches) + " matches";
    return out;
}

// Per-call fragment for summaries; named=true when it already carries the tool name
struct Fragment {
    std::string text;
    bool named = false;
};

std::string value_text(const json& v) {
    if (v.is_null()) return "null";
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

Fragment format_unknown(const std::string& name, const json& input) {
    if (input.is_null()) return {name, true};
    if (input.is_string()) return {name + "(\"" + input.get<std::string>() + "\")", true};
    if (input.is_number() || input.is_boolean()) return {name + "(" + input.dump() + ")", true};
    if (input.is_object()) {
        if (input.empty()) return {name, true};
        std::string pairs;
        int shown = 0;
        for (auto it = input.begin(); it != input.end() && shown < 2; ++it, ++shown) {
            if (shown > 0) pairs += ", ";
            pairs += it.key() + "=" + value_text(it.value());
        }
        return {name + "(" + pairs + ")", true};
    }
    return {name, true};
}

Fragment format_call(const std::string& name, const json& input) {
    std::string text;
    bool known = true;

    if (name == "Read" || name == "Write") {
        text = str_field(input, "file_path");
    } else if (name == "Edit") {
        text = str_field(input, "file_path");
        std::string old_str = first_line(str_field(input, "old_string"));
        if (!text.empty() && !old_str.empty()) {
            text += " (match: \"" + truncate_text(old_str, 50) + "\")";
        }
    } else if (name == "Bash") {
        text = "`" + truncate_text(str_field(input, "command"), 80) + "`";
    } else if (name == "Grep" || name == "Glob") {
        text = str_field(input, "pattern");
        std::string path = str_field(input, "path");
        if (!path.empty()) text += " in " + path;
    } else if (name == "Task") {
        text = str_field(input, "description");
    } else if (name == "TaskCreate") {
        text = str_field(input, "subject");
    } else if (name == "TaskUpdate") {
        text = str_field(input, "taskId");
        std::string status = str_field(input, "status");
        if (!status.empty()) text += " \xE2\x86\x92 " + status;
    } else if (name == "WebSearch") {
        text = "\"" + str_field(input, "query") + "\"";
    } else if (name == "WebFetch") {
        text = str_field(input, "url");
    } else {
        known = false;
    }

    if (!known) return format_unknown(name, input);
    if (text.empty()) return {name, true};
    return {text, false};
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

std::string truncate_text(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    if (max_bytes <= 3) return s.substr(0, max_bytes);

    size_t cut = max_bytes - 3;
    // Back up over UTF-8 continuation bytes
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return s.substr(0, cut) + "...";
}

std::string first_line(const std::string& s) {
    size_t pos = s.find('\n');
    return pos == std::string::npos ? s : s.substr(0, pos);
}

bool is_skipped_tool(const std::string& tool_name) {
    return SKIPPED_TOOLS.count(tool_name) > 0;
}

json merge_tool_data(const json& input, const json& response) {
    json merged = input.is_object() ? input : json::object();
    if (response.is_object()) {
        for (auto it = response.begin(); it != response.end(); ++it) {
            if (!merged.contains(it.key())) merged[it.key()] = it.value();
        }
    } else if (response.is_string()) {
        merged["output"] = response;
    }
    return merged;
}

std::optional<std::string> compress_tool_event(const std::string& tool_name, const json& data) {
    if (is_skipped_tool(tool_name)) return std::nullopt;

    std::string out;
    if (tool_name == "Read") {
        out = compress_read(data);
    } else if (tool_name == "Edit") {
        out = compress_edit(data);
    } else if (tool_name == "Write") {
        out = compress_write(data);
    } else if (tool_name == "Bash") {
        out = compress_bash(data);
    } else if (tool_name == "Grep") {
        out = compress_grep(data);
    } else if (tool_name == "WebSearch") {
        out = "Searched: " + str_field(data, "query");
    } else if (tool_name == "WebFetch") {
        std::string url = str_field(data, "url");
        out = url.empty() ? "Fetched" : "Fetched " + url;
    } else {
        out = tool_name;
    }
    return truncate_text(out, MAX_EVENT_CHARS);
}

std::string normalize_tool_name(const std::string& tool_name) {
    if (tool_name.rfind("mcp__plugin", 0) != 0) return tool_name;
    size_t pos = tool_name.rfind("__");
    return tool_name.substr(pos + 2);
}

std::string summarize_tool_calls(const std::vector<ToolCall>& calls) {
    if (calls.empty()) return "";

    // Group by normalized name, in order of first appearance
    std::vector<std::string> order;
    std::map<std::string, std::vector<Fragment>> groups;

    for (const auto& call : calls) {
        std::string name = normalize_tool_name(call.tool_name);
        json input;
        try {
            input = call.tool_input.empty() ? json() : json::parse(call.tool_input);
        } catch (const json::parse_error&) {
            input = call.tool_input;
        }
        if (groups.find(name) == groups.end()) order.push_back(name);
        groups[name].push_back(format_call(name, input));
    }

    std::vector<std::string> parts;
    for (const auto& name : order) {
        std::vector<std::string> named, bare;
        for (const auto& frag : groups[name]) {
            if (frag.text.empty()) continue;
            (frag.named ? named : bare).push_back(frag.text);
        }

        if (!bare.empty()) {
            parts.push_back(name + ": " + join(bare, ", "));
            parts.insert(parts.end(), named.begin(), named.end());
        } else if (named.size() == 1) {
            parts.push_back(named[0]);
        } else if (!named.empty()) {
            parts.push_back(name + ": " + join(named, ", "));
        } else {
            parts.push_back(name);
        }
    }
    return join(parts, " | ");
}

} // namespace mm
