#pragma once
// Compress: rule-based shrinking of tool events (no LLM involved)
//
// compress_tool_event() feeds pending_events from the PostToolUse hook.
// summarize_tool_calls() produces the one-line tool summary kept with
// each Exchange.

#include <memmem/types.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mm {

// Upper bound on a stored pending event
constexpr size_t MAX_EVENT_CHARS = 500;

// Cut to at most max_bytes, ending with "..." and never splitting a
// UTF-8 sequence.
std::string truncate_text(const std::string& s, size_t max_bytes);

std::string first_line(const std::string& s);

// Tools with no value for observations (Glob, TodoWrite, ...)
bool is_skipped_tool(const std::string& tool_name);

// Merge hook tool_input with tool_response into one object. Input keys win.
nlohmann::json merge_tool_data(const nlohmann::json& input, const nlohmann::json& response);

// "Read /a.ts (245 lines)", "Edited /a.ts: old → new", "Ran `make` → exit 0".
// nullopt for skipped tools.
std::optional<std::string> compress_tool_event(const std::string& tool_name,
                                               const nlohmann::json& data);

// "mcp__plugin_x__search" -> "search"
std::string normalize_tool_name(const std::string& tool_name);

// "Read: /a.ts, /b.ts | Bash: `npm test`"; empty for no calls
std::string summarize_tool_calls(const std::vector<ToolCall>& calls);

} // namespace mm
