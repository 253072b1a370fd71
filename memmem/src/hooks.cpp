#include <memmem/hooks.hpp>
#include <iostream>

namespace mm {

using json = nlohmann::json;

namespace {

std::string string_field(const json& obj, const char* key) {
    if (!obj.contains(key) || !obj[key].is_string()) return "";
    return obj[key].get<std::string>();
}

json object_field(const json& obj, const char* key) {
    if (!obj.contains(key)) return nullptr;
    return obj[key];
}

} // namespace

Result<HookInput> parse_hook_input(const std::string& raw) {
    HookInput input;
    if (raw.find_first_not_of(" \t\r\n") == std::string::npos) return input;

    json parsed = json::parse(raw, nullptr, false);
    if (parsed.is_discarded()) return Result<HookInput>::failure("hook input is not valid JSON");
    if (!parsed.is_object()) return Result<HookInput>::failure("hook input is not a JSON object");

    input.session_id = string_field(parsed, "session_id");
    input.cwd = string_field(parsed, "cwd");
    input.tool_name = string_field(parsed, "tool_name");
    input.tool_input = object_field(parsed, "tool_input");
    input.tool_response = object_field(parsed, "tool_response");
    return input;
}

std::string project_slug(const std::string& project_dir) {
    std::string slug = project_dir;
    for (char& c : slug) {
        if (c == '/' || c == '.') c = '-';
    }
    return slug;
}

Status post_tool_use(ObservationExtractor& extractor, const HookInput& input,
                     const std::string& project) {
    if (input.tool_name.empty()) return Status::failure("missing tool_name");
    if (input.session_id.empty()) return Status::failure("missing session_id");

    try {
        auto id = extractor.queue_tool_event(input.session_id, project, input.tool_name,
                                             input.tool_input, input.tool_response);
        if (id) {
            std::cerr << "[hooks] Queued " << input.tool_name << " event " << *id << "\n";
        }
        return Status::ok();
    } catch (const std::exception& e) {
        return Status::failure(std::string("post_tool_use: ") + e.what());
    }
}

Result<ExtractionReport> session_stop(ObservationExtractor& extractor,
                                      const std::string& session_id,
                                      const std::string& project) {
    if (session_id.empty()) return Result<ExtractionReport>::failure("missing session_id");
    return extractor.session_stop(session_id, project);
}

Result<InjectResult> session_start(const Storage& storage, const std::string& project,
                                   const InjectSettings& settings) {
    try {
        return inject(storage, project, settings);
    } catch (const std::exception& e) {
        return Result<InjectResult>::failure(std::string("session_start: ") + e.what());
    }
}

} // namespace mm
