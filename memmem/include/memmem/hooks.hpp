#pragma once
// Host hook boundary
//
// The assistant host runs `memmem observe|stop|inject` from its hooks and
// pipes one JSON object on stdin:
//
//   {"session_id": "...", "cwd": "...", "tool_name": "Edit",
//    "tool_input": {...}, "tool_response": {...}}
//
// Nothing here throws. A hook that fails must never break the host's
// session, so every error comes back as a Status / Result for the caller
// to log.

#include <memmem/errors.hpp>
#include <memmem/extraction.hpp>
#include <memmem/injector.hpp>
#include <memmem/storage.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace mm {

struct HookInput {
    std::string session_id;
    std::string cwd;
    std::string tool_name;
    nlohmann::json tool_input;
    nlohmann::json tool_response;
};

// Blank input gives an empty HookInput; malformed JSON is a failure
Result<HookInput> parse_hook_input(const std::string& raw);

// "/home/me/src/my.app" -> "-home-me-src-my-app"
std::string project_slug(const std::string& project_dir);

// Queue one tool event. Skipped tools are not an error.
Status post_tool_use(ObservationExtractor& extractor, const HookInput& input,
                     const std::string& project);

Result<ExtractionReport> session_stop(ObservationExtractor& extractor,
                                      const std::string& session_id,
                                      const std::string& project);

Result<InjectResult> session_start(const Storage& storage, const std::string& project,
                                   const InjectSettings& settings);

} // namespace mm
