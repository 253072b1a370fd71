#include <memmem/extraction.hpp>
#include <memmem/compress.hpp>
#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <iostream>

namespace mm {

using json = nlohmann::json;

const char* const BATCH_EXTRACT_SYSTEM_PROMPT =
    "You are an observation extractor that analyzes coding-assistant tool events and "
    "identifies meaningful insights.\n"
    "\n"
    "Your task:\n"
    "1. Analyze the batch of tool events\n"
    "2. Extract meaningful observations as {title, content} pairs\n"
    "3. Avoid duplicating information from previous observations\n"
    "4. Return an empty JSON array if the batch contains only low-value events\n"
    "\n"
    "Guidelines:\n"
    "- Title: Keep under 50 characters, descriptive and concise\n"
    "- Content: Keep under 200 characters, informative but brief\n"
    "- Optional fields: type (decision, learning, bugfix, refactor, feature, debug, test, "
    "config), facts, concepts, files_read, files_modified\n"
    "- Focus on: decisions, learnings, bugfixes, features, refactoring, debugging\n"
    "- Skip: trivial operations, simple file reads, status checks, repetitive tasks\n"
    "- Return JSON array only, no markdown, no explanations\n"
    "\n"
    "Response format:\n"
    "[\n"
    "  {\"title\": \"Fixed authentication bug\", \"content\": \"Resolved JWT token validation "
    "in login flow\", \"type\": \"bugfix\"},\n"
    "  {\"title\": \"Added test coverage\", \"content\": \"Added unit tests for auth module\"}\n"
    "]";

const std::vector<std::string>& observation_types() {
    static const std::vector<std::string> types = {
        "decision", "learning", "bugfix", "refactor", "feature", "debug", "test", "config",
    };
    return types;
}

namespace {

constexpr const char* DEFAULT_TYPE = "learning";

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Body of the first ``` fence, or the text itself
std::string strip_code_fence(const std::string& text) {
    std::string t = trim(text);
    if (t.rfind("```", 0) != 0) return t;

    size_t body = t.find('\n');
    if (body == std::string::npos) return "";
    size_t close = t.find("\n```", body);
    return trim(t.substr(body + 1, close == std::string::npos ? std::string::npos : close - body - 1));
}

// First of `keys` holding an array; non-string and blank entries dropped
std::vector<std::string> strings_at(const json& item, std::initializer_list<const char*> keys) {
    std::vector<std::string> out;
    for (const char* key : keys) {
        if (!item.contains(key) || !item[key].is_array()) continue;
        for (const auto& v : item[key]) {
            if (v.is_string() && !trim(v.get<std::string>()).empty()) {
                out.push_back(trim(v.get<std::string>()));
            }
        }
        break;
    }
    return out;
}

} // namespace

std::string build_batch_prompt(const std::vector<PendingEvent>& events,
                               const std::vector<Observation>& previous) {
    std::string prompt;

    if (!previous.empty()) {
        prompt += "<previous_observations>\n";
        for (const auto& obs : previous) {
            prompt += "- " + obs.title + ": " + obs.narrative + "\n";
        }
        prompt += "</previous_observations>\n\n";
    }

    prompt += "<tool_events>\n";
    for (const auto& ev : events) {
        prompt += "[" + format_iso8601(ev.timestamp) + "] " + ev.tool_name + ": " +
                  ev.merged_data + "\n";
    }
    prompt += "</tool_events>\n\n";

    prompt +=
        "Extract meaningful observations from these tool events.\n"
        "\n"
        "Remember:\n"
        "- title (under 50 characters)\n"
        "- content (under 200 characters)\n"
        "- Return empty array [] if this batch is low-value\n"
        "- Avoid duplicating information from previous observations above\n"
        "\n"
        "Return only a JSON array.";
    return prompt;
}

std::optional<std::vector<ExtractedInsight>> parse_batch_response(const std::string& response) {
    std::string text = strip_code_fence(response);
    json parsed = json::parse(text, nullptr, false);

    // Models sometimes wrap the array in prose
    if (parsed.is_discarded()) {
        size_t open = text.find('[');
        size_t close = text.rfind(']');
        if (open != std::string::npos && close != std::string::npos && close > open) {
            parsed = json::parse(text.substr(open, close - open + 1), nullptr, false);
        }
    }
    if (!parsed.is_array()) return std::nullopt;

    std::vector<ExtractedInsight> insights;
    for (const auto& item : parsed) {
        if (!item.is_object()) continue;
        if (!item.contains("title") || !item["title"].is_string()) continue;
        if (!item.contains("content") || !item["content"].is_string()) continue;

        ExtractedInsight insight;
        insight.title = trim(item["title"].get<std::string>());
        insight.content = trim(item["content"].get<std::string>());
        if (insight.title.empty() || insight.content.empty()) continue;

        insight.type = DEFAULT_TYPE;
        if (item.contains("type") && item["type"].is_string()) {
            const auto& types = observation_types();
            std::string type = item["type"].get<std::string>();
            if (std::find(types.begin(), types.end(), type) != types.end()) insight.type = type;
        }
        insight.facts = strings_at(item, {"facts"});
        insight.concepts = strings_at(item, {"concepts"});
        insight.files_read = strings_at(item, {"files_read", "filesRead"});
        insight.files_modified = strings_at(item, {"files_modified", "filesModified"});
        insights.push_back(std::move(insight));
    }
    return insights;
}

// ═══════════════════════════════════════════════════════════════════
// ObservationExtractor
// ═══════════════════════════════════════════════════════════════════

ObservationExtractor::ObservationExtractor(Storage& storage, std::shared_ptr<LlmProvider> provider,
                                           std::shared_ptr<Embedder> embedder,
                                           ExtractionSettings settings)
    : storage_(storage),
      provider_(std::move(provider)),
      embedder_(std::move(embedder)),
      settings_(settings) {
    settings_.batch_size = std::max<size_t>(1, settings_.batch_size);
}

std::optional<int64_t> ObservationExtractor::queue_tool_event(const std::string& session_id,
                                                              const std::string& project,
                                                              const std::string& tool_name,
                                                              const json& tool_input,
                                                              const json& tool_response) {
    json merged = merge_tool_data(tool_input, tool_response);
    auto compressed = compress_tool_event(tool_name, merged);
    if (!compressed) return std::nullopt;

    PendingEvent event;
    event.session_id = session_id;
    event.project = project;
    event.tool_name = tool_name;
    event.merged_data = *compressed;
    event.timestamp = now();
    return storage_.insert_pending_event(event);
}

Result<ExtractionReport> ObservationExtractor::session_stop(const std::string& session_id,
                                                            const std::string& project) {
    ExtractionReport report;
    try {
        if (!provider_) {
            report.no_provider = true;
            report.pending = storage_.pending_event_count(session_id);
            return report;
        }

        auto events = storage_.pending_events(session_id);
        report.pending = events.size();
        if (events.size() < settings_.min_events) {
            report.below_threshold = true;
            return report;
        }

        run_batches(events, session_id, project, report);

        std::cerr << "[extraction] Session " << session_id << ": " << report.observations
                  << " observations from " << report.events_consumed << "/" << report.pending
                  << " events\n";
        return report;
    } catch (const std::exception& e) {
        std::cerr << "[extraction] Session " << session_id << " failed: " << e.what() << "\n";
        return Result<ExtractionReport>::failure(e.what());
    }
}

void ObservationExtractor::run_batches(const std::vector<PendingEvent>& events,
                                       const std::string& session_id, const std::string& project,
                                       ExtractionReport& report) {
    LlmOptions options;
    options.system_prompt = BATCH_EXTRACT_SYSTEM_PROMPT;

    for (size_t start = 0; start < events.size(); start += settings_.batch_size) {
        size_t end = std::min(events.size(), start + settings_.batch_size);
        std::vector<PendingEvent> batch(events.begin() + start, events.begin() + end);

        // Dedup context: the session's latest observations, oldest first
        auto previous = storage_.observations_by_session(session_id);
        if (previous.size() > settings_.dedup_context) {
            previous.erase(previous.begin(),
                           previous.end() - static_cast<std::ptrdiff_t>(settings_.dedup_context));
        }

        std::string response;
        try {
            response = provider_->complete(build_batch_prompt(batch, previous), options);
        } catch (const std::exception& e) {
            // Leave this batch and the rest queued for a later run
            std::cerr << "[extraction] " << provider_->name() << " failed: " << e.what() << "\n";
            ++report.failed_batches;
            return;
        }

        const std::string& batch_project = project.empty() ? batch.front().project : project;
        Timestamp stamp = now();

        auto insights = parse_batch_response(response);
        if (!insights) {
            // Nothing was distilled, so nothing may be consumed
            std::cerr << "[extraction] " << provider_->name()
                      << " returned no JSON array, keeping " << batch.size() << " events queued\n";
            ++report.failed_batches;
            return;
        }

        std::vector<Observation> observations;
        for (const auto& insight : *insights) {
            observations.push_back(to_observation(insight, session_id, batch_project, stamp));
        }

        std::vector<int64_t> consumed;
        for (const auto& ev : batch) consumed.push_back(ev.id);

        storage_.commit_extraction(observations, consumed);
        ++report.batches;
        report.observations += observations.size();
        report.events_consumed += consumed.size();
    }
}

Observation ObservationExtractor::to_observation(const ExtractedInsight& insight,
                                                 const std::string& session_id,
                                                 const std::string& project, Timestamp timestamp) {
    Observation obs;
    obs.project = project;
    obs.session_id = session_id;
    obs.timestamp = timestamp;
    obs.type = insight.type;
    obs.title = insight.title;
    obs.narrative = insight.content;
    obs.facts = insight.facts;
    obs.concepts = insight.concepts;
    obs.files_read = insight.files_read;
    obs.files_modified = insight.files_modified;

    if (embedder_) {
        try {
            obs.embedding = embedder_->embed(observation_embedding_text(obs));
        } catch (const ProviderError& e) {
            // Stored without a vector; still reachable by text search
            std::cerr << "[extraction] Embedding failed for '" << obs.title << "': " << e.what()
                      << "\n";
        }
    }
    return obs;
}

} // namespace mm
