#pragma once
// Observation extraction: pending tool events -> durable observations
//
// PostToolUse compresses each tool event (compress.hpp) and queues it.
// At session stop the queue is cut into batches, each batch goes to the
// LLM with the session's latest observations as dedup context, and every
// returned insight becomes one Observation. A batch's observations and
// the deletion of its events commit together, so an event is either
// still queued or folded in, never lost.

#include <memmem/config.hpp>
#include <memmem/embedder.hpp>
#include <memmem/llm.hpp>
#include <memmem/storage.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mm {

extern const char* const BATCH_EXTRACT_SYSTEM_PROMPT;

// Observation types the extractor accepts; anything else becomes "learning"
const std::vector<std::string>& observation_types();

// One insight as returned by the model
struct ExtractedInsight {
    std::string title;
    std::string content;
    std::string type;
    std::vector<std::string> facts;
    std::vector<std::string> concepts;
    std::vector<std::string> files_read;
    std::vector<std::string> files_modified;
};

std::string build_batch_prompt(const std::vector<PendingEvent>& events,
                               const std::vector<Observation>& previous);

// JSON array of {title, content, ...}; code fences tolerated. Items
// without a non-empty title and content are dropped. nullopt when the
// reply holds no JSON array at all.
std::optional<std::vector<ExtractedInsight>> parse_batch_response(const std::string& response);

struct ExtractionReport {
    size_t pending = 0;              // Events queued when the run started
    size_t batches = 0;              // Batches committed
    size_t failed_batches = 0;
    size_t observations = 0;
    size_t events_consumed = 0;
    bool no_provider = false;
    bool below_threshold = false;
};

class ObservationExtractor {
public:
    // provider and embedder may be null
    ObservationExtractor(Storage& storage, std::shared_ptr<LlmProvider> provider,
                         std::shared_ptr<Embedder> embedder, ExtractionSettings settings = {});

    // Compress and queue one tool event. Returns the event id, or nullopt
    // when the tool is on the skip list. Throws StorageError.
    std::optional<int64_t> queue_tool_event(const std::string& session_id,
                                            const std::string& project,
                                            const std::string& tool_name,
                                            const nlohmann::json& tool_input,
                                            const nlohmann::json& tool_response);

    // Never throws. Without a provider the queue is left untouched.
    Result<ExtractionReport> session_stop(const std::string& session_id,
                                          const std::string& project);

private:
    Observation to_observation(const ExtractedInsight& insight, const std::string& session_id,
                               const std::string& project, Timestamp timestamp);
    void run_batches(const std::vector<PendingEvent>& events, const std::string& session_id,
                     const std::string& project, ExtractionReport& report);

    Storage& storage_;
    std::shared_ptr<LlmProvider> provider_;
    std::shared_ptr<Embedder> embedder_;
    ExtractionSettings settings_;
};

} // namespace mm
