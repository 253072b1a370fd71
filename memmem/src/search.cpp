#include <memmem/search.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <numeric>

namespace mm {

using json = nlohmann::json;

const char* to_string(SearchMode mode) {
    switch (mode) {
        case SearchMode::Vector: return "vector";
        case SearchMode::Text: return "text";
        case SearchMode::Both: return "both";
    }
    return "both";
}

std::optional<SearchMode> parse_search_mode(const std::string& name) {
    if (name == "vector") return SearchMode::Vector;
    if (name == "text") return SearchMode::Text;
    if (name == "both") return SearchMode::Both;
    return std::nullopt;
}

Timestamp SearchResult::timestamp() const {
    return is_exchange() ? exchange().timestamp : observation().timestamp;
}

std::string SearchResult::project() const {
    return is_exchange() ? exchange().project : observation().project;
}

std::string SearchResult::key() const {
    return is_exchange() ? "exchange:" + exchange().id
                         : "observation:" + std::to_string(observation().id);
}

Timestamp parse_date(const std::string& date) {
    bool shaped = date.size() == 10 && date[4] == '-' && date[7] == '-';
    for (size_t i = 0; shaped && i < date.size(); ++i) {
        if (i == 4 || i == 7) continue;
        shaped = std::isdigit(static_cast<unsigned char>(date[i])) != 0;
    }
    auto ts = shaped ? parse_iso8601(date) : std::nullopt;
    // Round trip rejects impossible days such as 2024-02-31
    if (!ts || format_date(*ts) != date) {
        throw ValidationError("invalid date '" + date + "', expected YYYY-MM-DD");
    }
    return *ts;
}

RecordFilter make_filter(const SearchOptions& options) {
    if (options.limit < MIN_SEARCH_LIMIT || options.limit > MAX_SEARCH_LIMIT) {
        throw ValidationError("limit must be between " + std::to_string(MIN_SEARCH_LIMIT) +
                              " and " + std::to_string(MAX_SEARCH_LIMIT) + ", got " +
                              std::to_string(options.limit));
    }

    RecordFilter filter;
    if (!options.after.empty()) filter.after = parse_date(options.after);
    if (!options.before.empty()) filter.before = parse_date(options.before) + MS_PER_DAY - 1;
    if (filter.after && filter.before && *filter.after > *filter.before) {
        throw ValidationError("after (" + options.after + ") is later than before (" +
                              options.before + ")");
    }
    filter.projects = options.projects;
    filter.files = options.files;
    filter.types = options.types;
    filter.concepts = options.concepts;
    return filter;
}

json to_json(const SearchResult& result) {
    json j;
    j["score"] = result.score;
    j["vectorMatch"] = result.vector_match;
    j["textMatch"] = result.text_match;
    if (!result.concept_scores.empty()) j["conceptScores"] = result.concept_scores;

    if (result.is_exchange()) {
        const Exchange& ex = result.exchange();
        j["kind"] = "exchange";
        j["id"] = ex.id;
        j["project"] = ex.project;
        j["timestamp"] = format_iso8601(ex.timestamp);
        j["sessionId"] = ex.session_id;
        j["userMessage"] = ex.user_message;
        j["assistantMessage"] = ex.assistant_message;
        j["archivePath"] = ex.archive_path;
        j["lineStart"] = ex.line_start;
        j["lineEnd"] = ex.line_end;
        j["isSidechain"] = ex.is_sidechain;
        if (ex.compressed_tool_summary) j["toolSummary"] = *ex.compressed_tool_summary;
    } else {
        const Observation& obs = result.observation();
        j["kind"] = "observation";
        j["id"] = obs.id;
        j["project"] = obs.project;
        j["timestamp"] = format_iso8601(obs.timestamp);
        j["sessionId"] = obs.session_id;
        j["type"] = obs.type;
        j["title"] = obs.title;
        j["subtitle"] = obs.subtitle;
        j["narrative"] = obs.narrative;
        j["facts"] = obs.facts;
        j["concepts"] = obs.concepts;
        j["filesRead"] = obs.files_read;
        j["filesModified"] = obs.files_modified;
    }
    return j;
}

namespace {

void rank(std::vector<SearchResult>& results, size_t limit) {
    std::sort(results.begin(), results.end(), [](const SearchResult& a, const SearchResult& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.timestamp() != b.timestamp()) return a.timestamp() > b.timestamp();
        return a.key() < b.key();
    });
    if (results.size() > limit) results.resize(limit);
}

bool blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

SearchEngine::SearchEngine(const Storage& storage, std::shared_ptr<Embedder> embedder)
    : storage_(storage), embedder_(std::move(embedder)) {}

std::optional<Vector> SearchEngine::embed_query(const std::string& text) const {
    if (!embedder_) throw ProviderError("vector search needs an embedding provider");
    return embedder_->embed(text);
}

std::vector<SearchResult> SearchEngine::vector_hits(const Vector& query, size_t limit,
                                                    const RecordFilter& filter) const {
    std::vector<SearchResult> hits;
    for (auto& hit : storage_.nearest_exchanges(query, limit, filter)) {
        SearchResult r{std::move(hit.item), hit.score, true, false, {}};
        hits.push_back(std::move(r));
    }
    for (auto& hit : storage_.nearest_observations(query, limit, filter)) {
        SearchResult r{std::move(hit.item), hit.score, true, false, {}};
        hits.push_back(std::move(r));
    }
    return hits;
}

std::vector<SearchResult> SearchEngine::text_hits(const std::string& query, size_t limit,
                                                  const RecordFilter& filter) const {
    std::vector<SearchResult> hits;
    for (auto& ex : storage_.text_match_exchanges(query, limit, filter)) {
        hits.push_back(SearchResult{std::move(ex), TEXT_MATCH_BOOST, false, true, {}});
    }
    for (auto& obs : storage_.text_match_observations(query, limit, filter)) {
        hits.push_back(SearchResult{std::move(obs), TEXT_MATCH_BOOST, false, true, {}});
    }
    return hits;
}

std::vector<SearchResult> SearchEngine::search(const std::string& query,
                                               const SearchOptions& options) const {
    if (blank(query)) throw ValidationError("search query is empty");
    RecordFilter filter = make_filter(options);
    const size_t limit = static_cast<size_t>(options.limit);

    SearchMode mode = options.mode;
    if (mode == SearchMode::Both && !embedder_) {
        std::cerr << "[search] No embedding provider, falling back to text search\n";
        mode = SearchMode::Text;
    }

    std::vector<SearchResult> results;

    if (mode == SearchMode::Vector || mode == SearchMode::Both) {
        if (auto q = embed_query(query)) results = vector_hits(*q, limit, filter);
    }

    if (mode == SearchMode::Text) {
        results = text_hits(query, limit, filter);
    } else if (mode == SearchMode::Both) {
        std::map<std::string, size_t> seen;
        for (size_t i = 0; i < results.size(); ++i) seen[results[i].key()] = i;

        for (auto& hit : text_hits(query, limit, filter)) {
            auto it = seen.find(hit.key());
            if (it != seen.end()) {
                results[it->second].text_match = true;
            } else {
                results.push_back(std::move(hit));
            }
        }
    }

    rank(results, limit);
    return results;
}

std::vector<SearchResult> SearchEngine::search_multi_concept(
    const std::vector<std::string>& concepts, const SearchOptions& options) const {
    if (concepts.size() < MIN_CONCEPTS || concepts.size() > MAX_CONCEPTS) {
        throw ValidationError("multi-concept search needs " + std::to_string(MIN_CONCEPTS) +
                              " to " + std::to_string(MAX_CONCEPTS) + " concepts, got " +
                              std::to_string(concepts.size()));
    }
    RecordFilter filter = make_filter(options);

    std::vector<Vector> queries;
    for (const auto& concept_text : concepts) {
        if (blank(concept_text)) throw ValidationError("empty concept in multi-concept search");
        auto v = embed_query(concept_text);
        if (!v) throw ValidationError("concept '" + concept_text + "' has nothing to embed");
        queries.push_back(std::move(*v));
    }

    std::vector<SearchResult> results;
    auto consider = [&](auto record, const Vector& embedding) {
        std::vector<float> scores;
        for (const auto& q : queries) {
            float similarity = embedding.cosine(q);
            if (similarity < CONCEPT_SIMILARITY_FLOOR) return;
            scores.push_back(similarity);
        }
        float mean = std::accumulate(scores.begin(), scores.end(), 0.0f) /
                     static_cast<float>(scores.size());
        results.push_back(SearchResult{std::move(record), mean, true, false, std::move(scores)});
    };

    for (auto& ex : storage_.embedded_exchanges(filter)) {
        Vector embedding = *ex.embedding;
        consider(std::move(ex), embedding);
    }
    for (auto& obs : storage_.embedded_observations(filter)) {
        Vector embedding = *obs.embedding;
        consider(std::move(obs), embedding);
    }

    rank(results, static_cast<size_t>(options.limit));
    return results;
}

std::vector<SearchResult> SearchEngine::search_queries(const std::vector<std::string>& queries,
                                                       const SearchOptions& options,
                                                       bool multi_concept) const {
    if (queries.empty()) throw ValidationError("no search query given");
    if (multi_concept || queries.size() > 1) return search_multi_concept(queries, options);
    return search(queries.front(), options);
}

} // namespace mm
