#pragma once
// Hybrid search over exchanges and observations
//
// Vector: cosine similarity to the embedded query.
// Text:   case-insensitive substring, every hit scores TEXT_MATCH_BOOST.
// Both:   union; a hit found by both keeps its similarity.
//
// Filters (dates, projects, files, types, concepts) are applied before
// ranking. Ties on score go to the newer record.

#include <memmem/embedder.hpp>
#include <memmem/storage.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mm {

enum class SearchMode {
    Vector,
    Text,
    Both,
};

const char* to_string(SearchMode mode);
std::optional<SearchMode> parse_search_mode(const std::string& name);

constexpr int MIN_SEARCH_LIMIT = 1;
constexpr int MAX_SEARCH_LIMIT = 50;
constexpr float TEXT_MATCH_BOOST = 0.5f;

// Legacy multi-concept search
constexpr size_t MIN_CONCEPTS = 2;
constexpr size_t MAX_CONCEPTS = 5;
constexpr float CONCEPT_SIMILARITY_FLOOR = 0.1f;

struct SearchOptions {
    SearchMode mode = SearchMode::Both;
    int limit = 10;
    std::string after;      // YYYY-MM-DD, inclusive; empty = open
    std::string before;     // YYYY-MM-DD, inclusive; empty = open
    std::vector<std::string> projects;
    std::vector<std::string> files;
    std::vector<std::string> types;
    std::vector<std::string> concepts;
};

struct SearchResult {
    std::variant<Exchange, Observation> record;
    float score = 0.0f;
    bool vector_match = false;
    bool text_match = false;
    std::vector<float> concept_scores;   // Multi-concept only, in query order

    bool is_exchange() const { return std::holds_alternative<Exchange>(record); }
    const Exchange& exchange() const { return std::get<Exchange>(record); }
    const Observation& observation() const { return std::get<Observation>(record); }

    Timestamp timestamp() const;
    std::string project() const;
    std::string key() const;    // "exchange:<id>" / "observation:<id>"
};

// Strict YYYY-MM-DD -> start of that UTC day. Throws ValidationError.
Timestamp parse_date(const std::string& date);

// Validated options -> storage filter. Throws ValidationError.
RecordFilter make_filter(const SearchOptions& options);

nlohmann::json to_json(const SearchResult& result);

class SearchEngine {
public:
    // embedder may be null: text search still works, vector search throws
    SearchEngine(const Storage& storage, std::shared_ptr<Embedder> embedder);

    // Throws ValidationError for an empty query, a limit outside [1, 50]
    // or a malformed date; ProviderError when vector search has no embedder.
    std::vector<SearchResult> search(const std::string& query, const SearchOptions& options) const;

    // Every concept's similarity must clear the floor; ranked by the mean.
    // Throws ValidationError unless 2..5 concepts are given.
    std::vector<SearchResult> search_multi_concept(const std::vector<std::string>& concepts,
                                                   const SearchOptions& options) const;

    // A lone query runs search(); several queries, or multi_concept, take the
    // multi-concept path. Throws ValidationError when queries is empty.
    std::vector<SearchResult> search_queries(const std::vector<std::string>& queries,
                                             const SearchOptions& options,
                                             bool multi_concept = false) const;

private:
    std::optional<Vector> embed_query(const std::string& text) const;
    std::vector<SearchResult> vector_hits(const Vector& query, size_t limit,
                                          const RecordFilter& filter) const;
    std::vector<SearchResult> text_hits(const std::string& query, size_t limit,
                                        const RecordFilter& filter) const;

    const Storage& storage_;
    std::shared_ptr<Embedder> embedder_;
};

} // namespace mm
