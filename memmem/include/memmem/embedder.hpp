#pragma once
// Embedder: text -> 768-dim unit vector
//
// embed() returns nullopt when there is nothing to embed (the caller
// stores the row without a vector). Backend failures throw ProviderError.
//
// Implementations:
//   HashEmbedder     - character trigram feature hashing, no model needed
//   LimitedEmbedder  - wraps another embedder behind a RateLimiter
//   OnnxEmbedder     - onnx_embedder.hpp (MEMMEM_WITH_ONNX)
//   WorkerEmbedder   - worker_client.hpp, talks to the embedding worker

#include <memmem/compress.hpp>
#include <memmem/errors.hpp>
#include <memmem/ratelimiter.hpp>
#include <memmem/types.hpp>
#include <cctype>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mm {

// Model input limits
constexpr size_t MAX_EMBED_CHARS = 8000;
constexpr const char* EMBED_PREFIX = "title: none | text: ";

class Embedder {
public:
    virtual ~Embedder() = default;

    virtual std::optional<Vector> embed(const std::string& text) = 0;
    virtual size_t dimension() const = 0;
    virtual bool ready() const = 0;
};

// Text as fed to the model: task prefix + bounded body
inline std::string prepare_embedding_text(const std::string& text) {
    return EMBED_PREFIX + truncate_text(text, MAX_EMBED_CHARS);
}

// Text that represents an Exchange in the vector index
inline std::string exchange_embedding_text(const Exchange& ex) {
    std::string text = "User: " + ex.user_message + "\n\nAssistant: " + ex.assistant_message;
    if (ex.compressed_tool_summary && !ex.compressed_tool_summary->empty()) {
        text += "\n\nTools: " + *ex.compressed_tool_summary;
    }
    return text;
}

inline std::string observation_embedding_text(const Observation& obs) {
    std::string text = obs.title;
    if (!obs.subtitle.empty()) text += "\n" + obs.subtitle;
    if (!obs.narrative.empty()) text += "\n" + obs.narrative;
    for (const auto& fact : obs.facts) text += "\n" + fact;
    return text;
}

// Model output -> unit Vector. Accepts [1, hidden] (already pooled) or
// [1, seq, hidden] token states, mean-pooled over tokens with mask != 0.
// Any other shape, or hidden != EMBED_DIM, throws ProviderError.
inline Vector pool_model_output(const float* data, const std::vector<int64_t>& shape,
                                const std::vector<int64_t>& mask) {
    if (shape.size() != 2 && shape.size() != 3) {
        throw ProviderError("model output has rank " + std::to_string(shape.size()) +
                            ", expected 2 or 3");
    }
    const int64_t hidden = shape.back();
    if (hidden != static_cast<int64_t>(EMBED_DIM)) {
        throw ProviderError("model output has " + std::to_string(hidden) +
                            " dimensions, expected " + std::to_string(EMBED_DIM));
    }

    Vector v;
    if (shape.size() == 2) {
        for (size_t d = 0; d < EMBED_DIM; ++d) v[d] = data[d];
    } else {
        const int64_t seq = shape[1];
        if (seq < 0 || static_cast<size_t>(seq) > mask.size()) {
            throw ProviderError("model output has " + std::to_string(seq) + " tokens, input had " +
                                std::to_string(mask.size()));
        }
        float count = 0.0f;
        for (int64_t t = 0; t < seq; ++t) {
            if (mask[static_cast<size_t>(t)] == 0) continue;
            count += 1.0f;
            for (size_t d = 0; d < EMBED_DIM; ++d) {
                v[d] += data[t * hidden + static_cast<int64_t>(d)];
            }
        }
        if (count > 0.0f) {
            for (size_t d = 0; d < EMBED_DIM; ++d) v[d] /= count;
        }
    }
    v.normalize();
    return v;
}

// Deterministic bag of padded word trigrams hashed into EMBED_DIM buckets.
// Words sharing a stem share trigrams ("auth" / "authentication"), so the
// cosine is positive whenever two texts share word prefixes.
class HashEmbedder : public Embedder {
public:
    std::optional<Vector> embed(const std::string& text) override {
        Vector v;
        bool any = false;

        std::string word;
        auto flush = [&]() {
            if (word.empty()) return;
            const std::string padded = "^" + word + "$";
            for (size_t i = 0; i + 3 <= padded.size(); ++i) {
                v[bucket(padded.data() + i, 3)] += 1.0f;
            }
            // Whole word as its own feature
            v[bucket(word.data(), word.size())] += 2.0f;
            any = true;
            word.clear();
        };

        for (unsigned char c : text) {
            if (std::isalnum(c) || c >= 0x80) {
                word += static_cast<char>(std::tolower(c));
            } else {
                flush();
            }
        }
        flush();

        if (!any) return std::nullopt;
        v.normalize();
        return v;
    }

    size_t dimension() const override { return EMBED_DIM; }
    bool ready() const override { return true; }

private:
    static size_t bucket(const char* data, size_t len) {
        uint64_t hash = 14695981039346656037ULL;
        for (size_t i = 0; i < len; ++i) {
            hash ^= static_cast<unsigned char>(data[i]);
            hash *= 1099511628211ULL;
        }
        return static_cast<size_t>(hash % EMBED_DIM);
    }
};

// Every embed() first takes a token from the shared limiter
class LimitedEmbedder : public Embedder {
public:
    LimitedEmbedder(std::shared_ptr<Embedder> inner, std::shared_ptr<RateLimiter> limiter)
        : inner_(std::move(inner)), limiter_(std::move(limiter)) {}

    std::optional<Vector> embed(const std::string& text) override {
        limiter_->acquire();
        return inner_->embed(text);
    }

    size_t dimension() const override { return inner_->dimension(); }
    bool ready() const override { return inner_->ready(); }

private:
    std::shared_ptr<Embedder> inner_;
    std::shared_ptr<RateLimiter> limiter_;
};

} // namespace mm
