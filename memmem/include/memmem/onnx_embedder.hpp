#pragma once
// OnnxEmbedder: sentence embeddings through ONNX Runtime
//
// WordPiece tokenization, one forward pass, attention-masked mean
// pooling, L2 normalization. Only built with MEMMEM_WITH_ONNX.

#include <memmem/embedder.hpp>
#include <memmem/errors.hpp>
#include <onnxruntime/core/session/onnxruntime_cxx_api.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mm {

class WordPieceTokenizer {
public:
    bool load(const std::string& vocab_path) {
        std::ifstream file(vocab_path);
        if (!file) return false;

        vocab_.clear();
        std::string line;
        int64_t id = 0;
        while (std::getline(file, line)) {
            while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
                line.pop_back();
            }
            if (!line.empty()) vocab_[line] = id;
            ++id;
        }

        cls_id_ = lookup("[CLS]");
        sep_id_ = lookup("[SEP]");
        pad_id_ = std::max<int64_t>(lookup("[PAD]"), 0);
        unk_id_ = lookup("[UNK]");
        return unk_id_ >= 0;
    }

    // input_ids and attention_mask, both max_length long
    std::pair<std::vector<int64_t>, std::vector<int64_t>>
    encode(const std::string& text, size_t max_length) const {
        std::vector<int64_t> ids;
        if (cls_id_ >= 0) ids.push_back(cls_id_);

        for (const auto& word : split(text)) {
            for (int64_t tok : pieces(word)) {
                if (ids.size() >= max_length - 1) break;
                ids.push_back(tok);
            }
            if (ids.size() >= max_length - 1) break;
        }
        if (sep_id_ >= 0) ids.push_back(sep_id_);

        std::vector<int64_t> mask(ids.size(), 1);
        ids.resize(max_length, pad_id_);
        mask.resize(max_length, 0);
        return {std::move(ids), std::move(mask)};
    }

private:
    int64_t lookup(const std::string& token) const {
        auto it = vocab_.find(token);
        return it != vocab_.end() ? it->second : -1;
    }

    // Lowercased ASCII words, punctuation as single tokens, each UTF-8
    // character on its own
    static std::vector<std::string> split(const std::string& text) {
        std::vector<std::string> words;
        std::string current;
        auto flush = [&]() {
            if (!current.empty()) words.push_back(std::move(current));
            current.clear();
        };

        for (size_t i = 0; i < text.size();) {
            unsigned char c = text[i];
            if (c < 0x80) {
                if (std::isspace(c)) {
                    flush();
                } else if (std::ispunct(c)) {
                    flush();
                    words.emplace_back(1, static_cast<char>(c));
                } else {
                    current += static_cast<char>(std::tolower(c));
                }
                ++i;
            } else {
                size_t len = (c & 0xE0) == 0xC0 ? 2 : (c & 0xF0) == 0xE0 ? 3 : (c & 0xF8) == 0xF0 ? 4 : 1;
                flush();
                words.push_back(text.substr(i, len));
                i += len;
            }
        }
        flush();
        return words;
    }

    std::vector<int64_t> pieces(const std::string& word) const {
        auto whole = vocab_.find(word);
        if (whole != vocab_.end()) return {whole->second};

        std::vector<int64_t> out;
        size_t start = 0;
        while (start < word.size()) {
            size_t end = word.size();
            int64_t found = -1;
            for (; end > start; --end) {
                std::string sub = word.substr(start, end - start);
                if (start > 0) sub = "##" + sub;
                found = lookup(sub);
                if (found >= 0) break;
            }
            if (found < 0) {
                out.push_back(unk_id_);
                ++start;
            } else {
                out.push_back(found);
                start = end;
            }
        }
        return out;
    }

    std::unordered_map<std::string, int64_t> vocab_;
    int64_t cls_id_ = -1;
    int64_t sep_id_ = -1;
    int64_t pad_id_ = 0;
    int64_t unk_id_ = -1;
};

class OnnxEmbedder : public Embedder {
public:
    explicit OnnxEmbedder(size_t max_seq_length = 256)
        : env_(ORT_LOGGING_LEVEL_WARNING, "memmem"), max_seq_length_(max_seq_length) {}

    // Returns false and sets error() on failure
    bool load(const std::string& model_path, const std::string& vocab_path) {
        try {
            if (!tokenizer_.load(vocab_path)) {
                error_ = "failed to load vocabulary from " + vocab_path;
                return false;
            }

            Ort::SessionOptions opts;
            opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
            session_ = std::make_unique<Ort::Session>(env_, model_path.c_str(), opts);

            Ort::AllocatorWithDefaultOptions allocator;
            for (size_t i = 0; i < session_->GetInputCount(); ++i) {
                input_names_.push_back(session_->GetInputNameAllocated(i, allocator).get());
            }
            output_name_ = session_->GetOutputNameAllocated(0, allocator).get();

            auto shape = session_->GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
            int64_t hidden = shape.empty() ? -1 : shape.back();
            if (hidden > 0 && static_cast<size_t>(hidden) != EMBED_DIM) {
                error_ = "model dimension " + std::to_string(hidden) +
                         " does not match " + std::to_string(EMBED_DIM);
                session_.reset();
                return false;
            }
            return true;
        } catch (const Ort::Exception& e) {
            error_ = std::string("ONNX error: ") + e.what();
            session_.reset();
            return false;
        }
    }

    std::optional<Vector> embed(const std::string& text) override {
        if (!session_) throw ProviderError("ONNX model not loaded");
        if (text.empty()) return std::nullopt;

        std::lock_guard<std::mutex> lock(mutex_);
        try {
            return run(prepare_embedding_text(text));
        } catch (const Ort::Exception& e) {
            throw ProviderError(std::string("ONNX inference failed: ") + e.what());
        }
    }

    size_t dimension() const override { return EMBED_DIM; }
    bool ready() const override { return session_ != nullptr; }
    const std::string& error() const { return error_; }

private:
    Vector run(const std::string& text) {
        auto [ids, mask] = tokenizer_.encode(text, max_seq_length_);
        std::vector<int64_t> type_ids(ids.size(), 0);

        auto memory = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        std::array<int64_t, 2> shape = {1, static_cast<int64_t>(ids.size())};

        std::vector<Ort::Value> inputs;
        std::vector<const char*> names;
        for (const auto& name : input_names_) {
            std::vector<int64_t>* source = nullptr;
            if (name == "input_ids") source = &ids;
            else if (name == "attention_mask") source = &mask;
            else if (name == "token_type_ids") source = &type_ids;
            if (!source) continue;
            inputs.push_back(Ort::Value::CreateTensor<int64_t>(
                memory, source->data(), source->size(), shape.data(), shape.size()));
            names.push_back(name.c_str());
        }

        const char* output_names[] = {output_name_.c_str()};
        auto outputs = session_->Run(Ort::RunOptions{nullptr},
                                     names.data(), inputs.data(), inputs.size(),
                                     output_names, 1);

        // Runtime shape; the declared one may be dynamic (-1)
        auto out_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        return pool_model_output(outputs[0].GetTensorData<float>(), out_shape, mask);
    }

    Ort::Env env_;
    std::unique_ptr<Ort::Session> session_;
    WordPieceTokenizer tokenizer_;
    size_t max_seq_length_;
    std::vector<std::string> input_names_;
    std::string output_name_;
    std::mutex mutex_;
    std::string error_;
};

} // namespace mm
