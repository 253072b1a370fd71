#pragma once
// Worker wire protocol: one JSON object per line
//
//   request   {"id": "...", "text": "..."}
//   success   {"id": "...", "embedding": [768 floats]}
//   failure   {"id": "...", "error": "..."}

#include <memmem/errors.hpp>
#include <memmem/types.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace mm::wire {

using json = nlohmann::json;

constexpr const char* NULL_EMBEDDING_ERROR = "embedding returned null";
constexpr const char* UNKNOWN_ID = "unknown";

struct EmbedRequest {
    std::string id;
    std::string text;
};

struct EmbedResponse {
    std::string id;
    std::optional<Vector> embedding;
    std::string error;          // Set when embedding is absent
};

inline std::string encode_request(const std::string& id, const std::string& text) {
    return json{{"id", id}, {"text", text}}.dump();
}

// Best-effort id for error replies; "unknown" when not recoverable
inline std::string request_id_of(const std::string& line) {
    json j = json::parse(line, nullptr, false);
    if (j.is_object() && j.contains("id") && j["id"].is_string()) {
        return j["id"].get<std::string>();
    }
    return UNKNOWN_ID;
}

// Throws ProtocolError on malformed lines
inline EmbedRequest decode_request(const std::string& line) {
    json j;
    try {
        j = json::parse(line);
    } catch (const json::parse_error& e) {
        throw ProtocolError(std::string("invalid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ProtocolError("invalid request: not an object");
    }
    if (!j.contains("id") || !j["id"].is_string()) {
        throw ProtocolError("invalid request: missing id");
    }
    if (!j.contains("text") || !j["text"].is_string()) {
        throw ProtocolError("invalid request: missing text");
    }
    return {j["id"].get<std::string>(), j["text"].get<std::string>()};
}

inline std::string encode_embedding(const std::string& id, const Vector& v) {
    return json{{"id", id}, {"embedding", v.data}}.dump();
}

inline std::string encode_error(const std::string& id, const std::string& message) {
    return json{{"id", id}, {"error", message}}.dump();
}

// Throws ProtocolError on malformed lines or a wrong-sized vector
inline EmbedResponse decode_response(const std::string& line) {
    json j;
    try {
        j = json::parse(line);
    } catch (const json::parse_error& e) {
        throw ProtocolError(std::string("invalid response JSON: ") + e.what());
    }
    if (!j.is_object() || !j.contains("id") || !j["id"].is_string()) {
        throw ProtocolError("response without id");
    }

    EmbedResponse response;
    response.id = j["id"].get<std::string>();

    if (j.contains("embedding") && j["embedding"].is_array()) {
        auto values = j["embedding"].get<std::vector<float>>();
        if (values.size() != EMBED_DIM) {
            throw ProtocolError("embedding has " + std::to_string(values.size()) +
                                " dimensions, expected " + std::to_string(EMBED_DIM));
        }
        response.embedding = Vector(std::move(values));
    } else if (j.contains("error") && j["error"].is_string()) {
        response.error = j["error"].get<std::string>();
    } else {
        throw ProtocolError("response has neither embedding nor error");
    }
    return response;
}

} // namespace mm::wire
