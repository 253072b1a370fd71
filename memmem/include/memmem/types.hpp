#pragma once
// Core types: what a remembered session is made of
//
// Exchanges are raw turns copied out of transcripts.
// Observations are the distilled insights.
// PendingEvents wait in between.

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mm {

// Embedding dimension (embeddinggemma-300m compatible)
constexpr size_t EMBED_DIM = 768;

// Timestamp as Unix millis
using Timestamp = int64_t;

constexpr int64_t MS_PER_DAY = 24LL * 60 * 60 * 1000;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Parse "2025-10-01T12:34:56.789Z" (fraction and zone optional).
// Returns nullopt if the string is not ISO-8601 shaped.
inline std::optional<Timestamp> parse_iso8601(const std::string& s) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (sscanf(s.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed) != 3 || consumed != 10) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) return std::nullopt;

    int64_t millis = 0;
    if (s.size() > 10) {
        if (s[10] != 'T' && s[10] != ' ') return std::nullopt;
        if (sscanf(s.c_str() + 11, "%2d:%2d:%2d", &hour, &minute, &second) != 3) {
            return std::nullopt;
        }
        size_t pos = 19;
        if (pos < s.size() && s[pos] == '.') {
            ++pos;
            int digits = 0;
            while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
                if (digits < 3) millis = millis * 10 + (s[pos] - '0');
                ++digits;
                ++pos;
            }
            for (; digits < 3; ++digits) millis *= 10;
        }
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    time_t secs = timegm(&tm);
    return static_cast<Timestamp>(secs) * 1000 + millis;
}

inline std::string format_iso8601(Timestamp ts) {
    time_t secs = static_cast<time_t>(ts / 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
             tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
             tm.tm_hour, tm.tm_min, tm.tm_sec,
             static_cast<int>(ts % 1000));
    return buf;
}

// "YYYY-MM-DD" in UTC
inline std::string format_date(Timestamp ts) {
    return format_iso8601(ts).substr(0, 10);
}

// Semantic vector - fixed length, compared by cosine
class Vector {
public:
    std::vector<float> data;

    Vector() : data(EMBED_DIM, 0.0f) {}

    explicit Vector(std::vector<float> v) : data(std::move(v)) {}

    const float* as_ptr() const { return data.data(); }
    float* as_ptr() { return data.data(); }
    size_t size() const { return data.size(); }

    float& operator[](size_t i) { return data[i]; }
    const float& operator[](size_t i) const { return data[i]; }

    // Cosine similarity (single pass); 0 for mismatched or zero vectors
    float cosine(const Vector& other) const {
        if (data.size() != other.data.size()) return 0.0f;
        float dot = 0.0f, norm_a = 0.0f, norm_b = 0.0f;
        for (size_t i = 0; i < data.size(); ++i) {
            float ai = data[i];
            float bi = other.data[i];
            dot += ai * bi;
            norm_a += ai * ai;
            norm_b += bi * bi;
        }
        float denom = std::sqrt(norm_a) * std::sqrt(norm_b);
        return denom > 0.0f ? dot / denom : 0.0f;
    }

    float norm() const {
        float sum_sq = 0.0f;
        for (float x : data) sum_sq += x * x;
        return std::sqrt(sum_sq);
    }

    // Normalize to unit vector
    void normalize() {
        float n = norm();
        if (n > 0.0f) {
            for (float& x : data) x /= n;
        }
    }
};

// One tool invocation inside an Exchange
struct ToolCall {
    std::string id;
    std::string exchange_id;
    std::string tool_name;
    std::string tool_input;      // JSON text
    std::string tool_result;
    bool is_error = false;
    Timestamp timestamp = 0;
};

// One user/assistant turn
struct Exchange {
    std::string id;
    std::string project;
    Timestamp timestamp = 0;
    std::string user_message;
    std::string assistant_message;
    std::string archive_path;
    int line_start = 0;          // 1-indexed, inclusive
    int line_end = 0;

    std::string session_id;
    std::string cwd;
    std::string git_branch;
    std::string assistant_version;
    std::string parent_uuid;
    bool is_sidechain = false;

    std::optional<Vector> embedding;
    std::optional<std::string> compressed_tool_summary;

    std::vector<ToolCall> tool_calls;
};

// Durable insight, never mutated after creation
struct Observation {
    int64_t id = 0;
    std::string project;
    std::string session_id;
    Timestamp timestamp = 0;
    std::string type;
    std::string title;
    std::string subtitle;
    std::string narrative;
    std::vector<std::string> facts;
    std::vector<std::string> concepts;
    std::vector<std::string> files_read;
    std::vector<std::string> files_modified;
    std::optional<Vector> embedding;
};

// Compressed tool-use event awaiting batch extraction
struct PendingEvent {
    int64_t id = 0;
    std::string session_id;
    std::string project;
    std::string tool_name;
    std::string merged_data;
    Timestamp timestamp = 0;
};

// Bookkeeping for one archive file
struct IndexedFile {
    std::string archive_path;
    std::string project;
    Timestamp indexed_at = 0;
    int exchange_count = 0;
    bool excluded = false;
};

// Derived aggregate, computed on demand
struct IndexStats {
    size_t exchanges = 0;
    size_t embedded_exchanges = 0;
    size_t tool_calls = 0;
    size_t observations = 0;
    size_t pending_events = 0;
    size_t indexed_files = 0;
    std::optional<Timestamp> earliest;
    std::optional<Timestamp> latest;
    std::map<std::string, size_t> exchanges_per_project;
};

} // namespace mm
