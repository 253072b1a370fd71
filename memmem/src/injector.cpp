#include <memmem/injector.hpp>

namespace mm {

namespace {

// One bullet per observation, on a single line
std::string bullet(const Observation& obs) {
    std::string line = "- " + obs.title;
    if (!obs.narrative.empty()) line += ": " + obs.narrative;
    for (char& c : line) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    return line + "\n";
}

} // namespace

size_t estimate_tokens(const std::string& text) {
    return (text.size() + 3) / 4;
}

InjectResult inject(const Storage& storage, const std::string& project,
                    const InjectSettings& settings, Timestamp at) {
    if (settings.max_observations == 0 || settings.max_tokens == 0) return {};

    Timestamp since = at - static_cast<Timestamp>(settings.recency_days) * MS_PER_DAY;
    auto candidates = storage.recent_observations(
        since, settings.project_only ? project : std::string(), settings.max_observations);
    if (candidates.empty()) return {};

    const std::string label = project.empty() ? "all projects" : project;
    std::string markdown = "# " + label + " recent context (memmem)\n";

    InjectResult result;
    std::string current_day;
    for (const auto& obs : candidates) {
        if (result.included_count >= settings.max_observations) break;

        std::string piece;
        std::string day = format_date(obs.timestamp);
        if (day != current_day) piece += "\n## " + day + "\n";
        piece += bullet(obs);

        if (estimate_tokens(markdown + piece) > settings.max_tokens) break;

        markdown += piece;
        current_day = day;
        ++result.included_count;
    }

    if (result.included_count == 0) return {};

    result.markdown = std::move(markdown);
    result.token_count = estimate_tokens(result.markdown);
    return result;
}

} // namespace mm
