#pragma once
// LLM providers for observation extraction
//
// complete() returns the model's text or throws ProviderError.
// CommandLlmProvider writes "<system>\n\n<prompt>" to an external
// command's stdin and takes its stdout as the completion, e.g.
// `claude -p` or a local model wrapper.

#include <memmem/errors.hpp>
#include <memmem/ratelimiter.hpp>
#include <memory>
#include <string>
#include <vector>

namespace mm {

struct LlmOptions {
    std::string system_prompt;
    int max_tokens = 2048;
};

class LlmProvider {
public:
    virtual ~LlmProvider() = default;

    virtual std::string complete(const std::string& prompt, const LlmOptions& options) = 0;
    virtual std::string name() const = 0;
};

class CommandLlmProvider : public LlmProvider {
public:
    static constexpr int DEFAULT_TIMEOUT_MS = 120000;

    // argv[0] is looked up on PATH. limiter may be null.
    CommandLlmProvider(std::vector<std::string> argv, std::shared_ptr<RateLimiter> limiter,
                       int timeout_ms = DEFAULT_TIMEOUT_MS);

    std::string complete(const std::string& prompt, const LlmOptions& options) override;
    std::string name() const override;

private:
    std::vector<std::string> argv_;
    std::shared_ptr<RateLimiter> limiter_;
    int timeout_ms_;
};

} // namespace mm
