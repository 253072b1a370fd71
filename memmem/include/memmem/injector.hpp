#pragma once
// Session-start injector: a small markdown digest of recent observations
//
//   # my-app recent context (memmem)
//
//   ## 2025-10-01
//   - Fixed JWT expiry check: tokens were compared in seconds, not ms
//   - Added auth tests: login and refresh paths covered
//
// Observations are taken newest first and appended while both budgets
// hold. Tokens are estimated as ceil(chars / 4).

#include <memmem/config.hpp>
#include <memmem/storage.hpp>
#include <string>

namespace mm {

struct InjectResult {
    std::string markdown;
    size_t included_count = 0;
    size_t token_count = 0;
};

size_t estimate_tokens(const std::string& text);

// Empty result ({"", 0, 0}) when nothing qualifies
InjectResult inject(const Storage& storage, const std::string& project,
                    const InjectSettings& settings, Timestamp at = now());

} // namespace mm
