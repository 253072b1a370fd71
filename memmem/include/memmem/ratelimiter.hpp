#pragma once
// RateLimiter: token bucket in front of embedding and LLM providers
//
// The bucket starts full (burst_size tokens) and refills at
// requests_per_second. acquire() blocks; waiters are served in ticket
// order so no caller starves behind later arrivals.

#include <memmem/config.hpp>
#include <memmem/errors.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace mm {

class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(const RateLimitSettings& settings)
        : max_tokens_(settings.burst_size),
          rate_per_ms_(settings.requests_per_second / 1000.0),
          tokens_(settings.burst_size),
          last_refill_(Clock::now())
    {
        if (settings.requests_per_second <= 0.0) {
            throw ValidationError("rate limit requests_per_second must be positive");
        }
        if (settings.burst_size < 1.0) {
            throw ValidationError("rate limit burst_size must be at least 1");
        }
    }

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Block until a token is available, then take it
    void acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        const uint64_t ticket = next_ticket_++;

        while (true) {
            refill();
            if (ticket == serving_ && tokens_ >= 1.0) {
                tokens_ -= 1.0;
                ++serving_;
                cv_.notify_all();
                return;
            }
            if (ticket != serving_) {
                cv_.wait(lock);
                continue;
            }
            // Head of the queue: sleep until the next token is due
            double needed = 1.0 - tokens_;
            auto wait_ms = static_cast<int64_t>(std::ceil(needed / rate_per_ms_));
            cv_.wait_for(lock, std::chrono::milliseconds(std::max<int64_t>(wait_ms, 1)));
        }
    }

    // Take a token only if one is free and nobody is queued
    bool try_acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        refill();
        if (serving_ == next_ticket_ && tokens_ >= 1.0) {
            tokens_ -= 1.0;
            return true;
        }
        return false;
    }

    size_t available_tokens() {
        std::lock_guard<std::mutex> lock(mutex_);
        refill();
        return static_cast<size_t>(std::floor(tokens_));
    }

    size_t waiting() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(next_ticket_ - serving_);
    }

private:
    void refill() {
        auto now = Clock::now();
        auto elapsed = std::chrono::duration<double, std::milli>(now - last_refill_).count();
        if (elapsed > 0.0) {
            tokens_ = std::min(max_tokens_, tokens_ + elapsed * rate_per_ms_);
            last_refill_ = now;
        }
    }

    const double max_tokens_;
    const double rate_per_ms_;
    double tokens_;
    Clock::time_point last_refill_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t next_ticket_ = 0;
    uint64_t serving_ = 0;
};

} // namespace mm
