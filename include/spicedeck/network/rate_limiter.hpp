#pragma once
// ============================================================================
// SPICEDECK - Rate Limiter
// ============================================================================
// Sliding-window limiter for outbound API calls
// At most `capacity` admissions inside any trailing `window`; callers that
// exceed the budget are blocked until the oldest admission expires
// ============================================================================

#include "spicedeck/core/types.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace spicedeck::network {

// ============================================================================
// Time Source
// ============================================================================

/// Clock and sleeper used by the limiter. Defaults to steady_clock and
/// std::this_thread::sleep_for; tests substitute a manual clock.
struct RateLimiterClock {
    std::function<SteadyTime()> now;
    std::function<void(Duration)> sleep;

    [[nodiscard]] static RateLimiterClock system();
};

// ============================================================================
// Rate Limiter
// ============================================================================

class RateLimiter {
public:
    /// Throws std::invalid_argument if capacity <= 0 or window is not a positive finite duration
    RateLimiter(int capacity, Seconds window);
    RateLimiter(int capacity, Seconds window, RateLimiterClock clock);
    ~RateLimiter();

    // Non-copyable
    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    RateLimiter(RateLimiter&&) noexcept;
    RateLimiter& operator=(RateLimiter&&) noexcept;

    /// Try to acquire a permit. Returns true if allowed.
    [[nodiscard]] bool try_acquire();

    /// Wait until a permit is available, then acquire. Never fails.
    void acquire();

    /// Get remaining permits in current window
    [[nodiscard]] int remaining() const;

    /// Get time until the oldest admission leaves the window (zero if not full)
    [[nodiscard]] std::chrono::milliseconds time_until_reset() const;

    [[nodiscard]] int capacity() const noexcept;
    [[nodiscard]] Seconds window() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace spicedeck::network
