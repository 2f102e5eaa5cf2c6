// ============================================================================
// SPICEDECK - Rate Limiter Implementation
// ============================================================================

#include "spicedeck/network/rate_limiter.hpp"
#include "spicedeck/utils/logger.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace spicedeck::network {

RateLimiterClock RateLimiterClock::system() {
    RateLimiterClock clock;
    clock.now = [] { return SteadyClock::now(); };
    clock.sleep = [](Duration d) { std::this_thread::sleep_for(d); };
    return clock;
}

// ============================================================================
// RateLimiter::Impl
// ============================================================================

struct RateLimiter::Impl {
    int capacity_;
    Seconds window_seconds_;
    Duration window_;
    RateLimiterClock clock_;
    std::deque<SteadyTime> calls_;
    mutable std::mutex mutex_;

    Impl(int capacity, Seconds window, RateLimiterClock clock)
        : capacity_(capacity)
        , window_seconds_(window)
        , window_(std::chrono::duration_cast<Duration>(window))
        , clock_(std::move(clock)) {}

    bool try_acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_.now();
        prune(now);

        if (static_cast<int>(calls_.size()) >= capacity_) {
            return false;
        }

        calls_.push_back(now);
        return true;
    }

    void acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_.now();
        prune(now);

        if (static_cast<int>(calls_.size()) >= capacity_) {
            const auto wait = sleep_duration(now);
            LOG_DEBUG("Rate limit reached ({} calls per {:.0f}s), waiting {} ms",
                      capacity_, window_seconds_.count(),
                      std::chrono::duration_cast<std::chrono::milliseconds>(wait).count());
            if (wait > Duration::zero()) {
                clock_.sleep(wait);
            }

            now = clock_.now();
            prune(now);
            // A clock that stalled or stepped backward can leave the window full
            // after the clamped sleep; the oldest entry has been waited out.
            while (static_cast<int>(calls_.size()) >= capacity_) {
                calls_.pop_front();
            }
        }

        calls_.push_back(now);
    }

    int remaining() const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_.now();
        const auto live = std::count_if(calls_.begin(), calls_.end(),
                                        [&](SteadyTime t) { return !expired(t, now); });
        return std::max(0, capacity_ - static_cast<int>(live));
    }

    std::chrono::milliseconds time_until_reset() const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_.now();
        auto first = std::find_if(calls_.begin(), calls_.end(),
                                  [&](SteadyTime t) { return !expired(t, now); });
        const auto live = std::distance(first, calls_.end());
        if (live < capacity_) {
            return std::chrono::milliseconds(0);
        }
        return std::chrono::ceil<std::chrono::milliseconds>(clamp_wait(window_ - (now - *first)));
    }

private:
    bool expired(SteadyTime t, SteadyTime now) const {
        return now - t >= window_;
    }

    void prune(SteadyTime now) {
        while (!calls_.empty() && expired(calls_.front(), now)) {
            calls_.pop_front();
        }
    }

    Duration sleep_duration(SteadyTime now) const {
        return clamp_wait(window_ - (now - calls_.front()));
    }

    // Negative waits come from drift, waits beyond the window from a clock
    // that moved backward past the recorded timestamp.
    Duration clamp_wait(Duration wait) const {
        return std::clamp(wait, Duration::zero(), window_);
    }
};

// ============================================================================
// RateLimiter Public Interface
// ============================================================================

RateLimiter::RateLimiter(int capacity, Seconds window)
    : RateLimiter(capacity, window, RateLimiterClock::system()) {}

RateLimiter::RateLimiter(int capacity, Seconds window, RateLimiterClock clock) {
    if (capacity <= 0) {
        throw std::invalid_argument("rate limiter capacity must be positive, got " +
                                    std::to_string(capacity));
    }
    if (!std::isfinite(window.count()) || window.count() <= 0.0) {
        throw std::invalid_argument("rate limiter window must be a positive number of seconds");
    }
    // The window is held as integral nanoseconds
    const Seconds max_window = std::chrono::duration_cast<Seconds>(Duration::max());
    if (window >= max_window || std::chrono::duration_cast<Duration>(window) < Duration(1)) {
        throw std::invalid_argument("rate limiter window must lie between 1ns and " +
                                    std::to_string(max_window.count()) + "s");
    }
    if (!clock.now || !clock.sleep) {
        throw std::invalid_argument("rate limiter clock requires both now and sleep");
    }
    impl_ = std::make_unique<Impl>(capacity, window, std::move(clock));
}

RateLimiter::~RateLimiter() = default;
RateLimiter::RateLimiter(RateLimiter&&) noexcept = default;
RateLimiter& RateLimiter::operator=(RateLimiter&&) noexcept = default;

bool RateLimiter::try_acquire() {
    return impl_->try_acquire();
}

void RateLimiter::acquire() {
    impl_->acquire();
}

int RateLimiter::remaining() const {
    return impl_->remaining();
}

std::chrono::milliseconds RateLimiter::time_until_reset() const {
    return impl_->time_until_reset();
}

int RateLimiter::capacity() const noexcept {
    return impl_->capacity_;
}

Seconds RateLimiter::window() const noexcept {
    return impl_->window_seconds_;
}

}  // namespace spicedeck::network
