#pragma once
// ============================================================================
// SPICEDECK - Core Types
// ============================================================================
// Time types and small value types shared across the manager
// ============================================================================

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace spicedeck {

// ============================================================================
// Time Types
// ============================================================================

/// Wall-clock timestamp with nanosecond precision
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

/// Monotonic clock used for all interval arithmetic
using SteadyClock = std::chrono::steady_clock;
using SteadyTime = SteadyClock::time_point;

/// Duration in nanoseconds
using Duration = std::chrono::nanoseconds;

/// Fractional seconds, used for configured windows and timeouts
using Seconds = std::chrono::duration<double>;

/// Get current wall-clock timestamp with nanosecond precision
[[nodiscard]] inline Timestamp now() noexcept {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now());
}

// ============================================================================
// Component Identity
// ============================================================================

/// Things the manager can check for updates
enum class Component : uint8_t {
    CliTool,
    Manager
};

[[nodiscard]] inline std::string_view to_string(Component component) noexcept {
    switch (component) {
        case Component::CliTool: return "spicetify";
        case Component::Manager: return "spicedeck";
    }
    return "unknown";
}

}  // namespace spicedeck
