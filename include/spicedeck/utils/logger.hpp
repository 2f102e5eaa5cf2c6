#pragma once
// ============================================================================
// SPICEDECK - Logger
// ============================================================================
// Process-wide logging facade over spdlog
// Console sink always, rotating file sink when a log file is configured
// ============================================================================

#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace spicedeck::utils {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/// Map a config string ("debug", "WARN", ...) to a level; unknown strings give Info
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string log_file = "spicedeck.log";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

    bool console = true;            // Echo to stderr

    // File settings
    size_t max_file_size_mb = 5;
    size_t max_files = 3;
};

// ============================================================================
// Logger Interface
// ============================================================================

class Logger {
public:
    /// Initialize the global logger
    static void initialize(const LogConfig& config = LogConfig{});

    /// Shutdown the logger (flush and close)
    static void shutdown();

    /// Get the global logger instance
    static Logger& instance();

    /// Set log level
    void set_level(LogLevel level);

    [[nodiscard]] LogLevel level() const noexcept;

    /// Log methods
    template <typename... Args>
    void trace(std::string_view format, Args&&... args) {
        log(LogLevel::Trace, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(std::string_view format, Args&&... args) {
        log(LogLevel::Debug, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::string_view format, Args&&... args) {
        log(LogLevel::Info, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::string_view format, Args&&... args) {
        log(LogLevel::Warn, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::string_view format, Args&&... args) {
        log(LogLevel::Error, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void critical(std::string_view format, Args&&... args) {
        log(LogLevel::Critical, format, std::forward<Args>(args)...);
    }

    /// Flush all pending logs
    void flush();

    ~Logger();

private:
    Logger();

    template <typename... Args>
    void log(LogLevel level, std::string_view format, Args&&... args) {
        if (!should_log(level)) return;
        if constexpr (sizeof...(Args) == 0) {
            write(level, format);
        } else {
            write(level, fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
        }
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept;
    void write(LogLevel level, std::string_view message);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define LOG_TRACE(...) ::spicedeck::utils::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::spicedeck::utils::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...) ::spicedeck::utils::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...) ::spicedeck::utils::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) ::spicedeck::utils::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::spicedeck::utils::Logger::instance().critical(__VA_ARGS__)

// ============================================================================
// Scoped Timer for Performance Measurement
// ============================================================================

class ScopedTimer {
public:
    explicit ScopedTimer(std::string_view name, LogLevel level = LogLevel::Debug)
        : name_(name), level_(level), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        const auto end = std::chrono::steady_clock::now();
        const auto duration =
            std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
        log_duration(duration);
    }

    // Non-copyable
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    void log_duration(int64_t microseconds) const;

    std::string_view name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_;
};

#define SPICEDECK_CONCAT_INNER(a, b) a##b
#define SPICEDECK_CONCAT(a, b) SPICEDECK_CONCAT_INNER(a, b)
#define SCOPED_TIMER(name) ::spicedeck::utils::ScopedTimer SPICEDECK_CONCAT(_timer_, __LINE__)(name)

}  // namespace spicedeck::utils
