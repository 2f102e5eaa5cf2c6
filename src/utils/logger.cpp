// ============================================================================
// SPICEDECK - Logger Implementation
// ============================================================================

#include "spicedeck/utils/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <vector>

namespace spicedeck::utils {

namespace {

constexpr const char* kLoggerName = "spicedeck";

spdlog::level::level_enum to_spdlog(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warn:     return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> make_console_logger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    return std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
}

}  // namespace

LogLevel parse_log_level(std::string_view name) noexcept {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Logger::Impl
// ============================================================================

struct Logger::Impl {
    std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_ = make_console_logger();
    std::atomic<LogLevel> level_{LogLevel::Info};

    std::shared_ptr<spdlog::logger> current() {
        std::lock_guard<std::mutex> lock(mutex_);
        return logger_;
    }

    void replace(std::shared_ptr<spdlog::logger> logger) {
        std::lock_guard<std::mutex> lock(mutex_);
        logger_ = std::move(logger);
    }
};

Logger::Logger() : impl_(std::make_unique<Impl>()) {
    impl_->logger_->set_level(to_spdlog(LogLevel::Info));
}

Logger::~Logger() = default;

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::initialize(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    if (!config.log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.log_file, config.max_file_size_mb * 1024 * 1024, config.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            // Fall back to console only; the file location may be read-only
            auto fallback = make_console_logger();
            fallback->warn("Cannot open log file '{}': {}", config.log_file, e.what());
            if (sinks.empty()) {
                sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            }
        }
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());

    logger->set_pattern(config.pattern);
    logger->set_level(to_spdlog(config.level));
    logger->flush_on(spdlog::level::warn);

    auto& self = instance();
    self.impl_->level_ = config.level;
    self.impl_->replace(std::move(logger));
}

void Logger::shutdown() {
    auto& self = instance();
    if (auto logger = self.impl_->current()) {
        logger->flush();
    }
    self.impl_->replace(make_console_logger());
    spdlog::shutdown();
}

void Logger::set_level(LogLevel level) {
    impl_->level_ = level;
    impl_->current()->set_level(to_spdlog(level));
}

LogLevel Logger::level() const noexcept {
    return impl_->level_.load();
}

bool Logger::should_log(LogLevel level) const noexcept {
    const auto threshold = impl_->level_.load();
    return threshold != LogLevel::Off && level >= threshold;
}

void Logger::write(LogLevel level, std::string_view message) {
    impl_->current()->log(to_spdlog(level), "{}", message);
}

void Logger::flush() {
    impl_->current()->flush();
}

// ============================================================================
// ScopedTimer
// ============================================================================

void ScopedTimer::log_duration(int64_t microseconds) const {
    auto& logger = Logger::instance();
    switch (level_) {
        case LogLevel::Trace:    logger.trace("{} took {} us", name_, microseconds); break;
        case LogLevel::Debug:    logger.debug("{} took {} us", name_, microseconds); break;
        case LogLevel::Info:     logger.info("{} took {} us", name_, microseconds); break;
        case LogLevel::Warn:     logger.warn("{} took {} us", name_, microseconds); break;
        case LogLevel::Error:    logger.error("{} took {} us", name_, microseconds); break;
        case LogLevel::Critical: logger.critical("{} took {} us", name_, microseconds); break;
        case LogLevel::Off:      break;
    }
}

}  // namespace spicedeck::utils
