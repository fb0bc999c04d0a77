/// @file logger.cpp
/// @brief Logger implementation over kcenon's GlobalLoggerRegistry.

#include "lineup/foundation/logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>

namespace lineup::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: lineup -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Info,   // Config
    LogLevel::Debug,  // Queue
    LogLevel::Info,   // Matchmaking
    LogLevel::Info    // Simulation
};

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    for (uint8_t i = 0; i <= static_cast<uint8_t>(LogLevel::Off); ++i) {
        auto level = static_cast<LogLevel>(i);
        if (logLevelName(level) == name) {
            return level;
        }
    }
    return std::nullopt;
}

static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.playerId && ctx.playerId->isValid()) {
        append("player_id", std::to_string(ctx.playerId->value()));
    }
    if (ctx.matchId && ctx.matchId->isValid()) {
        append("match_id", std::to_string(ctx.matchId->value()));
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct Logger::Impl {
    // Atomic so the hot-path isEnabled() check never takes a lock.
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("lineup.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        if (!logger || logger == kci::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return logger;
    }

    void write(LogLevel level, LogCategory cat, std::string_view msg,
               std::string_view ctx) const {
        // Format: [Category] message {key=val, ...}
        std::string formatted;
        formatted.reserve(msg.size() + ctx.size() + 20);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!ctx.empty()) {
            formatted += " {";
            formatted += ctx;
            formatted += '}';
        }

        auto logger = getLogger(cat);
        // Sink errors are not reported to callers.
        (void)logger->log(mapLevel(level), formatted);
    }
};

Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

Logger::Logger(Logger&&) noexcept = default;
Logger& Logger::operator=(Logger&&) noexcept = default;

void Logger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->write(level, cat, msg, {});
}

void Logger::logWithContext(LogLevel level, LogCategory cat,
                            std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->write(level, cat, msg, formatContext(ctx));
}

void Logger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

void Logger::setAllLevels(LogLevel minLevel) {
    for (auto& level : impl_->categoryLevels) {
        level.store(minLevel, std::memory_order_release);
    }
}

LogLevel Logger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool Logger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

LineupResult<void> Logger::flush() {
    auto logger = kci::GlobalLoggerRegistry::instance().get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return LineupResult<void>::err(
            LineupError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return LineupResult<void>::ok();
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

} // namespace lineup::foundation
