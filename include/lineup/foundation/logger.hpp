#pragma once

/// @file logger.hpp
/// @brief Logger facade over the kcenon common_system logger registry.
///
/// Adds per-category level filtering and structured context on top of
/// whatever ILogger the host process registers. With no logger registered
/// the registry's null logger swallows every message.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "lineup/foundation/lineup_result.hpp"
#include "lineup/foundation/types.hpp"

namespace lineup::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level one to one.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Subsystem categories, each with its own minimum level.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Process setup and shutdown
    Config      = 1, ///< Configuration loading
    Queue       = 2, ///< Queue store arrivals and removals
    Matchmaking = 3, ///< Match selection and team balancing
    Simulation  = 4  ///< Arrival simulator driver
};

inline constexpr std::size_t kLogCategoryCount = 5;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Config", "Queue", "Matchmaking", "Simulation"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name (case-sensitive, as printed by logLevelName).
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.matchId = MatchId(3);
///   ctx.extra["balance"] = "0.40";
///   logger.logWithContext(LogLevel::Info, LogCategory::Matchmaking,
///                         "Match formed", ctx);
/// @endcode
struct LogContext {
    std::optional<PlayerId> playerId;
    std::optional<MatchId> matchId;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-aware logger writing through kcenon's GlobalLoggerRegistry.
///
/// Each category resolves to a named logger "lineup.<Category>" and falls
/// back to the registry default logger when none is registered under that
/// name. Messages are prefixed with "[Category] ".
///
/// Default levels:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | Config      | Info          |
/// | Queue       | Debug         |
/// | Matchmaking | Info          |
/// | Simulation  | Info          |
class Logger {
public:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) noexcept;
    Logger& operator=(Logger&&) noexcept;

    /// Log a message. No-op if the level is below the category's minimum.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with context appended as " {key=val, ...}".
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Apply one minimum level to every category.
    void setAllLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the registry default logger.
    LineupResult<void> flush();

    /// Process-wide instance used by the LINEUP_LOG macros.
    static Logger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lineup::foundation

/// @name LINEUP_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define LINEUP_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold (0=Trace .. 6=Off).
/// @{

#ifndef LINEUP_MIN_LOG_LEVEL
    #define LINEUP_MIN_LOG_LEVEL 0
#endif

#define LINEUP_LOG(level, cat, msg)                                                 \
    do {                                                                            \
        _Pragma("GCC diagnostic push")                                              \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                         \
        if (static_cast<int>(level) >= LINEUP_MIN_LOG_LEVEL &&                      \
            ::lineup::foundation::Logger::instance().isEnabled((level), (cat)))     \
        {                                                                           \
            ::lineup::foundation::Logger::instance().log((level), (cat), (msg));    \
        }                                                                           \
        _Pragma("GCC diagnostic pop")                                               \
    } while (0)

#define LINEUP_LOG_DEBUG(cat, msg) \
    LINEUP_LOG(::lineup::foundation::LogLevel::Debug, (cat), (msg))

#define LINEUP_LOG_INFO(cat, msg) \
    LINEUP_LOG(::lineup::foundation::LogLevel::Info, (cat), (msg))

#define LINEUP_LOG_WARN(cat, msg) \
    LINEUP_LOG(::lineup::foundation::LogLevel::Warning, (cat), (msg))

#define LINEUP_LOG_ERROR(cat, msg) \
    LINEUP_LOG(::lineup::foundation::LogLevel::Error, (cat), (msg))

#define LINEUP_LOG_CRITICAL(cat, msg) \
    LINEUP_LOG(::lineup::foundation::LogLevel::Critical, (cat), (msg))

/// @}
