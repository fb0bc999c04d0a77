/// @file console_logger.cpp
/// @brief ConsoleLogger implementation.

#include "lineup/foundation/console_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>

namespace lineup::foundation {

namespace kci = kcenon::common::interfaces;

namespace {

const char* levelTag(kci::log_level level) {
    switch (level) {
        case kci::log_level::trace:    return "TRACE";
        case kci::log_level::debug:    return "DEBUG";
        case kci::log_level::info:     return "INFO";
        case kci::log_level::warning:  return "WARN";
        case kci::log_level::error:    return "ERROR";
        case kci::log_level::critical: return "CRIT";
        default:                       return "-";
    }
}

} // namespace

ConsoleLogger::ConsoleLogger(std::ostream& out) : out_(out) {}

kcenon::common::VoidResult ConsoleLogger::log(kci::log_level level,
                                              const std::string& message) {
    if (!is_enabled(level)) {
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::lock_guard lock(mutex_);
    out_ << std::put_time(&tm, "%H:%M:%S") << ' ' << std::setw(5) << std::left
         << levelTag(level) << std::right << ' ' << message << '\n';
    return kcenon::common::VoidResult::ok(std::monostate{});
}

kcenon::common::VoidResult ConsoleLogger::log(kci::log_level level,
                                              std::string_view message,
                                              const kci::source_location& /*loc*/) {
    return log(level, std::string(message));
}

kcenon::common::VoidResult ConsoleLogger::log(const kci::log_entry& entry) {
    return log(entry.level, entry.message);
}

bool ConsoleLogger::is_enabled(kci::log_level level) const {
    return level >= minLevel_.load(std::memory_order_acquire);
}

kcenon::common::VoidResult ConsoleLogger::set_level(kci::log_level level) {
    minLevel_.store(level, std::memory_order_release);
    return kcenon::common::VoidResult::ok(std::monostate{});
}

kci::log_level ConsoleLogger::get_level() const {
    return minLevel_.load(std::memory_order_acquire);
}

kcenon::common::VoidResult ConsoleLogger::flush() {
    std::lock_guard lock(mutex_);
    out_.flush();
    return kcenon::common::VoidResult::ok(std::monostate{});
}

void ConsoleLogger::installDefault(kci::log_level level) {
    auto logger = std::make_shared<ConsoleLogger>(std::clog);
    (void)logger->set_level(level);
    kci::GlobalLoggerRegistry::instance().set_default_logger(logger);
}

} // namespace lineup::foundation
