#pragma once

/// @file console_logger.hpp
/// @brief kcenon ILogger sink writing timestamped lines to a std::ostream.
///
/// Register it with the kcenon GlobalLoggerRegistry to make Logger output
/// visible; without a registered sink every message is dropped.

#include <atomic>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>

#include <kcenon/common/interfaces/logger_interface.h>

namespace lineup::foundation {

class ConsoleLogger : public kcenon::common::interfaces::ILogger {
public:
    /// @param out Destination stream; must outlive the logger.
    explicit ConsoleLogger(std::ostream& out);

    kcenon::common::VoidResult log(kcenon::common::interfaces::log_level level,
                                   const std::string& message) override;

    kcenon::common::VoidResult log(
        kcenon::common::interfaces::log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& loc) override;

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override;

    bool is_enabled(kcenon::common::interfaces::log_level level) const override;

    kcenon::common::VoidResult set_level(kcenon::common::interfaces::log_level level) override;

    kcenon::common::interfaces::log_level get_level() const override;

    kcenon::common::VoidResult flush() override;

    /// Install a ConsoleLogger on std::clog as the registry default logger.
    static void installDefault(kcenon::common::interfaces::log_level level);

private:
    std::ostream& out_;
    std::mutex mutex_;
    std::atomic<kcenon::common::interfaces::log_level> minLevel_{
        kcenon::common::interfaces::log_level::info};
};

} // namespace lineup::foundation
