#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for lineup.

#include <cstdint>
#include <string_view>

namespace lineup::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the error source
/// can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Config (0x0100 - 0x01FF)
    ConfigLoadFailed = 0x0100,
    ConfigKeyNotFound = 0x0101,
    ConfigTypeMismatch = 0x0102,

    // Matchmaking (0x0200 - 0x02FF)
    InvalidRatingDistance = 0x0200,
    QueueInconsistent = 0x0201,

    // Simulation (0x0300 - 0x03FF)
    InvalidSimulationConfig = 0x0300,

    // Logger (0x0400 - 0x04FF)
    LoggerError = 0x0400,
    LoggerFlushFailed = 0x0401,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    switch (value & 0xFF00) {
        case 0x0000: return "General";
        case 0x0100: return "Config";
        case 0x0200: return "Matchmaking";
        case 0x0300: return "Simulation";
        case 0x0400: return "Logger";
        default: return "Unknown";
    }
}

} // namespace lineup::foundation
