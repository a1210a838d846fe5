#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the ranking library.

#include <cstdint>
#include <string_view>

namespace arank::foundation {

/// Error codes grouped by subsystem in 256-value hex ranges.
///
/// The upper byte identifies the subsystem, so the source of an error can
/// be recovered from the numeric value alone (see errorSubsystem()).
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Ranking (0x0100 - 0x01FF)
    InvalidItem = 0x0100,
    IllegalState = 0x0101,
    NumericalFailure = 0x0102,

    // Backend (0x0200 - 0x02FF)
    BackendUnavailable = 0x0200,
    BackendRequestFailed = 0x0201,
    BackendResponseMismatch = 0x0202,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalidValue = 0x0603,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    JobNotFound = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Ranking";
        case 0x0200: return "Backend";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace arank::foundation
