#pragma once

/// @file rank_logger.hpp
/// @brief RankLogger wrapping kcenon common_system's logger registry.
///
/// Category-based filtering with per-category runtime levels, plus
/// structured context (session, request correlator, round).

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "arank/foundation/rank_result.hpp"
#include "arank/foundation/types.hpp"

namespace arank::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per library component.
enum class LogCategory : uint8_t {
    Core         = 0, ///< Configuration, startup, shared infrastructure
    Fitter       = 1, ///< Bayesian refit / Newton iterations
    Selector     = 2, ///< Information-gain pair selection
    Stopping     = 3, ///< Stopping policy and forecaster
    Orchestrator = 4, ///< Session state machine and speculation
    Backend      = 5  ///< Compute backend request handling
};

inline constexpr std::size_t kLogCategoryCount = 6;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Fitter", "Selector", "Stopping", "Orchestrator", "Backend"
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

/// Parse a level name as written in configuration files ("debug", "INFO").
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.sessionId = SessionId(3);
///   ctx.round = 12;
///   ctx.extra["reason"] = "stability";
///   logger.logWithContext(LogLevel::Info, LogCategory::Orchestrator,
///                         "session stopped", ctx);
/// @endcode
struct LogContext {
    std::optional<SessionId> sessionId;
    std::optional<RequestId> requestId;
    std::optional<std::size_t> round;
    std::unordered_map<std::string, std::string> extra;
};

/// Library logger forwarding to kcenon's GlobalLoggerRegistry.
///
/// Messages go to a named logger "arank.<Category>" when one is registered,
/// otherwise to the registry's default logger. Uses PIMPL to keep kcenon
/// headers out of the public API.
///
/// Default levels:
/// | Category     | Default Level |
/// |--------------|---------------|
/// | Core         | Info          |
/// | Fitter       | Warning       |
/// | Selector     | Info          |
/// | Stopping     | Info          |
/// | Orchestrator | Info          |
/// | Backend      | Info          |
class RankLogger {
public:
    RankLogger();
    ~RankLogger();

    RankLogger(const RankLogger&) = delete;
    RankLogger& operator=(const RankLogger&) = delete;
    RankLogger(RankLogger&&) noexcept;
    RankLogger& operator=(RankLogger&&) noexcept;

    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Context fields are appended as "{key=val, ...}".
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Apply one level to every category.
    void setAllLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    RankResult<void> flush();

    static RankLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace arank::foundation

/// @name ARANK_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define ARANK_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold (0=Trace ... 6=Off).
/// @{

#ifndef ARANK_MIN_LOG_LEVEL
    #define ARANK_MIN_LOG_LEVEL 0
#endif

#define ARANK_LOG(level, cat, msg)                                                  \
    do {                                                                            \
        _Pragma("GCC diagnostic push")                                              \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                         \
        if (static_cast<int>(level) >= ARANK_MIN_LOG_LEVEL &&                       \
            ::arank::foundation::RankLogger::instance().isEnabled((level), (cat)))  \
        {                                                                           \
            ::arank::foundation::RankLogger::instance().log((level), (cat), (msg)); \
        }                                                                           \
        _Pragma("GCC diagnostic pop")                                               \
    } while (0)

#define ARANK_LOG_DEBUG(cat, msg) \
    ARANK_LOG(::arank::foundation::LogLevel::Debug, (cat), (msg))

#define ARANK_LOG_INFO(cat, msg) \
    ARANK_LOG(::arank::foundation::LogLevel::Info, (cat), (msg))

#define ARANK_LOG_WARN(cat, msg) \
    ARANK_LOG(::arank::foundation::LogLevel::Warning, (cat), (msg))

#define ARANK_LOG_ERROR(cat, msg) \
    ARANK_LOG(::arank::foundation::LogLevel::Error, (cat), (msg))

/// @}
