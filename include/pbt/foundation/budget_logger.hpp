#pragma once

/// @file budget_logger.hpp
/// @brief BudgetLogger wrapping kcenon logger interfaces for structured logging.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "pbt/foundation/budget_result.hpp"
#include "pbt/foundation/types.hpp"

namespace pbt::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per library layer.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Library-wide messages
    Config   = 1, ///< Configuration loading
    Budget   = 2, ///< Over/under budget transitions
    Registry = 3, ///< Tracker creation and eviction
    Service  = 4  ///< Request handling
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 5;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Config", "Budget", "Registry", "Service"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
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

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.projectId = ProjectId(42);
///   ctx.configName = "default";
///   ctx.extra["spent"] = "105";
///   logger.logWithContext(LogLevel::Info, LogCategory::Budget,
///                         "project exceeds budget", ctx);
/// @endcode
struct LogContext {
    std::optional<ProjectId> projectId;
    std::optional<std::string> configName;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger wrapping kcenon's logging interfaces.
///
/// Uses PIMPL to keep kcenon headers out of the public API. Messages are
/// routed to the logger registered under "pbt.<Category>" in kcenon's
/// GlobalLoggerRegistry, falling back to the default logger.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Config   | Info          |
/// | Budget   | Info          |
/// | Registry | Info          |
/// | Service  | Warning       |
class BudgetLogger {
public:
    BudgetLogger();
    ~BudgetLogger();

    BudgetLogger(const BudgetLogger&) = delete;
    BudgetLogger& operator=(const BudgetLogger&) = delete;
    BudgetLogger(BudgetLogger&&) noexcept;
    BudgetLogger& operator=(BudgetLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    BudgetResult<void> flush();

    /// Process-wide instance used by the PBT_LOG macros and the library.
    static BudgetLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pbt::foundation

/// @name PBT_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// PBT_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef PBT_MIN_LOG_LEVEL
    #define PBT_MIN_LOG_LEVEL 0
#endif

#define PBT_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= PBT_MIN_LOG_LEVEL &&                      \
            ::pbt::foundation::BudgetLogger::instance().isEnabled((level), (cat))) \
        {                                                                        \
            ::pbt::foundation::BudgetLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define PBT_LOG_DEBUG(cat, msg) \
    PBT_LOG(::pbt::foundation::LogLevel::Debug, (cat), (msg))

#define PBT_LOG_INFO(cat, msg) \
    PBT_LOG(::pbt::foundation::LogLevel::Info, (cat), (msg))

#define PBT_LOG_WARN(cat, msg) \
    PBT_LOG(::pbt::foundation::LogLevel::Warning, (cat), (msg))

#define PBT_LOG_ERROR(cat, msg) \
    PBT_LOG(::pbt::foundation::LogLevel::Error, (cat), (msg))

/// @}
