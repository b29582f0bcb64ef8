#pragma once

/// @file engine_logger.hpp
/// @brief EngineLogger wrapping kcenon common_system logging with engine categories.
///
/// Provides category-based filtering, structured logging with context and
/// per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "ace/foundation/engine_result.hpp"
#include "ace/foundation/types.hpp"

namespace ace::foundation {

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

/// Engine log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Engine-wide messages
    State       = 1, ///< Snapshot and effect tracking
    Targeting   = 2, ///< Candidate cache and target selection
    Rules       = 3, ///< Providers, rule chains, auxiliary rules
    Resolution  = 4, ///< Resolution cache and pipeline
    Config      = 5, ///< Configuration loading
    Lifecycle   = 6, ///< initialize / dispose / reset
    Performance = 7  ///< Load controller and degraded mode
};

inline constexpr std::size_t kLogCategoryCount = 8;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "State", "Targeting", "Rules",
        "Resolution", "Config", "Lifecycle", "Performance"
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
///   ctx.jobId = JobId(24);
///   ctx.extra["rule"] = "refresh_dot";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Rules,
///                         "Rule faulted", ctx);
/// @endcode
struct LogContext {
    std::optional<JobId> jobId;
    std::optional<ActionId> actionId;
    std::optional<EntityId> entityId;
    std::optional<uint64_t> frameStamp;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger wrapping kcenon's logger registry.
///
/// Uses PIMPL to keep kcenon headers out of the public API. The level
/// check is a single relaxed atomic load, so disabled categories cost
/// nothing on the resolution hot path.
///
/// Default log levels per category:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | State       | Warning       |
/// | Targeting   | Warning       |
/// | Rules       | Info          |
/// | Resolution  | Warning       |
/// | Config      | Info          |
/// | Lifecycle   | Info          |
/// | Performance | Info          |
class EngineLogger {
public:
    EngineLogger();
    ~EngineLogger();

    EngineLogger(const EngineLogger&) = delete;
    EngineLogger& operator=(const EngineLogger&) = delete;
    EngineLogger(EngineLogger&&) noexcept;
    EngineLogger& operator=(EngineLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key-value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default kcenon logger.
    EngineResult<void> flush();

    /// Process-wide logger used by the ACE_LOG macros.
    static EngineLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ace::foundation

// ---------------------------------------------------------------------------
// Convenience macros (must be outside namespace; macros are global)
// ---------------------------------------------------------------------------

/// @name ACE_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// ACE_MIN_LOG_LEVEL can be defined before including this header to
/// compile out calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef ACE_MIN_LOG_LEVEL
    #define ACE_MIN_LOG_LEVEL 0
#endif

#define ACE_LOG(level, cat, msg)                                                   \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= ACE_MIN_LOG_LEVEL &&                        \
            ::ace::foundation::EngineLogger::instance().isEnabled((level), (cat)))  \
        {                                                                          \
            ::ace::foundation::EngineLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define ACE_LOG_DEBUG(cat, msg) \
    ACE_LOG(::ace::foundation::LogLevel::Debug, (cat), (msg))

#define ACE_LOG_INFO(cat, msg) \
    ACE_LOG(::ace::foundation::LogLevel::Info, (cat), (msg))

#define ACE_LOG_WARN(cat, msg) \
    ACE_LOG(::ace::foundation::LogLevel::Warning, (cat), (msg))

#define ACE_LOG_ERROR(cat, msg) \
    ACE_LOG(::ace::foundation::LogLevel::Error, (cat), (msg))

/// @}
