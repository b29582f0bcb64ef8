/// @file engine_logger.cpp
/// @brief EngineLogger implementation on top of the kcenon logger registry.

#include "ace/foundation/engine_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>

namespace ace::foundation {

namespace kc = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: ACE -> kcenon
// ---------------------------------------------------------------------------
static kc::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kc::log_level::trace;
        case LogLevel::Debug:    return kc::log_level::debug;
        case LogLevel::Info:     return kc::log_level::info;
        case LogLevel::Warning:  return kc::log_level::warning;
        case LogLevel::Error:    return kc::log_level::error;
        case LogLevel::Critical: return kc::log_level::critical;
        case LogLevel::Off:      return kc::log_level::off;
    }
    return kc::log_level::info;
}

// Hot-path categories stay quiet unless something is wrong.
static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,     // Core
    LogLevel::Warning,  // State
    LogLevel::Warning,  // Targeting
    LogLevel::Info,     // Rules
    LogLevel::Warning,  // Resolution
    LogLevel::Info,     // Config
    LogLevel::Info,     // Lifecycle
    LogLevel::Info      // Performance
};

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

    if (ctx.jobId && ctx.jobId->isValid()) {
        append("job", std::to_string(ctx.jobId->value()));
    }
    if (ctx.actionId && ctx.actionId->isValid()) {
        append("action", std::to_string(ctx.actionId->value()));
    }
    if (ctx.entityId && ctx.entityId->isValid()) {
        append("entity", std::to_string(ctx.entityId->value()));
    }
    if (ctx.frameStamp) {
        append("frame", std::to_string(*ctx.frameStamp));
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct EngineLogger::Impl {
    // Atomic so the hot-path level check never takes a lock.
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Named loggers looked up in GlobalLoggerRegistry, one per category.
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("ace.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kc::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kc::GlobalLoggerRegistry::null_logger();
        }
        auto& registry = kc::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        // Unregistered names resolve to the shared null logger.
        if (logger == kc::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return logger;
    }

    void write(LogLevel level, LogCategory cat, std::string_view msg,
               std::string_view ctx) const {
        // Format: [Category] message {key=val, ...}
        std::string formatted;
        formatted.reserve(msg.size() + ctx.size() + 24);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!ctx.empty()) {
            formatted += " {";
            formatted += ctx;
            formatted += '}';
        }
        // A failing sink must not disturb the caller; the result is dropped.
        (void)getLogger(cat)->log(mapLevel(level), formatted);
    }
};

EngineLogger::EngineLogger() : impl_(std::make_unique<Impl>()) {}

EngineLogger::~EngineLogger() = default;

EngineLogger::EngineLogger(EngineLogger&&) noexcept = default;
EngineLogger& EngineLogger::operator=(EngineLogger&&) noexcept = default;

void EngineLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->write(level, cat, msg, {});
}

void EngineLogger::logWithContext(LogLevel level, LogCategory cat,
                                  std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->write(level, cat, msg, formatContext(ctx));
}

void EngineLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel EngineLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool EngineLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_relaxed);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

EngineResult<void> EngineLogger::flush() {
    auto& registry = kc::GlobalLoggerRegistry::instance();
    auto result = registry.get_default_logger()->flush();
    if (result.is_err()) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return EngineResult<void>::ok();
}

EngineLogger& EngineLogger::instance() {
    static EngineLogger inst;
    return inst;
}

} // namespace ace::foundation
