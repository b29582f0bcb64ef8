/// @file engine_config.cpp
/// @brief EngineConfig loading and validation.

#include "ace/engine/engine_config.hpp"

#include <string>

#include "ace/rules/auxiliary_suggestion_engine.hpp"

namespace ace::engine {

using foundation::ConfigManager;
using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;

namespace {

EngineResult<void> invalid(const char* key, const std::string& why) {
    return EngineResult<void>::err(
        EngineError(ErrorCode::ConfigInvalidValue, std::string(key) + ": " + why,
                    std::string(key)));
}

/// Read @p key into @p out when present; a mistyped value is an error.
template <typename T>
EngineResult<void> readKey(const ConfigManager& config, const char* key, T& out) {
    if (!config.hasKey(key)) {
        return EngineResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (value.hasError()) {
        return EngineResult<void>::err(value.error());
    }
    out = value.value();
    return EngineResult<void>::ok();
}

} // namespace

EngineResult<void> EngineConfig::validate() const {
    if (cacheTtl.count() <= 0) {
        return invalid("engine.cache.ttl_ms", "must be positive");
    }
    if (!(weaveBudgetSeconds > 0.0f)) {
        return invalid("engine.auxiliary.weave_budget_s", "must be positive");
    }
    if (maxSuggestions == 0 || maxSuggestions > rules::SuggestionBuffer::kMaxSuggestions) {
        return invalid("engine.auxiliary.max_suggestions",
                       "must be between 1 and " +
                           std::to_string(rules::SuggestionBuffer::kMaxSuggestions));
    }
    if (staleThreshold.count() <= 0) {
        return invalid("engine.state.stale_ms", "must be positive");
    }
    if (!(hpThreshold > 0.0f && hpThreshold <= 1.0f)) {
        return invalid("engine.targeting.hp_threshold", "must be in (0, 1]");
    }
    return EngineResult<void>::ok();
}

EngineResult<EngineConfig> EngineConfig::fromConfig(const ConfigManager& config) {
    EngineConfig out;

    int64_t ttlMs = out.cacheTtl.count();
    int64_t staleMs = out.staleThreshold.count();
    uint32_t maxSuggestions = static_cast<uint32_t>(out.maxSuggestions);

    for (auto result : {readKey(config, "engine.cache.ttl_ms", ttlMs),
                        readKey(config, "engine.auxiliary.weave_budget_s", out.weaveBudgetSeconds),
                        readKey(config, "engine.auxiliary.max_suggestions", maxSuggestions),
                        readKey(config, "engine.state.stale_ms", staleMs),
                        readKey(config, "engine.targeting.hp_threshold", out.hpThreshold),
                        readKey(config, "engine.targeting.companion_grace_frames",
                                out.companionGraceFrames),
                        readKey(config, "engine.performance.auto_throttle", out.autoThrottle)}) {
        if (result.hasError()) {
            return EngineResult<EngineConfig>::err(result.error());
        }
    }

    out.cacheTtl = std::chrono::milliseconds(ttlMs);
    out.staleThreshold = std::chrono::milliseconds(staleMs);
    out.maxSuggestions = maxSuggestions;

    auto valid = out.validate();
    if (valid.hasError()) {
        return EngineResult<EngineConfig>::err(valid.error());
    }
    return EngineResult<EngineConfig>::ok(out);
}

} // namespace ace::engine
