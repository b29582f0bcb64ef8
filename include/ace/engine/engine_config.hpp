#pragma once

/// @file engine_config.hpp
/// @brief Tunable constants of the decision engine.

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "ace/foundation/config_manager.hpp"
#include "ace/foundation/engine_result.hpp"

namespace ace::engine {

/// Empirically tuned constants, all overridable from YAML:
///
/// @code
///   engine:
///     cache:
///       ttl_ms: 100
///     auxiliary:
///       weave_budget_s: 0.8
///       max_suggestions: 2
///     state:
///       stale_ms: 100
///     targeting:
///       hp_threshold: 0.99
///       companion_grace_frames: 3
///     performance:
///       auto_throttle: false
/// @endcode
struct EngineConfig {
    std::chrono::milliseconds cacheTtl{100};
    float weaveBudgetSeconds = 0.8f;
    std::size_t maxSuggestions = 2;
    std::chrono::milliseconds staleThreshold{100};
    float hpThreshold = 0.99f;
    uint32_t companionGraceFrames = 3;
    bool autoThrottle = false;

    /// Check every field against its accepted range.
    /// @return ConfigInvalidValue naming the first offending key.
    [[nodiscard]] foundation::EngineResult<void> validate() const;

    /// Read the `engine.*` keys of @p config; missing keys keep defaults.
    static foundation::EngineResult<EngineConfig> fromConfig(
        const foundation::ConfigManager& config);
};

} // namespace ace::engine
