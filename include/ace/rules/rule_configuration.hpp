#pragma once

/// @file rule_configuration.hpp
/// @brief Per-job rule enables, feature toggles and targeting settings.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "ace/foundation/config_manager.hpp"
#include "ace/foundation/engine_result.hpp"
#include "ace/foundation/types.hpp"
#include "ace/targeting/targeting_types.hpp"

namespace ace::rules {

using foundation::JobId;

/// Job-level features that can be switched off independently.
enum class Feature : uint8_t {
    Combo     = 0,
    Auxiliary = 1,
    Targeting = 2
};

constexpr std::string_view featureName(Feature f) {
    switch (f) {
        case Feature::Combo:     return "combo";
        case Feature::Auxiliary: return "auxiliary";
        case Feature::Targeting: return "targeting";
    }
    return "unknown";
}

/// Companion defaults applied to jobs without their own override.
struct TargetingDefaults {
    bool companionEnabled = true;
    bool companionOverride = false;
    float companionOverrideDelta = 0.25f;
};

/// Read-only (from the engine's side) rule configuration.
///
/// Everything defaults to enabled. Every mutation bumps version(), which the
/// job registry compares to decide whether its built rule arrays are stale.
/// Versions start at 1 and skip 0 on wrap, so 0 can mean "never built".
///
/// YAML layout accepted by loadFrom():
/// @code
///   targeting:
///     companion_enabled: true
///     companion_override: false
///     companion_override_delta: 0.25
///   jobs:
///     24:
///       combo: true
///       auxiliary: false
///       companion_override: true
///       rules:
///         refresh_dot: false
/// @endcode
class RuleConfiguration {
public:
    RuleConfiguration() = default;

    [[nodiscard]] bool isRuleEnabled(JobId job, std::string_view label) const;
    void setRuleEnabled(JobId job, std::string_view label, bool enabled);

    [[nodiscard]] bool isFeatureEnabled(JobId job, Feature feature) const noexcept;
    void setFeatureEnabled(JobId job, Feature feature, bool enabled);

    [[nodiscard]] const TargetingDefaults& defaults() const noexcept { return defaults_; }
    void setDefaults(const TargetingDefaults& defaults);

    void setCompanionOverride(JobId job, bool enabled, std::optional<float> delta = std::nullopt);
    void setCompanionEnabled(JobId job, bool enabled);

    /// Selection policy for @p job: job overrides over global defaults.
    [[nodiscard]] targeting::SelectionPolicy selectionPolicy(JobId job,
                                                             float hpThreshold) const noexcept;

    [[nodiscard]] uint64_t version() const noexcept { return version_; }

    /// Merge settings from @p config; bumps the version once on success.
    foundation::EngineResult<void> loadFrom(const foundation::ConfigManager& config);

    /// Drop every job setting and restore defaults.
    void clear();

private:
    struct JobSettings {
        std::unordered_map<std::string, bool> rules;
        std::optional<bool> combo;
        std::optional<bool> auxiliary;
        std::optional<bool> targeting;
        std::optional<bool> companionEnabled;
        std::optional<bool> companionOverride;
        std::optional<float> companionOverrideDelta;
    };

    [[nodiscard]] const JobSettings* settings(JobId job) const noexcept;

    foundation::EngineResult<void> applyJobKey(const foundation::ConfigManager& config,
                                               const std::string& key);

    void bump() noexcept;

    std::unordered_map<JobId, JobSettings> jobs_;
    TargetingDefaults defaults_;
    uint64_t version_ = 1;
};

} // namespace ace::rules
