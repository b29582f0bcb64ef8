/// @file rule_configuration.cpp
/// @brief RuleConfiguration implementation.

#include "ace/rules/rule_configuration.hpp"

#include <charconv>

#include "ace/foundation/engine_logger.hpp"

namespace ace::rules {

using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

constexpr std::string_view kJobsPrefix = "jobs.";

std::optional<bool> featureFlag(const auto& s, Feature feature) {
    switch (feature) {
        case Feature::Combo:     return s.combo;
        case Feature::Auxiliary: return s.auxiliary;
        case Feature::Targeting: return s.targeting;
    }
    return std::nullopt;
}

} // namespace

void RuleConfiguration::bump() noexcept {
    ++version_;
    if (version_ == 0) {
        version_ = 1;
    }
}

const RuleConfiguration::JobSettings* RuleConfiguration::settings(JobId job) const noexcept {
    auto it = jobs_.find(job);
    return it != jobs_.end() ? &it->second : nullptr;
}

bool RuleConfiguration::isRuleEnabled(JobId job, std::string_view label) const {
    const auto* s = settings(job);
    if (s == nullptr) {
        return true;
    }
    auto it = s->rules.find(std::string(label));
    return it == s->rules.end() || it->second;
}

void RuleConfiguration::setRuleEnabled(JobId job, std::string_view label, bool enabled) {
    jobs_[job].rules[std::string(label)] = enabled;
    bump();
}

bool RuleConfiguration::isFeatureEnabled(JobId job, Feature feature) const noexcept {
    const auto* s = settings(job);
    if (s == nullptr) {
        return true;
    }
    return featureFlag(*s, feature).value_or(true);
}

void RuleConfiguration::setFeatureEnabled(JobId job, Feature feature, bool enabled) {
    auto& s = jobs_[job];
    switch (feature) {
        case Feature::Combo:     s.combo = enabled; break;
        case Feature::Auxiliary: s.auxiliary = enabled; break;
        case Feature::Targeting: s.targeting = enabled; break;
    }
    bump();
}

void RuleConfiguration::setDefaults(const TargetingDefaults& defaults) {
    defaults_ = defaults;
    bump();
}

void RuleConfiguration::setCompanionOverride(JobId job, bool enabled, std::optional<float> delta) {
    auto& s = jobs_[job];
    s.companionOverride = enabled;
    if (delta) {
        s.companionOverrideDelta = *delta;
    }
    bump();
}

void RuleConfiguration::setCompanionEnabled(JobId job, bool enabled) {
    jobs_[job].companionEnabled = enabled;
    bump();
}

targeting::SelectionPolicy RuleConfiguration::selectionPolicy(JobId job,
                                                              float hpThreshold) const noexcept {
    targeting::SelectionPolicy policy;
    policy.hpThreshold = hpThreshold;
    policy.companionEnabled = defaults_.companionEnabled;
    policy.companionOverride = defaults_.companionOverride;
    policy.companionOverrideDelta = defaults_.companionOverrideDelta;
    if (const auto* s = settings(job)) {
        policy.companionEnabled = s->companionEnabled.value_or(policy.companionEnabled);
        policy.companionOverride = s->companionOverride.value_or(policy.companionOverride);
        policy.companionOverrideDelta =
            s->companionOverrideDelta.value_or(policy.companionOverrideDelta);
    }
    return policy;
}

EngineResult<void> RuleConfiguration::loadFrom(const foundation::ConfigManager& config) {
    auto next = *this;

    if (config.hasKey("targeting.companion_enabled")) {
        auto v = config.get<bool>("targeting.companion_enabled");
        if (v.hasError()) return EngineResult<void>::err(v.error());
        next.defaults_.companionEnabled = v.value();
    }
    if (config.hasKey("targeting.companion_override")) {
        auto v = config.get<bool>("targeting.companion_override");
        if (v.hasError()) return EngineResult<void>::err(v.error());
        next.defaults_.companionOverride = v.value();
    }
    if (config.hasKey("targeting.companion_override_delta")) {
        auto v = config.get<float>("targeting.companion_override_delta");
        if (v.hasError()) return EngineResult<void>::err(v.error());
        next.defaults_.companionOverrideDelta = v.value();
    }

    for (const auto& key : config.keysWithPrefix(kJobsPrefix)) {
        auto applied = next.applyJobKey(config, key);
        if (applied.hasError()) {
            ACE_LOG_ERROR(LogCategory::Config, applied.error().describe());
            return applied;
        }
    }

    auto version = version_;
    *this = std::move(next);
    version_ = version;
    bump();
    ACE_LOG_INFO(LogCategory::Config,
                 "Rule configuration loaded, version " + std::to_string(version_));
    return EngineResult<void>::ok();
}

EngineResult<void> RuleConfiguration::applyJobKey(const foundation::ConfigManager& config,
                                                  const std::string& key) {
    // jobs.<id>.<field>[.<label>]
    std::string_view rest(key);
    rest.remove_prefix(kJobsPrefix.size());
    auto dot = rest.find('.');
    if (dot == std::string_view::npos) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::ConfigInvalidValue, "job entry without field: " + key));
    }

    uint32_t id = 0;
    auto idText = rest.substr(0, dot);
    auto [ptr, ec] = std::from_chars(idText.data(), idText.data() + idText.size(), id);
    if (ec != std::errc() || ptr != idText.data() + idText.size() || id == 0) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::ConfigInvalidValue, "invalid job id in key: " + key));
    }
    auto field = rest.substr(dot + 1);
    auto& s = jobs_[JobId(id)];

    auto readBool = [&](std::optional<bool>& slot) -> EngineResult<void> {
        auto v = config.get<bool>(key);
        if (v.hasError()) return EngineResult<void>::err(v.error());
        slot = v.value();
        return EngineResult<void>::ok();
    };

    constexpr std::string_view kRulesPrefix = "rules.";
    if (field.substr(0, kRulesPrefix.size()) == kRulesPrefix) {
        auto v = config.get<bool>(key);
        if (v.hasError()) return EngineResult<void>::err(v.error());
        s.rules[std::string(field.substr(kRulesPrefix.size()))] = v.value();
        return EngineResult<void>::ok();
    }
    if (field == "combo") return readBool(s.combo);
    if (field == "auxiliary") return readBool(s.auxiliary);
    if (field == "targeting") return readBool(s.targeting);
    if (field == "companion_enabled") return readBool(s.companionEnabled);
    if (field == "companion_override") return readBool(s.companionOverride);
    if (field == "companion_override_delta") {
        auto v = config.get<float>(key);
        if (v.hasError()) return EngineResult<void>::err(v.error());
        s.companionOverrideDelta = v.value();
        return EngineResult<void>::ok();
    }
    return EngineResult<void>::err(
        EngineError(ErrorCode::ConfigInvalidValue, "unknown job setting: " + key));
}

void RuleConfiguration::clear() {
    jobs_.clear();
    defaults_ = TargetingDefaults{};
    bump();
}

} // namespace ace::rules
