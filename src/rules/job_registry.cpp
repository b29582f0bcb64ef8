/// @file job_registry.cpp
/// @brief JobRegistry implementation.

#include "ace/rules/job_registry.hpp"

#include <algorithm>
#include <exception>
#include <string>

#include "ace/foundation/engine_logger.hpp"

namespace ace::rules {

using foundation::EngineError;
using foundation::EngineLogger;
using foundation::EngineResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogLevel;

const RuleChain* ActiveRuleSet::chainFor(ActionId trigger) const noexcept {
    for (const auto& chain : chains) {
        if (chain.claims(trigger)) {
            return &chain;
        }
    }
    return nullptr;
}

EngineResult<void> JobRegistry::registerProviders(std::span<const ProviderRegistration> table) {
    for (const auto& row : table) {
        if (!row.factory) {
            return EngineResult<void>::err(
                EngineError(ErrorCode::InvalidArgument,
                            "provider '" + std::string(row.name) + "' has no factory"));
        }
        std::string failure;
        try {
            auto provider = row.factory();
            if (!provider || provider->jobId() != row.job) {
                return EngineResult<void>::err(
                    EngineError(ErrorCode::InvalidArgument,
                                "provider '" + std::string(row.name) +
                                    "' does not serve job " + std::to_string(row.job.value())));
            }
            auto result = registerProvider(std::move(provider));
            if (result.hasError()) {
                return result;
            }
            continue;
        } catch (const std::exception& e) {
            failure = e.what();
        } catch (...) {
            failure = "non-standard exception";
        }
        return EngineResult<void>::err(
            EngineError(ErrorCode::RuleError,
                        "provider '" + std::string(row.name) + "' threw: " + failure, row.job));
    }
    return EngineResult<void>::ok();
}

EngineResult<void> JobRegistry::registerProvider(std::unique_ptr<IJobProvider> provider) {
    if (!provider || !provider->jobId().isValid()) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::InvalidArgument, "provider must serve a valid job"));
    }
    auto job = provider->jobId();
    if (providers_.count(job) > 0) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::DuplicateProvider,
                        "job " + std::to_string(job.value()) + " already has a provider",
                        job));
    }

    ProviderCapabilities caps = 0;
    if (!provider->ruleChains().empty()) caps |= static_cast<uint8_t>(ProviderCapability::Combo);
    if (!provider->auxiliaryRules().empty()) caps |= static_cast<uint8_t>(ProviderCapability::Auxiliary);
    if (!provider->targetRules().empty()) caps |= static_cast<uint8_t>(ProviderCapability::Targeting);
    for (auto kind : {state::EffectKind::ActorEffect, state::EffectKind::TargetEffect,
                      state::EffectKind::Cooldown}) {
        if (!provider->trackedIds(kind).empty()) {
            caps |= static_cast<uint8_t>(ProviderCapability::Tracking);
        }
    }

    foundation::LogContext ctx;
    ctx.jobId = job;
    ctx.extra["provider"] = std::string(provider->name());
    EngineLogger::instance().logWithContext(LogLevel::Info, LogCategory::Rules,
                                            "Provider registered", ctx);

    providers_.emplace(job, Entry{std::move(provider), caps});
    if (built_ && active_.job == job) {
        invalidate();
    }
    return EngineResult<void>::ok();
}

const IJobProvider* JobRegistry::provider(JobId job) const noexcept {
    auto it = providers_.find(job);
    return it != providers_.end() ? it->second.provider.get() : nullptr;
}

ProviderCapabilities JobRegistry::capabilities(JobId job) const noexcept {
    auto it = providers_.find(job);
    return it != providers_.end() ? it->second.capabilities : 0;
}

void JobRegistry::seedTracking(state::EffectExpiryRegistry& effects) const {
    for (const auto& [job, entry] : providers_) {
        for (auto kind : {state::EffectKind::ActorEffect, state::EffectKind::TargetEffect,
                          state::EffectKind::Cooldown}) {
            for (auto id : entry.provider->trackedIds(kind)) {
                effects.trackIfAbsent(kind, id);
            }
        }
    }
}

const ActiveRuleSet& JobRegistry::ruleSet(JobId job, const RuleConfiguration& config) {
    if (!built_ || active_.job != job || active_.configVersion != config.version()) {
        rebuild(job, config);
    }
    return active_;
}

void JobRegistry::rebuild(JobId job, const RuleConfiguration& config) {
    ActiveRuleSet next;
    next.job = job;
    next.configVersion = config.version();
    next.generation = active_.generation + 1;
    ++rebuilds_;

    // A provider that throws leaves the job with an empty set, so every
    // input passes through until the job or the configuration changes.
    try {
        collect(next, job, config);
    } catch (const std::exception& e) {
        discardFaulted(next, job, e.what());
    } catch (...) {
        discardFaulted(next, job, "non-standard exception");
    }

    active_ = std::move(next);
    built_ = true;

    foundation::LogContext ctx;
    ctx.jobId = job;
    ctx.extra["config_version"] = std::to_string(active_.configVersion);
    ctx.extra["chains"] = std::to_string(active_.chains.size());
    ctx.extra["auxiliary"] = std::to_string(active_.auxiliary.size());
    EngineLogger::instance().logWithContext(LogLevel::Info, LogCategory::Rules,
                                            "Rule set rebuilt", ctx);
}

void JobRegistry::collect(ActiveRuleSet& out, JobId job, const RuleConfiguration& config) const {
    const auto* p = provider(job);
    if (p == nullptr) {
        return;
    }

    auto enabled = [&](std::string_view label) { return config.isRuleEnabled(job, label); };

    if (config.isFeatureEnabled(job, Feature::Combo)) {
        for (const auto& chain : p->ruleChains()) {
            out.chains.push_back(chain.filtered(enabled));
            out.dynamic = out.dynamic || out.chains.back().hasDynamicRules();
        }
    }
    if (config.isFeatureEnabled(job, Feature::Auxiliary)) {
        for (auto& rule : p->auxiliaryRules()) {
            if (enabled(rule.label)) {
                out.auxiliary.push_back(std::move(rule));
            }
        }
        std::stable_sort(out.auxiliary.begin(), out.auxiliary.end(),
                         [](const AuxiliaryRule& a, const AuxiliaryRule& b) {
                             return a.priority < b.priority;
                         });
        out.dynamic = out.dynamic || !out.auxiliary.empty();
    }
    if (config.isFeatureEnabled(job, Feature::Targeting)) {
        out.targets = p->targetRules();
    }
}

void JobRegistry::discardFaulted(ActiveRuleSet& next, JobId job, std::string_view what) {
    ++rebuildFaults_;
    next.chains.clear();
    next.auxiliary.clear();
    next.targets.clear();
    next.dynamic = false;

    foundation::LogContext ctx;
    ctx.jobId = job;
    ctx.extra["error"] = std::string(what);
    EngineLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Rules,
                                            "Provider faulted during rebuild", ctx);
}

void JobRegistry::invalidate() noexcept {
    built_ = false;
}

void JobRegistry::clear() {
    providers_.clear();
    auto generation = active_.generation;
    active_ = ActiveRuleSet{};
    active_.generation = generation;
    built_ = false;
}

} // namespace ace::rules
