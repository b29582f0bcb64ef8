/// @file decision_engine.cpp
/// @brief DecisionEngine implementation.

#include "ace/engine/decision_engine.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

#include "ace/foundation/engine_logger.hpp"

namespace ace::engine {

using foundation::EngineError;
using foundation::EngineLogger;
using foundation::EngineResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::TimePoint;
using resolution::CacheTier;
using rules::Feature;
using state::SideEffect;

DecisionEngine::DecisionEngine()
    : targets_(candidates_, state_) {}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

EngineResult<void> DecisionEngine::initialize(
    const EngineConfig& config, std::span<const rules::ProviderRegistration> providers,
    rules::RuleConfiguration configuration) {
    if (initialized_) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::AlreadyInitialized, "decision engine already initialized"));
    }

    auto valid = config.validate();
    if (valid.hasError()) {
        return valid;
    }

    registry_.clear();
    auto registered = registry_.registerProviders(providers);
    if (registered.hasError()) {
        registry_.clear();
        ACE_LOG_ERROR(LogCategory::Lifecycle,
                      "Initialize failed: " + registered.error().describe());
        return registered;
    }

    config_ = config;
    configuration_ = std::move(configuration);

    state_.reset();
    candidates_ = targeting::EntitySelectionCache(config_.companionGraceFrames);
    targets_.clearRules();
    auxiliary_.setWeaveBudget(config_.weaveBudgetSeconds);
    cache_.setTtl(config_.cacheTtl);
    clearCaches();
    cache_.resetStatistics();
    ruleEngine_.resetFaultCount();

    resolution::PerformanceConfig perf;
    perf.autoThrottle = config_.autoThrottle;
    performance_ = resolution::PerformanceController(perf);

    registry_.seedTracking(state_.effects());
    appliedGeneration_ = 0;
    resolveCalls_ = 0;
    bypassed_ = 0;
    boundaryFaults_ = 0;
    initialized_ = true;

    LogContext ctx;
    ctx.extra["providers"] = std::to_string(registry_.size());
    ctx.extra["ttl_ms"] = std::to_string(config_.cacheTtl.count());
    EngineLogger::instance().logWithContext(LogLevel::Info, LogCategory::Lifecycle,
                                            "Decision engine initialized", ctx);
    return EngineResult<void>::ok();
}

void DecisionEngine::dispose() {
    if (!initialized_) {
        return;
    }
    registry_.clear();
    targets_.clearRules();
    state_.reset();
    candidates_.clear();
    clearCaches();
    cache_.resetStatistics();
    performance_.reset();
    appliedGeneration_ = 0;
    initialized_ = false;
    ACE_LOG_INFO(LogCategory::Lifecycle, "Decision engine disposed");
}

void DecisionEngine::resetForTesting() {
    state_.reset();
    candidates_.clear();
    targets_.clearRules();
    clearCaches();
    cache_.resetStatistics();
    ruleEngine_.resetFaultCount();
    performance_.reset();
    registry_.invalidate();
    appliedGeneration_ = 0;
    resolveCalls_ = 0;
    bypassed_ = 0;
    boundaryFaults_ = 0;
    if (initialized_) {
        registry_.seedTracking(state_.effects());
    }
    ACE_LOG_INFO(LogCategory::Lifecycle, "Decision engine reset");
}

// ═══════════════════════════════════════════════════════════════════════════
// Update boundary
// ═══════════════════════════════════════════════════════════════════════════

state::StateTransition DecisionEngine::updateCoreState(const state::CoreStateUpdate& update,
                                                       TimePoint now) {
    if (!initialized_) {
        return {};
    }
    auto transition = state_.updateCore(update, now);
    applySideEffects(transition);
    return transition;
}

void DecisionEngine::applySideEffects(const state::StateTransition& transition) {
    for (auto effect : transition.sideEffects()) {
        switch (effect) {
            case SideEffect::ClearResolutionCache:
                clearCaches();
                break;
            case SideEffect::RebuildRuleChains:
                registry_.invalidate();
                break;
            case SideEffect::ReseedEffectTracking:
                registry_.seedTracking(state_.effects());
                break;
        }
    }
}

void DecisionEngine::updateScalarState(const state::ScalarStateUpdate& update) {
    if (initialized_) {
        state_.updateScalars(update);
    }
}

void DecisionEngine::updateEffects(state::EffectKind kind,
                                   const state::EffectRemainingMap& remaining, TimePoint now) {
    if (initialized_) {
        state_.updateEffects(kind, remaining, now);
    }
}

EngineResult<void> DecisionEngine::updateEntityCandidates(
    std::span<const EntityId> ids, std::span<const float> health,
    std::span<const targeting::CandidateFlags> flags, std::size_t count) {
    if (!initialized_) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::NotInitialized, "decision engine not initialized"));
    }
    return candidates_.update(ids, health, flags, count, state_.frameStamp());
}

void DecisionEngine::updateHardTarget(EntityId id, bool valid) {
    candidates_.updateHardTarget(id, valid);
}

void DecisionEngine::updateCompanionSystem(bool enabled) {
    candidates_.updateCompanionSystem(enabled, state_.inRestrictedArea());
}

void DecisionEngine::updateCompanion(EntityId id, float health, bool valid) {
    candidates_.updateCompanion(id, health, valid, state_.frameStamp());
}

void DecisionEngine::markKnownEntity(EntityId id) {
    candidates_.markKnownEntity(id, state_.frameStamp());
}

void DecisionEngine::markRemovableNegativeEffect(EntityId id, bool present) {
    candidates_.markRemovableNegativeEffect(id, present, state_.frameStamp());
}

bool DecisionEngine::updateJobGauge(JobId job, uint32_t gauge1, uint32_t gauge2) {
    if (!initialized_ || !state_.updateJobGauge(job, gauge1, gauge2)) {
        return false;
    }
    // Gauge words feed rule predicates; timed entries may now be wrong.
    cache_.clear();
    return true;
}

void DecisionEngine::recordActionUsed(ActionId action, float cooldownSeconds, TimePoint now) {
    if (initialized_) {
        state_.recordActionUsed(action, cooldownSeconds, now);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Resolution boundary
// ═══════════════════════════════════════════════════════════════════════════

ActionId DecisionEngine::resolve(ActionId input, TimePoint now) {
    if (!initialized_) {
        return input;
    }
    ++resolveCalls_;
    if (performance_.shouldBypass(state_.inCombat())) {
        ++bypassed_;
        return input;
    }
    if (!state_.canProcess()) {
        return input;
    }

    try {
        const auto& active = activeRules();
        auto tier = active.dynamic ? CacheTier::Frame : CacheTier::Timed;
        return cache_.resolve(input, tier, state_.frameStamp(), configuration_.version(), now,
                              [&] { return compute(input, active); });
    } catch (const std::exception& e) {
        recordBoundaryFault("resolve", e.what());
    } catch (...) {
        recordBoundaryFault("resolve", "non-standard exception");
    }
    return input;
}

ActionId DecisionEngine::compute(ActionId input, const rules::ActiveRuleSet& active) {
    auto replaced = targets_.resolveReplacement(input);
    if (replaced != input) {
        return replaced;
    }

    const auto* chain = active.chainFor(input);
    if (chain == nullptr) {
        return input;
    }

    rules::RuleContext ctx{state_, candidates_, targets_};
    auto result = ruleEngine_.evaluate(*chain, input, ctx);
    if (result != input || active.auxiliary.empty() ||
        !state_.canWeave(1, auxiliary_.weaveBudget())) {
        return result;
    }

    auto suggestions = auxiliary_.suggest(
        active.auxiliary, 1, ctx, configuration_.isFeatureEnabled(active.job, Feature::Auxiliary));
    return suggestions.empty() ? result : suggestions[0];
}

rules::SuggestionBuffer DecisionEngine::suggestAuxiliary(std::size_t maxCount) {
    if (!initialized_ || performance_.shouldBypass(state_.inCombat())) {
        return {};
    }
    try {
        const auto& active = activeRules();
        rules::RuleContext ctx{state_, candidates_, targets_};
        return auxiliary_.suggest(active.auxiliary, std::min(maxCount, config_.maxSuggestions),
                                  ctx,
                                  configuration_.isFeatureEnabled(active.job, Feature::Auxiliary));
    } catch (const std::exception& e) {
        recordBoundaryFault("suggestAuxiliary", e.what());
    } catch (...) {
        recordBoundaryFault("suggestAuxiliary", "non-standard exception");
    }
    return {};
}

EntityId DecisionEngine::resolveTarget(ActionId action) {
    if (!initialized_) {
        return EntityId{};
    }
    try {
        const auto& active = activeRules();
        if (!configuration_.isFeatureEnabled(active.job, Feature::Targeting)) {
            return EntityId{};
        }
        return targets_.resolveTarget(
            action, configuration_.selectionPolicy(active.job, config_.hpThreshold));
    } catch (const std::exception& e) {
        recordBoundaryFault("resolveTarget", e.what());
    } catch (...) {
        recordBoundaryFault("resolveTarget", "non-standard exception");
    }
    return EntityId{};
}

void DecisionEngine::recordBoundaryFault(std::string_view query, std::string_view what) {
    ++boundaryFaults_;
    LogContext ctx;
    ctx.extra["query"] = std::string(query);
    ctx.extra["error"] = std::string(what);
    EngineLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Resolution,
                                            "Query faulted; passing input through", ctx);
}

const rules::ActiveRuleSet& DecisionEngine::activeRules() {
    const auto& active = registry_.ruleSet(state_.job(), configuration_);
    if (active.generation != appliedGeneration_) {
        targets_.setRules(active.targets);
        clearCaches();
        appliedGeneration_ = active.generation;
    }
    return active;
}

void DecisionEngine::clearCaches() noexcept {
    cache_.clear();
    cache_.clearFrameMemo();
}

// ═══════════════════════════════════════════════════════════════════════════
// Access
// ═══════════════════════════════════════════════════════════════════════════

bool DecisionEngine::isStateStale(TimePoint now) const {
    return state_.isStale(config_.staleThreshold, now);
}

EngineStatistics DecisionEngine::statistics() const noexcept {
    EngineStatistics stats;
    stats.resolveCalls = resolveCalls_;
    stats.bypassed = bypassed_;
    stats.timedHits = cache_.hitCount();
    stats.timedMisses = cache_.missCount();
    stats.frameHits = cache_.frameHitCount();
    stats.frameMisses = cache_.frameMissCount();
    stats.ruleFaults = ruleEngine_.faultCount();
    stats.auxiliaryFaults = auxiliary_.faultCount();
    stats.ruleSetRebuilds = registry_.rebuildCount();
    stats.providerFaults = registry_.rebuildFaultCount();
    stats.boundaryFaults = boundaryFaults_;
    return stats;
}

DecisionEngine& DecisionEngine::instance() {
    static DecisionEngine inst;
    return inst;
}

} // namespace ace::engine
