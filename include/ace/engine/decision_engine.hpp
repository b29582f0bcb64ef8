#pragma once

/// @file decision_engine.hpp
/// @brief Process-wide facade tying state, targeting, rules and caching
///        together behind the update, resolution and lifecycle boundaries.

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "ace/engine/engine_config.hpp"
#include "ace/foundation/engine_result.hpp"
#include "ace/foundation/types.hpp"
#include "ace/resolution/action_resolution_cache.hpp"
#include "ace/resolution/performance_controller.hpp"
#include "ace/rules/auxiliary_suggestion_engine.hpp"
#include "ace/rules/job_provider.hpp"
#include "ace/rules/job_registry.hpp"
#include "ace/rules/priority_rule_engine.hpp"
#include "ace/rules/rule_configuration.hpp"
#include "ace/state/state_store.hpp"
#include "ace/targeting/entity_selection_cache.hpp"
#include "ace/targeting/target_resolver.hpp"

namespace ace::engine {

using foundation::ActionId;
using foundation::EntityId;
using foundation::JobId;

/// Counters gathered across the engine's components.
struct EngineStatistics {
    uint64_t resolveCalls = 0;
    uint64_t bypassed = 0;
    uint64_t timedHits = 0;
    uint64_t timedMisses = 0;
    uint64_t frameHits = 0;
    uint64_t frameMisses = 0;
    uint64_t ruleFaults = 0;
    uint64_t auxiliaryFaults = 0;
    uint64_t ruleSetRebuilds = 0;
    uint64_t providerFaults = 0; ///< rebuilds abandoned because a provider threw
    uint64_t boundaryFaults = 0; ///< queries that threw and fell back to pass-through
};

/// The decision engine.
///
/// The external per-tick driver feeds the update boundary exactly once per
/// tick, then any number of resolution queries may follow on the same
/// thread. Nothing here locks.
///
/// Every failure on the resolution path degrades to passing the input
/// through: before initialize(), while bypassing, outside combat, or when
/// no chain claims the input. Anything thrown from rule or provider code
/// while answering a query is caught at the query and logged.
///
/// Example:
/// @code
///   auto& engine = DecisionEngine::instance();
///   if (auto r = engine.initialize(EngineConfig{}, kProviders); !r) { ... }
///
///   // each tick
///   engine.updateCoreState({.job = JobId(24), .inCombat = true, .canAct = true});
///   engine.updateScalarState({.timeToNextPrimary = 1.9f});
///
///   // each intercepted action
///   ActionId actual = engine.resolve(requested);
/// @endcode
class DecisionEngine {
public:
    DecisionEngine();
    ~DecisionEngine() = default;

    DecisionEngine(const DecisionEngine&) = delete;
    DecisionEngine& operator=(const DecisionEngine&) = delete;

    // ── Lifecycle boundary ──────────────────────────────────────────────

    /// Validate @p config, register @p providers and seed effect tracking.
    /// @return AlreadyInitialized without an intervening dispose(),
    ///         ConfigInvalidValue or a registration error otherwise.
    foundation::EngineResult<void> initialize(
        const EngineConfig& config,
        std::span<const rules::ProviderRegistration> providers,
        rules::RuleConfiguration configuration = {});

    /// Drop providers and every piece of state. No-op when not initialized.
    void dispose();

    /// Clear snapshot, candidates and both cache tiers, then re-seed the
    /// sentinels of every registered provider. Providers stay registered.
    void resetForTesting();

    [[nodiscard]] bool isInitialized() const noexcept { return initialized_; }

    // ── Update boundary ─────────────────────────────────────────────────

    /// Apply the core fields of this tick and the resulting side effects.
    /// Ignored before initialize().
    state::StateTransition updateCoreState(const state::CoreStateUpdate& update,
                                           foundation::TimePoint now = foundation::Clock::now());

    void updateScalarState(const state::ScalarStateUpdate& update);

    void updateEffects(state::EffectKind kind, const state::EffectRemainingMap& remaining,
                       foundation::TimePoint now = foundation::Clock::now());

    /// Rebuild the candidate slots for the current frame stamp.
    foundation::EngineResult<void> updateEntityCandidates(
        std::span<const EntityId> ids, std::span<const float> health,
        std::span<const targeting::CandidateFlags> flags, std::size_t count);

    void updateHardTarget(EntityId id, bool valid);
    void updateCompanionSystem(bool enabled);
    void updateCompanion(EntityId id, float health, bool valid);
    void markKnownEntity(EntityId id);
    void markRemovableNegativeEffect(EntityId id, bool present);

    bool updateJobGauge(JobId job, uint32_t gauge1, uint32_t gauge2);

    void recordActionUsed(ActionId action, float cooldownSeconds,
                          foundation::TimePoint now = foundation::Clock::now());

    // ── Resolution boundary ─────────────────────────────────────────────

    /// The action that should execute in place of @p input.
    [[nodiscard]] ActionId resolve(ActionId input,
                                   foundation::TimePoint now = foundation::Clock::now());

    /// Up to min(@p maxCount, configured maximum) auxiliary actions.
    [[nodiscard]] rules::SuggestionBuffer suggestAuxiliary(std::size_t maxCount);

    /// Recipient of @p action; invalid when the caller should keep its own.
    [[nodiscard]] EntityId resolveTarget(ActionId action);

    // ── Access ──────────────────────────────────────────────────────────

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

    /// The configuration boundary. Mutations bump its version, which
    /// rebuilds the active rule set on the next query.
    [[nodiscard]] rules::RuleConfiguration& configuration() noexcept { return configuration_; }

    [[nodiscard]] resolution::PerformanceController& performance() noexcept { return performance_; }

    [[nodiscard]] const state::StateStore& state() const noexcept { return state_; }
    [[nodiscard]] const targeting::EntitySelectionCache& candidates() const noexcept {
        return candidates_;
    }
    [[nodiscard]] const resolution::ActionResolutionCache& cache() const noexcept { return cache_; }
    [[nodiscard]] const rules::JobRegistry& registry() const noexcept { return registry_; }

    [[nodiscard]] bool isStateStale(foundation::TimePoint now = foundation::Clock::now()) const;

    [[nodiscard]] EngineStatistics statistics() const noexcept;

    // ── Singleton ───────────────────────────────────────────────────────

    /// Access the process-wide engine.
    static DecisionEngine& instance();

private:
    /// Active rule set for the current job, re-applying targets and
    /// invalidating the caches whenever it was rebuilt.
    const rules::ActiveRuleSet& activeRules();

    ActionId compute(ActionId input, const rules::ActiveRuleSet& active);

    void applySideEffects(const state::StateTransition& transition);
    void clearCaches() noexcept;
    void recordBoundaryFault(std::string_view query, std::string_view what);

    EngineConfig config_;
    rules::RuleConfiguration configuration_;

    state::StateStore state_;
    targeting::EntitySelectionCache candidates_;
    targeting::TargetResolver targets_;

    rules::JobRegistry registry_;
    rules::PriorityRuleEngine ruleEngine_;
    rules::AuxiliarySuggestionEngine auxiliary_;

    resolution::ActionResolutionCache cache_;
    resolution::PerformanceController performance_;

    uint64_t appliedGeneration_ = 0;
    uint64_t resolveCalls_ = 0;
    uint64_t bypassed_ = 0;
    uint64_t boundaryFaults_ = 0;
    bool initialized_ = false;
};

} // namespace ace::engine
