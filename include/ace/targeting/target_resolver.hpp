#pragma once

/// @file target_resolver.hpp
/// @brief Picks the recipient of targeted actions from the selection cache.

#include <span>
#include <unordered_map>

#include "ace/state/state_store.hpp"
#include "ace/targeting/entity_selection_cache.hpp"
#include "ace/targeting/targeting_types.hpp"

namespace ace::targeting {

/// Resolves "whom" (or "where") for actions that carry a TargetRule.
///
/// Selection order for supportive abilities, first match wins:
/// 1. the hard target, when it is a valid ally target
/// 2. the lowest-health ally (not self) below the threshold; on equal
///    health the lower slot index wins
/// 3. the companion, replacing that ally when override is enabled and
///    companion health + delta is still lower; or on its own when no ally
///    qualified
/// 4. self when below the threshold
/// 5. self unconditionally
///
/// Every query returns an invalid EntityId when the cache holds no
/// candidates, which tells the caller to keep its own target.
class TargetResolver {
public:
    TargetResolver(const EntitySelectionCache& cache, const state::StateStore& state);

    /// Install the rules of the active job, indexed by primary and
    /// secondary action id. Replaces any previous set.
    void setRules(std::span<const TargetRule> rules);

    void clearRules();

    [[nodiscard]] const TargetRule* ruleFor(ActionId action) const;

    [[nodiscard]] std::size_t ruleCount() const noexcept { return rules_.size(); }

    /// Dispatch on the rule's mode; invalid when @p action has no rule.
    [[nodiscard]] EntityId resolveTarget(ActionId action, const SelectionPolicy& policy) const;

    [[nodiscard]] EntityId resolveHealTarget(const SelectionPolicy& policy) const;

    /// Same ordering as resolveHealTarget, restricted to candidates with a
    /// removable negative effect; self is still the terminal fallback.
    [[nodiscard]] EntityId resolveCleanseTarget(const SelectionPolicy& policy) const;

    /// Location anchor: current target if known this frame, else the first
    /// valid tank, else self.
    [[nodiscard]] EntityId resolveGroundTarget() const;

    /// The secondary action of a GroundTargetSpecial rule while its
    /// required actor effect is active, otherwise @p action.
    [[nodiscard]] ActionId resolveReplacement(ActionId action) const;

private:
    EntityId bestAlly(const SelectionPolicy& policy, bool cleanse) const;
    EntityId companionFor(const SelectionPolicy& policy, bool cleanse, float* health) const;
    EntityId selfFallback() const;
    EntityId firstTank() const;
    EntityId resolveGroundSpecial(const TargetRule& rule, const SelectionPolicy& policy) const;

    const EntitySelectionCache& cache_;
    const state::StateStore& state_;
    std::unordered_map<ActionId, TargetRule> rules_;
};

} // namespace ace::targeting
