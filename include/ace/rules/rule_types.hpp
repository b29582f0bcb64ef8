#pragma once

/// @file rule_types.hpp
/// @brief Rules, rule chains and auxiliary rules evaluated against the snapshot.

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "ace/foundation/types.hpp"

namespace ace::state {
class StateStore;
}

namespace ace::targeting {
class EntitySelectionCache;
class TargetResolver;
}

namespace ace::rules {

using foundation::ActionId;

/// Read-only view handed to every predicate and resolver.
struct RuleContext {
    const state::StateStore& state;
    const targeting::EntitySelectionCache& candidates;
    const targeting::TargetResolver& targets;
};

using RulePredicate = std::function<bool(const RuleContext&)>;

/// Produces the resolved action; receives the trigger that entered the chain.
using RuleResolver = std::function<ActionId(const RuleContext&, ActionId trigger)>;

/// Label of the terminal pass-through rule every chain ends with.
inline constexpr std::string_view kDefaultRuleLabel = "default";

// ── Rule ────────────────────────────────────────────────────────────────

/// A predicate over the snapshot paired with the action it resolves to.
///
/// @c label is the key external configuration uses to disable the rule.
/// @c dynamic marks rules whose outcome can change between two frames
/// even when nothing else in the snapshot does (timers, weave windows).
struct Rule {
    std::string label;
    RulePredicate predicate;
    RuleResolver resolver;
    bool dynamic = false;

    /// Rule resolving to a fixed action.
    static Rule fixed(std::string label, RulePredicate predicate, ActionId result,
                      bool dynamic = false);

    /// Always matches and returns the trigger unchanged.
    static Rule passThrough();

    [[nodiscard]] bool isDefault() const noexcept { return label == kDefaultRuleLabel; }
};

// ── RuleChain ───────────────────────────────────────────────────────────

/// Ordered rules plus the trigger actions the chain claims.
///
/// Construction guarantees the last rule is the pass-through default, so
/// evaluation always produces a value.
class RuleChain {
public:
    RuleChain(std::string name, std::vector<ActionId> triggers, std::vector<Rule> rules);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::vector<ActionId>& triggers() const noexcept { return triggers_; }
    [[nodiscard]] const std::vector<Rule>& rules() const noexcept { return rules_; }

    [[nodiscard]] bool claims(ActionId trigger) const noexcept;

    [[nodiscard]] bool hasDynamicRules() const noexcept;

    /// Copy without the rules @p enabled rejects; the default rule always stays.
    [[nodiscard]] RuleChain filtered(
        const std::function<bool(std::string_view label)>& enabled) const;

private:
    std::string name_;
    std::vector<ActionId> triggers_;
    std::vector<Rule> rules_;
};

// ── AuxiliaryRule ───────────────────────────────────────────────────────

using AuxiliaryAction = std::function<ActionId(const RuleContext&)>;

/// Independent opportunistic rule; lower priority values are tried first.
struct AuxiliaryRule {
    std::string label;
    uint8_t priority = 0;
    RulePredicate predicate;
    AuxiliaryAction action;
};

} // namespace ace::rules
