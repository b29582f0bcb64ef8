/// @file target_resolver.cpp
/// @brief TargetResolver implementation.

#include "ace/targeting/target_resolver.hpp"

namespace ace::targeting {

TargetResolver::TargetResolver(const EntitySelectionCache& cache,
                               const state::StateStore& state)
    : cache_(cache), state_(state) {}

void TargetResolver::setRules(std::span<const TargetRule> rules) {
    rules_.clear();
    rules_.reserve(rules.size() * 2);
    for (const auto& rule : rules) {
        if (!rule.action.isValid()) {
            continue;
        }
        rules_[rule.action] = rule;
        if (rule.secondaryAction.isValid()) {
            rules_[rule.secondaryAction] = rule;
        }
    }
}

void TargetResolver::clearRules() {
    rules_.clear();
}

const TargetRule* TargetResolver::ruleFor(ActionId action) const {
    auto it = rules_.find(action);
    return it != rules_.end() ? &it->second : nullptr;
}

EntityId TargetResolver::resolveTarget(ActionId action, const SelectionPolicy& policy) const {
    const auto* rule = ruleFor(action);
    if (rule == nullptr) {
        return EntityId{};
    }
    switch (rule->mode) {
        case TargetingMode::SmartAbility:        return resolveHealTarget(policy);
        case TargetingMode::GroundTarget:        return resolveGroundTarget();
        case TargetingMode::GroundTargetSpecial: return resolveGroundSpecial(*rule, policy);
        case TargetingMode::Cleanse:             return resolveCleanseTarget(policy);
    }
    return EntityId{};
}

EntityId TargetResolver::resolveHealTarget(const SelectionPolicy& policy) const {
    if (!cache_.isReady()) {
        return EntityId{};
    }
    if (auto hard = cache_.validHardTarget(); hard.isValid()) {
        return hard;
    }
    if (auto ally = bestAlly(policy, false); ally.isValid()) {
        return ally;
    }
    return selfFallback();
}

EntityId TargetResolver::resolveCleanseTarget(const SelectionPolicy& policy) const {
    if (!cache_.isReady()) {
        return EntityId{};
    }
    const auto frame = state_.frameStamp();
    if (auto hard = cache_.validHardTarget();
        hard.isValid() && cache_.hasRemovableNegativeEffect(hard, frame)) {
        return hard;
    }
    if (auto ally = bestAlly(policy, true); ally.isValid()) {
        return ally;
    }
    return selfFallback();
}

EntityId TargetResolver::bestAlly(const SelectionPolicy& policy, bool cleanse) const {
    const auto frame = state_.frameStamp();
    const auto self = cache_.selfId();

    EntityId bestId;
    float bestHealth = 1.0f;
    // Single linear scan; strict comparison keeps the lowest index on ties.
    for (std::size_t i = 0; i < cache_.count(); ++i) {
        const auto* slot = cache_.at(i);
        if (slot == nullptr || slot->id == self || !slot->isValidAllyTarget()) {
            continue;
        }
        if (cleanse) {
            if (!cache_.hasRemovableNegativeEffect(slot->id, frame)) {
                continue;
            }
        } else if (slot->health >= policy.hpThreshold) {
            continue;
        }
        if (!bestId.isValid() || slot->health < bestHealth) {
            bestId = slot->id;
            bestHealth = slot->health;
        }
    }

    float companionHealth = 1.0f;
    auto companion = companionFor(policy, cleanse, &companionHealth);
    if (bestId.isValid()) {
        if (companion.isValid() && policy.companionOverride &&
            companionHealth + policy.companionOverrideDelta < bestHealth) {
            return companion;
        }
        return bestId;
    }
    return companion;
}

EntityId TargetResolver::companionFor(const SelectionPolicy& policy, bool cleanse,
                                      float* health) const {
    if (!policy.companionEnabled) {
        return EntityId{};
    }
    const auto frame = state_.frameStamp();
    const auto* companion = cache_.usableCompanion(frame);
    if (companion == nullptr) {
        return EntityId{};
    }
    if (cleanse) {
        if (!cache_.hasRemovableNegativeEffect(companion->id, frame)) {
            return EntityId{};
        }
    } else if (companion->health >= policy.hpThreshold) {
        return EntityId{};
    }
    *health = companion->health;
    return companion->id;
}

EntityId TargetResolver::selfFallback() const {
    // Self below the threshold and self unconditionally resolve alike.
    return cache_.selfId();
}

EntityId TargetResolver::firstTank() const {
    if (cache_.count() <= 1) {
        return EntityId{};
    }
    for (std::size_t i = 0; i < cache_.count(); ++i) {
        const auto* slot = cache_.at(i);
        if (slot != nullptr && slot->has(CandidateFlag::Tank) && slot->isValidAllyTarget()) {
            return slot->id;
        }
    }
    return EntityId{};
}

EntityId TargetResolver::resolveGroundTarget() const {
    if (state_.hasTarget()) {
        auto target = state_.target();
        if (cache_.isKnownEntity(target, state_.frameStamp())) {
            return target;
        }
    }
    if (!cache_.isReady()) {
        return cache_.selfId();
    }
    if (auto tank = firstTank(); tank.isValid()) {
        return tank;
    }
    return cache_.selfId();
}

EntityId TargetResolver::resolveGroundSpecial(const TargetRule& rule,
                                              const SelectionPolicy& policy) const {
    // Once the follow-up is available the recipient is picked like a heal.
    if (rule.secondaryAction.isValid() && rule.requiredEffect.isValid() &&
        state_.hasActorEffect(rule.requiredEffect)) {
        return resolveHealTarget(policy);
    }
    return resolveGroundTarget();
}

ActionId TargetResolver::resolveReplacement(ActionId action) const {
    const auto* rule = ruleFor(action);
    if (rule == nullptr || rule->mode != TargetingMode::GroundTargetSpecial) {
        return action;
    }
    if (rule->secondaryAction.isValid() && rule->requiredEffect.isValid() &&
        state_.hasActorEffect(rule->requiredEffect)) {
        return rule->secondaryAction;
    }
    return action;
}

} // namespace ace::targeting
