#pragma once

/// @file targeting_types.hpp
/// @brief Candidate entity flags, target rules and the selection policy.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "ace/foundation/types.hpp"

namespace ace::targeting {

using foundation::ActionId;
using foundation::EffectId;
using foundation::EntityId;

/// Bit flags describing a candidate entity for the current tick.
enum class CandidateFlag : uint32_t {
    Alive                   = 1u << 0,
    InRange                 = 1u << 1,
    InLineOfSight           = 1u << 2,
    Targetable              = 1u << 3,
    Self                    = 1u << 4,
    HardTarget              = 1u << 5,
    Tank                    = 1u << 6,
    Healer                  = 1u << 7,
    Melee                   = 1u << 8,
    Ranged                  = 1u << 9,
    Ally                    = 1u << 10,
    RemovableNegativeEffect = 1u << 11,
};

using CandidateFlags = uint32_t;

constexpr CandidateFlags operator|(CandidateFlag a, CandidateFlag b) {
    return static_cast<CandidateFlags>(a) | static_cast<CandidateFlags>(b);
}

constexpr CandidateFlags operator|(CandidateFlags a, CandidateFlag b) {
    return a | static_cast<CandidateFlags>(b);
}

constexpr bool hasFlag(CandidateFlags flags, CandidateFlag flag) {
    return (flags & static_cast<CandidateFlags>(flag)) != 0;
}

/// Flags an entity needs before any ability may be aimed at it.
inline constexpr CandidateFlags kValidAbilityTarget =
    CandidateFlag::Alive | CandidateFlag::InRange |
    CandidateFlag::InLineOfSight | CandidateFlag::Targetable;

/// Flags an entity needs to receive a supportive ability.
inline constexpr CandidateFlags kValidAllyTarget = kValidAbilityTarget | CandidateFlag::Ally;

inline constexpr CandidateFlags kRoleMask =
    CandidateFlag::Tank | CandidateFlag::Healer | CandidateFlag::Melee | CandidateFlag::Ranged;

/// One occupied slot of the selection cache.
struct CandidateEntity {
    EntityId id;
    float health = 1.0f; ///< fraction 0..1
    CandidateFlags flags = 0;

    [[nodiscard]] bool has(CandidateFlag flag) const noexcept { return hasFlag(flags, flag); }

    [[nodiscard]] bool isValidAllyTarget() const noexcept {
        return (flags & kValidAllyTarget) == kValidAllyTarget;
    }
};

/// How an action picks its recipient.
enum class TargetingMode : uint8_t {
    SmartAbility        = 0, ///< lowest-health ally selection
    GroundTarget        = 1, ///< location of target, tank or self
    GroundTargetSpecial = 2, ///< ground placement that turns into a follow-up action
    Cleanse             = 3  ///< recipient must carry a removable negative effect
};

constexpr std::string_view targetingModeName(TargetingMode mode) {
    switch (mode) {
        case TargetingMode::SmartAbility:        return "SmartAbility";
        case TargetingMode::GroundTarget:        return "GroundTarget";
        case TargetingMode::GroundTargetSpecial: return "GroundTargetSpecial";
        case TargetingMode::Cleanse:             return "Cleanse";
    }
    return "Unknown";
}

/// Targeting behavior of one action, supplied by a job provider.
///
/// For GroundTargetSpecial the secondary action replaces the primary one
/// while the actor carries @c requiredEffect.
struct TargetRule {
    ActionId action;
    TargetingMode mode = TargetingMode::SmartAbility;
    ActionId secondaryAction;
    EffectId requiredEffect;
    std::string label;
};

/// Thresholds and companion settings used by one selection.
struct SelectionPolicy {
    float hpThreshold = 0.99f;
    bool companionEnabled = true;
    bool companionOverride = false;
    float companionOverrideDelta = 0.25f;
};

} // namespace ace::targeting
