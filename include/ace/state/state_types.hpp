#pragma once

/// @file state_types.hpp
/// @brief Snapshot, update payload and transition types for the state store.

#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <unordered_map>

#include "ace/foundation/types.hpp"

namespace ace::state {

using foundation::ActionId;
using foundation::EffectId;
using foundation::EntityId;
using foundation::JobId;
using foundation::ZoneId;

/// Boolean environment flags packed into StateSnapshot::flags.
enum class StateFlag : uint8_t {
    InCombat         = 1 << 0,
    HasTarget        = 1 << 1,
    InRestrictedArea = 1 << 2,
    CanAct           = 1 << 3,
    IsMoving         = 1 << 4,
};

using StateFlags = uint8_t;

constexpr StateFlags operator|(StateFlag a, StateFlag b) {
    return static_cast<StateFlags>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

constexpr bool hasFlag(StateFlags flags, StateFlag flag) {
    return (flags & static_cast<uint8_t>(flag)) != 0;
}

/// Reported remaining time for an effect that is tracked but not yet
/// observed. Never a duration: callers must compare against it explicitly.
inline constexpr float kUnobservedSeconds = -999.0f;

/// The authoritative environment snapshot, replaced wholesale per tick.
struct StateSnapshot {
    JobId job;
    uint32_t level = 0;
    EntityId target;
    ZoneId zone;
    StateFlags flags = 0;
    uint32_t gauge1 = 0;
    uint32_t gauge2 = 0;
    uint64_t frameStamp = 0;
    float timeToNextPrimary = 0.0f; ///< seconds until the next primary action
    uint32_t resourceCurrent = 0;
    uint32_t resourceMax = 0;
};

/// Per-tick core fields supplied by the external driver.
struct CoreStateUpdate {
    JobId job;
    uint32_t level = 0;
    EntityId target;
    ZoneId zone;
    bool inCombat = false;
    bool hasTarget = false;
    bool inRestrictedArea = false;
    bool canAct = false;
    bool isMoving = false;
    uint32_t gauge1 = 0;
    uint32_t gauge2 = 0;
};

/// Per-tick scalar fields supplied by the external driver.
struct ScalarStateUpdate {
    float timeToNextPrimary = 0.0f;
    uint32_t resourceCurrent = 0;
    uint32_t resourceMax = 0;
};

/// The three independently tracked effect classes.
enum class EffectKind : uint8_t {
    ActorEffect  = 0, ///< persistent effect on the actor
    TargetEffect = 1, ///< persistent effect on the current target
    Cooldown     = 2  ///< cooldown on an action
};

inline constexpr std::size_t kEffectKindCount = 3;

constexpr std::string_view effectKindName(EffectKind kind) {
    switch (kind) {
        case EffectKind::ActorEffect:  return "ActorEffect";
        case EffectKind::TargetEffect: return "TargetEffect";
        case EffectKind::Cooldown:     return "Cooldown";
    }
    return "Unknown";
}

/// Raw id -> remaining seconds, as observed by the driver this tick.
/// kUnobservedSeconds marks an id whose remaining time is unknown.
using EffectRemainingMap = std::unordered_map<uint32_t, float>;

/// Work the owner of the store must perform after a core update.
enum class SideEffect : uint8_t {
    ClearResolutionCache,
    RebuildRuleChains,
    ReseedEffectTracking
};

/// Outcome of StateStore::updateCore.
///
/// Carries the actor job before and after the update and the side effects
/// that follow from it, so the caller applies them explicitly.
struct StateTransition {
    JobId previousJob;
    JobId currentJob;
    uint64_t frameStamp = 0;

    [[nodiscard]] bool jobChanged() const noexcept { return count_ > 0; }

    [[nodiscard]] std::span<const SideEffect> sideEffects() const noexcept {
        return {effects_.data(), count_};
    }

    [[nodiscard]] bool includes(SideEffect effect) const noexcept {
        for (std::size_t i = 0; i < count_; ++i) {
            if (effects_[i] == effect) {
                return true;
            }
        }
        return false;
    }

    void add(SideEffect effect) noexcept {
        if (count_ < effects_.size() && !includes(effect)) {
            effects_[count_++] = effect;
        }
    }

private:
    std::array<SideEffect, 3> effects_{};
    std::size_t count_ = 0;
};

} // namespace ace::state
