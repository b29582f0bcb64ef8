#pragma once

/// @file state_store.hpp
/// @brief Authoritative per-tick environment snapshot with derived queries.

#include <chrono>
#include <cstdint>
#include <functional>

#include "ace/foundation/types.hpp"
#include "ace/state/effect_expiry_registry.hpp"
#include "ace/state/state_types.hpp"

namespace ace::state {

/// Holds the most recent environment snapshot and the effect registry.
///
/// The driver calls updateCore() exactly once per tick, followed by any of
/// the other update methods; resolution queries read in between. The
/// snapshot is rebuilt off to the side and assigned in one step, so a
/// reader never sees half of an update. Single writer, no locking.
///
/// Example:
/// @code
///   StateStore store;
///   auto transition = store.updateCore({.job = JobId(24), .inCombat = true,
///                                       .canAct = true});
///   for (auto effect : transition.sideEffects()) {
///       apply(effect);
///   }
///   if (store.canProcess() && store.canWeave()) { ... }
/// @endcode
class StateStore {
public:
    /// Observer notified with (previous, current) when the actor job changes.
    using JobChangeObserver = std::function<void(JobId, JobId)>;

    static constexpr float kDefaultWeaveBudgetSeconds = 0.8f;
    static constexpr std::chrono::milliseconds kDefaultStaleThreshold{100};

    StateStore() = default;

    // --- Update boundary ---

    /// Overwrite the core fields and advance the frame stamp.
    ///
    /// A job change is only reported once the store has seen a first
    /// update. The observer, if any, is invoked after the swap; anything it
    /// throws is logged and dropped.
    StateTransition updateCore(const CoreStateUpdate& update,
                               foundation::TimePoint now = foundation::Clock::now());

    void updateScalars(const ScalarStateUpdate& update);

    void updateEffects(EffectKind kind, const EffectRemainingMap& observed,
                       foundation::TimePoint now = foundation::Clock::now());

    /// Apply gauge words reported for @p job.
    /// @return false when @p job is not the current job or nothing changed.
    bool updateJobGauge(JobId job, uint32_t gauge1, uint32_t gauge2);

    /// Start the cooldown of an action that has just been executed.
    void recordActionUsed(ActionId action, float cooldownSeconds,
                          foundation::TimePoint now = foundation::Clock::now());

    void setJobChangeObserver(JobChangeObserver observer);

    // --- Snapshot access ---

    [[nodiscard]] const StateSnapshot& snapshot() const noexcept { return snapshot_; }

    [[nodiscard]] JobId job() const noexcept { return snapshot_.job; }
    [[nodiscard]] uint32_t level() const noexcept { return snapshot_.level; }
    [[nodiscard]] EntityId target() const noexcept { return snapshot_.target; }
    [[nodiscard]] ZoneId zone() const noexcept { return snapshot_.zone; }
    [[nodiscard]] uint64_t frameStamp() const noexcept { return snapshot_.frameStamp; }
    [[nodiscard]] uint32_t gauge1() const noexcept { return snapshot_.gauge1; }
    [[nodiscard]] uint32_t gauge2() const noexcept { return snapshot_.gauge2; }
    [[nodiscard]] float timeToNextPrimary() const noexcept { return snapshot_.timeToNextPrimary; }
    [[nodiscard]] uint32_t resourceCurrent() const noexcept { return snapshot_.resourceCurrent; }
    [[nodiscard]] uint32_t resourceMax() const noexcept { return snapshot_.resourceMax; }

    [[nodiscard]] bool inCombat() const noexcept { return hasFlag(snapshot_.flags, StateFlag::InCombat); }
    [[nodiscard]] bool hasTarget() const noexcept { return hasFlag(snapshot_.flags, StateFlag::HasTarget); }
    [[nodiscard]] bool inRestrictedArea() const noexcept {
        return hasFlag(snapshot_.flags, StateFlag::InRestrictedArea);
    }
    [[nodiscard]] bool canAct() const noexcept { return hasFlag(snapshot_.flags, StateFlag::CanAct); }
    [[nodiscard]] bool isMoving() const noexcept { return hasFlag(snapshot_.flags, StateFlag::IsMoving); }

    // --- Derived queries ---

    /// Rule evaluation is only meaningful in combat with the actor free to act.
    [[nodiscard]] bool canProcess() const noexcept { return inCombat() && canAct(); }

    /// True when @p slots secondary actions fit before the next primary one.
    [[nodiscard]] bool canWeave(int slots = 1,
                                float budgetPerSlot = kDefaultWeaveBudgetSeconds) const noexcept;

    [[nodiscard]] float resourceFraction() const noexcept;
    [[nodiscard]] bool isResourceLow(float threshold = 0.3f) const noexcept;
    [[nodiscard]] bool hasResourceFor(uint32_t cost) const noexcept;

    [[nodiscard]] bool isInitialized() const noexcept { return initialized_; }

    [[nodiscard]] foundation::Duration timeSinceLastUpdate(
        foundation::TimePoint now = foundation::Clock::now()) const noexcept;

    /// True before the first update or when the last one is older than @p threshold.
    [[nodiscard]] bool isStale(std::chrono::milliseconds threshold = kDefaultStaleThreshold,
                               foundation::TimePoint now = foundation::Clock::now()) const noexcept;

    // --- Effects ---

    [[nodiscard]] float actorEffectRemaining(EffectId id,
                                             foundation::TimePoint now = foundation::Clock::now()) const;
    [[nodiscard]] bool hasActorEffect(EffectId id,
                                      foundation::TimePoint now = foundation::Clock::now()) const;
    [[nodiscard]] float targetEffectRemaining(EffectId id,
                                              foundation::TimePoint now = foundation::Clock::now()) const;
    [[nodiscard]] bool hasTargetEffect(EffectId id,
                                       foundation::TimePoint now = foundation::Clock::now()) const;
    [[nodiscard]] float cooldownRemaining(ActionId id,
                                          foundation::TimePoint now = foundation::Clock::now()) const;
    [[nodiscard]] bool isActionReady(ActionId id,
                                     foundation::TimePoint now = foundation::Clock::now()) const;

    /// Action off cooldown and the actor in a state to use it.
    [[nodiscard]] bool isAuxiliaryReady(ActionId id,
                                        foundation::TimePoint now = foundation::Clock::now()) const;

    [[nodiscard]] EffectExpiryRegistry& effects() noexcept { return effects_; }
    [[nodiscard]] const EffectExpiryRegistry& effects() const noexcept { return effects_; }

    /// Zero the snapshot, forget every effect and drop initialization.
    /// The observer is kept.
    void reset();

private:
    void notifyJobChange(JobId previous, JobId current);

    StateSnapshot snapshot_;
    EffectExpiryRegistry effects_;
    JobChangeObserver observer_;
    foundation::TimePoint lastUpdate_{};
    bool initialized_ = false;
};

} // namespace ace::state
