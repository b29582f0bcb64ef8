/// @file state_store.cpp
/// @brief StateStore implementation.

#include "ace/state/state_store.hpp"

#include <exception>
#include <string>

#include "ace/foundation/engine_logger.hpp"

namespace ace::state {

using foundation::LogCategory;
using foundation::TimePoint;

StateTransition StateStore::updateCore(const CoreStateUpdate& update, TimePoint now) {
    StateFlags flags = 0;
    if (update.inCombat) flags |= static_cast<uint8_t>(StateFlag::InCombat);
    if (update.hasTarget) flags |= static_cast<uint8_t>(StateFlag::HasTarget);
    if (update.inRestrictedArea) flags |= static_cast<uint8_t>(StateFlag::InRestrictedArea);
    if (update.canAct) flags |= static_cast<uint8_t>(StateFlag::CanAct);
    if (update.isMoving) flags |= static_cast<uint8_t>(StateFlag::IsMoving);

    StateSnapshot next = snapshot_;
    next.job = update.job;
    next.level = update.level;
    next.target = update.target;
    next.zone = update.zone;
    next.flags = flags;
    next.gauge1 = update.gauge1;
    next.gauge2 = update.gauge2;
    next.frameStamp = snapshot_.frameStamp + 1;

    StateTransition transition;
    transition.previousJob = snapshot_.job;
    transition.currentJob = update.job;
    transition.frameStamp = next.frameStamp;
    bool jobChanged = initialized_ && snapshot_.job != update.job;

    snapshot_ = next;
    lastUpdate_ = now;
    initialized_ = true;

    if (jobChanged) {
        transition.add(SideEffect::ClearResolutionCache);
        transition.add(SideEffect::RebuildRuleChains);
        transition.add(SideEffect::ReseedEffectTracking);
        notifyJobChange(transition.previousJob, transition.currentJob);
    }
    return transition;
}

void StateStore::notifyJobChange(JobId previous, JobId current) {
    foundation::LogContext ctx;
    ctx.jobId = current;
    ctx.frameStamp = snapshot_.frameStamp;
    ctx.extra["previous_job"] = std::to_string(previous.value());
    foundation::EngineLogger::instance().logWithContext(
        foundation::LogLevel::Info, LogCategory::State, "Actor job changed", ctx);

    if (!observer_) {
        return;
    }
    try {
        observer_(previous, current);
        return;
    } catch (const std::exception& e) {
        ctx.extra["error"] = e.what();
    } catch (...) {
        ctx.extra["error"] = "non-standard exception";
    }
    foundation::EngineLogger::instance().logWithContext(
        foundation::LogLevel::Warning, LogCategory::State, "Job change observer threw", ctx);
}

void StateStore::updateScalars(const ScalarStateUpdate& update) {
    StateSnapshot next = snapshot_;
    next.timeToNextPrimary = update.timeToNextPrimary;
    next.resourceCurrent = update.resourceCurrent;
    next.resourceMax = update.resourceMax;
    snapshot_ = next;
}

void StateStore::updateEffects(EffectKind kind, const EffectRemainingMap& observed,
                               TimePoint now) {
    effects_.update(kind, observed, now);
}

bool StateStore::updateJobGauge(JobId job, uint32_t gauge1, uint32_t gauge2) {
    if (job != snapshot_.job) {
        return false;
    }
    if (snapshot_.gauge1 == gauge1 && snapshot_.gauge2 == gauge2) {
        return false;
    }
    StateSnapshot next = snapshot_;
    next.gauge1 = gauge1;
    next.gauge2 = gauge2;
    snapshot_ = next;
    return true;
}

void StateStore::recordActionUsed(ActionId action, float cooldownSeconds, TimePoint now) {
    if (!action.isValid() || cooldownSeconds <= 0.0f) {
        return;
    }
    effects_.recordUsage(EffectKind::Cooldown, action.value(), cooldownSeconds, now);
}

void StateStore::setJobChangeObserver(JobChangeObserver observer) {
    observer_ = std::move(observer);
}

bool StateStore::canWeave(int slots, float budgetPerSlot) const noexcept {
    if (snapshot_.timeToNextPrimary <= 0.0f) {
        return true;
    }
    return snapshot_.timeToNextPrimary >= budgetPerSlot * static_cast<float>(slots);
}

float StateStore::resourceFraction() const noexcept {
    if (snapshot_.resourceMax == 0) {
        return 0.0f;
    }
    return static_cast<float>(snapshot_.resourceCurrent) /
           static_cast<float>(snapshot_.resourceMax);
}

bool StateStore::isResourceLow(float threshold) const noexcept {
    return resourceFraction() < threshold;
}

bool StateStore::hasResourceFor(uint32_t cost) const noexcept {
    return snapshot_.resourceCurrent >= cost;
}

foundation::Duration StateStore::timeSinceLastUpdate(TimePoint now) const noexcept {
    if (!initialized_) {
        return foundation::Duration::max();
    }
    return now - lastUpdate_;
}

bool StateStore::isStale(std::chrono::milliseconds threshold, TimePoint now) const noexcept {
    if (!initialized_) {
        return true;
    }
    return now - lastUpdate_ > threshold;
}

float StateStore::actorEffectRemaining(EffectId id, TimePoint now) const {
    return effects_.remaining(EffectKind::ActorEffect, id.value(), now);
}

bool StateStore::hasActorEffect(EffectId id, TimePoint now) const {
    return effects_.isActive(EffectKind::ActorEffect, id.value(), now);
}

float StateStore::targetEffectRemaining(EffectId id, TimePoint now) const {
    return effects_.remaining(EffectKind::TargetEffect, id.value(), now);
}

bool StateStore::hasTargetEffect(EffectId id, TimePoint now) const {
    return effects_.isActive(EffectKind::TargetEffect, id.value(), now);
}

float StateStore::cooldownRemaining(ActionId id, TimePoint now) const {
    return effects_.remaining(EffectKind::Cooldown, id.value(), now);
}

bool StateStore::isActionReady(ActionId id, TimePoint now) const {
    return effects_.ready(EffectKind::Cooldown, id.value(), now);
}

bool StateStore::isAuxiliaryReady(ActionId id, TimePoint now) const {
    return canProcess() && isActionReady(id, now);
}

void StateStore::reset() {
    snapshot_ = StateSnapshot{};
    effects_.clear();
    lastUpdate_ = TimePoint{};
    initialized_ = false;
}

} // namespace ace::state
