/// @file entity_selection_cache.cpp
/// @brief EntitySelectionCache implementation.

#include "ace/targeting/entity_selection_cache.hpp"

#include <cmath>
#include <string>

#include "ace/foundation/engine_logger.hpp"

namespace ace::targeting {

using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;
using foundation::LogCategory;

EntitySelectionCache::EntitySelectionCache(uint32_t companionGraceFrames)
    : companionGraceFrames_(companionGraceFrames) {}

bool EntitySelectionCache::sameAsResident(std::span<const EntityId> ids,
                                          std::span<const float> health,
                                          std::span<const CandidateFlags> flags,
                                          std::size_t count) const noexcept {
    if (count != count_ || count_ == 0) {
        return false;
    }
    for (std::size_t i = 0; i < count; ++i) {
        const auto& slot = slots_[i];
        if (slot.id != ids[i] || slot.flags != flags[i]) {
            return false;
        }
        if (std::fabs(slot.health - health[i]) > kHealthEpsilon) {
            return false;
        }
    }
    return true;
}

EngineResult<void> EntitySelectionCache::update(std::span<const EntityId> ids,
                                                std::span<const float> health,
                                                std::span<const CandidateFlags> flags,
                                                std::size_t count,
                                                uint64_t frameStamp) {
    if (count > kCapacity) {
        ACE_LOG_WARN(LogCategory::Targeting,
                     "Candidate count " + std::to_string(count) + " clamped to " +
                         std::to_string(kCapacity));
        count = kCapacity;
    }
    if (ids.size() < count || health.size() < count || flags.size() < count) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::InvalidArgument,
                        "candidate spans shorter than count " + std::to_string(count)));
    }

    beginFrame(frameStamp);

    if (sameAsResident(ids, health, flags, count)) {
        lastUpdateFrame_ = frameStamp;
        partyChanged_ = false;
        return EngineResult<void>::ok();
    }

    partyChanged_ = count_ != 0 || count != 0;
    count_ = count;
    selfIndex_ = -1;
    for (std::size_t i = 0; i < kCapacity; ++i) {
        if (i < count) {
            slots_[i] = CandidateEntity{ids[i], health[i], flags[i]};
            if (selfIndex_ < 0 && hasFlag(flags[i], CandidateFlag::Self)) {
                selfIndex_ = static_cast<int>(i);
            }
        } else {
            slots_[i] = CandidateEntity{};
        }
    }
    lastUpdateFrame_ = count > 0 ? frameStamp : 0;
    return EngineResult<void>::ok();
}

void EntitySelectionCache::updateHardTarget(EntityId id, bool valid) {
    hardTarget_ = id;
    hardTargetValid_ = valid && id.isValid();
}

void EntitySelectionCache::updateCompanionSystem(bool enabled, bool inRestrictedArea) {
    companionSystemEnabled_ = enabled;
    companionRestricted_ = inRestrictedArea;
    if (!enabled || inRestrictedArea) {
        companion_ = CompanionState{};
    }
}

void EntitySelectionCache::updateCompanion(EntityId id, float health, bool valid,
                                           uint64_t frameStamp) {
    if (!companionSystemEnabled_ || companionRestricted_) {
        companion_ = CompanionState{};
        return;
    }
    companion_ = CompanionState{id, health, valid, frameStamp, true};
}

void EntitySelectionCache::beginFrame(uint64_t frameStamp) noexcept {
    if (scratchFrame_ == frameStamp) {
        return;
    }
    scratchFrame_ = frameStamp;
    knownCount_ = 0;
    markCount_ = 0;
}

void EntitySelectionCache::markKnownEntity(EntityId id, uint64_t frameStamp) {
    if (!id.isValid()) {
        return;
    }
    beginFrame(frameStamp);
    for (std::size_t i = 0; i < knownCount_; ++i) {
        if (known_[i] == id) {
            return;
        }
    }
    if (knownCount_ < known_.size()) {
        known_[knownCount_++] = id;
    }
}

void EntitySelectionCache::markRemovableNegativeEffect(EntityId id, bool present,
                                                       uint64_t frameStamp) {
    if (!id.isValid()) {
        return;
    }
    beginFrame(frameStamp);
    for (std::size_t i = 0; i < markCount_; ++i) {
        if (marks_[i].id == id) {
            marks_[i].present = present;
            return;
        }
    }
    if (markCount_ < marks_.size()) {
        marks_[markCount_++] = EffectMark{id, present};
    }
}

const CandidateEntity* EntitySelectionCache::at(std::size_t index) const noexcept {
    if (index >= count_) {
        return nullptr;
    }
    return &slots_[index];
}

int EntitySelectionCache::indexOf(EntityId id) const noexcept {
    if (!id.isValid()) {
        return -1;
    }
    for (std::size_t i = 0; i < count_; ++i) {
        if (slots_[i].id == id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

float EntitySelectionCache::healthOf(EntityId id) const noexcept {
    auto idx = indexOf(id);
    if (idx >= 0) {
        return slots_[static_cast<std::size_t>(idx)].health;
    }
    if (companion_.observed && companion_.id == id) {
        return companion_.health;
    }
    return 1.0f;
}

CandidateFlags EntitySelectionCache::flagsOf(EntityId id) const noexcept {
    auto idx = indexOf(id);
    return idx >= 0 ? slots_[static_cast<std::size_t>(idx)].flags : 0;
}

EntityId EntitySelectionCache::selfId() const noexcept {
    if (selfIndex_ < 0 || static_cast<std::size_t>(selfIndex_) >= count_) {
        return EntityId{};
    }
    return slots_[static_cast<std::size_t>(selfIndex_)].id;
}

bool EntitySelectionCache::isValidTarget(EntityId id) const noexcept {
    auto idx = indexOf(id);
    return idx >= 0 && slots_[static_cast<std::size_t>(idx)].isValidAllyTarget();
}

bool EntitySelectionCache::needsHealing(EntityId id, float threshold) const noexcept {
    auto idx = indexOf(id);
    return idx >= 0 && slots_[static_cast<std::size_t>(idx)].health < threshold;
}

bool EntitySelectionCache::isTank(EntityId id) const noexcept {
    return hasFlag(flagsOf(id), CandidateFlag::Tank);
}

EntityId EntitySelectionCache::validHardTarget() const noexcept {
    if (!hardTargetValid_) {
        return EntityId{};
    }
    return isValidTarget(hardTarget_) ? hardTarget_ : EntityId{};
}

const CompanionState* EntitySelectionCache::usableCompanion(uint64_t frameStamp) const noexcept {
    if (!companionSystemEnabled_ || companionRestricted_) {
        return nullptr;
    }
    const auto& c = companion_;
    if (!c.observed || !c.valid || !c.id.isValid() || c.health <= 0.0f) {
        return nullptr;
    }
    if (frameStamp < c.frameStamp || frameStamp - c.frameStamp > companionGraceFrames_) {
        return nullptr;
    }
    return &companion_;
}

bool EntitySelectionCache::isKnownEntity(EntityId id, uint64_t frameStamp) const noexcept {
    if (!id.isValid()) {
        return false;
    }
    if (isFresh(frameStamp) && indexOf(id) >= 0) {
        return true;
    }
    if (hardTargetValid_ && hardTarget_ == id) {
        return true;
    }
    if (auto* c = usableCompanion(frameStamp); c != nullptr && c->id == id) {
        return true;
    }
    if (scratchFrame_ != frameStamp) {
        return false;
    }
    for (std::size_t i = 0; i < knownCount_; ++i) {
        if (known_[i] == id) {
            return true;
        }
    }
    return false;
}

bool EntitySelectionCache::hasRemovableNegativeEffect(EntityId id,
                                                      uint64_t frameStamp) const noexcept {
    if (!id.isValid()) {
        return false;
    }
    if (scratchFrame_ == frameStamp) {
        for (std::size_t i = 0; i < markCount_; ++i) {
            if (marks_[i].id == id) {
                return marks_[i].present;
            }
        }
    }
    return hasFlag(flagsOf(id), CandidateFlag::RemovableNegativeEffect);
}

void EntitySelectionCache::clear() {
    slots_.fill(CandidateEntity{});
    count_ = 0;
    selfIndex_ = -1;
    lastUpdateFrame_ = 0;
    partyChanged_ = false;
    hardTarget_ = EntityId{};
    hardTargetValid_ = false;
    companion_ = CompanionState{};
    scratchFrame_ = 0;
    knownCount_ = 0;
    markCount_ = 0;
}

} // namespace ace::targeting
