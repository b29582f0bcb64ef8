#pragma once

/// @file entity_selection_cache.hpp
/// @brief Fixed-capacity per-tick cache of candidate entities.

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "ace/foundation/engine_result.hpp"
#include "ace/targeting/targeting_types.hpp"

namespace ace::targeting {

/// Last reported companion, usable for a few frames after it was seen.
struct CompanionState {
    EntityId id;
    float health = 1.0f;
    bool valid = false;
    uint64_t frameStamp = 0;
    bool observed = false;
};

/// Per-tick candidate cache (self, party members, companion, hard target).
///
/// Storage is a fixed array of kCapacity slots; slots past count() are
/// unoccupied and never returned. Frame-scoped data (known entities,
/// removable negative effect marks) is dropped lazily the first time it is
/// touched with a newer frame stamp.
class EntitySelectionCache {
public:
    static constexpr std::size_t kCapacity = 8;
    static constexpr std::size_t kKnownEntityCapacity = 32;
    static constexpr std::size_t kEffectMarkCapacity = 16;
    static constexpr uint32_t kDefaultCompanionGraceFrames = 3;
    static constexpr float kHealthEpsilon = 1e-4f;

    explicit EntitySelectionCache(uint32_t companionGraceFrames = kDefaultCompanionGraceFrames);

    /// Replace the candidate slots for @p frameStamp.
    ///
    /// An update identical to the resident slots (health within
    /// kHealthEpsilon) only refreshes the frame stamp. @p count == 0 empties
    /// the cache; counts above kCapacity are clamped.
    /// @return InvalidArgument when a span is shorter than @p count.
    foundation::EngineResult<void> update(std::span<const EntityId> ids,
                                          std::span<const float> health,
                                          std::span<const CandidateFlags> flags,
                                          std::size_t count,
                                          uint64_t frameStamp);

    void updateHardTarget(EntityId id, bool valid);

    /// Enable or disable companion use; restricted areas disable it too.
    void updateCompanionSystem(bool enabled, bool inRestrictedArea);

    void updateCompanion(EntityId id, float health, bool valid, uint64_t frameStamp);

    /// Record that @p id is resolvable in the world during @p frameStamp.
    void markKnownEntity(EntityId id, uint64_t frameStamp);

    /// Override the removable-negative-effect state of @p id for @p frameStamp.
    void markRemovableNegativeEffect(EntityId id, bool present, uint64_t frameStamp);

    // --- Queries ---

    [[nodiscard]] std::size_t count() const noexcept { return count_; }
    [[nodiscard]] bool isReady() const noexcept { return count_ > 0; }
    [[nodiscard]] bool isFresh(uint64_t frameStamp) const noexcept {
        return count_ > 0 && lastUpdateFrame_ == frameStamp;
    }
    [[nodiscard]] bool partyChangedThisFrame() const noexcept { return partyChanged_; }
    [[nodiscard]] uint64_t lastUpdateFrame() const noexcept { return lastUpdateFrame_; }

    /// Slot @p index, or nullptr when the slot is unoccupied.
    [[nodiscard]] const CandidateEntity* at(std::size_t index) const noexcept;

    /// Slot index of @p id, or -1.
    [[nodiscard]] int indexOf(EntityId id) const noexcept;

    /// Health fraction of @p id, 1.0 when unknown.
    [[nodiscard]] float healthOf(EntityId id) const noexcept;
    [[nodiscard]] CandidateFlags flagsOf(EntityId id) const noexcept;

    [[nodiscard]] EntityId selfId() const noexcept;

    /// Candidate present and carrying every kValidAllyTarget flag.
    [[nodiscard]] bool isValidTarget(EntityId id) const noexcept;
    [[nodiscard]] bool needsHealing(EntityId id, float threshold = 1.0f) const noexcept;
    [[nodiscard]] bool isTank(EntityId id) const noexcept;

    [[nodiscard]] EntityId hardTarget() const noexcept { return hardTargetValid_ ? hardTarget_ : EntityId{}; }

    /// Hard target, if it is also a valid candidate.
    [[nodiscard]] EntityId validHardTarget() const noexcept;

    /// The companion if enabled, valid, alive and seen within the grace window.
    [[nodiscard]] const CompanionState* usableCompanion(uint64_t frameStamp) const noexcept;

    [[nodiscard]] bool isKnownEntity(EntityId id, uint64_t frameStamp) const noexcept;

    [[nodiscard]] bool hasRemovableNegativeEffect(EntityId id, uint64_t frameStamp) const noexcept;

    void clear();

private:
    struct EffectMark {
        EntityId id;
        bool present = false;
    };

    bool sameAsResident(std::span<const EntityId> ids, std::span<const float> health,
                        std::span<const CandidateFlags> flags, std::size_t count) const noexcept;

    void beginFrame(uint64_t frameStamp) noexcept;

    std::array<CandidateEntity, kCapacity> slots_{};
    std::size_t count_ = 0;
    int selfIndex_ = -1;
    uint64_t lastUpdateFrame_ = 0;
    bool partyChanged_ = false;

    EntityId hardTarget_;
    bool hardTargetValid_ = false;

    CompanionState companion_;
    bool companionSystemEnabled_ = false;
    bool companionRestricted_ = false;
    uint32_t companionGraceFrames_;

    uint64_t scratchFrame_ = 0;
    std::array<EntityId, kKnownEntityCapacity> known_{};
    std::size_t knownCount_ = 0;
    std::array<EffectMark, kEffectMarkCapacity> marks_{};
    std::size_t markCount_ = 0;
};

} // namespace ace::targeting
